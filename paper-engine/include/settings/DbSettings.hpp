// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace paper::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читаются только при PAPER_STORE=postgres.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("PAPER_DB_HOST", "paper-postgres");
            port_ = std::stoi(getEnvOrDefault("PAPER_DB_PORT", "5432"));
            name_ = getEnvOrDefault("PAPER_DB_NAME", "paper_db");
            user_ = getEnvOrDefault("PAPER_DB_USER", "paper_user");
            password_ = getEnvOrDefault("PAPER_DB_PASSWORD", "paper_secret_password");
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace paper::settings
