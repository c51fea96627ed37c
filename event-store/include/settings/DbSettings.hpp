// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace eventstore::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения:
     * - EVENT_STORE_DB_HOST (default: localhost)
     * - EVENT_STORE_DB_PORT (default: 5432)
     * - EVENT_STORE_DB_NAME (default: event_store)
     * - EVENT_STORE_DB_USER (default: event_store)
     * - EVENT_STORE_DB_PASSWORD
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("EVENT_STORE_DB_HOST", "localhost");
            port_ = parsePort(getEnvOrDefault("EVENT_STORE_DB_PORT", "5432"));
            name_ = getEnvOrDefault("EVENT_STORE_DB_NAME", "event_store");
            user_ = getEnvOrDefault("EVENT_STORE_DB_USER", "event_store");
            password_ = getEnvOrDefault("EVENT_STORE_DB_PASSWORD", "event_store_password");
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

        static int parsePort(const std::string &value)
        {
            int port = 0;
            try
            {
                port = std::stoi(value);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("EVENT_STORE_DB_PORT is not a number: " + value);
            }
            if (port <= 0 || port > 65535)
            {
                throw std::invalid_argument("EVENT_STORE_DB_PORT out of range: " + value);
            }
            return port;
        }
    };

} // namespace eventstore::settings
