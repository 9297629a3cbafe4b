// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace cpq::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL (CPQ_STORAGE=postgres)
     *
     * CPQ_DB_HOST, CPQ_DB_PORT, CPQ_DB_NAME, CPQ_DB_USER, CPQ_DB_PASSWORD,
     * CPQ_DB_SSLMODE (disable | prefer | require), CPQ_DB_CONNECT_TIMEOUT (секунды).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("CPQ_DB_HOST", "cpq-postgres");
            port_ = parseBounded("CPQ_DB_PORT", getEnvOrDefault("CPQ_DB_PORT", "5432"), 1, 65535);
            name_ = getEnvOrDefault("CPQ_DB_NAME", "cpq_db");
            user_ = getEnvOrDefault("CPQ_DB_USER", "cpq_user");
            password_ = getEnvOrDefault("CPQ_DB_PASSWORD", "cpq_secret_password");
            sslMode_ = getEnvOrDefault("CPQ_DB_SSLMODE", "prefer");
            if (sslMode_ != "disable" && sslMode_ != "prefer" && sslMode_ != "require")
            {
                throw std::invalid_argument("CPQ_DB_SSLMODE must be disable, prefer or require: " + sslMode_);
            }
            connectTimeoutSec_ = parseBounded("CPQ_DB_CONNECT_TIMEOUT",
                                              getEnvOrDefault("CPQ_DB_CONNECT_TIMEOUT", "5"), 1, 300);
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        const std::string &getSslMode() const { return sslMode_; }
        int getConnectTimeoutSec() const { return connectTimeoutSec_; }

        /// Строка подключения libpq (каждый адаптер открывает соединение на вызов)
        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_ +
                   " sslmode=" + sslMode_ + " connect_timeout=" + std::to_string(connectTimeoutSec_) +
                   " application_name=cpq-engine";
        }

        /// Для логов: без пароля
        std::string describe() const
        {
            return user_ + "@" + host_ + ":" + std::to_string(port_) + "/" + name_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        std::string sslMode_;
        int connectTimeoutSec_;

        static int parseBounded(const char *name, const std::string &value, int min, int max)
        {
            size_t consumed = 0;
            int parsed = 0;
            try
            {
                parsed = std::stoi(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(std::string(name) + " is not a number: " + value);
            }
            if (consumed != value.size() || parsed < min || parsed > max)
            {
                throw std::invalid_argument(std::string(name) + " is out of range: " + value);
            }
            return parsed;
        }

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace cpq::settings
