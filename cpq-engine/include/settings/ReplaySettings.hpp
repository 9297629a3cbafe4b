// include/settings/ReplaySettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace cpq::settings
{

    /**
     * @brief Пути для cpq-replay; аргументы командной строки имеют приоритет
     *
     * CPQ_PUBLISHER: console (по умолчанию) | rabbitmq
     */
    class ReplaySettings
    {
    public:
        ReplaySettings()
        {
            catalogPath_ = getEnvOrDefault("CPQ_CATALOG_PATH", "fixtures/catalog.json");
            eventLogPath_ = getEnvOrDefault("CPQ_EVENT_LOG_PATH", "fixtures/events.json");
            publisher_ = getEnvOrDefault("CPQ_PUBLISHER", "console");
            if (publisher_ != "console" && publisher_ != "rabbitmq")
            {
                throw std::invalid_argument("CPQ_PUBLISHER must be console or rabbitmq: " + publisher_);
            }
        }

        const std::string &getCatalogPath() const { return catalogPath_; }
        const std::string &getEventLogPath() const { return eventLogPath_; }
        const std::string &getPublisher() const { return publisher_; }

        void setCatalogPath(const std::string &path) { catalogPath_ = path; }
        void setEventLogPath(const std::string &path) { eventLogPath_ = path; }

    private:
        std::string catalogPath_;
        std::string eventLogPath_;
        std::string publisher_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace cpq::settings
