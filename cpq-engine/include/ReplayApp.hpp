// include/ReplayApp.hpp
#pragma once

#include <boost/di.hpp>
#include <nlohmann/json.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/EngineSettings.hpp"
#include "settings/ReplaySettings.hpp"
#include "settings/RabbitMQSettings.hpp"

// Ports
#include "ports/input/IQuoteService.hpp"
#include "ports/output/IQuoteStore.hpp"
#include "ports/output/IAuditLog.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/ICatalogRepository.hpp"
#include "ports/output/IPolicyRepository.hpp"

// Application
#include "application/QuoteService.hpp"

// Secondary Adapters
#include "adapters/secondary/catalog/InMemoryCatalogRepository.hpp"
#include "adapters/secondary/catalog/InMemoryPolicyRepository.hpp"
#include "adapters/secondary/catalog/JsonCatalogLoader.hpp"
#include "adapters/secondary/persistence/InMemoryAuditLog.hpp"
#include "adapters/secondary/persistence/InMemoryIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/InMemoryQuoteStore.hpp"
#include "adapters/secondary/persistence/PostgresAuditLog.hpp"
#include "adapters/secondary/persistence/PostgresIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/PostgresQuoteStore.hpp"
#include "adapters/secondary/events/ConsoleEventPublisher.hpp"
#include "adapters/secondary/events/RabbitMQEventPublisher.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace di = boost::di;

namespace cpq
{

    /**
     * @brief cpq-replay: проигрывание журнала событий через движок
     *
     * Журнал - JSON-массив записей:
     *   {"command": "create_quote", "quote_id", "actor", "at"}
     *   {"command": "apply", "quote_id", "expected_version", "event": {...}}
     *
     * Печатает результат каждого шага и итог по котировкам. Повторный прогон
     * того же журнала на пустом хранилище даёт тот же вывод.
     */
    class ReplayApp
    {
    public:
        ReplayApp() { std::cout << "[ReplayApp] Initializing..." << std::endl; }
        ~ReplayApp() { std::cout << "[ReplayApp] Shutting down..." << std::endl; }

        /**
         * @return 0 - все шаги APPLIED (или ожидаемый отказ из "expect"),
         *         2 - есть неожиданные результаты или разорванная цепочка аудита
         */
        int run(int argc, char *argv[])
        {
            loadEnvironment(argc, argv);
            configureInjection();
            return replay();
        }

    private:
        std::shared_ptr<settings::ReplaySettings> replaySettings_;
        std::shared_ptr<settings::EngineSettings> engineSettings_;
        std::shared_ptr<ports::output::IEventPublisher> publisher_;
        std::shared_ptr<adapters::secondary::ConsoleEventPublisher> consolePublisher_;
        std::shared_ptr<adapters::secondary::RabbitMQEventPublisher> rabbitPublisher_;
        std::shared_ptr<ports::input::IQuoteService> quoteService_;

        void loadEnvironment(int argc, char *argv[])
        {
            replaySettings_ = std::make_shared<settings::ReplaySettings>();
            if (argc > 1)
                replaySettings_->setCatalogPath(argv[1]);
            if (argc > 2)
                replaySettings_->setEventLogPath(argv[2]);
            engineSettings_ = std::make_shared<settings::EngineSettings>();
            std::cout << "[ReplayApp] Environment loaded (storage=" << engineSettings_->getStorage()
                      << ", publisher=" << replaySettings_->getPublisher() << ")" << std::endl;
        }

        void configureInjection();

        size_t publishedCount() const
        {
            return rabbitPublisher_ ? rabbitPublisher_->publishedCount() : consolePublisher_->published().size();
        }

        int replay();

        bool replayEntry(const nlohmann::json &entry, size_t index);

        void printSummary(const std::vector<std::string> &quoteIds, bool &ok);
    };

} // namespace cpq
