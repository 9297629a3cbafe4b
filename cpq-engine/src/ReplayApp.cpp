// src/ReplayApp.cpp
#include "ReplayApp.hpp"
#include "application/EventCodec.hpp"
#include <algorithm>
#include <fstream>

namespace cpq
{

    void ReplayApp::configureInjection()
    {
        std::cout << "[ReplayApp] Configuring DI..." << std::endl;

        // Шаг 1: справочные данные загружаются один раз до создания сервиса
        auto catalog = std::make_shared<adapters::secondary::InMemoryCatalogRepository>();
        auto policies = std::make_shared<adapters::secondary::InMemoryPolicyRepository>();
        adapters::secondary::JsonCatalogLoader loader(catalog, policies);
        loader.loadFile(replaySettings_->getCatalogPath());

        if (replaySettings_->getPublisher() == "rabbitmq")
        {
            rabbitPublisher_ = std::make_shared<adapters::secondary::RabbitMQEventPublisher>(
                std::make_shared<settings::RabbitMQSettings>());
            publisher_ = rabbitPublisher_;
        }
        else
        {
            consolePublisher_ = std::make_shared<adapters::secondary::ConsoleEventPublisher>();
            publisher_ = consolePublisher_;
        }

        // Шаг 2: хранилище. EngineSettings передаётся экземпляром (два конструктора)
        if (engineSettings_->getStorage() == "postgres")
        {
            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::EngineSettings>().to(engineSettings_),
                di::bind<ports::output::IQuoteStore>().to<adapters::secondary::PostgresQuoteStore>().in(di::singleton),
                di::bind<ports::output::IAuditLog>().to<adapters::secondary::PostgresAuditLog>().in(di::singleton),
                di::bind<ports::output::IIdempotencyRepository>()
                    .to<adapters::secondary::PostgresIdempotencyRepository>()
                    .in(di::singleton),
                di::bind<ports::output::IEventPublisher>().to(publisher_),
                di::bind<ports::output::ICatalogRepository>().to(catalog),
                di::bind<ports::output::IPolicyRepository>().to(policies),
                di::bind<ports::input::IQuoteService>().to<application::QuoteService>().in(di::singleton));
            quoteService_ = injector.create<std::shared_ptr<ports::input::IQuoteService>>();
        }
        else
        {
            // Журнал и ключи - одни экземпляры для хранилища и для сервиса
            auto auditLog = std::make_shared<adapters::secondary::InMemoryAuditLog>();
            auto idempotency = std::make_shared<adapters::secondary::InMemoryIdempotencyRepository>();
            auto injector = di::make_injector(
                di::bind<settings::EngineSettings>().to(engineSettings_),
                di::bind<adapters::secondary::InMemoryAuditLog>().to(auditLog),
                di::bind<adapters::secondary::InMemoryIdempotencyRepository>().to(idempotency),
                di::bind<ports::output::IAuditLog>().to(auditLog),
                di::bind<ports::output::IIdempotencyRepository>().to(idempotency),
                di::bind<ports::output::IQuoteStore>().to<adapters::secondary::InMemoryQuoteStore>().in(di::singleton),
                di::bind<ports::output::IEventPublisher>().to(publisher_),
                di::bind<ports::output::ICatalogRepository>().to(catalog),
                di::bind<ports::output::IPolicyRepository>().to(policies),
                di::bind<ports::input::IQuoteService>().to<application::QuoteService>().in(di::singleton));
            quoteService_ = injector.create<std::shared_ptr<ports::input::IQuoteService>>();
        }

        std::cout << "[ReplayApp] Ready" << std::endl;
    }

    int ReplayApp::replay()
    {
        const std::string &path = replaySettings_->getEventLogPath();
        std::ifstream in(path);
        if (!in)
        {
            throw std::runtime_error("Cannot open event log: " + path);
        }
        nlohmann::json log;
        try
        {
            in >> log;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error("Event log " + path + " is not valid JSON: " + e.what());
        }
        if (!log.is_array())
        {
            throw std::runtime_error("Event log must be a JSON array: " + path);
        }

        bool ok = true;
        std::vector<std::string> quoteIds;
        for (size_t i = 0; i < log.size(); ++i)
        {
            const auto &entry = log[i];
            std::string quoteId = entry.value("quote_id", "");
            if (!quoteId.empty() && std::find(quoteIds.begin(), quoteIds.end(), quoteId) == quoteIds.end())
            {
                quoteIds.push_back(quoteId);
            }
            if (!replayEntry(entry, i))
                ok = false;
        }

        printSummary(quoteIds, ok);
        std::cout << "[ReplayApp] " << log.size() << " entries replayed, "
                  << publishedCount() << " external events published" << std::endl;
        return ok ? 0 : 2;
    }

    bool ReplayApp::replayEntry(const nlohmann::json &entry, size_t index)
    {
        std::string command = entry.value("command", "apply");
        std::string quoteId = entry.at("quote_id").get<std::string>();

        domain::ApplyResult result;
        if (command == "create_quote")
        {
            result = quoteService_->createQuote(
                quoteId,
                entry.at("actor").get<std::string>(),
                domain::Timestamp::fromString(entry.at("at").get<std::string>()));
        }
        else if (command == "apply")
        {
            domain::FlowEvent event;
            try
            {
                event = application::EventCodec::decode(entry.at("event"));
            }
            catch (const application::EventDecodeException &e)
            {
                std::cerr << "[ReplayApp] #" << index << " invalid event (" << e.field() << "): " << e.what() << std::endl;
                return entry.value("expect", "") == "INVALID_EVENT";
            }
            result = quoteService_->apply(quoteId, entry.at("expected_version").get<int64_t>(), event);
        }
        else
        {
            throw std::invalid_argument("Unknown replay command: " + command);
        }

        std::cout << "[ReplayApp] #" << index << " " << result.toJson().dump() << std::endl;

        // "expect" позволяет записать в журнал ожидаемый отказ
        std::string expected = entry.value("expect", domain::toString(domain::ApplyStatus::APPLIED));
        if (domain::toString(result.status) != expected)
        {
            std::cerr << "[ReplayApp] #" << index << " expected " << expected
                      << ", got " << domain::toString(result.status) << std::endl;
            return false;
        }
        return true;
    }

    void ReplayApp::printSummary(const std::vector<std::string> &quoteIds, bool &ok)
    {
        for (const auto &quoteId : quoteIds)
        {
            auto flow = quoteService_->getFlowState(quoteId);
            if (!flow)
                continue;

            nlohmann::json summary;
            summary["quote_id"] = quoteId;
            summary["state"] = domain::toString(flow->state);
            summary["version"] = flow->version;

            auto snapshots = quoteService_->getSnapshots(quoteId);
            if (!snapshots.empty())
            {
                const auto &last = snapshots.back();
                summary["snapshot_id"] = last.id;
                summary["subtotal"] = last.subtotal.toString();
                summary["discount_total"] = last.discountTotal.toString();
                summary["tax_total"] = last.taxTotal.toString();
                summary["total"] = last.total.toString();
                summary["trace_digest"] = last.traceDigest;
            }

            auto verification = quoteService_->verifyAuditTrail(quoteId);
            summary["audit_events"] = verification.eventCount;
            summary["audit_valid"] = verification.valid;
            if (!verification.valid)
                ok = false;

            std::cout << "[ReplayApp] Summary " << summary.dump() << std::endl;
        }
    }

} // namespace cpq
