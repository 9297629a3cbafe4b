// include/settings/EngineSettings.hpp
#pragma once

#include "domain/Decimal.hpp"
#include <string>
#include <vector>
#include <map>
#include <cstdlib>
#include <stdexcept>
#include <sstream>

namespace cpq::settings
{

    /**
     * @brief Настройки движка CPQ
     *
     * CPQ_STORAGE          - memory | postgres
     * CPQ_REQUIRED_FIELDS  - обязательные поля через запятую
     * CPQ_TAX_RATES        - ставки налога по регионам: "EU=20,US=0" (проценты)
     * CPQ_SEGMENT_FACTORS  - множители сегмента для формул: "enterprise=1.1"
     * CPQ_APPROVAL_TTL_HOURS - срок ожидания решения по запросу согласования
     * CPQ_CURRENCY_SCALE   - знаков после точки в денежных суммах
     */
    class EngineSettings
    {
    public:
        EngineSettings()
        {
            storage_ = getEnvOrDefault("CPQ_STORAGE", "memory");
            if (storage_ != "memory" && storage_ != "postgres")
            {
                throw std::invalid_argument("CPQ_STORAGE must be memory or postgres: " + storage_);
            }
            requiredFields_ = splitList(getEnvOrDefault(
                "CPQ_REQUIRED_FIELDS", "account_id,currency,segment,region,term_months,start_date"));
            taxRates_ = parseRates("CPQ_TAX_RATES", getEnvOrDefault("CPQ_TAX_RATES", ""));
            segmentFactors_ = parseRates("CPQ_SEGMENT_FACTORS", getEnvOrDefault("CPQ_SEGMENT_FACTORS", ""));
            approvalTtlHours_ = parseInt("CPQ_APPROVAL_TTL_HOURS", getEnvOrDefault("CPQ_APPROVAL_TTL_HOURS", "72"));
            currencyScale_ = parseInt("CPQ_CURRENCY_SCALE", getEnvOrDefault("CPQ_CURRENCY_SCALE", "2"));
            if (currencyScale_ < 0 || currencyScale_ > domain::Decimal::MAX_SCALE)
            {
                throw std::invalid_argument("CPQ_CURRENCY_SCALE must be within 0..9");
            }
        }

        /// Явные значения (тесты, встраивание)
        EngineSettings(std::vector<std::string> requiredFields,
                       std::map<std::string, domain::Decimal> taxRates,
                       std::map<std::string, domain::Decimal> segmentFactors,
                       int approvalTtlHours = 72,
                       int currencyScale = 2)
            : storage_("memory")
            , requiredFields_(std::move(requiredFields))
            , taxRates_(std::move(taxRates))
            , segmentFactors_(std::move(segmentFactors))
            , approvalTtlHours_(approvalTtlHours)
            , currencyScale_(currencyScale)
        {
        }

        const std::string &getStorage() const { return storage_; }
        const std::vector<std::string> &getRequiredFields() const { return requiredFields_; }
        int getApprovalTtlHours() const { return approvalTtlHours_; }
        int getCurrencyScale() const { return currencyScale_; }

        /// Ставка налога региона в процентах, 0 если не задана
        domain::Decimal getTaxRate(const std::string &region) const
        {
            auto it = taxRates_.find(region);
            return it == taxRates_.end() ? domain::Decimal::zero() : it->second;
        }

        /// Множитель сегмента, 1 если не задан
        domain::Decimal getSegmentFactor(const std::string &segment) const
        {
            auto it = segmentFactors_.find(segment);
            return it == segmentFactors_.end() ? domain::Decimal::fromInt(1) : it->second;
        }

    private:
        std::string storage_;
        std::vector<std::string> requiredFields_;
        std::map<std::string, domain::Decimal> taxRates_;
        std::map<std::string, domain::Decimal> segmentFactors_;
        int approvalTtlHours_;
        int currencyScale_;

        static std::vector<std::string> splitList(const std::string &value)
        {
            std::vector<std::string> items;
            std::stringstream ss(value);
            std::string item;
            while (std::getline(ss, item, ','))
            {
                if (!item.empty())
                    items.push_back(item);
            }
            return items;
        }

        static std::map<std::string, domain::Decimal> parseRates(const char *name, const std::string &value)
        {
            std::map<std::string, domain::Decimal> rates;
            for (const auto &pair : splitList(value))
            {
                auto eq = pair.find('=');
                if (eq == std::string::npos || eq == 0)
                {
                    throw std::invalid_argument(std::string(name) + " entry must be key=value: " + pair);
                }
                rates[pair.substr(0, eq)] = domain::Decimal::fromString(pair.substr(eq + 1));
            }
            return rates;
        }

        static int parseInt(const char *name, const std::string &value)
        {
            size_t consumed = 0;
            int parsed = 0;
            try
            {
                parsed = std::stoi(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(std::string(name) + " must be an integer: " + value);
            }
            if (consumed != value.size())
            {
                throw std::invalid_argument(std::string(name) + " must be an integer: " + value);
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
