// include/domain/Errors.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace cpq::domain {

/**
 * @brief Таксономия ошибок ядра
 *
 * ConfigurationInvalid и ApprovalRequired не исключения: это значения
 * (ConstraintResult, PolicyDecision).
 */
enum class ErrorKind {
    INVARIANT_VIOLATION,
    PRICING_DATA_MISSING,
    POLICY_DATA_MALFORMED,
    CONSTRAINT_DATA_MALFORMED,
    VERSION_CONFLICT,
    STORAGE
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVARIANT_VIOLATION: return "InvariantViolation";
        case ErrorKind::PRICING_DATA_MISSING: return "PricingDataMissing";
        case ErrorKind::POLICY_DATA_MALFORMED: return "PolicyDataMalformed";
        case ErrorKind::CONSTRAINT_DATA_MALFORMED: return "ConstraintDataMalformed";
        case ErrorKind::VERSION_CONFLICT: return "VersionConflict";
        case ErrorKind::STORAGE: return "Storage";
        default: return "Unknown";
    }
}

/**
 * @brief Базовое исключение движка
 */
class CpqException : public std::runtime_error {
public:
    CpqException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Недопустимое изменение доменного объекта (ошибка программы или данных)
 */
class InvariantViolationException : public CpqException {
public:
    explicit InvariantViolationException(const std::string& message)
        : CpqException(ErrorKind::INVARIANT_VIOLATION, message) {}
};

enum class PricingErrorCode {
    NO_LINES,
    NO_APPLICABLE_PRICE_BOOK,
    MISSING_PRODUCT,
    MISSING_PRICE_BOOK_ENTRY,
    TIER_GAP,
    MISSING_BUNDLE,
    MISSING_FORMULA,
    FORMULA_ERROR,
    MISSING_INPUT
};

inline std::string toString(PricingErrorCode code) {
    switch (code) {
        case PricingErrorCode::NO_LINES: return "no_lines";
        case PricingErrorCode::NO_APPLICABLE_PRICE_BOOK: return "no_applicable_price_book";
        case PricingErrorCode::MISSING_PRODUCT: return "missing_product";
        case PricingErrorCode::MISSING_PRICE_BOOK_ENTRY: return "missing_price_book_entry";
        case PricingErrorCode::TIER_GAP: return "tier_gap";
        case PricingErrorCode::MISSING_BUNDLE: return "missing_bundle";
        case PricingErrorCode::MISSING_FORMULA: return "missing_formula";
        case PricingErrorCode::FORMULA_ERROR: return "formula_error";
        case PricingErrorCode::MISSING_INPUT: return "missing_input";
        default: return "unknown";
    }
}

/**
 * @brief Нет данных для цены: прайс-листа, позиции, ступени, формулы
 *
 * Проход ценообразования прерывается целиком, цена никогда не подставляется.
 * internalConsistency = true для разрыва ступеней (данные прошли проверку
 * при загрузке, значит это дефект, а не ошибка пользователя).
 */
class PricingDataMissingException : public CpqException {
public:
    PricingDataMissingException(PricingErrorCode code,
                                const std::string& message,
                                std::string lineId = "",
                                std::string productId = "",
                                std::string reference = "")
        : CpqException(ErrorKind::PRICING_DATA_MISSING, message)
        , code_(code)
        , lineId_(std::move(lineId))
        , productId_(std::move(productId))
        , reference_(std::move(reference)) {}

    PricingErrorCode code() const { return code_; }
    const std::string& lineId() const { return lineId_; }
    const std::string& productId() const { return productId_; }
    const std::string& reference() const { return reference_; }
    bool internalConsistency() const { return code_ == PricingErrorCode::TIER_GAP; }

private:
    PricingErrorCode code_;
    std::string lineId_;
    std::string productId_;
    std::string reference_;
};

/**
 * @brief Некорректное условие политики; оценка для котировки блокируется
 */
class PolicyDataMalformedException : public CpqException {
public:
    PolicyDataMalformedException(std::string policyId, const std::string& detail)
        : CpqException(ErrorKind::POLICY_DATA_MALFORMED,
                       "Malformed policy " + policyId + ": " + detail)
        , policyId_(std::move(policyId)) {}

    const std::string& policyId() const { return policyId_; }

private:
    std::string policyId_;
};

/**
 * @brief Некорректное условие правила конфигурации
 */
class ConstraintDataMalformedException : public CpqException {
public:
    ConstraintDataMalformedException(std::string ruleId, const std::string& detail)
        : CpqException(ErrorKind::CONSTRAINT_DATA_MALFORMED,
                       "Malformed constraint rule " + ruleId + ": " + detail)
        , ruleId_(std::move(ruleId)) {}

    const std::string& ruleId() const { return ruleId_; }

private:
    std::string ruleId_;
};

/**
 * @brief Конкурентное изменение котировки: нужно перечитать и повторить
 */
class VersionConflictException : public CpqException {
public:
    VersionConflictException(const std::string& quoteId, int64_t expected, int64_t actual)
        : CpqException(ErrorKind::VERSION_CONFLICT,
                       "Version conflict on " + quoteId + ": expected " +
                       std::to_string(expected) + ", actual " + std::to_string(actual))
        , quoteId_(quoteId)
        , expected_(expected)
        , actual_(actual) {}

    const std::string& quoteId() const { return quoteId_; }
    int64_t expected() const { return expected_; }
    int64_t actual() const { return actual_; }

private:
    std::string quoteId_;
    int64_t expected_;
    int64_t actual_;
};

class StorageException : public CpqException {
public:
    explicit StorageException(const std::string& message)
        : CpqException(ErrorKind::STORAGE, message) {}
};

} // namespace cpq::domain
