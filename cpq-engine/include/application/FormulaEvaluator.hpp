// include/application/FormulaEvaluator.hpp
#pragma once

#include "domain/Decimal.hpp"
#include <string>
#include <map>
#include <optional>
#include <stdexcept>

namespace cpq::application {

/**
 * @brief Ошибка вычисления формулы
 */
class FormulaException : public std::runtime_error {
public:
    enum class Reason {
        SYNTAX,
        UNKNOWN_OPERATOR,
        UNKNOWN_VARIABLE,
        MISSING_VALUE,
        DIVISION_BY_ZERO
    };

    FormulaException(Reason reason, const std::string& message, std::string symbol = "")
        : std::runtime_error(message), reason_(reason), symbol_(std::move(symbol)) {}

    Reason reason() const { return reason_; }
    const std::string& symbol() const { return symbol_; }

private:
    Reason reason_;
    std::string symbol_;
};

/**
 * @brief Вычислитель хранимых формул цены
 *
 * Грамматика: десятичные литералы, переменные, + - * /, унарный минус, скобки.
 * Переменная, известная, но без значения (nullopt), даёт MISSING_VALUE;
 * неизвестная переменная или оператор - ошибку, никакого значения по умолчанию.
 */
class FormulaEvaluator {
public:
    using Variables = std::map<std::string, std::optional<domain::Decimal>>;

    static domain::Decimal evaluate(const std::string& expression, const Variables& variables);

private:
    class Parser;
};

} // namespace cpq::application
