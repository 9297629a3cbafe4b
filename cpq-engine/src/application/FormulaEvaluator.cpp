#include "application/FormulaEvaluator.hpp"
#include <cctype>

namespace cpq::application {

using domain::Decimal;

class FormulaEvaluator::Parser {
public:
    Parser(const std::string& text, const Variables& variables)
        : text_(text), variables_(variables) {}

    Decimal parse() {
        Decimal value = expression();
        skipSpaces();
        if (pos_ != text_.size()) {
            unexpected();
        }
        return value;
    }

private:
    // expression := term (('+' | '-') term)*
    Decimal expression() {
        Decimal value = term();
        while (true) {
            skipSpaces();
            if (match('+')) {
                value = value + term();
            } else if (match('-')) {
                value = value - term();
            } else {
                return value;
            }
        }
    }

    // term := unary (('*' | '/') unary)*
    Decimal term() {
        Decimal value = unary();
        while (true) {
            skipSpaces();
            if (match('*')) {
                value = value * unary();
            } else if (match('/')) {
                Decimal divisor = unary();
                if (divisor.isZero()) {
                    throw FormulaException(FormulaException::Reason::DIVISION_BY_ZERO,
                                           "Division by zero in formula: " + text_);
                }
                value = value / divisor;
            } else {
                return value;
            }
        }
    }

    Decimal unary() {
        skipSpaces();
        if (match('-')) return -unary();
        if (match('+')) return unary();
        return primary();
    }

    Decimal primary() {
        skipSpaces();
        if (pos_ >= text_.size()) {
            throw FormulaException(FormulaException::Reason::SYNTAX,
                                   "Unexpected end of formula: " + text_);
        }

        char c = text_[pos_];
        if (c == '(') {
            ++pos_;
            Decimal value = expression();
            skipSpaces();
            if (!match(')')) {
                throw FormulaException(FormulaException::Reason::SYNTAX,
                                       "Missing ')' in formula: " + text_);
            }
            return value;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            return number();
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            return variable();
        }
        unexpected();
        return Decimal();
    }

    Decimal number() {
        size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
            ++pos_;
        }
        std::string literal = text_.substr(start, pos_ - start);
        try {
            return Decimal::fromString(literal);
        } catch (const std::invalid_argument&) {
            throw FormulaException(FormulaException::Reason::SYNTAX,
                                   "Invalid number '" + literal + "' in formula: " + text_, literal);
        }
    }

    Decimal variable() {
        size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
            ++pos_;
        }
        std::string name = text_.substr(start, pos_ - start);

        auto it = variables_.find(name);
        if (it == variables_.end()) {
            throw FormulaException(FormulaException::Reason::UNKNOWN_VARIABLE,
                                   "Unknown variable '" + name + "' in formula: " + text_, name);
        }
        if (!it->second) {
            throw FormulaException(FormulaException::Reason::MISSING_VALUE,
                                   "Variable '" + name + "' has no value", name);
        }
        return *it->second;
    }

    [[noreturn]] void unexpected() {
        std::string symbol(1, text_[pos_]);
        throw FormulaException(FormulaException::Reason::UNKNOWN_OPERATOR,
                               "Unknown operator '" + symbol + "' in formula: " + text_, symbol);
    }

    bool match(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skipSpaces() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    const std::string& text_;
    const Variables& variables_;
    size_t pos_ = 0;
};

Decimal FormulaEvaluator::evaluate(const std::string& expression, const Variables& variables) {
    Parser parser(expression, variables);
    return parser.parse();
}

} // namespace cpq::application
