// include/domain/JsonConversions.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace cpq::domain {

// Decimal хранится строкой, чтобы не проходить через double
inline void to_json(nlohmann::json& j, const Decimal& d) {
    j = d.toString();
}

inline void from_json(const nlohmann::json& j, Decimal& d) {
    if (!j.is_string()) {
        throw std::invalid_argument("Decimal must be encoded as a string: " + j.dump());
    }
    d = Decimal::fromString(j.get<std::string>());
}

inline void to_json(nlohmann::json& j, const Timestamp& t) {
    j = t.toString();
}

inline void from_json(const nlohmann::json& j, Timestamp& t) {
    t = Timestamp::fromString(j.get<std::string>());
}

/// Записать значение, только если оно есть
template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template <typename T>
std::optional<T> getOptional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->template get<T>();
}

} // namespace cpq::domain
