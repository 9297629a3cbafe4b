// include/domain/PricingTrace.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cpq::domain {

/**
 * @brief Шаг трассы: этап, потреблённые входы и численный результат
 *
 * Числа хранятся строками в канонической десятичной форме.
 */
struct TraceStep {
    int sequence = 0;
    std::string stage;
    std::string lineId;         ///< Пусто для шагов уровня котировки
    nlohmann::json inputs = nlohmann::json::object();
    nlohmann::json result = nlohmann::json::object();

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["seq"] = sequence;
        j["stage"] = stage;
        if (!lineId.empty()) j["line_id"] = lineId;
        j["inputs"] = inputs;
        j["result"] = result;
        return j;
    }

    static TraceStep fromJson(const nlohmann::json& j) {
        TraceStep step;
        step.sequence = j.at("seq").get<int>();
        step.stage = j.at("stage").get<std::string>();
        step.lineId = j.value("line_id", "");
        step.inputs = j.at("inputs");
        step.result = j.at("result");
        return step;
    }
};

/**
 * @brief Упорядоченная трасса расчёта
 */
class PricingTrace {
public:
    void append(const std::string& stage, const std::string& lineId,
                nlohmann::json inputs, nlohmann::json result) {
        TraceStep step;
        step.sequence = static_cast<int>(steps_.size()) + 1;
        step.stage = stage;
        step.lineId = lineId;
        step.inputs = std::move(inputs);
        step.result = std::move(result);
        steps_.push_back(std::move(step));
    }

    const std::vector<TraceStep>& steps() const { return steps_; }

    std::vector<TraceStep> stepsForStage(const std::string& stage) const {
        std::vector<TraceStep> out;
        for (const auto& s : steps_) {
            if (s.stage == stage) out.push_back(s);
        }
        return out;
    }

    nlohmann::json toJson() const {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& s : steps_) arr.push_back(s.toJson());
        return arr;
    }

    static PricingTrace fromJson(const nlohmann::json& arr) {
        PricingTrace trace;
        for (const auto& item : arr) trace.steps_.push_back(TraceStep::fromJson(item));
        return trace;
    }

private:
    std::vector<TraceStep> steps_;
};

} // namespace cpq::domain
