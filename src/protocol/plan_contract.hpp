#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/task_errors.hpp"
#include "protocol/entity_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace taskpilot::protocol {

enum class StepStatus {
    Pending,
    Running,
    Succeeded,
    FailedRetryable,
    FailedTerminal
};

struct Unbound {};

struct BackReference {
    int step_id = 0;
    std::string export_name;
};

inline bool operator==(const Unbound&, const Unbound&) { return true; }

inline bool operator==(const BackReference& a, const BackReference& b) {
    return a.step_id == b.step_id && a.export_name == b.export_name;
}

// Unbound until bound to a literal or to an earlier step's export.
using ArgBinding = std::variant<Unbound, nlohmann::json, BackReference>;

struct PlanStep {
    int id = 0;                 // Stable across reordering
    std::size_t position = 0;   // Index in the plan, 1-based
    std::string tool_name;
    std::map<std::string, ArgBinding> arguments;
    int retry_count = 0;
    StepStatus status = StepStatus::Pending;
    std::optional<core::errors::TaskError> error;

    std::set<int> prerequisites() const {
        std::set<int> ids;
        for (const auto& [name, binding] : arguments) {
            if (const auto* ref = std::get_if<BackReference>(&binding)) {
                ids.insert(ref->step_id);
            }
        }
        return ids;
    }
};

struct Plan {
    std::vector<PlanStep> steps;
    int next_step_id = 1;

    PlanStep& append(const std::string& tool_name) {
        PlanStep step;
        step.id = next_step_id++;
        step.tool_name = tool_name;
        steps.push_back(step);
        steps.back().position = steps.size();
        return steps.back();
    }

    const PlanStep* find(const int step_id) const {
        for (const auto& step : steps) {
            if (step.id == step_id) {
                return &step;
            }
        }
        return nullptr;
    }
};

struct StepResult {
    int step_id = 0;
    std::string tool_name;
    bool success = false;
    nlohmann::json output;
    std::string excerpt;
    std::optional<core::errors::TaskError> error;
    std::map<std::string, nlohmann::json> exports;
    std::vector<SourceAttribution> origins;
    int attempts = 0;
    int retry_count = 0;
};

struct AggregatedAnswer {
    std::string text;
    std::vector<SourceAttribution> sources;
    std::vector<StepResult> step_results;
    Intent intent = Intent::CompositeTask;
    std::vector<std::string> failure_notes;
};

inline std::string to_string(const StepStatus status) {
    switch (status) {
        case StepStatus::Pending:
            return "pending";
        case StepStatus::Running:
            return "running";
        case StepStatus::Succeeded:
            return "succeeded";
        case StepStatus::FailedRetryable:
            return "failed_retryable";
        case StepStatus::FailedTerminal:
            return "failed_terminal";
        default:
            return "unknown";
    }
}

inline bool is_terminal(const StepStatus status) {
    return status == StepStatus::Succeeded || status == StepStatus::FailedTerminal;
}

}  // namespace taskpilot::protocol
