#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "collab/collaborators.hpp"
#include "protocol/entity_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "tools/tool_registry.hpp"

namespace taskpilot::runtime {

class ResultAggregator {
public:
    ResultAggregator(const tools::ToolRegistry& registry,
                     std::shared_ptr<collab::LanguageModel> model,
                     std::chrono::milliseconds model_timeout);

    // `stop_reason` explains steps of the plan that have no result.
    protocol::AggregatedAnswer aggregate(const std::string& request_text,
                                         protocol::Intent intent,
                                         const protocol::Plan& plan,
                                         const std::vector<protocol::StepResult>& results,
                                         const std::string& stop_reason = "") const;

    // Gathered material grouped by tool family, plus the failure notes.
    std::string compose_material(const std::vector<protocol::StepResult>& results,
                                 const std::vector<std::string>& failure_notes) const;

    static std::string apology(const std::vector<std::string>& failure_notes);

private:
    std::string label_of(const std::string& tool_name) const;
    std::string failure_note(const protocol::StepResult& result) const;

    const tools::ToolRegistry& registry_;
    std::shared_ptr<collab::LanguageModel> model_;
    std::chrono::milliseconds model_timeout_;
};

}  // namespace taskpilot::runtime
