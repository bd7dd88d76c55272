#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "collab/collaborators.hpp"
#include "core/config/engine_config.hpp"
#include "core/errors/task_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "tools/tool_registry.hpp"

namespace taskpilot::runtime {

struct OrchestratorConfig {
    const tools::ToolRegistry* registry = nullptr;   // Sealed; outlives the orchestrator
    std::shared_ptr<collab::LanguageModel> language_model;
    core::config::EngineConfig engine;
    std::string request_id;
    std::function<void(const protocol::EngineEvent&)> on_event;
};

// Drives one request from text to answer. Not reusable.
class Orchestrator {
public:
    explicit Orchestrator(OrchestratorConfig config);

    // Errors:
    //   Input                   empty request, or the orchestrator already ran
    //   DependencyUnsatisfiable the plan needs a value no tool can supply
    //   Configuration           the plan's steps depend on each other in a cycle
    //   InternalFault           registry or resolver invariant broken
    core::errors::Result<protocol::AggregatedAnswer> run(
        const std::string& request_text,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    protocol::OrchestratorState state() const;
    const std::vector<protocol::OrchestratorState>& history() const;
    const protocol::Plan& plan() const;
    std::size_t executed_steps() const;

private:
    void transition(protocol::OrchestratorState next);
    void emit(const protocol::EngineEvent& event) const;
    core::errors::TaskError fault(core::errors::TaskError error);
    core::errors::TaskError reject(core::errors::TaskError error);

    OrchestratorConfig config_;
    protocol::OrchestratorState state_ = protocol::OrchestratorState::Received;
    std::vector<protocol::OrchestratorState> history_;
    protocol::Plan plan_;
    std::size_t executed_steps_ = 0;
    bool started_ = false;
};

}  // namespace taskpilot::runtime
