#pragma once
#include <string>
#include <variant>
#include "protocol/plan_contract.hpp"

namespace taskpilot::protocol {

    // Request lifecycle as driven by the orchestrator
    enum class OrchestratorState {
        Received,
        Classified,
        Planned,
        Resolved,
        Executing,
        Aggregated,
        Done,
        Rejected,   // Unsatisfiable or cyclic plan
        Faulted     // Internal invariant violation
    };

    struct RequestReceivedEvent { std::string request_id; std::string request_text; };
    struct StateChangedEvent { OrchestratorState from; OrchestratorState to; };
    struct PlanResolvedEvent { Plan plan; };
    struct StepFinishedEvent { StepResult result; };
    struct RequestFinishedEvent { OrchestratorState state; std::string summary; };

    using EngineEvent = std::variant<
        RequestReceivedEvent,
        StateChangedEvent,
        PlanResolvedEvent,
        StepFinishedEvent,
        RequestFinishedEvent
    >;

    inline std::string to_string(const OrchestratorState state) {
        switch (state) {
            case OrchestratorState::Received: return "received";
            case OrchestratorState::Classified: return "classified";
            case OrchestratorState::Planned: return "planned";
            case OrchestratorState::Resolved: return "resolved";
            case OrchestratorState::Executing: return "executing";
            case OrchestratorState::Aggregated: return "aggregated";
            case OrchestratorState::Done: return "done";
            case OrchestratorState::Rejected: return "rejected";
            case OrchestratorState::Faulted: return "faulted";
            default: return "unknown";
        }
    }

} // namespace taskpilot::protocol
