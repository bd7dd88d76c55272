#pragma once

#include <optional>
#include <nlohmann/json.hpp>
#include "core/errors/task_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace taskpilot::runtime {

// Deterministic rewrites applied before a ParameterInvalid retry.
class ArgumentRepair {
public:
    // Returns the rewritten arguments, or nullopt when no rule changes
    // anything or the rewrite would alter a target-entity argument.
    static std::optional<nlohmann::json> repair(const protocol::ToolSpec& spec,
                                                const nlohmann::json& arguments,
                                                const core::errors::TaskError& error);

    // Target arguments may only differ in case and surrounding whitespace.
    static bool preserves_targets(const protocol::ToolSpec& spec,
                                  const nlohmann::json& before,
                                  const nlohmann::json& after);
};

}  // namespace taskpilot::runtime
