#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/task_errors.hpp"
#include "protocol/entity_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "tools/tool_registry.hpp"

namespace taskpilot::runtime {

struct ExecutorOptions {
    std::uint32_t max_retries = 2;   // Re-invocations after the first attempt
    std::chrono::milliseconds step_timeout{5000};
    std::chrono::milliseconds generation_timeout{30000};
};

class StepExecutor {
public:
    StepExecutor(const tools::ToolRegistry& registry, ExecutorOptions options);

    // Runs one step to a terminal status. Step-local failures are reported in
    // the returned StepResult, never as an error of the call itself.
    protocol::StepResult execute(protocol::PlanStep& step,
                                 const protocol::EntityBag& entities,
                                 const std::vector<protocol::StepResult>& prior_results,
                                 std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

private:
    core::errors::Result<nlohmann::json> bind_arguments(
        const protocol::ToolSpec& spec, const protocol::PlanStep& step,
        const protocol::EntityBag& entities,
        const std::vector<protocol::StepResult>& prior_results) const;

    core::errors::Result<protocol::ToolOutput> invoke_once(
        const tools::ToolEntry& entry, const nlohmann::json& arguments,
        const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    const tools::ToolRegistry& registry_;
    ExecutorOptions options_;
};

}  // namespace taskpilot::runtime
