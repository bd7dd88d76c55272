#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/config/engine_config.hpp"
#include "core/errors/task_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "protocol/task_request.hpp"

namespace taskpilot::session {

// Appends one JSON object per line to <trace_dir>/<request id>.jsonl.
class TraceWriter {
public:
    explicit TraceWriter(std::filesystem::path trace_dir);

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& request_id, const protocol::TaskRequest& request,
        const core::config::EngineConfig& config) const;

    core::errors::Result<std::filesystem::path> write_plan(
        const std::string& request_id, const protocol::Plan& plan) const;

    core::errors::Result<std::filesystem::path> write_step(
        const std::string& request_id, const protocol::StepResult& result) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& request_id, protocol::OrchestratorState state,
        const std::string& summary,
        const std::optional<core::errors::TaskError>& error = std::nullopt) const;

    core::errors::Result<std::filesystem::path> trace_path(
        const std::string& request_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& request_id, const std::string& event_json) const;

    std::filesystem::path trace_dir_;
};

}  // namespace taskpilot::session
