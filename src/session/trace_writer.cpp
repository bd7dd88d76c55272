#include "session/trace_writer.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

namespace taskpilot::session {

using core::errors::ErrorKind;
using core::errors::TaskError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json error_to_json(const TaskError& error) {
    json payload;
    payload["kind"] = core::errors::to_string(error.kind);
    payload["code"] = error.code;
    payload["message"] = error.message;
    payload["parameter"] = error.parameter;
    return payload;
}

json request_to_json(const protocol::TaskRequest& request,
                     const core::config::EngineConfig& config) {
    json payload;
    payload["request_text"] = request.request_text;
    payload["config_file"] =
        request.config_file.has_value() ? request.config_file.value().string() : "";
    payload["user_id"] = request.user_id.has_value() ? request.user_id.value() : "";
    payload["verbose"] = request.verbose;
    payload["max_steps"] = config.max_steps;
    payload["max_retries"] = config.max_retries;
    payload["step_timeout_ms"] = config.step_timeout_ms;
    payload["reference_date"] =
        config.reference_date.has_value() ? config.reference_date.value() : "";
    return payload;
}

json binding_to_json(const protocol::ArgBinding& binding) {
    if (const auto* literal = std::get_if<json>(&binding)) {
        return *literal;
    }
    if (const auto* ref = std::get_if<protocol::BackReference>(&binding)) {
        return json{{"from_step", ref->step_id}, {"export", ref->export_name}};
    }
    return nullptr;
}

json plan_to_json(const protocol::Plan& plan) {
    json steps = json::array();
    for (const auto& step : plan.steps) {
        json arguments = json::object();
        for (const auto& [name, binding] : step.arguments) {
            arguments[name] = binding_to_json(binding);
        }
        json payload;
        payload["id"] = step.id;
        payload["position"] = step.position;
        payload["tool"] = step.tool_name;
        payload["status"] = protocol::to_string(step.status);
        payload["arguments"] = arguments;
        if (step.error.has_value()) {
            payload["error"] = error_to_json(step.error.value());
        }
        steps.push_back(payload);
    }
    return json{{"steps", steps}};
}

json step_to_json(const protocol::StepResult& result) {
    json payload;
    payload["step_id"] = result.step_id;
    payload["tool"] = result.tool_name;
    payload["success"] = result.success;
    payload["attempts"] = result.attempts;
    payload["retry_count"] = result.retry_count;
    payload["excerpt"] = result.excerpt;
    payload["exports"] = json(result.exports);
    if (result.error.has_value()) {
        payload["error"] = error_to_json(result.error.value());
    }
    return payload;
}

}  // namespace

TraceWriter::TraceWriter(std::filesystem::path trace_dir)
    : trace_dir_(std::move(trace_dir)) {}

core::errors::Result<std::filesystem::path> TraceWriter::trace_path(
    const std::string& request_id) const {
    if (request_id.empty()) {
        return TaskError{ErrorKind::Input, "Request ID cannot be empty.",
                         "invalid_request_id"};
    }
    if (trace_dir_.empty()) {
        return TaskError{ErrorKind::Input, "Trace directory cannot be empty.",
                         "invalid_trace_dir"};
    }

    std::error_code ec;
    if (std::filesystem::exists(trace_dir_, ec) &&
        !std::filesystem::is_directory(trace_dir_, ec)) {
        return TaskError{ErrorKind::Input,
                         "Trace path is not a directory: " + trace_dir_.string(),
                         "invalid_trace_dir"};
    }
    std::filesystem::create_directories(trace_dir_, ec);
    if (ec) {
        return TaskError{ErrorKind::InternalFault,
                         "Unable to create trace directory: " + trace_dir_.string(),
                         "trace_dir_create_failed"};
    }

    return trace_dir_ / (request_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> TraceWriter::append_event(
    const std::string& request_id, const std::string& event_json) const {
    auto path_result = trace_path(request_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return TaskError{ErrorKind::InternalFault, "Unable to open trace file: " + path.string(),
                         "trace_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return TaskError{ErrorKind::InternalFault,
                         "Unable to write trace event: " + path.string(),
                         "trace_write_failed"};
    }

    return path;
}

core::errors::Result<std::filesystem::path> TraceWriter::write_request(
    const std::string& request_id, const protocol::TaskRequest& request,
    const core::config::EngineConfig& config) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "request";
    event["request_id"] = request_id;
    event["payload"] = request_to_json(request, config);
    return append_event(request_id, event.dump());
}

core::errors::Result<std::filesystem::path> TraceWriter::write_plan(
    const std::string& request_id, const protocol::Plan& plan) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "plan";
    event["request_id"] = request_id;
    event["payload"] = plan_to_json(plan);
    return append_event(request_id, event.dump());
}

core::errors::Result<std::filesystem::path> TraceWriter::write_step(
    const std::string& request_id, const protocol::StepResult& result) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "step";
    event["request_id"] = request_id;
    event["payload"] = step_to_json(result);
    return append_event(request_id, event.dump());
}

core::errors::Result<std::filesystem::path> TraceWriter::write_final(
    const std::string& request_id, const protocol::OrchestratorState state,
    const std::string& summary, const std::optional<TaskError>& error) const {
    json payload;
    payload["state"] = protocol::to_string(state);
    payload["summary"] = summary;
    if (error.has_value()) {
        payload["error"] = error_to_json(error.value());
    }

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "final";
    event["request_id"] = request_id;
    event["payload"] = payload;
    return append_event(request_id, event.dump());
}

}  // namespace taskpilot::session
