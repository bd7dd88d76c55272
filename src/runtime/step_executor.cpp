#include "runtime/step_executor.hpp"

#include <algorithm>
#include <future>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include "collab/collaborators.hpp"
#include "core/logging/logger.hpp"
#include "runtime/argument_repair.hpp"

namespace taskpilot::runtime {

using core::errors::ErrorKind;
using core::errors::TaskError;
using nlohmann::json;
using protocol::BackReference;
using protocol::PlanStep;
using protocol::StepResult;
using protocol::StepStatus;
using protocol::ToolEffect;
using protocol::ToolOutput;
using protocol::ToolSpec;

namespace {

StepResult fail(StepResult result, PlanStep& step, const TaskError& error) {
    step.status = StepStatus::FailedTerminal;
    step.error = error;
    result.success = false;
    result.error = error;
    result.retry_count = step.retry_count;
    return result;
}

// A state-changing call that failed transiently may still have taken effect,
// unless the collaborator refused it up front.
TaskError classify(const ToolSpec& spec, TaskError error) {
    if (error.kind == ErrorKind::Transient && spec.effect == ToolEffect::Mutating &&
        !collab::was_refused(error)) {
        error.kind = ErrorKind::ExternalMutationUncertain;
        error.message = spec.name + " did not confirm its result and may have been applied (" +
                        error.message + ")";
        error.hint = "Check the target system before trying again.";
    }
    return error;
}

std::string step_label(const PlanStep& step) {
    return "step " + std::to_string(step.id) + " (" + step.tool_name + ")";
}

}  // namespace

StepExecutor::StepExecutor(const tools::ToolRegistry& registry, ExecutorOptions options)
    : registry_(registry), options_(options) {}

StepResult StepExecutor::execute(PlanStep& step, const protocol::EntityBag& entities,
                                 const std::vector<StepResult>& prior_results,
                                 std::shared_ptr<std::atomic_bool> cancel_token) const {
    StepResult result;
    result.step_id = step.id;
    result.tool_name = step.tool_name;

    if (step.status == StepStatus::FailedTerminal) {
        result.error = step.error.value_or(TaskError{ErrorKind::InternalFault,
                                                     "Step was marked failed without a reason.",
                                                     "missing_step_error"});
        result.retry_count = step.retry_count;
        return result;
    }

    auto found = registry_.lookup(step.tool_name);
    if (core::errors::is_error(found)) {
        return fail(result, step, core::errors::get_error(found));
    }
    const tools::ToolEntry& entry = *core::errors::get_value(found);
    const ToolSpec& spec = entry.spec;

    auto bound = bind_arguments(spec, step, entities, prior_results);
    if (core::errors::is_error(bound)) {
        const auto& error = core::errors::get_error(bound);
        LOG_WARN("Not running " + step_label(step) + ": " + error.message);
        return fail(result, step, error);
    }
    json arguments = core::errors::get_value(bound);

    step.status = StepStatus::Running;
    LOG_INFO("Running " + step_label(step) + " with " + arguments.dump());

    for (;;) {
        ++result.attempts;
        auto outcome = invoke_once(entry, arguments, cancel_token);
        if (!core::errors::is_error(outcome)) {
            const ToolOutput& output = core::errors::get_value(outcome);
            step.status = StepStatus::Succeeded;
            step.error.reset();
            result.success = true;
            result.output = output.value;
            result.excerpt = output.text;
            for (const auto& name : spec.exports) {
                auto exported = output.exports.find(name);
                if (exported != output.exports.end()) {
                    result.exports[name] = exported->second;
                }
            }
            result.origins = output.origins;
            result.retry_count = step.retry_count;
            LOG_INFO("Finished " + step_label(step) + " after " +
                     std::to_string(result.attempts) + " attempt(s)");
            return result;
        }

        const TaskError error = classify(spec, core::errors::get_error(outcome));
        LOG_WARN("Attempt " + std::to_string(result.attempts) + " of " + step_label(step) +
                 " failed [" + core::errors::to_string(error.kind) + "/" + error.code +
                 "]: " + error.message);

        if (!core::errors::is_retryable(error.kind) ||
            step.retry_count >= static_cast<int>(options_.max_retries)) {
            return fail(result, step, error);
        }
        if (cancel_token && cancel_token->load()) {
            LOG_INFO("Not retrying " + step_label(step) + ": request cancelled");
            return fail(result, step, error);
        }

        if (error.kind == ErrorKind::ParameterInvalid) {
            auto repaired = ArgumentRepair::repair(spec, arguments, error);
            if (!repaired.has_value()) {
                LOG_INFO("No repair rule applies to " + step_label(step));
                return fail(result, step, error);
            }
            LOG_INFO("Repaired arguments of " + step_label(step) + ": " + repaired->dump());
            arguments = std::move(repaired.value());
        }

        step.status = StepStatus::FailedRetryable;
        ++step.retry_count;
    }
}

core::errors::Result<json> StepExecutor::bind_arguments(
    const ToolSpec& spec, const PlanStep& step, const protocol::EntityBag& entities,
    const std::vector<StepResult>& prior_results) const {
    json arguments = json::object();

    for (const auto& param : spec.params) {
        auto binding = step.arguments.find(param.name);
        if (binding != step.arguments.end()) {
            if (const auto* literal = std::get_if<json>(&binding->second)) {
                arguments[param.name] = *literal;
                continue;
            }
            if (const auto* ref = std::get_if<BackReference>(&binding->second)) {
                const StepResult* producer = nullptr;
                for (const auto& prior : prior_results) {
                    if (prior.step_id == ref->step_id) {
                        producer = &prior;
                    }
                }
                if (producer == nullptr) {
                    return TaskError{ErrorKind::PreconditionFailed,
                                     "Step " + std::to_string(ref->step_id) +
                                         " has not run, so " + param.name + " is unknown.",
                                     "prerequisite_missing", "", param.name};
                }
                std::string producer_label = producer->tool_name;
                auto producer_entry = registry_.lookup(producer->tool_name);
                if (!core::errors::is_error(producer_entry)) {
                    producer_label = core::errors::get_value(producer_entry)->spec.description;
                }
                if (!producer->success) {
                    return TaskError{ErrorKind::PreconditionFailed,
                                     "Skipped because '" + producer_label +
                                         "' did not succeed.",
                                     "prerequisite_failed", "", param.name};
                }
                auto exported = producer->exports.find(ref->export_name);
                if (exported == producer->exports.end()) {
                    return TaskError{ErrorKind::PreconditionFailed,
                                     "'" + producer_label + "' did not supply " +
                                         ref->export_name + ".",
                                     "export_missing", "", param.name};
                }
                arguments[param.name] = exported->second;
                continue;
            }
        }

        if (param.entity.has_value()) {
            auto value = entities.find(param.entity.value());
            if (value != entities.end() && !value->second.empty()) {
                arguments[param.name] = value->second;
                continue;
            }
        }
        if (!param.default_value.is_null()) {
            arguments[param.name] = param.default_value;
            continue;
        }
        if (param.required) {
            std::string message = "No value is available for " + param.name + ".";
            if (param.entity.has_value()) {
                std::string what = protocol::to_string(param.entity.value());
                std::replace(what.begin(), what.end(), '_', ' ');
                message = "The request does not say which " + what + " to use.";
            }
            return TaskError{ErrorKind::PreconditionFailed, message, "unbound_parameter", "",
                             param.name};
        }
    }
    return arguments;
}

core::errors::Result<ToolOutput> StepExecutor::invoke_once(
    const tools::ToolEntry& entry, const json& arguments,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    collab::CallContext context;
    context.timeout = std::holds_alternative<tools::GenerationTool>(entry.impl)
                          ? options_.generation_timeout
                          : options_.step_timeout;
    context.deadline = std::chrono::steady_clock::now() + context.timeout;
    context.cancel_token = cancel_token;

    // The worker owns copies of everything it touches; an abandoned call may
    // finish long after this step has moved on.
    using Call = std::packaged_task<core::errors::Result<ToolOutput>()>;
    auto call = std::make_shared<Call>(
        [tool = entry, arguments, context]() {
            return tools::invoke_tool(tool, arguments, context);
        });
    auto pending = call->get_future();
    std::thread([call, request_id = core::logging::Logger::get().current_request_id()]() {
        core::logging::RequestScope log_scope(request_id);
        (*call)();
    }).detach();

    if (pending.wait_for(context.timeout) == std::future_status::ready) {
        return pending.get();
    }
    LOG_WARN(entry.spec.name + " is still running after " +
             std::to_string(context.timeout.count()) + " ms; abandoning the call");
    return TaskError{ErrorKind::Transient,
                     entry.spec.name + " did not answer within " +
                         std::to_string(context.timeout.count()) + " ms.",
                     "tool_timeout"};
}

}  // namespace taskpilot::runtime
