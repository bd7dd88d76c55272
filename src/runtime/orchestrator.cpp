#include "runtime/orchestrator.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"
#include "core/time/calendar.hpp"
#include "planning/dependency_resolver.hpp"
#include "planning/intent_classifier.hpp"
#include "planning/plan_synthesizer.hpp"
#include "runtime/result_aggregator.hpp"
#include "runtime/step_executor.hpp"

namespace taskpilot::runtime {

using core::errors::ErrorKind;
using core::errors::TaskError;
using protocol::OrchestratorState;
using protocol::StepResult;
using protocol::StepStatus;

namespace {

planning::ClassifierOptions classifier_options(const core::config::EngineConfig& engine) {
    planning::ClassifierOptions options;
    options.current_user = engine.current_user;
    options.model_timeout = std::chrono::milliseconds(engine.generation_timeout_ms);
    options.reference_date = core::time::system_today();
    if (engine.reference_date.has_value()) {
        if (auto parsed = core::time::parse_iso_date(engine.reference_date.value())) {
            options.reference_date = parsed.value();
        }
    }
    return options;
}

}  // namespace

Orchestrator::Orchestrator(OrchestratorConfig config) : config_(std::move(config)) {
    history_.push_back(state_);
}

OrchestratorState Orchestrator::state() const { return state_; }

const std::vector<OrchestratorState>& Orchestrator::history() const { return history_; }

const protocol::Plan& Orchestrator::plan() const { return plan_; }

std::size_t Orchestrator::executed_steps() const { return executed_steps_; }

void Orchestrator::emit(const protocol::EngineEvent& event) const {
    if (config_.on_event) {
        config_.on_event(event);
    }
}

void Orchestrator::transition(const OrchestratorState next) {
    const OrchestratorState from = state_;
    state_ = next;
    history_.push_back(next);
    LOG_DEBUG("State " + protocol::to_string(from) + " -> " + protocol::to_string(next));
    emit(protocol::StateChangedEvent{from, next});
}

TaskError Orchestrator::fault(TaskError error) {
    error.kind = ErrorKind::InternalFault;
    LOG_ERROR("Request faulted [" + error.code + "]: " + error.message);
    transition(OrchestratorState::Faulted);
    emit(protocol::RequestFinishedEvent{state_, error.message});
    return error;
}

TaskError Orchestrator::reject(TaskError error) {
    LOG_WARN("Request rejected [" + error.code + "]: " + error.message);
    transition(OrchestratorState::Rejected);
    emit(protocol::RequestFinishedEvent{state_, error.message});
    return error;
}

core::errors::Result<protocol::AggregatedAnswer> Orchestrator::run(
    const std::string& request_text, std::shared_ptr<std::atomic_bool> cancel_token) {
    if (started_) {
        return TaskError{ErrorKind::Input, "An orchestrator handles exactly one request.",
                         "orchestrator_reused", "Create a new orchestrator per request."};
    }
    started_ = true;

    core::logging::RequestScope log_scope(config_.request_id);
    if (config_.registry == nullptr || !config_.registry->sealed()) {
        return fault(TaskError{ErrorKind::InternalFault,
                               "Tool registry is missing or not sealed.",
                               "registry_unavailable"});
    }
    const std::string text = core::text::trim(request_text);
    if (text.empty()) {
        return TaskError{ErrorKind::Input, "Request text cannot be empty.", "empty_request"};
    }
    const tools::ToolRegistry& registry = *config_.registry;
    const auto& engine = config_.engine;

    emit(protocol::RequestReceivedEvent{config_.request_id, text});

    planning::IntentClassifier classifier(registry, config_.language_model,
                                          classifier_options(engine));
    const planning::Classification classification = classifier.classify(text);
    transition(OrchestratorState::Classified);

    planning::PlanSynthesizer synthesizer(registry);
    protocol::Plan draft = synthesizer.synthesize(classification);
    transition(OrchestratorState::Planned);

    planning::DependencyResolver resolver(registry);
    auto resolved = resolver.resolve(std::move(draft), classification.entities);
    if (core::errors::is_error(resolved)) {
        const TaskError& error = core::errors::get_error(resolved);
        if (error.kind == ErrorKind::InternalFault) {
            return fault(error);
        }
        transition(OrchestratorState::Resolved);
        return reject(error);
    }
    plan_ = core::errors::get_value(resolved);
    transition(OrchestratorState::Resolved);
    emit(protocol::PlanResolvedEvent{plan_});

    std::string unsatisfied;
    for (const auto& step : plan_.steps) {
        if (step.status == StepStatus::FailedTerminal && step.error.has_value() &&
            step.error->kind == ErrorKind::DependencyUnsatisfiable) {
            unsatisfied += (unsatisfied.empty() ? "" : " ") + step.error->message;
        }
    }
    if (!unsatisfied.empty()) {
        return reject(TaskError{ErrorKind::DependencyUnsatisfiable,
                                "This request cannot be completed. " + unsatisfied,
                                "dependency_unsatisfiable",
                                "Register a tool that provides the missing value."});
    }

    transition(OrchestratorState::Executing);
    ExecutorOptions executor_options;
    executor_options.max_retries = engine.max_retries;
    executor_options.step_timeout = std::chrono::milliseconds(engine.step_timeout_ms);
    executor_options.generation_timeout =
        std::chrono::milliseconds(engine.generation_timeout_ms);
    StepExecutor executor(registry, executor_options);

    std::vector<StepResult> results;
    std::string stop_reason;
    for (auto& step : plan_.steps) {
        if (cancel_token && cancel_token->load()) {
            stop_reason = "request cancelled";
            LOG_WARN("Cancelled; aggregating " + std::to_string(results.size()) +
                     " finished step(s)");
            break;
        }
        if (executed_steps_ >= engine.max_steps) {
            stop_reason = "step limit of " + std::to_string(engine.max_steps) + " reached";
            LOG_WARN("Step limit reached with " +
                     std::to_string(plan_.steps.size() - executed_steps_) +
                     " step(s) left");
            break;
        }

        StepResult result = executor.execute(step, classification.entities, results,
                                             cancel_token);
        ++executed_steps_;
        emit(protocol::StepFinishedEvent{result});
        if (result.error.has_value() && result.error->kind == ErrorKind::InternalFault) {
            return fault(result.error.value());
        }
        results.push_back(std::move(result));
    }

    ResultAggregator aggregator(registry, config_.language_model,
                                std::chrono::milliseconds(engine.generation_timeout_ms));
    protocol::AggregatedAnswer answer = aggregator.aggregate(
        text, classification.intent, plan_, results, stop_reason);
    transition(OrchestratorState::Aggregated);

    std::size_t succeeded = 0;
    for (const auto& result : results) {
        succeeded += result.success ? 1 : 0;
    }
    transition(OrchestratorState::Done);
    emit(protocol::RequestFinishedEvent{
        state_, std::to_string(succeeded) + " of " + std::to_string(plan_.steps.size()) +
                    " step(s) succeeded"});
    return answer;
}

}  // namespace taskpilot::runtime
