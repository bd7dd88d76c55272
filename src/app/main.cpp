#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include "app/cli_parser.hpp"
#include "collab/finance_store.hpp"
#include "collab/keyword_retriever.hpp"
#include "collab/template_language_model.hpp"
#include "core/config/engine_config.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/task_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/orchestrator.hpp"
#include "session/request_manager.hpp"
#include "session/trace_writer.hpp"
#include "tools/finance_catalog.hpp"
#include "tools/tool_registry.hpp"

namespace {

std::atomic_bool* g_cancel_flag = nullptr;

void handle_interrupt(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

void print_answer(const taskpilot::protocol::AggregatedAnswer& answer) {
    std::cout << answer.text << "\n";
    if (!answer.sources.empty()) {
        std::cout << "\nSources:\n";
        for (const auto& source : answer.sources) {
            std::cout << "- " << source.origin_id;
            if (!source.excerpt.empty()) {
                std::cout << ": " << source.excerpt;
            }
            std::cout << "\n";
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate a bootstrap ID until the request manager hands out the real one
    std::string bootstrap_id = taskpilot::core::config::generate_request_id();
    taskpilot::core::logging::Logger::get().set_request_id(bootstrap_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = taskpilot::app::cli::parse_and_validate(argc, argv);
    if (taskpilot::core::errors::is_error(parsed)) {
        const auto& err = taskpilot::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = taskpilot::core::errors::get_value(parsed);
    if (req.verbose) {
        taskpilot::core::logging::Logger::get().set_min_level(
            taskpilot::core::logging::LogLevel::DEBUG);
    }

    // 3. Load configuration; CLI flags win over the file
    taskpilot::core::config::EngineConfig config;
    if (req.config_file.has_value()) {
        auto loaded = taskpilot::core::config::load_engine_config(req.config_file.value());
        if (taskpilot::core::errors::is_error(loaded)) {
            const auto& err = taskpilot::core::errors::get_error(loaded);
            LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
            return 3;
        }
        config = taskpilot::core::errors::get_value(loaded);
    }
    if (req.max_steps.has_value()) {
        config.max_steps = req.max_steps.value();
    }
    if (req.max_retries.has_value()) {
        config.max_retries = req.max_retries.value();
    }

    auto store = std::make_shared<taskpilot::collab::InMemoryFinanceStore>();
    auto retriever = std::make_shared<taskpilot::collab::KeywordRetriever>(
        taskpilot::collab::default_policy_corpus());
    auto model = std::make_shared<taskpilot::collab::TemplateLanguageModel>();

    if (req.user_id.has_value()) {
        auto employee = store->find_employee(req.user_id.value());
        if (!employee.has_value()) {
            LOG_ERROR("Input error [unknown_user]: No employee with id " +
                      req.user_id.value());
            return 2;
        }
        config.current_user = taskpilot::core::config::UserProfile{
            employee->name, employee->id, employee->department};
    }

    // 4. Register the request and its cancellation token
    taskpilot::session::RequestManager request_manager;
    auto started = request_manager.start_request(req);
    if (taskpilot::core::errors::is_error(started)) {
        const auto& err = taskpilot::core::errors::get_error(started);
        LOG_ERROR("Failed to start request [" + err.code + "]: " + err.message);
        return 2;
    }
    const std::string request_id = taskpilot::core::errors::get_value(started);
    taskpilot::core::logging::Logger::get().set_request_id(request_id);
    LOG_INFO("Request started: " + request_id);

    auto cancel_token_result = request_manager.get_cancel_token(request_id);
    if (taskpilot::core::errors::is_error(cancel_token_result)) {
        const auto& err = taskpilot::core::errors::get_error(cancel_token_result);
        LOG_ERROR("Failed to get cancellation token [" + err.code + "]: " + err.message);
        return 1;
    }
    auto cancel_token = taskpilot::core::errors::get_value(cancel_token_result);
    g_cancel_flag = cancel_token.get();
    std::signal(SIGINT, handle_interrupt);

    // 5. Build the tool registry
    taskpilot::tools::ToolRegistry registry;
    auto registered = taskpilot::tools::register_finance_tools(
        registry, taskpilot::tools::FinanceCollaborators{retriever, model, store}, config);
    if (taskpilot::core::errors::is_error(registered)) {
        const auto& err = taskpilot::core::errors::get_error(registered);
        LOG_ERROR("Tool registration failed [" + err.code + "]: " + err.message);
        return 3;
    }
    registry.seal();
    LOG_DEBUG("Registered " + std::to_string(registry.size()) + " tools");

    // 6. Optional trace
    std::optional<taskpilot::session::TraceWriter> trace;
    bool trace_failed = false;
    auto check_trace = [&trace_failed](
                           const taskpilot::core::errors::Result<std::filesystem::path>& written) {
        if (taskpilot::core::errors::is_error(written)) {
            const auto& err = taskpilot::core::errors::get_error(written);
            LOG_ERROR("Failed to write trace [" + err.code + "]: " + err.message);
            trace_failed = true;
        }
    };
    if (req.trace_dir.has_value()) {
        trace.emplace(req.trace_dir.value());
        check_trace(trace->write_request(request_id, req, config));
        if (trace_failed) {
            return 6;
        }
    }

    // 7. Run
    taskpilot::runtime::OrchestratorConfig orchestrator_config;
    orchestrator_config.registry = &registry;
    orchestrator_config.language_model = model;
    orchestrator_config.engine = config;
    orchestrator_config.request_id = request_id;
    orchestrator_config.on_event = [&](const taskpilot::protocol::EngineEvent& event) {
        if (!trace.has_value()) {
            return;
        }
        if (const auto* resolved = std::get_if<taskpilot::protocol::PlanResolvedEvent>(&event)) {
            check_trace(trace->write_plan(request_id, resolved->plan));
        } else if (const auto* finished =
                       std::get_if<taskpilot::protocol::StepFinishedEvent>(&event)) {
            check_trace(trace->write_step(request_id, finished->result));
        }
    };

    taskpilot::runtime::Orchestrator orchestrator(std::move(orchestrator_config));
    auto outcome = orchestrator.run(req.request_text, cancel_token);
    g_cancel_flag = nullptr;

    if (taskpilot::core::errors::is_error(outcome)) {
        const auto& err = taskpilot::core::errors::get_error(outcome);
        const auto state = orchestrator.state();
        LOG_ERROR("Request ended " + taskpilot::protocol::to_string(state) + " [" + err.code +
                  "]: " + err.message);
        std::cout << taskpilot::core::errors::user_message(err) << "\n";
        if (!err.hint.empty() && err.kind != taskpilot::core::errors::ErrorKind::InternalFault) {
            std::cout << err.hint << "\n";
        }

        if (trace.has_value()) {
            check_trace(trace->write_final(request_id, state, "Request not answered.", err));
        }
        auto marked = state == taskpilot::protocol::OrchestratorState::Rejected
                          ? request_manager.mark_rejected(request_id, err.message)
                          : request_manager.mark_failed(request_id, err.message);
        if (taskpilot::core::errors::is_error(marked)) {
            const auto& mark_err = taskpilot::core::errors::get_error(marked);
            LOG_ERROR("Failed to record request state [" + mark_err.code + "]: " +
                      mark_err.message);
        }
        return err.kind == taskpilot::core::errors::ErrorKind::Input ? 2 : 1;
    }

    const auto& answer = taskpilot::core::errors::get_value(outcome);
    for (const auto& result : answer.step_results) {
        LOG_INFO("Step " + std::to_string(result.step_id) + " (" + result.tool_name + "): " +
                 (result.success ? "ok" : "failed") + ", attempts " +
                 std::to_string(result.attempts));
    }
    print_answer(answer);

    auto finished = cancel_token->load() ? request_manager.cancel_request(request_id)
                                         : request_manager.mark_completed(request_id);
    if (taskpilot::core::errors::is_error(finished)) {
        const auto& err = taskpilot::core::errors::get_error(finished);
        LOG_ERROR("Failed to record request state [" + err.code + "]: " + err.message);
        return 1;
    }

    if (trace.has_value()) {
        check_trace(trace->write_final(
            request_id, orchestrator.state(),
            std::to_string(answer.step_results.size()) + " step(s) run, " +
                std::to_string(answer.failure_notes.size()) + " note(s)"));
        if (!trace_failed) {
            auto path = trace->trace_path(request_id);
            if (!taskpilot::core::errors::is_error(path)) {
                LOG_INFO("Trace: " + taskpilot::core::errors::get_value(path).string());
            }
        }
    }
    return trace_failed ? 6 : 0;
}
