#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "collab/collaborators.hpp"
#include "core/errors/task_errors.hpp"
#include "core/text/text_utils.hpp"
#include "protocol/plan_contract.hpp"
#include "runtime/step_executor.hpp"
#include "test_fakes.hpp"
#include "tools/tool_registry.hpp"

namespace {

using taskpilot::core::errors::ErrorKind;
using taskpilot::core::errors::is_error;
using taskpilot::core::errors::TaskError;
using taskpilot::protocol::BackReference;
using taskpilot::protocol::EntityBag;
using taskpilot::protocol::EntityKind;
using taskpilot::protocol::PlanStep;
using taskpilot::protocol::StepResult;
using taskpilot::protocol::StepStatus;
using taskpilot::protocol::ToolEffect;
using taskpilot::protocol::ToolFamily;
using taskpilot::runtime::ExecutorOptions;
using taskpilot::runtime::StepExecutor;
using taskpilot::testing::make_output;
using taskpilot::testing::make_spec;
using taskpilot::testing::param;
using taskpilot::testing::ScriptedDataService;
using taskpilot::tools::DataTool;
using taskpilot::tools::ToolRegistry;
using nlohmann::json;

TaskError transient() {
    return TaskError{ErrorKind::Transient, "Service busy.", "service_busy"};
}

PlanStep make_step(int id, const std::string& tool_name) {
    PlanStep step;
    step.id = id;
    step.position = static_cast<std::size_t>(id);
    step.tool_name = tool_name;
    return step;
}

class StepExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_ = std::make_shared<ScriptedDataService>();
        ASSERT_FALSE(is_error(registry_.register_tool(
            make_spec("lookup", ToolFamily::Record,
                      {param("employee_name", false, EntityKind::EmployeeName, nullptr, true)},
                      {"employee_id"}),
            DataTool{data_})));
        ASSERT_FALSE(is_error(registry_.register_tool(
            make_spec("summary", ToolFamily::Record,
                      {param("employee_id", true, EntityKind::EmployeeId, nullptr, true),
                       param("start_date", false, EntityKind::StartDate),
                       param("limit", false, std::nullopt, 100)},
                      {"total_amount"}),
            DataTool{data_})));
        ASSERT_FALSE(is_error(registry_.register_tool(
            make_spec("create_ticket", ToolFamily::Action,
                      {param("title", true, EntityKind::Subject)}, {"ticket_id"}, {},
                      ToolEffect::Mutating),
            DataTool{data_})));
        registry_.seal();
        options_.step_timeout = std::chrono::milliseconds(1000);
    }

    StepExecutor executor() const { return StepExecutor(registry_, options_); }

    ToolRegistry registry_;
    std::shared_ptr<ScriptedDataService> data_;
    ExecutorOptions options_;
};

TEST_F(StepExecutorTest, SuccessKeepsDeclaredExportsOnly) {
    data_->enqueue("lookup", make_output("Alice Chen (E001)",
                                         {{"employee_id", "E001"}, {"secret", "x"}},
                                         "employees:E001"));
    PlanStep step = make_step(1, "lookup");
    step.arguments["employee_name"] = json("Alice Chen");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.retry_count, 0);
    EXPECT_EQ(step.status, StepStatus::Succeeded);
    EXPECT_EQ(result.exports.at("employee_id"), "E001");
    EXPECT_EQ(result.exports.count("secret"), 0u);
    EXPECT_EQ(result.origins.front().origin_id, "employees:E001");
}

TEST_F(StepExecutorTest, TransientFailureIsRetried) {
    data_->enqueue("summary", transient());
    PlanStep step = make_step(1, "summary");
    step.arguments["employee_id"] = json("E001");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(result.retry_count, 1);
    EXPECT_EQ(step.retry_count, 1);
}

TEST_F(StepExecutorTest, RetriesStopAtConfiguredBound) {
    for (int i = 0; i < 10; ++i) {
        data_->enqueue("summary", transient());
    }
    PlanStep step = make_step(1, "summary");
    step.arguments["employee_id"] = json("E001");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(result.retry_count, 2);
    EXPECT_EQ(data_->call_count("summary"), 3u);
    EXPECT_EQ(step.status, StepStatus::FailedTerminal);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::Transient);
}

TEST_F(StepExecutorTest, ZeroRetriesMeansSingleAttempt) {
    options_.max_retries = 0;
    data_->enqueue("summary", transient());
    PlanStep step = make_step(1, "summary");
    step.arguments["employee_id"] = json("E001");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(data_->call_count("summary"), 1u);
}

TEST_F(StepExecutorTest, ParameterRepairKeepsTargetEntity) {
    data_->enqueue("summary", TaskError{ErrorKind::ParameterInvalid, "Bad date.",
                                        "invalid_date", "", "start_date"});
    data_->enqueue("summary", TaskError{ErrorKind::ParameterInvalid, "Bad id.",
                                        "invalid_id", "", "employee_id"});
    PlanStep step = make_step(1, "summary");
    step.arguments["employee_id"] = json("e001");
    step.arguments["start_date"] = json("2024/3/1");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_TRUE(result.success);
    ASSERT_EQ(data_->calls().size(), 3u);
    EXPECT_EQ(data_->calls()[1].arguments.at("start_date"), "2024-03-01");
    EXPECT_EQ(data_->calls()[2].arguments.at("employee_id"), "E001");
    for (const auto& call : data_->calls()) {
        EXPECT_EQ(taskpilot::core::text::uppercase(
                      call.arguments.at("employee_id").get<std::string>()),
                  "E001");
    }
}

TEST_F(StepExecutorTest, UnrepairableParameterIsNotRetried) {
    data_->enqueue("summary", TaskError{ErrorKind::ParameterInvalid, "Unknown employee.",
                                        "invalid_id", "", "employee_id"});
    PlanStep step = make_step(1, "summary");
    step.arguments["employee_id"] = json("E999");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.error->kind, ErrorKind::ParameterInvalid);
}

TEST_F(StepExecutorTest, EntityNotFoundIsTerminal) {
    data_->enqueue("lookup", TaskError{ErrorKind::EntityNotFound, "No such employee.",
                                       "employee_not_found"});
    PlanStep step = make_step(1, "lookup");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.error->kind, ErrorKind::EntityNotFound);
}

TEST_F(StepExecutorTest, MutatingTransientFailureIsNeverRepeated) {
    data_->enqueue("create_ticket", transient());
    PlanStep step = make_step(1, "create_ticket");
    step.arguments["title"] = json("Check invoice");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(data_->call_count("create_ticket"), 1u);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::ExternalMutationUncertain);
    EXPECT_FALSE(result.error->hint.empty());
}

TEST_F(StepExecutorTest, SlowReadOnlyCallTimesOut) {
    options_.step_timeout = std::chrono::milliseconds(20);
    options_.max_retries = 1;
    data_->set_delay(std::chrono::milliseconds(300));
    PlanStep step = make_step(1, "summary");
    step.arguments["employee_id"] = json("E001");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 2);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::Transient);
    EXPECT_EQ(result.error->code, "tool_timeout");
}

TEST_F(StepExecutorTest, HangingCallIsAbandonedAtTimeout) {
    options_.step_timeout = std::chrono::milliseconds(50);
    options_.max_retries = 2;
    data_->set_delay(std::chrono::milliseconds(1000));
    PlanStep step = make_step(1, "summary");
    step.arguments["employee_id"] = json("E001");

    const auto started = std::chrono::steady_clock::now();
    const StepResult result = executor().execute(step, {}, {});
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    EXPECT_LT(elapsed.count(), 500);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(result.retry_count, 2);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, "tool_timeout");
}

TEST_F(StepExecutorTest, SlowMutatingCallIsUncertain) {
    options_.step_timeout = std::chrono::milliseconds(20);
    data_->set_delay(std::chrono::milliseconds(300));
    PlanStep step = make_step(1, "create_ticket");
    step.arguments["title"] = json("Check invoice");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 1);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::ExternalMutationUncertain);
}

TEST_F(StepExecutorTest, RefusedMutatingCallIsNotUncertain) {
    data_->enqueue("create_ticket",
                   TaskError{ErrorKind::Transient, "Request was cancelled.",
                             taskpilot::collab::kCancelledCode});
    auto token = std::make_shared<std::atomic_bool>(true);
    PlanStep step = make_step(1, "create_ticket");
    step.arguments["title"] = json("Check invoice");

    const StepResult result = executor().execute(step, {}, {}, token);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(data_->call_count("create_ticket"), 1u);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::Transient);
    EXPECT_EQ(result.error->code, "cancelled");
}

TEST_F(StepExecutorTest, BackReferenceReadsProducerExport) {
    StepResult lookup;
    lookup.step_id = 1;
    lookup.tool_name = "lookup";
    lookup.success = true;
    lookup.exports["employee_id"] = "E002";

    PlanStep step = make_step(2, "summary");
    step.arguments["employee_id"] = BackReference{1, "employee_id"};
    const EntityBag entities{{EntityKind::StartDate, "2024-03-01"}};

    const StepResult result = executor().execute(step, entities, {lookup});
    EXPECT_TRUE(result.success);
    ASSERT_EQ(data_->calls().size(), 1u);
    EXPECT_EQ(data_->calls().front().arguments.at("employee_id"), "E002");
    EXPECT_EQ(data_->calls().front().arguments.at("start_date"), "2024-03-01");
    EXPECT_EQ(data_->calls().front().arguments.at("limit"), 100);
}

TEST_F(StepExecutorTest, FailedPrerequisiteSkipsStep) {
    StepResult lookup;
    lookup.step_id = 1;
    lookup.tool_name = "lookup";
    lookup.success = false;
    lookup.error = TaskError{ErrorKind::EntityNotFound, "No such employee.", "employee_not_found"};

    PlanStep step = make_step(2, "summary");
    step.arguments["employee_id"] = BackReference{1, "employee_id"};

    const StepResult result = executor().execute(step, {}, {lookup});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 0);
    EXPECT_EQ(data_->calls().size(), 0u);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::PreconditionFailed);
    EXPECT_EQ(result.error->code, "prerequisite_failed");
    EXPECT_EQ(result.error->message, "Skipped because 'lookup' did not succeed.");
}

TEST_F(StepExecutorTest, MissingExportIsPreconditionFailure) {
    StepResult lookup;
    lookup.step_id = 1;
    lookup.tool_name = "lookup";
    lookup.success = true;

    PlanStep step = make_step(2, "summary");
    step.arguments["employee_id"] = BackReference{1, "employee_id"};

    const StepResult result = executor().execute(step, {}, {lookup});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->code, "export_missing");
}

TEST_F(StepExecutorTest, UnboundRequiredParameterIsPreconditionFailure) {
    PlanStep step = make_step(1, "summary");

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->code, "unbound_parameter");
    EXPECT_EQ(result.error->parameter, "employee_id");
    EXPECT_EQ(result.error->message, "The request does not say which employee id to use.");
}

TEST_F(StepExecutorTest, TerminalStepIsNotInvoked) {
    PlanStep step = make_step(1, "summary");
    step.status = StepStatus::FailedTerminal;
    step.error = TaskError{ErrorKind::DependencyUnsatisfiable, "Nothing exports it.",
                           "dependency_unsatisfiable"};

    const StepResult result = executor().execute(step, {}, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->kind, ErrorKind::DependencyUnsatisfiable);
    EXPECT_TRUE(data_->calls().empty());
}

TEST_F(StepExecutorTest, CancellationStopsRetries) {
    data_->enqueue("summary", transient());
    auto token = std::make_shared<std::atomic_bool>(true);
    PlanStep step = make_step(1, "summary");
    step.arguments["employee_id"] = json("E001");

    const StepResult result = executor().execute(step, {}, {}, token);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(data_->call_count("summary"), 1u);
}

}  // namespace
