#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/task_errors.hpp"
#include "core/text/text_utils.hpp"
#include "planning/intent_classifier.hpp"
#include "planning/plan_synthesizer.hpp"
#include "test_fakes.hpp"
#include "tools/tool_registry.hpp"

namespace {

using taskpilot::core::errors::is_error;
using taskpilot::planning::Classification;
using taskpilot::planning::PlanSynthesizer;
using taskpilot::protocol::EntityKind;
using taskpilot::protocol::Intent;
using taskpilot::protocol::Plan;
using taskpilot::protocol::StepStatus;
using taskpilot::protocol::ToolFamily;
using taskpilot::protocol::Unbound;
using taskpilot::testing::register_finance;
using taskpilot::testing::ScriptedDataService;
using taskpilot::tools::ToolRegistry;
using nlohmann::json;

Classification make_classification(Intent intent, const std::string& text) {
    Classification classification;
    classification.intent = intent;
    classification.normalized_text = taskpilot::core::text::normalize(text);
    classification.entities[EntityKind::Subject] = text;
    return classification;
}

std::vector<std::string> tool_names(const Plan& plan) {
    std::vector<std::string> names;
    for (const auto& step : plan.steps) {
        names.push_back(step.tool_name);
    }
    return names;
}

class PlanSynthesizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(
            is_error(register_finance(registry_, std::make_shared<ScriptedDataService>())));
        registry_.seal();
    }

    ToolRegistry registry_;
};

TEST_F(PlanSynthesizerTest, DataQueryPicksCuedRecordTool) {
    auto classification = make_classification(
        Intent::DataQuery, "Show the reimbursement summary for Alice Chen");
    classification.entities[EntityKind::StartDate] = "2024-03-01";

    const Plan plan = PlanSynthesizer(registry_).synthesize(classification);
    ASSERT_EQ(tool_names(plan), std::vector<std::string>{"query_reimbursement_summary"});

    const auto& step = plan.steps.front();
    EXPECT_EQ(step.id, 1);
    EXPECT_EQ(step.position, 1u);
    EXPECT_EQ(step.status, StepStatus::Pending);
    EXPECT_TRUE(std::holds_alternative<Unbound>(step.arguments.at("employee_id")));
    EXPECT_EQ(std::get<json>(step.arguments.at("start_date")), "2024-03-01");
    EXPECT_EQ(step.arguments.count("end_date"), 0u);
}

TEST_F(PlanSynthesizerTest, CompositeOrdersByPriority) {
    const auto classification = make_classification(
        Intent::CompositeTask, "Draft an email to HR about pending claims and send it");

    const Plan plan = PlanSynthesizer(registry_).synthesize(classification);
    EXPECT_EQ(tool_names(plan),
              (std::vector<std::string>{"query_reimbursement_records",
                                        "query_reimbursement_status", "draft_content",
                                        "send_email"}));
    for (std::size_t i = 0; i < plan.steps.size(); ++i) {
        EXPECT_EQ(plan.steps[i].position, i + 1);
    }
}

TEST_F(PlanSynthesizerTest, IntentLimitsEligibleFamilies) {
    const auto classification = make_classification(
        Intent::DataQuery, "What is the total, and open a work order about it");

    const Plan plan = PlanSynthesizer(registry_).synthesize(classification);
    EXPECT_EQ(tool_names(plan), std::vector<std::string>{"query_reimbursement_summary"});
}

TEST_F(PlanSynthesizerTest, FallsBackToFirstToolOfPrimaryFamily) {
    const Plan lookup = PlanSynthesizer(registry_).synthesize(
        make_classification(Intent::SimpleLookup, "hello there"));
    EXPECT_EQ(tool_names(lookup), std::vector<std::string>{"rag_search"});

    const Plan data = PlanSynthesizer(registry_).synthesize(
        make_classification(Intent::DataQuery, "hello there"));
    EXPECT_EQ(tool_names(data), std::vector<std::string>{"query_employee_info"});

    const Plan composite = PlanSynthesizer(registry_).synthesize(
        make_classification(Intent::CompositeTask, "hello there"));
    EXPECT_EQ(tool_names(composite), std::vector<std::string>{"rag_search"});
}

TEST_F(PlanSynthesizerTest, GenerationStepBindsSubject) {
    const auto classification =
        make_classification(Intent::ContentGeneration, "Write a letter about late claims");

    const Plan plan = PlanSynthesizer(registry_).synthesize(classification);
    ASSERT_EQ(tool_names(plan), std::vector<std::string>{"draft_content"});
    EXPECT_EQ(std::get<json>(plan.steps.front().arguments.at("subject")),
              "Write a letter about late claims");
}

TEST(PlanSynthesizerFamiliesTest, CompositeAllowsEveryFamily) {
    EXPECT_EQ(PlanSynthesizer::eligible_families(Intent::SimpleLookup),
              std::vector<ToolFamily>{ToolFamily::Rule});
    EXPECT_EQ(PlanSynthesizer::eligible_families(Intent::CompositeTask).size(), 4u);
}

}  // namespace
