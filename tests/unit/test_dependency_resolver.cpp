#include <algorithm>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/task_errors.hpp"
#include "planning/dependency_resolver.hpp"
#include "planning/entity_binding.hpp"
#include "test_fakes.hpp"
#include "tools/tool_registry.hpp"

namespace {

using taskpilot::core::errors::ErrorKind;
using taskpilot::core::errors::get_error;
using taskpilot::core::errors::get_value;
using taskpilot::core::errors::is_error;
using taskpilot::planning::bind_entities;
using taskpilot::planning::DependencyResolver;
using taskpilot::protocol::BackReference;
using taskpilot::protocol::EntityBag;
using taskpilot::protocol::EntityKind;
using taskpilot::protocol::Plan;
using taskpilot::protocol::PlanStep;
using taskpilot::protocol::StepStatus;
using taskpilot::protocol::ToolFamily;
using taskpilot::protocol::ToolSpec;
using taskpilot::protocol::Unbound;
using taskpilot::testing::make_spec;
using taskpilot::testing::param;
using taskpilot::testing::register_finance;
using taskpilot::testing::ScriptedDataService;
using taskpilot::tools::DataTool;
using taskpilot::tools::ToolRegistry;
using nlohmann::json;

// Appends a step for `tool_name` with its entity parameters bound.
PlanStep& add_step(Plan& plan, const ToolRegistry& registry, const std::string& tool_name,
                   const EntityBag& entities) {
    PlanStep& step = plan.append(tool_name);
    auto found = registry.lookup(tool_name);
    if (!is_error(found)) {
        bind_entities(get_value(found)->spec, entities, step);
    }
    return step;
}

bool same_plan(const Plan& a, const Plan& b) {
    if (a.steps.size() != b.steps.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.steps.size(); ++i) {
        const auto& left = a.steps[i];
        const auto& right = b.steps[i];
        if (left.id != right.id || left.tool_name != right.tool_name ||
            left.position != right.position || left.status != right.status ||
            left.arguments != right.arguments) {
            return false;
        }
    }
    return true;
}

std::size_t index_of(const Plan& plan, int step_id) {
    for (std::size_t i = 0; i < plan.steps.size(); ++i) {
        if (plan.steps[i].id == step_id) {
            return i;
        }
    }
    return plan.steps.size();
}

class FinanceResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(
            is_error(register_finance(registry_, std::make_shared<ScriptedDataService>())));
        registry_.seal();
        entities_[EntityKind::EmployeeName] = "Alice Chen";
        entities_[EntityKind::StartDate] = "2024-03-01";
        entities_[EntityKind::EndDate] = "2024-03-31";
        entities_[EntityKind::Subject] = "summary";
    }

    ToolRegistry registry_;
    EntityBag entities_;
};

TEST_F(FinanceResolverTest, InsertsEmployeeLookupBeforeSummary) {
    Plan plan;
    add_step(plan, registry_, "query_reimbursement_summary", entities_);

    auto resolved = DependencyResolver(registry_).resolve(plan, entities_);
    ASSERT_FALSE(is_error(resolved));
    const Plan& result = get_value(resolved);

    ASSERT_EQ(result.steps.size(), 2u);
    EXPECT_EQ(result.steps[0].tool_name, "query_employee_info");
    EXPECT_EQ(result.steps[1].tool_name, "query_reimbursement_summary");
    EXPECT_EQ(result.steps[0].position, 1u);
    EXPECT_EQ(result.steps[1].position, 2u);
    EXPECT_EQ(std::get<json>(result.steps[0].arguments.at("employee_name")), "Alice Chen");

    const auto& reference =
        std::get<BackReference>(result.steps[1].arguments.at("employee_id"));
    EXPECT_EQ(reference.step_id, result.steps[0].id);
    EXPECT_EQ(reference.export_name, "employee_id");
    EXPECT_EQ(std::get<json>(result.steps[1].arguments.at("start_date")), "2024-03-01");
}

TEST_F(FinanceResolverTest, ReusesExporterAlreadyInPlan) {
    Plan plan;
    add_step(plan, registry_, "query_reimbursement_summary", entities_);
    add_step(plan, registry_, "query_employee_info", entities_);

    auto resolved = DependencyResolver(registry_).resolve(plan, entities_);
    ASSERT_FALSE(is_error(resolved));
    const Plan& result = get_value(resolved);

    ASSERT_EQ(result.steps.size(), 2u);
    EXPECT_EQ(result.steps[0].tool_name, "query_employee_info");
    EXPECT_EQ(std::get<BackReference>(result.steps[1].arguments.at("employee_id")).step_id, 2);
}

TEST_F(FinanceResolverTest, ComposesDraftAndSendChain) {
    EntityBag entities = entities_;
    entities[EntityKind::Recipient] = "HR";
    Plan plan;
    add_step(plan, registry_, "send_email", entities);

    auto resolved = DependencyResolver(registry_).resolve(plan, entities);
    ASSERT_FALSE(is_error(resolved));
    const Plan& result = get_value(resolved);

    ASSERT_EQ(result.steps.size(), 2u);
    EXPECT_EQ(result.steps[0].tool_name, "draft_content");
    EXPECT_EQ(std::get<BackReference>(result.steps[1].arguments.at("email_body")).export_name,
              "email_body");
}

TEST_F(FinanceResolverTest, ResolvingTwiceChangesNothing) {
    Plan plan;
    add_step(plan, registry_, "query_reimbursement_summary", entities_);
    add_step(plan, registry_, "create_work_order", entities_);

    DependencyResolver resolver(registry_);
    auto once = resolver.resolve(plan, entities_);
    ASSERT_FALSE(is_error(once));
    auto twice = resolver.resolve(get_value(once), entities_);
    ASSERT_FALSE(is_error(twice));
    EXPECT_TRUE(same_plan(get_value(once), get_value(twice)));
}

TEST_F(FinanceResolverTest, MissingRequestEntityStaysUnbound) {
    Plan plan;
    add_step(plan, registry_, "send_email", entities_);

    auto resolved = DependencyResolver(registry_).resolve(plan, entities_);
    ASSERT_FALSE(is_error(resolved));
    const Plan& result = get_value(resolved);

    ASSERT_EQ(result.steps.size(), 2u);
    EXPECT_EQ(result.steps[0].tool_name, "draft_content");
    const auto& send = result.steps[1];
    EXPECT_EQ(send.status, StepStatus::Pending);
    EXPECT_FALSE(send.error.has_value());
    auto recipient = send.arguments.find("to");
    EXPECT_TRUE(recipient == send.arguments.end() ||
                std::holds_alternative<Unbound>(recipient->second));
}

TEST_F(FinanceResolverTest, DanglingReferenceIsInternalFault) {
    Plan plan;
    auto& step = add_step(plan, registry_, "query_reimbursement_summary", entities_);
    step.arguments["employee_id"] = BackReference{99, "employee_id"};

    auto resolved = DependencyResolver(registry_).resolve(plan, entities_);
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).kind, ErrorKind::InternalFault);
    EXPECT_EQ(get_error(resolved).code, "dangling_reference");
}

TEST_F(FinanceResolverTest, UnknownToolIsInternalFault) {
    Plan plan;
    plan.append("query_payroll");

    auto resolved = DependencyResolver(registry_).resolve(plan, entities_);
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).code, "tool_not_found");
}

TEST(DependencyResolverTest, UnexportedParameterMarksStepUnsatisfiable) {
    ToolRegistry registry;
    auto data = std::make_shared<ScriptedDataService>();
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("budget_report", ToolFamily::Record, {param("budget_code")}, {"budget"}),
        DataTool{data})));
    registry.seal();

    Plan plan;
    add_step(plan, registry, "budget_report", {});
    auto resolved = DependencyResolver(registry).resolve(plan, {});
    ASSERT_FALSE(is_error(resolved));

    const auto& step = get_value(resolved).steps.front();
    EXPECT_EQ(step.status, StepStatus::FailedTerminal);
    ASSERT_TRUE(step.error.has_value());
    EXPECT_EQ(step.error->kind, ErrorKind::DependencyUnsatisfiable);
    EXPECT_EQ(step.error->parameter, "budget_code");
    EXPECT_EQ(step.error->message,
              "No registered tool provides 'budget_code', which budget_report needs.");
}

TEST(DependencyResolverTest, ExplicitCycleIsRejected) {
    ToolRegistry registry;
    auto data = std::make_shared<ScriptedDataService>();
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("alpha", ToolFamily::Record, {param("x")}, {"y"}), DataTool{data})));
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("beta", ToolFamily::Record, {param("y")}, {"x"}), DataTool{data})));
    registry.seal();

    Plan plan;
    plan.append("alpha");
    plan.append("beta");
    plan.steps[0].arguments["x"] = BackReference{2, "x"};
    plan.steps[1].arguments["y"] = BackReference{1, "y"};

    auto resolved = DependencyResolver(registry).resolve(plan, {});
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).kind, ErrorKind::Configuration);
    EXPECT_EQ(get_error(resolved).code, "dependency_cycle");
}

TEST(DependencyResolverTest, MutualProducersFormCycle) {
    ToolRegistry registry;
    auto data = std::make_shared<ScriptedDataService>();
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("alpha", ToolFamily::Record, {param("x")}, {"y"}), DataTool{data})));
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("beta", ToolFamily::Record, {param("y")}, {"x"}), DataTool{data})));
    registry.seal();

    Plan plan;
    plan.append("alpha").arguments["x"] = Unbound{};

    auto resolved = DependencyResolver(registry).resolve(plan, {});
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).code, "dependency_cycle");
}

// Random acyclic catalogs: tool i exports v<i> and needs some v<j> with j < i.
// Some tools also need a value nobody exports.
TEST(DependencyResolverTest, RandomPlansResolveToValidOrder) {
    std::mt19937 rng(20240315);
    for (int round = 0; round < 200; ++round) {
        ToolRegistry registry;
        auto data = std::make_shared<ScriptedDataService>();
        const int tool_count = 2 + static_cast<int>(rng() % 6);
        std::vector<ToolSpec> specs;
        for (int i = 0; i < tool_count; ++i) {
            std::vector<taskpilot::protocol::ParamSpec> params;
            for (int j = 0; j < i; ++j) {
                if (rng() % 3 == 0) {
                    params.push_back(param("v" + std::to_string(j)));
                }
            }
            if (rng() % 10 == 0) {
                params.push_back(param("unobtainable"));
            }
            if (rng() % 4 == 0) {
                params.push_back(param("note", false, EntityKind::Subject));
            }
            specs.push_back(make_spec("t" + std::to_string(i), ToolFamily::Record, params,
                                      {"v" + std::to_string(i)}));
            ASSERT_FALSE(is_error(registry.register_tool(specs.back(), DataTool{data})));
        }
        registry.seal();

        std::vector<int> picks(static_cast<std::size_t>(tool_count));
        for (int i = 0; i < tool_count; ++i) {
            picks[static_cast<std::size_t>(i)] = i;
        }
        std::shuffle(picks.begin(), picks.end(), rng);
        picks.resize(1 + rng() % picks.size());

        const EntityBag entities{{EntityKind::Subject, "random"}};
        Plan plan;
        for (const int pick : picks) {
            add_step(plan, registry, "t" + std::to_string(pick), entities);
        }

        DependencyResolver resolver(registry);
        auto resolved = resolver.resolve(plan, entities);
        ASSERT_FALSE(is_error(resolved)) << get_error(resolved).message;
        const Plan& result = get_value(resolved);

        std::set<int> ids;
        for (std::size_t i = 0; i < result.steps.size(); ++i) {
            const auto& step = result.steps[i];
            EXPECT_EQ(step.position, i + 1);
            EXPECT_TRUE(ids.insert(step.id).second);
            if (step.status == StepStatus::FailedTerminal) {
                ASSERT_TRUE(step.error.has_value());
                EXPECT_EQ(step.error->kind, ErrorKind::DependencyUnsatisfiable);
                EXPECT_EQ(step.error->parameter, "unobtainable");
                continue;
            }

            const auto& spec = get_value(registry.lookup(step.tool_name))->spec;
            for (const auto& parameter : spec.params) {
                auto binding = step.arguments.find(parameter.name);
                if (!parameter.required) {
                    continue;
                }
                ASSERT_NE(binding, step.arguments.end());
                ASSERT_FALSE(std::holds_alternative<Unbound>(binding->second));
                if (const auto* ref = std::get_if<BackReference>(&binding->second)) {
                    const std::size_t producer = index_of(result, ref->step_id);
                    ASSERT_LT(producer, i);
                    const auto& producer_spec =
                        get_value(registry.lookup(result.steps[producer].tool_name))->spec;
                    EXPECT_TRUE(producer_spec.exports_param(ref->export_name));
                }
            }
        }

        auto again = resolver.resolve(result, entities);
        ASSERT_FALSE(is_error(again));
        EXPECT_TRUE(same_plan(result, get_value(again)));
    }
}

}  // namespace
