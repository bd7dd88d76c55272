#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "collab/collaborators.hpp"
#include "core/errors/task_errors.hpp"
#include "test_fakes.hpp"
#include "tools/tool_registry.hpp"

namespace {

using taskpilot::collab::CallContext;
using taskpilot::collab::Passage;
using taskpilot::core::errors::ErrorKind;
using taskpilot::core::errors::get_error;
using taskpilot::core::errors::get_value;
using taskpilot::core::errors::is_error;
using taskpilot::protocol::EntityKind;
using taskpilot::protocol::PromptPurpose;
using taskpilot::protocol::ToolFamily;
using taskpilot::testing::FixedRetriever;
using taskpilot::testing::make_spec;
using taskpilot::testing::param;
using taskpilot::testing::ScriptedDataService;
using taskpilot::testing::ScriptedLanguageModel;
using taskpilot::tools::DataTool;
using taskpilot::tools::GenerationTool;
using taskpilot::tools::RetrievalTool;
using taskpilot::tools::ToolRegistry;
using nlohmann::json;

TEST(ToolRegistryTest, RejectsDuplicateNames) {
    ToolRegistry registry;
    auto data = std::make_shared<ScriptedDataService>();
    auto first = registry.register_tool(
        make_spec("lookup", ToolFamily::Record, {}, {"employee_id"}), DataTool{data});
    ASSERT_FALSE(is_error(first));

    auto second = registry.register_tool(
        make_spec("lookup", ToolFamily::Record, {}, {}), DataTool{data});
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).kind, ErrorKind::Configuration);
    EXPECT_EQ(get_error(second).code, "duplicate_tool");
}

TEST(ToolRegistryTest, RejectsDuplicateParameters) {
    ToolRegistry registry;
    auto registered = registry.register_tool(
        make_spec("lookup", ToolFamily::Record, {param("employee_id"), param("employee_id")},
                  {}),
        DataTool{std::make_shared<ScriptedDataService>()});
    ASSERT_TRUE(is_error(registered));
    EXPECT_EQ(get_error(registered).code, "invalid_tool_spec");
}

TEST(ToolRegistryTest, SealedRegistryRefusesChanges) {
    ToolRegistry registry;
    registry.seal();
    EXPECT_TRUE(registry.sealed());

    auto registered = registry.register_tool(
        make_spec("lookup", ToolFamily::Record, {}, {}),
        DataTool{std::make_shared<ScriptedDataService>()});
    ASSERT_TRUE(is_error(registered));
    EXPECT_EQ(get_error(registered).code, "registry_sealed");
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ToolRegistryTest, FirstRegisteredExporterIsDefaultProducer) {
    ToolRegistry registry;
    auto data = std::make_shared<ScriptedDataService>();
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("directory", ToolFamily::Record, {}, {"employee_id"}), DataTool{data})));
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("hr_lookup", ToolFamily::Record, {}, {"employee_id"}), DataTool{data})));

    EXPECT_EQ(registry.tools_exporting("employee_id").size(), 2u);
    ASSERT_NE(registry.default_producer("employee_id"), nullptr);
    EXPECT_EQ(registry.default_producer("employee_id")->name, "directory");
    EXPECT_EQ(registry.default_producer("message_id"), nullptr);

    auto declared = registry.set_default_producer("employee_id", "hr_lookup");
    ASSERT_FALSE(is_error(declared));
    EXPECT_EQ(registry.default_producer("employee_id")->name, "hr_lookup");

    auto wrong = registry.set_default_producer("message_id", "hr_lookup");
    ASSERT_TRUE(is_error(wrong));
    EXPECT_EQ(get_error(wrong).code, "invalid_default_producer");
}

TEST(ToolRegistryTest, LookupOfUnknownToolIsInternalFault) {
    ToolRegistry registry;
    auto found = registry.lookup("missing");
    ASSERT_TRUE(is_error(found));
    EXPECT_EQ(get_error(found).kind, ErrorKind::InternalFault);
    EXPECT_EQ(get_error(found).code, "tool_not_found");
}

TEST(ToolRegistryTest, CuesAreNormalized) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("lookup", ToolFamily::Record, {}, {}, {"  Employee   INFO "}),
        DataTool{std::make_shared<ScriptedDataService>()})));
    ASSERT_EQ(registry.all().size(), 1u);
    EXPECT_EQ(registry.all().front()->cues.front(), "employee info");
}

TEST(ToolRegistryTest, RetrievalToolReportsPassagesAndOrigins) {
    ToolRegistry registry;
    auto retriever = std::make_shared<FixedRetriever>(std::vector<Passage>{
        {"Economy class is required for flights under six hours.", "doc:travel-policy", 0.8},
        {"Meals are covered up to 60 per day.", "doc:meal-allowance", 0.4}});
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("rag_search", ToolFamily::Rule, {param("query", true, EntityKind::Subject)},
                  {"policy_excerpt"}),
        RetrievalTool{retriever, 1, 0.2})));

    auto invoked = registry.invoke("rag_search", json{{"query", "flight class"}}, CallContext{});
    ASSERT_FALSE(is_error(invoked));
    const auto& output = get_value(invoked);
    ASSERT_EQ(output.origins.size(), 1u);
    EXPECT_EQ(output.origins.front().origin_id, "doc:travel-policy");
    EXPECT_EQ(output.exports.at("policy_excerpt"),
              "Economy class is required for flights under six hours.");
    EXPECT_EQ(retriever->queries().front(), "flight class");
}

TEST(ToolRegistryTest, RetrievalToolRejectsBlankQuery) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("rag_search", ToolFamily::Rule, {param("query")}, {}),
        RetrievalTool{std::make_shared<FixedRetriever>(std::vector<Passage>{})})));

    auto invoked = registry.invoke("rag_search", json{{"query", "   "}}, CallContext{});
    ASSERT_TRUE(is_error(invoked));
    EXPECT_EQ(get_error(invoked).kind, ErrorKind::ParameterInvalid);
    EXPECT_EQ(get_error(invoked).parameter, "query");
}

TEST(ToolRegistryTest, RetrievalWithoutMatchesIsEntityNotFound) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("rag_search", ToolFamily::Rule, {param("query")}, {}),
        RetrievalTool{std::make_shared<FixedRetriever>(std::vector<Passage>{})})));

    auto invoked = registry.invoke("rag_search", json{{"query", "parking"}}, CallContext{});
    ASSERT_TRUE(is_error(invoked));
    EXPECT_EQ(get_error(invoked).code, "no_matching_documents");
}

TEST(ToolRegistryTest, GenerationToolSendsDraftPrompt) {
    ToolRegistry registry;
    auto model = std::make_shared<ScriptedLanguageModel>();
    model->enqueue(std::string("  Subject: Claims\n\nHello  "));
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("draft_content", ToolFamily::Generation, {param("subject")}, {"email_body"}),
        GenerationTool{model, "Write an e-mail."})));

    auto invoked =
        registry.invoke("draft_content", json{{"subject", "Claims"}}, CallContext{});
    ASSERT_FALSE(is_error(invoked));
    EXPECT_EQ(get_value(invoked).exports.at("email_body"), "Subject: Claims\n\nHello");
    EXPECT_EQ(get_value(invoked).origins.front().origin_id, "generated:draft_content");

    ASSERT_EQ(model->prompts().size(), 1u);
    EXPECT_EQ(model->prompts().front().purpose, PromptPurpose::Draft);
    EXPECT_NE(model->prompts().front().messages.back().content.find("subject: Claims"),
              std::string::npos);
}

TEST(ToolRegistryTest, EmptyGenerationIsTransient) {
    ToolRegistry registry;
    auto model = std::make_shared<ScriptedLanguageModel>();
    model->enqueue(std::string("   "));
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("draft_content", ToolFamily::Generation, {}, {"email_body"}),
        GenerationTool{model, "Write."})));

    auto invoked = registry.invoke("draft_content", json::object(), CallContext{});
    ASSERT_TRUE(is_error(invoked));
    EXPECT_EQ(get_error(invoked).kind, ErrorKind::Transient);
    EXPECT_EQ(get_error(invoked).code, "empty_generation");
}

TEST(ToolRegistryTest, DataToolDelegatesByName) {
    ToolRegistry registry;
    auto data = std::make_shared<ScriptedDataService>();
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("query_employee_info", ToolFamily::Record, {}, {}), DataTool{data})));

    auto invoked =
        registry.invoke("query_employee_info", json{{"employee_id", "E001"}}, CallContext{});
    ASSERT_FALSE(is_error(invoked));
    ASSERT_EQ(data->calls().size(), 1u);
    EXPECT_EQ(data->calls().front().tool_name, "query_employee_info");
    EXPECT_EQ(data->calls().front().arguments.at("employee_id"), "E001");
}

TEST(ToolRegistryTest, MissingCollaboratorIsInternalFault) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(
        make_spec("query_employee_info", ToolFamily::Record, {}, {}), DataTool{nullptr})));

    auto invoked = registry.invoke("query_employee_info", json::object(), CallContext{});
    ASSERT_TRUE(is_error(invoked));
    EXPECT_EQ(get_error(invoked).kind, ErrorKind::InternalFault);
    EXPECT_EQ(get_error(invoked).code, "collaborator_missing");
}

}  // namespace
