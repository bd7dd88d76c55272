#include "tools/finance_catalog.hpp"

#include <optional>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace taskpilot::tools {

using protocol::EntityKind;
using protocol::ParamSpec;
using protocol::ToolEffect;
using protocol::ToolFamily;
using protocol::ToolSpec;

namespace {

ParamSpec required(std::string name, std::optional<EntityKind> entity,
                   const bool identifies_target = false) {
    return ParamSpec{std::move(name), true, entity, nullptr, identifies_target};
}

ParamSpec optional_param(std::string name, std::optional<EntityKind> entity,
                         nlohmann::json default_value = nullptr,
                         const bool identifies_target = false) {
    return ParamSpec{std::move(name), false, entity, std::move(default_value),
                     identifies_target};
}

constexpr const char* kDraftInstruction =
    "You are a finance assistant. Write a short, polite e-mail using only the "
    "details below. Start with a 'Subject:' line.";

}  // namespace

std::vector<ToolSpec> finance_tool_specs() {
    std::vector<ToolSpec> specs;

    specs.push_back(ToolSpec{
        "rag_search",
        "Search the reimbursement policy documents",
        ToolFamily::Rule,
        ToolEffect::ReadOnly,
        {required("query", EntityKind::Subject)},
        {"policy_excerpt"},
        {"policy", "policies", "rule", "rules", "standard", "standards", "allowed",
         "eligible", "limit", "limits", "regulation", "regulations", "process", "deadline",
         "deadlines"},
        2});

    specs.push_back(ToolSpec{
        "query_employee_info",
        "Look up the employee record",
        ToolFamily::Record,
        ToolEffect::ReadOnly,
        {optional_param("employee_name", EntityKind::EmployeeName, nullptr, true),
         optional_param("employee_id", EntityKind::EmployeeId, nullptr, true),
         optional_param("department", std::nullopt)},
        {"employee_id", "employee_name", "department", "employee_email", "assignee_id"},
        {"employee info", "employee information", "who is", "department", "contact"},
        1});

    specs.push_back(ToolSpec{
        "query_reimbursement_summary",
        "Summarise reimbursements",
        ToolFamily::Record,
        ToolEffect::ReadOnly,
        {required("employee_id", EntityKind::EmployeeId, true),
         optional_param("start_date", EntityKind::StartDate),
         optional_param("end_date", EntityKind::EndDate),
         optional_param("category", EntityKind::Category)},
        {"total_amount", "claim_count"},
        {"summary", "total", "totals", "how much", "sum", "amount", "amounts", "spent"},
        3});

    specs.push_back(ToolSpec{
        "query_reimbursement_records",
        "List reimbursement records",
        ToolFamily::Record,
        ToolEffect::ReadOnly,
        {required("employee_id", EntityKind::EmployeeId, true),
         optional_param("start_date", EntityKind::StartDate),
         optional_param("end_date", EntityKind::EndDate),
         optional_param("status", std::nullopt),
         optional_param("limit", std::nullopt, 100)},
        {"claim_count"},
        {"record", "records", "claims", "list", "history", "details"},
        3});

    specs.push_back(ToolSpec{
        "query_reimbursement_status",
        "Check reimbursement status",
        ToolFamily::Record,
        ToolEffect::ReadOnly,
        {required("employee_id", EntityKind::EmployeeId, true),
         optional_param("reimbursement_id", std::nullopt, nullptr, true),
         optional_param("status", std::nullopt)},
        {"latest_status"},
        {"status", "pending", "approved", "rejected", "paid"},
        3});

    specs.push_back(ToolSpec{
        "create_work_order",
        "Create a finance work order",
        ToolFamily::Action,
        ToolEffect::Mutating,
        {required("title", EntityKind::Subject),
         required("assignee_id", EntityKind::EmployeeId, true),
         optional_param("description", std::nullopt),
         optional_param("priority", EntityKind::Priority, "medium"),
         optional_param("category", EntityKind::Category),
         optional_param("duplicate_action", std::nullopt, "auto"),
         optional_param("duplicate_reason", std::nullopt)},
        {"work_order_id"},
        {"work order", "work orders", "ticket", "tickets", "jira"},
        4});

    specs.push_back(ToolSpec{
        "draft_content",
        "Draft the e-mail text",
        ToolFamily::Generation,
        ToolEffect::ReadOnly,
        {required("subject", EntityKind::Subject),
         optional_param("recipient", EntityKind::Recipient),
         optional_param("employee_name", EntityKind::EmployeeName)},
        {"email_body"},
        {"write", "draft", "compose", "email", "emails", "e-mail", "letter", "message"},
        5});

    specs.push_back(ToolSpec{
        "send_email",
        "Send the e-mail",
        ToolFamily::Action,
        ToolEffect::Mutating,
        {required("to", EntityKind::Recipient, true),
         required("subject", EntityKind::Subject),
         required("email_body", std::nullopt)},
        {"message_id"},
        {"send", "notify", "forward"},
        6});

    return specs;
}

core::errors::Result<std::size_t> register_finance_tools(
    ToolRegistry& registry, const FinanceCollaborators& collaborators,
    const core::config::EngineConfig& config) {
    std::size_t registered = 0;
    for (auto& spec : finance_tool_specs()) {
        ToolVariant impl;
        switch (spec.family) {
            case ToolFamily::Rule:
                impl = RetrievalTool{collaborators.retriever, config.retrieval_top_k,
                                     config.similarity_threshold};
                break;
            case ToolFamily::Generation:
                impl = GenerationTool{collaborators.language_model, kDraftInstruction};
                break;
            default:
                impl = DataTool{collaborators.data_service};
                break;
        }

        const std::string name = spec.name;
        auto added = registry.register_tool(std::move(spec), std::move(impl));
        if (core::errors::is_error(added)) {
            return core::errors::get_error(added);
        }
        ++registered;
        LOG_DEBUG("Registered tool " + name);
    }

    auto producer = registry.set_default_producer("employee_id", "query_employee_info");
    if (core::errors::is_error(producer)) {
        return core::errors::get_error(producer);
    }
    return registered;
}

}  // namespace taskpilot::tools
