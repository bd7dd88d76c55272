#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "collab/collaborators.hpp"

namespace taskpilot::collab {

struct EmployeeRecord {
    std::string id;
    std::string name;
    std::string department;
    std::string email;
};

struct ReimbursementRecord {
    std::string id;
    std::string employee_id;
    std::string date;       // YYYY-MM-DD
    std::string category;
    double amount = 0.0;
    std::string status;     // pending, approved, rejected or paid
    std::string description;
};

struct WorkOrderRecord {
    std::string id;
    std::string title;
    std::string description;
    std::string assignee_id;
    std::string priority;
    std::string category;
    std::string status = "open";
    std::vector<std::string> notes;
};

struct OutboxMessage {
    std::string message_id;
    std::string to;
    std::string subject;
    std::string body;
};

// Offline finance backend serving the record and action tools.
class InMemoryFinanceStore : public DataService {
public:
    // Seeded with a small set of employees and reimbursements.
    InMemoryFinanceStore();

    core::errors::Result<protocol::ToolOutput> invoke(
        const std::string& tool_name, const nlohmann::json& arguments,
        const CallContext& context) override;

    void add_employee(EmployeeRecord employee);
    void add_reimbursement(ReimbursementRecord record);

    std::optional<EmployeeRecord> find_employee(const std::string& employee_id) const;
    std::vector<WorkOrderRecord> work_orders() const;
    std::vector<OutboxMessage> outbox() const;

private:
    core::errors::Result<protocol::ToolOutput> query_employee_info(
        const nlohmann::json& arguments) const;
    core::errors::Result<protocol::ToolOutput> query_reimbursement_summary(
        const nlohmann::json& arguments) const;
    core::errors::Result<protocol::ToolOutput> query_reimbursement_records(
        const nlohmann::json& arguments) const;
    core::errors::Result<protocol::ToolOutput> query_reimbursement_status(
        const nlohmann::json& arguments) const;
    core::errors::Result<protocol::ToolOutput> create_work_order(
        const nlohmann::json& arguments);
    core::errors::Result<protocol::ToolOutput> send_email(const nlohmann::json& arguments);

    core::errors::Result<const EmployeeRecord*> require_employee(
        const nlohmann::json& arguments) const;
    const EmployeeRecord* employee_by_id(const std::string& employee_id) const;

    mutable std::mutex mutex_;
    std::vector<EmployeeRecord> employees_;
    std::vector<ReimbursementRecord> reimbursements_;
    std::vector<WorkOrderRecord> work_orders_;
    std::vector<OutboxMessage> outbox_;
};

}  // namespace taskpilot::collab
