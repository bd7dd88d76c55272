#include "collab/finance_store.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"
#include "core/time/calendar.hpp"

namespace taskpilot::collab {

using core::errors::ErrorKind;
using core::errors::TaskError;
using nlohmann::json;
using protocol::SourceAttribution;
using protocol::ToolOutput;

namespace {

constexpr const char* kMailDomain = "company.example";

std::string string_arg(const json& arguments, const std::string& name) {
    if (!arguments.is_object() || !arguments.contains(name) ||
        arguments.at(name).is_null()) {
        return "";
    }
    const auto& value = arguments.at(name);
    return core::text::trim(value.is_string() ? value.get<std::string>() : value.dump());
}

std::string format_amount(const double amount) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << amount;
    return out.str();
}

std::optional<TaskError> check_date(const std::string& value, const std::string& name) {
    if (value.empty() || core::time::parse_iso_date(value).has_value()) {
        return std::nullopt;
    }
    return TaskError{ErrorKind::ParameterInvalid,
                     "'" + value + "' is not a valid date for " + name + ".",
                     "invalid_date", "Use the YYYY-MM-DD format.", name};
}

bool is_known_status(const std::string& status) {
    return status == "pending" || status == "approved" || status == "rejected" ||
           status == "paid";
}

bool is_known_priority(const std::string& priority) {
    return priority == "low" || priority == "medium" || priority == "high" ||
           priority == "urgent";
}

// Date bounds are inclusive; empty means open.
bool in_range(const std::string& date, const std::string& start, const std::string& end) {
    return (start.empty() || date >= start) && (end.empty() || date <= end);
}

json to_json(const EmployeeRecord& employee) {
    return json{{"employee_id", employee.id},
                {"employee_name", employee.name},
                {"department", employee.department},
                {"employee_email", employee.email}};
}

json to_json(const ReimbursementRecord& record) {
    return json{{"reimbursement_id", record.id}, {"employee_id", record.employee_id},
                {"date", record.date},           {"category", record.category},
                {"amount", record.amount},       {"status", record.status},
                {"description", record.description}};
}

std::string describe_period(const std::string& start, const std::string& end) {
    if (start.empty() && end.empty()) {
        return "on record";
    }
    if (end.empty()) {
        return "since " + start;
    }
    if (start.empty()) {
        return "up to " + end;
    }
    return "from " + start + " to " + end;
}

}  // namespace

InMemoryFinanceStore::InMemoryFinanceStore() {
    employees_ = {
        {"E001", "Alice Chen", "Finance", "alice.chen@company.example"},
        {"E002", "Bob Li", "Engineering", "bob.li@company.example"},
        {"E003", "Carol Wang", "HR", "carol.wang@company.example"},
        {"E004", "David Zhang", "Sales", "david.zhang@company.example"},
    };
    reimbursements_ = {
        {"R001", "E001", "2024-03-05", "travel", 1250.00, "approved",
         "Client visit to Shanghai"},
        {"R002", "E001", "2024-03-12", "meals", 86.50, "paid", "Team dinner"},
        {"R003", "E001", "2024-03-20", "accommodation", 640.00, "pending",
         "Hotel, audit week"},
        {"R004", "E001", "2024-04-02", "transport", 45.00, "approved", "Airport taxi"},
        {"R005", "E002", "2024-03-08", "office", 120.00, "rejected", "Standing desk mat"},
        {"R006", "E002", "2024-05-15", "travel", 980.00, "pending", "Conference trip"},
        {"R007", "E003", "2024-02-11", "meals", 60.00, "paid", "Interview lunch"},
        {"R008", "E004", "2024-03-28", "travel", 2100.00, "approved",
         "Customer workshop in Beijing"},
    };
}

void InMemoryFinanceStore::add_employee(EmployeeRecord employee) {
    std::lock_guard<std::mutex> lock(mutex_);
    employees_.push_back(std::move(employee));
}

void InMemoryFinanceStore::add_reimbursement(ReimbursementRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    reimbursements_.push_back(std::move(record));
}

std::optional<EmployeeRecord> InMemoryFinanceStore::find_employee(
    const std::string& employee_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* employee = employee_by_id(employee_id);
    if (employee == nullptr) {
        return std::nullopt;
    }
    return *employee;
}

std::vector<WorkOrderRecord> InMemoryFinanceStore::work_orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return work_orders_;
}

std::vector<OutboxMessage> InMemoryFinanceStore::outbox() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbox_;
}

core::errors::Result<ToolOutput> InMemoryFinanceStore::invoke(
    const std::string& tool_name, const json& arguments, const CallContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto refused = refuse_call(context)) {
        return refused.value();
    }
    LOG_DEBUG("Finance store call " + tool_name + " " + arguments.dump());

    if (tool_name == "query_employee_info") {
        return query_employee_info(arguments);
    }
    if (tool_name == "query_reimbursement_summary") {
        return query_reimbursement_summary(arguments);
    }
    if (tool_name == "query_reimbursement_records") {
        return query_reimbursement_records(arguments);
    }
    if (tool_name == "query_reimbursement_status") {
        return query_reimbursement_status(arguments);
    }
    if (tool_name == "create_work_order") {
        return create_work_order(arguments);
    }
    if (tool_name == "send_email") {
        return send_email(arguments);
    }
    return TaskError{ErrorKind::InternalFault,
                     "Finance store does not serve tool " + tool_name,
                     "unsupported_tool"};
}

const EmployeeRecord* InMemoryFinanceStore::employee_by_id(
    const std::string& employee_id) const {
    const std::string wanted = core::text::uppercase(core::text::trim(employee_id));
    for (const auto& employee : employees_) {
        if (employee.id == wanted) {
            return &employee;
        }
    }
    return nullptr;
}

core::errors::Result<const EmployeeRecord*> InMemoryFinanceStore::require_employee(
    const json& arguments) const {
    const std::string employee_id = string_arg(arguments, "employee_id");
    if (employee_id.empty()) {
        return TaskError{ErrorKind::ParameterInvalid, "An employee id is required.",
                         "missing_employee_id", "", "employee_id"};
    }
    const auto* employee = employee_by_id(employee_id);
    if (employee == nullptr) {
        return TaskError{ErrorKind::EntityNotFound,
                         "No employee with id '" + employee_id + "' could be found.",
                         "employee_not_found", "", "employee_id"};
    }
    return employee;
}

core::errors::Result<ToolOutput> InMemoryFinanceStore::query_employee_info(
    const json& arguments) const {
    const std::string employee_id = string_arg(arguments, "employee_id");
    const std::string employee_name = string_arg(arguments, "employee_name");
    const std::string department = string_arg(arguments, "department");

    std::vector<const EmployeeRecord*> matches;
    if (!employee_id.empty()) {
        const auto* employee = employee_by_id(employee_id);
        if (employee == nullptr) {
            return TaskError{ErrorKind::EntityNotFound,
                             "No employee with id '" + employee_id + "' could be found.",
                             "employee_not_found", "", "employee_id"};
        }
        matches.push_back(employee);
    } else if (!employee_name.empty()) {
        const std::string wanted = core::text::normalize(employee_name);
        for (const auto& employee : employees_) {
            if (core::text::normalize(employee.name) == wanted) {
                matches.push_back(&employee);
            }
        }
        if (matches.empty()) {
            for (const auto& employee : employees_) {
                if (core::text::normalize(employee.name).find(wanted) != std::string::npos) {
                    matches.push_back(&employee);
                }
            }
        }
        if (matches.empty()) {
            return TaskError{ErrorKind::EntityNotFound,
                             "No employee named '" + employee_name + "' could be found.",
                             "employee_not_found", "Check the spelling of the name.",
                             "employee_name"};
        }
    } else if (!department.empty()) {
        const std::string wanted = core::text::lowercase(department);
        for (const auto& employee : employees_) {
            if (core::text::lowercase(employee.department) == wanted) {
                matches.push_back(&employee);
            }
        }
        if (matches.empty()) {
            return TaskError{ErrorKind::EntityNotFound,
                             "No employees found in department '" + department + "'.",
                             "department_not_found", "", "department"};
        }
    } else {
        return TaskError{ErrorKind::ParameterInvalid,
                         "An employee name, id or department is required.",
                         "missing_employee_reference"};
    }

    ToolOutput output;
    output.value = json::array();
    std::ostringstream text;
    for (const auto* employee : matches) {
        output.value.push_back(to_json(*employee));
        text << employee->name << " (" << employee->id << "), " << employee->department
             << ", " << employee->email << "\n";
        output.origins.push_back(SourceAttribution{
            "employees:" + employee->id, employee->name + " (" + employee->id + ")",
            std::nullopt});
    }
    output.text = text.str();

    if (matches.size() == 1) {
        const auto& employee = *matches.front();
        output.exports["employee_id"] = employee.id;
        output.exports["employee_name"] = employee.name;
        output.exports["department"] = employee.department;
        output.exports["employee_email"] = employee.email;
        // Work orders are assigned to the employee the request is about.
        output.exports["assignee_id"] = employee.id;
    } else if (department.empty()) {
        return TaskError{ErrorKind::EntityNotFound,
                         "The name '" + employee_name + "' matches " +
                             std::to_string(matches.size()) + " employees.",
                         "ambiguous_employee", "Give the full name or the employee id.",
                         "employee_name"};
    }
    return output;
}

core::errors::Result<ToolOutput> InMemoryFinanceStore::query_reimbursement_summary(
    const json& arguments) const {
    auto found = require_employee(arguments);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const EmployeeRecord& employee = *core::errors::get_value(found);

    const std::string start = string_arg(arguments, "start_date");
    const std::string end = string_arg(arguments, "end_date");
    const std::string category = core::text::lowercase(string_arg(arguments, "category"));
    for (const auto& [value, name] : {std::make_pair(start, std::string("start_date")),
                                      std::make_pair(end, std::string("end_date"))}) {
        if (auto invalid = check_date(value, name)) {
            return invalid.value();
        }
    }
    if (!start.empty() && !end.empty() && start > end) {
        return TaskError{ErrorKind::ParameterInvalid,
                         "The end date " + end + " is before the start date " + start + ".",
                         "invalid_date_range", "", "end_date"};
    }

    double total = 0.0;
    int count = 0;
    json by_category = json::object();
    for (const auto& record : reimbursements_) {
        if (record.employee_id != employee.id || !in_range(record.date, start, end)) {
            continue;
        }
        if (!category.empty() && record.category != category) {
            continue;
        }
        total += record.amount;
        ++count;
        const double previous =
            by_category.contains(record.category) ? by_category[record.category].get<double>()
                                                  : 0.0;
        by_category[record.category] = previous + record.amount;
    }

    ToolOutput output;
    output.value = json{{"employee_id", employee.id},
                        {"employee_name", employee.name},
                        {"start_date", start},
                        {"end_date", end},
                        {"category", category},
                        {"total_amount", total},
                        {"claim_count", count},
                        {"by_category", by_category}};

    std::ostringstream text;
    text << "Reimbursements for " << employee.name << " (" << employee.id << ") "
         << describe_period(start, end)
         << (category.empty() ? "" : " in category " + category) << ": " << count
         << (count == 1 ? " claim" : " claims") << ", total " << format_amount(total)
         << ".";
    for (const auto& [name, amount] : by_category.items()) {
        text << "\n  " << name << ": " << format_amount(amount.get<double>());
    }
    output.text = text.str();
    output.exports["total_amount"] = total;
    output.exports["claim_count"] = count;
    output.origins.push_back(SourceAttribution{"reimbursements:" + employee.id,
                                               output.text.substr(0, output.text.find('\n')),
                                               std::nullopt});
    return output;
}

core::errors::Result<ToolOutput> InMemoryFinanceStore::query_reimbursement_records(
    const json& arguments) const {
    auto found = require_employee(arguments);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const EmployeeRecord& employee = *core::errors::get_value(found);

    const std::string start = string_arg(arguments, "start_date");
    const std::string end = string_arg(arguments, "end_date");
    const std::string status = core::text::lowercase(string_arg(arguments, "status"));
    for (const auto& [value, name] : {std::make_pair(start, std::string("start_date")),
                                      std::make_pair(end, std::string("end_date"))}) {
        if (auto invalid = check_date(value, name)) {
            return invalid.value();
        }
    }
    if (!status.empty() && !is_known_status(status)) {
        return TaskError{ErrorKind::ParameterInvalid, "Unknown status '" + status + "'.",
                         "invalid_status", "Use pending, approved, rejected or paid.",
                         "status"};
    }

    std::size_t limit = 100;
    if (arguments.contains("limit") && arguments.at("limit").is_number_integer()) {
        const auto requested = arguments.at("limit").get<long long>();
        if (requested <= 0) {
            return TaskError{ErrorKind::ParameterInvalid, "The record limit must be positive.",
                             "invalid_limit", "", "limit"};
        }
        limit = static_cast<std::size_t>(requested);
    }

    ToolOutput output;
    output.value = json::array();
    std::ostringstream text;
    text << "Reimbursement records for " << employee.name << " (" << employee.id << ") "
         << describe_period(start, end) << ":";
    int count = 0;
    for (const auto& record : reimbursements_) {
        if (record.employee_id != employee.id || !in_range(record.date, start, end)) {
            continue;
        }
        if (!status.empty() && record.status != status) {
            continue;
        }
        if (output.value.size() >= limit) {
            break;
        }
        output.value.push_back(to_json(record));
        text << "\n  " << record.id << " " << record.date << " " << record.category << " "
             << format_amount(record.amount) << " " << record.status << " ("
             << record.description << ")";
        ++count;
    }
    if (count == 0) {
        text << "\n  none";
    }
    output.text = text.str();
    output.exports["claim_count"] = count;
    output.origins.push_back(SourceAttribution{"reimbursements:" + employee.id,
                                               std::to_string(count) + " records",
                                               std::nullopt});
    return output;
}

core::errors::Result<ToolOutput> InMemoryFinanceStore::query_reimbursement_status(
    const json& arguments) const {
    auto found = require_employee(arguments);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const EmployeeRecord& employee = *core::errors::get_value(found);

    const std::string reimbursement_id =
        core::text::uppercase(string_arg(arguments, "reimbursement_id"));
    const std::string status = core::text::lowercase(string_arg(arguments, "status"));
    if (!status.empty() && !is_known_status(status)) {
        return TaskError{ErrorKind::ParameterInvalid, "Unknown status '" + status + "'.",
                         "invalid_status", "Use pending, approved, rejected or paid.",
                         "status"};
    }

    const ReimbursementRecord* latest = nullptr;
    ToolOutput output;
    output.value = json::array();
    for (const auto& record : reimbursements_) {
        if (record.employee_id != employee.id) {
            continue;
        }
        if (!reimbursement_id.empty() && record.id != reimbursement_id) {
            continue;
        }
        if (!status.empty() && record.status != status) {
            continue;
        }
        output.value.push_back(to_json(record));
        if (latest == nullptr || record.date > latest->date) {
            latest = &record;
        }
    }
    if (latest == nullptr) {
        return TaskError{ErrorKind::EntityNotFound,
                         reimbursement_id.empty()
                             ? "No matching reimbursements for " + employee.name + "."
                             : "Reimbursement " + reimbursement_id + " could not be found.",
                         "reimbursement_not_found", "",
                         reimbursement_id.empty() ? "" : "reimbursement_id"};
    }

    output.text = "Latest reimbursement " + latest->id + " for " + employee.name + " (" +
                  employee.id + "), " + latest->date + ", " +
                  format_amount(latest->amount) + ": " + latest->status + ".";
    output.exports["latest_status"] = latest->status;
    output.origins.push_back(
        SourceAttribution{"reimbursements:" + latest->id, output.text, std::nullopt});
    return output;
}

core::errors::Result<ToolOutput> InMemoryFinanceStore::create_work_order(
    const json& arguments) {
    const std::string title = string_arg(arguments, "title");
    if (title.empty()) {
        return TaskError{ErrorKind::ParameterInvalid, "A work order needs a title.",
                         "missing_title", "", "title"};
    }
    const std::string assignee_id = string_arg(arguments, "assignee_id");
    const auto* assignee = employee_by_id(assignee_id);
    if (assignee == nullptr) {
        return TaskError{ErrorKind::EntityNotFound,
                         "No employee with id '" + assignee_id + "' can be assigned.",
                         "employee_not_found", "", "assignee_id"};
    }
    std::string priority = core::text::lowercase(string_arg(arguments, "priority"));
    if (priority.empty()) {
        priority = "medium";
    }
    if (!is_known_priority(priority)) {
        return TaskError{ErrorKind::ParameterInvalid, "Unknown priority '" + priority + "'.",
                         "invalid_priority", "Use low, medium, high or urgent.", "priority"};
    }
    std::string action = core::text::lowercase(string_arg(arguments, "duplicate_action"));
    if (action.empty()) {
        action = "auto";
    }
    if (action != "auto" && action != "update_existing" && action != "create_new") {
        return TaskError{ErrorKind::ParameterInvalid,
                         "Unknown duplicate action '" + action + "'.",
                         "invalid_duplicate_action",
                         "Use auto, update_existing or create_new.", "duplicate_action"};
    }
    const std::string description = string_arg(arguments, "description");

    WorkOrderRecord* duplicate = nullptr;
    for (auto& order : work_orders_) {
        if (order.status == "open" && order.assignee_id == assignee->id &&
            core::text::normalize(order.title) == core::text::normalize(title)) {
            duplicate = &order;
            break;
        }
    }

    ToolOutput output;
    if (duplicate != nullptr && action != "create_new") {
        std::string outcome = "existing";
        if (action == "update_existing") {
            duplicate->notes.push_back(description.empty() ? title : description);
            outcome = "updated";
        }
        output.value = json{{"work_order_id", duplicate->id}, {"outcome", outcome}};
        output.text = (outcome == "updated" ? "Updated open work order " :
                                              "An open work order already exists: ") +
                      duplicate->id + " \"" + duplicate->title + "\" assigned to " +
                      assignee->name + ".";
        output.exports["work_order_id"] = duplicate->id;
        output.origins.push_back(
            SourceAttribution{"work_orders:" + duplicate->id, output.text, std::nullopt});
        return output;
    }

    const std::string reason = string_arg(arguments, "duplicate_reason");
    if (duplicate != nullptr && reason.empty()) {
        return TaskError{ErrorKind::ParameterInvalid,
                         "A duplicate work order needs a reason.",
                         "duplicate_reason_required",
                         "Explain why " + duplicate->id + " cannot be reused.",
                         "duplicate_reason"};
    }

    std::ostringstream id;
    id << "WO" << std::setw(4) << std::setfill('0') << (work_orders_.size() + 1);
    WorkOrderRecord order;
    order.id = id.str();
    order.title = title;
    order.description = description;
    order.assignee_id = assignee->id;
    order.priority = priority;
    order.category = string_arg(arguments, "category");
    if (!reason.empty()) {
        order.notes.push_back("Duplicate of " + duplicate->id + ": " + reason);
    }
    work_orders_.push_back(order);

    output.value = json{{"work_order_id", order.id},
                        {"outcome", "created"},
                        {"assignee_id", order.assignee_id},
                        {"priority", order.priority}};
    output.text = "Created work order " + order.id + " \"" + order.title + "\" for " +
                  assignee->name + " with " + order.priority + " priority.";
    output.exports["work_order_id"] = order.id;
    output.origins.push_back(
        SourceAttribution{"work_orders:" + order.id, output.text, std::nullopt});
    return output;
}

core::errors::Result<ToolOutput> InMemoryFinanceStore::send_email(const json& arguments) {
    const std::string to = string_arg(arguments, "to");
    const std::string subject = string_arg(arguments, "subject");
    const std::string body = string_arg(arguments, "email_body");
    if (to.empty()) {
        return TaskError{ErrorKind::ParameterInvalid, "The e-mail needs a recipient.",
                         "missing_recipient", "", "to"};
    }
    if (subject.empty() || body.empty()) {
        return TaskError{ErrorKind::ParameterInvalid,
                         "The e-mail needs a subject and a body.", "missing_email_content",
                         "", subject.empty() ? "subject" : "email_body"};
    }

    std::string address;
    if (to.find('@') != std::string::npos) {
        address = to;
    } else {
        const std::string wanted = core::text::normalize(to);
        for (const auto& employee : employees_) {
            if (core::text::lowercase(employee.department) == wanted) {
                address = wanted + "@" + kMailDomain;
                break;
            }
            if (core::text::normalize(employee.name) == wanted ||
                core::text::lowercase(employee.id) == wanted) {
                address = employee.email;
                break;
            }
        }
    }
    if (address.empty()) {
        return TaskError{ErrorKind::EntityNotFound,
                         "No mailbox is known for '" + to + "'.", "recipient_not_found",
                         "Give an e-mail address, a department or an employee name.", "to"};
    }

    std::ostringstream id;
    id << "MSG" << std::setw(4) << std::setfill('0') << (outbox_.size() + 1);
    outbox_.push_back(OutboxMessage{id.str(), address, subject, body});

    ToolOutput output;
    output.value = json{{"message_id", id.str()}, {"to", address}, {"subject", subject}};
    output.text = "Sent e-mail " + id.str() + " to " + address + ".";
    output.exports["message_id"] = id.str();
    output.origins.push_back(
        SourceAttribution{"outbox:" + id.str(), output.text, std::nullopt});
    return output;
}

}  // namespace taskpilot::collab
