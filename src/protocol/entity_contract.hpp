#pragma once

#include <map>
#include <optional>
#include <string>

namespace taskpilot::protocol {

enum class Intent {
    SimpleLookup,
    DataQuery,
    CompositeTask,
    ContentGeneration
};

enum class EntityKind {
    EmployeeName,
    EmployeeId,
    StartDate,
    EndDate,
    Subject,
    Recipient,
    Priority,
    Category
};

// Built once per request by the classifier and read-only afterwards.
using EntityBag = std::map<EntityKind, std::string>;

inline std::string to_string(const Intent intent) {
    switch (intent) {
        case Intent::SimpleLookup:
            return "simple_lookup";
        case Intent::DataQuery:
            return "data_query";
        case Intent::CompositeTask:
            return "composite_task";
        case Intent::ContentGeneration:
            return "content_generation";
        default:
            return "unknown";
    }
}

inline std::optional<Intent> intent_from_string(const std::string& value) {
    if (value == "simple_lookup" || value == "simple-lookup") {
        return Intent::SimpleLookup;
    }
    if (value == "data_query" || value == "data-query") {
        return Intent::DataQuery;
    }
    if (value == "composite_task" || value == "composite-task") {
        return Intent::CompositeTask;
    }
    if (value == "content_generation" || value == "content-generation") {
        return Intent::ContentGeneration;
    }
    return std::nullopt;
}

inline std::string to_string(const EntityKind kind) {
    switch (kind) {
        case EntityKind::EmployeeName:
            return "employee_name";
        case EntityKind::EmployeeId:
            return "employee_id";
        case EntityKind::StartDate:
            return "start_date";
        case EntityKind::EndDate:
            return "end_date";
        case EntityKind::Subject:
            return "subject";
        case EntityKind::Recipient:
            return "recipient";
        case EntityKind::Priority:
            return "priority";
        case EntityKind::Category:
            return "category";
        default:
            return "unknown";
    }
}

inline std::optional<EntityKind> entity_kind_from_string(const std::string& value) {
    static const EntityKind kAll[] = {
        EntityKind::EmployeeName, EntityKind::EmployeeId, EntityKind::StartDate,
        EntityKind::EndDate,      EntityKind::Subject,    EntityKind::Recipient,
        EntityKind::Priority,     EntityKind::Category};
    for (const auto kind : kAll) {
        if (to_string(kind) == value) {
            return kind;
        }
    }
    return std::nullopt;
}

}  // namespace taskpilot::protocol
