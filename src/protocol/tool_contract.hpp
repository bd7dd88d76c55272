#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/entity_contract.hpp"

namespace taskpilot::protocol {

    // Semantic group of a tool: decides plan eligibility and answer grouping.
    enum class ToolFamily {
        Rule,        // Policy and rule information
        Record,      // Structured data lookups
        Action,      // State-changing operations
        Generation   // Generated content
    };

    // Whether repeating a call is safe.
    enum class ToolEffect {
        ReadOnly,
        IdempotentByKey,
        Mutating
    };

    struct ParamSpec {
        std::string name;
        bool required = false;
        std::optional<EntityKind> entity;          // Bound eagerly from the entity bag
        nlohmann::json default_value = nullptr;    // null means "no default"
        bool identifies_target = false;            // Must never change across retries
    };

    struct ToolSpec {
        std::string name;
        std::string description;
        ToolFamily family = ToolFamily::Record;
        ToolEffect effect = ToolEffect::ReadOnly;
        std::vector<ParamSpec> params;
        std::vector<std::string> exports;
        std::vector<std::string> cues;
        int priority = 50;

        const ParamSpec* find_param(const std::string& param_name) const {
            for (const auto& param : params) {
                if (param.name == param_name) {
                    return &param;
                }
            }
            return nullptr;
        }

        bool exports_param(const std::string& param_name) const {
            for (const auto& name : exports) {
                if (name == param_name) {
                    return true;
                }
            }
            return false;
        }
    };

    struct SourceAttribution {
        std::string origin_id;             // doc:<id>, <table>:<row> or generated:<tool>
        std::string excerpt;
        std::optional<double> confidence;
    };

    // What a tool hands back on success.
    struct ToolOutput {
        nlohmann::json value;                          // Raw structured output
        std::string text;                              // Readable excerpt
        std::map<std::string, nlohmann::json> exports;
        std::vector<SourceAttribution> origins;
    };

    inline std::string to_string(const ToolFamily family) {
        switch (family) {
            case ToolFamily::Rule: return "rule";
            case ToolFamily::Record: return "record";
            case ToolFamily::Action: return "action";
            case ToolFamily::Generation: return "generation";
            default: return "unknown";
        }
    }

    inline std::string to_string(const ToolEffect effect) {
        switch (effect) {
            case ToolEffect::ReadOnly: return "read_only";
            case ToolEffect::IdempotentByKey: return "idempotent_by_key";
            case ToolEffect::Mutating: return "mutating";
            default: return "unknown";
        }
    }

} // namespace taskpilot::protocol
