#include "runtime/argument_repair.hpp"

#include <string>
#include <vector>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"
#include "core/time/calendar.hpp"

namespace taskpilot::runtime {

using nlohmann::json;
using protocol::ParamSpec;
using protocol::ToolSpec;

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

json comparable(const json& value) {
    if (value.is_string()) {
        return core::text::uppercase(core::text::trim(value.get<std::string>()));
    }
    return value;
}

// Applies the format rules for one parameter. True when the value changed.
bool normalize_value(const ParamSpec& param, json& arguments) {
    if (!arguments.contains(param.name) || !arguments.at(param.name).is_string()) {
        return false;
    }
    const std::string value = arguments.at(param.name).get<std::string>();

    if (ends_with(param.name, "_date")) {
        auto normalized = core::time::normalize_date(value);
        if (normalized.has_value() && normalized.value() != value) {
            arguments[param.name] = normalized.value();
            return true;
        }
        return false;
    }
    if (ends_with(param.name, "_id")) {
        const std::string normalized = core::text::uppercase(core::text::trim(value));
        if (normalized != value) {
            arguments[param.name] = normalized;
            return true;
        }
    }
    return false;
}

// The parameter was rejected outright: fall back to its default or drop it.
bool replace_rejected(const ParamSpec& param, json& arguments) {
    if (!param.default_value.is_null()) {
        if (!arguments.contains(param.name) || arguments.at(param.name) != param.default_value) {
            arguments[param.name] = param.default_value;
            return true;
        }
        return false;
    }
    if (!param.required && arguments.contains(param.name)) {
        arguments.erase(param.name);
        return true;
    }
    return false;
}

}  // namespace

std::optional<json> ArgumentRepair::repair(const ToolSpec& spec, const json& arguments,
                                           const core::errors::TaskError& error) {
    if (!arguments.is_object()) {
        return std::nullopt;
    }

    std::vector<const ParamSpec*> candidates;
    if (!error.parameter.empty()) {
        const auto* param = spec.find_param(error.parameter);
        if (param == nullptr) {
            return std::nullopt;
        }
        candidates.push_back(param);
    } else {
        for (const auto& param : spec.params) {
            candidates.push_back(&param);
        }
    }

    json repaired = arguments;
    bool changed = false;
    for (const auto* param : candidates) {
        if (normalize_value(*param, repaired)) {
            changed = true;
            continue;
        }
        if (!error.parameter.empty() && replace_rejected(*param, repaired)) {
            changed = true;
        }
    }

    if (!changed) {
        return std::nullopt;
    }
    if (!preserves_targets(spec, arguments, repaired)) {
        LOG_WARN("Refusing repair of " + spec.name + ": it would change the target entity");
        return std::nullopt;
    }
    return repaired;
}

bool ArgumentRepair::preserves_targets(const ToolSpec& spec, const json& before,
                                       const json& after) {
    for (const auto& param : spec.params) {
        if (!param.identifies_target) {
            continue;
        }
        const bool had = before.is_object() && before.contains(param.name);
        const bool has = after.is_object() && after.contains(param.name);
        if (had != has) {
            return false;
        }
        if (had && comparable(before.at(param.name)) != comparable(after.at(param.name))) {
            return false;
        }
    }
    return true;
}

}  // namespace taskpilot::runtime
