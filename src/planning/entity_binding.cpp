#include "planning/entity_binding.hpp"

#include <variant>

namespace taskpilot::planning {

using protocol::ArgBinding;
using protocol::Unbound;

void bind_entities(const protocol::ToolSpec& spec, const protocol::EntityBag& entities,
                   protocol::PlanStep& step) {
    for (const auto& param : spec.params) {
        auto existing = step.arguments.find(param.name);
        if (existing != step.arguments.end() &&
            !std::holds_alternative<Unbound>(existing->second)) {
            continue;
        }

        if (param.entity.has_value()) {
            auto value = entities.find(param.entity.value());
            if (value != entities.end() && !value->second.empty()) {
                step.arguments[param.name] = ArgBinding{nlohmann::json(value->second)};
                continue;
            }
        }

        if (param.required) {
            step.arguments[param.name] = ArgBinding{Unbound{}};
        }
    }
}

}  // namespace taskpilot::planning
