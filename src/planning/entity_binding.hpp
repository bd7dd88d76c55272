#pragma once

#include "protocol/entity_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace taskpilot::planning {

// Binds every parameter that declares an entity kind present in the bag.
// Required parameters left without a value are recorded as Unbound;
// arguments that are already bound are never touched.
void bind_entities(const protocol::ToolSpec& spec, const protocol::EntityBag& entities,
                   protocol::PlanStep& step);

}  // namespace taskpilot::planning
