#pragma once

#include <cstddef>
#include "core/errors/task_errors.hpp"
#include "protocol/entity_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "tools/tool_registry.hpp"

namespace taskpilot::planning {

// Turns a draft plan into one where every required parameter is bound and
// every back-reference points at an earlier step.
//
// Errors:
//   Configuration "dependency_cycle"   back-references form a cycle, or the
//                                      insertion passes did not converge
//   InternalFault "tool_not_found"     a step names an unregistered tool
//   InternalFault "dangling_reference" a back-reference names no step
//
// Steps whose parameter no tool exports are kept, marked FailedTerminal with
// DependencyUnsatisfiable; the caller decides whether to run such a plan.
class DependencyResolver {
public:
    explicit DependencyResolver(const tools::ToolRegistry& registry);

    core::errors::Result<protocol::Plan> resolve(protocol::Plan plan,
                                                 const protocol::EntityBag& entities) const;

private:
    core::errors::Result<bool> check_references(const protocol::Plan& plan) const;

    // Binds the unbound required parameters of the step at `index`, inserting
    // producer steps before it. Returns the number of inserted steps.
    core::errors::Result<std::size_t> resolve_step(protocol::Plan& plan, std::size_t index,
                                                   const protocol::EntityBag& entities,
                                                   bool& changed) const;

    core::errors::Result<bool> order(protocol::Plan& plan) const;

    const tools::ToolRegistry& registry_;
};

}  // namespace taskpilot::planning
