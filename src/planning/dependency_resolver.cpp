#include "planning/dependency_resolver.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "core/logging/logger.hpp"
#include "planning/entity_binding.hpp"

namespace taskpilot::planning {

using core::errors::ErrorKind;
using core::errors::TaskError;
using protocol::BackReference;
using protocol::Plan;
using protocol::PlanStep;
using protocol::StepStatus;
using protocol::ToolSpec;
using protocol::Unbound;

DependencyResolver::DependencyResolver(const tools::ToolRegistry& registry)
    : registry_(registry) {}

core::errors::Result<Plan> DependencyResolver::resolve(
    Plan plan, const protocol::EntityBag& entities) const {
    auto checked = check_references(plan);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    const std::size_t max_passes = registry_.size() + 1;
    bool converged = false;
    for (std::size_t pass = 0; pass < max_passes; ++pass) {
        bool changed = false;
        for (std::size_t i = 0; i < plan.steps.size(); ++i) {
            auto inserted = resolve_step(plan, i, entities, changed);
            if (core::errors::is_error(inserted)) {
                return core::errors::get_error(inserted);
            }
            i += core::errors::get_value(inserted);
        }
        if (!changed) {
            converged = true;
            break;
        }
    }
    if (!converged) {
        return TaskError{ErrorKind::Configuration,
                         "Dependency resolution did not settle after " +
                             std::to_string(max_passes) + " passes.",
                         "dependency_cycle"};
    }

    auto ordered = order(plan);
    if (core::errors::is_error(ordered)) {
        return core::errors::get_error(ordered);
    }

    std::string summary;
    for (const auto& step : plan.steps) {
        summary += (summary.empty() ? "" : " -> ") + step.tool_name + "#" +
                   std::to_string(step.id);
    }
    LOG_INFO("Resolved plan: " + (summary.empty() ? std::string("empty") : summary));
    return plan;
}

core::errors::Result<bool> DependencyResolver::check_references(const Plan& plan) const {
    for (const auto& step : plan.steps) {
        auto found = registry_.lookup(step.tool_name);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        for (const int target : step.prerequisites()) {
            if (target == step.id || plan.find(target) == nullptr) {
                return TaskError{ErrorKind::InternalFault,
                                 "Step " + std::to_string(step.id) +
                                     " refers to missing step " + std::to_string(target),
                                 "dangling_reference"};
            }
        }
    }
    return true;
}

core::errors::Result<std::size_t> DependencyResolver::resolve_step(
    Plan& plan, const std::size_t index, const protocol::EntityBag& entities,
    bool& changed) const {
    if (plan.steps[index].status == StepStatus::FailedTerminal) {
        return std::size_t{0};
    }
    auto found = registry_.lookup(plan.steps[index].tool_name);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const ToolSpec& spec = core::errors::get_value(found)->spec;

    std::size_t current = index;
    std::size_t inserted = 0;
    for (const auto& param : spec.params) {
        if (!param.required) {
            continue;
        }
        PlanStep& step = plan.steps[current];
        auto binding = step.arguments.find(param.name);
        if (binding != step.arguments.end() &&
            !std::holds_alternative<Unbound>(binding->second)) {
            continue;
        }

        // An exporter already in the plan wins; the earliest one is used.
        const PlanStep* existing = nullptr;
        for (const auto& candidate : plan.steps) {
            if (candidate.id == step.id || candidate.tool_name == step.tool_name) {
                continue;
            }
            auto candidate_entry = registry_.lookup(candidate.tool_name);
            if (core::errors::is_error(candidate_entry)) {
                return core::errors::get_error(candidate_entry);
            }
            if (core::errors::get_value(candidate_entry)->spec.exports_param(param.name)) {
                existing = &candidate;
                break;
            }
        }
        if (existing != nullptr) {
            step.arguments[param.name] = BackReference{existing->id, param.name};
            changed = true;
            LOG_DEBUG("Bound " + spec.name + "." + param.name + " to step " +
                      std::to_string(existing->id));
            continue;
        }

        const ToolSpec* producer = registry_.default_producer(param.name);
        if (producer != nullptr && producer->name == spec.name) {
            producer = nullptr;
            for (const auto* candidate : registry_.tools_exporting(param.name)) {
                if (candidate->name != spec.name) {
                    producer = candidate;
                    break;
                }
            }
        }
        if (producer == nullptr && param.entity.has_value()) {
            // Comes from the request text; if the request lacks it only this step fails.
            LOG_DEBUG("Left " + spec.name + "." + param.name +
                      " unbound: no exporter and not named in the request");
            continue;
        }
        if (producer == nullptr) {
            step.status = StepStatus::FailedTerminal;
            step.error = TaskError{ErrorKind::DependencyUnsatisfiable,
                                   "No registered tool provides '" + param.name +
                                       "', which " + spec.name + " needs.",
                                   "dependency_unsatisfiable", "", param.name};
            changed = true;
            LOG_WARN("Step " + std::to_string(step.id) + " (" + spec.name +
                     ") cannot be satisfied: nothing exports " + param.name);
            break;
        }

        PlanStep producer_step;
        producer_step.id = plan.next_step_id++;
        producer_step.tool_name = producer->name;
        bind_entities(*producer, entities, producer_step);
        const int producer_id = producer_step.id;

        plan.steps.insert(plan.steps.begin() + static_cast<std::ptrdiff_t>(current),
                          std::move(producer_step));
        ++current;
        ++inserted;
        plan.steps[current].arguments[param.name] = BackReference{producer_id, param.name};
        changed = true;
        LOG_INFO("Inserted " + producer->name + " to supply " + param.name + " for " +
                 spec.name);
    }
    return inserted;
}

core::errors::Result<bool> DependencyResolver::order(Plan& plan) const {
    std::vector<PlanStep> remaining = std::move(plan.steps);
    std::vector<PlanStep> ordered;
    ordered.reserve(remaining.size());
    std::set<int> placed;

    // Kahn's algorithm, always taking the earliest ready step.
    while (!remaining.empty()) {
        auto ready = std::find_if(remaining.begin(), remaining.end(),
                                  [&placed](const PlanStep& step) {
                                      for (const int id : step.prerequisites()) {
                                          if (placed.count(id) == 0) {
                                              return false;
                                          }
                                      }
                                      return true;
                                  });
        if (ready == remaining.end()) {
            std::string involved;
            for (const auto& step : remaining) {
                involved += (involved.empty() ? "" : ", ") + step.tool_name;
            }
            plan.steps = std::move(ordered);
            return TaskError{ErrorKind::Configuration,
                             "Steps depend on each other in a cycle: " + involved,
                             "dependency_cycle"};
        }
        placed.insert(ready->id);
        ordered.push_back(std::move(*ready));
        remaining.erase(ready);
    }

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        ordered[i].position = i + 1;
    }
    plan.steps = std::move(ordered);
    return true;
}

}  // namespace taskpilot::planning
