#include "planning/plan_synthesizer.hpp"

#include <algorithm>
#include <string>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"
#include "planning/entity_binding.hpp"

namespace taskpilot::planning {

using protocol::Intent;
using protocol::Plan;
using protocol::ToolFamily;
using protocol::ToolSpec;

PlanSynthesizer::PlanSynthesizer(const tools::ToolRegistry& registry)
    : registry_(registry) {}

std::vector<ToolFamily> PlanSynthesizer::eligible_families(const Intent intent) {
    switch (intent) {
        case Intent::SimpleLookup:
            return {ToolFamily::Rule};
        case Intent::DataQuery:
            return {ToolFamily::Record};
        case Intent::ContentGeneration:
            return {ToolFamily::Generation};
        case Intent::CompositeTask:
        default:
            return {ToolFamily::Rule, ToolFamily::Record, ToolFamily::Action,
                    ToolFamily::Generation};
    }
}

Plan PlanSynthesizer::synthesize(const Classification& classification) const {
    const auto families = eligible_families(classification.intent);
    auto eligible = [&families](const ToolSpec& spec) {
        return std::find(families.begin(), families.end(), spec.family) != families.end();
    };

    // registry_.all() is in registration order, so the stable sort below
    // keeps that order among tools of equal priority.
    std::vector<const ToolSpec*> selected;
    for (const auto* spec : registry_.all()) {
        if (!eligible(*spec)) {
            continue;
        }
        const bool cued = std::any_of(spec->cues.begin(), spec->cues.end(),
                                      [&classification](const std::string& cue) {
                                          return core::text::contains_phrase(
                                              classification.normalized_text, cue);
                                      });
        if (cued) {
            selected.push_back(spec);
        }
    }

    if (selected.empty()) {
        for (const auto* spec : registry_.all()) {
            if (spec->family == families.front()) {
                LOG_INFO("No tool cue matched; falling back to " + spec->name);
                selected.push_back(spec);
                break;
            }
        }
    }

    std::stable_sort(selected.begin(), selected.end(),
                     [](const ToolSpec* a, const ToolSpec* b) {
                         return a->priority < b->priority;
                     });

    Plan plan;
    std::string summary;
    for (const auto* spec : selected) {
        auto& step = plan.append(spec->name);
        bind_entities(*spec, classification.entities, step);
        summary += (summary.empty() ? "" : " -> ") + spec->name;
    }
    LOG_INFO("Draft plan (" + protocol::to_string(classification.intent) +
             "): " + (summary.empty() ? "empty" : summary));
    return plan;
}

}  // namespace taskpilot::planning
