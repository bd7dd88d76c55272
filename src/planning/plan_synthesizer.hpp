#pragma once

#include <vector>
#include "planning/intent_classifier.hpp"
#include "protocol/entity_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace taskpilot::planning {

// Builds the draft plan: tools of the intent's families whose cues occur in
// the request, ordered by tool priority. Dependencies are left to the resolver.
class PlanSynthesizer {
public:
    explicit PlanSynthesizer(const tools::ToolRegistry& registry);

    protocol::Plan synthesize(const Classification& classification) const;

    // First family is the one used when no cue matches.
    static std::vector<protocol::ToolFamily> eligible_families(protocol::Intent intent);

private:
    const tools::ToolRegistry& registry_;
};

}  // namespace taskpilot::planning
