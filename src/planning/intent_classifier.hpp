#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include "collab/collaborators.hpp"
#include "core/config/engine_config.hpp"
#include "core/time/calendar.hpp"
#include "protocol/entity_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace taskpilot::planning {

enum class ClassificationSource {
    Rules,
    Model
};

struct Classification {
    protocol::Intent intent = protocol::Intent::CompositeTask;
    protocol::EntityBag entities;
    std::string normalized_text;
    ClassificationSource source = ClassificationSource::Rules;
};

struct ClassifierOptions {
    std::optional<core::config::UserProfile> current_user;
    core::time::CalendarDate reference_date;   // "today" for relative dates
    std::chrono::milliseconds model_timeout{30000};
};

class IntentClassifier {
public:
    IntentClassifier(const tools::ToolRegistry& registry,
                     std::shared_ptr<collab::LanguageModel> model,
                     ClassifierOptions options);

    // Never fails: ambiguous or unreadable requests become composite tasks.
    Classification classify(const std::string& request_text) const;

    protocol::EntityBag extract_entities(const std::string& request_text) const;

    // Families whose tool cues occur in the normalized request text.
    std::set<protocol::ToolFamily> matched_families(const std::string& normalized_text) const;

    protocol::Intent intent_from_families(
        const std::set<protocol::ToolFamily>& families) const;

private:
    std::optional<protocol::Intent> classify_with_model(const std::string& request_text,
                                                        protocol::EntityBag& entities) const;

    const tools::ToolRegistry& registry_;
    std::shared_ptr<collab::LanguageModel> model_;
    ClassifierOptions options_;
};

}  // namespace taskpilot::planning
