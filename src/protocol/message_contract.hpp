#pragma once
#include <string>
#include <vector>

namespace taskpilot::protocol {

    enum class Role {
        User,
        Assistant,
        System
    };

    struct Message {
        Role role;
        std::string content;
    };

    // What the language model is being asked to do.
    enum class PromptPurpose {
        Classify,   // Reply with a JSON intent object
        Draft,      // Write a piece of content (e-mail, note)
        Answer      // Compose the final answer from gathered material
    };

    struct PromptContext {
        PromptPurpose purpose = PromptPurpose::Answer;
        std::vector<Message> messages;
    };

    inline std::string to_string(const PromptPurpose purpose) {
        switch (purpose) {
            case PromptPurpose::Classify: return "classify";
            case PromptPurpose::Draft: return "draft";
            case PromptPurpose::Answer: return "answer";
            default: return "unknown";
        }
    }

} // namespace taskpilot::protocol
