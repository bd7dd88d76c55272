#pragma once

#include <string>
#include "collab/collaborators.hpp"

namespace taskpilot::collab {

// Deterministic stand-in for a hosted model. Drafts and answers are filled
// from templates; classification requests are declined so callers fall back
// to their rules.
class TemplateLanguageModel : public LanguageModel {
public:
    explicit TemplateLanguageModel(std::string sender_name = "Finance Assistant");

    core::errors::Result<std::string> generate(const protocol::PromptContext& prompt,
                                               const CallContext& context) override;

private:
    std::string draft(const protocol::PromptContext& prompt) const;
    std::string answer(const protocol::PromptContext& prompt) const;

    std::string sender_name_;
};

}  // namespace taskpilot::collab
