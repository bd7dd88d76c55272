#include "collab/template_language_model.hpp"

#include <map>
#include <sstream>
#include <utility>
#include "core/text/text_utils.hpp"

namespace taskpilot::collab {

using core::errors::ErrorKind;
using core::errors::TaskError;
using protocol::PromptContext;
using protocol::PromptPurpose;
using protocol::Role;

namespace {

std::string last_user_message(const PromptContext& prompt) {
    for (auto it = prompt.messages.rbegin(); it != prompt.messages.rend(); ++it) {
        if (it->role == Role::User) {
            return it->content;
        }
    }
    return "";
}

// Parses "key: value" lines.
std::map<std::string, std::string> parse_fields(const std::string& content) {
    std::map<std::string, std::string> fields;
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        fields[core::text::trim(line.substr(0, colon))] =
            core::text::trim(line.substr(colon + 1));
    }
    return fields;
}

std::string field_or(const std::map<std::string, std::string>& fields,
                     const std::string& key, const std::string& fallback) {
    auto it = fields.find(key);
    return it == fields.end() || it->second.empty() ? fallback : it->second;
}

}  // namespace

TemplateLanguageModel::TemplateLanguageModel(std::string sender_name)
    : sender_name_(std::move(sender_name)) {}

core::errors::Result<std::string> TemplateLanguageModel::generate(
    const PromptContext& prompt, const CallContext& context) {
    if (auto refused = refuse_call(context)) {
        return refused.value();
    }

    switch (prompt.purpose) {
        case PromptPurpose::Classify:
            return TaskError{ErrorKind::Transient,
                             "Template model does not classify requests.",
                             "classification_unsupported"};
        case PromptPurpose::Draft:
            return draft(prompt);
        case PromptPurpose::Answer:
            return answer(prompt);
        default:
            return TaskError{ErrorKind::InternalFault, "Unknown prompt purpose.",
                             "unknown_prompt_purpose"};
    }
}

std::string TemplateLanguageModel::draft(const PromptContext& prompt) const {
    const auto fields = parse_fields(last_user_message(prompt));
    const std::string subject = field_or(fields, "subject", "your request");
    const std::string recipient = field_or(fields, "recipient", "colleague");

    std::ostringstream text;
    text << "Subject: " << subject << "\n\n"
         << "Dear " << recipient << ",\n\n"
         << "I am writing regarding the following: " << subject << ".";
    const std::string employee = field_or(fields, "employee_name", "");
    if (!employee.empty()) {
        text << " This concerns " << employee << ".";
    }
    text << " Please let me know if you need any further details.\n\n"
         << "Best regards,\n"
         << sender_name_;
    return text.str();
}

std::string TemplateLanguageModel::answer(const PromptContext& prompt) const {
    std::string material = last_user_message(prompt);
    const auto marker = material.find("Material:\n");
    if (marker != std::string::npos) {
        material = material.substr(marker + std::string("Material:\n").size());
    }
    return "Here is what I found.\n\n" + core::text::trim(material);
}

}  // namespace taskpilot::collab
