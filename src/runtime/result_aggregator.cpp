#include "runtime/result_aggregator.hpp"

#include <sstream>
#include <utility>
#include "core/errors/task_errors.hpp"
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

namespace taskpilot::runtime {

using core::errors::ErrorKind;
using protocol::AggregatedAnswer;
using protocol::StepResult;
using protocol::ToolFamily;

namespace {

struct Section {
    ToolFamily family;
    const char* heading;
};

constexpr Section kSections[] = {
    {ToolFamily::Rule, "Policy information"},
    {ToolFamily::Record, "Data"},
    {ToolFamily::Action, "Actions taken"},
    {ToolFamily::Generation, "Generated content"},
};

// Kinds whose message names the missing or rejected thing.
bool message_is_user_facing(const ErrorKind kind) {
    return kind == ErrorKind::EntityNotFound || kind == ErrorKind::ParameterInvalid ||
           kind == ErrorKind::PreconditionFailed ||
           kind == ErrorKind::DependencyUnsatisfiable;
}

}  // namespace

ResultAggregator::ResultAggregator(const tools::ToolRegistry& registry,
                                   std::shared_ptr<collab::LanguageModel> model,
                                   const std::chrono::milliseconds model_timeout)
    : registry_(registry), model_(std::move(model)), model_timeout_(model_timeout) {}

std::string ResultAggregator::label_of(const std::string& tool_name) const {
    auto found = registry_.lookup(tool_name);
    if (core::errors::is_error(found)) {
        return tool_name;
    }
    const auto& description = core::errors::get_value(found)->spec.description;
    return description.empty() ? tool_name : description;
}

std::string ResultAggregator::failure_note(const StepResult& result) const {
    std::string note = label_of(result.tool_name) + ": ";
    if (!result.error.has_value()) {
        return note + core::errors::plain_reason(ErrorKind::InternalFault);
    }
    const auto& error = result.error.value();
    note += core::errors::plain_reason(error.kind);
    if (message_is_user_facing(error.kind) && !error.message.empty()) {
        note += " (" + error.message + ")";
    }
    return note;
}

std::string ResultAggregator::compose_material(
    const std::vector<StepResult>& results, const std::vector<std::string>& failure_notes) const {
    std::ostringstream out;
    for (const auto& section : kSections) {
        std::vector<std::string> excerpts;
        for (const auto& result : results) {
            if (!result.success) {
                continue;
            }
            auto found = registry_.lookup(result.tool_name);
            if (core::errors::is_error(found) ||
                core::errors::get_value(found)->spec.family != section.family) {
                continue;
            }
            const std::string excerpt = core::text::trim(result.excerpt);
            if (!excerpt.empty()) {
                excerpts.push_back(excerpt);
            }
        }
        if (excerpts.empty()) {
            continue;
        }
        out << section.heading << ":\n";
        for (const auto& excerpt : excerpts) {
            out << excerpt << "\n";
        }
        out << "\n";
    }

    if (!failure_notes.empty()) {
        out << "Could not complete:\n";
        for (const auto& note : failure_notes) {
            out << "- " << note << "\n";
        }
    }
    return core::text::trim(out.str());
}

std::string ResultAggregator::apology(const std::vector<std::string>& failure_notes) {
    std::string text = "Sorry, I could not complete your request.";
    if (!failure_notes.empty()) {
        text += "\nReasons:";
        for (const auto& note : failure_notes) {
            text += "\n- " + note;
        }
    }
    return text;
}

AggregatedAnswer ResultAggregator::aggregate(const std::string& request_text,
                                             const protocol::Intent intent,
                                             const protocol::Plan& plan,
                                             const std::vector<StepResult>& results,
                                             const std::string& stop_reason) const {
    AggregatedAnswer answer;
    answer.intent = intent;
    answer.step_results = results;

    bool any_success = false;
    for (const auto& result : results) {
        if (result.success) {
            any_success = true;
            if (!result.origins.empty()) {
                answer.sources.push_back(result.origins.front());
            }
        } else {
            answer.failure_notes.push_back(failure_note(result));
        }
    }
    for (const auto& step : plan.steps) {
        bool has_result = false;
        for (const auto& result : results) {
            has_result = has_result || result.step_id == step.id;
        }
        if (!has_result) {
            answer.failure_notes.push_back(
                label_of(step.tool_name) + ": not attempted" +
                (stop_reason.empty() ? std::string() : " (" + stop_reason + ")"));
        }
    }

    if (!any_success) {
        answer.text = apology(answer.failure_notes);
        LOG_INFO("No step succeeded; answering with the apology template");
        return answer;
    }

    const std::string material = compose_material(results, answer.failure_notes);
    answer.text = material;
    if (!model_) {
        return answer;
    }

    protocol::PromptContext prompt;
    prompt.purpose = protocol::PromptPurpose::Answer;
    prompt.messages.push_back(
        {protocol::Role::System,
         "You are a finance assistant. Answer the question using only the material "
         "below. Keep employee ids, amounts and dates exactly as given, and say plainly "
         "which parts could not be completed."});
    prompt.messages.push_back(
        {protocol::Role::User, "Question: " + request_text + "\n\nMaterial:\n" + material});

    collab::CallContext context;
    context.timeout = model_timeout_;
    context.deadline = std::chrono::steady_clock::now() + model_timeout_;

    auto reply = model_->generate(prompt, context);
    if (core::errors::is_error(reply)) {
        LOG_WARN("Answer composition failed (" + core::errors::get_error(reply).code +
                 "); returning the gathered material");
        return answer;
    }
    const std::string text = core::text::trim(core::errors::get_value(reply));
    if (text.empty()) {
        LOG_WARN("Answer composition returned nothing; returning the gathered material");
        return answer;
    }
    answer.text = text;
    return answer;
}

}  // namespace taskpilot::runtime
