#include "tools/tool_registry.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include "core/text/text_utils.hpp"

namespace taskpilot::tools {

using core::errors::ErrorKind;
using core::errors::TaskError;
using nlohmann::json;
using protocol::SourceAttribution;
using protocol::ToolOutput;
using protocol::ToolSpec;

namespace {

constexpr std::size_t kMaxExcerptLength = 300;

core::errors::Result<ToolOutput> run_retrieval(const ToolSpec& spec,
                                               const RetrievalTool& tool,
                                               const json& arguments,
                                               const collab::CallContext& context) {
    if (!tool.retriever) {
        return TaskError{ErrorKind::InternalFault,
                         "No retriever configured for " + spec.name,
                         "collaborator_missing"};
    }
    if (!arguments.contains("query") || !arguments.at("query").is_string() ||
        core::text::trim(arguments.at("query").get<std::string>()).empty()) {
        return TaskError{ErrorKind::ParameterInvalid, "Search query cannot be empty.",
                         "empty_search_query", "", "query"};
    }

    auto searched = tool.retriever->search(arguments.at("query").get<std::string>(),
                                           tool.top_k, tool.similarity_threshold,
                                           context);
    if (core::errors::is_error(searched)) {
        return core::errors::get_error(searched);
    }
    const auto& passages = core::errors::get_value(searched);
    if (passages.empty()) {
        return TaskError{ErrorKind::EntityNotFound,
                         "No policy document matched the question.",
                         "no_matching_documents",
                         "Try different keywords."};
    }

    ToolOutput output;
    output.value = json::array();
    std::ostringstream text;
    int index = 1;
    for (const auto& passage : passages) {
        output.value.push_back(json{
            {"origin", passage.origin_id}, {"text", passage.text}, {"score", passage.score}});
        text << index++ << ". [" << passage.origin_id << "] "
             << core::text::truncate(passage.text, kMaxExcerptLength) << " (relevance "
             << std::fixed << std::setprecision(2) << passage.score << ")\n";
        output.origins.push_back(SourceAttribution{
            passage.origin_id, core::text::truncate(passage.text, kMaxExcerptLength),
            passage.score});
    }
    output.text = text.str();
    for (const auto& name : spec.exports) {
        output.exports[name] = passages.front().text;
    }
    return output;
}

core::errors::Result<ToolOutput> run_generation(const ToolSpec& spec,
                                                const GenerationTool& tool,
                                                const json& arguments,
                                                const collab::CallContext& context) {
    if (!tool.model) {
        return TaskError{ErrorKind::InternalFault,
                         "No language model configured for " + spec.name,
                         "collaborator_missing"};
    }

    std::ostringstream details;
    for (const auto& [key, value] : arguments.items()) {
        details << key << ": "
                << (value.is_string() ? value.get<std::string>() : value.dump()) << "\n";
    }

    protocol::PromptContext prompt;
    prompt.purpose = protocol::PromptPurpose::Draft;
    prompt.messages.push_back({protocol::Role::System, tool.instruction});
    prompt.messages.push_back({protocol::Role::User, details.str()});

    auto generated = tool.model->generate(prompt, context);
    if (core::errors::is_error(generated)) {
        return core::errors::get_error(generated);
    }
    const std::string text = core::text::trim(core::errors::get_value(generated));
    if (text.empty()) {
        return TaskError{ErrorKind::Transient, "Language model returned no content.",
                         "empty_generation"};
    }

    ToolOutput output;
    output.value = json{{"text", text}};
    output.text = text;
    for (const auto& name : spec.exports) {
        output.exports[name] = text;
    }
    output.origins.push_back(SourceAttribution{
        "generated:" + spec.name, core::text::truncate(text, kMaxExcerptLength),
        std::nullopt});
    return output;
}

core::errors::Result<ToolOutput> run_data(const ToolSpec& spec, const DataTool& tool,
                                          const json& arguments,
                                          const collab::CallContext& context) {
    if (!tool.service) {
        return TaskError{ErrorKind::InternalFault,
                         "No data service configured for " + spec.name,
                         "collaborator_missing"};
    }
    return tool.service->invoke(spec.name, arguments, context);
}

}  // namespace

core::errors::Result<std::size_t> ToolRegistry::register_tool(ToolSpec spec,
                                                              ToolVariant impl) {
    if (sealed_) {
        return TaskError{ErrorKind::Configuration,
                         "Registry is sealed; cannot register " + spec.name,
                         "registry_sealed"};
    }
    if (spec.name.empty()) {
        return TaskError{ErrorKind::Configuration, "Tool name cannot be empty.",
                         "invalid_tool_spec"};
    }
    if (index_.find(spec.name) != index_.end()) {
        return TaskError{ErrorKind::Configuration,
                         "Tool already registered: " + spec.name, "duplicate_tool"};
    }

    std::unordered_set<std::string> param_names;
    for (const auto& param : spec.params) {
        if (param.name.empty() || !param_names.insert(param.name).second) {
            return TaskError{ErrorKind::Configuration,
                             "Tool " + spec.name + " has an empty or duplicate parameter.",
                             "invalid_tool_spec"};
        }
    }
    for (const auto& export_name : spec.exports) {
        if (export_name.empty()) {
            return TaskError{ErrorKind::Configuration,
                             "Tool " + spec.name + " declares an empty export.",
                             "invalid_tool_spec"};
        }
    }

    for (auto& cue : spec.cues) {
        cue = core::text::normalize(cue);
    }

    const std::size_t slot = entries_.size();
    index_.emplace(spec.name, slot);
    entries_.push_back(ToolEntry{std::move(spec), std::move(impl)});
    return slot;
}

core::errors::Result<std::string> ToolRegistry::set_default_producer(
    const std::string& export_name, const std::string& tool_name) {
    if (sealed_) {
        return TaskError{ErrorKind::Configuration,
                         "Registry is sealed; cannot change producers.",
                         "registry_sealed"};
    }
    auto it = index_.find(tool_name);
    if (it == index_.end()) {
        return TaskError{ErrorKind::Configuration, "Unknown tool: " + tool_name,
                         "tool_not_found"};
    }
    if (!entries_[it->second].spec.exports_param(export_name)) {
        return TaskError{ErrorKind::Configuration,
                         tool_name + " does not export " + export_name,
                         "invalid_default_producer"};
    }
    default_producers_[export_name] = tool_name;
    return tool_name;
}

void ToolRegistry::seal() { sealed_ = true; }

bool ToolRegistry::sealed() const { return sealed_; }

core::errors::Result<const ToolEntry*> ToolRegistry::lookup(
    const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return TaskError{ErrorKind::InternalFault, "Unknown tool: " + name,
                         "tool_not_found"};
    }
    return &entries_[it->second];
}

std::vector<const ToolSpec*> ToolRegistry::tools_exporting(
    const std::string& param_name) const {
    std::vector<const ToolSpec*> producers;
    for (const auto& entry : entries_) {
        if (entry.spec.exports_param(param_name)) {
            producers.push_back(&entry.spec);
        }
    }
    return producers;
}

const ToolSpec* ToolRegistry::default_producer(const std::string& param_name) const {
    auto declared = default_producers_.find(param_name);
    if (declared != default_producers_.end()) {
        return &entries_[index_.at(declared->second)].spec;
    }
    const auto producers = tools_exporting(param_name);
    if (producers.empty()) {
        return nullptr;
    }
    return producers.front();
}

std::vector<const ToolSpec*> ToolRegistry::all() const {
    std::vector<const ToolSpec*> specs;
    specs.reserve(entries_.size());
    for (const auto& entry : entries_) {
        specs.push_back(&entry.spec);
    }
    return specs;
}

std::size_t ToolRegistry::size() const { return entries_.size(); }

core::errors::Result<ToolOutput> ToolRegistry::invoke(
    const std::string& name, const json& arguments,
    const collab::CallContext& context) const {
    auto found = lookup(name);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    return invoke_tool(*core::errors::get_value(found), arguments, context);
}

core::errors::Result<ToolOutput> invoke_tool(const ToolEntry& entry, const json& arguments,
                                             const collab::CallContext& context) {
    return std::visit(
        [&](const auto& tool) -> core::errors::Result<ToolOutput> {
            using T = std::decay_t<decltype(tool)>;
            if constexpr (std::is_same_v<T, RetrievalTool>) {
                return run_retrieval(entry.spec, tool, arguments, context);
            } else if constexpr (std::is_same_v<T, GenerationTool>) {
                return run_generation(entry.spec, tool, arguments, context);
            } else {
                return run_data(entry.spec, tool, arguments, context);
            }
        },
        entry.impl);
}

}  // namespace taskpilot::tools
