#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "collab/collaborators.hpp"
#include "core/errors/task_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace taskpilot::tools {

struct RetrievalTool {
    std::shared_ptr<collab::Retriever> retriever;
    std::size_t top_k = 3;
    double similarity_threshold = 0.2;
};

struct GenerationTool {
    std::shared_ptr<collab::LanguageModel> model;
    std::string instruction;
};

struct DataTool {
    std::shared_ptr<collab::DataService> service;
};

using ToolVariant = std::variant<RetrievalTool, GenerationTool, DataTool>;

struct ToolEntry {
    protocol::ToolSpec spec;
    ToolVariant impl;
};

// Built once at startup, then sealed and shared read-only.
class ToolRegistry {
public:
    core::errors::Result<std::size_t> register_tool(protocol::ToolSpec spec,
                                                    ToolVariant impl);

    // Overrides the first-registered-wins producer choice for one export.
    core::errors::Result<std::string> set_default_producer(
        const std::string& export_name, const std::string& tool_name);

    void seal();
    bool sealed() const;

    core::errors::Result<const ToolEntry*> lookup(const std::string& name) const;
    std::vector<const protocol::ToolSpec*> tools_exporting(
        const std::string& param_name) const;
    const protocol::ToolSpec* default_producer(const std::string& param_name) const;
    std::vector<const protocol::ToolSpec*> all() const;
    std::size_t size() const;

    core::errors::Result<protocol::ToolOutput> invoke(
        const std::string& name, const nlohmann::json& arguments,
        const collab::CallContext& context) const;

private:
    std::vector<ToolEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
    std::unordered_map<std::string, std::string> default_producers_;
    bool sealed_ = false;
};

// Calls one tool's collaborator. Safe to run on any thread while the entry's
// collaborators are alive.
core::errors::Result<protocol::ToolOutput> invoke_tool(const ToolEntry& entry,
                                                       const nlohmann::json& arguments,
                                                       const collab::CallContext& context);

}  // namespace taskpilot::tools
