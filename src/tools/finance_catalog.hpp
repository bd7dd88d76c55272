#pragma once

#include <cstddef>
#include <memory>
#include <vector>
#include "collab/collaborators.hpp"
#include "core/config/engine_config.hpp"
#include "core/errors/task_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace taskpilot::tools {

struct FinanceCollaborators {
    std::shared_ptr<collab::Retriever> retriever;
    std::shared_ptr<collab::LanguageModel> language_model;
    std::shared_ptr<collab::DataService> data_service;
};

// Specs of the finance assistant tools, in registration order.
std::vector<protocol::ToolSpec> finance_tool_specs();

// Registers every finance tool and declares the default producers. The
// registry is left unsealed so callers can add their own tools.
core::errors::Result<std::size_t> register_finance_tools(
    ToolRegistry& registry, const FinanceCollaborators& collaborators,
    const core::config::EngineConfig& config);

}  // namespace taskpilot::tools
