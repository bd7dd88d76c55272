#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/task_errors.hpp"

namespace taskpilot::core::config {

struct UserProfile {
    std::string name;
    std::string employee_id;
    std::string department;
};

struct EngineConfig {
    std::uint32_t max_retries = 2;
    std::uint32_t max_steps = 8;
    std::uint32_t step_timeout_ms = 5000;
    std::uint32_t generation_timeout_ms = 30000;
    std::uint32_t retrieval_top_k = 3;
    double similarity_threshold = 0.2;
    // "Today" for relative dates such as "last month"; system date when unset.
    std::optional<std::string> reference_date;
    std::optional<UserProfile> current_user;
};

core::errors::Result<EngineConfig> parse_engine_config(const std::string& json_text);

core::errors::Result<EngineConfig> load_engine_config(const std::filesystem::path& path);

}  // namespace taskpilot::core::config
