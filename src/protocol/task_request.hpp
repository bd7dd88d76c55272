#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <optional>

namespace taskpilot::protocol {

    // Validated user input required to run one request
    struct TaskRequest {
        std::string request_text;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> trace_dir;
        std::optional<std::uint32_t> max_steps;     // Overrides the config file
        std::optional<std::uint32_t> max_retries;   // Overrides the config file
        std::optional<std::string> user_id;         // Employee id of the caller
        bool verbose = false;
    };

} // namespace taskpilot::protocol
