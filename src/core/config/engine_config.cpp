#include "core/config/engine_config.hpp"

#include <fstream>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/time/calendar.hpp"

namespace taskpilot::core::config {

using core::errors::ErrorKind;
using core::errors::TaskError;
using nlohmann::json;

namespace {

void read_bounded_uint(const json& doc, const std::string& key,
                       const std::uint32_t min_value, const std::uint32_t max_value,
                       std::uint32_t& target, std::vector<std::string>& problems) {
    if (!doc.contains(key)) {
        return;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_integer()) {
        problems.push_back(key + " must be an integer");
        return;
    }
    const auto number = value.get<std::int64_t>();
    if (number < static_cast<std::int64_t>(min_value) ||
        number > static_cast<std::int64_t>(max_value)) {
        problems.push_back(key + " must be between " + std::to_string(min_value) +
                           " and " + std::to_string(max_value));
        return;
    }
    target = static_cast<std::uint32_t>(number);
}

void read_user(const json& doc, EngineConfig& config,
               std::vector<std::string>& problems) {
    if (!doc.contains("current_user")) {
        return;
    }
    const auto& user = doc.at("current_user");
    if (!user.is_object()) {
        problems.push_back("current_user must be an object");
        return;
    }

    UserProfile profile;
    if (user.contains("name") && user.at("name").is_string()) {
        profile.name = user.at("name").get<std::string>();
    }
    if (user.contains("employee_id") && user.at("employee_id").is_string()) {
        profile.employee_id = user.at("employee_id").get<std::string>();
    }
    if (user.contains("department") && user.at("department").is_string()) {
        profile.department = user.at("department").get<std::string>();
    }
    if (profile.name.empty() && profile.employee_id.empty()) {
        problems.push_back("current_user needs a name or an employee_id");
        return;
    }
    config.current_user = profile;
}

}  // namespace

core::errors::Result<EngineConfig> parse_engine_config(const std::string& json_text) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return TaskError{ErrorKind::Configuration, "Config is not valid JSON.",
                         "invalid_config_json"};
    }
    if (!doc.is_object()) {
        return TaskError{ErrorKind::Configuration, "Config must be a JSON object.",
                         "invalid_config_json"};
    }

    EngineConfig config;
    std::vector<std::string> problems;

    read_bounded_uint(doc, "max_retries", 0, 10, config.max_retries, problems);
    read_bounded_uint(doc, "max_steps", 1, 1000, config.max_steps, problems);
    read_bounded_uint(doc, "step_timeout_ms", 1, 600000, config.step_timeout_ms,
                      problems);
    read_bounded_uint(doc, "generation_timeout_ms", 1, 600000,
                      config.generation_timeout_ms, problems);
    read_bounded_uint(doc, "retrieval_top_k", 1, 100, config.retrieval_top_k,
                      problems);

    if (doc.contains("similarity_threshold")) {
        const auto& value = doc.at("similarity_threshold");
        if (!value.is_number()) {
            problems.push_back("similarity_threshold must be a number");
        } else {
            const double threshold = value.get<double>();
            if (threshold < 0.0 || threshold > 1.0) {
                problems.push_back("similarity_threshold must be between 0 and 1");
            } else {
                config.similarity_threshold = threshold;
            }
        }
    }

    if (doc.contains("reference_date")) {
        const auto& value = doc.at("reference_date");
        if (!value.is_string() ||
            !core::time::parse_iso_date(value.get<std::string>()).has_value()) {
            problems.push_back("reference_date must be a YYYY-MM-DD date");
        } else {
            config.reference_date = value.get<std::string>();
        }
    }

    read_user(doc, config, problems);

    if (!problems.empty()) {
        std::ostringstream message;
        message << "Config validation failed:";
        for (const auto& problem : problems) {
            message << "\n  - " << problem;
        }
        return TaskError{ErrorKind::Configuration, message.str(), "invalid_config"};
    }
    return config;
}

core::errors::Result<EngineConfig> load_engine_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return TaskError{ErrorKind::Configuration,
                         "Config file does not exist: " + path.string(),
                         "config_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return TaskError{ErrorKind::Configuration,
                         "Unable to open config file: " + path.string(),
                         "config_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_engine_config(buffer.str());
}

}  // namespace taskpilot::core::config
