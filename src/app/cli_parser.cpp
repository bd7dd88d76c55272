#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>
#include "core/text/text_utils.hpp"

namespace taskpilot::app::cli {

    using namespace taskpilot::core::errors;
    using taskpilot::protocol::TaskRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> request;
        std::optional<std::string> config;
        std::optional<std::string> max_steps;
        std::optional<std::string> max_retries;
        std::optional<std::string> user;
        std::optional<std::string> trace_dir;
        bool verbose = false;
    };

    namespace {

        // Exception-free integer parsing with inclusive bounds
        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint32_t min, std::uint32_t max) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return TaskError{ErrorKind::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            if (value < min || value > max) {
                return TaskError{ErrorKind::Input, flag + " out of bounds", "bounds_error",
                                 "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

    } // namespace

    Result<TaskRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return TaskError{ErrorKind::Input, "No command provided.", "missing_command", "Usage: taskpilot ask --request \"...\""};
        }

        std::string command = argv[1];
        if (command != "ask") {
            return TaskError{ErrorKind::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'ask' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'ask' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--request") {
                if (i + 1 < args.size()) raw.request = args[++i];
                else return TaskError{ErrorKind::Input, "Missing value for --request", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return TaskError{ErrorKind::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--max-steps") {
                if (i + 1 < args.size()) raw.max_steps = args[++i];
                else return TaskError{ErrorKind::Input, "Missing value for --max-steps", "missing_value"};
            } else if (args[i] == "--max-retries") {
                if (i + 1 < args.size()) raw.max_retries = args[++i];
                else return TaskError{ErrorKind::Input, "Missing value for --max-retries", "missing_value"};
            } else if (args[i] == "--user") {
                if (i + 1 < args.size()) raw.user = args[++i];
                else return TaskError{ErrorKind::Input, "Missing value for --user", "missing_value"};
            } else if (args[i] == "--trace-dir") {
                if (i + 1 < args.size()) raw.trace_dir = args[++i];
                else return TaskError{ErrorKind::Input, "Missing value for --trace-dir", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return TaskError{ErrorKind::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        TaskRequest req;
        req.verbose = raw.verbose;

        if (!raw.request.has_value()) {
            return TaskError{ErrorKind::Input, "Must provide --request", "missing_required_flag"};
        }
        req.request_text = taskpilot::core::text::trim(raw.request.value());
        if (req.request_text.empty()) {
            return TaskError{ErrorKind::Input, "--request cannot be empty", "empty_request", "Describe what you need in plain words."};
        }

        if (raw.max_steps) {
            auto steps = parse_bounded("--max-steps", raw.max_steps.value(), 1, 1000);
            if (is_error(steps)) return get_error(steps);
            req.max_steps = get_value(steps);
        }
        if (raw.max_retries) {
            auto retries = parse_bounded("--max-retries", raw.max_retries.value(), 0, 10);
            if (is_error(retries)) return get_error(retries);
            req.max_retries = get_value(retries);
        }

        if (raw.user) {
            const std::string user = taskpilot::core::text::uppercase(taskpilot::core::text::trim(raw.user.value()));
            if (user.empty()) {
                return TaskError{ErrorKind::Input, "--user cannot be empty", "invalid_user", "Provide an employee id such as E001."};
            }
            req.user_id = user;
        }

        // Path validation
        if (raw.config) {
            std::filesystem::path p(raw.config.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return TaskError{ErrorKind::Input, "Config file does not exist or is not a regular file", "invalid_path"};
            }

            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return TaskError{ErrorKind::Input, "Config file does not exist or is not a regular file", "invalid_path"};
            }
            req.config_file = std::move(p);
        }

        if (raw.trace_dir) {
            std::filesystem::path p(raw.trace_dir.value());
            if (p.empty()) {
                return TaskError{ErrorKind::Input, "--trace-dir cannot be empty", "invalid_path"};
            }
            std::error_code path_ec;
            if (std::filesystem::exists(p, path_ec) && !std::filesystem::is_directory(p, path_ec)) {
                return TaskError{ErrorKind::Input, "Trace path exists and is not a directory", "invalid_path"};
            }
            req.trace_dir = std::move(p);
        }

        return req;
    }

} // namespace taskpilot::app::cli
