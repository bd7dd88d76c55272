#pragma once
#include "protocol/task_request.hpp"
#include "core/errors/task_errors.hpp"

namespace taskpilot::app::cli {
    taskpilot::core::errors::Result<taskpilot::protocol::TaskRequest> parse_and_validate(int argc, char* argv[]);
}
