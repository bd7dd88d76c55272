#pragma once

#include <cstddef>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/task_errors.hpp"
#include "protocol/task_request.hpp"

namespace taskpilot::session {

enum class RequestState {
    Created,
    Running,
    Completed,
    Rejected,
    Failed,
    Cancelled
};

struct RequestRecord {
    std::string request_id;
    protocol::TaskRequest request;
    RequestState state = RequestState::Created;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

class RequestManager {
public:
    core::errors::Result<std::string> start_request(const protocol::TaskRequest& request);
    core::errors::Result<RequestState> cancel_request(const std::string& request_id);
    core::errors::Result<RequestState> get_request_state(const std::string& request_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& request_id) const;

    core::errors::Result<RequestState> mark_completed(const std::string& request_id);
    core::errors::Result<RequestState> mark_rejected(const std::string& request_id,
                                                     const std::string& reason);
    core::errors::Result<RequestState> mark_failed(const std::string& request_id,
                                                   const std::string& reason);

    std::size_t request_count() const;

    static std::string to_string(RequestState state);

private:
    core::errors::Result<RequestState> transition_to_terminal(
        const std::string& request_id, RequestState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RequestState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestRecord> requests_;
};

}  // namespace taskpilot::session
