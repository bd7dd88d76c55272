#include "session/request_manager.hpp"
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

namespace taskpilot::session {

using core::errors::ErrorKind;
using core::errors::TaskError;
using protocol::TaskRequest;

bool RequestManager::is_terminal(const RequestState state) {
    return state == RequestState::Completed || state == RequestState::Rejected ||
           state == RequestState::Failed || state == RequestState::Cancelled;
}

std::string RequestManager::to_string(const RequestState state) {
    switch (state) {
        case RequestState::Created:
            return "created";
        case RequestState::Running:
            return "running";
        case RequestState::Completed:
            return "completed";
        case RequestState::Rejected:
            return "rejected";
        case RequestState::Failed:
            return "failed";
        case RequestState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<std::string> RequestManager::start_request(const TaskRequest& request) {
    if (core::text::trim(request.request_text).empty()) {
        return TaskError{ErrorKind::Input, "Request text cannot be empty.",
                         "invalid_task_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string request_id = core::config::generate_request_id();
        if (requests_.find(request_id) != requests_.end()) {
            continue;
        }

        RequestRecord record;
        record.request_id = request_id;
        record.request = request;
        record.state = RequestState::Created;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        requests_.emplace(request_id, std::move(record));
        LOG_INFO("RequestManager: request " + request_id + " transition created -> running");
        requests_[request_id].state = RequestState::Running;
        return request_id;
    }

    return TaskError{ErrorKind::InternalFault, "Unable to allocate unique request ID.",
                     "request_id_generation_failed"};
}

core::errors::Result<RequestState> RequestManager::cancel_request(
    const std::string& request_id) {
    auto token = get_cancel_token(request_id);
    if (!core::errors::is_error(token)) {
        core::errors::get_value(token)->store(true);
    }
    return transition_to_terminal(request_id, RequestState::Cancelled, std::nullopt);
}

core::errors::Result<RequestState> RequestManager::mark_completed(
    const std::string& request_id) {
    return transition_to_terminal(request_id, RequestState::Completed, std::nullopt);
}

core::errors::Result<RequestState> RequestManager::mark_rejected(
    const std::string& request_id, const std::string& reason) {
    return transition_to_terminal(request_id, RequestState::Rejected, reason);
}

core::errors::Result<RequestState> RequestManager::mark_failed(
    const std::string& request_id, const std::string& reason) {
    return transition_to_terminal(request_id, RequestState::Failed, reason);
}

core::errors::Result<RequestState> RequestManager::transition_to_terminal(
    const std::string& request_id, const RequestState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return TaskError{ErrorKind::Input, "Request ID not found: " + request_id,
                         "request_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return TaskError{ErrorKind::Input,
                         "Request is already terminal: " + to_string(it->second.state),
                         "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    LOG_INFO("RequestManager: request " + request_id + " transition " + prev + " -> " +
             to_string(next_state));
    return it->second.state;
}

core::errors::Result<RequestState> RequestManager::get_request_state(
    const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return TaskError{ErrorKind::Input, "Request ID not found: " + request_id,
                         "request_not_found"};
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RequestManager::get_cancel_token(
    const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return TaskError{ErrorKind::Input, "Request ID not found: " + request_id,
                         "request_not_found"};
    }
    return it->second.cancel_token;
}

std::size_t RequestManager::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

}  // namespace taskpilot::session
