#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/task_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace taskpilot::collab {

// Passed to every external call. Collaborators should give up once the
// deadline passes or the token is set; the executor stops waiting at the
// deadline either way.
struct CallContext {
    std::chrono::milliseconds timeout{5000};
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::time_point::max();
    std::shared_ptr<std::atomic_bool> cancel_token;

    bool cancelled() const { return cancel_token && cancel_token->load(); }
    bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
};

constexpr const char* kCancelledCode = "cancelled";
constexpr const char* kDeadlineCode = "deadline_exceeded";

// Checked before a collaborator does any work. A refusal means nothing changed.
inline std::optional<core::errors::TaskError> refuse_call(const CallContext& context) {
    if (context.cancelled()) {
        return core::errors::TaskError{core::errors::ErrorKind::Transient,
                                       "Request was cancelled.", kCancelledCode};
    }
    if (context.expired()) {
        return core::errors::TaskError{core::errors::ErrorKind::Transient,
                                       "Call deadline passed before it started.",
                                       kDeadlineCode};
    }
    return std::nullopt;
}

inline bool was_refused(const core::errors::TaskError& error) {
    return error.kind == core::errors::ErrorKind::Transient &&
           (error.code == kCancelledCode || error.code == kDeadlineCode);
}

struct Passage {
    std::string text;
    std::string origin_id;
    double score = 0.0;
};

class Retriever {
public:
    virtual ~Retriever() = default;

    virtual core::errors::Result<std::vector<Passage>> search(
        const std::string& query, std::size_t top_k, double similarity_threshold,
        const CallContext& context) = 0;
};

class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    virtual core::errors::Result<std::string> generate(
        const protocol::PromptContext& prompt, const CallContext& context) = 0;
};

// Structured-data backend serving one or more tools by name.
class DataService {
public:
    virtual ~DataService() = default;

    virtual core::errors::Result<protocol::ToolOutput> invoke(
        const std::string& tool_name, const nlohmann::json& arguments,
        const CallContext& context) = 0;
};

}  // namespace taskpilot::collab
