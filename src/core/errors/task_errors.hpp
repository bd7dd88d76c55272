#pragma once
#include <string>
#include <variant>

namespace taskpilot::core::errors {

    // 1. Define typed error kinds
    enum class ErrorKind {
        Input,                      // E.g., an invalid CLI flag or empty request
        Configuration,              // E.g., a bad config file or a dependency cycle
        ParameterInvalid,           // E.g., a malformed date; repairable
        EntityNotFound,             // E.g., no employee with that name
        DependencyUnsatisfiable,    // No tool can supply a required parameter
        PreconditionFailed,         // A prerequisite step did not supply its value
        Transient,                  // E.g., a timeout or an empty model reply
        ExternalMutationUncertain,  // A state-changing call may have partially applied
        InternalFault               // Registry or resolver invariant violation
    };

    // The standardized error payload
    struct TaskError {
            ErrorKind kind;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
            std::string parameter = "";     // Offending argument, when there is one
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a TaskError.
    template <typename T>
    using Result = std::variant<T, TaskError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<TaskError>(result);
    }

    template <typename T>
    const TaskError& get_error(const Result<T>& result) {
        return std::get<TaskError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // 3. Retry classification
    // Only these kinds may be retried; the executor still checks the tool's effect.
    inline bool is_retryable(const ErrorKind kind) {
        return kind == ErrorKind::ParameterInvalid || kind == ErrorKind::Transient;
    }

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Input: return "input";
            case ErrorKind::Configuration: return "configuration";
            case ErrorKind::ParameterInvalid: return "parameter_invalid";
            case ErrorKind::EntityNotFound: return "entity_not_found";
            case ErrorKind::DependencyUnsatisfiable: return "dependency_unsatisfiable";
            case ErrorKind::PreconditionFailed: return "precondition_failed";
            case ErrorKind::Transient: return "transient";
            case ErrorKind::ExternalMutationUncertain: return "external_mutation_uncertain";
            case ErrorKind::InternalFault: return "internal_fault";
            default: return "unknown";
        }
    }

    // Plain-language reason shown to end users instead of raw messages.
    inline std::string plain_reason(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Input:
                return "the request could not be understood";
            case ErrorKind::Configuration:
                return "the assistant is not configured to handle this request";
            case ErrorKind::ParameterInvalid:
                return "some of the details given were not in a usable form";
            case ErrorKind::EntityNotFound:
                return "the requested record could not be found";
            case ErrorKind::DependencyUnsatisfiable:
                return "no available tool can supply the information this needs";
            case ErrorKind::PreconditionFailed:
                return "something it needed was not available";
            case ErrorKind::Transient:
                return "a service did not respond in time";
            case ErrorKind::ExternalMutationUncertain:
                return "the change may have been partially applied and needs a manual check";
            case ErrorKind::InternalFault:
                return "an internal error occurred";
            default:
                return "an unknown problem occurred";
        }
    }

    // What the CLI prints for a request that ended in `error`. Faults and
    // configuration problems carry internal detail, so only the reason is shown.
    inline std::string user_message(const TaskError& error) {
        if (error.kind == ErrorKind::InternalFault || error.kind == ErrorKind::Configuration ||
            error.message.empty()) {
            return "Sorry, your request could not be completed: " + plain_reason(error.kind) +
                   ".";
        }
        return error.message;
    }

} // namespace taskpilot::core::errors
