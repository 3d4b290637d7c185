#pragma once
#include <t9s/app/Effect.hpp>
#include <t9s/core/Error.hpp>
#include <t9s/input/KeyEvent.hpp>
#include <t9s/nav/Location.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace T9 {

enum class ConnectionStatus : std::uint8_t {
    Unknown = 0,
    Connected,
    Disconnected
};

struct Navigate {
    Location location;
};

struct Back {};

struct KeyPressed {
    KeyAction action;
};

// Replaces the buffer of the open text overlay.
struct TextEdited {
    std::string text;
};

struct SubmitCommand {
    std::string text;
};

struct DataLoaded {
    LoadRequest request;
    LoadPayload payload;
};

struct DataLoadFailed {
    LoadRequest request;
    Error       error;
};

// target is filled in from the focused row or detail view when absent.
struct InvokeOperation {
    KindId                         kind{KindId::WorkflowExecution};
    OperationId                    op{OperationId::CancelWorkflow};
    std::optional<OperationTarget> target;
};

struct OperationConfirmed {};
struct OperationCancelled {};

struct OperationSucceeded {
    RunOperation request;
};

struct OperationFailed {
    RunOperation request;
    Error        error;
};

struct PollTick {};

struct TimerElapsed {
    TimerId       timer{TimerId::Toast};
    std::uint64_t generation{0};
};

struct ConnectionChanged {
    ConnectionStatus     status{ConnectionStatus::Unknown};
    std::optional<Error> error;
};

struct SetPollingEnabled {
    bool enabled = true;
};

struct SwitchNamespace {
    std::string ns;
};

using Action = std::variant<Navigate,
                            Back,
                            KeyPressed,
                            TextEdited,
                            SubmitCommand,
                            DataLoaded,
                            DataLoadFailed,
                            InvokeOperation,
                            OperationConfirmed,
                            OperationCancelled,
                            OperationSucceeded,
                            OperationFailed,
                            PollTick,
                            TimerElapsed,
                            ConnectionChanged,
                            SetPollingEnabled,
                            SwitchNamespace>;

[[nodiscard]] auto actionName(Action const& action) -> std::string_view;

} // namespace T9
