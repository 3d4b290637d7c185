#pragma once
#include <t9s/kinds/KindId.hpp>

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace T9 {

enum class KeyCode : std::uint8_t {
    Char = 0,
    Enter,
    Escape,
    Tab,
    BackTab,
    Backspace,
    Up,
    Down,
    Left,
    Right,
    PageUp,
    PageDown,
    Home,
    End
};

struct KeyEvent {
    KeyCode code  = KeyCode::Char;
    char    ch    = 0;
    bool    ctrl  = false;
    bool    shift = false;
    bool    alt   = false;

    static auto Char(char c) -> KeyEvent {
        return KeyEvent{KeyCode::Char, c, false, std::isupper(static_cast<unsigned char>(c)) != 0, false};
    }
    static auto Ctrl(char c) -> KeyEvent { return KeyEvent{KeyCode::Char, c, true, false, false}; }
    static auto Special(KeyCode code) -> KeyEvent { return KeyEvent{code, 0, false, false, false}; }

    bool operator==(KeyEvent const&) const = default;
};

/**
 * A bindable key. Modifier matching is exact with two exceptions:
 *  - a binding without shift still matches a shifted event when the key is not
 *    an ASCII letter, so '?' or ':' typed with shift held resolve normally;
 *  - a binding without ctrl never matches a ctrl-modified event. Ctrl bindings
 *    have to be declared explicitly (ctrl+c quit is one).
 */
struct KeyBinding {
    KeyCode code  = KeyCode::Char;
    char    ch    = 0;
    bool    ctrl  = false;
    bool    shift = false;
    bool    alt   = false;

    static auto Char(char c) -> KeyBinding {
        return KeyBinding{KeyCode::Char, c, false, std::isupper(static_cast<unsigned char>(c)) != 0, false};
    }
    static auto Ctrl(char c) -> KeyBinding { return KeyBinding{KeyCode::Char, c, true, false, false}; }
    static auto Special(KeyCode code) -> KeyBinding { return KeyBinding{code, 0, false, false, false}; }

    [[nodiscard]] auto matches(KeyEvent const& event) const -> bool;
    [[nodiscard]] auto label() const -> std::string;

    bool operator==(KeyBinding const&) const = default;
};

enum class KeyCommand : std::uint8_t {
    Quit = 0,
    ToggleHelp,
    OpenCommandPalette,
    OpenCommandInput,
    OpenSearch,
    OpenNamespaceSelector,
    Refresh,
    SwitchToWorkflows,
    SwitchToSchedules,
    MoveUp,
    MoveDown,
    MoveToTop,
    MoveToBottom,
    PageUp,
    PageDown,
    Select,
    Back,
    NextTab,
    PrevTab,
    ViewActivities,
    ViewScheduleWorkflows,
    Confirm,
    Cancel,
    InvokeOperation,
    TextInsert,
    TextBackspace,
    TextComplete,
    TextSubmit
};

[[nodiscard]] auto keyCommandName(KeyCommand command) -> std::string_view;

struct KeyAction {
    KeyCommand                 command = KeyCommand::Quit;
    std::optional<OperationId> operation;
    std::string                text;

    static auto Of(KeyCommand command) -> KeyAction { return KeyAction{command, std::nullopt, {}}; }
    static auto Operation(OperationId op) -> KeyAction { return KeyAction{KeyCommand::InvokeOperation, op, {}}; }
    static auto Insert(std::string text) -> KeyAction { return KeyAction{KeyCommand::TextInsert, std::nullopt, std::move(text)}; }

    bool operator==(KeyAction const&) const = default;
};

enum class KeyContext : std::uint8_t {
    WorkflowList = 0,
    WorkflowDetail,
    ScheduleList,
    ScheduleDetail,
    ActivityList,
    ActivityDetail,
    TaskQueueDetail,
    Help,
    Confirm,
    CommandPalette,
    NamespaceSelector,
    TextEntry
};

[[nodiscard]] constexpr auto isOverlayContext(KeyContext context) -> bool {
    return context == KeyContext::Help || context == KeyContext::Confirm || context == KeyContext::CommandPalette
           || context == KeyContext::NamespaceSelector || context == KeyContext::TextEntry;
}

} // namespace T9
