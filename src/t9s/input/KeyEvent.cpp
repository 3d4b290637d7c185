#include <t9s/input/KeyEvent.hpp>

namespace T9 {

namespace {

auto is_ascii_letter(char ch) -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

auto special_label(KeyCode code) -> std::string_view {
    switch (code) {
    case KeyCode::Enter:
        return "enter";
    case KeyCode::Escape:
        return "esc";
    case KeyCode::Tab:
        return "tab";
    case KeyCode::BackTab:
        return "shift+tab";
    case KeyCode::Backspace:
        return "backspace";
    case KeyCode::Up:
        return "up";
    case KeyCode::Down:
        return "down";
    case KeyCode::Left:
        return "left";
    case KeyCode::Right:
        return "right";
    case KeyCode::PageUp:
        return "pgup";
    case KeyCode::PageDown:
        return "pgdn";
    case KeyCode::Home:
        return "home";
    case KeyCode::End:
        return "end";
    case KeyCode::Char:
        break;
    }
    return "";
}

} // namespace

auto KeyBinding::matches(KeyEvent const& event) const -> bool {
    if (event.code != code) {
        return false;
    }
    if (code == KeyCode::Char && event.ch != ch) {
        return false;
    }
    if (event.ctrl != ctrl || event.alt != alt) {
        return false;
    }
    if (shift) {
        return event.shift;
    }
    if (event.shift) {
        return code != KeyCode::Char || !is_ascii_letter(event.ch);
    }
    return true;
}

auto KeyBinding::label() const -> std::string {
    std::string text;
    if (ctrl) {
        text += "ctrl+";
    }
    if (alt) {
        text += "alt+";
    }
    if (code == KeyCode::Char) {
        text.push_back(ch);
    } else {
        text += special_label(code);
    }
    return text;
}

auto keyCommandName(KeyCommand command) -> std::string_view {
    switch (command) {
    case KeyCommand::Quit:
        return "quit";
    case KeyCommand::ToggleHelp:
        return "help";
    case KeyCommand::OpenCommandPalette:
        return "command-palette";
    case KeyCommand::OpenCommandInput:
        return "command";
    case KeyCommand::OpenSearch:
        return "search";
    case KeyCommand::OpenNamespaceSelector:
        return "namespaces";
    case KeyCommand::Refresh:
        return "refresh";
    case KeyCommand::SwitchToWorkflows:
        return "workflows";
    case KeyCommand::SwitchToSchedules:
        return "schedules";
    case KeyCommand::MoveUp:
        return "up";
    case KeyCommand::MoveDown:
        return "down";
    case KeyCommand::MoveToTop:
        return "top";
    case KeyCommand::MoveToBottom:
        return "bottom";
    case KeyCommand::PageUp:
        return "page-up";
    case KeyCommand::PageDown:
        return "page-down";
    case KeyCommand::Select:
        return "select";
    case KeyCommand::Back:
        return "back";
    case KeyCommand::NextTab:
        return "next-tab";
    case KeyCommand::PrevTab:
        return "prev-tab";
    case KeyCommand::ViewActivities:
        return "activities";
    case KeyCommand::ViewScheduleWorkflows:
        return "schedule-workflows";
    case KeyCommand::Confirm:
        return "confirm";
    case KeyCommand::Cancel:
        return "cancel";
    case KeyCommand::InvokeOperation:
        return "operation";
    case KeyCommand::TextInsert:
        return "insert";
    case KeyCommand::TextBackspace:
        return "backspace";
    case KeyCommand::TextComplete:
        return "complete";
    case KeyCommand::TextSubmit:
        return "submit";
    }
    return "unknown";
}

} // namespace T9
