#include <t9s/ui/Terminal.hpp>

namespace T9::UI {

auto KeyFromControlCode(int code) -> std::optional<KeyEvent> {
    switch (code) {
    case '\t':
        return KeyEvent::Special(KeyCode::Tab);
    case '\n':
    case '\r':
        return KeyEvent::Special(KeyCode::Enter);
    case 8:
    case 127:
        return KeyEvent::Special(KeyCode::Backspace);
    case 27:
        return KeyEvent::Special(KeyCode::Escape);
    default:
        break;
    }
    if (code >= 1 && code <= 26) {
        return KeyEvent::Ctrl(static_cast<char>('a' + code - 1));
    }
    if (code >= 32 && code < 127) {
        return KeyEvent::Char(static_cast<char>(code));
    }
    return std::nullopt;
}

} // namespace T9::UI
