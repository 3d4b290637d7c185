#pragma once
#include <t9s/input/KeyEvent.hpp>
#include <t9s/ui/Frame.hpp>

#include <chrono>
#include <optional>
#include <variant>

namespace T9::UI {

struct ResizeEvent {
    bool operator==(ResizeEvent const&) const = default;
};

using TerminalEvent = std::variant<KeyEvent, ResizeEvent>;

struct TerminalSize {
    int columns = 80;
    int rows    = 24;

    bool operator==(TerminalSize const&) const = default;
};

class Terminal {
public:
    virtual ~Terminal() = default;

    [[nodiscard]] virtual auto size() const -> TerminalSize = 0;
    virtual auto draw(Frame const& frame) -> void = 0;
    // Waits at most timeout for input; nullopt when nothing arrived.
    virtual auto poll(std::chrono::milliseconds timeout) -> std::optional<TerminalEvent> = 0;
};

// Maps a single-byte terminal code to a key. Codes 1 to 26 are ctrl+letter
// except the ones terminals use for Tab, Enter and Backspace.
[[nodiscard]] auto KeyFromControlCode(int code) -> std::optional<KeyEvent>;

} // namespace T9::UI
