#pragma once
#include <t9s/core/Error.hpp>
#include <t9s/ui/Terminal.hpp>

#include <memory>

namespace T9::UI {

// ncurses-backed terminal. Only one may exist at a time; the destructor
// restores the terminal.
class CursesTerminal final : public Terminal {
public:
    [[nodiscard]] static auto Create() -> Expected<std::unique_ptr<CursesTerminal>>;

    ~CursesTerminal() override;

    CursesTerminal(CursesTerminal const&)                    = delete;
    auto operator=(CursesTerminal const&) -> CursesTerminal& = delete;

    [[nodiscard]] auto size() const -> TerminalSize override;
    auto draw(Frame const& frame) -> void override;
    auto poll(std::chrono::milliseconds timeout) -> std::optional<TerminalEvent> override;

private:
    struct Screen;

    explicit CursesTerminal(std::unique_ptr<Screen> screen);

    std::unique_ptr<Screen> screen_;
};

} // namespace T9::UI
