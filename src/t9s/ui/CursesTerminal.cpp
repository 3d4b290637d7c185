#include <t9s/ui/CursesTerminal.hpp>

#include "log/TaggedLogger.hpp"

#include <curses.h>

#include <array>
#include <clocale>
#include <cstdio>

namespace T9::UI {

namespace {

constexpr int kEscape   = 27;
constexpr int kEscDelay = 25;

struct StyleColor {
    Style style;
    short foreground;
    short background;
    int   attributes;
};

constexpr std::array<StyleColor, 9> kStyleColors{{
        {Style::Normal, -1, -1, A_NORMAL},
        {Style::Dim, -1, -1, A_DIM},
        {Style::Header, COLOR_CYAN, -1, A_BOLD},
        {Style::Accent, COLOR_YELLOW, -1, A_BOLD},
        {Style::Selected, COLOR_BLACK, COLOR_CYAN, A_NORMAL},
        {Style::Error, COLOR_RED, -1, A_BOLD},
        {Style::Success, COLOR_GREEN, -1, A_NORMAL},
        {Style::Warning, COLOR_YELLOW, -1, A_NORMAL},
        {Style::Border, COLOR_BLUE, -1, A_NORMAL},
}};

auto style_attributes(Style style, bool colors) -> int {
    auto index = static_cast<std::size_t>(style);
    if (index >= kStyleColors.size()) {
        return A_NORMAL;
    }
    auto const& entry = kStyleColors[index];
    if (!colors) {
        return style == Style::Selected ? A_REVERSE : entry.attributes;
    }
    return entry.attributes | COLOR_PAIR(static_cast<int>(index) + 1);
}

auto special_key(int code) -> std::optional<KeyEvent> {
    switch (code) {
    case KEY_UP:
        return KeyEvent::Special(KeyCode::Up);
    case KEY_DOWN:
        return KeyEvent::Special(KeyCode::Down);
    case KEY_LEFT:
        return KeyEvent::Special(KeyCode::Left);
    case KEY_RIGHT:
        return KeyEvent::Special(KeyCode::Right);
    case KEY_PPAGE:
        return KeyEvent::Special(KeyCode::PageUp);
    case KEY_NPAGE:
        return KeyEvent::Special(KeyCode::PageDown);
    case KEY_HOME:
        return KeyEvent::Special(KeyCode::Home);
    case KEY_END:
        return KeyEvent::Special(KeyCode::End);
    case KEY_BTAB:
        return KeyEvent::Special(KeyCode::BackTab);
    case KEY_BACKSPACE:
        return KeyEvent::Special(KeyCode::Backspace);
    case KEY_ENTER:
        return KeyEvent::Special(KeyCode::Enter);
    default:
        break;
    }
    return KeyFromControlCode(code);
}

} // namespace

struct CursesTerminal::Screen {
    SCREEN* handle = nullptr;
    bool    colors = false;
};

auto CursesTerminal::Create() -> Expected<std::unique_ptr<CursesTerminal>> {
    std::setlocale(LC_ALL, "");
    auto screen    = std::make_unique<Screen>();
    screen->handle = newterm(nullptr, stdout, stdin);
    if (screen->handle == nullptr) {
        return std::unexpected(Error{Error::Code::Unavailable, "cannot initialize the terminal"});
    }
    set_term(screen->handle);
    raw();
    noecho();
    nonl();
    keypad(stdscr, TRUE);
    set_escdelay(kEscDelay);
    curs_set(0);

    if (has_colors() == TRUE && start_color() == OK) {
        use_default_colors();
        for (std::size_t i = 0; i < kStyleColors.size(); ++i) {
            init_pair(static_cast<short>(i + 1), kStyleColors[i].foreground, kStyleColors[i].background);
        }
        screen->colors = true;
    }
    t9_log("terminal ready", "CursesTerminal");
    return std::unique_ptr<CursesTerminal>(new CursesTerminal(std::move(screen)));
}

CursesTerminal::CursesTerminal(std::unique_ptr<Screen> screen)
    : screen_(std::move(screen)) {}

CursesTerminal::~CursesTerminal() {
    if (screen_ && screen_->handle != nullptr) {
        endwin();
        delscreen(screen_->handle);
    }
}

auto CursesTerminal::size() const -> TerminalSize {
    int rows    = 0;
    int columns = 0;
    getmaxyx(stdscr, rows, columns);
    return TerminalSize{columns, rows};
}

auto CursesTerminal::draw(Frame const& frame) -> void {
    werase(stdscr);
    int row = 0;
    for (auto const& line : frame.lines) {
        if (row >= frame.height) {
            break;
        }
        wmove(stdscr, row, 0);
        for (auto const& span : line.spans) {
            auto attributes = style_attributes(span.style, screen_->colors);
            wattron(stdscr, attributes);
            waddnstr(stdscr, span.text.c_str(), static_cast<int>(span.text.size()));
            wattroff(stdscr, attributes);
        }
        ++row;
    }
    if (frame.cursor) {
        curs_set(1);
        wmove(stdscr, frame.cursor->row, frame.cursor->column);
    } else {
        curs_set(0);
    }
    wnoutrefresh(stdscr);
    doupdate();
}

auto CursesTerminal::poll(std::chrono::milliseconds timeout) -> std::optional<TerminalEvent> {
    wtimeout(stdscr, static_cast<int>(timeout.count()));
    int code = wgetch(stdscr);
    if (code == ERR) {
        return std::nullopt;
    }
    if (code == KEY_RESIZE) {
        return TerminalEvent{ResizeEvent{}};
    }
    if (code == kEscape) {
        // ESC followed at once by a key is alt+key.
        wtimeout(stdscr, 0);
        int next = wgetch(stdscr);
        if (next != ERR) {
            if (auto key = special_key(next)) {
                key->alt = true;
                return TerminalEvent{*key};
            }
        }
        return TerminalEvent{KeyEvent::Special(KeyCode::Escape)};
    }
    if (auto key = special_key(code)) {
        return TerminalEvent{*key};
    }
    return std::nullopt;
}

} // namespace T9::UI
