#pragma once
#include <t9s/input/Keymap.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace T9 {

struct AppState;
class KindRegistry;

namespace UI {

enum class Style : std::uint8_t {
    Normal = 0,
    Dim,
    Header,
    Accent,
    Selected,
    Error,
    Success,
    Warning,
    Border
};

struct Span {
    std::string text;
    Style       style = Style::Normal;

    bool operator==(Span const&) const = default;
};

// One terminal row; spans are laid out left to right and never exceed the
// frame width.
struct Line {
    std::vector<Span> spans;

    [[nodiscard]] auto text() const -> std::string;

    bool operator==(Line const&) const = default;
};

struct Cursor {
    int row    = 0;
    int column = 0;

    bool operator==(Cursor const&) const = default;
};

struct Frame {
    int                   width  = 0;
    int                   height = 0;
    std::vector<Line>     lines;
    std::optional<Cursor> cursor;

    [[nodiscard]] auto text() const -> std::string;
};

// Display width in columns; every code point counts as one.
[[nodiscard]] auto DisplayWidth(std::string_view text) -> std::size_t;
// Truncates to width columns (ending in '~' when cut) and pads with spaces.
[[nodiscard]] auto FitText(std::string_view text, std::size_t width) -> std::string;

/**
 * Renders one AppState snapshot into rows of styled text.
 *
 * Layout top to bottom: the kind tabs with namespace and connection, the
 * breadcrumbs, the view body (a table for collections, tabbed lines for
 * details), and a status line that shows the toast, the text being typed or
 * key hints. Modal overlays are drawn as a centered box over the body.
 */
[[nodiscard]] auto BuildFrame(AppState const& state, KindRegistry const& registry, Keymap const& keymap, int width, int height)
    -> Frame;

} // namespace UI
} // namespace T9
