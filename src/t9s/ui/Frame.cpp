#include <t9s/ui/Frame.hpp>

#include <t9s/app/AppState.hpp>
#include <t9s/app/Palette.hpp>
#include <t9s/input/Commands.hpp>
#include <t9s/kinds/KindRegistry.hpp>
#include <t9s/nav/Uri.hpp>
#include <t9s/poll/PollScheduler.hpp>

#include <algorithm>
#include <array>
#include <utility>
#include <variant>

namespace T9::UI {

namespace {

constexpr std::string_view kSeparator{" > "};
constexpr std::size_t      kColumnGap = 2;

auto is_continuation(unsigned char byte) -> bool {
    return (byte & 0xC0) == 0x80;
}

// Byte length of the first count code points.
auto prefix_bytes(std::string_view text, std::size_t count) -> std::size_t {
    std::size_t index = 0;
    while (index < text.size() && count > 0) {
        ++index;
        while (index < text.size() && is_continuation(static_cast<unsigned char>(text[index]))) {
            ++index;
        }
        --count;
    }
    return index;
}

class LineBuilder {
public:
    explicit LineBuilder(std::size_t width)
        : width_(width) {}

    auto add(std::string_view text, Style style = Style::Normal) -> LineBuilder& {
        if (used_ >= width_ || text.empty()) {
            return *this;
        }
        auto room  = width_ - used_;
        auto width = DisplayWidth(text);
        if (width > room) {
            text  = text.substr(0, prefix_bytes(text, room));
            width = room;
        }
        line_.spans.push_back(Span{std::string{text}, style});
        used_ += width;
        return *this;
    }

    auto pad_to(std::size_t column, Style style = Style::Normal) -> LineBuilder& {
        if (column > used_) {
            add(std::string(std::min(column, width_) - used_, ' '), style);
        }
        return *this;
    }

    // Places text flush with the right edge when it fits after what is there.
    auto right(std::string_view text, Style style) -> LineBuilder& {
        auto width = DisplayWidth(text);
        if (used_ + width + 1 <= width_) {
            pad_to(width_ - width);
            add(text, style);
        }
        return *this;
    }

    [[nodiscard]] auto used() const -> std::size_t { return used_; }
    [[nodiscard]] auto take() -> Line { return std::move(line_); }

private:
    std::size_t width_ = 0;
    std::size_t used_  = 0;
    Line        line_;
};

auto plain(std::string_view text, std::size_t width, Style style = Style::Normal) -> Line {
    LineBuilder builder{width};
    builder.add(text, style);
    return builder.take();
}

auto connection_label(AppState const& state) -> std::pair<std::string, Style> {
    switch (state.connection) {
    case ConnectionStatus::Connected:
        return {"connected", Style::Success};
    case ConnectionStatus::Disconnected:
        return {"disconnected", Style::Error};
    case ConnectionStatus::Unknown:
        break;
    }
    return {"connecting", Style::Warning};
}

auto header_line(AppState const& state, KindRegistry const& registry, std::size_t width) -> Line {
    LineBuilder builder{width};
    builder.add(" t9s ", Style::Accent);
    auto root = state.location.route.front().kind;
    for (auto kind : kAllKinds) {
        auto const& spec = registry.get(kind);
        if (!spec.root_addressable || !spec.collection) {
            continue;
        }
        builder.add(" ");
        builder.add(" " + spec.label + " ", kind == root ? Style::Selected : Style::Dim);
    }
    auto [label, style] = connection_label(state);
    builder.right("ns:" + state.location.ns + "  " + label + " ", style);
    return builder.take();
}

auto breadcrumb_line(AppState const& state, KindRegistry const& registry, std::size_t width) -> Line {
    LineBuilder builder{width};
    builder.add(" ");
    builder.add(state.location.ns, Style::Dim);
    for (auto const& crumb : DeriveBreadcrumbs(state.location, registry)) {
        builder.add(kSeparator, Style::Dim);
        builder.add(crumb.label, Style::Header);
    }
    if (auto filter = state.location.queryValue(kQueryFilter)) {
        builder.add("  filter: ", Style::Dim);
        builder.add(*filter, Style::Accent);
    }
    return builder.take();
}

// Column widths: fixed columns keep their width, width-0 columns share the rest.
auto layout_columns(std::vector<Column> const& columns, std::size_t width) -> std::vector<std::size_t> {
    std::vector<std::size_t> widths;
    std::size_t              fixed    = 0;
    std::size_t              flexible = 0;
    for (auto const& column : columns) {
        if (column.width > 0) {
            fixed += static_cast<std::size_t>(column.width);
        } else {
            ++flexible;
        }
    }
    auto gaps      = columns.empty() ? 0 : (columns.size() - 1) * kColumnGap + 1;
    auto remaining = width > fixed + gaps ? width - fixed - gaps : 0;
    for (auto const& column : columns) {
        if (column.width > 0) {
            widths.push_back(static_cast<std::size_t>(column.width));
        } else {
            widths.push_back(std::max<std::size_t>(remaining / std::max<std::size_t>(flexible, 1), 4));
        }
    }
    return widths;
}

auto table_row(std::vector<std::string> const& cells, std::vector<std::size_t> const& widths, std::size_t width, Style style)
    -> Line {
    LineBuilder builder{width};
    builder.add(" ", style);
    for (std::size_t i = 0; i < widths.size(); ++i) {
        auto cell = i < cells.size() ? std::string_view{cells[i]} : std::string_view{};
        builder.add(FitText(cell, widths[i]), style);
        if (i + 1 < widths.size()) {
            builder.add(std::string(kColumnGap, ' '), style);
        }
    }
    if (style == Style::Selected) {
        builder.pad_to(width, style);
    }
    return builder.take();
}

auto collection_body(AppState const& state, CollectionSpec const& spec, KindId kind, std::size_t width, std::size_t height)
    -> std::vector<Line> {
    std::vector<Line> body;
    if (height == 0) {
        return body;
    }
    auto const& slot   = state.collection(kind);
    auto        widths = layout_columns(spec.columns, width);

    std::vector<std::string> titles;
    for (auto const& column : spec.columns) {
        titles.push_back(column.title);
    }
    body.push_back(table_row(titles, widths, width, Style::Header));

    auto rows = spec.rows ? spec.rows(state) : std::vector<Row>{};
    if (rows.empty()) {
        if (slot.loading) {
            body.push_back(plain(" Loading...", width, Style::Dim));
        } else if (slot.error) {
            body.push_back(plain(" " + describeError(*slot.error), width, Style::Error));
        } else {
            body.push_back(plain(" " + spec.empty_label, width, Style::Dim));
        }
        return body;
    }

    auto visible = height > 2 ? height - 2 : 1;
    auto first   = slot.selection >= visible ? slot.selection - visible + 1 : 0;
    for (auto i = first; i < rows.size() && i < first + visible; ++i) {
        body.push_back(table_row(rows[i], widths, width, i == slot.selection ? Style::Selected : Style::Normal));
    }

    std::string footer = " " + std::to_string(std::min(slot.selection + 1, rows.size())) + "/" + std::to_string(rows.size());
    if (slot.next_page_token) {
        footer += " (more)";
    }
    if (slot.loading) {
        footer += "  loading";
    }
    if (slot.error) {
        footer += "  " + describeError(*slot.error);
    }
    body.push_back(plain(footer, width, slot.error ? Style::Error : Style::Dim));
    return body;
}

auto detail_body(AppState const& state, DetailSpec const& spec, std::size_t width, std::size_t height) -> std::vector<Line> {
    std::vector<Line> body;
    if (height == 0) {
        return body;
    }
    auto tab = spec.tabIndex(state.location.queryValue(kQueryTab));
    if (spec.tabs.size() > 1) {
        LineBuilder tabs{width};
        tabs.add(" ");
        for (std::size_t i = 0; i < spec.tabs.size(); ++i) {
            tabs.add(" " + spec.tabs[i].name + " ", i == tab ? Style::Selected : Style::Dim);
            tabs.add(" ");
        }
        body.push_back(tabs.take());
    }

    if (!state.detail.payload) {
        if (state.detail.error) {
            body.push_back(plain(" " + describeError(*state.detail.error), width, Style::Error));
        } else {
            body.push_back(plain(" Loading...", width, Style::Dim));
        }
        return body;
    }

    auto lines = spec.lines ? spec.lines(state, tab) : std::vector<std::string>{};
    if (state.detail.error) {
        body.push_back(plain(" " + describeError(*state.detail.error), width, Style::Error));
    }
    auto first = std::min(state.detail.scroll, lines.empty() ? 0 : lines.size() - 1);
    for (auto i = first; i < lines.size() && body.size() < height; ++i) {
        body.push_back(plain(" " + lines[i], width));
    }
    return body;
}

struct Box {
    std::string       title;
    std::vector<Line> lines;
};

// Draws box over rows [top, top + box height) of lines, centered horizontally.
auto overlay_box(std::vector<Line>& lines, Box const& box, std::size_t width, std::size_t top) -> void {
    std::size_t inner = 0;
    for (auto const& line : box.lines) {
        inner = std::max(inner, DisplayWidth(line.text()));
    }
    inner      = std::max(inner, DisplayWidth(box.title) + 2);
    inner      = std::min(inner + 2, width > 4 ? width - 4 : width);
    auto left  = (width - std::min(width, inner + 2)) / 2;
    auto place = [&](std::size_t row, Line content) {
        if (row >= lines.size()) {
            return;
        }
        LineBuilder builder{width};
        builder.add(std::string(left, ' '));
        for (auto& span : content.spans) {
            builder.add(span.text, span.style);
        }
        lines[row] = builder.take();
    };

    LineBuilder border{inner + 2};
    border.add("+-", Style::Border).add(box.title, Style::Header).add(std::string(inner, '-'), Style::Border);
    auto top_line = border.take();
    if (!top_line.spans.empty()) {
        top_line.spans.back().text.pop_back();
        top_line.spans.back().text.push_back('+');
    }
    place(top, std::move(top_line));

    std::size_t row = top + 1;
    for (auto const& line : box.lines) {
        LineBuilder framed{inner + 2};
        framed.add("|", Style::Border);
        for (auto const& span : line.spans) {
            framed.add(span.text, span.style);
        }
        framed.pad_to(inner + 1);
        framed.add("|", Style::Border);
        place(row++, framed.take());
    }
    place(row, plain("+" + std::string(inner, '-') + "+", inner + 2, Style::Border));
}

auto binding_line(std::string const& key, std::string const& description) -> Line {
    Line line;
    line.spans.push_back(Span{" " + FitText(key, 10), Style::Accent});
    line.spans.push_back(Span{description + " ", Style::Normal});
    return line;
}

auto help_box(AppState const& state, Keymap const& keymap, KindRegistry const& registry) -> Box {
    Box box{" Help ", {}};
    AppState underlying = state;
    underlying.overlay  = NoOverlay{};
    auto context        = KeyContextFor(underlying);

    for (auto const& binding : keymap.contextBindings(context)) {
        box.lines.push_back(binding_line(binding.key.label(), binding.description));
    }
    for (auto const* op : registry.operations_for(state.location.leaf().kind, underlying)) {
        if (op->key) {
            box.lines.push_back(binding_line(op->key->label(), op->label));
        }
    }
    for (auto const& sequence : keymap.sequences) {
        std::string keys;
        for (auto const& key : sequence.keys) {
            keys += key.label();
        }
        box.lines.push_back(binding_line(keys, sequence.description));
    }
    for (auto const& binding : keymap.navigation) {
        box.lines.push_back(binding_line(binding.key.label(), binding.description));
    }
    for (auto const& binding : keymap.global) {
        box.lines.push_back(binding_line(binding.key.label(), binding.description));
    }
    return box;
}

auto confirm_box(ConfirmOverlay const& confirm) -> Box {
    Box box{" Confirm ", {}};
    box.lines.push_back(Line{{Span{" " + confirm.pending.prompt + " ", Style::Warning}}});
    if (confirm.error) {
        box.lines.push_back(Line{{Span{" " + describeError(*confirm.error) + " ", Style::Error}}});
    }
    box.lines.push_back(Line{});
    box.lines.push_back(Line{{Span{" [y] ", Style::Accent}, Span{"confirm  "}, Span{"[n] ", Style::Accent}, Span{"cancel "}}});
    return box;
}

auto palette_box(AppState const& state, KindRegistry const& registry, CommandPaletteOverlay const& palette, std::size_t rows)
    -> Box {
    Box  box{" Commands ", {}};
    auto entries = PaletteEntries(state, registry);
    auto first   = palette.selection >= rows ? palette.selection - rows + 1 : 0;
    for (auto i = first; i < entries.size() && i < first + rows; ++i) {
        auto style = i == palette.selection ? Style::Selected : Style::Normal;
        Line line;
        line.spans.push_back(Span{" " + FitText(entries[i].label, 28), style});
        line.spans.push_back(Span{entries[i].hint + " ", i == palette.selection ? Style::Selected : Style::Dim});
        box.lines.push_back(std::move(line));
    }
    return box;
}

auto namespace_box(AppState const& state, NamespaceSelectorOverlay const& selector, std::size_t rows) -> Box {
    Box         box{" Namespaces ", {}};
    auto const& items = state.namespaces.items;
    if (items.empty()) {
        auto text = state.namespaces.loading ? std::string{" Loading... "}
                    : state.namespaces.error ? " " + describeError(*state.namespaces.error) + " "
                                             : std::string{" No namespaces "};
        box.lines.push_back(Line{{Span{text, state.namespaces.error ? Style::Error : Style::Dim}}});
        return box;
    }
    auto first = selector.selection >= rows ? selector.selection - rows + 1 : 0;
    for (auto i = first; i < items.size() && i < first + rows; ++i) {
        auto marker = items[i].name == state.location.ns ? "* " : "  ";
        auto style  = i == selector.selection ? Style::Selected : Style::Normal;
        box.lines.push_back(Line{{Span{" " + std::string{marker} + items[i].name + " ", style}}});
    }
    return box;
}

auto status_line(AppState const& state, std::size_t width, std::optional<Cursor>& cursor, int row) -> Line {
    LineBuilder builder{width};
    if (auto const* input = std::get_if<CommandInputOverlay>(&state.overlay)) {
        builder.add(":", Style::Accent).add(input->buffer);
        cursor = Cursor{row, static_cast<int>(builder.used())};
        auto first_word = std::string_view{input->buffer}.substr(0, input->buffer.find(' '));
        if (input->buffer.find(' ') == std::string::npos) {
            std::string hints;
            for (auto const& name : MatchingCommands(first_word)) {
                hints += name + " ";
            }
            builder.add("   ").add(hints, Style::Dim);
        }
        return builder.take();
    }
    if (auto const* search = std::get_if<SearchOverlay>(&state.overlay)) {
        builder.add("/", Style::Accent).add(search->buffer);
        cursor = Cursor{row, static_cast<int>(builder.used())};
        return builder.take();
    }
    if (state.toast) {
        builder.add(" " + state.toast->message, state.toast->is_error ? Style::Error : Style::Success);
        return builder.take();
    }

    builder.add(" ?", Style::Accent).add(" help  ", Style::Dim);
    builder.add(":", Style::Accent).add(" command  ", Style::Dim);
    builder.add("ctrl+p", Style::Accent).add(" palette  ", Style::Dim);
    builder.add("/", Style::Accent).add(" filter  ", Style::Dim);
    if (state.in_flight_operation) {
        builder.add(state.in_flight_operation->label + "... ", Style::Warning);
    }

    std::string polling;
    auto const& leaf  = state.location.leaf();
    auto const& count = state.workflow_count;
    if (leaf.isCollection() && leaf.kind == KindId::WorkflowExecution && count.total
        && count.requested == state.collection(KindId::WorkflowExecution).requested) {
        polling = "[" + std::to_string(*count.total) + " workflows]  ";
    }
    if (!state.polling.enabled) {
        polling += "polling paused";
    } else {
        polling += "polling " + std::to_string(EffectiveInterval(state.polling, state.error_count).count() / 1000) + "s";
        if (state.error_count > 0) {
            polling += " (" + std::to_string(state.error_count) + " errors)";
        }
    }
    builder.right(polling + " ", state.error_count > 0 ? Style::Warning : Style::Dim);
    return builder.take();
}

} // namespace

auto Line::text() const -> std::string {
    std::string out;
    for (auto const& span : spans) {
        out += span.text;
    }
    return out;
}

auto Frame::text() const -> std::string {
    std::string out;
    for (auto const& line : lines) {
        out += line.text();
        out.push_back('\n');
    }
    return out;
}

auto DisplayWidth(std::string_view text) -> std::size_t {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
        return !is_continuation(static_cast<unsigned char>(ch));
    }));
}

auto FitText(std::string_view text, std::size_t width) -> std::string {
    auto length = DisplayWidth(text);
    if (length <= width) {
        std::string out{text};
        out.append(width - length, ' ');
        return out;
    }
    if (width == 0) {
        return {};
    }
    std::string out{text.substr(0, prefix_bytes(text, width - 1))};
    out.push_back('~');
    return out;
}

auto BuildFrame(AppState const& state, KindRegistry const& registry, Keymap const& keymap, int width, int height) -> Frame {
    Frame frame;
    frame.width  = std::max(width, 0);
    frame.height = std::max(height, 0);
    if (frame.width == 0 || frame.height == 0) {
        return frame;
    }
    auto columns = static_cast<std::size_t>(frame.width);
    auto rows    = static_cast<std::size_t>(frame.height);

    std::vector<Line> lines;
    lines.push_back(header_line(state, registry, columns));
    if (rows > 2) {
        lines.push_back(breadcrumb_line(state, registry, columns));
    }

    auto        body_rows = rows > 3 ? rows - 3 : 0;
    auto const& leaf      = state.location.leaf();
    auto const& spec      = registry.get(leaf.kind);
    if (leaf.id && spec.detail) {
        auto body = detail_body(state, *spec.detail, columns, body_rows);
        lines.insert(lines.end(), body.begin(), body.end());
    } else if (spec.collection) {
        auto body = collection_body(state, *spec.collection, leaf.kind, columns, body_rows);
        lines.insert(lines.end(), body.begin(), body.end());
    }
    while (lines.size() < rows - 1) {
        lines.emplace_back();
    }
    lines.resize(rows - 1);

    auto box_rows = body_rows > 4 ? body_rows - 4 : 1;
    auto top      = std::min<std::size_t>(3, lines.size());
    if (std::holds_alternative<HelpOverlay>(state.overlay)) {
        auto box = help_box(state, keymap, registry);
        if (box.lines.size() > box_rows) {
            box.lines.resize(box_rows);
        }
        overlay_box(lines, box, columns, top);
    } else if (auto const* confirm = std::get_if<ConfirmOverlay>(&state.overlay)) {
        overlay_box(lines, confirm_box(*confirm), columns, top);
    } else if (auto const* palette = std::get_if<CommandPaletteOverlay>(&state.overlay)) {
        overlay_box(lines, palette_box(state, registry, *palette, box_rows), columns, top);
    } else if (auto const* selector = std::get_if<NamespaceSelectorOverlay>(&state.overlay)) {
        overlay_box(lines, namespace_box(state, *selector, box_rows), columns, top);
    }

    lines.push_back(status_line(state, columns, frame.cursor, frame.height - 1));
    frame.lines = std::move(lines);
    return frame;
}

} // namespace T9::UI
