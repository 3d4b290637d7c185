#include <t9s/input/Keymap.hpp>

#include <t9s/app/AppState.hpp>
#include <t9s/kinds/KindRegistry.hpp>

namespace T9 {

namespace {

auto bind(KeyBinding key, KeyCommand command, std::string description, bool reserved = false) -> Binding {
    return Binding{key, KeyAction::Of(command), std::move(description), reserved};
}

auto list_navigation() -> std::vector<Binding> {
    return {
        bind(KeyBinding::Char('j'), KeyCommand::MoveDown, "Move down"),
        bind(KeyBinding::Special(KeyCode::Down), KeyCommand::MoveDown, "Move down"),
        bind(KeyBinding::Char('k'), KeyCommand::MoveUp, "Move up"),
        bind(KeyBinding::Special(KeyCode::Up), KeyCommand::MoveUp, "Move up"),
        bind(KeyBinding::Special(KeyCode::Enter), KeyCommand::Select, "Select"),
        bind(KeyBinding::Special(KeyCode::Escape), KeyCommand::Back, "Close"),
    };
}

} // namespace

auto Keymap::contextBindings(KeyContext context) const -> std::vector<Binding> const& {
    static std::vector<Binding> const kEmpty;
    auto                              it = contexts.find(context);
    return it == contexts.end() ? kEmpty : it->second;
}

auto DefaultKeymap() -> Keymap {
    Keymap keymap;

    keymap.global = {
        bind(KeyBinding::Char('q'), KeyCommand::Quit, "Quit", true),
        bind(KeyBinding::Ctrl('c'), KeyCommand::Quit, "Quit", true),
        bind(KeyBinding::Char('?'), KeyCommand::ToggleHelp, "Help", true),
        bind(KeyBinding::Ctrl('p'), KeyCommand::OpenCommandPalette, "Command palette", true),
        bind(KeyBinding::Char(':'), KeyCommand::OpenCommandInput, "Command"),
        bind(KeyBinding::Char('/'), KeyCommand::OpenSearch, "Filter"),
        bind(KeyBinding::Ctrl('r'), KeyCommand::Refresh, "Refresh"),
        bind(KeyBinding::Char('1'), KeyCommand::SwitchToWorkflows, "Workflows"),
        bind(KeyBinding::Char('2'), KeyCommand::SwitchToSchedules, "Schedules"),
        bind(KeyBinding::Char('n'), KeyCommand::OpenNamespaceSelector, "Switch namespace"),
    };

    keymap.navigation = {
        bind(KeyBinding::Char('j'), KeyCommand::MoveDown, "Move down"),
        bind(KeyBinding::Special(KeyCode::Down), KeyCommand::MoveDown, "Move down"),
        bind(KeyBinding::Char('k'), KeyCommand::MoveUp, "Move up"),
        bind(KeyBinding::Special(KeyCode::Up), KeyCommand::MoveUp, "Move up"),
        bind(KeyBinding::Char('G'), KeyCommand::MoveToBottom, "Bottom"),
        bind(KeyBinding::Special(KeyCode::Home), KeyCommand::MoveToTop, "Top"),
        bind(KeyBinding::Special(KeyCode::End), KeyCommand::MoveToBottom, "Bottom"),
        bind(KeyBinding::Ctrl('d'), KeyCommand::PageDown, "Page down"),
        bind(KeyBinding::Ctrl('u'), KeyCommand::PageUp, "Page up"),
        bind(KeyBinding::Special(KeyCode::PageDown), KeyCommand::PageDown, "Page down"),
        bind(KeyBinding::Special(KeyCode::PageUp), KeyCommand::PageUp, "Page up"),
        bind(KeyBinding::Special(KeyCode::Enter), KeyCommand::Select, "Open"),
        bind(KeyBinding::Special(KeyCode::Escape), KeyCommand::Back, "Back"),
        bind(KeyBinding::Char('h'), KeyCommand::PrevTab, "Previous tab"),
        bind(KeyBinding::Special(KeyCode::Left), KeyCommand::PrevTab, "Previous tab"),
        bind(KeyBinding::Char('l'), KeyCommand::NextTab, "Next tab"),
        bind(KeyBinding::Special(KeyCode::Right), KeyCommand::NextTab, "Next tab"),
        bind(KeyBinding::Special(KeyCode::Tab), KeyCommand::NextTab, "Next tab"),
        bind(KeyBinding::Special(KeyCode::BackTab), KeyCommand::PrevTab, "Previous tab"),
    };

    keymap.sequences = {
        KeySequence{{KeyBinding::Char('g'), KeyBinding::Char('g')}, KeyAction::Of(KeyCommand::MoveToTop), "Top"},
    };

    keymap.contexts[KeyContext::WorkflowList]   = {bind(KeyBinding::Char('a'), KeyCommand::ViewActivities, "Pending activities")};
    keymap.contexts[KeyContext::WorkflowDetail] = {bind(KeyBinding::Char('a'), KeyCommand::ViewActivities, "Pending activities")};
    keymap.contexts[KeyContext::ScheduleList]   = {bind(KeyBinding::Char('w'), KeyCommand::ViewScheduleWorkflows, "Workflows of schedule")};
    keymap.contexts[KeyContext::ScheduleDetail] = {bind(KeyBinding::Char('w'), KeyCommand::ViewScheduleWorkflows, "Workflows of schedule")};

    keymap.contexts[KeyContext::Help] = {
        bind(KeyBinding::Char('?'), KeyCommand::Back, "Close help"),
        bind(KeyBinding::Char('q'), KeyCommand::Back, "Close help"),
        bind(KeyBinding::Special(KeyCode::Escape), KeyCommand::Back, "Close help"),
    };
    keymap.contexts[KeyContext::Confirm] = {
        bind(KeyBinding::Char('y'), KeyCommand::Confirm, "Confirm"),
        bind(KeyBinding::Special(KeyCode::Enter), KeyCommand::Confirm, "Confirm"),
        bind(KeyBinding::Char('n'), KeyCommand::Cancel, "Cancel"),
        bind(KeyBinding::Special(KeyCode::Escape), KeyCommand::Cancel, "Cancel"),
    };
    keymap.contexts[KeyContext::CommandPalette]    = list_navigation();
    keymap.contexts[KeyContext::NamespaceSelector] = list_navigation();
    keymap.contexts[KeyContext::TextEntry] = {
        bind(KeyBinding::Special(KeyCode::Escape), KeyCommand::Back, "Cancel"),
        bind(KeyBinding::Special(KeyCode::Enter), KeyCommand::TextSubmit, "Submit"),
        bind(KeyBinding::Special(KeyCode::Backspace), KeyCommand::TextBackspace, "Delete"),
        bind(KeyBinding::Special(KeyCode::Tab), KeyCommand::TextComplete, "Complete"),
    };
    return keymap;
}

auto KeyContextFor(AppState const& state) -> KeyContext {
    struct OverlayContext {
        std::optional<KeyContext> operator()(NoOverlay const&) const { return std::nullopt; }
        std::optional<KeyContext> operator()(HelpOverlay const&) const { return KeyContext::Help; }
        std::optional<KeyContext> operator()(ConfirmOverlay const&) const { return KeyContext::Confirm; }
        std::optional<KeyContext> operator()(CommandInputOverlay const&) const { return KeyContext::TextEntry; }
        std::optional<KeyContext> operator()(SearchOverlay const&) const { return KeyContext::TextEntry; }
        std::optional<KeyContext> operator()(CommandPaletteOverlay const&) const { return KeyContext::CommandPalette; }
        std::optional<KeyContext> operator()(NamespaceSelectorOverlay const&) const { return KeyContext::NamespaceSelector; }
    };
    if (auto overlay = std::visit(OverlayContext{}, state.overlay)) {
        return *overlay;
    }

    auto const& leaf   = state.location.leaf();
    bool        detail = leaf.id.has_value();
    switch (leaf.kind) {
    case KindId::WorkflowExecution:
        return detail ? KeyContext::WorkflowDetail : KeyContext::WorkflowList;
    case KindId::Schedule:
        return detail ? KeyContext::ScheduleDetail : KeyContext::ScheduleList;
    case KindId::Activity:
        return detail ? KeyContext::ActivityDetail : KeyContext::ActivityList;
    case KindId::TaskQueue:
        return KeyContext::TaskQueueDetail;
    }
    return KeyContext::WorkflowList;
}

auto OperationBindingsFor(AppState const& state, KindRegistry const& registry) -> std::vector<OperationBinding> {
    std::vector<OperationBinding> bindings;
    if (state.hasOverlay()) {
        return bindings;
    }
    for (auto const* op : registry.operations_for(state.location.leaf().kind, state)) {
        if (op->key) {
            bindings.push_back(OperationBinding{*op->key, op->id});
        }
    }
    return bindings;
}

} // namespace T9
