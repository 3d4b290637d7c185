#include <t9s/app/Palette.hpp>

#include <t9s/app/AppState.hpp>
#include <t9s/kinds/KindRegistry.hpp>

namespace T9 {

namespace {

auto key_hint(std::optional<KeyBinding> const& key) -> std::string {
    return key ? key->label() : std::string{};
}

} // namespace

auto PaletteEntries(AppState const& state, KindRegistry const& registry) -> std::vector<PaletteEntry> {
    std::vector<PaletteEntry> entries;
    auto const&               ns = state.location.ns;

    entries.push_back({"Go to workflows", "1", Navigate{MakeCollectionLocation(ns, KindId::WorkflowExecution)}});
    entries.push_back({"Go to schedules", "2", Navigate{MakeCollectionLocation(ns, KindId::Schedule)}});
    entries.push_back({"Switch namespace", "n", KeyPressed{KeyAction::Of(KeyCommand::OpenNamespaceSelector)}});
    entries.push_back({"Refresh", "ctrl+r", KeyPressed{KeyAction::Of(KeyCommand::Refresh)}});

    if (!state.location.route.empty()) {
        auto kind = state.location.leaf().kind;
        for (auto const* op : registry.operations_for(kind, state)) {
            entries.push_back({op->label, key_hint(op->key), InvokeOperation{kind, op->id, std::nullopt}});
        }
    }

    for (auto const& [name, uri] : state.saved_views) {
        entries.push_back({"View: " + name, uri, SubmitCommand{"view " + name}});
    }

    entries.push_back({state.polling.enabled ? "Pause polling" : "Resume polling", ":polling",
                       SetPollingEnabled{!state.polling.enabled}});
    entries.push_back({"Help", "?", KeyPressed{KeyAction::Of(KeyCommand::ToggleHelp)}});
    entries.push_back({"Quit", "q", KeyPressed{KeyAction::Of(KeyCommand::Quit)}});
    return entries;
}

} // namespace T9
