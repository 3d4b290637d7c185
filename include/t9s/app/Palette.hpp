#pragma once
#include <t9s/app/Action.hpp>

#include <string>
#include <vector>

namespace T9 {

struct AppState;
class KindRegistry;

struct PaletteEntry {
    std::string label;
    std::string hint;
    Action      action;
};

// Commands reachable from the palette for the current view: navigation, the
// operations applicable to the focused item, saved views and app toggles.
[[nodiscard]] auto PaletteEntries(AppState const& state, KindRegistry const& registry) -> std::vector<PaletteEntry>;

} // namespace T9
