#pragma once
#include <t9s/input/KeyEvent.hpp>

#include <map>
#include <string>
#include <vector>

namespace T9 {

struct AppState;
class KindRegistry;

struct Binding {
    KeyBinding  key;
    KeyAction   action;
    std::string description;
    // Reserved bindings are resolved before anything else and cannot be shadowed.
    bool reserved = false;
};

struct KeySequence {
    std::vector<KeyBinding> keys;
    KeyAction               action;
    std::string             description;
};

struct Keymap {
    std::vector<Binding>                    global;
    std::vector<Binding>                    navigation;
    std::map<KeyContext, std::vector<Binding>> contexts;
    std::vector<KeySequence>                sequences;

    [[nodiscard]] auto contextBindings(KeyContext context) const -> std::vector<Binding> const&;
};

// Operation keys come from the kind registry at resolution time.
struct OperationBinding {
    KeyBinding  key;
    OperationId op;
};

[[nodiscard]] auto DefaultKeymap() -> Keymap;

// Derives the input context from the open overlay and the leaf of the location.
[[nodiscard]] auto KeyContextFor(AppState const& state) -> KeyContext;

// Bindings for the operations applicable to the current leaf.
[[nodiscard]] auto OperationBindingsFor(AppState const& state, KindRegistry const& registry) -> std::vector<OperationBinding>;

} // namespace T9
