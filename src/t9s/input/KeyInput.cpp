#include <t9s/input/KeyInput.hpp>

#include "log/TaggedLogger.hpp"

namespace T9 {

namespace {

auto find_binding(std::vector<Binding> const& bindings, KeyEvent const& event) -> std::optional<KeyAction> {
    for (auto const& binding : bindings) {
        if (binding.key.matches(event)) {
            return binding.action;
        }
    }
    return std::nullopt;
}

// Context bindings, then the operation keys of the current leaf.
auto find_context_binding(std::vector<Binding> const& bindings, std::span<OperationBinding const> operations, KeyEvent const& event)
    -> std::optional<KeyAction> {
    if (auto action = find_binding(bindings, event)) {
        return action;
    }
    for (auto const& op : operations) {
        if (op.key.matches(event)) {
            return KeyAction::Operation(op.op);
        }
    }
    return std::nullopt;
}

auto is_quit_chord(KeyEvent const& event) -> bool {
    return KeyBinding::Ctrl('c').matches(event);
}

auto is_printable(KeyEvent const& event) -> bool {
    auto ch = static_cast<unsigned char>(event.ch);
    return event.code == KeyCode::Char && !event.ctrl && !event.alt && ch >= 0x20 && ch != 0x7f;
}

} // namespace

KeyInput::KeyInput(Keymap keymap, std::chrono::milliseconds sequenceTimeout)
    : keymap_(std::move(keymap)), timeout_(sequenceTimeout) {}

auto KeyInput::handle(KeyEvent const& event, KeyContext context, std::span<OperationBinding const> operations, TimePoint now)
    -> std::optional<KeyAction> {
    if (isOverlayContext(context)) {
        reset();
        return resolve(event, context, operations);
    }

    if (pending_.empty()) {
        return handle_idle(event, context, operations, now);
    }

    if (deadline_ && now >= *deadline_) {
        reset();
        return handle_idle(event, context, operations, now);
    }

    pending_.push_back(event);
    KeyAction action;
    switch (match_sequence(pending_, action)) {
    case SequenceMatch::Complete:
        reset();
        t9_log("KeyInput sequence complete: " + std::string{keyCommandName(action.command)}, "KeyInput");
        return action;
    case SequenceMatch::Prefix:
        deadline_ = now + timeout_;
        return std::nullopt;
    case SequenceMatch::None:
        break;
    }
    // The buffered prefix is dropped; the new key still counts on its own.
    reset();
    return handle_idle(event, context, operations, now);
}

auto KeyInput::expire(TimePoint now) -> void {
    if (deadline_ && now >= *deadline_) {
        t9_log("KeyInput sequence timed out", "KeyInput");
        reset();
    }
}

auto KeyInput::handle_idle(KeyEvent const& event, KeyContext context, std::span<OperationBinding const> operations, TimePoint now)
    -> std::optional<KeyAction> {
    std::vector<KeyEvent> candidate{event};
    KeyAction             action;
    switch (match_sequence(candidate, action)) {
    case SequenceMatch::Complete:
        return action;
    case SequenceMatch::Prefix:
        pending_  = std::move(candidate);
        deadline_ = now + timeout_;
        return std::nullopt;
    case SequenceMatch::None:
        break;
    }
    return resolve(event, context, operations);
}

auto KeyInput::resolve(KeyEvent const& event, KeyContext context, std::span<OperationBinding const> operations) const
    -> std::optional<KeyAction> {
    if (context == KeyContext::TextEntry) {
        if (is_quit_chord(event)) {
            return KeyAction::Of(KeyCommand::Quit);
        }
        if (auto action = find_binding(keymap_.contextBindings(context), event)) {
            return action;
        }
        if (is_printable(event)) {
            return KeyAction::Insert(std::string(1, event.ch));
        }
        return std::nullopt;
    }

    if (isOverlayContext(context)) {
        if (is_quit_chord(event)) {
            return KeyAction::Of(KeyCommand::Quit);
        }
        return find_binding(keymap_.contextBindings(context), event);
    }

    // Global first, then navigation, then the context. A context binding may
    // shadow a global one unless the global binding is reserved.
    for (auto const& binding : keymap_.global) {
        if (binding.reserved && binding.key.matches(event)) {
            return binding.action;
        }
    }
    for (auto const& binding : keymap_.global) {
        if (!binding.reserved && binding.key.matches(event)) {
            auto shadow = find_context_binding(keymap_.contextBindings(context), operations, event);
            return shadow ? shadow : std::optional<KeyAction>{binding.action};
        }
    }
    if (auto navigation = find_binding(keymap_.navigation, event)) {
        return navigation;
    }
    return find_context_binding(keymap_.contextBindings(context), operations, event);
}

auto KeyInput::match_sequence(std::vector<KeyEvent> const& keys, KeyAction& action) const -> SequenceMatch {
    bool prefix = false;
    for (auto const& sequence : keymap_.sequences) {
        if (keys.size() > sequence.keys.size()) {
            continue;
        }
        bool matched = true;
        for (std::size_t i = 0; i < keys.size(); ++i) {
            if (!sequence.keys[i].matches(keys[i])) {
                matched = false;
                break;
            }
        }
        if (!matched) {
            continue;
        }
        if (keys.size() == sequence.keys.size()) {
            action = sequence.action;
            return SequenceMatch::Complete;
        }
        prefix = true;
    }
    return prefix ? SequenceMatch::Prefix : SequenceMatch::None;
}

auto KeyInput::reset() -> void {
    pending_.clear();
    deadline_.reset();
}

} // namespace T9
