#pragma once
#include <t9s/input/KeyEvent.hpp>
#include <t9s/input/Keymap.hpp>

#include <chrono>
#include <optional>
#include <span>
#include <vector>

namespace T9 {

/**
 * KeyInput: turns key events into symbolic key actions.
 *
 * Idle: a key that starts a sequence is buffered with a deadline; any other key
 * is resolved against the single-key bindings of the context.
 * BufferingSequence: a completed sequence emits its action; a longer valid
 * prefix keeps buffering with a fresh deadline; anything else drops the buffer
 * and resolves the new key as if it had been pressed from Idle.
 * An elapsed deadline drops the buffer without emitting.
 *
 * Calls never block; the owner polls expire() with its own clock.
 */
class KeyInput {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    explicit KeyInput(Keymap keymap, std::chrono::milliseconds sequenceTimeout = std::chrono::milliseconds{500});

    auto handle(KeyEvent const& event, KeyContext context, std::span<OperationBinding const> operations, TimePoint now)
        -> std::optional<KeyAction>;

    auto expire(TimePoint now) -> void;

    [[nodiscard]] auto isBuffering() const -> bool { return !pending_.empty(); }
    [[nodiscard]] auto deadline() const -> std::optional<TimePoint> { return deadline_; }
    [[nodiscard]] auto keymap() const -> Keymap const& { return keymap_; }

    // Single-key resolution only; exposed for tests and the help overlay.
    [[nodiscard]] auto resolve(KeyEvent const& event, KeyContext context, std::span<OperationBinding const> operations) const
        -> std::optional<KeyAction>;

private:
    enum class SequenceMatch {
        None,
        Prefix,
        Complete
    };

    auto match_sequence(std::vector<KeyEvent> const& keys, KeyAction& action) const -> SequenceMatch;
    auto handle_idle(KeyEvent const& event, KeyContext context, std::span<OperationBinding const> operations, TimePoint now)
        -> std::optional<KeyAction>;
    auto reset() -> void;

    Keymap                   keymap_;
    std::chrono::milliseconds timeout_;
    std::vector<KeyEvent>    pending_;
    std::optional<TimePoint> deadline_;
};

} // namespace T9
