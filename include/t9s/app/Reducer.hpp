#pragma once
#include <t9s/app/Action.hpp>
#include <t9s/app/AppState.hpp>
#include <t9s/app/Effect.hpp>

#include <vector>

namespace T9 {

class KindRegistry;

/**
 * Reducer: the only function that changes AppState.
 *
 * reduce() is pure: the same state and action always give the same next state
 * and effects, and it performs no I/O. Effects are descriptions the runtime
 * executes; every load effect it emits is recorded in state first, so a
 * completion that no longer matches what the state asked for is dropped
 * without touching anything.
 */
class Reducer {
public:
    struct Result {
        AppState            state;
        std::vector<Effect> effects;
    };

    explicit Reducer(KindRegistry const& registry)
        : registry_(registry) {}

    [[nodiscard]] auto reduce(AppState state, Action const& action) const -> Result;

private:
    KindRegistry const& registry_;
};

// Rows moved by PageUp/PageDown.
inline constexpr std::size_t kPageStep = 10;
// Next page is requested when the selection gets this close to the end.
inline constexpr std::size_t kLoadMoreThreshold = 5;

} // namespace T9
