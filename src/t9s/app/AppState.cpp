#include <t9s/app/AppState.hpp>

namespace T9 {

auto CollectionState::size() const -> std::size_t {
    if (!items) {
        return 0;
    }
    return std::visit([](auto const& values) { return values.size(); }, *items);
}

auto MakeInitialState(Location location, PollingConfig polling) -> AppState {
    AppState state;
    state.location = std::move(location);
    state.polling  = polling;
    return state;
}

auto actionName(Action const& action) -> std::string_view {
    struct Name {
        auto operator()(Navigate const&) const -> std::string_view { return "Navigate"; }
        auto operator()(Back const&) const -> std::string_view { return "Back"; }
        auto operator()(KeyPressed const&) const -> std::string_view { return "KeyPressed"; }
        auto operator()(TextEdited const&) const -> std::string_view { return "TextEdited"; }
        auto operator()(SubmitCommand const&) const -> std::string_view { return "SubmitCommand"; }
        auto operator()(DataLoaded const&) const -> std::string_view { return "DataLoaded"; }
        auto operator()(DataLoadFailed const&) const -> std::string_view { return "DataLoadFailed"; }
        auto operator()(InvokeOperation const&) const -> std::string_view { return "InvokeOperation"; }
        auto operator()(OperationConfirmed const&) const -> std::string_view { return "OperationConfirmed"; }
        auto operator()(OperationCancelled const&) const -> std::string_view { return "OperationCancelled"; }
        auto operator()(OperationSucceeded const&) const -> std::string_view { return "OperationSucceeded"; }
        auto operator()(OperationFailed const&) const -> std::string_view { return "OperationFailed"; }
        auto operator()(PollTick const&) const -> std::string_view { return "PollTick"; }
        auto operator()(TimerElapsed const&) const -> std::string_view { return "TimerElapsed"; }
        auto operator()(ConnectionChanged const&) const -> std::string_view { return "ConnectionChanged"; }
        auto operator()(SetPollingEnabled const&) const -> std::string_view { return "SetPollingEnabled"; }
        auto operator()(SwitchNamespace const&) const -> std::string_view { return "SwitchNamespace"; }
    };
    return std::visit(Name{}, action);
}

} // namespace T9
