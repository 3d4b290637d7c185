#pragma once
#include <t9s/app/Action.hpp>
#include <t9s/app/Effect.hpp>
#include <t9s/core/Error.hpp>
#include <t9s/nav/Location.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace T9 {

struct PollingConfig {
    bool                      enabled = true;
    std::chrono::milliseconds base_interval{3000};
    std::chrono::milliseconds max_interval{60000};

    bool operator==(PollingConfig const&) const = default;
};

struct CollectionState {
    std::optional<CollectionItems> items;
    std::size_t                    selection = 0;
    std::optional<std::string>     filter;
    // The list the slot currently shows or waits for; completions for any
    // other query are stale.
    std::optional<CollectionQuery> requested;
    std::optional<std::string>     pending_page_token;
    bool                           loading = false;
    std::optional<std::string>     next_page_token;
    // Pages merged into items; polling only refreshes a single-page list.
    std::size_t                    pages = 0;
    std::optional<Error>           error;

    [[nodiscard]] auto size() const -> std::size_t;

    bool operator==(CollectionState const&) const = default;
};

struct DetailState {
    std::optional<LoadDetail>    requested;
    std::optional<DetailPayload> payload;
    bool                         loading = false;
    std::optional<Error>         error;
    std::size_t                  scroll = 0;

    bool operator==(DetailState const&) const = default;
};

struct HistoryState {
    std::optional<LoadHistory> requested;
    std::vector<HistoryEvent>  events;
    bool                       loading = false;
    std::optional<Error>       error;

    bool operator==(HistoryState const&) const = default;
};

// Total matching the workflow list on screen; requested mirrors that list's query.
struct WorkflowCountState {
    std::optional<CollectionQuery> requested;
    std::optional<std::uint64_t>   total;
    bool                           loading = false;

    bool operator==(WorkflowCountState const&) const = default;
};

struct NamespaceListState {
    std::vector<Namespace> items;
    bool                   loading = false;
    std::optional<Error>   error;

    bool operator==(NamespaceListState const&) const = default;
};

struct PendingOperation {
    KindId          kind{KindId::WorkflowExecution};
    OperationId     op{OperationId::CancelWorkflow};
    OperationTarget target;
    std::string     label;
    std::string     prompt;
    bool            confirmed = false;

    bool operator==(PendingOperation const&) const = default;
};

struct NoOverlay {
    bool operator==(NoOverlay const&) const = default;
};
struct HelpOverlay {
    bool operator==(HelpOverlay const&) const = default;
};
struct ConfirmOverlay {
    PendingOperation     pending;
    std::optional<Error> error;
    bool operator==(ConfirmOverlay const&) const = default;
};
struct CommandInputOverlay {
    std::string buffer;
    bool operator==(CommandInputOverlay const&) const = default;
};
struct SearchOverlay {
    std::string buffer;
    bool operator==(SearchOverlay const&) const = default;
};
struct CommandPaletteOverlay {
    std::size_t selection = 0;
    bool operator==(CommandPaletteOverlay const&) const = default;
};
struct NamespaceSelectorOverlay {
    std::size_t selection = 0;
    bool operator==(NamespaceSelectorOverlay const&) const = default;
};

using Overlay = std::variant<NoOverlay,
                             HelpOverlay,
                             ConfirmOverlay,
                             CommandInputOverlay,
                             SearchOverlay,
                             CommandPaletteOverlay,
                             NamespaceSelectorOverlay>;

struct Toast {
    std::string   message;
    bool          is_error = false;
    std::uint64_t generation = 0;

    bool operator==(Toast const&) const = default;
};

/**
 * AppState: the single state container.
 *
 * Only the Reducer produces new AppState values. Renderers and key-context
 * resolution read an immutable snapshot for one pass and never write back.
 */
struct AppState {
    Location                                 location;
    std::vector<Location>                    back_stack;
    std::array<CollectionState, kKindCount>  collections{};
    DetailState                              detail;
    HistoryState                             history;
    WorkflowCountState                       workflow_count;
    NamespaceListState                       namespaces;
    Overlay                                  overlay{NoOverlay{}};
    std::optional<PendingOperation>          in_flight_operation;
    ConnectionStatus                         connection = ConnectionStatus::Unknown;
    PollingConfig                            polling;
    std::uint32_t                            error_count = 0;
    std::optional<Toast>                     toast;
    std::uint64_t                            toast_generation = 0;
    std::chrono::milliseconds                toast_duration{4000};
    std::map<std::string, std::string>       saved_views;
    bool                                     should_quit = false;

    [[nodiscard]] auto collection(KindId kind) -> CollectionState& { return collections[kindIndex(kind)]; }
    [[nodiscard]] auto collection(KindId kind) const -> CollectionState const& { return collections[kindIndex(kind)]; }
    [[nodiscard]] auto hasOverlay() const -> bool { return !std::holds_alternative<NoOverlay>(overlay); }

    bool operator==(AppState const&) const = default;
};

inline constexpr std::size_t kBackStackLimit = 32;

[[nodiscard]] auto MakeInitialState(Location location, PollingConfig polling) -> AppState;

} // namespace T9
