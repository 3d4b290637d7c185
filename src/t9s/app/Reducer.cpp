#include <t9s/app/Reducer.hpp>

#include <t9s/app/Palette.hpp>
#include <t9s/input/Commands.hpp>
#include <t9s/kinds/KindRegistry.hpp>
#include <t9s/nav/Uri.hpp>
#include <t9s/poll/PollScheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <limits>

namespace T9 {

namespace {

constexpr std::ptrdiff_t kJumpToEnd = std::numeric_limits<std::ptrdiff_t>::max();

auto trimmed(std::string_view text) -> std::string {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return std::string{text};
}

auto combine_filters(std::optional<std::string> base, std::optional<std::string> user) -> std::optional<std::string> {
    if (base && user) {
        return "(" + *base + ") AND (" + *user + ")";
    }
    if (base) {
        return base;
    }
    return user;
}

auto step_index(std::size_t current, std::ptrdiff_t delta, std::size_t size) -> std::size_t {
    if (size == 0) {
        return 0;
    }
    if (delta < 0) {
        auto back = static_cast<std::size_t>(-delta);
        return current > back ? current - back : 0;
    }
    return std::min(current + static_cast<std::size_t>(delta), size - 1);
}

// Drops one UTF-8 code point from the end.
auto pop_code_point(std::string& text) -> void {
    while (!text.empty() && (static_cast<unsigned char>(text.back()) & 0xC0) == 0x80) {
        text.pop_back();
    }
    if (!text.empty()) {
        text.pop_back();
    }
}

auto merge_page(CollectionItems& into, CollectionItems page) -> void {
    std::visit(
            [&page](auto& existing) {
                using Items = std::decay_t<decltype(existing)>;
                if (auto* incoming = std::get_if<Items>(&page)) {
                    existing.insert(existing.end(), std::make_move_iterator(incoming->begin()), std::make_move_iterator(incoming->end()));
                }
            },
            into);
}

class Transition {
public:
    Transition(KindRegistry const& registry, AppState& state, std::vector<Effect>& effects)
        : registry_(registry), state_(state), effects_(effects) {}

    auto apply(Action const& action) -> void {
        std::visit([this](auto const& concrete) { this->on(concrete); }, action);
    }

private:
    auto on(Navigate const& action) -> void { navigate(action.location, true); }
    auto on(Back const&) -> void { go_back(); }
    auto on(KeyPressed const& action) -> void { on_key(action.action); }
    auto on(SubmitCommand const& action) -> void { run_command(action.text); }

    auto on(TextEdited const& action) -> void {
        if (auto* buffer = text_buffer()) {
            *buffer = action.text;
        }
    }

    auto on(DataLoaded const& loaded) -> void {
        if (auto const* request = std::get_if<LoadCollection>(&loaded.request)) {
            collection_loaded(*request, loaded.payload);
        } else if (auto const* request = std::get_if<LoadDetail>(&loaded.request)) {
            detail_loaded(*request, loaded.payload);
        } else if (auto const* request = std::get_if<LoadHistory>(&loaded.request)) {
            history_loaded(*request, loaded.payload);
        } else if (auto const* request = std::get_if<LoadWorkflowCount>(&loaded.request)) {
            count_loaded(*request, loaded.payload);
        } else {
            namespaces_loaded(loaded.payload);
        }
    }

    auto on(DataLoadFailed const& failed) -> void {
        std::string what;
        if (auto const* request = std::get_if<LoadCollection>(&failed.request)) {
            auto& slot = state_.collection(request->kind);
            if (!is_current(slot, *request)) {
                t9_log("Dropping stale collection failure", "Reducer");
                return;
            }
            slot.loading = false;
            slot.pending_page_token.reset();
            slot.error = failed.error;
            what       = registry_.get(request->kind).label;
        } else if (auto const* request = std::get_if<LoadDetail>(&failed.request)) {
            auto& detail = state_.detail;
            if (!detail_is_current(*request)) {
                t9_log("Dropping stale detail failure", "Reducer");
                return;
            }
            detail.loading = false;
            detail.error   = failed.error;
            what           = registry_.get(request->kind).identity.label(request->identity);
        } else if (auto const* request = std::get_if<LoadHistory>(&failed.request)) {
            auto& history = state_.history;
            if (!history.loading || history.requested != *request) {
                return;
            }
            history.loading = false;
            history.error   = failed.error;
            what            = "history of " + request->workflow.workflow_id;
        } else if (auto const* request = std::get_if<LoadWorkflowCount>(&failed.request)) {
            // The count only decorates the list; its failure is not surfaced.
            auto& count = state_.workflow_count;
            if (count.loading && count.requested == request->query) {
                count.loading = false;
                count.total.reset();
            }
            t9_log("Workflow count failed: " + describeError(failed.error), "Reducer");
            return;
        } else {
            if (!state_.namespaces.loading) {
                return;
            }
            state_.namespaces.loading = false;
            state_.namespaces.error   = failed.error;
            what                      = "namespaces";
        }

        show_toast("Could not load " + what + ": " + describeError(failed.error), true);
        if (isRetryable(failed.error.code)) {
            ++state_.error_count;
        }
        if (failed.error.code == Error::Code::ConnectionError && state_.connection != ConnectionStatus::Disconnected) {
            enter_disconnected();
        }
    }

    auto on(InvokeOperation const& invoke) -> void {
        if (state_.in_flight_operation) {
            show_toast("Another operation is still running", true);
            return;
        }
        auto const* op = registry_.get(invoke.kind).findOperation(invoke.op);
        if (op == nullptr) {
            show_toast(std::string{operationName(invoke.op)} + " is not available for " + registry_.get(invoke.kind).label, true);
            return;
        }
        if (!op->applicability(state_)) {
            return;
        }
        auto target = invoke.target ? invoke.target : focused_target(invoke.kind);
        if (!target) {
            return;
        }
        PendingOperation pending{invoke.kind, invoke.op, *target, op->label, op->label + " " + identity_label(target->identity) + "?", false};
        if (op->requires_confirmation) {
            state_.overlay = ConfirmOverlay{std::move(pending), std::nullopt};
            return;
        }
        start_operation(std::move(pending));
    }

    auto on(OperationConfirmed const&) -> void {
        auto* confirm = std::get_if<ConfirmOverlay>(&state_.overlay);
        if (confirm == nullptr) {
            return;
        }
        if (state_.in_flight_operation) {
            show_toast("Another operation is still running", true);
            return;
        }
        auto pending      = confirm->pending;
        pending.confirmed = true;
        state_.overlay    = NoOverlay{};
        start_operation(std::move(pending));
    }

    auto on(OperationCancelled const&) -> void {
        if (std::holds_alternative<ConfirmOverlay>(state_.overlay)) {
            state_.overlay = NoOverlay{};
        }
    }

    auto on(OperationSucceeded const& done) -> void {
        auto pending = take_in_flight(done.request);
        if (!pending) {
            return;
        }
        show_toast(pending->label + " " + identity_label(pending->target.identity) + ": done", false);

        auto const* spec = registry_.get(pending->kind).findOperation(pending->op);
        auto const& leaf = state_.location.leaf();
        if (spec != nullptr && spec->removes_target && leaf.id && *leaf.id == pending->target.identity) {
            auto location           = state_.location;
            location.route.back().id.reset();
            location.query.erase(std::string{kQueryTab});
            location.query.erase(std::string{kQueryRunId});
            navigate(std::move(location), false);
            return;
        }
        load_view(true);
    }

    auto on(OperationFailed const& failed) -> void {
        auto pending = take_in_flight(failed.request);
        if (!pending) {
            return;
        }
        show_toast(pending->label + " failed: " + describeError(failed.error), true);
        if (pending->confirmed) {
            pending->confirmed = false;
            state_.overlay     = ConfirmOverlay{std::move(*pending), failed.error};
        }
    }

    auto on(PollTick const&) -> void {
        if (state_.connection != ConnectionStatus::Connected || !state_.polling.enabled) {
            return;
        }
        auto const& leaf = state_.location.leaf();
        auto const& spec = registry_.get(leaf.kind);
        if (leaf.id) {
            if (!spec.detail || !spec.detail->pollable || state_.detail.loading) {
                return;
            }
            load_view(true);
            return;
        }
        auto const& slot = state_.collection(leaf.kind);
        if (!spec.collection || !spec.collection->pollable || slot.loading || slot.pages > 1) {
            return;
        }
        load_collection(leaf.kind);
    }

    auto on(TimerElapsed const& timer) -> void {
        switch (timer.timer) {
        case TimerId::Toast:
            if (state_.toast && state_.toast->generation == timer.generation) {
                state_.toast.reset();
            }
            break;
        case TimerId::Reconnect:
            if (state_.connection != ConnectionStatus::Connected) {
                effects_.push_back(CheckConnection{});
            }
            break;
        }
    }

    auto on(ConnectionChanged const& changed) -> void {
        auto const previous = state_.connection;
        switch (changed.status) {
        case ConnectionStatus::Connected:
            state_.connection = ConnectionStatus::Connected;
            if (previous == ConnectionStatus::Connected) {
                return;
            }
            state_.error_count = 0;
            if (previous == ConnectionStatus::Disconnected) {
                show_toast("Reconnected", false);
            }
            load_view(true);
            if (state_.namespaces.items.empty() && !state_.namespaces.loading) {
                request_namespaces();
            }
            break;
        case ConnectionStatus::Disconnected:
            ++state_.error_count;
            if (previous != ConnectionStatus::Disconnected) {
                auto reason = changed.error ? describeError(*changed.error) : std::string{"connection lost"};
                show_toast("Disconnected: " + reason, true);
            }
            enter_disconnected();
            break;
        case ConnectionStatus::Unknown:
            state_.connection = ConnectionStatus::Unknown;
            break;
        }
    }

    auto on(SetPollingEnabled const& action) -> void {
        if (action.enabled && !state_.polling.enabled) {
            // Resumed polling starts over at the base interval.
            state_.error_count = 0;
        }
        state_.polling.enabled = action.enabled;
        show_toast(action.enabled ? "Polling resumed" : "Polling paused", false);
    }

    auto on(SwitchNamespace const& action) -> void {
        auto ns = trimmed(action.ns);
        if (ns.empty()) {
            show_toast("Namespace name is empty", true);
            return;
        }
        auto root      = state_.location.route.front().kind;
        auto const& rs = registry_.get(root);
        if (!rs.collection || !rs.root_addressable) {
            root = KindId::WorkflowExecution;
        }
        if (ns != state_.location.ns) {
            state_.collections    = {};
            state_.detail         = {};
            state_.history        = {};
            state_.workflow_count = {};
        }
        navigate(MakeCollectionLocation(ns, root), true);
        show_toast("Namespace " + ns, false);
    }

    // -- navigation ------------------------------------------------------------

    auto navigate(Location target, bool push) -> void {
        if (target.route.empty()) {
            show_toast("Cannot open an empty location", true);
            return;
        }
        if (trimmed(target.ns).empty()) {
            show_toast("Cannot open a location without a namespace", true);
            return;
        }
        auto        location = CanonicalLocation(std::move(target), registry_);
        auto const& leaf     = location.leaf();
        auto const& spec     = registry_.get(leaf.kind);
        if (leaf.id ? !spec.detail : !spec.collection) {
            show_toast(spec.label + " cannot be shown this way", true);
            return;
        }
        if (push && location != state_.location) {
            state_.back_stack.push_back(state_.location);
            if (state_.back_stack.size() > kBackStackLimit) {
                state_.back_stack.erase(state_.back_stack.begin());
            }
        }
        t9_log("Navigate to " + FormatDeepLink(location, registry_), "Reducer");
        state_.location = std::move(location);
        state_.overlay  = NoOverlay{};
        if (!state_.location.leaf().id) {
            state_.detail  = {};
            state_.history = {};
        }
        load_view(false);
    }

    auto go_back() -> void {
        if (state_.hasOverlay()) {
            state_.overlay = NoOverlay{};
            return;
        }
        if (!state_.back_stack.empty()) {
            auto previous = std::move(state_.back_stack.back());
            state_.back_stack.pop_back();
            navigate(std::move(previous), false);
            return;
        }
        auto crumbs = DeriveBreadcrumbs(state_.location, registry_);
        if (crumbs.size() >= 2) {
            navigate(crumbs[crumbs.size() - 2].location, false);
        }
    }

    auto open_link(std::string const& uri) -> void {
        auto location = ParseDeepLink(uri, registry_);
        if (!location) {
            show_toast("Invalid link: " + describeError(toError(location.error())), true);
            return;
        }
        navigate(std::move(*location), true);
    }

    auto current_tab() const -> std::size_t {
        auto const& spec = registry_.get(state_.location.leaf().kind);
        if (!spec.detail) {
            return 0;
        }
        return spec.detail->tabIndex(state_.location.queryValue(kQueryTab));
    }

    auto switch_tab(bool forward) -> void {
        auto const& leaf = state_.location.leaf();
        auto const& spec = registry_.get(leaf.kind);
        if (!leaf.id || !spec.detail) {
            return;
        }
        auto const count = spec.detail->tabs.size();
        if (count <= 1) {
            return;
        }
        auto const next = forward ? (current_tab() + 1) % count : (current_tab() + count - 1) % count;
        if (next == 0) {
            state_.location.query.erase(std::string{kQueryTab});
        } else {
            state_.location.query.insert_or_assign(std::string{kQueryTab}, spec.detail->tabs[next].slug);
        }
        state_.detail.scroll = 0;
        load_companions(false);
    }

    // -- loading ---------------------------------------------------------------

    auto load_view(bool refresh) -> void {
        auto const& leaf = state_.location.leaf();
        if (!leaf.id) {
            load_collection(leaf.kind);
            return;
        }
        LoadDetail request{leaf.kind, state_.location.ns, *leaf.id};
        auto&      detail = state_.detail;
        if (detail.requested != request) {
            detail.payload.reset();
            detail.error.reset();
            detail.scroll = 0;
        }
        detail.requested = request;
        detail.loading   = true;
        effects_.push_back(std::move(request));
        load_companions(refresh);
    }

    auto load_companions(bool refresh) -> void {
        auto const& leaf = state_.location.leaf();
        auto const& spec = registry_.get(leaf.kind);
        if (!leaf.id || !spec.detail || !spec.detail->companion_loads) {
            return;
        }
        for (auto& effect : spec.detail->companion_loads(state_.location.ns, *leaf.id, current_tab())) {
            if (auto const* history = std::get_if<LoadHistory>(&effect)) {
                auto& slot = state_.history;
                if (slot.requested == *history && (!refresh || slot.loading)) {
                    continue;
                }
                if (slot.requested != *history) {
                    slot.events.clear();
                    slot.error.reset();
                }
                slot.requested = *history;
                slot.loading   = true;
            }
            effects_.push_back(std::move(effect));
        }
    }

    auto load_collection(KindId kind) -> void {
        auto const& location = state_.location;
        auto const& spec     = *registry_.get(kind).collection;
        auto const* parent   = location.parent();

        std::optional<std::string> base;
        if (parent != nullptr && spec.base_filter) {
            base = spec.base_filter(*parent);
        }
        std::optional<std::string> user;
        if (spec.supports_filter) {
            if (auto q = location.queryValue(kQueryFilter)) {
                auto text = trimmed(*q);
                if (!text.empty()) {
                    user = std::move(text);
                }
            }
        }

        CollectionQuery query{location.ns, combine_filters(base, user), std::nullopt};
        if (parent != nullptr) {
            query.parent = parent->id;
        }

        auto& slot = state_.collection(kind);
        if (slot.requested != query) {
            slot.items.reset();
            slot.selection = 0;
            slot.next_page_token.reset();
            slot.error.reset();
            slot.pages = 0;
        }
        slot.filter    = user;
        slot.requested = query;
        slot.pending_page_token.reset();
        slot.loading = true;
        effects_.push_back(LoadCollection{kind, query, std::nullopt});
        if (kind == KindId::WorkflowExecution) {
            request_count(std::move(query));
        }
    }

    auto request_count(CollectionQuery query) -> void {
        auto& count = state_.workflow_count;
        if (count.requested != query) {
            count.total.reset();
        } else if (count.loading) {
            return;
        }
        count.requested = query;
        count.loading   = true;
        effects_.push_back(LoadWorkflowCount{std::move(query)});
    }

    auto maybe_load_more(KindId kind) -> void {
        auto const& spec = registry_.get(kind);
        auto&       slot = state_.collection(kind);
        if (!spec.collection || !spec.collection->paged || !slot.next_page_token || slot.loading || !slot.requested) {
            return;
        }
        if (slot.selection + kLoadMoreThreshold < slot.size()) {
            return;
        }
        slot.pending_page_token = slot.next_page_token;
        slot.loading            = true;
        effects_.push_back(LoadCollection{kind, *slot.requested, slot.next_page_token});
    }

    auto request_namespaces() -> void {
        state_.namespaces.loading = true;
        effects_.push_back(LoadNamespaces{});
    }

    static auto is_current(CollectionState const& slot, LoadCollection const& request) -> bool {
        return slot.loading && slot.requested == request.query && slot.pending_page_token == request.page_token;
    }

    auto collection_loaded(LoadCollection const& request, LoadPayload const& payload) -> void {
        auto& slot = state_.collection(request.kind);
        auto const* page = std::get_if<Page>(&payload);
        if (!is_current(slot, request) || page == nullptr) {
            t9_log("Dropping stale collection page", "Reducer");
            return;
        }
        if (request.page_token && slot.items) {
            merge_page(*slot.items, page->items);
            ++slot.pages;
        } else {
            slot.items = page->items;
            slot.pages = 1;
        }
        slot.next_page_token = page->next_page_token;
        slot.loading         = false;
        slot.pending_page_token.reset();
        slot.error.reset();
        slot.selection = step_index(slot.selection, 0, slot.size());
        mark_healthy();
    }

    // A detail completion applies only to the request in flight for the leaf on screen.
    auto detail_is_current(LoadDetail const& request) const -> bool {
        auto const& detail = state_.detail;
        auto const& leaf   = state_.location.leaf();
        return detail.loading && detail.requested == request && leaf.kind == request.kind && leaf.id == request.identity
               && state_.location.ns == request.ns;
    }

    auto detail_loaded(LoadDetail const& request, LoadPayload const& payload) -> void {
        auto&       detail = state_.detail;
        auto const* value  = std::get_if<DetailPayload>(&payload);
        if (!detail_is_current(request) || value == nullptr) {
            t9_log("Dropping stale detail payload", "Reducer");
            return;
        }
        detail.payload = *value;
        detail.loading = false;
        detail.error.reset();
        mark_healthy();
    }

    auto history_loaded(LoadHistory const& request, LoadPayload const& payload) -> void {
        auto&       history = state_.history;
        auto const* events  = std::get_if<std::vector<HistoryEvent>>(&payload);
        if (!history.loading || history.requested != request || events == nullptr) {
            return;
        }
        history.events  = *events;
        history.loading = false;
        history.error.reset();
        mark_healthy();
    }

    auto count_loaded(LoadWorkflowCount const& request, LoadPayload const& payload) -> void {
        auto&       count = state_.workflow_count;
        auto const* value = std::get_if<WorkflowCount>(&payload);
        if (!count.loading || count.requested != request.query || value == nullptr) {
            return;
        }
        count.total   = value->count;
        count.loading = false;
    }

    auto namespaces_loaded(LoadPayload const& payload) -> void {
        auto const* items = std::get_if<std::vector<Namespace>>(&payload);
        if (!state_.namespaces.loading || items == nullptr) {
            return;
        }
        state_.namespaces.items   = *items;
        state_.namespaces.loading = false;
        state_.namespaces.error.reset();
        if (auto* selector = std::get_if<NamespaceSelectorOverlay>(&state_.overlay)) {
            selector->selection = namespace_index(state_.location.ns);
        }
        mark_healthy();
    }

    auto mark_healthy() -> void {
        state_.error_count = 0;
        state_.connection  = ConnectionStatus::Connected;
    }

    auto enter_disconnected() -> void {
        state_.connection = ConnectionStatus::Disconnected;
        effects_.push_back(SetTimer{EffectiveInterval(state_.polling, state_.error_count), TimerId::Reconnect, 0});
    }

    // -- operations ------------------------------------------------------------

    auto focused_identity(KindId kind) const -> std::optional<Identity> {
        auto const& leaf = state_.location.leaf();
        if (leaf.kind != kind) {
            return std::nullopt;
        }
        if (leaf.id) {
            return leaf.id;
        }
        auto const& spec = registry_.get(kind);
        if (!spec.collection) {
            return std::nullopt;
        }
        return spec.collection->row_identity(state_, state_.collection(kind).selection);
    }

    auto focused_target(KindId kind) const -> std::optional<OperationTarget> {
        auto identity = focused_identity(kind);
        if (!identity) {
            return std::nullopt;
        }
        return OperationTarget{kind, std::move(*identity), {}};
    }

    auto start_operation(PendingOperation pending) -> void {
        auto effects = registry_.resolve_effects(pending.kind, pending.op, pending.target, state_);
        if (!effects) {
            show_toast(describeError(effects.error()), true);
            return;
        }
        t9_log("Running " + std::string{operationName(pending.op)}, "Reducer");
        state_.in_flight_operation = std::move(pending);
        for (auto& effect : *effects) {
            effects_.push_back(std::move(effect));
        }
    }

    auto take_in_flight(RunOperation const& request) -> std::optional<PendingOperation> {
        auto& current = state_.in_flight_operation;
        if (!current || current->op != request.op || current->target.identity != request.target.identity) {
            return std::nullopt;
        }
        auto pending = std::move(*current);
        current.reset();
        return pending;
    }

    auto identity_label(Identity const& identity) const -> std::string {
        return registry_.get(identityKind(identity)).identity.label(identity);
    }

    // -- input -----------------------------------------------------------------

    auto text_buffer() -> std::string* {
        if (auto* command = std::get_if<CommandInputOverlay>(&state_.overlay)) {
            return &command->buffer;
        }
        if (auto* search = std::get_if<SearchOverlay>(&state_.overlay)) {
            return &search->buffer;
        }
        return nullptr;
    }

    auto namespace_index(std::string const& ns) const -> std::size_t {
        auto const& items = state_.namespaces.items;
        auto        it    = std::find_if(items.begin(), items.end(), [&ns](Namespace const& item) { return item.name == ns; });
        return it == items.end() ? 0 : static_cast<std::size_t>(it - items.begin());
    }

    auto move(std::ptrdiff_t delta) -> void {
        if (auto* palette = std::get_if<CommandPaletteOverlay>(&state_.overlay)) {
            palette->selection = step_index(palette->selection, delta, PaletteEntries(state_, registry_).size());
            return;
        }
        if (auto* selector = std::get_if<NamespaceSelectorOverlay>(&state_.overlay)) {
            selector->selection = step_index(selector->selection, delta, state_.namespaces.items.size());
            return;
        }
        if (state_.hasOverlay()) {
            return;
        }
        auto const& leaf = state_.location.leaf();
        auto const& spec = registry_.get(leaf.kind);
        if (leaf.id) {
            if (spec.detail && spec.detail->lines) {
                auto lines           = spec.detail->lines(state_, current_tab());
                state_.detail.scroll = step_index(state_.detail.scroll, delta, lines.size());
            }
            return;
        }
        auto& slot = state_.collection(leaf.kind);
        if (slot.size() == 0) {
            return;
        }
        slot.selection = step_index(slot.selection, delta, slot.size());
        if (delta > 0) {
            maybe_load_more(leaf.kind);
        }
    }

    auto select() -> void {
        if (auto const* palette = std::get_if<CommandPaletteOverlay>(&state_.overlay)) {
            auto entries = PaletteEntries(state_, registry_);
            if (palette->selection < entries.size()) {
                auto action    = entries[palette->selection].action;
                state_.overlay = NoOverlay{};
                apply(action);
            }
            return;
        }
        if (auto const* selector = std::get_if<NamespaceSelectorOverlay>(&state_.overlay)) {
            if (selector->selection < state_.namespaces.items.size()) {
                on(SwitchNamespace{state_.namespaces.items[selector->selection].name});
            }
            return;
        }
        if (state_.hasOverlay()) {
            return;
        }
        auto const& leaf = state_.location.leaf();
        auto const& spec = registry_.get(leaf.kind);
        if (leaf.id) {
            if (spec.detail && spec.detail->select) {
                if (auto target = spec.detail->select(state_, current_tab())) {
                    navigate(std::move(*target), true);
                }
            }
            return;
        }
        if (auto identity = focused_identity(leaf.kind)) {
            navigate(MakeDetailLocation(state_.location.ns, std::move(*identity)), true);
        }
    }

    auto open_child(KindId parent, KindId child) -> void {
        if (auto identity = focused_identity(parent)) {
            navigate(MakeChildCollectionLocation(state_.location.ns, std::move(*identity), child), true);
        }
    }

    auto open_namespace_selector() -> void {
        state_.overlay = NamespaceSelectorOverlay{namespace_index(state_.location.ns)};
        if (state_.namespaces.items.empty() && !state_.namespaces.loading) {
            request_namespaces();
        }
    }

    auto open_search() -> void {
        auto const& leaf = state_.location.leaf();
        auto const& spec = registry_.get(leaf.kind);
        if (leaf.id || !spec.collection || !spec.collection->supports_filter) {
            show_toast("Filtering is not available here", true);
            return;
        }
        state_.overlay = SearchOverlay{state_.location.queryValue(kQueryFilter).value_or("")};
    }

    auto submit_text() -> void {
        if (auto const* command = std::get_if<CommandInputOverlay>(&state_.overlay)) {
            auto text      = command->buffer;
            state_.overlay = NoOverlay{};
            run_command(text);
            return;
        }
        if (auto const* search = std::get_if<SearchOverlay>(&state_.overlay)) {
            auto text      = trimmed(search->buffer);
            state_.overlay = NoOverlay{};
            auto location  = state_.location;
            if (text.empty()) {
                location.query.erase(std::string{kQueryFilter});
            } else {
                location.query.insert_or_assign(std::string{kQueryFilter}, text);
            }
            if (location != state_.location) {
                navigate(std::move(location), false);
            }
        }
    }

    auto on_key(KeyAction const& key) -> void {
        switch (key.command) {
        case KeyCommand::Quit:
            state_.should_quit = true;
            break;
        case KeyCommand::ToggleHelp:
            if (std::holds_alternative<HelpOverlay>(state_.overlay)) {
                state_.overlay = NoOverlay{};
            } else if (!state_.hasOverlay()) {
                state_.overlay = HelpOverlay{};
            }
            break;
        case KeyCommand::OpenCommandPalette:
            state_.overlay = CommandPaletteOverlay{0};
            break;
        case KeyCommand::OpenCommandInput:
            state_.overlay = CommandInputOverlay{};
            break;
        case KeyCommand::OpenSearch:
            open_search();
            break;
        case KeyCommand::OpenNamespaceSelector:
            open_namespace_selector();
            break;
        case KeyCommand::Refresh:
            load_view(true);
            break;
        case KeyCommand::SwitchToWorkflows:
            navigate(MakeCollectionLocation(state_.location.ns, KindId::WorkflowExecution), true);
            break;
        case KeyCommand::SwitchToSchedules:
            navigate(MakeCollectionLocation(state_.location.ns, KindId::Schedule), true);
            break;
        case KeyCommand::MoveUp:
            move(-1);
            break;
        case KeyCommand::MoveDown:
            move(1);
            break;
        case KeyCommand::MoveToTop:
            move(-kJumpToEnd);
            break;
        case KeyCommand::MoveToBottom:
            move(kJumpToEnd);
            break;
        case KeyCommand::PageUp:
            move(-static_cast<std::ptrdiff_t>(kPageStep));
            break;
        case KeyCommand::PageDown:
            move(static_cast<std::ptrdiff_t>(kPageStep));
            break;
        case KeyCommand::Select:
            select();
            break;
        case KeyCommand::Back:
            go_back();
            break;
        case KeyCommand::NextTab:
            switch_tab(true);
            break;
        case KeyCommand::PrevTab:
            switch_tab(false);
            break;
        case KeyCommand::ViewActivities:
            open_child(KindId::WorkflowExecution, KindId::Activity);
            break;
        case KeyCommand::ViewScheduleWorkflows:
            open_child(KindId::Schedule, KindId::WorkflowExecution);
            break;
        case KeyCommand::Confirm:
            on(OperationConfirmed{});
            break;
        case KeyCommand::Cancel:
            on(OperationCancelled{});
            break;
        case KeyCommand::InvokeOperation:
            if (key.operation) {
                on(InvokeOperation{state_.location.leaf().kind, *key.operation, std::nullopt});
            }
            break;
        case KeyCommand::TextInsert:
            if (auto* buffer = text_buffer()) {
                *buffer += key.text;
            }
            break;
        case KeyCommand::TextBackspace:
            if (auto* buffer = text_buffer()) {
                pop_code_point(*buffer);
            }
            break;
        case KeyCommand::TextComplete:
            if (auto* command = std::get_if<CommandInputOverlay>(&state_.overlay)) {
                if (auto completed = CompleteCommand(command->buffer)) {
                    command->buffer = std::move(*completed);
                }
            }
            break;
        case KeyCommand::TextSubmit:
            submit_text();
            break;
        }
    }

    auto run_command(std::string const& text) -> void {
        auto parsed = ParseCommand(text);
        if (!parsed) {
            show_toast(parsed.error().message.value_or("invalid command"), true);
            return;
        }
        auto const& args = parsed->args;
        auto const& ns   = state_.location.ns;
        switch (parsed->kind) {
        case CommandKind::Workflows:
            navigate(MakeCollectionLocation(ns, KindId::WorkflowExecution), true);
            break;
        case CommandKind::Schedules:
            navigate(MakeCollectionLocation(ns, KindId::Schedule), true);
            break;
        case CommandKind::Namespace:
            if (args.empty()) {
                open_namespace_selector();
            } else {
                on(SwitchNamespace{args.front()});
            }
            break;
        case CommandKind::Signal: {
            auto target = focused_target(KindId::WorkflowExecution);
            if (!target) {
                show_toast("Select a workflow to signal", true);
                break;
            }
            target->params.insert_or_assign(std::string{kParamSignalName}, args[0]);
            if (args.size() > 1) {
                target->params.insert_or_assign(std::string{kParamInput}, args[1]);
            }
            on(InvokeOperation{KindId::WorkflowExecution, OperationId::SignalWorkflow, std::move(target)});
            break;
        }
        case CommandKind::Open:
            open_link(args.front());
            break;
        case CommandKind::TaskQueue:
            navigate(MakeDetailLocation(ns, TaskQueueIdentity{args.front()}), true);
            break;
        case CommandKind::View: {
            auto it = state_.saved_views.find(args.front());
            if (it == state_.saved_views.end()) {
                show_toast("No saved view named '" + args.front() + "'", true);
                break;
            }
            auto uri = it->second;
            open_link(uri);
            break;
        }
        case CommandKind::Polling:
            if (args.empty()) {
                on(SetPollingEnabled{!state_.polling.enabled});
            } else if (args.front() == "on") {
                on(SetPollingEnabled{true});
            } else if (args.front() == "off") {
                on(SetPollingEnabled{false});
            } else {
                show_toast("usage: polling [on|off]", true);
            }
            break;
        case CommandKind::Help:
            state_.overlay = HelpOverlay{};
            break;
        case CommandKind::Quit:
            state_.should_quit = true;
            break;
        }
    }

    auto show_toast(std::string message, bool isError) -> void {
        auto const generation = ++state_.toast_generation;
        state_.toast          = Toast{std::move(message), isError, generation};
        effects_.push_back(SetTimer{state_.toast_duration, TimerId::Toast, generation});
    }

    KindRegistry const&  registry_;
    AppState&            state_;
    std::vector<Effect>& effects_;
};

} // namespace

auto Reducer::reduce(AppState state, Action const& action) const -> Result {
    std::vector<Effect> effects;
    Transition{registry_, state, effects}.apply(action);
    return Result{std::move(state), std::move(effects)};
}

} // namespace T9
