#pragma once
#include <t9s/app/Effect.hpp>
#include <t9s/input/KeyEvent.hpp>
#include <t9s/kinds/KindId.hpp>
#include <t9s/nav/Location.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace T9 {

struct AppState;

struct Column {
    std::string title;
    int         width = 0; // 0 takes the remaining space
};

using Row = std::vector<std::string>;

/**
 * IdentitySpec: the only place that knows how a kind's identity looks in a URI.
 *
 * parse receives the raw (already percent-decoded) path token, the parent segment
 * when the kind is nested, and the query map. It may consume query keys that
 * belong to the identity (run_id for workflows). format is the inverse and adds
 * those keys back.
 */
struct IdentitySpec {
    std::function<std::optional<Identity>(std::string_view token, RouteSegment const* parent, QueryMap& query)> parse;
    std::function<std::string(Identity const& identity, QueryMap& query)>                                     format;
    std::function<std::string(Identity const& identity)>                                                      label;
};

struct CollectionSpec {
    std::vector<Column>                                                    columns;
    std::function<std::vector<Row>(AppState const& state)>                 rows;
    std::function<bool(AppState const& state)>                             is_loading;
    std::function<std::optional<Identity>(AppState const&, std::size_t)>   row_identity;
    // Filter implied by the parent segment of a nested collection.
    std::function<std::optional<std::string>(RouteSegment const& parent)> base_filter;
    bool                                                                   supports_filter = false;
    bool                                                                   pollable        = true;
    bool                                                                   paged           = false;
    std::string                                                            empty_label{"Nothing to show"};
};

struct DetailTab {
    std::string name;
    std::string slug;
    std::vector<std::string> aliases;
};

struct DetailSpec {
    std::vector<DetailTab>                                                          tabs;
    std::function<std::vector<std::string>(AppState const& state, std::size_t tab)> lines;
    // Extra loads a tab needs besides the detail payload itself.
    std::function<std::vector<Effect>(std::string const& ns, Identity const& identity, std::size_t tab)> companion_loads;
    // Where Enter leads from the given tab, if anywhere.
    std::function<std::optional<Location>(AppState const& state, std::size_t tab)> select;
    bool pollable = true;

    [[nodiscard]] auto tabIndex(std::optional<std::string> const& slug) const -> std::size_t;
};

struct OperationSpec {
    OperationId                                                                         id{OperationId::CancelWorkflow};
    std::string                                                                         label;
    std::optional<KeyBinding>                                                           key;
    bool                                                                                requires_confirmation = false;
    // The operation makes its target disappear; the UI leaves its detail view.
    bool                                                                                removes_target = false;
    std::function<bool(AppState const& state)>                                          applicability;
    std::function<std::vector<Effect>(OperationTarget const& target, AppState const&)> to_effects;
};

struct KindSpec {
    KindId                        id{KindId::WorkflowExecution};
    std::string                   label;
    std::string                   segment;
    std::vector<std::string>      aliases;
    bool                          root_addressable = true;
    std::vector<KindId>           children;
    IdentitySpec                  identity;
    std::optional<CollectionSpec> collection;
    std::optional<DetailSpec>     detail;
    std::vector<OperationSpec>    operations;

    [[nodiscard]] auto acceptsSegment(std::string_view token) const -> bool;
    [[nodiscard]] auto findOperation(OperationId op) const -> OperationSpec const*;
    [[nodiscard]] auto allowsChild(KindId child) const -> bool;
};

} // namespace T9
