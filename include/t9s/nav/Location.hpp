#pragma once
#include <t9s/kinds/KindId.hpp>
#include <t9s/nav/Identity.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace T9 {

using QueryMap = std::map<std::string, std::string>;

struct RouteSegment {
    KindId                  kind{KindId::WorkflowExecution};
    std::optional<Identity> id;

    [[nodiscard]] auto isCollection() const -> bool { return !id.has_value(); }

    bool operator==(RouteSegment const&) const = default;
};

/**
 * Location: where the UI currently is.
 *
 * route holds the segments root first; the last one is the leaf and is the only
 * segment that decides what gets rendered. A Location is a value: navigation
 * replaces it wholesale. Query keys are kept sorted so equal field values always
 * format to the same string.
 */
struct Location {
    std::string               ns;
    std::vector<RouteSegment> route;
    QueryMap                  query;

    [[nodiscard]] auto leaf() const -> RouteSegment const& { return route.back(); }
    [[nodiscard]] auto parent() const -> RouteSegment const* {
        return route.size() > 1 ? &route[route.size() - 2] : nullptr;
    }
    [[nodiscard]] auto queryValue(std::string_view key) const -> std::optional<std::string> {
        auto it = query.find(std::string{key});
        if (it == query.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool operator==(Location const&) const = default;
};

inline constexpr std::string_view kQueryFilter{"q"};
inline constexpr std::string_view kQueryTab{"tab"};
inline constexpr std::string_view kQueryRunId{"run_id"};

[[nodiscard]] inline auto MakeCollectionLocation(std::string ns, KindId kind) -> Location {
    return Location{std::move(ns), {RouteSegment{kind, std::nullopt}}, {}};
}

[[nodiscard]] inline auto MakeDetailLocation(std::string ns, Identity identity) -> Location {
    auto kind = identityKind(identity);
    if (auto const* activity = std::get_if<ActivityIdentity>(&identity)) {
        Identity workflow = WorkflowIdentity{activity->workflow_id, activity->run_id};
        return Location{std::move(ns),
                        {RouteSegment{KindId::WorkflowExecution, std::move(workflow)}, RouteSegment{kind, std::move(identity)}},
                        {}};
    }
    return Location{std::move(ns), {RouteSegment{kind, std::move(identity)}}, {}};
}

[[nodiscard]] inline auto MakeChildCollectionLocation(std::string ns, Identity parent, KindId child) -> Location {
    auto kind = identityKind(parent);
    return Location{std::move(ns), {RouteSegment{kind, std::move(parent)}, RouteSegment{child, std::nullopt}}, {}};
}

} // namespace T9
