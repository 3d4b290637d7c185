#pragma once
#include <t9s/core/Error.hpp>
#include <t9s/nav/Location.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace T9 {

class KindRegistry;

inline constexpr std::string_view kUriScheme{"temporal"};
inline constexpr std::string_view kUriAuthority{"tui"};

struct RouteError {
    enum class Code {
        InvalidScheme = 0,
        InvalidAuthority,
        MissingNamespace,
        UnknownKind,
        InvalidPath,
        UnsupportedRoute,
        MalformedQuery,
        InvalidIdentity
    };

    Code        code;
    std::string detail;

    bool operator==(RouteError const&) const = default;
};

[[nodiscard]] auto routeErrorCodeToString(RouteError::Code code) -> std::string_view;
[[nodiscard]] auto toError(RouteError const& error) -> Error;

/**
 * Parses temporal://tui/namespaces/{ns}/{segment}[/{id}[/{child}[/{child-id}]]][?query].
 *
 * Segment tokens and identities are resolved through the registry. The result is
 * already canonical: a child detail whose kind is addressable from the root is
 * re-rooted, so schedules/s/workflows/w and workflows/w parse to the same value.
 */
[[nodiscard]] auto ParseDeepLink(std::string_view uri, KindRegistry const& registry) -> std::expected<Location, RouteError>;

// Never reads the string a Location was parsed from; query keys come out sorted.
[[nodiscard]] auto FormatDeepLink(Location const& location, KindRegistry const& registry) -> std::string;

// Applies the alias rules ParseDeepLink applies. Idempotent.
[[nodiscard]] auto CanonicalLocation(Location location, KindRegistry const& registry) -> Location;

struct Breadcrumb {
    std::string label;
    Location    location;

    bool operator==(Breadcrumb const&) const = default;
};

// Root to leaf; the last crumb's location is the input location itself.
[[nodiscard]] auto DeriveBreadcrumbs(Location const& location, KindRegistry const& registry) -> std::vector<Breadcrumb>;

[[nodiscard]] auto PercentEncode(std::string_view value) -> std::string;
// Returns nullopt on a truncated or non-hex escape. plus_as_space is for query strings.
[[nodiscard]] auto PercentDecode(std::string_view value, bool plus_as_space) -> std::optional<std::string>;

} // namespace T9
