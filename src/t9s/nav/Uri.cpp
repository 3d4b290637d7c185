#include <t9s/nav/Uri.hpp>

#include <t9s/kinds/KindRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>

namespace T9 {

namespace {

constexpr std::string_view kNamespacesSegment{"namespaces"};
constexpr std::size_t      kMaxRouteDepth = 2;

auto fail(RouteError::Code code, std::string detail) -> std::unexpected<RouteError> {
    t9_log("ParseDeepLink failed: " + detail, "Uri");
    return std::unexpected(RouteError{code, std::move(detail)});
}

auto hex_value(char ch) -> int {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + (ch - 'A');
    }
    return -1;
}

auto split(std::string_view text, char delimiter) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t                   start = 0;
    while (true) {
        auto pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

auto parse_query(std::string_view text) -> std::expected<QueryMap, RouteError> {
    QueryMap query;
    if (text.empty()) {
        return query;
    }
    for (auto pair : split(text, '&')) {
        if (pair.empty()) {
            continue;
        }
        auto             equals = pair.find('=');
        std::string_view rawKey = pair.substr(0, equals);
        std::string_view rawValue;
        if (equals != std::string_view::npos) {
            rawValue = pair.substr(equals + 1);
        }
        auto key   = PercentDecode(rawKey, true);
        auto value = PercentDecode(rawValue, true);
        if (!key || !value) {
            return fail(RouteError::Code::MalformedQuery, "bad percent escape in '" + std::string{pair} + "'");
        }
        if (key->empty()) {
            return fail(RouteError::Code::MalformedQuery, "empty query key in '" + std::string{pair} + "'");
        }
        query.insert_or_assign(std::move(*key), std::move(*value));
    }
    return query;
}

// Keeps the run id in one place: the workflow identity at the root of the route.
void fold_run_id(Location& location) {
    if (location.route.empty() || !location.route.front().id) {
        return;
    }
    auto* workflow = std::get_if<WorkflowIdentity>(&*location.route.front().id);
    if (workflow == nullptr) {
        return;
    }
    auto it = location.query.find(std::string{kQueryRunId});
    if (it != location.query.end()) {
        if (!workflow->run_id && !it->second.empty()) {
            workflow->run_id = it->second;
        }
        location.query.erase(it);
    }
    for (std::size_t i = 1; i < location.route.size(); ++i) {
        if (!location.route[i].id) {
            continue;
        }
        if (auto* activity = std::get_if<ActivityIdentity>(&*location.route[i].id)) {
            activity->workflow_id = workflow->workflow_id;
            activity->run_id      = workflow->run_id;
        }
    }
}

} // namespace

auto routeErrorCodeToString(RouteError::Code code) -> std::string_view {
    switch (code) {
    case RouteError::Code::InvalidScheme:
        return "invalid_scheme";
    case RouteError::Code::InvalidAuthority:
        return "invalid_authority";
    case RouteError::Code::MissingNamespace:
        return "missing_namespace";
    case RouteError::Code::UnknownKind:
        return "unknown_kind";
    case RouteError::Code::InvalidPath:
        return "invalid_path";
    case RouteError::Code::UnsupportedRoute:
        return "unsupported_route";
    case RouteError::Code::MalformedQuery:
        return "malformed_query";
    case RouteError::Code::InvalidIdentity:
        return "invalid_identity";
    }
    return "invalid_path";
}

auto toError(RouteError const& error) -> Error {
    std::string message{routeErrorCodeToString(error.code)};
    if (!error.detail.empty()) {
        message.append(": ");
        message.append(error.detail);
    }
    return Error{Error::Code::RoutingError, std::move(message)};
}

auto PercentEncode(std::string_view value) -> std::string {
    static constexpr char kHexDigits[] = "0123456789ABCDEF";
    std::string           encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char ch : value) {
        bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-'
                          || ch == '.' || ch == '_' || ch == '~';
        if (unreserved) {
            encoded.push_back(static_cast<char>(ch));
        } else {
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(ch >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[ch & 0x0F]);
        }
    }
    return encoded;
}

auto PercentDecode(std::string_view value, bool plus_as_space) -> std::optional<std::string> {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char ch = value[i];
        if (ch == '%') {
            if (i + 2 >= value.size()) {
                return std::nullopt;
            }
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            decoded.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (ch == '+' && plus_as_space) {
            decoded.push_back(' ');
        } else {
            decoded.push_back(ch);
        }
    }
    return decoded;
}

auto CanonicalLocation(Location location, KindRegistry const& registry) -> Location {
    if (location.route.size() > 1) {
        auto const& leaf = location.route.back();
        if (leaf.id && registry.get(leaf.kind).root_addressable) {
            RouteSegment rerooted = leaf;
            location.route.assign(1, std::move(rerooted));
        }
    }
    fold_run_id(location);
    return location;
}

auto ParseDeepLink(std::string_view uri, KindRegistry const& registry) -> std::expected<Location, RouteError> {
    auto schemeEnd = uri.find("://");
    if (schemeEnd == std::string_view::npos || uri.substr(0, schemeEnd) != kUriScheme) {
        return fail(RouteError::Code::InvalidScheme, "expected " + std::string{kUriScheme} + "://");
    }
    auto rest = uri.substr(schemeEnd + 3);
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    std::string_view queryText;
    if (auto question = rest.find('?'); question != std::string_view::npos) {
        queryText = rest.substr(question + 1);
        rest      = rest.substr(0, question);
    }

    auto             slash     = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (authority != kUriAuthority) {
        return fail(RouteError::Code::InvalidAuthority, "expected authority '" + std::string{kUriAuthority} + "'");
    }
    std::string_view path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);
    if (path.ends_with('/')) {
        path.remove_suffix(1);
    }

    std::vector<std::string> segments;
    if (!path.empty()) {
        for (auto raw : split(path, '/')) {
            auto decoded = PercentDecode(raw, false);
            if (!decoded) {
                return fail(RouteError::Code::InvalidPath, "bad percent escape in '" + std::string{raw} + "'");
            }
            segments.push_back(std::move(*decoded));
        }
    }

    if (segments.size() < 2 || segments[0] != kNamespacesSegment || segments[1].empty()) {
        return fail(RouteError::Code::MissingNamespace, "path must start with /namespaces/{namespace}");
    }

    auto query = parse_query(queryText);
    if (!query) {
        return std::unexpected(query.error());
    }

    Location location;
    location.ns    = segments[1];
    location.query = std::move(*query);

    if (segments.size() == 2) {
        return fail(RouteError::Code::InvalidPath, "missing resource segment");
    }

    std::size_t i = 2;
    while (i < segments.size()) {
        auto const& token = segments[i];
        if (token.empty()) {
            return fail(RouteError::Code::InvalidPath, "empty path segment");
        }
        auto kind = registry.kindForSegment(token);
        if (!kind) {
            return fail(RouteError::Code::UnknownKind, "'" + token + "' is not a resource kind");
        }
        auto const&         spec   = registry.get(*kind);
        RouteSegment const* parent = location.route.empty() ? nullptr : &location.route.back();
        if (location.route.size() >= kMaxRouteDepth) {
            return fail(RouteError::Code::UnsupportedRoute, "routes nest at most " + std::to_string(kMaxRouteDepth) + " levels");
        }
        if (parent == nullptr && !spec.root_addressable) {
            return fail(RouteError::Code::UnsupportedRoute, "'" + token + "' must be nested under its owner");
        }
        if (parent != nullptr) {
            if (!parent->id || !registry.get(parent->kind).allowsChild(*kind)) {
                return fail(RouteError::Code::UnsupportedRoute, "'" + token + "' cannot be nested here");
            }
        }
        ++i;

        RouteSegment segment{*kind, std::nullopt};
        if (i < segments.size()) {
            auto const& rawId = segments[i];
            if (rawId.empty()) {
                return fail(RouteError::Code::InvalidPath, "empty identifier");
            }
            auto identity = spec.identity.parse(rawId, parent, location.query);
            if (!identity) {
                return fail(RouteError::Code::InvalidIdentity, "'" + rawId + "' is not a valid " + spec.label + " identifier");
            }
            segment.id = std::move(*identity);
            ++i;
        }

        if (segment.isCollection() && !spec.collection) {
            return fail(RouteError::Code::UnsupportedRoute, "'" + token + "' has no list view");
        }
        if (!segment.isCollection() && !spec.detail) {
            return fail(RouteError::Code::UnsupportedRoute, "'" + token + "' has no detail view");
        }
        location.route.push_back(std::move(segment));
    }

    return CanonicalLocation(std::move(location), registry);
}

auto FormatDeepLink(Location const& input, KindRegistry const& registry) -> std::string {
    auto     location = CanonicalLocation(input, registry);
    QueryMap query    = location.query;

    std::string out{kUriScheme};
    out.append("://");
    out.append(kUriAuthority);
    out.push_back('/');
    out.append(kNamespacesSegment);
    out.push_back('/');
    out.append(PercentEncode(location.ns));
    for (auto const& segment : location.route) {
        auto const& spec = registry.get(segment.kind);
        out.push_back('/');
        out.append(spec.segment);
        if (segment.id) {
            out.push_back('/');
            out.append(PercentEncode(spec.identity.format(*segment.id, query)));
        }
    }

    bool first = true;
    for (auto const& [key, value] : query) {
        out.push_back(first ? '?' : '&');
        first = false;
        out.append(PercentEncode(key));
        out.push_back('=');
        out.append(PercentEncode(value));
    }
    return out;
}

auto DeriveBreadcrumbs(Location const& location, KindRegistry const& registry) -> std::vector<Breadcrumb> {
    std::vector<Breadcrumb> crumbs;
    Location                prefix{location.ns, {}, {}};
    for (std::size_t i = 0; i < location.route.size(); ++i) {
        auto const& segment = location.route[i];
        auto const& spec    = registry.get(segment.kind);
        if (spec.collection) {
            Location collection = prefix;
            collection.route.push_back(RouteSegment{segment.kind, std::nullopt});
            crumbs.push_back(Breadcrumb{spec.label, std::move(collection)});
        }
        prefix.route.push_back(segment);
        if (segment.id) {
            crumbs.push_back(Breadcrumb{spec.identity.label(*segment.id), prefix});
        }
    }
    if (!crumbs.empty()) {
        crumbs.back().location = location;
    }
    return crumbs;
}

} // namespace T9
