#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif

#include "httplib.h"

#include <t9s/client/HttpTemporalClient.hpp>
#include <t9s/client/TemporalJson.hpp>
#include <t9s/nav/Uri.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <type_traits>
#include <utility>
#include <vector>

namespace T9 {

using json = nlohmann::json;

struct HttpTemporalClient::Response {
    int                      status{0};
    std::string              body;
    std::vector<std::string> set_cookies;
};

namespace {

constexpr std::string_view kApiPrefix{"/api/v1/"};

std::unique_ptr<httplib::ClientImpl> make_http_client(ServerUrl const& url, std::chrono::seconds timeout) {
    std::unique_ptr<httplib::ClientImpl> client;
    if (url.tls) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        auto ssl_client = std::make_unique<httplib::SSLClient>(url.host, url.port);
        ssl_client->enable_server_certificate_verification(true);
        client = std::unique_ptr<httplib::ClientImpl>(std::move(ssl_client));
#else
        return nullptr;
#endif
    } else {
        client = std::make_unique<httplib::ClientImpl>(url.host, url.port);
    }
    int timeout_seconds = static_cast<int>(timeout.count());
    client->set_connection_timeout(timeout_seconds, 0);
    client->set_read_timeout(timeout_seconds, 0);
    client->set_write_timeout(timeout_seconds, 0);
    client->set_follow_location(false);
    client->set_keep_alive(false);
    return client;
}

auto namespace_path(std::string const& ns) -> std::string {
    return "namespaces/" + PercentEncode(ns);
}

auto with_query(std::string path, std::vector<std::pair<std::string, std::string>> const& params) -> std::string {
    char separator = '?';
    for (auto const& [key, value] : params) {
        path.push_back(separator);
        path.append(PercentEncode(key));
        path.push_back('=');
        path.append(PercentEncode(value));
        separator = '&';
    }
    return path;
}

auto workflow_path(std::string const& ns, std::string const& workflowId) -> std::string {
    return namespace_path(ns) + "/workflows/" + PercentEncode(workflowId);
}

auto run_params(std::optional<std::string> const& runId) -> std::vector<std::pair<std::string, std::string>> {
    if (runId && !runId->empty()) {
        return {{"runId", *runId}};
    }
    return {};
}

auto param(OperationTarget const& target, std::string_view key) -> std::optional<std::string> {
    auto it = target.params.find(std::string{key});
    if (it == target.params.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto contains_ignoring_case(std::string_view haystack, std::string_view needle) -> bool {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char lhs, char rhs) {
        return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
    });
    return it != haystack.end();
}

auto wrong_identity(KindId kind) -> Error {
    return Error{Error::Code::ValidationError, std::string{"identity does not match kind "} + std::string{kindName(kind)}};
}

template <typename T>
auto parse_then(Expected<std::string> body, T&& transform) -> Expected<std::invoke_result_t<T, json const&>> {
    if (!body) {
        return std::unexpected(std::move(body.error()));
    }
    auto parsed = TemporalJson::ParseBody(*body);
    if (!parsed) {
        return std::unexpected(std::move(parsed.error()));
    }
    return std::forward<T>(transform)(*parsed);
}

} // namespace

auto ParseServerUrl(std::string_view url) -> std::optional<ServerUrl> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    ServerUrl parsed;
    parsed.scheme = std::string{url.substr(0, scheme_end)};
    if (parsed.scheme == "https") {
        parsed.tls = true;
    } else if (parsed.scheme != "http") {
        return std::nullopt;
    }

    auto             remainder = url.substr(scheme_end + 3);
    auto             slash     = remainder.find('/');
    std::string_view authority = remainder.substr(0, slash);
    if (slash != std::string_view::npos) {
        auto path = remainder.substr(slash);
        while (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }
        parsed.base_path = std::string{path};
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    parsed.port = parsed.tls ? 443 : 80;
    auto colon  = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port_view = authority.substr(colon + 1);
        int  port      = 0;
        auto result    = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
        if (port_view.empty() || result.ec != std::errc{} || result.ptr != port_view.data() + port_view.size() || port <= 0
            || port > 65535) {
            return std::nullopt;
        }
        parsed.port = port;
        authority   = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    parsed.host = std::string{authority};
    return parsed;
}

auto HttpTemporalClient::Create(Options options) -> Expected<std::unique_ptr<HttpTemporalClient>> {
    auto url = ParseServerUrl(options.address);
    if (!url) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "invalid server address: " + options.address});
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url->tls) {
        return std::unexpected(Error{Error::Code::Unavailable, "https requires a build with OpenSSL"});
    }
#endif
    if (options.page_size <= 0) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "page size must be positive"});
    }
    return std::unique_ptr<HttpTemporalClient>(new HttpTemporalClient(std::move(options), std::move(*url)));
}

HttpTemporalClient::HttpTemporalClient(Options options, ServerUrl url)
    : options_(std::move(options)), url_(std::move(url)) {}

auto HttpTemporalClient::send(Method method, std::string const& path, std::optional<std::string> const& body)
    -> Expected<Response> {
    auto client = make_http_client(url_, options_.timeout);
    if (!client) {
        return std::unexpected(Error{Error::Code::Unavailable, "http client unavailable"});
    }

    httplib::Headers headers{{"Accept", "application/json"}};
    if (options_.api_key && !options_.api_key->empty()) {
        headers.emplace("Authorization", "Bearer " + *options_.api_key);
    }
    if (method != Method::Get) {
        if (auto token = csrf_token()) {
            headers.emplace("X-CSRF-Token", *token);
            headers.emplace("Cookie", "_csrf=" + *token);
        }
    }

    auto full = url_.base_path;
    full.append(kApiPrefix);
    full.append(path);

    httplib::Result result;
    switch (method) {
    case Method::Get:
        result = client->Get(full, headers);
        break;
    case Method::Post:
        result = client->Post(full, headers, body.value_or("{}"), "application/json");
        break;
    case Method::Delete:
        result = client->Delete(full, headers);
        break;
    }
    if (!result) {
        auto reason = httplib::to_string(result.error());
        t9_log("request failed: " + full + " (" + reason + ")", "HttpTemporalClient", "Error");
        return std::unexpected(TemporalJson::ErrorFromStatus(0, reason));
    }

    Response response{result->status, result->body, {}};
    auto     cookies = result->headers.equal_range("Set-Cookie");
    for (auto it = cookies.first; it != cookies.second; ++it) {
        response.set_cookies.push_back(it->second);
    }
    return response;
}

auto HttpTemporalClient::request(Method method, std::string const& path, std::optional<std::string> const& body)
    -> Expected<std::string> {
    if (method != Method::Get) {
        if (auto error = ensure_csrf()) {
            return std::unexpected(std::move(*error));
        }
    }
    auto response = send(method, path, body);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    for (auto const& cookie : response->set_cookies) {
        remember_csrf(cookie);
    }
    if (response->status < 200 || response->status >= 300) {
        t9_log("HTTP " + std::to_string(response->status) + " for " + path, "HttpTemporalClient", "Error");
        return std::unexpected(TemporalJson::ErrorFromStatus(response->status, response->body));
    }
    return std::move(response->body);
}

auto HttpTemporalClient::ensure_csrf() -> std::optional<Error> {
    if (csrf_token()) {
        return std::nullopt;
    }
    // Only a missing server is fatal here; the mutation itself reports anything else.
    auto response = send(Method::Get, "settings", std::nullopt);
    if (!response) {
        return response.error();
    }
    for (auto const& cookie : response->set_cookies) {
        remember_csrf(cookie);
    }
    return std::nullopt;
}

auto HttpTemporalClient::csrf_token() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(csrfMutex_);
    return csrf_;
}

auto HttpTemporalClient::remember_csrf(std::string_view setCookie) -> void {
    if (auto token = TemporalJson::CsrfFromSetCookie(setCookie)) {
        std::lock_guard<std::mutex> lock(csrfMutex_);
        csrf_ = std::move(*token);
    }
}

auto HttpTemporalClient::describe_workflow_raw(std::string const& ns, WorkflowIdentity const& workflow)
    -> Expected<std::string> {
    return request(Method::Get, with_query(workflow_path(ns, workflow.workflow_id), run_params(workflow.run_id)));
}

auto HttpTemporalClient::list_collection(KindId kind, CollectionQuery const& query, std::optional<std::string> const& pageToken)
    -> Expected<Page> {
    switch (kind) {
    case KindId::WorkflowExecution: {
        std::vector<std::pair<std::string, std::string>> params;
        if (query.filter && !query.filter->empty()) {
            params.emplace_back("query", *query.filter);
        }
        params.emplace_back("pageSize", std::to_string(options_.page_size));
        if (pageToken && !pageToken->empty()) {
            params.emplace_back("nextPageToken", *pageToken);
        }
        return parse_then(request(Method::Get, with_query(namespace_path(query.ns) + "/workflows", params)),
                          [](json const& raw) { return TemporalJson::ToWorkflowPage(raw); });
    }
    case KindId::Schedule: {
        auto page = parse_then(request(Method::Get, namespace_path(query.ns) + "/schedules"),
                               [](json const& raw) { return TemporalJson::ToSchedulePage(raw); });
        if (!page || !query.filter || query.filter->empty()) {
            return page;
        }
        // The schedules endpoint takes no query, so filters match id or type locally.
        auto& schedules = std::get<std::vector<Schedule>>(page->items);
        std::erase_if(schedules, [&](Schedule const& schedule) {
            return !contains_ignoring_case(schedule.schedule_id, *query.filter)
                   && !contains_ignoring_case(schedule.workflow_type, *query.filter);
        });
        return page;
    }
    case KindId::Activity: {
        auto const* parent = query.parent ? std::get_if<WorkflowIdentity>(&*query.parent) : nullptr;
        if (parent == nullptr) {
            return std::unexpected(Error{Error::Code::ValidationError, "activities are listed per workflow"});
        }
        return parse_then(describe_workflow_raw(query.ns, *parent), [](json const& raw) {
            return Page{TemporalJson::ToWorkflowDetail(raw).pending_activities, std::nullopt};
        });
    }
    case KindId::TaskQueue:
        break;
    }
    return std::unexpected(Error{Error::Code::OperationNotFound, std::string{kindName(kind)} + " has no collection"});
}

auto HttpTemporalClient::describe(KindId kind, std::string const& ns, Identity const& identity) -> Expected<DetailPayload> {
    if (identityKind(identity) != kind) {
        return std::unexpected(wrong_identity(kind));
    }
    switch (kind) {
    case KindId::WorkflowExecution:
        return parse_then(describe_workflow_raw(ns, std::get<WorkflowIdentity>(identity)),
                          [](json const& raw) -> DetailPayload { return TemporalJson::ToWorkflowDetail(raw); });
    case KindId::Schedule: {
        auto const& id = std::get<ScheduleIdentity>(identity).schedule_id;
        return parse_then(request(Method::Get, namespace_path(ns) + "/schedules/" + PercentEncode(id)),
                          [&id](json const& raw) -> DetailPayload { return TemporalJson::ToSchedule(raw, id); });
    }
    case KindId::Activity: {
        auto const& activity = std::get<ActivityIdentity>(identity);
        auto        detail   = parse_then(describe_workflow_raw(ns, WorkflowIdentity{activity.workflow_id, activity.run_id}),
                                          [](json const& raw) { return TemporalJson::ToWorkflowDetail(raw); });
        if (!detail) {
            return std::unexpected(std::move(detail.error()));
        }
        for (auto& pending : detail->pending_activities) {
            if (pending.activity_id == activity.activity_id) {
                return DetailPayload{std::move(pending)};
            }
        }
        return std::unexpected(Error{Error::Code::NotFoundError, "activity " + activity.activity_id + " is not pending"});
    }
    case KindId::TaskQueue: {
        auto const& name = std::get<TaskQueueIdentity>(identity).name;
        return parse_then(request(Method::Get, namespace_path(ns) + "/task-queues/" + PercentEncode(name)),
                          [&name](json const& raw) -> DetailPayload { return TemporalJson::ToTaskQueue(raw, name); });
    }
    }
    return std::unexpected(wrong_identity(kind));
}

auto HttpTemporalClient::history(std::string const& ns, WorkflowIdentity const& workflow) -> Expected<std::vector<HistoryEvent>> {
    return parse_then(request(Method::Get, with_query(workflow_path(ns, workflow.workflow_id) + "/history", run_params(workflow.run_id))),
                      [](json const& raw) { return TemporalJson::ToHistory(raw); });
}

auto HttpTemporalClient::count_workflows(std::string const& ns, std::optional<std::string> const& filter) -> Expected<WorkflowCount> {
    std::vector<std::pair<std::string, std::string>> params;
    if (filter && !filter->empty()) {
        params.emplace_back("query", *filter);
    }
    return parse_then(request(Method::Get, with_query(namespace_path(ns) + "/workflows/count", params)),
                      [](json const& raw) { return TemporalJson::ToWorkflowCount(raw); });
}

auto HttpTemporalClient::list_namespaces() -> Expected<std::vector<Namespace>> {
    return parse_then(request(Method::Get, "namespaces"), [](json const& raw) { return TemporalJson::ToNamespaces(raw); });
}

auto HttpTemporalClient::invoke(std::string const& ns, OperationId op, OperationTarget const& target) -> Expected<void> {
    auto discard = [](Expected<std::string> result) -> Expected<void> {
        if (!result) {
            return std::unexpected(std::move(result.error()));
        }
        return {};
    };

    switch (op) {
    case OperationId::CancelWorkflow:
    case OperationId::TerminateWorkflow:
    case OperationId::SignalWorkflow: {
        auto const* workflow = std::get_if<WorkflowIdentity>(&target.identity);
        if (workflow == nullptr) {
            return std::unexpected(wrong_identity(KindId::WorkflowExecution));
        }
        auto base = workflow_path(ns, workflow->workflow_id);
        if (op == OperationId::CancelWorkflow) {
            return discard(request(Method::Post, base + "/cancel"));
        }
        if (op == OperationId::TerminateWorkflow) {
            json body = json::object();
            if (auto reason = param(target, kParamReason)) {
                body["reason"] = *reason;
            }
            return discard(request(Method::Post, base + "/terminate", body.dump()));
        }
        auto name = param(target, kParamSignalName);
        if (!name || name->empty()) {
            return std::unexpected(Error{Error::Code::ValidationError, "signal name is required"});
        }
        json body{{"signalName", *name}};
        if (auto input = param(target, kParamInput); input && !input->empty()) {
            auto parsed = json::parse(*input, nullptr, false);
            if (parsed.is_discarded()) {
                return std::unexpected(Error{Error::Code::ValidationError, "signal input is not valid JSON"});
            }
            body["input"] = std::move(parsed);
        }
        return discard(request(Method::Post, base + "/signal", body.dump()));
    }
    case OperationId::PauseSchedule:
    case OperationId::TriggerSchedule:
    case OperationId::DeleteSchedule: {
        auto const* schedule = std::get_if<ScheduleIdentity>(&target.identity);
        if (schedule == nullptr) {
            return std::unexpected(wrong_identity(KindId::Schedule));
        }
        auto base = namespace_path(ns) + "/schedules/" + PercentEncode(schedule->schedule_id);
        if (op == OperationId::DeleteSchedule) {
            return discard(request(Method::Delete, base));
        }
        if (op == OperationId::TriggerSchedule) {
            return discard(request(Method::Post, base + "/trigger"));
        }
        bool pause = param(target, kParamPause).value_or("true") == "true";
        return discard(request(Method::Post, base + (pause ? "/pause" : "/unpause")));
    }
    case OperationId::PauseActivity:
    case OperationId::UnpauseActivity:
    case OperationId::ResetActivity: {
        auto const* activity = std::get_if<ActivityIdentity>(&target.identity);
        if (activity == nullptr) {
            return std::unexpected(wrong_identity(KindId::Activity));
        }
        std::string_view verb = op == OperationId::PauseActivity     ? "pause"
                                : op == OperationId::UnpauseActivity ? "unpause"
                                                                     : "reset";
        json body{{"workflowId", activity->workflow_id}, {"activityId", activity->activity_id}};
        return discard(request(Method::Post, namespace_path(ns) + "/activities/" + std::string{verb}, body.dump()));
    }
    }
    return std::unexpected(Error{Error::Code::OperationNotFound, std::string{operationName(op)}});
}

auto HttpTemporalClient::ping() -> Expected<void> {
    auto result = request(Method::Get, "settings");
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }
    return {};
}

} // namespace T9
