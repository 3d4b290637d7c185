#include <t9s/client/TemporalJson.hpp>

#include <cctype>
#include <charconv>
#include <initializer_list>
#include <map>

namespace T9::TemporalJson {

namespace {

constexpr std::string_view kJsonEncoding{"json/plain"};

auto find_path(json const& object, std::initializer_list<std::string_view> path) -> json const* {
    json const* current = &object;
    for (auto key : path) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(std::string{key});
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

auto string_at(json const& object, std::initializer_list<std::string_view> path) -> std::optional<std::string> {
    auto const* value = find_path(object, path);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    auto text = value->get<std::string>();
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

// Temporal's JSON mapping sends int64 values as strings.
auto int_at(json const& object, std::initializer_list<std::string_view> path) -> std::optional<std::int64_t> {
    auto const* value = find_path(object, path);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_integer()) {
        return value->get<std::int64_t>();
    }
    if (value->is_string()) {
        auto const&  text   = value->get_ref<std::string const&>();
        std::int64_t parsed = 0;
        auto         result = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (result.ec == std::errc{} && result.ptr == text.data() + text.size()) {
            return parsed;
        }
    }
    return std::nullopt;
}

auto bool_at(json const& object, std::initializer_list<std::string_view> path) -> std::optional<bool> {
    auto const* value = find_path(object, path);
    if (value == nullptr || !value->is_boolean()) {
        return std::nullopt;
    }
    return value->get<bool>();
}

auto array_at(json const& object, std::initializer_list<std::string_view> path) -> json const* {
    auto const* value = find_path(object, path);
    return value != nullptr && value->is_array() ? value : nullptr;
}

auto is_payload(json const& value) -> bool {
    return value.is_object() && value.contains("data") && value["data"].is_string();
}

auto payload_encoding(json const& payload) -> std::optional<std::string> {
    auto encoded = string_at(payload, {"metadata", "encoding"});
    if (!encoded) {
        return std::nullopt;
    }
    return DecodeBase64(*encoded);
}

// Replaces every payload below value by its decoded form.
auto decode_payloads(json const& value) -> json {
    if (is_payload(value)) {
        auto decoded = DecodeBase64(value["data"].get<std::string>());
        if (!decoded) {
            return value;
        }
        if (payload_encoding(value) == kJsonEncoding) {
            auto parsed = json::parse(*decoded, nullptr, false);
            if (!parsed.is_discarded()) {
                return parsed;
            }
        }
        return *decoded;
    }
    if (value.is_object()) {
        json copy = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            copy[it.key()] = decode_payloads(it.value());
        }
        return copy;
    }
    if (value.is_array()) {
        json copy = json::array();
        for (auto const& item : value) {
            copy.push_back(decode_payloads(item));
        }
        return copy;
    }
    return value;
}

auto payloads_text(json const& holder) -> std::string {
    auto const* payloads = array_at(holder, {"payloads"});
    if (payloads == nullptr) {
        return decode_payloads(holder).dump();
    }
    if (payloads->size() == 1) {
        return PayloadText(payloads->front());
    }
    return decode_payloads(*payloads).dump();
}

auto field_map(json const* fields) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> out;
    if (fields == nullptr || !fields->is_object()) {
        return out;
    }
    for (auto it = fields->begin(); it != fields->end(); ++it) {
        out.emplace(it.key(), PayloadText(it.value()));
    }
    return out;
}

// EVENT_TYPE_WORKFLOW_EXECUTION_STARTED -> WorkflowExecutionStarted
auto normalize_event_type(std::string_view text) -> std::string {
    constexpr std::string_view kPrefix{"EVENT_TYPE_"};
    if (!text.starts_with(kPrefix)) {
        return std::string{text};
    }
    text.remove_prefix(kPrefix.size());
    std::string out;
    bool        upper = true;
    for (char ch : text) {
        if (ch == '_') {
            upper = true;
            continue;
        }
        auto c = static_cast<unsigned char>(ch);
        out.push_back(static_cast<char>(upper ? std::toupper(c) : std::tolower(c)));
        upper = false;
    }
    return out;
}

auto event_details(json const& event) -> std::string {
    json const* attributes = nullptr;
    for (auto it = event.begin(); it != event.end(); ++it) {
        auto const& key = it.key();
        if (it.value().is_object() && (key == "attributes" || key.ends_with("Attributes"))) {
            attributes = &it.value();
            break;
        }
    }
    if (attributes == nullptr) {
        return {};
    }
    if (auto const* input = find_path(*attributes, {"input"})) {
        return payloads_text(*input);
    }
    if (auto const* result = find_path(*attributes, {"result"})) {
        return payloads_text(*result);
    }
    if (auto message = string_at(*attributes, {"failure", "message"})) {
        return *message;
    }
    return decode_payloads(*attributes).dump();
}

auto describe_spec(json const* spec) -> std::string {
    if (spec == nullptr || !spec->is_object()) {
        return {};
    }
    if (auto const* crons = array_at(*spec, {"cronString"}); crons != nullptr && !crons->empty()) {
        std::string text;
        for (auto const& cron : *crons) {
            if (!cron.is_string()) {
                continue;
            }
            if (!text.empty()) {
                text += "; ";
            }
            text += cron.get<std::string>();
        }
        return text;
    }
    if (auto const* intervals = array_at(*spec, {"interval"}); intervals != nullptr && !intervals->empty()) {
        std::string text;
        for (auto const& interval : *intervals) {
            auto every = string_at(interval, {"interval"});
            if (!every) {
                continue;
            }
            if (!text.empty()) {
                text += "; ";
            }
            text += "every " + *every;
            if (auto phase = string_at(interval, {"phase"})) {
                text += " offset " + *phase;
            }
        }
        return text;
    }
    for (auto key : {"structuredCalendar", "calendar"}) {
        if (auto const* calendar = array_at(*spec, {key}); calendar != nullptr && !calendar->empty()) {
            return "calendar (" + std::to_string(calendar->size()) + (calendar->size() == 1 ? " rule)" : " rules)");
        }
    }
    return {};
}

} // namespace

auto DecodeBase64(std::string_view input) -> std::optional<std::string> {
    auto decode_char = [](char ch) -> std::optional<unsigned char> {
        if (ch >= 'A' && ch <= 'Z') {
            return static_cast<unsigned char>(ch - 'A');
        }
        if (ch >= 'a' && ch <= 'z') {
            return static_cast<unsigned char>(26 + ch - 'a');
        }
        if (ch >= '0' && ch <= '9') {
            return static_cast<unsigned char>(52 + ch - '0');
        }
        if (ch == '+' || ch == '-') {
            return static_cast<unsigned char>(62);
        }
        if (ch == '/' || ch == '_') {
            return static_cast<unsigned char>(63);
        }
        return std::nullopt;
    };

    while (!input.empty() && input.back() == '=') {
        input.remove_suffix(1);
    }
    std::string   output;
    std::uint32_t value = 0;
    int           bits  = 0;
    output.reserve((input.size() * 3) / 4);
    for (char ch : input) {
        auto decoded = decode_char(ch);
        if (!decoded) {
            return std::nullopt;
        }
        value = (value << 6) | *decoded;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<char>((value >> bits) & 0xFF));
        }
    }
    return output;
}

auto PayloadText(json const& payload) -> std::string {
    if (payload.is_string()) {
        return payload.get<std::string>();
    }
    auto decoded = decode_payloads(payload);
    if (decoded.is_string()) {
        return decoded.get<std::string>();
    }
    return decoded.dump();
}

auto ParseBody(std::string_view body) -> Expected<json> {
    if (body.empty()) {
        return json::object();
    }
    auto parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedResponse, "response is not valid JSON"});
    }
    return parsed;
}

auto ErrorFromStatus(int status, std::string_view body) -> Error {
    if (status == 0) {
        return Error{Error::Code::ConnectionError, body.empty() ? std::string{"no response from server"} : std::string{body}};
    }

    std::string message = "HTTP " + std::to_string(status);
    auto        parsed  = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (auto text = string_at(parsed, {"message"})) {
            message = *text;
        }
    }

    auto code = Error::Code::UnknownError;
    if (status == 401 || status == 403) {
        code = Error::Code::AuthError;
    } else if (status == 404) {
        code = Error::Code::NotFoundError;
    } else if (status == 400) {
        code = Error::Code::ValidationError;
    } else if (status == 408 || status == 504) {
        code = Error::Code::TimeoutError;
    } else if (status >= 500) {
        code = Error::Code::ServerError;
    }
    return Error{code, std::move(message)};
}

auto CsrfFromSetCookie(std::string_view header) -> std::optional<std::string> {
    constexpr std::string_view kCookie{"_csrf="};
    auto                       start = header.find(kCookie);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    auto value = header.substr(start + kCookie.size());
    value      = value.substr(0, value.find(';'));
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string{value};
}

auto ToWorkflowSummary(json const& raw) -> WorkflowSummary {
    WorkflowSummary summary;
    summary.workflow_id    = string_at(raw, {"execution", "workflowId"}).value_or("");
    summary.run_id         = string_at(raw, {"execution", "runId"}).value_or("");
    summary.workflow_type  = string_at(raw, {"type", "name"}).value_or("");
    summary.status         = parseWorkflowStatus(string_at(raw, {"status"}).value_or(""));
    summary.start_time     = string_at(raw, {"startTime"}).value_or("");
    summary.close_time     = string_at(raw, {"closeTime"});
    summary.task_queue     = string_at(raw, {"taskQueue"}).value_or("");
    summary.history_length = int_at(raw, {"historyLength"});
    return summary;
}

auto ToWorkflowPage(json const& raw) -> Page {
    std::vector<WorkflowSummary> items;
    if (auto const* executions = array_at(raw, {"executions"})) {
        items.reserve(executions->size());
        for (auto const& execution : *executions) {
            items.push_back(ToWorkflowSummary(execution));
        }
    }
    return Page{std::move(items), string_at(raw, {"nextPageToken"})};
}

auto ToPendingActivity(json const& raw) -> PendingActivity {
    PendingActivity activity;
    activity.activity_id       = string_at(raw, {"activityId"}).value_or("");
    activity.activity_type     = string_at(raw, {"activityType", "name"}).value_or("");
    activity.state             = parsePendingActivityState(string_at(raw, {"state"}).value_or(""));
    activity.attempt           = static_cast<int>(int_at(raw, {"attempt"}).value_or(1));
    activity.maximum_attempts  = static_cast<int>(int_at(raw, {"maximumAttempts"}).value_or(0));
    activity.scheduled_time    = string_at(raw, {"scheduledTime"});
    activity.last_started_time = string_at(raw, {"lastStartedTime"});
    activity.expiration_time   = string_at(raw, {"expirationTime"});
    activity.last_failure      = string_at(raw, {"lastFailure", "message"});
    activity.paused            = bool_at(raw, {"paused"}).value_or(activity.state == PendingActivityState::Paused);
    return activity;
}

auto ToWorkflowDetail(json const& raw) -> WorkflowDetail {
    WorkflowDetail detail;
    json const*    info = find_path(raw, {"workflowExecutionInfo"});
    if (info != nullptr && info->is_object()) {
        detail.summary = ToWorkflowSummary(*info);
        if (!detail.summary.history_length) {
            detail.summary.history_length = 0;
        }
        detail.execution_time     = string_at(*info, {"executionTime"});
        detail.parent_workflow_id = string_at(*info, {"parentExecution", "workflowId"});
        detail.memo               = field_map(find_path(*info, {"memo", "fields"}));
        detail.search_attributes  = field_map(find_path(*info, {"searchAttributes", "indexedFields"}));
    }
    if (auto const* pending = array_at(raw, {"pendingActivities"})) {
        for (auto const& activity : *pending) {
            detail.pending_activities.push_back(ToPendingActivity(activity));
        }
    }
    return detail;
}

auto ToHistory(json const& raw) -> std::vector<HistoryEvent> {
    std::vector<HistoryEvent> events;
    auto const*               list = array_at(raw, {"history", "events"});
    if (list == nullptr) {
        list = array_at(raw, {"events"});
    }
    if (list == nullptr) {
        return events;
    }
    events.reserve(list->size());
    for (auto const& event : *list) {
        HistoryEvent out;
        out.event_id   = int_at(event, {"eventId"}).value_or(0);
        out.event_type = normalize_event_type(string_at(event, {"eventType"}).value_or(""));
        out.event_time = string_at(event, {"eventTime"}).value_or("");
        out.details    = event_details(event);
        events.push_back(std::move(out));
    }
    return events;
}

auto ToSchedule(json const& raw, std::optional<std::string> scheduleId) -> Schedule {
    Schedule schedule;
    schedule.schedule_id = scheduleId ? *scheduleId : string_at(raw, {"scheduleId"}).value_or("");

    auto const* start = find_path(raw, {"schedule", "action", "startWorkflow"});
    auto        type  = start != nullptr ? string_at(*start, {"workflowType", "name"}) : std::nullopt;
    if (!type) {
        type = string_at(raw, {"info", "workflowType", "name"});
    }
    schedule.workflow_type = type.value_or("Unknown");
    if (start != nullptr) {
        schedule.task_queue = string_at(*start, {"taskQueue", "name"}).value_or("");
    }

    auto paused = bool_at(raw, {"schedule", "state", "paused"});
    if (!paused) {
        paused = bool_at(raw, {"info", "paused"});
    }
    schedule.state = paused.value_or(false) ? ScheduleState::Paused : ScheduleState::Active;

    schedule.notes = string_at(raw, {"schedule", "state", "notes"});
    if (!schedule.notes) {
        schedule.notes = string_at(raw, {"info", "notes"});
    }

    auto const* spec = find_path(raw, {"schedule", "spec"});
    if (spec == nullptr) {
        spec = find_path(raw, {"info", "spec"});
    }
    schedule.spec_description = describe_spec(spec);

    if (auto const* next = array_at(raw, {"info", "futureActionTimes"}); next != nullptr && !next->empty() && next->front().is_string()) {
        schedule.next_run = next->front().get<std::string>();
    }
    if (auto const* next = array_at(raw, {"info", "nextActionTimes"}); next != nullptr && !next->empty() && next->front().is_string()) {
        schedule.next_run = next->front().get<std::string>();
    }
    if (auto const* recent = array_at(raw, {"info", "recentActions"})) {
        for (auto const& action : *recent) {
            auto when = string_at(action, {"actualTime"});
            if (!when) {
                when = string_at(action, {"scheduleTime"});
            }
            if (when) {
                schedule.recent_actions.push_back(*when);
            }
        }
    }
    schedule.action_count = int_at(raw, {"info", "numActions"}).value_or(0);
    return schedule;
}

auto ToSchedulePage(json const& raw) -> Page {
    std::vector<Schedule> items;
    if (auto const* schedules = array_at(raw, {"schedules"})) {
        items.reserve(schedules->size());
        for (auto const& schedule : *schedules) {
            items.push_back(ToSchedule(schedule));
        }
    }
    return Page{std::move(items), string_at(raw, {"nextPageToken"})};
}

auto ToTaskQueue(json const& raw, std::string name) -> TaskQueueInfo {
    TaskQueueInfo info;
    info.name = std::move(name);
    if (auto const* pollers = array_at(raw, {"pollers"})) {
        for (auto const& poller : *pollers) {
            TaskQueuePoller out;
            out.identity         = string_at(poller, {"identity"}).value_or("");
            out.last_access_time = string_at(poller, {"lastAccessTime"}).value_or("");
            if (auto const* rate = find_path(poller, {"ratePerSecond"}); rate != nullptr && rate->is_number()) {
                out.rate_per_second = rate->get<double>();
            }
            info.pollers.push_back(std::move(out));
        }
    }
    info.backlog_count_hint = int_at(raw, {"taskQueueStatus", "backlogCountHint"});
    return info;
}

auto ToNamespaces(json const& raw) -> std::vector<Namespace> {
    std::vector<Namespace> namespaces;
    auto const*            list = array_at(raw, {"namespaces"});
    if (list == nullptr) {
        return namespaces;
    }
    for (auto const& entry : *list) {
        Namespace ns;
        ns.name = string_at(entry, {"namespaceInfo", "name"}).value_or("");
        if (ns.name.empty()) {
            continue;
        }
        ns.state       = string_at(entry, {"namespaceInfo", "state"}).value_or("");
        ns.description = string_at(entry, {"namespaceInfo", "description"});
        ns.owner_email = string_at(entry, {"namespaceInfo", "ownerEmail"});
        ns.retention   = string_at(entry, {"config", "workflowExecutionRetentionTtl"});
        namespaces.push_back(std::move(ns));
    }
    return namespaces;
}

auto ToWorkflowCount(json const& raw) -> WorkflowCount {
    auto count = int_at(raw, {"count"}).value_or(0);
    return WorkflowCount{count > 0 ? static_cast<std::uint64_t>(count) : 0};
}

} // namespace T9::TemporalJson
