#pragma once
#include <t9s/app/Effect.hpp>
#include <t9s/core/Error.hpp>
#include <t9s/domain/Namespace.hpp>
#include <t9s/domain/Schedule.hpp>
#include <t9s/domain/Workflow.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace T9::TemporalJson {

using json = nlohmann::json;

// Parses a response body; empty bodies become an empty object.
[[nodiscard]] auto ParseBody(std::string_view body) -> Expected<json>;

// Maps an HTTP status to an error code; status 0 means no response at all. The
// message is the body's "message" field when there is one.
[[nodiscard]] auto ErrorFromStatus(int status, std::string_view body) -> Error;

// Extracts the _csrf value from a Set-Cookie header.
[[nodiscard]] auto CsrfFromSetCookie(std::string_view header) -> std::optional<std::string>;

[[nodiscard]] auto ToWorkflowSummary(json const& raw) -> WorkflowSummary;
[[nodiscard]] auto ToWorkflowPage(json const& raw) -> Page;
[[nodiscard]] auto ToWorkflowDetail(json const& raw) -> WorkflowDetail;
[[nodiscard]] auto ToPendingActivity(json const& raw) -> PendingActivity;
[[nodiscard]] auto ToHistory(json const& raw) -> std::vector<HistoryEvent>;

// describe responses do not repeat the schedule id, so it is passed in.
[[nodiscard]] auto ToSchedule(json const& raw, std::optional<std::string> scheduleId = std::nullopt) -> Schedule;
[[nodiscard]] auto ToSchedulePage(json const& raw) -> Page;

[[nodiscard]] auto ToTaskQueue(json const& raw, std::string name) -> TaskQueueInfo;
[[nodiscard]] auto ToNamespaces(json const& raw) -> std::vector<Namespace>;
// The count endpoint answers {"count": "<int64>"}; a missing count reads as zero.
[[nodiscard]] auto ToWorkflowCount(json const& raw) -> WorkflowCount;

// Temporal payloads carry base64 data; a JSON-encoded payload is shown as its
// JSON text, anything else as the decoded bytes.
[[nodiscard]] auto PayloadText(json const& payload) -> std::string;

[[nodiscard]] auto DecodeBase64(std::string_view input) -> std::optional<std::string>;

} // namespace T9::TemporalJson
