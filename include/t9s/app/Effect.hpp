#pragma once
#include <t9s/domain/Namespace.hpp>
#include <t9s/domain/Schedule.hpp>
#include <t9s/domain/Workflow.hpp>
#include <t9s/kinds/KindId.hpp>
#include <t9s/nav/Identity.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace T9 {

// What a list request asks for, minus the paging cursor. Two requests with equal
// queries address the same collection; completions are matched on this.
struct CollectionQuery {
    std::string                ns;
    std::optional<std::string> filter;
    std::optional<Identity>    parent;

    bool operator==(CollectionQuery const&) const = default;
};

struct OperationTarget {
    KindId                             kind{KindId::WorkflowExecution};
    Identity                           identity;
    std::map<std::string, std::string> params;

    bool operator==(OperationTarget const&) const = default;
};

inline constexpr std::string_view kParamSignalName{"signal_name"};
inline constexpr std::string_view kParamInput{"input"};
inline constexpr std::string_view kParamReason{"reason"};
inline constexpr std::string_view kParamPause{"pause"};

using CollectionItems = std::variant<std::vector<WorkflowSummary>, std::vector<Schedule>, std::vector<PendingActivity>>;

struct Page {
    CollectionItems            items;
    std::optional<std::string> next_page_token;

    bool operator==(Page const&) const = default;
};

using DetailPayload = std::variant<WorkflowDetail, Schedule, PendingActivity, TaskQueueInfo>;

// Total number of workflow executions matching a list query.
struct WorkflowCount {
    std::uint64_t count = 0;

    bool operator==(WorkflowCount const&) const = default;
};

enum class TimerId : std::uint8_t {
    Toast = 0,
    Reconnect
};

struct LoadCollection {
    KindId                     kind{KindId::WorkflowExecution};
    CollectionQuery            query;
    std::optional<std::string> page_token;

    bool operator==(LoadCollection const&) const = default;
};

struct LoadDetail {
    KindId      kind{KindId::WorkflowExecution};
    std::string ns;
    Identity    identity;

    bool operator==(LoadDetail const&) const = default;
};

struct LoadHistory {
    std::string      ns;
    WorkflowIdentity workflow;

    bool operator==(LoadHistory const&) const = default;
};

struct LoadWorkflowCount {
    CollectionQuery query;

    bool operator==(LoadWorkflowCount const&) const = default;
};

struct LoadNamespaces {
    bool operator==(LoadNamespaces const&) const = default;
};

struct RunOperation {
    std::string     ns;
    OperationId     op{OperationId::CancelWorkflow};
    OperationTarget target;

    bool operator==(RunOperation const&) const = default;
};

struct SetTimer {
    std::chrono::milliseconds delay{0};
    TimerId                   timer{TimerId::Toast};
    std::uint64_t             generation{0};

    bool operator==(SetTimer const&) const = default;
};

struct CheckConnection {
    bool operator==(CheckConnection const&) const = default;
};

using Effect = std::variant<LoadCollection,
                            LoadDetail,
                            LoadHistory,
                            LoadWorkflowCount,
                            LoadNamespaces,
                            RunOperation,
                            SetTimer,
                            CheckConnection>;

// The subset of effects whose completion is a DataLoaded/DataLoadFailed pair.
using LoadRequest = std::variant<LoadCollection, LoadDetail, LoadHistory, LoadWorkflowCount, LoadNamespaces>;
using LoadPayload = std::variant<Page, DetailPayload, std::vector<HistoryEvent>, WorkflowCount, std::vector<Namespace>>;

[[nodiscard]] inline auto requestKind(LoadRequest const& request) -> std::optional<KindId> {
    if (auto const* collection = std::get_if<LoadCollection>(&request)) {
        return collection->kind;
    }
    if (auto const* detail = std::get_if<LoadDetail>(&request)) {
        return detail->kind;
    }
    if (std::holds_alternative<LoadHistory>(request) || std::holds_alternative<LoadWorkflowCount>(request)) {
        return KindId::WorkflowExecution;
    }
    return std::nullopt;
}

} // namespace T9
