#pragma once
#include <t9s/client/TemporalClient.hpp>
#include <t9s/domain/Schedule.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace T9 {

/**
 * DemoTemporalClient: an in-memory Temporal service seeded with sample data.
 *
 * Backs `t9s --demo` and the runtime tests. Operations mutate the seeded state
 * the way the server would (cancel closes the run, trigger starts a scheduled
 * run, and so on). Workflow filters understand the `Key = 'value'` clauses the
 * app itself produces, joined with AND.
 */
class DemoTemporalClient final : public TemporalClient {
public:
    struct Options {
        int page_size = 50;
    };

    DemoTemporalClient();
    explicit DemoTemporalClient(Options options);

    auto list_collection(KindId kind, CollectionQuery const& query, std::optional<std::string> const& pageToken)
        -> Expected<Page> override;
    auto describe(KindId kind, std::string const& ns, Identity const& identity) -> Expected<DetailPayload> override;
    auto history(std::string const& ns, WorkflowIdentity const& workflow) -> Expected<std::vector<HistoryEvent>> override;
    auto count_workflows(std::string const& ns, std::optional<std::string> const& filter) -> Expected<WorkflowCount> override;
    auto list_namespaces() -> Expected<std::vector<Namespace>> override;
    auto invoke(std::string const& ns, OperationId op, OperationTarget const& target) -> Expected<void> override;
    auto ping() -> Expected<void> override;

    // While unreachable every call fails with a connection error.
    auto setReachable(bool reachable) -> void;
    [[nodiscard]] auto callCount() const -> std::size_t;

private:
    struct StoredWorkflow {
        std::string                ns;
        WorkflowDetail             detail;
        std::vector<HistoryEvent>  history;
        std::optional<std::string> scheduled_by;
    };

    struct StoredSchedule {
        std::string ns;
        Schedule    schedule;
    };

    auto seed() -> void;
    auto add_workflow(std::string ns, WorkflowSummary summary, std::string input) -> StoredWorkflow&;
    auto find_workflow(std::string const& ns, WorkflowIdentity const& identity) -> StoredWorkflow*;
    // Caller holds mutex_.
    auto matching_workflows(std::string const& ns, std::optional<std::string> const& filter)
        -> Expected<std::vector<WorkflowSummary>>;
    auto find_schedule(std::string const& ns, std::string const& id) -> StoredSchedule*;
    auto next_time() -> std::string;
    auto unreachable() -> std::optional<Error>;

    auto close_workflow(StoredWorkflow& workflow, WorkflowStatus status, std::string eventType, std::string details)
        -> Expected<void>;
    auto append_event(StoredWorkflow& workflow, std::string eventType, std::string details) -> void;

    Options                     options_;
    mutable std::mutex          mutex_;
    std::vector<StoredWorkflow> workflows_;
    std::vector<StoredSchedule> schedules_;
    std::vector<TaskQueueInfo>  taskQueues_;
    std::vector<Namespace>      namespaces_;
    int                         clock_ = 0;
    std::uint64_t               runCounter_ = 0;
    std::atomic<bool>           reachable_{true};
    std::atomic<std::size_t>    calls_{0};
};

} // namespace T9
