#pragma once
#include <t9s/app/Effect.hpp>
#include <t9s/core/Error.hpp>
#include <t9s/domain/Namespace.hpp>
#include <t9s/domain/Workflow.hpp>

#include <optional>
#include <string>
#include <vector>

namespace T9 {

/**
 * TemporalClient: the boundary to the Temporal service.
 *
 * Every call is blocking and may run on any worker thread, so implementations
 * must be safe to call concurrently. Failures come back as Error values with the
 * codes the reducer understands (connection, auth, not_found, validation,
 * timeout, server); implementations do not throw for transport failures.
 */
class TemporalClient {
public:
    virtual ~TemporalClient() = default;

    virtual auto list_collection(KindId kind, CollectionQuery const& query, std::optional<std::string> const& pageToken)
        -> Expected<Page> = 0;

    virtual auto describe(KindId kind, std::string const& ns, Identity const& identity) -> Expected<DetailPayload> = 0;

    virtual auto history(std::string const& ns, WorkflowIdentity const& workflow) -> Expected<std::vector<HistoryEvent>> = 0;

    // Number of workflow executions matching filter (all of them when absent).
    virtual auto count_workflows(std::string const& ns, std::optional<std::string> const& filter) -> Expected<WorkflowCount> = 0;

    virtual auto list_namespaces() -> Expected<std::vector<Namespace>> = 0;

    virtual auto invoke(std::string const& ns, OperationId op, OperationTarget const& target) -> Expected<void> = 0;

    // Reachability check used for reconnects.
    virtual auto ping() -> Expected<void> = 0;
};

} // namespace T9
