#pragma once
#include <t9s/client/TemporalClient.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace T9 {

struct ServerUrl {
    std::string scheme;
    std::string host;
    std::string base_path; // without trailing slash, empty for the root
    int         port = 0;
    bool        tls  = false;

    bool operator==(ServerUrl const&) const = default;
};

[[nodiscard]] auto ParseServerUrl(std::string_view url) -> std::optional<ServerUrl>;

/**
 * HttpTemporalClient: talks to the Temporal UI server's HTTP API (/api/v1).
 *
 * Requests are blocking and open a fresh connection each time, so concurrent
 * calls from the worker pool share nothing but the CSRF token. Mutating
 * requests fetch that token from /api/v1/settings first and send it back both
 * as X-CSRF-Token and as the _csrf cookie.
 */
class HttpTemporalClient final : public TemporalClient {
public:
    struct Options {
        std::string                address{"http://localhost:8233"};
        std::optional<std::string> api_key;
        int                        page_size = 50;
        std::chrono::seconds       timeout{5};
    };

    [[nodiscard]] static auto Create(Options options) -> Expected<std::unique_ptr<HttpTemporalClient>>;

    auto list_collection(KindId kind, CollectionQuery const& query, std::optional<std::string> const& pageToken)
        -> Expected<Page> override;
    auto describe(KindId kind, std::string const& ns, Identity const& identity) -> Expected<DetailPayload> override;
    auto history(std::string const& ns, WorkflowIdentity const& workflow) -> Expected<std::vector<HistoryEvent>> override;
    auto count_workflows(std::string const& ns, std::optional<std::string> const& filter) -> Expected<WorkflowCount> override;
    auto list_namespaces() -> Expected<std::vector<Namespace>> override;
    auto invoke(std::string const& ns, OperationId op, OperationTarget const& target) -> Expected<void> override;
    auto ping() -> Expected<void> override;

    [[nodiscard]] auto serverUrl() const -> ServerUrl const& { return url_; }

private:
    enum class Method { Get, Post, Delete };

    HttpTemporalClient(Options options, ServerUrl url);

    struct Response;

    auto send(Method method, std::string const& path, std::optional<std::string> const& body) -> Expected<Response>;
    auto request(Method method, std::string const& path, std::optional<std::string> const& body = std::nullopt)
        -> Expected<std::string>;
    auto ensure_csrf() -> std::optional<Error>;
    auto csrf_token() const -> std::optional<std::string>;
    auto remember_csrf(std::string_view setCookie) -> void;

    auto describe_workflow_raw(std::string const& ns, WorkflowIdentity const& workflow) -> Expected<std::string>;

    Options                    options_;
    ServerUrl                  url_;
    mutable std::mutex         csrfMutex_;
    std::optional<std::string> csrf_;
};

} // namespace T9
