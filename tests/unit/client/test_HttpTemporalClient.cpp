#include <t9s/client/HttpTemporalClient.hpp>

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include "httplib.h"

#include <nlohmann/json.hpp>
#include <doctest/doctest.h>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace T9;

namespace {

struct Recorded {
    std::string method;
    std::string path;
    std::string query;
    std::string csrf_header;
    std::string authorization;
    std::string body;
};

// A loopback stand-in for the Temporal UI server's /api/v1 routes.
class FakeUiServer {
public:
    explicit FakeUiServer(std::string prefix = {})
        : prefix_(std::move(prefix)) {
        auto api = prefix_ + "/api/v1";

        server_.Get(api + "/settings", [this](httplib::Request const& req, httplib::Response& res) {
            record("GET", req);
            res.set_header("Set-Cookie", "_csrf=tok-1; Path=/; HttpOnly");
            res.set_content("{}", "application/json");
        });
        server_.Get(api + "/namespaces", [this](httplib::Request const& req, httplib::Response& res) {
            record("GET", req);
            res.set_content(R"({"namespaces":[{"namespaceInfo":{"name":"default","state":"NAMESPACE_STATE_REGISTERED"}}]})",
                            "application/json");
        });
        server_.Get(api + "/namespaces/default/workflows", [this](httplib::Request const& req, httplib::Response& res) {
            record("GET", req);
            res.set_content(R"({"executions":[{"execution":{"workflowId":"order-1","runId":"r1"},"type":{"name":"OrderWorkflow"},)"
                            R"("status":"WORKFLOW_EXECUTION_STATUS_RUNNING","startTime":"2024-01-15T08:00:00Z"}],"nextPageToken":"next-1"})",
                            "application/json");
        });
        server_.Get(api + "/namespaces/default/workflows/count", [this](httplib::Request const& req, httplib::Response& res) {
            record("GET", req);
            res.set_content(R"({"count":"1234"})", "application/json");
        });
        server_.Get(api + "/namespaces/default/workflows/missing", [this](httplib::Request const& req, httplib::Response& res) {
            record("GET", req);
            res.status = 404;
            res.set_content(R"({"code":5,"message":"workflow not found"})", "application/json");
        });
        server_.Get(api + "/namespaces/default/workflows/garbled", [this](httplib::Request const& req, httplib::Response& res) {
            record("GET", req);
            res.set_content("<html>", "text/html");
        });
        server_.Get(api + "/namespaces/default/workflows/order-1", [this](httplib::Request const& req, httplib::Response& res) {
            record("GET", req);
            res.set_content(R"({"workflowExecutionInfo":{"execution":{"workflowId":"order-1","runId":"r1"},"status":"RUNNING"},)"
                            R"("pendingActivities":[{"activityId":"7","activityType":{"name":"Ship"},"attempt":2}]})",
                            "application/json");
        });
        server_.Get(api + "/namespaces/default/schedules", [this](httplib::Request const& req, httplib::Response& res) {
            record("GET", req);
            res.set_content(R"({"schedules":[{"scheduleId":"payroll-weekly","info":{"workflowType":{"name":"PayrollWorkflow"}}},)"
                            R"({"scheduleId":"cleanup","info":{"workflowType":{"name":"CleanupWorkflow"}}}]})",
                            "application/json");
        });
        server_.Post(api + "/namespaces/default/workflows/order-1/cancel", [this](httplib::Request const& req, httplib::Response& res) {
            record("POST", req);
            res.set_content("{}", "application/json");
        });
        server_.Post(api + "/namespaces/default/workflows/order-1/terminate",
                     [this](httplib::Request const& req, httplib::Response& res) {
                         record("POST", req);
                         res.set_content("{}", "application/json");
                     });
        server_.Post(api + "/namespaces/default/workflows/order-1/signal", [this](httplib::Request const& req, httplib::Response& res) {
            record("POST", req);
            res.set_content("{}", "application/json");
        });
        server_.Delete(api + "/namespaces/default/schedules/payroll-weekly",
                       [this](httplib::Request const& req, httplib::Response& res) {
                           record("DELETE", req);
                           res.status = 403;
                           res.set_content(R"({"message":"permission denied"})", "application/json");
                       });

        port_   = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeUiServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    FakeUiServer(FakeUiServer const&)                    = delete;
    auto operator=(FakeUiServer const&) -> FakeUiServer& = delete;

    [[nodiscard]] auto address() const -> std::string { return "http://127.0.0.1:" + std::to_string(port_) + prefix_; }
    [[nodiscard]] auto port() const -> int { return port_; }

    auto requests() -> std::vector<Recorded> {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    auto record(std::string method, httplib::Request const& req) -> void {
        Recorded entry;
        entry.method        = std::move(method);
        entry.path          = req.path;
        entry.query         = req.get_param_value("query");
        entry.csrf_header   = req.get_header_value("X-CSRF-Token");
        entry.authorization = req.get_header_value("Authorization");
        entry.body          = req.body;
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(std::move(entry));
    }

    std::string           prefix_;
    httplib::Server       server_;
    std::thread           thread_;
    int                   port_ = -1;
    std::mutex            mutex_;
    std::vector<Recorded> requests_;
};

auto makeClient(std::string address, std::optional<std::string> apiKey = std::nullopt) -> std::unique_ptr<HttpTemporalClient> {
    HttpTemporalClient::Options options;
    options.address   = std::move(address);
    options.api_key   = std::move(apiKey);
    options.page_size = 25;
    options.timeout   = std::chrono::seconds{2};
    auto client       = HttpTemporalClient::Create(std::move(options));
    REQUIRE(client.has_value());
    return std::move(*client);
}

} // namespace

TEST_SUITE("client.http") {
    TEST_CASE("Server URL parsing") {
        CHECK(ParseServerUrl("http://localhost:8233") == std::optional<ServerUrl>{ServerUrl{"http", "localhost", "", 8233, false}});
        CHECK(ParseServerUrl("https://temporal.example.com/ui/") ==
              std::optional<ServerUrl>{ServerUrl{"https", "temporal.example.com", "/ui", 443, true}});
        CHECK(ParseServerUrl("http://10.0.0.5") == std::optional<ServerUrl>{ServerUrl{"http", "10.0.0.5", "", 80, false}});
        CHECK_FALSE(ParseServerUrl("localhost:8233").has_value());
        CHECK_FALSE(ParseServerUrl("ftp://host").has_value());
        CHECK_FALSE(ParseServerUrl("http://").has_value());
        CHECK_FALSE(ParseServerUrl("http://host:0").has_value());
        CHECK_FALSE(ParseServerUrl("http://host:99999").has_value());
        CHECK_FALSE(ParseServerUrl("http://host:port").has_value());
    }

    TEST_CASE("Create validates its options") {
        HttpTemporalClient::Options options;
        options.address = "not a url";
        auto bad        = HttpTemporalClient::Create(options);
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::InvalidConfiguration);

        options.address   = "http://localhost:8233";
        options.page_size = 0;
        CHECK_FALSE(HttpTemporalClient::Create(options).has_value());
    }

    TEST_CASE("Nothing listening is a connection error") {
        // Bind a port and close it again so the address is known to refuse.
        int port = 0;
        {
            httplib::Server placeholder;
            port = placeholder.bind_to_any_port("127.0.0.1");
        }
        auto client = makeClient("http://127.0.0.1:" + std::to_string(port));
        auto result = client->ping();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::ConnectionError);
        CHECK(isRetryable(result.error().code));
    }

    TEST_CASE("Workflow list sends the query and page size") {
        FakeUiServer server;
        auto         client = makeClient(server.address(), std::string{"secret"});
        auto         page   = client->list_collection(KindId::WorkflowExecution,
                                                      CollectionQuery{"default", std::string{"WorkflowType='OrderWorkflow'"}, std::nullopt},
                                                      std::nullopt);
        REQUIRE(page.has_value());
        CHECK(page->next_page_token == std::optional<std::string>{"next-1"});
        auto const& items = std::get<std::vector<WorkflowSummary>>(page->items);
        REQUIRE(items.size() == 1);
        CHECK(items[0].workflow_id == "order-1");

        auto requests = server.requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].path == "/api/v1/namespaces/default/workflows");
        CHECK(requests[0].query == "WorkflowType='OrderWorkflow'");
        CHECK(requests[0].authorization == "Bearer secret");
    }

    TEST_CASE("Workflow count hits the count route with the same query") {
        FakeUiServer server;
        auto         client = makeClient(server.address());
        auto         count  = client->count_workflows("default", std::string{"ExecutionStatus='Running'"});
        REQUIRE(count.has_value());
        CHECK(count->count == 1234);

        auto requests = server.requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].path == "/api/v1/namespaces/default/workflows/count");
        CHECK(requests[0].query == "ExecutionStatus='Running'");

        auto unfiltered = client->count_workflows("default", std::nullopt);
        REQUIRE(unfiltered.has_value());
        CHECK(server.requests().back().query.empty());
    }

    TEST_CASE("Schedule filters are applied locally") {
        FakeUiServer server;
        auto         client = makeClient(server.address());
        auto         page   = client->list_collection(KindId::Schedule, CollectionQuery{"default", std::string{"payroll"}, std::nullopt},
                                                      std::nullopt);
        REQUIRE(page.has_value());
        auto const& schedules = std::get<std::vector<Schedule>>(page->items);
        REQUIRE(schedules.size() == 1);
        CHECK(schedules[0].schedule_id == "payroll-weekly");
    }

    TEST_CASE("Activities come from the parent workflow") {
        FakeUiServer    server;
        auto            client = makeClient(server.address());
        CollectionQuery query{"default", std::nullopt, Identity{WorkflowIdentity{"order-1", std::nullopt}}};
        auto            page = client->list_collection(KindId::Activity, query, std::nullopt);
        REQUIRE(page.has_value());
        auto const& activities = std::get<std::vector<PendingActivity>>(page->items);
        REQUIRE(activities.size() == 1);
        CHECK(activities[0].activity_type == "Ship");

        auto detail = client->describe(KindId::Activity, "default", ActivityIdentity{"order-1", std::nullopt, "7"});
        REQUIRE(detail.has_value());
        CHECK(std::get<PendingActivity>(*detail).attempt == 2);

        auto gone = client->describe(KindId::Activity, "default", ActivityIdentity{"order-1", std::nullopt, "8"});
        REQUIRE_FALSE(gone.has_value());
        CHECK(gone.error().code == Error::Code::NotFoundError);
    }

    TEST_CASE("HTTP failures map to error codes") {
        FakeUiServer server;
        auto         client  = makeClient(server.address());
        auto         missing = client->describe(KindId::WorkflowExecution, "default", WorkflowIdentity{"missing", std::nullopt});
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFoundError);
        CHECK(missing.error().message == std::optional<std::string>{"workflow not found"});

        auto garbled = client->describe(KindId::WorkflowExecution, "default", WorkflowIdentity{"garbled", std::nullopt});
        REQUIRE_FALSE(garbled.has_value());
        CHECK(garbled.error().code == Error::Code::MalformedResponse);

        auto mismatch = client->describe(KindId::Schedule, "default", WorkflowIdentity{"order-1", std::nullopt});
        REQUIRE_FALSE(mismatch.has_value());
        CHECK(mismatch.error().code == Error::Code::ValidationError);
    }

    TEST_CASE("Mutations fetch and send the CSRF token once") {
        FakeUiServer    server;
        auto            client = makeClient(server.address());
        OperationTarget target{KindId::WorkflowExecution, WorkflowIdentity{"order-1", std::nullopt}, {}};

        REQUIRE(client->invoke("default", OperationId::CancelWorkflow, target).has_value());
        target.params[std::string{kParamReason}] = "cleanup";
        REQUIRE(client->invoke("default", OperationId::TerminateWorkflow, target).has_value());

        auto requests = server.requests();
        REQUIRE(requests.size() == 3);
        CHECK(requests[0].path == "/api/v1/settings");
        CHECK(requests[1].path == "/api/v1/namespaces/default/workflows/order-1/cancel");
        CHECK(requests[1].csrf_header == "tok-1");
        CHECK(requests[2].csrf_header == "tok-1");
        CHECK(nlohmann::json::parse(requests[2].body)["reason"] == "cleanup");
    }

    TEST_CASE("Signals are validated before anything is sent") {
        FakeUiServer    server;
        auto            client = makeClient(server.address());
        OperationTarget target{KindId::WorkflowExecution, WorkflowIdentity{"order-1", std::nullopt},
                               {{std::string{kParamSignalName}, "approve"}, {std::string{kParamInput}, "{broken"}}};
        auto            bad = client->invoke("default", OperationId::SignalWorkflow, target);
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::ValidationError);

        target.params[std::string{kParamInput}] = R"({"by":"ops"})";
        REQUIRE(client->invoke("default", OperationId::SignalWorkflow, target).has_value());
        auto requests = server.requests();
        REQUIRE_FALSE(requests.empty());
        auto body = nlohmann::json::parse(requests.back().body);
        CHECK(body["signalName"] == "approve");
        CHECK(body["input"]["by"] == "ops");
    }

    TEST_CASE("Rejected mutations surface the server message") {
        FakeUiServer    server;
        auto            client = makeClient(server.address());
        OperationTarget target{KindId::Schedule, ScheduleIdentity{"payroll-weekly"}, {}};
        auto            result = client->invoke("default", OperationId::DeleteSchedule, target);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::AuthError);
        CHECK(result.error().message == std::optional<std::string>{"permission denied"});
    }

    TEST_CASE("A base path prefixes every route") {
        FakeUiServer server("/temporal");
        auto         client = makeClient(server.address());
        CHECK(client->serverUrl().base_path == "/temporal");
        auto namespaces = client->list_namespaces();
        REQUIRE(namespaces.has_value());
        REQUIRE(namespaces->size() == 1);
        CHECK(namespaces->front().name == "default");
        CHECK(client->ping().has_value());
    }
}
