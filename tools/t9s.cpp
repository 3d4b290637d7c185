#include <t9s/app/AppState.hpp>
#include <t9s/client/DemoTemporalClient.hpp>
#include <t9s/client/HttpTemporalClient.hpp>
#include <t9s/config/Options.hpp>
#include <t9s/kinds/KindRegistry.hpp>
#include <t9s/nav/Location.hpp>
#include <t9s/nav/Uri.hpp>
#include <t9s/runtime/AppRuntime.hpp>
#include <t9s/ui/CursesTerminal.hpp>

#include "log/TaggedLogger.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested.store(true);
}

auto make_client(T9::Config::Options const& options) -> T9::Expected<std::unique_ptr<T9::TemporalClient>> {
    if (options.demo) {
        return std::make_unique<T9::DemoTemporalClient>(T9::DemoTemporalClient::Options{options.page_size});
    }
    T9::HttpTemporalClient::Options http;
    http.address   = options.address;
    http.api_key   = options.api_key;
    http.page_size = options.page_size;
    auto client    = T9::HttpTemporalClient::Create(std::move(http));
    if (!client) {
        return std::unexpected(client.error());
    }
    return std::unique_ptr<T9::TemporalClient>(std::move(*client));
}

} // namespace

int main(int argc, char** argv) {
    auto options = T9::Config::LoadOptions(argc, argv, T9::Config::ProcessEnvironment());
    if (!options) {
        std::cerr << T9::describeError(options.error()) << "\n"
                  << "Try 't9s --help' for more information.\n";
        return EXIT_FAILURE;
    }
    if (options->show_help) {
        std::cout << T9::Config::UsageText("t9s");
        return EXIT_SUCCESS;
    }
    if (options->show_version) {
        std::cout << "t9s " << T9::Config::VersionString() << "\n";
        return EXIT_SUCCESS;
    }

#ifdef T9_LOG_DEBUG
    T9::set_thread_name("Main");
    if (options->log_file) {
        if (!T9::set_log_file(*options->log_file)) {
            std::cerr << "t9s: cannot open log file " << *options->log_file << "\n";
            return EXIT_FAILURE;
        }
        T9::set_logging_enabled(true);
    } else {
        // stderr belongs to the terminal UI.
        T9::set_logging_enabled(false);
    }
#endif

    auto registry = T9::MakeDefaultKindRegistry();
    if (!registry) {
        std::cerr << "t9s: " << T9::describeError(registry.error()) << "\n";
        return EXIT_FAILURE;
    }

    auto location = T9::MakeCollectionLocation(options->ns, T9::KindId::WorkflowExecution);
    if (options->open_uri) {
        auto parsed = T9::ParseDeepLink(*options->open_uri, *registry);
        if (!parsed) {
            std::cerr << "t9s: " << T9::describeError(T9::toError(parsed.error())) << "\n";
            return EXIT_FAILURE;
        }
        location = std::move(*parsed);
    }

    auto client = make_client(*options);
    if (!client) {
        std::cerr << "t9s: " << T9::describeError(client.error()) << "\n";
        return EXIT_FAILURE;
    }

    auto state        = T9::MakeInitialState(std::move(location),
                                      T9::PollingConfig{options->polling, options->poll_interval, options->max_poll_interval});
    state.saved_views = options->views;

    auto terminal = T9::UI::CursesTerminal::Create();
    if (!terminal) {
        std::cerr << "t9s: " << T9::describeError(terminal.error()) << "\n";
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    T9::AppRuntime::Options runtimeOptions;
    runtimeOptions.key_timeout = options->key_timeout;
    T9::AppRuntime runtime(*registry, **client, **terminal, std::move(state), runtimeOptions);
    runtime.start();
    while (!g_stop_requested.load() && runtime.step()) {
    }
    runtime.stop();
    return EXIT_SUCCESS;
}
