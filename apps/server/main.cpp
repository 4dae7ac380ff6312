// --- GPO SHORTEST-PATH SERVER --- //
// File: main.cpp
// Description: Serveur HTTP POST /shortest. Charge la config, choisit le
//              device, compile les kernels puis sert jusqu'à SIGINT/SIGTERM.
// Auteur: MasterLaplace

#include <gpo/service/Config.hpp>
#include <gpo/service/Server.hpp>
#include <gpo/core/Log.hpp>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

// ─── Device Listing ───────────────────────────────────────────

static int listDevices(gpo::service::Server &server)
{
    auto devices = server.rankedDevices();
    if (!devices)
    {
        std::fprintf(stderr, "%s\n", devices.error().describe().c_str());
        return EXIT_FAILURE;
    }
    if (devices->empty())
        std::printf("no device matches the selection policy\n");

    for (std::size_t i = 0; i < devices->size(); ++i)
        std::printf("%zu. %s\n", i + 1, (*devices)[i].summary().c_str());
    return EXIT_SUCCESS;
}

// ─── MAIN ─────────────────────────────────────────────────────

int main(int argc, char **argv)
{
    const std::vector<std::string> args(argv + 1, argv + argc);

    // 1. Configuration: defaults < environment < flags
    auto config = gpo::service::Config::load(args);
    if (!config)
    {
        std::fprintf(stderr, "%s\n\n%s", config.error().describe().c_str(),
                     gpo::service::Config::usage(argv[0]).c_str());
        return EXIT_FAILURE;
    }
    if (config->showHelp())
    {
        std::printf("%s", gpo::service::Config::usage(argv[0]).c_str());
        return EXIT_SUCCESS;
    }
    gpo::core::Log::setMinLevel(config->logLevel());

    // 2. Signals are consumed by one waiter thread; block them before any thread starts
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    gpo::service::Server server{*config};

    if (config->listDevices())
        return listDevices(server);

    // 3. Warm-up: device selection + kernel build, fatal on failure
    if (auto device = server.init(); !device)
        return EXIT_FAILURE;

    // 4. Serve
    if (auto started = server.start(); !started)
    {
        gpo::core::Log::fatal("SVC", started.error().describe());
        return EXIT_FAILURE;
    }

    std::atomic<bool> signalled{false};
    std::thread signalWaiter{[&server, &signalled, signals] {
        int received = 0;
        sigwait(&signals, &received);
        signalled.store(true);
        gpo::core::Log::info("SVC", std::string{"received signal "} + std::to_string(received) + ", shutting down");
        server.stop();
    }};

    server.wait();

    // Stopped without a signal: wake the waiter so it can be joined.
    if (!signalled.load())
        pthread_kill(signalWaiter.native_handle(), SIGTERM);
    signalWaiter.join();
    return EXIT_SUCCESS;
}
