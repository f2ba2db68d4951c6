#include "Config.hpp"
#include "ConsoleSink.hpp"
#include "FeedClient.hpp"
#include "RateBudget.hpp"
#include "StopSignal.hpp"
#include "Tracing.hpp"
#include "WatchSupervisor.hpp"

#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {
constexpr int kExitUsage = 1;
constexpr int kExitAllFeedsFailed = 2;
} // namespace

int main(int argc, char* argv[]) {
    // Before anything can spawn a thread, including the span exporter.
    const sigset_t signals = BlockStopSignals();
    const std::string program = argc > 0 ? argv[0] : "feedwatch";

    WatchConfig config = LoadConfigFromEnvironment();
    CommandLine commandLine;
    std::string error;
    if (!ParseCommandLine(argc, argv, config, commandLine, error)) {
        std::cerr << program << ": " << error << "\n\n" << UsageText(program);
        return kExitUsage;
    }

    if (commandLine.showHelp) {
        std::cout << UsageText(program);
        return 0;
    }

    std::vector<WatchedResource> resources;
    for (const auto& text : commandLine.resources) {
        WatchedResource resource;
        if (!WatchedResource::Parse(text, resource)) {
            std::cerr << "Repositories must be in owner/repo format: '" << text << "'" << std::endl;
            return kExitUsage;
        }
        resources.push_back(resource);
    }

    std::string token;
    if (!ResolveCredential(commandLine.credentialRef, token, error)) {
        std::cerr << "[Watch] " << error << std::endl;
        return kExitUsage;
    }

    Tracer::Instance().Configure(config.trace);

    RateBudget budget(config.rateFloor);
    FeedClient client(BuildClientConfig(config, token));
    if (!client.RefreshRateLimit(budget)) {
        std::cerr << "[Watch] Starting without a known rate budget." << std::endl;
    }

    ConsoleSink sink;
    StopSignal stop;
    std::thread signalWaiter = StartSignalWaiter(signals, stop);

    WatchSupervisor supervisor(client, sink, budget, BuildPollerSettings(config));
    const bool clean = supervisor.Run(resources, stop);

    if (stop.Requested()) {
        signalWaiter.join();
    } else {
        // Every feed ended on its own.
        ReleaseSignalWaiter(signalWaiter);
    }

    Tracer::Instance().Shutdown();
    return clean ? 0 : kExitAllFeedsFailed;
}
