#pragma once

#include "FeedClient.hpp"
#include "FeedPoller.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <string>
#include <vector>

struct WatchConfig {
    std::string apiUrl = "https://api.github.com";
    std::chrono::seconds pollInterval{60};
    std::chrono::seconds maxBackoff{900};
    int rateFloor = 50;
    int maxRetries = 5;
    int maxPages = 10;
    int pageSize = 100;
    TlsSettings tls;
    TraceConfig trace;
};

struct CommandLine {
    std::string credentialRef;
    std::vector<std::string> resources;
    bool showHelp = false;
};

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);
int GetEnvInt(const char* name, int defaultValue, int minValue);

WatchConfig LoadConfigFromEnvironment();

// Applies options on top of config and collects the positional arguments.
bool ParseCommandLine(int argc, const char* const argv[], WatchConfig& config, CommandLine& outCommandLine, std::string& outError);
std::string UsageText(const std::string& program);

// "env:NAME" reads the variable NAME; anything else names a file whose first
// line is the token.
bool ResolveCredential(const std::string& reference, std::string& outToken, std::string& outError);

FeedClientConfig BuildClientConfig(const WatchConfig& config, const std::string& token);
PollerSettings BuildPollerSettings(const WatchConfig& config);
