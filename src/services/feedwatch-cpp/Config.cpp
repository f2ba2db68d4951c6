#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {
bool ParseInt(const std::string& text, int& outValue) {
    try {
        size_t index = 0;
        const int value = std::stoi(text, &index);
        if (index == text.size()) {
            outValue = value;
            return true;
        }
    } catch (const std::exception&) {
    }

    return false;
}

bool ParseIntOption(const std::string& option, const std::string& text, int minValue, int& outValue, std::string& outError) {
    int value = 0;
    if (!ParseInt(text, value) || value < minValue) {
        outError = option + " expects an integer >= " + std::to_string(minValue) + ", got '" + text + "'";
        return false;
    }

    outValue = value;
    return true;
}

std::string TrimLine(std::string value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    const auto begin = std::find_if(value.begin(), value.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    return std::string(begin, value.end());
}
} // namespace

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    std::cerr << "[Config] " << name << "='" << value << "' is not a boolean, using default." << std::endl;
    return defaultValue;
}

int GetEnvInt(const char* name, int defaultValue, int minValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    int parsed = 0;
    if (!ParseInt(value, parsed) || parsed < minValue) {
        std::cerr << "[Config] " << name << "='" << value << "' is invalid, using " << defaultValue << "." << std::endl;
        return defaultValue;
    }

    return parsed;
}

WatchConfig LoadConfigFromEnvironment() {
    WatchConfig config;
    config.apiUrl = GetEnvOrDefault("FW_API_URL", config.apiUrl);
    config.pollInterval = std::chrono::seconds(
        GetEnvInt("FW_POLL_INTERVAL_SECONDS", static_cast<int>(config.pollInterval.count()), 1));
    config.maxBackoff = std::chrono::seconds(
        GetEnvInt("FW_MAX_BACKOFF_SECONDS", static_cast<int>(config.maxBackoff.count()), 1));
    config.rateFloor = GetEnvInt("FW_RATE_FLOOR", config.rateFloor, 0);
    config.maxRetries = GetEnvInt("FW_MAX_RETRIES", config.maxRetries, 0);
    config.maxPages = GetEnvInt("FW_MAX_PAGES", config.maxPages, 1);
    config.pageSize = GetEnvInt("FW_PAGE_SIZE", config.pageSize, 1);

    config.tls.caPath = GetEnvOrDefault("FW_CA_PATH", "");
    config.tls.verifyPeer = GetEnvBool("FW_VERIFY_PEER", true);
    config.tls.verifyHost = GetEnvBool("FW_VERIFY_HOST", true);

    config.trace.enabled = GetEnvBool("FW_OTEL_ENABLED", false);
    config.trace.endpoint = GetEnvOrDefault("FW_OTEL_ENDPOINT", "");
    config.trace.serviceName = GetEnvOrDefault("FW_OTEL_SERVICE_NAME", config.trace.serviceName);
    return config;
}

bool ParseCommandLine(int argc, const char* const argv[], WatchConfig& config, CommandLine& outCommandLine, std::string& outError) {
    outCommandLine = CommandLine();
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            outCommandLine.showHelp = true;
            return true;
        }

        if (arg == "--api-url" || arg == "--interval" || arg == "--rate-floor" || arg == "--max-retries") {
            if (i + 1 >= argc) {
                outError = arg + " requires a value";
                return false;
            }
            const std::string value = argv[++i];

            if (arg == "--api-url") {
                config.apiUrl = value;
                continue;
            }

            int parsed = 0;
            if (arg == "--interval") {
                if (!ParseIntOption(arg, value, 1, parsed, outError)) {
                    return false;
                }
                config.pollInterval = std::chrono::seconds(parsed);
            } else if (arg == "--rate-floor") {
                if (!ParseIntOption(arg, value, 0, parsed, outError)) {
                    return false;
                }
                config.rateFloor = parsed;
            } else {
                if (!ParseIntOption(arg, value, 0, parsed, outError)) {
                    return false;
                }
                config.maxRetries = parsed;
            }
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            outError = "unknown option " + arg;
            return false;
        }

        positional.push_back(arg);
    }

    if (positional.size() < 2) {
        outError = "expected a credential reference and at least one owner/repo";
        return false;
    }

    outCommandLine.credentialRef = positional.front();
    outCommandLine.resources.assign(positional.begin() + 1, positional.end());
    return true;
}

std::string UsageText(const std::string& program) {
    std::ostringstream usage;
    usage << "usage: " << program << " [options] <credential> <owner/repo>...\n"
          << "\n"
          << "Listen to events on GitHub repositories.\n"
          << "\n"
          << "  <credential>          env:NAME to read the token from $NAME, or a token file path\n"
          << "  --api-url URL         API root (FW_API_URL)\n"
          << "  --interval SECONDS    delay between polls of one feed (FW_POLL_INTERVAL_SECONDS)\n"
          << "  --rate-floor N        remaining requests below which polling slows down (FW_RATE_FLOOR)\n"
          << "  --max-retries N       consecutive failures before a feed is abandoned (FW_MAX_RETRIES)\n"
          << "  -h, --help            show this help\n";
    return usage.str();
}

bool ResolveCredential(const std::string& reference, std::string& outToken, std::string& outError) {
    if (reference.empty()) {
        outError = "empty credential reference";
        return false;
    }

    if (reference.rfind("env:", 0) == 0) {
        const std::string name = reference.substr(4);
        const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
        if (!value || std::string(value).empty()) {
            outError = "environment variable '" + name + "' is not set";
            return false;
        }
        outToken = TrimLine(value);
        return true;
    }

    std::ifstream input(reference);
    if (!input) {
        outError = "unable to read credential file " + reference;
        return false;
    }

    std::string line;
    std::getline(input, line);
    line = TrimLine(line);
    if (line.empty()) {
        outError = "credential file " + reference + " is empty";
        return false;
    }

    outToken = line;
    return true;
}

FeedClientConfig BuildClientConfig(const WatchConfig& config, const std::string& token) {
    FeedClientConfig clientConfig;
    clientConfig.apiUrl = config.apiUrl;
    clientConfig.token = token;
    clientConfig.pageSize = config.pageSize;
    clientConfig.maxPages = config.maxPages;
    clientConfig.tls = config.tls;
    return clientConfig;
}

PollerSettings BuildPollerSettings(const WatchConfig& config) {
    PollerSettings settings;
    settings.baseInterval = config.pollInterval;
    settings.maxBackoff = std::max<std::chrono::milliseconds>(config.maxBackoff, config.pollInterval);
    settings.maxTransientRetries = config.maxRetries;
    return settings;
}
