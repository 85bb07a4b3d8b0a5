#include "config/ConfigProvider.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace config {

namespace {
constexpr int kMaxCandleLimit = 1000;

struct FlagAlias {
    const char* flag;
    const char* shortFlag;
    const char* key;
};

// CLI flags map onto the same keys the config file uses.
constexpr FlagAlias kFlagAliases[] = {
    {"--symbol", "-s", "symbol"},
    {"--interval", "-i", "interval"},
    {"--exchange", "-e", "exchange"},
    {"--exchange-priority", nullptr, "exchangePriority"},
    {"--candle-limit", "-n", "candleLimit"},
    {"--relay-url", nullptr, "relayUrl"},
    {"--http-timeout", nullptr, "httpTimeoutSec"},
    {"--run-seconds", "-t", "runSeconds"},
    {"--log-level", "-l", "logLevel"},
};

struct EnvAlias {
    const char* name;
    const char* key;
};

constexpr EnvAlias kEnvAliases[] = {
    {"TCS_SYMBOL", "symbol"},
    {"TCS_INTERVAL", "interval"},
    {"TCS_EXCHANGE", "exchange"},
    {"TCS_EXCHANGE_PRIORITY", "exchangePriority"},
    {"TCS_CANDLE_LIMIT", "candleLimit"},
    {"TCS_RELAY_URL", "relayUrl"},
    {"TCS_HTTP_TIMEOUT", "httpTimeoutSec"},
    {"TCS_RUN_SECONDS", "runSeconds"},
    {"TCS_LOG_LEVEL", "logLevel"},
};

const char* keyForFlag(const std::string& flag) {
    for (const auto& alias : kFlagAliases) {
        if (flag == alias.flag || (alias.shortFlag != nullptr && flag == alias.shortFlag)) {
            return alias.key;
        }
    }
    return nullptr;
}

}  // namespace

ConfigProvider::ConfigProvider(int argc, const char* const* argv) {
    std::string cliConfigPath;
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);
        if (arg == "--config") {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for --config\n");
            }
            else {
                cliConfigPath = argv[++i];
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            cliConfigPath = arg.substr(9);
        }
    }

    if (!cliConfigPath.empty()) {
        if (fileExists_(cliConfigPath)) {
            parseFile_(cliConfigPath);
            cfg_.configFile = cliConfigPath;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", cliConfigPath.c_str());
        }
    }
    else if (const char* envCfg = std::getenv("TCS_CONFIG")) {
        std::string path(envCfg);
        if (fileExists_(path)) {
            parseFile_(path);
            cfg_.configFile = path;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", path.c_str());
        }
    }

    parseEnv_();
    parseCli_(argc, argv);
}

LogLevel ConfigProvider::parseLogLevel(const std::string& value) {
    std::string lower = lowercase_(value);
    if (lower == "trace") {
        return LogLevel::Trace;
    }
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

std::string ConfigProvider::logLevelToString(LogLevel l) {
    switch (l) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

std::vector<std::string> ConfigProvider::splitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream input(value);
    std::string item;
    while (std::getline(input, item, ',')) {
        item = trim_(item);
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
    }
    return items;
}

void ConfigProvider::printUsage(const char* program) {
    std::printf(
        "Usage: %s [options]\n"
        "  -s, --symbol <BASE>            base asset to search (default BTC)\n"
        "  -i, --interval <LABEL>         candle interval, e.g. 1m 15m 1h 1d 1M (default 15m)\n"
        "  -e, --exchange <NAME>          force one exchange (Binance, Bybit, MEXC, Gate, OKX)\n"
        "      --exchange-priority <LIST> comma separated fast-path order\n"
        "  -n, --candle-limit <N>         history length and series cap (default 500)\n"
        "      --relay-url <PREFIX>       relay used when a direct request fails\n"
        "      --http-timeout <SEC>       per-stage socket timeout (default 20)\n"
        "  -t, --run-seconds <SEC>        stop after SEC seconds, 0 runs until interrupted\n"
        "  -l, --log-level <LEVEL>        trace, debug, info, warn, error\n"
        "      --config <FILE>            key=value configuration file\n"
        "      --help, --version\n",
        program != nullptr ? program : "candlescope");
}

void ConfigProvider::parseCli_(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);

        auto takeNext = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for %s\n", name);
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            cfg_.showHelp = true;
            continue;
        }
        if (arg == "--version") {
            cfg_.showVersion = true;
            continue;
        }
        if (arg == "--config") {
            // Already consumed by the constructor.
            ++i;
            continue;
        }
        if (arg.rfind("--config=", 0) == 0) {
            continue;
        }

        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            if (const char* key = keyForFlag(arg.substr(0, eq))) {
                applyKey_(key, arg.substr(eq + 1));
                continue;
            }
        }
        else if (const char* key = keyForFlag(arg)) {
            if (auto next = takeNext(arg.c_str())) {
                applyKey_(key, *next);
            }
            continue;
        }

        std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
    }
}

void ConfigProvider::parseEnv_() {
    for (const auto& alias : kEnvAliases) {
        if (const char* value = std::getenv(alias.name)) {
            applyKey_(alias.key, value);
        }
    }
}

void ConfigProvider::parseFile_(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        std::fprintf(stderr, "Unable to open config file: %s\n", path.c_str());
        return;
    }

    std::string line;
    while (std::getline(input, line)) {
        line = trim_(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        applyKey_(trim_(line.substr(0, pos)), trim_(line.substr(pos + 1)));
    }
}

void ConfigProvider::applyKey_(const std::string& key, const std::string& value) {
    if (key == "symbol") {
        if (!trim_(value).empty()) {
            cfg_.symbol = trim_(value);
        }
    }
    else if (key == "interval") {
        cfg_.interval = trim_(value);
    }
    else if (key == "exchange") {
        cfg_.exchange = trim_(value);
    }
    else if (key == "exchangePriority") {
        if (!splitList(value).empty()) {
            cfg_.exchangePriority = value;
        }
    }
    else if (key == "candleLimit") {
        int v{};
        if (parseInt_(value, v) && v > 0) {
            cfg_.candleLimit = static_cast<std::size_t>(std::min(v, kMaxCandleLimit));
        }
    }
    else if (key == "relayUrl") {
        cfg_.relayUrl = trim_(value);
    }
    else if (key == "httpTimeoutSec") {
        int v{};
        if (parseInt_(value, v) && v > 0) {
            cfg_.httpTimeoutSec = v;
        }
    }
    else if (key == "runSeconds") {
        int v{};
        if (parseInt_(value, v) && v >= 0) {
            cfg_.runSeconds = v;
        }
    }
    else if (key == "logLevel") {
        cfg_.logLevel = parseLogLevel(value);
    }
    else {
        std::fprintf(stderr, "Unknown config key: %s\n", key.c_str());
    }
}

bool ConfigProvider::fileExists_(const std::string& path) {
    std::ifstream input(path);
    return input.good();
}

std::string ConfigProvider::trim_(const std::string& s) {
    std::string::size_type start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::string::size_type end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

bool ConfigProvider::parseInt_(const std::string& value, int& out) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed, 10);
        if (consumed != value.size()) {
            std::fprintf(stderr, "Invalid integer value: %s\n", value.c_str());
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&) {
        std::fprintf(stderr, "Invalid integer value: %s\n", value.c_str());
        return false;
    }
}

std::string ConfigProvider::lowercase_(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace config
