#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace config {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

inline int logLevelSeverity(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return 0;
    case LogLevel::Debug:
        return 1;
    case LogLevel::Info:
        return 2;
    case LogLevel::Warn:
        return 3;
    case LogLevel::Error:
        return 4;
    }
    return 2;
}

inline bool logLevelAtLeast(LogLevel level, LogLevel threshold) {
    return logLevelSeverity(level) <= logLevelSeverity(threshold);
}

struct Config {
    // session
    std::string symbol           = "BTC";
    std::string interval         = "15m";
    std::string exchange         = "";
    std::string exchangePriority = "Binance,Bybit,MEXC,Gate,OKX";
    std::size_t candleLimit      = 500;

    // network
    std::string relayUrl         = "https://api.allorigins.win/get?url=";
    int httpTimeoutSec           = 20;

    // runtime
    int runSeconds               = 0;
    std::string configFile       = "";

    // logs
    LogLevel logLevel            = LogLevel::Info;

    // util
    bool showHelp                = false;
    bool showVersion             = false;
};

}  // namespace config
