#pragma once

#include "config/Config.h"

#include <string>
#include <vector>

namespace config {

class ConfigProvider {
public:
    ConfigProvider(int argc, const char* const* argv);

    const Config& get() const { return cfg_; }

    static LogLevel parseLogLevel(const std::string& s);
    static std::string logLevelToString(LogLevel l);
    static std::vector<std::string> splitList(const std::string& value);
    static void printUsage(const char* program);

private:
    Config cfg_;
    void parseCli_(int argc, const char* const* argv);
    void parseEnv_();
    void parseFile_(const std::string& path);
    void applyKey_(const std::string& key, const std::string& value);

    static bool fileExists_(const std::string& path);
    static std::string trim_(const std::string& s);
    static bool parseInt_(const std::string& value, int& out);
    static std::string lowercase_(std::string s);
};

}  // namespace config
