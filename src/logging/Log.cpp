#include "logging/Log.h"

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace {
using logging::Log;

constexpr std::size_t kMessageBufferSize = 2048;
constexpr std::size_t kQueueCapacity = 4096;
constexpr std::size_t kDebugLogMaxBytes = 8 * 1024 * 1024;
const std::filesystem::path kDebugLogPath{"./logs/candlescope-debug.log"};

struct LogMessage {
    config::LogLevel level{};
    logging::LogCategory category{};
    std::chrono::system_clock::time_point timestamp{};
    std::string text;
};

struct AsyncLogState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<LogMessage> queue;
    bool stopping = false;
    std::thread worker;
};

AsyncLogState& asyncState() {
    static AsyncLogState state;
    return state;
}

std::once_flag& workerOnce() {
    static std::once_flag flag;
    return flag;
}

struct DebugFileState {
    std::mutex mutex;
    std::ofstream stream;
    std::size_t size = 0;
    bool enabled = false;
};

DebugFileState& debugFileState() {
    static DebugFileState state;
    return state;
}

std::atomic<bool>& debugSinkEnabled() {
    static std::atomic<bool> enabled{false};
    return enabled;
}

void processMessage(const LogMessage& msg);

void openDebugLogUnlocked(DebugFileState& state) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!kDebugLogPath.parent_path().empty()) {
        fs::create_directories(kDebugLogPath.parent_path(), ec);
    }

    state.stream.open(kDebugLogPath, std::ios::out | std::ios::app);
    if (!state.stream) {
        state.size = 0;
        return;
    }

    state.size = fs::exists(kDebugLogPath, ec) ? static_cast<std::size_t>(fs::file_size(kDebugLogPath, ec)) : 0U;
}

void rotateDebugLogUnlocked(DebugFileState& state) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (state.stream.is_open()) {
        state.stream.flush();
        state.stream.close();
    }

    fs::path rotated = kDebugLogPath;
    rotated += ".1";

    fs::remove(rotated, ec);
    fs::rename(kDebugLogPath, rotated, ec);
    state.size = 0;
}

void shutdownWorker();

void ensureWorkerStarted() {
    std::call_once(workerOnce(), [] {
        auto& state = asyncState();
        state.worker = std::thread([] {
            auto& localState = asyncState();
            std::unique_lock<std::mutex> lock(localState.mutex);
            while (true) {
                localState.cv.wait(lock, [&] {
                    return localState.stopping || !localState.queue.empty();
                });

                if (localState.queue.empty()) {
                    if (localState.stopping) {
                        break;
                    }
                    continue;
                }

                LogMessage msg = std::move(localState.queue.front());
                localState.queue.pop_front();
                lock.unlock();

                processMessage(msg);

                lock.lock();
            }
        });
        std::atexit(shutdownWorker);
    });
}

void shutdownWorker() {
    auto& state = asyncState();
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.stopping = true;
    }
    state.cv.notify_all();
    if (state.worker.joinable()) {
        state.worker.join();
    }

    auto& debugState = debugFileState();
    std::lock_guard<std::mutex> lock(debugState.mutex);
    if (debugState.stream.is_open()) {
        debugState.stream.flush();
        debugState.stream.close();
    }
}

bool enqueueMessage(LogMessage&& msg) {
    ensureWorkerStarted();
    auto& state = asyncState();
    {
        std::unique_lock<std::mutex> lock(state.mutex);
        if (state.stopping || state.queue.size() >= kQueueCapacity) {
            return false;
        }
        state.queue.emplace_back(std::move(msg));
    }
    state.cv.notify_one();
    return true;
}

std::string formatLine(const LogMessage& msg) {
    using namespace std::chrono;
    const auto msSinceEpoch = duration_cast<milliseconds>(msg.timestamp.time_since_epoch());
    const std::time_t seconds = static_cast<std::time_t>(msSinceEpoch.count() / 1000);
    const int millis = static_cast<int>(msSinceEpoch.count() % 1000);

    std::tm utcTime{};
    gmtime_r(&seconds, &utcTime);

    char timestamp[16];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d", utcTime.tm_hour, utcTime.tm_min, utcTime.tm_sec, millis);

    const char* levelStr = Log::level_to_string(msg.level);
    const char* categoryStr = Log::category_to_string(msg.category);

    std::string line;
    line.reserve(std::strlen(timestamp) + std::strlen(levelStr) + std::strlen(categoryStr) + msg.text.size() + 4);
    line.append(timestamp);
    line.push_back(' ');
    line.append(levelStr);
    line.push_back(' ');
    line.append(categoryStr);
    line.push_back(' ');
    line.append(msg.text);
    return line;
}

void writeToStream(FILE* stream, const std::string& line) {
    std::fwrite(line.data(), 1, line.size(), stream);
    std::fputc('\n', stream);
    std::fflush(stream);
}

bool writeToDebugFile(const std::string& line) {
    if (!debugSinkEnabled().load(std::memory_order_acquire)) {
        return false;
    }

    auto& state = debugFileState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.enabled) {
        return false;
    }

    if (!state.stream.is_open()) {
        openDebugLogUnlocked(state);
        if (!state.stream.is_open()) {
            return false;
        }
    }

    const std::size_t lineBytes = line.size() + 1;
    if (state.size + lineBytes > kDebugLogMaxBytes) {
        rotateDebugLogUnlocked(state);
        openDebugLogUnlocked(state);
        if (!state.stream.is_open()) {
            return false;
        }
    }

    state.stream << line << '\n';
    state.stream.flush();
    state.size += lineBytes;
    return true;
}

void configureForLevel(config::LogLevel level) {
    const bool enableDebug = config::logLevelAtLeast(level, config::LogLevel::Debug);
    auto& state = debugFileState();
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.enabled = enableDebug;
        if (!enableDebug) {
            if (state.stream.is_open()) {
                state.stream.flush();
                state.stream.close();
            }
            state.size = 0;
        }
    }
    debugSinkEnabled().store(enableDebug, std::memory_order_release);
}

void processMessage(const LogMessage& msg) {
    const std::string line = formatLine(msg);

    switch (msg.level) {
    case config::LogLevel::Error:
    case config::LogLevel::Warn:
        writeToStream(stderr, line);
        break;
    case config::LogLevel::Info:
        writeToStream(stdout, line);
        break;
    case config::LogLevel::Debug:
    case config::LogLevel::Trace: {
        if (!writeToDebugFile(line)) {
            writeToStream(stdout, line);
        }
        break;
    }
    }
}

}  // namespace

namespace logging {

std::atomic<config::LogLevel> Log::currentLevel{ config::LogLevel::Info };

void Log::set_log_level(config::LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
    configureForLevel(level);
}

const char* Log::level_to_string(config::LogLevel level) {
    switch (level) {
    case config::LogLevel::Error:
        return "ERROR";
    case config::LogLevel::Warn:
        return "WARN";
    case config::LogLevel::Info:
        return "INFO";
    case config::LogLevel::Debug:
        return "DEBUG";
    case config::LogLevel::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

const char* Log::category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::NET:
        return "NET";
    case LogCategory::DATA:
        return "DATA";
    case LogCategory::STREAM:
        return "STREAM";
    case LogCategory::INDICATOR:
        return "INDICATOR";
    case LogCategory::SESSION:
        return "SESSION";
    case LogCategory::CONFIG:
        return "CONFIG";
    }
    return "UNKNOWN";
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args) {
    if (config::logLevelSeverity(level) < config::logLevelSeverity(currentLevel.load(std::memory_order_relaxed))) {
        return;
    }

    std::array<char, kMessageBufferSize> buffer{};
    std::va_list argsCopy;
    va_copy(argsCopy, args);
    int written = std::vsnprintf(buffer.data(), buffer.size(), fmt, argsCopy);
    va_end(argsCopy);

    if (written < 0) {
        std::snprintf(buffer.data(), buffer.size(), "<format-error>");
    }
    else if (static_cast<std::size_t>(written) >= buffer.size()) {
        buffer[buffer.size() - 4] = '.';
        buffer[buffer.size() - 3] = '.';
        buffer[buffer.size() - 2] = '.';
        buffer[buffer.size() - 1] = '\0';
    }

    LogMessage message;
    message.level = level;
    message.category = category;
    message.timestamp = std::chrono::system_clock::now();
    message.text.assign(buffer.data());

    if (!enqueueMessage(LogMessage(message))) {
        // Saturated queue drops low-severity lines; warnings and errors are written inline.
        if (level == config::LogLevel::Error || level == config::LogLevel::Warn) {
            processMessage(message);
        }
    }
}

}  // namespace logging
