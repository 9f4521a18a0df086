#include "infstore/logging.h"

#include <nlohmann/json.hpp>
#include <trantor/utils/Logger.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace infstore {
namespace {

std::mutex logMutex;
std::unique_ptr<std::ofstream> fileSink;
std::mutex rulesMutex;
std::vector<std::regex> redactionRules;

thread_local LogContext threadLogContext{};

std::string isoTimestampUtc() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto seconds = time_point_cast<std::chrono::seconds>(now);
    const auto micro = duration_cast<microseconds>(now - seconds).count();
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T");
    oss << '.' << std::setw(6) << std::setfill('0') << micro << 'Z';
    return oss.str();
}

trantor::Logger::LogLevel toTrantorLevel(const std::string &level) {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "trace") {
        return trantor::Logger::kTrace;
    }
    if (lowered == "debug") {
        return trantor::Logger::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return trantor::Logger::kWarn;
    }
    if (lowered == "error") {
        return trantor::Logger::kError;
    }
    if (lowered == "fatal" || lowered == "critical") {
        return trantor::Logger::kFatal;
    }
    return trantor::Logger::kInfo;
}

// trantor prefixes each line with "<date> <thread> <LEVEL> ..."
std::string extractLevel(std::string_view message) {
    static const std::vector<std::string> levels{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    for (const auto &level : levels) {
        const auto needle = " " + level + " ";
        if (message.find(needle) != std::string_view::npos) {
            return level;
        }
    }
    return "INFO";
}

void installDefaultRules() {
    redactionRules.clear();
    redactionRules.emplace_back(R"(bot\d+:[A-Za-z0-9_-]{20,})");
    redactionRules.emplace_back(R"((?:Bearer\s+)[A-Za-z0-9._~+/=-]+)", std::regex::icase);
    redactionRules.emplace_back(R"((?:(?:x-)?api[_-]?key|token|secret|authorization)\s*[:=]\s*[^\s,&]+)",
                                std::regex::icase);
}

void emitLogPayload(const nlohmann::json &payload) {
    const std::string serialized = payload.dump();
    std::lock_guard<std::mutex> lock(logMutex);
    std::cout << serialized << std::endl;
    if (fileSink && fileSink->is_open()) {
        (*fileSink) << serialized << std::endl;
    }
}

}  // namespace

ScopedLogContext::ScopedLogContext(LogContext context) : active_(true), previous_(threadLogContext) {
    setLogContext(context);
}

ScopedLogContext::ScopedLogContext(ScopedLogContext &&other) noexcept
    : active_(other.active_), previous_(std::move(other.previous_)) {
    other.active_ = false;
}

ScopedLogContext &ScopedLogContext::operator=(ScopedLogContext &&other) noexcept {
    if (this != &other) {
        if (active_) {
            threadLogContext = previous_;
        }
        active_ = other.active_;
        previous_ = std::move(other.previous_);
        other.active_ = false;
    }
    return *this;
}

ScopedLogContext::~ScopedLogContext() {
    if (active_) {
        threadLogContext = previous_;
    }
}

void initializeLogging(const std::string &level, const YAML::Node &loggingConfig) {
    using trantor::Logger;

    Logger::setLogLevel(toTrantorLevel(level));

    bool enableStdout = true;
    bool enableFile = false;
    std::filesystem::path logPath;

    resetRedactionRules();

    if (loggingConfig) {
        if (auto logging = loggingConfig["logging"]; logging) {
            if (auto stdoutNode = logging["stdout"]; stdoutNode) {
                enableStdout = stdoutNode.as<bool>(enableStdout);
            }
            if (auto fileNode = logging["file"]; fileNode) {
                enableFile = fileNode["enabled"].as<bool>(enableFile);
                if (enableFile && fileNode["path"]) {
                    logPath = fileNode["path"].as<std::string>();
                    if (!logPath.empty()) {
                        auto parent = logPath.parent_path();
                        if (!parent.empty()) {
                            std::error_code ec;
                            std::filesystem::create_directories(parent, ec);
                        }
                        std::lock_guard<std::mutex> lock(logMutex);
                        fileSink = std::make_unique<std::ofstream>(logPath, std::ios::app);
                    }
                }
            }
            if (auto redactNode = logging["redact"]; redactNode) {
                if (auto patterns = redactNode["patterns"]; patterns && patterns.IsSequence()) {
                    std::lock_guard<std::mutex> lock(rulesMutex);
                    for (const auto &pattern : patterns) {
                        try {
                            redactionRules.emplace_back(pattern.as<std::string>());
                        } catch (const std::regex_error &) {
                            LOG_WARN << "Invalid redaction regex ignored: " << pattern.as<std::string>("");
                        }
                    }
                }
            }
        }
    }

    if (!enableStdout) {
        std::cout.setstate(std::ios::failbit);
    }

    Logger::setOutputFunction(
        [](const char *msg, const uint64_t len) {
            std::string_view view(msg, len);
            if (!view.empty() && view.back() == '\n') {
                view.remove_suffix(1);
            }

            auto sanitized = redactMessage(view);
            auto context = currentLogContext();

            nlohmann::json payload;
            payload["ts"] = isoTimestampUtc();
            payload["level"] = extractLevel(view);
            payload["msg"] = sanitized;
            payload["request_id"] = context.requestId.empty() ? nlohmann::json(nullptr) : nlohmann::json(context.requestId);
            payload["endpoint"] = context.endpoint.empty() ? nlohmann::json(nullptr) : nlohmann::json(context.endpoint);
            payload["file_id"] = context.fileId > 0 ? nlohmann::json(context.fileId) : nlohmann::json(nullptr);
            payload["status"] = context.status != 0 ? nlohmann::json(context.status) : nlohmann::json(nullptr);
            payload["latency_ms"] = context.latencyMs > 0.0 ? nlohmann::json(context.latencyMs) : nlohmann::json(nullptr);

            emitLogPayload(payload);
        },
        []() {
            std::lock_guard<std::mutex> lock(logMutex);
            std::cout << std::flush;
            if (fileSink && fileSink->is_open()) {
                fileSink->flush();
            }
        });

    LOG_INFO << "Logging initialized at level " << level;
}

void setLogContext(const LogContext &context) {
    threadLogContext = context;
    threadLogContext.hasRequest = !context.requestId.empty() || context.hasRequest;
}

void updateLogContext(const LogContext &context) {
    if (!context.requestId.empty()) {
        threadLogContext.requestId = context.requestId;
    }
    if (!context.endpoint.empty()) {
        threadLogContext.endpoint = context.endpoint;
    }
    if (context.fileId > 0) {
        threadLogContext.fileId = context.fileId;
    }
    if (context.status != 0) {
        threadLogContext.status = context.status;
    }
    if (context.latencyMs > 0.0) {
        threadLogContext.latencyMs = context.latencyMs;
    }
    threadLogContext.hasRequest = threadLogContext.hasRequest || context.hasRequest || !threadLogContext.requestId.empty();
}

LogContext currentLogContext() {
    return threadLogContext;
}

void clearLogContext() {
    threadLogContext = LogContext{};
}

void resetRedactionRules() {
    std::lock_guard<std::mutex> lock(rulesMutex);
    installDefaultRules();
}

std::string redactMessage(std::string_view message) {
    std::string sanitized(message);
    std::lock_guard<std::mutex> lock(rulesMutex);
    if (redactionRules.empty()) {
        installDefaultRules();
    }
    for (const auto &rule : redactionRules) {
        sanitized = std::regex_replace(sanitized, rule, "[REDACTED]");
    }
    return sanitized;
}

}  // namespace infstore
