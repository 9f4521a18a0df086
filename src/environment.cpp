#include "infstore/environment.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace infstore {
namespace {

std::string trim(std::string_view input) {
    auto begin = input.begin();
    auto end = input.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    while (end != begin) {
        auto prev = end;
        --prev;
        if (!std::isspace(static_cast<unsigned char>(*prev))) {
            break;
        }
        end = prev;
    }
    return std::string(begin, end);
}

bool isQuoted(const std::string &value) {
    return value.size() >= 2 &&
           ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''));
}

// Unquoted values may carry a trailing " # comment".
std::string stripInlineComment(const std::string &value) {
    if (value.empty() || value.front() == '"' || value.front() == '\'') {
        return value;
    }
    auto hash = value.find(" #");
    if (hash == std::string::npos) {
        return value;
    }
    return trim(std::string_view(value.data(), hash));
}

void setEnv(const std::string &key, const std::string &value) {
#ifdef _WIN32
    _putenv((key + "=" + value).c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

}  // namespace

bool loadDotEnv(const std::filesystem::path &path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(input, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        if (trimmed.rfind("export ", 0) == 0) {
            trimmed = trim(std::string_view(trimmed).substr(7));
        }

        auto delimiterPos = trimmed.find('=');
        if (delimiterPos == std::string::npos) {
            continue;
        }

        auto key = trim(std::string_view(trimmed.data(), delimiterPos));
        auto value = stripInlineComment(
            trim(std::string_view(trimmed.data() + delimiterPos + 1, trimmed.size() - delimiterPos - 1)));

        if (isQuoted(value)) {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setEnv(key, value);
        }
    }

    return true;
}

std::optional<std::string> getEnv(std::string_view key) {
    auto *value = std::getenv(std::string(key).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string getEnvOrDefault(std::string_view key, std::string_view defaultValue) {
    auto value = getEnv(key);
    if (!value.has_value() || value->empty()) {
        return std::string(defaultValue);
    }
    return *value;
}

bool getEnvFlag(std::string_view key, bool defaultValue) {
    auto value = getEnv(key);
    if (!value.has_value()) {
        return defaultValue;
    }

    std::string lowered = *value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }

    return defaultValue;
}

std::uint64_t getEnvUnsigned(std::string_view key, std::uint64_t defaultValue) {
    auto value = getEnv(key);
    if (!value.has_value() || value->empty()) {
        return defaultValue;
    }
    if (!std::all_of(value->begin(), value->end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return defaultValue;
    }
    try {
        return std::stoull(*value);
    } catch (const std::exception &) {
        return defaultValue;
    }
}

std::chrono::milliseconds getEnvMillis(std::string_view key, std::chrono::milliseconds defaultValue) {
    const auto fallback = static_cast<std::uint64_t>(std::max<std::int64_t>(0, defaultValue.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(getEnvUnsigned(key, fallback)));
}

std::string expandEnvReference(const std::string &text) {
    if (text.size() < 3 || text.front() != '$' || text[1] != '{' || text.back() != '}') {
        return text;
    }
    auto inner = text.substr(2, text.size() - 3);
    auto delim = inner.find(":-");
    std::string envKey = inner.substr(0, delim == std::string::npos ? inner.size() : delim);
    std::string defaultValue = delim == std::string::npos ? std::string{} : inner.substr(delim + 2);
    auto envValue = getEnv(envKey);
    if (envValue.has_value() && !envValue->empty()) {
        return *envValue;
    }
    return defaultValue;
}

}  // namespace infstore
