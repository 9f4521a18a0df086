#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace infstore {

bool loadDotEnv(const std::filesystem::path &path);
std::optional<std::string> getEnv(std::string_view key);
std::string getEnvOrDefault(std::string_view key, std::string_view defaultValue);
bool getEnvFlag(std::string_view key, bool defaultValue);
std::uint64_t getEnvUnsigned(std::string_view key, std::uint64_t defaultValue);
std::chrono::milliseconds getEnvMillis(std::string_view key, std::chrono::milliseconds defaultValue);

// Expands "${VAR}" and "${VAR:-fallback}"; any other text is returned as is.
std::string expandEnvReference(const std::string &text);

}  // namespace infstore
