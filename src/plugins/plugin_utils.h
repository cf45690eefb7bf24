// File: src/plugins/plugin_utils.h
#pragma once

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "core/config_value.h"

namespace pm::plugins {

// True for the string "skip".
bool isSkip(const ConfigValue &value);

// Throws ConfigError naming `context` and the unknown keys, if any.
void rejectUnknownKeys(const ConfigValue::Table &table,
                       std::initializer_list<const char *> known,
                       const std::string &context);

// Small sysfs/procfs helpers. Both report failure instead of throwing.
bool writeTextFile(const std::string &path, const std::string &contents);
std::optional<std::string> readTextFile(const std::string &path);

// cpuN directories (N all digits) under `cpuRoot`, sorted by N.
std::vector<std::filesystem::path> listCpuDirectories(const std::filesystem::path &cpuRoot);

} // namespace pm::plugins
