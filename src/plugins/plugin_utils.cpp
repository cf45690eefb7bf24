// File: src/plugins/plugin_utils.cpp
#include "plugin_utils.h"
#include "plugin.h"
#include "core/error.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace pm::plugins {

bool isSkip(const ConfigValue &value) {
    return value.isString() && value.asString() == kSkipSentinel;
}

void rejectUnknownKeys(const ConfigValue::Table &table,
                       std::initializer_list<const char *> known,
                       const std::string &context) {
    std::string unknown;
    for (const auto &e : table) {
        const bool ok = std::any_of(known.begin(), known.end(),
                                    [&](const char *k) { return e.first == k; });
        if (ok) continue;
        if (!unknown.empty()) unknown += ", ";
        unknown += e.first;
    }
    if (!unknown.empty())
        throw ConfigError(context + " has the following unknown properties: " + unknown + ".");
}

bool writeTextFile(const std::string &path, const std::string &contents) {
    std::ofstream ofs(path);
    if (!ofs)
        return false;
    ofs << contents;
    ofs.flush();
    return ofs.good();
}

std::optional<std::string> readTextFile(const std::string &path) {
    std::ifstream ifs(path);
    if (!ifs)
        return std::nullopt;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (ifs.bad())
        return std::nullopt;
    return ss.str();
}

std::vector<std::filesystem::path> listCpuDirectories(const std::filesystem::path &cpuRoot) {
    namespace fs = std::filesystem;
    std::vector<std::pair<std::string, fs::path>> found;
    std::error_code ec;

    for (const auto &e : fs::directory_iterator(cpuRoot, ec)) {
        if (!e.is_directory(ec)) continue;
        const std::string name = e.path().filename().string();
        // only cpuN dirs (skip cpufreq, cpuidle and anything else)
        bool is_cpuN = name.size() > 3 && name.rfind("cpu", 0) == 0 &&
                       std::all_of(name.begin() + 3, name.end(),
                                   [](unsigned char ch){ return std::isdigit(ch); });
        if (!is_cpuN) continue;
        found.emplace_back(name.substr(3), e.path());
    }

    std::sort(found.begin(), found.end(),
              [](const auto &a, const auto &b) {
                  // numeric order without converting: shorter digit strings first
                  if (a.first.size() != b.first.size())
                      return a.first.size() < b.first.size();
                  return a.first < b.first;
              });
    std::vector<fs::path> out;
    out.reserve(found.size());
    for (auto &f : found)
        out.push_back(std::move(f.second));
    return out;
}

} // namespace pm::plugins
