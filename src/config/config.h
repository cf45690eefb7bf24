#pragma once

#include <QString>
#include <QStringList>
#include <string>
#include <vector>

#include "core/config_value.h"

static const inline QString DEFAULT_CONFIG_PATH = "/etc/powermodes.yaml";

namespace YAML {
class Node;
}

namespace pm {

// One power mode: plugin id -> raw plugin configuration, in file order.
struct Mode {
    std::string name;
    ConfigValue::Table plugins;
};

class Config {
public:
    // Reads and converts a YAML file. Throws ConfigError with the path and
    // the parser's message on failure.
    static ConfigValue loadFile(const QString &path);
    static ConfigValue parse(const std::string &yaml);

    // YAML -> ConfigValue. `where` names the node in error messages.
    static ConfigValue fromYaml(const YAML::Node &node, const std::string &where);

    // Top-level entries that are tables become modes; anything else is
    // skipped and described in `warnings`.
    static std::vector<Mode> modes(const ConfigValue &root, QStringList *warnings);
    static const Mode *findMode(const std::vector<Mode> &modes, const std::string &name);

    // Renders `key: value` so that loading it back yields the same value.
    static std::string toYaml(const std::string &key, const ConfigValue &value);
};

} // namespace pm
