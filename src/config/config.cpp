#include "config.h"
#include <yaml-cpp/yaml.h>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include "core/error.h"
#include "core/log.h"

namespace pm {

namespace {

const QRegularExpression kIntegerPattern(QStringLiteral("^[+-]?[0-9]+$"));

std::string child(const std::string &where, const std::string &key) {
    return where.empty() ? key : where + "." + key;
}

bool isQuotedOrString(const YAML::Node &node) {
    // yaml-cpp tags non-plain scalars with "!"
    return node.Tag() == "!" || node.Tag() == "tag:yaml.org,2002:str";
}

bool looksLikeNonString(const std::string &s) {
    return s == "true" || s == "false" || s.empty()
        || kIntegerPattern.match(QString::fromStdString(s)).hasMatch();
}

ConfigValue scalarFromYaml(const YAML::Node &node, const std::string &where) {
    const std::string &text = node.Scalar();
    if (isQuotedOrString(node))
        return ConfigValue::string(text);

    if (text == "true")  return ConfigValue::boolean(true);
    if (text == "false") return ConfigValue::boolean(false);

    if (kIntegerPattern.match(QString::fromStdString(text)).hasMatch()) {
        try {
            return ConfigValue::integer(std::stoll(text));
        } catch (const std::out_of_range &) {
            throw ConfigError(where + ": integer " + text + " is out of range");
        }
    }
    return ConfigValue::string(text);
}

void emit(YAML::Emitter &out, const ConfigValue &value) {
    switch (value.type()) {
    case ConfigValue::Type::String:
        if (looksLikeNonString(value.asString()))
            out << YAML::DoubleQuoted << value.asString();
        else
            out << value.asString();
        break;
    case ConfigValue::Type::Integer:
        out << value.asInteger();
        break;
    case ConfigValue::Type::Boolean:
        out << value.asBoolean();
        break;
    case ConfigValue::Type::List:
        out << YAML::BeginSeq;
        for (const auto &item : value.asList())
            emit(out, item);
        out << YAML::EndSeq;
        break;
    case ConfigValue::Type::Table:
        out << YAML::BeginMap;
        for (const auto &e : value.asTable()) {
            out << YAML::Key << e.first << YAML::Value;
            emit(out, e.second);
        }
        out << YAML::EndMap;
        break;
    }
}

} // namespace

ConfigValue Config::fromYaml(const YAML::Node &node, const std::string &where) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        return scalarFromYaml(node, where);

    case YAML::NodeType::Sequence: {
        ConfigValue::List items;
        std::size_t i = 0;
        for (const auto &item : node) {
            items.push_back(fromYaml(item, where + "[" + std::to_string(i) + "]"));
            ++i;
        }
        return ConfigValue::list(std::move(items));
    }

    case YAML::NodeType::Map: {
        ConfigValue::Table entries;
        for (const auto &kv : node) {
            if (!kv.first.IsScalar())
                throw ConfigError(child(where, "<key>") + ": keys must be scalars");
            const std::string key = kv.first.Scalar();
            for (const auto &e : entries) {
                if (e.first == key)
                    throw ConfigError(child(where, key) + ": duplicate key");
            }
            entries.emplace_back(key, fromYaml(kv.second, child(where, key)));
        }
        return ConfigValue::table(std::move(entries));
    }

    case YAML::NodeType::Null:
        throw ConfigError((where.empty() ? std::string("document") : where)
                          + ": empty values are not supported");
    case YAML::NodeType::Undefined:
        break;
    }
    throw ConfigError((where.empty() ? std::string("document") : where) + ": undefined value");
}

ConfigValue Config::parse(const std::string &yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception &e) {
        throw ConfigError(std::string("invalid YAML: ") + e.what());
    }
    if (root.IsNull())
        throw ConfigError("configuration is empty");
    return fromYaml(root, "");
}

ConfigValue Config::loadFile(const QString &path) {
    if (!QFileInfo(path).isFile())
        throw ConfigError("Failed to read config from \"" + path.toStdString() + "\": no such file.");

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.toStdString());
    } catch (const YAML::BadFile &) {
        throw ConfigError("Failed to read config from \"" + path.toStdString() + "\".");
    } catch (const YAML::Exception &e) {
        throw ConfigError("Failed to parse config in \"" + path.toStdString()
                          + "\". Here's the error message:\n" + e.what());
    }

    if (root.IsNull())
        throw ConfigError("Config file \"" + path.toStdString() + "\" is empty.");

    try {
        ConfigValue tree = fromYaml(root, "");
        log_debug(QString("Loaded configuration from %1").arg(path).toUtf8().constData());
        return tree;
    } catch (const ConfigError &e) {
        throw ConfigError("Invalid config in \"" + path.toStdString() + "\": " + e.what());
    }
}

std::vector<Mode> Config::modes(const ConfigValue &root, QStringList *warnings) {
    if (!root.isTable())
        throw ConfigError("the top level of the configuration must be a table of powermodes");

    std::vector<Mode> result;
    for (const auto &e : root.asTable()) {
        if (!e.second.isTable()) {
            if (warnings)
                warnings->append(QString("Config specified invalid powermode \"%1\". "
                                         "Must be a table. Ignoring it.")
                                     .arg(QString::fromStdString(e.first)));
            continue;
        }
        result.push_back(Mode{e.first, e.second.asTable()});
    }
    return result;
}

const Mode *Config::findMode(const std::vector<Mode> &modes, const std::string &name) {
    for (const auto &m : modes) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

std::string Config::toYaml(const std::string &key, const ConfigValue &value) {
    YAML::Emitter out;
    out << YAML::BeginMap << YAML::Key << key << YAML::Value;
    emit(out, value);
    out << YAML::EndMap;
    return out.c_str();
}

} // namespace pm
