// File: src/core/config_value.h
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pm {

// Untyped configuration tree handed to plugins. Exactly five shapes; tables
// keep insertion order and unique keys.
class ConfigValue {
public:
    enum class Type { String, Integer, Boolean, List, Table };

    using List  = std::vector<ConfigValue>;
    using Entry = std::pair<std::string, ConfigValue>;
    using Table = std::vector<Entry>;

    // An empty table.
    ConfigValue() = default;

    static ConfigValue string(std::string value);
    static ConfigValue integer(long long value);
    static ConfigValue boolean(bool value);
    static ConfigValue list(List values);
    // Throws ConfigError on a duplicate key.
    static ConfigValue table(Table entries);

    Type type() const { return m_type; }
    bool isString() const  { return m_type == Type::String; }
    bool isInteger() const { return m_type == Type::Integer; }
    bool isBoolean() const { return m_type == Type::Boolean; }
    bool isList() const    { return m_type == Type::List; }
    bool isTable() const   { return m_type == Type::Table; }

    // Accessors throw ConfigError when the tag does not match.
    const std::string &asString() const;
    long long asInteger() const;
    bool asBoolean() const;
    const List &asList() const;
    const Table &asTable() const;

    // Table lookup; nullptr when absent or when this is not a table.
    const ConfigValue *find(const std::string &key) const;

    bool operator==(const ConfigValue &other) const;
    bool operator!=(const ConfigValue &other) const { return !(*this == other); }

    // Short rendering for diagnostics: strings quoted, containers abbreviated.
    std::string describe() const;

    static const char *typeName(Type type);

private:
    Type        m_type = Type::Table;
    std::string m_string;
    long long   m_integer = 0;
    bool        m_boolean = false;
    List        m_list;
    Table       m_table;
};

} // namespace pm
