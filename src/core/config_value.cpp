// File: src/core/config_value.cpp
#include "config_value.h"
#include "error.h"

#include <set>

namespace pm {

ConfigValue ConfigValue::string(std::string value) {
    ConfigValue v;
    v.m_type = Type::String;
    v.m_string = std::move(value);
    return v;
}

ConfigValue ConfigValue::integer(long long value) {
    ConfigValue v;
    v.m_type = Type::Integer;
    v.m_integer = value;
    return v;
}

ConfigValue ConfigValue::boolean(bool value) {
    ConfigValue v;
    v.m_type = Type::Boolean;
    v.m_boolean = value;
    return v;
}

ConfigValue ConfigValue::list(List values) {
    ConfigValue v;
    v.m_type = Type::List;
    v.m_list = std::move(values);
    return v;
}

ConfigValue ConfigValue::table(Table entries) {
    std::set<std::string> seen;
    for (const auto &e : entries) {
        if (!seen.insert(e.first).second)
            throw ConfigError("duplicate key \"" + e.first + "\"");
    }
    ConfigValue v;
    v.m_type = Type::Table;
    v.m_table = std::move(entries);
    return v;
}

static ConfigError wrongType(ConfigValue::Type wanted, ConfigValue::Type got) {
    return ConfigError(std::string("expected ") + ConfigValue::typeName(wanted) +
                       ", got " + ConfigValue::typeName(got));
}

const std::string &ConfigValue::asString() const {
    if (m_type != Type::String) throw wrongType(Type::String, m_type);
    return m_string;
}

long long ConfigValue::asInteger() const {
    if (m_type != Type::Integer) throw wrongType(Type::Integer, m_type);
    return m_integer;
}

bool ConfigValue::asBoolean() const {
    if (m_type != Type::Boolean) throw wrongType(Type::Boolean, m_type);
    return m_boolean;
}

const ConfigValue::List &ConfigValue::asList() const {
    if (m_type != Type::List) throw wrongType(Type::List, m_type);
    return m_list;
}

const ConfigValue::Table &ConfigValue::asTable() const {
    if (m_type != Type::Table) throw wrongType(Type::Table, m_type);
    return m_table;
}

const ConfigValue *ConfigValue::find(const std::string &key) const {
    if (m_type != Type::Table) return nullptr;
    for (const auto &e : m_table) {
        if (e.first == key) return &e.second;
    }
    return nullptr;
}

bool ConfigValue::operator==(const ConfigValue &other) const {
    if (m_type != other.m_type) return false;
    switch (m_type) {
    case Type::String:  return m_string == other.m_string;
    case Type::Integer: return m_integer == other.m_integer;
    case Type::Boolean: return m_boolean == other.m_boolean;
    case Type::List:    return m_list == other.m_list;
    case Type::Table:   return m_table == other.m_table;
    }
    return false;
}

std::string ConfigValue::describe() const {
    switch (m_type) {
    case Type::String:  return "\"" + m_string + "\"";
    case Type::Integer: return std::to_string(m_integer);
    case Type::Boolean: return m_boolean ? "true" : "false";
    case Type::List:    return "list of " + std::to_string(m_list.size()) + " element(s)";
    case Type::Table:   return "table of " + std::to_string(m_table.size()) + " key(s)";
    }
    return "?";
}

const char *ConfigValue::typeName(Type type) {
    switch (type) {
    case Type::String:  return "string";
    case Type::Integer: return "integer";
    case Type::Boolean: return "boolean";
    case Type::List:    return "list";
    case Type::Table:   return "table";
    }
    return "unknown";
}

} // namespace pm
