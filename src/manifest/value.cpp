// ==============================================================================
// value.cpp - Реализация Value (структурированный документ манифеста)
// ==============================================================================

#include <mustgather/value.hpp>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace mustgather {

namespace {

// ----------------------------------------------------------------------------
// Разрешение типов plain скаляров (YAML 1.2 core schema, подмножество)
// ----------------------------------------------------------------------------

constexpr const char* YAML_STR_TAG = "tag:yaml.org,2002:str";

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/// [-+]?[0-9]+
bool looks_like_integer(const std::string& s) {
    std::size_t i = 0;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        i = 1;
    }
    if (i >= s.size()) {
        return false;
    }
    for (; i < s.size(); ++i) {
        if (!is_digit(s[i])) {
            return false;
        }
    }
    return true;
}

/// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
bool looks_like_float(const std::string& s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        ++i;
    }
    std::size_t int_digits = 0;
    while (i < s.size() && is_digit(s[i])) {
        ++i;
        ++int_digits;
    }
    std::size_t frac_digits = 0;
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && is_digit(s[i])) {
            ++i;
            ++frac_digits;
        }
    }
    if (int_digits == 0 && frac_digits == 0) {
        return false;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
            ++i;
        }
        std::size_t exp_digits = 0;
        while (i < s.size() && is_digit(s[i])) {
            ++i;
            ++exp_digits;
        }
        if (exp_digits == 0) {
            return false;
        }
    }
    return i == s.size();
}

std::optional<Value> resolve_special_float(const std::string& s) {
    if (s == ".inf" || s == ".Inf" || s == ".INF" || s == "+.inf" || s == "+.Inf" ||
        s == "+.INF") {
        return Value(std::numeric_limits<double>::infinity());
    }
    if (s == "-.inf" || s == "-.Inf" || s == "-.INF") {
        return Value(-std::numeric_limits<double>::infinity());
    }
    if (s == ".nan" || s == ".NaN" || s == ".NAN") {
        return Value(std::numeric_limits<double>::quiet_NaN());
    }
    return std::nullopt;
}

/// Порядок приоритета для целых: UInt64 → Int64 → Double
Value resolve_plain_scalar(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") {
        return Value(true);
    }
    if (s == "false" || s == "False" || s == "FALSE") {
        return Value(false);
    }

    if (looks_like_integer(s)) {
        errno = 0;
        if (s[0] != '-') {
            unsigned long long u = std::strtoull(s.c_str(), nullptr, 10);
            if (errno == 0) {
                return Value(static_cast<std::uint64_t>(u));
            }
        } else {
            long long i = std::strtoll(s.c_str(), nullptr, 10);
            if (errno == 0) {
                return Value(static_cast<std::int64_t>(i));
            }
        }
        // Переполнение: ниже как double
    }

    if (looks_like_integer(s) || looks_like_float(s)) {
        errno = 0;
        double d = std::strtod(s.c_str(), nullptr);
        if (errno == 0) {
            return Value(d);
        }
    }

    if (auto special = resolve_special_float(s)) {
        return *special;
    }

    return Value(s);
}

}  // namespace

// ----------------------------------------------------------------------------
// Операции с массивом и объектом
// ----------------------------------------------------------------------------

void Value::push_back(Value v) {
    if (auto* arr = get_array_mut()) {
        arr->push_back(std::move(v));
    }
}

void Value::set(const std::string& key, Value v) {
    if (auto* obj = get_object_mut()) {
        (*obj)[key] = std::move(v);
    }
}

std::size_t Value::size() const {
    if (const auto* arr = get_array()) {
        return arr->size();
    }
    if (const auto* obj = get_object()) {
        return obj->size();
    }
    return 0;
}

const Value* Value::get(const std::string& key) const {
    const auto* obj = get_object();
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = obj->find(key);
    return it != obj->end() ? &it->second : nullptr;
}

// ----------------------------------------------------------------------------
// Вложенный доступ
// ----------------------------------------------------------------------------

const Value* Value::find(const KeyPath& keys) const {
    const Value* current = this;
    for (const auto& key : keys) {
        current = current->get(key);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

const Value* Value::find(std::initializer_list<std::string> keys) const {
    return find(KeyPath(keys));
}

std::optional<std::string> Value::find_string(const KeyPath& keys) const {
    const Value* leaf = find(keys);
    if (leaf == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = leaf->get_string()) {
        return *s;
    }
    return std::nullopt;
}

std::optional<std::string> Value::find_string(std::initializer_list<std::string> keys) const {
    return find_string(KeyPath(keys));
}

// ----------------------------------------------------------------------------
// Value::from_yaml
// ----------------------------------------------------------------------------

Value Value::from_yaml(const YAML::Node& node) {
    if (!node.IsDefined()) {
        return Value();
    }

    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return Value();

    case YAML::NodeType::Scalar: {
        // Tag "?" - plain скаляр, "!" - quoted
        const std::string& tag = node.Tag();
        if (tag == "!" || tag == YAML_STR_TAG) {
            return Value(node.Scalar());
        }
        return resolve_plain_scalar(node.Scalar());
    }

    case YAML::NodeType::Sequence: {
        Array arr;
        arr.reserve(node.size());
        for (const auto& item : node) {
            arr.push_back(from_yaml(item));
        }
        return Value(std::move(arr));
    }

    case YAML::NodeType::Map: {
        Object obj;
        for (const auto& kv : node) {
            if (!kv.first.IsScalar()) {
                continue;
            }
            obj[kv.first.Scalar()] = from_yaml(kv.second);
        }
        return Value(std::move(obj));
    }
    }

    return Value();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
    } else if (is_bool()) {
        out.SetBool(as_bool());
    } else if (is_int()) {
        out.SetInt64(as_int());
    } else if (is_uint()) {
        out.SetUint64(as_uint());
    } else if (is_double()) {
        double d = as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
    } else if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    } else if (is_array()) {
        out.SetArray();
        out.Reserve(static_cast<rapidjson::SizeType>(size()), alloc);
        for (const auto& elem : as_array()) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
    } else if (is_object()) {
        out.SetObject();
        for (const auto& [key, val] : as_object()) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
    } else {
        out.SetNull();
    }
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

}  // namespace mustgather
