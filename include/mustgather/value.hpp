// ==============================================================================
// mustgather/value.hpp - Структурированный документ манифеста (Value)
// ==============================================================================
//
// Назначение:
// - Каноническое представление распарсенного YAML манифеста
// - Вложенный доступ к полям по последовательности ключей
// - Конверсия из yaml-cpp (YAML::Node) и в RapidJSON (для --json)
//
// Типизация скаляров YAML:
// - plain скаляры: null (~, null, пусто) → bool → Int64/UInt64 → Double → String
// - quoted скаляры ('...', "...") всегда String
//
// ==============================================================================

#ifndef MUSTGATHER_VALUE_HPP
#define MUSTGATHER_VALUE_HPP

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace YAML {
class Node;
}  // namespace YAML

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace mustgather {

class Value;

/// Последовательность YAML элементов
using ValueArray = std::vector<Value>;

/// YAML mapping. Упорядочен по ключу: JSON вывод детерминирован
using ValueObject = std::map<std::string, Value>;

/// Путь к вложенному полю: {"status", "desired", "version"}
using KeyPath = std::vector<std::string>;

class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }


    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const String* get_string() const { return std::get_if<String>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом и объектом
    // -------------------------------------------------------------------------

    /// Добавить элемент (только если is_array())
    void push_back(Value v);

    /// Установить поле (только если is_object())
    void set(const std::string& key, Value v);

    std::size_t size() const;


    /// Поле объекта по ключу (nullptr если нет ключа или не объект)
    const Value* get(const std::string& key) const;


    // -------------------------------------------------------------------------
    // Вложенный доступ
    // -------------------------------------------------------------------------

    /// Спуститься по цепочке ключей объектов
    /// Пустой путь возвращает this. nullptr если любое звено отсутствует.
    const Value* find(const KeyPath& keys) const;
    const Value* find(std::initializer_list<std::string> keys) const;

    /// Строка на конце пути; nullopt если поля нет или это не строка
    std::optional<std::string> find_string(const KeyPath& keys) const;
    std::optional<std::string> find_string(std::initializer_list<std::string> keys) const;

    // -------------------------------------------------------------------------
    // Конверсии
    // -------------------------------------------------------------------------

    /// Конвертировать yaml-cpp узел (рекурсивно)
    /// Ключи mapping'ов, не являющиеся скалярами, пропускаются.
    static Value from_yaml(const YAML::Node& node);

    /// Записать в RapidJSON Value
    /// @throws std::runtime_error для нечислового double (nan, inf)
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    rapidjson::Document to_rapidjson_document() const;

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;
};

}  // namespace mustgather

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // MUSTGATHER_VALUE_HPP
