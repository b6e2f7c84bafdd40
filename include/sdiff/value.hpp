// ==============================================================================
// sdiff/value.hpp - Дерево значений документа (Value)
// ==============================================================================
//
// Назначение:
// - Единое представление распарсенного документа (JSON/YAML)
// - Шесть вариантов: Null, Bool, Number, String, Object, Array
// - Структурное семантическое сравнение (semantic_equals)
// - Конверсия из/в RapidJSON, из yaml-cpp
//
// Все числа хранятся как double: потеря точности для больших целых
// принимается на стороне парсера.
//
// ==============================================================================

#ifndef SDIFF_VALUE_HPP
#define SDIFF_VALUE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
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

namespace sdiff {

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта (map string -> Value, порядок ключей не значим)
using ValueObject = std::unordered_map<std::string, Value>;

/// Вариант значения (для switch без цепочки is_*)
enum class ValueKind { Null, Bool, Number, String, Object, Array };

/// Абсолютный допуск при сравнении чисел.
/// Не относительный: большие числа с разницей > 1e-10 считаются разными.
constexpr double NUMBER_EPSILON = 1e-10;

// ----------------------------------------------------------------------------
// Value - дерево значений документа
// ----------------------------------------------------------------------------
//
// Контейнеры хранятся через unique_ptr (ValueObject требует полного типа).
// Копирование Value глубокое: копия никогда не разделяет узлы с оригиналом,
// поэтому Diff может пережить исходные деревья.
//

class Value {
public:
    // Внутренние типы для variant
    struct Null {};
    using Bool = bool;
    using Number = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Number, String, std::unique_ptr<Array>, std::unique_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    /// Создать Null значение
    Value() : data_(Null{}) {}

    /// Создать Bool значение
    explicit Value(bool v) : data_(v) {}

    /// Создать Number значение
    explicit Value(double v) : data_(v) {}

    /// Создать Number значение из целого
    explicit Value(int v) : data_(static_cast<double>(v)) {}

    /// Создать String значение
    explicit Value(std::string v) : data_(std::move(v)) {}

    /// Создать String значение из C-строки
    explicit Value(const char* v) : data_(std::string(v)) {}

    /// Создать Array значение
    explicit Value(Array v) : data_(std::make_unique<Array>(std::move(v))) {}

    /// Создать Object значение
    explicit Value(Object v) : data_(std::make_unique<Object>(std::move(v))) {}

    /// Глубокое копирование
    Value(const Value& other);
    Value& operator=(const Value& other);

    /// Перемещение: источник становится Null
    Value(Value&& other) noexcept;
    Value& operator=(Value&& other) noexcept;

    ~Value() = default;

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    static Value make_null() { return Value(); }
    static Value make_bool(bool v) { return Value(v); }
    static Value make_number(double v) { return Value(v); }
    static Value make_string(std::string v) { return Value(std::move(v)); }

    /// Создать пустой Array
    static Value make_array() { return Value(Array{}); }

    /// Создать пустой Object
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_number() const { return std::holds_alternative<Number>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::unique_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::unique_ptr<Object>>(data_); }

    /// Текущий вариант
    ValueKind kind() const;

    /// Имя типа для сообщений: "null", "boolean", "number", "string", "object", "array"
    const char* type_name() const;

    // -------------------------------------------------------------------------
    // Доступ к значению
    // -------------------------------------------------------------------------

    /// Получить bool значение (undefined behavior если не is_bool())
    Bool as_bool() const { return std::get<Bool>(data_); }

    /// Получить число (undefined behavior если не is_number())
    Number as_number() const { return std::get<Number>(data_); }

    /// Получить string значение (undefined behavior если не is_string())
    const String& as_string() const { return std::get<String>(data_); }

    /// Получить array (undefined behavior если не is_array())
    const Array& as_array() const { return *std::get<std::unique_ptr<Array>>(data_); }

    /// Получить array для модификации
    Array& as_array_mut() { return *std::get<std::unique_ptr<Array>>(data_); }

    /// Получить object (undefined behavior если не is_object())
    const Object& as_object() const { return *std::get<std::unique_ptr<Object>>(data_); }

    /// Получить object для модификации
    Object& as_object_mut() { return *std::get<std::unique_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (возвращает nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const Bool* get_bool() const { return std::get_if<Bool>(&data_); }

    const Number* get_number() const { return std::get_if<Number>(&data_); }

    const String* get_string() const { return std::get_if<String>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::unique_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::unique_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    /// Добавить элемент в массив (только если is_array())
    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    /// Размер массива (0 если не массив)
    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    /// Доступ к элементу массива по индексу
    const Value* at(std::size_t index) const {
        if (const auto* arr = get_array()) {
            if (index < arr->size()) {
                return &(*arr)[index];
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    /// Установить поле объекта (только если is_object())
    void set(const std::string& key, Value v) {
        if (auto* obj = get_object_mut()) {
            (*obj)[key] = std::move(v);
        }
    }

    /// Получить поле объекта по ключу (nullptr если не найдено или не объект)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Проверить наличие ключа в объекте
    bool has(const std::string& key) const { return get(key) != nullptr; }

    /// Размер объекта (0 если не объект)
    std::size_t object_size() const {
        if (const auto* obj = get_object()) {
            return obj->size();
        }
        return 0;
    }

    // -------------------------------------------------------------------------
    // Семантическое сравнение
    // -------------------------------------------------------------------------

    /// Структурное равенство: порядок ключей объекта не важен,
    /// числа сравниваются с допуском NUMBER_EPSILON, массивы поэлементно.
    /// Разные варианты никогда не равны.
    bool semantic_equals(const Value& other) const;

    // -------------------------------------------------------------------------
    // Представление для вывода
    // -------------------------------------------------------------------------

    /// Короткое представление значения, обрезанное до max_len байт
    /// (с "..." в конце при обрезке)
    std::string preview(std::size_t max_len) const;

    /// Приблизительный размер дерева в байтах
    std::size_t approximate_size() const;

    // -------------------------------------------------------------------------
    // Конверсия
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value (все числа -> double)
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON Value
    /// @param null_non_finite NaN/Inf -> null вместо исключения
    /// @throws std::runtime_error для NaN/Inf при null_non_finite == false
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc,
                      bool null_non_finite = false) const;

    /// Создать новый RapidJSON Document из этого Value
    rapidjson::Document to_rapidjson_document() const;

    /// Компактная JSON-строка (NaN/Inf выводятся как null)
    std::string to_json_string() const;

    /// Конвертировать из yaml-cpp узла (скаляры по core schema YAML 1.2)
    static Value from_yaml(const YAML::Node& node);

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::unique_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::unique_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

}  // namespace sdiff

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // SDIFF_VALUE_HPP
