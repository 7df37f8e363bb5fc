#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace minirel {

// Column / value type tag. The numeric value is persisted in index entries.
enum class ValueType : uint8_t {
    INT = 0x01,      // 32-bit signed
    BIGINT = 0x02,   // 64-bit signed
    FLOAT = 0x03,
    DOUBLE = 0x04,
    VARCHAR = 0x05,  // variable length, bounded by the column length
    CHAR = 0x06      // fixed length, NUL-padded on disk
};

const char* value_type_name(ValueType type);

/**
 * Value - One typed scalar of a row.
 *
 * Ordering (compare) is numeric across the four numeric types and bytewise
 * across the two text types; every numeric value sorts before every text
 * value. Equality (operator==) is exact: same tag and same payload.
 */
class Value {
public:
    Value() : type_(ValueType::INT), data_(int32_t{0}) {}

    static Value integer(int32_t v) { return Value(ValueType::INT, v); }
    static Value big_integer(int64_t v) { return Value(ValueType::BIGINT, v); }
    static Value real(float v) { return Value(ValueType::FLOAT, v); }
    static Value double_value(double v) { return Value(ValueType::DOUBLE, v); }
    static Value varchar(std::string v) { return Value(ValueType::VARCHAR, std::move(v)); }
    static Value fixed_char(std::string v) { return Value(ValueType::CHAR, std::move(v)); }

    ValueType type() const { return type_; }

    bool is_numeric() const { return !is_text(); }
    bool is_text() const { return type_ == ValueType::VARCHAR || type_ == ValueType::CHAR; }
    bool is_integral() const { return type_ == ValueType::INT || type_ == ValueType::BIGINT; }

    int32_t as_int() const { return std::get<int32_t>(data_); }
    int64_t as_bigint() const { return std::get<int64_t>(data_); }
    float as_float() const { return std::get<float>(data_); }
    double as_double() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }

    // Integral payload widened to 64 bits (INT or BIGINT only)
    int64_t integral() const;

    // Numeric payload widened to double (any numeric type)
    double numeric() const;

    // <0, 0, >0 like strcmp
    int compare(const Value& other) const;

    bool operator==(const Value& other) const {
        return type_ == other.type_ && data_ == other.data_;
    }
    bool operator!=(const Value& other) const { return !(*this == other); }
    bool operator<(const Value& other) const { return compare(other) < 0; }

    std::string to_string() const;

private:
    using Storage = std::variant<int32_t, int64_t, float, double, std::string>;

    Value(ValueType type, Storage data) : type_(type), data_(std::move(data)) {}

    ValueType type_;
    Storage data_;
};

using Row = std::vector<Value>;

std::string row_to_string(const Row& row);

/**
 * Column definition supplied by the catalog collaborator.
 * `length` is the declared n of VARCHAR(n) / CHAR(n); ignored otherwise.
 */
struct Column {
    std::string name;
    ValueType type = ValueType::INT;
    uint16_t length = 0;

    Column() = default;
    Column(std::string column_name, ValueType column_type, uint16_t column_length = 0)
        : name(std::move(column_name)), type(column_type), length(column_length) {}
};

class Schema {
public:
    Schema() = default;
    explicit Schema(std::vector<Column> columns) : columns_(std::move(columns)) {}

    const std::vector<Column>& columns() const { return columns_; }
    const Column& column(size_t index) const { return columns_.at(index); }
    size_t size() const { return columns_.size(); }
    bool empty() const { return columns_.empty(); }

    std::optional<size_t> index_of(const std::string& name) const;

private:
    std::vector<Column> columns_;
};

}  // namespace minirel
