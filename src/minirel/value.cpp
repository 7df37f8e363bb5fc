#include <minirel/value.hpp>

#include <cmath>
#include <sstream>

namespace minirel {

const char* value_type_name(ValueType type) {
    switch (type) {
        case ValueType::INT: return "INT";
        case ValueType::BIGINT: return "BIGINT";
        case ValueType::FLOAT: return "FLOAT";
        case ValueType::DOUBLE: return "DOUBLE";
        case ValueType::VARCHAR: return "VARCHAR";
        case ValueType::CHAR: return "CHAR";
        default: return "UNKNOWN";
    }
}

int64_t Value::integral() const {
    if (type_ == ValueType::INT) {
        return static_cast<int64_t>(as_int());
    }
    return as_bigint();
}

double Value::numeric() const {
    switch (type_) {
        case ValueType::INT: return static_cast<double>(as_int());
        case ValueType::BIGINT: return static_cast<double>(as_bigint());
        case ValueType::FLOAT: return static_cast<double>(as_float());
        case ValueType::DOUBLE: return as_double();
        default: return 0.0;
    }
}

int Value::compare(const Value& other) const {
    if (is_text() != other.is_text()) {
        return is_text() ? 1 : -1;
    }

    if (is_text()) {
        int c = as_string().compare(other.as_string());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    // Stay in integer arithmetic when both sides allow it so large
    // BIGINT keys do not collapse through double rounding
    if (is_integral() && other.is_integral()) {
        int64_t a = integral();
        int64_t b = other.integral();
        return a < b ? -1 : (a > b ? 1 : 0);
    }

    double a = numeric();
    double b = other.numeric();
    // NaN sorts after every other number and equals only NaN
    bool a_nan = std::isnan(a);
    bool b_nan = std::isnan(b);
    if (a_nan || b_nan) {
        return a_nan == b_nan ? 0 : (a_nan ? 1 : -1);
    }
    if (a < b) return -1;
    if (a > b) return 1;
    return 0;
}

std::string Value::to_string() const {
    switch (type_) {
        case ValueType::INT: return std::to_string(as_int());
        case ValueType::BIGINT: return std::to_string(as_bigint());
        case ValueType::FLOAT:
        case ValueType::DOUBLE: {
            std::ostringstream ss;
            ss << numeric();
            return ss.str();
        }
        case ValueType::VARCHAR:
        case ValueType::CHAR:
            return "'" + as_string() + "'";
        default:
            return "?";
    }
}

std::string row_to_string(const Row& row) {
    std::string out = "(";
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out += ", ";
        out += row[i].to_string();
    }
    out += ")";
    return out;
}

std::optional<size_t> Schema::index_of(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace minirel
