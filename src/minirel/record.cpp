#include <minirel/record.hpp>
#include <minirel/util/serializer.hpp>

#include <limits>

namespace minirel {

namespace {

constexpr size_t MAX_TEXT_LENGTH = std::numeric_limits<uint16_t>::max();

Error mismatch(const Column& column, const std::string& detail) {
    return Error(ErrorCode::SCHEMA_MISMATCH,
                 "column '" + column.name + "' (" + value_type_name(column.type) + "): " + detail);
}

void write_payload(const Value& value, BinaryWriter& writer) {
    switch (value.type()) {
        case ValueType::INT: writer.write_int32(value.as_int()); break;
        case ValueType::BIGINT: writer.write_int64(value.as_bigint()); break;
        case ValueType::FLOAT: writer.write_float(value.as_float()); break;
        case ValueType::DOUBLE: writer.write_double(value.as_double()); break;
        case ValueType::VARCHAR:
        case ValueType::CHAR: writer.write_short_string(value.as_string()); break;
    }
}

bool read_payload(ValueType type, BinaryReader& reader, Value* value) {
    switch (type) {
        case ValueType::INT: {
            int32_t v;
            if (!reader.read_int32(&v)) return false;
            *value = Value::integer(v);
            return true;
        }
        case ValueType::BIGINT: {
            int64_t v;
            if (!reader.read_int64(&v)) return false;
            *value = Value::big_integer(v);
            return true;
        }
        case ValueType::FLOAT: {
            float v;
            if (!reader.read_float(&v)) return false;
            *value = Value::real(v);
            return true;
        }
        case ValueType::DOUBLE: {
            double v;
            if (!reader.read_double(&v)) return false;
            *value = Value::double_value(v);
            return true;
        }
        case ValueType::VARCHAR:
        case ValueType::CHAR: {
            std::string s;
            if (!reader.read_short_string(&s)) return false;
            *value = type == ValueType::VARCHAR ? Value::varchar(std::move(s))
                                                : Value::fixed_char(std::move(s));
            return true;
        }
    }
    return false;
}

bool is_known_type(uint8_t tag) {
    return tag >= static_cast<uint8_t>(ValueType::INT) &&
           tag <= static_cast<uint8_t>(ValueType::CHAR);
}

}  // namespace

Result<Value> coerce_value(const Value& value, const Column& column) {
    switch (column.type) {
        case ValueType::INT:
            if (value.type() == ValueType::INT) return value;
            break;
        case ValueType::BIGINT:
            if (value.is_integral()) return Value::big_integer(value.integral());
            break;
        case ValueType::FLOAT:
            if (value.type() == ValueType::FLOAT) return value;
            break;
        case ValueType::DOUBLE:
            if (value.is_numeric()) return Value::double_value(value.numeric());
            break;
        case ValueType::VARCHAR:
        case ValueType::CHAR: {
            if (!value.is_text()) break;
            const std::string& s = value.as_string();
            size_t limit = column.length > 0 ? column.length : MAX_TEXT_LENGTH;
            if (s.size() > limit) {
                return mismatch(column, "value of length " + std::to_string(s.size()) +
                                        " exceeds " + std::to_string(limit));
            }
            if (column.type == ValueType::CHAR && s.find('\0') != std::string::npos) {
                return mismatch(column, "CHAR values cannot contain NUL bytes");
            }
            return column.type == ValueType::VARCHAR ? Value::varchar(s) : Value::fixed_char(s);
        }
    }
    return mismatch(column, std::string("cannot store a ") + value_type_name(value.type()));
}

Result<std::string> encode_row(const Schema& schema, const Row& row) {
    if (row.size() != schema.size()) {
        return Error(ErrorCode::SCHEMA_MISMATCH,
                     "row has " + std::to_string(row.size()) + " values, schema has " +
                     std::to_string(schema.size()) + " columns");
    }

    BinaryWriter writer;
    for (size_t i = 0; i < row.size(); ++i) {
        const Column& column = schema.column(i);
        if (column.type == ValueType::CHAR && column.length == 0) {
            return mismatch(column, "CHAR columns need a declared length");
        }

        auto coerced = coerce_value(row[i], column);
        if (!coerced.ok()) {
            return coerced.error();
        }

        const Value& v = coerced.value();
        if (column.type == ValueType::CHAR) {
            writer.write_fixed(v.as_string(), column.length);
        } else {
            write_payload(v, writer);
        }
    }
    return writer.release();
}

Result<Row> decode_row(const Schema& schema, const char* data, size_t size) {
    BinaryReader reader(data, size);
    Row row;
    row.reserve(schema.size());

    for (const Column& column : schema.columns()) {
        Value v;
        bool ok;
        if (column.type == ValueType::CHAR) {
            std::string s;
            ok = reader.read_fixed(&s, column.length);
            v = Value::fixed_char(std::move(s));
        } else {
            ok = read_payload(column.type, reader, &v);
        }
        if (!ok) {
            return Error(ErrorCode::PAGE_FORMAT_ERROR,
                         "tuple truncated while decoding column '" + column.name + "'");
        }
        row.push_back(std::move(v));
    }
    return row;
}

void encode_tagged_value(const Value& value, BinaryWriter& writer) {
    writer.write_uint8(static_cast<uint8_t>(value.type()));
    write_payload(value, writer);
}

void encode_tagged_row(const Row& row, BinaryWriter& writer) {
    writer.write_uint16(static_cast<uint16_t>(row.size()));
    for (const Value& v : row) {
        encode_tagged_value(v, writer);
    }
}

bool decode_tagged_value(BinaryReader& reader, Value* value) {
    uint8_t tag;
    if (!reader.read_uint8(&tag) || !is_known_type(tag)) {
        return false;
    }
    return read_payload(static_cast<ValueType>(tag), reader, value);
}

bool decode_tagged_row(BinaryReader& reader, Row* row) {
    uint16_t count;
    if (!reader.read_uint16(&count)) {
        return false;
    }
    row->clear();
    row->reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        Value v;
        if (!decode_tagged_value(reader, &v)) {
            return false;
        }
        row->push_back(std::move(v));
    }
    return true;
}

}  // namespace minirel
