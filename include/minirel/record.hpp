#pragma once

#include <minirel/result.hpp>
#include <minirel/value.hpp>

#include <string>

namespace minirel {

/**
 * Schema-driven tuple encoding used by data pages.
 *
 * Widths: INT 4, BIGINT 8, FLOAT 4, DOUBLE 8, VARCHAR(n) uint16 length +
 * bytes, CHAR(n) exactly n bytes. Values are coerced to the column type
 * first (see coerce_value), so the bytes never depend on how the caller
 * spelled a literal.
 *
 * @return SCHEMA_MISMATCH on arity, type or length violations
 */
Result<std::string> encode_row(const Schema& schema, const Row& row);

Result<Row> decode_row(const Schema& schema, const char* data, size_t size);

/**
 * Convert a value to the column's type.
 * Accepts INT -> BIGINT/DOUBLE, BIGINT -> DOUBLE, FLOAT -> DOUBLE and
 * VARCHAR <-> CHAR within the declared length.
 */
Result<Value> coerce_value(const Value& value, const Column& column);

class BinaryWriter;
class BinaryReader;

// Self-describing encoding (type tag + payload), used by index entries
void encode_tagged_value(const Value& value, BinaryWriter& writer);
void encode_tagged_row(const Row& row, BinaryWriter& writer);

bool decode_tagged_value(BinaryReader& reader, Value* value);
bool decode_tagged_row(BinaryReader& reader, Row* row);

}  // namespace minirel
