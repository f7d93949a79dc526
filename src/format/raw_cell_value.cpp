#include "format/raw_cell_value.hpp"
#include "duckdb/common/exception.hpp"

namespace sqlcsv {

RawCellValue::RawCellValue() : RawCellValue(Kind::Null) {
}

RawCellValue::RawCellValue(Kind kind) : kind_(kind) {
	scalar_.integer = 0;
}

RawCellValue RawCellValue::Null() {
	return RawCellValue(Kind::Null);
}

RawCellValue RawCellValue::Boolean(bool value) {
	RawCellValue result(Kind::Boolean);
	result.scalar_.boolean = value;
	return result;
}

RawCellValue RawCellValue::Integer(int64_t value) {
	RawCellValue result(Kind::Integer);
	result.scalar_.integer = value;
	return result;
}

RawCellValue RawCellValue::Float(double value) {
	RawCellValue result(Kind::Float);
	result.scalar_.floating = value;
	return result;
}

RawCellValue RawCellValue::Bytes(std::vector<uint8_t> value) {
	RawCellValue result(Kind::Bytes);
	result.bytes_ = std::move(value);
	return result;
}

RawCellValue RawCellValue::Bytes(const std::string &value) {
	return Bytes(std::vector<uint8_t>(value.begin(), value.end()));
}

RawCellValue RawCellValue::String(std::string value) {
	RawCellValue result(Kind::String);
	result.string_ = std::move(value);
	return result;
}

void RawCellValue::CheckKind(Kind expected) const {
	if (kind_ != expected) {
		throw duckdb::InternalException("RawCellValue holds %s, not %s", KindToString(kind_), KindToString(expected));
	}
}

bool RawCellValue::GetBoolean() const {
	CheckKind(Kind::Boolean);
	return scalar_.boolean;
}

int64_t RawCellValue::GetInteger() const {
	CheckKind(Kind::Integer);
	return scalar_.integer;
}

double RawCellValue::GetFloat() const {
	CheckKind(Kind::Float);
	return scalar_.floating;
}

const std::vector<uint8_t> &RawCellValue::GetBytes() const {
	CheckKind(Kind::Bytes);
	return bytes_;
}

const std::string &RawCellValue::GetString() const {
	CheckKind(Kind::String);
	return string_;
}

const char *RawCellValue::KindToString(Kind kind) {
	switch (kind) {
	case Kind::Null:
		return "null";
	case Kind::Boolean:
		return "boolean";
	case Kind::Integer:
		return "integer";
	case Kind::Float:
		return "float";
	case Kind::Bytes:
		return "bytes";
	case Kind::String:
		return "string";
	}
	return "unknown";
}

}  // namespace sqlcsv
