#include "format/value_formatter.hpp"
#include "sqlcsv_exception.hpp"
#include "tds/encoding/guid_encoding.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace sqlcsv {

using tds::encoding::GuidEncoding;

static const char HEX_DIGITS[] = "0123456789abcdef";

std::string ValueFormatter::FormatHex(const std::vector<uint8_t> &bytes) {
	std::string result;
	result.reserve(2 + bytes.size() * 2);
	result += "0x";
	for (auto byte : bytes) {
		result.push_back(HEX_DIGITS[byte >> 4]);
		result.push_back(HEX_DIGITS[byte & 0x0F]);
	}
	return result;
}

std::string ValueFormatter::FormatFloat(double value) {
	if (std::isnan(value)) {
		return "NaN";
	}
	if (std::isinf(value)) {
		return value > 0 ? "+Inf" : "-Inf";
	}

	// Shortest mantissa that reads back as the same double
	char buffer[48];
	int digits = 17;
	for (int precision = 0; precision <= 16; precision++) {
		snprintf(buffer, sizeof(buffer), "%.*e", precision, value);
		if (std::strtod(buffer, nullptr) == value) {
			digits = precision + 1;
			break;
		}
	}
	const char *exponent_text = std::strchr(buffer, 'e');
	int exponent = exponent_text ? std::atoi(exponent_text + 1) : 0;
	if (exponent < -4 || exponent >= 6) {
		return buffer;
	}
	int decimals = std::max(digits - 1 - exponent, 0);
	snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
	return buffer;
}

static std::string FormatGuid(const RawCellValue &value) {
	if (value.GetKind() != RawCellValue::Kind::Bytes) {
		throw MalformedIdentifier("UNIQUEIDENTIFIER value is a %s, not a byte sequence",
		                          RawCellValue::KindToString(value.GetKind()));
	}
	auto &bytes = value.GetBytes();
	if (bytes.size() != GuidEncoding::GUID_SIZE) {
		throw MalformedIdentifier("UNIQUEIDENTIFIER value has %llu bytes, expected 16", bytes.size());
	}
	return GuidEncoding::FormatGuid(bytes.data());
}

static std::string FormatDefault(const RawCellValue &value) {
	switch (value.GetKind()) {
	case RawCellValue::Kind::Null:
		return std::string();
	case RawCellValue::Kind::Boolean:
		return value.GetBoolean() ? "true" : "false";
	case RawCellValue::Kind::Integer:
		return std::to_string(value.GetInteger());
	case RawCellValue::Kind::Float:
		return ValueFormatter::FormatFloat(value.GetFloat());
	case RawCellValue::Kind::Bytes:
		return ValueFormatter::FormatHex(value.GetBytes());
	case RawCellValue::Kind::String:
		return value.GetString();
	}
	return std::string();
}

std::string ValueFormatter::Format(const ColumnDescriptor &column, const RawCellValue &value,
                                   const std::string &null_literal) {
	if (value.IsNull()) {
		return null_literal;
	}

	auto &type_name = column.database_type_name;
	if (type_name == "UNIQUEIDENTIFIER") {
		return FormatGuid(value);
	}
	// DECIMAL shares the MONEY rule
	if ((type_name == "MONEY" || type_name == "DECIMAL") && value.GetKind() == RawCellValue::Kind::Bytes) {
		auto &bytes = value.GetBytes();
		return std::string(bytes.begin(), bytes.end());
	}
	if (type_name == "BIT" && value.GetKind() == RawCellValue::Kind::Boolean) {
		return value.GetBoolean() ? "1" : "0";
	}
	return FormatDefault(value);
}

}  // namespace sqlcsv
