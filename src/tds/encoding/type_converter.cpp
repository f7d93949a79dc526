#include "tds/encoding/type_converter.hpp"
#include "tds/encoding/datetime_encoding.hpp"
#include "tds/encoding/decimal_encoding.hpp"
#include "tds/encoding/utf16.hpp"
#include "tds/tds_types.hpp"
#include "duckdb/common/exception.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

static int GetTypeConverterDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLCSV_TC_DEBUG_LOG(level, fmt, ...)                          \
	do {                                                              \
		if (GetTypeConverterDebugLevel() >= level) {                  \
			fprintf(stderr, "[SQLCSV TC] " fmt "\n", ##__VA_ARGS__); \
		}                                                             \
	} while (0)

namespace sqlcsv {
namespace tds {
namespace encoding {

std::string TypeConverter::GetDatabaseTypeName(const ColumnMetadata &column) {
	switch (column.type_id) {
	case TDS_TYPE_TINYINT:
		return "TINYINT";
	case TDS_TYPE_SMALLINT:
		return "SMALLINT";
	case TDS_TYPE_INT:
		return "INT";
	case TDS_TYPE_BIGINT:
		return "BIGINT";
	case TDS_TYPE_INTN:
		switch (column.max_length) {
		case 1:
			return "TINYINT";
		case 2:
			return "SMALLINT";
		case 4:
			return "INT";
		case 8:
			return "BIGINT";
		default:
			throw duckdb::InvalidInputException("Invalid INTN length: %d", column.max_length);
		}
	case TDS_TYPE_BIT:
	case TDS_TYPE_BITN:
		return "BIT";
	case TDS_TYPE_REAL:
		return "REAL";
	case TDS_TYPE_FLOAT:
		return "FLOAT";
	case TDS_TYPE_FLOATN:
		return column.max_length == 4 ? "REAL" : "FLOAT";
	case TDS_TYPE_MONEY:
		return "MONEY";
	case TDS_TYPE_SMALLMONEY:
		return "SMALLMONEY";
	case TDS_TYPE_MONEYN:
		return column.max_length == 4 ? "SMALLMONEY" : "MONEY";
	case TDS_TYPE_DATETIME:
		return "DATETIME";
	case TDS_TYPE_SMALLDATETIME:
		return "SMALLDATETIME";
	case TDS_TYPE_DATETIMEN:
		return column.max_length == 4 ? "SMALLDATETIME" : "DATETIME";
	case TDS_TYPE_DATE:
		return "DATE";
	case TDS_TYPE_TIME:
		return "TIME";
	case TDS_TYPE_DATETIME2:
		return "DATETIME2";
	case TDS_TYPE_DATETIMEOFFSET:
		return "DATETIMEOFFSET";
	case TDS_TYPE_DECIMAL:
	case TDS_TYPE_NUMERIC:
		return "DECIMAL";
	case TDS_TYPE_UNIQUEIDENTIFIER:
		return "UNIQUEIDENTIFIER";
	case TDS_TYPE_BIGVARCHAR:
		return "VARCHAR";
	case TDS_TYPE_BIGCHAR:
		return "CHAR";
	case TDS_TYPE_NVARCHAR:
		return "NVARCHAR";
	case TDS_TYPE_NCHAR:
		return "NCHAR";
	case TDS_TYPE_BIGVARBINARY:
		return "VARBINARY";
	case TDS_TYPE_BIGBINARY:
		return "BINARY";
	case TDS_TYPE_XML:
		return "XML";
	case TDS_TYPE_TEXT:
		return "TEXT";
	case TDS_TYPE_NTEXT:
		return "NTEXT";
	case TDS_TYPE_IMAGE:
		return "IMAGE";
	case TDS_TYPE_SQL_VARIANT:
		return "SQL_VARIANT";
	case TDS_TYPE_UDT:
		return "UDT";
	case TDS_TYPE_NULL:
		return "NULL";
	default:
		throw duckdb::InvalidInputException("Unsupported SQL Server type: 0x%02x", column.type_id);
	}
}

ColumnDescriptor TypeConverter::GetColumnDescriptor(const ColumnMetadata &column) {
	ColumnDescriptor descriptor(column.name, GetDatabaseTypeName(column));
	descriptor.WithNullable(column.IsNullable());

	switch (column.type_id) {
	case TDS_TYPE_BIGVARCHAR:
	case TDS_TYPE_BIGVARBINARY:
		descriptor.WithLength(column.max_length == TDS_PLP_MARKER ? TDS_LENGTH_VARCHAR_MAX : column.max_length);
		break;
	case TDS_TYPE_BIGCHAR:
	case TDS_TYPE_BIGBINARY:
		descriptor.WithLength(column.max_length);
		break;
	case TDS_TYPE_NVARCHAR:
		descriptor.WithLength(column.max_length == TDS_PLP_MARKER ? TDS_LENGTH_NVARCHAR_MAX : column.max_length / 2);
		break;
	case TDS_TYPE_NCHAR:
		descriptor.WithLength(column.max_length / 2);
		break;
	case TDS_TYPE_XML:
		descriptor.WithLength(TDS_LENGTH_NVARCHAR_MAX);
		break;
	case TDS_TYPE_TEXT:
	case TDS_TYPE_IMAGE:
		descriptor.WithLength(TDS_LENGTH_TEXT);
		break;
	case TDS_TYPE_NTEXT:
		descriptor.WithLength(TDS_LENGTH_NTEXT);
		break;
	case TDS_TYPE_DECIMAL:
	case TDS_TYPE_NUMERIC:
		descriptor.WithDecimalSize(column.precision, column.scale);
		break;
	default:
		break;
	}
	return descriptor;
}

static uint64_t ReadUnsignedLE(const std::vector<uint8_t> &value) {
	uint64_t result = 0;
	for (size_t i = 0; i < value.size(); i++) {
		result |= static_cast<uint64_t>(value[i]) << (8 * i);
	}
	return result;
}

RawCellValue TypeConverter::ConvertInteger(const std::vector<uint8_t> &value) {
	uint64_t raw = ReadUnsignedLE(value);
	switch (value.size()) {
	case 1:
		// TINYINT is unsigned
		return RawCellValue::Integer(static_cast<uint8_t>(raw));
	case 2:
		return RawCellValue::Integer(static_cast<int16_t>(raw));
	case 4:
		return RawCellValue::Integer(static_cast<int32_t>(raw));
	case 8:
		return RawCellValue::Integer(static_cast<int64_t>(raw));
	default:
		throw duckdb::InvalidInputException("Invalid integer value length: %d", static_cast<int>(value.size()));
	}
}

// Widen a REAL through its shortest single-precision text so that 0.1f
// becomes 0.1 rather than 0.10000000149011612.
static double WidenReal(float value) {
	if (std::isnan(value) || std::isinf(value) || value == 0.0f) {
		return static_cast<double>(value);
	}
	char buffer[32];
	for (int precision = 6; precision <= 9; precision++) {
		snprintf(buffer, sizeof(buffer), "%.*g", precision, static_cast<double>(value));
		if (std::strtof(buffer, nullptr) == value) {
			break;
		}
	}
	return std::strtod(buffer, nullptr);
}

RawCellValue TypeConverter::ConvertFloat(const std::vector<uint8_t> &value) {
	if (value.size() == 4) {
		float result;
		std::memcpy(&result, value.data(), 4);
		return RawCellValue::Float(WidenReal(result));
	}
	if (value.size() == 8) {
		double result;
		std::memcpy(&result, value.data(), 8);
		return RawCellValue::Float(result);
	}
	throw duckdb::InvalidInputException("Invalid float value length: %d", static_cast<int>(value.size()));
}

RawCellValue TypeConverter::ConvertMoney(const std::vector<uint8_t> &value) {
	if (value.size() == 8) {
		return RawCellValue::Bytes(DecimalEncoding::MoneyToString(DecimalEncoding::ConvertMoney(value.data())));
	}
	if (value.size() == 4) {
		return RawCellValue::Bytes(DecimalEncoding::MoneyToString(DecimalEncoding::ConvertSmallMoney(value.data())));
	}
	throw duckdb::InvalidInputException("Invalid money value length: %d", static_cast<int>(value.size()));
}

RawCellValue TypeConverter::ConvertDatetime(const std::vector<uint8_t> &value) {
	if (value.size() == 8) {
		return RawCellValue::String(DateTimeEncoding::DatetimeToString(value.data()));
	}
	if (value.size() == 4) {
		return RawCellValue::String(DateTimeEncoding::SmallDatetimeToString(value.data()));
	}
	throw duckdb::InvalidInputException("Invalid datetime value length: %d", static_cast<int>(value.size()));
}

static void CheckLength(const ColumnMetadata &column, const std::vector<uint8_t> &value, size_t expected) {
	if (value.size() != expected) {
		throw duckdb::InvalidInputException("Invalid %s value length: %d", column.GetTypeName(),
		                                    static_cast<int>(value.size()));
	}
}

RawCellValue TypeConverter::ConvertValue(const ColumnMetadata &column, const std::vector<uint8_t> &value,
                                         bool is_null) {
	if (is_null || column.type_id == TDS_TYPE_NULL) {
		return RawCellValue::Null();
	}

	SQLCSV_TC_DEBUG_LOG(3, "ConvertValue: column='%s' type=0x%02x bytes=%zu", column.name.c_str(), column.type_id,
	                    value.size());

	switch (column.type_id) {
	case TDS_TYPE_TINYINT:
	case TDS_TYPE_SMALLINT:
	case TDS_TYPE_INT:
	case TDS_TYPE_BIGINT:
	case TDS_TYPE_INTN:
		return ConvertInteger(value);

	case TDS_TYPE_BIT:
	case TDS_TYPE_BITN:
		CheckLength(column, value, 1);
		return RawCellValue::Boolean(value[0] != 0);

	case TDS_TYPE_REAL:
	case TDS_TYPE_FLOAT:
	case TDS_TYPE_FLOATN:
		return ConvertFloat(value);

	case TDS_TYPE_MONEY:
	case TDS_TYPE_SMALLMONEY:
	case TDS_TYPE_MONEYN:
		return ConvertMoney(value);

	case TDS_TYPE_DECIMAL:
	case TDS_TYPE_NUMERIC: {
		if (value.size() < 5) {
			throw duckdb::InvalidInputException("Invalid DECIMAL value length: %d", static_cast<int>(value.size()));
		}
		auto unscaled = DecimalEncoding::ConvertDecimal(value.data(), value.size());
		return RawCellValue::Bytes(DecimalEncoding::DecimalToString(unscaled, column.precision, column.scale));
	}

	case TDS_TYPE_UNIQUEIDENTIFIER:
		return RawCellValue::Bytes(value);

	case TDS_TYPE_DATE:
		CheckLength(column, value, 3);
		return RawCellValue::String(DateTimeEncoding::DateToString(value.data()));
	case TDS_TYPE_TIME:
		CheckLength(column, value, DateTimeEncoding::GetTimeByteLength(column.scale));
		return RawCellValue::String(DateTimeEncoding::TimeToString(value.data(), column.scale));
	case TDS_TYPE_DATETIME:
	case TDS_TYPE_SMALLDATETIME:
	case TDS_TYPE_DATETIMEN:
		return ConvertDatetime(value);
	case TDS_TYPE_DATETIME2:
		CheckLength(column, value, DateTimeEncoding::GetTimeByteLength(column.scale) + 3);
		return RawCellValue::String(DateTimeEncoding::Datetime2ToString(value.data(), column.scale));
	case TDS_TYPE_DATETIMEOFFSET:
		CheckLength(column, value, DateTimeEncoding::GetTimeByteLength(column.scale) + 5);
		return RawCellValue::String(DateTimeEncoding::DatetimeOffsetToString(value.data(), column.scale));

	case TDS_TYPE_BIGCHAR:
	case TDS_TYPE_BIGVARCHAR:
	case TDS_TYPE_TEXT:
		return RawCellValue::String(std::string(value.begin(), value.end()));

	case TDS_TYPE_NCHAR:
	case TDS_TYPE_NVARCHAR:
	case TDS_TYPE_NTEXT:
	case TDS_TYPE_XML:
		return RawCellValue::String(Utf16LEDecode(value));

	case TDS_TYPE_BIGBINARY:
	case TDS_TYPE_BIGVARBINARY:
	case TDS_TYPE_IMAGE:
	case TDS_TYPE_UDT:
		return RawCellValue::Bytes(value);

	default:
		throw duckdb::InvalidInputException("unsupported value of type %s for column \"%s\"",
		                                    GetDatabaseTypeName(column), column.name);
	}
}

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
