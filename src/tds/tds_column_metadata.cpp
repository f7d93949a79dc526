#include "tds/tds_column_metadata.hpp"
#include "tds/encoding/utf16.hpp"
#include "duckdb/common/exception.hpp"

namespace sqlcsv {
namespace tds {

//===----------------------------------------------------------------------===//
// Wire string helpers
//===----------------------------------------------------------------------===//

static bool ReadCharacters(const uint8_t *data, size_t length, size_t &offset, size_t char_count,
                           std::string *result) {
	size_t byte_length = char_count * 2;
	if (offset + byte_length > length) {
		return false;
	}
	if (result) {
		*result = encoding::Utf16LEDecode(data + offset, byte_length);
	}
	offset += byte_length;
	return true;
}

bool ReadBVarchar(const uint8_t *data, size_t length, size_t &offset, std::string &result) {
	if (offset >= length) {
		return false;
	}
	size_t char_count = data[offset++];
	return ReadCharacters(data, length, offset, char_count, &result);
}

bool ReadUSVarchar(const uint8_t *data, size_t length, size_t &offset, std::string &result) {
	if (offset + 2 > length) {
		return false;
	}
	size_t char_count = data[offset] | (data[offset + 1] << 8);
	offset += 2;
	return ReadCharacters(data, length, offset, char_count, &result);
}

bool SkipBVarchar(const uint8_t *data, size_t length, size_t &offset) {
	if (offset >= length) {
		return false;
	}
	size_t char_count = data[offset++];
	return ReadCharacters(data, length, offset, char_count, nullptr);
}

bool SkipUSVarchar(const uint8_t *data, size_t length, size_t &offset) {
	if (offset + 2 > length) {
		return false;
	}
	size_t char_count = data[offset] | (data[offset + 1] << 8);
	offset += 2;
	return ReadCharacters(data, length, offset, char_count, nullptr);
}

//===----------------------------------------------------------------------===//
// ColumnMetadata
//===----------------------------------------------------------------------===//

std::string ColumnMetadata::GetTypeName() const {
	switch (type_id) {
	case TDS_TYPE_NULL: return "NULL";
	case TDS_TYPE_TINYINT: return "TINYINT";
	case TDS_TYPE_BIT: return "BIT";
	case TDS_TYPE_SMALLINT: return "SMALLINT";
	case TDS_TYPE_INT: return "INT";
	case TDS_TYPE_BIGINT: return "BIGINT";
	case TDS_TYPE_REAL: return "REAL";
	case TDS_TYPE_FLOAT: return "FLOAT";
	case TDS_TYPE_MONEY: return "MONEY";
	case TDS_TYPE_SMALLMONEY: return "SMALLMONEY";
	case TDS_TYPE_DATETIME: return "DATETIME";
	case TDS_TYPE_SMALLDATETIME: return "SMALLDATETIME";
	case TDS_TYPE_INTN: return "INTN";
	case TDS_TYPE_BITN: return "BITN";
	case TDS_TYPE_FLOATN: return "FLOATN";
	case TDS_TYPE_MONEYN: return "MONEYN";
	case TDS_TYPE_DATETIMEN: return "DATETIMEN";
	case TDS_TYPE_DECIMAL: return "DECIMAL";
	case TDS_TYPE_NUMERIC: return "NUMERIC";
	case TDS_TYPE_UNIQUEIDENTIFIER: return "UNIQUEIDENTIFIER";
	case TDS_TYPE_BIGCHAR: return "CHAR";
	case TDS_TYPE_BIGVARCHAR: return "VARCHAR";
	case TDS_TYPE_NCHAR: return "NCHAR";
	case TDS_TYPE_NVARCHAR: return "NVARCHAR";
	case TDS_TYPE_BIGBINARY: return "BINARY";
	case TDS_TYPE_BIGVARBINARY: return "VARBINARY";
	case TDS_TYPE_DATE: return "DATE";
	case TDS_TYPE_TIME: return "TIME";
	case TDS_TYPE_DATETIME2: return "DATETIME2";
	case TDS_TYPE_DATETIMEOFFSET: return "DATETIMEOFFSET";
	case TDS_TYPE_XML: return "XML";
	case TDS_TYPE_UDT: return "UDT";
	case TDS_TYPE_SQL_VARIANT: return "SQL_VARIANT";
	case TDS_TYPE_IMAGE: return "IMAGE";
	case TDS_TYPE_TEXT: return "TEXT";
	case TDS_TYPE_NTEXT: return "NTEXT";
	default: return "UNKNOWN(" + std::to_string(type_id) + ")";
	}
}

bool ColumnMetadata::IsPLPType() const {
	switch (type_id) {
	case TDS_TYPE_BIGVARCHAR:
	case TDS_TYPE_NVARCHAR:
	case TDS_TYPE_BIGVARBINARY:
		return max_length == TDS_PLP_MARKER;
	case TDS_TYPE_XML:
	case TDS_TYPE_UDT:
		return true;
	default:
		return false;
	}
}

size_t ColumnMetadata::GetFixedSize() const {
	switch (type_id) {
	case TDS_TYPE_NULL: return 0;
	case TDS_TYPE_TINYINT: return 1;
	case TDS_TYPE_BIT: return 1;
	case TDS_TYPE_SMALLINT: return 2;
	case TDS_TYPE_INT: return 4;
	case TDS_TYPE_BIGINT: return 8;
	case TDS_TYPE_REAL: return 4;
	case TDS_TYPE_FLOAT: return 8;
	case TDS_TYPE_MONEY: return 8;
	case TDS_TYPE_SMALLMONEY: return 4;
	case TDS_TYPE_DATETIME: return 8;
	case TDS_TYPE_SMALLDATETIME: return 4;
	default: return 0;
	}
}

//===----------------------------------------------------------------------===//
// ColumnMetadataParser
//===----------------------------------------------------------------------===//

bool ColumnMetadataParser::Parse(const uint8_t *data, size_t length, size_t &bytes_consumed,
                                 std::vector<ColumnMetadata> &columns) {
	columns.clear();
	if (length < 2) {
		return false;
	}

	uint16_t count = static_cast<uint16_t>(data[0] | (data[1] << 8));
	size_t offset = 2;

	// 0xFFFF: no metadata follows
	if (count == 0xFFFF) {
		bytes_consumed = offset;
		return true;
	}

	columns.reserve(count);
	for (uint16_t i = 0; i < count; i++) {
		ColumnMetadata column;
		if (!ParseColumn(data, length, offset, column)) {
			return false;
		}
		columns.push_back(std::move(column));
	}

	bytes_consumed = offset;
	return true;
}

bool ColumnMetadataParser::ParseColumn(const uint8_t *data, size_t length, size_t &offset, ColumnMetadata &column) {
	// UserType (4 bytes, ignored) + Flags (2 bytes)
	if (offset + 6 > length) {
		return false;
	}
	column.flags = static_cast<uint16_t>(data[offset + 4] | (data[offset + 5] << 8));
	offset += 6;

	if (!ParseTypeInfo(data, length, offset, column)) {
		return false;
	}
	return ReadBVarchar(data, length, offset, column.name);
}

static uint32_t ReadUInt32LE(const uint8_t *data) {
	return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
	       (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
}

bool ColumnMetadataParser::ParseTypeInfo(const uint8_t *data, size_t length, size_t &offset, ColumnMetadata &column) {
	if (offset >= length) {
		return false;
	}
	column.type_id = data[offset++];

	switch (column.type_id) {
	// Fixed-length types
	case TDS_TYPE_NULL:
	case TDS_TYPE_TINYINT:
	case TDS_TYPE_BIT:
	case TDS_TYPE_SMALLINT:
	case TDS_TYPE_INT:
	case TDS_TYPE_BIGINT:
	case TDS_TYPE_REAL:
	case TDS_TYPE_FLOAT:
	case TDS_TYPE_MONEY:
	case TDS_TYPE_SMALLMONEY:
	case TDS_TYPE_DATETIME:
	case TDS_TYPE_SMALLDATETIME:
	case TDS_TYPE_DATE:
		column.max_length = static_cast<uint32_t>(column.GetFixedSize());
		return true;

	// 1-byte length
	case TDS_TYPE_INTN:
	case TDS_TYPE_BITN:
	case TDS_TYPE_FLOATN:
	case TDS_TYPE_MONEYN:
	case TDS_TYPE_DATETIMEN:
	case TDS_TYPE_UNIQUEIDENTIFIER:
		if (offset >= length) {
			return false;
		}
		column.max_length = data[offset++];
		return true;

	// 1-byte length, precision, scale
	case TDS_TYPE_DECIMAL:
	case TDS_TYPE_NUMERIC:
		if (offset + 3 > length) {
			return false;
		}
		column.max_length = data[offset++];
		column.precision = data[offset++];
		column.scale = data[offset++];
		return true;

	// 1-byte scale
	case TDS_TYPE_TIME:
	case TDS_TYPE_DATETIME2:
	case TDS_TYPE_DATETIMEOFFSET:
		if (offset >= length) {
			return false;
		}
		column.scale = data[offset++];
		return true;

	// 2-byte length + 5-byte collation
	case TDS_TYPE_BIGCHAR:
	case TDS_TYPE_BIGVARCHAR:
	case TDS_TYPE_NCHAR:
	case TDS_TYPE_NVARCHAR:
		if (offset + 7 > length) {
			return false;
		}
		column.max_length = static_cast<uint32_t>(data[offset] | (data[offset + 1] << 8));
		column.collation = ReadUInt32LE(data + offset + 2);
		offset += 7;
		return true;

	// 2-byte length
	case TDS_TYPE_BIGBINARY:
	case TDS_TYPE_BIGVARBINARY:
		if (offset + 2 > length) {
			return false;
		}
		column.max_length = static_cast<uint32_t>(data[offset] | (data[offset + 1] << 8));
		offset += 2;
		return true;

	// 4-byte length [+ collation] + multi-part table name
	case TDS_TYPE_TEXT:
	case TDS_TYPE_NTEXT:
	case TDS_TYPE_IMAGE: {
		size_t fixed = column.type_id == TDS_TYPE_IMAGE ? 4 : 9;
		if (offset + fixed + 1 > length) {
			return false;
		}
		column.max_length = ReadUInt32LE(data + offset);
		if (column.type_id != TDS_TYPE_IMAGE) {
			column.collation = ReadUInt32LE(data + offset + 4);
		}
		offset += fixed;
		uint8_t parts = data[offset++];
		for (uint8_t i = 0; i < parts; i++) {
			if (!SkipUSVarchar(data, length, offset)) {
				return false;
			}
		}
		return true;
	}

	case TDS_TYPE_SQL_VARIANT:
		if (offset + 4 > length) {
			return false;
		}
		column.max_length = ReadUInt32LE(data + offset);
		offset += 4;
		return true;

	// Schema-present flag + optional schema collection
	case TDS_TYPE_XML: {
		if (offset >= length) {
			return false;
		}
		bool schema_present = data[offset++] != 0;
		if (schema_present) {
			if (!SkipBVarchar(data, length, offset) || !SkipBVarchar(data, length, offset) ||
			    !SkipUSVarchar(data, length, offset)) {
				return false;
			}
		}
		return true;
	}

	// 2-byte length + db, schema, type and assembly names
	case TDS_TYPE_UDT:
		if (offset + 2 > length) {
			return false;
		}
		column.max_length = static_cast<uint32_t>(data[offset] | (data[offset + 1] << 8));
		offset += 2;
		return SkipBVarchar(data, length, offset) && SkipBVarchar(data, length, offset) &&
		       SkipBVarchar(data, length, offset) && SkipUSVarchar(data, length, offset);

	default:
		throw duckdb::IOException("Unsupported SQL Server type 0x%02x in COLMETADATA", static_cast<int>(column.type_id));
	}
}

}  // namespace tds
}  // namespace sqlcsv
