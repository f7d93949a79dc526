#pragma once

#include "tds_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sqlcsv {
namespace tds {

//===----------------------------------------------------------------------===//
// ColumnMetadata - one result column from a COLMETADATA token
//===----------------------------------------------------------------------===//

struct ColumnMetadata {
	std::string name;          // Column name (UTF-8)
	uint8_t type_id = 0;       // TDS type identifier
	uint32_t max_length = 0;   // Declared length (4 bytes for TEXT/NTEXT/IMAGE/SQL_VARIANT)
	uint8_t precision = 0;     // DECIMAL/NUMERIC precision
	uint8_t scale = 0;         // DECIMAL/NUMERIC or TIME/DATETIME2/DATETIMEOFFSET scale
	uint32_t collation = 0;    // Collation LCID bits for character types
	uint16_t flags = 0;        // Column flags

	bool IsNullable() const {
		return (flags & COL_FLAG_NULLABLE) != 0;
	}

	// Wire name of the type, for diagnostics
	std::string GetTypeName() const;

	// MAX, XML and UDT values use chunked PLP encoding
	bool IsPLPType() const;

	// Byte size of fixed-length types without a length prefix, 0 otherwise
	size_t GetFixedSize() const;
};

//===----------------------------------------------------------------------===//
// ColumnMetadataParser - parses the body of a COLMETADATA token
//===----------------------------------------------------------------------===//

class ColumnMetadataParser {
public:
	// Returns false if more data is needed. Throws IOException on unknown types.
	static bool Parse(const uint8_t *data, size_t length, size_t &bytes_consumed, std::vector<ColumnMetadata> &columns);

private:
	static bool ParseColumn(const uint8_t *data, size_t length, size_t &offset, ColumnMetadata &column);
	static bool ParseTypeInfo(const uint8_t *data, size_t length, size_t &offset, ColumnMetadata &column);
};

// Wire-format string helpers shared by the token parsers.
// Return false if the buffer ends before the string does.
bool ReadBVarchar(const uint8_t *data, size_t length, size_t &offset, std::string &result);
bool ReadUSVarchar(const uint8_t *data, size_t length, size_t &offset, std::string &result);
bool SkipBVarchar(const uint8_t *data, size_t length, size_t &offset);
bool SkipUSVarchar(const uint8_t *data, size_t length, size_t &offset);

}  // namespace tds
}  // namespace sqlcsv
