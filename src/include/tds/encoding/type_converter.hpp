#pragma once

#include "format/column_descriptor.hpp"
#include "format/raw_cell_value.hpp"
#include "tds/tds_column_metadata.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sqlcsv {
namespace tds {
namespace encoding {

//===----------------------------------------------------------------------===//
// TypeConverter - maps COLMETADATA to column descriptors and wire values to
// RawCellValue
//===----------------------------------------------------------------------===//

class TypeConverter {
public:
	// Throws InvalidInputException for types with no mapping
	static ColumnDescriptor GetColumnDescriptor(const ColumnMetadata &column);

	// Driver type tag reported for the column, e.g. "NVARCHAR"
	static std::string GetDatabaseTypeName(const ColumnMetadata &column);

	// Decode one raw value from a ROW/NBCROW token.
	// Throws InvalidInputException on malformed or unsupported values.
	static RawCellValue ConvertValue(const ColumnMetadata &column, const std::vector<uint8_t> &value, bool is_null);

private:
	static RawCellValue ConvertInteger(const std::vector<uint8_t> &value);
	static RawCellValue ConvertFloat(const std::vector<uint8_t> &value);
	static RawCellValue ConvertMoney(const std::vector<uint8_t> &value);
	static RawCellValue ConvertDatetime(const std::vector<uint8_t> &value);
};

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
