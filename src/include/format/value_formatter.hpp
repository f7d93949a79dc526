#pragma once

#include "format/column_descriptor.hpp"
#include "format/raw_cell_value.hpp"
#include <string>
#include <vector>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// ValueFormatter - renders one cell as CSV field text
//===----------------------------------------------------------------------===//
//
// Rules, first match wins:
//   1. null                 -> null_literal, verbatim
//   2. UNIQUEIDENTIFIER     -> canonical lowercase GUID (MalformedIdentifier if not 16 bytes)
//   3. MONEY, DECIMAL bytes -> bytes as text
//   4. BIT boolean          -> "1" / "0"
//   5. any other bytes      -> "0x" + lowercase hex
//   6. otherwise            -> default text of the value

class ValueFormatter {
public:
	static std::string Format(const ColumnDescriptor &column, const RawCellValue &value,
	                          const std::string &null_literal);

	// Lowercase hex with "0x" prefix
	static std::string FormatHex(const std::vector<uint8_t> &bytes);

	// Shortest text that parses back to the same double
	static std::string FormatFloat(double value);
};

}  // namespace sqlcsv
