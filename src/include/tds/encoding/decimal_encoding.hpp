#pragma once

#include "duckdb/common/types/hugeint.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace sqlcsv {
namespace tds {
namespace encoding {

//===----------------------------------------------------------------------===//
// DecimalEncoding - SQL Server DECIMAL/NUMERIC and MONEY wire formats
//===----------------------------------------------------------------------===//

class DecimalEncoding {
public:
	// DECIMAL/NUMERIC: sign byte (0 = negative, 1 = positive) followed by a
	// little-endian magnitude of 4, 8, 12 or 16 bytes. Returns the unscaled value.
	static duckdb::hugeint_t ConvertDecimal(const uint8_t *data, size_t length);

	// MONEY: high int32 then low int32 (each little-endian), value x 10000
	static int64_t ConvertMoney(const uint8_t *data);

	// SMALLMONEY: int32 little-endian, value x 10000
	static int64_t ConvertSmallMoney(const uint8_t *data);

	// Render an unscaled value with exactly `scale` fractional digits, e.g. "-12.50"
	static std::string DecimalToString(const duckdb::hugeint_t &value, uint8_t precision, uint8_t scale);

	// Render a MONEY/SMALLMONEY amount with four fractional digits
	static std::string MoneyToString(int64_t value);
};

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
