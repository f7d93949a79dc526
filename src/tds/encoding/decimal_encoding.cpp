#include "tds/encoding/decimal_encoding.hpp"
#include "duckdb/common/types/decimal.hpp"
#include <cstring>

namespace sqlcsv {
namespace tds {
namespace encoding {

using duckdb::hugeint_t;

// Widest DECIMAL SQL Server supports
static constexpr uint8_t MAX_DECIMAL_PRECISION = 38;
static constexpr uint8_t MONEY_PRECISION = 19;
static constexpr uint8_t MONEY_SCALE = 4;

hugeint_t DecimalEncoding::ConvertDecimal(const uint8_t *data, size_t length) {
	if (length == 0) {
		return hugeint_t(0);
	}

	bool negative = data[0] == 0;
	hugeint_t magnitude(0);
	for (size_t i = length - 1; i >= 1; i--) {
		magnitude = magnitude * hugeint_t(256) + hugeint_t(data[i]);
	}
	return negative ? -magnitude : magnitude;
}

int64_t DecimalEncoding::ConvertMoney(const uint8_t *data) {
	int32_t high = 0;
	uint32_t low = 0;
	std::memcpy(&high, data, 4);
	std::memcpy(&low, data + 4, 4);
	return static_cast<int64_t>((static_cast<uint64_t>(static_cast<uint32_t>(high)) << 32) | low);
}

int64_t DecimalEncoding::ConvertSmallMoney(const uint8_t *data) {
	int32_t value = 0;
	std::memcpy(&value, data, 4);
	return value;
}

std::string DecimalEncoding::DecimalToString(const hugeint_t &value, uint8_t precision, uint8_t scale) {
	if (precision == 0 || precision > MAX_DECIMAL_PRECISION) {
		precision = MAX_DECIMAL_PRECISION;
	}
	if (scale > precision) {
		scale = precision;
	}
	return duckdb::Decimal::ToString(value, precision, scale);
}

std::string DecimalEncoding::MoneyToString(int64_t value) {
	return duckdb::Decimal::ToString(hugeint_t(value), MONEY_PRECISION, MONEY_SCALE);
}

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
