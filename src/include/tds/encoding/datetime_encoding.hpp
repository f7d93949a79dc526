#pragma once

#include "duckdb/common/types/date.hpp"
#include "duckdb/common/types/time.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace sqlcsv {
namespace tds {
namespace encoding {

//===----------------------------------------------------------------------===//
// DateTimeEncoding - SQL Server date/time wire formats
//===----------------------------------------------------------------------===//

class DateTimeEncoding {
public:
	// DATE: 3-byte little-endian days since 0001-01-01
	static duckdb::date_t ConvertDate(const uint8_t *data);

	// TIME: 3-5 byte little-endian count of 10^-scale second units since midnight
	static duckdb::dtime_t ConvertTime(const uint8_t *data, uint8_t scale);

	// DATETIME: int32 days since 1900-01-01 + uint32 ticks of 1/300 second
	static duckdb::timestamp_t ConvertDatetime(const uint8_t *data);

	// SMALLDATETIME: uint16 days since 1900-01-01 + uint16 minutes since midnight
	static duckdb::timestamp_t ConvertSmallDatetime(const uint8_t *data);

	// DATETIME2: TIME part followed by DATE part
	static duckdb::timestamp_t ConvertDatetime2(const uint8_t *data, uint8_t scale);

	// DATETIMEOFFSET: DATETIME2 part in UTC followed by an int16 offset in minutes
	static duckdb::timestamp_t ConvertDatetimeOffset(const uint8_t *data, uint8_t scale, int16_t &offset_minutes);

	// Text renderings used for CSV output
	static std::string DateToString(const uint8_t *data);
	static std::string TimeToString(const uint8_t *data, uint8_t scale);
	static std::string DatetimeToString(const uint8_t *data);
	static std::string SmallDatetimeToString(const uint8_t *data);
	static std::string Datetime2ToString(const uint8_t *data, uint8_t scale);
	// Local time followed by the offset, e.g. "2024-01-15 12:30:00+02:00"
	static std::string DatetimeOffsetToString(const uint8_t *data, uint8_t scale);

	// Byte length of the TIME part for a given scale
	static size_t GetTimeByteLength(uint8_t scale);
};

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
