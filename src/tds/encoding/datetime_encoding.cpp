#include "tds/encoding/datetime_encoding.hpp"
#include "duckdb/common/string_util.hpp"
#include <cstdlib>
#include <cstring>

namespace sqlcsv {
namespace tds {
namespace encoding {

using duckdb::date_t;
using duckdb::dtime_t;
using duckdb::timestamp_t;

// Days from 0001-01-01 to 1970-01-01
constexpr int32_t DAYS_FROM_0001_TO_EPOCH = 719162;

// Days from 1900-01-01 to 1970-01-01
constexpr int32_t DAYS_FROM_1900_TO_EPOCH = 25567;

constexpr int64_t MICROS_PER_DAY = 86400000000LL;
constexpr int64_t MICROS_PER_MINUTE = 60000000LL;

static int64_t ReadLittleEndian(const uint8_t *data, size_t length) {
	int64_t value = 0;
	for (size_t i = 0; i < length; i++) {
		value |= static_cast<int64_t>(data[i]) << (i * 8);
	}
	return value;
}

// Convert a count of 10^-scale second units to microseconds
static int64_t TicksToMicros(int64_t ticks, uint8_t scale) {
	if (scale > 6) {
		return ticks / 10;
	}
	for (int i = scale; i < 6; i++) {
		ticks *= 10;
	}
	return ticks;
}

static int64_t ReadDateDays(const uint8_t *data) {
	return ReadLittleEndian(data, 3) - DAYS_FROM_0001_TO_EPOCH;
}

date_t DateTimeEncoding::ConvertDate(const uint8_t *data) {
	return date_t(static_cast<int32_t>(ReadDateDays(data)));
}

dtime_t DateTimeEncoding::ConvertTime(const uint8_t *data, uint8_t scale) {
	return dtime_t(TicksToMicros(ReadLittleEndian(data, GetTimeByteLength(scale)), scale));
}

timestamp_t DateTimeEncoding::ConvertDatetime(const uint8_t *data) {
	int32_t days = 0;
	uint32_t ticks = 0;
	std::memcpy(&days, data, 4);
	std::memcpy(&ticks, data + 4, 4);

	// 1 tick = 1/300 second
	int64_t micros = (static_cast<int64_t>(ticks) * 10000) / 3;
	return timestamp_t((static_cast<int64_t>(days) - DAYS_FROM_1900_TO_EPOCH) * MICROS_PER_DAY + micros);
}

timestamp_t DateTimeEncoding::ConvertSmallDatetime(const uint8_t *data) {
	uint16_t days = 0;
	uint16_t minutes = 0;
	std::memcpy(&days, data, 2);
	std::memcpy(&minutes, data + 2, 2);

	return timestamp_t((static_cast<int64_t>(days) - DAYS_FROM_1900_TO_EPOCH) * MICROS_PER_DAY +
	                   static_cast<int64_t>(minutes) * MICROS_PER_MINUTE);
}

timestamp_t DateTimeEncoding::ConvertDatetime2(const uint8_t *data, uint8_t scale) {
	size_t time_len = GetTimeByteLength(scale);
	int64_t micros = TicksToMicros(ReadLittleEndian(data, time_len), scale);
	return timestamp_t(ReadDateDays(data + time_len) * MICROS_PER_DAY + micros);
}

timestamp_t DateTimeEncoding::ConvertDatetimeOffset(const uint8_t *data, uint8_t scale, int16_t &offset_minutes) {
	size_t time_len = GetTimeByteLength(scale);
	std::memcpy(&offset_minutes, data + time_len + 3, 2);
	return ConvertDatetime2(data, scale);
}

std::string DateTimeEncoding::DateToString(const uint8_t *data) {
	return duckdb::Date::ToString(ConvertDate(data));
}

std::string DateTimeEncoding::TimeToString(const uint8_t *data, uint8_t scale) {
	return duckdb::Time::ToString(ConvertTime(data, scale));
}

std::string DateTimeEncoding::DatetimeToString(const uint8_t *data) {
	return duckdb::Timestamp::ToString(ConvertDatetime(data));
}

std::string DateTimeEncoding::SmallDatetimeToString(const uint8_t *data) {
	return duckdb::Timestamp::ToString(ConvertSmallDatetime(data));
}

std::string DateTimeEncoding::Datetime2ToString(const uint8_t *data, uint8_t scale) {
	return duckdb::Timestamp::ToString(ConvertDatetime2(data, scale));
}

std::string DateTimeEncoding::DatetimeOffsetToString(const uint8_t *data, uint8_t scale) {
	int16_t offset = 0;
	timestamp_t utc = ConvertDatetimeOffset(data, scale, offset);
	timestamp_t local(utc.value + static_cast<int64_t>(offset) * MICROS_PER_MINUTE);

	int magnitude = std::abs(static_cast<int>(offset));
	return duckdb::Timestamp::ToString(local) +
	       duckdb::StringUtil::Format("%s%02d:%02d", offset < 0 ? "-" : "+", magnitude / 60, magnitude % 60);
}

size_t DateTimeEncoding::GetTimeByteLength(uint8_t scale) {
	if (scale <= 2) {
		return 3;
	}
	if (scale <= 4) {
		return 4;
	}
	return 5;
}

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
