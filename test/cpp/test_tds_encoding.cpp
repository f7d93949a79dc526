// test/cpp/test_tds_encoding.cpp
// Unit tests for TDS value encodings and the wire value -> RawCellValue mapping
//
// These tests do NOT require a running SQL Server instance.
//
// Tests cover:
// - UNIQUEIDENTIFIER byte order
// - DECIMAL/NUMERIC and MONEY/SMALLMONEY
// - DATE, TIME, DATETIME, SMALLDATETIME, DATETIME2, DATETIMEOFFSET
// - UTF-16LE text
// - TypeConverter::ConvertValue per type family
//
// Run:
//   ./test_tds_encoding

#include <cassert>
#include <iostream>

#include "format/value_formatter.hpp"
#include "sqlcsv_exception.hpp"
#include "tds/encoding/datetime_encoding.hpp"
#include "tds/encoding/decimal_encoding.hpp"
#include "tds/encoding/guid_encoding.hpp"
#include "tds/encoding/type_converter.hpp"
#include "tds/encoding/utf16.hpp"
#include "tds/tds_types.hpp"

using namespace sqlcsv;
using namespace sqlcsv::tds;
using namespace sqlcsv::tds::encoding;

#define ASSERT_EQ(actual, expected)                                                          \
	do {                                                                                     \
		if ((actual) != (expected)) {                                                        \
			std::cerr << "ASSERTION FAILED at " << __FILE__ << ":" << __LINE__ << std::endl; \
			std::cerr << "  Expected: " << (expected) << std::endl;                          \
			std::cerr << "  Actual:   " << (actual) << std::endl;                            \
			assert(false);                                                                   \
		}                                                                                    \
	} while (0)

static ColumnMetadata MakeColumn(uint8_t type_id, uint32_t max_length = 0, uint8_t precision = 0, uint8_t scale = 0) {
	ColumnMetadata column;
	column.name = "c";
	column.type_id = type_id;
	column.max_length = max_length;
	column.precision = precision;
	column.scale = scale;
	column.flags = COL_FLAG_NULLABLE;
	return column;
}

// Decode and format as the CSV output would
static std::string Render(const ColumnMetadata &column, const std::vector<uint8_t> &bytes) {
	auto descriptor = TypeConverter::GetColumnDescriptor(column);
	return ValueFormatter::Format(descriptor, TypeConverter::ConvertValue(column, bytes, false), "NULL");
}

//==============================================================================
// Test: GUID
//==============================================================================
void test_guid() {
	std::cout << "\n=== Test: GUID ===" << std::endl;

	std::vector<uint8_t> wire = {0x33, 0x22, 0x11, 0x00, 0x55, 0x44, 0x77, 0x66,
	                             0x88, 0x99, 0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
	ASSERT_EQ(GuidEncoding::FormatGuid(wire.data()), "00112233-4455-6677-8899-aabbccddeeff");

	uint8_t canonical[16];
	uint8_t back[16];
	GuidEncoding::ReorderGuidBytes(wire.data(), canonical);
	ASSERT_EQ(static_cast<int>(canonical[0]), 0x00);
	ASSERT_EQ(static_cast<int>(canonical[3]), 0x33);
	GuidEncoding::ReorderGuidBytes(canonical, back);
	for (size_t i = 0; i < 16; i++) {
		ASSERT_EQ(static_cast<int>(back[i]), static_cast<int>(wire[i]));
	}

	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_UNIQUEIDENTIFIER, 16), wire), "00112233-4455-6677-8899-aabbccddeeff");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: DECIMAL and MONEY
//==============================================================================
void test_decimal() {
	std::cout << "\n=== Test: DECIMAL ===" << std::endl;

	// sign 1 (positive), magnitude 12345
	std::vector<uint8_t> positive = {0x01, 0x39, 0x30, 0x00, 0x00};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_DECIMAL, 5, 10, 2), positive), "123.45");

	std::vector<uint8_t> negative = {0x00, 0x39, 0x30, 0x00, 0x00};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_NUMERIC, 5, 10, 2), negative), "-123.45");

	std::vector<uint8_t> whole = {0x01, 0x07, 0x00, 0x00, 0x00};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_DECIMAL, 5, 5, 0), whole), "7");

	// 9-byte form: magnitude 10^12 with scale 4
	std::vector<uint8_t> wide = {0x01, 0x00, 0x10, 0xA5, 0xD4, 0xE8, 0x00, 0x00, 0x00};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_DECIMAL, 9, 19, 4), wide), "100000000.0000");

	std::cout << "PASSED!" << std::endl;
}

void test_money() {
	std::cout << "\n=== Test: MONEY / SMALLMONEY ===" << std::endl;

	// 12.34 x 10000 = 123400 (high dword first)
	std::vector<uint8_t> money = {0x00, 0x00, 0x00, 0x00, 0x08, 0xE2, 0x01, 0x00};
	ASSERT_EQ(DecimalEncoding::ConvertMoney(money.data()), static_cast<int64_t>(123400));
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_MONEYN, 8), money), "12.3400");

	std::vector<uint8_t> minus_one_unit(8, 0xFF);
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_MONEY), minus_one_unit), "-0.0001");

	std::vector<uint8_t> small = {0x08, 0xE2, 0x01, 0x00};
	ASSERT_EQ(DecimalEncoding::ConvertSmallMoney(small.data()), static_cast<int64_t>(123400));
	ASSERT_EQ(DecimalEncoding::MoneyToString(123400), "12.3400");
	// SMALLMONEY text goes out hex-encoded
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_MONEYN, 4), small), "0x31322e33343030");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: date and time types
//==============================================================================
void test_date_and_time() {
	std::cout << "\n=== Test: Date And Time ===" << std::endl;

	std::vector<uint8_t> date = {0x53, 0x46, 0x0B};
	ASSERT_EQ(DateTimeEncoding::DateToString(date.data()), "2024-01-15");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_DATE), date), "2024-01-15");

	std::vector<uint8_t> epoch = {0x00, 0x00, 0x00};
	ASSERT_EQ(DateTimeEncoding::DateToString(epoch.data()), "0001-01-01");

	// 12:30:00.1234567 at scale 7
	std::vector<uint8_t> time7 = {0x87, 0xEA, 0x29, 0xC6, 0x68};
	ASSERT_EQ(DateTimeEncoding::GetTimeByteLength(7), static_cast<size_t>(5));
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_TIME, 0, 0, 7), time7), "12:30:00.123456");

	// 12:30:00 at scale 0: 45000 seconds
	std::vector<uint8_t> time0 = {0xC8, 0xAF, 0x00};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_TIME, 0, 0, 0), time0), "12:30:00");

	std::cout << "PASSED!" << std::endl;
}

void test_datetime() {
	std::cout << "\n=== Test: DATETIME / SMALLDATETIME ===" << std::endl;

	// 45304 days after 1900-01-01, 13500001 ticks of 1/300 s
	std::vector<uint8_t> datetime = {0xF8, 0xB0, 0x00, 0x00, 0x61, 0xFE, 0xCD, 0x00};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_DATETIMEN, 8), datetime), "2024-01-15 12:30:00.003333");

	std::vector<uint8_t> small = {0xF8, 0xB0, 0xEE, 0x02};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_DATETIMEN, 4), small), "2024-01-15 12:30:00");

	std::cout << "PASSED!" << std::endl;
}

void test_datetime2_and_offset() {
	std::cout << "\n=== Test: DATETIME2 / DATETIMEOFFSET ===" << std::endl;

	std::vector<uint8_t> datetime2 = {0x87, 0xEA, 0x29, 0xC6, 0x68, 0x53, 0x46, 0x0B};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_DATETIME2, 0, 0, 7), datetime2), "2024-01-15 12:30:00.123456");

	// 10:30 UTC with a +02:00 offset
	std::vector<uint8_t> plus_two = {0x00, 0x44, 0x8E, 0x02, 0x58, 0x53, 0x46, 0x0B, 0x78, 0x00};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_DATETIMEOFFSET, 0, 0, 7), plus_two), "2024-01-15 12:30:00+02:00");

	// same instant with a -01:30 offset
	std::vector<uint8_t> minus = {0x00, 0x44, 0x8E, 0x02, 0x58, 0x53, 0x46, 0x0B, 0xA6, 0xFF};
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_DATETIMEOFFSET, 0, 0, 7), minus), "2024-01-15 09:00:00-01:30");

	bool threw = false;
	try {
		TypeConverter::ConvertValue(MakeColumn(TDS_TYPE_DATETIME2, 0, 0, 7), {0x00, 0x01}, false);
	} catch (std::exception &) {
		threw = true;
	}
	assert(threw);

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: UTF-16LE
//==============================================================================
void test_utf16() {
	std::cout << "\n=== Test: UTF-16LE ===" << std::endl;

	auto encoded = Utf16LEEncode("h\xC3\xA9");
	std::vector<uint8_t> expected = {0x68, 0x00, 0xE9, 0x00};
	assert(encoded == expected);
	ASSERT_EQ(Utf16LEDecode(encoded), "h\xC3\xA9");

	// U+1F600 as a surrogate pair
	std::vector<uint8_t> emoji = {0x3D, 0xD8, 0x00, 0xDE};
	ASSERT_EQ(Utf16LEDecode(emoji), "\xF0\x9F\x98\x80");
	assert(Utf16LEEncode("\xF0\x9F\x98\x80") == emoji);

	// unpaired high surrogate
	std::vector<uint8_t> lone = {0x3D, 0xD8};
	ASSERT_EQ(Utf16LEDecode(lone), "\xEF\xBF\xBD");

	ASSERT_EQ(Utf16LEDecode(std::vector<uint8_t>()), "");

	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_NVARCHAR, 100), Utf16LEEncode("caf\xC3\xA9, ok")), "caf\xC3\xA9, ok");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: numeric and other families
//==============================================================================
void test_integers_and_bits() {
	std::cout << "\n=== Test: Integers And Bits ===" << std::endl;

	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_INTN, 1), {0xFF}), "255");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_INTN, 2), {0xFF, 0xFF}), "-1");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_INTN, 4), {0x2A, 0x00, 0x00, 0x00}), "42");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_INTN, 8), {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80}),
	          "-9223372036854775808");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_INT), {0xFE, 0xFF, 0xFF, 0xFF}), "-2");

	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_BITN, 1), {0x01}), "1");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_BIT), {0x00}), "0");

	bool threw = false;
	try {
		TypeConverter::ConvertValue(MakeColumn(TDS_TYPE_INTN, 4), {0x01, 0x02, 0x03}, false);
	} catch (std::exception &) {
		threw = true;
	}
	assert(threw);

	std::cout << "PASSED!" << std::endl;
}

void test_floats() {
	std::cout << "\n=== Test: Floats ===" << std::endl;

	// REAL 0.1f widens to its shortest text
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_FLOATN, 4), {0xCD, 0xCC, 0xCC, 0x3D}), "0.1");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_FLOATN, 8), {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x04, 0x40}), "2.5");

	std::cout << "PASSED!" << std::endl;
}

void test_strings_and_binary() {
	std::cout << "\n=== Test: Strings And Binary ===" << std::endl;

	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_BIGVARCHAR, 10), {'a', 'b', 'c'}), "abc");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_BIGVARBINARY, 10), {0x01, 0xAB}), "0x01ab");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_BIGVARBINARY, 10), {}), "0x");
	ASSERT_EQ(Render(MakeColumn(TDS_TYPE_UDT), {0xF0}), "0xf0");

	auto nulled = TypeConverter::ConvertValue(MakeColumn(TDS_TYPE_NVARCHAR, 100), {}, true);
	assert(nulled.IsNull());
	assert(TypeConverter::ConvertValue(MakeColumn(TDS_TYPE_NULL), {}, false).IsNull());

	std::cout << "PASSED!" << std::endl;
}

int main() {
	std::cout << "==========================================" << std::endl;
	std::cout << "TDS Encoding Unit Tests" << std::endl;
	std::cout << "==========================================" << std::endl;

	try {
		test_guid();
		test_decimal();
		test_money();
		test_date_and_time();
		test_datetime();
		test_datetime2_and_offset();
		test_utf16();
		test_integers_and_bits();
		test_floats();
		test_strings_and_binary();

		std::cout << "\n==========================================" << std::endl;
		std::cout << "ALL TESTS PASSED!" << std::endl;
		std::cout << "==========================================" << std::endl;
		return 0;

	} catch (const std::exception &e) {
		std::cerr << "\n==========================================" << std::endl;
		std::cerr << "TEST FAILED WITH EXCEPTION: " << GetErrorMessage(e) << std::endl;
		std::cerr << "==========================================" << std::endl;
		return 1;
	}
}
