// test/cpp/test_value_formatter.cpp
// Unit tests for ValueFormatter
//
// These tests do NOT require a running SQL Server instance.
//
// Run:
//   ./test_value_formatter

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "format/value_formatter.hpp"
#include "sqlcsv_exception.hpp"

using namespace sqlcsv;

#define ASSERT_EQ(actual, expected)                                                          \
	do {                                                                                     \
		if ((actual) != (expected)) {                                                        \
			std::cerr << "ASSERTION FAILED at " << __FILE__ << ":" << __LINE__ << std::endl; \
			std::cerr << "  Expected: " << (expected) << std::endl;                          \
			std::cerr << "  Actual:   " << (actual) << std::endl;                            \
			assert(false);                                                                   \
		}                                                                                    \
	} while (0)

static std::string Fmt(const std::string &type_name, const RawCellValue &value, const std::string &null_literal = "NULL") {
	return ValueFormatter::Format(ColumnDescriptor("c", type_name), value, null_literal);
}

//==============================================================================
// Test: null values use the configured literal verbatim
//==============================================================================
void test_null_literal() {
	std::cout << "\n=== Test: Null Literal ===" << std::endl;

	ASSERT_EQ(Fmt("INT", RawCellValue::Null()), "NULL");
	ASSERT_EQ(Fmt("NVARCHAR", RawCellValue::Null(), ""), "");
	ASSERT_EQ(Fmt("UNIQUEIDENTIFIER", RawCellValue::Null(), "\\N"), "\\N");
	// the literal is not trimmed or escaped
	ASSERT_EQ(Fmt("BIT", RawCellValue(), " <nil> "), " <nil> ");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: UNIQUEIDENTIFIER wire bytes render in canonical order
//==============================================================================
void test_uniqueidentifier() {
	std::cout << "\n=== Test: UNIQUEIDENTIFIER ===" << std::endl;

	// 6F9619FF-8B86-D011-B42D-00C04FC964FF as sent by the server
	std::vector<uint8_t> wire = {0xFF, 0x19, 0x96, 0x6F, 0x86, 0x8B, 0x11, 0xD0,
	                             0xB4, 0x2D, 0x00, 0xC0, 0x4F, 0xC9, 0x64, 0xFF};
	ASSERT_EQ(Fmt("UNIQUEIDENTIFIER", RawCellValue::Bytes(wire)), "6f9619ff-8b86-d011-b42d-00c04fc964ff");

	std::vector<uint8_t> zeros(16, 0);
	ASSERT_EQ(Fmt("UNIQUEIDENTIFIER", RawCellValue::Bytes(zeros)), "00000000-0000-0000-0000-000000000000");

	std::cout << "PASSED!" << std::endl;
}

void test_uniqueidentifier_wrong_length() {
	std::cout << "\n=== Test: UNIQUEIDENTIFIER Wrong Length ===" << std::endl;

	bool threw = false;
	try {
		Fmt("UNIQUEIDENTIFIER", RawCellValue::Bytes(std::vector<uint8_t>(15, 0xAB)));
	} catch (MalformedIdentifier &ex) {
		threw = true;
		assert(GetErrorMessage(ex).find("15") != std::string::npos);
	}
	assert(threw);

	threw = false;
	try {
		Fmt("UNIQUEIDENTIFIER", RawCellValue::Bytes(std::vector<uint8_t>(17, 0xAB)));
	} catch (MalformedIdentifier &) {
		threw = true;
	}
	assert(threw);

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: MONEY and DECIMAL bytes are emitted as text
//==============================================================================
void test_money_and_decimal_text() {
	std::cout << "\n=== Test: MONEY / DECIMAL Text ===" << std::endl;

	ASSERT_EQ(Fmt("MONEY", RawCellValue::Bytes(std::string("12.3400"))), "12.3400");
	ASSERT_EQ(Fmt("MONEY", RawCellValue::Bytes(std::string("-0.0001"))), "-0.0001");
	ASSERT_EQ(Fmt("DECIMAL", RawCellValue::Bytes(std::string("123.45"))), "123.45");

	// SMALLMONEY has no text rule of its own
	ASSERT_EQ(Fmt("SMALLMONEY", RawCellValue::Bytes(std::string("1.5"))), "0x312e35");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: BIT booleans render as 1/0
//==============================================================================
void test_bit() {
	std::cout << "\n=== Test: BIT ===" << std::endl;

	ASSERT_EQ(Fmt("BIT", RawCellValue::Boolean(true)), "1");
	ASSERT_EQ(Fmt("BIT", RawCellValue::Boolean(false)), "0");
	// booleans outside BIT columns use the default text
	ASSERT_EQ(Fmt("SQL_VARIANT", RawCellValue::Boolean(true)), "true");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: other byte sequences render as lowercase hex
//==============================================================================
void test_binary_hex() {
	std::cout << "\n=== Test: Binary Hex ===" << std::endl;

	ASSERT_EQ(Fmt("VARBINARY", RawCellValue::Bytes(std::vector<uint8_t> {0xDE, 0xAD, 0xBE, 0xEF})), "0xdeadbeef");
	ASSERT_EQ(Fmt("VARBINARY", RawCellValue::Bytes(std::vector<uint8_t>())), "0x");
	ASSERT_EQ(Fmt("IMAGE", RawCellValue::Bytes(std::vector<uint8_t> {0x00, 0x0A})), "0x000a");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: default text for numbers and strings
//==============================================================================
void test_default_text() {
	std::cout << "\n=== Test: Default Text ===" << std::endl;

	ASSERT_EQ(Fmt("INT", RawCellValue::Integer(-42)), "-42");
	ASSERT_EQ(Fmt("BIGINT", RawCellValue::Integer(std::numeric_limits<int64_t>::min())), "-9223372036854775808");
	ASSERT_EQ(Fmt("TINYINT", RawCellValue::Integer(255)), "255");
	ASSERT_EQ(Fmt("NVARCHAR", RawCellValue::String("héllo, world")), "héllo, world");
	ASSERT_EQ(Fmt("NVARCHAR", RawCellValue::String("")), "");
	ASSERT_EQ(Fmt("DATETIME2", RawCellValue::String("2024-01-15 12:30:00")), "2024-01-15 12:30:00");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: floats use the shortest round-trip text
//==============================================================================
void test_float_text() {
	std::cout << "\n=== Test: Float Text ===" << std::endl;

	ASSERT_EQ(ValueFormatter::FormatFloat(0.1), "0.1");
	ASSERT_EQ(ValueFormatter::FormatFloat(1.0), "1");
	ASSERT_EQ(ValueFormatter::FormatFloat(-2.5), "-2.5");
	ASSERT_EQ(ValueFormatter::FormatFloat(1e21), "1e+21");
	ASSERT_EQ(ValueFormatter::FormatFloat(0.0), "0");
	ASSERT_EQ(ValueFormatter::FormatFloat(std::numeric_limits<double>::infinity()), "+Inf");
	ASSERT_EQ(ValueFormatter::FormatFloat(-std::numeric_limits<double>::infinity()), "-Inf");
	ASSERT_EQ(ValueFormatter::FormatFloat(std::nan("")), "NaN");

	double third = 1.0 / 3.0;
	ASSERT_EQ(std::stod(ValueFormatter::FormatFloat(third)), third);

	ASSERT_EQ(Fmt("FLOAT", RawCellValue::Float(3.25)), "3.25");

	// whole numbers stay in positional form below a million
	ASSERT_EQ(ValueFormatter::FormatFloat(100.0), "100");
	ASSERT_EQ(ValueFormatter::FormatFloat(1500.0), "1500");
	ASSERT_EQ(ValueFormatter::FormatFloat(-123456.0), "-123456");
	ASSERT_EQ(Fmt("REAL", RawCellValue::Float(20.0)), "20");
	ASSERT_EQ(Fmt("FLOAT", RawCellValue::Float(12345.678)), "12345.678");

	// exponent form from 1e6 up and below 1e-4
	ASSERT_EQ(ValueFormatter::FormatFloat(1e6), "1e+06");
	ASSERT_EQ(ValueFormatter::FormatFloat(123456789.0), "1.23456789e+08");
	ASSERT_EQ(ValueFormatter::FormatFloat(0.0001), "0.0001");
	ASSERT_EQ(ValueFormatter::FormatFloat(0.00001), "1e-05");
	ASSERT_EQ(ValueFormatter::FormatFloat(-1.5e-7), "-1.5e-07");

	std::cout << "PASSED!" << std::endl;
}

int main() {
	std::cout << "==========================================" << std::endl;
	std::cout << "ValueFormatter Unit Tests" << std::endl;
	std::cout << "==========================================" << std::endl;

	try {
		test_null_literal();
		test_uniqueidentifier();
		test_uniqueidentifier_wrong_length();
		test_money_and_decimal_text();
		test_bit();
		test_binary_hex();
		test_default_text();
		test_float_text();

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
