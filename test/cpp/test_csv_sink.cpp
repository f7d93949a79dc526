// test/cpp/test_csv_sink.cpp
// Unit tests for CsvRecordSink
//
// These tests do NOT require a running SQL Server instance.
//
// Run:
//   ./test_csv_sink

#include <cassert>
#include <iostream>
#include <sstream>

#include "query/record_sink.hpp"
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

static std::string WriteOne(const std::vector<std::string> &fields) {
	std::ostringstream out;
	CsvRecordSink sink(out);
	sink.WriteRecord(fields);
	sink.Flush();
	return out.str();
}

void test_plain_fields() {
	std::cout << "\n=== Test: Plain Fields ===" << std::endl;

	ASSERT_EQ(WriteOne({"1", "abc", "NULL"}), "1,abc,NULL\n");
	ASSERT_EQ(WriteOne({"", "", ""}), ",,\n");
	ASSERT_EQ(WriteOne({"[Id] INT NOT NULL", "[Name] NVARCHAR(50) NULL"}), "[Id] INT NOT NULL,[Name] NVARCHAR(50) NULL\n");

	std::cout << "PASSED!" << std::endl;
}

void test_empty_record() {
	std::cout << "\n=== Test: Empty Record ===" << std::endl;

	ASSERT_EQ(WriteOne({}), "\n");

	std::cout << "PASSED!" << std::endl;
}

void test_quoting() {
	std::cout << "\n=== Test: Quoting ===" << std::endl;

	ASSERT_EQ(WriteOne({"a,b"}), "\"a,b\"\n");
	ASSERT_EQ(WriteOne({"say \"hi\""}), "\"say \"\"hi\"\"\"\n");
	ASSERT_EQ(WriteOne({"line1\nline2"}), "\"line1\nline2\"\n");
	ASSERT_EQ(WriteOne({"cr\r"}), "\"cr\r\"\n");
	ASSERT_EQ(WriteOne({" leading"}), "\" leading\"\n");
	ASSERT_EQ(WriteOne({"\tx"}), "\"\tx\"\n");
	ASSERT_EQ(WriteOne({"\\."}), "\"\\.\"\n");
	// trailing whitespace and a longer backslash sequence stay bare
	ASSERT_EQ(WriteOne({"trailing "}), "trailing \n");
	ASSERT_EQ(WriteOne({"\\.x"}), "\\.x\n");

	assert(CsvRecordSink::FieldNeedsQuotes("\xC2\xA0nbsp"));
	assert(!CsvRecordSink::FieldNeedsQuotes("\xC3\xA9t\xC3\xA9"));
	assert(!CsvRecordSink::FieldNeedsQuotes(""));

	std::cout << "PASSED!" << std::endl;
}

void test_records_in_order() {
	std::cout << "\n=== Test: Records In Order ===" << std::endl;

	std::ostringstream out;
	CsvRecordSink sink(out);
	sink.WriteRecord({});
	sink.WriteRecord({"[x] INT NULL"});
	sink.WriteRecord({"1"});
	sink.WriteRecord({"NULL"});
	sink.Flush();
	ASSERT_EQ(out.str(), "\n[x] INT NULL\n1\nNULL\n");

	std::cout << "PASSED!" << std::endl;
}

void test_failed_stream() {
	std::cout << "\n=== Test: Failed Stream ===" << std::endl;

	std::ostringstream out;
	out.setstate(std::ios::badbit);
	CsvRecordSink sink(out);

	bool threw = false;
	try {
		sink.WriteRecord({"1"});
	} catch (SinkWriteError &) {
		threw = true;
	}
	assert(threw);

	threw = false;
	try {
		sink.Flush();
	} catch (SinkWriteError &) {
		threw = true;
	}
	assert(threw);

	std::cout << "PASSED!" << std::endl;
}

int main() {
	std::cout << "==========================================" << std::endl;
	std::cout << "CsvRecordSink Unit Tests" << std::endl;
	std::cout << "==========================================" << std::endl;

	try {
		test_plain_fields();
		test_empty_record();
		test_quoting();
		test_records_in_order();
		test_failed_stream();

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
