// test/cpp/test_result_streaming.cpp
// Unit tests for ResultSetStreamer and QueryExecutor
//
// These tests do NOT require a running SQL Server instance. They drive the
// streamer and executor with in-memory cursors and sinks.
//
// Run:
//   ./test_result_streaming

#include <cassert>
#include <iostream>
#include <memory>

#include "query/query_executor.hpp"
#include "query/result_set_streamer.hpp"
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

#define ASSERT_CONTAINS(str, substr)                                                         \
	do {                                                                                     \
		if ((str).find(substr) == std::string::npos) {                                       \
			std::cerr << "ASSERTION FAILED at " << __FILE__ << ":" << __LINE__ << std::endl; \
			std::cerr << "  String does not contain: " << (substr) << std::endl;             \
			std::cerr << "  Actual string: " << (str) << std::endl;                          \
			assert(false);                                                                   \
		}                                                                                    \
	} while (0)

//==============================================================================
// In-memory test doubles
//==============================================================================

using Row = std::vector<RawCellValue>;

struct FakeResultSet {
	std::vector<ColumnDescriptor> columns;
	std::vector<Row> rows;
	// Throw from NextRow() once this many rows have been returned
	int fail_after_rows = -1;
	std::string failure;
};

enum class FailurePoint { None, Execute, ExecuteServer, ExecuteTimeout, NextResultSet, Close, CloseServer };

struct FakeScript {
	std::vector<FakeResultSet> result_sets;
	FailurePoint failure = FailurePoint::None;
};

static tds::TdsError MakeServerError(uint32_t number, const std::string &message) {
	tds::TdsError error;
	error.number = number;
	error.state = 1;
	error.severity = 16;
	error.message = message;
	error.server_name = "testsrv";
	error.line_number = 1;
	return error;
}

class FakeCursor : public ResultCursor {
public:
	explicit FakeCursor(const FakeScript &script, int *close_calls = nullptr)
	    : script_(script), current_(0), row_(0), close_calls_(close_calls) {
		if (script_.result_sets.empty()) {
			script_.result_sets.push_back(FakeResultSet());
		}
	}

	const std::vector<ColumnDescriptor> &Columns() const override {
		return script_.result_sets[current_].columns;
	}

	bool NextRow(std::vector<RawCellValue> &row) override {
		auto &set = script_.result_sets[current_];
		if (set.fail_after_rows >= 0 && static_cast<int>(row_) == set.fail_after_rows) {
			throw duckdb::InvalidInputException(set.failure);
		}
		if (row_ >= set.rows.size()) {
			return false;
		}
		row = set.rows[row_++];
		return true;
	}

	bool NextResultSet() override {
		if (script_.failure == FailurePoint::NextResultSet) {
			throw duckdb::InvalidInputException("lost track of result sets");
		}
		if (current_ + 1 >= script_.result_sets.size()) {
			return false;
		}
		current_++;
		row_ = 0;
		return true;
	}

	void Close() override {
		if (close_calls_) {
			(*close_calls_)++;
		}
		if (script_.failure == FailurePoint::Close) {
			throw duckdb::InvalidInputException("trailing garbage");
		}
		if (script_.failure == FailurePoint::CloseServer) {
			throw ServerError({MakeServerError(8134, "Divide by zero error encountered.")});
		}
	}

private:
	FakeScript script_;
	size_t current_;
	size_t row_;
	int *close_calls_;
};

class FakeConnection : public QueryConnection {
public:
	explicit FakeConnection(FakeScript script) : script_(std::move(script)), last_timeout(0), close_calls(0) {
	}

	std::unique_ptr<ResultCursor> ExecuteQuery(const std::string &sql, int timeout_seconds) override {
		last_sql = sql;
		last_timeout = timeout_seconds;
		switch (script_.failure) {
		case FailurePoint::Execute:
			throw duckdb::IOException("connection reset by peer");
		case FailurePoint::ExecuteServer:
			throw ServerError({MakeServerError(208, "Invalid object name 'nope'.")});
		case FailurePoint::ExecuteTimeout:
			throw QueryTimeout("query timed out after 1 seconds");
		default:
			break;
		}
		return std::unique_ptr<ResultCursor>(new FakeCursor(script_, &close_calls));
	}

	std::string last_sql;
	int last_timeout;
	int close_calls;

private:
	FakeScript script_;
};

class RecordingSink : public RecordSink {
public:
	RecordingSink() : fail_at(-1), flushes(0) {
	}

	void WriteRecord(const std::vector<std::string> &fields) override {
		if (fail_at >= 0 && static_cast<int>(records.size()) == fail_at) {
			throw SinkWriteError("broken pipe");
		}
		records.push_back(fields);
	}

	void Flush() override {
		flushes++;
	}

	// Records joined as simple text, one line each
	std::string Text() const {
		std::string result;
		for (auto &record : records) {
			for (size_t i = 0; i < record.size(); i++) {
				result += (i > 0 ? "," : "") + record[i];
			}
			result += "\n";
		}
		return result;
	}

	std::vector<std::vector<std::string>> records;
	int fail_at;
	int flushes;
};

static FakeResultSet TwoColumnSet() {
	FakeResultSet set;
	set.columns.push_back(ColumnDescriptor("Id", "INT").WithNullable(false));
	set.columns.push_back(ColumnDescriptor("Name", "NVARCHAR").WithLength(50).WithNullable(true));
	set.rows.push_back({RawCellValue::Integer(1), RawCellValue::String("alpha")});
	set.rows.push_back({RawCellValue::Integer(2), RawCellValue::Null()});
	return set;
}

//==============================================================================
// Test: streamer writes header then rows
//==============================================================================
void test_stream_header_and_rows() {
	std::cout << "\n=== Test: Stream Header And Rows ===" << std::endl;

	FakeScript script;
	script.result_sets.push_back(TwoColumnSet());
	FakeCursor cursor(script);
	RecordingSink sink;
	ResultSetStreamer streamer(sink, "NULL");

	auto rows = streamer.Stream(cursor.Columns(), cursor);
	ASSERT_EQ(rows, static_cast<uint64_t>(2));
	ASSERT_EQ(sink.Text(), "[Id] INT NOT NULL,[Name] NVARCHAR(50) NULL\n1,alpha\n2,NULL\n");

	std::cout << "PASSED!" << std::endl;
}

void test_stream_header_only() {
	std::cout << "\n=== Test: Stream Header Only ===" << std::endl;

	FakeScript script;
	FakeResultSet set;
	set.columns.push_back(ColumnDescriptor("x", "INT").WithNullable(true));
	script.result_sets.push_back(set);
	FakeCursor cursor(script);
	RecordingSink sink;
	ResultSetStreamer streamer(sink, "");

	ASSERT_EQ(streamer.Stream(cursor.Columns(), cursor), static_cast<uint64_t>(0));
	ASSERT_EQ(sink.Text(), "[x] INT NULL\n");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: streamer error reporting
//==============================================================================
void test_stream_malformed_identifier() {
	std::cout << "\n=== Test: Stream Malformed Identifier ===" << std::endl;

	FakeScript script;
	FakeResultSet set;
	set.columns.push_back(ColumnDescriptor("g", "UNIQUEIDENTIFIER"));
	set.rows.push_back({RawCellValue::Bytes(std::vector<uint8_t>(16, 0x11))});
	set.rows.push_back({RawCellValue::Bytes(std::vector<uint8_t>(15, 0x11))});
	script.result_sets.push_back(set);
	FakeCursor cursor(script);
	RecordingSink sink;
	ResultSetStreamer streamer(sink, "NULL");

	bool threw = false;
	try {
		streamer.Stream(cursor.Columns(), cursor);
	} catch (QueryRowError &ex) {
		threw = true;
		ASSERT_EQ(ex.RowIndex(), static_cast<uint64_t>(2));
		ASSERT_CONTAINS(GetErrorMessage(ex), "error in row 2 constructing uuid from bytes");
	}
	assert(threw);
	// header and first row were already written
	ASSERT_EQ(sink.records.size(), static_cast<size_t>(2));

	std::cout << "PASSED!" << std::endl;
}

void test_stream_scan_failure() {
	std::cout << "\n=== Test: Stream Scan Failure ===" << std::endl;

	FakeScript script;
	auto set = TwoColumnSet();
	set.fail_after_rows = 1;
	set.failure = "Invalid INTN length: 3";
	script.result_sets.push_back(set);
	FakeCursor cursor(script);
	RecordingSink sink;
	ResultSetStreamer streamer(sink, "NULL");

	bool threw = false;
	try {
		streamer.Stream(cursor.Columns(), cursor);
	} catch (QueryRowError &ex) {
		threw = true;
		ASSERT_EQ(ex.RowIndex(), static_cast<uint64_t>(2));
		ASSERT_CONTAINS(GetErrorMessage(ex), "error in row 2 scanning: Invalid INTN length: 3");
	}
	assert(threw);

	std::cout << "PASSED!" << std::endl;
}

void test_stream_sink_failures() {
	std::cout << "\n=== Test: Stream Sink Failures ===" << std::endl;

	FakeScript script;
	script.result_sets.push_back(TwoColumnSet());

	{
		FakeCursor cursor(script);
		RecordingSink sink;
		sink.fail_at = 0;
		ResultSetStreamer streamer(sink, "NULL");
		bool threw = false;
		try {
			streamer.Stream(cursor.Columns(), cursor);
		} catch (SinkWriteError &ex) {
			threw = true;
			ASSERT_CONTAINS(GetErrorMessage(ex), "error writing CSV column header: broken pipe");
		}
		assert(threw);
	}
	{
		FakeCursor cursor(script);
		RecordingSink sink;
		sink.fail_at = 2;
		ResultSetStreamer streamer(sink, "NULL");
		bool threw = false;
		try {
			streamer.Stream(cursor.Columns(), cursor);
		} catch (SinkWriteError &ex) {
			threw = true;
			ASSERT_CONTAINS(GetErrorMessage(ex), "error in row 2 writing CSV: broken pipe");
		}
		assert(threw);
	}

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: executor result-set layout
//==============================================================================
void test_execute_single_result_set() {
	std::cout << "\n=== Test: Execute Single Result Set ===" << std::endl;

	FakeScript script;
	script.result_sets.push_back(TwoColumnSet());
	FakeConnection connection(script);
	RecordingSink sink;
	QueryExecutor executor(connection, sink, "NULL", 60);

	executor.Execute("SELECT Id, Name FROM t\r\n");
	ASSERT_EQ(connection.last_sql, "SELECT Id, Name FROM t\r\n");
	ASSERT_EQ(connection.last_timeout, 60);
	ASSERT_EQ(sink.Text(), "\n[Id] INT NOT NULL,[Name] NVARCHAR(50) NULL\n1,alpha\n2,NULL\n");
	ASSERT_EQ(executor.GetRowCount(), static_cast<uint64_t>(2));
	ASSERT_EQ(sink.flushes, 1);

	std::cout << "PASSED!" << std::endl;
}

void test_execute_multiple_result_sets() {
	std::cout << "\n=== Test: Execute Multiple Result Sets ===" << std::endl;

	FakeScript script;
	FakeResultSet first;
	first.columns.push_back(ColumnDescriptor("a", "INT").WithNullable(false));
	first.rows.push_back({RawCellValue::Integer(1)});
	FakeResultSet second;
	second.columns.push_back(ColumnDescriptor("b", "BIT").WithNullable(false));
	second.rows.push_back({RawCellValue::Boolean(true)});
	script.result_sets.push_back(first);
	script.result_sets.push_back(second);
	FakeConnection connection(script);
	RecordingSink sink;
	QueryExecutor executor(connection, sink, "NULL", 60);

	executor.Execute("SELECT 1 AS a; SELECT CAST(1 AS bit) AS b");
	ASSERT_EQ(sink.Text(), "\n[a] INT NOT NULL\n1\n\n[b] BIT NOT NULL\n1\n");

	std::cout << "PASSED!" << std::endl;
}

void test_execute_no_columns() {
	std::cout << "\n=== Test: Execute Without Columns ===" << std::endl;

	FakeScript script;
	FakeConnection connection(script);
	RecordingSink sink;
	QueryExecutor executor(connection, sink, "NULL", 0);

	executor.Execute("UPDATE t SET x = 1");
	ASSERT_EQ(sink.Text(), "\n");
	ASSERT_EQ(connection.last_timeout, 0);
	ASSERT_EQ(sink.flushes, 1);

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: executor error wrapping
//==============================================================================
static std::string ExecuteExpectingError(FailurePoint failure, RecordingSink &sink, int *close_calls = nullptr) {
	FakeScript script;
	script.result_sets.push_back(TwoColumnSet());
	script.failure = failure;
	FakeConnection connection(script);
	QueryExecutor executor(connection, sink, "NULL", 60);
	std::string message;
	try {
		executor.Execute("SELECT 1");
	} catch (ServerError &ex) {
		message = "server:" + ex.StructuredDescription();
	} catch (QueryTimeout &ex) {
		message = "timeout:" + GetErrorMessage(ex);
	} catch (ExecutionError &ex) {
		message = GetErrorMessage(ex);
	}
	assert(!message.empty());
	if (close_calls) {
		*close_calls = connection.close_calls;
	}
	return message;
}

void test_execute_error_wrapping() {
	std::cout << "\n=== Test: Execute Error Wrapping ===" << std::endl;

	{
		RecordingSink sink;
		ASSERT_EQ(ExecuteExpectingError(FailurePoint::Execute, sink),
		          "error executing query: connection reset by peer");
		ASSERT_EQ(sink.flushes, 1);
		assert(sink.records.empty());
	}
	{
		RecordingSink sink;
		ASSERT_EQ(ExecuteExpectingError(FailurePoint::ExecuteServer, sink),
		          "server:SQL Server error {Number: 208, State: 1, Class: 16, Message: \"Invalid object name "
		          "'nope'.\", Server: \"testsrv\", Procedure: \"\", Line: 1}");
	}
	{
		RecordingSink sink;
		ASSERT_EQ(ExecuteExpectingError(FailurePoint::ExecuteTimeout, sink),
		          "timeout:query timed out after 1 seconds");
	}
	{
		RecordingSink sink;
		int close_calls = 0;
		ASSERT_EQ(ExecuteExpectingError(FailurePoint::NextResultSet, sink, &close_calls),
		          "error from result set: lost track of result sets");
		// the cursor is still closed after a failed result set
		ASSERT_EQ(close_calls, 1);
		// rows streamed before the failure stay written
		ASSERT_EQ(sink.records.size(), static_cast<size_t>(4));
		ASSERT_EQ(sink.flushes, 1);
	}
	{
		RecordingSink sink;
		int close_calls = 0;
		ASSERT_EQ(ExecuteExpectingError(FailurePoint::Close, sink, &close_calls),
		          "error closing result set: trailing garbage");
		ASSERT_EQ(close_calls, 1);
	}
	{
		RecordingSink sink;
		ASSERT_CONTAINS(ExecuteExpectingError(FailurePoint::CloseServer, sink), "server:SQL Server error {Number: 8134");
	}

	std::cout << "PASSED!" << std::endl;
}

void test_execute_row_error_passthrough() {
	std::cout << "\n=== Test: Execute Row Error Passthrough ===" << std::endl;

	FakeScript script;
	auto set = TwoColumnSet();
	set.fail_after_rows = 0;
	set.failure = "bad bytes";
	script.result_sets.push_back(set);
	FakeConnection connection(script);
	RecordingSink sink;
	QueryExecutor executor(connection, sink, "NULL", 60);

	bool threw = false;
	try {
		executor.Execute("SELECT 1");
	} catch (QueryRowError &ex) {
		threw = true;
		ASSERT_EQ(GetErrorMessage(ex), "error in row 1 scanning: bad bytes");
	}
	assert(threw);
	ASSERT_EQ(sink.Text(), "\n[Id] INT NOT NULL,[Name] NVARCHAR(50) NULL\n");
	ASSERT_EQ(sink.flushes, 1);
	ASSERT_EQ(connection.close_calls, 1);

	std::cout << "PASSED!" << std::endl;
}

int main() {
	std::cout << "==========================================" << std::endl;
	std::cout << "Result Streaming Unit Tests" << std::endl;
	std::cout << "==========================================" << std::endl;

	try {
		test_stream_header_and_rows();
		test_stream_header_only();
		test_stream_malformed_identifier();
		test_stream_scan_failure();
		test_stream_sink_failures();
		test_execute_single_result_set();
		test_execute_multiple_result_sets();
		test_execute_no_columns();
		test_execute_error_wrapping();
		test_execute_row_error_passthrough();

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
