// test/integration/test_sqlcsv_integration.cpp
// End-to-end tests: connection, batch execution and CSV output against a
// live SQL Server
//
// This test requires a running SQL Server instance.
//
// Set environment variables:
//   MSSQL_TEST_HOST:    SQL Server hostname (default: localhost)
//   MSSQL_TEST_PORT:    SQL Server port (default: 1433)
//   MSSQL_TEST_USER:    SQL Server username (default: sa)
//   MSSQL_TEST_PASS:    SQL Server password (required, test is skipped without it)
//   MSSQL_TEST_DB:      Database name (default: master)
//
// Run:
//   ./test_sqlcsv_integration

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <sstream>

#include "connection/connection_manager.hpp"
#include "query/query_executor.hpp"
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

#define ASSERT_CONTAINS(str, substr)                                                         \
	do {                                                                                     \
		if ((str).find(substr) == std::string::npos) {                                       \
			std::cerr << "ASSERTION FAILED at " << __FILE__ << ":" << __LINE__ << std::endl; \
			std::cerr << "  String does not contain: " << (substr) << std::endl;             \
			std::cerr << "  Actual string: " << (str) << std::endl;                          \
			assert(false);                                                                   \
		}                                                                                    \
	} while (0)

std::string getenv_or(const char *name, const char *default_value) {
	const char *value = std::getenv(name);
	return value ? value : default_value;
}

struct TestConfig {
	std::string host;
	uint16_t port;
	std::string user;
	std::string pass;
	std::string database;

	static TestConfig FromEnv() {
		TestConfig config;
		config.host = getenv_or("MSSQL_TEST_HOST", "localhost");
		config.port = static_cast<uint16_t>(std::stoi(getenv_or("MSSQL_TEST_PORT", "1433")));
		config.user = getenv_or("MSSQL_TEST_USER", "sa");
		config.pass = getenv_or("MSSQL_TEST_PASS", "");
		config.database = getenv_or("MSSQL_TEST_DB", "master");
		return config;
	}

	bool IsValid() const {
		return !pass.empty();
	}

	ConnectionConfig ToConnectionConfig(bool encrypt) const {
		ConnectionConfig result;
		result.host = host;
		result.port = port;
		result.user = user;
		result.password = pass;
		result.database = database;
		result.use_encrypt = encrypt;
		return result;
	}
};

// Runs one batch and returns the CSV text, or "ERROR: <message>"
static std::string RunBatch(ConnectionManager &manager, const std::string &sql, int timeout_seconds = 30,
                            const std::string &null_literal = "NULL") {
	std::ostringstream out;
	CsvRecordSink sink(out);
	QueryExecutor executor(manager.GetQueryConnection(), sink, null_literal, timeout_seconds);
	try {
		executor.Execute(sql);
	} catch (ServerError &ex) {
		return out.str() + "ERROR: " + ex.StructuredDescription();
	} catch (ExecutionError &ex) {
		return out.str() + "ERROR: " + GetErrorMessage(ex);
	}
	return out.str();
}

//==============================================================================
// Test: basic result set shape
//==============================================================================
void test_select_types(ConnectionManager &manager) {
	std::cout << "\n=== Test: Select Types ===" << std::endl;

	auto csv = RunBatch(manager, "SELECT CAST(1 AS int) AS [Id], N'h\xC3\xA9llo, world' AS [Name], "
	                             "CAST(NULL AS int) AS [Missing], CAST(1 AS bit) AS [Flag]\r\n");
	ASSERT_EQ(csv, "\n[Id] INT NOT NULL,[Name] NVARCHAR(12) NOT NULL,[Missing] INT NULL,[Flag] BIT NOT NULL\n"
	               "1,\"h\xC3\xA9llo, world\",NULL,1\n");

	csv = RunBatch(manager,
	               "SELECT CAST('6F9619FF-8B86-D011-B42D-00C04FC964FF' AS uniqueidentifier) AS g, "
	               "CAST(12.34 AS money) AS m, CAST(123.45 AS decimal(10,2)) AS d, 0xDEADBEEF AS b, "
	               "CAST('2024-01-15T12:30:00' AS datetime2(0)) AS t");
	ASSERT_CONTAINS(csv, "6f9619ff-8b86-d011-b42d-00c04fc964ff,12.3400,123.45,0xdeadbeef,2024-01-15 12:30:00\n");
	ASSERT_CONTAINS(csv, "[d] DECIMAL(10,2) NOT NULL");

	csv = RunBatch(manager, "SELECT CAST(N'x' AS nvarchar(max)) AS big", 30, "");
	ASSERT_CONTAINS(csv, "\n[big] NVARCHAR(max) ");
	ASSERT_CONTAINS(csv, "\nx\n");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: multiple and empty result sets
//==============================================================================
void test_multiple_result_sets(ConnectionManager &manager) {
	std::cout << "\n=== Test: Multiple Result Sets ===" << std::endl;

	auto csv = RunBatch(manager, "SELECT 1 AS a; SELECT 2 AS b WHERE 1 = 0; SELECT 3 AS c");
	ASSERT_EQ(csv, "\n[a] INT NOT NULL\n1\n\n[b] INT NOT NULL\n\n[c] INT NOT NULL\n3\n");

	csv = RunBatch(manager, "DECLARE @x int = 1; SET @x = @x + 1;");
	ASSERT_EQ(csv, "\n");

	csv = RunBatch(manager, "SET NOCOUNT ON; DECLARE @t TABLE (v int); INSERT INTO @t VALUES (5); SELECT v FROM @t");
	ASSERT_EQ(csv, "\n[v] INT NULL\n5\n");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: server errors leave the session usable
//==============================================================================
void test_server_error(ConnectionManager &manager) {
	std::cout << "\n=== Test: Server Error ===" << std::endl;

	auto csv = RunBatch(manager, "SELECT * FROM dbo.table_that_does_not_exist_sqlcsv");
	ASSERT_CONTAINS(csv, "ERROR: SQL Server error {Number: 208, State: 1, Class: 16");

	// error after rows were produced
	csv = RunBatch(manager, "SELECT 1 AS a; SELECT 1/0 AS b");
	ASSERT_CONTAINS(csv, "\n[a] INT NOT NULL\n1\n");
	ASSERT_CONTAINS(csv, "Number: 8134");

	csv = RunBatch(manager, "SELECT 42 AS answer");
	ASSERT_EQ(csv, "\n[answer] INT NOT NULL\n42\n");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: timeout cancels the batch and keeps the session
//==============================================================================
void test_timeout(ConnectionManager &manager) {
	std::cout << "\n=== Test: Timeout ===" << std::endl;

	auto csv = RunBatch(manager, "WAITFOR DELAY '00:00:05'; SELECT 1 AS late", 1);
	ASSERT_CONTAINS(csv, "ERROR: query timed out after 1 seconds");

	// the session survives a cancelled batch
	manager.Ping(5);

	csv = RunBatch(manager, "SELECT 7 AS after_timeout");
	ASSERT_EQ(csv, "\n[after_timeout] INT NOT NULL\n7\n");

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: large result spanning many packets
//==============================================================================
void test_many_rows(ConnectionManager &manager) {
	std::cout << "\n=== Test: Many Rows ===" << std::endl;

	auto csv = RunBatch(manager, "SELECT TOP 5000 ROW_NUMBER() OVER (ORDER BY (SELECT NULL)) AS n, "
	                             "REPLICATE('x', 100) AS pad FROM sys.all_objects a CROSS JOIN sys.all_objects b");
	size_t lines = 0;
	for (auto c : csv) {
		if (c == '\n') {
			lines++;
		}
	}
	// separator + header + rows
	ASSERT_EQ(lines, static_cast<size_t>(5002));
	ASSERT_CONTAINS(csv, "\n5000,");

	std::cout << "PASSED!" << std::endl;
}

void test_connect_failure() {
	std::cout << "\n=== Test: Connect Failure ===" << std::endl;

	ConnectionConfig config;
	config.host = "127.0.0.1";
	config.port = 1;
	config.user = "sa";
	ConnectionManager manager(config);

	bool threw = false;
	try {
		manager.Open(2);
	} catch (ConnectivityError &ex) {
		threw = true;
		ASSERT_CONTAINS(GetErrorMessage(ex), "127.0.0.1:1");
	}
	assert(threw);
	assert(!manager.IsOpen());

	std::cout << "PASSED!" << std::endl;
}

static void RunSuite(const TestConfig &test_config, bool encrypt) {
	std::cout << "\n--- encrypt=" << (encrypt ? "true" : "false") << " ---" << std::endl;
	ConnectionManager manager(test_config.ToConnectionConfig(encrypt));
	manager.Open();
	assert(manager.IsOpen());

	test_select_types(manager);
	test_multiple_result_sets(manager);
	test_server_error(manager);
	test_timeout(manager);
	test_many_rows(manager);
}

int main() {
	std::cout << "==========================================" << std::endl;
	std::cout << "sqlcsv Integration Tests" << std::endl;
	std::cout << "==========================================" << std::endl;

	auto config = TestConfig::FromEnv();
	if (!config.IsValid()) {
		std::cout << "SKIPPED: MSSQL_TEST_PASS is not set" << std::endl;
		return 0;
	}

	try {
		test_connect_failure();
		RunSuite(config, false);
		RunSuite(config, true);

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
