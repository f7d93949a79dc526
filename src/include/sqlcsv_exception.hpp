#pragma once

#include "duckdb/common/exception.hpp"
#include "tds/tds_message.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace sqlcsv {

using duckdb::ExceptionType;

// Plain message text of any exception, without DuckDB's JSON envelope
std::string GetErrorMessage(const std::exception &ex);

//===----------------------------------------------------------------------===//
// Process-fatal errors (raised before any batch runs)
//===----------------------------------------------------------------------===//

// Missing or unparseable connection information
class ConfigError : public duckdb::Exception {
public:
	explicit ConfigError(const std::string &msg);

	template <typename... ARGS>
	explicit ConfigError(const std::string &msg, ARGS... params) : ConfigError(ConstructMessage(msg, params...)) {
	}
};

// Open or ping failure
class ConnectivityError : public duckdb::Exception {
public:
	explicit ConnectivityError(const std::string &msg);

	template <typename... ARGS>
	explicit ConnectivityError(const std::string &msg, ARGS... params)
	    : ConnectivityError(ConstructMessage(msg, params...)) {
	}
};

// Standard input could not be read
class InputReadError : public duckdb::Exception {
public:
	explicit InputReadError(const std::string &msg);
};

//===----------------------------------------------------------------------===//
// Per-batch errors (reported, then the next batch runs)
//===----------------------------------------------------------------------===//

class ExecutionError : public duckdb::Exception {
public:
	explicit ExecutionError(const std::string &msg);

	template <typename... ARGS>
	explicit ExecutionError(const std::string &msg, ARGS... params) : ExecutionError(ConstructMessage(msg, params...)) {
	}

protected:
	ExecutionError(ExceptionType type, const std::string &msg);
};

// The batch deadline elapsed
class QueryTimeout : public ExecutionError {
public:
	explicit QueryTimeout(const std::string &msg);
};

// Decoding or formatting row `row_index` (1-based) failed
class QueryRowError : public ExecutionError {
public:
	QueryRowError(uint64_t row_index, const std::string &cause);

	uint64_t RowIndex() const {
		return row_index_;
	}

private:
	uint64_t row_index_;
};

// Writing a record to the output failed
class SinkWriteError : public ExecutionError {
public:
	explicit SinkWriteError(const std::string &msg);
};

// One or more ERROR tokens reported by the server
class ServerError : public ExecutionError {
public:
	explicit ServerError(std::vector<tds::TdsError> errors);

	// Every error in structured form, one per line
	std::string StructuredDescription() const;

private:
	std::vector<tds::TdsError> errors_;
};

//===----------------------------------------------------------------------===//
// Formatting errors
//===----------------------------------------------------------------------===//

// A UNIQUEIDENTIFIER value that is not 16 bytes
class MalformedIdentifier : public duckdb::Exception {
public:
	explicit MalformedIdentifier(const std::string &msg);

	template <typename... ARGS>
	explicit MalformedIdentifier(const std::string &msg, ARGS... params)
	    : MalformedIdentifier(ConstructMessage(msg, params...)) {
	}
};

}  // namespace sqlcsv
