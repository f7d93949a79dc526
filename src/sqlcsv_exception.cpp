#include "sqlcsv_exception.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/common/string_util.hpp"

namespace sqlcsv {

using duckdb::StringUtil;

std::string GetErrorMessage(const std::exception &ex) {
	duckdb::ErrorData error(ex);
	return error.RawMessage();
}

ConfigError::ConfigError(const std::string &msg) : Exception(ExceptionType::INVALID_INPUT, msg) {
}

ConnectivityError::ConnectivityError(const std::string &msg) : Exception(ExceptionType::CONNECTION, msg) {
}

InputReadError::InputReadError(const std::string &msg) : Exception(ExceptionType::IO, msg) {
}

ExecutionError::ExecutionError(const std::string &msg) : Exception(ExceptionType::EXECUTOR, msg) {
}

ExecutionError::ExecutionError(ExceptionType type, const std::string &msg) : Exception(type, msg) {
}

QueryTimeout::QueryTimeout(const std::string &msg) : ExecutionError(ExceptionType::INTERRUPT, msg) {
}

QueryRowError::QueryRowError(uint64_t row_index, const std::string &cause)
    : ExecutionError(ExceptionType::CONVERSION,
                     StringUtil::Format("error in row %llu %s", row_index, cause)),
      row_index_(row_index) {
}

SinkWriteError::SinkWriteError(const std::string &msg) : ExecutionError(ExceptionType::IO, msg) {
}

static std::string JoinErrorMessages(const std::vector<tds::TdsError> &errors) {
	if (errors.empty()) {
		return "SQL Server reported an error";
	}
	std::string result;
	for (auto &error : errors) {
		if (!result.empty()) {
			result += "; ";
		}
		result += StringUtil::Format("SQL Server error [%d, severity %d]: %s", error.number,
		                             static_cast<int>(error.severity), error.message);
	}
	return result;
}

ServerError::ServerError(std::vector<tds::TdsError> errors)
    : ExecutionError(ExceptionType::EXECUTOR, JoinErrorMessages(errors)), errors_(std::move(errors)) {
}

std::string ServerError::StructuredDescription() const {
	std::string result;
	for (auto &error : errors_) {
		if (!result.empty()) {
			result += "\n";
		}
		result += error.ToString();
	}
	return result;
}

MalformedIdentifier::MalformedIdentifier(const std::string &msg) : Exception(ExceptionType::CONVERSION, msg) {
}

}  // namespace sqlcsv
