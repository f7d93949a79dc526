#include "query/query_executor.hpp"
#include "sqlcsv_exception.hpp"
#include <cstdio>
#include <cstdlib>
#include <memory>

static int GetExecutorDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLCSV_EXEC_DEBUG_LOG(level, fmt, ...)                          \
	do {                                                                \
		if (GetExecutorDebugLevel() >= level) {                         \
			fprintf(stderr, "[SQLCSV EXEC] " fmt "\n", ##__VA_ARGS__); \
		}                                                               \
	} while (0)

namespace sqlcsv {

QueryExecutor::QueryExecutor(QueryConnection &connection, RecordSink &sink, std::string null_literal,
                             int timeout_seconds)
    : connection_(connection), sink_(sink), streamer_(sink, std::move(null_literal)),
      timeout_seconds_(timeout_seconds), row_count_(0) {
}

void QueryExecutor::Execute(const std::string &sql) {
	row_count_ = 0;
	try {
		Run(sql);
	} catch (std::exception &) {
		try {
			sink_.Flush();
		} catch (SinkWriteError &ex) {
			// the batch error is the one reported
			SQLCSV_EXEC_DEBUG_LOG(1, "flush after failed batch: %s", GetErrorMessage(ex).c_str());
		}
		throw;
	}
	sink_.Flush();
}

void QueryExecutor::CloseAbandoned(ResultCursor &cursor) {
	try {
		cursor.Close();
	} catch (std::exception &ex) {
		// the result set error is the one reported
		SQLCSV_EXEC_DEBUG_LOG(1, "close after failed result set: %s", GetErrorMessage(ex).c_str());
	}
}

void QueryExecutor::Run(const std::string &sql) {
	std::unique_ptr<ResultCursor> cursor;
	try {
		cursor = connection_.ExecuteQuery(sql, timeout_seconds_);
	} catch (ServerError &) {
		throw;
	} catch (QueryTimeout &) {
		throw;
	} catch (std::exception &ex) {
		throw ExecutionError("error executing query: " + GetErrorMessage(ex));
	}

	try {
		size_t result_set = 0;
		do {
			sink_.WriteRecord({});
			const auto &columns = cursor->Columns();
			if (!columns.empty()) {
				uint64_t rows = streamer_.Stream(columns, *cursor);
				row_count_ += rows;
				SQLCSV_EXEC_DEBUG_LOG(1, "result set %zu: %zu columns, %llu rows", result_set, columns.size(),
				                      static_cast<unsigned long long>(rows));
			}
			result_set++;
		} while (cursor->NextResultSet());
	} catch (ExecutionError &) {
		CloseAbandoned(*cursor);
		throw;
	} catch (std::exception &ex) {
		CloseAbandoned(*cursor);
		throw ExecutionError("error from result set: " + GetErrorMessage(ex));
	}

	try {
		cursor->Close();
	} catch (ExecutionError &) {
		throw;
	} catch (std::exception &ex) {
		throw ExecutionError("error closing result set: " + GetErrorMessage(ex));
	}
}

}  // namespace sqlcsv
