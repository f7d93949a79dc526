#pragma once

#include "query/record_sink.hpp"
#include "query/result_cursor.hpp"
#include "query/result_set_streamer.hpp"
#include <string>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// QueryExecutor - runs one batch and writes every result set it produces
//
// Each result set is preceded by one empty separator record. Result sets
// without columns contribute only the separator.
//===----------------------------------------------------------------------===//

class QueryExecutor {
public:
	QueryExecutor(QueryConnection &connection, RecordSink &sink, std::string null_literal, int timeout_seconds);

	// Throws ExecutionError or one of its subclasses. The sink is flushed
	// whether or not the batch succeeds.
	void Execute(const std::string &sql);

	// Rows written by the last Execute(), across all result sets
	uint64_t GetRowCount() const {
		return row_count_;
	}

private:
	void Run(const std::string &sql);
	// Close after a failed result set; close errors are only logged
	void CloseAbandoned(ResultCursor &cursor);

	QueryConnection &connection_;
	RecordSink &sink_;
	ResultSetStreamer streamer_;
	int timeout_seconds_;
	uint64_t row_count_;
};

}  // namespace sqlcsv
