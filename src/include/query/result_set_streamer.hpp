#pragma once

#include "format/column_descriptor.hpp"
#include "query/record_sink.hpp"
#include "query/result_cursor.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// ResultSetStreamer - writes one result set as a header record followed by
// one record per row, as the rows arrive
//===----------------------------------------------------------------------===//

class ResultSetStreamer {
public:
	ResultSetStreamer(RecordSink &sink, std::string null_literal);

	// Returns the number of rows written.
	// Throws QueryRowError for a row that cannot be decoded or formatted and
	// SinkWriteError when the sink fails. Cursor transport errors pass through.
	uint64_t Stream(const std::vector<ColumnDescriptor> &columns, ResultCursor &cursor);

private:
	bool FetchRow(ResultCursor &cursor, uint64_t row_number);

	RecordSink &sink_;
	std::string null_literal_;
	std::vector<RawCellValue> row_;
	std::vector<std::string> formatted_;
};

}  // namespace sqlcsv
