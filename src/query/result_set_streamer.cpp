#include "query/result_set_streamer.hpp"
#include "format/header_renderer.hpp"
#include "format/value_formatter.hpp"
#include "sqlcsv_exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace sqlcsv {

using duckdb::StringUtil;

ResultSetStreamer::ResultSetStreamer(RecordSink &sink, std::string null_literal)
    : sink_(sink), null_literal_(std::move(null_literal)) {
}

bool ResultSetStreamer::FetchRow(ResultCursor &cursor, uint64_t row_number) {
	try {
		return cursor.NextRow(row_);
	} catch (ExecutionError &) {
		throw;
	} catch (duckdb::IOException &) {
		throw;
	} catch (std::exception &ex) {
		throw QueryRowError(row_number, "scanning: " + GetErrorMessage(ex));
	}
}

uint64_t ResultSetStreamer::Stream(const std::vector<ColumnDescriptor> &columns, ResultCursor &cursor) {
	try {
		sink_.WriteRecord(HeaderRenderer::RenderHeader(columns));
	} catch (SinkWriteError &ex) {
		throw SinkWriteError("error writing CSV column header: " + GetErrorMessage(ex));
	}

	formatted_.resize(columns.size());
	uint64_t row_count = 0;
	while (FetchRow(cursor, row_count + 1)) {
		uint64_t row_number = row_count + 1;
		if (row_.size() != columns.size()) {
			throw QueryRowError(row_number, StringUtil::Format("scanning: expected %llu values, got %llu",
			                                                   static_cast<uint64_t>(columns.size()),
			                                                   static_cast<uint64_t>(row_.size())));
		}
		for (size_t i = 0; i < columns.size(); i++) {
			try {
				formatted_[i] = ValueFormatter::Format(columns[i], row_[i], null_literal_);
			} catch (MalformedIdentifier &ex) {
				throw QueryRowError(row_number, "constructing uuid from bytes: " + GetErrorMessage(ex));
			} catch (std::exception &ex) {
				throw QueryRowError(row_number, "formatting column [" + columns[i].name +
				                                    "]: " + GetErrorMessage(ex));
			}
		}
		try {
			sink_.WriteRecord(formatted_);
		} catch (SinkWriteError &ex) {
			throw SinkWriteError(
			    StringUtil::Format("error in row %llu writing CSV: %s", row_number, GetErrorMessage(ex)));
		}
		row_count = row_number;
	}
	return row_count;
}

}  // namespace sqlcsv
