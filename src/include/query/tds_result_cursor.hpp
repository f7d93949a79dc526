#pragma once

#include "query/result_cursor.hpp"
#include "tds/tds_batch_channel.hpp"
#include "tds/tds_message.hpp"
#include "tds/tds_token_parser.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sqlcsv {

enum class TdsCursorState : uint8_t {
	Initializing,  // Batch sent, waiting for the first COLMETADATA
	InResultSet,   // Yielding ROW tokens
	Between,       // Current result set ended, response continues
	Exhausted      // Final DONE received
};

//===----------------------------------------------------------------------===//
// TdsResultCursor - ResultCursor over the token stream of one SQL_BATCH
//
// Result sets begin at COLMETADATA; DONE tokens of statements without a
// result (DML, DDL) are skipped. An ERROR reported while rows are read ends
// the result sets and is raised by Close() as ServerError. A deadline
// overrun sends ATTENTION and raises QueryTimeout.
//===----------------------------------------------------------------------===//

class TdsResultCursor : public ResultCursor {
public:
	TdsResultCursor(tds::BatchChannel &connection, int timeout_seconds);
	~TdsResultCursor() override;

	TdsResultCursor(const TdsResultCursor &) = delete;
	TdsResultCursor &operator=(const TdsResultCursor &) = delete;

	// Send the batch and read up to the first result set.
	// Throws ServerError, QueryTimeout or IOException.
	void Start(const std::string &sql);

	const std::vector<ColumnDescriptor> &Columns() const override {
		return columns_;
	}
	bool NextRow(std::vector<RawCellValue> &row) override;
	bool NextResultSet() override;
	void Close() override;

	TdsCursorState GetState() const {
		return state_;
	}

private:
	// Next token, reading packets as needed. Returns None once the response is complete.
	tds::ParsedTokenType NextToken();
	bool ReadMoreData();
	void OnColMetadata();
	// Handles DONE; returns true if it ended the current result set
	bool OnDone();
	// Read up to the next COLMETADATA; false when the response ends first
	bool SeekResultSet();
	// Read and discard everything up to the final DONE
	void Drain();
	// Cancel an unfinished response after an abandoned read
	void Cancel();
	[[noreturn]] void ThrowTimeout();

	tds::BatchChannel &connection_;
	int timeout_seconds_;
	bool has_deadline_;
	std::chrono::steady_clock::time_point deadline_;

	TdsCursorState state_;
	bool closed_;
	// Last packet of the response has been fed to the parser
	bool eom_received_;
	// COLMETADATA of the next result set already parsed
	bool pending_metadata_;
	tds::TokenParser parser_;
	std::vector<tds::ColumnMetadata> metadata_;
	std::vector<ColumnDescriptor> columns_;
	std::vector<tds::TdsError> errors_;
	uint64_t rows_read_;
};

//===----------------------------------------------------------------------===//
// TdsQueryConnection - QueryConnection backed by a TDS session
//===----------------------------------------------------------------------===//

class TdsQueryConnection : public QueryConnection {
public:
	explicit TdsQueryConnection(tds::BatchChannel &connection);

	std::unique_ptr<ResultCursor> ExecuteQuery(const std::string &sql, int timeout_seconds) override;

private:
	tds::BatchChannel &connection_;
};

}  // namespace sqlcsv
