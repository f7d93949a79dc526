#include "query/tds_result_cursor.hpp"
#include "sqlcsv_exception.hpp"
#include "tds/encoding/type_converter.hpp"
#include "tds/tds_packet.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include <cstdio>
#include <cstdlib>

static int GetCursorDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLCSV_CURSOR_DEBUG_LOG(level, fmt, ...)                          \
	do {                                                                  \
		if (GetCursorDebugLevel() >= level) {                             \
			fprintf(stderr, "[SQLCSV CURSOR] " fmt "\n", ##__VA_ARGS__); \
		}                                                                 \
	} while (0)

namespace sqlcsv {

using tds::ParsedTokenType;

TdsResultCursor::TdsResultCursor(tds::BatchChannel &connection, int timeout_seconds)
    : connection_(connection), timeout_seconds_(timeout_seconds), has_deadline_(timeout_seconds > 0),
      state_(TdsCursorState::Initializing), closed_(false), eom_received_(false),
      pending_metadata_(false), rows_read_(0) {
}

TdsResultCursor::~TdsResultCursor() {
	if (state_ != TdsCursorState::Exhausted && connection_.GetState() == tds::ConnectionState::Executing) {
		Cancel();
	}
}

void TdsResultCursor::Start(const std::string &sql) {
	if (has_deadline_) {
		deadline_ = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds_);
	}
	if (!connection_.ExecuteBatch(sql)) {
		state_ = TdsCursorState::Exhausted;
		throw duckdb::IOException("Failed to send SQL batch: %s", connection_.GetLastError());
	}

	state_ = TdsCursorState::Between;
	if (SeekResultSet()) {
		return;
	}
	// No tabular result at all: one result set without columns
	columns_.clear();
	if (!errors_.empty()) {
		auto errors = std::move(errors_);
		errors_.clear();
		closed_ = true;
		throw ServerError(std::move(errors));
	}
}

bool TdsResultCursor::ReadMoreData() {
	int timeout_ms = 0;
	if (has_deadline_) {
		auto remaining =
		    std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now()).count();
		if (remaining <= 0) {
			ThrowTimeout();
		}
		timeout_ms = static_cast<int>(remaining);
	} else {
		timeout_ms = -1;
	}

	tds::TdsPacket packet;
	if (!connection_.ReceivePacket(packet, timeout_ms)) {
		if (connection_.TimedOut()) {
			ThrowTimeout();
		}
		state_ = TdsCursorState::Exhausted;
		throw duckdb::IOException("Connection lost while reading results: %s", connection_.GetLastError());
	}

	const auto &payload = packet.GetPayload();
	if (!payload.empty()) {
		parser_.Feed(payload);
	}
	eom_received_ = packet.IsEndOfMessage();
	SQLCSV_CURSOR_DEBUG_LOG(2, "ReadMoreData: %zu bytes, eom=%d", payload.size(), eom_received_ ? 1 : 0);
	return true;
}

void TdsResultCursor::ThrowTimeout() {
	SQLCSV_CURSOR_DEBUG_LOG(1, "deadline of %ds elapsed after %llu rows, cancelling", timeout_seconds_,
	                        static_cast<unsigned long long>(rows_read_));
	state_ = TdsCursorState::Exhausted;
	closed_ = true;
	if (!connection_.SendAttention() || !connection_.WaitForAttentionAck()) {
		SQLCSV_CURSOR_DEBUG_LOG(1, "cancel not acknowledged: %s", connection_.GetLastError().c_str());
	}
	throw QueryTimeout(duckdb::StringUtil::Format("query timed out after %d seconds", timeout_seconds_));
}

ParsedTokenType TdsResultCursor::NextToken() {
	while (true) {
		ParsedTokenType token = parser_.TryParseNext();
		if (token != ParsedTokenType::NeedMoreData && token != ParsedTokenType::None) {
			return token;
		}
		if (parser_.HasError()) {
			state_ = TdsCursorState::Exhausted;
			Cancel();
			throw duckdb::IOException("TDS parse error: %s", parser_.GetParseError());
		}
		if (eom_received_) {
			state_ = TdsCursorState::Exhausted;
			connection_.FinishResponse();
			return ParsedTokenType::None;
		}
		ReadMoreData();
	}
}

void TdsResultCursor::OnColMetadata() {
	metadata_ = parser_.GetColumnMetadata();
	columns_.clear();
	columns_.reserve(metadata_.size());
	for (const auto &column : metadata_) {
		columns_.push_back(tds::encoding::TypeConverter::GetColumnDescriptor(column));
	}
	state_ = TdsCursorState::InResultSet;
	SQLCSV_CURSOR_DEBUG_LOG(1, "result set with %zu columns", columns_.size());
}

bool TdsResultCursor::OnDone() {
	const auto &done = parser_.GetDone();
	SQLCSV_CURSOR_DEBUG_LOG(2, "DONE status=0x%04x rows=%llu", done.status,
	                        static_cast<unsigned long long>(done.row_count));
	if (done.HasError() && errors_.empty()) {
		tds::TdsError error;
		error.message = "SQL Server returned error status";
		errors_.push_back(error);
	}
	return state_ == TdsCursorState::InResultSet;
}

bool TdsResultCursor::NextRow(std::vector<RawCellValue> &row) {
	if (state_ != TdsCursorState::InResultSet) {
		return false;
	}

	while (true) {
		switch (NextToken()) {
		case ParsedTokenType::Row: {
			const auto &data = parser_.GetRow();
			row.clear();
			row.reserve(metadata_.size());
			rows_read_++;
			for (size_t i = 0; i < metadata_.size(); i++) {
				row.push_back(
				    tds::encoding::TypeConverter::ConvertValue(metadata_[i], data.values[i], data.null_mask[i]));
			}
			return true;
		}
		case ParsedTokenType::ColMetadata:
			// Next result set started without a DONE in between
			OnColMetadata();
			state_ = TdsCursorState::Between;
			pending_metadata_ = true;
			return false;
		case ParsedTokenType::Done:
			if (OnDone()) {
				state_ = TdsCursorState::Between;
				if (!errors_.empty()) {
					Drain();
				}
				return false;
			}
			break;
		case ParsedTokenType::Error:
			errors_.push_back(parser_.GetError());
			break;
		case ParsedTokenType::Info:
			SQLCSV_CURSOR_DEBUG_LOG(1, "server message %d: %s", parser_.GetInfo().number,
			                        parser_.GetInfo().message.c_str());
			break;
		case ParsedTokenType::None:
			return false;
		default:
			break;
		}
	}
}

bool TdsResultCursor::SeekResultSet() {
	while (true) {
		switch (NextToken()) {
		case ParsedTokenType::ColMetadata:
			OnColMetadata();
			return true;
		case ParsedTokenType::Done:
			OnDone();
			if (!errors_.empty()) {
				Drain();
				return false;
			}
			break;
		case ParsedTokenType::Error:
			errors_.push_back(parser_.GetError());
			break;
		case ParsedTokenType::Info:
			SQLCSV_CURSOR_DEBUG_LOG(1, "server message %d: %s", parser_.GetInfo().number,
			                        parser_.GetInfo().message.c_str());
			break;
		case ParsedTokenType::Row:
			throw duckdb::IOException("ROW token outside of a result set");
		case ParsedTokenType::None:
			return false;
		default:
			break;
		}
	}
}

bool TdsResultCursor::NextResultSet() {
	std::vector<RawCellValue> discard;
	while (state_ == TdsCursorState::InResultSet) {
		NextRow(discard);
	}
	if (pending_metadata_) {
		pending_metadata_ = false;
		state_ = TdsCursorState::InResultSet;
		return true;
	}
	if (state_ == TdsCursorState::Exhausted || !errors_.empty()) {
		return false;
	}
	return SeekResultSet();
}

void TdsResultCursor::Drain() {
	while (state_ != TdsCursorState::Exhausted) {
		ParsedTokenType token = NextToken();
		if (token == ParsedTokenType::Error) {
			errors_.push_back(parser_.GetError());
		}
	}
}

void TdsResultCursor::Cancel() {
	if (!connection_.SendAttention() || !connection_.WaitForAttentionAck()) {
		SQLCSV_CURSOR_DEBUG_LOG(1, "cancel not acknowledged: %s", connection_.GetLastError().c_str());
	}
	state_ = TdsCursorState::Exhausted;
}

void TdsResultCursor::Close() {
	if (closed_) {
		return;
	}
	closed_ = true;
	pending_metadata_ = false;
	Drain();
	if (!errors_.empty()) {
		auto errors = std::move(errors_);
		errors_.clear();
		throw ServerError(std::move(errors));
	}
}

//===----------------------------------------------------------------------===//
// TdsQueryConnection
//===----------------------------------------------------------------------===//

TdsQueryConnection::TdsQueryConnection(tds::BatchChannel &connection) : connection_(connection) {
}

std::unique_ptr<ResultCursor> TdsQueryConnection::ExecuteQuery(const std::string &sql, int timeout_seconds) {
	std::unique_ptr<TdsResultCursor> cursor(new TdsResultCursor(connection_, timeout_seconds));
	cursor->Start(sql);
	return std::move(cursor);
}

}  // namespace sqlcsv
