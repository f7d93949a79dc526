#pragma once

#include "tds_types.hpp"
#include "tds_column_metadata.hpp"
#include "tds_message.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlcsv {
namespace tds {

//===----------------------------------------------------------------------===//
// DoneToken - DONE/DONEPROC/DONEINPROC
//===----------------------------------------------------------------------===//

struct DoneToken {
	uint16_t status = 0;
	uint16_t cur_cmd = 0;
	uint64_t row_count = 0;

	bool IsFinal() const {
		return (status & static_cast<uint16_t>(DoneStatus::DONE_MORE)) == 0;
	}
	bool HasError() const {
		return (status & static_cast<uint16_t>(DoneStatus::DONE_ERROR)) != 0;
	}
	bool HasRowCount() const {
		return (status & static_cast<uint16_t>(DoneStatus::DONE_COUNT)) != 0;
	}
	bool IsAttentionAck() const {
		return (status & static_cast<uint16_t>(DoneStatus::DONE_ATTN)) != 0;
	}
};

//===----------------------------------------------------------------------===//
// RowData - raw values of one ROW/NBCROW token
//===----------------------------------------------------------------------===//

struct RowData {
	std::vector<std::vector<uint8_t>> values;
	std::vector<bool> null_mask;

	// Size for num_columns and clear, keeping allocated capacity
	void Prepare(size_t num_columns) {
		values.resize(num_columns);
		null_mask.assign(num_columns, false);
		for (auto &value : values) {
			value.clear();
		}
	}
};

//===----------------------------------------------------------------------===//
// TokenParser - incremental parser for a TDS token stream
//===----------------------------------------------------------------------===//

enum class ParserState : uint8_t {
	WaitingForToken,  // Between tokens
	Complete,         // Final DONE received
	Error             // Malformed stream
};

enum class ParsedTokenType : uint8_t {
	None,
	ColMetadata,   // GetColumnMetadata() is valid
	Row,           // GetRow() is valid
	Done,          // GetDone() is valid
	Error,         // GetError() is valid
	Info,          // GetInfo() is valid
	EnvChange,     // Consumed, packet size change exposed via GetNewPacketSize()
	NeedMoreData   // Token incomplete; Feed() more bytes
};

class TokenParser {
public:
	TokenParser();

	void Feed(const uint8_t *data, size_t length);
	void Feed(const std::vector<uint8_t> &data);

	// Parse the next complete token from the buffer
	ParsedTokenType TryParseNext();

	const std::vector<ColumnMetadata> &GetColumnMetadata() const {
		return columns_;
	}
	const RowData &GetRow() const {
		return current_row_;
	}
	const TdsError &GetError() const {
		return current_error_;
	}
	const TdsInfo &GetInfo() const {
		return current_info_;
	}
	const DoneToken &GetDone() const {
		return current_done_;
	}
	// Negotiated packet size from the last packet-size ENVCHANGE, 0 if none
	uint32_t GetNewPacketSize() const {
		return new_packet_size_;
	}

	bool IsComplete() const {
		return state_ == ParserState::Complete;
	}
	bool HasError() const {
		return state_ == ParserState::Error;
	}
	const std::string &GetParseError() const {
		return parse_error_;
	}

private:
	bool ParseColMetadata();
	bool ParseRow(bool null_bitmap_compressed);
	bool ParseDone();
	bool ParseMessage(TdsError &message);
	bool ParseEnvChange();
	bool SkipLengthPrefixedToken();

	void Fail(const std::string &message);

	void ConsumeBytes(size_t count);
	size_t Available() const {
		return buffer_.size() - buffer_pos_;
	}
	const uint8_t *Current() const {
		return buffer_.data() + buffer_pos_;
	}

	ParserState state_;
	std::string parse_error_;

	std::vector<uint8_t> buffer_;
	size_t buffer_pos_;

	std::vector<ColumnMetadata> columns_;
	RowData current_row_;
	TdsError current_error_;
	TdsInfo current_info_;
	DoneToken current_done_;
	uint32_t new_packet_size_;
};

}  // namespace tds
}  // namespace sqlcsv
