#include "tds/tds_token_parser.hpp"
#include "tds/tds_row_reader.hpp"
#include "tds/encoding/utf16.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/common/string_util.hpp"
#include <cstdio>
#include <cstdlib>
#include <exception>

static int GetParserDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define TDS_PARSER_DEBUG(level, fmt, ...)                                   \
	do {                                                                    \
		if (GetParserDebugLevel() >= level) {                               \
			fprintf(stderr, "[SQLCSV PARSER] " fmt "\n", ##__VA_ARGS__);     \
		}                                                                   \
	} while (0)

namespace sqlcsv {
namespace tds {

// ENVCHANGE type carrying the negotiated packet size
static constexpr uint8_t ENVCHANGE_PACKET_SIZE = 4;

static uint16_t ReadUInt16(const uint8_t *data) {
	return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

static uint32_t ReadUInt32(const uint8_t *data) {
	return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
	       (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
}

std::string TdsError::ToString() const {
	return duckdb::StringUtil::Format(
	    "SQL Server error {Number: %d, State: %d, Class: %d, Message: \"%s\", Server: \"%s\", Procedure: \"%s\", "
	    "Line: %d}",
	    number, static_cast<int>(state), static_cast<int>(severity), message, server_name, proc_name, line_number);
}

TokenParser::TokenParser() : state_(ParserState::WaitingForToken), buffer_pos_(0), new_packet_size_(0) {
}

void TokenParser::Feed(const uint8_t *data, size_t length) {
	buffer_.insert(buffer_.end(), data, data + length);
}

void TokenParser::Feed(const std::vector<uint8_t> &data) {
	Feed(data.data(), data.size());
}

void TokenParser::ConsumeBytes(size_t count) {
	buffer_pos_ += count;
	if (buffer_pos_ > buffer_.size() / 2 && buffer_pos_ > 4096) {
		buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_pos_));
		buffer_pos_ = 0;
	}
}

void TokenParser::Fail(const std::string &message) {
	parse_error_ = message;
	state_ = ParserState::Error;
	TDS_PARSER_DEBUG(1, "parse error: %s", message.c_str());
}

ParsedTokenType TokenParser::TryParseNext() {
	while (state_ == ParserState::WaitingForToken || state_ == ParserState::Complete) {
		if (Available() < 1) {
			return ParsedTokenType::NeedMoreData;
		}

		uint8_t token_type = Current()[0];
		switch (static_cast<TokenType>(token_type)) {
		case TokenType::COLMETADATA:
			return ParseColMetadata() ? ParsedTokenType::ColMetadata : ParsedTokenType::NeedMoreData;
		case TokenType::ROW:
			return ParseRow(false) ? ParsedTokenType::Row : ParsedTokenType::NeedMoreData;
		case TokenType::NBCROW:
			return ParseRow(true) ? ParsedTokenType::Row : ParsedTokenType::NeedMoreData;
		case TokenType::DONE:
		case TokenType::DONEPROC:
		case TokenType::DONEINPROC:
			return ParseDone() ? ParsedTokenType::Done : ParsedTokenType::NeedMoreData;
		case TokenType::ERROR_TOKEN:
			return ParseMessage(current_error_) ? ParsedTokenType::Error : ParsedTokenType::NeedMoreData;
		case TokenType::INFO: {
			TdsError message;
			if (!ParseMessage(message)) {
				return ParsedTokenType::NeedMoreData;
			}
			current_info_.number = message.number;
			current_info_.state = message.state;
			current_info_.severity = message.severity;
			current_info_.message = std::move(message.message);
			current_info_.server_name = std::move(message.server_name);
			current_info_.proc_name = std::move(message.proc_name);
			current_info_.line_number = message.line_number;
			return ParsedTokenType::Info;
		}
		case TokenType::ENVCHANGE:
			return ParseEnvChange() ? ParsedTokenType::EnvChange : ParsedTokenType::NeedMoreData;
		case TokenType::ORDER:
		case TokenType::RETURNSTATUS:
		case TokenType::LOGINACK:
		case TokenType::TABNAME:
		case TokenType::COLINFO:
			if (!SkipLengthPrefixedToken()) {
				return ParsedTokenType::NeedMoreData;
			}
			continue;
		default:
			Fail(duckdb::StringUtil::Format("Unknown TDS token type 0x%02x", static_cast<int>(token_type)));
			return ParsedTokenType::None;
		}
	}
	return ParsedTokenType::None;
}

bool TokenParser::SkipLengthPrefixedToken() {
	if (Available() < 3) {
		return false;
	}
	// RETURNSTATUS is a fixed 4-byte value, the others carry a 2-byte length
	if (static_cast<TokenType>(Current()[0]) == TokenType::RETURNSTATUS) {
		if (Available() < 5) {
			return false;
		}
		ConsumeBytes(5);
		return true;
	}
	size_t token_length = ReadUInt16(Current() + 1);
	if (Available() < 3 + token_length) {
		return false;
	}
	ConsumeBytes(3 + token_length);
	return true;
}

bool TokenParser::ParseColMetadata() {
	size_t bytes_consumed = 0;
	try {
		if (!ColumnMetadataParser::Parse(Current() + 1, Available() - 1, bytes_consumed, columns_)) {
			return false;
		}
	} catch (const std::exception &e) {
		Fail("COLMETADATA parse error: " + duckdb::ErrorData(e).RawMessage());
		return false;
	}

	TDS_PARSER_DEBUG(2, "COLMETADATA: %zu columns", columns_.size());
	ConsumeBytes(1 + bytes_consumed);
	state_ = ParserState::WaitingForToken;
	return true;
}

bool TokenParser::ParseRow(bool null_bitmap_compressed) {
	if (columns_.empty()) {
		Fail("ROW token before COLMETADATA");
		return false;
	}

	RowReader reader(columns_);
	size_t bytes_consumed = 0;
	try {
		bool complete = null_bitmap_compressed
		                    ? reader.ReadNBCRow(Current() + 1, Available() - 1, bytes_consumed, current_row_)
		                    : reader.ReadRow(Current() + 1, Available() - 1, bytes_consumed, current_row_);
		if (!complete) {
			return false;
		}
	} catch (const std::exception &e) {
		Fail("ROW parse error: " + duckdb::ErrorData(e).RawMessage());
		return false;
	}

	ConsumeBytes(1 + bytes_consumed);
	return true;
}

bool TokenParser::ParseDone() {
	// type + status(2) + curCmd(2) + rowCount(8)
	if (Available() < 13) {
		return false;
	}

	const uint8_t *data = Current();
	current_done_.status = ReadUInt16(data + 1);
	current_done_.cur_cmd = ReadUInt16(data + 3);
	current_done_.row_count = static_cast<uint64_t>(ReadUInt32(data + 5)) |
	                          (static_cast<uint64_t>(ReadUInt32(data + 9)) << 32);
	ConsumeBytes(13);

	TDS_PARSER_DEBUG(2, "DONE: status=0x%04x rows=%llu", current_done_.status,
	                 static_cast<unsigned long long>(current_done_.row_count));
	state_ = current_done_.IsFinal() ? ParserState::Complete : ParserState::WaitingForToken;
	return true;
}

bool TokenParser::ParseMessage(TdsError &message) {
	// ERROR and INFO share a layout: length, number, state, class, text, server, proc, line
	if (Available() < 3) {
		return false;
	}
	const uint8_t *data = Current();
	size_t end = 3 + ReadUInt16(data + 1);
	if (Available() < end) {
		return false;
	}

	size_t offset = 3;
	if (offset + 6 > end) {
		Fail("Truncated ERROR/INFO token");
		return false;
	}
	message.number = ReadUInt32(data + offset);
	message.state = data[offset + 4];
	message.severity = data[offset + 5];
	offset += 6;

	if (!ReadUSVarchar(data, end, offset, message.message) || !ReadBVarchar(data, end, offset, message.server_name) ||
	    !ReadBVarchar(data, end, offset, message.proc_name) || offset + 4 > end) {
		Fail("Truncated ERROR/INFO token");
		return false;
	}
	message.line_number = ReadUInt32(data + offset);

	ConsumeBytes(end);
	return true;
}

bool TokenParser::ParseEnvChange() {
	if (Available() < 3) {
		return false;
	}
	const uint8_t *data = Current();
	size_t end = 3 + ReadUInt16(data + 1);
	if (Available() < end) {
		return false;
	}

	// Packet size: type, B_VARCHAR new value, B_VARCHAR old value
	if (end > 4 && data[3] == ENVCHANGE_PACKET_SIZE) {
		size_t offset = 4;
		std::string new_value;
		if (ReadBVarchar(data, end, offset, new_value)) {
			new_packet_size_ = static_cast<uint32_t>(std::strtoul(new_value.c_str(), nullptr, 10));
		}
	}

	ConsumeBytes(end);
	return true;
}

}  // namespace tds
}  // namespace sqlcsv
