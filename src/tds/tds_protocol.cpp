#include "tds/tds_protocol.hpp"
#include "tds/tds_token_parser.hpp"
#include "tds/encoding/utf16.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#ifdef _WIN32
#include <process.h>
#define GET_PID() _getpid()
#else
#include <unistd.h>
#define GET_PID() getpid()
#endif

static int GetProtocolDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLCSV_PROTO_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                \
		if (GetProtocolDebugLevel() >= lvl)                             \
			fprintf(stderr, "[SQLCSV PROTO] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlcsv {
namespace tds {

// LOGIN7 fixed header length
static constexpr uint16_t LOGIN7_HEADER_SIZE = 94;

// ALL_HEADERS with a single transaction descriptor header
static constexpr uint32_t ALL_HEADERS_LENGTH = 22;
static constexpr uint32_t TRANSACTION_HEADER_LENGTH = 18;
static constexpr uint16_t TRANSACTION_HEADER_TYPE = 0x0002;

TdsPacket TdsProtocol::BuildPrelogin(bool use_encrypt) {
	TdsPacket packet(PacketType::PRELOGIN);

	// Option table: VERSION(5) + ENCRYPTION(5) + TERMINATOR(1), then option data
	uint16_t data_offset = 11;

	packet.AppendByte(static_cast<uint8_t>(PreloginOption::VERSION));
	packet.AppendUInt16BE(data_offset);
	packet.AppendUInt16BE(6);

	packet.AppendByte(static_cast<uint8_t>(PreloginOption::ENCRYPTION));
	packet.AppendUInt16BE(data_offset + 6);
	packet.AppendUInt16BE(1);

	packet.AppendByte(static_cast<uint8_t>(PreloginOption::TERMINATOR));

	// UL_VERSION + US_SUBBUILD
	packet.AppendByte(15);
	packet.AppendByte(0);
	packet.AppendUInt16BE(0);
	packet.AppendUInt16BE(0);

	packet.AppendByte(static_cast<uint8_t>(use_encrypt ? EncryptionOption::ENCRYPT_ON
	                                                   : EncryptionOption::ENCRYPT_NOT_SUP));
	return packet;
}

PreloginResponse TdsProtocol::ParsePreloginResponse(const std::vector<uint8_t> &data) {
	PreloginResponse response;
	if (data.empty()) {
		response.error_message = "Empty PRELOGIN response";
		return response;
	}

	size_t pos = 0;
	while (pos < data.size()) {
		uint8_t option = data[pos];
		if (option == static_cast<uint8_t>(PreloginOption::TERMINATOR)) {
			response.success = true;
			break;
		}
		if (pos + 5 > data.size()) {
			response.error_message = "Truncated PRELOGIN response";
			return response;
		}

		size_t offset = (data[pos + 1] << 8) | data[pos + 2];
		size_t length = (data[pos + 3] << 8) | data[pos + 4];
		if (offset + length > data.size()) {
			response.error_message = "PRELOGIN option points past the end of the response";
			return response;
		}

		if (option == static_cast<uint8_t>(PreloginOption::VERSION) && length >= 6) {
			response.version_major = data[offset];
			response.version_minor = data[offset + 1];
			response.version_build = static_cast<uint16_t>((data[offset + 2] << 8) | data[offset + 3]);
		} else if (option == static_cast<uint8_t>(PreloginOption::ENCRYPTION) && length >= 1) {
			response.encryption = static_cast<EncryptionOption>(data[offset]);
		}
		pos += 5;
	}

	if (!response.success && response.error_message.empty()) {
		response.error_message = "PRELOGIN response has no terminator";
	}
	return response;
}

std::vector<uint8_t> TdsProtocol::EncodePassword(const std::string &password) {
	std::vector<uint8_t> encoded = encoding::Utf16LEEncode(password);
	for (auto &byte : encoded) {
		byte = static_cast<uint8_t>(((byte << 4) & 0xF0) | ((byte >> 4) & 0x0F));
		byte ^= 0xA5;
	}
	return encoded;
}

TdsPacket TdsProtocol::BuildLogin7(const LoginParams &params) {
	// Variable-length fields, in offset-table order. Empty entries are unused.
	std::vector<uint8_t> host = encoding::Utf16LEEncode(params.client_hostname);
	std::vector<uint8_t> user = encoding::Utf16LEEncode(params.username);
	std::vector<uint8_t> password = EncodePassword(params.password);
	std::vector<uint8_t> app = encoding::Utf16LEEncode(params.app_name);
	std::vector<uint8_t> server = encoding::Utf16LEEncode(params.server_name);
	std::vector<uint8_t> database = encoding::Utf16LEEncode(params.database);
	std::vector<uint8_t> none;

	// HostName, UserName, Password, AppName, ServerName, Extension, CltIntName, Language, Database
	const std::vector<uint8_t> *fields[] = {&host, &user, &password, &app, &server, &none, &none, &none, &database};

	uint32_t total_length = LOGIN7_HEADER_SIZE;
	for (auto field : fields) {
		total_length += static_cast<uint32_t>(field->size());
	}

	TdsPacket packet(PacketType::LOGIN7);
	packet.AppendUInt32LE(total_length);
	packet.AppendUInt32LE(TDS_VERSION_7_4);
	packet.AppendUInt32LE(params.packet_size);
	packet.AppendUInt32LE(0x00000001);  // ClientProgVer
	packet.AppendUInt32LE(static_cast<uint32_t>(GET_PID()));
	packet.AppendUInt32LE(0);           // ConnectionID
	packet.AppendByte(0x20 | 0x80);     // OptionFlags1: USE_DB | SET_LANG
	packet.AppendByte(0x02);            // OptionFlags2: ODBC (ANSI session defaults)
	packet.AppendByte(0x00);            // TypeFlags
	packet.AppendByte(0x00);            // OptionFlags3
	packet.AppendUInt32LE(0);           // ClientTimeZone
	packet.AppendUInt32LE(0x0409);      // ClientLCID

	// Offset/length table; lengths are in characters
	uint16_t offset = LOGIN7_HEADER_SIZE;
	for (auto field : fields) {
		packet.AppendUInt16LE(offset);
		packet.AppendUInt16LE(static_cast<uint16_t>(field->size() / 2));
		offset = static_cast<uint16_t>(offset + field->size());
	}
	for (int i = 0; i < 6; i++) {
		packet.AppendByte(0);  // ClientID
	}
	// SSPI, AtchDBFile, ChangePassword
	for (int i = 0; i < 3; i++) {
		packet.AppendUInt16LE(offset);
		packet.AppendUInt16LE(0);
	}
	packet.AppendUInt32LE(0);  // cbSSPILong

	for (auto field : fields) {
		packet.AppendPayload(*field);
	}
	return packet;
}

LoginResponse TdsProtocol::ParseLoginResponse(const std::vector<uint8_t> &data) {
	LoginResponse response;
	if (data.empty()) {
		response.error_message = "Empty LOGIN response";
		return response;
	}

	TokenParser parser;
	parser.Feed(data);

	bool done_error = false;
	while (!parser.IsComplete()) {
		ParsedTokenType token = parser.TryParseNext();
		if (token == ParsedTokenType::Error) {
			response.errors.push_back(parser.GetError());
		} else if (token == ParsedTokenType::EnvChange) {
			if (parser.GetNewPacketSize() != 0) {
				response.negotiated_packet_size = parser.GetNewPacketSize();
			}
		} else if (token == ParsedTokenType::Done) {
			done_error = done_error || parser.GetDone().HasError();
		} else if (token == ParsedTokenType::NeedMoreData || token == ParsedTokenType::None) {
			break;
		}
	}

	if (parser.HasError()) {
		response.error_message = parser.GetParseError();
	} else if (!response.errors.empty()) {
		response.error_message = response.errors.front().message;
	} else if (done_error || !parser.IsComplete()) {
		response.error_message = "Login failed without an error message";
	} else {
		response.success = true;
	}

	SQLCSV_PROTO_DEBUG_LOG(1, "LOGIN response: success=%d packet_size=%u", response.success ? 1 : 0,
	                       response.negotiated_packet_size);
	return response;
}

std::vector<TdsPacket> TdsProtocol::BuildSqlBatch(const std::string &sql, size_t max_packet_size) {
	TdsPacket message(PacketType::SQL_BATCH);
	message.AppendUInt32LE(ALL_HEADERS_LENGTH);
	message.AppendUInt32LE(TRANSACTION_HEADER_LENGTH);
	message.AppendUInt16LE(TRANSACTION_HEADER_TYPE);
	for (int i = 0; i < 8; i++) {
		message.AppendByte(0);  // no active transaction
	}
	message.AppendUInt32LE(1);  // outstanding request count
	message.AppendUTF16LE(sql);

	auto &payload = message.GetPayload();
	size_t max_payload = max_packet_size - TDS_HEADER_SIZE;

	std::vector<TdsPacket> packets;
	size_t offset = 0;
	while (offset < payload.size()) {
		size_t chunk_size = std::min(max_payload, payload.size() - offset);
		bool is_last = offset + chunk_size >= payload.size();

		TdsPacket packet(PacketType::SQL_BATCH, is_last ? PacketStatus::END_OF_MESSAGE : PacketStatus::NORMAL);
		packet.AppendPayload(payload.data() + offset, chunk_size);
		packets.push_back(std::move(packet));
		offset += chunk_size;
	}

	SQLCSV_PROTO_DEBUG_LOG(2, "SQL_BATCH: %zu payload bytes in %zu packets", payload.size(), packets.size());
	return packets;
}

TdsPacket TdsProtocol::BuildAttention() {
	return TdsPacket(PacketType::ATTENTION);
}

bool TdsProtocol::IsAttentionAck(const std::vector<uint8_t> &message) {
	// DONE: token(1) + status(2) + curcmd(2) + rowcount(8)
	static constexpr size_t DONE_TOKEN_SIZE = 13;
	if (message.size() < DONE_TOKEN_SIZE) {
		return false;
	}
	const uint8_t *done = message.data() + message.size() - DONE_TOKEN_SIZE;
	if (done[0] != static_cast<uint8_t>(TokenType::DONE)) {
		return false;
	}
	uint16_t status = static_cast<uint16_t>(done[1] | (done[2] << 8));
	return (status & static_cast<uint16_t>(DoneStatus::DONE_ATTN)) != 0;
}

}  // namespace tds
}  // namespace sqlcsv
