#pragma once

#include "tds_message.hpp"
#include "tds_packet.hpp"
#include "tds_types.hpp"
#include <string>
#include <vector>

namespace sqlcsv {
namespace tds {

// PRELOGIN response data
struct PreloginResponse {
	bool success = false;
	uint8_t version_major = 0;
	uint8_t version_minor = 0;
	uint16_t version_build = 0;
	EncryptionOption encryption = EncryptionOption::ENCRYPT_NOT_SUP;
	std::string error_message;
};

// Fields of a LOGIN7 request with SQL Server authentication
struct LoginParams {
	std::string client_hostname;
	std::string username;
	std::string password;
	std::string server_name;
	std::string database;
	std::string app_name;
	uint32_t packet_size = TDS_DEFAULT_PACKET_SIZE;
};

// LOGIN7 response data
struct LoginResponse {
	bool success = false;
	uint32_t negotiated_packet_size = TDS_DEFAULT_PACKET_SIZE;
	std::vector<TdsError> errors;
	std::string error_message;
};

// TDS message builders and parsers for the login handshake and SQL batches
class TdsProtocol {
public:
	// use_encrypt selects ENCRYPT_ON, otherwise ENCRYPT_NOT_SUP is announced
	static TdsPacket BuildPrelogin(bool use_encrypt);
	static PreloginResponse ParsePreloginResponse(const std::vector<uint8_t> &data);

	static TdsPacket BuildLogin7(const LoginParams &params);
	static LoginResponse ParseLoginResponse(const std::vector<uint8_t> &data);

	// SQL_BATCH message: ALL_HEADERS + UTF-16LE text, split to fit max_packet_size.
	// Only the last packet carries END_OF_MESSAGE.
	static std::vector<TdsPacket> BuildSqlBatch(const std::string &sql, size_t max_packet_size);

	// Header-only ATTENTION packet
	static TdsPacket BuildAttention();

	// True when the message ends with a DONE token carrying DONE_ATTN
	static bool IsAttentionAck(const std::vector<uint8_t> &message);

	// Password obfuscation: nibble swap then XOR 0xA5 over the UTF-16LE bytes
	static std::vector<uint8_t> EncodePassword(const std::string &password);
};

}  // namespace tds
}  // namespace sqlcsv
