#include "tds/tds_connection.hpp"
#include "tds/tds_token_parser.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <unistd.h>
#endif

static int GetConnectionDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLCSV_CONN_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                               \
		if (GetConnectionDebugLevel() >= lvl)                          \
			fprintf(stderr, "[SQLCSV CONN] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlcsv {
namespace tds {

const char *ConnectionStateToString(ConnectionState state) {
	switch (state) {
	case ConnectionState::Disconnected:
		return "Disconnected";
	case ConnectionState::Authenticating:
		return "Authenticating";
	case ConnectionState::Idle:
		return "Idle";
	case ConnectionState::Executing:
		return "Executing";
	case ConnectionState::Cancelling:
		return "Cancelling";
	default:
		return "Unknown";
	}
}

static std::string LocalHostName() {
	char buffer[256];
	if (gethostname(buffer, sizeof(buffer)) != 0) {
		return "localhost";
	}
	buffer[sizeof(buffer) - 1] = '\0';
	return buffer;
}

TdsConnection::TdsConnection()
    : socket_(new TdsSocket()), state_(ConnectionState::Disconnected), next_packet_id_(1),
      tls_enabled_(false), negotiated_packet_size_(TDS_DEFAULT_PACKET_SIZE) {
}

TdsConnection::~TdsConnection() {
	Close();
}

void TdsConnection::Fail(const std::string &message) {
	last_error_ = message;
	socket_->Close();
	state_.store(ConnectionState::Disconnected);
}

bool TdsConnection::Connect(const std::string &host, uint16_t port, int timeout_seconds) {
	ConnectionState expected = ConnectionState::Disconnected;
	if (!state_.compare_exchange_strong(expected, ConnectionState::Authenticating)) {
		last_error_ = "Invalid state for Connect: " + std::string(ConnectionStateToString(expected));
		return false;
	}

	host_ = host;
	last_error_.clear();

	if (!socket_->Connect(host, port, timeout_seconds)) {
		last_error_ = socket_->GetLastError();
		state_.store(ConnectionState::Disconnected);
		return false;
	}
	return true;
}

bool TdsConnection::Authenticate(const std::string &username, const std::string &password,
                                 const std::string &database, const std::string &app_name, bool use_encrypt) {
	if (state_.load() != ConnectionState::Authenticating) {
		last_error_ = "Cannot authenticate: not in Authenticating state";
		return false;
	}

	if (!DoPrelogin(use_encrypt)) {
		Fail(last_error_);
		return false;
	}

	LoginParams params;
	params.client_hostname = LocalHostName();
	params.username = username;
	params.password = password;
	params.server_name = host_;
	params.database = database;
	params.app_name = app_name;
	if (!DoLogin7(params)) {
		Fail(last_error_);
		return false;
	}

	state_.store(ConnectionState::Idle);
	return true;
}

bool TdsConnection::DoPrelogin(bool use_encrypt) {
	TdsPacket prelogin = TdsProtocol::BuildPrelogin(use_encrypt);
	prelogin.SetPacketId(next_packet_id_++);

	if (!socket_->SendPacket(prelogin)) {
		last_error_ = "Failed to send PRELOGIN: " + socket_->GetLastError();
		return false;
	}

	std::vector<uint8_t> response;
	if (!socket_->ReceiveMessage(response, DEFAULT_CONNECTION_TIMEOUT * 1000)) {
		last_error_ = "Failed to receive PRELOGIN response: " + socket_->GetLastError();
		return false;
	}

	PreloginResponse prelogin_response = TdsProtocol::ParsePreloginResponse(response);
	if (!prelogin_response.success) {
		last_error_ = "PRELOGIN failed: " + prelogin_response.error_message;
		return false;
	}
	SQLCSV_CONN_DEBUG_LOG(1, "DoPrelogin: server version=%d.%d.%d, encryption=%d", prelogin_response.version_major,
	                      prelogin_response.version_minor, prelogin_response.version_build,
	                      static_cast<int>(prelogin_response.encryption));

	if (use_encrypt) {
		if (prelogin_response.encryption == EncryptionOption::ENCRYPT_NOT_SUP ||
		    prelogin_response.encryption == EncryptionOption::ENCRYPT_OFF) {
			last_error_ = "Encryption requested but the server does not support it";
			return false;
		}
		if (!socket_->EnableTls(next_packet_id_, DEFAULT_CONNECTION_TIMEOUT * 1000)) {
			last_error_ = socket_->GetLastError();
			return false;
		}
		tls_enabled_ = true;
	} else {
		// Login-only encryption is not supported
		if (prelogin_response.encryption == EncryptionOption::ENCRYPT_REQ ||
		    prelogin_response.encryption == EncryptionOption::ENCRYPT_ON) {
			last_error_ = "Server requires encryption; enable it in the connection string";
			return false;
		}
		tls_enabled_ = false;
	}
	return true;
}

bool TdsConnection::DoLogin7(const LoginParams &params) {
	SQLCSV_CONN_DEBUG_LOG(1, "DoLogin7: user='%s', db='%s'", params.username.c_str(), params.database.c_str());

	TdsPacket login = TdsProtocol::BuildLogin7(params);
	login.SetPacketId(next_packet_id_++);

	if (!socket_->SendPacket(login)) {
		last_error_ = "Failed to send LOGIN7: " + socket_->GetLastError();
		return false;
	}

	std::vector<uint8_t> response;
	if (!socket_->ReceiveMessage(response, DEFAULT_CONNECTION_TIMEOUT * 1000)) {
		last_error_ = "Failed to receive LOGIN7 response: " + socket_->GetLastError();
		return false;
	}

	LoginResponse login_response = TdsProtocol::ParseLoginResponse(response);
	if (!login_response.success) {
		if (!login_response.errors.empty()) {
			last_error_ = "Login failed: " + login_response.errors.front().ToString();
		} else {
			last_error_ = "Login failed: " + login_response.error_message;
		}
		return false;
	}

	negotiated_packet_size_ = login_response.negotiated_packet_size;
	SQLCSV_CONN_DEBUG_LOG(1, "DoLogin7: authenticated, packet_size=%u", negotiated_packet_size_);
	return true;
}

bool TdsConnection::IsAlive() const {
	return state_.load(std::memory_order_acquire) != ConnectionState::Disconnected && socket_->IsConnected();
}

bool TdsConnection::Ping(int timeout_ms) {
	if (!ExecuteBatch("SELECT 1")) {
		return false;
	}

	std::vector<uint8_t> response;
	if (!socket_->ReceiveMessage(response, timeout_ms)) {
		Fail("Ping failed: " + socket_->GetLastError());
		return false;
	}

	TokenParser parser;
	parser.Feed(response);
	std::string error;
	while (!parser.IsComplete()) {
		ParsedTokenType token = parser.TryParseNext();
		if (token == ParsedTokenType::Error && error.empty()) {
			error = parser.GetError().ToString();
		} else if (token == ParsedTokenType::NeedMoreData || token == ParsedTokenType::None) {
			break;
		}
	}
	if (parser.HasError()) {
		Fail("Ping failed: " + parser.GetParseError());
		return false;
	}
	if (!parser.IsComplete()) {
		Fail("Ping failed: incomplete response");
		return false;
	}

	FinishResponse();
	if (!error.empty()) {
		last_error_ = "Ping failed: " + error;
		return false;
	}
	return true;
}

void TdsConnection::Close() {
	ConnectionState current = state_.load();
	if (current == ConnectionState::Disconnected) {
		return;
	}
	if (current == ConnectionState::Executing) {
		if (SendAttention()) {
			WaitForAttentionAck(CANCELLATION_TIMEOUT * 1000);
		}
	}
	socket_->Close();
	state_.store(ConnectionState::Disconnected);
}

bool TdsConnection::ExecuteBatch(const std::string &sql) {
	ConnectionState expected = ConnectionState::Idle;
	if (!state_.compare_exchange_strong(expected, ConnectionState::Executing)) {
		last_error_ = "Cannot execute: connection not in Idle state (current: " +
		              std::string(ConnectionStateToString(expected)) + ")";
		return false;
	}

	std::vector<TdsPacket> packets = TdsProtocol::BuildSqlBatch(sql, negotiated_packet_size_);
	SQLCSV_CONN_DEBUG_LOG(1, "ExecuteBatch: sql_size=%zu, packet_count=%zu", sql.size(), packets.size());

	uint8_t packet_id = 1;
	for (size_t i = 0; i < packets.size(); i++) {
		packets[i].SetPacketId(packet_id++);
		if (!socket_->SendPacket(packets[i])) {
			Fail("Failed to send SQL_BATCH packet " + std::to_string(i + 1) + "/" + std::to_string(packets.size()) +
			     ": " + socket_->GetLastError());
			return false;
		}
	}
	return true;
}

bool TdsConnection::ReceivePacket(TdsPacket &packet, int timeout_ms) {
	ConnectionState current = state_.load();
	if (current != ConnectionState::Executing && current != ConnectionState::Cancelling) {
		last_error_ = "Cannot receive: connection not in Executing or Cancelling state";
		return false;
	}

	if (!socket_->ReceivePacket(packet, timeout_ms)) {
		last_error_ = socket_->GetLastError();
		if (!socket_->TimedOut()) {
			Fail("Receive error: " + last_error_);
		}
		return false;
	}
	return true;
}

bool TdsConnection::TimedOut() const {
	return socket_->TimedOut();
}

void TdsConnection::FinishResponse() {
	ConnectionState expected = ConnectionState::Executing;
	state_.compare_exchange_strong(expected, ConnectionState::Idle);
}

bool TdsConnection::SendAttention() {
	ConnectionState expected = ConnectionState::Executing;
	if (!state_.compare_exchange_strong(expected, ConnectionState::Cancelling)) {
		return false;
	}

	TdsPacket attention = TdsProtocol::BuildAttention();
	attention.SetPacketId(1);
	if (!socket_->SendPacket(attention)) {
		Fail("Failed to send ATTENTION: " + socket_->GetLastError());
		return false;
	}
	SQLCSV_CONN_DEBUG_LOG(1, "SendAttention: sent");
	return true;
}

bool TdsConnection::WaitForAttentionAck(int timeout_ms) {
	if (state_.load() != ConnectionState::Cancelling) {
		return false;
	}

	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
	std::vector<uint8_t> message;
	while (true) {
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
		                     .count();
		if (remaining <= 0) {
			Fail("ATTENTION acknowledgment timeout");
			return false;
		}

		TdsPacket packet;
		if (!socket_->ReceivePacket(packet, static_cast<int>(remaining))) {
			Fail("ATTENTION acknowledgment failed: " + socket_->GetLastError());
			return false;
		}
		const auto &payload = packet.GetPayload();
		message.insert(message.end(), payload.begin(), payload.end());
		if (!packet.IsEndOfMessage()) {
			continue;
		}
		if (TdsProtocol::IsAttentionAck(message)) {
			SQLCSV_CONN_DEBUG_LOG(1, "WaitForAttentionAck: acknowledged");
			state_.store(ConnectionState::Idle);
			return true;
		}
		message.clear();
	}
}

}  // namespace tds
}  // namespace sqlcsv
