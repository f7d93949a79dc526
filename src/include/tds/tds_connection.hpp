#pragma once

#include "tds_batch_channel.hpp"
#include "tds_platform.hpp"
#include "tds_protocol.hpp"
#include "tds_socket.hpp"
#include "tds_types.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace sqlcsv {
namespace tds {

// A single authenticated TDS session.
//
// State machine:
//   Disconnected -> Authenticating (Connect) -> Idle (Authenticate)
//   Idle -> Executing (ExecuteBatch) -> Idle (FinishResponse)
//   Executing -> Cancelling (SendAttention) -> Idle (WaitForAttentionAck)
// Any I/O failure moves the connection to Disconnected.
class TdsConnection : public BatchChannel {
public:
	TdsConnection();
	~TdsConnection() override;

	TdsConnection(const TdsConnection &) = delete;
	TdsConnection &operator=(const TdsConnection &) = delete;

	// Open the TCP connection; stays in Authenticating until Authenticate()
	bool Connect(const std::string &host, uint16_t port, int timeout_seconds = DEFAULT_CONNECTION_TIMEOUT);

	// PRELOGIN (+ TLS when use_encrypt) followed by LOGIN7 with SQL authentication
	bool Authenticate(const std::string &username, const std::string &password, const std::string &database,
	                  const std::string &app_name, bool use_encrypt);

	bool IsAlive() const;

	// Run SELECT 1 and read the full response
	bool Ping(int timeout_ms = PING_TIMEOUT * 1000);

	void Close();

	bool ExecuteBatch(const std::string &sql) override;

	// Valid while Executing or Cancelling
	bool ReceivePacket(TdsPacket &packet, int timeout_ms) override;
	bool TimedOut() const override;

	void FinishResponse() override;

	bool SendAttention() override;
	// Drain the response until the ATTENTION acknowledgment arrives
	bool WaitForAttentionAck(int timeout_ms = CANCELLATION_TIMEOUT * 1000) override;

	ConnectionState GetState() const override {
		return state_.load(std::memory_order_acquire);
	}
	const std::string &GetLastError() const override {
		return last_error_;
	}
	bool IsTlsEnabled() const {
		return tls_enabled_;
	}
	uint32_t GetPacketSize() const {
		return negotiated_packet_size_;
	}

private:
	std::unique_ptr<TdsSocket> socket_;
	std::atomic<ConnectionState> state_;

	// Server name sent in LOGIN7
	std::string host_;
	std::string last_error_;

	uint8_t next_packet_id_;
	bool tls_enabled_;
	uint32_t negotiated_packet_size_;

	bool DoPrelogin(bool use_encrypt);
	bool DoLogin7(const LoginParams &params);
	void Fail(const std::string &message);
};

}  // namespace tds
}  // namespace sqlcsv
