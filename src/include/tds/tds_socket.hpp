#pragma once

#include "tds_packet.hpp"
#include "tds_platform.hpp"
#include "tds_types.hpp"
#include "tds/tls/tds_tls_context.hpp"
#include <memory>
#include <string>

namespace sqlcsv {
namespace tds {

// TCP socket carrying TDS packets, optionally through TLS.
// Failures return false/-1 with the reason in GetLastError().
class TdsSocket {
public:
	TdsSocket();
	~TdsSocket();

	TdsSocket(const TdsSocket &) = delete;
	TdsSocket &operator=(const TdsSocket &) = delete;

	bool Connect(const std::string &host, uint16_t port, int timeout_seconds);
	void Close();
	bool IsConnected() const;

	// Run the TLS handshake inside PRELOGIN packets. packet_id continues the
	// PRELOGIN packet sequence. After success all traffic is encrypted.
	bool EnableTls(uint8_t &packet_id, int timeout_ms);
	bool IsTlsEnabled() const;

	bool Send(const uint8_t *data, size_t length);
	bool Send(const std::vector<uint8_t> &data);
	bool SendPacket(const TdsPacket &packet);

	// Returns bytes received, 0 on timeout, -1 on error
	ssize_t Receive(uint8_t *buffer, size_t max_length, int timeout_ms);

	// Returns false on timeout or error; TimedOut() tells which
	bool ReceivePacket(TdsPacket &packet, int timeout_ms);

	// Concatenated payload of all packets up to END_OF_MESSAGE
	bool ReceiveMessage(std::vector<uint8_t> &message, int timeout_ms);

	bool TimedOut() const {
		return timed_out_;
	}
	const std::string &GetLastError() const {
		return last_error_;
	}

private:
	int fd_;
	// Server name for TLS
	std::string host_;
	bool connected_;
	bool timed_out_;
	std::string last_error_;

	std::unique_ptr<TlsTdsContext> tls_context_;
	std::vector<uint8_t> receive_buffer_;

	bool SetNonBlocking(bool enable);
	// Returns false on timeout (timed_out_ set) or socket error
	bool WaitForReady(bool for_write, int timeout_ms);
	bool SendRaw(const uint8_t *data, size_t length);
	bool ReceiveRaw(uint8_t *buffer, size_t length, int timeout_ms);
};

}  // namespace tds
}  // namespace sqlcsv
