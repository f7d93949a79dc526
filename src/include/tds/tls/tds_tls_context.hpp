//===----------------------------------------------------------------------===//
//                         sqlcsv
//
// tds_tls_context.hpp
//
// mbedTLS client session for encrypted TDS connections
//===----------------------------------------------------------------------===//

#pragma once

#include "tds/tds_platform.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace sqlcsv {
namespace tds {

// I/O callbacks used while the handshake is wrapped in PRELOGIN packets.
// Return: bytes transferred, -1 on error, 0 on would-block/timeout
using TlsSendCallback = std::function<int(const uint8_t *data, size_t len)>;
using TlsRecvCallback = std::function<int(uint8_t *buf, size_t len, int timeout_ms)>;

enum class TlsErrorCode {
	NONE = 0,
	INIT_FAILED,
	HANDSHAKE_FAILED,
	HANDSHAKE_TIMEOUT,
	SEND_FAILED,
	RECV_FAILED,
	NOT_INITIALIZED,
	PEER_CLOSED
};

const char *TlsErrorCodeToString(TlsErrorCode code);

struct TlsTdsContextImpl;

// TLS state for a single connection. The server certificate is not verified.
class TlsTdsContext {
public:
	TlsTdsContext();
	~TlsTdsContext();

	TlsTdsContext(const TlsTdsContext &) = delete;
	TlsTdsContext &operator=(const TlsTdsContext &) = delete;

	// Seed the RNG and build a TLS 1.2 client configuration
	bool Initialize();

	// Attach to a connected socket; hostname is used for SNI when non-empty
	bool WrapSocket(int socket_fd, const std::string &hostname = "");

	// Route handshake records through custom callbacks instead of the socket
	void SetBioCallbacks(TlsSendCallback send_cb, TlsRecvCallback recv_cb);
	void ClearBioCallbacks();

	bool Handshake(int timeout_ms = 30000);

	// Returns bytes sent, or -1 on error
	ssize_t Send(const uint8_t *data, size_t length);

	// Returns bytes received, 0 on timeout or peer close, -1 on error
	ssize_t Receive(uint8_t *buffer, size_t max_length, int timeout_ms = 0);

	// Send close_notify and release the session
	void Close();

	bool IsInitialized() const;
	bool IsPeerClosed() const;
	const std::string &GetLastError() const;
	TlsErrorCode GetLastErrorCode() const;
	std::string GetCipherSuite() const;
	std::string GetTlsVersion() const;

private:
	std::unique_ptr<TlsTdsContextImpl> impl_;
};

}  // namespace tds
}  // namespace sqlcsv
