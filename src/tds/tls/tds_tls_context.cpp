//===----------------------------------------------------------------------===//
//                         sqlcsv
//
// tds_tls_context.cpp
//
// mbedTLS client session. During the TDS handshake the TLS records travel
// inside PRELOGIN packets, so the BIO layer can be redirected to callbacks.
//===----------------------------------------------------------------------===//

#include "tds/tls/tds_tls_context.hpp"

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/debug.h>
#include <mbedtls/entropy.h>
#include <mbedtls/error.h>
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

static int GetTlsDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLCSV_TLS_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                              \
		if (GetTlsDebugLevel() >= lvl)                                \
			fprintf(stderr, "[SQLCSV TLS] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlcsv {
namespace tds {

const char *TlsErrorCodeToString(TlsErrorCode code) {
	switch (code) {
	case TlsErrorCode::NONE:
		return "No error";
	case TlsErrorCode::INIT_FAILED:
		return "TLS initialization failed";
	case TlsErrorCode::HANDSHAKE_FAILED:
		return "TLS handshake failed";
	case TlsErrorCode::HANDSHAKE_TIMEOUT:
		return "TLS handshake timed out";
	case TlsErrorCode::SEND_FAILED:
		return "TLS send failed";
	case TlsErrorCode::RECV_FAILED:
		return "TLS receive failed";
	case TlsErrorCode::NOT_INITIALIZED:
		return "TLS not initialized";
	case TlsErrorCode::PEER_CLOSED:
		return "Server closed TLS connection";
	default:
		return "Unknown TLS error";
	}
}

struct TlsTdsContextImpl {
	mbedtls_ssl_context ssl;
	mbedtls_ssl_config conf;
	mbedtls_ctr_drbg_context ctr_drbg;
	mbedtls_entropy_context entropy;

	bool initialized = false;
	bool handshake_complete = false;
	bool peer_closed = false;
	int socket_fd = -1;
	std::string last_error;
	TlsErrorCode last_error_code = TlsErrorCode::NONE;

	TlsSendCallback send_callback;
	TlsRecvCallback recv_callback;

	TlsTdsContextImpl() {
		Init();
	}
	~TlsTdsContextImpl() {
		Free();
	}

	void Init() {
		mbedtls_ssl_init(&ssl);
		mbedtls_ssl_config_init(&conf);
		mbedtls_ctr_drbg_init(&ctr_drbg);
		mbedtls_entropy_init(&entropy);
	}
	void Free() {
		mbedtls_ssl_free(&ssl);
		mbedtls_ssl_config_free(&conf);
		mbedtls_ctr_drbg_free(&ctr_drbg);
		mbedtls_entropy_free(&entropy);
	}
	void SetError(TlsErrorCode code, std::string message) {
		last_error_code = code;
		last_error = std::move(message);
	}
};

static std::string FormatMbedTlsError(int ret) {
	char buf[256];
	mbedtls_strerror(ret, buf, sizeof(buf));
	return std::string(buf);
}

static void MbedTlsDebugCallback(void *, int level, const char *file, int line, const char *str) {
	std::string message(str);
	if (!message.empty() && message.back() == '\n') {
		message.pop_back();
	}
	SQLCSV_TLS_DEBUG_LOG(level + 1, "[mbedTLS %d] %s:%04d: %s", level, file, line, message.c_str());
}

static int BioSend(void *ctx, const unsigned char *buf, size_t len) {
	auto *impl = static_cast<TlsTdsContextImpl *>(ctx);

	if (impl->send_callback) {
		int ret = impl->send_callback(reinterpret_cast<const uint8_t *>(buf), len);
		if (ret < 0) {
			return MBEDTLS_ERR_NET_SEND_FAILED;
		}
		return ret == 0 ? MBEDTLS_ERR_SSL_WANT_WRITE : ret;
	}

#ifdef _WIN32
	int ret = send(impl->socket_fd, reinterpret_cast<const char *>(buf), static_cast<int>(len), 0);
	if (ret < 0) {
		return WSAGetLastError() == WSAEWOULDBLOCK ? MBEDTLS_ERR_SSL_WANT_WRITE : MBEDTLS_ERR_NET_SEND_FAILED;
	}
#else
	ssize_t ret = send(impl->socket_fd, buf, len, MSG_NOSIGNAL);
	if (ret < 0) {
		if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
			return MBEDTLS_ERR_SSL_WANT_WRITE;
		}
		return MBEDTLS_ERR_NET_SEND_FAILED;
	}
#endif
	return static_cast<int>(ret);
}

static int BioRecv(void *ctx, unsigned char *buf, size_t len) {
	auto *impl = static_cast<TlsTdsContextImpl *>(ctx);

	if (impl->recv_callback) {
		int ret = impl->recv_callback(reinterpret_cast<uint8_t *>(buf), len, 0);
		if (ret < 0) {
			return MBEDTLS_ERR_NET_RECV_FAILED;
		}
		return ret == 0 ? MBEDTLS_ERR_SSL_WANT_READ : ret;
	}

#ifdef _WIN32
	int ret = recv(impl->socket_fd, reinterpret_cast<char *>(buf), static_cast<int>(len), 0);
	if (ret < 0) {
		return WSAGetLastError() == WSAEWOULDBLOCK ? MBEDTLS_ERR_SSL_WANT_READ : MBEDTLS_ERR_NET_RECV_FAILED;
	}
#else
	ssize_t ret = recv(impl->socket_fd, buf, len, 0);
	if (ret < 0) {
		if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
			return MBEDTLS_ERR_SSL_WANT_READ;
		}
		return MBEDTLS_ERR_NET_RECV_FAILED;
	}
#endif
	if (ret == 0) {
		return MBEDTLS_ERR_NET_CONN_RESET;
	}
	return static_cast<int>(ret);
}

// Wait for the socket to become readable; returns >0 ready, 0 timeout, <0 error
static int PollReadable(int fd, int timeout_ms) {
#ifdef _WIN32
	fd_set read_fds;
	FD_ZERO(&read_fds);
	FD_SET(fd, &read_fds);
	struct timeval tv;
	tv.tv_sec = timeout_ms / 1000;
	tv.tv_usec = (timeout_ms % 1000) * 1000;
	return select(fd + 1, &read_fds, nullptr, nullptr, &tv);
#else
	struct pollfd pfd;
	pfd.fd = fd;
	pfd.events = POLLIN;
	pfd.revents = 0;
	int ready = poll(&pfd, 1, timeout_ms);
	if (ready < 0 && errno == EINTR) {
		return 0;
	}
	return ready;
#endif
}

static int BioRecvTimeout(void *ctx, unsigned char *buf, size_t len, uint32_t timeout) {
	auto *impl = static_cast<TlsTdsContextImpl *>(ctx);

	if (impl->recv_callback) {
		int ret = impl->recv_callback(reinterpret_cast<uint8_t *>(buf), len, static_cast<int>(timeout));
		if (ret < 0) {
			return MBEDTLS_ERR_NET_RECV_FAILED;
		}
		return ret == 0 ? MBEDTLS_ERR_SSL_TIMEOUT : ret;
	}

	int ready = PollReadable(impl->socket_fd, static_cast<int>(timeout));
	if (ready < 0) {
		return MBEDTLS_ERR_NET_RECV_FAILED;
	}
	if (ready == 0) {
		return MBEDTLS_ERR_SSL_TIMEOUT;
	}
	return BioRecv(ctx, buf, len);
}

//===----------------------------------------------------------------------===//
// TlsTdsContext
//===----------------------------------------------------------------------===//

TlsTdsContext::TlsTdsContext() : impl_(new TlsTdsContextImpl()) {
}

TlsTdsContext::~TlsTdsContext() {
	Close();
}

bool TlsTdsContext::Initialize() {
	if (impl_->initialized) {
		return true;
	}

	const char *pers = "sqlcsv_tds_tls";
	int ret = mbedtls_ctr_drbg_seed(&impl_->ctr_drbg, mbedtls_entropy_func, &impl_->entropy,
	                                reinterpret_cast<const unsigned char *>(pers), strlen(pers));
	if (ret != 0) {
		impl_->SetError(TlsErrorCode::INIT_FAILED, "CTR DRBG seed failed: " + FormatMbedTlsError(ret));
		return false;
	}

	ret = mbedtls_ssl_config_defaults(&impl_->conf, MBEDTLS_SSL_IS_CLIENT, MBEDTLS_SSL_TRANSPORT_STREAM,
	                                  MBEDTLS_SSL_PRESET_DEFAULT);
	if (ret != 0) {
		impl_->SetError(TlsErrorCode::INIT_FAILED, "SSL config defaults failed: " + FormatMbedTlsError(ret));
		return false;
	}

	mbedtls_ssl_conf_rng(&impl_->conf, mbedtls_ctr_drbg_random, &impl_->ctr_drbg);
	if (GetTlsDebugLevel() >= 3) {
		mbedtls_ssl_conf_dbg(&impl_->conf, MbedTlsDebugCallback, nullptr);
		mbedtls_debug_set_threshold(4);
	}

	mbedtls_ssl_conf_authmode(&impl_->conf, MBEDTLS_SSL_VERIFY_NONE);
	mbedtls_ssl_conf_min_tls_version(&impl_->conf, MBEDTLS_SSL_VERSION_TLS1_2);
	mbedtls_ssl_conf_max_tls_version(&impl_->conf, MBEDTLS_SSL_VERSION_TLS1_2);
	mbedtls_ssl_conf_read_timeout(&impl_->conf, 30000);

	ret = mbedtls_ssl_setup(&impl_->ssl, &impl_->conf);
	if (ret != 0) {
		impl_->SetError(TlsErrorCode::INIT_FAILED, "SSL setup failed: " + FormatMbedTlsError(ret));
		return false;
	}

	impl_->initialized = true;
	SQLCSV_TLS_DEBUG_LOG(1, "Initialize: success");
	return true;
}

bool TlsTdsContext::WrapSocket(int socket_fd, const std::string &hostname) {
	if (!impl_->initialized) {
		impl_->SetError(TlsErrorCode::NOT_INITIALIZED, "Call Initialize() first");
		return false;
	}

	impl_->socket_fd = socket_fd;
	if (!hostname.empty()) {
		int ret = mbedtls_ssl_set_hostname(&impl_->ssl, hostname.c_str());
		if (ret != 0) {
			impl_->SetError(TlsErrorCode::INIT_FAILED, "Failed to set hostname for SNI: " + FormatMbedTlsError(ret));
			return false;
		}
	}

	mbedtls_ssl_set_bio(&impl_->ssl, impl_.get(), BioSend, BioRecv, BioRecvTimeout);
	return true;
}

void TlsTdsContext::SetBioCallbacks(TlsSendCallback send_cb, TlsRecvCallback recv_cb) {
	impl_->send_callback = std::move(send_cb);
	impl_->recv_callback = std::move(recv_cb);
}

void TlsTdsContext::ClearBioCallbacks() {
	impl_->send_callback = nullptr;
	impl_->recv_callback = nullptr;
}

bool TlsTdsContext::Handshake(int timeout_ms) {
	if (!impl_->initialized || impl_->socket_fd < 0) {
		impl_->SetError(TlsErrorCode::NOT_INITIALIZED, "TLS session is not attached to a socket");
		return false;
	}

	auto start = std::chrono::steady_clock::now();
	int ret;
	while ((ret = mbedtls_ssl_handshake(&impl_->ssl)) != 0) {
		if (ret != MBEDTLS_ERR_SSL_WANT_READ && ret != MBEDTLS_ERR_SSL_WANT_WRITE) {
			impl_->SetError(TlsErrorCode::HANDSHAKE_FAILED, "Handshake failed: " + FormatMbedTlsError(ret));
			return false;
		}
		auto elapsed =
		    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
		if (elapsed >= timeout_ms) {
			impl_->SetError(TlsErrorCode::HANDSHAKE_TIMEOUT, "Timeout after " + std::to_string(elapsed) + "ms");
			return false;
		}
	}

	impl_->handshake_complete = true;
	SQLCSV_TLS_DEBUG_LOG(1, "Handshake: %s, %s", GetTlsVersion().c_str(), GetCipherSuite().c_str());
	return true;
}

ssize_t TlsTdsContext::Send(const uint8_t *data, size_t length) {
	if (!impl_->handshake_complete) {
		impl_->SetError(TlsErrorCode::NOT_INITIALIZED, "Handshake not complete");
		return -1;
	}

	size_t total_sent = 0;
	while (total_sent < length) {
		int ret = mbedtls_ssl_write(&impl_->ssl, data + total_sent, length - total_sent);
		if (ret > 0) {
			total_sent += ret;
		} else if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
			continue;
		} else if (ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY) {
			impl_->peer_closed = true;
			impl_->SetError(TlsErrorCode::PEER_CLOSED, "Peer closed connection");
			return -1;
		} else {
			impl_->SetError(TlsErrorCode::SEND_FAILED, "Send failed: " + FormatMbedTlsError(ret));
			return -1;
		}
	}
	return static_cast<ssize_t>(total_sent);
}

ssize_t TlsTdsContext::Receive(uint8_t *buffer, size_t max_length, int timeout_ms) {
	if (!impl_->handshake_complete) {
		impl_->SetError(TlsErrorCode::NOT_INITIALIZED, "Handshake not complete");
		return -1;
	}

	// Decrypted bytes may already be buffered inside the session
	if (timeout_ms > 0 && mbedtls_ssl_get_bytes_avail(&impl_->ssl) == 0) {
		int ready = PollReadable(impl_->socket_fd, timeout_ms);
		if (ready < 0) {
			impl_->SetError(TlsErrorCode::RECV_FAILED, "poll failed");
			return -1;
		}
		if (ready == 0) {
			return 0;
		}
	}

	int ret = mbedtls_ssl_read(&impl_->ssl, buffer, max_length);
	if (ret > 0) {
		return ret;
	}
	if (ret == 0 || ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY || ret == MBEDTLS_ERR_NET_CONN_RESET) {
		impl_->peer_closed = true;
		impl_->SetError(TlsErrorCode::PEER_CLOSED, "Connection closed by peer");
		return 0;
	}
	if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
		return 0;
	}
	impl_->SetError(TlsErrorCode::RECV_FAILED, "Receive failed: " + FormatMbedTlsError(ret));
	return -1;
}

void TlsTdsContext::Close() {
	if (!impl_) {
		return;
	}
	if (impl_->handshake_complete && !impl_->peer_closed) {
		mbedtls_ssl_close_notify(&impl_->ssl);
	}
	impl_->Free();
	impl_->Init();
	impl_->initialized = false;
	impl_->handshake_complete = false;
	impl_->socket_fd = -1;
	ClearBioCallbacks();
}

bool TlsTdsContext::IsInitialized() const {
	return impl_->initialized && impl_->handshake_complete;
}

bool TlsTdsContext::IsPeerClosed() const {
	return impl_->peer_closed;
}

const std::string &TlsTdsContext::GetLastError() const {
	return impl_->last_error;
}

TlsErrorCode TlsTdsContext::GetLastErrorCode() const {
	return impl_->last_error_code;
}

std::string TlsTdsContext::GetCipherSuite() const {
	if (!impl_->handshake_complete) {
		return "";
	}
	const char *suite = mbedtls_ssl_get_ciphersuite(&impl_->ssl);
	return suite ? suite : "";
}

std::string TlsTdsContext::GetTlsVersion() const {
	if (!impl_->handshake_complete) {
		return "";
	}
	const char *version = mbedtls_ssl_get_version(&impl_->ssl);
	return version ? version : "";
}

}  // namespace tds
}  // namespace sqlcsv
