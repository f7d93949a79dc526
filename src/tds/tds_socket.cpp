#include "tds/tds_socket.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
#define CLOSE_SOCKET closesocket
#define SOCKET_ERROR_CODE WSAGetLastError()
#define poll WSAPoll
typedef int socklen_t;
#define SOCK_OPT_CAST(x) reinterpret_cast<char *>(x)
#define SOCK_OPT_CONST_CAST(x) reinterpret_cast<const char *>(x)
#define SOCK_BUF_CAST(x) reinterpret_cast<char *>(x)
#define SOCK_BUF_CONST_CAST(x) reinterpret_cast<const char *>(x)
#define MSG_NOSIGNAL 0

static std::once_flag winsock_init_flag;
static bool winsock_initialized = false;

static void InitializeWinsock() {
	WSADATA wsaData;
	if (WSAStartup(MAKEWORD(2, 2), &wsaData) == 0) {
		winsock_initialized = true;
		atexit([]() { WSACleanup(); });
	}
}
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#define CLOSE_SOCKET close
#define SOCKET_ERROR_CODE errno
#define SOCK_OPT_CAST(x) (x)
#define SOCK_OPT_CONST_CAST(x) (x)
#define SOCK_BUF_CAST(x) (x)
#define SOCK_BUF_CONST_CAST(x) (x)
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif
#endif

static int GetSocketDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLCSV_SOCKET_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                 \
		if (GetSocketDebugLevel() >= lvl)                                \
			fprintf(stderr, "[SQLCSV SOCKET] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlcsv {
namespace tds {

TdsSocket::TdsSocket() : fd_(-1), connected_(false), timed_out_(false) {
}

TdsSocket::~TdsSocket() {
	Close();
}

bool TdsSocket::Connect(const std::string &host, uint16_t port, int timeout_seconds) {
	SQLCSV_SOCKET_DEBUG_LOG(1, "Connect: %s:%d (timeout=%ds)", host.c_str(), port, timeout_seconds);

	if (connected_) {
		Close();
	}
	host_ = host;
	last_error_.clear();
	timed_out_ = false;

#ifdef _WIN32
	std::call_once(winsock_init_flag, InitializeWinsock);
	if (!winsock_initialized) {
		last_error_ = "Failed to initialize Windows socket library (WSAStartup failed)";
		return false;
	}
#endif

	struct addrinfo hints, *result, *rp;
	std::memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_protocol = IPPROTO_TCP;

	std::string port_str = std::to_string(port);
	int ret = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
	if (ret != 0) {
		last_error_ = "Failed to resolve hostname: " + std::string(gai_strerror(ret));
		return false;
	}

	// Try each resolved address until one connects
	for (rp = result; rp != nullptr; rp = rp->ai_next) {
		fd_ = static_cast<int>(socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol));
		if (fd_ == -1) {
			continue;
		}
		if (!SetNonBlocking(true)) {
			CLOSE_SOCKET(fd_);
			fd_ = -1;
			continue;
		}

		ret = connect(fd_, rp->ai_addr, static_cast<socklen_t>(rp->ai_addrlen));
		if (ret == 0) {
			connected_ = true;
			break;
		}

		int connect_error = SOCKET_ERROR_CODE;
#ifdef _WIN32
		if (connect_error == WSAEWOULDBLOCK) {
#else
		if (connect_error == EINPROGRESS || connect_error == EWOULDBLOCK) {
#endif
			if (WaitForReady(true, timeout_seconds * 1000)) {
				int error = 0;
				socklen_t len = sizeof(error);
				if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, SOCK_OPT_CAST(&error), &len) == 0 && error == 0) {
					connected_ = true;
					break;
				}
				last_error_ = "Connection failed: " + std::string(strerror(error));
			} else if (timed_out_) {
				last_error_ = "Connection timed out";
			}
		} else {
			last_error_ = "Connection failed: " + std::string(strerror(connect_error));
		}
		SQLCSV_SOCKET_DEBUG_LOG(1, "Connect: address failed: %s", last_error_.c_str());

		CLOSE_SOCKET(fd_);
		fd_ = -1;
	}
	freeaddrinfo(result);

	if (!connected_) {
		if (last_error_.empty()) {
			last_error_ = "Failed to connect to " + host + ":" + std::to_string(port);
		}
		return false;
	}

	int flag = 1;
	setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, SOCK_OPT_CONST_CAST(&flag), sizeof(flag));
#ifdef __APPLE__
	setsockopt(fd_, SOL_SOCKET, SO_NOSIGPIPE, SOCK_OPT_CONST_CAST(&flag), sizeof(flag));
#endif
	SetNonBlocking(false);
	return true;
}

void TdsSocket::Close() {
	if (tls_context_) {
		tls_context_->Close();
		tls_context_.reset();
	}
	if (fd_ >= 0) {
		CLOSE_SOCKET(fd_);
		fd_ = -1;
	}
	connected_ = false;
	receive_buffer_.clear();
}

bool TdsSocket::IsConnected() const {
	return connected_ && fd_ >= 0;
}

bool TdsSocket::EnableTls(uint8_t &packet_id, int timeout_ms) {
	if (!IsConnected()) {
		last_error_ = "Cannot enable TLS: not connected";
		return false;
	}
	if (tls_context_) {
		last_error_ = "TLS is already enabled";
		return false;
	}
	receive_buffer_.clear();

	tls_context_.reset(new TlsTdsContext());
	if (!tls_context_->Initialize()) {
		last_error_ = "TLS initialization failed: " + tls_context_->GetLastError();
		tls_context_.reset();
		return false;
	}
	if (!tls_context_->WrapSocket(fd_, host_)) {
		last_error_ = "TLS socket wrap failed: " + tls_context_->GetLastError();
		tls_context_.reset();
		return false;
	}

	// Outgoing handshake records are batched and flushed as one PRELOGIN
	// packet right before the next read.
	std::vector<uint8_t> send_buffer;
	std::vector<uint8_t> recv_buffer;

	auto flush = [this, &packet_id, &send_buffer]() -> bool {
		if (send_buffer.empty()) {
			return true;
		}
		TdsPacket packet(PacketType::PRELOGIN);
		packet.SetPacketId(packet_id++);
		packet.AppendPayload(send_buffer);
		send_buffer.clear();
		std::vector<uint8_t> wire = packet.Serialize();
		SQLCSV_SOCKET_DEBUG_LOG(2, "TLS handshake: sending %zu bytes", wire.size());
		return SendRaw(wire.data(), wire.size());
	};

	TlsSendCallback send_cb = [&send_buffer](const uint8_t *data, size_t len) -> int {
		send_buffer.insert(send_buffer.end(), data, data + len);
		return static_cast<int>(len);
	};

	TlsRecvCallback recv_cb = [this, &recv_buffer, &flush](uint8_t *buf, size_t len, int wait_ms) -> int {
		if (!flush()) {
			return -1;
		}
		if (recv_buffer.empty()) {
			uint8_t header[TDS_HEADER_SIZE];
			if (!ReceiveRaw(header, sizeof(header), wait_ms > 0 ? wait_ms : 30000)) {
				return timed_out_ ? 0 : -1;
			}
			uint8_t type = header[0];
			uint16_t length = TdsPacket::GetPacketLength(header);
			if ((type != static_cast<uint8_t>(PacketType::TABULAR_RESULT) &&
			     type != static_cast<uint8_t>(PacketType::PRELOGIN)) ||
			    length < TDS_HEADER_SIZE) {
				last_error_ = "Unexpected packet during TLS handshake";
				return -1;
			}
			recv_buffer.resize(length - TDS_HEADER_SIZE);
			if (!recv_buffer.empty() && !ReceiveRaw(recv_buffer.data(), recv_buffer.size(), 30000)) {
				recv_buffer.clear();
				return -1;
			}
		}
		size_t to_copy = std::min(len, recv_buffer.size());
		std::memcpy(buf, recv_buffer.data(), to_copy);
		recv_buffer.erase(recv_buffer.begin(), recv_buffer.begin() + to_copy);
		return static_cast<int>(to_copy);
	};

	tls_context_->SetBioCallbacks(std::move(send_cb), std::move(recv_cb));
	bool ok = tls_context_->Handshake(timeout_ms);
	tls_context_->ClearBioCallbacks();

	if (!ok) {
		last_error_ = "TLS handshake failed: " + tls_context_->GetLastError();
		tls_context_.reset();
		return false;
	}
	SQLCSV_SOCKET_DEBUG_LOG(1, "EnableTls: %s %s", tls_context_->GetTlsVersion().c_str(),
	                        tls_context_->GetCipherSuite().c_str());
	return true;
}

bool TdsSocket::IsTlsEnabled() const {
	return tls_context_ && tls_context_->IsInitialized();
}

bool TdsSocket::SendRaw(const uint8_t *data, size_t length) {
	size_t total_sent = 0;
	while (total_sent < length) {
		auto sent = send(fd_, SOCK_BUF_CONST_CAST(data + total_sent), length - total_sent, MSG_NOSIGNAL);
		if (sent <= 0) {
			if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
				if (!WaitForReady(true, 30000)) {
					last_error_ = "Send timeout";
					return false;
				}
				continue;
			}
			last_error_ = "Send failed: " + std::string(strerror(errno));
			connected_ = false;
			return false;
		}
		total_sent += static_cast<size_t>(sent);
	}
	return true;
}

bool TdsSocket::ReceiveRaw(uint8_t *buffer, size_t length, int timeout_ms) {
	size_t total = 0;
	while (total < length) {
		if (!WaitForReady(false, timeout_ms)) {
			return false;
		}
		auto n = recv(fd_, SOCK_BUF_CAST(buffer + total), length - total, 0);
		if (n < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
				continue;
			}
			last_error_ = "Receive failed: " + std::string(strerror(errno));
			connected_ = false;
			return false;
		}
		if (n == 0) {
			last_error_ = "Connection closed by server";
			connected_ = false;
			return false;
		}
		total += static_cast<size_t>(n);
	}
	return true;
}

bool TdsSocket::Send(const uint8_t *data, size_t length) {
	if (!IsConnected()) {
		last_error_ = "Not connected";
		return false;
	}
	if (tls_context_) {
		ssize_t sent = tls_context_->Send(data, length);
		if (sent < 0 || static_cast<size_t>(sent) != length) {
			last_error_ = "TLS send failed: " + tls_context_->GetLastError();
			return false;
		}
		return true;
	}
	return SendRaw(data, length);
}

bool TdsSocket::Send(const std::vector<uint8_t> &data) {
	return Send(data.data(), data.size());
}

bool TdsSocket::SendPacket(const TdsPacket &packet) {
	return Send(packet.Serialize());
}

ssize_t TdsSocket::Receive(uint8_t *buffer, size_t max_length, int timeout_ms) {
	timed_out_ = false;
	if (!IsConnected()) {
		last_error_ = "Not connected";
		return -1;
	}

	if (tls_context_) {
		ssize_t received = tls_context_->Receive(buffer, max_length, timeout_ms);
		if (received < 0 || (received == 0 && tls_context_->IsPeerClosed())) {
			last_error_ = "TLS receive failed: " + tls_context_->GetLastError();
			connected_ = false;
			return -1;
		}
		if (received == 0) {
			timed_out_ = true;
			last_error_ = "Socket timeout waiting for data";
		}
		return received;
	}

	if (!WaitForReady(false, timeout_ms)) {
		return timed_out_ ? 0 : -1;
	}

	auto received = recv(fd_, SOCK_BUF_CAST(buffer), max_length, 0);
	if (received < 0) {
		if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
			return 0;
		}
		last_error_ = "Receive failed: " + std::string(strerror(errno));
		connected_ = false;
		return -1;
	}
	if (received == 0) {
		last_error_ = "Connection closed by server";
		connected_ = false;
		return -1;
	}
	return received;
}

// Milliseconds left of a timeout_ms wait that began at start; negative waits forever
static int RemainingMs(std::chrono::steady_clock::time_point start, int timeout_ms) {
	if (timeout_ms < 0) {
		return -1;
	}
	auto elapsed =
	    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
	return elapsed >= timeout_ms ? 0 : static_cast<int>(timeout_ms - elapsed);
}

bool TdsSocket::ReceivePacket(TdsPacket &packet, int timeout_ms) {
	uint8_t temp_buffer[TDS_DEFAULT_PACKET_SIZE];
	auto start = std::chrono::steady_clock::now();

	while (true) {
		if (receive_buffer_.size() >= TDS_HEADER_SIZE) {
			size_t consumed = TdsPacket::Parse(receive_buffer_.data(), receive_buffer_.size(), packet);
			if (consumed > 0) {
				receive_buffer_.erase(receive_buffer_.begin(), receive_buffer_.begin() + consumed);
				return true;
			}
		}

		ssize_t received = Receive(temp_buffer, sizeof(temp_buffer), RemainingMs(start, timeout_ms));
		if (received < 0 || timed_out_) {
			return false;
		}
		if (received == 0) {
			// readiness without data (EAGAIN or EINTR from recv)
			continue;
		}
		receive_buffer_.insert(receive_buffer_.end(), temp_buffer, temp_buffer + received);
	}
}

bool TdsSocket::ReceiveMessage(std::vector<uint8_t> &message, int timeout_ms) {
	message.clear();
	while (true) {
		TdsPacket packet;
		if (!ReceivePacket(packet, timeout_ms)) {
			return false;
		}
		const auto &payload = packet.GetPayload();
		message.insert(message.end(), payload.begin(), payload.end());
		if (packet.IsEndOfMessage()) {
			return true;
		}
	}
}

bool TdsSocket::SetNonBlocking(bool enable) {
#ifdef _WIN32
	u_long mode = enable ? 1 : 0;
	return ioctlsocket(fd_, FIONBIO, &mode) == 0;
#else
	int flags = fcntl(fd_, F_GETFL, 0);
	if (flags < 0) {
		return false;
	}
	flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
	return fcntl(fd_, F_SETFL, flags) == 0;
#endif
}

bool TdsSocket::WaitForReady(bool for_write, int timeout_ms) {
	timed_out_ = false;
	struct pollfd pfd;
	pfd.fd = fd_;
	pfd.events = for_write ? POLLOUT : POLLIN;
	pfd.revents = 0;

	auto start = std::chrono::steady_clock::now();
	int ret;
	do {
		ret = poll(&pfd, 1, RemainingMs(start, timeout_ms));
	} while (ret < 0 && errno == EINTR);
	if (ret < 0) {
		last_error_ = "Poll failed: " + std::string(strerror(errno));
		return false;
	}
	if (ret == 0) {
		timed_out_ = true;
		last_error_ = "Socket timeout waiting for data";
		return false;
	}
	if (pfd.revents & (POLLERR | POLLNVAL)) {
		last_error_ = "Socket error during poll";
		connected_ = false;
		return false;
	}
	// Pending data is still readable after the peer hung up
	if (!for_write && (pfd.revents & POLLIN)) {
		return true;
	}
	if (pfd.revents & POLLHUP) {
		last_error_ = "Connection closed by server";
		connected_ = false;
		return false;
	}
	return true;
}

}  // namespace tds
}  // namespace sqlcsv
