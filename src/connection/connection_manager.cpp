#include "connection/connection_manager.hpp"
#include "sqlcsv_exception.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>

static int GetConnectionDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLCSV_CONN_DEBUG_LOG(level, fmt, ...)                          \
	do {                                                                \
		if (GetConnectionDebugLevel() >= level) {                       \
			fprintf(stderr, "[SQLCSV CONN] " fmt "\n", ##__VA_ARGS__); \
		}                                                               \
	} while (0)

namespace sqlcsv {

std::string ResolveConnectionString(const std::string &cs, const std::string &csenv) {
	if (!cs.empty()) {
		return cs;
	}
	if (csenv.empty()) {
		throw ConfigError("missing required sql connection string via -cs or -csenv flag");
	}
	const char *value = std::getenv(csenv.c_str());
	if (!value || value[0] == '\0') {
		throw ConfigError("missing required sql connection string from environment variable '%s' (via -csenv flag)",
		                  csenv);
	}
	return value;
}

ConnectionManager::ConnectionManager(ConnectionConfig config) : config_(std::move(config)) {
}

ConnectionManager::~ConnectionManager() {
	Close();
}

void ConnectionManager::Open(int deadline_seconds) {
	Close();

	auto start = std::chrono::steady_clock::now();
	auto remaining_ms = [&]() -> int {
		auto elapsed =
		    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
		auto left = static_cast<int64_t>(deadline_seconds) * 1000 - elapsed;
		return left > 0 ? static_cast<int>(left) : 0;
	};

	int connect_timeout = deadline_seconds;
	if (config_.connect_timeout > 0 && config_.connect_timeout < connect_timeout) {
		connect_timeout = config_.connect_timeout;
	}

	SQLCSV_CONN_DEBUG_LOG(1, "Open: connecting to %s (encrypt=%d, timeout=%ds)", config_.Describe().c_str(),
	                      config_.use_encrypt ? 1 : 0, connect_timeout);

	auto connection = std::make_unique<tds::TdsConnection>();
	if (!connection->Connect(config_.host, config_.port, connect_timeout)) {
		throw ConnectivityError("unable to open tcp connection with host '%s:%d': %s", config_.host,
		                        static_cast<int>(config_.port), connection->GetLastError());
	}
	if (!connection->Authenticate(config_.user, config_.password, config_.database, config_.app_name,
	                              config_.use_encrypt)) {
		throw ConnectivityError("login error: %s", connection->GetLastError());
	}

	int ping_ms = remaining_ms();
	if (ping_ms == 0 || !connection->Ping(ping_ms)) {
		std::string reason = ping_ms == 0 ? "deadline exceeded" : connection->GetLastError();
		throw ConnectivityError("ping failed: %s", reason);
	}

	SQLCSV_CONN_DEBUG_LOG(1, "Open: connected (tls=%d, packet_size=%u)", connection->IsTlsEnabled() ? 1 : 0,
	                      connection->GetPacketSize());

	connection_ = std::move(connection);
	query_connection_ = std::make_unique<TdsQueryConnection>(*connection_);
}

void ConnectionManager::Ping(int timeout_seconds) {
	if (!connection_) {
		throw duckdb::InternalException("ConnectionManager::Ping called before Open");
	}
	if (!connection_->Ping(timeout_seconds * 1000)) {
		throw ConnectivityError("ping failed: %s", connection_->GetLastError());
	}
}

QueryConnection &ConnectionManager::GetQueryConnection() {
	if (!query_connection_) {
		throw duckdb::InternalException("ConnectionManager::GetQueryConnection called before Open");
	}
	return *query_connection_;
}

bool ConnectionManager::IsOpen() const {
	return connection_ && connection_->IsAlive();
}

void ConnectionManager::Close() {
	query_connection_.reset();
	if (connection_) {
		SQLCSV_CONN_DEBUG_LOG(1, "Close: %s", config_.Describe().c_str());
		connection_->Close();
		connection_.reset();
	}
}

}  // namespace sqlcsv
