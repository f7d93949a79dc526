#pragma once

#include "connection/connection_string.hpp"
#include "query/tds_result_cursor.hpp"
#include "tds/tds_connection.hpp"
#include <memory>
#include <string>

namespace sqlcsv {

// Pick the connection string from -cs, falling back to the environment
// variable named by -csenv. Throws ConfigError when neither yields text.
std::string ResolveConnectionString(const std::string &cs, const std::string &csenv);

//===----------------------------------------------------------------------===//
// ConnectionManager - owns the single database session for the process
//===----------------------------------------------------------------------===//

class ConnectionManager {
public:
	explicit ConnectionManager(ConnectionConfig config);
	~ConnectionManager();

	ConnectionManager(const ConnectionManager &) = delete;
	ConnectionManager &operator=(const ConnectionManager &) = delete;

	// Connect, log in and ping, all within deadline_seconds.
	// Throws ConnectivityError.
	void Open(int deadline_seconds = tds::PING_TIMEOUT);

	// Round-trip a trivial query. Throws ConnectivityError.
	void Ping(int timeout_seconds = tds::PING_TIMEOUT);

	// The session as a QueryConnection. Requires a successful Open().
	QueryConnection &GetQueryConnection();

	bool IsOpen() const;
	void Close();

private:
	ConnectionConfig config_;
	std::unique_ptr<tds::TdsConnection> connection_;
	std::unique_ptr<TdsQueryConnection> query_connection_;
};

}  // namespace sqlcsv
