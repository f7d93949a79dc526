#pragma once

#include "duckdb/common/case_insensitive_map.hpp"
#include <cstdint>
#include <string>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// ConnectionConfig - connection parameters extracted from a connection string
//===----------------------------------------------------------------------===//

struct ConnectionConfig {
	std::string host;
	uint16_t port = 1433;
	// Named instance from host\instance; informational only
	std::string instance;
	std::string database;
	std::string user;
	std::string password;
	bool use_encrypt = true;
	bool trust_server_certificate = false;
	std::string app_name = "sqlcsv";
	int connect_timeout = 30;

	// Accepts ADO style "key=value;..." and the sqlserver:// and mssql:// URL
	// styles. Throws ConfigError on missing or invalid values.
	static ConnectionConfig FromConnectionString(const std::string &connection_string);

	static bool IsUrlFormat(const std::string &str);

	// host:port/database, without credentials
	std::string Describe() const;
};

using ConnectionParams = duckdb::case_insensitive_map_t<std::string>;

// Exposed for tests
ConnectionParams ParseAdoConnectionString(const std::string &connection_string);
ConnectionParams ParseUrlConnectionString(const std::string &url);
// Decodes %XX escapes; query components also map '+' to a space
std::string UrlDecode(const std::string &str, bool plus_as_space = false);

}  // namespace sqlcsv
