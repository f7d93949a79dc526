#pragma once

#include <cstdint>
#include <string>

namespace sqlcsv {
namespace tds {

//===----------------------------------------------------------------------===//
// TdsError - Error information from ERROR token
//===----------------------------------------------------------------------===//

struct TdsError {
	uint32_t number = 0;      // SQL Server error number
	uint8_t state = 0;        // Error state
	uint8_t severity = 0;     // Error class (0-25)
	std::string message;      // Error message text
	std::string server_name;  // Server name
	std::string proc_name;    // Procedure name (if applicable)
	uint32_t line_number = 0; // Line number in batch

	// Full structured rendering, one line
	std::string ToString() const;
};

//===----------------------------------------------------------------------===//
// TdsInfo - Informational message from INFO token (PRINT, RAISERROR < 11)
//===----------------------------------------------------------------------===//

struct TdsInfo {
	uint32_t number = 0;
	uint8_t state = 0;
	uint8_t severity = 0;
	std::string message;
	std::string server_name;
	std::string proc_name;
	uint32_t line_number = 0;
};

}  // namespace tds
}  // namespace sqlcsv
