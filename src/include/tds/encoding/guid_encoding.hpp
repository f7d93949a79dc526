#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sqlcsv {
namespace tds {
namespace encoding {

//===----------------------------------------------------------------------===//
// GuidEncoding - SQL Server UNIQUEIDENTIFIER wire format
//===----------------------------------------------------------------------===//
//
// Wire layout is mixed-endian:
//   bytes 0-3: Data1 (little-endian uint32)
//   bytes 4-5: Data2 (little-endian uint16)
//   bytes 6-7: Data3 (little-endian uint16)
//   bytes 8-15: Data4 (as-is)

class GuidEncoding {
public:
	static constexpr size_t GUID_SIZE = 16;

	// Reorder 16 bytes between wire order and big-endian RFC 4122 order.
	// The permutation is its own inverse.
	static void ReorderGuidBytes(const uint8_t *input, uint8_t *output);

	// Render wire bytes as "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" (lowercase)
	static std::string FormatGuid(const uint8_t *data);
};

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
