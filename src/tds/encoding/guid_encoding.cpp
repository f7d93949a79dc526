#include "tds/encoding/guid_encoding.hpp"
#include <cstring>

namespace sqlcsv {
namespace tds {
namespace encoding {

static const char HEX_DIGITS[] = "0123456789abcdef";

void GuidEncoding::ReorderGuidBytes(const uint8_t *input, uint8_t *output) {
	// Data1
	output[0] = input[3];
	output[1] = input[2];
	output[2] = input[1];
	output[3] = input[0];
	// Data2
	output[4] = input[5];
	output[5] = input[4];
	// Data3
	output[6] = input[7];
	output[7] = input[6];
	// Data4
	std::memcpy(output + 8, input + 8, 8);
}

std::string GuidEncoding::FormatGuid(const uint8_t *data) {
	uint8_t ordered[GUID_SIZE];
	ReorderGuidBytes(data, ordered);

	std::string result;
	result.reserve(36);
	for (size_t i = 0; i < GUID_SIZE; i++) {
		if (i == 4 || i == 6 || i == 8 || i == 10) {
			result.push_back('-');
		}
		result.push_back(HEX_DIGITS[ordered[i] >> 4]);
		result.push_back(HEX_DIGITS[ordered[i] & 0x0F]);
	}
	return result;
}

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
