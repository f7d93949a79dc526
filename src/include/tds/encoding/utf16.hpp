#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sqlcsv {
namespace tds {
namespace encoding {

//===----------------------------------------------------------------------===//
// UTF-16LE <-> UTF-8
//===----------------------------------------------------------------------===//

// Encode UTF-8 text as UTF-16LE. Invalid UTF-8 bytes are dropped.
std::vector<uint8_t> Utf16LEEncode(const std::string &input);

// Decode UTF-16LE bytes to UTF-8. Unpaired surrogates become U+FFFD.
std::string Utf16LEDecode(const uint8_t *data, size_t byte_length);
std::string Utf16LEDecode(const std::vector<uint8_t> &data);

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
