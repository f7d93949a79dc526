#include "tds/encoding/utf16.hpp"

namespace sqlcsv {
namespace tds {
namespace encoding {

static constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

static void AppendCodeUnit(std::vector<uint8_t> &out, uint16_t unit) {
	out.push_back(static_cast<uint8_t>(unit & 0xFF));
	out.push_back(static_cast<uint8_t>(unit >> 8));
}

static void AppendUtf8(std::string &out, uint32_t codepoint) {
	if (codepoint <= 0x7F) {
		out.push_back(static_cast<char>(codepoint));
	} else if (codepoint <= 0x7FF) {
		out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
		out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
	} else if (codepoint <= 0xFFFF) {
		out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
		out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
	} else {
		out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
		out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
	}
}

// Decodes one UTF-8 sequence at input[i]; returns its length, or 0 if invalid
static size_t DecodeUtf8(const std::string &input, size_t i, uint32_t &codepoint) {
	auto lead = static_cast<uint8_t>(input[i]);
	size_t length;
	if (lead < 0x80) {
		codepoint = lead;
		return 1;
	} else if ((lead & 0xE0) == 0xC0) {
		codepoint = lead & 0x1F;
		length = 2;
	} else if ((lead & 0xF0) == 0xE0) {
		codepoint = lead & 0x0F;
		length = 3;
	} else if ((lead & 0xF8) == 0xF0) {
		codepoint = lead & 0x07;
		length = 4;
	} else {
		return 0;
	}
	if (i + length > input.size()) {
		return 0;
	}
	for (size_t k = 1; k < length; k++) {
		auto cont = static_cast<uint8_t>(input[i + k]);
		if ((cont & 0xC0) != 0x80) {
			return 0;
		}
		codepoint = (codepoint << 6) | (cont & 0x3F);
	}
	return codepoint > 0x10FFFF ? 0 : length;
}

std::vector<uint8_t> Utf16LEEncode(const std::string &input) {
	std::vector<uint8_t> result;
	result.reserve(input.size() * 2);

	size_t i = 0;
	while (i < input.size()) {
		uint32_t codepoint = 0;
		size_t consumed = DecodeUtf8(input, i, codepoint);
		if (consumed == 0) {
			i++;
			continue;
		}
		i += consumed;

		if (codepoint <= 0xFFFF) {
			AppendCodeUnit(result, static_cast<uint16_t>(codepoint));
		} else {
			codepoint -= 0x10000;
			AppendCodeUnit(result, static_cast<uint16_t>(0xD800 + (codepoint >> 10)));
			AppendCodeUnit(result, static_cast<uint16_t>(0xDC00 + (codepoint & 0x3FF)));
		}
	}
	return result;
}

std::string Utf16LEDecode(const uint8_t *data, size_t byte_length) {
	std::string result;
	result.reserve(byte_length);

	size_t i = 0;
	while (i + 1 < byte_length) {
		uint32_t unit = data[i] | (data[i + 1] << 8);
		i += 2;

		if (unit >= 0xD800 && unit <= 0xDBFF) {
			uint32_t low = (i + 1 < byte_length) ? static_cast<uint32_t>(data[i] | (data[i + 1] << 8)) : 0;
			if (low >= 0xDC00 && low <= 0xDFFF) {
				i += 2;
				AppendUtf8(result, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
			} else {
				AppendUtf8(result, REPLACEMENT_CHARACTER);
			}
		} else if (unit >= 0xDC00 && unit <= 0xDFFF) {
			AppendUtf8(result, REPLACEMENT_CHARACTER);
		} else {
			AppendUtf8(result, unit);
		}
	}
	return result;
}

std::string Utf16LEDecode(const std::vector<uint8_t> &data) {
	return Utf16LEDecode(data.data(), data.size());
}

}  // namespace encoding
}  // namespace tds
}  // namespace sqlcsv
