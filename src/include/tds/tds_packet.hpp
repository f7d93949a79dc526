#pragma once

#include "tds_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sqlcsv {
namespace tds {

// One TDS packet: 8-byte header followed by the payload.
// Header (multi-byte values big-endian):
//   0: type, 1: status, 2-3: length incl. header, 4-5: SPID, 6: packet id, 7: window
class TdsPacket {
public:
	TdsPacket();
	explicit TdsPacket(PacketType type, PacketStatus status = PacketStatus::END_OF_MESSAGE);

	PacketType GetType() const {
		return type_;
	}
	PacketStatus GetStatus() const {
		return status_;
	}
	uint16_t GetLength() const;
	const std::vector<uint8_t> &GetPayload() const {
		return payload_;
	}

	void SetPacketId(uint8_t id) {
		packet_id_ = id;
	}

	void AppendPayload(const uint8_t *data, size_t length);
	void AppendPayload(const std::vector<uint8_t> &data);
	void AppendByte(uint8_t byte);
	void AppendUInt16BE(uint16_t value);
	void AppendUInt16LE(uint16_t value);
	void AppendUInt32LE(uint32_t value);
	void AppendUTF16LE(const std::string &str);

	std::vector<uint8_t> Serialize() const;

	// Parse one packet from data; returns bytes consumed or 0 if incomplete.
	// Throws IOException on a corrupt length field.
	static size_t Parse(const uint8_t *data, size_t length, TdsPacket &packet);

	static uint16_t GetPacketLength(const uint8_t *data);

	bool IsEndOfMessage() const {
		return (static_cast<uint8_t>(status_) & static_cast<uint8_t>(PacketStatus::END_OF_MESSAGE)) != 0;
	}

private:
	PacketType type_;
	PacketStatus status_;
	uint16_t spid_;
	uint8_t packet_id_;
	std::vector<uint8_t> payload_;
};

}  // namespace tds
}  // namespace sqlcsv
