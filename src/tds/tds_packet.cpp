#include "tds/tds_packet.hpp"
#include "tds/encoding/utf16.hpp"
#include "duckdb/common/exception.hpp"

namespace sqlcsv {
namespace tds {

TdsPacket::TdsPacket() : TdsPacket(PacketType::SQL_BATCH) {
}

TdsPacket::TdsPacket(PacketType type, PacketStatus status)
    : type_(type), status_(status), spid_(0), packet_id_(1) {
}

uint16_t TdsPacket::GetLength() const {
	return static_cast<uint16_t>(TDS_HEADER_SIZE + payload_.size());
}

void TdsPacket::AppendPayload(const uint8_t *data, size_t length) {
	payload_.insert(payload_.end(), data, data + length);
}

void TdsPacket::AppendPayload(const std::vector<uint8_t> &data) {
	payload_.insert(payload_.end(), data.begin(), data.end());
}

void TdsPacket::AppendByte(uint8_t byte) {
	payload_.push_back(byte);
}

void TdsPacket::AppendUInt16BE(uint16_t value) {
	payload_.push_back(static_cast<uint8_t>(value >> 8));
	payload_.push_back(static_cast<uint8_t>(value));
}

void TdsPacket::AppendUInt16LE(uint16_t value) {
	payload_.push_back(static_cast<uint8_t>(value));
	payload_.push_back(static_cast<uint8_t>(value >> 8));
}

void TdsPacket::AppendUInt32LE(uint32_t value) {
	AppendUInt16LE(static_cast<uint16_t>(value));
	AppendUInt16LE(static_cast<uint16_t>(value >> 16));
}

void TdsPacket::AppendUTF16LE(const std::string &str) {
	AppendPayload(encoding::Utf16LEEncode(str));
}

std::vector<uint8_t> TdsPacket::Serialize() const {
	uint16_t length = GetLength();
	std::vector<uint8_t> result;
	result.reserve(length);

	result.push_back(static_cast<uint8_t>(type_));
	result.push_back(static_cast<uint8_t>(status_));
	result.push_back(static_cast<uint8_t>(length >> 8));
	result.push_back(static_cast<uint8_t>(length));
	result.push_back(static_cast<uint8_t>(spid_ >> 8));
	result.push_back(static_cast<uint8_t>(spid_));
	result.push_back(packet_id_);
	result.push_back(0);  // window

	result.insert(result.end(), payload_.begin(), payload_.end());
	return result;
}

uint16_t TdsPacket::GetPacketLength(const uint8_t *data) {
	return static_cast<uint16_t>((data[2] << 8) | data[3]);
}

size_t TdsPacket::Parse(const uint8_t *data, size_t length, TdsPacket &packet) {
	if (length < TDS_HEADER_SIZE) {
		return 0;
	}

	uint16_t packet_length = GetPacketLength(data);
	if (packet_length < TDS_HEADER_SIZE || packet_length > TDS_MAX_PACKET_SIZE) {
		throw duckdb::IOException("Invalid TDS packet length %d", static_cast<int>(packet_length));
	}
	if (length < packet_length) {
		return 0;
	}

	packet.type_ = static_cast<PacketType>(data[0]);
	packet.status_ = static_cast<PacketStatus>(data[1]);
	packet.spid_ = static_cast<uint16_t>((data[4] << 8) | data[5]);
	packet.packet_id_ = data[6];
	packet.payload_.assign(data + TDS_HEADER_SIZE, data + packet_length);

	return packet_length;
}

}  // namespace tds
}  // namespace sqlcsv
