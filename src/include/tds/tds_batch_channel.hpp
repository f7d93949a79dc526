#pragma once

#include "tds_packet.hpp"
#include "tds_types.hpp"
#include <string>

namespace sqlcsv {
namespace tds {

//===----------------------------------------------------------------------===//
// BatchChannel - request/response half of a session used by result cursors
//
// Sends one SQL_BATCH and hands back its response packets. Implemented by
// TdsConnection; every method follows its bool + GetLastError() convention.
//===----------------------------------------------------------------------===//

class BatchChannel {
public:
	virtual ~BatchChannel() = default;

	// Send SQL_BATCH; on success the channel is Executing
	virtual bool ExecuteBatch(const std::string &sql) = 0;

	// Next response packet. timeout_ms < 0 waits forever. Returns false on
	// error or timeout; TimedOut() tells them apart.
	virtual bool ReceivePacket(TdsPacket &packet, int timeout_ms) = 0;
	virtual bool TimedOut() const = 0;

	// Response fully consumed: Executing -> Idle
	virtual void FinishResponse() = 0;

	virtual bool SendAttention() = 0;
	virtual bool WaitForAttentionAck(int timeout_ms = CANCELLATION_TIMEOUT * 1000) = 0;

	virtual ConnectionState GetState() const = 0;
	virtual const std::string &GetLastError() const = 0;
};

}  // namespace tds
}  // namespace sqlcsv
