#pragma once

#include "tds_column_metadata.hpp"
#include "tds_token_parser.hpp"
#include <cstdint>
#include <vector>

namespace sqlcsv {
namespace tds {

//===----------------------------------------------------------------------===//
// RowReader - splits ROW/NBCROW token data into raw per-column values
//===----------------------------------------------------------------------===//
//
// All Read* functions return false when the buffer ends mid-row; nothing is
// consumed in that case and the caller retries once more data has arrived.

class RowReader {
public:
	explicit RowReader(const std::vector<ColumnMetadata> &columns);

	bool ReadRow(const uint8_t *data, size_t length, size_t &bytes_consumed, RowData &row);

	// NBCROW: a null bitmap, then values for the non-NULL columns only
	bool ReadNBCRow(const uint8_t *data, size_t length, size_t &bytes_consumed, RowData &row);

private:
	// Returns bytes consumed, 0 if more data is needed
	size_t ReadValue(const uint8_t *data, size_t length, const ColumnMetadata &column, std::vector<uint8_t> &value,
	                 bool &is_null);

	size_t ReadByteLengthValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value, bool &is_null);
	size_t ReadUShortLengthValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value, bool &is_null);
	size_t ReadLongLengthValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value, bool &is_null);
	size_t ReadTextPointerValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value, bool &is_null);
	size_t ReadPLPValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value, bool &is_null);

	const std::vector<ColumnMetadata> &columns_;
};

}  // namespace tds
}  // namespace sqlcsv
