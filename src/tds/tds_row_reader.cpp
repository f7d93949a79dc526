#include "tds/tds_row_reader.hpp"
#include "tds/tds_types.hpp"
#include "duckdb/common/exception.hpp"
#include <cstdio>
#include <cstdlib>

static int GetRowReaderDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLCSV_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define TDS_ROW_DEBUG(level, fmt, ...)                               \
	do {                                                             \
		if (GetRowReaderDebugLevel() >= level) {                     \
			fprintf(stderr, "[SQLCSV ROW] " fmt "\n", ##__VA_ARGS__); \
		}                                                            \
	} while (0)

namespace sqlcsv {
namespace tds {

// PLP total length markers
static constexpr uint64_t PLP_NULL_MARKER = 0xFFFFFFFFFFFFFFFEULL;
static constexpr uint64_t PLP_UNKNOWN_MARKER = 0xFFFFFFFFFFFFFFFFULL;

static uint32_t ReadUInt32(const uint8_t *data) {
	return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
	       (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
}

static uint64_t ReadUInt64(const uint8_t *data) {
	return static_cast<uint64_t>(ReadUInt32(data)) | (static_cast<uint64_t>(ReadUInt32(data + 4)) << 32);
}

RowReader::RowReader(const std::vector<ColumnMetadata> &columns) : columns_(columns) {
}

bool RowReader::ReadRow(const uint8_t *data, size_t length, size_t &bytes_consumed, RowData &row) {
	row.Prepare(columns_.size());

	size_t offset = 0;
	for (size_t col_idx = 0; col_idx < columns_.size(); col_idx++) {
		// NULL-typed columns (SELECT NULL) carry no bytes
		if (columns_[col_idx].type_id == TDS_TYPE_NULL) {
			row.null_mask[col_idx] = true;
			continue;
		}
		bool is_null = false;
		size_t consumed = ReadValue(data + offset, length - offset, columns_[col_idx], row.values[col_idx], is_null);
		if (consumed == 0) {
			return false;
		}
		row.null_mask[col_idx] = is_null;
		offset += consumed;
	}

	bytes_consumed = offset;
	return true;
}

bool RowReader::ReadNBCRow(const uint8_t *data, size_t length, size_t &bytes_consumed, RowData &row) {
	row.Prepare(columns_.size());

	size_t bitmap_bytes = (columns_.size() + 7) / 8;
	if (length < bitmap_bytes) {
		return false;
	}

	size_t offset = bitmap_bytes;
	for (size_t col_idx = 0; col_idx < columns_.size(); col_idx++) {
		if ((data[col_idx / 8] & (1 << (col_idx % 8))) || columns_[col_idx].type_id == TDS_TYPE_NULL) {
			row.null_mask[col_idx] = true;
			continue;
		}
		bool is_null = false;
		size_t consumed = ReadValue(data + offset, length - offset, columns_[col_idx], row.values[col_idx], is_null);
		if (consumed == 0) {
			return false;
		}
		row.null_mask[col_idx] = is_null;
		offset += consumed;
	}

	bytes_consumed = offset;
	return true;
}

size_t RowReader::ReadValue(const uint8_t *data, size_t length, const ColumnMetadata &column,
                            std::vector<uint8_t> &value, bool &is_null) {
	value.clear();
	is_null = false;

	if (column.IsPLPType()) {
		return ReadPLPValue(data, length, value, is_null);
	}

	switch (column.type_id) {
	case TDS_TYPE_TINYINT:
	case TDS_TYPE_BIT:
	case TDS_TYPE_SMALLINT:
	case TDS_TYPE_INT:
	case TDS_TYPE_BIGINT:
	case TDS_TYPE_REAL:
	case TDS_TYPE_FLOAT:
	case TDS_TYPE_MONEY:
	case TDS_TYPE_SMALLMONEY:
	case TDS_TYPE_DATETIME:
	case TDS_TYPE_SMALLDATETIME: {
		size_t size = column.GetFixedSize();
		if (length < size) {
			return 0;
		}
		value.assign(data, data + size);
		return size;
	}

	case TDS_TYPE_INTN:
	case TDS_TYPE_BITN:
	case TDS_TYPE_FLOATN:
	case TDS_TYPE_MONEYN:
	case TDS_TYPE_DATETIMEN:
	case TDS_TYPE_DECIMAL:
	case TDS_TYPE_NUMERIC:
	case TDS_TYPE_UNIQUEIDENTIFIER:
	case TDS_TYPE_DATE:
	case TDS_TYPE_TIME:
	case TDS_TYPE_DATETIME2:
	case TDS_TYPE_DATETIMEOFFSET:
		return ReadByteLengthValue(data, length, value, is_null);

	case TDS_TYPE_BIGCHAR:
	case TDS_TYPE_BIGVARCHAR:
	case TDS_TYPE_NCHAR:
	case TDS_TYPE_NVARCHAR:
	case TDS_TYPE_BIGBINARY:
	case TDS_TYPE_BIGVARBINARY:
		return ReadUShortLengthValue(data, length, value, is_null);

	case TDS_TYPE_TEXT:
	case TDS_TYPE_NTEXT:
	case TDS_TYPE_IMAGE:
		return ReadTextPointerValue(data, length, value, is_null);

	case TDS_TYPE_SQL_VARIANT:
		return ReadLongLengthValue(data, length, value, is_null);

	default:
		throw duckdb::IOException("Unsupported type in row data: %s", column.GetTypeName());
	}
}

size_t RowReader::ReadByteLengthValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value,
                                      bool &is_null) {
	if (length < 1) {
		return 0;
	}
	size_t data_length = data[0];
	if (data_length == 0) {
		is_null = true;
		return 1;
	}
	if (length < 1 + data_length) {
		return 0;
	}
	value.assign(data + 1, data + 1 + data_length);
	return 1 + data_length;
}

size_t RowReader::ReadUShortLengthValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value,
                                        bool &is_null) {
	if (length < 2) {
		return 0;
	}
	size_t data_length = data[0] | (data[1] << 8);
	if (data_length == 0xFFFF) {
		is_null = true;
		return 2;
	}
	if (length < 2 + data_length) {
		return 0;
	}
	value.assign(data + 2, data + 2 + data_length);
	return 2 + data_length;
}

size_t RowReader::ReadLongLengthValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value,
                                      bool &is_null) {
	if (length < 4) {
		return 0;
	}
	size_t data_length = ReadUInt32(data);
	if (data_length == 0) {
		is_null = true;
		return 4;
	}
	if (length < 4 + data_length) {
		return 0;
	}
	value.assign(data + 4, data + 4 + data_length);
	return 4 + data_length;
}

size_t RowReader::ReadTextPointerValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value,
                                       bool &is_null) {
	// TEXTPTR length, TEXTPTR, 8-byte timestamp, 4-byte data length, data
	if (length < 1) {
		return 0;
	}
	size_t pointer_length = data[0];
	if (pointer_length == 0) {
		is_null = true;
		return 1;
	}
	size_t header = 1 + pointer_length + 8;
	if (length < header + 4) {
		return 0;
	}
	size_t data_length = ReadUInt32(data + header);
	if (length < header + 4 + data_length) {
		return 0;
	}
	value.assign(data + header + 4, data + header + 4 + data_length);
	return header + 4 + data_length;
}

size_t RowReader::ReadPLPValue(const uint8_t *data, size_t length, std::vector<uint8_t> &value, bool &is_null) {
	// 8-byte total length, then 4-byte length-prefixed chunks up to a zero chunk
	if (length < 8) {
		return 0;
	}
	uint64_t total_length = ReadUInt64(data);
	if (total_length == PLP_NULL_MARKER) {
		is_null = true;
		return 8;
	}
	if (total_length != PLP_UNKNOWN_MARKER && total_length < 0x7FFFFFFF) {
		value.reserve(static_cast<size_t>(total_length));
	}

	size_t offset = 8;
	while (true) {
		if (offset + 4 > length) {
			value.clear();
			return 0;
		}
		size_t chunk_length = ReadUInt32(data + offset);
		offset += 4;
		if (chunk_length == 0) {
			break;
		}
		if (offset + chunk_length > length) {
			value.clear();
			return 0;
		}
		value.insert(value.end(), data + offset, data + offset + chunk_length);
		offset += chunk_length;
	}

	TDS_ROW_DEBUG(3, "PLP value: %zu bytes", value.size());
	return offset;
}

}  // namespace tds
}  // namespace sqlcsv
