#pragma once

#include "format/column_descriptor.hpp"
#include "format/raw_cell_value.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// ResultCursor - forward-only view over the response to one batch
//
// A freshly executed cursor is positioned on the first result set (which
// has no columns when the batch produced no tabular result).
//===----------------------------------------------------------------------===//

class ResultCursor {
public:
	virtual ~ResultCursor() = default;

	// Columns of the current result set
	virtual const std::vector<ColumnDescriptor> &Columns() const = 0;

	// Decode the next row of the current result set into `row`.
	// Returns false when the result set is exhausted.
	virtual bool NextRow(std::vector<RawCellValue> &row) = 0;

	// Advance to the next result set, skipping unread rows.
	// Returns false when the response has no further result set.
	virtual bool NextResultSet() = 0;

	// Consume the rest of the response and raise any error the server
	// reported after the last row was read. Safe to call more than once.
	virtual void Close() = 0;
};

//===----------------------------------------------------------------------===//
// QueryConnection - submits batch text and hands back a cursor
//===----------------------------------------------------------------------===//

class QueryConnection {
public:
	virtual ~QueryConnection() = default;

	// timeout_seconds <= 0 disables the deadline
	virtual std::unique_ptr<ResultCursor> ExecuteQuery(const std::string &sql, int timeout_seconds) = 0;
};

}  // namespace sqlcsv
