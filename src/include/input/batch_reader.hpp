#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <string>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// BatchReader - splits a line-oriented script into batches on GO lines
//
// A line whose trimmed, upper-cased text is exactly "GO" ends the current
// batch. Every other line is appended followed by CRLF. Text after the last
// GO line is never returned.
//===----------------------------------------------------------------------===//

class BatchReader {
public:
	explicit BatchReader(std::istream &in);

	// Returns false at end of input. Throws InputReadError when the stream fails.
	bool ReadBatch(std::string &batch);

	// Calls callback for every remaining batch; returns how many were read
	uint64_t ForEachBatch(const std::function<void(const std::string &)> &callback);

	static bool IsSeparator(const std::string &line);

	// Lines consumed so far, separators included
	uint64_t GetLineNumber() const {
		return line_number_;
	}

private:
	std::istream &in_;
	uint64_t line_number_;
};

}  // namespace sqlcsv
