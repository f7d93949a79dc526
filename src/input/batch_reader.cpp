#include "input/batch_reader.hpp"
#include "sqlcsv_exception.hpp"
#include "duckdb/common/string_util.hpp"
#include <cerrno>
#include <cstring>

namespace sqlcsv {

using duckdb::StringUtil;

BatchReader::BatchReader(std::istream &in) : in_(in), line_number_(0) {
}

bool BatchReader::IsSeparator(const std::string &line) {
	std::string trimmed = line;
	StringUtil::Trim(trimmed);
	return trimmed.size() == 2 && StringUtil::Upper(trimmed) == "GO";
}

bool BatchReader::ReadBatch(std::string &batch) {
	batch.clear();
	std::string line;
	while (std::getline(in_, line)) {
		line_number_++;
		// getline keeps the CR of a CRLF line ending
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (IsSeparator(line)) {
			return true;
		}
		batch += line;
		batch += "\r\n";
	}
	if (in_.bad()) {
		throw InputReadError(std::string("error reading standard input: ") + strerror(errno));
	}
	return false;
}

uint64_t BatchReader::ForEachBatch(const std::function<void(const std::string &)> &callback) {
	uint64_t count = 0;
	std::string batch;
	while (ReadBatch(batch)) {
		count++;
		callback(batch);
	}
	return count;
}

}  // namespace sqlcsv
