#include "query/record_sink.hpp"
#include "sqlcsv_exception.hpp"

namespace sqlcsv {

CsvRecordSink::CsvRecordSink(std::ostream &out) : out_(out) {
}

static bool StartsWithSpace(const std::string &field) {
	unsigned char first = static_cast<unsigned char>(field[0]);
	switch (first) {
	case ' ':
	case '\t':
	case '\n':
	case '\v':
	case '\f':
	case '\r':
		return true;
	case 0xC2:
		// U+0085 NEXT LINE, U+00A0 NO-BREAK SPACE
		return field.size() > 1 && (static_cast<unsigned char>(field[1]) == 0x85 ||
		                             static_cast<unsigned char>(field[1]) == 0xA0);
	default:
		return false;
	}
}

bool CsvRecordSink::FieldNeedsQuotes(const std::string &field) {
	if (field.empty()) {
		return false;
	}
	// PostgreSQL COPY end-of-data marker
	if (field == "\\.") {
		return true;
	}
	if (field.find_first_of(",\"\r\n") != std::string::npos) {
		return true;
	}
	return StartsWithSpace(field);
}

void CsvRecordSink::AppendField(const std::string &field, std::string &line) {
	if (!FieldNeedsQuotes(field)) {
		line += field;
		return;
	}
	line += '"';
	for (char c : field) {
		if (c == '"') {
			line += "\"\"";
		} else {
			line += c;
		}
	}
	line += '"';
}

void CsvRecordSink::WriteRecord(const std::vector<std::string> &fields) {
	line_.clear();
	for (size_t i = 0; i < fields.size(); i++) {
		if (i > 0) {
			line_ += ',';
		}
		AppendField(fields[i], line_);
	}
	line_ += '\n';

	out_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
	if (!out_) {
		throw SinkWriteError("failed to write CSV record");
	}
}

void CsvRecordSink::Flush() {
	out_.flush();
	if (!out_) {
		throw SinkWriteError("failed to flush CSV output");
	}
}

}  // namespace sqlcsv
