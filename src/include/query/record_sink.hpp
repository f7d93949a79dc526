#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// RecordSink - ordered destination for output records
//===----------------------------------------------------------------------===//

class RecordSink {
public:
	virtual ~RecordSink() = default;

	// Append one record; an empty record is a blank separator line.
	// Throws SinkWriteError.
	virtual void WriteRecord(const std::vector<std::string> &fields) = 0;

	// Push buffered records to the underlying stream. Throws SinkWriteError.
	virtual void Flush() = 0;
};

//===----------------------------------------------------------------------===//
// CsvRecordSink - comma-separated records with LF terminators
//===----------------------------------------------------------------------===//

class CsvRecordSink : public RecordSink {
public:
	explicit CsvRecordSink(std::ostream &out);

	void WriteRecord(const std::vector<std::string> &fields) override;
	void Flush() override;

	static bool FieldNeedsQuotes(const std::string &field);
	static void AppendField(const std::string &field, std::string &line);

private:
	std::ostream &out_;
	std::string line_;
};

}  // namespace sqlcsv
