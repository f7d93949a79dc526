#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// RawCellValue - one decoded cell, tagged by kind
//===----------------------------------------------------------------------===//

class RawCellValue {
public:
	enum class Kind : uint8_t { Null, Boolean, Integer, Float, Bytes, String };

	// A null cell
	RawCellValue();

	static RawCellValue Null();
	static RawCellValue Boolean(bool value);
	static RawCellValue Integer(int64_t value);
	static RawCellValue Float(double value);
	static RawCellValue Bytes(std::vector<uint8_t> value);
	static RawCellValue Bytes(const std::string &value);
	static RawCellValue String(std::string value);

	Kind GetKind() const {
		return kind_;
	}
	bool IsNull() const {
		return kind_ == Kind::Null;
	}

	// Accessors throw InternalException when the kind does not match
	bool GetBoolean() const;
	int64_t GetInteger() const;
	double GetFloat() const;
	const std::vector<uint8_t> &GetBytes() const;
	const std::string &GetString() const;

	static const char *KindToString(Kind kind);

private:
	explicit RawCellValue(Kind kind);
	void CheckKind(Kind expected) const;

	Kind kind_;
	union {
		bool boolean;
		int64_t integer;
		double floating;
	} scalar_;
	std::vector<uint8_t> bytes_;
	std::string string_;
};

}  // namespace sqlcsv
