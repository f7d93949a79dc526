#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// ColumnDescriptor - driver-reported metadata for one result-set column
//===----------------------------------------------------------------------===//

struct ColumnDescriptor {
	std::string name;
	// Driver type tag, e.g. "INT", "NVARCHAR", "UNIQUEIDENTIFIER"
	std::string database_type_name;

	bool has_nullable = false;
	bool nullable = false;

	// Declared length; absent for fixed-width types
	bool has_length = false;
	int64_t length = 0;

	bool has_decimal_size = false;
	int64_t precision = 0;
	int64_t scale = 0;

	ColumnDescriptor() = default;
	ColumnDescriptor(std::string name_p, std::string type_name_p)
	    : name(std::move(name_p)), database_type_name(std::move(type_name_p)) {
	}

	ColumnDescriptor &WithNullable(bool value) {
		has_nullable = true;
		nullable = value;
		return *this;
	}
	ColumnDescriptor &WithLength(int64_t value) {
		has_length = true;
		length = value;
		return *this;
	}
	ColumnDescriptor &WithDecimalSize(int64_t precision_p, int64_t scale_p) {
		has_decimal_size = true;
		precision = precision_p;
		scale = scale_p;
		return *this;
	}
};

}  // namespace sqlcsv
