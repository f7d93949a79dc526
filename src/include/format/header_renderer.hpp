#pragma once

#include "format/column_descriptor.hpp"
#include <string>
#include <vector>

namespace sqlcsv {

//===----------------------------------------------------------------------===//
// HeaderRenderer - descriptive CSV header labels
//===----------------------------------------------------------------------===//
//
// Label format: [name] TYPE(size) NULL|NOT NULL
// "]" in the name is doubled; the two driver MAX length markers render as "(max)".

class HeaderRenderer {
public:
	static std::vector<std::string> RenderHeader(const std::vector<ColumnDescriptor> &columns);
	static std::string RenderLabel(const ColumnDescriptor &column);

	static bool IsMaxLength(int64_t length);
};

}  // namespace sqlcsv
