#include "format/header_renderer.hpp"
#include "duckdb/common/string_util.hpp"
#include "tds/tds_types.hpp"

namespace sqlcsv {

using duckdb::StringUtil;

bool HeaderRenderer::IsMaxLength(int64_t length) {
	return length == tds::TDS_LENGTH_VARCHAR_MAX || length == tds::TDS_LENGTH_NVARCHAR_MAX;
}

static std::string SizeSuffix(const ColumnDescriptor &column) {
	if (column.has_length) {
		if (HeaderRenderer::IsMaxLength(column.length)) {
			return "(max)";
		}
		return "(" + std::to_string(column.length) + ")";
	}
	if (column.has_decimal_size) {
		return StringUtil::Format("(%lld,%lld)", column.precision, column.scale);
	}
	return std::string();
}

std::string HeaderRenderer::RenderLabel(const ColumnDescriptor &column) {
	std::string label = "[" + StringUtil::Replace(column.name, "]", "]]") + "] ";
	label += column.database_type_name;
	label += SizeSuffix(column);
	if (column.has_nullable) {
		label += column.nullable ? " NULL" : " NOT NULL";
	}
	return label;
}

std::vector<std::string> HeaderRenderer::RenderHeader(const std::vector<ColumnDescriptor> &columns) {
	std::vector<std::string> labels;
	labels.reserve(columns.size());
	for (auto &column : columns) {
		labels.push_back(RenderLabel(column));
	}
	return labels;
}

}  // namespace sqlcsv
