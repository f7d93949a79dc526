#include "connection/connection_manager.hpp"
#include "input/batch_reader.hpp"
#include "query/query_executor.hpp"
#include "query/record_sink.hpp"
#include "sqlcsv_exception.hpp"

#include <boost/program_options.hpp>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace sqlcsv {

struct CommandLine {
	std::string cs;
	std::string csenv;
	std::string null_literal = "NULL";
	int timeout_seconds = 60;
};

static void PrintUsage(std::ostream &out, const po::options_description &desc) {
	out << "Usage: sqlcsv [options] < script.sql\n\n"
	    << "Runs each GO-terminated batch read from standard input and writes\n"
	    << "every result set to standard output as CSV.\n\n"
	    << desc << std::endl;
}

static void ReportBatchError(const ExecutionError &ex) {
	auto server_error = dynamic_cast<const ServerError *>(&ex);
	if (server_error) {
		std::cerr << server_error->StructuredDescription() << std::endl;
	} else {
		std::cerr << "error: " << GetErrorMessage(ex) << std::endl;
	}
}

static int Run(const CommandLine &cmd) {
	auto config = ConnectionConfig::FromConnectionString(ResolveConnectionString(cmd.cs, cmd.csenv));

	ConnectionManager manager(config);
	manager.Open();

	CsvRecordSink sink(std::cout);
	QueryExecutor executor(manager.GetQueryConnection(), sink, cmd.null_literal, cmd.timeout_seconds);
	BatchReader reader(std::cin);

	reader.ForEachBatch([&](const std::string &batch) {
		try {
			executor.Execute(batch);
		} catch (ExecutionError &ex) {
			ReportBatchError(ex);
		}
	});
	return 0;
}

}  // namespace sqlcsv

int main(int argc, char *argv[]) {
	sqlcsv::CommandLine cmd;

	po::options_description desc("Options");
	desc.add_options()("help,h", "show this help message")(
	    "cs", po::value<std::string>(&cmd.cs), "sql connection string")(
	    "csenv", po::value<std::string>(&cmd.csenv), "get sql connection string from this environment variable")(
	    "null", po::value<std::string>(&cmd.null_literal)->default_value(cmd.null_literal),
	    "null string representation to use in CSV output")(
	    "t", po::value<int>(&cmd.timeout_seconds)->default_value(cmd.timeout_seconds), "query timeout (seconds)");

	po::variables_map vm;
	try {
		// -cs and friends are long options written with a single dash
		auto style = po::command_line_style::unix_style | po::command_line_style::allow_long_disguise;
		po::store(po::command_line_parser(argc, argv).options(desc).style(style).run(), vm);
		po::notify(vm);
	} catch (const po::error &e) {
		std::cerr << "error: " << e.what() << "\n";
		sqlcsv::PrintUsage(std::cerr, desc);
		return 2;
	}

	if (vm.count("help")) {
		sqlcsv::PrintUsage(std::cout, desc);
		return 0;
	}

	std::ios::sync_with_stdio(false);
	try {
		return sqlcsv::Run(cmd);
	} catch (const std::exception &e) {
		std::cerr << "fatal: " << sqlcsv::GetErrorMessage(e) << std::endl;
		return 1;
	}
}
