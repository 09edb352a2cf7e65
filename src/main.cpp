#include <chrono>
#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "sproc_mapper/version.hpp"
#include "core/connection_string.hpp"
#include "core/logger.hpp"
#include "core/odbc_error.hpp"
#include "invoke/connection_catalog.hpp"
#include "invoke/procedure_invoker.hpp"
#include "reporting/console_reporter.hpp"
#include "reporting/json_reporter.hpp"

using namespace sproc_mapper;

namespace {

// "name=value" -> text parameter; the value may itself contain '='
invoke::Parameter parse_assignment(const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument("Parameter must be name=value: " + assignment);
    }
    return invoke::Parameter{assignment.substr(0, eq), assignment.substr(eq + 1)};
}

invoke::Cardinality parse_expect(const std::string& expect) {
    if (expect == "none") return invoke::Cardinality::None;
    if (expect == "one") return invoke::Cardinality::One;
    return invoke::Cardinality::Many;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{
        "sproc-mapper - Stored Procedure Runner\n"
        "\n"
        "  Calls a stored procedure through ODBC with text parameters and\n"
        "  prints the rows it returns.\n"
        "\n"
        "Examples:\n"
        "  sproc-mapper \"DSN=Sales\" GetUser -p id=42 --expect one\n"
        "  sproc-mapper main DeleteUser -p id=42 --expect none --config connections.json\n"
        "  sproc-mapper main ListOrders -p since=2024-01-01 -o json -f orders.json\n",
        "sproc-mapper"
    };

    app.set_version_flag("--version,-V", SPROC_MAPPER_VERSION);

    std::string connection;
    app.add_option("connection", connection,
                   "Connection name from the catalog, or an ODBC connection string")
        ->required();

    std::string procedure;
    app.add_option("procedure", procedure, "Stored procedure name")
        ->required();

    std::vector<std::string> assignments;
    app.add_option("-p,--param", assignments, "Text parameter as name=value (repeatable)");

    std::vector<std::string> null_params;
    app.add_option("-n,--null", null_params, "Parameter bound as NULL (repeatable)");

    std::string expect = "many";
    app.add_option("--expect", expect, "Expected result: 'none', 'one' or 'many' (default)")
        ->check(CLI::IsMember({"none", "one", "many"}));

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Show the connection and bound parameters");

    std::string output_format = "console";
    app.add_option("-o,--output", output_format,
                   "Output format: 'console' (default) or 'json'")
        ->check(CLI::IsMember({"console", "json"}));

    std::string json_file;
    app.add_option("-f,--file", json_file, "Write JSON output to FILE instead of stdout");

    std::string config_file;
    app.add_option("--config", config_file, "JSON file with named connections")
        ->check(CLI::ExistingFile);

    std::string log_level;
    app.add_option("--log-level", log_level,
                   "Minimum log level: trace, debug, info, warn, error, fatal");

    std::string log_file;
    app.add_option("--log-file", log_file, "Append log records to FILE");

    CLI11_PARSE(app, argc, argv);

    auto& logger = core::Logger::instance();
    logger.configure_from_environment();
    if (!log_level.empty()) {
        auto level = core::parse_log_level(log_level);
        if (!level) {
            std::cerr << "Error: unknown log level '" << log_level << "'\n";
            return 3;
        }
        logger.set_level(*level);
    }
    if (!log_file.empty()) {
        logger.set_output(log_file);
    }

    try {
        invoke::ParameterList params;
        for (const auto& a : assignments) {
            params.push_back(parse_assignment(a));
        }
        for (const auto& name : null_params) {
            params.push_back(invoke::Parameter{name, std::monostate{}});
        }

        invoke::ProcedureInvoker invoker;
        invoke::ConnectionCatalog catalog;
        if (!config_file.empty()) {
            catalog = invoke::ConnectionCatalog::load_file(config_file);
        }
        auto resolved = catalog.resolve(connection);
        invoker.set_catalog(catalog);

        std::unique_ptr<reporting::Reporter> reporter;
        if (output_format == "json") {
            reporter = std::make_unique<reporting::JsonReporter>(json_file);
        } else {
            reporter = std::make_unique<reporting::ConsoleReporter>(std::cout, verbose);
        }

        invoke::ProcedureCall call{procedure, params, parse_expect(expect)};
        reporter->report_start(core::redact_connection_string(resolved), call);

        auto start = std::chrono::steady_clock::now();
        auto rows = invoker.fetch_rows(connection, params, procedure, call.cardinality);
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);

        reporter->report_rows(rows);
        reporter->report_summary(rows.size(), duration);
        reporter->report_end();
        return 0;

    } catch (const core::OdbcError& e) {
        std::cerr << "\nODBC Error: " << e.what() << "\n";
        std::cerr << e.format_diagnostics() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 3;
    }
}
