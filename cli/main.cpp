#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "ovsql/diagnostics.h"
#include "ovsql/ovsql.h"
#include "ovsql/version.h"
#include "cli_args.h"

using namespace ovsql::cli;

namespace {

std::string read_stdin() {
  return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

}  // namespace

/// Entry point: reads one query from stdin and writes SQL for the named dialect to stdout.
/// MUST keep stdout empty on failure and MUST preserve exit codes for script usage.
int main(int argc, char** argv) {
  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    std::cerr << "Run 'ovsql --help' for usage.\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "ovsql " << ovsql::version_string() << std::endl;
    return 0;
  }

  int srid = 4326;
  if (!resolve_srid(options, std::getenv("OVSQL_SRID"), srid, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }

  // WHY: an unknown dialect is a configuration error and must be reported before stdin is consumed.
  std::unique_ptr<ovsql::Dialect> dialect;
  try {
    dialect = ovsql::make_dialect(options.dialect);
  } catch (const ovsql::UnsupportedDialectError& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  const std::string query = read_stdin();

  if (options.lint) {
    std::vector<ovsql::Diagnostic> diagnostics = ovsql::lint_query(query, dialect->name());
    if (options.format == "json") {
      std::cout << ovsql::render_diagnostics_json(diagnostics) << std::endl;
    } else if (diagnostics.empty()) {
      std::cout << "No diagnostics." << std::endl;
    } else {
      std::cout << ovsql::render_diagnostics_text(diagnostics);
    }
    return ovsql::has_error_diagnostics(diagnostics) ? 1 : 0;
  }

  try {
    if (options.emit == "ast") {
      std::cout << ovsql::dump_query_ast(query);
      return 0;
    }
    ovsql::CompileOptions compile_options;
    compile_options.srid = srid;
    const ovsql::SqlScript script = ovsql::compile_query(query, *dialect, compile_options);
    std::cout << script.to_string();
    return 0;
  } catch (const ovsql::Error& e) {
    std::cerr << ovsql::render_diagnostics_text({ovsql::diagnose_failure(query, e)});
    return 1;
  }
}
