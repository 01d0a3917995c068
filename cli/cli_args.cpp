#include "cli_args.h"

#include <sstream>
#include <string>

namespace ovsql::cli {

namespace {

bool parse_srid(const std::string& text, int& srid) {
  std::istringstream in(text);
  int value = 0;
  if (!(in >> value) || !in.eof() || value <= 0) return false;
  srid = value;
  return true;
}

}  // namespace

void print_help(std::ostream& os) {
  os << "Usage: ovsql [--srid <n>] [--emit sql|ast] <postgres|duckdb> < query.overpassql\n";
  os << "       ovsql --lint [--format text|json] <postgres|duckdb> < query.overpassql\n";
  os << "       ovsql --help | --version\n";
  os << "The query is read from stdin; SQL is written to stdout.\n";
  os << "--srid sets the SRID of the stored geometries (default: $OVSQL_SRID, else 4326).\n";
  os << "--emit ast prints the parsed query as JSON instead of SQL.\n";
  os << "--lint validates syntax and set usage without emitting SQL.\n";
  os << "--format json emits lint diagnostics as a JSON array.\n";
  os << "Query comments are supported: // ... and /* ... */.\n";
  os << "Exit codes: 0=success, 1=syntax/compile error, 2=CLI/configuration error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--srid") {
      if (i + 1 >= argc) {
        error = "Missing value for --srid";
        return false;
      }
      int srid = 0;
      if (!parse_srid(argv[++i], srid)) {
        error = "Invalid --srid value (use a positive integer)";
        return false;
      }
      parsed.srid = srid;
    } else if (arg == "--emit") {
      if (i + 1 >= argc) {
        error = "Missing value for --emit";
        return false;
      }
      parsed.emit = argv[++i];
      if (parsed.emit != "sql" && parsed.emit != "ast") {
        error = "Invalid --emit value (use sql|ast)";
        return false;
      }
    } else if (arg == "--lint") {
      parsed.lint = true;
    } else if (arg == "--format") {
      if (i + 1 >= argc) {
        error = "Missing value for --format";
        return false;
      }
      parsed.format = argv[++i];
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "Unknown argument: " + arg;
      return false;
    } else if (parsed.dialect.empty()) {
      parsed.dialect = arg;
    } else {
      error = "Unexpected argument: " + arg + " (only one dialect may be given)";
      return false;
    }
  }
  if (!parsed.lint && parsed.format != "text") {
    error = "--format is only supported with --lint";
    return false;
  }
  if (parsed.format != "text" && parsed.format != "json") {
    error = "Invalid --format value (use text|json)";
    return false;
  }
  if (parsed.lint && parsed.emit != "sql") {
    error = "--lint and --emit are mutually exclusive";
    return false;
  }
  if (parsed.dialect.empty() && !parsed.show_help && !parsed.show_version) {
    error = "Missing dialect argument (use postgres|duckdb)";
    return false;
  }
  options = parsed;
  return true;
}

bool resolve_srid(const CliOptions& options, const char* env_value, int& srid, std::string& error) {
  if (options.srid.has_value()) {
    srid = *options.srid;
    return true;
  }
  if (env_value != nullptr && *env_value != '\0') {
    if (!parse_srid(env_value, srid)) {
      error = "Invalid OVSQL_SRID value (use a positive integer)";
      return false;
    }
    return true;
  }
  srid = 4326;
  return true;
}

}  // namespace ovsql::cli
