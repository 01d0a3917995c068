#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace ovsql::cli {

/// Options collected from argv.
struct CliOptions {
  std::string dialect;
  std::optional<int> srid;
  std::string emit = "sql";
  bool lint = false;
  std::string format = "text";
  bool show_help = false;
  bool show_version = false;
};

/// Prints usage, flags and exit codes.
/// MUST stay synchronized with supported flags and MUST not throw on stream errors.
void print_help(std::ostream& os);

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false with a message for unknown flags, bad values and a missing dialect.
/// The dialect name itself is validated later, by the dialect registry.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

/// Picks the storage SRID: `--srid` first, then the OVSQL_SRID value, then 4326.
/// `env_value` may be null. MUST return false for a non-positive or non-numeric value.
bool resolve_srid(const CliOptions& options, const char* env_value, int& srid, std::string& error);

}  // namespace ovsql::cli
