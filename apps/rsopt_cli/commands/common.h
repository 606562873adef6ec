#pragma once

#include "rsopt/app/app_service.h"
#include "rsopt/optimize/optimizer_config.h"
#include "rsopt/storage/sqlite/sqlite_audit_log.h"
#include "rsopt/storage/sqlite/sqlite_db.h"

#include "shared/arg_parser.h"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rsopt::cli {

// Flags shared by every subcommand.
struct CommonConfig {
  std::string db_path{"data/rsopt.db"};
  std::optional<std::string> config_path;
  app::StoragePaths paths;
};

// Appends --db, --config, --uploads-dir and --optimized-dir to options. Config must have a
// CommonConfig member named common.
template <typename Config>
void add_common_options(std::vector<apps::Option<Config>>& options) {
  options.push_back({"--db", true, "SQLite database file (default data/rsopt.db)",
                     [](Config& c, const std::string& v) {
                       c.common.db_path = v;
                       return !v.empty();
                     }});
  options.push_back({"--config", true, "Optimizer configuration JSON file",
                     [](Config& c, const std::string& v) {
                       c.common.config_path = v;
                       return !v.empty();
                     }});
  options.push_back({"--uploads-dir", true, "Directory for uploaded originals",
                     [](Config& c, const std::string& v) {
                       c.common.paths.uploads_dir = v;
                       return !v.empty();
                     }});
  options.push_back({"--optimized-dir", true, "Directory for optimized outputs",
                     [](Config& c, const std::string& v) {
                       c.common.paths.optimized_dir = v;
                       return !v.empty();
                     }});
}

// Prints every parse error to stderr. Returns true when there were none.
template <typename Config>
bool report_parse_errors(const apps::ParsedArgs<Config>& parsed) {
  for (const auto& error : parsed.errors) {
    std::cerr << "Error: " << error << "\n";
  }
  return parsed.ok();
}

// Opens the database (creating its directory) and applies the schema.
// Throws std::runtime_error on failure.
[[nodiscard]] std::shared_ptr<storage::sqlite::SqliteDb> open_database(const std::string& path);

// Defaults, overlaid with the JSON file when one is given. Throws std::runtime_error.
[[nodiscard]] optimize::OptimizerConfig load_optimizer_config(
    const std::optional<std::string>& path);

// Whole file as a string. Throws std::runtime_error.
[[nodiscard]] std::string read_text_file(const std::string& path);

// Paragraph texts of a .docx/.txt file joined by newlines. Throws std::runtime_error.
[[nodiscard]] std::string read_document_text(const std::string& path);

// Job description from --jd or --jd-file (exactly one). Throws std::invalid_argument.
[[nodiscard]] std::string resolve_job_description(const std::optional<std::string>& jd_text,
                                                  const std::optional<std::string>& jd_file);

// Prints PDF and prediction failures of a finished run to stderr as warnings.
void report_warnings(const app::OptimizeReport& report);

// Prints a warning to stderr when audit events could not be stored.
void report_audit_failures(const storage::sqlite::SqliteAuditLog& audit_log);

// Positive integer flag value, nullopt when malformed.
[[nodiscard]] std::optional<std::size_t> parse_count(const std::string& value);

}  // namespace rsopt::cli
