#include "common.h"

#include "rsopt/io/document_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace rsopt::cli {

namespace fs = std::filesystem;

std::shared_ptr<storage::sqlite::SqliteDb> open_database(const std::string& path) {
  if (path != ":memory:") {
    const fs::path parent = fs::path(path).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
      fs::create_directories(parent, ec);
      if (ec) {
        throw std::runtime_error("Failed to create database directory " + parent.string() +
                                 ": " + ec.message());
      }
    }
  }

  auto db_result = storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    throw std::runtime_error(db_result.error());
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    throw std::runtime_error("Failed to initialize schema: " + schema_result.error());
  }
  return db;
}

optimize::OptimizerConfig load_optimizer_config(const std::optional<std::string>& path) {
  if (!path.has_value()) {
    return optimize::default_optimizer_config();
  }
  return optimize::config_from_json(read_text_file(path.value()));
}

std::string read_text_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream content;
  content << file.rdbuf();
  return content.str();
}

std::string read_document_text(const std::string& path) {
  const auto source = io::create_document_source(path);
  if (!source) {
    throw std::runtime_error("Unsupported file type: " + path + " (expected .docx or .txt)");
  }
  const auto result = source->read(path);
  if (!result.has_value()) {
    throw std::runtime_error(result.error().message);
  }
  return result.value().joined_text();
}

std::string resolve_job_description(const std::optional<std::string>& jd_text,
                                    const std::optional<std::string>& jd_file) {
  if (jd_text.has_value() == jd_file.has_value()) {
    throw std::invalid_argument("Provide exactly one of --jd <text> or --jd-file <path>");
  }
  if (jd_text.has_value()) {
    return jd_text.value();
  }
  return read_text_file(jd_file.value());
}

void report_warnings(const app::OptimizeReport& report) {
  for (const auto& change : report.change_log) {
    for (const auto& error : change.prediction_errors) {
      std::cerr << "Warning: paragraph " << change.paragraph_index << ": " << error << "\n";
    }
  }
  if (report.pdf_error.has_value()) {
    std::cerr << "Warning: PDF rendering failed: " << report.pdf_error.value() << "\n";
  }
}

void report_audit_failures(const storage::sqlite::SqliteAuditLog& audit_log) {
  if (audit_log.failed_appends() == 0) {
    return;
  }
  std::cerr << "Warning: " << audit_log.failed_appends() << " audit event(s) not recorded ("
            << audit_log.last_error().value_or("unknown error") << ")\n";
}

std::optional<std::size_t> parse_count(const std::string& value) {
  if (value.empty() || value.size() > 6) {
    return std::nullopt;
  }
  std::size_t count = 0;
  for (const char ch : value) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    count = count * 10 + static_cast<std::size_t>(ch - '0');
  }
  if (count == 0) {
    return std::nullopt;
  }
  return count;
}

}  // namespace rsopt::cli
