#include "rsopt/domain/keyword.h"

#include "rsopt/core/normalization.h"

#include <set>
#include <string>

namespace rsopt::domain {

namespace {

const std::set<std::string>& technology_vocabulary() {
  // Languages, tools, frameworks, platforms and role terms.
  static const std::set<std::string> kVocabulary = {
      "python",      "java",          "c++",          "c#",          "javascript",
      "typescript",  "rust",          "go",           "golang",      "kotlin",
      "swift",       "scala",         "ruby",         "php",         "sql",
      "nosql",       "docker",        "kubernetes",   "k8s",         "aws",
      "gcp",         "azure",         "react",        "angular",     "vue",
      "django",      "flask",         "spring",       "node",        "node.js",
      ".net",        "git",           "ci/cd",        "terraform",   "ansible",
      "jenkins",     "cmake",         "gradle",       "maven",       "pytest",
      "junit",       "tdd",           "agile",        "scrum",       "rest",
      "graphql",     "grpc",          "mongodb",      "postgresql",  "mysql",
      "redis",       "kafka",         "spark",        "hadoop",      "airflow",
      "tensorflow",  "pytorch",       "scikit-learn", "pandas",      "numpy",
      "linux",       "bash",          "microservices", "serverless", "cloud",
      "devops",      "mlops",         "backend",      "frontend",    "fullstack",
      "api",         "apis",          "containerization", "orchestration", "pipelines",
      "analytics",   "machine",       "learning",     "neural",      "networks",
      "deployment",  "monitoring",    "observability", "security",   "database",
      "distributed", "architecture",  "infrastructure", "automation", "testing",
      "engineer",    "developer",     "architect",    "lead",        "principal",
      "manager",     "analyst",       "scientist",    "consultant",  "specialist",
  };
  return kVocabulary;
}

}  // namespace

bool is_known_technology(const std::string_view keyword) {
  const auto& vocabulary = technology_vocabulary();
  const std::string lowered = core::normalize_ascii_lower(keyword);
  if (vocabulary.contains(lowered)) {
    return true;
  }
  for (const auto& word : core::split_words(lowered)) {
    if (vocabulary.contains(word)) {
      return true;
    }
  }
  return false;
}

bool is_acronym(const std::string_view keyword) {
  if (keyword.size() < 2 || keyword.size() > 5) {
    return false;
  }
  for (const char ch : keyword) {
    if (ch < 'A' || ch > 'Z') {
      return false;
    }
  }
  return true;
}

bool is_technical_keyword(const std::string_view keyword) {
  if (is_known_technology(keyword)) {
    return true;
  }
  for (const char ch : keyword) {
    if (core::is_ascii_digit(ch)) {
      return true;
    }
  }
  if (is_acronym(keyword)) {
    return true;
  }
  // Fallback keeps soft-skill heavy job descriptions from yielding nothing.
  return keyword.size() > 3;
}

std::vector<std::string> keyword_texts(const std::vector<Keyword>& keywords) {
  std::vector<std::string> texts;
  texts.reserve(keywords.size());
  for (const auto& keyword : keywords) {
    texts.push_back(keyword.text);
  }
  return texts;
}

}  // namespace rsopt::domain
