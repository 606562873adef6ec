#include "commands/audit.h"
#include "commands/gap.h"
#include "commands/keywords.h"
#include "commands/optimize.h"
#include "commands/status.h"
#include "commands/upload.h"
#include "rsopt/core/version.h"

#include <iostream>
#include <string>
#include <unordered_map>

namespace {

using CommandFn = int (*)(int, char**);

void print_usage() {
  std::cerr << "rsopt_cli v" << rsopt::core::kBuildVersion << "\n"
            << "Usage: rsopt_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  upload <file> --user <id>              Register a .docx/.txt resume\n"
            << "  optimize <resume-id> --user <id> (--jd <text> | --jd-file <path>)\n"
            << "                                         Insert missing job keywords\n"
            << "  status <resume-id> [--user <id>]       Show a resume record\n"
            << "  keywords <file> [--top <k>]            Extract keywords from a file\n"
            << "  gap <resume-file> (--jd | --jd-file)   List missing keywords\n"
            << "  audit [<trace-id>]                     Show an audit trace\n\n"
            << "Common options: --db <path> --config <file.json> --uploads-dir <dir> "
               "--optimized-dir <dir>\n";
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::unordered_map<std::string, CommandFn> commands = {
      {"upload", cmd_upload},     {"optimize", cmd_optimize}, {"status", cmd_status},
      {"keywords", cmd_keywords}, {"gap", cmd_gap},           {"audit", cmd_audit},
  };

  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (subcommand == "--version" || subcommand == "version") {
    std::cout << "rsopt_cli v" << rsopt::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  const auto it = commands.find(subcommand);
  if (it == commands.end()) {
    std::cerr << "Unknown command: " << subcommand << "\n\n";
    print_usage();
    return 1;
  }
  return it->second(argc, argv);
}
