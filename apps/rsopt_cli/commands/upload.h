#pragma once

// cmd_upload: copy a resume into the uploads directory and register it.
// Usage: rsopt_cli upload <file.docx|file.txt> --user <user-id> [--db <path>]
//                         [--uploads-dir <dir>]
// Prints the stored record as JSON.
int cmd_upload(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
