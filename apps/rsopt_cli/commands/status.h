#pragma once

// cmd_status: print a stored resume record as JSON.
// Usage: rsopt_cli status <resume-id> [--user <user-id>] [--db <path>]
// With --user the record must belong to that user.
int cmd_status(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
