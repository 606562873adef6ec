#pragma once

// cmd_audit: print the audit events of one trace as a JSON array, or the known trace ids
// when no trace id is given.
// Usage: rsopt_cli audit [<trace-id>] [--db <path>]
int cmd_audit(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
