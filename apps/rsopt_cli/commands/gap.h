#pragma once

// cmd_gap: list job-description keywords missing from a resume, in insertion order.
// Usage: rsopt_cli gap <resume-file> (--jd <text> | --jd-file <path>) [--config <file.json>]
int cmd_gap(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
