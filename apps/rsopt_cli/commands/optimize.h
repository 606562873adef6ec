#pragma once

// cmd_optimize: optimize a stored resume against a job description.
// Usage: rsopt_cli optimize <resume-id> --user <user-id> (--jd <text> | --jd-file <path>)
//                           [--no-pdf] [--predictor-cmd <cmd>] [--soffice-cmd <cmd>]
//                           [--db <path>] [--config <file.json>] [--optimized-dir <dir>]
// --predictor-cmd names a program called as `<cmd> '<context with [MASK]>' <top_k>` that
// prints a JSON array of candidates. Without it the template phrasing is used.
// --soffice-cmd "" disables LibreOffice conversion; the built-in text PDF renderer remains.
// Prints the optimization report as JSON and warnings on stderr; exits 1 when the run failed.
int cmd_optimize(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
