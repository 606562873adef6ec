#pragma once

// cmd_keywords: extract the most frequent keywords of a .docx/.txt file.
// Usage: rsopt_cli keywords <file> [--top <k>] [--config <file.json>]
// --top defaults to the configured jd_top_k.
int cmd_keywords(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
