#pragma once

#include <string>
#include <vector>

#include "job.h"

namespace texq {

struct LogSummary {
    int error_count = 0;
    int warning_count = 0;
    int info_count = 0;
    std::vector<ParsedLogEntry> entries;
};

// Parses a raw LaTeX/latexmk transcript into structured diagnostics.
//
// Pure and deterministic: the same text always yields the same entries, so
// persisted logs can be re-parsed at any time. Never throws. When a line
// number cannot be located unambiguously the entry carries line 0 instead
// of a guess.
std::vector<ParsedLogEntry> parse_latex_log(const std::string& raw_log);

LogSummary summarize_log(const std::string& raw_log);

std::vector<ParsedLogEntry> extract_errors(const std::string& raw_log);

// "[ERROR] ./main.tex:12: message" lines, or "No issues found."
std::string format_log_entries(const std::vector<ParsedLogEntry>& entries);

} // namespace texq
