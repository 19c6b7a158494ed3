#include "log_parser.h"

#include <regex>
#include <sstream>

namespace texq {

namespace {

// ./chapter/intro.tex:42: Missing $ inserted.
const std::regex kFileLineError(R"(^((?:\./|/)[^:]+\.[A-Za-z]+):(\d+):\s*(.+)$)");
// ! LaTeX Error: Environment itemize undefined.
const std::regex kBangError(R"(^!\s+(.+)$)");
// l.27 \begin{itemiz}
const std::regex kErrorLineNumber(R"(^l\.(\d+)(?:\s|$))");
// LaTeX Warning: Reference `fig:foo' on page 3 undefined on input line 45.
const std::regex kWarning(R"(^(?:LaTeX|Package\s+(\S+)|Class\s+(\S+))\s+Warning:\s*(.+)$)");
// Warning--I didn't find a database entry for "knuth84"
const std::regex kBibtexWarning(R"(^Warning--(.+)$)");
const std::regex kWarningLine(R"(on input line (\d+))");
// Overfull \hbox (6.80882pt too wide) in paragraph at lines 28--32
const std::regex kBoxWarning(R"(^((?:Over|Under)full\s+\\[hv]box\s+.+)$)");
const std::regex kBoxLine(R"(at lines? (\d+))");

// TeX wraps its transcript at 79 columns; anything far longer is not a
// diagnostic and is kept away from the regex engine.
constexpr size_t kMaxScannedLine = 4096;
constexpr int kLineNumberLookahead = 5;

const char* const kTrackedExtensions[] = {
    ".tex", ".sty", ".cls", ".bib", ".bbl", ".aux", ".toc", ".lof", ".lot",
    ".clo", ".def", ".cfg", ".fd", ".ltx"
};

// A line that opens a diagnostic of its own ends any wrapped warning
bool starts_diagnostic(const std::string& line) {
    if (line.empty() || line[0] == '!' || line[0] == '(') return true;
    if (line.size() > kMaxScannedLine) return true;
    return std::regex_match(line, kFileLineError) || std::regex_match(line, kWarning) ||
           std::regex_match(line, kBibtexWarning) || std::regex_match(line, kBoxWarning);
}

int safe_int(const std::string& digits) {
    if (digits.empty() || digits.size() > 9) return 0;
    int value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return 0;
        value = value * 10 + (c - '0');
    }
    return value;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_tracked_file(const std::string& token) {
    if (token.empty()) return false;
    if (token[0] != '.' && token[0] != '/') return false;
    for (const char* ext : kTrackedExtensions) {
        if (ends_with(token, ext)) return true;
    }
    return false;
}

// Open/close bookkeeping: every "(" pushes either the file it opens or a
// placeholder, every ")" pops. The innermost real file is the current one.
class FileTracker {
public:
    void feed(const std::string& line) {
        for (size_t i = 0; i < line.size(); i++) {
            char c = line[i];
            if (c == '(') {
                size_t end = i + 1;
                while (end < line.size() && line[end] != ' ' && line[end] != '(' &&
                       line[end] != ')' && line[end] != '\t') {
                    end++;
                }
                std::string token = line.substr(i + 1, end - i - 1);
                stack_.push_back(is_tracked_file(token) ? token : std::string());
                i = end - 1;
            } else if (c == ')') {
                if (!stack_.empty()) stack_.pop_back();
            }
        }
    }

    std::string current() const {
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
            if (!it->empty()) return *it;
        }
        return "";
    }

private:
    std::vector<std::string> stack_;
};

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(text);
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string file_or_unknown(const std::string& file) {
    return file.empty() ? "unknown" : file;
}

} // namespace

std::vector<ParsedLogEntry> parse_latex_log(const std::string& raw_log) {
    std::vector<ParsedLogEntry> entries;
    const std::vector<std::string> lines = split_lines(raw_log);
    FileTracker files;

    for (size_t i = 0; i < lines.size(); i++) {
        const std::string& line = lines[i];
        if (line.size() > kMaxScannedLine) {
            continue;
        }
        std::smatch m;

        if (std::regex_match(line, m, kFileLineError)) {
            entries.push_back({LogEntryType::Error, m[1].str(), safe_int(m[2].str()),
                               trim(m[3].str())});
            continue;
        }

        if (std::regex_match(line, m, kBangError)) {
            int error_line = 0;
            size_t last = std::min(lines.size(), i + 1 + kLineNumberLookahead);
            for (size_t j = i + 1; j < last; j++) {
                std::smatch lm;
                if (std::regex_search(lines[j], lm, kErrorLineNumber)) {
                    error_line = safe_int(lm[1].str());
                    break;
                }
            }
            entries.push_back({LogEntryType::Error, file_or_unknown(files.current()),
                               error_line, trim(m[1].str())});
            continue;
        }

        if (std::regex_match(line, m, kWarning)) {
            std::string owner = m[1].matched ? m[1].str() : m[2].str();
            std::string text = trim(m[3].str());
            const std::string continuation_prefix = "(" + owner + ")";

            // Warnings wrap over several lines and end with a period
            size_t j = i + 1;
            while (j < lines.size() && !ends_with(text, ".")) {
                std::string next = trim(lines[j]);
                if (!owner.empty() && next.compare(0, continuation_prefix.size(),
                                                   continuation_prefix) == 0) {
                    next = trim(next.substr(continuation_prefix.size()));
                } else if (starts_diagnostic(next)) {
                    break;
                }
                text += " " + next;
                j++;
            }
            i = j - 1;

            std::smatch lm;
            int warning_line = std::regex_search(text, lm, kWarningLine) ? safe_int(lm[1].str()) : 0;
            entries.push_back({LogEntryType::Warning, file_or_unknown(files.current()),
                               warning_line, text});
            continue;
        }

        if (std::regex_match(line, m, kBibtexWarning)) {
            entries.push_back({LogEntryType::Warning, file_or_unknown(files.current()), 0,
                               trim(m[1].str())});
            continue;
        }

        if (std::regex_match(line, m, kBoxWarning)) {
            std::string text = trim(m[1].str());
            std::smatch lm;
            int box_line = std::regex_search(text, lm, kBoxLine) ? safe_int(lm[1].str()) : 0;
            entries.push_back({LogEntryType::Info, file_or_unknown(files.current()), box_line, text});
            continue;
        }

        // Source context lines echo user text, parentheses included
        if (std::regex_search(line, m, kErrorLineNumber)) {
            continue;
        }
        files.feed(line);
    }

    return entries;
}

LogSummary summarize_log(const std::string& raw_log) {
    LogSummary summary;
    summary.entries = parse_latex_log(raw_log);
    for (const auto& entry : summary.entries) {
        switch (entry.type) {
            case LogEntryType::Error: summary.error_count++; break;
            case LogEntryType::Warning: summary.warning_count++; break;
            case LogEntryType::Info: summary.info_count++; break;
        }
    }
    return summary;
}

std::vector<ParsedLogEntry> extract_errors(const std::string& raw_log) {
    std::vector<ParsedLogEntry> errors;
    for (auto& entry : parse_latex_log(raw_log)) {
        if (entry.type == LogEntryType::Error) {
            errors.push_back(std::move(entry));
        }
    }
    return errors;
}

std::string format_log_entries(const std::vector<ParsedLogEntry>& entries) {
    if (entries.empty()) {
        return "No issues found.";
    }

    std::ostringstream out;
    for (size_t i = 0; i < entries.size(); i++) {
        const auto& entry = entries[i];
        const char* prefix = entry.type == LogEntryType::Error ? "ERROR"
                           : entry.type == LogEntryType::Warning ? "WARN" : "INFO";
        if (i > 0) out << '\n';
        out << '[' << prefix << "] " << entry.file;
        if (entry.line > 0) out << ':' << entry.line;
        out << ": " << entry.message;
    }
    return out.str();
}

} // namespace texq
