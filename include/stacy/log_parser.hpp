#pragma once

#include <stacy/result.hpp>
#include <stacy/error_codes.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace stacy {

// One uncaptured r() error found in a log.
struct ErrorOccurrence {
    ErrorCode code;
    size_t line = 0;            // 1-based; 0 when the window did not reach the file start
    size_t lines_from_end = 0;  // distance of the status marker from the last log line
    std::string context;        // error text printed above the r() line, if found
};

// Outcome of one execution attempt. Built once, never modified afterwards.
struct DetectionResult {
    bool success = false;
    std::vector<ErrorOccurrence> errors;
    int exit_code = 0;
    int signal = 0;             // non-zero when the process was killed
    bool incomplete = false;    // log ended without a completion marker
    double duration_secs = 0.0;
    std::string log_path;

    static DetectionResult from_signal(int sig, double duration_secs,
                                       std::string log_path);

    const ErrorOccurrence* primary_error() const {
        return errors.empty() ? nullptr : &errors.front();
    }
};

// ---------------------------------------------------------------------------
// TailWindow: fixed-size ring of the last K lines of a log
// ---------------------------------------------------------------------------

class TailWindow {
public:
    static constexpr size_t kDefaultLines = 200;
    static constexpr size_t kMaxBytes = 256 * 1024;
    static constexpr size_t kMaxLineLength = 4096;

    explicit TailWindow(size_t capacity = kDefaultLines);

    // Reads at most kMaxBytes from the end of the file, whatever its size.
    static Result<TailWindow> read_file(const std::string& path,
                                        size_t capacity = kDefaultLines);
    static TailWindow from_string(const std::string& text,
                                  size_t capacity = kDefaultLines);

    void push(std::string line);

    size_t size() const { return count_; }
    size_t capacity() const { return ring_.size(); }
    size_t total_pushed() const { return pushed_; }

    // 0 is the oldest retained line
    const std::string& at(size_t i) const;
    std::vector<std::string> lines() const;

    // Absolute 1-based line number of at(i), or 0 if unknown
    size_t line_number(size_t i) const;

private:
    std::vector<std::string> ring_;
    size_t head_ = 0;       // index of the oldest line
    size_t count_ = 0;
    size_t pushed_ = 0;
    bool from_start_ = true; // pushed lines began at the file's first line
};

// ---------------------------------------------------------------------------
// LogParser
// ---------------------------------------------------------------------------

class LogParser {
public:
    DetectionResult parse(const TailWindow& window) const;
    DetectionResult parse_text(const std::string& text) const;
    Result<DetectionResult> parse_file(const std::string& path,
                                       size_t window_lines = TailWindow::kDefaultLines) const;
};

// "end of do-file" (after trimming)
bool is_completion_marker(const std::string& line);

// "r(601);" with optional surrounding whitespace; sets `code`
bool parse_status_marker(const std::string& line, int& code);

// ". cmd", ".", "> continuation", "12. loop body"
bool is_command_echo(const std::string& trimmed);

} // namespace stacy
