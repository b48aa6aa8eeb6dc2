#include <stacy/log_parser.hpp>
#include <stacy/log.hpp>

#include <cctype>
#include <fstream>

namespace stacy {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static const size_t kMaxContextLines = 3;

// ---------------------------------------------------------------------------
// Markers
// ---------------------------------------------------------------------------

bool is_completion_marker(const std::string& line) {
    return trim(line) == "end of do-file";
}

bool parse_status_marker(const std::string& line, int& code) {
    std::string t = trim(line);
    // r(<digits>);
    if (t.size() < 5 || t.compare(0, 2, "r(") != 0) return false;
    if (t.compare(t.size() - 2, 2, ");") != 0) return false;
    std::string digits = t.substr(2, t.size() - 4);
    if (digits.empty() || digits.size() > 9) return false;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    code = std::stoi(digits);
    return true;
}

bool is_command_echo(const std::string& trimmed) {
    if (trimmed == "." || trimmed.compare(0, 2, ". ") == 0) return true;
    if (trimmed.compare(0, 2, "> ") == 0) return true;

    // Numbered loop body echo: "2. ", "10."
    size_t i = 0;
    while (i < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[i]))) ++i;
    if (i == 0 || i >= trimmed.size() || trimmed[i] != '.') return false;
    ++i;
    return i == trimmed.size() || trimmed[i] == ' ';
}

// ---------------------------------------------------------------------------
// DetectionResult
// ---------------------------------------------------------------------------

DetectionResult DetectionResult::from_signal(int sig, double duration_secs,
                                             std::string log_path) {
    DetectionResult r;
    r.success = false;
    r.signal = sig;
    r.exit_code = signal_exit_code(sig);
    r.duration_secs = duration_secs;
    r.log_path = std::move(log_path);
    return r;
}

// ---------------------------------------------------------------------------
// TailWindow
// ---------------------------------------------------------------------------

TailWindow::TailWindow(size_t capacity)
    : ring_(capacity == 0 ? 1 : capacity) {}

void TailWindow::push(std::string line) {
    if (line.size() > kMaxLineLength) {
        line.resize(kMaxLineLength);
    }
    size_t slot = (head_ + count_) % ring_.size();
    if (count_ == ring_.size()) {
        // Full: overwrite the oldest line
        ring_[head_] = std::move(line);
        head_ = (head_ + 1) % ring_.size();
    } else {
        ring_[slot] = std::move(line);
        ++count_;
    }
    ++pushed_;
}

const std::string& TailWindow::at(size_t i) const {
    return ring_[(head_ + i) % ring_.size()];
}

std::vector<std::string> TailWindow::lines() const {
    std::vector<std::string> out;
    out.reserve(count_);
    for (size_t i = 0; i < count_; ++i) out.push_back(at(i));
    return out;
}

size_t TailWindow::line_number(size_t i) const {
    if (!from_start_) return 0;
    return pushed_ - count_ + i + 1;
}

TailWindow TailWindow::from_string(const std::string& text, size_t capacity) {
    TailWindow w(capacity);
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = (nl == std::string::npos) ? text.size() : nl;
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        w.push(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return w;
}

Result<TailWindow> TailWindow::read_file(const std::string& path, size_t capacity) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return StacyError{StacyError::NotFound, "log file not found: " + path};
    }

    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size < 0) {
        return StacyError{StacyError::IO, "cannot determine size of log: " + path};
    }

    std::streamoff offset = 0;
    if (size > static_cast<std::streamoff>(kMaxBytes)) {
        offset = size - static_cast<std::streamoff>(kMaxBytes);
    }
    in.seekg(offset, std::ios::beg);

    std::string chunk(static_cast<size_t>(size - offset), '\0');
    in.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
    chunk.resize(static_cast<size_t>(in.gcount()));

    if (offset > 0) {
        // The first line is a fragment
        size_t nl = chunk.find('\n');
        chunk.erase(0, nl == std::string::npos ? chunk.size() : nl + 1);
    }

    TailWindow w = from_string(chunk, capacity);
    w.from_start_ = (offset == 0);
    log::trace("read %zu tail lines from %s (%lld bytes, offset %lld)",
               w.size(), path.c_str(), static_cast<long long>(size),
               static_cast<long long>(offset));
    return Result<TailWindow>::ok(std::move(w));
}

// ---------------------------------------------------------------------------
// LogParser
// ---------------------------------------------------------------------------

// Text printed above the first body occurrence of r(code); before `end`.
static std::string extract_context(const std::vector<std::string>& lines,
                                   size_t end, int code) {
    std::string target = "r(" + std::to_string(code) + ");";
    size_t body_idx = end;
    for (size_t i = 0; i < end; ++i) {
        if (trim(lines[i]) == target) {
            body_idx = i;
            break;
        }
    }
    if (body_idx == end) return "";

    std::vector<std::string> collected;
    for (size_t i = body_idx; i-- > 0;) {
        std::string t = trim(lines[i]);
        if (t.empty()) {
            if (!collected.empty()) break;
            continue;
        }
        if (t == "--Break--") continue;
        if (is_command_echo(t)) break;
        collected.push_back(t);
        if (collected.size() >= kMaxContextLines) break;
    }

    std::string out;
    for (size_t i = collected.size(); i-- > 0;) {
        if (!out.empty()) out += "\n";
        out += collected[i];
    }
    return out;
}

DetectionResult LogParser::parse(const TailWindow& window) const {
    std::vector<std::string> lines = window.lines();
    DetectionResult result;

    // Last completion marker: nested do-files each emit their own
    size_t marker = lines.size();
    for (size_t i = lines.size(); i-- > 0;) {
        if (is_completion_marker(lines[i])) {
            marker = i;
            break;
        }
    }

    if (marker == lines.size()) {
        result.success = false;
        result.incomplete = true;
        result.exit_code = static_cast<int>(ExitClass::StataError);
        return result;
    }

    for (size_t i = marker + 1; i < lines.size(); ++i) {
        std::string t = trim(lines[i]);
        if (t.empty() || t == "--Break--") continue;

        int code = 0;
        if (!parse_status_marker(t, code)) break;

        ErrorOccurrence occ;
        occ.code = classify_error_code(code);
        occ.line = window.line_number(i);
        occ.lines_from_end = lines.size() - 1 - i;
        occ.context = extract_context(lines, marker, code);

        result.success = false;
        result.exit_code = static_cast<int>(occ.code.exit_class());
        result.errors.push_back(std::move(occ));
        return result;
    }

    result.success = true;
    result.exit_code = static_cast<int>(ExitClass::Success);
    return result;
}

DetectionResult LogParser::parse_text(const std::string& text) const {
    return parse(TailWindow::from_string(text));
}

Result<DetectionResult> LogParser::parse_file(const std::string& path,
                                              size_t window_lines) const {
    auto window = TailWindow::read_file(path, window_lines);
    if (window.is_err()) return std::move(window).error();
    DetectionResult r = parse(window.value());
    r.log_path = path;
    return Result<DetectionResult>::ok(std::move(r));
}

} // namespace stacy
