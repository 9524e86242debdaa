// Lightweight progress / formatting utilities for console output.
// Header-only, no .cc file needed.  All functions are inline.
//
// Everything is written to stderr: stdout may carry the count matrix
// when isodemux is run with "-o -".
//
// Features:
//   - TTY detection on stderr (cached once)
//   - ANSI color wrappers (no-op when stderr is not a TTY)
//   - Human-friendly formatting for durations and counts
//   - ProgressLine: overwriting single-line row counter for table reads
//   - Stage banners and status lines
//
// Dependencies: <string>, <cstdio>, <cstdint>, <chrono>, <unistd.h>

#pragma once

#include <string>
#include <cstdio>
#include <cstdint>
#include <chrono>
#include <unistd.h>

namespace progress {


// ── Clock / TTY detection ────────────────────────────────────────────

// Seconds on a monotonic clock.  Only differences are meaningful.
inline double now() {
    using clock = std::chrono::steady_clock;
    return std::chrono::duration<double>(clock::now().time_since_epoch()).count();
}

inline bool is_tty() {
    static const bool tty = isatty(fileno(stderr));
    return tty;
}


// ── ANSI color wrappers ─────────────────────────────────────────────
// Each returns the plain string when stderr is not a TTY.

namespace ansi {

inline std::string bold(const std::string &s) {
    return is_tty() ? "\033[1m" + s + "\033[0m" : s;
}
inline std::string green(const std::string &s) {
    return is_tty() ? "\033[32m" + s + "\033[0m" : s;
}
inline std::string yellow(const std::string &s) {
    return is_tty() ? "\033[33m" + s + "\033[0m" : s;
}
inline std::string red(const std::string &s) {
    return is_tty() ? "\033[31m" + s + "\033[0m" : s;
}

} // namespace ansi


// ── Duration / count formatting ─────────────────────────────────────

inline std::string format_duration(double secs) {
    if (secs < 0.01) return "0.0s";
    if (secs < 60.0) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%.1fs", secs);
        return buf;
    }
    int m = static_cast<int>(secs) / 60;
    int s = static_cast<int>(secs) % 60;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%dm%02ds", m, s);
    return buf;
}

inline std::string format_count(int64_t n) {
    if (n < 1000) return std::to_string(n);
    if (n < 1000000) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%.1fK", n / 1e3);
        return buf;
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.2fM", n / 1e6);
    return buf;
}

inline std::string format_rate(double per_sec) {
    if (per_sec < 1.0) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%.2f/s", per_sec);
        return buf;
    }
    return format_count(static_cast<int64_t>(per_sec)) + "/s";
}


// ── ProgressLine: overwriting row counter ───────────────────────────
//
// TTY:     \r-overwriting updates (throttled to 0.25s)
// Non-TTY: nothing until finish()
// finish() always prints a final summary with \n.

class ProgressLine {
    std::string label_;
    int64_t current_ = 0;
    double start_;
    double last_print_ = 0;
    bool tty_;

public:
    explicit ProgressLine(const std::string &label)
        : label_(label), start_(now()), tty_(is_tty()) {}

    void update(int64_t current) {
        current_ = current;
        if (!tty_) return;
        double t = now();
        if (t - last_print_ < 0.25) return;
        last_print_ = t;
        print(false);
    }

    void finish() {
        print(true);
    }

private:
    void print(bool final) {
        double elapsed = now() - start_;
        double rate = (current_ > 0 && elapsed > 0.001)
                          ? static_cast<double>(current_) / elapsed : 0;

        if (tty_) {
            std::string line = "  [" + label_ + "] " + format_count(current_)
                             + "  " + format_rate(rate);
            if (final) line += "  " + format_duration(elapsed);
            while (line.size() < 80) line += ' ';

            if (final) std::fprintf(stderr, "\r%s\n", line.c_str());
            else       std::fprintf(stderr, "\r%s", line.c_str());
        } else {
            std::fprintf(stderr, "  [%s] %s in %s\n",
                         label_.c_str(), format_count(current_).c_str(),
                         format_duration(elapsed).c_str());
        }
        std::fflush(stderr);
    }
};


// ── Stage banners / status lines ────────────────────────────────────

inline void print_banner(const std::string &text) {
    // "── text ──────────..."  (UTF-8 box-drawing horizontal line)
    std::string line = "\xe2\x94\x80\xe2\x94\x80 " + text + " ";
    while (line.size() < 60) line += "\xe2\x94\x80";
    std::fprintf(stderr, "\n%s\n", ansi::bold(line).c_str());
    std::fflush(stderr);
}

inline void print_status(const std::string &text) {
    std::fprintf(stderr, "  %s\n", text.c_str());
    std::fflush(stderr);
}

inline void print_warning(const std::string &text) {
    std::fprintf(stderr, "%s\n", ansi::yellow("WARNING: " + text).c_str());
    std::fflush(stderr);
}


} // namespace progress
