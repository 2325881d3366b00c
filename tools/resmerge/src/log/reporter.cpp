#include <resmerge/log/Reporter.hpp>

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace resmerge::log {

namespace {

constexpr const char* kAnsiReset = "\033[0m";
constexpr const char* kAnsiGreen = "\033[32m";
constexpr const char* kAnsiRed = "\033[31m";
constexpr const char* kAnsiOrange = "\033[38;5;208m";
constexpr const char* kAnsiCyan = "\033[36m";

std::string quote_arg(const std::string& a) {
    if (!a.empty() && a.find_first_of(" \t\"'\\$") == std::string::npos) return a;
    std::string out = "'";
    for (char c : a) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace

bool parse_color_mode(std::string_view text, ColorMode& out) {
    if (text == "auto") out = ColorMode::kAuto;
    else if (text == "always") out = ColorMode::kAlways;
    else if (text == "never") out = ColorMode::kNever;
    else return false;
    return true;
}

Reporter::Reporter()
    : os_(&std::cerr), to_stderr_(true) {}

Reporter::Reporter(std::ostream& os, ColorMode color, bool progress, bool verbose)
    : os_(&os), to_stderr_(&os == &std::cerr), color_(color), progress_(progress), verbose_(verbose) {}

bool Reporter::use_color() const {
    if (color_ == ColorMode::kNever) return false;
    if (color_ == ColorMode::kAlways) return true;
    if (std::getenv("NO_COLOR") != nullptr) return false;
    if (!to_stderr_) return false;
    return isatty(fileno(stderr)) != 0;
}

std::string Reporter::paint(std::string_view text, const char* ansi) const {
    if (!use_color()) return std::string(text);
    return std::string(ansi) + std::string(text) + kAnsiReset;
}

std::string Reporter::tag(std::string_view text, const char* ansi) const {
    if (!use_color()) return "[" + std::string(text) + "]";
    return "[" + std::string(ansi) + std::string(text) + kAnsiReset + "]";
}

void Reporter::emit(const std::string& line) {
    std::lock_guard<std::mutex> lock(mu_);
    *os_ << line << "\n";
}

void Reporter::progress(int pct, std::string_view message) {
    if (!progress_) return;
    std::ostringstream oss;
    oss << "[" << std::setw(3) << pct << "%]";
    emit(paint(oss.str(), kAnsiGreen) + " " + std::string(message));
}

void Reporter::warn(std::string_view message) {
    emit(tag("WARN", kAnsiOrange) + " " + std::string(message));
}

void Reporter::fail(std::string_view message) {
    emit(tag("FAIL", kAnsiRed) + " " + std::string(message));
}

void Reporter::done(std::string_view message) {
    if (!progress_) return;
    emit(tag("DONE", kAnsiGreen) + " " + std::string(message));
}

void Reporter::note(std::string_view message) {
    if (!verbose_) return;
    emit(tag("NOTE", kAnsiCyan) + " " + std::string(message));
}

void Reporter::command(const std::vector<std::string>& argv) {
    if (!verbose_) return;
    std::string line{};
    for (const auto& a : argv) {
        if (!line.empty()) line.push_back(' ');
        line += quote_arg(a);
    }
    emit(tag("EXEC", kAnsiCyan) + " " + line);
}

void Reporter::report(const diag::Bag& bag) {
    for (const auto& d : bag.all()) {
        std::string msg = d.message;
        if (!d.subject.empty()) msg += " (" + d.subject + ")";
        switch (d.severity) {
            case diag::Severity::kNote:
                note(msg);
                break;
            case diag::Severity::kWarning:
                warn(msg);
                break;
            case diag::Severity::kError:
                fail(std::string(diag::code_name(d.code)) + ": " + msg);
                break;
        }
    }
}

} // namespace resmerge::log
