#pragma once

#include <resmerge/diag/DiagCode.hpp>

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::log {

enum class ColorMode : uint8_t {
    kAuto,
    kAlways,
    kNever,
};

bool parse_color_mode(std::string_view text, ColorMode& out);

/// Console reporting for one run. Writes tagged lines to stderr (or the given stream);
/// whole lines are written under a lock so workers may report too.
class Reporter {
public:
    Reporter();
    Reporter(std::ostream& os, ColorMode color, bool progress, bool verbose);

    void set_color(ColorMode c) { color_ = c; }
    void set_progress(bool on) { progress_ = on; }
    void set_verbose(bool on) { verbose_ = on; }
    bool verbose() const { return verbose_; }

    void progress(int pct, std::string_view message);
    void warn(std::string_view message);
    void fail(std::string_view message);
    void done(std::string_view message);
    void note(std::string_view message);
    void command(const std::vector<std::string>& argv);

    /// Emits every diagnostic of `bag`: notes only when verbose.
    void report(const diag::Bag& bag);

private:
    bool use_color() const;
    std::string paint(std::string_view text, const char* ansi) const;
    std::string tag(std::string_view text, const char* ansi) const;
    void emit(const std::string& line);

    std::mutex mu_{};
    std::ostream* os_ = nullptr;
    bool to_stderr_ = true;
    ColorMode color_ = ColorMode::kAuto;
    bool progress_ = true;
    bool verbose_ = false;
};

} // namespace resmerge::log
