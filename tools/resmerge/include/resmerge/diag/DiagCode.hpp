#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace resmerge::diag {

enum class Code : uint16_t {
    kConfigurationContradiction = 1,
    kExternalToolFailure,
    kPolicyMismatch,
    kMissingResource,

    kIoFailure = 100,
    kInvariantViolation,
};

enum class Severity : uint8_t {
    kNote,
    kWarning,
    kError,
};

inline const char* code_name(Code c) {
    switch (c) {
        case Code::kConfigurationContradiction: return "CONFIGURATION_CONTRADICTION";
        case Code::kExternalToolFailure: return "EXTERNAL_TOOL_FAILURE";
        case Code::kPolicyMismatch: return "POLICY_MISMATCH";
        case Code::kMissingResource: return "MISSING_RESOURCE";
        case Code::kIoFailure: return "IO_FAILURE";
        case Code::kInvariantViolation: return "INVARIANT_VIOLATION";
    }
    return "UNKNOWN";
}

inline const char* severity_name(Severity s) {
    switch (s) {
        case Severity::kNote: return "note";
        case Severity::kWarning: return "warning";
        case Severity::kError: return "error";
    }
    return "error";
}

struct Diagnostic {
    Severity severity = Severity::kError;
    Code code{};
    std::string subject{};
    std::string message{};
};

class Bag {
public:
    void error(Code code, std::string subject, std::string message) {
        diagnostics_.push_back(Diagnostic{Severity::kError, code, std::move(subject), std::move(message)});
    }

    void warning(Code code, std::string subject, std::string message) {
        diagnostics_.push_back(Diagnostic{Severity::kWarning, code, std::move(subject), std::move(message)});
    }

    void note(std::string subject, std::string message) {
        diagnostics_.push_back(Diagnostic{Severity::kNote, Code{}, std::move(subject), std::move(message)});
    }

    bool has_error() const {
        for (const auto& d : diagnostics_) {
            if (d.severity == Severity::kError) return true;
        }
        return false;
    }

    bool has_code(Code code) const {
        for (const auto& d : diagnostics_) {
            if (d.severity == Severity::kError && d.code == code) return true;
        }
        return false;
    }

    size_t error_count() const {
        size_t n = 0;
        for (const auto& d : diagnostics_) {
            if (d.severity == Severity::kError) ++n;
        }
        return n;
    }

    const std::vector<Diagnostic>& all() const { return diagnostics_; }

    void merge(Bag&& other) {
        for (auto& d : other.diagnostics_) diagnostics_.push_back(std::move(d));
        other.diagnostics_.clear();
    }

    std::string render_text() const {
        std::ostringstream oss;
        for (const auto& d : diagnostics_) {
            if (d.severity == Severity::kNote) {
                oss << "note: " << d.message << "\n";
            } else {
                oss << severity_name(d.severity) << "[" << code_name(d.code) << "]: " << d.message << "\n";
            }
            if (!d.subject.empty()) oss << " --> " << d.subject << "\n";
        }
        return oss.str();
    }

private:
    std::vector<Diagnostic> diagnostics_{};
};

} // namespace resmerge::diag
