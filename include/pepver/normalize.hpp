#pragma once

#include <pepver/result.hpp>
#include <functional>
#include <string>

namespace pepver {

// Advisory event raised when normalization changes the caller's text.
struct Diagnostic {
    enum Kind {
        Normalized,       // valid input rewritten to its canonical form
        AllowedInvalid    // invalid input passed through by the override
    };

    Kind kind;
    std::string original;
    std::string result;
    std::string source = "allow-invalid";  // setting that enabled the override

    std::string message() const;
};

using DiagnosticFn = std::function<void(const Diagnostic&)>;

struct NormalizeOptions {
    // Return the lowercased input instead of failing on invalid versions
    bool allow_invalid = false;
    // Optional; called for every Diagnostic
    DiagnosticFn on_diagnostic;
};

// Normalize a version number according to the rules in PEP 440:
// https://peps.python.org/pep-0440/#normalization
//
// Fails with PepverError::InvalidVersion when the string does not match
// the permissive grammar, unless opts.allow_invalid is set.
Result<std::string> normalize_version(const std::string& version,
                                      const NormalizeOptions& opts = {});

// DiagnosticFn that reports through log::warn. Safe to call from several
// threads once the logger has been configured.
void log_diagnostic(const Diagnostic& d);

} // namespace pepver
