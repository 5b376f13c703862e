#include <pepver/normalize.hpp>
#include <pepver/log.hpp>
#include <pepver/text.hpp>
#include <pepver/version.hpp>

namespace pepver {

std::string Diagnostic::message() const {
    switch (kind) {
    case Normalized:
        return "version number '" + original + "' normalised to '" +
               result + "' (see PEP 440)";
    case AllowedInvalid:
        return "invalid version number '" + original + "' allowed by " +
               source;
    }
    return original;
}

void log_diagnostic(const Diagnostic& d) {
    log::warn("%s", d.message().c_str());
}

Result<std::string> normalize_version(const std::string& version,
                                      const NormalizeOptions& opts) {
    auto fields = match_version(version);
    if (!fields) {
        if (!opts.allow_invalid) {
            return PepverError{PepverError::InvalidVersion,
                "version number '" + version + "' does not match PEP 440 rules",
                "see https://peps.python.org/pep-0440/ for the accepted syntax"};
        }
        std::string lower = to_lower(version);
        if (opts.on_diagnostic) {
            opts.on_diagnostic(
                Diagnostic{Diagnostic::AllowedInvalid, version, lower});
        }
        return Result<std::string>::ok(std::move(lower));
    }

    std::string canonical = canonicalize(*fields);
    if (canonical != version && opts.on_diagnostic) {
        opts.on_diagnostic(
            Diagnostic{Diagnostic::Normalized, version, canonical});
    }
    return Result<std::string>::ok(std::move(canonical));
}

} // namespace pepver
