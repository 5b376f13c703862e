#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pepver {

// Numeric components are kept as the decimal digits that were matched
// (e.g. "007"), so components of any length survive unchanged until
// canonicalize() strips their leading zeros.

// Pre-release: a1, b2, rc3 (also alpha, beta, c, pre, preview)
struct PreRelease {
    std::string tag;                    // as matched, e.g. "alpha"
    std::optional<std::string> number;  // absent means 0
};

// Post-release has two surface forms: "-N" and an explicit tag
struct PostRelease {
    enum class Form { Implicit, Tagged };

    Form form = Form::Tagged;
    std::string tag;                    // "post", "rev" or "r"; empty for Implicit
    std::optional<std::string> number;  // always set for Implicit
};

struct DevRelease {
    std::optional<std::string> number;  // absent means 0
};

// Decomposition of a version string that matched the permissive
// PEP 440 grammar:
//
//   [N!]N(.N)*[{a|b|rc}N][.postN][.devN][+local]
struct VersionFields {
    std::optional<std::string> epoch;
    std::vector<std::string> release;   // never empty after a match
    std::optional<PreRelease> pre;
    std::optional<PostRelease> post;
    std::optional<DevRelease> dev;
    std::vector<std::string> local;     // empty when there is no +label

    // Same as canonicalize(*this)
    std::string to_string() const;
};

// Matches `version` end-to-end against the permissive grammar. Leading and
// trailing whitespace and a leading 'v' are skipped, letters are compared
// case-insensitively. Returns nullopt when the string does not match.
std::optional<VersionFields> match_version(const std::string& version);

// Maps a pre-release spelling to its canonical form ("alpha" -> "a",
// "preview" -> "rc", ...). Returns nullptr for an unknown spelling.
const char* canonical_pre_tag(const std::string& tag);

// Strips leading zeros from a digit string, keeping a single "0".
std::string strip_leading_zeros(const std::string& digits);

// Renders the unique canonical PEP 440 string for the matched fields.
// Precondition: fields.pre->tag, when present, is a spelling that
// canonical_pre_tag() knows. match_version() only produces such tags; a
// hand-built VersionFields with any other tag gets it copied verbatim,
// and the result is then not canonical.
std::string canonicalize(const VersionFields& fields);

} // namespace pepver
