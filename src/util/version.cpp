#include <pepver/version.hpp>
#include <pepver/text.hpp>
#include <algorithm>

namespace pepver {

// ---------------------------------------------------------------------------
// Tag tables
// ---------------------------------------------------------------------------

// Longer spellings come first so that "alpha" is not read as "a" + "lpha".
static const char* const kPreTags[] = {
    "preview", "alpha", "beta", "pre", "rc", "a", "b", "c",
};

static const char* const kPostTags[] = {
    "post", "rev", "r",
};

const char* canonical_pre_tag(const std::string& tag) {
    if (tag == "a" || tag == "alpha") return "a";
    if (tag == "b" || tag == "beta") return "b";
    if (tag == "rc" || tag == "c" || tag == "pre" || tag == "preview") return "rc";
    return nullptr;
}

// ---------------------------------------------------------------------------
// Grammar matcher
// ---------------------------------------------------------------------------

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_separator(char c) {
    return c == '-' || c == '_' || c == '.';
}

static bool is_local_char(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'z');
}

// Cursor over the lowercased input. Every try_* member either consumes
// what it recognized and reports success, or leaves pos where it was.
struct VersionScanner {
    const std::string& text;
    size_t pos;

    explicit VersionScanner(const std::string& t) : text(t), pos(0) {}

    bool at_end() const { return pos >= text.size(); }

    char peek() const { return at_end() ? '\0' : text[pos]; }

    void skip_whitespace() {
        while (!at_end() && is_space(peek())) ++pos;
    }

    bool try_char(char c) {
        if (peek() != c) return false;
        ++pos;
        return true;
    }

    bool try_separator() {
        if (!is_separator(peek())) return false;
        ++pos;
        return true;
    }

    bool try_word(const char* word) {
        size_t len = std::char_traits<char>::length(word);
        if (text.compare(pos, len, word) != 0) return false;
        pos += len;
        return true;
    }

    std::optional<std::string> try_digits() {
        size_t start = pos;
        while (!at_end() && is_digit(peek())) ++pos;
        if (pos == start) return std::nullopt;
        return text.substr(start, pos - start);
    }

    template<size_t N>
    std::optional<std::string> try_tag(const char* const (&tags)[N]) {
        for (const char* tag : tags) {
            if (try_word(tag)) return std::string(tag);
        }
        return std::nullopt;
    }

    // epoch? digits ("." digits)*
    bool release(VersionFields& out) {
        size_t start = pos;
        auto first = try_digits();
        if (!first) return false;

        if (try_char('!')) {
            out.epoch = std::move(first);
            first = try_digits();
            if (!first) {
                pos = start;
                out.epoch.reset();
                return false;
            }
        }
        out.release.push_back(std::move(*first));

        while (peek() == '.' && pos + 1 < text.size() && is_digit(text[pos + 1])) {
            ++pos;
            out.release.push_back(*try_digits());
        }
        return true;
    }

    // sep? pre_tag sep? digits?
    void pre(VersionFields& out) {
        size_t start = pos;
        try_separator();
        auto tag = try_tag(kPreTags);
        if (!tag) {
            pos = start;
            return;
        }
        try_separator();
        out.pre = PreRelease{std::move(*tag), try_digits()};
    }

    // "-" digits | sep? ("post"|"rev"|"r") sep? digits?
    void post(VersionFields& out) {
        size_t start = pos;
        if (try_char('-')) {
            if (auto n = try_digits()) {
                out.post = PostRelease{PostRelease::Form::Implicit, "", std::move(n)};
                return;
            }
            pos = start;
        }

        try_separator();
        auto tag = try_tag(kPostTags);
        if (!tag) {
            pos = start;
            return;
        }
        try_separator();
        out.post = PostRelease{PostRelease::Form::Tagged, std::move(*tag), try_digits()};
    }

    // sep? "dev" sep? digits?
    void dev(VersionFields& out) {
        size_t start = pos;
        try_separator();
        if (!try_word("dev")) {
            pos = start;
            return;
        }
        try_separator();
        out.dev = DevRelease{try_digits()};
    }

    // "+" alnum_run (sep alnum_run)*
    bool local(VersionFields& out) {
        if (!try_char('+')) return true;

        std::vector<std::string> segments;
        while (true) {
            size_t start = pos;
            while (!at_end() && is_local_char(peek())) ++pos;
            if (pos == start) return false;
            segments.push_back(text.substr(start, pos - start));

            if (!is_separator(peek())) break;
            ++pos;
        }
        out.local = std::move(segments);
        return true;
    }
};

std::optional<VersionFields> match_version(const std::string& version) {
    std::string lower = to_lower(version);
    VersionScanner s(lower);
    VersionFields fields;

    s.skip_whitespace();
    s.try_char('v');
    if (!s.release(fields)) return std::nullopt;
    s.pre(fields);
    s.post(fields);
    s.dev(fields);
    if (!s.local(fields)) return std::nullopt;
    s.skip_whitespace();

    if (!s.at_end()) return std::nullopt;
    return fields;
}

// ---------------------------------------------------------------------------
// Canonicalizer
// ---------------------------------------------------------------------------

std::string strip_leading_zeros(const std::string& digits) {
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) return "0";
    return digits.substr(first);
}

static std::string number_or_zero(const std::optional<std::string>& n) {
    return n ? strip_leading_zeros(*n) : "0";
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
}

std::string canonicalize(const VersionFields& fields) {
    std::string out;

    if (fields.epoch) {
        out += strip_leading_zeros(*fields.epoch);
        out += '!';
    }

    for (size_t i = 0; i < fields.release.size(); ++i) {
        if (i > 0) out += '.';
        out += strip_leading_zeros(fields.release[i]);
    }

    if (fields.pre) {
        const char* tag = canonical_pre_tag(fields.pre->tag);
        out += tag ? tag : fields.pre->tag.c_str();
        out += number_or_zero(fields.pre->number);
    }

    if (fields.post) {
        out += ".post";
        out += number_or_zero(fields.post->number);
    }

    if (fields.dev) {
        out += ".dev";
        out += number_or_zero(fields.dev->number);
    }

    if (!fields.local.empty()) {
        out += '+';
        for (size_t i = 0; i < fields.local.size(); ++i) {
            if (i > 0) out += '.';
            const std::string& seg = fields.local[i];
            out += all_digits(seg) ? strip_leading_zeros(seg) : seg;
        }
    }

    return out;
}

std::string VersionFields::to_string() const {
    return canonicalize(*this);
}

} // namespace pepver
