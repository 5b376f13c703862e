#include <catch2/catch.hpp>
#include <pepver/normalize.hpp>
#include <string>
#include <vector>

using namespace pepver;

static std::string norm(const std::string& s) {
    auto r = normalize_version(s);
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== Canonical output =====

TEST_CASE("normalize already canonical versions", "[normalize]") {
    REQUIRE(norm("1.0") == "1.0");
    REQUIRE(norm("1.0a0") == "1.0a0");
    REQUIRE(norm("1.0rc2") == "1.0rc2");
    REQUIRE(norm("1.0.post0") == "1.0.post0");
    REQUIRE(norm("1.0.dev5") == "1.0.dev5");
    REQUIRE(norm("1!2.0a1.post3.dev4+local.7") == "1!2.0a1.post3.dev4+local.7");
}

TEST_CASE("normalize ignores case and surrounding whitespace", "[normalize]") {
    REQUIRE(norm("  V1.0  ") == norm("1.0"));
    REQUIRE(norm("1.0RC1") == "1.0rc1");
    REQUIRE(norm("\tv2.0.DEV1\n") == "2.0.dev1");
}

TEST_CASE("normalize unifies pre-release spellings", "[normalize]") {
    REQUIRE(norm("1.0alpha1") == "1.0a1");
    REQUIRE(norm("1.0a1") == "1.0a1");
    REQUIRE(norm("1.0beta2") == "1.0b2");
    REQUIRE(norm("1.0c3") == "1.0rc3");
    REQUIRE(norm("1.0pre4") == "1.0rc4");
    REQUIRE(norm("1.0preview5") == "1.0rc5");
    REQUIRE(norm("1.0-alpha.1") == "1.0a1");
    REQUIRE(norm("1.0_b") == "1.0b0");
    REQUIRE(norm("1.0a-") == "1.0a0");
}

TEST_CASE("normalize post-release surface forms", "[normalize]") {
    REQUIRE(norm("1.0-1") == "1.0.post1");
    REQUIRE(norm("1.0.post1") == "1.0.post1");
    REQUIRE(norm("1.0rev1") == "1.0.post1");
    REQUIRE(norm("1.0r1") == "1.0.post1");
    REQUIRE(norm("1.0-post-1") == "1.0.post1");
    REQUIRE(norm("1.0post") == "1.0.post0");
    REQUIRE(norm("1.0-007") == "1.0.post7");
}

TEST_CASE("normalize dev releases", "[normalize]") {
    REQUIRE(norm("1.0dev") == "1.0.dev0");
    REQUIRE(norm("1.0-dev-3") == "1.0.dev3");
    REQUIRE(norm("1.0_dev_03") == "1.0.dev3");
}

TEST_CASE("normalize strips zero padding", "[normalize]") {
    REQUIRE(norm("1.01.0") == "1.1.0");
    REQUIRE(norm("00!0.000.01") == "0!0.0.1");
    REQUIRE(norm("1.0a01.post02.dev03") == "1.0a1.post2.dev3");
}

TEST_CASE("normalize local version label", "[normalize]") {
    REQUIRE(norm("1.0+ABC_123.4") == "1.0+abc.123.4");
    REQUIRE(norm("1.0+ubuntu-007") == "1.0+ubuntu.7");
    REQUIRE(norm("1.0+0abc.00") == "1.0+0abc.0");
}

TEST_CASE("normalize combined non-canonical segments", "[normalize]") {
    REQUIRE(norm("v01!1.02-preview_3-4-DEV.5+Build_06") ==
            "1!1.2rc3.post4.dev5+build.6");
}

// ===== Properties =====

TEST_CASE("normalize is idempotent", "[normalize]") {
    std::vector<std::string> inputs = {
        "1.0", " V1.0 ", "1.0alpha", "1.0-1", "1.0.r2", "1.0PRE-3",
        "2!01.002dev", "1.0+Local_Tag-01", "1.0a-", "3.0.0-beta.4.post_5.dev",
    };
    for (const auto& s : inputs) {
        auto once = norm(s);
        REQUIRE(norm(once) == once);
    }
}

// ===== Invalid input =====

TEST_CASE("invalid version fails without override", "[normalize]") {
    auto r = normalize_version("not-a-version");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PepverError::InvalidVersion);
}

TEST_CASE("invalid version error quotes the original input", "[normalize]") {
    auto r = normalize_version("Not-A-Version");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("'Not-A-Version'") != std::string::npos);
    REQUIRE(r.error().format().find("error[InvalidVersion]") != std::string::npos);
}

TEST_CASE("invalid version passes through with override", "[normalize]") {
    NormalizeOptions opts;
    opts.allow_invalid = true;

    auto r = normalize_version("not-a-version", opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "not-a-version");

    r = normalize_version("  Not A Version ", opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "  not a version ");
}

TEST_CASE("override leaves valid versions normalized", "[normalize]") {
    NormalizeOptions opts;
    opts.allow_invalid = true;
    auto r = normalize_version("1.0ALPHA", opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "1.0a0");
}

// ===== Diagnostics =====

TEST_CASE("diagnostic reports normalization changes", "[normalize]") {
    std::vector<Diagnostic> seen;
    NormalizeOptions opts;
    opts.on_diagnostic = [&](const Diagnostic& d) { seen.push_back(d); };

    auto r = normalize_version("1.0-1", opts);
    REQUIRE(r.is_ok());
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].kind == Diagnostic::Normalized);
    REQUIRE(seen[0].original == "1.0-1");
    REQUIRE(seen[0].result == "1.0.post1");
    REQUIRE(seen[0].message() ==
            "version number '1.0-1' normalised to '1.0.post1' (see PEP 440)");
}

TEST_CASE("no diagnostic for canonical input", "[normalize]") {
    int calls = 0;
    NormalizeOptions opts;
    opts.on_diagnostic = [&](const Diagnostic&) { ++calls; };

    REQUIRE(normalize_version("1.0.post1", opts).is_ok());
    REQUIRE(calls == 0);
}

TEST_CASE("case-only change still raises a diagnostic", "[normalize]") {
    int calls = 0;
    NormalizeOptions opts;
    opts.on_diagnostic = [&](const Diagnostic&) { ++calls; };

    REQUIRE(normalize_version("1.0RC1", opts).is_ok());
    REQUIRE(calls == 1);
}

TEST_CASE("diagnostic reports overridden invalid version", "[normalize]") {
    std::vector<Diagnostic> seen;
    NormalizeOptions opts;
    opts.allow_invalid = true;
    opts.on_diagnostic = [&](const Diagnostic& d) { seen.push_back(d); };

    auto r = normalize_version("junk", opts);
    REQUIRE(r.is_ok());
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].kind == Diagnostic::AllowedInvalid);
    REQUIRE(seen[0].original == "junk");
    REQUIRE(seen[0].result == "junk");
    REQUIRE(seen[0].message() ==
            "invalid version number 'junk' allowed by allow-invalid");
}

TEST_CASE("no diagnostic when invalid version is rejected", "[normalize]") {
    int calls = 0;
    NormalizeOptions opts;
    opts.on_diagnostic = [&](const Diagnostic&) { ++calls; };

    REQUIRE(normalize_version("junk", opts).is_err());
    REQUIRE(calls == 0);
}
