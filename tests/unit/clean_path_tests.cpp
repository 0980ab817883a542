#include <doctest/doctest.h>
#include <cleanpath/clean_path.hpp>

#include <string>
#include <string_view>
#include <vector>

using cleanpath::clean_path;
using cleanpath::is_clean;
using cleanpath::normalize;

namespace {

struct CleanCase {
    const char* path;
    const char* expected;
};

const CleanCase kCleanCases[] = {
    // Already clean
    {"/", "/"},
    {"/abc", "/abc"},
    {"/a/b/c", "/a/b/c"},
    {"/abc/", "/abc/"},
    {"/a/b/c/", "/a/b/c/"},

    // Missing root
    {"", "/"},
    {"a/", "/a/"},
    {"abc", "/abc"},
    {"abc/def", "/abc/def"},
    {"a/b/c", "/a/b/c"},

    // Remove doubled slash
    {"//", "/"},
    {"/abc//", "/abc/"},
    {"/abc/def//", "/abc/def/"},
    {"/a/b/c//", "/a/b/c/"},
    {"/abc//def//ghi", "/abc/def/ghi"},
    {"//abc", "/abc"},
    {"///abc", "/abc"},
    {"//abc//", "/abc/"},

    // Remove . elements
    {".", "/"},
    {"./", "/"},
    {"/abc/./def", "/abc/def"},
    {"/./abc/def", "/abc/def"},
    {"/abc/.", "/abc/"},

    // Remove .. elements
    {"..", "/"},
    {"../", "/"},
    {"../../", "/"},
    {"../..", "/"},
    {"../../abc", "/abc"},
    {"/abc/def/ghi/../jkl", "/abc/def/jkl"},
    {"/abc/def/../ghi/../jkl", "/abc/jkl"},
    {"/abc/def/..", "/abc"},
    {"/abc/def/../..", "/"},
    {"/abc/def/../../..", "/"},
    {"/abc/def/../../../ghi/jkl/../../../mno", "/mno"},

    // Combinations
    {"abc/./../def", "/def"},
    {"abc//./../def", "/def"},
    {"abc/../../././../def", "/def"},
};

// Straightforward split-and-stack normalizer used as an oracle.
std::string reference_clean(std::string_view p) {
    if (p.empty()) {
        return "/";
    }

    std::vector<std::string_view> segments;
    std::size_t start = 0;
    while (start <= p.size()) {
        auto slash = p.find('/', start);
        if (slash == std::string_view::npos) slash = p.size();
        segments.push_back(p.substr(start, slash - start));
        start = slash + 1;
    }

    bool trailing = (p.size() > 1 && p.back() == '/') || segments.back() == ".";

    std::vector<std::string_view> stack;
    for (auto s : segments) {
        if (s.empty() || s == ".") continue;
        if (s == "..") {
            if (!stack.empty()) stack.pop_back();
            continue;
        }
        stack.push_back(s);
    }

    std::string out = "/";
    for (std::size_t i = 0; i < stack.size(); ++i) {
        if (i > 0) out += '/';
        out.append(stack[i].data(), stack[i].size());
    }
    if (trailing && !stack.empty()) {
        out += '/';
    }
    return out;
}

// Every path of up to max_tokens tokens joined by '/', with and without a
// leading slash.
std::vector<std::string> generate_corpus(std::size_t max_tokens) {
    const std::vector<std::string> tokens = {"", ".", "..", "a", "bc", "...", ".x", "..y"};

    std::vector<std::string> level = {""};
    std::vector<std::string> corpus;
    for (std::size_t depth = 1; depth <= max_tokens; ++depth) {
        std::vector<std::string> next;
        for (const auto& prefix : level) {
            for (const auto& t : tokens) {
                next.push_back(depth == 1 ? t : prefix + "/" + t);
            }
        }
        for (const auto& p : next) {
            corpus.push_back(p);
            corpus.push_back("/" + p);
        }
        level = std::move(next);
    }
    return corpus;
}

// Builds a path of at least min_length bytes by repeating unit.
std::string repeat_to(std::string_view unit, std::size_t min_length) {
    std::string out;
    while (out.size() < min_length) {
        out.append(unit.data(), unit.size());
    }
    return out;
}

} // namespace

TEST_CASE("clean_path literal cases") {
    for (const auto& c : kCleanCases) {
        CAPTURE(c.path);
        CHECK(normalize(c.path) == c.expected);
        CHECK(clean_path(c.path).view() == std::string_view(c.expected));
    }
}

TEST_CASE("normalize is idempotent on literal cases") {
    for (const auto& c : kCleanCases) {
        CAPTURE(c.path);
        auto once = normalize(c.path);
        CHECK(normalize(once) == once);
        CHECK(is_clean(once));
    }
}

TEST_CASE("empty input yields root") {
    auto cleaned = clean_path("");
    CHECK(cleaned.view() == "/");
    CHECK(cleaned.size() == 1);
}

TEST_CASE("excess parent segments are absorbed by the root") {
    CHECK(normalize("/../a") == "/a");
    CHECK(normalize("/../../a") == "/a");
    CHECK(normalize("/a/../../../b/") == "/b/");
    CHECK(normalize("/..") == "/");
}

TEST_CASE("trailing lone dot forces a trailing slash") {
    CHECK(normalize("/a/.") == "/a/");
    CHECK(normalize("a/.") == "/a/");
    CHECK(normalize("/a/b/./.") == "/a/b/");
    CHECK(normalize("/.") == "/");
    // only a whole "." segment counts
    CHECK(normalize("/a.") == "/a.");
    CHECK(normalize("/a/.b") == "/a/.b");
}

TEST_CASE("dot-prefixed names are ordinary segments") {
    CHECK(normalize("/...") == "/...");
    CHECK(normalize("/a/.../b") == "/a/.../b");
    CHECK(normalize("/..a/b") == "/..a/b");
    CHECK(normalize("/a/..b/..") == "/a");
}

TEST_CASE("bytes are not interpreted") {
    CHECK(normalize("/a%2e%2e/b") == "/a%2e%2e/b");
    CHECK(normalize("/a?x=/../y") == "/y");

    std::string with_nul("/a\0b/../c", 9);
    CHECK(normalize(with_nul) == "/c");

    std::string high_bytes = "/\xff\xfe//\x80/../z";
    CHECK(normalize(high_bytes) == "/\xff\xfe/z");
}

TEST_CASE("canonical input is borrowed, not copied") {
    SUBCASE("whole input") {
        std::string input = "/abc/def/";
        auto cleaned = clean_path(input);
        CHECK(cleaned.is_borrowed());
        CHECK(cleaned.view().data() == input.data());
        CHECK(cleaned.size() == input.size());
    }

    SUBCASE("prefix of input") {
        std::string input = "/abc//";
        auto cleaned = clean_path(input);
        CHECK(cleaned.is_borrowed());
        CHECK(cleaned.view().data() == input.data());
        CHECK(cleaned.view() == "/abc/");
    }

    SUBCASE("trailing parent segment") {
        std::string input = "/abc/def/..";
        auto cleaned = clean_path(input);
        CHECK(cleaned.is_borrowed());
        CHECK(cleaned.view() == "/abc");
    }
}

TEST_CASE("rewritten input is owned") {
    CHECK(clean_path("abc").is_owned());
    CHECK(clean_path("/a/./b").is_owned());
    CHECK(clean_path("/a/b/../c").is_owned());
    CHECK(clean_path("/a//b").is_owned());

    // owned result outlives the input
    cleanpath::CleanedPath cleaned = cleanpath::CleanedPath::borrowed("/");
    {
        std::string input = "/x/y/../z";
        cleaned = clean_path(input);
        input.assign(input.size(), '#');
    }
    CHECK(cleaned.view() == "/x/z");
}

TEST_CASE("str moves owned results out") {
    auto owned = clean_path("a/b");
    CHECK(owned.str() == "/a/b");
    CHECK(std::move(owned).str() == "/a/b");

    std::string input = "/a/b";
    CHECK(clean_path(input).str() == "/a/b");
}

TEST_CASE("is_clean") {
    CHECK(is_clean("/"));
    CHECK(is_clean("/abc"));
    CHECK(is_clean("/abc/"));
    CHECK(is_clean("/a/.../b"));

    CHECK_FALSE(is_clean(""));
    CHECK_FALSE(is_clean("abc"));
    CHECK_FALSE(is_clean("/abc//"));
    CHECK_FALSE(is_clean("/a/./b"));
    CHECK_FALSE(is_clean("/a/b/.."));
    CHECK_FALSE(is_clean("/a/."));
}

TEST_CASE("generated corpus matches the reference normalizer") {
    for (const auto& p : generate_corpus(4)) {
        CAPTURE(p);
        auto cleaned = clean_path(p);
        auto expected = reference_clean(p);
        REQUIRE(cleaned.view() == std::string_view(expected));

        auto out = cleaned.str();
        CHECK(out.front() == '/');
        CHECK(out.find("//") == std::string::npos);
        CHECK(out.find("/./") == std::string::npos);
        CHECK(out.find("/../") == std::string::npos);
        CHECK(normalize(out) == out);
        CHECK(is_clean(out));
        CHECK(is_clean(p) == (out == p));
    }
}

TEST_CASE("results do not depend on the buffer tier") {
    // lengths straddling every inline tier and the heap tier
    const std::size_t lengths[] = {1, 62, 63, 64, 65, 254, 255, 256, 257,
                                   1022, 1023, 1024, 1025, 4096};
    const std::string_view units[] = {"/abc", "/a/./b", "//x/y/..", "seg/", "/../q"};

    for (auto unit : units) {
        for (auto length : lengths) {
            auto p = repeat_to(unit, length);
            CAPTURE(p.size());
            CAPTURE(unit);
            CHECK(normalize(p) == reference_clean(p));
        }
    }
}

TEST_CASE("long canonical input is borrowed in every tier") {
    const std::size_t lengths[] = {63, 255, 1023, 5000};
    for (auto length : lengths) {
        auto p = repeat_to("/seg", length);
        CAPTURE(p.size());
        auto cleaned = clean_path(p);
        CHECK(cleaned.is_borrowed());
        CHECK(cleaned.view().data() == p.data());
        CHECK(cleaned.size() == p.size());
    }
}

TEST_CASE("long input without a leading slash grows by one byte") {
    auto p = repeat_to("seg/", 2048);
    auto cleaned = clean_path(p);
    CHECK(cleaned.is_owned());
    CHECK(cleaned.size() == p.size() + 1);
    CHECK(cleaned.view() == std::string_view("/" + p));
}
