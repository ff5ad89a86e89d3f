#include <catch2/catch_all.hpp>

#include "stanza/reader.hpp"
#include "stanza/writer.hpp"

#include <limits>
#include <random>
#include <string>
#include <vector>

using namespace Catch;
using Stanza::token_type;

namespace {

    struct rng {
        std::mt19937_64 eng;

        rng() : eng(std::random_device{}()) {}

        size_t uniform_size(size_t min, size_t max) {
            std::uniform_int_distribution<size_t> dist(min, max);
            return dist(eng);
        }

        char ascii_char() {
            std::uniform_int_distribution<int> dist(32, 126);
            return static_cast<char>(dist(eng));
        }

        std::string random_string(size_t max_len = 16) {
            size_t len = uniform_size(0, max_len);
            std::string s;
            s.reserve(len);
            for (size_t i = 0; i < len; i++)
                s.push_back(ascii_char());
            return s;
        }
    };

    using Tokens = std::vector<token_type>;

    Stanza::Result<Tokens> tokenize(std::string_view s, const Stanza::ReaderOptions& opts = {}) {
        Stanza::ReaderState state;
        Stanza::Reader reader{ s, true, state, opts };
        Tokens out;
        while (true) {
            auto r = reader.read();
            if (!r) return std::unexpected(r.error());
            if (!*r) return out;
            out.push_back(reader.token());
        }
    }

    /// Feeds @p s in pieces of @p step bytes, carrying unconsumed bytes over.
    Stanza::Result<Tokens> tokenize_chunked(std::string_view s, size_t step, const Stanza::ReaderOptions& opts = {}) {
        Stanza::ReaderState state;
        std::string buffer;
        size_t fed = 0;
        Tokens out;
        while (true) {
            bool final_block = fed >= s.size();
            Stanza::Reader reader{ buffer, final_block, state, opts };
            while (true) {
                auto r = reader.read();
                if (!r) return std::unexpected(r.error());
                if (!*r) break;
                out.push_back(reader.token());
            }
            state.base_offset += reader.consumed();
            buffer.erase(0, reader.consumed());
            if (final_block) return out;
            buffer.append(s.substr(fed, step));
            fed += step;
        }
    }

    void expect_ok(std::string_view s, const Stanza::ReaderOptions& opts = {}) {
        INFO("input: " << s);
        auto r = tokenize(s, opts);
        if (!r) UNSCOPED_INFO("error: " << r.error().msg);
        REQUIRE(r);
    }

    void expect_fail(std::string_view s, Stanza::Error::code code, const Stanza::ReaderOptions& opts = {}) {
        INFO("input: " << s);
        auto r = tokenize(s, opts);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == Stanza::Error::category::read);
        REQUIRE(r.error().errc == code);
    }

    std::string first_string(std::string_view s) {
        Stanza::ReaderState state;
        Stanza::Reader reader{ s, true, state };
        auto r = reader.read();
        REQUIRE(r);
        REQUIRE(*r);
        REQUIRE(reader.token() == token_type::string);
        return reader.get_string();
    }

} // namespace


TEST_CASE("Token Sequence of a Document") {
    auto r = tokenize(R"({"a":[1,true,null,"x"],"b":{}})");
    REQUIRE(r);
    REQUIRE(*r == Tokens{
        token_type::start_object,
        token_type::property_name, token_type::start_array,
        token_type::number, token_type::true_value, token_type::null, token_type::string,
        token_type::end_array,
        token_type::property_name, token_type::start_object, token_type::end_object,
        token_type::end_object,
    });
}

TEST_CASE("Property Name Token Carries the Unquoted Name") {
    Stanza::ReaderState state;
    Stanza::Reader reader{ R"({ "key" : 1 })", true, state };
    REQUIRE(*reader.read());
    REQUIRE(*reader.read());
    REQUIRE(reader.token() == token_type::property_name);
    REQUIRE(reader.raw() == "key");
    REQUIRE(*reader.read());
    REQUIRE(reader.token() == token_type::number);
    REQUIRE(reader.raw() == "1");
}

TEST_CASE("Parse String Escapes") {
    REQUIRE(first_string(R"("line\nbreak")") == "line\nbreak");
    REQUIRE(first_string(R"("\u20AC")") == "\xE2\x82\xAC");
    REQUIRE(first_string(R"("\uD83D\uDE00")") == "\xF0\x9F\x98\x80");
    REQUIRE(first_string(R"("q\"b\\s\/")") == "q\"b\\s/");
}

TEST_CASE("Reject Leading Zeros") {
    expect_fail("01", Stanza::Error::code::invalid_number);
}

TEST_CASE("Reject Trailing Characters") {
    expect_fail("1 2", Stanza::Error::code::trailing_characters);
}

TEST_CASE("Line and Block Comments Are Accepted When Allowed") {
    std::string s = R"(
        // comment
        {
            "x": 1, /* comment */ "y": 2
        }
    )";

    Stanza::ReaderOptions opts;
    opts.comments = Stanza::comment_handling::skip;

    auto r = tokenize(s, opts);
    REQUIRE(r);
    REQUIRE(r->size() == 6);
}

TEST_CASE("Comments Rejected When Not Allowed") {
    expect_fail("{ // comment\n \"x\": 1 }", Stanza::Error::code::unexpected_character);
}

TEST_CASE("Trailing Commas Controlled by Option") {
    std::string s = "{ \"a\": 1, }";

    expect_fail(s, Stanza::Error::code::trailing_characters);

    Stanza::ReaderOptions relaxed;
    relaxed.allow_trailing_commas = true;
    expect_ok(s, relaxed);
    expect_ok("[1,]", relaxed);
}

TEST_CASE("Unpaired Surrogate Rejected") {
    expect_fail(R"("\uD83D")", Stanza::Error::code::invalid_unicode_escape);
    expect_fail(R"("\uDE00")", Stanza::Error::code::invalid_unicode_escape);
}

TEST_CASE("Error Position in Range") {
    std::string s = "{\n  \"x\": 1,\n  oops\n}";
    auto r = tokenize(s);
    REQUIRE_FALSE(r);

    const auto& e = r.error();
    REQUIRE(e.offset == s.find("oops"));
    REQUIRE(e.line == 3);
    REQUIRE(e.column == 3);
    REQUIRE_FALSE(e.msg.empty());
}

TEST_CASE("RFC8259 - Top-Level Single Value with Whitespace") {
    expect_ok(" 42 ");
    expect_ok("\n\n {\"a\":1}  \t");
    expect_ok("[1, 2, 3]");
    expect_ok("null");
    expect_ok("\"string\"");
}

TEST_CASE("RFC8259 - Trailing Characters are Rejected") {
    expect_fail("null true", Stanza::Error::code::trailing_characters);
    expect_fail("{\"a\":1} 0", Stanza::Error::code::trailing_characters);
    expect_fail("[] [ ]", Stanza::Error::code::trailing_characters);
}

TEST_CASE("RFC8259 - non-JSON Whitespace is Rejected") {
    expect_fail("\xC2\xA0\x01", Stanza::Error::code::unexpected_character);
}

TEST_CASE("RFC8259 - Byte Order Mark is Skipped") {
    expect_ok("\xEF\xBB\xBF{}");
}

TEST_CASE("RFC8259 - Valid Numbers") {
    for (auto s : { "0", "123", "-0", "-123", "0.0", "-0.1", "10.5", "1e10", "1E10", "1e+10", "1e-10", "-1E-10" }) {
        INFO("parsing: " << s);
        auto r = tokenize(s);
        REQUIRE(r);
        REQUIRE(*r == Tokens{ token_type::number });
    }
}

TEST_CASE("RFC8259 - Invalid Numbers are Rejected") {
    expect_fail("01",     Stanza::Error::code::invalid_number);
    expect_fail("-01",    Stanza::Error::code::invalid_number);

    expect_fail("1.",     Stanza::Error::code::invalid_number);
    expect_fail("1.e10",  Stanza::Error::code::invalid_number);
    expect_fail(".5",     Stanza::Error::code::invalid_number);

    expect_fail("1e",     Stanza::Error::code::invalid_number);
    expect_fail("1e+",    Stanza::Error::code::invalid_number);
    expect_fail("1e-",    Stanza::Error::code::invalid_number);
    expect_fail("1e1.2",  Stanza::Error::code::invalid_number);

    expect_fail("+1",     Stanza::Error::code::unexpected_character);
}

TEST_CASE("RFC8259 - Valid String Escapes") {
    expect_ok("\"simple\"");
    expect_ok("\"quote: \\\"\"");
    expect_ok("\"backslash: \\\\\"");
    expect_ok("\"controls: \\b\\f\\n\\r\\t\"");
    expect_ok("\"solidus: \\/\"");
}

TEST_CASE("RFC8259 - Invalid Escapes") {
    expect_fail("\"\\x41\"", Stanza::Error::code::invalid_escape);
    expect_fail("\"\\", Stanza::Error::code::invalid_escape);
}

TEST_CASE("RFC8259 - Control Characters Must be Escaped") {
    expect_fail("\"Hello\nWorld\"", Stanza::Error::code::invalid_string);
    expect_fail("\"\x01\"", Stanza::Error::code::invalid_string);
}

TEST_CASE("RFC8259 - Invalid Unicode Escapes") {
    expect_fail("\"\\u12\"", Stanza::Error::code::invalid_unicode_escape);
    expect_fail("\"\\uZZZZ\"", Stanza::Error::code::invalid_unicode_escape);
    expect_fail("\"\\uD800\"", Stanza::Error::code::invalid_unicode_escape);
    expect_fail("\"\\uD800abc\"", Stanza::Error::code::invalid_unicode_escape);
    expect_fail("\"\\uD800\\u0041\"", Stanza::Error::code::invalid_unicode_escape);
}

TEST_CASE("RFC8259 - Invalid Arrays") {
    expect_fail("[", Stanza::Error::code::unexpected_end_of_input);
    expect_fail("[1", Stanza::Error::code::unexpected_end_of_input);
    expect_fail("[1,", Stanza::Error::code::unexpected_end_of_input);
    expect_fail("[1 2]", Stanza::Error::code::unexpected_character);
    expect_fail("[,1]", Stanza::Error::code::unexpected_character);
    expect_fail("[1,]", Stanza::Error::code::trailing_characters);
}

TEST_CASE("RFC8259 - Invalid Objects") {
    expect_fail("{", Stanza::Error::code::unexpected_end_of_input);
    expect_fail("{\"a\":1", Stanza::Error::code::unexpected_end_of_input);
    expect_fail("{\"a\":1,", Stanza::Error::code::unexpected_end_of_input);
    expect_fail("{a:1}", Stanza::Error::code::unexpected_character);
    expect_fail("{\"a\" 1}", Stanza::Error::code::unexpected_character);
    expect_fail("{,\"a\":1}", Stanza::Error::code::unexpected_character);
    expect_fail("{\"a\":1]", Stanza::Error::code::unexpected_character);
}

TEST_CASE("RFC8259 - UTF-8 in Strings") {
    expect_ok("\"caf\xC3\xA9\"");
    expect_ok("\"snowman: \xE2\x98\x83\"");

    expect_fail("\"\xC0\xAF\"", Stanza::Error::code::invalid_string);
    expect_fail("\"\xED\xA0\x80\"", Stanza::Error::code::invalid_string);
    expect_fail("\"\xE2\x98\"", Stanza::Error::code::invalid_string);
}

TEST_CASE("RFC8259 - NaN and Infinity tokens are rejected") {
    expect_fail("NaN",       Stanza::Error::code::unexpected_character);
    expect_fail("Infinity",  Stanza::Error::code::unexpected_character);
    expect_fail("-Infinity", Stanza::Error::code::unexpected_character);
}

TEST_CASE("Empty and Whitespace-only Input is Rejected") {
    expect_fail("", Stanza::Error::code::unexpected_end_of_input);
    expect_fail("   \n\t  ", Stanza::Error::code::unexpected_end_of_input);
}

TEST_CASE("Max depth is enforced") {
    Stanza::ReaderOptions opts;
    opts.max_depth = 3;

    expect_ok("[[[]]]", opts);
    expect_ok("{ \"1\": { \"2\": {}}}", opts);

    for (auto s : { "[[[[]]]]", "{ \"1\": { \"2\": { \"3\": {}}}}" }) {
        auto r = tokenize(s, opts);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == Stanza::Error::category::depth_exceeded);
    }
}

TEST_CASE("Unlimited Depth with max_depth 0") {
    Stanza::ReaderOptions opts;
    opts.max_depth = 0;
    std::string s(10000, '[');
    s.append(10000, ']');
    expect_ok(s, opts);
}

TEST_CASE("Chunked Input Yields the Same Tokens at Every Split") {
    const std::string doc = R"({"name":"caf\u00e9 \uD83D\uDE00","n":[-12.5e+3,0,true,false,null],"o":{"k":"v"}})";
    auto whole = tokenize(doc);
    REQUIRE(whole);

    for (size_t step = 1; step <= doc.size(); step++) {
        INFO("step: " << step);
        auto chunked = tokenize_chunked(doc, step);
        REQUIRE(chunked);
        REQUIRE(*chunked == *whole);
    }
}

TEST_CASE("Chunked Input Reports Absolute Error Offsets") {
    const std::string doc = "[1, 2, 3, @]";
    auto r = tokenize_chunked(doc, 2);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().offset == doc.find('@'));
    REQUIRE(r.error().column == doc.find('@') + 1);
}

TEST_CASE("Skip Consumes a Whole Container") {
    Stanza::ReaderState state;
    Stanza::Reader reader{ R"([{"a":[1,{"b":2}]}, 3])", true, state };
    REQUIRE(*reader.read());
    REQUIRE(*reader.read());
    REQUIRE(reader.token() == token_type::start_object);
    REQUIRE(reader.skip());
    REQUIRE(*reader.read());
    REQUIRE(reader.token() == token_type::number);
    REQUIRE(reader.raw() == "3");
}

TEST_CASE("can_skip Reports Incomplete Containers Without Consuming") {
    Stanza::ReaderState state;
    Stanza::Reader reader{ R"({"a":[1,2)", false, state };
    REQUIRE(*reader.read());
    auto complete = reader.can_skip();
    REQUIRE(complete);
    REQUIRE_FALSE(*complete);
    REQUIRE(reader.token() == token_type::start_object);
    REQUIRE(*reader.read());
    REQUIRE(reader.token() == token_type::property_name);
}

TEST_CASE("Writer Compact Output") {
    Stanza::Writer w;
    REQUIRE(w.start_object());
    REQUIRE(w.property("a"));
    REQUIRE(w.start_array());
    w.number(std::int64_t{ -1 });
    w.number(std::uint64_t{ 18446744073709551615ull });
    w.boolean(true);
    w.null();
    REQUIRE(w.number(0.5));
    REQUIRE(w.end_array());
    REQUIRE(w.property("b"));
    REQUIRE(w.string("x\"y\n\x01"));
    REQUIRE(w.end_object());

    REQUIRE(w.buffer() == R"({"a":[-1,18446744073709551615,true,null,0.5],"b":"x\"y\n\u0001"})");
}

TEST_CASE("Writer Pretty Output") {
    Stanza::WriterOptions opts;
    opts.pretty = true;
    opts.indent = 2;

    Stanza::Writer w{ opts };
    REQUIRE(w.start_object());
    REQUIRE(w.property("a"));
    w.number(std::int64_t{ 1 });
    REQUIRE(w.property("b"));
    REQUIRE(w.start_array());
    REQUIRE(w.end_array());
    REQUIRE(w.property("c"));
    REQUIRE(w.start_array());
    w.boolean(false);
    REQUIRE(w.end_array());
    REQUIRE(w.end_object());

    REQUIRE(w.buffer() == "{\n  \"a\": 1,\n  \"b\": [],\n  \"c\": [\n    false\n  ]\n}");
}

TEST_CASE("Writer Rejects NaN, Infinity and Invalid UTF-8") {
    Stanza::Writer w;
    REQUIRE_FALSE(w.number(std::numeric_limits<double>::quiet_NaN()));
    REQUIRE_FALSE(w.number(std::numeric_limits<double>::infinity()));
    auto bad = w.string("\xC0\xAF");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().kind == Stanza::Error::category::write);
    REQUIRE(w.buffer().empty());
}

TEST_CASE("Writer Enforces Depth") {
    Stanza::WriterOptions opts;
    opts.max_depth = 2;
    Stanza::Writer w{ opts };
    REQUIRE(w.start_array());
    REQUIRE(w.start_array());
    auto r = w.start_array();
    REQUIRE_FALSE(r);
    REQUIRE(r.error().kind == Stanza::Error::category::depth_exceeded);
}

TEST_CASE("Writer Flushes to the Sink at the Threshold") {
    std::vector<std::string> chunks;
    Stanza::WriterOptions opts;
    opts.flush_threshold = 8;
    Stanza::Writer w{ opts, [&](std::string_view c) -> Stanza::Result<void> {
        chunks.emplace_back(c);
        return {};
    } };

    REQUIRE(w.start_array());
    for (int i = 0; i < 10; i++) {
        REQUIRE(w.string("abc"));
        REQUIRE(w.flush_if_needed());
    }
    REQUIRE(w.end_array());
    REQUIRE(w.flush());

    REQUIRE(chunks.size() > 1);
    std::string joined;
    for (auto& c : chunks) joined += c;
    REQUIRE(joined.front() == '[');
    REQUIRE(joined.back() == ']');
    REQUIRE(tokenize(joined));
}

TEST_CASE("Written Strings Read Back Unchanged") {
    rng r;
    for (int i = 0; i < 200; i++) {
        std::string original = r.random_string(32);
        Stanza::Writer w;
        REQUIRE(w.string(original));
        REQUIRE(first_string(w.buffer()) == original);
    }
}

TEST_CASE("Random Text Never Crashes the Tokenizer") {
    rng r;
    Stanza::ReaderOptions opts;
    opts.comments = Stanza::comment_handling::skip;
    opts.allow_trailing_commas = true;

    for (int i = 0; i < 500; i++) {
        std::string input = r.random_string(64);
        auto whole = tokenize(input, opts);
        auto chunked = tokenize_chunked(input, r.uniform_size(1, 8), opts);
        REQUIRE(whole.has_value() == chunked.has_value());
        if (whole) REQUIRE(*whole == *chunked);
    }
}
