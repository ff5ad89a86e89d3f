#include <catch2/catch_all.hpp>

#include "fixtures.hpp"
#include "stanza/name_matcher.hpp"

#include <string>
#include <vector>

namespace {

    /// Metadata with hand-made properties; only names and policies matter for matching.
    Stanza::TypeMetadata make_meta(const std::vector<std::string>& names, bool case_insensitive = false) {
        Stanza::TypeMetadata meta;
        for (const auto& n : names) {
            Stanza::PropertyMetadata p;
            p.name = n;
            p.declared_name = n;
            p.policy.case_insensitive = case_insensitive;
            p.match_bytes = case_insensitive ? Stanza::fold_name(n) : n;
            p.key = Stanza::pack_name_key(n, case_insensitive);
            meta.properties.push_back(std::move(p));
        }
        meta.any_case_insensitive = case_insensitive;
        return meta;
    }

    const Stanza::PropertyMetadata* match(const Stanza::TypeMetadata& meta, std::string_view name) {
        std::size_t hint = 0;
        return Stanza::match_property(meta, name, hint);
    }

} // namespace


TEST_CASE("Packed Key Layout") {
    REQUIRE(Stanza::pack_name_key("", false) == 0);
    REQUIRE(Stanza::pack_name_key("a", false) == ((std::uint64_t{ 1 } << 48) | 'a'));
    REQUIRE(Stanza::pack_name_key("ab", false) == ((std::uint64_t{ 2 } << 48) | ('b' << 8) | 'a'));
    REQUIRE(Stanza::pack_name_key("AB", true) == Stanza::pack_name_key("ab", false));
    REQUIRE(Stanza::pack_name_key("abcdefgh", false) >> 48 == 8);
}

TEST_CASE("Names of One to Six Bytes Match on the Key") {
    auto meta = make_meta({ "a", "ab", "abc", "abcd", "abcde", "abcdef" });
    for (const auto& p : meta.properties) {
        INFO("name: " << p.name);
        REQUIRE(match(meta, p.name) == &p);
    }
    REQUIRE(match(meta, "abcdeg") == nullptr);
    REQUIRE(match(meta, "b") == nullptr);
    REQUIRE(match(meta, "") == nullptr);
}

TEST_CASE("Names Longer Than Six Bytes Are Confirmed Byte by Byte") {
    auto meta = make_meta({ "Address1Line", "Address2Line", "AddressXLineLonger" });
    REQUIRE(meta.properties[0].key == meta.properties[1].key);

    REQUIRE(match(meta, "Address1Line") == &meta.properties[0]);
    REQUIRE(match(meta, "Address2Line") == &meta.properties[1]);
    REQUIRE(match(meta, "AddressXLineLonger") == &meta.properties[2]);
    REQUIRE(match(meta, "Address3Line") == nullptr);
}

TEST_CASE("Regression: Shared Prefix and Length Map to the Right Property") {
    Stanza::Options options;
    auto meta = options.metadata<fixtures::Address>();
    REQUIRE(meta);

    auto r = Stanza::deserialize<fixtures::Address>(R"({"Address2Line":"two","Address1Line":"one","City":"x"})", options);
    REQUIRE(r);
    REQUIRE(r->line1 == "one");
    REQUIRE(r->line2 == "two");
    REQUIRE(r->city == "x");
}

TEST_CASE("Case Sensitive Matching by Default") {
    auto meta = make_meta({ "Name", "LongerName" });
    REQUIRE(match(meta, "Name") != nullptr);
    REQUIRE(match(meta, "name") == nullptr);
    REQUIRE(match(meta, "LONGERNAME") == nullptr);
}

TEST_CASE("Case Insensitive Matching Folds ASCII") {
    auto meta = make_meta({ "Name", "LongerName" }, true);
    REQUIRE(match(meta, "name") == &meta.properties[0]);
    REQUIRE(match(meta, "NAME") == &meta.properties[0]);
    REQUIRE(match(meta, "longername") == &meta.properties[1]);
    REQUIRE(match(meta, "LONGERNAME") == &meta.properties[1]);
    REQUIRE(match(meta, "LongerNam") == nullptr);
}

TEST_CASE("Hint Advances Past Each Match and Wraps Around") {
    auto meta = make_meta({ "a", "b", "c" });
    std::size_t hint = 0;
    REQUIRE(Stanza::match_property(meta, "a", hint) == &meta.properties[0]);
    REQUIRE(hint == 1);
    REQUIRE(Stanza::match_property(meta, "b", hint) == &meta.properties[1]);
    REQUIRE(hint == 2);
    REQUIRE(Stanza::match_property(meta, "a", hint) == &meta.properties[0]);
    REQUIRE(hint == 1);

    hint = 99;
    REQUIRE(Stanza::match_property(meta, "c", hint) == &meta.properties[2]);
    REQUIRE(hint == 3);
    REQUIRE(Stanza::match_property(meta, "x", hint) == nullptr);
}

TEST_CASE("Empty Metadata Matches Nothing") {
    Stanza::TypeMetadata meta;
    std::size_t hint = 0;
    REQUIRE(Stanza::match_property(meta, "a", hint) == nullptr);
}
