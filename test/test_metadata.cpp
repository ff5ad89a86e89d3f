#include <catch2/catch_all.hpp>

#include "fixtures.hpp"

#include <map>
#include <thread>
#include <vector>

using namespace Catch;

namespace metadata_fixtures {

    struct Duplicated {
        int first = 0;
        int second = 0;
    };

    inline void describe(Stanza::TypeBuilder<Duplicated>& t) {
        t.field<&Duplicated::first>("Value");
        t.field<&Duplicated::second>("Value");
    }

    struct Colliding {
        std::string upper;
        std::string lower;
    };

    inline void describe(Stanza::TypeBuilder<Colliding>& t) {
        t.field<&Colliding::upper>("Name");
        t.field<&Colliding::lower>("name").case_insensitive();
    }

    struct CaseDistinct {
        std::string upper;
        std::string lower;
    };

    inline void describe(Stanza::TypeBuilder<CaseDistinct>& t) {
        t.field<&CaseDistinct::upper>("Name");
        t.field<&CaseDistinct::lower>("name");
    }

    struct Lookup {
        std::map<std::string, int> entries;
    };

    inline void describe(Stanza::TypeBuilder<Lookup>& t) {
        t.field<&Lookup::entries>("Entries");
    }

    struct Renamed {
        std::string identifier;
        std::string display_name;
    };

    inline void describe(Stanza::TypeBuilder<Renamed>& t) {
        t.options().naming = Stanza::naming_policy::camel_case;
        t.field<&Renamed::identifier>("Identifier").json_name("id");
        t.field<&Renamed::display_name>("DisplayName");
    }

    struct Quoted {
        std::string value;
    };

    inline void describe(Stanza::TypeBuilder<Quoted>& t) {
        t.field<&Quoted::value>("say \"hi\"");
    }

} // namespace metadata_fixtures

using namespace metadata_fixtures;

namespace {

    std::vector<std::string> wire_names(const Stanza::TypeMetadata& meta) {
        std::vector<std::string> out;
        for (const auto& p : meta.properties) out.push_back(p.name);
        return out;
    }

} // namespace


TEST_CASE("Properties Keep Declaration Order") {
    Stanza::Options options;
    auto meta = options.metadata<fixtures::Person>();
    REQUIRE(meta);
    REQUIRE(wire_names(**meta) == std::vector<std::string>{ "FirstName", "LastName", "BirthDay" });
    REQUIRE((*meta)->properties[0].escaped_name == "\"FirstName\"");
    REQUIRE((*meta)->find("LastName") == &(*meta)->properties[1]);
    REQUIRE((*meta)->find("Missing") == nullptr);
}

TEST_CASE("Metadata Is Built Once Per Type") {
    Stanza::Options options;
    auto first = options.metadata<fixtures::Family>();
    REQUIRE(first);
    const std::size_t builds = options.metadata_cache().builds();

    auto second = options.metadata<fixtures::Family>();
    REQUIRE(second);
    REQUIRE(*first == *second);
    REQUIRE(options.metadata_cache().builds() == builds);
}

TEST_CASE("Concurrent First Requests Observe One Published Instance") {
    Stanza::Options options;
    std::vector<const Stanza::TypeMetadata*> seen(8, nullptr);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < seen.size(); i++) {
            threads.emplace_back([&options, &seen, i] {
                auto meta = options.metadata<fixtures::Node>();
                if (meta) seen[i] = *meta;
            });
        }
    }
    REQUIRE(seen[0] != nullptr);
    for (const auto* m : seen) REQUIRE(m == seen[0]);
}

TEST_CASE("Naming Policies and Explicit Names") {
    SECTION("Global camel case") {
        Stanza::Options options{ Stanza::ConfigLayer{ .naming = Stanza::naming_policy::camel_case } };
        auto meta = options.metadata<fixtures::Person>();
        REQUIRE(meta);
        REQUIRE(wire_names(**meta) == std::vector<std::string>{ "firstName", "lastName", "birthDay" });
        REQUIRE((*meta)->properties[0].declared_name == "FirstName");
    }

    SECTION("Global run-time layer overrides the design-time layer") {
        Stanza::Options options{ Stanza::ConfigLayer{ .naming = Stanza::naming_policy::camel_case } };
        REQUIRE(options.configure_global({ .naming = Stanza::naming_policy::none }));
        auto meta = options.metadata<fixtures::Person>();
        REQUIRE(meta);
        REQUIRE((*meta)->properties[0].name == "FirstName");
    }

    SECTION("Declared json name bypasses the class naming policy") {
        Stanza::Options options;
        auto meta = options.metadata<Renamed>();
        REQUIRE(meta);
        REQUIRE(wire_names(**meta) == std::vector<std::string>{ "id", "displayName" });
    }

    SECTION("Run-time name beats every other source") {
        Stanza::Options options;
        REQUIRE(options.configure_property<Renamed>("Identifier", { .name = "key" }));
        REQUIRE(options.configure_property<fixtures::Person>("BirthDay", { .name = "born" }));

        auto renamed = options.metadata<Renamed>();
        REQUIRE(renamed);
        REQUIRE((*renamed)->properties[0].name == "key");

        auto person = options.metadata<fixtures::Person>();
        REQUIRE(person);
        REQUIRE((*person)->properties[2].name == "born");
        REQUIRE((*person)->properties[2].escaped_name == "\"born\"");
    }
}

TEST_CASE("Escaped Names Are Ready to Write") {
    Stanza::Options options;
    auto meta = options.metadata<Quoted>();
    REQUIRE(meta);
    REQUIRE((*meta)->properties[0].escaped_name == R"("say \"hi\"")");

    auto json = Stanza::serialize(Quoted{ "x" }, options);
    REQUIRE(json);
    REQUIRE(*json == R"({"say \"hi\"":"x"})");
}

TEST_CASE("Property Policies Are Resolved Per Property") {
    Stanza::Options options;
    auto meta = options.metadata<fixtures::Sparse>();
    REQUIRE(meta);
    const auto& m = **meta;

    REQUIRE(m.policy.ignore_null_on_write);
    REQUIRE(m.find("Nickname")->policy.ignore_null_on_write);
    REQUIRE_FALSE(m.find("Rank")->policy.ignore_null_on_write);
    REQUIRE(m.find("Count")->policy.ignore_null_on_read);
    REQUIRE_FALSE(m.find("Nickname")->policy.ignore_null_on_read);
}

TEST_CASE("Run-time Property Layer Beats the Declaration") {
    Stanza::Options options;
    REQUIRE(options.configure_property<fixtures::Palette>("Primary", { .layer = { .enum_as_string = false } }));
    REQUIRE(options.configure_property<fixtures::Palette>("Secondary", { .layer = { .enum_as_string = true } }));

    auto meta = options.metadata<fixtures::Palette>();
    REQUIRE(meta);
    REQUIRE_FALSE((*meta)->find("Primary")->policy.enum_as_string);
    REQUIRE((*meta)->find("Secondary")->policy.enum_as_string);
    REQUIRE_FALSE((*meta)->find("Level")->policy.enum_as_string);
}

TEST_CASE("Enum Written by Name Without Declared Names Fails") {
    Stanza::Options options;
    REQUIRE(options.configure_type<fixtures::Palette>({ .enum_as_string = true }));
    auto meta = options.metadata<fixtures::Palette>();
    REQUIRE_FALSE(meta);
    REQUIRE(meta.error().kind == Stanza::Error::category::configuration);
    REQUIRE_THAT(meta.error().msg, Matchers::ContainsSubstring("Level"));
}

TEST_CASE("Read-only Properties Have No Mutable Accessor") {
    Stanza::Options options;
    auto meta = options.metadata<fixtures::Account>();
    REQUIRE(meta);
    REQUIRE_FALSE((*meta)->find("Owner")->read_only());
    REQUIRE((*meta)->find("Display")->read_only());
}

TEST_CASE("Callbacks Are Detected") {
    Stanza::Options options;
    auto tracked = options.metadata<fixtures::Tracked>();
    REQUIRE(tracked);
    REQUIRE((*tracked)->callbacks.on_deserializing != nullptr);
    REQUIRE((*tracked)->callbacks.on_deserialized != nullptr);
    REQUIRE((*tracked)->callbacks.on_serializing != nullptr);
    REQUIRE((*tracked)->callbacks.on_serialized != nullptr);

    auto person = options.metadata<fixtures::Person>();
    REQUIRE(person);
    REQUIRE((*person)->callbacks.on_deserialized == nullptr);
}

TEST_CASE("Duplicate Wire Names Fail") {
    Stanza::Options options;
    auto meta = options.metadata<Duplicated>();
    REQUIRE_FALSE(meta);
    REQUIRE(meta.error().kind == Stanza::Error::category::configuration);
    REQUIRE_THAT(meta.error().msg, Matchers::ContainsSubstring("duplicate property name 'Value'"));
}

TEST_CASE("Names Colliding Under Case Folding Fail Only When Folding") {
    Stanza::Options options;

    auto colliding = options.metadata<Colliding>();
    REQUIRE_FALSE(colliding);
    REQUIRE(colliding.error().kind == Stanza::Error::category::configuration);

    auto distinct = options.metadata<CaseDistinct>();
    REQUIRE(distinct);
    REQUIRE((*distinct)->properties.size() == 2);
}

TEST_CASE("Build Failures Are Cached") {
    Stanza::Options options;
    auto first = options.metadata<Lookup>();
    REQUIRE_FALSE(first);
    REQUIRE(first.error().kind == Stanza::Error::category::unsupported_type);
    REQUIRE_THAT(first.error().msg, Matchers::ContainsSubstring("Entries"));
    const std::size_t builds = options.metadata_cache().builds();

    auto second = options.metadata<Lookup>();
    REQUIRE_FALSE(second);
    REQUIRE(second.error().msg == first.error().msg);
    REQUIRE(options.metadata_cache().builds() == builds);

    auto read = Stanza::deserialize<Lookup>("{}", options);
    REQUIRE_FALSE(read);
    REQUIRE(read.error().kind == Stanza::Error::category::unsupported_type);
    REQUIRE(options.metadata_cache().builds() == builds);
}

TEST_CASE("Types Without a Declaration Have No Metadata") {
    Stanza::Options options;
    auto meta = options.metadata<int>();
    REQUIRE_FALSE(meta);
    REQUIRE(meta.error().kind == Stanza::Error::category::unsupported_type);
}

TEST_CASE("Run-time Converter Must Match the Property Type") {
    Stanza::Options options;
    REQUIRE(options.configure_property<fixtures::Person>("FirstName", { .converter = std::make_shared<fixtures::PointConverter>() }));
    auto meta = options.metadata<fixtures::Person>();
    REQUIRE_FALSE(meta);
    REQUIRE(meta.error().kind == Stanza::Error::category::configuration);
}

TEST_CASE("Property Converters Are Resolved at Build Time") {
    Stanza::Options options;
    REQUIRE(options.configure_property<fixtures::Person>("LastName", { .converter = std::make_shared<fixtures::ShoutingConverter>() }));
    auto meta = options.metadata<fixtures::Person>();
    REQUIRE(meta);

    auto builtin = options.converter_for(Stanza::type_of<std::string>());
    REQUIRE(builtin);
    REQUIRE((*meta)->find("FirstName")->converter == *builtin);
    REQUIRE((*meta)->find("LastName")->converter != *builtin);
}
