#pragma once

#include <array>
#include <cctype>
#include <deque>
#include <forward_list>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "stanza/stanza.hpp"

namespace fixtures {

    struct Person {
        std::string first_name;
        std::string last_name;
        Stanza::DateTime birthday;
    };

    inline void describe(Stanza::TypeBuilder<Person>& t) {
        t.field<&Person::first_name>("FirstName");
        t.field<&Person::last_name>("LastName");
        t.field<&Person::birthday>("BirthDay");
    }

    enum class Color : int { Red = 1, Green = 2, Blue = 3 };

    inline void describe(Stanza::EnumBuilder<Color>& e) {
        e.value(Color::Red, "Red").value(Color::Green, "Green").value(Color::Blue, "Blue");
    }

    enum class Level : signed char { Low = -1, Mid = 0, High = 1 };

    struct Address {
        std::string line1;
        std::string line2;
        std::string city;
    };

    // First six bytes of the first two names are identical
    inline void describe(Stanza::TypeBuilder<Address>& t) {
        t.field<&Address::line1>("Address1Line");
        t.field<&Address::line2>("Address2Line");
        t.field<&Address::city>("City");
    }

    struct Child {
        std::string name;
        std::optional<int> age;
    };

    inline void describe(Stanza::TypeBuilder<Child>& t) {
        t.field<&Child::name>("Name");
        t.field<&Child::age>("Age");
    }

    struct Family {
        std::string name;
        std::vector<Child> children;
        std::optional<Color> favourite;
        std::array<int, 3> scores{};
        std::set<std::string> tags;
    };

    inline void describe(Stanza::TypeBuilder<Family>& t) {
        t.field<&Family::name>("Name");
        t.field<&Family::children>("Children");
        t.field<&Family::favourite>("Favourite");
        t.field<&Family::scores>("Scores");
        t.field<&Family::tags>("Tags");
    }

    struct Palette {
        Color primary = Color::Red;
        Color secondary = Color::Green;
        Level level = Level::Mid;
    };

    inline void describe(Stanza::TypeBuilder<Palette>& t) {
        t.field<&Palette::primary>("Primary").enum_as_string();
        t.field<&Palette::secondary>("Secondary");
        t.field<&Palette::level>("Level");
    }

    struct Node {
        int value = 0;
        std::vector<Node> children;
    };

    inline void describe(Stanza::TypeBuilder<Node>& t) {
        t.field<&Node::value>("Value");
        t.field<&Node::children>("Children");
    }

    /// Nested chain of @p depth objects.
    inline std::string nested_nodes(std::size_t depth) {
        std::string s;
        for (std::size_t i = 0; i < depth; i++) s += R"({"Value":1,"Children":[)";
        for (std::size_t i = 0; i < depth; i++) s += "]}";
        return s;
    }

    struct Animal {
        virtual ~Animal() = default;
        std::string name;
    };

    inline void describe(Stanza::TypeBuilder<Animal>& t) {
        t.field<&Animal::name>("Name");
    }

    struct Dog : Animal {
        int tricks = 0;
    };

    inline void describe(Stanza::TypeBuilder<Dog>& t) {
        t.field<&Animal::name>("Name");
        t.field<&Dog::tricks>("Tricks");
    }

    struct Cat : Animal {};

    inline void describe(Stanza::TypeBuilder<Cat>& t) {
        t.field<&Animal::name>("Name");
    }

    /// Records the order callbacks and property writes happen in.
    struct Tracked {
        int value = 0;
        std::optional<std::string> note;
        mutable std::vector<std::string> events;

        Stanza::Result<void> on_deserializing() {
            events.push_back("deserializing");
            return {};
        }

        Stanza::Result<void> on_deserialized() {
            events.push_back("deserialized");
            if (value < 0) return std::unexpected(Stanza::Error::callback_failed("value must not be negative"));
            if (!note) note = "default";
            return {};
        }

        Stanza::Result<void> on_serializing() const {
            events.push_back("serializing");
            return {};
        }

        Stanza::Result<void> on_serialized(Stanza::Writer& w) const {
            events.push_back("serialized");
            if (auto r = w.property("Checksum"); !r) return r;
            w.number(static_cast<std::int64_t>(value * 2));
            return {};
        }
    };

    inline void describe(Stanza::TypeBuilder<Tracked>& t) {
        t.field<&Tracked::value>("Value");
        t.field<&Tracked::note>("Note");
    }

    struct Sparse {
        std::optional<std::string> nickname;
        std::optional<int> rank;
        int count = 7;
    };

    inline void describe(Stanza::TypeBuilder<Sparse>& t) {
        t.options().ignore_null_on_write = true;
        t.field<&Sparse::nickname>("Nickname");
        t.field<&Sparse::rank>("Rank").ignore_null_on_write(false);
        t.field<&Sparse::count>("Count").ignore_null_on_read();
    }

    struct Account {
        std::string id;
        std::string owner;

        const std::string& display() const { return owner; }
    };

    inline void describe(Stanza::TypeBuilder<Account>& t) {
        t.field<&Account::id>("Id");
        t.field<&Account::owner>("Owner");
        t.property<&Account::display>("Display");
    }

    struct Queue {
        std::forward_list<int> items;
    };

    inline void describe(Stanza::TypeBuilder<Queue>& t) {
        t.field<&Queue::items>("Items");
    }

    /// Builds a forward_list from the decoded elements in input order.
    struct ForwardListMaterializer : Stanza::TypedMaterializer<std::forward_list<int>> {
        Stanza::Result<void> fill(std::deque<int>& elements, std::forward_list<int>& out) const override {
            out.assign(elements.begin(), elements.end());
            return {};
        }
    };

    /// Writes strings upper-cased and reads them lower-cased.
    struct ShoutingConverter : Stanza::TypedConverter<std::string> {
        Stanza::Result<void> read_value(Stanza::Reader& r, std::string& out) const override {
            if (r.token() != Stanza::token_type::string)
                return std::unexpected(r.error(Stanza::Error::code::invalid_value, "Expected a string"));
            out = r.get_string();
            for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return {};
        }

        Stanza::Result<void> write_value(Stanza::Writer& w, const std::string& v) const override {
            std::string up = v;
            for (char& c : up) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return w.string(up);
        }
    };

    struct Point {
        int x = 0;
        int y = 0;
    };

    /// Reads and writes a point as a two-element array.
    struct PointConverter : Stanza::TypedConverter<Point> {
        Stanza::Result<void> read_value(Stanza::Reader& r, Point& out) const override {
            if (r.token() != Stanza::token_type::start_array)
                return std::unexpected(r.error(Stanza::Error::code::invalid_value, "Expected [x, y]"));
            int* slots[] = { &out.x, &out.y };
            for (int* slot : slots) {
                auto more = r.read();
                if (!more) return std::unexpected(more.error());
                if (r.token() != Stanza::token_type::number)
                    return std::unexpected(r.error(Stanza::Error::code::invalid_value, "Expected a coordinate"));
                *slot = std::stoi(std::string{ r.raw() });
            }
            auto end = r.read();
            if (!end) return std::unexpected(end.error());
            if (r.token() != Stanza::token_type::end_array)
                return std::unexpected(r.error(Stanza::Error::code::invalid_value, "Expected ]"));
            return {};
        }

        Stanza::Result<void> write_value(Stanza::Writer& w, const Point& p) const override {
            if (auto r = w.start_array(); !r) return r;
            w.number(static_cast<std::int64_t>(p.x));
            w.number(static_cast<std::int64_t>(p.y));
            return w.end_array();
        }
    };

    struct Shape {
        std::string name;
        Point origin;
        std::vector<Point> path;
    };

    inline void describe(Stanza::TypeBuilder<Shape>& t) {
        t.field<&Shape::name>("Name");
        t.field<&Shape::origin>("Origin").converter(std::make_shared<PointConverter>());
        t.field<&Shape::path>("Path");
    }

    struct Grid {
        int cells[2][2]{};
        int cube[2][2][2]{};
    };

    inline void describe(Stanza::TypeBuilder<Grid>& t) {
        t.field<&Grid::cells>("Cells");
        t.field<&Grid::cube>("Cube");
    }

} // namespace fixtures
