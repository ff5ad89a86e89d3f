#include <print>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "stanza/stanza.hpp"

struct Contact {
    std::string kind;
    std::string value;
};

void describe(Stanza::TypeBuilder<Contact>& t) {
    t.field<&Contact::kind>("Kind");
    t.field<&Contact::value>("Value");
}

struct Person {
    std::string first_name;
    std::string last_name;
    Stanza::DateTime birthday;
    std::optional<std::string> nickname;
    std::vector<Contact> contacts;
};

void describe(Stanza::TypeBuilder<Person>& t) {
    t.options().ignore_null_on_write = true;
    t.field<&Person::first_name>("FirstName");
    t.field<&Person::last_name>("LastName");
    t.field<&Person::birthday>("BirthDay");
    t.field<&Person::nickname>("Nickname");
    t.field<&Person::contacts>("Contacts");
}

int main(int argc, char** argv) {
    Stanza::logger()->set_level(spdlog::level::info);

    Stanza::Options options{ Stanza::ConfigLayer{ .naming = Stanza::naming_policy::camel_case } };
    if (auto r = options.set_pretty(true); !r) {
        std::println("{}", Stanza::to_string(r.error()));
        return 1;
    }

    Person jane{ "Jane", "Doe", Stanza::DateTime::from_parts(2000, 1, 1), std::nullopt,
                 { { "email", "jane@example.com" }, { "phone", "555-0100" } } };

    auto json = Stanza::serialize(jane, options);
    if (!json) {
        std::println("{}", Stanza::to_string(json.error()));
        return 1;
    }
    std::println("{}", *json);

    auto back = Stanza::deserialize<Person>(*json, options);
    if (!back) {
        std::println("{}", Stanza::to_string(back.error()));
        return 1;
    }
    std::println("\n{} {} has {} contacts", back->first_name, back->last_name, back->contacts.size());

    if (argc < 2) return 0;

    std::ifstream ifs(argv[1]);
    if (!ifs) {
        std::println("Failed to open {}", argv[1]);
        return -1;
    }

    auto from_file = Stanza::deserialize<Person>(ifs, options);
    if (!from_file) {
        std::println("Read error! -> {}", Stanza::to_string(from_file.error()));
        return 1;
    }
    std::println("{} {} read from {}", from_file->first_name, from_file->last_name, argv[1]);

    return 0;
}
