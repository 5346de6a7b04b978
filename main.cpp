#include <iostream>
#include <memory>
#include "lazy.hpp"

// Example usage
using namespace lazy;

struct Contact
{
    std::string first;
    std::string last;
    std::string mobile;
    std::string home;
};

struct Person
{
    Field<std::string, "name">        name;
    Field<std::string, "phone">       phone;
    Field<std::string, "contactInfo"> contactInfo;
    Field<int32_t,     "nameLength">  nameLength;
};

struct Application : std::enable_shared_from_this<Application>
{
    Application() : toPerson(mapping(personSpecification())) {}

    static Specification<Contact, Person> personSpecification()
    {
        Specification<Contact, Person> spec;

        spec.rule("name"_fld, [] (Contact const& c)
            {
                std::cout << "  (computing name)" << std::endl;
                return c.first + " " + c.last;
            })
            .rule("phone"_fld, [] (Contact const& c)
            {
                std::cout << "  (computing phone)" << std::endl;
                return c.mobile.empty() ? c.home : c.mobile;
            })
            .rule("contactInfo"_fld, [] (Contact const&, auto const& self)
            {
                std::cout << "  (computing contactInfo)" << std::endl;
                return self("name"_fld).value_or("") + " <" + self("phone"_fld).value_or("no phone") + ">";
            })
            .rule("nameLength"_fld, [] (Contact const&, auto const& self)
            {
                return static_cast<int32_t>(self("name"_fld).value_or("").size());
            });

        return spec;
    }

    void run()
    {
        auto lando = toPerson(Contact { "Lando", "Calrissian", "555-123-1234", "555-555-5555" });

        std::cout << "keys:";
        for (auto const& key : lando.keys())
            std::cout << " " << key;
        std::cout << std::endl;

        std::cout << "contactInfo: " << *lando("contactInfo"_fld) << std::endl;
        std::cout << "name again:  " << *lando("name"_fld) << std::endl;

        lando.set("name"_fld, "Baron Administrator");
        lando.set("planet", "Bespin");
        lando.remove("phone");

        std::cout << "after edits: " << lando << std::endl;
        std::cout << "has(\"phone\"): " << lando.has("phone")
                  << ", get(\"phone\") valid: " << lando.get("phone").isValid() << std::endl;

        if (auto descriptor = lando.describe("planet"); descriptor && descriptor->value != nullptr)
            std::cout << "planet: " << *descriptor->value << std::endl;

        Person plain = lando.snapshot();
        std::cout << "snapshot name length: " << plain.nameLength.value_or(0) << std::endl;

        auto han = toPerson(Contact { "Han", "Solo", "", "555-000-0000" });
        std::cout << std::format("{}", han) << std::endl;
    }

    Factory<Contact, Person> toPerson;
};

struct Loop
{
    Field<int32_t, "ping"> ping;
    Field<int32_t, "pong"> pong;
};

void cycleExample()
{
    std::cout << "\n=== Cycle detection ===\n\n";

    Specification<Contact, Loop> spec;
    spec.rule("ping"_fld, [] (Contact const&, auto const& self) { return self("pong"_fld).value_or(0) + 1; })
        .rule("pong"_fld, [] (Contact const&, auto const& self) { return self("ping"_fld).value_or(0) + 1; });

    auto loop = mapping(std::move(spec), Options { .detectCycles = true })(Contact {});

    try
    {
        loop.get("ping");
    }
    catch (CircularDependency const& e)
    {
        std::cout << "  " << e.what() << std::endl;
    }

    loop.set("pong", 41);
    std::cout << "  ping = " << *loop("ping"_fld) << std::endl;
}

int main()
{
    setLogLevel(LogLevel::info);

    auto app = std::make_shared<Application>();
    app->run();

    cycleExample();

    return 0;
}
