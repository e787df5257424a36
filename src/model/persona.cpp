// persona.cpp
#include "model/persona.hpp"

#include <spdlog/fmt/fmt.h>

#include "core/error.hpp"

namespace model {

PersonaTable default_personas() {
    const TripNeeds needs{{Purpose::work, 4}, {Purpose::leisure, 1}};
    return {Persona(Gender::male, needs), Persona(Gender::flint, needs)};
}

const Persona& classify(const Person& person, const PersonaTable& table) {
    for (const Persona& p : table) {
        if (p.is_member(person)) return p;
    }
    core::fail(core::ErrorKind::NoApplicablePersona,
               fmt::format("no persona for gender {} among {} personas", to_string(person.gender), table.size()));
}

void adopt_trip_needs(Person& person, const PersonaTable& table) {
    person.trip_needs = classify(person, table).trip_needs();
}

} // namespace model
