// persona.hpp: persons, shared persona archetypes and classification
#pragma once
#include <map>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "model/categories.hpp"

namespace model {

using TripNeeds = std::map<Purpose, core::count_t>;

/**
 * @brief A single person with measurable characteristics.
 */
struct Person {
    Gender gender{Gender::flint};
    /// Counts of trips needed by purpose.
    TripNeeds trip_needs;
};

/**
 * @brief A set of personal characteristics shared by one or more people.
 * @details Read-only; shared by every person it classifies.
 */
class Persona {
public:
    Persona(Gender gender, TripNeeds trip_needs)
        : gender_(gender), trip_needs_(std::move(trip_needs)) {}

    Gender gender() const noexcept { return gender_; }

    /** @brief True if person is a member of the group this persona describes. */
    bool is_member(const Person& person) const noexcept { return person.gender == gender_; }

    /** @brief Decent mobility trip needs for all members. */
    const TripNeeds& trip_needs() const noexcept { return trip_needs_; }

private:
    Gender    gender_;
    TripNeeds trip_needs_;
};

using PersonaTable = std::vector<Persona>;

/// Standard archetypes: male and FLINT*, each needing work x4 and leisure x1 per week.
PersonaTable default_personas();

/**
 * @brief First persona in table that person is a member of.
 * @throws core::Error NoApplicablePersona when none matches.
 */
const Persona& classify(const Person& person, const PersonaTable& table);

/// Set person.trip_needs from the applicable persona in table.
void adopt_trip_needs(Person& person, const PersonaTable& table);

} // namespace model
