// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ribopnet::pnet
{
    // Token counts and arc weights. Signed so that bad input can be rejected instead of wrapping.
    using Count = std::int64_t;

    // Arc map: place name -> weight. Ordered so that iteration and serialization are deterministic.
    using ArcMap = std::map<std::string, Count>;

    struct Place
    {
        std::string name;
        Count initial_marking{0};

        bool operator==(const Place &) const = default;
    };

    struct Transition
    {
        std::string name;
        ArcMap consume; // place -> tokens removed on firing
        ArcMap produce; // place -> tokens added on firing

        bool operator==(const Transition &) const = default;
    };

    // Place/transition network handed to the simulation engine.
    // Map keys equal the name stored in the value.
    struct Network
    {
        std::map<std::string, Place> places;
        std::map<std::string, Transition> transitions;

        bool operator==(const Network &) const = default;

        bool has_place(const std::string &name) const { return places.count(name) != 0; }
        bool has_transition(const std::string &name) const { return transitions.count(name) != 0; }

        // Inserts a place, returns false if the name is already taken.
        bool add_place(const std::string &name, Count initial_marking);
        // Inserts a transition, returns false if the name is already taken.
        bool add_transition(Transition transition);

        const Place &place(const std::string &name) const { return places.at(name); }
        const Transition &transition(const std::string &name) const { return transitions.at(name); }
        Transition &transition(const std::string &name) { return transitions.at(name); }
    };

    // Adds weight to an arc, creating it if absent. Existing weights are summed, never replaced.
    void add_arc(ArcMap &arcs, const std::string &place, Count weight);

    // Returns one message per broken invariant; empty when the network is consistent:
    // every arc names an existing place, markings are >= 0, weights are > 0,
    // and map keys match the stored names.
    std::vector<std::string> check_integrity(const Network &network);

} // namespace ribopnet::pnet
