// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <map>
#include <random>
#include <string>
#include <vector>

#include "ribopnet/pnet/network.hpp"

// Minimal token game used to check that compiled networks behave as intended.
namespace ribopnet::test
{
    using Marking = std::map<std::string, pnet::Count>;

    inline Marking initial_marking(const pnet::Network &net)
    {
        Marking m;
        for (const auto &[name, p] : net.places)
            m[name] = p.initial_marking;
        return m;
    }

    inline bool enabled(const pnet::Transition &t, const Marking &m)
    {
        for (const auto &[place, weight] : t.consume)
        {
            auto it = m.find(place);
            if (it == m.end() || it->second < weight)
                return false;
        }
        return true;
    }

    inline void fire(const pnet::Transition &t, Marking &m)
    {
        for (const auto &[place, weight] : t.consume)
            m[place] -= weight;
        for (const auto &[place, weight] : t.produce)
            m[place] += weight;
    }

    inline std::vector<const pnet::Transition *> enabled_transitions(const pnet::Network &net, const Marking &m)
    {
        std::vector<const pnet::Transition *> out;
        for (const auto &[name, t] : net.transitions)
            if (enabled(t, m))
                out.push_back(&t);
        return out;
    }

    // Fires a uniformly chosen enabled transition until the net is dead or max_steps is reached.
    // observe(m) is called on the initial marking and after every firing.
    template <typename Observer>
    int run_random(const pnet::Network &net, Marking &m, unsigned seed, int max_steps, Observer observe)
    {
        std::mt19937 rng(seed);
        observe(m);
        int steps = 0;
        for (; steps < max_steps; ++steps)
        {
            auto choices = enabled_transitions(net, m);
            if (choices.empty())
                break;
            std::uniform_int_distribution<std::size_t> pick(0, choices.size() - 1);
            fire(*choices[pick(rng)], m);
            observe(m);
        }
        return steps;
    }

} // namespace ribopnet::test
