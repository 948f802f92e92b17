// SPDX-License-Identifier: AGPL-3.0-or-later
#include "ribopnet/pnet/network.hpp"

#include <sstream>
#include <utility>

namespace ribopnet::pnet
{
    namespace detail
    {
        static inline void check_arcs(const Network &network, const Transition &t, const ArcMap &arcs,
                                      const char *side, std::vector<std::string> &out)
        {
            for (const auto &[place, weight] : arcs)
            {
                if (!network.has_place(place))
                {
                    std::ostringstream msg;
                    msg << "transition '" << t.name << "' " << side << "s unknown place '" << place << "'";
                    out.push_back(msg.str());
                }
                if (weight <= 0)
                {
                    std::ostringstream msg;
                    msg << "transition '" << t.name << "' has non-positive " << side << " weight " << weight
                        << " on place '" << place << "'";
                    out.push_back(msg.str());
                }
            }
        }
    }

    bool Network::add_place(const std::string &name, Count initial_marking)
    {
        return places.emplace(name, Place{name, initial_marking}).second;
    }

    bool Network::add_transition(Transition transition)
    {
        std::string key = transition.name;
        return transitions.emplace(std::move(key), std::move(transition)).second;
    }

    void add_arc(ArcMap &arcs, const std::string &place, Count weight)
    {
        arcs[place] += weight;
    }

    std::vector<std::string> check_integrity(const Network &network)
    {
        std::vector<std::string> out;

        for (const auto &[key, p] : network.places)
        {
            if (key != p.name)
                out.push_back("place key '" + key + "' does not match stored name '" + p.name + "'");
            if (p.initial_marking < 0)
            {
                std::ostringstream msg;
                msg << "place '" << key << "' has negative marking " << p.initial_marking;
                out.push_back(msg.str());
            }
        }

        for (const auto &[key, t] : network.transitions)
        {
            if (key != t.name)
                out.push_back("transition key '" + key + "' does not match stored name '" + t.name + "'");
            if (network.has_place(key))
                out.push_back("name '" + key + "' is used by both a place and a transition");
            detail::check_arcs(network, t, t.consume, "consume", out);
            detail::check_arcs(network, t, t.produce, "produce", out);
        }

        return out;
    }

} // namespace ribopnet::pnet
