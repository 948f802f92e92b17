// SPDX-License-Identifier: AGPL-3.0-or-later
#include "ribopnet/pnet/network_json.hpp"

#include <fstream>

#include "ribopnet/errors.hpp"

namespace ribopnet::pnet
{
    namespace detail
    {
        static inline json arcs_to_json(const ArcMap &arcs)
        {
            json out = json::object();
            for (const auto &[place, weight] : arcs)
                out[place] = weight;
            return out;
        }

        static inline Count read_count(const json &v, const std::string &where)
        {
            if (!v.is_number_integer())
                throw ConfigError(where + ": expected an integer, got " + std::string(v.type_name()));
            return v.get<Count>();
        }

        static inline ArcMap arcs_from_json(const json &t, const char *key, const std::string &transition)
        {
            ArcMap arcs;
            if (!t.contains(key) || t[key].is_null())
                return arcs;
            const json &obj = t[key];
            if (!obj.is_object())
                throw ConfigError("transition '" + transition + "': '" + key + "' must be an object");
            for (const auto &[place, weight] : obj.items())
                arcs[place] = read_count(weight, "transition '" + transition + "' " + key + " '" + place + "'");
            return arcs;
        }
    }

    json to_json(const Network &network)
    {
        json places = json::object();
        for (const auto &[name, p] : network.places)
            places[name] = p.initial_marking;

        json transitions = json::object();
        for (const auto &[name, t] : network.transitions)
        {
            transitions[name] = json{
                {"consume", detail::arcs_to_json(t.consume)},
                {"produce", detail::arcs_to_json(t.produce)},
            };
        }

        return json{{"places", std::move(places)}, {"transitions", std::move(transitions)}};
    }

    Network network_from_json(const json &doc)
    {
        if (!doc.is_object())
            throw ConfigError("network document must be a JSON object");
        if (!doc.contains("places") || !doc["places"].is_object())
            throw ConfigError("network document needs a 'places' object");
        if (!doc.contains("transitions") || !doc["transitions"].is_object())
            throw ConfigError("network document needs a 'transitions' object");

        Network network;
        for (const auto &[name, marking] : doc["places"].items())
            network.add_place(name, detail::read_count(marking, "place '" + name + "'"));

        for (const auto &[name, t] : doc["transitions"].items())
        {
            if (!t.is_object())
                throw ConfigError("transition '" + name + "' must be an object");
            network.add_transition(Transition{
                name,
                detail::arcs_from_json(t, "consume", name),
                detail::arcs_from_json(t, "produce", name),
            });
        }
        return network;
    }

    Network load_network(const std::string &path)
    {
        std::ifstream f(path);
        if (!f)
            throw ConfigError("cannot open network file '" + path + "'");

        json doc;
        try
        {
            f >> doc;
        }
        catch (const json::parse_error &e)
        {
            throw ConfigError("invalid JSON in '" + path + "': " + e.what());
        }
        return network_from_json(doc);
    }

    void save_network(const Network &network, const std::string &path, int indent)
    {
        std::ofstream f(path);
        if (!f)
            throw ConfigError("cannot write network file '" + path + "'");
        f << to_json(network).dump(indent) << "\n";
        if (!f)
            throw ConfigError("failed writing network file '" + path + "'");
    }

} // namespace ribopnet::pnet
