// SPDX-License-Identifier: AGPL-3.0-or-later
#include "ribopnet/mrna/chain_set_loader.hpp"

#include <fstream>
#include <utility>

#include "ribopnet/errors.hpp"

namespace ribopnet::mrna
{
    namespace detail
    {
        template <typename E>
        static inline std::string get_string(const json &obj, const char *key, const std::string &where)
        {
            if (!obj.contains(key) || obj[key].is_null())
                throw E(where + ": missing '" + key + "'");
            if (!obj[key].is_string())
                throw E(where + ": '" + key + "' must be a string");
            return obj[key].get<std::string>();
        }

        template <typename E>
        static inline Count get_count(const json &obj, const char *key, const std::string &where)
        {
            if (!obj.contains(key) || obj[key].is_null())
                throw E(where + ": missing '" + key + "'");
            if (!obj[key].is_number_integer())
                throw E(where + ": '" + key + "' must be an integer");
            return obj[key].get<Count>();
        }

        static inline Chain parse_chain(const json &c, std::size_t index)
        {
            const std::string where = "chains[" + std::to_string(index) + "]";
            if (!c.is_object())
                throw InvalidChainError(where + " must be an object");

            Chain chain;
            chain.name = get_string<InvalidChainError>(c, "name", where);
            chain.sequence = get_string<InvalidChainError>(c, "sequence", where);
            if (c.contains("polipeptide_name"))
                chain.product_name = get_string<InvalidChainError>(c, "polipeptide_name", where);
            else
                chain.product_name = get_string<InvalidChainError>(c, "product_name", where);
            return chain;
        }

        static inline SimulationParameters parse_parameters(const json &p)
        {
            const std::string where = "simulation_parameters";
            SimulationParameters params;
            params.initial_marking_per_chain = get_count<InvalidParametersError>(p, "initial_chains_marking", where);
            params.target_output = get_count<InvalidParametersError>(p, "max_protein_output_goal", where);

            if (p.contains("excess_aminoacids_factor") && !p["excess_aminoacids_factor"].is_null())
            {
                if (!p["excess_aminoacids_factor"].is_number())
                    throw InvalidParametersError(where + ": 'excess_aminoacids_factor' must be a number");
                params.excess_factor = p["excess_aminoacids_factor"].get<double>();
            }

            if (p.contains("ribosome_parameters") && !p["ribosome_parameters"].is_null())
            {
                const json &r = p["ribosome_parameters"];
                if (!r.is_object())
                    throw InvalidResourceError(where + ": 'ribosome_parameters' must be an object");
                params.resource_parameters =
                    ResourceParameters{get_count<InvalidResourceError>(r, "initial_ribosomes", where + ".ribosome_parameters")};
            }
            return params;
        }
    }

    ChainSet chain_set_from_json(const json &doc)
    {
        if (!doc.is_object())
            throw ConfigError("chain-set description must be a JSON object");
        if (!doc.contains("chains") || !doc["chains"].is_array())
            throw InvalidChainError("chain-set description needs a 'chains' array");
        if (!doc.contains("simulation_parameters") || !doc["simulation_parameters"].is_object())
            throw InvalidParametersError("chain-set description needs a 'simulation_parameters' object");

        ChainSet set;
        const json &chains = doc["chains"];
        set.chains.reserve(chains.size());
        for (std::size_t i = 0; i < chains.size(); ++i)
            set.chains.push_back(detail::parse_chain(chains[i], i));

        set.parameters = detail::parse_parameters(doc["simulation_parameters"]);
        return set;
    }

    ChainSet load_chain_set(const std::string &path)
    {
        std::ifstream f(path);
        if (!f)
            throw ConfigError("cannot open chain-set file '" + path + "'");

        json doc;
        try
        {
            f >> doc;
        }
        catch (const json::parse_error &e)
        {
            throw ConfigError("invalid JSON in '" + path + "': " + e.what());
        }
        return chain_set_from_json(doc);
    }

    json to_json(const ChainSet &set)
    {
        json chains = json::array();
        for (const Chain &c : set.chains)
            chains.push_back(json{{"name", c.name}, {"sequence", c.sequence}, {"polipeptide_name", c.product_name}});

        const SimulationParameters &p = set.parameters;
        json params = {
            {"initial_chains_marking", p.initial_marking_per_chain},
            {"max_protein_output_goal", p.target_output},
        };
        if (p.excess_factor)
            params["excess_aminoacids_factor"] = *p.excess_factor;
        if (p.resource_parameters)
            params["ribosome_parameters"] = {{"initial_ribosomes", p.resource_parameters->initial_units}};

        return json{{"chains", std::move(chains)}, {"simulation_parameters", std::move(params)}};
    }

} // namespace ribopnet::mrna
