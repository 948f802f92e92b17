// SPDX-License-Identifier: AGPL-3.0-or-later
#include "ribopnet/mrna/chain_compiler.hpp"

#include <cmath>
#include <set>
#include <sstream>
#include <string>
#include <utility>

#include "ribopnet/errors.hpp"
#include "ribopnet/mrna/naming.hpp"

namespace ribopnet::mrna
{
    void validate_parameters(const SimulationParameters &params)
    {
        if (params.initial_marking_per_chain < 0)
        {
            std::ostringstream msg;
            msg << "initial_chains_marking must be >= 0, got " << params.initial_marking_per_chain;
            throw InvalidParametersError(msg.str());
        }
        if (params.target_output < 0)
        {
            std::ostringstream msg;
            msg << "max_protein_output_goal must be >= 0, got " << params.target_output;
            throw InvalidParametersError(msg.str());
        }
        if (params.excess_factor && !(std::isfinite(*params.excess_factor) && *params.excess_factor > 0.0))
        {
            std::ostringstream msg;
            msg << "excess_aminoacids_factor must be a positive number, got " << *params.excess_factor;
            throw InvalidParametersError(msg.str());
        }
    }

    void validate_chains(const std::vector<Chain> &chains)
    {
        std::set<std::string> names;
        std::set<std::string> position_places;

        for (const Chain &c : chains)
        {
            if (c.name.empty())
                throw InvalidChainError("chain name must not be empty");
            if (!names.insert(c.name).second)
                throw InvalidChainError("duplicate chain name '" + c.name + "'");
            if (c.sequence.empty())
                throw InvalidChainError("chain '" + c.name + "' has an empty sequence");
            if (c.product_name.empty())
                throw InvalidChainError("chain '" + c.name + "' has an empty product name");

            for (std::size_t i = 0; i < c.length(); ++i)
                position_places.insert(position_place_name(c.name, i));
        }

        // Product places share the p_ prefix with position places and the resource pool.
        for (const Chain &c : chains)
        {
            const std::string product = product_place_name(c.product_name);
            if (product == resource_place_name())
                throw InvalidChainError("chain '" + c.name + "': product place '" + product +
                                        "' is reserved for the resource pool");
            if (position_places.count(product))
                throw InvalidChainError("chain '" + c.name + "': product place '" + product +
                                        "' collides with a chain position place");
        }
    }

    pnet::Network compile(const std::vector<Chain> &chains, const SimulationParameters &params)
    {
        validate_parameters(params);
        validate_chains(chains);

        pnet::Network network;
        for (const Chain &c : chains)
        {
            const std::size_t L = c.length();
            for (std::size_t i = 0; i < L; ++i)
                network.add_place(position_place_name(c.name, i), i == 0 ? params.initial_marking_per_chain : 0);

            // Shared products: the first chain creates the place, later ones feed into it.
            const std::string product = product_place_name(c.product_name);
            network.add_place(product, 0);

            for (std::size_t step = 1; step <= L; ++step)
            {
                pnet::Transition t;
                t.name = step_transition_name(c.name, step);
                t.consume[position_place_name(c.name, step - 1)] = 1;
                t.produce[step == L ? product : position_place_name(c.name, step)] = 1;
                network.add_transition(std::move(t));
            }
        }
        return network;
    }

} // namespace ribopnet::mrna
