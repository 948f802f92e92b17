// SPDX-License-Identifier: AGPL-3.0-or-later
#include "ribopnet/mrna/resource_extension.hpp"

#include <set>
#include <sstream>
#include <string>
#include <utility>

#include "ribopnet/errors.hpp"
#include "ribopnet/mrna/naming.hpp"

namespace ribopnet::mrna
{
    namespace detail
    {
        struct ChainEnds
        {
            std::string first; // acquires a ribosome
            std::string last;  // releases it
        };

        static inline void require_transition(const pnet::Network &network, const Chain &c, const std::string &name)
        {
            if (!network.has_transition(name))
                throw MissingTransitionError("chain '" + c.name + "': transition '" + name +
                                             "' not found in base network");
        }

        // The last step of a chain is the one that releases its product.
        static inline void require_release(const pnet::Network &network, const Chain &c, const std::string &name)
        {
            const std::string product = product_place_name(c.product_name);
            if (!network.transition(name).produce.count(product))
                throw MissingTransitionError("chain '" + c.name + "': transition '" + name + "' does not produce '" +
                                             product + "'; sequence does not match the base network");
        }
    }

    Count resolve_initial_units(const std::optional<ResourceParameters> &resource, const ExtensionConfig &config)
    {
        Count units = 0;
        if (resource)
            units = resource->initial_units;
        else if (config.default_initial_units)
            units = *config.default_initial_units;
        else
            throw InvalidResourceError("no ribosome_parameters given and no default pool size configured");

        if (units < 0)
        {
            std::ostringstream msg;
            msg << "initial_ribosomes must be >= 0, got " << units;
            throw InvalidResourceError(msg.str());
        }
        return units;
    }

    pnet::Network extend(pnet::Network base, const std::vector<Chain> &chains,
                         const std::optional<ResourceParameters> &resource, const ExtensionConfig &config)
    {
        const Count units = resolve_initial_units(resource, config);

        std::vector<detail::ChainEnds> ends;
        ends.reserve(chains.size());
        std::set<std::string> names;
        for (const Chain &c : chains)
        {
            if (!names.insert(c.name).second)
                throw InvalidChainError("duplicate chain name '" + c.name + "'");
            if (c.sequence.empty())
                throw InvalidChainError("chain '" + c.name + "' has an empty sequence");
            detail::ChainEnds e{step_transition_name(c.name, 1), step_transition_name(c.name, c.length())};
            detail::require_transition(base, c, e.first);
            detail::require_transition(base, c, e.last);
            detail::require_release(base, c, e.last);
            ends.push_back(std::move(e));
        }

        const std::string &pool = resource_place_name();
        auto it = base.places.find(pool);
        if (it == base.places.end())
            base.add_place(pool, units);
        else
            it->second.initial_marking = units; // re-extension re-seeds the pool

        for (const detail::ChainEnds &e : ends)
        {
            pnet::add_arc(base.transition(e.first).consume, pool, 1);
            pnet::add_arc(base.transition(e.last).produce, pool, 1);
        }
        return base;
    }

} // namespace ribopnet::mrna
