// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <optional>
#include <vector>

#include "ribopnet/mrna/chain.hpp"
#include "ribopnet/pnet/network.hpp"

namespace ribopnet::mrna
{
    struct ExtensionConfig
    {
        // Pool size used when the caller passes no ResourceParameters.
        // Unset by default: extend() then refuses to guess and throws InvalidResourceError.
        // The sweep experiments this tool grew out of used 50.
        std::optional<Count> default_initial_units;
    };

    // Couples every chain to a shared pool of free ribosomes.
    //
    // Adds p_free_ribosomes seeded with the pool size, then for each chain adds a weight-1
    // consume arc on t_<chain>_t1 and a weight-1 produce arc on t_<chain>_tL. Arcs are merged
    // additively, so extending an already extended network doubles those weights.
    // Every other transition is left as it was.
    //
    // The base is taken by value: pass std::move(base) to extend in place, or a copy to keep it.
    // All transitions are checked before the first change, so on error nothing is modified.
    //
    // Throws InvalidChainError, InvalidResourceError or MissingTransitionError.
    pnet::Network extend(pnet::Network base, const std::vector<Chain> &chains,
                         const std::optional<ResourceParameters> &resource,
                         const ExtensionConfig &config = {});

    // Pool size extend() will use for the given inputs.
    Count resolve_initial_units(const std::optional<ResourceParameters> &resource, const ExtensionConfig &config);

} // namespace ribopnet::mrna
