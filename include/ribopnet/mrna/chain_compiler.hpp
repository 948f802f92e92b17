// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <vector>

#include "ribopnet/mrna/chain.hpp"
#include "ribopnet/pnet/network.hpp"

namespace ribopnet::mrna
{
    // Builds the base translation network.
    //
    // For a chain of length L: places p_<chain>_0..p_<chain>_{L-1}, position 0 seeded with
    // params.initial_marking_per_chain, and transitions t_<chain>_t1..t_<chain>_tL, each moving
    // one token forward. The last step produces into p_<product>, which is created once and
    // shared by every chain naming that product. No resource place is added.
    //
    // Throws InvalidChainError or InvalidParametersError before building anything.
    pnet::Network compile(const std::vector<Chain> &chains, const SimulationParameters &params);

    // Input checks run by compile(), exposed for drivers that want to reject a configuration early.
    void validate_chains(const std::vector<Chain> &chains);
    void validate_parameters(const SimulationParameters &params);

} // namespace ribopnet::mrna
