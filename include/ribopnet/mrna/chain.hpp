// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ribopnet/pnet/network.hpp"

namespace ribopnet::mrna
{
    using pnet::Count;

    // One mRNA transcript to be translated.
    struct Chain
    {
        std::string name;         // unique within a compilation, e.g. "chainA"
        std::string sequence;     // one monomer symbol per character; length = elongation steps
        std::string product_name; // polypeptide released on completion, e.g. "preinsulin"

        std::size_t length() const { return sequence.size(); }
    };

    struct ResourceParameters
    {
        Count initial_units{0}; // free ribosomes at t = 0
    };

    struct SimulationParameters
    {
        Count initial_marking_per_chain{0}; // copies of each chain waiting at position 0
        Count target_output{0};             // informational target, not used by the compilers
        std::optional<double> excess_factor; // informational ratio
        std::optional<ResourceParameters> resource_parameters;
    };

    // A full experiment configuration: what the chain-set description file holds.
    struct ChainSet
    {
        std::vector<Chain> chains;
        SimulationParameters parameters;
    };

} // namespace ribopnet::mrna
