// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "ribopnet/mrna/chain.hpp"

namespace ribopnet::mrna
{
    using json = nlohmann::json;

    // Parse a chain-set description:
    //   {"chains": [{"name", "sequence", "polipeptide_name"}],
    //    "simulation_parameters": {"initial_chains_marking", "max_protein_output_goal",
    //                              "excess_aminoacids_factor"?, "ribosome_parameters"?: {"initial_ribosomes"}}}
    // "product_name" is accepted in place of "polipeptide_name".
    // Values are taken as written; range checks are left to compile() and extend().
    ChainSet chain_set_from_json(const json &doc);

    ChainSet load_chain_set(const std::string &path);

    // Inverse of chain_set_from_json, writing "polipeptide_name".
    json to_json(const ChainSet &set);

} // namespace ribopnet::mrna
