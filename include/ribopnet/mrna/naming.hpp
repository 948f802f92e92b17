// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <string>

namespace ribopnet::mrna
{
    // Naming contract shared by the compilers and by anything that reads their output
    // (simulation history columns are place names).
    //
    //   p_<chain>_<i>       copies of <chain> waiting at position i, i = 0..L-1
    //   p_<product>         released polypeptide molecules
    //   t_<chain>_t<i>      elongation step i, i = 1..L
    //   p_free_ribosomes    shared resource pool

    std::string position_place_name(const std::string &chain, std::size_t position);
    std::string product_place_name(const std::string &product);
    std::string step_transition_name(const std::string &chain, std::size_t step);
    const std::string &resource_place_name();

} // namespace ribopnet::mrna
