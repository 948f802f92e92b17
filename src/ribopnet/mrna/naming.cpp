// SPDX-License-Identifier: AGPL-3.0-or-later
#include "ribopnet/mrna/naming.hpp"

namespace ribopnet::mrna
{
    std::string position_place_name(const std::string &chain, std::size_t position)
    {
        return "p_" + chain + "_" + std::to_string(position);
    }

    std::string product_place_name(const std::string &product)
    {
        return "p_" + product;
    }

    std::string step_transition_name(const std::string &chain, std::size_t step)
    {
        return "t_" + chain + "_t" + std::to_string(step);
    }

    const std::string &resource_place_name()
    {
        static const std::string name = "p_free_ribosomes";
        return name;
    }

} // namespace ribopnet::mrna
