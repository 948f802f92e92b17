// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "ribopnet/pnet/network.hpp"

namespace ribopnet::pnet
{
    using json = nlohmann::json;

    // {"places": {name: marking}, "transitions": {name: {"consume": {...}, "produce": {...}}}}
    // Keys come out sorted, so equal networks dump to identical text.
    json to_json(const Network &network);

    // Inverse of to_json. Throws ConfigError on a document of the wrong shape.
    Network network_from_json(const json &doc);

    // Reads a network document from disk. Throws ConfigError if unreadable or malformed.
    Network load_network(const std::string &path);

    // Writes to_json(network) with the given indentation. Throws ConfigError on I/O failure.
    void save_network(const Network &network, const std::string &path, int indent = 2);

} // namespace ribopnet::pnet
