// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <stdexcept>
#include <string>

namespace ribopnet
{
    // Base for every failure raised while loading, compiling or extending a network.
    class Error : public std::runtime_error
    {
    public:
        explicit Error(const std::string &what) : std::runtime_error(what) {}
    };

    // Malformed chain: empty sequence, empty or duplicate name, colliding product place.
    class InvalidChainError : public Error
    {
    public:
        explicit InvalidChainError(const std::string &what) : Error(what) {}
    };

    // Malformed simulation parameters (negative marking or target, bad excess factor).
    class InvalidParametersError : public Error
    {
    public:
        explicit InvalidParametersError(const std::string &what) : Error(what) {}
    };

    // Extension applied to a network that lacks a chain's first or last transition.
    class MissingTransitionError : public Error
    {
    public:
        explicit MissingTransitionError(const std::string &what) : Error(what) {}
    };

    // Negative or unresolvable resource pool size.
    class InvalidResourceError : public Error
    {
    public:
        explicit InvalidResourceError(const std::string &what) : Error(what) {}
    };

    // Unreadable file or a JSON document of the wrong shape.
    class ConfigError : public Error
    {
    public:
        explicit ConfigError(const std::string &what) : Error(what) {}
    };

} // namespace ribopnet
