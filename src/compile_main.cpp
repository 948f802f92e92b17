// SPDX-License-Identifier: AGPL-3.0-or-later
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include <tclap/CmdLine.h>

#include "ribopnet/errors.hpp"
#include "ribopnet/mrna/chain_compiler.hpp"
#include "ribopnet/mrna/chain_set_loader.hpp"
#include "ribopnet/mrna/naming.hpp"
#include "ribopnet/mrna/resource_extension.hpp"
#include "ribopnet/pnet/network_json.hpp"

int main(int argc, char **argv)
{
    using namespace ribopnet;

    std::string input_path;
    std::string out_path;
    std::string base_path;
    bool with_ribosomes = false;
    std::optional<long long> default_ribosomes;
    int indent = 2;
    int verbose = 0;

    try
    {
        TCLAP::CmdLine cmd("compile an mRNA chain set into a place/transition network", ' ', "0.1.2");
        TCLAP::ValueArg<std::string> cmdInput("i", "input", "chain-set description (JSON)", true, "", "path", cmd);
        TCLAP::ValueArg<std::string> cmdOut("o", "out", "network output; '-' for stdout", false, "-", "path", cmd);
        TCLAP::ValueArg<std::string> cmdBase("", "base", "extend this stored network instead of compiling", false, "",
                                             "path", cmd);
        TCLAP::SwitchArg cmdRibosomes("r", "ribosomes", "couple chains through a shared ribosome pool", cmd);
        TCLAP::ValueArg<long long> cmdDefault("", "default-ribosomes",
                                              "pool size when the input has no ribosome_parameters", false, 0, "count",
                                              cmd);
        TCLAP::ValueArg<int> cmdIndent("", "indent", "JSON indentation, -1 for one line", false, 2, "int", cmd);
        TCLAP::MultiSwitchArg cmdVerbose("v", "verbose", "verbosity level", cmd);
        cmd.parse(argc, argv);

        input_path = cmdInput.getValue();
        out_path = cmdOut.getValue();
        base_path = cmdBase.getValue();
        with_ribosomes = cmdRibosomes.getValue() || !base_path.empty();
        if (cmdDefault.isSet())
            default_ribosomes = cmdDefault.getValue();
        indent = cmdIndent.getValue();
        verbose = cmdVerbose.getValue();
    }
    catch (const TCLAP::ArgException &e)
    {
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << "\n";
        return 1;
    }

    try
    {
        const mrna::ChainSet set = mrna::load_chain_set(input_path);
        if (verbose >= 1)
        {
            std::cerr << "Loaded " << set.chains.size() << " chain(s) from " << input_path << "\n";
            for (const auto &c : set.chains)
                std::cerr << "  " << c.name << ": " << c.length() << " steps -> " << mrna::product_place_name(c.product_name)
                          << "\n";
        }

        pnet::Network network = base_path.empty() ? mrna::compile(set.chains, set.parameters)
                                                  : pnet::load_network(base_path);

        if (with_ribosomes)
        {
            mrna::ExtensionConfig config;
            if (default_ribosomes)
                config.default_initial_units = *default_ribosomes;
            network = mrna::extend(std::move(network), set.chains, set.parameters.resource_parameters, config);
            if (verbose >= 1)
                std::cerr << "Ribosome pool " << mrna::resource_place_name() << " = "
                          << network.place(mrna::resource_place_name()).initial_marking << "\n";
        }

        const auto problems = pnet::check_integrity(network);
        if (!problems.empty())
        {
            for (const auto &p : problems)
                std::cerr << "integrity: " << p << "\n";
            return 2;
        }

        if (verbose >= 1)
            std::cerr << "Network: " << network.places.size() << " places, " << network.transitions.size()
                      << " transitions\n";

        if (out_path == "-")
            std::cout << pnet::to_json(network).dump(indent) << "\n";
        else
            pnet::save_network(network, out_path, indent);
    }
    catch (const Error &e)
    {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
