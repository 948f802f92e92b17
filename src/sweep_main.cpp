// SPDX-License-Identifier: AGPL-3.0-or-later
#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <tclap/CmdLine.h>

#include "ribopnet/errors.hpp"
#include "ribopnet/experiment/sweep.hpp"
#include "ribopnet/mrna/chain_set_loader.hpp"

int main(int argc, char **argv)
{
    using namespace ribopnet;
    using nlohmann::json;

    std::string input_path;
    experiment::SweepGrid grid;
    unsigned threads = 0;
    bool quiet = false;

    try
    {
        TCLAP::CmdLine cmd("compile every point of a chains-marking x ribosome sweep", ' ', "0.1.2");
        TCLAP::ValueArg<std::string> cmdInput("i", "input", "base chain-set description (JSON)", true, "", "path", cmd);
        TCLAP::MultiArg<long long> cmdMarkings("m", "marking", "initial chains marking value (repeatable)", true,
                                               "count", cmd);
        TCLAP::MultiArg<long long> cmdRibosomes("r", "ribosomes", "initial ribosome value (repeatable)", true, "count",
                                                cmd);
        TCLAP::ValueArg<int> cmdRepetitions("n", "repetitions", "runs per parameter combination", false, 1, "int", cmd);
        TCLAP::ValueArg<long long> cmdGoal("g", "goal", "max protein output goal", false, 100, "count", cmd);
        TCLAP::ValueArg<unsigned> cmdThreads("j", "threads", "worker threads, 0 for 70% of cores", false, 0, "int", cmd);
        TCLAP::SwitchArg cmdQuiet("q", "quiet", "no progress lines on stderr", cmd);
        cmd.parse(argc, argv);

        input_path = cmdInput.getValue();
        for (long long m : cmdMarkings.getValue())
            grid.chains_marking_values.push_back(m);
        for (long long r : cmdRibosomes.getValue())
            grid.ribosome_values.push_back(r);
        grid.repetitions = cmdRepetitions.getValue();
        grid.max_protein_output_goal = cmdGoal.getValue();
        threads = cmdThreads.getValue();
        quiet = cmdQuiet.getValue();
    }
    catch (const TCLAP::ArgException &e)
    {
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << "\n";
        return 1;
    }

    try
    {
        mrna::ChainSet base = mrna::load_chain_set(input_path);
        experiment::SweepRunner runner(std::move(base), grid);
        runner.set_threads(threads);
        if (!quiet)
            runner.set_log(&std::cerr);

        if (!quiet)
            std::cerr << "Total points: " << runner.points().size() << " (" << grid.repetitions
                      << " repetition(s) per combination)\n";

        const auto start = std::chrono::steady_clock::now();
        const auto outcomes = runner.run();
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

        std::size_t failed = 0;
        for (const auto &o : outcomes)
        {
            json line = {
                {"index", o.point.index},
                {"initial_chains_marking", o.point.initial_chains_marking},
                {"initial_ribosomes", o.point.initial_ribosomes},
                {"repetition", o.point.repetition},
                {"excess_factor", o.point.excess_factor},
                {"step_budget", o.point.step_budget},
                {"history_file", experiment::history_file_name(o.point)},
                {"ok", o.ok},
            };
            if (o.ok)
            {
                line["places"] = o.place_count;
                line["transitions"] = o.transition_count;
            }
            else
            {
                line["error"] = o.error;
                ++failed;
            }
            std::cout << line.dump() << "\n";
        }

        if (!quiet)
            std::cerr << "Successful: " << outcomes.size() - failed << ", failed: " << failed << ", elapsed "
                      << elapsed.count() << " s\n";
        return failed == 0 ? 0 : 3;
    }
    catch (const Error &e)
    {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
