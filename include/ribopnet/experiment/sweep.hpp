// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include "ribopnet/mrna/chain.hpp"
#include "ribopnet/mrna/resource_extension.hpp"
#include "ribopnet/pnet/network.hpp"

namespace ribopnet::experiment
{
    using pnet::Count;

    // Substrate availability x ribosome availability grid, each cell repeated.
    struct SweepGrid
    {
        std::vector<Count> chains_marking_values;
        std::vector<Count> ribosome_values;
        int repetitions{1};
        Count max_protein_output_goal{100};
    };

    struct SweepPoint
    {
        std::size_t index{0};
        Count initial_chains_marking{0};
        Count initial_ribosomes{0};
        int repetition{0};
        double excess_factor{0.0};   // initial_chains_marking / max_protein_output_goal
        Count step_budget{0};        // longest chain * (initial_chains_marking + 1)
    };

    // Expands the grid in marking-major, ribosome, repetition order.
    // Throws InvalidParametersError for a non-positive goal or repetition count, and for a
    // marking that is negative or whose step budget would overflow Count.
    std::vector<SweepPoint> expand_grid(const SweepGrid &grid, const std::vector<mrna::Chain> &chains);

    // Copy of base with the point's marking and ribosome count applied.
    mrna::ChainSet make_chain_set(const mrna::ChainSet &base, const SweepPoint &point, Count max_protein_output_goal);

    // Simulation history file name for a run, e.g.
    // chains_marking_simulation_history_2_ribosomes_1.00_excess_mrna_20250101_120000.parquet
    std::string history_file_name(const SweepPoint &point, const std::optional<std::string> &timestamp = std::nullopt);

    struct RunKey
    {
        Count initial_ribosomes{0};
        double excess_factor{0.0};
    };

    // Recovers (ribosomes, excess factor) from a history file name or path; nullopt if it does not match.
    std::optional<RunKey> parse_history_file_name(const std::string &name);

    struct SweepOutcome
    {
        SweepPoint point;
        bool ok{false};
        std::size_t place_count{0};
        std::size_t transition_count{0};
        std::string error; // what() of the compile failure when !ok
    };

    // Receives each compiled network. Runs on a worker thread; the network is the worker's own.
    using EngineCallback = std::function<void(const SweepPoint &, const pnet::Network &)>;

    // Joins every joinable thread in the pool when it goes out of scope, including on unwinding.
    class ThreadJoiner
    {
    public:
        explicit ThreadJoiner(std::vector<std::thread> &pool) : m_pool(pool) {}
        ThreadJoiner(const ThreadJoiner &) = delete;
        ThreadJoiner &operator=(const ThreadJoiner &) = delete;
        ~ThreadJoiner()
        {
            for (auto &th : m_pool)
                if (th.joinable())
                    th.join();
        }

    private:
        std::vector<std::thread> &m_pool;
    };

    // Compiles and extends every point of a sweep on a pool of worker threads.
    class SweepRunner
    {
    public:
        SweepRunner(mrna::ChainSet base, SweepGrid grid, mrna::ExtensionConfig extension = {});

        // 0 picks 70% of the hardware threads, at least one.
        void set_threads(unsigned threads) { m_threads = threads; }
        // Progress lines go here; nullptr silences them.
        void set_log(std::ostream *log) { m_log = log; }

        const std::vector<SweepPoint> &points() const { return m_points; }

        // Returns one outcome per point, in point order. A failing point is logged and recorded,
        // the rest of the sweep still runs.
        std::vector<SweepOutcome> run(const EngineCallback &engine = {});

        static unsigned default_threads();

    private:
        SweepOutcome run_point(const SweepPoint &point, const EngineCallback &engine) const;

        mrna::ChainSet m_base;
        SweepGrid m_grid;
        mrna::ExtensionConfig m_extension;
        std::vector<SweepPoint> m_points;
        unsigned m_threads{0};
        std::ostream *m_log{nullptr};
    };

} // namespace ribopnet::experiment
