// SPDX-License-Identifier: AGPL-3.0-or-later
#include "ribopnet/experiment/sweep.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <iomanip>
#include <limits>
#include <mutex>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "ribopnet/errors.hpp"
#include "ribopnet/mrna/chain_compiler.hpp"

namespace ribopnet::experiment
{
    namespace detail
    {
        static inline Count longest_chain(const std::vector<mrna::Chain> &chains)
        {
            std::size_t L = 0;
            for (const auto &c : chains)
                L = std::max(L, c.length());
            return static_cast<Count>(L);
        }

        static inline std::string format_excess(double excess)
        {
            std::ostringstream s;
            s << std::fixed << std::setprecision(2) << excess;
            return s.str();
        }
    }

    std::vector<SweepPoint> expand_grid(const SweepGrid &grid, const std::vector<mrna::Chain> &chains)
    {
        if (grid.max_protein_output_goal <= 0)
            throw InvalidParametersError("sweep max_protein_output_goal must be > 0");
        if (grid.repetitions < 1)
            throw InvalidParametersError("sweep repetitions must be >= 1");

        const Count L = detail::longest_chain(chains);
        // Largest marking whose step budget L * (marking + 1) still fits in a Count.
        const Count max_marking = std::numeric_limits<Count>::max() / std::max<Count>(L, 1) - 1;
        for (Count marking : grid.chains_marking_values)
        {
            if (marking < 0 || marking > max_marking)
            {
                std::ostringstream msg;
                msg << "sweep chains marking must be in [0, " << max_marking << "], got " << marking;
                throw InvalidParametersError(msg.str());
            }
        }

        std::vector<SweepPoint> points;
        points.reserve(grid.chains_marking_values.size() * grid.ribosome_values.size() *
                       static_cast<std::size_t>(grid.repetitions));

        for (Count marking : grid.chains_marking_values)
        {
            for (Count ribosomes : grid.ribosome_values)
            {
                for (int r = 0; r < grid.repetitions; ++r)
                {
                    SweepPoint p;
                    p.index = points.size();
                    p.initial_chains_marking = marking;
                    p.initial_ribosomes = ribosomes;
                    p.repetition = r;
                    p.excess_factor = static_cast<double>(marking) / static_cast<double>(grid.max_protein_output_goal);
                    p.step_budget = L * (marking + 1);
                    points.push_back(p);
                }
            }
        }
        return points;
    }

    mrna::ChainSet make_chain_set(const mrna::ChainSet &base, const SweepPoint &point, Count max_protein_output_goal)
    {
        mrna::ChainSet set = base;
        set.parameters.initial_marking_per_chain = point.initial_chains_marking;
        set.parameters.target_output = max_protein_output_goal;
        set.parameters.resource_parameters = mrna::ResourceParameters{point.initial_ribosomes};
        return set;
    }

    std::string history_file_name(const SweepPoint &point, const std::optional<std::string> &timestamp)
    {
        std::ostringstream s;
        s << "chains_marking_simulation_history_" << point.initial_ribosomes << "_ribosomes_"
          << detail::format_excess(point.excess_factor) << "_excess_mrna";
        if (timestamp)
            s << "_" << *timestamp;
        s << ".parquet";
        return s.str();
    }

    std::optional<RunKey> parse_history_file_name(const std::string &name)
    {
        // With or without the _YYYYmmdd_HHMMSS suffix.
        static const std::regex pattern(
            R"(chains_marking_simulation_history_(\d+)_ribosomes_(\d+(?:\.\d+)?)_excess_mrna(?:_\d{8}_\d{6})?\.parquet$)");

        std::smatch m;
        if (!std::regex_search(name, m, pattern))
            return std::nullopt;

        RunKey key;
        const std::string ribosomes = m[1].str();
        const char *last = ribosomes.data() + ribosomes.size();
        const auto [end, ec] = std::from_chars(ribosomes.data(), last, key.initial_ribosomes);
        if (ec != std::errc{} || end != last)
            return std::nullopt;
        try
        {
            key.excess_factor = std::stod(m[2].str());
        }
        catch (const std::out_of_range &)
        {
            return std::nullopt;
        }
        return key;
    }

    SweepRunner::SweepRunner(mrna::ChainSet base, SweepGrid grid, mrna::ExtensionConfig extension)
        : m_base(std::move(base)), m_grid(std::move(grid)), m_extension(std::move(extension))
    {
        m_points = expand_grid(m_grid, m_base.chains);
    }

    unsigned SweepRunner::default_threads()
    {
        const unsigned hw = std::thread::hardware_concurrency();
        return std::max(1u, static_cast<unsigned>(hw * 0.7));
    }

    SweepOutcome SweepRunner::run_point(const SweepPoint &point, const EngineCallback &engine) const
    {
        SweepOutcome out;
        out.point = point;

        const mrna::ChainSet set = make_chain_set(m_base, point, m_grid.max_protein_output_goal);
        try
        {
            pnet::Network network = mrna::extend(mrna::compile(set.chains, set.parameters), set.chains,
                                                 set.parameters.resource_parameters, m_extension);
            out.place_count = network.places.size();
            out.transition_count = network.transitions.size();
            if (engine)
                engine(point, network);
            out.ok = true;
        }
        catch (const std::exception &e)
        {
            out.error = e.what();
        }
        return out;
    }

    std::vector<SweepOutcome> SweepRunner::run(const EngineCallback &engine)
    {
        std::vector<SweepOutcome> outcomes(m_points.size());
        if (m_points.empty())
            return outcomes;

        const unsigned threads =
            std::min<unsigned>(m_threads ? m_threads : default_threads(), static_cast<unsigned>(m_points.size()));

        std::atomic<std::size_t> next{0};
        std::atomic<std::size_t> done{0};
        std::mutex log_mutex;

        auto worker = [&]()
        {
            for (std::size_t i = next++; i < m_points.size(); i = next++)
            {
                outcomes[i] = run_point(m_points[i], engine);
                const std::size_t finished = ++done;
                if (!m_log)
                    continue;

                std::lock_guard<std::mutex> lock(log_mutex);
                const SweepPoint &p = m_points[i];
                if (!outcomes[i].ok)
                    *m_log << "[sweep] point " << p.index << " (" << p.initial_chains_marking << " chains, "
                           << p.initial_ribosomes << " ribosomes) failed: " << outcomes[i].error << "\n";
                *m_log << "[sweep] progress: " << finished << "/" << m_points.size() << " completed\n";
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(threads);
        {
            // If a spawn fails, the workers already started drain the queue and are joined before the throw leaves.
            ThreadJoiner joiner(pool);
            for (unsigned t = 0; t < threads; ++t)
                pool.emplace_back(worker);
        }

        return outcomes;
    }

} // namespace ribopnet::experiment
