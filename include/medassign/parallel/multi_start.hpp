#pragma once

#ifdef MEDASSIGN_HAVE_TBB

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <medassign/assignment/optimizer.hpp>
#include <medassign/problems/context.hpp>
#include <medassign/utils/logging.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>

namespace medassign::parallel {

struct MultiStartResult {
    assignment::OptimizationResult best;
    std::size_t best_index = 0; // Position of the winning seed
    std::vector<std::uint64_t> seeds;
    std::vector<double> best_fitness_per_start;
};

/// Independent optimizer runs, one per seed, executed in parallel
///
/// Every run owns its own snapshot, population and random engine, so the outcome of each
/// start depends only on its seed. The best start wins; ties go to the earlier seed.
/// Returns std::nullopt when the source does not yield residents and hospitals.
///
/// @throws std::invalid_argument if seeds is empty
/// @throws std::exception Propagates failures of any run
template <problems::RosterSource Source>
[[nodiscard]] std::optional<MultiStartResult>
run_multi_start(const Source& source, const assignment::OptimizerSettings& settings,
                std::span<const std::uint64_t> seeds) {
    if (seeds.empty()) {
        throw std::invalid_argument("Multi-start needs at least one seed");
    }

    std::vector<assignment::Optimizer> optimizers;
    optimizers.reserve(seeds.size());
    for (const auto seed : seeds) {
        auto run_settings = settings;
        run_settings.ga.seed = seed;
        auto& optimizer = optimizers.emplace_back(run_settings);
        if (!optimizer.load_data(source)) {
            return std::nullopt;
        }
    }

    utils::logger()->info("Running {} independent starts", seeds.size());

    std::vector<assignment::OptimizationResult> results(seeds.size());
    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, seeds.size()),
        [&optimizers, &results](const tbb::blocked_range<std::size_t>& range) {
            for (std::size_t i = range.begin(); i != range.end(); ++i) {
                results[i] = optimizers[i].optimize();
            }
        },
        tbb::static_partitioner{});

    MultiStartResult outcome;
    outcome.seeds.assign(seeds.begin(), seeds.end());
    outcome.best_fitness_per_start.reserve(results.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        outcome.best_fitness_per_start.push_back(results[i].best_fitness.value);
        if (results[i].best_fitness > results[outcome.best_index].best_fitness) {
            outcome.best_index = i;
        }
    }
    outcome.best = std::move(results[outcome.best_index]);

    utils::logger()->info("Best start: seed {} with fitness {:.4f}",
                          outcome.seeds[outcome.best_index], outcome.best.best_fitness.value);
    return outcome;
}

} // namespace medassign::parallel

#else

#error "\n" \
       "====================================================================\n" \
       " TBB (Threading Building Blocks) is required for multi-start runs\n" \
       " but was not found during configuration.\n" \
       "\n" \
       " Resolution options:\n" \
       "   1. Install the oneTBB development package:\n" \
       "      - Ubuntu/Debian: apt install libtbb-dev\n" \
       "      - RHEL/CentOS:   yum install tbb-devel\n" \
       "      - macOS:         brew install tbb\n" \
       "\n" \
       "   2. Build without multi-start support:\n" \
       "      cmake -DMEDASSIGN_USE_TBB=OFF .\n" \
       "===================================================================="

#endif // MEDASSIGN_HAVE_TBB
