#pragma once

/// @file selection.hpp
/// @brief Selection operators working on cached fitness values
///
/// Fitness is maximized: a larger value wins a tournament.

#include <algorithm>
#include <cassert>
#include <random>
#include <span>
#include <vector>

#include <medassign/core/concepts.hpp>

namespace medassign::operators {

/// Tournament selection with replacement
///
/// Draws `tournament_size` contestants uniformly (the same individual may be drawn more
/// than once) and returns the index of the fittest. Ties keep the earliest draw.
///
/// ## Example Usage:
/// ```cpp
/// std::vector<Fitness> fitnesses = {Fitness{0.2}, Fitness{0.7}, Fitness{0.4}};
/// std::mt19937 rng(42);
/// TournamentSelection selector(3);
/// std::size_t winner = selector.select(fitnesses, rng);
/// ```
class TournamentSelection {
    std::size_t tournament_size_;

  public:
    explicit TournamentSelection(std::size_t tournament_size = 3)
        : tournament_size_(std::max<std::size_t>(1, tournament_size)) {}

    /// @pre fitnesses.size() >= 1
    std::size_t select(std::span<const core::Fitness> fitnesses, std::mt19937& rng) const {
        assert(!fitnesses.empty());
        if (fitnesses.size() == 1) {
            return 0;
        }

        std::uniform_int_distribution<std::size_t> dist(0, fitnesses.size() - 1);

        std::size_t best_idx = dist(rng);
        core::Fitness best_fitness = fitnesses[best_idx];

        for (std::size_t i = 1; i < tournament_size_; ++i) {
            std::size_t candidate = dist(rng);
            if (fitnesses[candidate] > best_fitness) {
                best_idx = candidate;
                best_fitness = fitnesses[candidate];
            }
        }

        return best_idx;
    }

    /// Run k independent tournaments
    std::vector<std::size_t> select_many(std::span<const core::Fitness> fitnesses, std::size_t k,
                                         std::mt19937& rng) const {
        std::vector<std::size_t> chosen;
        chosen.reserve(k);
        for (std::size_t i = 0; i < k; ++i) {
            chosen.push_back(select(fitnesses, rng));
        }
        return chosen;
    }

    std::size_t tournament_size() const { return tournament_size_; }
};

} // namespace medassign::operators
