#pragma once

#include <algorithm>
#include <cassert>
#include <random>
#include <utility>
#include <vector>

#include "../core/concepts.hpp"

namespace medassign::operators {

/// Two-point crossover for fixed-length assignment vectors
///
/// Both cut points are drawn from [1, n-1]; the segment [cut1, cut2) is exchanged between
/// the parents. Genes never move between positions, so every child gene at position i is
/// one of the parents' genes at position i.
class TwoPointCrossover {
  public:
    template <core::Problem P>
    std::pair<typename P::GenomeT, typename P::GenomeT>
    cross([[maybe_unused]] const P& problem, const typename P::GenomeT& parent1,
          const typename P::GenomeT& parent2, std::mt19937& rng) const {

        assert(parent1.size() == parent2.size());
        const std::size_t n = parent1.size();

        if (n < 2) {
            return {parent1, parent2};
        }

        std::uniform_int_distribution<std::size_t> dist(1, n - 1);
        std::size_t point1 = dist(rng);
        std::size_t point2 = dist(rng);
        if (point2 < point1)
            std::swap(point1, point2);

        auto child1 = parent1;
        auto child2 = parent2;
        std::swap_ranges(child1.begin() + point1, child1.begin() + point2,
                         child2.begin() + point1);

        return {std::move(child1), std::move(child2)};
    }
};

/// Uniform crossover: each position is exchanged independently with probability indpb
class UniformCrossover {
    double indpb_;

  public:
    explicit UniformCrossover(double indpb = 0.5) : indpb_(indpb) {}

    template <core::Problem P>
    std::pair<typename P::GenomeT, typename P::GenomeT>
    cross([[maybe_unused]] const P& problem, const typename P::GenomeT& parent1,
          const typename P::GenomeT& parent2, std::mt19937& rng) const {

        assert(parent1.size() == parent2.size());

        auto child1 = parent1;
        auto child2 = parent2;

        std::uniform_real_distribution<double> coin(0.0, 1.0);
        for (std::size_t i = 0; i < child1.size(); ++i) {
            if (coin(rng) < indpb_) {
                std::swap(child1[i], child2[i]);
            }
        }

        return {std::move(child1), std::move(child2)};
    }

    double indpb() const { return indpb_; }
};

} // namespace medassign::operators
