#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <random>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace medassign::core {

/// Fitness value of a candidate assignment (higher is better)
struct Fitness {
    double value;

    constexpr Fitness() : value(0.0) {}
    constexpr explicit Fitness(double v) : value(v) {}

    constexpr auto operator<=>(const Fitness&) const = default;

    constexpr Fitness& operator+=(const Fitness& other) {
        value += other.value;
        return *this;
    }
    constexpr Fitness& operator*=(double factor) {
        value *= factor;
        return *this;
    }
};

/// Generic genome representation
template <typename Gene>
using Genome = std::vector<Gene>;

/// Run parameters outside their admissible range
class ConfigValidationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Input data required for a run is missing (empty roster, duplicate ids)
class DataUnavailableError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Engine used out of order, e.g. optimize() before a successful load_data()
class SequencingError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

/// A candidate broke the encoding invariant (wrong length, gene out of range).
/// Signals a defect in the engine; callers must not try to recover from it.
class InvariantViolation : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

/// Concept for optimization problems
template <typename P>
concept Problem = requires(const P& problem, const typename P::GenomeT& genome) {
    typename P::Gene;
    typename P::GenomeT;

    // Must be able to evaluate a genome
    { problem.evaluate(genome) } -> std::convertible_to<Fitness>;

    // Must be able to generate a random genome
    { problem.random_genome(std::declval<std::mt19937&>()) } -> std::same_as<typename P::GenomeT>;

    // Must provide problem size/dimension
    { problem.size() } -> std::convertible_to<std::size_t>;
};

/// Problems whose genes are category indices in [0, num_values())
template <typename P>
concept CategoricalProblem = Problem<P> && requires(const P& problem) {
    { problem.num_values() } -> std::convertible_to<std::size_t>;
};

/// Concept for selection operators
///
/// Selection receives the cached fitness of every individual and returns the index of the
/// chosen one. Precondition: fitnesses.size() >= 1.
template <typename S, typename P>
concept SelectionOperator =
    Problem<P> &&
    requires(const S& selector, std::span<const Fitness> fitnesses, std::mt19937& rng) {
        { selector.select(fitnesses, rng) } -> std::same_as<std::size_t>;
    };

/// Concept for crossover operators
template <typename C, typename P>
concept CrossoverOperator =
    Problem<P> && requires(const C& crossover, const P& problem, const typename P::GenomeT& parent1,
                           const typename P::GenomeT& parent2, std::mt19937& rng) {
        // Produce offspring from two parents
        {
            crossover.cross(problem, parent1, parent2, rng)
        } -> std::same_as<std::pair<typename P::GenomeT, typename P::GenomeT>>;
    };

/// Concept for mutation operators
///
/// Mutates in place and reports whether any gene changed, so the caller knows when a
/// cached fitness has gone stale.
template <typename M, typename P>
concept MutationOperator = Problem<P> && requires(const M& mutator, const P& problem,
                                                  typename P::GenomeT& genome, std::mt19937& rng) {
    { mutator.mutate(problem, genome, rng) } -> std::same_as<bool>;
};

} // namespace medassign::core
