#pragma once

/// @file ga.hpp
/// @brief Generational genetic algorithm driver
///
/// Each generation selects a full offspring population by tournament, crosses adjacent
/// pairs, mutates individuals, re-evaluates only those whose genes changed and replaces the
/// population wholesale. The best candidate ever evaluated is kept in a separate slot, so
/// losing it to selection never loses it from the result.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <functional>
#include <numeric>
#include <random>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <medassign/core/concepts.hpp>
#include <medassign/core/population.hpp>
#include <medassign/utils/logging.hpp>

namespace medassign::core {

/// Configuration for genetic algorithm
struct GAConfig {
    std::size_t population_size = 100;
    std::size_t max_generations = 200;

    double crossover_prob = 0.7;
    double mutation_prob = 0.2;

    std::uint64_t seed = 1;

    std::size_t tournament_size = 3;

    // Progress callback cadence (generation 0 is always reported)
    std::size_t progress_interval = 10;

    // Early stop once gen > convergence_min_generation and |max - mean| < threshold
    double convergence_threshold = 0.001;
    std::size_t convergence_min_generation = 50;

    /// Structural sanity checks; product ranges are enforced by config::Config
    ///
    /// @throws ConfigValidationError
    void validate() const {
        if (population_size < 2) {
            throw ConfigValidationError("Population size must be at least 2");
        }
        if (max_generations == 0) {
            throw ConfigValidationError("Generation count must be positive");
        }
        if (crossover_prob < 0.0 || crossover_prob > 1.0) {
            throw ConfigValidationError("Crossover probability must be in [0,1]");
        }
        if (mutation_prob < 0.0 || mutation_prob > 1.0) {
            throw ConfigValidationError("Mutation probability must be in [0,1]");
        }
        if (tournament_size == 0) {
            throw ConfigValidationError("Tournament size must be positive");
        }
        if (progress_interval == 0) {
            throw ConfigValidationError("Progress interval must be positive");
        }
        if (convergence_threshold < 0.0) {
            throw ConfigValidationError("Convergence threshold cannot be negative");
        }
    }
};

/// Statistics for a single generation
struct GenerationStats {
    std::size_t generation = 0;
    Fitness best_fitness;   // Fittest individual of this generation
    Fitness mean_fitness;
    Fitness worst_fitness;
    Fitness best_so_far;    // Best-ever slot after this generation
    std::size_t evaluations = 0;
    std::chrono::milliseconds elapsed_time{0};
};

/// Result of genetic algorithm run
template <typename GenomeT>
struct GAResult {
    GenomeT best_genome;
    Fitness best_fitness;
    std::size_t generations = 0; // Last completed generation (0 = initial population only)
    std::size_t evaluations = 0;
    std::chrono::milliseconds total_time{0};
    std::vector<GenerationStats> history;
    bool converged = false;
    bool cancelled = false;
};

/// Receives (generation, best fitness so far)
using ProgressCallback = std::function<void(std::size_t, double)>;

/// Main genetic algorithm implementation
template <typename Selection, typename Crossover, typename Mutation>
class GeneticAlgorithm {
  public:
    using SelectionT = Selection;
    using CrossoverT = Crossover;
    using MutationT = Mutation;

  private:
    Selection selection_;
    Crossover crossover_;
    Mutation mutation_;

    mutable std::mt19937 rng_;

  public:
    GeneticAlgorithm(Selection sel, Crossover cross, Mutation mut)
        : selection_(std::move(sel)), crossover_(std::move(cross)), mutation_(std::move(mut)) {}

    const Selection& selection() const noexcept { return selection_; }
    const Crossover& crossover() const noexcept { return crossover_; }
    const Mutation& mutation() const noexcept { return mutation_; }

    /// Run genetic algorithm on the given problem
    ///
    /// @param progress Called for generation 0 and every config.progress_interval generations;
    ///                 anything thrown from it is logged and the run continues
    /// @param stop Polled once per generation; a stopped run returns its best-so-far result
    /// @throws ConfigValidationError if config is structurally invalid
    template <Problem P>
        requires SelectionOperator<Selection, P> && CrossoverOperator<Crossover, P> &&
                 MutationOperator<Mutation, P>
    GAResult<typename P::GenomeT> run(const P& problem, const GAConfig& config = {},
                                      const ProgressCallback& progress = {},
                                      std::stop_token stop = {}) {
        using GenomeT = typename P::GenomeT;

        config.validate();
        rng_.seed(static_cast<std::mt19937::result_type>(config.seed));

        auto log = utils::logger();
        log->debug("GA start: population {}, generations {}, crossover {}, mutation {}, seed {}",
                   config.population_size, config.max_generations, config.crossover_prob,
                   config.mutation_prob, config.seed);

        const auto start_time = std::chrono::steady_clock::now();
        const std::size_t n = config.population_size;

        Population<GenomeT> population(n);
        for (std::size_t i = 0; i < n; ++i) {
            population.push_back(problem.random_genome(rng_));
        }

        GAResult<GenomeT> result;
        result.history.reserve(config.max_generations + 1);
        result.evaluations = evaluate_invalid(problem, population);

        auto fitness_values = population.fitness_values();
        auto best_idx = argmax(fitness_values);
        GenomeT best_genome = population.genome(best_idx);
        Fitness best_fitness = fitness_values[best_idx];

        result.history.push_back(
            make_stats(0, fitness_values, best_fitness, result.evaluations, start_time));
        notify(progress, 0, best_fitness);

        std::size_t last_generation = 0;
        std::uniform_real_distribution<double> coin(0.0, 1.0);

        for (std::size_t gen = 1; gen <= config.max_generations; ++gen) {
            if (stop.stop_requested()) {
                result.cancelled = true;
                log->info("Run cancelled before generation {}", gen);
                break;
            }

            // Selection: copies keep their cached fitness
            Population<GenomeT> offspring(n);
            for (std::size_t i = 0; i < n; ++i) {
                const auto idx = selection_.select(fitness_values, rng_);
                offspring.push_back(population.genome(idx), population.fitness(idx));
            }

            // Crossover on adjacent pairs
            for (std::size_t i = 1; i < n; i += 2) {
                if (coin(rng_) < config.crossover_prob) {
                    auto [child1, child2] = crossover_.cross(problem, offspring.genome(i - 1),
                                                             offspring.genome(i), rng_);
                    offspring.modify(i - 1) = std::move(child1);
                    offspring.modify(i) = std::move(child2);
                }
            }

            // Mutation
            for (std::size_t i = 0; i < n; ++i) {
                if (coin(rng_) < config.mutation_prob) {
                    if (mutation_.mutate(problem, offspring.mutable_genome(i), rng_)) {
                        offspring.invalidate(i);
                    }
                }
            }

            result.evaluations += evaluate_invalid(problem, offspring);
            population = std::move(offspring);
            fitness_values = population.fitness_values();

            best_idx = argmax(fitness_values);
            if (fitness_values[best_idx] > best_fitness) {
                best_genome = population.genome(best_idx);
                best_fitness = fitness_values[best_idx];
            }

            const auto& stats = result.history.emplace_back(
                make_stats(gen, fitness_values, best_fitness, result.evaluations, start_time));
            last_generation = gen;

            if (gen % config.progress_interval == 0) {
                log->debug("Generation {}: best {:.4f}, mean {:.4f}, best so far {:.4f}", gen,
                           stats.best_fitness.value, stats.mean_fitness.value, best_fitness.value);
                notify(progress, gen, best_fitness);
            }

            if (gen > config.convergence_min_generation &&
                std::abs(stats.best_fitness.value - stats.mean_fitness.value) <
                    config.convergence_threshold) {
                result.converged = true;
                log->info("Converged at generation {}", gen);
                break;
            }
        }

        const auto end_time = std::chrono::steady_clock::now();

        result.best_genome = std::move(best_genome);
        result.best_fitness = best_fitness;
        result.generations = last_generation;
        result.total_time =
            std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        return result;
    }

  private:
    /// Evaluate every individual lacking a cached fitness; returns how many were evaluated
    template <Problem P>
    static std::size_t evaluate_invalid(const P& problem,
                                        Population<typename P::GenomeT>& population) {
        std::size_t evaluated = 0;
        for (std::size_t i = 0; i < population.size(); ++i) {
            if (!population.has_fitness(i)) {
                population.set_fitness(i, problem.evaluate(population.genome(i)));
                ++evaluated;
            }
        }
        return evaluated;
    }

    static std::size_t argmax(const std::vector<Fitness>& values) {
        return static_cast<std::size_t>(std::max_element(values.begin(), values.end()) -
                                        values.begin());
    }

    static GenerationStats make_stats(std::size_t generation, const std::vector<Fitness>& values,
                                      Fitness best_so_far, std::size_t evaluations,
                                      std::chrono::steady_clock::time_point start_time) {
        const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());

        GenerationStats stats;
        stats.generation = generation;
        stats.best_fitness = *max_it;
        stats.worst_fitness = *min_it;
        stats.mean_fitness = Fitness(
            std::accumulate(values.begin(), values.end(), 0.0,
                            [](double sum, const Fitness& f) { return sum + f.value; }) /
            static_cast<double>(values.size()));
        stats.best_so_far = best_so_far;
        stats.evaluations = evaluations;
        stats.elapsed_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return stats;
    }

    static void notify(const ProgressCallback& progress, std::size_t generation, Fitness best) {
        if (!progress)
            return;
        try {
            progress(generation, best.value);
        } catch (const std::exception& e) {
            utils::logger()->warn("Progress callback failed at generation {}: {}", generation,
                                  e.what());
        } catch (...) {
            utils::logger()->warn("Progress callback failed at generation {}", generation);
        }
    }
};

/// Factory function for creating genetic algorithms
template <typename Selection, typename Crossover, typename Mutation>
auto make_ga(Selection sel, Crossover cross, Mutation mut) {
    return GeneticAlgorithm<Selection, Crossover, Mutation>(std::move(sel), std::move(cross),
                                                            std::move(mut));
}

} // namespace medassign::core
