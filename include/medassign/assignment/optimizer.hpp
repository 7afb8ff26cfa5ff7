#pragma once

/// @file optimizer.hpp
/// @brief Annual assignment run: data load, evolution, result extraction
///
/// An Optimizer owns one FitnessContext snapshot and one GA instance. It moves through
/// Uninitialized -> DataLoaded -> Evolving -> Completed; optimize() may be repeated on the
/// same snapshot once data is loaded.

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <medassign/core/concepts.hpp>
#include <medassign/core/ga.hpp>
#include <medassign/operators/crossover.hpp>
#include <medassign/operators/mutation.hpp>
#include <medassign/operators/selection.hpp>
#include <medassign/problems/assignment.hpp>
#include <medassign/problems/context.hpp>
#include <medassign/problems/model.hpp>
#include <medassign/utils/logging.hpp>

namespace medassign::assignment {

/// Everything a run needs besides the data
struct OptimizerSettings {
    int fiscal_year = 2025;
    core::GAConfig ga;

    // Per-offspring stage probabilities inside the mutation pipeline
    double random_gene_rate = 0.05;
    double capacity_rate = 0.3;
    double hope_rate = 0.2;

    // Accepted and validated by the configuration layer; not part of the fitness formula
    double mismatch_bonus = 1.5;
};

enum class OptimizerState { Uninitialized, DataLoaded, Evolving, Completed };

[[nodiscard]] inline std::string_view to_string(OptimizerState state) noexcept {
    switch (state) {
    case OptimizerState::Uninitialized:
        return "uninitialized";
    case OptimizerState::DataLoaded:
        return "data_loaded";
    case OptimizerState::Evolving:
        return "evolving";
    case OptimizerState::Completed:
        return "completed";
    }
    return "uninitialized";
}

/// Final placement of one resident
struct AssignmentOutcome {
    int resident_id = 0;
    int hospital_id = 0;
    int hope_rank = 0;    // 1..3, or 0 when the hospital was not among the choices
    double fitness = 0.0; // Score of this placement alone (no competition for capacity)
};

struct OptimizationResult {
    int fiscal_year = 0;
    std::vector<int> best_genome;
    core::Fitness best_fitness;
    std::size_t generations = 0;
    std::size_t evaluations = 0;
    bool converged = false;
    bool cancelled = false;
    std::chrono::milliseconds total_time{0};
    std::vector<core::GenerationStats> history;
    std::vector<AssignmentOutcome> assignments;

    /// Number of residents placed outside their declared choices
    [[nodiscard]] std::size_t mismatch_count() const noexcept {
        std::size_t count = 0;
        for (const auto& outcome : assignments) {
            if (outcome.hope_rank == 0)
                ++count;
        }
        return count;
    }
};

/// Random reset, then capacity repair, then hope repair
using AssignmentMutation =
    operators::MutationPipeline<operators::RandomResetMutation, operators::CapacityAwareMutation,
                                operators::HopeAwareMutation>;

/// Operator set registered for one run
inline auto make_assignment_ga(const OptimizerSettings& settings) {
    return core::make_ga(operators::TournamentSelection{settings.ga.tournament_size},
                         operators::TwoPointCrossover{},
                         AssignmentMutation{operators::RandomResetMutation{settings.random_gene_rate},
                                            operators::CapacityAwareMutation{settings.capacity_rate},
                                            operators::HopeAwareMutation{settings.hope_rate}});
}

using AssignmentGA = decltype(make_assignment_ga(std::declval<const OptimizerSettings&>()));

/// Per-resident outcomes of a genome, each scored on a single-resident context
[[nodiscard]] inline std::vector<AssignmentOutcome>
extract_assignments(const problems::FitnessContext& ctx, const std::vector<int>& genome) {
    std::vector<AssignmentOutcome> outcomes;
    outcomes.reserve(genome.size());

    for (std::size_t i = 0; i < genome.size(); ++i) {
        const auto& hospital = ctx.hospitals.at(static_cast<std::size_t>(genome[i]));
        const problems::AssignmentProblem single(ctx.narrowed_to(i));

        AssignmentOutcome outcome;
        outcome.resident_id = ctx.residents[i].id;
        outcome.hospital_id = hospital.id;
        outcome.hope_rank = problems::scoring::hope_rank(ctx, i, hospital.id);
        outcome.fitness = single.evaluate({genome[i]}).value;
        outcomes.push_back(outcome);
    }
    return outcomes;
}

class Optimizer {
    OptimizerSettings settings_;
    AssignmentGA ga_;
    OptimizerState state_ = OptimizerState::Uninitialized;
    std::optional<problems::AssignmentProblem> problem_;

  public:
    /// @throws core::ConfigValidationError if settings.ga is structurally invalid
    explicit Optimizer(OptimizerSettings settings)
        : settings_(std::move(settings)), ga_(make_assignment_ga(settings_)) {
        settings_.ga.validate();
    }

    [[nodiscard]] OptimizerState state() const noexcept { return state_; }
    [[nodiscard]] const OptimizerSettings& settings() const noexcept { return settings_; }

    /// Snapshot of the loaded data
    ///
    /// @throws core::SequencingError before a successful load_data()
    [[nodiscard]] const problems::FitnessContext& context() const {
        if (!problem_) {
            throw core::SequencingError("No data loaded");
        }
        return problem_->context();
    }

    /// Load the staff (filtered to residents) and hospital lists from the source
    template <problems::RosterSource Source>
    [[nodiscard]] bool load_data(const Source& source) {
        std::vector<problems::Resident> residents;
        for (auto& member : source.staff()) {
            if (member.staff_type == problems::StaffType::Resident) {
                residents.push_back(std::move(member));
            }
        }
        return load_data(source, std::move(residents), source.hospitals());
    }

    /// Build the run snapshot from explicit lists
    ///
    /// Returns false, logs a warning and leaves the state unchanged when either list is
    /// empty or contains duplicate ids.
    template <problems::ContextSource Source>
    [[nodiscard]] bool load_data(const Source& source, std::vector<problems::Resident> residents,
                                 std::vector<problems::Hospital> hospitals) {
        auto log = utils::logger();
        if (state_ == OptimizerState::Evolving) {
            throw core::SequencingError("Cannot load data while a run is in progress");
        }

        try {
            auto ctx = problems::build_context(source, settings_.fiscal_year, std::move(residents),
                                               std::move(hospitals));
            log->info("Loaded {} residents and {} hospitals for fiscal year {}",
                      ctx.resident_count(), ctx.hospital_count(), settings_.fiscal_year);
            problem_.emplace(std::move(ctx));
        } catch (const core::DataUnavailableError& e) {
            log->warn("Data load failed: {}", e.what());
            return false;
        }

        state_ = OptimizerState::DataLoaded;
        return true;
    }

    /// Evolve assignments for the loaded snapshot
    ///
    /// @throws core::SequencingError unless data has been loaded
    OptimizationResult optimize(const core::ProgressCallback& progress = {},
                                std::stop_token stop = {}) {
        if (state_ != OptimizerState::DataLoaded && state_ != OptimizerState::Completed) {
            throw core::SequencingError("optimize() requires loaded data (state: " +
                                        std::string(to_string(state_)) + ")");
        }

        auto log = utils::logger();
        log->info("Starting optimization: population {}, generations {}",
                  settings_.ga.population_size, settings_.ga.max_generations);

        state_ = OptimizerState::Evolving;
        OptimizationResult result;
        try {
            auto run = ga_.run(*problem_, settings_.ga, progress, std::move(stop));

            result.fiscal_year = settings_.fiscal_year;
            result.best_fitness = run.best_fitness;
            result.generations = run.generations;
            result.evaluations = run.evaluations;
            result.converged = run.converged;
            result.cancelled = run.cancelled;
            result.total_time = run.total_time;
            result.history = std::move(run.history);
            result.assignments = extract_assignments(problem_->context(), run.best_genome);
            result.best_genome = std::move(run.best_genome);
        } catch (...) {
            state_ = OptimizerState::DataLoaded;
            throw;
        }

        state_ = OptimizerState::Completed;
        log->info("Optimization finished after {} generations: best fitness {:.4f}, {} of {} "
                  "residents outside their choices",
                  result.generations, result.best_fitness.value, result.mismatch_count(),
                  result.assignments.size());
        return result;
    }
};

} // namespace medassign::assignment
