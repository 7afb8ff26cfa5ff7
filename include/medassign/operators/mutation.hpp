#pragma once

/// @file mutation.hpp
/// @brief Mutation operators for assignment candidates
///
/// Every operator mutates in place and returns true when at least one gene changed. The
/// capacity- and hope-aware operators read the run's FitnessContext through the problem
/// and move at most one resident per call.

#include <random>
#include <tuple>
#include <utility>
#include <vector>

#include <medassign/core/concepts.hpp>
#include <medassign/problems/assignment.hpp>

namespace medassign::operators {

/// Replace each gene, with probability indpb, by a uniformly random hospital index
class RandomResetMutation {
    double indpb_;

  public:
    explicit RandomResetMutation(double indpb = 0.05) : indpb_(indpb) {}

    template <core::CategoricalProblem P>
    bool mutate(const P& problem, typename P::GenomeT& genome, std::mt19937& rng) const {
        const auto values = static_cast<int>(problem.num_values());
        if (values == 0)
            return false;

        std::uniform_real_distribution<double> coin(0.0, 1.0);
        std::uniform_int_distribution<int> pick(0, values - 1);

        bool changed = false;
        for (auto& gene : genome) {
            if (coin(rng) < indpb_) {
                const int replacement = pick(rng);
                changed = changed || replacement != gene;
                gene = replacement;
            }
        }
        return changed;
    }

    double indpb() const { return indpb_; }
};

/// With probability indpb, exchange the hospitals of two distinct residents
class SwapMutation {
    double indpb_;

  public:
    explicit SwapMutation(double indpb = 0.1) : indpb_(indpb) {}

    template <core::Problem P>
    bool mutate([[maybe_unused]] const P& problem, typename P::GenomeT& genome,
                std::mt19937& rng) const {
        if (genome.size() < 2)
            return false;

        std::uniform_real_distribution<double> coin(0.0, 1.0);
        if (coin(rng) >= indpb_)
            return false;

        std::uniform_int_distribution<std::size_t> dist(0, genome.size() - 1);
        std::size_t pos1 = dist(rng);
        std::size_t pos2 = dist(rng);

        // Ensure different positions
        while (pos1 == pos2) {
            pos2 = dist(rng);
        }

        const bool changed = genome[pos1] != genome[pos2];
        std::swap(genome[pos1], genome[pos2]);
        return changed;
    }

    double indpb() const { return indpb_; }
};

/// With probability indpb, move one resident out of an over-capacity hospital
///
/// The first resident (by position) sitting in any over-capacity hospital is sent to a
/// uniformly chosen hospital that still has free places. Nothing happens when no hospital
/// is over capacity or none has room left.
class CapacityAwareMutation {
    double indpb_;

  public:
    explicit CapacityAwareMutation(double indpb = 0.3) : indpb_(indpb) {}

    bool mutate(const problems::AssignmentProblem& problem,
                problems::AssignmentProblem::GenomeT& genome, std::mt19937& rng) const {
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        if (coin(rng) >= indpb_)
            return false;

        problem.check(genome);
        const auto& ctx = problem.context();
        const auto counts = problem.assignment_counts(genome);

        std::vector<bool> over(counts.size(), false);
        std::vector<int> under;
        bool any_over = false;
        for (std::size_t h = 0; h < counts.size(); ++h) {
            const int capacity = ctx.capacity_of(ctx.hospitals[h].id);
            if (counts[h] > capacity) {
                over[h] = true;
                any_over = true;
            } else if (counts[h] < capacity) {
                under.push_back(static_cast<int>(h));
            }
        }

        if (!any_over || under.empty())
            return false;

        for (auto& gene : genome) {
            if (over[gene]) {
                std::uniform_int_distribution<std::size_t> pick(0, under.size() - 1);
                gene = under[pick(rng)];
                return true;
            }
        }
        return false;
    }

    double indpb() const { return indpb_; }
};

/// With probability indpb, send one resident placed outside their choices to a choice
///
/// Residents are scanned in order; the first one who declared choices, is not currently
/// at any of them, and has at least one choice among the run's hospitals is moved to one of
/// those choices picked uniformly.
class HopeAwareMutation {
    double indpb_;

  public:
    explicit HopeAwareMutation(double indpb = 0.2) : indpb_(indpb) {}

    bool mutate(const problems::AssignmentProblem& problem,
                problems::AssignmentProblem::GenomeT& genome, std::mt19937& rng) const {
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        if (coin(rng) >= indpb_)
            return false;

        problem.check(genome);
        const auto& ctx = problem.context();

        for (std::size_t i = 0; i < genome.size(); ++i) {
            const auto& choices = ctx.choices[i];
            if (choices.empty())
                continue;

            const int current_id = ctx.hospitals[genome[i]].id;
            std::vector<int> targets;
            bool satisfied = false;
            for (const auto& [rank, hospital_id] : choices) {
                if (hospital_id == current_id) {
                    satisfied = true;
                    break;
                }
                if (auto it = ctx.hospital_index.find(hospital_id); it != ctx.hospital_index.end()) {
                    targets.push_back(static_cast<int>(it->second));
                }
            }

            if (satisfied || targets.empty())
                continue;

            std::uniform_int_distribution<std::size_t> pick(0, targets.size() - 1);
            genome[i] = targets[pick(rng)];
            return true;
        }
        return false;
    }

    double indpb() const { return indpb_; }
};

/// Applies several mutations in a fixed order; reports whether any of them changed a gene
template <typename... Mutations>
class MutationPipeline {
    std::tuple<Mutations...> stages_;

  public:
    explicit MutationPipeline(Mutations... stages) : stages_(std::move(stages)...) {}

    template <core::Problem P>
    bool mutate(const P& problem, typename P::GenomeT& genome, std::mt19937& rng) const {
        bool changed = false;
        std::apply(
            [&](const auto&... stage) {
                ((changed = stage.mutate(problem, genome, rng) || changed), ...);
            },
            stages_);
        return changed;
    }

    const std::tuple<Mutations...>& stages() const { return stages_; }
};

} // namespace medassign::operators
