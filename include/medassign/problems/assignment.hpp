#pragma once

/// @file assignment.hpp
/// @brief Resident-to-hospital assignment problem and its fitness function
///
/// A candidate is a vector with one gene per resident; gene i is the index of the hospital
/// resident i is sent to. Fitness is the per-resident average of three weighted terms
/// (declared hope, personal preference factors, department evaluation) minus a penalty for
/// every head over a hospital's resident capacity.

#include <algorithm>
#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <medassign/core/concepts.hpp>
#include <medassign/problems/context.hpp>

namespace medassign::problems {

namespace scoring {

inline constexpr double HOPE_WEIGHT = 0.4;
inline constexpr double PREFERENCE_WEIGHT = 0.3;
inline constexpr double ADMIN_WEIGHT = 0.3;

inline constexpr double RANK_STEP = 0.33;
inline constexpr double NEUTRAL_SCORE = 0.5;
inline constexpr double OVERFLOW_PENALTY = 0.5; // Per resident above capacity

inline constexpr double SALARY_CEILING = 10'000'000.0;
inline constexpr double COMMUTE_HORIZON_MINUTES = 120.0;
inline constexpr double DEFAULT_COMMUTE_MINUTES = 60.0;
inline constexpr double CASELOAD_CEILING = 20.0;

/// Declared rank (1..3) of a hospital for a resident, 0 when it is not among the choices
[[nodiscard]] inline int hope_rank(const FitnessContext& ctx, std::size_t resident_pos,
                                   int hospital_id) {
    for (const auto& [rank, choice_id] : ctx.choices[resident_pos]) {
        if (choice_id == hospital_id) {
            return rank;
        }
    }
    return 0;
}

/// 1.0 / 0.67 / 0.34 for the first / second / third choice, 0 otherwise
[[nodiscard]] inline double hope_score(const FitnessContext& ctx, std::size_t resident_pos,
                                       int hospital_id) {
    const int rank = hope_rank(ctx, resident_pos, hospital_id);
    return rank > 0 ? 1.0 - (rank - 1) * RANK_STEP : 0.0;
}

/// Sub-score of one staff-preference factor for a resident at a hospital
[[nodiscard]] inline double factor_score(const FitnessContext& ctx, FactorKind kind,
                                         int resident_id, const Hospital& hospital) {
    switch (kind) {
    case FactorKind::Salary: {
        const double salary = hospital.annual_salary;
        return salary > 0.0 ? std::min(1.0, salary / SALARY_CEILING) : NEUTRAL_SCORE;
    }
    case FactorKind::Commute: {
        const double minutes =
            ctx.commute_minutes(resident_id, hospital.id).value_or(DEFAULT_COMMUTE_MINUTES);
        return minutes > 0.0 ? std::max(0.0, 1.0 - minutes / COMMUTE_HORIZON_MINUTES)
                             : NEUTRAL_SCORE;
    }
    case FactorKind::Caseload: {
        const int capacity = hospital.total_capacity();
        return capacity > 0 ? std::min(1.0, capacity / CASELOAD_CEILING) : NEUTRAL_SCORE;
    }
    case FactorKind::Unspecified:
    case FactorKind::Other:
        break;
    }
    return NEUTRAL_SCORE;
}

/// Weighted mean of the factor sub-scores, using the resident's own weights
[[nodiscard]] inline double preference_score(const FitnessContext& ctx, std::size_t resident_pos,
                                             const Hospital& hospital) {
    const auto& weights = ctx.weights[resident_pos];
    if (weights.empty()) {
        return NEUTRAL_SCORE;
    }

    double total_weight = 0.0;
    for (const auto& [factor_id, weight] : weights) {
        total_weight += weight;
    }
    if (total_weight == 0.0) {
        return NEUTRAL_SCORE;
    }

    const int resident_id = ctx.residents[resident_pos].id;
    double score = 0.0;
    for (const auto& factor : ctx.staff_factors) {
        const auto it = weights.find(factor.id);
        if (it == weights.end() || it->second == 0.0)
            continue;

        score += factor_score(ctx, factor.kind, resident_id, hospital) * (it->second / total_weight);
    }
    return score;
}

/// Mean of the department's evaluations of a resident
[[nodiscard]] inline double admin_score(const FitnessContext& ctx, std::size_t resident_pos) {
    const auto& evaluations = ctx.evaluations[resident_pos];
    if (evaluations.empty()) {
        return NEUTRAL_SCORE;
    }

    double sum = 0.0;
    for (const auto& [factor_id, value] : evaluations) {
        sum += value;
    }
    return sum / static_cast<double>(evaluations.size());
}

/// Weighted sum of the three terms for one resident at one hospital
[[nodiscard]] inline double resident_score(const FitnessContext& ctx, std::size_t resident_pos,
                                           const Hospital& hospital) {
    return hope_score(ctx, resident_pos, hospital.id) * HOPE_WEIGHT +
           preference_score(ctx, resident_pos, hospital) * PREFERENCE_WEIGHT +
           admin_score(ctx, resident_pos) * ADMIN_WEIGHT;
}

/// Penalty for the given per-hospital head counts (indexed like ctx.hospitals)
[[nodiscard]] inline double capacity_penalty(const FitnessContext& ctx,
                                             const std::vector<int>& counts) {
    double penalty = 0.0;
    for (std::size_t h = 0; h < counts.size(); ++h) {
        const int excess = counts[h] - ctx.capacity_of(ctx.hospitals[h].id);
        if (excess > 0) {
            penalty += excess * OVERFLOW_PENALTY;
        }
    }
    return penalty;
}

} // namespace scoring

/// Resident assignment problem for one fiscal year
class AssignmentProblem {
  public:
    using Gene = int;
    using GenomeT = std::vector<int>;

  private:
    std::shared_ptr<const FitnessContext> context_;

  public:
    explicit AssignmentProblem(FitnessContext context)
        : context_(std::make_shared<const FitnessContext>(std::move(context))) {}

    explicit AssignmentProblem(std::shared_ptr<const FitnessContext> context)
        : context_(std::move(context)) {}

    [[nodiscard]] const FitnessContext& context() const noexcept { return *context_; }

    [[nodiscard]] std::shared_ptr<const FitnessContext> shared_context() const noexcept {
        return context_;
    }

    /// Number of genes (residents)
    std::size_t size() const noexcept { return context_->resident_count(); }

    /// Number of admissible gene values (hospitals)
    std::size_t num_values() const noexcept { return context_->hospital_count(); }

    /// Uniformly random hospital for every resident
    GenomeT random_genome(std::mt19937& rng) const {
        GenomeT genome(size());
        if (num_values() == 0)
            return genome;

        std::uniform_int_distribution<int> dist(0, static_cast<int>(num_values()) - 1);
        std::generate(genome.begin(), genome.end(), [&] { return dist(rng); });
        return genome;
    }

    [[nodiscard]] bool is_valid(const GenomeT& genome) const noexcept {
        if (genome.size() != size())
            return false;
        const int limit = static_cast<int>(num_values());
        return std::all_of(genome.begin(), genome.end(),
                           [limit](int gene) { return gene >= 0 && gene < limit; });
    }

    /// @throws core::InvariantViolation if the genome breaks the encoding
    void check(const GenomeT& genome) const {
        if (genome.size() != size()) {
            throw core::InvariantViolation("Candidate has " + std::to_string(genome.size()) +
                                           " genes, expected " + std::to_string(size()));
        }
        const int limit = static_cast<int>(num_values());
        for (std::size_t i = 0; i < genome.size(); ++i) {
            if (genome[i] < 0 || genome[i] >= limit) {
                throw core::InvariantViolation(
                    "Gene " + std::to_string(i) + " references hospital index " +
                    std::to_string(genome[i]) + " outside [0, " + std::to_string(limit) + ")");
            }
        }
    }

    /// Residents assigned to each hospital index
    [[nodiscard]] std::vector<int> assignment_counts(const GenomeT& genome) const {
        std::vector<int> counts(num_values(), 0);
        for (int gene : genome) {
            counts[gene]++;
        }
        return counts;
    }

    /// Score a candidate (higher is better, never negative)
    ///
    /// @throws core::InvariantViolation on a malformed candidate
    core::Fitness evaluate(const GenomeT& genome) const {
        const auto& ctx = *context_;
        const std::size_t n = ctx.resident_count();
        if (n == 0) {
            return core::Fitness{0.0};
        }

        check(genome);

        double total = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            total += scoring::resident_score(ctx, i, ctx.hospitals[genome[i]]);
        }

        total -= scoring::capacity_penalty(ctx, assignment_counts(genome));

        return core::Fitness{std::max(0.0, total / static_cast<double>(n))};
    }

    /// Total number of residents above capacity across all hospitals
    [[nodiscard]] int total_overflow(const GenomeT& genome) const {
        check(genome);
        const auto counts = assignment_counts(genome);
        int overflow = 0;
        for (std::size_t h = 0; h < counts.size(); ++h) {
            overflow += std::max(0, counts[h] - context_->capacity_of(context_->hospitals[h].id));
        }
        return overflow;
    }
};

} // namespace medassign::problems
