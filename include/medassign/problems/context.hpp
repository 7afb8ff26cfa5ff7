#pragma once

/// @file context.hpp
/// @brief Immutable per-run snapshot of everything the fitness function reads
///
/// The snapshot is assembled once per run from a ContextSource (the repository layer, or
/// the in-memory data::Dataset) and then shared read-only by the evaluator and the
/// context-aware mutation operators.

#include <algorithm>
#include <cctype>
#include <concepts>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <medassign/core/concepts.hpp>
#include <medassign/problems/model.hpp>

namespace medassign::problems {

/// Rank (1..3) -> hospital id
using ChoiceMap = std::map<int, int>;
/// Factor id -> weight or evaluation value
using FactorValueMap = std::map<int, double>;

/// Data queries needed to build a FitnessContext
template <typename S>
concept ContextSource = requires(const S& source, int staff_id, int hospital_id, int year,
                                 FactorType type) {
    { source.hospital_choices(staff_id, year) } -> std::convertible_to<ChoiceMap>;
    { source.factor_weights(staff_id, year) } -> std::convertible_to<FactorValueMap>;
    { source.admin_evaluations(staff_id, year) } -> std::convertible_to<FactorValueMap>;
    { source.commute_minutes(staff_id, hospital_id) } -> std::convertible_to<std::optional<double>>;
    { source.factors(type) } -> std::convertible_to<std::vector<EvaluationFactor>>;
};

/// A ContextSource that also provides the master lists
template <typename S>
concept RosterSource = ContextSource<S> && requires(const S& source) {
    { source.staff() } -> std::convertible_to<std::vector<Resident>>;
    { source.hospitals() } -> std::convertible_to<std::vector<Hospital>>;
};

/// ASCII-lowercase copy; multi-byte UTF-8 sequences pass through untouched
[[nodiscard]] inline std::string ascii_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return lowered;
}

/// Scoring rule for a factor: the explicit tag if present, otherwise guessed from the name
[[nodiscard]] inline FactorKind resolve_factor_kind(const EvaluationFactor& factor) {
    if (factor.kind != FactorKind::Unspecified) {
        return factor.kind;
    }

    const auto name = ascii_lower(factor.name);
    auto contains = [&name](std::string_view needle) {
        return name.find(needle) != std::string::npos;
    };

    if (contains("年収") || contains("給与") || contains("salary"))
        return FactorKind::Salary;
    if (contains("通勤") || contains("距離") || contains("commute"))
        return FactorKind::Commute;
    if (contains("症例") || contains("外勤") || contains("caseload") || contains("outpatient"))
        return FactorKind::Caseload;
    return FactorKind::Other;
}

struct FitnessContext {
    int fiscal_year = 0;

    std::vector<Resident> residents;
    std::vector<Hospital> hospitals;

    std::unordered_map<int, std::size_t> resident_index; // resident id -> gene position
    std::unordered_map<int, std::size_t> hospital_index; // hospital id -> gene value

    // Indexed by resident position
    std::vector<ChoiceMap> choices;
    std::vector<FactorValueMap> weights;
    std::vector<FactorValueMap> evaluations;

    std::map<std::pair<int, int>, double> commute; // (resident id, hospital id) -> minutes

    std::vector<FactorInfo> staff_factors;
    std::vector<FactorInfo> admin_factors;

    std::unordered_map<int, int> capacities; // hospital id -> resident capacity

    [[nodiscard]] std::size_t resident_count() const noexcept { return residents.size(); }
    [[nodiscard]] std::size_t hospital_count() const noexcept { return hospitals.size(); }

    /// Resident capacity of a hospital; hospitals without an entry accept nobody
    [[nodiscard]] int capacity_of(int hospital_id) const {
        const auto it = capacities.find(hospital_id);
        return it == capacities.end() ? 0 : it->second;
    }

    [[nodiscard]] std::optional<double> commute_minutes(int resident_id, int hospital_id) const {
        const auto it = commute.find({resident_id, hospital_id});
        if (it == commute.end())
            return std::nullopt;
        return it->second;
    }

    /// Copy restricted to a single resident, for per-resident reporting
    [[nodiscard]] FitnessContext narrowed_to(std::size_t resident_pos) const {
        FitnessContext single;
        single.fiscal_year = fiscal_year;
        single.residents = {residents.at(resident_pos)};
        single.hospitals = hospitals;
        single.resident_index = {{residents[resident_pos].id, 0}};
        single.hospital_index = hospital_index;
        single.choices = {choices.at(resident_pos)};
        single.weights = {weights.at(resident_pos)};
        single.evaluations = {evaluations.at(resident_pos)};

        const int resident_id = residents[resident_pos].id;
        for (auto it = commute.lower_bound({resident_id, std::numeric_limits<int>::min()});
             it != commute.end() && it->first.first == resident_id; ++it) {
            single.commute.insert(*it);
        }

        single.staff_factors = staff_factors;
        single.admin_factors = admin_factors;
        single.capacities = capacities;
        return single;
    }
};

namespace detail {

inline std::vector<FactorInfo> make_catalog(std::vector<EvaluationFactor> factors) {
    std::erase_if(factors, [](const EvaluationFactor& f) { return !f.active; });
    std::stable_sort(factors.begin(), factors.end(),
                     [](const EvaluationFactor& a, const EvaluationFactor& b) {
                         return std::pair(a.display_order, a.id) < std::pair(b.display_order, b.id);
                     });

    std::vector<FactorInfo> catalog;
    catalog.reserve(factors.size());
    for (const auto& factor : factors) {
        catalog.push_back({factor.id, factor.name, resolve_factor_kind(factor)});
    }
    return catalog;
}

} // namespace detail

/// Assemble the immutable snapshot for one run
///
/// @throws core::DataUnavailableError if either list is empty or contains duplicate ids
template <ContextSource Source>
FitnessContext build_context(const Source& source, int fiscal_year,
                             std::vector<Resident> residents, std::vector<Hospital> hospitals) {
    if (residents.empty()) {
        throw core::DataUnavailableError("No residents available for fiscal year " +
                                         std::to_string(fiscal_year));
    }
    if (hospitals.empty()) {
        throw core::DataUnavailableError("No hospitals available for fiscal year " +
                                         std::to_string(fiscal_year));
    }

    FitnessContext ctx;
    ctx.fiscal_year = fiscal_year;

    for (std::size_t i = 0; i < residents.size(); ++i) {
        if (!ctx.resident_index.emplace(residents[i].id, i).second) {
            throw core::DataUnavailableError("Duplicate resident id " +
                                             std::to_string(residents[i].id));
        }
    }
    for (std::size_t j = 0; j < hospitals.size(); ++j) {
        if (!ctx.hospital_index.emplace(hospitals[j].id, j).second) {
            throw core::DataUnavailableError("Duplicate hospital id " +
                                             std::to_string(hospitals[j].id));
        }
    }

    ctx.choices.reserve(residents.size());
    ctx.weights.reserve(residents.size());
    ctx.evaluations.reserve(residents.size());
    for (const auto& resident : residents) {
        ctx.choices.push_back(source.hospital_choices(resident.id, fiscal_year));
        ctx.weights.push_back(source.factor_weights(resident.id, fiscal_year));
        ctx.evaluations.push_back(source.admin_evaluations(resident.id, fiscal_year));

        for (const auto& hospital : hospitals) {
            if (auto minutes = source.commute_minutes(resident.id, hospital.id)) {
                ctx.commute.emplace(std::pair(resident.id, hospital.id), *minutes);
            }
        }
    }

    ctx.staff_factors = detail::make_catalog(source.factors(FactorType::StaffPreference));
    ctx.admin_factors = detail::make_catalog(source.factors(FactorType::AdminEvaluation));

    for (const auto& hospital : hospitals) {
        ctx.capacities.emplace(hospital.id, hospital.resident_capacity);
    }

    ctx.residents = std::move(residents);
    ctx.hospitals = std::move(hospitals);
    return ctx;
}

} // namespace medassign::problems
