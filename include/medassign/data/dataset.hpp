#pragma once

/// @file dataset.hpp
/// @brief In-memory snapshot of the master data, usable as a ContextSource
///
/// Setters store what they are given; range and uniqueness checks belong to whoever fills
/// the dataset (io::load_dataset for files, the caller for hand-built datasets).

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include <medassign/problems/context.hpp>
#include <medassign/problems/model.hpp>

namespace medassign::data {

class Dataset {
    using StaffYear = std::pair<int, int>; // (staff id, fiscal year)

    std::vector<problems::Resident> staff_;
    std::vector<problems::Hospital> hospitals_;
    std::vector<problems::EvaluationFactor> factors_;

    std::map<StaffYear, problems::ChoiceMap> choices_;
    std::map<StaffYear, problems::FactorValueMap> weights_;
    std::map<StaffYear, problems::FactorValueMap> evaluations_;
    std::map<std::pair<int, int>, double> commute_; // (staff id, hospital id) -> minutes

    std::optional<int> fiscal_year_;

  public:
    /// Year the snapshot was exported for, if recorded
    [[nodiscard]] std::optional<int> fiscal_year() const noexcept { return fiscal_year_; }
    void set_fiscal_year(int year) noexcept { fiscal_year_ = year; }

    void add_staff(problems::Resident member) { staff_.push_back(std::move(member)); }
    void add_hospital(problems::Hospital hospital) { hospitals_.push_back(std::move(hospital)); }
    void add_factor(problems::EvaluationFactor factor) { factors_.push_back(std::move(factor)); }

    void set_choice(int staff_id, int fiscal_year, int rank, int hospital_id) {
        choices_[{staff_id, fiscal_year}][rank] = hospital_id;
    }

    void set_weight(int staff_id, int fiscal_year, int factor_id, double weight) {
        weights_[{staff_id, fiscal_year}][factor_id] = weight;
    }

    void set_evaluation(int staff_id, int fiscal_year, int factor_id, double value) {
        evaluations_[{staff_id, fiscal_year}][factor_id] = value;
    }

    void set_commute(int staff_id, int hospital_id, double minutes) {
        commute_[{staff_id, hospital_id}] = minutes;
    }

    // Roster

    [[nodiscard]] const std::vector<problems::Resident>& staff() const noexcept { return staff_; }

    [[nodiscard]] const std::vector<problems::Hospital>& hospitals() const noexcept {
        return hospitals_;
    }

    [[nodiscard]] const std::vector<problems::EvaluationFactor>& all_factors() const noexcept {
        return factors_;
    }

    // ContextSource queries

    [[nodiscard]] problems::ChoiceMap hospital_choices(int staff_id, int fiscal_year) const {
        const auto it = choices_.find({staff_id, fiscal_year});
        return it == choices_.end() ? problems::ChoiceMap{} : it->second;
    }

    [[nodiscard]] problems::FactorValueMap factor_weights(int staff_id, int fiscal_year) const {
        const auto it = weights_.find({staff_id, fiscal_year});
        return it == weights_.end() ? problems::FactorValueMap{} : it->second;
    }

    [[nodiscard]] problems::FactorValueMap admin_evaluations(int staff_id, int fiscal_year) const {
        const auto it = evaluations_.find({staff_id, fiscal_year});
        return it == evaluations_.end() ? problems::FactorValueMap{} : it->second;
    }

    [[nodiscard]] std::optional<double> commute_minutes(int staff_id, int hospital_id) const {
        const auto it = commute_.find({staff_id, hospital_id});
        if (it == commute_.end())
            return std::nullopt;
        return it->second;
    }

    /// Factors of one catalog, in insertion order (inactive ones included)
    [[nodiscard]] std::vector<problems::EvaluationFactor> factors(problems::FactorType type) const {
        std::vector<problems::EvaluationFactor> selected;
        for (const auto& factor : factors_) {
            if (factor.type == type)
                selected.push_back(factor);
        }
        return selected;
    }
};

static_assert(problems::RosterSource<Dataset>);

} // namespace medassign::data
