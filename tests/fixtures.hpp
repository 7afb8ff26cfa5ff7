#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <medassign/assignment/optimizer.hpp>
#include <medassign/data/dataset.hpp>
#include <medassign/problems/context.hpp>
#include <medassign/problems/model.hpp>

// Small hand-built datasets shared by the test executables

namespace fixtures {

inline constexpr int YEAR = 2025;

inline medassign::problems::Resident resident(int id, const char* name) {
    return {id, name, medassign::problems::StaffType::Resident};
}

inline medassign::problems::Hospital hospital(int id, const char* name, int capacity,
                                               double salary = 0.0) {
    medassign::problems::Hospital h;
    h.id = id;
    h.name = name;
    h.resident_capacity = capacity;
    h.annual_salary = salary;
    return h;
}

/// Three residents, two hospitals with capacities 1 and 2; only resident 1 declared a choice
inline medassign::data::Dataset capacity_pair() {
    medassign::data::Dataset ds;
    ds.set_fiscal_year(YEAR);
    ds.add_staff(resident(1, "Aoki"));
    ds.add_staff(resident(2, "Baba"));
    ds.add_staff(resident(3, "Chiba"));
    ds.add_hospital(hospital(10, "North", 1));
    ds.add_hospital(hospital(20, "South", 2));
    ds.set_choice(1, YEAR, 1, 10);
    return ds;
}

/// Hospitals but no residents
inline medassign::data::Dataset no_residents() {
    medassign::data::Dataset ds;
    ds.set_fiscal_year(YEAR);
    ds.add_hospital(hospital(10, "North", 1));
    ds.add_hospital(hospital(20, "South", 2));
    return ds;
}

/// Five residents, three hospitals, a non-resident staff member, full factor data
inline medassign::data::Dataset department() {
    using medassign::problems::EvaluationFactor;
    using medassign::problems::FactorKind;
    using medassign::problems::FactorType;
    using medassign::problems::StaffType;

    medassign::data::Dataset ds;
    ds.set_fiscal_year(YEAR);

    for (int id = 1; id <= 5; ++id) {
        ds.add_staff(resident(id, "resident"));
    }
    ds.add_staff({99, "Specialist", StaffType::Specialist});

    ds.add_hospital(hospital(10, "City General", 2, 8'000'000.0));
    ds.add_hospital(hospital(20, "Harbor Clinic", 2, 12'000'000.0));
    ds.add_hospital(hospital(30, "Mountain Hospital", 1));

    ds.add_factor({1, "salary", FactorType::StaffPreference, FactorKind::Unspecified, 1, true});
    ds.add_factor({2, "通勤時間", FactorType::StaffPreference, FactorKind::Unspecified, 2, true});
    ds.add_factor({3, "teaching", FactorType::StaffPreference, FactorKind::Caseload, 3, true});
    ds.add_factor({4, "clinical skill", FactorType::AdminEvaluation, FactorKind::Unspecified, 1,
                   true});
    ds.add_factor({5, "attitude", FactorType::AdminEvaluation, FactorKind::Unspecified, 2, true});

    ds.set_choice(1, YEAR, 1, 10);
    ds.set_choice(1, YEAR, 2, 20);
    ds.set_choice(2, YEAR, 1, 20);
    ds.set_choice(3, YEAR, 1, 30);
    ds.set_choice(3, YEAR, 2, 10);
    ds.set_choice(3, YEAR, 3, 20);
    ds.set_choice(4, YEAR, 1, 10);
    // Resident 5 declared nothing

    ds.set_weight(1, YEAR, 1, 3.0);
    ds.set_weight(1, YEAR, 2, 1.0);
    ds.set_weight(2, YEAR, 2, 2.0);
    ds.set_weight(4, YEAR, 3, 1.0);

    ds.set_evaluation(1, YEAR, 4, 0.8);
    ds.set_evaluation(1, YEAR, 5, 0.6);
    ds.set_evaluation(3, YEAR, 4, 0.9);

    ds.set_commute(1, 10, 30.0);
    ds.set_commute(1, 20, 95.5);
    ds.set_commute(2, 20, 45.0);

    return ds;
}

inline medassign::assignment::OptimizerSettings settings(std::size_t population,
                                                         std::size_t generations,
                                                         std::uint64_t seed = 42) {
    medassign::assignment::OptimizerSettings s;
    s.fiscal_year = YEAR;
    s.ga.population_size = population;
    s.ga.max_generations = generations;
    s.ga.seed = seed;
    return s;
}

/// Snapshot of a dataset restricted to its residents
template <typename Source>
medassign::problems::FitnessContext context_of(const Source& source) {
    std::vector<medassign::problems::Resident> residents;
    for (const auto& member : source.staff()) {
        if (member.staff_type == medassign::problems::StaffType::Resident)
            residents.push_back(member);
    }
    return medassign::problems::build_context(source, YEAR, std::move(residents),
                                              source.hospitals());
}

} // namespace fixtures
