#pragma once

/// @file model.hpp
/// @brief Master data consumed by the assignment engine

#include <optional>
#include <string>
#include <string_view>

namespace medassign::problems {

enum class StaffType {
    Resident,  // Takes part in the annual hospital assignment
    Specialist,
    Instructor,
    Faculty,
    Administrative
};

/// Member of staff; only residents are assigned by the engine
struct Resident {
    int id = 0;
    std::string name;
    StaffType staff_type = StaffType::Resident;
};

struct Hospital {
    int id = 0;
    std::string name;
    int resident_capacity = 0;
    int specialist_capacity = 0;
    int instructor_capacity = 0;
    double annual_salary = 0.0; // 0 means unknown

    /// Head count over all three roles, used as a caseload proxy
    [[nodiscard]] int total_capacity() const noexcept {
        return resident_capacity + specialist_capacity + instructor_capacity;
    }
};

/// Which catalog an evaluation factor belongs to
enum class FactorType {
    StaffPreference, // Weighted by each resident (salary, commute, ...)
    AdminEvaluation  // Scored by the department for each resident
};

/// Scoring rule applied to a staff-preference factor
enum class FactorKind {
    Unspecified, // Inferred from the factor name
    Salary,
    Commute,
    Caseload,
    Other
};

struct EvaluationFactor {
    int id = 0;
    std::string name;
    FactorType type = FactorType::StaffPreference;
    FactorKind kind = FactorKind::Unspecified;
    int display_order = 0;
    bool active = true;
};

/// Catalog entry as seen by the fitness function
struct FactorInfo {
    int id = 0;
    std::string name;
    FactorKind kind = FactorKind::Unspecified;
};

[[nodiscard]] inline std::string_view to_string(StaffType type) noexcept {
    switch (type) {
    case StaffType::Resident:
        return "resident";
    case StaffType::Specialist:
        return "specialist";
    case StaffType::Instructor:
        return "instructor";
    case StaffType::Faculty:
        return "faculty";
    case StaffType::Administrative:
        return "administrative";
    }
    return "resident";
}

[[nodiscard]] inline std::optional<StaffType> parse_staff_type(std::string_view text) noexcept {
    if (text == "resident")
        return StaffType::Resident;
    if (text == "specialist")
        return StaffType::Specialist;
    if (text == "instructor")
        return StaffType::Instructor;
    if (text == "faculty")
        return StaffType::Faculty;
    if (text == "administrative")
        return StaffType::Administrative;
    return std::nullopt;
}

[[nodiscard]] inline std::string_view to_string(FactorType type) noexcept {
    return type == FactorType::StaffPreference ? "staff_preference" : "admin_evaluation";
}

[[nodiscard]] inline std::optional<FactorType> parse_factor_type(std::string_view text) noexcept {
    if (text == "staff_preference")
        return FactorType::StaffPreference;
    if (text == "admin_evaluation")
        return FactorType::AdminEvaluation;
    return std::nullopt;
}

[[nodiscard]] inline std::string_view to_string(FactorKind kind) noexcept {
    switch (kind) {
    case FactorKind::Unspecified:
        return "unspecified";
    case FactorKind::Salary:
        return "salary";
    case FactorKind::Commute:
        return "commute";
    case FactorKind::Caseload:
        return "caseload";
    case FactorKind::Other:
        return "other";
    }
    return "unspecified";
}

[[nodiscard]] inline std::optional<FactorKind> parse_factor_kind(std::string_view text) noexcept {
    if (text == "unspecified")
        return FactorKind::Unspecified;
    if (text == "salary")
        return FactorKind::Salary;
    if (text == "commute")
        return FactorKind::Commute;
    if (text == "caseload")
        return FactorKind::Caseload;
    if (text == "other")
        return FactorKind::Other;
    return std::nullopt;
}

} // namespace medassign::problems
