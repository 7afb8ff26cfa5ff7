#pragma once

/// @file dataset.hpp
/// @brief JSON dataset loader
///
/// Reads a master-data snapshot (staff, hospitals, evaluation factors, choices, weights,
/// evaluations, commute cache) into a data::Dataset and rejects inconsistent input.

#include <fstream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include <medassign/data/dataset.hpp>
#include <medassign/problems/model.hpp>

namespace medassign::io {

/// Malformed or inconsistent dataset file
class DatasetError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class DatasetParser {
  public:
    using json = nlohmann::json;

    /// @throws DatasetError if the file cannot be read or fails validation
    static data::Dataset parse_file(const std::string& filename);

    /// @throws DatasetError on malformed JSON or failed validation
    static data::Dataset parse_string(const std::string& content);

    /// @throws DatasetError on failed validation
    static data::Dataset parse_json(const json& root);

  private:
    static data::Dataset build(const json& root);

    static problems::Resident parse_staff(const json& entry);
    static problems::Hospital parse_hospital(const json& entry);
    static problems::EvaluationFactor parse_factor(const json& entry);

    static int entry_year(const json& entry, std::optional<int> default_year, const char* section);
    static void require_non_negative(double value, const std::string& what);
};

inline data::Dataset DatasetParser::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw DatasetError("Cannot open dataset file: " + filename);
    }

    json root;
    try {
        file >> root;
    } catch (const json::exception& e) {
        throw DatasetError("Invalid JSON in " + filename + ": " + e.what());
    }
    return parse_json(root);
}

inline data::Dataset DatasetParser::parse_string(const std::string& content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::exception& e) {
        throw DatasetError(std::string("Invalid JSON: ") + e.what());
    }
    return parse_json(root);
}

inline data::Dataset DatasetParser::parse_json(const json& root) {
    if (!root.is_object()) {
        throw DatasetError("Dataset root must be a JSON object");
    }

    // Missing required keys and type mismatches surface as json exceptions
    try {
        return build(root);
    } catch (const json::exception& e) {
        throw DatasetError(std::string("Malformed dataset: ") + e.what());
    }
}

inline data::Dataset DatasetParser::build(const json& root) {
    data::Dataset dataset;

    std::optional<int> default_year;
    if (root.contains("fiscal_year")) {
        default_year = root.at("fiscal_year").get<int>();
        dataset.set_fiscal_year(*default_year);
    }

    std::set<int> staff_ids;
    for (const auto& entry : root.value("staff", json::array())) {
        auto member = parse_staff(entry);
        if (!staff_ids.insert(member.id).second) {
            throw DatasetError("Duplicate staff id " + std::to_string(member.id));
        }
        dataset.add_staff(std::move(member));
    }

    std::set<int> hospital_ids;
    for (const auto& entry : root.value("hospitals", json::array())) {
        auto hospital = parse_hospital(entry);
        if (!hospital_ids.insert(hospital.id).second) {
            throw DatasetError("Duplicate hospital id " + std::to_string(hospital.id));
        }
        dataset.add_hospital(std::move(hospital));
    }

    std::set<int> factor_ids;
    for (const auto& entry : root.value("factors", json::array())) {
        auto factor = parse_factor(entry);
        if (!factor_ids.insert(factor.id).second) {
            throw DatasetError("Duplicate factor id " + std::to_string(factor.id));
        }
        dataset.add_factor(std::move(factor));
    }

    for (const auto& entry : root.value("hospital_choices", json::array())) {
        const int staff_id = entry.at("staff_id").get<int>();
        const int year = entry_year(entry, default_year, "hospital_choices");
        const int rank = entry.at("rank").get<int>();
        const int hospital_id = entry.at("hospital_id").get<int>();

        if (rank < 1 || rank > 3) {
            throw DatasetError("Choice rank " + std::to_string(rank) + " for staff " +
                               std::to_string(staff_id) + " outside 1..3");
        }

        for (const auto& [existing_rank, existing_hospital] :
             dataset.hospital_choices(staff_id, year)) {
            if (existing_rank == rank) {
                throw DatasetError("Duplicate choice rank " + std::to_string(rank) +
                                   " for staff " + std::to_string(staff_id) + " in " +
                                   std::to_string(year));
            }
            if (existing_hospital == hospital_id) {
                throw DatasetError("Hospital " + std::to_string(hospital_id) +
                                   " chosen twice by staff " + std::to_string(staff_id) + " in " +
                                   std::to_string(year));
            }
        }
        dataset.set_choice(staff_id, year, rank, hospital_id);
    }

    for (const auto& entry : root.value("factor_weights", json::array())) {
        const int staff_id = entry.at("staff_id").get<int>();
        const int year = entry_year(entry, default_year, "factor_weights");
        const double weight = entry.at("weight").get<double>();
        require_non_negative(weight, "Weight of staff " + std::to_string(staff_id));
        dataset.set_weight(staff_id, year, entry.at("factor_id").get<int>(), weight);
    }

    for (const auto& entry : root.value("admin_evaluations", json::array())) {
        const int staff_id = entry.at("staff_id").get<int>();
        const int year = entry_year(entry, default_year, "admin_evaluations");
        const double value = entry.at("value").get<double>();
        if (value < 0.0 || value > 1.0) {
            throw DatasetError("Evaluation of staff " + std::to_string(staff_id) +
                               " must be in [0,1]");
        }
        dataset.set_evaluation(staff_id, year, entry.at("factor_id").get<int>(), value);
    }

    for (const auto& entry : root.value("commute", json::array())) {
        const int staff_id = entry.at("staff_id").get<int>();
        const int hospital_id = entry.at("hospital_id").get<int>();
        const double minutes = entry.at("minutes").get<double>();
        require_non_negative(minutes, "Commute of staff " + std::to_string(staff_id) +
                                          " to hospital " + std::to_string(hospital_id));
        dataset.set_commute(staff_id, hospital_id, minutes);
    }

    return dataset;
}

inline problems::Resident DatasetParser::parse_staff(const json& entry) {
    problems::Resident member;
    member.id = entry.at("id").get<int>();
    member.name = entry.value("name", std::string{});

    const auto type_str = entry.value("staff_type", std::string{"resident"});
    const auto type = problems::parse_staff_type(type_str);
    if (!type) {
        throw DatasetError("Unknown staff type: " + type_str);
    }
    member.staff_type = *type;
    return member;
}

inline problems::Hospital DatasetParser::parse_hospital(const json& entry) {
    problems::Hospital hospital;
    hospital.id = entry.at("id").get<int>();
    hospital.name = entry.value("name", std::string{});
    hospital.resident_capacity = entry.value("resident_capacity", 0);
    hospital.specialist_capacity = entry.value("specialist_capacity", 0);
    hospital.instructor_capacity = entry.value("instructor_capacity", 0);
    hospital.annual_salary = entry.value("annual_salary", 0.0);

    const auto where = "Hospital " + std::to_string(hospital.id);
    require_non_negative(hospital.resident_capacity, where + " resident capacity");
    require_non_negative(hospital.specialist_capacity, where + " specialist capacity");
    require_non_negative(hospital.instructor_capacity, where + " instructor capacity");
    require_non_negative(hospital.annual_salary, where + " salary");
    return hospital;
}

inline problems::EvaluationFactor DatasetParser::parse_factor(const json& entry) {
    problems::EvaluationFactor factor;
    factor.id = entry.at("id").get<int>();
    factor.name = entry.value("name", std::string{});

    const auto type_str = entry.at("type").get<std::string>();
    const auto type = problems::parse_factor_type(type_str);
    if (!type) {
        throw DatasetError("Unknown factor type: " + type_str);
    }
    factor.type = *type;

    const auto kind_str = entry.value("kind", std::string{"unspecified"});
    const auto kind = problems::parse_factor_kind(kind_str);
    if (!kind) {
        throw DatasetError("Unknown factor kind: " + kind_str);
    }
    factor.kind = *kind;

    factor.display_order = entry.value("display_order", 0);
    factor.active = entry.value("active", true);
    return factor;
}

inline int DatasetParser::entry_year(const json& entry, std::optional<int> default_year,
                                     const char* section) {
    if (entry.contains("fiscal_year")) {
        return entry.at("fiscal_year").get<int>();
    }
    if (!default_year) {
        throw DatasetError(std::string("Entry in ") + section +
                           " has no fiscal_year and the dataset declares none");
    }
    return *default_year;
}

inline void DatasetParser::require_non_negative(double value, const std::string& what) {
    if (value < 0.0) {
        throw DatasetError(what + " cannot be negative");
    }
}

/// Convenience wrapper around DatasetParser::parse_file
inline data::Dataset load_dataset(const std::string& filename) {
    return DatasetParser::parse_file(filename);
}

} // namespace medassign::io
