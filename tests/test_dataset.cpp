#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <medassign/medassign.hpp>

#include "test_helper.hpp"

using namespace medassign;

const std::string SAMPLE = R"({
  "fiscal_year": 2025,
  "staff": [
    {"id": 1, "name": "Aoki", "staff_type": "resident"},
    {"id": 2, "name": "Baba"},
    {"id": 7, "name": "Kato", "staff_type": "specialist"}
  ],
  "hospitals": [
    {"id": 10, "name": "North", "resident_capacity": 1, "specialist_capacity": 2,
     "annual_salary": 9000000},
    {"id": 20, "name": "South", "resident_capacity": 2}
  ],
  "factors": [
    {"id": 1, "name": "年収", "type": "staff_preference", "display_order": 1},
    {"id": 2, "name": "travel", "type": "staff_preference", "kind": "commute"},
    {"id": 3, "name": "skill", "type": "admin_evaluation", "active": false}
  ],
  "hospital_choices": [
    {"staff_id": 1, "rank": 1, "hospital_id": 10},
    {"staff_id": 1, "rank": 2, "hospital_id": 20},
    {"staff_id": 2, "fiscal_year": 2024, "rank": 1, "hospital_id": 20}
  ],
  "factor_weights": [
    {"staff_id": 1, "factor_id": 1, "weight": 2.5}
  ],
  "admin_evaluations": [
    {"staff_id": 2, "factor_id": 3, "value": 0.75}
  ],
  "commute": [
    {"staff_id": 1, "hospital_id": 10, "minutes": 42.5}
  ]
})";

// Replace the first occurrence of `from` in the sample
std::string sample_with(const std::string& from, const std::string& to) {
    auto text = SAMPLE;
    const auto pos = text.find(from);
    if (pos != std::string::npos)
        text.replace(pos, from.size(), to);
    return text;
}

void test_parse_sample() {
    TestResult result;

    const auto ds = io::DatasetParser::parse_string(SAMPLE);

    result.assert_true(ds.fiscal_year() == 2025, "Dataset fiscal year");
    result.assert_eq(std::size_t{3}, ds.staff().size(), "All staff parsed");
    result.assert_eq(problems::StaffType::Resident, ds.staff()[1].staff_type,
                     "Staff type defaults to resident");
    result.assert_eq(problems::StaffType::Specialist, ds.staff()[2].staff_type,
                     "Specialist parsed");

    result.assert_eq(std::size_t{2}, ds.hospitals().size(), "Hospitals parsed");
    result.assert_eq(3, ds.hospitals()[0].total_capacity(), "Capacities summed");
    result.assert_equals(9000000.0, ds.hospitals()[0].annual_salary, "Salary parsed");

    result.assert_eq(std::size_t{2}, ds.factors(problems::FactorType::StaffPreference).size(),
                     "Staff preference factors");
    result.assert_eq(problems::FactorKind::Commute, ds.all_factors()[1].kind, "Explicit kind");
    result.assert_true(!ds.all_factors()[2].active, "Inactive flag parsed");

    result.assert_eq(std::size_t{2}, ds.hospital_choices(1, 2025).size(),
                     "Choices use the dataset year");
    result.assert_eq(20, ds.hospital_choices(2, 2024).at(1), "Choice with its own year");
    result.assert_true(ds.hospital_choices(2, 2025).empty(), "No choices in another year");
    result.assert_equals(2.5, ds.factor_weights(1, 2025).at(1), "Weight parsed");
    result.assert_equals(0.75, ds.admin_evaluations(2, 2025).at(3), "Evaluation parsed");
    result.assert_true(ds.commute_minutes(1, 10) == 42.5, "Commute parsed");
    result.assert_true(!ds.commute_minutes(1, 20).has_value(), "Missing commute is empty");

    result.print_summary();
}

void test_parse_file() {
    TestResult result;

    const auto path = std::filesystem::temp_directory_path() / "medassign_test_dataset.json";
    {
        std::ofstream file(path);
        file << SAMPLE;
    }

    const auto ds = io::load_dataset(path.string());
    result.assert_eq(std::size_t{3}, ds.staff().size(), "File parsed");

    std::filesystem::remove(path);

    result.assert_throws<io::DatasetError>(
        [] { (void)io::load_dataset("/nonexistent/medassign_dataset.json"); },
        "Missing file rejected");

    result.print_summary();
}

void test_rejects_inconsistent_data() {
    TestResult result;

    auto rejects = [&result](const std::string& text, const std::string& message) {
        result.assert_throws<io::DatasetError>(
            [&] { (void)io::DatasetParser::parse_string(text); }, message);
    };

    rejects("{not json", "Malformed JSON");
    rejects("[1, 2]", "Root must be an object");
    rejects(sample_with(R"({"id": 2, "name": "Baba"})", R"({"id": 1, "name": "Baba"})"),
            "Duplicate staff id");
    rejects(sample_with(R"({"id": 20, "name": "South")", R"({"id": 10, "name": "South")"),
            "Duplicate hospital id");
    rejects(sample_with(R"("staff_type": "specialist")", R"("staff_type": "surgeon")"),
            "Unknown staff type");
    rejects(sample_with(R"("type": "staff_preference", "display_order")",
                        R"("type": "wishlist", "display_order")"),
            "Unknown factor type");
    rejects(sample_with(R"("kind": "commute")", R"("kind": "distance")"), "Unknown factor kind");
    rejects(sample_with(R"("rank": 2)", R"("rank": 4)"), "Rank outside 1..3");
    rejects(sample_with(R"("rank": 2)", R"("rank": 1)"), "Duplicate rank");
    rejects(sample_with(R"("rank": 2, "hospital_id": 20)", R"("rank": 2, "hospital_id": 10)"),
            "Same hospital chosen twice");
    rejects(sample_with(R"("value": 0.75)", R"("value": 1.5)"), "Evaluation above 1");
    rejects(sample_with(R"("weight": 2.5)", R"("weight": -1)"), "Negative weight");
    rejects(sample_with(R"("minutes": 42.5)", R"("minutes": -3)"), "Negative commute");
    rejects(sample_with(R"("resident_capacity": 2)", R"("resident_capacity": -2)"),
            "Negative capacity");
    rejects(sample_with(R"("fiscal_year": 2025,)", ""), "Entries without any fiscal year");
    rejects(sample_with(R"({"staff_id": 1, "factor_id": 1, "weight": 2.5})",
                        R"({"staff_id": 1, "weight": 2.5})"),
            "Missing required key");

    result.print_summary();
}

void test_optional_sections() {
    TestResult result;

    const auto ds = io::DatasetParser::parse_string(
        R"({"staff": [{"id": 1}], "hospitals": [{"id": 5, "resident_capacity": 1}]})");

    result.assert_true(!ds.fiscal_year().has_value(), "Fiscal year optional");
    result.assert_eq(std::size_t{1}, ds.staff().size(), "Staff parsed");
    result.assert_true(ds.all_factors().empty(), "No factors");
    result.assert_true(ds.hospital_choices(1, 2025).empty(), "No choices");

    result.print_summary();
}

void test_dataset_as_context_source() {
    TestResult result;

    const auto ds = io::DatasetParser::parse_string(SAMPLE);
    assignment::OptimizerSettings settings;
    settings.ga.population_size = 10;
    settings.ga.max_generations = 5;

    assignment::Optimizer optimizer(settings);
    result.assert_true(optimizer.load_data(ds), "Parsed dataset loads");

    const auto& ctx = optimizer.context();
    result.assert_eq(std::size_t{2}, ctx.resident_count(), "Specialist filtered out");
    result.assert_eq(std::size_t{2}, ctx.staff_factors.size(), "Both preference factors kept");
    result.assert_true(ctx.admin_factors.empty(), "Inactive evaluation factor dropped");
    result.assert_eq(2, ctx.staff_factors[0].id, "Display order 0 sorts first");
    result.assert_eq(problems::FactorKind::Salary, ctx.staff_factors[1].kind,
                     "Japanese salary name resolved");

    result.print_summary();
}

int main() {
    utils::set_log_level("off");

    std::cout << "=== Dataset Loader Tests ===\n\n";

    std::cout << "Test: Parse sample dataset\n";
    test_parse_sample();

    std::cout << "\nTest: Parse dataset file\n";
    test_parse_file();

    std::cout << "\nTest: Inconsistent data\n";
    test_rejects_inconsistent_data();

    std::cout << "\nTest: Optional sections\n";
    test_optional_sections();

    std::cout << "\nTest: Dataset as context source\n";
    test_dataset_as_context_source();

    std::cout << "\n=== All Dataset Tests Completed ===\n";
    return TestResult::exit_code();
}
