#include <filesystem>
#include <fstream>
#include <optional>
#include <iostream>
#include <string>

#include <medassign/config/config.hpp>
#include <medassign/utils/logging.hpp>

#include "test_helper.hpp"

using namespace medassign::config;

// Helper function to create temporary TOML file for testing
std::filesystem::path create_temp_toml(const std::string& content) {
    auto temp_path = std::filesystem::temp_directory_path() / "medassign_test_config.toml";
    std::ofstream file(temp_path);
    file << content;
    file.close();
    return temp_path;
}

void test_defaults() {
    TestResult result;

    const auto config = Config::from_string("");

    result.assert_eq(2025, config.run.fiscal_year, "Default fiscal year");
    result.assert_eq(static_cast<size_t>(100), config.ga.population_size, "Default population");
    result.assert_eq(static_cast<size_t>(200), config.ga.generations, "Default generations");
    result.assert_eq(0.7, config.ga.crossover_probability, "Default crossover probability");
    result.assert_eq(0.2, config.ga.mutation_probability, "Default mutation probability");
    result.assert_eq(1.5, config.ga.mismatch_bonus, "Default mismatch bonus");
    result.assert_eq(static_cast<size_t>(3), config.operators.tournament_size,
                     "Default tournament size");
    result.assert_eq(0.05, config.operators.random_gene_rate, "Default random gene rate");
    result.assert_eq(0.3, config.operators.capacity_rate, "Default capacity repair rate");
    result.assert_eq(0.2, config.operators.hope_rate, "Default hope repair rate");
    result.assert_eq(std::string("info"), config.logging.level, "Default log level");
    result.assert_eq(static_cast<size_t>(10), config.logging.progress_interval,
                     "Default progress interval");

    result.print_summary();
}

void test_file_config() {
    TestResult result;

    const std::string toml_content = R"(
        [run]
        fiscal_year = 2027

        [ga]
        population_size = 150
        generations = 400
        crossover_probability = 0.8
        mutation_probability = 0.1
        mismatch_bonus = 2
        seed = 42

        [operators]
        tournament_size = 5
        capacity_rate = 0.5

        [termination]
        convergence_threshold = 0.0005
        convergence_min_generation = 80

        [logging]
        level = "debug"
        progress_interval = 25
    )";

    auto temp_file = create_temp_toml(toml_content);
    auto config = Config::from_file(temp_file.string());

    result.assert_eq(2027, config.run.fiscal_year, "Fiscal year");
    result.assert_eq(static_cast<size_t>(150), config.ga.population_size, "Population size");
    result.assert_eq(static_cast<size_t>(400), config.ga.generations, "Generations");
    result.assert_eq(0.8, config.ga.crossover_probability, "Crossover probability");
    result.assert_eq(0.1, config.ga.mutation_probability, "Mutation probability");
    result.assert_eq(2.0, config.ga.mismatch_bonus, "Integer literal accepted for a float key");
    result.assert_eq(static_cast<size_t>(42), static_cast<size_t>(config.ga.seed), "Seed");
    result.assert_eq(static_cast<size_t>(5), config.operators.tournament_size, "Tournament size");
    result.assert_eq(0.5, config.operators.capacity_rate, "Capacity repair rate");
    result.assert_eq(0.2, config.operators.hope_rate, "Unset key keeps its default");
    result.assert_eq(0.0005, config.termination.convergence_threshold, "Convergence threshold");
    result.assert_eq(std::string("debug"), config.logging.level, "Log level");

    std::filesystem::remove(temp_file);
    result.print_summary();
}

void test_validation_ranges() {
    TestResult result;

    auto rejects = [&result](const std::string& toml, const std::string& message) {
        result.assert_throws<ConfigValidationError>([&] { (void)Config::from_string(toml); },
                                                    message);
    };

    rejects("[ga]\npopulation_size = 5\n", "Population below 10 rejected");
    rejects("[ga]\npopulation_size = 501\n", "Population above 500 rejected");
    rejects("[ga]\ngenerations = 49\n", "Generations below 50 rejected");
    rejects("[ga]\ngenerations = 1001\n", "Generations above 1000 rejected");
    rejects("[ga]\ncrossover_probability = 1.5\n", "Crossover probability above 1 rejected");
    rejects("[ga]\nmutation_probability = -0.1\n", "Negative mutation probability rejected");
    rejects("[ga]\nmismatch_bonus = 0.5\n", "Mismatch bonus below 1 rejected");
    rejects("[ga]\nmismatch_bonus = 6.0\n", "Mismatch bonus above 5 rejected");
    rejects("[run]\nfiscal_year = 1999\n", "Fiscal year before 2000 rejected");
    rejects("[run]\nfiscal_year = 2101\n", "Fiscal year after 2100 rejected");
    rejects("[operators]\nhope_rate = 1.2\n", "Stage rate above 1 rejected");
    rejects("[logging]\nlevel = \"loud\"\n", "Unknown log level rejected");

    result.assert_no_throw(
        [] {
            (void)Config::from_string("[ga]\npopulation_size = 10\ngenerations = 1000\n"
                                      "crossover_probability = 0.0\nmutation_probability = 1.0\n"
                                      "mismatch_bonus = 5.0\n[run]\nfiscal_year = 2100\n");
        },
        "Range boundaries accepted");

    result.print_summary();
}

void test_overrides() {
    TestResult result;

    auto config = Config::from_string("[ga]\npopulation_size = 120\n");

    ConfigOverrides overrides;
    overrides.population_size = 60;
    overrides.generations = 75;
    overrides.seed = 9;
    overrides.fiscal_year = 2030;
    config.apply_overrides(overrides);

    result.assert_eq(static_cast<size_t>(60), config.ga.population_size, "Population overridden");
    result.assert_eq(static_cast<size_t>(75), config.ga.generations, "Generations overridden");
    result.assert_eq(2030, config.run.fiscal_year, "Fiscal year overridden");
    result.assert_eq(0.7, config.ga.crossover_probability, "Unset override leaves value alone");

    ConfigOverrides bad;
    bad.population_size = 1000;
    result.assert_throws<ConfigValidationError>([&] { config.apply_overrides(bad); },
                                                "Overrides are validated");

    result.print_summary();
}

void test_data_fiscal_year() {
    TestResult result;

    auto unnamed = Config::from_string("[ga]\npopulation_size = 40\n");
    unnamed.apply_data_fiscal_year(2027);
    result.assert_eq(2027, unnamed.run.fiscal_year, "Data year used when the file names none");
    result.assert_eq(2027, unnamed.to_settings().fiscal_year, "Data year reaches the settings");

    auto named = Config::from_string("[run]\nfiscal_year = 2026\n");
    named.apply_data_fiscal_year(2027);
    result.assert_eq(2026, named.run.fiscal_year, "File year wins over the data year");

    auto overridden = Config::from_string("[ga]\nseed = 3\n");
    ConfigOverrides overrides;
    overrides.fiscal_year = 2031;
    overridden.apply_overrides(overrides);
    overridden.apply_data_fiscal_year(2027);
    result.assert_eq(2031, overridden.run.fiscal_year, "Override wins over the data year");

    Config defaults;
    defaults.apply_data_fiscal_year(std::nullopt);
    result.assert_eq(2025, defaults.run.fiscal_year, "Default year without data year");

    Config out_of_range;
    result.assert_throws<ConfigValidationError>(
        [&] { out_of_range.apply_data_fiscal_year(1990); }, "Data year is validated");

    result.print_summary();
}

void test_settings_conversion() {
    TestResult result;

    const auto config = Config::from_string(R"(
        [run]
        fiscal_year = 2026
        [ga]
        population_size = 40
        generations = 90
        seed = 7
        [operators]
        tournament_size = 4
        random_gene_rate = 0.1
        [termination]
        convergence_min_generation = 60
        [logging]
        progress_interval = 5
    )");

    const auto settings = config.to_settings();
    result.assert_eq(2026, settings.fiscal_year, "Fiscal year carried");
    result.assert_eq(static_cast<size_t>(40), settings.ga.population_size, "Population carried");
    result.assert_eq(static_cast<size_t>(90), settings.ga.max_generations, "Generations carried");
    result.assert_eq(static_cast<size_t>(4), settings.ga.tournament_size, "Tournament carried");
    result.assert_eq(static_cast<size_t>(5), settings.ga.progress_interval, "Interval carried");
    result.assert_eq(static_cast<size_t>(60), settings.ga.convergence_min_generation,
                     "Convergence start carried");
    result.assert_eq(0.1, settings.random_gene_rate, "Random gene rate carried");
    result.assert_eq(1.5, settings.mismatch_bonus, "Mismatch bonus carried");
    result.assert_no_throw([&] { settings.ga.validate(); }, "Converted settings validate");

    result.print_summary();
}

void test_round_trip() {
    TestResult result;

    auto config = Config::from_string("[ga]\npopulation_size = 250\nseed = 11\n");
    const auto reloaded = Config::from_string(config.to_toml());

    result.assert_eq(static_cast<size_t>(250), reloaded.ga.population_size,
                     "Population survives export");
    result.assert_eq(static_cast<size_t>(11), static_cast<size_t>(reloaded.ga.seed),
                     "Seed survives export");

    result.print_summary();
}

void test_malformed_toml() {
    TestResult result;

    result.assert_throws<std::exception>([] { (void)Config::from_string("[ga\npopulation = "); },
                                         "Syntax errors surface as exceptions");
    result.assert_throws<std::exception>(
        [] { (void)Config::from_file("/nonexistent/medassign.toml"); }, "Missing file rejected");

    result.print_summary();
}

int main() {
    medassign::utils::set_log_level("off");

    std::cout << "=== Configuration System Tests ===\n\n";

    std::cout << "Test: Defaults\n";
    test_defaults();

    std::cout << "\nTest: File configuration\n";
    test_file_config();

    std::cout << "\nTest: Validation ranges\n";
    test_validation_ranges();

    std::cout << "\nTest: Command-line overrides\n";
    test_overrides();

    std::cout << "\nTest: Fiscal year from the data\n";
    test_data_fiscal_year();

    std::cout << "\nTest: Optimizer settings conversion\n";
    test_settings_conversion();

    std::cout << "\nTest: TOML export\n";
    test_round_trip();

    std::cout << "\nTest: Malformed input\n";
    test_malformed_toml();

    std::cout << "\n=== All Configuration Tests Completed ===\n";
    return TestResult::exit_code();
}
