#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

#include <toml.hpp>

#include <medassign/assignment/optimizer.hpp>
#include <medassign/core/concepts.hpp>
#include <medassign/core/ga.hpp>
#include <medassign/utils/logging.hpp>

namespace medassign::config {

using ConfigValidationError = core::ConfigValidationError;

/// Admissible ranges of the run parameters
namespace limits {
inline constexpr std::size_t MIN_POPULATION = 10;
inline constexpr std::size_t MAX_POPULATION = 500;
inline constexpr std::size_t MIN_GENERATIONS = 50;
inline constexpr std::size_t MAX_GENERATIONS = 1000;
inline constexpr double MIN_MISMATCH_BONUS = 1.0;
inline constexpr double MAX_MISMATCH_BONUS = 5.0;
inline constexpr int MIN_FISCAL_YEAR = 2000;
inline constexpr int MAX_FISCAL_YEAR = 2100;
} // namespace limits

/// Run scope
struct RunConfig {
    int fiscal_year = 2025;
    bool fiscal_year_set = false; // Named by the file or an override
};

/// GA core configuration parameters
struct GAConfig {
    std::size_t population_size = 100;
    std::size_t generations = 200;
    double crossover_probability = 0.7;
    double mutation_probability = 0.2;
    double mismatch_bonus = 1.5; // Validated and carried; the fitness formula does not use it
    std::uint64_t seed = 1;
};

/// Operator parameters
struct OperatorsConfig {
    std::size_t tournament_size = 3;
    double random_gene_rate = 0.05; // Per-gene reset probability
    double capacity_rate = 0.3;     // Capacity repair stage probability
    double hope_rate = 0.2;         // Hope repair stage probability
};

/// Early stopping
struct TerminationConfig {
    double convergence_threshold = 0.001;
    std::size_t convergence_min_generation = 50;
};

/// Logging and progress reporting
struct LoggingConfig {
    std::string level = "info";
    std::size_t progress_interval = 10;
};

/// Command-line override structure
/// Contains optional overrides for configuration parameters
struct ConfigOverrides {
    std::optional<std::size_t> population_size;
    std::optional<std::size_t> generations;
    std::optional<double> crossover_probability;
    std::optional<double> mutation_probability;
    std::optional<std::uint64_t> seed;
    std::optional<int> fiscal_year;
    std::optional<std::string> log_level;
};

/// Complete configuration structure
struct Config {
    RunConfig run;
    GAConfig ga;
    OperatorsConfig operators;
    TerminationConfig termination;
    LoggingConfig logging;

    /// Load configuration from TOML file
    /// Validates all parameters and applies defaults for missing values
    static Config from_file(const std::string& filepath);

    /// Load configuration from TOML string
    static Config from_string(const std::string& toml_string);

    /// Validate configuration parameters
    /// Throws ConfigValidationError if any parameter is invalid
    void validate() const;

    /// Export configuration to TOML string
    std::string to_toml() const;

    /// GA driver parameters
    core::GAConfig to_ga_config() const;

    /// Everything an assignment::Optimizer needs
    assignment::OptimizerSettings to_settings() const;

    /// Apply command-line overrides to configuration
    /// Overrides take precedence over loaded values
    void apply_overrides(const ConfigOverrides& overrides);

    /// Adopt the fiscal year of the loaded data unless the file or an override named one
    void apply_data_fiscal_year(std::optional<int> data_year);

  private:
    static Config from_value(const toml::value& data);

    static RunConfig parse_run(const toml::value& data);
    static GAConfig parse_ga(const toml::value& data);
    static OperatorsConfig parse_operators(const toml::value& data);
    static TerminationConfig parse_termination(const toml::value& data);
    static LoggingConfig parse_logging(const toml::value& data);

    /// Float key that also accepts an integer literal (e.g. `mismatch_bonus = 2`)
    static double find_number(const toml::value& table, const std::string& key);
};

// Implementation of Config methods

inline Config Config::from_file(const std::string& filepath) {
    const auto data = toml::parse(filepath);
    return from_value(data);
}

inline Config Config::from_string(const std::string& toml_string) {
    std::istringstream iss(toml_string);
    const auto data = toml::parse(iss, "config_string");
    return from_value(data);
}

inline Config Config::from_value(const toml::value& data) {
    Config config;

    // Parse each section if it exists, otherwise use defaults
    if (data.contains("run")) {
        config.run = parse_run(data);
    }

    if (data.contains("ga")) {
        config.ga = parse_ga(data);
    }

    if (data.contains("operators")) {
        config.operators = parse_operators(data);
    }

    if (data.contains("termination")) {
        config.termination = parse_termination(data);
    }

    if (data.contains("logging")) {
        config.logging = parse_logging(data);
    }

    config.validate();
    return config;
}

inline void Config::validate() const {
    auto in_unit_range = [](double p) { return p >= 0.0 && p <= 1.0; };

    if (run.fiscal_year < limits::MIN_FISCAL_YEAR || run.fiscal_year > limits::MAX_FISCAL_YEAR) {
        throw ConfigValidationError("Fiscal year must be in [2000,2100]");
    }

    if (ga.population_size < limits::MIN_POPULATION ||
        ga.population_size > limits::MAX_POPULATION) {
        throw ConfigValidationError("Population size must be in [10,500]");
    }

    if (ga.generations < limits::MIN_GENERATIONS || ga.generations > limits::MAX_GENERATIONS) {
        throw ConfigValidationError("Generations must be in [50,1000]");
    }

    if (!in_unit_range(ga.crossover_probability)) {
        throw ConfigValidationError("Crossover probability must be in [0,1]");
    }

    if (!in_unit_range(ga.mutation_probability)) {
        throw ConfigValidationError("Mutation probability must be in [0,1]");
    }

    if (ga.mismatch_bonus < limits::MIN_MISMATCH_BONUS ||
        ga.mismatch_bonus > limits::MAX_MISMATCH_BONUS) {
        throw ConfigValidationError("Mismatch bonus must be in [1.0,5.0]");
    }

    if (operators.tournament_size == 0) {
        throw ConfigValidationError("Tournament size must be positive");
    }

    if (!in_unit_range(operators.random_gene_rate) || !in_unit_range(operators.capacity_rate) ||
        !in_unit_range(operators.hope_rate)) {
        throw ConfigValidationError("Mutation stage rates must be in [0,1]");
    }

    if (termination.convergence_threshold < 0.0) {
        throw ConfigValidationError("Convergence threshold cannot be negative");
    }

    if (logging.progress_interval == 0) {
        throw ConfigValidationError("Progress interval must be positive");
    }

    if (!utils::parse_log_level(logging.level)) {
        throw ConfigValidationError("Unknown log level: " + logging.level);
    }
}

inline double Config::find_number(const toml::value& table, const std::string& key) {
    const auto& value = table.at(key);
    if (value.is_integer()) {
        return static_cast<double>(toml::find<std::int64_t>(table, key));
    }
    return toml::find<double>(table, key);
}

inline RunConfig Config::parse_run(const toml::value& data) {
    RunConfig run;
    const auto& run_table = toml::find(data, "run");

    if (run_table.contains("fiscal_year")) {
        run.fiscal_year = toml::find<int>(run_table, "fiscal_year");
        run.fiscal_year_set = true;
    }

    return run;
}

inline GAConfig Config::parse_ga(const toml::value& data) {
    GAConfig ga;
    const auto& ga_table = toml::find(data, "ga");

    if (ga_table.contains("population_size")) {
        ga.population_size = toml::find<std::size_t>(ga_table, "population_size");
    }

    if (ga_table.contains("generations")) {
        ga.generations = toml::find<std::size_t>(ga_table, "generations");
    }

    if (ga_table.contains("crossover_probability")) {
        ga.crossover_probability = find_number(ga_table, "crossover_probability");
    }

    if (ga_table.contains("mutation_probability")) {
        ga.mutation_probability = find_number(ga_table, "mutation_probability");
    }

    if (ga_table.contains("mismatch_bonus")) {
        ga.mismatch_bonus = find_number(ga_table, "mismatch_bonus");
    }

    if (ga_table.contains("seed")) {
        ga.seed = toml::find<std::uint64_t>(ga_table, "seed");
    }

    return ga;
}

inline OperatorsConfig Config::parse_operators(const toml::value& data) {
    OperatorsConfig ops;
    const auto& ops_table = toml::find(data, "operators");

    if (ops_table.contains("tournament_size")) {
        ops.tournament_size = toml::find<std::size_t>(ops_table, "tournament_size");
    }

    if (ops_table.contains("random_gene_rate")) {
        ops.random_gene_rate = find_number(ops_table, "random_gene_rate");
    }

    if (ops_table.contains("capacity_rate")) {
        ops.capacity_rate = find_number(ops_table, "capacity_rate");
    }

    if (ops_table.contains("hope_rate")) {
        ops.hope_rate = find_number(ops_table, "hope_rate");
    }

    return ops;
}

inline TerminationConfig Config::parse_termination(const toml::value& data) {
    TerminationConfig term;
    const auto& term_table = toml::find(data, "termination");

    if (term_table.contains("convergence_threshold")) {
        term.convergence_threshold = find_number(term_table, "convergence_threshold");
    }

    if (term_table.contains("convergence_min_generation")) {
        term.convergence_min_generation =
            toml::find<std::size_t>(term_table, "convergence_min_generation");
    }

    return term;
}

inline LoggingConfig Config::parse_logging(const toml::value& data) {
    LoggingConfig log;
    const auto& log_table = toml::find(data, "logging");

    if (log_table.contains("level")) {
        log.level = toml::find<std::string>(log_table, "level");
    }

    if (log_table.contains("progress_interval")) {
        log.progress_interval = toml::find<std::size_t>(log_table, "progress_interval");
    }

    return log;
}

inline std::string Config::to_toml() const {
    toml::value root;

    toml::value run_table;
    run_table["fiscal_year"] = run.fiscal_year;
    root["run"] = run_table;

    toml::value ga_table;
    ga_table["population_size"] = ga.population_size;
    ga_table["generations"] = ga.generations;
    ga_table["crossover_probability"] = ga.crossover_probability;
    ga_table["mutation_probability"] = ga.mutation_probability;
    ga_table["mismatch_bonus"] = ga.mismatch_bonus;
    ga_table["seed"] = ga.seed;
    root["ga"] = ga_table;

    toml::value ops_table;
    ops_table["tournament_size"] = operators.tournament_size;
    ops_table["random_gene_rate"] = operators.random_gene_rate;
    ops_table["capacity_rate"] = operators.capacity_rate;
    ops_table["hope_rate"] = operators.hope_rate;
    root["operators"] = ops_table;

    toml::value term_table;
    term_table["convergence_threshold"] = termination.convergence_threshold;
    term_table["convergence_min_generation"] = termination.convergence_min_generation;
    root["termination"] = term_table;

    toml::value log_table;
    log_table["level"] = logging.level;
    log_table["progress_interval"] = logging.progress_interval;
    root["logging"] = log_table;

    std::stringstream ss;
    ss << toml::format(root);
    return ss.str();
}

inline void Config::apply_overrides(const ConfigOverrides& overrides) {
    // Apply overrides only if they are set
    if (overrides.population_size.has_value()) {
        ga.population_size = overrides.population_size.value();
    }

    if (overrides.generations.has_value()) {
        ga.generations = overrides.generations.value();
    }

    if (overrides.crossover_probability.has_value()) {
        ga.crossover_probability = overrides.crossover_probability.value();
    }

    if (overrides.mutation_probability.has_value()) {
        ga.mutation_probability = overrides.mutation_probability.value();
    }

    if (overrides.seed.has_value()) {
        ga.seed = overrides.seed.value();
    }

    if (overrides.fiscal_year.has_value()) {
        run.fiscal_year = overrides.fiscal_year.value();
        run.fiscal_year_set = true;
    }

    if (overrides.log_level.has_value()) {
        logging.level = overrides.log_level.value();
    }

    // Re-validate after applying overrides
    validate();
}

inline void Config::apply_data_fiscal_year(std::optional<int> data_year) {
    if (run.fiscal_year_set || !data_year.has_value()) {
        return;
    }
    run.fiscal_year = *data_year;
    validate();
}

inline core::GAConfig Config::to_ga_config() const {
    core::GAConfig ga_config;

    ga_config.population_size = ga.population_size;
    ga_config.max_generations = ga.generations;
    ga_config.crossover_prob = ga.crossover_probability;
    ga_config.mutation_prob = ga.mutation_probability;
    ga_config.seed = ga.seed;

    ga_config.tournament_size = operators.tournament_size;

    ga_config.convergence_threshold = termination.convergence_threshold;
    ga_config.convergence_min_generation = termination.convergence_min_generation;

    ga_config.progress_interval = logging.progress_interval;

    return ga_config;
}

inline assignment::OptimizerSettings Config::to_settings() const {
    assignment::OptimizerSettings settings;
    settings.fiscal_year = run.fiscal_year;
    settings.ga = to_ga_config();
    settings.random_gene_rate = operators.random_gene_rate;
    settings.capacity_rate = operators.capacity_rate;
    settings.hope_rate = operators.hope_rate;
    settings.mismatch_bonus = ga.mismatch_bonus;
    return settings;
}

} // namespace medassign::config
