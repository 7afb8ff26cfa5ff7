#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <medassign/medassign.hpp>
#include <nlohmann/json.hpp>

#ifdef MEDASSIGN_HAVE_TBB
#include <medassign/parallel/multi_start.hpp>
#endif

using namespace medassign;

/// Command-line arguments structure
/// Wraps both the configuration and runtime options
struct CLIConfig {
    std::string data_file;
    std::string config_file;
    std::size_t population = 100;
    std::size_t generations = 200;
    double crossover_prob = 0.7;
    double mutation_prob = 0.2;
    std::uint64_t seed = 1;
    int fiscal_year = 2025;
    std::size_t starts = 1;
    bool verbose = false;
    std::string output_file;
    bool json_output = false;
    std::string json_file;

    // Track which values were explicitly set via command line
    bool has_population_override = false;
    bool has_generations_override = false;
    bool has_crossover_override = false;
    bool has_mutation_override = false;
    bool has_seed_override = false;
    bool has_year_override = false;

    // Convert CLI overrides to configuration overrides
    config::ConfigOverrides to_overrides() const {
        config::ConfigOverrides overrides;
        if (has_population_override) {
            overrides.population_size = population;
        }
        if (has_generations_override) {
            overrides.generations = generations;
        }
        if (has_crossover_override) {
            overrides.crossover_probability = crossover_prob;
        }
        if (has_mutation_override) {
            overrides.mutation_probability = mutation_prob;
        }
        if (has_seed_override) {
            overrides.seed = seed;
        }
        if (has_year_override) {
            overrides.fiscal_year = fiscal_year;
        }
        if (verbose) {
            overrides.log_level = "debug";
        }
        return overrides;
    }
};

/// Get git commit hash (from CMake build)
std::string get_git_hash() {
#ifdef GIT_HASH
    return GIT_HASH;
#else
    return "unknown";
#endif
}

/// Get build configuration info
std::string get_build_config() {
#ifdef NDEBUG
    std::string mode = "Release";
#else
    std::string mode = "Debug";
#endif

#ifdef __clang__
    std::string compiler =
        "Clang " + std::to_string(__clang_major__) + "." + std::to_string(__clang_minor__);
#elif defined(__GNUC__)
    std::string compiler = "GCC " + std::to_string(__GNUC__) + "." + std::to_string(__GNUC_MINOR__);
#else
    std::string compiler = "Unknown";
#endif

    return mode + " (" + compiler + ")";
}

/// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --data FILE [OPTIONS]\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -d, --data FILE         Dataset JSON file (required)\n"
              << "  --config FILE           Load configuration from TOML file\n"
              << "  -p, --population SIZE   Population size (default: 100)\n"
              << "  -g, --generations NUM   Max generations (default: 200)\n"
              << "  -c, --crossover PROB    Crossover probability (default: 0.7)\n"
              << "  -m, --mutation PROB     Mutation probability (default: 0.2)\n"
              << "  -s, --seed SEED         Random seed (default: 1)\n"
              << "  -y, --year YEAR         Fiscal year (default: dataset or 2025)\n"
              << "  --starts K              Independent parallel starts (requires TBB)\n"
              << "  -v, --verbose           Verbose output\n"
              << "  -o, --output FILE       Save assignments to a JSON assignment store\n"
              << "  --json                  Enable JSON output format\n"
              << "  --json-file FILE        Write JSON results to file\n"
              << "\nExamples:\n"
              << "  " << program_name << " --data data/sample.json\n"
              << "  " << program_name << " --data data/sample.json --config config/default.toml\n"
              << "  " << program_name << " --data data/sample.json -y 2026 -o assignments.json\n"
              << "  " << program_name << " --data data/sample.json --json --json-file out.json\n";
}

/// Parse command line arguments
CLIConfig parse_args(int argc, char** argv) {
    CLIConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            config.data_file = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config.config_file = argv[++i];
        } else if ((arg == "-p" || arg == "--population") && i + 1 < argc) {
            config.population = std::stoull(argv[++i]);
            config.has_population_override = true;
        } else if ((arg == "-g" || arg == "--generations") && i + 1 < argc) {
            config.generations = std::stoull(argv[++i]);
            config.has_generations_override = true;
        } else if ((arg == "-c" || arg == "--crossover") && i + 1 < argc) {
            config.crossover_prob = std::stod(argv[++i]);
            config.has_crossover_override = true;
        } else if ((arg == "-m" || arg == "--mutation") && i + 1 < argc) {
            config.mutation_prob = std::stod(argv[++i]);
            config.has_mutation_override = true;
        } else if ((arg == "-s" || arg == "--seed") && i + 1 < argc) {
            config.seed = std::stoull(argv[++i]);
            config.has_seed_override = true;
        } else if ((arg == "-y" || arg == "--year") && i + 1 < argc) {
            config.fiscal_year = std::stoi(argv[++i]);
            config.has_year_override = true;
        } else if (arg == "--starts" && i + 1 < argc) {
            config.starts = std::stoull(argv[++i]);
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            config.output_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--json") {
            config.json_output = true;
        } else if (arg == "--json-file" && i + 1 < argc) {
            config.json_file = argv[++i];
            config.json_output = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    return config;
}

/// Run all requested starts; a single start runs on the already loaded optimizer
assignment::OptimizationResult run_optimization(assignment::Optimizer& optimizer,
                                                [[maybe_unused]] const data::Dataset& dataset,
                                                const CLIConfig& cli_config,
                                                [[maybe_unused]] const config::Config& cfg) {
    core::ProgressCallback progress;
    if (!cli_config.json_output) {
        progress = [](std::size_t generation, double best) {
            std::cout << "  generation " << std::setw(4) << generation << "  best " << std::fixed
                      << std::setprecision(4) << best << "\n";
        };
    }

    if (cli_config.starts <= 1) {
        return optimizer.optimize(progress);
    }

#ifdef MEDASSIGN_HAVE_TBB
    std::vector<std::uint64_t> seeds;
    for (std::size_t k = 0; k < cli_config.starts; ++k) {
        seeds.push_back(cfg.ga.seed + k);
    }
    auto outcome = parallel::run_multi_start(dataset, cfg.to_settings(), seeds);
    if (!outcome) {
        throw core::DataUnavailableError("Multi-start could not load the dataset");
    }
    if (!cli_config.json_output) {
        std::cout << "Best of " << seeds.size() << " starts: seed "
                  << outcome->seeds[outcome->best_index] << "\n";
    }
    return std::move(outcome->best);
#else
    throw std::runtime_error("--starts requires a build with TBB (MEDASSIGN_USE_TBB=ON)");
#endif
}

/// Write JSON output with full metadata
void write_json_output(const assignment::OptimizationResult& result, const CLIConfig& cli_config,
                       const config::Config& cfg, const problems::FitnessContext& ctx,
                       double runtime, std::size_t saved, const std::string& filename = "") {
    using json = nlohmann::json;

    json output;

    // Metadata section
    output["metadata"] = {{"version", VERSION},
                          {"git_hash", get_git_hash()},
                          {"build_config", get_build_config()},
                          {"timestamp", std::time(nullptr)},
                          {"runtime_seconds", runtime}};

    // Configuration section
    output["configuration"] = {{"data_file", cli_config.data_file},
                               {"fiscal_year", cfg.run.fiscal_year},
                               {"population_size", cfg.ga.population_size},
                               {"generations", cfg.ga.generations},
                               {"crossover_probability", cfg.ga.crossover_probability},
                               {"mutation_probability", cfg.ga.mutation_probability},
                               {"mismatch_bonus", cfg.ga.mismatch_bonus},
                               {"seed", cfg.ga.seed},
                               {"starts", cli_config.starts}};

    // Problem section
    output["problem"] = {{"residents", ctx.resident_count()}, {"hospitals", ctx.hospital_count()}};

    // Results section
    json results;
    results["best_fitness"] = result.best_fitness.value;
    results["generations_used"] = result.generations;
    results["evaluations_performed"] = result.evaluations;
    results["converged"] = result.converged;
    results["cancelled"] = result.cancelled;
    results["mismatches"] = result.mismatch_count();
    results["saved_records"] = saved;
    output["results"] = results;

    // Evolution history section (last 5 entries)
    json history = json::array();
    auto history_start = result.history.size() > 5 ? result.history.size() - 5 : 0;
    for (std::size_t i = history_start; i < result.history.size(); ++i) {
        const auto& stats = result.history[i];
        history.push_back({{"generation", stats.generation},
                           {"best_fitness", stats.best_fitness.value},
                           {"mean_fitness", stats.mean_fitness.value},
                           {"worst_fitness", stats.worst_fitness.value},
                           {"best_so_far", stats.best_so_far.value},
                           {"elapsed_ms", stats.elapsed_time.count()}});
    }
    output["evolution_history"] = history;

    json assignments = json::array();
    for (const auto& outcome : result.assignments) {
        assignments.push_back({{"resident_id", outcome.resident_id},
                               {"hospital_id", outcome.hospital_id},
                               {"hope_rank", outcome.hope_rank > 0 ? json(outcome.hope_rank)
                                                                   : json(nullptr)},
                               {"fitness", outcome.fitness}});
    }
    output["assignments"] = assignments;

    // Output to file or stdout
    if (!filename.empty()) {
        std::ofstream file(filename);
        if (!file) {
            throw std::runtime_error("Could not open JSON output file: " + filename);
        }
        file << output.dump(2);
    } else {
        std::cout << output.dump(2) << "\n";
    }
}

/// Print statistics and the assignment table
void print_stats(const assignment::OptimizationResult& result, const CLIConfig& cli_config,
                 const problems::FitnessContext& ctx, double runtime) {
    std::cout << "\n=== Results ===\n";
    std::cout << "Best fitness: " << std::fixed << std::setprecision(4) << result.best_fitness.value
              << "\n";
    std::cout << "Generations: " << result.generations << "\n";
    std::cout << "Evaluations: " << result.evaluations << "\n";
    std::cout << "Runtime: " << std::fixed << std::setprecision(3) << runtime << " seconds\n";
    std::cout << "Converged: " << (result.converged ? "Yes" : "No") << "\n";
    std::cout << "Outside choices: " << result.mismatch_count() << " of "
              << result.assignments.size() << "\n";

    std::unordered_map<int, std::string> hospital_names;
    for (const auto& hospital : ctx.hospitals) {
        hospital_names.emplace(hospital.id, hospital.name);
    }

    std::cout << "\n=== Assignments ===\n";
    std::cout << std::left << std::setw(24) << "Resident" << std::setw(24) << "Hospital"
              << std::right << std::setw(8) << "Choice" << std::setw(10) << "Score" << "\n";
    std::cout << std::string(66, '-') << "\n";
    for (std::size_t i = 0; i < result.assignments.size(); ++i) {
        const auto& outcome = result.assignments[i];
        const std::string choice =
            outcome.hope_rank > 0 ? "#" + std::to_string(outcome.hope_rank) : "-";
        std::cout << std::left << std::setw(24) << ctx.residents[i].name << std::setw(24)
                  << hospital_names[outcome.hospital_id] << std::right << std::setw(8) << choice
                  << std::setw(10) << std::fixed << std::setprecision(4) << outcome.fitness
                  << "\n";
    }

    if (cli_config.verbose && !result.history.empty()) {
        std::cout << "\n=== Evolution History ===\n";
        std::cout << std::setw(10) << "Gen" << std::setw(15) << "Best" << std::setw(15) << "Mean"
                  << std::setw(15) << "Worst" << std::setw(12) << "Time(ms)\n";
        std::cout << std::string(67, '-') << "\n";

        for (const auto& stats : result.history) {
            std::cout << std::setw(10) << stats.generation << std::setw(15) << std::fixed
                      << std::setprecision(4) << stats.best_fitness.value << std::setw(15)
                      << stats.mean_fitness.value << std::setw(15) << stats.worst_fitness.value
                      << std::setw(12) << stats.elapsed_time.count() << "\n";
        }
    }
}

int main(int argc, char** argv) {
    try {
        auto cli_config = parse_args(argc, argv);

        if (cli_config.data_file.empty()) {
            std::cerr << "Error: --data is required\n";
            print_usage(argv[0]);
            return 1;
        }

        // Only print header if not in JSON output mode
        if (!cli_config.json_output) {
            std::cout << "MedAssign Resident Assignment v" << VERSION << "\n";
            std::cout << std::string(36, '=') << "\n";
        }

        auto dataset = io::load_dataset(cli_config.data_file);

        // Load or create configuration
        config::Config cfg;
        if (!cli_config.config_file.empty()) {
            if (!cli_config.json_output) {
                std::cout << "Loading configuration from: " << cli_config.config_file << "\n";
            }
            cfg = config::Config::from_file(cli_config.config_file);
        }
        cfg.apply_overrides(cli_config.to_overrides());
        cfg.apply_data_fiscal_year(dataset.fiscal_year());
        utils::set_log_level(cfg.logging.level);

        auto settings = cfg.to_settings();
        assignment::Optimizer optimizer(settings);
        if (!optimizer.load_data(dataset)) {
            std::cerr << "Error: dataset has no residents or no hospitals\n";
            return 1;
        }

        const auto& ctx = optimizer.context();
        if (!cli_config.json_output) {
            std::cout << "Fiscal year: " << cfg.run.fiscal_year << "\n";
            std::cout << "Residents: " << ctx.resident_count() << "\n";
            std::cout << "Hospitals: " << ctx.hospital_count() << "\n";
            std::cout << "Population: " << settings.ga.population_size << "\n";
            std::cout << "Generations: " << settings.ga.max_generations << "\n";
            std::cout << "Seed: " << settings.ga.seed << "\n\n";
            std::cout << "Starting evolution...\n";
        }
        auto start_time = std::chrono::steady_clock::now();

        auto result = run_optimization(optimizer, dataset, cli_config, cfg);

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration<double>(end_time - start_time).count();

        std::size_t saved = 0;
        if (!cli_config.output_file.empty()) {
            auto records = assignment::make_assignment_records(result, ctx, cfg.run.fiscal_year);
            io::AssignmentStore store(cli_config.output_file);
            saved = store.replace_fiscal_year(cfg.run.fiscal_year, records);
        }

        if (cli_config.json_output) {
            write_json_output(result, cli_config, cfg, ctx, duration, saved, cli_config.json_file);
        } else {
            print_stats(result, cli_config, ctx, duration);
            if (saved > 0) {
                std::cout << "\nSaved " << saved << " assignments to " << cli_config.output_file
                          << "\n";
            }
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
