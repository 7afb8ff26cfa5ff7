#pragma once

// Core components
#include "core/concepts.hpp"
#include "core/ga.hpp"
#include "core/population.hpp"

// Problem model and fitness
#include "problems/assignment.hpp"
#include "problems/context.hpp"
#include "problems/model.hpp"

// Genetic operators
#include "operators/crossover.hpp"
#include "operators/mutation.hpp"
#include "operators/selection.hpp"

// Optimization driver and persistence records
#include "assignment/optimizer.hpp"
#include "assignment/records.hpp"

// Data sources and IO
#include "data/dataset.hpp"
#include "io/assignment_store.hpp"
#include "io/dataset.hpp"

// Configuration
#include "config/config.hpp"

// Utilities
#include "utils/logging.hpp"

/**
 * @file medassign.hpp
 * @brief Main header for MedAssign - annual resident-to-hospital assignment by GA
 *
 * Basic usage:
 * @code
 * #include <medassign/medassign.hpp>
 * using namespace medassign;
 *
 * auto dataset = io::load_dataset("dataset.json");
 * auto cfg = config::Config::from_file("config/default.toml");
 *
 * assignment::Optimizer optimizer(cfg.to_settings());
 * if (!optimizer.load_data(dataset)) {
 *     return 1;
 * }
 *
 * auto result = optimizer.optimize([](std::size_t gen, double best) {
 *     std::cout << gen << ": " << best << '\n';
 * });
 *
 * auto records = assignment::make_assignment_records(result, optimizer.context(),
 *                                                    cfg.run.fiscal_year);
 * io::AssignmentStore("assignments.json").replace_fiscal_year(cfg.run.fiscal_year, records);
 * @endcode
 */

namespace medassign {

/// Current version
constexpr const char* VERSION = "0.1.0";

/// Common type aliases
namespace types {
using Fitness = core::Fitness;

template <typename T>
using Genome = core::Genome<T>;

using Assignment = problems::AssignmentProblem;
} // namespace types

/// Factory functions for common configurations
namespace factory {

/// Operator set for an assignment run from explicit settings
inline auto make_assignment_ga(const assignment::OptimizerSettings& settings) {
    return assignment::make_assignment_ga(settings);
}

/// Operator set for an assignment run from a loaded configuration
inline auto make_assignment_ga_from_config(const config::Config& cfg) {
    return assignment::make_assignment_ga(cfg.to_settings());
}

/// Optimizer ready for load_data() from a loaded configuration
inline assignment::Optimizer make_optimizer_from_config(const config::Config& cfg) {
    return assignment::Optimizer(cfg.to_settings());
}

} // namespace factory

} // namespace medassign
