#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

#include <medassign/medassign.hpp>

#include "fixtures.hpp"
#include "test_helper.hpp"

using namespace medassign;
using assignment::OptimizerState;

void test_capacity_pair_assignment() {
    TestResult result;

    const auto ds = fixtures::capacity_pair();
    assignment::Optimizer optimizer(fixtures::settings(20, 30));

    result.assert_eq(OptimizerState::Uninitialized, optimizer.state(), "Starts uninitialized");
    result.assert_true(optimizer.load_data(ds), "Data loads");
    result.assert_eq(OptimizerState::DataLoaded, optimizer.state(), "State after load");

    const auto run = optimizer.optimize();
    result.assert_eq(OptimizerState::Completed, optimizer.state(), "State after optimize");
    result.assert_eq(std::size_t{3}, run.best_genome.size(), "One gene per resident");
    result.assert_eq(fixtures::YEAR, run.fiscal_year, "Result tagged with the fiscal year");

    const problems::AssignmentProblem problem(optimizer.context());
    result.assert_eq(0, problem.total_overflow(run.best_genome), "No hospital over capacity");

    const auto first = std::find_if(run.assignments.begin(), run.assignments.end(),
                                    [](const auto& a) { return a.resident_id == 1; });
    result.assert_true(first != run.assignments.end(), "Resident 1 assigned");
    result.assert_eq(10, first->hospital_id, "Resident 1 gets the first choice");
    result.assert_eq(1, first->hope_rank, "Hope rank reported");
    result.assert_equals(0.7, first->fitness, "Per-resident fitness of the first choice");

    result.assert_equals(1.3 / 3.0, run.best_fitness.value, "Optimal assignment found");
    result.assert_eq(std::size_t{2}, run.mismatch_count(), "Two residents without choices");
    result.assert_true(run.generations <= 30, "Generation count bounded by the setting");

    result.print_summary();
}

void test_no_residents() {
    TestResult result;

    assignment::Optimizer optimizer(fixtures::settings(20, 30));

    result.assert_true(!optimizer.load_data(fixtures::no_residents()),
                       "Loading without residents fails");
    result.assert_eq(OptimizerState::Uninitialized, optimizer.state(), "State unchanged");
    result.assert_throws<core::SequencingError>([&] { (void)optimizer.optimize(); },
                                                "optimize() refused without data");
    result.assert_throws<core::SequencingError>([&] { (void)optimizer.context(); },
                                                "No snapshot without data");

    result.print_summary();
}

void test_failed_reload_keeps_snapshot() {
    TestResult result;

    assignment::Optimizer optimizer(fixtures::settings(20, 30));
    result.assert_true(optimizer.load_data(fixtures::capacity_pair()), "First load succeeds");
    result.assert_true(!optimizer.load_data(fixtures::no_residents()), "Second load fails");
    result.assert_eq(OptimizerState::DataLoaded, optimizer.state(), "Previous state kept");
    result.assert_eq(std::size_t{3}, optimizer.context().resident_count(),
                     "Previous snapshot kept");

    result.print_summary();
}

void test_department_run() {
    TestResult result;

    const auto ds = fixtures::department();
    assignment::Optimizer optimizer(fixtures::settings(30, 60, 5));
    result.assert_true(optimizer.load_data(ds), "Data loads");
    result.assert_eq(std::size_t{5}, optimizer.context().resident_count(),
                     "Specialist excluded from the run");

    const auto run = optimizer.optimize();
    result.assert_eq(std::size_t{5}, run.assignments.size(), "One assignment per resident");

    std::set<int> residents;
    std::set<int> hospitals{10, 20, 30};
    bool known_hospitals = true;
    for (const auto& a : run.assignments) {
        residents.insert(a.resident_id);
        if (!hospitals.contains(a.hospital_id))
            known_hospitals = false;
    }
    result.assert_true(residents == std::set<int>{1, 2, 3, 4, 5}, "Every resident exactly once");
    result.assert_true(known_hospitals, "Every assignment names a loaded hospital");

    result.assert_true(run.history.size() == run.generations + 1,
                       "History holds one entry per evaluated generation");
    result.assert_true(run.best_fitness.value >= 0.0 && run.best_fitness.value <= 1.0,
                       "Best fitness within [0,1]");

    const problems::AssignmentProblem problem(optimizer.context());
    result.assert_equals(problem.evaluate(run.best_genome).value, run.best_fitness.value,
                         "Best fitness matches the returned genome");

    result.print_summary();
}

void test_explicit_lists() {
    TestResult result;

    const auto ds = fixtures::department();
    assignment::Optimizer optimizer(fixtures::settings(20, 10));

    std::vector<problems::Resident> residents{ds.staff()[0], ds.staff()[2]};
    result.assert_true(optimizer.load_data(ds, residents, ds.hospitals()),
                       "Explicit lists load");
    result.assert_eq(std::size_t{2}, optimizer.context().resident_count(),
                     "Only the given residents are in the snapshot");

    const auto run = optimizer.optimize();
    result.assert_eq(std::size_t{2}, run.assignments.size(), "Assignments for the given residents");

    result.print_summary();
}

void test_repeat_and_determinism() {
    TestResult result;

    const auto ds = fixtures::department();
    assignment::Optimizer first(fixtures::settings(20, 40, 123));
    assignment::Optimizer second(fixtures::settings(20, 40, 123));
    result.assert_true(first.load_data(ds) && second.load_data(ds), "Both load");

    const auto a = first.optimize();
    const auto b = second.optimize();
    result.assert_true(a.best_genome == b.best_genome, "Same seed, same assignment");
    result.assert_equals(a.best_fitness.value, b.best_fitness.value, "Same seed, same fitness");

    const auto again = first.optimize();
    result.assert_eq(OptimizerState::Completed, first.state(), "Repeated run completes");
    result.assert_true(again.best_genome == a.best_genome, "Repeated run is reproducible");

    result.print_summary();
}

void test_progress_and_cancellation() {
    TestResult result;

    const auto ds = fixtures::department();

    {
        assignment::Optimizer optimizer(fixtures::settings(20, 30));
        result.assert_true(optimizer.load_data(ds), "Data loads");

        std::vector<std::size_t> generations;
        const auto run = optimizer.optimize([&](std::size_t gen, double) {
            generations.push_back(gen);
            throw std::runtime_error("observer failed");
        });
        result.assert_true(generations == std::vector<std::size_t>{0, 10, 20, 30},
                           "Progress at 0 and every 10 generations despite failures");
        result.assert_eq(std::size_t{30}, run.generations, "Run unaffected by the observer");
    }

    {
        assignment::Optimizer optimizer(fixtures::settings(20, 30));
        result.assert_true(optimizer.load_data(ds), "Data loads");

        const auto run = optimizer.optimize([](std::size_t, double) { throw 42; });
        result.assert_eq(std::size_t{30}, run.generations,
                         "Observer throwing a non-exception type does not abort the run");
        result.assert_eq(OptimizerState::Completed, optimizer.state(), "Run completes");
    }

    {
        assignment::Optimizer optimizer(fixtures::settings(20, 30));
        result.assert_true(optimizer.load_data(ds), "Data loads");

        std::stop_source stop;
        stop.request_stop();
        const auto run = optimizer.optimize({}, stop.get_token());
        result.assert_true(run.cancelled, "Cancelled run flagged");
        result.assert_eq(std::size_t{0}, run.generations, "No generation after generation 0");
        result.assert_eq(std::size_t{5}, run.assignments.size(),
                         "Cancelled run still assigns everyone");
        result.assert_eq(OptimizerState::Completed, optimizer.state(),
                         "Cancelled run completes");
    }

    result.print_summary();
}

void test_invalid_settings() {
    TestResult result;

    auto settings = fixtures::settings(1, 30);
    result.assert_throws<core::ConfigValidationError>(
        [&] { assignment::Optimizer optimizer(settings); }, "Population of one rejected");

    settings = fixtures::settings(20, 30);
    settings.ga.crossover_prob = 2.0;
    result.assert_throws<core::ConfigValidationError>(
        [&] { assignment::Optimizer optimizer(settings); }, "Crossover probability above one");

    result.print_summary();
}

void test_state_names() {
    TestResult result;

    result.assert_eq(std::string("uninitialized"),
                     std::string(assignment::to_string(OptimizerState::Uninitialized)),
                     "Uninitialized name");
    result.assert_eq(std::string("evolving"),
                     std::string(assignment::to_string(OptimizerState::Evolving)),
                     "Evolving name");

    result.print_summary();
}

int main() {
    utils::set_log_level("off");

    std::cout << "=== Optimizer Tests ===\n\n";

    std::cout << "Test: Capacity pair assignment\n";
    test_capacity_pair_assignment();

    std::cout << "\nTest: Empty resident list\n";
    test_no_residents();

    std::cout << "\nTest: Failed reload\n";
    test_failed_reload_keeps_snapshot();

    std::cout << "\nTest: Department run\n";
    test_department_run();

    std::cout << "\nTest: Explicit resident and hospital lists\n";
    test_explicit_lists();

    std::cout << "\nTest: Repeat and determinism\n";
    test_repeat_and_determinism();

    std::cout << "\nTest: Progress and cancellation\n";
    test_progress_and_cancellation();

    std::cout << "\nTest: Invalid settings\n";
    test_invalid_settings();

    std::cout << "\nTest: State names\n";
    test_state_names();

    std::cout << "\n=== All Optimizer Tests Completed ===\n";
    return TestResult::exit_code();
}
