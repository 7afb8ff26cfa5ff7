#pragma once

/// @file records.hpp
/// @brief Persistence records produced from an optimization result
///
/// One record per resident. Assignments run for a fiscal year from April 1 to March 31 of
/// the following calendar year.

#include <charconv>
#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <medassign/assignment/optimizer.hpp>
#include <medassign/problems/context.hpp>

namespace medassign::assignment {

inline constexpr std::string_view MISMATCH_NO_PREFERENCE = "no_preference";

struct AssignmentRecord {
    int resident_id = 0;
    int hospital_id = 0;
    int fiscal_year = 0;
    std::chrono::year_month_day start_date;
    std::chrono::year_month_day end_date;
    bool mismatch = false;
    std::string mismatch_reason; // Empty unless mismatch
    double fitness_score = 0.0;
    std::optional<int> hope_rank;       // Empty when placed outside the choices
    std::optional<int> commute_minutes; // Empty when unknown
};

[[nodiscard]] constexpr std::chrono::year_month_day fiscal_year_start(int fiscal_year) noexcept {
    return std::chrono::year{fiscal_year} / std::chrono::April / std::chrono::day{1};
}

[[nodiscard]] constexpr std::chrono::year_month_day fiscal_year_end(int fiscal_year) noexcept {
    return std::chrono::year{fiscal_year + 1} / std::chrono::March / std::chrono::day{31};
}

/// ISO 8601 calendar date (YYYY-MM-DD)
[[nodiscard]] inline std::string format_date(const std::chrono::year_month_day& date) {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(date.month()) << '-' << std::setw(2)
        << static_cast<unsigned>(date.day());
    return out.str();
}

/// Parse YYYY-MM-DD; std::nullopt for anything else or an impossible date
[[nodiscard]] inline std::optional<std::chrono::year_month_day> parse_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
        return std::nullopt;

    auto field = [&text](std::size_t pos, std::size_t len) -> std::optional<int> {
        int value = 0;
        const auto* first = text.data() + pos;
        const auto* last = first + len;
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last)
            return std::nullopt;
        return value;
    };

    const auto y = field(0, 4);
    const auto m = field(5, 2);
    const auto d = field(8, 2);
    if (!y || !m || !d)
        return std::nullopt;

    const std::chrono::year_month_day date{std::chrono::year{*y},
                                           std::chrono::month{static_cast<unsigned>(*m)},
                                           std::chrono::day{static_cast<unsigned>(*d)}};
    if (!date.ok())
        return std::nullopt;
    return date;
}

/// Records for every resident of a finished run
[[nodiscard]] inline std::vector<AssignmentRecord>
make_assignment_records(const OptimizationResult& result, const problems::FitnessContext& ctx,
                        int fiscal_year) {
    std::vector<AssignmentRecord> records;
    records.reserve(result.assignments.size());

    for (const auto& outcome : result.assignments) {
        AssignmentRecord record;
        record.resident_id = outcome.resident_id;
        record.hospital_id = outcome.hospital_id;
        record.fiscal_year = fiscal_year;
        record.start_date = fiscal_year_start(fiscal_year);
        record.end_date = fiscal_year_end(fiscal_year);
        record.fitness_score = outcome.fitness;

        if (outcome.hope_rank > 0) {
            record.hope_rank = outcome.hope_rank;
        } else {
            record.mismatch = true;
            record.mismatch_reason = std::string(MISMATCH_NO_PREFERENCE);
        }

        const auto minutes = ctx.commute_minutes(outcome.resident_id, outcome.hospital_id);
        if (minutes && *minutes > 0.0) {
            record.commute_minutes = static_cast<int>(*minutes); // Whole minutes, truncated
        }

        records.push_back(std::move(record));
    }
    return records;
}

} // namespace medassign::assignment
