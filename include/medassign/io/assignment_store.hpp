#pragma once

/// @file assignment_store.hpp
/// @brief JSON file holding the saved assignment records of every fiscal year
///
/// Saving a run replaces all records of its fiscal year and leaves other years untouched.
/// The file is rewritten through a temporary sibling and renamed into place.

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <medassign/assignment/records.hpp>
#include <medassign/utils/logging.hpp>

namespace medassign::io {

/// Assignment file could not be read or written
class StoreError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class AssignmentStore {
  public:
    using json = nlohmann::json;
    using Record = assignment::AssignmentRecord;

  private:
    std::filesystem::path path_;

  public:
    explicit AssignmentStore(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// All stored records; a missing file is an empty store
    ///
    /// @throws StoreError on unreadable or malformed content
    [[nodiscard]] std::vector<Record> load() const {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            if (ec) {
                throw StoreError("Cannot access " + path_.string() + ": " + ec.message());
            }
            return {};
        }

        std::ifstream file(path_);
        if (!file) {
            throw StoreError("Cannot open assignment store: " + path_.string());
        }

        try {
            json root;
            file >> root;

            std::vector<Record> records;
            for (const auto& entry : root.at("assignments")) {
                records.push_back(from_json(entry));
            }
            return records;
        } catch (const json::exception& e) {
            throw StoreError("Malformed assignment store " + path_.string() + ": " + e.what());
        }
    }

    /// Records of one fiscal year
    [[nodiscard]] std::vector<Record> for_fiscal_year(int fiscal_year) const {
        std::vector<Record> selected;
        for (auto& record : load()) {
            if (record.fiscal_year == fiscal_year)
                selected.push_back(std::move(record));
        }
        return selected;
    }

    /// Drop every record of the fiscal year, store the given ones; returns how many were saved
    ///
    /// @throws StoreError if a record belongs to another year or the file cannot be written
    std::size_t replace_fiscal_year(int fiscal_year, const std::vector<Record>& records) {
        for (const auto& record : records) {
            if (record.fiscal_year != fiscal_year) {
                throw StoreError("Record of resident " + std::to_string(record.resident_id) +
                                 " belongs to fiscal year " + std::to_string(record.fiscal_year) +
                                 ", not " + std::to_string(fiscal_year));
            }
        }

        auto stored = load();
        const auto removed = std::erase_if(
            stored, [fiscal_year](const Record& r) { return r.fiscal_year == fiscal_year; });
        stored.insert(stored.end(), records.begin(), records.end());

        write(stored);

        utils::logger()->info("Saved {} assignments for fiscal year {} to {} (replaced {})",
                              records.size(), fiscal_year, path_.string(), removed);
        return records.size();
    }

    static json to_json(const Record& record) {
        json entry;
        entry["resident_id"] = record.resident_id;
        entry["hospital_id"] = record.hospital_id;
        entry["fiscal_year"] = record.fiscal_year;
        entry["start_date"] = assignment::format_date(record.start_date);
        entry["end_date"] = assignment::format_date(record.end_date);
        entry["mismatch"] = record.mismatch;
        entry["mismatch_reason"] =
            record.mismatch ? json(record.mismatch_reason) : json(nullptr);
        entry["fitness_score"] = record.fitness_score;
        entry["hope_rank"] = record.hope_rank ? json(*record.hope_rank) : json(nullptr);
        entry["commute_minutes"] =
            record.commute_minutes ? json(*record.commute_minutes) : json(nullptr);
        return entry;
    }

    /// @throws StoreError on invalid dates; json::exception on missing fields
    static Record from_json(const json& entry) {
        Record record;
        record.resident_id = entry.at("resident_id").get<int>();
        record.hospital_id = entry.at("hospital_id").get<int>();
        record.fiscal_year = entry.at("fiscal_year").get<int>();

        const auto start = assignment::parse_date(entry.at("start_date").get<std::string>());
        const auto end = assignment::parse_date(entry.at("end_date").get<std::string>());
        if (!start || !end) {
            throw StoreError("Invalid assignment dates for resident " +
                             std::to_string(record.resident_id));
        }
        record.start_date = *start;
        record.end_date = *end;

        record.mismatch = entry.value("mismatch", false);
        if (const auto it = entry.find("mismatch_reason"); it != entry.end() && !it->is_null()) {
            record.mismatch_reason = it->get<std::string>();
        }
        record.fitness_score = entry.value("fitness_score", 0.0);
        if (const auto it = entry.find("hope_rank"); it != entry.end() && !it->is_null()) {
            record.hope_rank = it->get<int>();
        }
        if (const auto it = entry.find("commute_minutes"); it != entry.end() && !it->is_null()) {
            record.commute_minutes = it->get<int>();
        }
        return record;
    }

  private:
    void write(const std::vector<Record>& records) const {
        json root;
        root["assignments"] = json::array();
        for (const auto& record : records) {
            root["assignments"].push_back(to_json(record));
        }

        auto tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::trunc);
            if (!file) {
                throw StoreError("Cannot write assignment store: " + tmp.string());
            }
            file << root.dump(2) << '\n';
            if (!file) {
                throw StoreError("Write failed for assignment store: " + tmp.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path_, ec);
        if (ec) {
            throw StoreError("Cannot replace " + path_.string() + ": " + ec.message());
        }
    }
};

} // namespace medassign::io
