/*
 * File: src/hub_store.hpp
 * Project: Home Hub
 * Purpose: Durable reading store (history + latest-per-key snapshot)
 * Notes:
 *  - save_reading runs on the transport thread, load_current once at boot
 *  - Retention/cleanup is handled outside the hub
 * Last updated: 2026-10-18
 */

#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "atomic_write.hpp"
#include "common/reading.hpp"

class ReadingStore
{
public:
    virtual ~ReadingStore() = default;

    // Throws on I/O failure; callers decide whether that is fatal.
    virtual void save_reading(const Reading &r) = 0;
    virtual std::vector<Reading> load_current() = 0;
};

// ${data_dir}/readings.jsonl  one line per persisted reading
// ${data_dir}/current.json    latest reading per (sensor, property)
class JsonlReadingStore : public ReadingStore
{
    std::filesystem::path root_;
    std::mutex m_;
    std::map<ReadingKey, Reading> current_;

public:
    explicit JsonlReadingStore(std::filesystem::path root) : root_(std::move(root))
    {
        ensure_dir(root_);
    }

    const std::filesystem::path &root() const { return root_; }
    std::filesystem::path history_path() const { return root_ / "readings.jsonl"; }
    std::filesystem::path current_path() const { return root_ / "current.json"; }

    void save_reading(const Reading &r) override
    {
        std::scoped_lock lk(m_);
        append_line(history_path(), reading_to_json(r).dump());
        current_[key_of(r)] = r;

        nlohmann::json snapshot = nlohmann::json::array();
        for (const auto &[key, reading] : current_)
            snapshot.push_back(reading_to_json(reading));
        write_atomic(current_path(), snapshot.dump());
    }

    std::vector<Reading> load_current() override
    {
        std::scoped_lock lk(m_);
        std::vector<Reading> out;
        std::string s;
        if (!read_file_all(current_path(), s) || s.empty())
            return out;

        auto j = nlohmann::json::parse(s, nullptr, false);
        if (j.is_discarded() || !j.is_array())
            throw std::runtime_error("corrupt snapshot: " + current_path().string());

        for (const auto &entry : j)
        {
            Reading r = reading_from_json(entry);
            current_[key_of(r)] = r;
            out.push_back(std::move(r));
        }
        return out;
    }
};
