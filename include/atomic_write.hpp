/*
 * File: include/atomic_write.hpp
 * Project: Home Hub
 * Purpose: File helpers for the reading store
 * Notes:
 *  - current.json is only ever replaced through write_atomic
 *  - readings.jsonl is append-only
 * Last updated: 2026-10-18
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include <fcntl.h>

inline void ensure_dir(const std::filesystem::path &p)
{
    std::error_code ec;
    if (!std::filesystem::exists(p, ec))
    {
        std::filesystem::create_directories(p, ec);
        if (ec)
            throw std::runtime_error("create_directories failed: " + ec.message());
    }
}

// Atomic file writer: writes to <path>.tmp, fsyncs, then rename() to final.
inline void write_atomic(const std::filesystem::path &final_path, const std::string &data)
{
    std::filesystem::path tmp = final_path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw std::runtime_error("Failed to open temp file: " + tmp.string());
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
            throw std::runtime_error("Failed to write temp file: " + tmp.string());
    }
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd >= 0)
    {
        ::fsync(fd);
        ::close(fd);
    }
    std::error_code ec;
    std::filesystem::rename(tmp, final_path, ec);
    if (ec)
        throw std::runtime_error("rename tmp->dst failed: " + ec.message());
}

inline void append_line(const std::filesystem::path &dst, const std::string &line)
{
    std::ofstream f(dst, std::ios::app);
    if (!f)
        throw std::runtime_error("open for append failed: " + dst.string());
    f << line << '\n';
    if (!f)
        throw std::runtime_error("append failed: " + dst.string());
}

inline bool read_file_all(const std::filesystem::path &p, std::string &out)
{
    std::ifstream f(p);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}
