#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace gas_deblend::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities
float compute_median(std::vector<float> values);
float compute_mad(const std::vector<float>& values);
float compute_robust_sigma(const std::vector<float>& values);

// Half-open index range [begin, end). Empty when begin >= end.
struct IndexRange {
    int begin = 0;
    int end = 0;

    bool empty() const { return begin >= end; }
    int size() const { return empty() ? 0 : end - begin; }
};

// Range [center - half, center + half] clipped to [0, extent). Returns an
// empty range when the box lies entirely outside the array.
IndexRange clip_box(int center, int half, int extent);

// Number of worker threads to use for a requested count.
int resolve_workers(int requested);

// Runs fn(i) for i in [0, n) on up to `workers` threads. Returns after every
// call completed; the first exception thrown by fn is rethrown.
void parallel_for(size_t n, int workers, const std::function<void(size_t)>& fn);

// String utilities
std::string to_lower(const std::string& s);

} // namespace gas_deblend::core
