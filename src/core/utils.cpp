#include "gas_deblend/core/utils.hpp"
#include "gas_deblend/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <ctime>
#include <exception>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>

#include <openssl/sha.h>

namespace gas_deblend::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_file(const fs::path& path) {
    auto data = read_bytes(path);
    return sha256_bytes(data);
}

float compute_median(std::vector<float> values) {
    if (values.empty()) return 0.0f;

    std::sort(values.begin(), values.end());
    size_t n = values.size();
    if (n % 2 == 0) {
        return (values[n/2 - 1] + values[n/2]) / 2.0f;
    } else {
        return values[n/2];
    }
}

float compute_mad(const std::vector<float>& values) {
    float median = compute_median(values);

    std::vector<float> deviations(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        deviations[i] = std::abs(values[i] - median);
    }

    return compute_median(std::move(deviations));
}

float compute_robust_sigma(const std::vector<float>& values) {
    return 1.4826f * compute_mad(values);
}

IndexRange clip_box(int center, int half, int extent) {
    IndexRange r;
    r.begin = std::max(0, center - half);
    r.end = std::min(extent, center + half + 1);
    if (r.end < r.begin) r.end = r.begin;
    return r;
}

int resolve_workers(int requested) {
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores < 1) cpu_cores = 1;
    int workers = std::min(requested, cpu_cores);
    return std::max(1, workers);
}

void parallel_for(size_t n, int workers, const std::function<void(size_t)>& fn) {
    if (n == 0) return;
    workers = std::min<int>(std::max(1, workers), static_cast<int>(std::min<size_t>(n, 1024)));

    if (workers <= 1) {
        for (size_t i = 0; i < n; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(workers));
    for (int w = 0; w < workers; ++w) {
        pool.emplace_back([&]() {
            while (!failed.load()) {
                size_t i = next.fetch_add(1);
                if (i >= n)
                    break;
                try {
                    fn(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    failed.store(true);
                }
            }
        });
    }

    for (auto& worker : pool) {
        worker.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

} // namespace gas_deblend::core
