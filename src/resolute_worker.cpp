// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file resolute_worker.cpp
 * @brief CPU-bound background task run by TaskExecutor in its own process
 *
 * Protocol: progress lines on stdout, errors on stderr, exit 0 on success
 * and non-zero on failure. Takes no arguments.
 *
 * RESOLUTE_WORKER_SCALE (percent, default 100) scales every stage so tests
 * and slow machines can run a shortened task.
 */

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr size_t BASE_PRIME_COUNT = 10000;
constexpr size_t BASE_FILE_CHUNKS = 64;
constexpr size_t FILE_CHUNK_BYTES = 16 * 1024;
constexpr size_t BASE_RECORD_COUNT = 50000;
constexpr size_t BASE_MATRIX_SIZE = 120;
constexpr unsigned FIBONACCI_TERMS = 90;

int g_scale_percent = 100;

/// Line-buffered progress output; the parent reads it through a pipe
void progress(const std::string& line) {
    fprintf(stdout, "%s\n", line.c_str());
    fflush(stdout);
}

size_t scaled(size_t base) {
    return std::max<size_t>(1, base * static_cast<size_t>(g_scale_percent) / 100);
}

// =============================================================================
// Stages
// =============================================================================

bool is_prime(uint64_t n) {
    if (n < 2) {
        return false;
    }
    if (n % 2 == 0) {
        return n == 2;
    }
    for (uint64_t i = 3; i * i <= n; i += 2) {
        if (n % i == 0) {
            return false;
        }
    }
    return true;
}

void generate_primes() {
    const size_t count = scaled(BASE_PRIME_COUNT);
    progress("Stage 1: generating " + std::to_string(count) + " primes");

    std::vector<uint64_t> primes;
    primes.reserve(count);
    for (uint64_t n = 2; primes.size() < count; ++n) {
        if (is_prime(n)) {
            primes.push_back(n);
        }
    }
    progress("Generated " + std::to_string(primes.size()) +
             " primes, largest " + std::to_string(primes.back()));
}

void generate_data_file(std::mt19937& rng) {
    const size_t chunks = scaled(BASE_FILE_CHUNKS);
    fs::path file = fs::temp_directory_path() /
                    ("resolute_worker_" + std::to_string(getpid()) + ".jsonl");
    progress("Stage 2: writing " + std::to_string(chunks) + " chunks to " + file.string());

    {
        std::ofstream out(file, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + file.string());
        }

        std::uniform_int_distribution<int> byte_dist(0, 255);
        std::string payload(FILE_CHUNK_BYTES, '\0');
        for (size_t chunk = 0; chunk < chunks; ++chunk) {
            uint32_t checksum = 0;
            for (char& c : payload) {
                c = static_cast<char>('a' + byte_dist(rng) % 26);
                checksum = checksum * 31 + static_cast<uint8_t>(c);
            }
            json line = {{"chunk", chunk}, {"checksum", checksum}, {"data", payload}};
            out << line.dump() << '\n';
            if (!out) {
                throw std::runtime_error("write failed on " + file.string());
            }
            if ((chunk + 1) % 16 == 0) {
                progress("Written " + std::to_string(chunk + 1) + " of " + std::to_string(chunks) +
                         " chunks");
            }
        }
    }

    auto size = fs::file_size(file);
    std::error_code ec;
    fs::remove(file, ec);
    progress("Data file complete (" + std::to_string(size / 1024) + " KiB), removed");
}

void process_dataset(std::mt19937& rng) {
    const size_t count = scaled(BASE_RECORD_COUNT);
    progress("Stage 3: processing " + std::to_string(count) + " records");

    static const char* const LANGUAGES[] = {"en", "es", "fr", "de", "it"};
    std::uniform_int_distribution<int> age_dist(18, 97);
    std::uniform_real_distribution<double> score_dist(0.0, 100.0);
    std::uniform_int_distribution<int> salary_dist(30000, 130000);
    std::uniform_int_distribution<int> lang_dist(0, 4);

    json records = json::array();
    for (size_t i = 0; i < count; ++i) {
        records.push_back({{"id", i},
                           {"name", "User " + std::to_string(i)},
                           {"age", age_dist(rng)},
                           {"score", score_dist(rng)},
                           {"salary", salary_dist(rng)},
                           {"language", LANGUAGES[lang_dist(rng)]}});
    }

    std::vector<json> sorted(records.begin(), records.end());
    std::sort(sorted.begin(), sorted.end(), [](const json& a, const json& b) {
        return a["score"].get<double>() > b["score"].get<double>();
    });

    size_t high_scorers = static_cast<size_t>(
        std::count_if(sorted.begin(), sorted.end(),
                      [](const json& r) { return r["score"].get<double>() > 80.0; }));

    std::map<std::string, std::pair<double, size_t>> salary_by_language;
    for (const auto& r : sorted) {
        auto& entry = salary_by_language[r["language"].get<std::string>()];
        entry.first += r["salary"].get<double>();
        entry.second++;
    }

    json summary = {{"records", count},
                    {"top_score", sorted.front()["score"]},
                    {"high_scorers", high_scorers}};
    for (const auto& [language, total] : salary_by_language) {
        summary["avg_salary"][language] = std::round(total.first / total.second);
    }
    progress("Dataset summary: " + summary.dump());
}

void multiply_matrices(std::mt19937& rng) {
    const size_t n = std::min<size_t>(scaled(BASE_MATRIX_SIZE), BASE_MATRIX_SIZE * 4);
    progress("Stage 4: multiplying two " + std::to_string(n) + "x" + std::to_string(n) +
             " matrices");

    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    std::vector<double> a(n * n), b(n * n), c(n * n, 0.0);
    for (size_t i = 0; i < n * n; ++i) {
        a[i] = dist(rng);
        b[i] = dist(rng);
    }
    for (size_t i = 0; i < n; ++i) {
        for (size_t k = 0; k < n; ++k) {
            double aik = a[i * n + k];
            for (size_t j = 0; j < n; ++j) {
                c[i * n + j] += aik * b[k * n + j];
            }
        }
    }

    double trace = 0.0;
    for (size_t i = 0; i < n; ++i) {
        trace += c[i * n + i];
    }
    char buf[64];
    snprintf(buf, sizeof(buf), "%.4f", trace);
    progress(std::string("Matrix product trace ") + buf);
}

void fibonacci() {
    progress("Stage 5: Fibonacci numbers");
    uint64_t prev = 0;
    uint64_t cur = 1;
    for (unsigned i = 2; i <= FIBONACCI_TERMS; ++i) {
        uint64_t next = prev + cur;
        prev = cur;
        cur = next;
    }
    progress("F(" + std::to_string(FIBONACCI_TERMS) + ") = " + std::to_string(cur));
}

} // namespace

int main(int /*argc*/, char** /*argv*/) {
    if (const char* scale = getenv("RESOLUTE_WORKER_SCALE")) {
        int value = atoi(scale);
        if (value > 0) {
            g_scale_percent = value;
        }
    }

    auto start = std::chrono::steady_clock::now();
    progress("Starting background task");

    try {
        std::mt19937 rng(std::random_device{}());
        generate_primes();
        generate_data_file(rng);
        process_dataset(rng);
        multiply_matrices(rng);
        fibonacci();
    } catch (const std::exception& e) {
        fprintf(stderr, "Background task failed: %s\n", e.what());
        return 1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();
    char buf[64];
    snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(elapsed) / 1000.0);
    progress(std::string("Background task completed in ") + buf + " seconds");
    return 0;
}
