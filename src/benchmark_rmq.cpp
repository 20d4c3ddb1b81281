#include "data_io.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "structures/factory.h"
#include "utils/sort_utils.h"
#include "utils/thread_pool.h"
#include "utils/timing_utils.h"

namespace fs = std::filesystem;

struct BenchmarkConfig {
    fs::path data_dir;
    size_t num_runs = 5;
    size_t num_queries = 500;
    size_t num_updates = 500;
    std::chrono::seconds timeout{120};
    uint32_t seed = 42;
    std::string value_column = "value";
};

enum class Metric { BUILD, QUERY, UPDATE };

static const char *metric_name(Metric m) {
    switch (m) {
        case Metric::BUILD: return "build";
        case Metric::QUERY: return "query";
        case Metric::UPDATE: return "update";
    }
    return "?";
}

class Benchmark {
public:
    explicit Benchmark(BenchmarkConfig config) : config(std::move(config)), rng(this->config.seed) {}

    void run_benchmarks() {
        auto datasets = list_datasets(config.data_dir);
        const auto &types = all_structure_types();

        std::cout << "=== RMQ Benchmark Suite ===\n";
        std::cout << "(" << types.size() << " structures x " << datasets.size() << " datasets x "
                  << config.num_runs << " runs)\n\n";

        for (const auto &[n, path] : datasets) {
            auto data = std::make_shared<const std::vector<double>>(
                numeric_sequence(read_column_csv(path, config.value_column)));

            std::cout << "---------------------------------------------------------------------------------\n";
            std::cout << "Dataset " << path.filename().string() << " (N=" << data->size() << ")\n";

            for (StructureType type : types) {
                auto build = measure(type, Metric::BUILD, data);
                auto query = measure(type, Metric::QUERY, data);
                auto update = measure(type, Metric::UPDATE, data);
                print_summary(type, build, query, update);
            }
        }
        std::cout << "\n=== Benchmark Complete ===\n";
    }

private:
    BenchmarkConfig config;
    ThreadPool pool;
    std::mt19937 rng;
    std::map<Metric, std::set<StructureType>> skipped;

    // Seconds spent constructing one structure
    static double run_build(StructureType type, const std::vector<double> &data) {
        double seconds = 0.0;
        {
            ScopedOperationTimer timer(seconds);
            auto rmq = create_structure(type, data);
        }
        return seconds;
    }

    // Mean seconds per query over random inclusive ranges
    static double run_queries(StructureType type, const std::vector<double> &data,
                              const std::vector<std::pair<int64_t, int64_t>> &queries) {
        auto rmq = create_structure(type, data);
        double checksum = 0.0;
        double seconds = 0.0;
        {
            ScopedOperationTimer timer(seconds);
            for (const auto &[l, r] : queries) checksum += rmq->query(l, r);
        }
        // keeps the loop from being optimised away
        if (std::isnan(checksum)) std::cerr << "Warning: NaN in query results\n";
        return seconds / static_cast<double>(queries.size());
    }

    // Mean seconds per point update
    static double run_updates(StructureType type, const std::vector<double> &data,
                              const std::vector<std::pair<int64_t, double>> &updates) {
        auto rmq = create_structure(type, data);
        double seconds = 0.0;
        {
            ScopedOperationTimer timer(seconds);
            for (const auto &[i, v] : updates) rmq->update(i, v);
        }
        return seconds / static_cast<double>(updates.size());
    }

    std::function<double()> make_task(StructureType type, Metric metric,
                                      const std::shared_ptr<const std::vector<double>> &data) {
        const auto n = static_cast<int64_t>(data->size());
        std::uniform_int_distribution<int64_t> index_dist(0, n - 1);

        switch (metric) {
            case Metric::BUILD:
                return [type, data] { return run_build(type, *data); };
            case Metric::QUERY: {
                std::vector<std::pair<int64_t, int64_t>> queries;
                queries.reserve(config.num_queries);
                for (size_t q = 0; q < config.num_queries; ++q) {
                    int64_t a = index_dist(rng);
                    int64_t b = index_dist(rng);
                    queries.emplace_back(std::min(a, b), std::max(a, b));
                }
                return [type, data, queries = std::move(queries)] { return run_queries(type, *data, queries); };
            }
            case Metric::UPDATE: {
                std::uniform_real_distribution<double> value_dist(-1000.0, 1000.0);
                std::vector<std::pair<int64_t, double>> updates;
                updates.reserve(config.num_updates);
                for (size_t u = 0; u < config.num_updates; ++u)
                    updates.emplace_back(index_dist(rng), value_dist(rng));
                return [type, data, updates = std::move(updates)] { return run_updates(type, *data, updates); };
            }
        }
        throw std::invalid_argument("Unsupported metric");
    }

    std::optional<SampleSummary> measure(StructureType type, Metric metric,
                                         const std::shared_ptr<const std::vector<double>> &data) {
        if (skipped[metric].count(type)) return std::nullopt;

        std::vector<double> samples;
        samples.reserve(config.num_runs);
        for (size_t run = 0; run < config.num_runs; ++run) {
            auto result = pool.run_with_timeout(make_task(type, metric, data), config.timeout);
            if (!result) {
                std::cout << structure_name(type) << " (N=" << data->size() << ") " << metric_name(metric)
                          << " exceeded " << config.timeout.count() << "s, skipping this and larger datasets\n";
                skipped[metric].insert(type);

                // the abandoned run would otherwise load the CPU under the next measurement
                std::cout << "Waiting for the abandoned " << structure_name(type) << " run to return...\n";
                pool.drain_abandoned();
                return std::nullopt;
            }
            samples.push_back(*result);
        }
        return SortUtils::summarize(std::move(samples));
    }

    static void print_summary(StructureType type, const std::optional<SampleSummary> &build,
                              const std::optional<SampleSummary> &query,
                              const std::optional<SampleSummary> &update) {
        auto fmt = [](const std::optional<SampleSummary> &s, double scale) {
            if (!s) return std::string("      N/A");
            std::ostringstream os;
            os << std::fixed << std::setprecision(2) << std::setw(9) << s->mean * scale
               << " +- " << std::setw(7) << s->stddev * scale
               << " (p50 " << std::setw(9) << s->median * scale << ")";
            return os.str();
        };

        std::cout << std::left << std::setw(18) << structure_name(type) << std::right
                  << " | Build: " << fmt(build, 1e3) << " ms"
                  << " | Query: " << fmt(query, 1e6) << " us"
                  << " | Update: " << fmt(update, 1e6) << " us\n";
    }
};

static size_t parse_count(const char *arg, const char *what) {
    char *end = nullptr;
    unsigned long long v = std::strtoull(arg, &end, 10);
    if (end == arg || *end != '\0' || v == 0) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + arg);
    }
    return static_cast<size_t>(v);
}

// usage: rmq_benchmark [data_dir] [runs] [queries] [updates] [timeout_s]
int main(int argc, char **argv) {
    try {
        BenchmarkConfig config;
        config.data_dir = argc > 1 ? fs::path(argv[1]) : get_data_path();
        if (argc > 2) config.num_runs = parse_count(argv[2], "run count");
        if (argc > 3) config.num_queries = parse_count(argv[3], "query count");
        if (argc > 4) config.num_updates = parse_count(argv[4], "update count");
        if (argc > 5) config.timeout = std::chrono::seconds(parse_count(argv[5], "timeout"));

        Benchmark benchmark(std::move(config));
        benchmark.run_benchmarks();
    } catch (const RmqError &e) {
        std::cerr << "Structure error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
