#include "codec/codec.hpp"
#include "log/logger.hpp"
#include "record/record.hpp"
#include "storage/memory_store.hpp"
#include "storage/write_batch.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fmt/core.h>
#include <iostream>
#include <sys/resource.h>
#include <tuple>
#include <vector>

namespace {
    using namespace orderkv;

    // (tenant, timestamp, name) keyed event used by every workload
    struct Event : record::Record<Event> {
        using Key = std::tuple<uint32_t, int64_t, codec::Greedy<std::string>>;

        uint32_t tenant = 0;
        int64_t timestamp = 0;
        std::string name;
        std::string payload;

        auto try_encode(Key &key, core::Bytes &value) const -> core::Status {
            key = Key{tenant, timestamp, codec::Greedy<std::string>(name)};
            value = payload;
            return core::Status::Ok();
        }

        static auto try_decode(const Key &key, core::BytesView value, Event &out)
            -> core::Status {
            out.tenant = std::get<0>(key);
            out.timestamp = std::get<1>(key);
            out.name = std::get<2>(key).value;
            out.payload.assign(value);
            return core::Status::Ok();
        }
    };

    struct BenchmarkResult {
        std::string name;
        uint64_t ops_total;
        double duration_ms;
        double throughput_ops_sec;
        double avg_latency_us;
        uint64_t peak_rss_bytes;

        auto get_throughput_str() const -> std::string {
            if (throughput_ops_sec >= 1e6) {
                return fmt::format("{:.2f}M", throughput_ops_sec / 1e6);
            } else if (throughput_ops_sec >= 1e3) {
                return fmt::format("{:.2f}K", throughput_ops_sec / 1e3);
            }
            return fmt::format("{:.0f}", throughput_ops_sec);
        }
    };

    auto get_memory_usage() -> uint64_t {
        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) == 0) {
            return static_cast<uint64_t>(usage.ru_maxrss) * 1024; // Linux: ru_maxrss in KB
        }
        return 0;
    }

    auto format_bytes(uint64_t bytes) -> std::string {
        if (bytes >= 1024 * 1024) {
            return fmt::format("{:.2f} MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
        } else if (bytes >= 1024) {
            return fmt::format("{:.2f} KB", static_cast<double>(bytes) / 1024.0);
        }
        return fmt::format("{} B", bytes);
    }

    auto make_event(uint64_t i) -> Event {
        Event e;
        e.tenant = static_cast<uint32_t>(i % 16);
        e.timestamp = static_cast<int64_t>(i) - 50000;
        e.name = fmt::format("evt_{:08d}", i);
        e.payload = fmt::format("payload_{}_xxxxxxxxxxxxxxxx", i);
        return e;
    }

    template <typename Func>
    auto measure_operation(std::string name, uint64_t iterations, Func &&op) -> BenchmarkResult {
        storage::MemoryStore store;

        const uint64_t peak_rss_before = get_memory_usage();
        const auto start = std::chrono::high_resolution_clock::now();

        op(store, iterations);

        const auto end = std::chrono::high_resolution_clock::now();
        const uint64_t peak_rss_after = get_memory_usage();

        const double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
        const double ops = static_cast<double>(iterations);

        return BenchmarkResult{
            .name = std::move(name),
            .ops_total = iterations,
            .duration_ms = duration_ms,
            .throughput_ops_sec = (ops / duration_ms) * 1000.0,
            .avg_latency_us = (duration_ms * 1000.0) / ops,
            .peak_rss_bytes = peak_rss_after > peak_rss_before ? peak_rss_after - peak_rss_before
                                                               : 0};
    }

    auto benchmark_key_encode() -> BenchmarkResult {
        return measure_operation("Key Encode (tuple)", 500000,
                                 [](storage::MemoryStore &, uint64_t n) {
                                     size_t total = 0;
                                     for (uint64_t i = 0; i < n; i++) {
                                         Event::Key key{static_cast<uint32_t>(i), -1,
                                                        codec::Greedy<std::string>("evt")};
                                         total += codec::encode_key(key).size();
                                     }
                                     if (total == 0) {
                                         LOG_WARN("Encoded nothing");
                                     }
                                 });
    }

    auto benchmark_persist() -> BenchmarkResult {
        return measure_operation("Persist", 100000, [](storage::MemoryStore &store, uint64_t n) {
            for (uint64_t i = 0; i < n; i++) {
                auto err = make_event(i).persist(store);
                if (!err.ok()) {
                    LOG_ERROR("persist failed: {}", err.to_string());
                    return;
                }
            }
        });
    }

    auto benchmark_batch_persist() -> BenchmarkResult {
        return measure_operation("Persist (1000-op batches)", 100000,
                                 [](storage::MemoryStore &store, uint64_t n) {
                                     storage::WriteBatch batch(store);
                                     for (uint64_t i = 0; i < n; i++) {
                                         (void)make_event(i).persist(batch);
                                         if (batch.pending() >= 1000) {
                                             auto status = batch.commit();
                                             if (!status.ok()) {
                                                 LOG_ERROR("commit failed: {}", status.to_string());
                                                 return;
                                             }
                                         }
                                     }
                                     (void)batch.commit();
                                 });
    }

    auto benchmark_fetch() -> BenchmarkResult {
        return measure_operation("Fetch (hit)", 100000, [](storage::MemoryStore &store, uint64_t n) {
            for (uint64_t i = 0; i < n; i++) {
                (void)make_event(i).persist(store);
            }

            uint64_t hits = 0;
            for (uint64_t i = 0; i < n; i++) {
                auto e = make_event(i);
                auto result = Event::fetch(store, Event::Key{e.tenant, e.timestamp, e.name});
                if (result.ok() && result.has_record())
                    hits++;
            }
            if (hits != n) {
                LOG_WARN("Fetch hits: {} != expected {}", hits, n);
            }
        });
    }

    auto benchmark_prefix_scan() -> BenchmarkResult {
        return measure_operation(
            "Prefix Scan (per tenant)", 100000, [](storage::MemoryStore &store, uint64_t n) {
                for (uint64_t i = 0; i < n; i++) {
                    (void)make_event(i).persist(store);
                }

                uint64_t seen = 0;
                for (uint32_t tenant = 0; tenant < 16; ++tenant) {
                    auto cursor = Event::scan_prefix(store, tenant);
                    while (auto item = cursor.next()) {
                        if (item->ok())
                            seen++;
                    }
                }
                if (seen != n) {
                    LOG_WARN("Prefix scan saw {} != expected {}", seen, n);
                }
            });
    }

    auto benchmark_range_scan() -> BenchmarkResult {
        return measure_operation(
            "Range Scan (tenant, time window)", 100000,
            [](storage::MemoryStore &store, uint64_t n) {
                for (uint64_t i = 0; i < n; i++) {
                    (void)make_event(i).persist(store);
                }

                using Window = std::tuple<uint32_t, int64_t>;
                uint64_t seen = 0;
                for (uint32_t tenant = 0; tenant < 16; ++tenant) {
                    auto cursor = Event::scan_range(
                        store, scan::KeyRange<Window>::closed({tenant, -1000}, {tenant, 1000}));
                    seen += cursor.collect().size();
                }
                LOG_DEBUG("Range scan saw {} events", seen);
            });
    }

} // namespace

auto main() -> int {
    using namespace orderkv;

    log::LogConfig config;
    config.level = log::Level::Warn; // Quiet during benchmarks
    config.console_output = false;
    log::Logger::instance().init(log::config_from_env(config));

    std::cout << "\norderkv benchmark suite\n\n";

    std::vector<BenchmarkResult> results;

    std::cout << "[1/6] Running: Key Encode...\n" << std::flush;
    results.push_back(benchmark_key_encode());

    std::cout << "[2/6] Running: Persist...\n" << std::flush;
    results.push_back(benchmark_persist());

    std::cout << "[3/6] Running: Batched Persist...\n" << std::flush;
    results.push_back(benchmark_batch_persist());

    std::cout << "[4/6] Running: Fetch...\n" << std::flush;
    results.push_back(benchmark_fetch());

    std::cout << "[5/6] Running: Prefix Scan...\n" << std::flush;
    results.push_back(benchmark_prefix_scan());

    std::cout << "[6/6] Running: Range Scan...\n" << std::flush;
    results.push_back(benchmark_range_scan());

    std::cout << "\n" << std::string(98, '.') << "\n";
    std::cout << fmt::format("│ {:<35} │ {:>10} │ {:>12} │ {:>12} │ {:>10} │\n", "Benchmark",
                             "Ops/sec", "Avg Latency", "Time (ms)", "RAM Delta");
    std::cout << std::string(98, '.') << "\n";

    for (const auto &result : results) {
        std::cout << fmt::format("│ {:<35} │ {:>10} │ {:>10.2f} μs │ {:>10.2f} │ {:>10} │\n",
                                 result.name.substr(0, 35), result.get_throughput_str(),
                                 result.avg_latency_us, result.duration_ms,
                                 format_bytes(result.peak_rss_bytes));
    }

    std::cout << std::string(98, '.') << "\n\n";

    log::Logger::instance().shutdown();
    return 0;
}
