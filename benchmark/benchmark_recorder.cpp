// ============================================================================
// BENCHMARK: METRIC RECORDER PERFORMANCE
// ============================================================================
// Performance measurement for metric ingestion and windowed statistics
//
// Scenarios:
// 1. Sequential record (baseline)
// 2. Concurrent producers on distinct metrics (2, 4, 8 threads)
// 3. Concurrent producers on one shared metric
// 4. Stats query latency while producers are running
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <iomanip>
#include <string>
#include <perfwatch/core/metrics/recorder.hpp>

using namespace PerfWatch;

// ============================================================================
// REPORTING HELPERS
// ============================================================================
// Query latencies are summarized with the recorder's own statistics
void print_latency(const std::string& label, const std::vector<double>& latencies_ns) {
    auto stats = MetricRecorder::computeStats(latencies_ns, 0);
    std::cout << label << std::endl;
    if (!stats) {
        std::cout << "  (no samples)" << std::endl;
        return;
    }
    std::cout << std::fixed << std::setprecision(1)
              << "  samples: " << stats->count << std::endl
              << "  mean:    " << stats->mean << " ns (stddev " << stats->stddev << ")" << std::endl
              << "  median:  " << stats->median << " ns" << std::endl
              << "  p95/p99: " << stats->p95 << " / " << stats->p99 << " ns" << std::endl
              << "  range:   " << stats->min << " .. " << stats->max << " ns" << std::endl;
}

void print_header(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_throughput(uint64_t ops, double elapsed_sec) {
    std::cout << "  Total ops:    " << ops << std::endl;
    std::cout << "  Duration:     " << std::fixed << std::setprecision(3) << elapsed_sec << " sec" << std::endl;
    std::cout << "  Throughput:   " << std::setprecision(2)
              << (ops / elapsed_sec) / 1e6 << " M records/sec" << std::endl;
}

// ============================================================================
// TEST 1: SEQUENTIAL RECORD (BASELINE)
// ============================================================================
void test_sequential_record() {
    print_header("TEST 1: SEQUENTIAL RECORD (Single Thread Baseline)");

    MetricRecorder recorder(1000);
    const uint64_t NUM_RECORDS = 1000000;

    auto start = std::chrono::high_resolution_clock::now();
    for (uint64_t i = 0; i < NUM_RECORDS; ++i) {
        recorder.record("bench.sequential", MetricKind::GAUGE, static_cast<double>(i % 100));
    }
    auto end = std::chrono::high_resolution_clock::now();

    double elapsed_sec = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count() / 1e9;
    std::cout << "\nResults:" << std::endl;
    print_throughput(NUM_RECORDS, elapsed_sec);
    std::cout << "  Buffered:     " << recorder.size("bench.sequential") << std::endl;
}

// ============================================================================
// TEST 2: CONCURRENT PRODUCERS
// ============================================================================
void test_concurrent_producers(size_t num_producers, bool shared_metric) {
    print_header(std::string("TEST ") + (shared_metric ? "3" : "2") + ": CONCURRENT PRODUCERS (" +
                 std::to_string(num_producers) + " threads, " +
                 (shared_metric ? "one shared metric" : "distinct metrics") + ")");

    MetricRecorder recorder(1000);
    const uint64_t RECORDS_PER_PRODUCER = 250000;

    auto producer = [&](size_t thread_id) {
        std::string name = shared_metric ? "bench.shared" : "bench.thread_" + std::to_string(thread_id);
        for (uint64_t i = 0; i < RECORDS_PER_PRODUCER; ++i) {
            recorder.record(name, MetricKind::COUNTER, 1.0);
        }
    };

    auto start = std::chrono::high_resolution_clock::now();
    std::vector<std::thread> threads;
    for (size_t i = 0; i < num_producers; ++i) {
        threads.emplace_back(producer, i);
    }
    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    double elapsed_sec = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count() / 1e9;
    std::cout << "\nResults:" << std::endl;
    std::cout << "  Producers:    " << num_producers << std::endl;
    print_throughput(RECORDS_PER_PRODUCER * num_producers, elapsed_sec);
}

// ============================================================================
// TEST 4: STATS LATENCY UNDER LOAD
// ============================================================================
void test_stats_latency() {
    print_header("TEST 4: STATS QUERY LATENCY (4 producers running)");

    MetricRecorder recorder(1000);
    std::atomic<bool> stop{false};

    std::vector<std::thread> producers;
    for (size_t i = 0; i < 4; ++i) {
        producers.emplace_back([&recorder, &stop]() {
            uint64_t i = 0;
            while (!stop.load(std::memory_order_relaxed)) {
                recorder.record("bench.latency", MetricKind::TIMER, static_cast<double>(i++ % 5000));
            }
        });
    }

    // Let the buffer fill before measuring
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const size_t NUM_QUERIES = 10000;
    std::vector<double> latencies;
    latencies.reserve(NUM_QUERIES);
    for (size_t i = 0; i < NUM_QUERIES; ++i) {
        auto start = std::chrono::high_resolution_clock::now();
        auto stats = recorder.stats("bench.latency", 60);
        auto end = std::chrono::high_resolution_clock::now();
        if (stats) {
            latencies.push_back(static_cast<double>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count()));
        }
    }

    stop.store(true);
    for (auto& t : producers) {
        t.join();
    }

    std::cout << "\nQueries answered: " << latencies.size() << " / " << NUM_QUERIES << std::endl;
    print_latency("stats(window=60s) over 1000 buffered samples:", latencies);
}

// ============================================================================
// MAIN
// ============================================================================
int main() {
    std::cout << "\n" << std::string(70, '#') << std::endl;
    std::cout << "# METRIC RECORDER BENCHMARK" << std::endl;
    std::cout << std::string(70, '#') << std::endl;

    test_sequential_record();

    for (size_t producers : {2, 4, 8}) {
        test_concurrent_producers(producers, false);
    }
    test_concurrent_producers(4, true);

    test_stats_latency();

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "BENCHMARK COMPLETE" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    return 0;
}
