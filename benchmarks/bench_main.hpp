#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace ebml::benchmarks {

struct BenchmarkResult {
  std::string_view name;
  std::size_t data_size;
  double avg_ms;
  double best_ms;
  double throughput_mbps;
};

class BenchmarkTimer {
 public:
  void start() { start_ = std::chrono::steady_clock::now(); }
  void stop() { end_ = std::chrono::steady_clock::now(); }

  [[nodiscard]] double elapsed_ms() const {
    return std::chrono::duration<double, std::milli>(end_ - start_).count();
  }

 private:
  std::chrono::steady_clock::time_point start_{};
  std::chrono::steady_clock::time_point end_{};
};

inline std::vector<BenchmarkResult>& results() {
  static std::vector<BenchmarkResult> results_;
  return results_;
}

// 吞吐按平均耗时计算；data_size 为 0 时不计算吞吐。
template <typename Func>
inline void run_benchmark(std::string_view name, std::size_t data_size, int iterations, Func&& func) {
  double total_ms = 0.0;
  double best_ms = 0.0;
  for (int i = 0; i < iterations; ++i) {
    BenchmarkTimer timer;
    timer.start();
    func();
    timer.stop();
    const auto t = timer.elapsed_ms();
    total_ms += t;
    best_ms = (i == 0) ? t : std::min(best_ms, t);
  }

  const double avg_ms = iterations > 0 ? total_ms / iterations : 0.0;
  double throughput_mbps = 0.0;
  if (avg_ms > 0.0 && data_size != 0) {
    throughput_mbps = (static_cast<double>(data_size) / (1024.0 * 1024.0)) / (avg_ms / 1000.0);
  }
  results().push_back({name, data_size, avg_ms, best_ms, throughput_mbps});
}

inline std::string format_size(std::size_t n) {
  if (n >= 1024 * 1024) {
    return std::to_string(n / (1024 * 1024)) + " MB";
  }
  if (n >= 1024) {
    return std::to_string(n / 1024) + " KB";
  }
  return std::to_string(n) + " B";
}

inline void print_results() {
  const std::string rule(96, '=');
  std::cout << '\n' << rule << "\nEBML BENCHMARK RESULTS\n" << rule << '\n';
  std::cout << std::left << std::setw(44) << "Benchmark" << std::setw(12) << "Size" << std::setw(12)
            << "Avg (ms)" << std::setw(12) << "Best (ms)" << "Throughput (MB/s)\n";
  std::cout << std::string(96, '-') << '\n';

  for (const auto& r : results()) {
    std::cout << std::left << std::setw(44) << r.name << std::setw(12) << format_size(r.data_size);
    std::cout << std::fixed << std::setprecision(3) << std::setw(12) << r.avg_ms << std::setw(12)
              << r.best_ms;
    if (r.throughput_mbps > 0.0) {
      std::cout << r.throughput_mbps;
    } else {
      std::cout << "N/A";
    }
    std::cout << '\n';
  }
  std::cout << rule << "\n\n";
}

}  // namespace ebml::benchmarks

#define BENCH_RUN(name, size, iterations, ...) \
  ::ebml::benchmarks::run_benchmark(name, size, iterations, [&]() { __VA_ARGS__; })
