#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace dagcbor::benchmarks {

// 一项基准的统计结果（耗时单位 ms）。
struct Sample {
    std::string name;
    std::size_t bytes{0};
    int runs{0};
    double min_ms{0.0};
    double median_ms{0.0};
    double mean_ms{0.0};
};

class Suite {
public:
    /**
     * @brief 先预热一次，再计时 runs 次。
     *
     * fn 返回本次处理的字节数（编码输出长度或解码输入长度），用于计算吞吐。
     */
    template <typename Fn>
    void measure(std::string name, int runs, Fn &&fn) {
        Sample sample;
        sample.name = std::move(name);
        sample.runs = runs;
        sample.bytes = fn();

        std::vector<double> timings;
        timings.reserve(static_cast<std::size_t>(runs));
        for (int i = 0; i < runs; ++i) {
            const auto begin = std::chrono::steady_clock::now();
            sample.bytes = fn();
            const auto end = std::chrono::steady_clock::now();
            timings.push_back(std::chrono::duration<double, std::milli>(end - begin).count());
        }
        if (!timings.empty()) {
            std::sort(timings.begin(), timings.end());
            sample.min_ms = timings.front();
            sample.median_ms = timings[timings.size() / 2];
            double total = 0.0;
            for (double t : timings) {
                total += t;
            }
            sample.mean_ms = total / static_cast<double>(timings.size());
        }
        samples_.push_back(std::move(sample));
    }

    void report() const {
        std::printf("\n%-48s %12s %5s %10s %10s %10s %10s\n", "benchmark", "bytes", "runs", "min ms",
                    "median ms", "mean ms", "MiB/s");
        for (const auto &s : samples_) {
            // 吞吐按中位数计算。
            const double mib = static_cast<double>(s.bytes) / (1024.0 * 1024.0);
            const double rate = s.median_ms > 0.0 ? mib / (s.median_ms / 1000.0) : 0.0;
            std::printf("%-48s %12zu %5d %10.3f %10.3f %10.3f %10.1f\n", s.name.c_str(), s.bytes, s.runs,
                        s.min_ms, s.median_ms, s.mean_ms, rate);
        }
        std::printf("\n");
    }

private:
    std::vector<Sample> samples_;
};

} // namespace dagcbor::benchmarks
