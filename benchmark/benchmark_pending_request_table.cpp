#include <benchmark/benchmark.h>
#include "core/pending_request_table.hpp"
#include <chrono>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace gvrelay;
using namespace gvrelay::core;

class PendingRequestTableBenchmark : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        table_ = std::make_unique<PendingRequestTable>(std::chrono::seconds(5));

        // 预生成请求方地址
        generateRequesters(256);
    }

    void TearDown(const ::benchmark::State& state) override {
        table_.reset();
    }

protected:
    std::unique_ptr<PendingRequestTable> table_;
    std::vector<std::string> requesters_;

    void generateRequesters(size_t count) {
        requesters_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            requesters_.push_back("192.168." + std::to_string(i / 250) + "." +
                                  std::to_string(i % 250 + 1));
        }
    }
};

// 记录请求
BENCHMARK_DEFINE_F(PendingRequestTableBenchmark, Record)(benchmark::State& state) {
    TransactionId id = 0;
    for (auto _ : state) {
        const auto& requester = requesters_[id % requesters_.size()];
        benchmark::DoNotOptimize(table_->record(id, requester, 50000, "192.168.1.1"));
        ++id;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(PendingRequestTableBenchmark, Record);

// 记录后立即解析，模拟一次完整的发现往返
BENCHMARK_DEFINE_F(PendingRequestTableBenchmark, RecordThenResolve)(benchmark::State& state) {
    TransactionId id = 0;
    for (auto _ : state) {
        table_->record(id, requesters_[id % requesters_.size()], 50000, "192.168.1.1");
        auto resolved = table_->resolve(id);
        benchmark::DoNotOptimize(resolved);
        ++id;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(PendingRequestTableBenchmark, RecordThenResolve);

// 清理不同规模的过期表项
BENCHMARK_DEFINE_F(PendingRequestTableBenchmark, Sweep)(benchmark::State& state) {
    const auto entry_count = static_cast<size_t>(state.range(0));
    const auto start = SteadyClock::now();

    for (auto _ : state) {
        state.PauseTiming();
        for (size_t i = 0; i < entry_count; ++i) {
            table_->record(static_cast<TransactionId>(i),
                           requesters_[i % requesters_.size()], 50000,
                           "192.168.1.1", start);
        }
        state.ResumeTiming();

        auto removed = table_->sweep(start + std::chrono::seconds(10));
        benchmark::DoNotOptimize(removed);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK_REGISTER_F(PendingRequestTableBenchmark, Sweep)
    ->RangeMultiplier(4)->Range(16, 16384)->Complexity();

// 多个接口监听线程并发记录，一个线程解析
BENCHMARK_DEFINE_F(PendingRequestTableBenchmark, ConcurrentRecordResolve)(benchmark::State& state) {
    const int writer_count = static_cast<int>(state.range(0));

    for (auto _ : state) {
        std::vector<std::thread> writers;
        writers.reserve(writer_count);
        for (int w = 0; w < writer_count; ++w) {
            writers.emplace_back([this, w]() {
                for (int i = 0; i < 1000; ++i) {
                    const auto id = static_cast<TransactionId>(w * 1000 + i);
                    table_->record(id, requesters_[i % requesters_.size()],
                                   50000, "192.168.1.1");
                }
            });
        }

        std::thread resolver([this, writer_count]() {
            for (int i = 0; i < writer_count * 1000; ++i) {
                auto resolved = table_->resolve(static_cast<TransactionId>(i));
                benchmark::DoNotOptimize(resolved);
            }
        });

        for (auto& writer : writers) {
            writer.join();
        }
        resolver.join();
    }
    state.SetItemsProcessed(state.iterations() * writer_count * 1000);
}
BENCHMARK_REGISTER_F(PendingRequestTableBenchmark, ConcurrentRecordResolve)
    ->Arg(1)->Arg(2)->Arg(4)->Arg(8)
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK_MAIN();
