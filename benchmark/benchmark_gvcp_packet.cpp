#include <benchmark/benchmark.h>
#include "network/gvcp_packet.hpp"
#include <algorithm>
#include <string>

using namespace gvrelay;
using namespace gvrelay::network;

namespace {

Bytes makeReplyWithIdentity() {
    Bytes payload(gvcp::kDiscoveryAckPayloadSize, 0);
    const std::string manufacturer = "Acme Vision";
    const std::string model = "GV-1200";
    std::copy(manufacturer.begin(), manufacturer.end(), payload.begin() + 0x48);
    std::copy(model.begin(), model.end(), payload.begin() + 0x68);
    return gvcp::makeDiscoveryReply(0x1234, payload);
}

}  // namespace

// 每个数据报都要经过的头部解析
static void BM_ParseHeader(benchmark::State& state) {
    const auto request = gvcp::makeDiscoveryRequest(0x1234);
    for (auto _ : state) {
        auto header = gvcp::parseHeader(request);
        benchmark::DoNotOptimize(header);
    }
    state.SetBytesProcessed(state.iterations() * request.size());
}
BENCHMARK(BM_ParseHeader);

static void BM_ClassifyDatagram(benchmark::State& state) {
    const auto reply = makeReplyWithIdentity();
    for (auto _ : state) {
        benchmark::DoNotOptimize(gvcp::isDiscoveryRequest(reply));
        benchmark::DoNotOptimize(gvcp::isDiscoveryReply(reply));
    }
}
BENCHMARK(BM_ClassifyDatagram);

static void BM_MakeDiscoveryRequest(benchmark::State& state) {
    TransactionId id = 0;
    for (auto _ : state) {
        auto request = gvcp::makeDiscoveryRequest(id++);
        benchmark::DoNotOptimize(request);
    }
}
BENCHMARK(BM_MakeDiscoveryRequest);

// 调试日志中使用的设备信息解码
static void BM_ParseDeviceInfo(benchmark::State& state) {
    const auto reply = makeReplyWithIdentity();
    for (auto _ : state) {
        auto info = gvcp::parseDeviceInfo(reply);
        benchmark::DoNotOptimize(info);
    }
}
BENCHMARK(BM_ParseDeviceInfo);

BENCHMARK_MAIN();
