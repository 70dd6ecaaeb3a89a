#include "relay_server.hpp"

#include <algorithm>
#include <iterator>
#include <set>

#include "common/logging.hpp"
#include "network/device_forwarder.hpp"
#include "network/interface_listener.hpp"
#include "network/response_listener.hpp"
#include "network/response_relay.hpp"

namespace gvrelay::server {

RelayServer::RelayServer(RelayOptions options)
    : options_(std::move(options)), table_(options_.request_ttl) {
  relay_ = std::make_unique<network::ResponseRelay>(table_, stats_);
  forwarder_ = std::make_unique<network::DeviceForwarder>(
      options_.devices, *relay_, stats_, options_.forward_wait,
      options_.forward_mode);
}

RelayServer::~RelayServer() { stop(); }

auto RelayServer::selectInterfaces() const
    -> tl::expected<std::vector<network::NetworkInterface>, RelayError> {
  std::vector<network::NetworkInterface> selected;

  // 显式配置的接口地址
  if (!options_.interfaces.empty()) {
    for (const auto& address : options_.interfaces) {
      auto found = network::InterfaceEnumerator::findByAddress(address);
      if (found) {
        selected.push_back(*found);
      } else {
        LOG_WARNING << "Interface address " << address
                    << " is not assigned to any local interface";
        selected.push_back(network::NetworkInterface{"", address, "", ""});
      }
    }
    return selected;
  }

  auto detected = network::InterfaceEnumerator::list();
  if (!detected) {
    return tl::make_unexpected(detected.error());
  }

  if (options_.interface_selection == InterfaceSelection::kAll) {
    selected = std::move(*detected);
  } else {
    std::set<IpAddress> routed;
    for (const auto& device : options_.devices) {
      if (auto source = network::InterfaceEnumerator::sourceAddressFor(device.ip);
          source) {
        LOG_INFO << "Device " << device.toString() << " is reached via "
                 << *source;
        routed.insert(*source);
      } else {
        LOG_WARNING << source.error().message;
      }
    }
    std::copy_if(detected->begin(), detected->end(),
                 std::back_inserter(selected),
                 [&routed](const network::NetworkInterface& iface) {
                   return routed.count(iface.address) > 0;
                 });
  }

  if (selected.empty()) {
    return tl::make_unexpected(
        RelayError{RelayErrorCode::kConfiguration,
                   "no usable network interfaces found"});
  }
  return selected;
}

auto RelayServer::start() -> tl::expected<void, RelayError> {
  if (running_) {
    return {};
  }

  auto interfaces = selectInterfaces();
  if (!interfaces) {
    return tl::make_unexpected(interfaces.error());
  }

  LOG_INFO << "Relaying discovery to " << options_.devices.size()
           << " device(s):";
  for (const auto& device : options_.devices) {
    LOG_INFO << "  " << device.toString();
  }

  for (const auto& iface : *interfaces) {
    auto listener = std::make_unique<network::InterfaceListener>(
        iface.address, iface.name, options_.listen_port, options_.bind_mode,
        table_, *forwarder_, stats_);
    // 绑定失败已在监听器内计数并记录，只禁用该接口
    if (listener->bind()) {
      listeners_.push_back(std::move(listener));
    }
  }

  if (listeners_.empty()) {
    return tl::make_unexpected(RelayError{
        RelayErrorCode::kConfiguration,
        "could not bind the discovery port on any interface"});
  }

  forwarder_->start(constants::kForwarderThreadCount);
  if (options_.response_listener_enabled) {
    startResponseListener();
  }

  for (auto& listener : listeners_) {
    listener->start();
  }

  housekeeping_ioc_ = std::make_unique<net::io_context>();
  sweep_timer_ = std::make_unique<net::steady_timer>(*housekeeping_ioc_);
  stats_timer_ = std::make_unique<net::steady_timer>(*housekeeping_ioc_);
  scheduleSweep();
  scheduleStats();
  housekeeping_thread_ = std::thread([this] {
    try {
      housekeeping_ioc_->run();
    } catch (const std::exception& e) {
      LOG_ERROR << "Housekeeping stopped unexpectedly: " << e.what();
    }
  });

  running_ = true;
  LOG_INFO << "Relay started on " << listeners_.size()
           << " interface(s), port " << options_.listen_port
           << ", bind mode " << toString(options_.bind_mode)
           << ", forward mode " << toString(options_.forward_mode)
           << ", TTL " << options_.request_ttl.count() << "ms";
  return {};
}

void RelayServer::startResponseListener() {
  response_listener_ = std::make_unique<network::ResponseListener>(
      options_.devices, *relay_, stats_);

  auto bound = response_listener_->bind("0.0.0.0", options_.response_port);
  if (!bound) {
    stats_.recordError(bound.error().code);
    LOG_ERROR << bound.error().message;
    response_listener_.reset();
    if (options_.forward_mode == network::ForwardMode::kShared) {
      LOG_WARNING << "Falling back to inline forwarding";
    }
    return;
  }

  response_listener_->start();
  if (options_.forward_mode == network::ForwardMode::kShared) {
    forwarder_->setSharedSender(response_listener_.get());
  }
}

void RelayServer::stop() {
  const bool was_running = running_.exchange(false);

  for (auto& listener : listeners_) {
    listener->stop();
  }

  if (forwarder_) {
    forwarder_->setSharedSender(nullptr);
    forwarder_->stop();
  }
  if (response_listener_) {
    response_listener_->stop();
  }

  if (housekeeping_ioc_) {
    housekeeping_ioc_->stop();
  }
  if (housekeeping_thread_.joinable()) {
    housekeeping_thread_.join();
  }

  if (was_running) {
    LOG_INFO << "Relay stopped. " << snapshot().summary();
  }
}

auto RelayServer::snapshot() const -> core::RelayStatsSnapshot {
  return stats_.snapshot(table_.size());
}

auto RelayServer::boundInterfaces() const -> std::vector<IpAddress> {
  std::vector<IpAddress> addresses;
  addresses.reserve(listeners_.size());
  for (const auto& listener : listeners_) {
    addresses.push_back(listener->interfaceIp());
  }
  return addresses;
}

auto RelayServer::responseListenerEndpoint() const
    -> std::optional<net::ip::udp::endpoint> {
  if (!response_listener_) {
    return std::nullopt;
  }
  return response_listener_->localEndpoint();
}

void RelayServer::scheduleSweep() {
  sweep_timer_->expires_after(options_.sweep_interval);
  sweep_timer_->async_wait([this](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    const auto removed = table_.sweep(SteadyClock::now());
    if (removed > 0) {
      stats_.addExpiredRequests(removed);
      LOG_DEBUG << "Expired " << removed << " pending request(s)";
    }
    scheduleSweep();
  });
}

void RelayServer::scheduleStats() {
  stats_timer_->expires_after(options_.stats_interval);
  stats_timer_->async_wait([this](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    LOG_INFO << "Stats: " << snapshot().summary();
    scheduleStats();
  });
}

}  // namespace gvrelay::server
