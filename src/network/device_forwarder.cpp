#include "network/device_forwarder.hpp"

#include <array>
#include <memory>
#include <tl/expected.hpp>

#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "network/error_context.hpp"
#include "network/gvcp_packet.hpp"
#include "network/response_listener.hpp"

namespace gvrelay::network {

/**
 * @brief One unicast request and the wait for its reply.
 *
 * Kept alive by the handlers pending on the forwarder's io_context. The
 * socket and timer share one strand, so their handlers never run
 * concurrently even with several worker threads.
 */
class DeviceForwarder::ForwardAttempt
    : public std::enable_shared_from_this<ForwardAttempt> {
 public:
  ForwardAttempt(DeviceForwarder& owner, const DeviceEndpoint& device,
                 std::optional<TransactionId> transaction_id)
      : owner_(owner),
        device_(device),
        transaction_id_(transaction_id),
        strand_(net::make_strand(owner.ioc_)),
        socket_(strand_),
        timer_(strand_) {
    owner_.in_flight_.fetch_add(1);
  }

  ~ForwardAttempt() { owner_.in_flight_.fetch_sub(1); }

  ForwardAttempt(const ForwardAttempt&) = delete;
  auto operator=(const ForwardAttempt&) -> ForwardAttempt& = delete;

  /**
   * @brief Sends the request on a socket connected to the device.
   *
   * Connecting lets ICMP errors (port or host unreachable) surface on the
   * pending receive, and limits the reply wait to datagrams from the device.
   */
  auto send(const Bytes& request) -> tl::expected<void, RelayError> {
    boost::system::error_code ec;
    const auto address = net::ip::make_address_v4(device_.ip, ec);
    if (ec) {
      return tl::make_unexpected(
          RelayError{RelayErrorCode::kForwardFailure,
                     "invalid device address: " + ec.message()});
    }
    const udp::endpoint target(address, device_.port);

    socket_.open(udp::v4(), ec);
    if (!ec) {
      socket_.bind(udp::endpoint(udp::v4(), 0), ec);
    }
    if (!ec) {
      socket_.connect(target, ec);
    }
    if (!ec) {
      socket_.send(net::buffer(request), 0, ec);
    }
    if (ec) {
      boost::system::error_code ignored;
      socket_.close(ignored);
      return tl::make_unexpected(
          RelayError{RelayErrorCode::kForwardFailure, ec.message()});
    }
    return {};
  }

  void awaitReply() {
    net::post(strand_, [self = shared_from_this()] { self->startWait(); });
  }

 private:
  void startWait() {
    auto self = shared_from_this();

    timer_.expires_after(owner_.reply_wait_);
    timer_.async_wait([self](const boost::system::error_code& ec) {
      if (!ec) {
        // 等待超时；关闭 socket 以结束挂起的接收
        boost::system::error_code ignored;
        self->socket_.close(ignored);
      }
    });

    do_receive();
  }

  void do_receive() {
    auto self = shared_from_this();
    socket_.async_receive(
        net::buffer(buffer_),
        [self](const boost::system::error_code& ec, const std::size_t bytes) {
          self->handle_reply(ec, bytes);
        });
  }

  void handle_reply(const boost::system::error_code& error,
                    const std::size_t bytes_transferred) {
    if (error) {
      if (ErrorHelper::isUnreachable(error)) {
        const RelayError failure{RelayErrorCode::kForwardFailure,
                                 error.message()};
        owner_.stats_.recordError(failure.code);
        ErrorLogger::logRelayError(
            NetworkContext("forward", device_.toString(), transaction_id_),
            failure);
      } else if (!ErrorHelper::isCancellation(error)) {
        LOG_DEBUG << "No reply from " << device_.toString() << ": "
                  << error.message();
      } else {
        LOG_TRACE << "Reply wait for " << device_.toString() << " ended";
      }
      timer_.cancel();
      boost::system::error_code ignored;
      socket_.close(ignored);
      return;
    }

    Bytes datagram(buffer_.begin(), buffer_.begin() + bytes_transferred);
    if (!gvcp::isDiscoveryReply(datagram)) {
      LOG_DEBUG << "Ignoring " << bytes_transferred << " bytes from "
                << device_.toString() << " while waiting for its reply";
      do_receive();
      return;
    }

    timer_.cancel();
    owner_.stats_.incrementRepliesReceived();
    LOG_DEBUG << "Reply from " << device_.toString() << " ("
              << bytes_transferred << " bytes) for "
              << (transaction_id_
                      ? common::format_transaction_id(*transaction_id_)
                      : std::string("unknown request"));

    // 失败已在 ResponseRelay 中计数并记录
    if (auto delivery = owner_.relay_.relay(datagram); delivery) {
      LOG_INFO << "Relayed reply from " << device_.toString() << " to "
               << delivery->request.requester_ip << ":"
               << delivery->request.requester_port << " via "
               << delivery->request.interface_ip;
    }

    boost::system::error_code ignored;
    socket_.close(ignored);
  }

  DeviceForwarder& owner_;
  const DeviceEndpoint device_;
  const std::optional<TransactionId> transaction_id_;
  net::strand<net::io_context::executor_type> strand_;
  udp::socket socket_;
  net::steady_timer timer_;
  std::array<std::uint8_t, constants::kReceiveBufferSize> buffer_{};
};

DeviceForwarder::DeviceForwarder(std::vector<DeviceEndpoint> devices,
                                 ResponseRelay& relay, core::RelayStats& stats,
                                 const std::chrono::milliseconds reply_wait,
                                 const ForwardMode mode)
    : devices_(std::move(devices)),
      relay_(relay),
      stats_(stats),
      reply_wait_(reply_wait),
      mode_(mode) {}

DeviceForwarder::~DeviceForwarder() { stop(); }

void DeviceForwarder::start(std::size_t threads) {
  if (!threads_.empty()) {
    return;
  }
  if (threads == 0) {
    threads = 1;
  }

  ioc_.restart();
  work_guard_.emplace(net::make_work_guard(ioc_));
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back([this] {
      try {
        ioc_.run();
      } catch (const std::exception& e) {
        LOG_ERROR << "Device forwarder worker stopped unexpectedly: "
                  << e.what();
      }
    });
  }
  LOG_DEBUG << "Device forwarder started with " << threads
            << " worker thread(s), reply wait " << reply_wait_.count()
            << "ms";
}

void DeviceForwarder::stop() {
  work_guard_.reset();
  ioc_.stop();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

void DeviceForwarder::setSharedSender(ResponseListener* listener) {
  shared_sender_.store(listener);
}

auto DeviceForwarder::forward(const Bytes& request) -> ForwardReport {
  ForwardReport report;

  if (mode_ == ForwardMode::kShared && shared_sender_.load() != nullptr) {
    forwardShared(request, report);
    return report;
  }

  std::optional<TransactionId> transaction_id;
  if (auto header = gvcp::parseHeader(request); header) {
    transaction_id = header->transaction_id;
  }
  forwardInline(request, transaction_id, report);
  return report;
}

void DeviceForwarder::forwardShared(const Bytes& request,
                                    ForwardReport& report) {
  auto* sender = shared_sender_.load();
  auto shared_request = std::make_shared<const Bytes>(request);

  for (const auto& device : devices_) {
    boost::system::error_code ec;
    const auto address = net::ip::make_address_v4(device.ip, ec);
    if (ec) {
      ++report.failed;
      stats_.recordError(RelayErrorCode::kForwardFailure);
      continue;
    }
    sender->sendToDevice(shared_request, udp::endpoint(address, device.port));
    ++report.sent;
  }
}

void DeviceForwarder::forwardInline(const Bytes& request,
                                    std::optional<TransactionId> transaction_id,
                                    ForwardReport& report) {
  for (const auto& device : devices_) {
    auto attempt =
        std::make_shared<ForwardAttempt>(*this, device, transaction_id);

    if (auto sent = attempt->send(request); !sent) {
      ++report.failed;
      stats_.recordError(sent.error().code);
      ErrorLogger::logRelayError(
          NetworkContext("forward", device.toString(), transaction_id),
          sent.error());
      continue;
    }

    ++report.sent;
    stats_.incrementUnicastForwards();
    LOG_DEBUG << "Forwarded "
              << (transaction_id
                      ? common::format_transaction_id(*transaction_id)
                      : std::string("request"))
              << " to " << device.toString();

    attempt->awaitReply();
  }
}

}  // namespace gvrelay::network
