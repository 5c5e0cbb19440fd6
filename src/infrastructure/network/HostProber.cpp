#include "infrastructure/network/HostProber.hpp"

#include "core/util/Time.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <semaphore>

namespace rackscan::infra {

namespace {

// Shared between the probing thread and the completion handlers of one host.
struct ProbeBatch {
    explicit ProbeBatch(int concurrency) : slots(concurrency) {}

    std::mutex mutex;
    std::condition_variable done;
    std::vector<int> openPorts;
    size_t pending{0};
    std::counting_semaphore<> slots;
};

// State of a single connect attempt. Handlers run on the strand.
struct PortProbe {
    PortProbe(asio::io_context& io, uint16_t p)
        : strand(asio::make_strand(io)), socket(strand), timer(strand), port(p) {}

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    uint16_t port;
    std::atomic<bool> completed{false};
};

} // namespace

HostProber::HostProber(AsioContext& context, HostProberOptions options)
    : context_(context), options_(std::move(options)) {
    if (options_.maxConcurrentPorts <= 0) {
        options_.maxConcurrentPorts = 1;
    }
}

core::DiscoveredDevice HostProber::probeHost(const std::string& ip,
                                             std::chrono::milliseconds timeout,
                                             std::stop_token stopToken) {
    core::DiscoveredDevice device;
    device.ip = ip;
    device.status = core::DeviceStatus::Offline;
    device.lastSeen = core::util::now();

    asio::error_code ec;
    auto address = asio::ip::make_address_v4(ip, ec);
    if (ec) {
        spdlog::debug("Skipping probe of invalid address {}", ip);
        return device;
    }

    if (timeout <= std::chrono::milliseconds::zero()) {
        timeout = kDefaultTimeout;
    }

    spdlog::debug("Probing host {}", ip);

    if (options_.reverseDns && !stopToken.stop_requested()) {
        device.hostname = lookupHostname(address, timeout);
    }

    device.openPorts = probePorts(address, timeout, stopToken);
    if (!device.openPorts.empty()) {
        device.status = core::DeviceStatus::Online;
    }

    return device;
}

std::string HostProber::lookupHostname(const asio::ip::address_v4& address,
                                       std::chrono::milliseconds timeout) {
    // The resolver outlives this call when the lookup times out.
    struct Lookup {
        explicit Lookup(asio::io_context& io) : resolver(io) {}
        asio::ip::tcp::resolver resolver;
        std::promise<std::string> result;
    };

    auto lookup = std::make_shared<Lookup>(context_.getContext());
    auto future = lookup->result.get_future();

    asio::ip::tcp::endpoint endpoint(address, 0);
    lookup->resolver.async_resolve(
        endpoint, [lookup](const asio::error_code& ec,
                           asio::ip::tcp::resolver::results_type results) {
            std::string name;
            if (!ec && !results.empty()) {
                name = results.begin()->host_name();
            }
            lookup->result.set_value(std::move(name));
        });

    if (future.wait_for(timeout) != std::future_status::ready) {
        spdlog::debug("Reverse lookup of {} timed out", address.to_string());
        return {};
    }

    auto name = future.get();
    // getnameinfo falls back to the numeric form when no PTR record exists
    if (name == address.to_string()) {
        return {};
    }
    if (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    return name;
}

std::vector<int> HostProber::probePorts(const asio::ip::address_v4& address,
                                        std::chrono::milliseconds timeout,
                                        std::stop_token stopToken) {
    auto batch = std::make_shared<ProbeBatch>(options_.maxConcurrentPorts);

    for (uint16_t port : options_.ports) {
        if (stopToken.stop_requested()) {
            break;
        }
        batch->slots.acquire();
        if (stopToken.stop_requested()) {
            batch->slots.release();
            break;
        }

        {
            std::lock_guard lock(batch->mutex);
            ++batch->pending;
        }

        auto probe = std::make_shared<PortProbe>(context_.getContext(), port);
        asio::ip::tcp::endpoint endpoint(address, port);

        auto finish = [batch, probe, address](bool open) {
            if (probe->completed.exchange(true)) {
                return;
            }
            probe->timer.cancel();
            asio::error_code ignored;
            probe->socket.close(ignored);

            if (open) {
                spdlog::debug("Port {} open on {}", probe->port, address.to_string());
            }

            batch->slots.release();
            std::lock_guard lock(batch->mutex);
            if (open) {
                batch->openPorts.push_back(probe->port);
            }
            if (--batch->pending == 0) {
                batch->done.notify_all();
            }
        };

        asio::post(probe->strand, [probe, endpoint, timeout, finish]() {
            probe->timer.expires_after(timeout);
            probe->timer.async_wait([finish](const asio::error_code& ec) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                finish(false);
            });
            probe->socket.async_connect(endpoint, [finish](const asio::error_code& ec) {
                finish(!ec);
            });
        });
    }

    std::unique_lock lock(batch->mutex);
    batch->done.wait(lock, [&batch] { return batch->pending == 0; });

    // Report in configured order regardless of completion order
    std::vector<int> result;
    for (uint16_t port : options_.ports) {
        if (std::find(batch->openPorts.begin(), batch->openPorts.end(), port) !=
            batch->openPorts.end()) {
            result.push_back(port);
        }
    }
    return result;
}

} // namespace rackscan::infra
