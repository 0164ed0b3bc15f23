// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * ZLock a distributed lock manager for conditional-write stores.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef RPC_SERVICE_H
#define RPC_SERVICE_H

#include "client/Config.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace zlock {

// One channel and stub to a single endpoint. Reconnects lazily when the
// channel drops; every call carries the configured deadline.
template<typename Service>
class RPCService {
public:
    using Stub = typename Service::Stub;
    explicit RPCService(const Config& c);
    RPCService(const RPCService&) = delete;
    RPCService& operator=(const RPCService&) = delete;
    std::expected<std::monostate, Error> connect();
    template<typename Req, typename Rep>
    std::expected<std::monostate, Error> call(
        grpc::Status (Stub::* f)(grpc::ClientContext*, const Req&, Rep*),
        const Req& request,
        Rep& reply) {
        std::shared_ptr<Stub> stubLocal;
        {
            auto connected = connect();
            if (!connected.has_value()) {
                return std::unexpected {connected.error()};
            }
            std::lock_guard<std::mutex> lock {m};
            stubLocal = stub;
        }
        if (!stubLocal) {
            return std::unexpected {Error{ErrorCode::Unavailable, "Not connected to store @ " + config.address}};
        }
        grpc::ClientContext c {};
        c.set_deadline(std::chrono::system_clock::now() + config.rpcTimeout);
        return toExpected((stubLocal.get()->*f)(&c, request, &reply));
    }
    [[nodiscard]] bool connected() const;
    [[nodiscard]] std::string address() const;
private:
    mutable std::mutex m;
    const Config& config;
    std::shared_ptr<grpc::Channel> channel;
    std::shared_ptr<Stub> stub;
};

template<typename Service>
RPCService<Service>::RPCService(const Config& c)
    : config {c} {}

template<typename Service>
std::expected<std::monostate, Error> RPCService<Service>::connect() {
    std::lock_guard<std::mutex> lock {m};
    if (channel) {
        auto state = channel->GetState(false);
        if (state == GRPC_CHANNEL_READY) {
            if (!stub) {
                stub = Service::NewStub(channel);
            }
            return {};
        }
        if (state == GRPC_CHANNEL_IDLE || state == GRPC_CHANNEL_CONNECTING) {
            if (channel->WaitForConnected(std::chrono::system_clock::now() + config.channelTimeout)) {
                if (!stub) {
                    stub = Service::NewStub(channel);
                }
                spdlog::info("Reconnected to store @ {}", config.address);
                return {};
            }
        }
    }
    channel = grpc::CreateChannel(config.address, grpc::InsecureChannelCredentials());
    stub.reset();
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + config.channelTimeout)) {
        spdlog::warn("Could not connect to store @ {}", config.address);
        return std::unexpected {Error{ErrorCode::Unavailable, "Could not connect to store @ " + config.address}};
    }
    stub = Service::NewStub(channel);
    spdlog::debug("Connected to store @ {}", config.address);
    return {};
}

template<typename Service>
bool RPCService<Service>::connected() const {
    std::lock_guard<std::mutex> lock {m};
    return channel && stub && channel->GetState(false) == GRPC_CHANNEL_READY;
}

template<typename Service>
std::string RPCService<Service>::address() const {
    return config.address;
}

} // namespace zlock

#endif // RPC_SERVICE_H
