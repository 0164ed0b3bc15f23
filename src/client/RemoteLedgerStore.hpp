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
#ifndef REMOTE_LEDGER_STORE_H
#define REMOTE_LEDGER_STORE_H

#include <cstdint>
#include <expected>
#include <string>
#include <variant>
#include <vector>
#include "client/Config.hpp"
#include "common/Error.hpp"
#include "common/RPCService.hpp"
#include "storage/LedgerStore.hpp"
#include "proto/store.grpc.pb.h"

namespace zlock {

class RemoteLedgerStore : public LedgerStore {
public:
    explicit RemoteLedgerStore(const Config& c);
    RemoteLedgerStore(const RemoteLedgerStore&) = delete;
    RemoteLedgerStore& operator=(const RemoteLedgerStore&) = delete;
    std::expected<uint64_t, Error> insertIfAbsent(const std::string& rowKey, const LedgerFields& fields) override;
    std::expected<std::monostate, Error> deleteIfVersion(const std::string& rowKey, uint64_t version) override;
    std::expected<LedgerRow, Error> get(const std::string& rowKey) const override;
    std::expected<std::vector<LedgerRow>, Error> list() const override;
private:
    mutable RPCService<store::LedgerStoreService> service;
};

} // namespace zlock

#endif // REMOTE_LEDGER_STORE_H
