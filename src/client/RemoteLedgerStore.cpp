#include "client/RemoteLedgerStore.hpp"
#include "proto/store.pb.h"
#include <expected>
#include <string>
#include <vector>

namespace zlock {

namespace {

LedgerRow fromProto(const store::LedgerRow& row) {
    return LedgerRow{row.key(), LedgerFields{row.fields().begin(), row.fields().end()}, row.version()};
}

} // namespace

RemoteLedgerStore::RemoteLedgerStore(const Config& c) : service {c} {}

std::expected<uint64_t, Error> RemoteLedgerStore::insertIfAbsent(const std::string& rowKey, const LedgerFields& fields) {
    store::InsertIfAbsentRequest request;
    request.set_key(rowKey);
    request.mutable_fields()->insert(fields.begin(), fields.end());
    store::InsertIfAbsentReply reply;
    auto t = service.call(&store::LedgerStoreService::Stub::insertIfAbsent, request, reply);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return reply.version();
}

std::expected<std::monostate, Error> RemoteLedgerStore::deleteIfVersion(const std::string& rowKey, uint64_t version) {
    store::DeleteIfVersionRequest request;
    request.set_key(rowKey);
    request.set_version(version);
    store::DeleteIfVersionReply reply;
    return service.call(&store::LedgerStoreService::Stub::deleteIfVersion, request, reply);
}

std::expected<LedgerRow, Error> RemoteLedgerStore::get(const std::string& rowKey) const {
    store::GetRowRequest request;
    request.set_key(rowKey);
    store::GetRowReply reply;
    auto t = service.call(&store::LedgerStoreService::Stub::get, request, reply);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return fromProto(reply.row());
}

std::expected<std::vector<LedgerRow>, Error> RemoteLedgerStore::list() const {
    store::ListRowsRequest request;
    store::ListRowsReply reply;
    auto t = service.call(&store::LedgerStoreService::Stub::list, request, reply);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    std::vector<LedgerRow> rows;
    rows.reserve(static_cast<std::size_t>(reply.rows_size()));
    for (const auto& row : reply.rows()) {
        rows.push_back(fromProto(row));
    }
    return rows;
}

} // namespace zlock
