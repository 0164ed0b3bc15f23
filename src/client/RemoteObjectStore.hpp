#ifndef REMOTE_OBJECT_STORE_H
#define REMOTE_OBJECT_STORE_H

#include <expected>
#include <string>
#include <variant>
#include "client/Config.hpp"
#include "common/Error.hpp"
#include "common/RPCService.hpp"
#include "storage/ObjectStore.hpp"
#include "proto/store.grpc.pb.h"

namespace zlock {

class RemoteObjectStore : public ObjectStore {
public:
    explicit RemoteObjectStore(const Config& c);
    RemoteObjectStore(const RemoteObjectStore&) = delete;
    RemoteObjectStore& operator=(const RemoteObjectStore&) = delete;
    std::expected<std::string, Error> conditionalPut(const std::string& key, const std::string& body, const PutCondition& condition) override;
    std::expected<std::monostate, Error> conditionalDelete(const std::string& key, const std::string& token) override;
    std::expected<StoredObject, Error> get(const std::string& key) const override;
    std::expected<std::monostate, Error> erase(const std::string& key) override;
private:
    mutable RPCService<store::ObjectStoreService> service;
};

} // namespace zlock

#endif // REMOTE_OBJECT_STORE_H
