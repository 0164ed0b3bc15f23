#ifndef SRC_SERVER_LEDGERSTORESERVICEIMPL_HPP
#define SRC_SERVER_LEDGERSTORESERVICEIMPL_HPP

#include <grpcpp/grpcpp.h>
#include "proto/store.grpc.pb.h"
#include "storage/LedgerStore.hpp"

namespace zlock {

class LedgerStoreServiceImpl final : public store::LedgerStoreService::Service {
public:
    explicit LedgerStoreServiceImpl(LedgerStore& s);
    grpc::Status insertIfAbsent(
        grpc::ServerContext* context,
        const store::InsertIfAbsentRequest* request,
        store::InsertIfAbsentReply* reply) override;
    grpc::Status deleteIfVersion(
        grpc::ServerContext* context,
        const store::DeleteIfVersionRequest* request,
        store::DeleteIfVersionReply* reply) override;
    grpc::Status get(
        grpc::ServerContext* context,
        const store::GetRowRequest* request,
        store::GetRowReply* reply) override;
    grpc::Status list(
        grpc::ServerContext* context,
        const store::ListRowsRequest* request,
        store::ListRowsReply* reply) override;
private:
    LedgerStore& ledger;
};

} // namespace zlock

#endif // SRC_SERVER_LEDGERSTORESERVICEIMPL_HPP
