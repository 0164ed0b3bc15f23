#ifndef RPC_SERVER_H
#define RPC_SERVER_H

#include <memory>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <stdexcept>
#include <string>
#include <chrono>

namespace zlock {

// Hosts one or more gRPC services on a single listening address. Serving
// starts in the constructor and stops in shutdown() or the destructor.
template<typename... Services>
class RPCServer {
public:
    RPCServer(const std::string& address, Services&... s);
    ~RPCServer();
    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;
    RPCServer(RPCServer&&) = delete;
    RPCServer& operator=(RPCServer&&) = delete;
    void wait();
    void shutdown();
    // The bound port, useful when listening on port 0.
    [[nodiscard]] int port() const;
private:
    std::string addr;
    int selectedPort;
    std::unique_ptr<grpc::Server> server;
    std::thread serverThread;
};

template<typename... Services>
RPCServer<Services...>::RPCServer(const std::string& address, Services&... s)
    : addr{address}, selectedPort {0} {
    grpc::ServerBuilder sb{};
    sb.AddListeningPort(addr, grpc::InsecureServerCredentials(), &selectedPort);
    (sb.RegisterService(&s), ...);
    server = sb.BuildAndStart();
    if (!server || selectedPort == 0) {
        throw std::runtime_error("Failed to start gRPC server on address: " + address);
    }
    spdlog::info("Serving {} service(s) on {} (port {})", sizeof...(Services), addr, selectedPort);
    serverThread = std::thread([this]() { this->wait(); });
}

template<typename... Services>
void RPCServer<Services...>::wait() {
    if (server) {
        server->Wait();
    }
}

template<typename... Services>
void RPCServer<Services...>::shutdown() {
    if (server) {
        auto deadline = std::chrono::system_clock::now() + std::chrono::milliseconds(100);
        server->Shutdown(deadline);
    }
    if (serverThread.joinable()) {
        serverThread.join();
    }
    server.reset();
}

template<typename... Services>
int RPCServer<Services...>::port() const {
    return selectedPort;
}

template<typename... Services>
RPCServer<Services...>::~RPCServer() {
    shutdown();
}

} // namespace zlock

#endif // RPC_SERVER_H
