#ifndef CONFIG_H
#define CONFIG_H

#include <chrono>
#include <string>

namespace zlock {

constexpr auto defaultEndpoint = "localhost:50061";

class Config {
public:
    // Throws std::invalid_argument on an empty address or non-positive timeouts.
    explicit Config(std::string address,
                    std::chrono::milliseconds rpcTimeout = std::chrono::seconds(2),
                    std::chrono::milliseconds channelTimeout = std::chrono::seconds(1));

    // $ZLOCK_ENDPOINT when set and non-empty, else defaultEndpoint.
    static std::string endpointFromEnvironment();

    const std::string address;
    const std::chrono::milliseconds rpcTimeout;
    const std::chrono::milliseconds channelTimeout;
};

} // namespace zlock

#endif // CONFIG_H
