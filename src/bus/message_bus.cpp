#include "devicehost/bus/message_bus.hpp"

namespace devicehost::bus {

MessagePtr IMessageBus::request(const std::string& channel,
                                const message::Message& request,
                                std::chrono::milliseconds timeout) {
    auto future = async_request(channel, request);
    if (future.wait_for(timeout) != std::future_status::ready) {
        throw BusError("Request on channel '" + channel + "' timed out after " +
                       std::to_string(timeout.count()) + "ms");
    }
    return future.get();
}

}  // namespace devicehost::bus
