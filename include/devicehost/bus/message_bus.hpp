#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

#include "devicehost/message/message.hpp"

namespace devicehost::bus {

class BusError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using MessagePtr = std::shared_ptr<message::Message>;
using RequestHandler =
    std::function<MessagePtr(const message::Message& request)>;
using MessageHandler = std::function<void(const message::Message& message)>;
using SubscriptionId = uint64_t;

/// @brief Contract of the publish/subscribe bus the managers listen on.
/// A channel has at most one request handler; every request delivered to it
/// produces exactly one reply, stamped with the request's correlation id.
class IMessageBus {
public:
    virtual ~IMessageBus() = default;

    /// @brief Bind the request handler of a channel.
    /// @throws BusError if the channel already has a handler or the bus is
    /// closed.
    virtual void register_request_handler(const std::string& channel,
                                          RequestHandler handler) = 0;

    /// @return True if a handler was bound to the channel.
    virtual bool unregister_request_handler(const std::string& channel) = 0;

    /// @brief Send a request; the future yields the reply or the handler's
    /// exception.
    /// @throws BusError if nothing handles the channel or the bus is closed.
    virtual std::future<MessagePtr> async_request(
        const std::string& channel, const message::Message& request) = 0;

    /// @brief Blocking request with a deadline.
    /// @throws BusError on timeout, plus everything async_request throws.
    MessagePtr request(const std::string& channel,
                       const message::Message& request,
                       std::chrono::milliseconds timeout);

    virtual void publish(const std::string& channel,
                         const message::Message& message) = 0;

    virtual SubscriptionId subscribe(const std::string& channel,
                                     MessageHandler handler) = 0;

    virtual bool unsubscribe(SubscriptionId id) = 0;

    // Drop all handlers and subscriptions and stop delivering.
    virtual void close() = 0;
};

}  // namespace devicehost::bus
