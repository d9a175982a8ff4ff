#include "devicehost/bus/local_message_bus.hpp"

#include <boost/asio/post.hpp>
#include <stdexcept>
#include <vector>

#include "devicehost/log/logger.hpp"

namespace devicehost::bus {

LocalMessageBus::LocalMessageBus(std::size_t threads, bool serialize_delivery)
    : pool_(threads == 0 ? 1 : threads),
      serialize_delivery_(serialize_delivery) {}

LocalMessageBus::~LocalMessageBus() { close(); }

template <typename Fn>
void LocalMessageBus::dispatch(const std::string& channel, Fn&& fn) {
    if (!serialize_delivery_) {
        boost::asio::post(pool_, std::forward<Fn>(fn));
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    auto it = strands_.find(channel);
    if (it == strands_.end()) {
        it = strands_
                 .emplace(channel,
                          boost::asio::make_strand(pool_.get_executor()))
                 .first;
    }
    auto strand = it->second;
    lock.unlock();

    boost::asio::post(strand, std::forward<Fn>(fn));
}

void LocalMessageBus::register_request_handler(const std::string& channel,
                                               RequestHandler handler) {
    if (closed_) {
        throw BusError("Message bus is closed");
    }
    if (!handler) {
        throw std::invalid_argument("Cannot register empty request handler");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (handlers_.count(channel)) {
        throw BusError("Channel '" + channel +
                       "' already has a request handler");
    }
    handlers_[channel] = std::make_shared<RequestHandler>(std::move(handler));
    DEVICEHOST_LOG_DEBUG << "Registered request handler on channel "
                         << channel;
}

bool LocalMessageBus::unregister_request_handler(const std::string& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handlers_.erase(channel) == 0) {
        return false;
    }
    release_strand(channel);
    return true;
}

void LocalMessageBus::release_strand(const std::string& channel) {
    if (handlers_.count(channel)) {
        return;
    }
    for (const auto& [id, subscription] : subscriptions_) {
        if (subscription.channel == channel) {
            return;
        }
    }
    // Deliveries already posted keep the strand alive until they run
    strands_.erase(channel);
}

bool LocalMessageBus::has_request_handler(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(channel) > 0;
}

std::future<MessagePtr> LocalMessageBus::async_request(
    const std::string& channel, const message::Message& request) {
    if (closed_) {
        throw BusError("Message bus is closed");
    }

    std::shared_ptr<RequestHandler> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(channel);
        if (it == handlers_.end()) {
            throw BusError("No request handler on channel '" + channel + "'");
        }
        handler = it->second;
    }

    auto pending = request.clone();
    const uint64_t request_id = ++next_request_id_;
    pending->request_id = request_id;

    auto promise = std::make_shared<std::promise<MessagePtr>>();
    auto future = promise->get_future();

    dispatch(channel, [handler, pending, promise, request_id, channel]() {
        try {
            MessagePtr reply = (*handler)(*pending);
            if (!reply) {
                throw BusError("Handler on channel '" + channel +
                               "' produced no reply");
            }
            reply->request_id = request_id;
            promise->set_value(std::move(reply));
        } catch (...) {
            // The requester receives the failure through its future.
            promise->set_exception(std::current_exception());
        }
    });

    return future;
}

void LocalMessageBus::publish(const std::string& channel,
                              const message::Message& message) {
    if (closed_) {
        throw BusError("Message bus is closed");
    }

    std::vector<std::shared_ptr<MessageHandler>> receivers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, subscription] : subscriptions_) {
            if (subscription.channel == channel) {
                receivers.push_back(subscription.handler);
            }
        }
    }
    if (receivers.empty()) {
        return;
    }

    std::shared_ptr<const message::Message> payload = message.clone();
    dispatch(channel, [receivers = std::move(receivers), payload, channel]() {
        for (const auto& receiver : receivers) {
            try {
                (*receiver)(*payload);
            } catch (const std::exception& e) {
                DEVICEHOST_LOG_ERROR << "Subscriber on channel " << channel
                                     << " failed: " << e.what();
            }
        }
    });
}

SubscriptionId LocalMessageBus::subscribe(const std::string& channel,
                                          MessageHandler handler) {
    if (closed_) {
        throw BusError("Message bus is closed");
    }
    if (!handler) {
        throw std::invalid_argument("Cannot subscribe an empty handler");
    }

    const SubscriptionId id = ++next_subscription_id_;
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_[id] = Subscription{
        channel, std::make_shared<MessageHandler>(std::move(handler))};
    return id;
}

bool LocalMessageBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end()) {
        return false;
    }
    const std::string channel = it->second.channel;
    subscriptions_.erase(it);
    release_strand(channel);
    return true;
}

std::size_t LocalMessageBus::subscriber_count(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, subscription] : subscriptions_) {
        if (subscription.channel == channel) {
            ++count;
        }
    }
    return count;
}

std::size_t LocalMessageBus::strand_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strands_.size();
}

void LocalMessageBus::close() {
    if (closed_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.clear();
        subscriptions_.clear();
    }

    // Lets already queued deliveries finish.
    pool_.join();
    DEVICEHOST_LOG_DEBUG << "Message bus closed";
}

}  // namespace devicehost::bus
