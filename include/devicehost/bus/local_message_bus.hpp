#pragma once

#include <atomic>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <mutex>
#include <unordered_map>

#include "devicehost/bus/message_bus.hpp"

namespace devicehost::bus {

/// @brief In-process bus. Handlers run on a boost::asio thread pool; with
/// serialize_delivery every channel gets its own strand so messages to one
/// channel are handled one at a time, in order.
class LocalMessageBus : public IMessageBus {
public:
    explicit LocalMessageBus(std::size_t threads = 2,
                             bool serialize_delivery = true);
    ~LocalMessageBus() override;

    LocalMessageBus(const LocalMessageBus&) = delete;
    LocalMessageBus& operator=(const LocalMessageBus&) = delete;

    void register_request_handler(const std::string& channel,
                                  RequestHandler handler) override;
    bool unregister_request_handler(const std::string& channel) override;
    std::future<MessagePtr> async_request(
        const std::string& channel, const message::Message& request) override;
    void publish(const std::string& channel,
                 const message::Message& message) override;
    SubscriptionId subscribe(const std::string& channel,
                             MessageHandler handler) override;
    bool unsubscribe(SubscriptionId id) override;

    // Must not be called from a handler running on this bus.
    void close() override;

    bool is_closed() const { return closed_; }
    bool has_request_handler(const std::string& channel) const;
    std::size_t subscriber_count(const std::string& channel) const;
    std::size_t strand_count() const;

private:
    using Executor = boost::asio::thread_pool::executor_type;

    struct Subscription {
        std::string channel;
        std::shared_ptr<MessageHandler> handler;
    };

    template <typename Fn>
    void dispatch(const std::string& channel, Fn&& fn);

    // Caller holds mutex_. Forgets the strand of a channel nobody uses.
    void release_strand(const std::string& channel);

    boost::asio::thread_pool pool_;
    bool serialize_delivery_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> next_request_id_{0};
    std::atomic<SubscriptionId> next_subscription_id_{0};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<RequestHandler>> handlers_;
    std::unordered_map<SubscriptionId, Subscription> subscriptions_;
    std::unordered_map<std::string, boost::asio::strand<Executor>> strands_;
};

}  // namespace devicehost::bus
