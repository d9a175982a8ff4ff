// tests/component/test_runtime_instance.cpp
#define BOOST_TEST_MODULE RuntimeInstanceTests
#include <boost/test/unit_test.hpp>

#include "devicehost/component/runtime_instance.hpp"
#include "../support/test_components.hpp"

using namespace devicehost::component;
using namespace devicehost::testing;

namespace {

template <typename T>
std::unique_ptr<ComponentRuntimeInstance> make_instance(
    boost::property_tree::ptree conf = {}) {
    auto stop = std::make_shared<Signal>();
    auto ready = std::make_shared<Signal>();
    auto context = make_context(stop, ready);
    context.conf = std::move(conf);
    auto component = std::make_shared<T>(std::move(context));
    return std::make_unique<ComponentRuntimeInstance>(
        "test", "test:127.0.0.1", stop, ready, component);
}

}  // namespace

BOOST_AUTO_TEST_SUITE(RuntimeInstanceTestSuite)

BOOST_AUTO_TEST_CASE(test_launch_ready_and_stop) {
    auto instance = make_instance<IdleComponent>();
    BOOST_CHECK(!instance->is_launched());

    instance->launch();
    BOOST_CHECK(instance->is_launched());
    BOOST_CHECK(instance->wait_until_ready(2000ms) == ReadyOutcome::READY);
    BOOST_CHECK(instance->is_ready());
    BOOST_CHECK(instance->is_running());

    instance->request_stop();
    BOOST_CHECK(instance->join_for(2000ms));
    BOOST_CHECK(!instance->is_running());
    BOOST_CHECK(!instance->failure());
}

BOOST_AUTO_TEST_CASE(test_launch_twice_rejected) {
    auto instance = make_instance<IdleComponent>();
    instance->launch();
    BOOST_CHECK_THROW(instance->launch(), std::logic_error);
    instance->request_stop();
    BOOST_CHECK(instance->join_for(2000ms));
}

BOOST_AUTO_TEST_CASE(test_failure_before_ready) {
    auto instance = make_instance<FailingComponent>();
    instance->launch();

    BOOST_CHECK(instance->wait_until_ready(2000ms) == ReadyOutcome::FAILED);
    BOOST_CHECK(instance->join_for(2000ms));
    BOOST_REQUIRE(instance->failure());
    BOOST_CHECK_THROW(std::rethrow_exception(instance->failure()),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_ready_timeout) {
    boost::property_tree::ptree conf;
    conf.put("delay_ms", 300);
    auto instance = make_instance<SlowComponent>(conf);
    instance->launch();

    BOOST_CHECK(instance->wait_until_ready(50ms) == ReadyOutcome::TIMED_OUT);
    // Still comes up eventually
    BOOST_CHECK(instance->wait_until_ready(2000ms) == ReadyOutcome::READY);

    instance->request_stop();
    BOOST_CHECK(instance->join_for(2000ms));
}

BOOST_AUTO_TEST_CASE(test_join_for_bounded_when_stop_ignored) {
    boost::property_tree::ptree conf;
    conf.put("hold_ms", 500);
    auto instance = make_instance<StubbornComponent>(conf);
    instance->launch();
    BOOST_CHECK(instance->wait_until_ready(2000ms) == ReadyOutcome::READY);

    instance->request_stop();
    auto begin = std::chrono::steady_clock::now();
    BOOST_CHECK(!instance->join_for(50ms));
    BOOST_CHECK(std::chrono::steady_clock::now() - begin < 400ms);

    instance->abandon();
    BOOST_CHECK(instance->stop_signal()->is_set());

    // Let the abandoned unit finish before the process tears down logging
    std::this_thread::sleep_for(600ms);
}

BOOST_AUTO_TEST_CASE(test_join_unlaunched) {
    auto instance = make_instance<IdleComponent>();
    BOOST_CHECK(instance->join_for(0ms));
    BOOST_CHECK(instance->uptime() == 0ms);
}

BOOST_AUTO_TEST_SUITE_END()
