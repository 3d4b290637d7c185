#include <t9s/runtime/ActionChannel.hpp>

#include <doctest/doctest.h>

#include <thread>
#include <vector>

using namespace T9;
using namespace std::chrono_literals;

TEST_SUITE("runtime.channel") {
    TEST_CASE("Actions come out in posting order") {
        ActionChannel channel;
        CHECK(channel.post(PollTick{}));
        CHECK(channel.post(SwitchNamespace{"staging"}));
        CHECK(channel.size() == 2);

        auto first = channel.try_pop();
        REQUIRE(first.has_value());
        CHECK(std::holds_alternative<PollTick>(*first));
        auto second = channel.try_pop();
        REQUIRE(second.has_value());
        CHECK(std::get<SwitchNamespace>(*second).ns == "staging");
        CHECK_FALSE(channel.try_pop().has_value());
    }

    TEST_CASE("Closing refuses new actions but keeps queued ones") {
        ActionChannel channel;
        CHECK(channel.post(PollTick{}));
        channel.close();
        CHECK(channel.closed());
        CHECK_FALSE(channel.post(PollTick{}));
        CHECK(channel.try_pop().has_value());
        CHECK_FALSE(channel.try_pop().has_value());
    }

    TEST_CASE("wait_pop times out on an empty channel") {
        ActionChannel channel;
        auto const    start = ActionChannel::Clock::now();
        CHECK_FALSE(channel.wait_pop(start + 20ms).has_value());
        CHECK(ActionChannel::Clock::now() - start >= 20ms);
    }

    TEST_CASE("wait_pop wakes for a post from another thread") {
        ActionChannel channel;
        std::thread   producer([&channel] {
            std::this_thread::sleep_for(10ms);
            channel.post(OperationCancelled{});
        });
        auto action = channel.wait_pop(ActionChannel::Clock::now() + 5s);
        producer.join();
        REQUIRE(action.has_value());
        CHECK(std::holds_alternative<OperationCancelled>(*action));
    }

    TEST_CASE("Concurrent producers lose nothing") {
        ActionChannel            channel;
        std::vector<std::thread> producers;
        for (int t = 0; t < 4; ++t) {
            producers.emplace_back([&channel] {
                for (int i = 0; i < 250; ++i) {
                    channel.post(PollTick{});
                }
            });
        }
        for (auto& producer : producers) {
            producer.join();
        }
        CHECK(channel.size() == 1000);
    }
}
