#include <catch2/catch_test_macros.hpp>
#include "custodian/session/one_shot_channel.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace custodian;
using namespace custodian::session;

TEST_CASE("OneShotChannel - Delivery", "[session][channel]") {
    SECTION("Value sent before receive") {
        auto [sender, receiver] = MakeOneShotChannel<std::string>();
        REQUIRE(sender.Send("material").IsOk());
        REQUIRE(sender.IsUsed());
        auto value = receiver.Receive();
        REQUIRE(value.IsOk());
        REQUIRE(value.Unwrap() == "material");
        REQUIRE(receiver.IsUsed());
    }

    SECTION("Receiver blocks until the value arrives") {
        auto [sender, receiver] = MakeOneShotChannel<int>();
        std::thread producer([s = std::move(sender)]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            (void)s.Send(42);
        });
        auto value = receiver.Receive();
        producer.join();
        REQUIRE(value.IsOk());
        REQUIRE(value.Unwrap() == 42);
    }

    SECTION("Move-only payloads") {
        auto [sender, receiver] = MakeOneShotChannel<std::unique_ptr<int>>();
        REQUIRE(sender.Send(std::make_unique<int>(7)).IsOk());
        auto value = receiver.Receive();
        REQUIRE(value.IsOk());
        REQUIRE(*value.Unwrap() == 7);
    }
}

TEST_CASE("OneShotChannel - Single use", "[session][channel]") {
    SECTION("Second send fails") {
        auto [sender, receiver] = MakeOneShotChannel<int>();
        REQUIRE(sender.Send(1).IsOk());
        auto second = sender.Send(2);
        REQUIRE(second.IsErr());
        REQUIRE(second.UnwrapErr().type == CustodyFailureType::ChannelClosed);
        REQUIRE(receiver.Receive().Unwrap() == 1);
    }

    SECTION("Second receive fails") {
        auto [sender, receiver] = MakeOneShotChannel<int>();
        REQUIRE(sender.Send(1).IsOk());
        REQUIRE(receiver.Receive().IsOk());
        auto again = receiver.Receive();
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == CustodyFailureType::ChannelClosed);
    }
}

TEST_CASE("OneShotChannel - Closure", "[session][channel]") {
    SECTION("Dropped sender wakes the receiver") {
        auto [sender, receiver] = MakeOneShotChannel<int>();
        std::thread dropper([s = std::move(sender)]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            auto gone = std::move(s);
        });
        auto value = receiver.Receive();
        dropper.join();
        REQUIRE(value.IsErr());
        REQUIRE(value.UnwrapErr().type == CustodyFailureType::ChannelClosed);
    }

    SECTION("Send to a dropped receiver fails") {
        auto [sender, receiver] = MakeOneShotChannel<int>();
        {
            auto gone = std::move(receiver);
        }
        auto sent = sender.Send(5);
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().type == CustodyFailureType::ChannelClosed);
    }

    SECTION("Timed receive expires and stays usable") {
        auto [sender, receiver] = MakeOneShotChannel<int>();
        auto timed_out = receiver.Receive(std::chrono::milliseconds(10));
        REQUIRE(timed_out.IsErr());
        REQUIRE(timed_out.UnwrapErr().type == CustodyFailureType::Expired);
        REQUIRE_FALSE(receiver.IsUsed());

        REQUIRE(sender.Send(9).IsOk());
        REQUIRE(receiver.Receive(std::chrono::milliseconds(10)).Unwrap() == 9);
    }
}
