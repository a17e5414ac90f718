#include <gtest/gtest.h>

#include "snipbox/ipc/outcome_channel.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <thread>

using namespace snipbox::ipc;
using Clock = std::chrono::steady_clock;

namespace {

Clock::time_point In(std::chrono::milliseconds delay) {
    return Clock::now() + delay;
}

void WaitChild(pid_t pid) {
    int status = 0;
    ASSERT_EQ(pid, ::waitpid(pid, &status, 0));
}

} // anonymous namespace

TEST(OutcomeChannel, DeliversOneMessageAcrossFork) {
    OutcomeChannel channel;

    const pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        channel.CloseReadEnd();
        ::_exit(channel.Send(R"({"ok":true})") ? 0 : 1);
    }
    channel.CloseWriteEnd();

    auto received = channel.Receive(In(std::chrono::seconds(5)));
    EXPECT_EQ(ReceiveStatus::MESSAGE, received.status);
    EXPECT_EQ(R"({"ok":true})", received.payload);

    WaitChild(pid);
}

TEST(OutcomeChannel, LargeMessageArrivesIntact) {
    OutcomeChannel channel;
    const std::string payload(3 * 1024 * 1024 + 17, 'z');

    std::thread writer([&channel, &payload]() {
        EXPECT_TRUE(channel.Send(payload));
    });

    auto received = channel.Receive(In(std::chrono::seconds(10)));
    writer.join();

    ASSERT_EQ(ReceiveStatus::MESSAGE, received.status);
    EXPECT_EQ(payload.size(), received.payload.size());
    EXPECT_EQ(payload, received.payload);
}

TEST(OutcomeChannel, EmptyPayloadIsAMessage) {
    OutcomeChannel channel;
    ASSERT_TRUE(channel.Send(""));

    auto received = channel.Receive(In(std::chrono::seconds(1)));
    EXPECT_EQ(ReceiveStatus::MESSAGE, received.status);
    EXPECT_TRUE(received.payload.empty());
}

TEST(OutcomeChannel, ClosedWithoutMessage) {
    OutcomeChannel channel;

    const pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        ::_exit(0);
    }
    channel.CloseWriteEnd();

    auto received = channel.Receive(In(std::chrono::seconds(5)));
    EXPECT_EQ(ReceiveStatus::CLOSED, received.status);
    EXPECT_TRUE(received.error.empty());

    WaitChild(pid);
}

TEST(OutcomeChannel, DeadlineWhenNothingArrives) {
    OutcomeChannel channel;

    const auto start = Clock::now();
    auto received = channel.Receive(In(std::chrono::milliseconds(100)));
    const auto elapsed = Clock::now() - start;

    EXPECT_EQ(ReceiveStatus::DEADLINE, received.status);
    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(OutcomeChannel, PastDeadlineReadsNothing) {
    OutcomeChannel channel;
    ASSERT_TRUE(channel.Send("late"));

    auto received = channel.Receive(Clock::now() - std::chrono::milliseconds(1));
    EXPECT_EQ(ReceiveStatus::DEADLINE, received.status);
    EXPECT_TRUE(received.payload.empty());
}

TEST(OutcomeChannel, SecondSendThrows) {
    OutcomeChannel channel;
    ASSERT_TRUE(channel.Send("first"));
    EXPECT_THROW(channel.Send("second"), std::logic_error);
}

TEST(OutcomeChannel, SendAfterWriteEndClosedFails) {
    OutcomeChannel channel;
    channel.CloseWriteEnd();
    EXPECT_EQ(-1, channel.GetWriteFd());
    EXPECT_FALSE(channel.Send("nobody listens"));
}
