//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "transport/outbox.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <poll.h>

#include <deque>
#include <memory>
#include <string>

namespace
{

using namespace possync::common::transport;  // NOLINT This our main concern here in the unit tests.

using testing::IsEmpty;
using testing::Pointee;
using testing::ElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestOutbox : public testing::Test
{
protected:
    static Outbox::Frame makeFrame(const std::string& text)
    {
        return std::make_shared<const std::string>(text);
    }

    static bool isReadable(const int fd)
    {
        pollfd pfd{fd, POLLIN, 0};
        return (::poll(&pfd, 1, 0) == 1) && ((pfd.revents & POLLIN) != 0);
    }
};

// MARK: - Tests:

TEST_F(TestOutbox, push_and_take_all_in_fifo_order)
{
    const auto outbox = Outbox::make(8);
    ASSERT_TRUE(outbox);
    EXPECT_FALSE(isReadable(outbox->wakeFd()));

    EXPECT_FALSE(outbox->push(makeFrame("a")));
    EXPECT_FALSE(outbox->push(makeFrame("b")));
    EXPECT_THAT(outbox->size(), 2);
    EXPECT_TRUE(isReadable(outbox->wakeFd()));

    const auto frames = outbox->takeAll();
    EXPECT_THAT(frames, ElementsAre(Pointee(std::string{"a"}), Pointee(std::string{"b"})));
    EXPECT_THAT(outbox->size(), 0);
    EXPECT_FALSE(isReadable(outbox->wakeFd()));

    EXPECT_THAT(outbox->takeAll(), IsEmpty());
}

TEST_F(TestOutbox, drops_oldest_when_full)
{
    const auto outbox = Outbox::make(3);
    ASSERT_TRUE(outbox);

    for (const auto* const text : {"1", "2", "3"})
    {
        EXPECT_FALSE(outbox->push(makeFrame(text)));
    }
    EXPECT_TRUE(outbox->push(makeFrame("4")));
    EXPECT_TRUE(outbox->push(makeFrame("5")));
    EXPECT_THAT(outbox->size(), 3);
    EXPECT_THAT(outbox->droppedCount(), 2);

    EXPECT_THAT(outbox->takeAll(),
                ElementsAre(Pointee(std::string{"3"}), Pointee(std::string{"4"}), Pointee(std::string{"5"})));
}

TEST_F(TestOutbox, zero_capacity_keeps_latest)
{
    const auto outbox = Outbox::make(0);
    ASSERT_TRUE(outbox);

    EXPECT_FALSE(outbox->push(makeFrame("a")));
    EXPECT_TRUE(outbox->push(makeFrame("b")));
    EXPECT_THAT(outbox->takeAll(), ElementsAre(Pointee(std::string{"b"})));
}

TEST_F(TestOutbox, frames_are_shared_not_copied)
{
    const auto first  = Outbox::make(4);
    const auto second = Outbox::make(4);
    ASSERT_TRUE(first && second);

    const auto frame = makeFrame(R"({"type":"ping"})");
    first->push(frame);
    second->push(frame);

    EXPECT_THAT(first->takeAll().front().get(), frame.get());
    EXPECT_THAT(second->takeAll().front().get(), frame.get());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
