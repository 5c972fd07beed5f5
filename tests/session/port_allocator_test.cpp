// ProctorSFU - Exam Proctoring Media Server
// Tests for PortAllocator

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>

#include "proctorsfu/session/port_allocator.hpp"

namespace proctorsfu {
namespace session {
namespace test {

TEST(PortAllocatorTest, IssuesPortsInOrder) {
    PortAllocator allocator(40000, 40003);

    EXPECT_EQ(allocator.acquire().value(), 40000);
    EXPECT_EQ(allocator.acquire().value(), 40001);
    EXPECT_EQ(allocator.acquire().value(), 40002);
    EXPECT_EQ(allocator.leasedCount(), 3u);
}

TEST(PortAllocatorTest, ExhaustedRangeIsRecordingError) {
    PortAllocator allocator(40000, 40002);
    ASSERT_TRUE(allocator.acquire().isSuccess());
    ASSERT_TRUE(allocator.acquire().isSuccess());

    auto exhausted = allocator.acquire();

    ASSERT_TRUE(exhausted.isError());
    EXPECT_EQ(exhausted.error().code, core::ErrorCode::RecordingError);
}

TEST(PortAllocatorTest, WrapsAroundToReleasedPorts) {
    PortAllocator allocator(40000, 40003);
    auto first = allocator.acquire().value();
    allocator.acquire();
    allocator.acquire();

    allocator.release(first);

    auto reused = allocator.acquire();
    ASSERT_TRUE(reused.isSuccess());
    EXPECT_EQ(reused.value(), first);
    EXPECT_TRUE(allocator.isLeased(first));
}

TEST(PortAllocatorTest, ContinuesAfterLastIssuedPort) {
    PortAllocator allocator(40000, 40010);
    auto first = allocator.acquire().value();
    allocator.release(first);

    // The counter moves on rather than reissuing the port just returned
    EXPECT_EQ(allocator.acquire().value(), 40001);
}

TEST(PortAllocatorTest, SkipsPortsThatFailProbe) {
    std::set<uint16_t> busy = {40000, 40001};
    PortAllocator allocator(40000, 40005, [&busy](uint16_t port) {
        return busy.count(port) == 0;
    });

    EXPECT_EQ(allocator.acquire().value(), 40002);
    EXPECT_FALSE(allocator.isLeased(40000));
}

TEST(PortAllocatorTest, AllPortsBusyFails) {
    PortAllocator allocator(40000, 40004, [](uint16_t) { return false; });

    EXPECT_TRUE(allocator.acquire().isError());
    EXPECT_EQ(allocator.leasedCount(), 0u);
}

TEST(PortAllocatorTest, ReleaseOfUnknownPortIsIgnored) {
    PortAllocator allocator(40000, 40004);
    allocator.acquire();

    allocator.release(12345);

    EXPECT_EQ(allocator.leasedCount(), 1u);
}

TEST(PortAllocatorTest, EmptyRangeThrows) {
    EXPECT_THROW(PortAllocator(40000, 40000), std::invalid_argument);
    EXPECT_THROW(PortAllocator(40010, 40000), std::invalid_argument);
}

} // namespace test
} // namespace session
} // namespace proctorsfu
