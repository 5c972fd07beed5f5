// ProctorSFU - Exam Proctoring Media Server
// Tests for the Linux Network PAL over loopback

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "proctorsfu/pal/linux/linux_network_pal.hpp"

namespace proctorsfu {
namespace pal {
namespace test {

namespace {

constexpr auto WAIT_LIMIT = std::chrono::seconds(5);

// Blocking client socket connected to 127.0.0.1:port
int connectClient(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    struct timeval timeout;
    timeout.tv_sec = 5;
    timeout.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

std::string readExactly(int fd, size_t length) {
    std::string out;
    char buffer[256];
    while (out.size() < length) {
        ssize_t n = recv(fd, buffer, std::min(sizeof(buffer), length - out.size()), 0);
        if (n <= 0) {
            break;
        }
        out.append(buffer, static_cast<size_t>(n));
    }
    return out;
}

} // anonymous namespace

class LinuxNetworkPALTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(network_.initialize().isSuccess());
        loopThread_ = std::thread([this]() { network_.runEventLoop(); });
    }

    void TearDown() override {
        network_.stopEventLoop();
        if (loopThread_.joinable()) {
            loopThread_.join();
        }
    }

    ServerSocket listen() {
        auto server = network_.createServer("127.0.0.1", 0, ServerOptions{});
        EXPECT_TRUE(server.isSuccess());
        return server.isSuccess() ? server.value() : ServerSocket{INVALID_SOCKET_HANDLE, "", 0};
    }

    linux::LinuxNetworkPAL network_;
    std::thread loopThread_;
};

TEST_F(LinuxNetworkPALTest, SecondInitializeFails) {
    auto again = network_.initialize();

    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, NetworkErrorCode::AlreadyInitialized);
}

TEST_F(LinuxNetworkPALTest, EphemeralPortIsReported) {
    ServerSocket server = listen();

    EXPECT_NE(server.port, 0);
    auto local = network_.getLocalPort(server.handle);
    ASSERT_TRUE(local.isSuccess());
    EXPECT_EQ(local.value(), server.port);
}

TEST_F(LinuxNetworkPALTest, InvalidAddressRejected) {
    auto server = network_.createServer("not-an-ip", 0, ServerOptions{});

    ASSERT_TRUE(server.isError());
    EXPECT_EQ(server.error().code, NetworkErrorCode::InvalidAddress);
}

TEST_F(LinuxNetworkPALTest, AcceptReadAndWrite) {
    ServerSocket server = listen();

    std::promise<SocketHandle> accepted;
    network_.asyncAccept(server, [&accepted](core::Result<SocketHandle, NetworkError> result) {
        if (result.isSuccess()) {
            accepted.set_value(result.value());
        }
    });

    int client = connectClient(server.port);
    ASSERT_GE(client, 0);
    auto acceptedFuture = accepted.get_future();
    ASSERT_EQ(acceptedFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    SocketHandle connection = acceptedFuture.get();
    EXPECT_TRUE(network_.setSocketOption(connection, SocketOption::NoDelay, 1).isSuccess());

    std::promise<std::string> received;
    network_.asyncRead(connection, 1024, [&received](core::Result<std::vector<uint8_t>, NetworkError> result) {
        received.set_value(result.isSuccess()
            ? std::string(result.value().begin(), result.value().end()) : std::string("error"));
    });
    const std::string request = "join-room";
    ASSERT_EQ(send(client, request.data(), request.size(), 0), static_cast<ssize_t>(request.size()));

    auto receivedFuture = received.get_future();
    ASSERT_EQ(receivedFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_EQ(receivedFuture.get(), "join-room");

    std::promise<size_t> written;
    const std::string reply = "router-capabilities";
    network_.asyncWrite(connection, std::vector<uint8_t>(reply.begin(), reply.end()),
        [&written](core::Result<size_t, NetworkError> result) {
            written.set_value(result.isSuccess() ? result.value() : 0);
        });

    auto writtenFuture = written.get_future();
    ASSERT_EQ(writtenFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_EQ(writtenFuture.get(), reply.size());
    EXPECT_EQ(readExactly(client, reply.size()), reply);

    close(client);
    network_.closeSocket(connection);
}

TEST_F(LinuxNetworkPALTest, PeerCloseReportedAsConnectionClosed) {
    ServerSocket server = listen();
    std::promise<SocketHandle> accepted;
    network_.asyncAccept(server, [&accepted](core::Result<SocketHandle, NetworkError> result) {
        if (result.isSuccess()) {
            accepted.set_value(result.value());
        }
    });
    int client = connectClient(server.port);
    ASSERT_GE(client, 0);
    auto acceptedFuture = accepted.get_future();
    ASSERT_EQ(acceptedFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    SocketHandle connection = acceptedFuture.get();

    std::promise<NetworkErrorCode> outcome;
    network_.asyncRead(connection, 1024, [&outcome](core::Result<std::vector<uint8_t>, NetworkError> result) {
        outcome.set_value(result.isError() ? result.error().code : NetworkErrorCode::Success);
    });
    close(client);

    auto outcomeFuture = outcome.get_future();
    ASSERT_EQ(outcomeFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_EQ(outcomeFuture.get(), NetworkErrorCode::ConnectionClosed);
    network_.closeSocket(connection);
}

TEST_F(LinuxNetworkPALTest, ReadOnClosedSocketFails) {
    std::promise<NetworkErrorCode> outcome;

    network_.asyncRead(SocketHandle{987654}, 16, [&outcome](core::Result<std::vector<uint8_t>, NetworkError> result) {
        outcome.set_value(result.isError() ? result.error().code : NetworkErrorCode::Success);
    });

    auto future = outcome.get_future();
    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_EQ(future.get(), NetworkErrorCode::ConnectionClosed);
}

TEST_F(LinuxNetworkPALTest, ProbeUdpPortDetectsBoundPort) {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    ASSERT_GE(fd, 0);
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ASSERT_EQ(bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t length = sizeof(addr);
    ASSERT_EQ(getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &length), 0);
    uint16_t port = ntohs(addr.sin_port);

    EXPECT_FALSE(network_.probeUdpPort("127.0.0.1", port));

    close(fd);
    EXPECT_TRUE(network_.probeUdpPort("127.0.0.1", port));
}

TEST_F(LinuxNetworkPALTest, ProbeRejectsInvalidAddress) {
    EXPECT_FALSE(network_.probeUdpPort("999.1.1.1", 40000));
}

} // namespace test
} // namespace pal
} // namespace proctorsfu
