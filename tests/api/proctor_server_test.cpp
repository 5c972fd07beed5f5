// ProctorSFU - Exam Proctoring Media Server
// ProctorServer lifecycle and end-to-end signaling tests

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cstring>
#include <string>
#include <vector>

#include "proctorsfu/api/proctor_server.hpp"
#include "proctorsfu/core/json_value.hpp"
#include "proctorsfu/core/token_verifier.hpp"
#include "proctorsfu/pal/linux/linux_log_pal.hpp"
#include "capturing_collaborators.hpp"
#include "fake_media_engine.hpp"

namespace proctorsfu {
namespace api {
namespace test {

namespace {

const std::string SECRET = "api-test-secret";

/**
 * @brief Minimal blocking WebSocket client for loopback tests.
 */
class LoopbackClient {
public:
    ~LoopbackClient() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    bool connect(uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            return false;
        }
        timeval timeout{};
        timeout.tv_sec = 3;
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        return ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    bool sendRaw(const std::string& bytes) {
        size_t sent = 0;
        while (sent < bytes.size()) {
            ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    std::string upgrade(const std::string& target) {
        std::string request =
            "GET " + target + " HTTP/1.1\r\n"
            "Host: 127.0.0.1\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
            "Sec-WebSocket-Version: 13\r\n\r\n";
        if (!sendRaw(request)) {
            return "";
        }
        std::string response;
        while (response.find("\r\n\r\n") == std::string::npos) {
            char byte = 0;
            if (::recv(fd_, &byte, 1, 0) != 1) {
                break;
            }
            response.push_back(byte);
        }
        return response;
    }

    bool sendText(const std::string& text) {
        std::string frame;
        frame.push_back(static_cast<char>(0x81));
        if (text.size() < 126) {
            frame.push_back(static_cast<char>(0x80 | text.size()));
        } else {
            frame.push_back(static_cast<char>(0x80 | 126));
            frame.push_back(static_cast<char>((text.size() >> 8) & 0xFF));
            frame.push_back(static_cast<char>(text.size() & 0xFF));
        }
        const uint8_t mask[4] = {0x12, 0x34, 0x56, 0x78};
        for (uint8_t b : mask) {
            frame.push_back(static_cast<char>(b));
        }
        for (size_t i = 0; i < text.size(); ++i) {
            frame.push_back(static_cast<char>(static_cast<uint8_t>(text[i]) ^ mask[i % 4]));
        }
        return sendRaw(frame);
    }

    /**
     * @brief Read one unmasked server text frame; empty on timeout or close.
     */
    std::string readText() {
        uint8_t header[2];
        if (!readExact(header, 2)) {
            return "";
        }
        uint64_t length = header[1] & 0x7F;
        if (length == 126) {
            uint8_t ext[2];
            if (!readExact(ext, 2)) {
                return "";
            }
            length = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
        } else if (length == 127) {
            uint8_t ext[8];
            if (!readExact(ext, 8)) {
                return "";
            }
            length = 0;
            for (uint8_t b : ext) {
                length = (length << 8) | b;
            }
        }
        std::string payload(static_cast<size_t>(length), '\0');
        if (length > 0 && !readExact(reinterpret_cast<uint8_t*>(&payload[0]), payload.size())) {
            return "";
        }
        if ((header[0] & 0x0F) != 0x1) {
            return "";
        }
        return payload;
    }

private:
    bool readExact(uint8_t* out, size_t count) {
        size_t got = 0;
        while (got < count) {
            ssize_t n = ::recv(fd_, out + got, count - got, 0);
            if (n <= 0) {
                return false;
            }
            got += static_cast<size_t>(n);
        }
        return true;
    }

    int fd_ = -1;
};

std::string tokenFor(const std::string& userId, const std::string& role) {
    return core::JwtTokenVerifier::sign(
        "{\"user_id\":\"" + userId + "\",\"role\":\"" + role + "\"}", SECRET);
}

} // anonymous namespace

// =============================================================================
// Fixture
// =============================================================================

class ProctorServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.server.host = "127.0.0.1";
        config_.server.port = 0;
        config_.auth.jwtSecret = SECRET;

        engine_ = std::make_shared<proctorsfu::test::FakeMediaEngine>();
        uploader_ = std::make_shared<proctorsfu::test::MockRecordingUploader>();

        deps_.mediaEngine = engine_;
        deps_.uploader = uploader_;
        deps_.logPal = std::make_shared<pal::linux::LinuxLogPAL>("proctorsfu-test", false);
    }

    core::Configuration config_;
    ServerDependencies deps_;
    std::shared_ptr<proctorsfu::test::FakeMediaEngine> engine_;
    std::shared_ptr<proctorsfu::test::MockRecordingUploader> uploader_;
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(ProctorServerTest, VersionMatchesRelease) {
    EXPECT_EQ(ProctorServer::getVersion(), "0.1.0");
}

TEST_F(ProctorServerTest, ServerStateNames) {
    EXPECT_STREQ(serverStateToString(ServerState::Stopped), "Stopped");
    EXPECT_STREQ(serverStateToString(ServerState::Starting), "Starting");
    EXPECT_STREQ(serverStateToString(ServerState::Running), "Running");
    EXPECT_STREQ(serverStateToString(ServerState::Stopping), "Stopping");
}

TEST_F(ProctorServerTest, InitialStateIsStopped) {
    ProctorServer server(config_, deps_);
    EXPECT_EQ(server.state(), ServerState::Stopped);
    EXPECT_FALSE(server.isRunning());
    EXPECT_EQ(server.connectionCount(), 0u);
}

TEST_F(ProctorServerTest, StartWithoutEngineFails) {
    deps_.mediaEngine.reset();
    ProctorServer server(config_, deps_);

    auto result = server.start();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ServerError::Code::InvalidConfiguration);
    EXPECT_EQ(server.state(), ServerState::Stopped);
}

TEST_F(ProctorServerTest, StartBindsEphemeralPortAndStops) {
    ProctorServer server(config_, deps_);

    auto result = server.start();
    ASSERT_TRUE(result.isSuccess()) << result.error().message;
    EXPECT_TRUE(server.isRunning());
    EXPECT_NE(server.boundPort(), 0);

    auto second = server.start();
    ASSERT_TRUE(second.isError());
    EXPECT_EQ(second.error().code, ServerError::Code::InvalidState);

    server.stop();
    EXPECT_EQ(server.state(), ServerState::Stopped);
    server.stop();
    EXPECT_EQ(server.state(), ServerState::Stopped);
}

TEST_F(ProctorServerTest, RestartAfterStopIsRejected) {
    ProctorServer server(config_, deps_);
    ASSERT_TRUE(server.start().isSuccess());
    server.stop();

    auto again = server.start();
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, ServerError::Code::InvalidState);
}

// =============================================================================
// Upgrade and signaling over loopback
// =============================================================================

TEST_F(ProctorServerTest, UpgradeWithoutTokenIsUnauthorized) {
    ProctorServer server(config_, deps_);
    ASSERT_TRUE(server.start().isSuccess());

    LoopbackClient client;
    ASSERT_TRUE(client.connect(server.boundPort()));
    std::string response = client.upgrade("/");
    EXPECT_NE(response.find("401"), std::string::npos) << response;

    server.stop();
}

TEST_F(ProctorServerTest, UpgradeWithBadSignatureIsUnauthorized) {
    ProctorServer server(config_, deps_);
    ASSERT_TRUE(server.start().isSuccess());

    std::string forged = core::JwtTokenVerifier::sign(
        "{\"user_id\":\"mallory\",\"role\":\"student\"}", "other-secret");

    LoopbackClient client;
    ASSERT_TRUE(client.connect(server.boundPort()));
    std::string response = client.upgrade("/?token=" + forged);
    EXPECT_NE(response.find("401"), std::string::npos) << response;

    server.stop();
}

TEST_F(ProctorServerTest, JoinRoomOverWebSocket) {
    ProctorServer server(config_, deps_);
    ASSERT_TRUE(server.start().isSuccess());

    LoopbackClient client;
    ASSERT_TRUE(client.connect(server.boundPort()));
    std::string response = client.upgrade("/?token=" + tokenFor("student-1", "student"));
    ASSERT_NE(response.find("101"), std::string::npos) << response;
    EXPECT_NE(response.find("s3pPLMBiTxaQ9kYGzzhZRbK+xOo="), std::string::npos);

    ASSERT_TRUE(client.sendText(
        "{\"event\":\"join-room\",\"ackId\":1,"
        "\"data\":{\"roomId\":\"exam-42\",\"role\":\"student\"}}"));

    auto reply = core::JsonValue::parse(client.readText());
    ASSERT_TRUE(reply.isSuccess());
    EXPECT_EQ(reply.value()["ackId"].getInt(), 1);
    EXPECT_TRUE(reply.value()["ok"].getBool());
    EXPECT_TRUE(reply.value()["data"]["routerCapabilities"].isObject());

    server.stop();
}

TEST_F(ProctorServerTest, MalformedMessageGetsValidationError) {
    ProctorServer server(config_, deps_);
    ASSERT_TRUE(server.start().isSuccess());

    LoopbackClient client;
    ASSERT_TRUE(client.connect(server.boundPort()));
    ASSERT_NE(client.upgrade("/?token=" + tokenFor("student-2", "student")).find("101"),
              std::string::npos);

    ASSERT_TRUE(client.sendText("{\"ackId\":7,\"data\":{}}"));

    auto reply = core::JsonValue::parse(client.readText());
    ASSERT_TRUE(reply.isSuccess());
    EXPECT_EQ(reply.value()["ackId"].getInt(), 7);
    EXPECT_FALSE(reply.value()["ok"].getBool());
    EXPECT_EQ(reply.value()["error"]["code"].getString(), "VALIDATION_ERROR");

    server.stop();
}

} // namespace test
} // namespace api
} // namespace proctorsfu
