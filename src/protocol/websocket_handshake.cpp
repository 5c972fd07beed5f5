// ProctorSFU - Exam Proctoring Media Server
// WebSocket Handshake Implementation

#include "proctorsfu/protocol/websocket_handshake.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <openssl/evp.h>

namespace proctorsfu {
namespace protocol {

namespace {

const std::string HEADER_END = "\r\n\r\n";

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

// True if a comma-separated header value lists token (case-insensitive)
bool headerListContains(const std::string& value, const std::string& token) {
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (toLower(trim(item)) == token) {
            return true;
        }
    }
    return false;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string urlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < value.size()) {
            int high = hexValue(value[i + 1]);
            int low = hexValue(value[i + 2]);
            if (high < 0 || low < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>(high * 16 + low));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

WebSocketHandshake::WebSocketHandshake()
    : state_(HandshakeState::WaitingRequest) {
}

HandshakeResult WebSocketHandshake::processData(const uint8_t* data, size_t length) {
    if (state_ != HandshakeState::WaitingRequest) {
        return HandshakeResult::ok(0);
    }
    if (data == nullptr || length == 0) {
        return HandshakeResult::ok(0);
    }

    const size_t previous = buffer_.size();
    buffer_.append(reinterpret_cast<const char*>(data), length);

    // The terminator may straddle the previous read
    size_t searchFrom = previous >= 3 ? previous - 3 : 0;
    size_t end = buffer_.find(HEADER_END, searchFrom);
    if (end == std::string::npos) {
        if (buffer_.size() > websocket::MAX_REQUEST_SIZE) {
            return failWith(HandshakeError::Code::RequestTooLarge, "Upgrade request too large");
        }
        return HandshakeResult::ok(length);
    }

    const size_t blockSize = end + HEADER_END.size();
    if (blockSize > websocket::MAX_REQUEST_SIZE) {
        return failWith(HandshakeError::Code::RequestTooLarge, "Upgrade request too large");
    }

    HandshakeResult parsed = parseRequest(buffer_.substr(0, end));
    if (!parsed.success) {
        return parsed;
    }

    buffer_.clear();
    state_ = HandshakeState::Complete;
    return HandshakeResult::ok(blockSize - previous);
}

HandshakeResult WebSocketHandshake::failWith(HandshakeError::Code code, const std::string& message) {
    state_ = HandshakeState::Failed;
    buffer_.clear();
    return HandshakeResult::fail(HandshakeError(code, message));
}

HandshakeResult WebSocketHandshake::parseRequest(const std::string& block) {
    size_t lineEnd = block.find("\r\n");
    std::string requestLine = block.substr(0, lineEnd);

    std::istringstream requestStream(requestLine);
    std::string method;
    std::string target;
    std::string version;
    requestStream >> method >> target >> version;
    if (method.empty() || target.empty() || version.compare(0, 5, "HTTP/") != 0) {
        return failWith(HandshakeError::Code::MalformedRequest, "Malformed request line");
    }
    if (method != "GET") {
        return failWith(HandshakeError::Code::MalformedRequest, "Upgrade requires GET");
    }

    UpgradeRequest request;
    request.method = method;
    request.target = target;

    size_t queryStart = target.find('?');
    request.path = target.substr(0, queryStart);
    if (queryStart != std::string::npos) {
        std::stringstream query(target.substr(queryStart + 1));
        std::string pair;
        while (std::getline(query, pair, '&')) {
            if (pair.empty()) {
                continue;
            }
            size_t eq = pair.find('=');
            std::string name = urlDecode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));
            request.query[name] = value;
        }
    }

    size_t pos = lineEnd == std::string::npos ? block.size() : lineEnd + 2;
    while (pos < block.size()) {
        size_t next = block.find("\r\n", pos);
        std::string line = block.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        pos = next == std::string::npos ? block.size() : next + 2;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return failWith(HandshakeError::Code::MalformedRequest, "Malformed header line");
        }
        request.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    auto header = [&request](const std::string& name) -> std::string {
        auto it = request.headers.find(name);
        return it == request.headers.end() ? std::string() : it->second;
    };

    if (!headerListContains(header("upgrade"), "websocket") ||
        !headerListContains(header("connection"), "upgrade")) {
        return failWith(HandshakeError::Code::NotUpgrade, "Not a WebSocket upgrade request");
    }
    request.key = header("sec-websocket-key");
    if (request.key.empty()) {
        return failWith(HandshakeError::Code::MissingKey, "Missing Sec-WebSocket-Key");
    }
    if (header("sec-websocket-version") != websocket::SUPPORTED_VERSION) {
        return failWith(HandshakeError::Code::UnsupportedVersion, "Unsupported WebSocket version");
    }

    auto token = request.query.find("token");
    if (token != request.query.end() && !token->second.empty()) {
        request.token = token->second;
    } else {
        std::string authorization = header("authorization");
        const std::string bearer = "bearer ";
        if (toLower(authorization.substr(0, bearer.size())) == bearer) {
            std::string credential = trim(authorization.substr(bearer.size()));
            if (!credential.empty()) {
                request.token = credential;
            }
        }
    }

    request_ = std::move(request);
    return HandshakeResult::ok(0);
}

std::string WebSocketHandshake::computeAcceptKey(const std::string& key) {
    const std::string input = key + websocket::ACCEPT_GUID;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digestLength, EVP_sha1(), nullptr) != 1) {
        return "";
    }

    // 4 output bytes per 3 input bytes, plus the terminator
    std::vector<unsigned char> encoded(((digestLength + 2) / 3) * 4 + 1);
    int written = EVP_EncodeBlock(encoded.data(), digest, static_cast<int>(digestLength));
    return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(written));
}

std::vector<uint8_t> WebSocketHandshake::buildAcceptResponse(const std::string& key) {
    std::string response =
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Accept: " + computeAcceptKey(key) + "\r\n"
        "\r\n";
    return std::vector<uint8_t>(response.begin(), response.end());
}

std::vector<uint8_t> WebSocketHandshake::buildRejectResponse(int status, const std::string& reason) {
    std::string response =
        "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
        "Connection: close\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: " + std::to_string(reason.size()) + "\r\n"
        "\r\n" + reason;
    return std::vector<uint8_t>(response.begin(), response.end());
}

} // namespace protocol
} // namespace proctorsfu
