#include "net/ws_frame.hpp"
#include "util.hpp"

#include <openssl/sha.h>

namespace prisma {

static const char* kWsGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

bool is_ws_control(WsOpcode opcode) {
    return (static_cast<uint8_t>(opcode) & 0x8) != 0;
}

static bool known_opcode(uint8_t op) {
    return op == 0x0 || op == 0x1 || op == 0x2 || op == 0x8 || op == 0x9 || op == 0xA;
}

WsParse parse_ws_frame(const std::string& buf, WsFrame& out, size_t& consumed) {
    if (buf.size() < 2) return WsParse::Incomplete;

    auto byte = [&](size_t i) { return static_cast<uint8_t>(buf[i]); };

    uint8_t b0 = byte(0);
    uint8_t b1 = byte(1);
    if (b0 & 0x70) return WsParse::Invalid; // no extensions negotiated
    uint8_t op = b0 & 0x0F;
    if (!known_opcode(op)) return WsParse::Invalid;

    bool fin    = (b0 & 0x80) != 0;
    bool masked = (b1 & 0x80) != 0;
    uint64_t len = b1 & 0x7F;
    size_t pos = 2;

    if (len == 126) {
        if (buf.size() < pos + 2) return WsParse::Incomplete;
        len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
        pos += 2;
    } else if (len == 127) {
        if (buf.size() < pos + 8) return WsParse::Incomplete;
        len = 0;
        for (size_t i = 0; i < 8; ++i) len = (len << 8) | byte(2 + i);
        pos += 8;
    }

    auto opcode = static_cast<WsOpcode>(op);
    if (is_ws_control(opcode) && (!fin || len > 125)) return WsParse::Invalid;
    if (len > kWsMaxPayload) return WsParse::Invalid;

    std::array<uint8_t, 4> mask{};
    if (masked) {
        if (buf.size() < pos + 4) return WsParse::Incomplete;
        for (size_t i = 0; i < 4; ++i) mask[i] = byte(pos + i);
        pos += 4;
    }

    if (buf.size() < pos + len) return WsParse::Incomplete;

    out.fin = fin;
    out.opcode = opcode;
    out.payload.assign(buf, pos, static_cast<size_t>(len));
    if (masked) {
        for (size_t i = 0; i < out.payload.size(); ++i)
            out.payload[i] = static_cast<char>(out.payload[i] ^ mask[i % 4]);
    }
    consumed = pos + static_cast<size_t>(len);
    return WsParse::Complete;
}

std::string encode_ws_frame(WsOpcode opcode, const std::string& payload,
                            const std::array<uint8_t, 4>& mask) {
    std::string frame;
    frame.reserve(payload.size() + 14);
    frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));

    uint64_t len = payload.size();
    if (len < 126) {
        frame.push_back(static_cast<char>(0x80 | len));
    } else if (len <= 0xFFFF) {
        frame.push_back(static_cast<char>(0x80 | 126));
        frame.push_back(static_cast<char>((len >> 8) & 0xFF));
        frame.push_back(static_cast<char>(len & 0xFF));
    } else {
        frame.push_back(static_cast<char>(0x80 | 127));
        for (int i = 7; i >= 0; --i)
            frame.push_back(static_cast<char>((len >> (i * 8)) & 0xFF));
    }

    for (uint8_t b : mask) frame.push_back(static_cast<char>(b));
    for (size_t i = 0; i < payload.size(); ++i)
        frame.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]));
    return frame;
}

std::string ws_close_payload(uint16_t code) {
    std::string p;
    p.push_back(static_cast<char>((code >> 8) & 0xFF));
    p.push_back(static_cast<char>(code & 0xFF));
    return p;
}

uint16_t ws_close_code(const std::string& payload) {
    if (payload.size() < 2) return kWsCloseNoStatus;
    return static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                                 static_cast<uint8_t>(payload[1]));
}

std::string ws_accept_key(const std::string& client_key) {
    std::string input = client_key + kWsGuid;
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

} // namespace prisma
