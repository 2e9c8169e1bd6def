#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace prisma {

// RFC 6455 framing. Client frames are always masked; server frames never are
// (a masked server frame is accepted and unmasked anyway).

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text         = 0x1,
    Binary       = 0x2,
    Close        = 0x8,
    Ping         = 0x9,
    Pong         = 0xA,
};

constexpr uint16_t kWsCloseNormal    = 1000;
constexpr uint16_t kWsCloseGoingAway = 1001;
constexpr uint16_t kWsCloseNoStatus  = 1005;
constexpr uint16_t kWsCloseAbnormal  = 1006;

constexpr uint64_t kWsMaxPayload = 16 * 1024 * 1024;

struct WsFrame {
    bool fin = true;
    WsOpcode opcode = WsOpcode::Text;
    std::string payload;
};

enum class WsParse { Incomplete, Complete, Invalid };

// Try to parse one frame from the front of buf. On Complete, consumed holds
// the number of bytes the frame occupied.
WsParse parse_ws_frame(const std::string& buf, WsFrame& out, size_t& consumed);

// Build a masked client frame with FIN set.
std::string encode_ws_frame(WsOpcode opcode, const std::string& payload,
                            const std::array<uint8_t, 4>& mask);

// Close frame payload helpers.
std::string ws_close_payload(uint16_t code);
uint16_t ws_close_code(const std::string& payload);

// Sec-WebSocket-Accept value expected for a given Sec-WebSocket-Key.
std::string ws_accept_key(const std::string& client_key);

bool is_ws_control(WsOpcode opcode);

} // namespace prisma
