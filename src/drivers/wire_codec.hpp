#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include "wire_packet.hpp"
#include "../../include/frame.hpp"

enum class ResponseStatus {
    OK,
    NAK,
    MALFORMED
};

inline const char* status_to_string(ResponseStatus s) {
    switch (s) {
        case ResponseStatus::OK:        return "OK";
        case ResponseStatus::NAK:       return "NAK";
        case ResponseStatus::MALFORMED: return "MALFORMED";
        default:                        return "UNKNOWN";
    }
}

inline std::uint16_t buttons_to_mask(const Buttons& b) {
    std::uint16_t mask = 0;
    for (std::size_t i = 0; i < NUM_BUTTONS; ++i) {
        if (b[i]) mask |= static_cast<std::uint16_t>(1u << i);
    }
    return mask;
}

// 단일 바이트 dpad 코드 (0~8, 중앙 = 4)
inline std::uint8_t dpad_code(Dpad d) {
    return static_cast<std::uint8_t>((d.x + 1) + (d.y + 1) * 3);
}

inline std::uint8_t wire_checksum(const std::uint8_t* body, std::size_t n) {
    unsigned sum = 0;
    for (std::size_t i = 0; i < n; ++i) sum += body[i];
    return static_cast<std::uint8_t>(sum & 0xFF);
}

// ---------- Encode ------------
// 불변식을 만족하는 Frame이면 항상 성공
inline WirePacket encode_frame(const Frame& f) {
    WirePacket p{};
    p[0] = WIRE_HEADER;

    const std::uint16_t mask = buttons_to_mask(f.buttons());
    p[1] = mask & 0xFF;
    p[2] = (mask >> 8) & 0xFF;

    for (std::size_t i = 0; i < NUM_AXES; ++i) {
        const auto v = static_cast<std::int16_t>(std::lround(f.axes()[i] * AXIS_SCALE));
        const auto u = static_cast<std::uint16_t>(v);
        p[3 + i * 2]     = u & 0xFF;
        p[3 + i * 2 + 1] = (u >> 8) & 0xFF;
    }

    p[15] = static_cast<std::uint8_t>(static_cast<std::int8_t>(f.dpad().x));
    p[16] = static_cast<std::uint8_t>(static_cast<std::int8_t>(f.dpad().y));

    p[17] = wire_checksum(p.data() + 1, WIRE_SIZE - 2);
    return p;
}

// ---------- Decode ------------
// loopback / 시뮬레이터 장치용. header, checksum, 범위 중 하나라도 틀리면 nullopt
inline std::optional<Frame> decode_frame(const std::uint8_t* data, std::size_t len) {
    if (len != WIRE_SIZE) return std::nullopt;
    if (data[0] != WIRE_HEADER) return std::nullopt;
    if (data[17] != wire_checksum(data + 1, WIRE_SIZE - 2)) return std::nullopt;

    const std::uint16_t mask = data[1] | (data[2] << 8);
    if (mask >> NUM_BUTTONS) return std::nullopt;

    Buttons b{};
    for (std::size_t i = 0; i < NUM_BUTTONS; ++i) b[i] = (mask >> i) & 1;

    Axes a{};
    for (std::size_t i = 0; i < NUM_AXES; ++i) {
        const auto u = static_cast<std::uint16_t>(data[3 + i * 2] | (data[3 + i * 2 + 1] << 8));
        const auto v = static_cast<std::int16_t>(u);
        a[i] = v / AXIS_SCALE;
    }

    const Dpad d{static_cast<std::int8_t>(data[15]), static_cast<std::int8_t>(data[16])};

    // -32768 은 encode가 만들지 않는 값 -> make()에서 범위 위반으로 걸러짐
    return Frame::make(b, a, d);
}

inline std::optional<Frame> decode_frame(const WirePacket& p) {
    return decode_frame(p.data(), p.size());
}

inline ResponseStatus decode_status(const std::uint8_t* data, std::size_t len) {
    if (len != STATUS_SIZE) return ResponseStatus::MALFORMED;
    if (data[0] != STATUS_HEADER) return ResponseStatus::MALFORMED;

    switch (data[1]) {
        case STATUS_OK:  return ResponseStatus::OK;
        case STATUS_NAK: return ResponseStatus::NAK;
        default:         return ResponseStatus::MALFORMED;
    }
}
