#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

// =====================
// 장치로 보내는 고정 18바이트 프레임 (little-endian)
//  [0]      0xFF header
//  [1..2]   buttons bitmask (bit i = buttons[i], bit 10~15 = 0)
//  [3..14]  axes x6, int16 = round(v * 32767)
//  [15]     dpad x (int8)
//  [16]     dpad y (int8)
//  [17]     checksum = sum([1..16]) & 0xFF
// 장치 펌웨어와의 호환 계약이므로 바꾸지 말 것
// =====================
constexpr std::uint8_t WIRE_HEADER   = 0xFF;
constexpr std::size_t  WIRE_SIZE     = 18;
constexpr double       AXIS_SCALE    = 32767.0;

using WirePacket = std::array<std::uint8_t, WIRE_SIZE>;

// 장치 응답: [0xFE, code]
constexpr std::uint8_t STATUS_HEADER = 0xFE;
constexpr std::size_t  STATUS_SIZE   = 2;
constexpr std::uint8_t STATUS_OK     = 0x00;
constexpr std::uint8_t STATUS_NAK    = 0x01;
