#pragma once

#include "oid/core/types.hpp"

// Big-endian field codecs. Every multi-byte field of an ObjectId goes through
// these; nothing reinterprets the byte array as wider integers.
namespace oid::core {

    constexpr void put_u16_be(u8* out, u16 v) noexcept {
        out[0] = static_cast<u8>((v >> 8) & 0xffu);
        out[1] = static_cast<u8>((v >> 0) & 0xffu);
    }

    constexpr void put_u24_be(u8* out, u32 v) noexcept {
        out[0] = static_cast<u8>((v >> 16) & 0xffu);
        out[1] = static_cast<u8>((v >> 8) & 0xffu);
        out[2] = static_cast<u8>((v >> 0) & 0xffu);
    }

    constexpr void put_u32_be(u8* out, u32 v) noexcept {
        out[0] = static_cast<u8>((v >> 24) & 0xffu);
        out[1] = static_cast<u8>((v >> 16) & 0xffu);
        out[2] = static_cast<u8>((v >> 8) & 0xffu);
        out[3] = static_cast<u8>((v >> 0) & 0xffu);
    }

    constexpr void put_u64_be(u8* out, u64 v) noexcept {
        out[0] = static_cast<u8>((v >> 56) & 0xffu);
        out[1] = static_cast<u8>((v >> 48) & 0xffu);
        out[2] = static_cast<u8>((v >> 40) & 0xffu);
        out[3] = static_cast<u8>((v >> 32) & 0xffu);
        out[4] = static_cast<u8>((v >> 24) & 0xffu);
        out[5] = static_cast<u8>((v >> 16) & 0xffu);
        out[6] = static_cast<u8>((v >> 8) & 0xffu);
        out[7] = static_cast<u8>((v >> 0) & 0xffu);
    }

    [[nodiscard]] constexpr u16 get_u16_be(const u8* in) noexcept {
        return static_cast<u16>((static_cast<u32>(in[0]) << 8) | (static_cast<u32>(in[1]) << 0));
    }

    [[nodiscard]] constexpr u32 get_u24_be(const u8* in) noexcept {
        return (static_cast<u32>(in[0]) << 16) | (static_cast<u32>(in[1]) << 8) | (static_cast<u32>(in[2]) << 0);
    }

    [[nodiscard]] constexpr u32 get_u32_be(const u8* in) noexcept {
        return (static_cast<u32>(in[0]) << 24) | (static_cast<u32>(in[1]) << 16) | (static_cast<u32>(in[2]) << 8) |
               (static_cast<u32>(in[3]) << 0);
    }

    [[nodiscard]] constexpr u64 get_u64_be(const u8* in) noexcept {
        return (static_cast<u64>(in[0]) << 56) | (static_cast<u64>(in[1]) << 48) | (static_cast<u64>(in[2]) << 40) |
               (static_cast<u64>(in[3]) << 32) | (static_cast<u64>(in[4]) << 24) | (static_cast<u64>(in[5]) << 16) |
               (static_cast<u64>(in[6]) << 8) | (static_cast<u64>(in[7]) << 0);
    }

} // namespace oid::core
