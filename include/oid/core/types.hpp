#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace oid::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i32 = std::int32_t;
    using i64 = std::int64_t;

    // Wall-clock input for the calendar-time entry points
    using SysTime = std::chrono::system_clock::time_point;
    using SysSeconds = std::chrono::sys_seconds;

    inline constexpr u32 kMask24 = 0x00ffffffu;
    inline constexpr u64 kMask40 = 0xffffffffffull;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);
    static_assert(std::is_trivially_copyable_v<Hash256>);

} // namespace oid::core
