#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

#include "oid/core/buffer.hpp"
#include "oid/core/endian.hpp"
#include "oid/core/errors.hpp"
#include "oid/core/types.hpp"

namespace oid::id {
    using u8 = oid::core::u8;
    using u16 = oid::core::u16;
    using u32 = oid::core::u32;
    using u64 = oid::core::u64;

    inline constexpr u32 kObjectIdBytes = 12;
    inline constexpr u32 kObjectIdHexChars = 2 * kObjectIdBytes;

    // Byte offsets of the big-endian fields
    inline constexpr u32 kTimestampOffset = 0;
    inline constexpr u32 kMachineOffset = 4;
    inline constexpr u32 kProcessOffset = 7;
    inline constexpr u32 kCounterOffset = 9;

    // 12-byte identifier: timestamp(4) | machine(3) | process(2) | counter(3),
    // all big-endian. Ordering and equality are over the raw bytes, so the
    // leading timestamp is the most significant field.
    class ObjectId {
    public:
        constexpr ObjectId() noexcept = default;

        explicit constexpr ObjectId(const std::array<u8, kObjectIdBytes>& b) noexcept : b_(b) {}

        // Writes three big-endian words across the 12 bytes. No range checks:
        // callers have already composed valid bit patterns.
        [[nodiscard]] static constexpr ObjectId from_words_unchecked(u32 timestamp,
            u32 machine_pid,
            u32 pid_increment) noexcept {
            ObjectId id;
            oid::core::put_u32_be(id.b_.data() + 0, timestamp);
            oid::core::put_u32_be(id.b_.data() + 4, machine_pid);
            oid::core::put_u32_be(id.b_.data() + 8, pid_increment);
            return id;
        }

        [[nodiscard]] constexpr const std::array<u8, kObjectIdBytes>& bytes() const noexcept { return b_; }

        [[nodiscard]] constexpr u32 timestamp() const noexcept {
            return oid::core::get_u32_be(b_.data() + kTimestampOffset);
        }

        [[nodiscard]] constexpr u32 machine() const noexcept {
            return oid::core::get_u24_be(b_.data() + kMachineOffset);
        }

        [[nodiscard]] constexpr u16 process() const noexcept {
            return oid::core::get_u16_be(b_.data() + kProcessOffset);
        }

        [[nodiscard]] constexpr u32 counter() const noexcept {
            return oid::core::get_u24_be(b_.data() + kCounterOffset);
        }

        friend constexpr bool operator==(const ObjectId&, const ObjectId&) noexcept = default;
        friend constexpr auto operator<=>(const ObjectId&, const ObjectId&) noexcept = default;

    private:
        std::array<u8, kObjectIdBytes> b_{};
    };

    static_assert(sizeof(ObjectId) == kObjectIdBytes);
    static_assert(std::is_trivially_copyable_v<ObjectId>);
    static_assert(std::is_standard_layout_v<ObjectId>);

    inline constexpr ObjectId kEmptyObjectId{};
    inline constexpr ObjectId kMinObjectId{};
    inline constexpr ObjectId kMaxObjectId = ObjectId::from_words_unchecked(0xffffffffu, 0xffffffffu, 0xffffffffu);

    // ========================================================================
    // Construction
    // ========================================================================

    // Copies exactly 12 bytes. Any other length is InvalidLength.
    [[nodiscard]] oid::core::Status object_id_from_bytes(oid::core::BufferView in, ObjectId* out) noexcept;

    // machine and counter must fit in 24 bits (OutOfRange otherwise).
    // A signed timestamp is passed as its u32 bit pattern.
    [[nodiscard]] oid::core::Status object_id_from_fields(u32 timestamp,
        u32 machine,
        u16 process,
        u32 counter,
        ObjectId* out) noexcept;

    // Whole seconds since the Unix epoch, rounded toward negative infinity.
    // OutOfRange unless the result is within [0, 2^32 - 1].
    [[nodiscard]] oid::core::Status timestamp_from_time(oid::core::SysTime t, u32* out) noexcept;

    [[nodiscard]] oid::core::Status object_id_from_time(oid::core::SysTime t,
        u32 machine,
        u16 process,
        u32 counter,
        ObjectId* out) noexcept;

    // ========================================================================
    // Ordering and hashing
    // ========================================================================

    // -1, 0 or 1; lexicographic over the 12 bytes
    [[nodiscard]] int object_id_compare(const ObjectId& a, const ObjectId& b) noexcept;

    // XOR of the three big-endian 32-bit words
    [[nodiscard]] constexpr u32 object_id_hash(const ObjectId& id) noexcept {
        const u8* p = id.bytes().data();
        return oid::core::get_u32_be(p + 0) ^ oid::core::get_u32_be(p + 4) ^ oid::core::get_u32_be(p + 8);
    }

    // ========================================================================
    // Conversions
    // ========================================================================

    [[nodiscard]] std::array<u8, kObjectIdBytes> object_id_to_bytes(const ObjectId& id) noexcept;

    // false when out is null or shorter than 12 bytes; nothing is written then
    [[nodiscard]] bool object_id_try_write(const ObjectId& id, oid::core::BufferMut out) noexcept;

    // 24 uppercase hex characters
    [[nodiscard]] std::string object_id_to_hex(const ObjectId& id);

    // Writes 24 hex characters plus NUL. Returns false if out_size < 25.
    [[nodiscard]] bool object_id_to_hex(const ObjectId& id, char* out, std::size_t out_size) noexcept;

    // Accepts upper- or lowercase digits. InvalidLength unless 24 characters,
    // Invalid on any non-hex character.
    [[nodiscard]] oid::core::Status object_id_from_hex(std::string_view hex, ObjectId* out) noexcept;

    [[nodiscard]] oid::core::SysSeconds object_id_created(const ObjectId& id) noexcept;

} // namespace oid::id

namespace std {
    template <>
    struct hash<oid::id::ObjectId> {
        std::size_t operator()(const oid::id::ObjectId& id) const noexcept {
            return static_cast<std::size_t>(oid::id::object_id_hash(id));
        }
    };
} // namespace std
