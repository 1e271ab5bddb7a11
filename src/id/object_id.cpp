#include "oid/id/object_id.hpp"

#include <chrono>
#include <cstring>

namespace oid::id {
    namespace {
        constexpr char kHexUpper[] = "0123456789ABCDEF";

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            return -1;
        }

        void write_hex(const ObjectId& id, char* out) noexcept {
            const auto& b = id.bytes();
            for (u32 i = 0; i < kObjectIdBytes; ++i) {
                out[2 * i + 0] = kHexUpper[(b[i] >> 4) & 0xF];
                out[2 * i + 1] = kHexUpper[b[i] & 0xF];
            }
        }
    } // namespace

    oid::core::Status object_id_from_bytes(oid::core::BufferView in, ObjectId* out) noexcept {
        if (out == nullptr || !oid::core::buffer_ok(in)) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::Invalid);
        }
        if (in.len != kObjectIdBytes) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::InvalidLength, in.len);
        }

        std::array<u8, kObjectIdBytes> b{};
        std::memcpy(b.data(), in.data, b.size());
        *out = ObjectId{b};
        return oid::core::ok_status();
    }

    oid::core::Status object_id_from_fields(u32 timestamp,
        u32 machine,
        u16 process,
        u32 counter,
        ObjectId* out) noexcept {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::Invalid);
        }
        if ((machine & ~oid::core::kMask24) != 0) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::OutOfRange, machine);
        }
        if ((counter & ~oid::core::kMask24) != 0) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::OutOfRange, counter);
        }

        std::array<u8, kObjectIdBytes> b{};
        oid::core::put_u32_be(b.data() + kTimestampOffset, timestamp);
        oid::core::put_u24_be(b.data() + kMachineOffset, machine);
        oid::core::put_u16_be(b.data() + kProcessOffset, process);
        oid::core::put_u24_be(b.data() + kCounterOffset, counter);
        *out = ObjectId{b};
        return oid::core::ok_status();
    }

    oid::core::Status timestamp_from_time(oid::core::SysTime t, u32* out) noexcept {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::Invalid);
        }

        // floor, not truncation: 1969-12-31T23:59:59.5 is -1, not 0
        const oid::core::i64 secs = std::chrono::floor<std::chrono::seconds>(t.time_since_epoch()).count();
        if (secs < 0 || secs > static_cast<oid::core::i64>(0xffffffffu)) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::OutOfRange);
        }

        *out = static_cast<u32>(secs);
        return oid::core::ok_status();
    }

    oid::core::Status object_id_from_time(oid::core::SysTime t,
        u32 machine,
        u16 process,
        u32 counter,
        ObjectId* out) noexcept {
        u32 timestamp = 0;
        const oid::core::Status s = timestamp_from_time(t, &timestamp);
        if (!oid::core::is_ok(s)) {
            return s;
        }
        return object_id_from_fields(timestamp, machine, process, counter, out);
    }

    int object_id_compare(const ObjectId& a, const ObjectId& b) noexcept {
        const auto c = a <=> b;
        if (c < 0) {
            return -1;
        }
        if (c > 0) {
            return 1;
        }
        return 0;
    }

    std::array<u8, kObjectIdBytes> object_id_to_bytes(const ObjectId& id) noexcept {
        return id.bytes();
    }

    bool object_id_try_write(const ObjectId& id, oid::core::BufferMut out) noexcept {
        if (!oid::core::buffer_ok_mut(out) || out.len < kObjectIdBytes) {
            return false;
        }
        std::memcpy(out.data, id.bytes().data(), kObjectIdBytes);
        return true;
    }

    std::string object_id_to_hex(const ObjectId& id) {
        std::string s(kObjectIdHexChars, '0');
        write_hex(id, s.data());
        return s;
    }

    bool object_id_to_hex(const ObjectId& id, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || out_size < kObjectIdHexChars + 1) {
            return false;
        }
        write_hex(id, out);
        out[kObjectIdHexChars] = '\0';
        return true;
    }

    oid::core::Status object_id_from_hex(std::string_view hex, ObjectId* out) noexcept {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::Invalid);
        }
        if (hex.size() != kObjectIdHexChars) {
            return oid::core::make_status(oid::core::StatusDomain::Id,
                                          oid::core::StatusCode::InvalidLength,
                                          static_cast<u32>(hex.size()));
        }

        std::array<u8, kObjectIdBytes> b{};
        for (u32 i = 0; i < kObjectIdBytes; ++i) {
            const int hi = hex_value(hex[2 * i + 0]);
            const int lo = hex_value(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::Invalid, 2 * i);
            }
            b[i] = static_cast<u8>((hi << 4) | lo);
        }

        *out = ObjectId{b};
        return oid::core::ok_status();
    }

    oid::core::SysSeconds object_id_created(const ObjectId& id) noexcept {
        return oid::core::SysSeconds{std::chrono::seconds{static_cast<oid::core::i64>(id.timestamp())}};
    }

} // namespace oid::id
