#pragma once

#include "oid/core/buffer.hpp"
#include "oid/core/errors.hpp"
#include "oid/core/types.hpp"

namespace oid::host {
    using u8 = oid::core::u8;
    using u32 = oid::core::u32;

    oid::core::Status hash_compute(oid::core::BufferView data, oid::core::Hash256* out) noexcept;

    // Low 24 bits of the digest read as a little-endian word
    [[nodiscard]] constexpr u32 hash_low24(const oid::core::Hash256& h) noexcept {
        return (static_cast<u32>(h.b[0]) << 0) | (static_cast<u32>(h.b[1]) << 8) | (static_cast<u32>(h.b[2]) << 16);
    }

    // Machine discriminator for a host name. A null name hashes as "".
    // BLAKE3 stands in for a fast non-cryptographic hash: it is already
    // linked, runs once per process, and is unseeded, so every process on one
    // host gets the same machine field.
    [[nodiscard]] u32 machine_name_hash24(const char* name) noexcept;

} // namespace oid::host
