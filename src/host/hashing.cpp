#include "oid/host/hashing.hpp"

#include <cstddef>
#include <cstring>

#include <blake3.h>

namespace oid::host {
    oid::core::Status hash_compute(oid::core::BufferView data, oid::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Host, oid::core::StatusCode::Invalid);
        }
        if (!oid::core::buffer_ok(data)) {
            return oid::core::make_status(oid::core::StatusDomain::Host, oid::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0) {
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return oid::core::ok_status();
    }

    u32 machine_name_hash24(const char* name) noexcept {
        const char* s = (name != nullptr) ? name : "";
        const oid::core::BufferView view{reinterpret_cast<const u8*>(s), static_cast<u32>(std::strlen(s))};

        oid::core::Hash256 h{};
        if (!oid::core::is_ok(hash_compute(view, &h))) {
            return 0;
        }
        return hash_low24(h);
    }
} // namespace oid::host
