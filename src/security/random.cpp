#include "oid/security/random.hpp"

#include <cstddef>

#include <sodium.h>

#include "oid/core/endian.hpp"

namespace oid::security {
    namespace {
        oid::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return oid::core::make_status(oid::core::StatusDomain::External, oid::core::StatusCode::Unavailable);
            }
            return oid::core::ok_status();
        }
    } // namespace

    oid::core::Status random40_from_seed(u64 seed, u64* out) noexcept {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Security, oid::core::StatusCode::Invalid);
        }

        const oid::core::Status init = ensure_sodium();
        if (!oid::core::is_ok(init)) {
            return init;
        }

        // seed occupies the first 8 bytes of the 32-byte sodium seed
        unsigned char seed_bytes[randombytes_SEEDBYTES] = {};
        oid::core::put_u64_be(seed_bytes, seed);

        unsigned char buf[8] = {};
        randombytes_buf_deterministic(buf, sizeof(buf), seed_bytes);
        sodium_memzero(seed_bytes, sizeof(seed_bytes));

        *out = oid::core::get_u64_be(buf) & oid::core::kMask40;
        return oid::core::ok_status();
    }

    oid::core::Status random_u32(u32* out) noexcept {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Security, oid::core::StatusCode::Invalid);
        }

        const oid::core::Status init = ensure_sodium();
        if (!oid::core::is_ok(init)) {
            return init;
        }

        *out = randombytes_random();
        return oid::core::ok_status();
    }
} // namespace oid::security
