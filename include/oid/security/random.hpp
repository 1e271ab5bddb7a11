#pragma once

#include "oid/core/errors.hpp"
#include "oid/core/types.hpp"

namespace oid::security {
    using u32 = oid::core::u32;
    using u64 = oid::core::u64;

    // Deterministic 40-bit value for a seed: the same seed yields the same
    // value in every process. Unavailable if libsodium cannot initialise.
    [[nodiscard]] oid::core::Status random40_from_seed(u64 seed, u64* out) noexcept;

    // Unpredictable 32-bit value from the system CSPRNG
    [[nodiscard]] oid::core::Status random_u32(u32* out) noexcept;

} // namespace oid::security
