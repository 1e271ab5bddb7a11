#pragma once

#include <string>

#include "oid/core/errors.hpp"
#include "oid/core/types.hpp"

namespace oid::host {
    using u16 = oid::core::u16;
    using u32 = oid::core::u32;
    using u64 = oid::core::u64;

    // gethostname(); Unavailable with errno in aux on failure
    [[nodiscard]] oid::core::Status host_machine_name(std::string* out);

    // getpid(); Unavailable if the OS refuses
    [[nodiscard]] oid::core::Status host_process_id(u32* out) noexcept;

    // Process id, 0 when the OS refuses it. Never reports an error.
    [[nodiscard]] u32 process_id_or_zero() noexcept;

    // Low 16 bits of process_id_or_zero()
    [[nodiscard]] u16 process_discriminator() noexcept;

    // Hash of the host name ("" when it cannot be read). The name is read
    // on the first call only.
    [[nodiscard]] u32 machine_discriminator();

    // system_clock ticks since the epoch, for seeding
    [[nodiscard]] u64 host_clock_ticks() noexcept;

} // namespace oid::host
