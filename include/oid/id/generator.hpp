#pragma once

#include <atomic>
#include <type_traits>

#include "oid/core/errors.hpp"
#include "oid/core/types.hpp"
#include "oid/id/object_id.hpp"

namespace oid::id {

    // Process-stable inputs of a Generator. Built once from the host, or
    // from fixed values when the caller needs reproducible identifiers.
    struct GeneratorSeed {
        u32 machine{0};  // 24-bit machine discriminator
        u16 process{0};  // low 16 bits of the process id
        u64 random{0};   // 40-bit value used by the randomized strategy
        u32 counter{0};  // counter value before the first increment
    };

    static_assert(std::is_trivially_copyable_v<GeneratorSeed>);
    static_assert(std::is_standard_layout_v<GeneratorSeed>);

    // random is derived from (clock_ticks ^ machine hash ^ process_id)
    [[nodiscard]] GeneratorSeed generator_seed_from(const char* machine_name,
        u32 process_id,
        u64 clock_ticks,
        u32 initial_counter) noexcept;

    // Host name, process id, clock and a CSPRNG counter start. Host failures
    // degrade to "" and 0; this never reports an error.
    [[nodiscard]] GeneratorSeed generator_seed_from_host();

    class Generator {
    public:
        explicit Generator(const GeneratorSeed& seed) noexcept;

        Generator(const Generator&) = delete;
        Generator& operator=(const Generator&) = delete;

        // timestamp | machine(3) | process(2) | counter(3)
        [[nodiscard]] ObjectId next(u32 timestamp) noexcept;

        // timestamp | random >> 8 (4) | random low byte | counter(3)
        [[nodiscard]] ObjectId next_object_id(u32 timestamp) noexcept;

        // One atomic increment of the counter shared by both strategies,
        // masked to 24 bits
        [[nodiscard]] u32 next_increment() noexcept;

        [[nodiscard]] const GeneratorSeed& seed() const noexcept { return seed_; }

    private:
        GeneratorSeed seed_;
        u32 machine_pid_;
        std::atomic<u32> counter_;
    };

    // Built from generator_seed_from_host() on first use
    [[nodiscard]] Generator& process_generator();

    [[nodiscard]] u32 machine_hash24();

    // Current UTC seconds, floored and truncated to 32 bits
    [[nodiscard]] u32 current_timestamp() noexcept;

    // ========================================================================
    // Machine/process strategy
    // ========================================================================

    [[nodiscard]] ObjectId new_id();
    [[nodiscard]] ObjectId new_id(u32 timestamp);
    [[nodiscard]] oid::core::Status new_id_at(oid::core::SysTime t, ObjectId* out);

    // ========================================================================
    // Randomized strategy
    // ========================================================================

    [[nodiscard]] ObjectId new_object_id();
    [[nodiscard]] ObjectId new_object_id(u32 timestamp);
    [[nodiscard]] oid::core::Status new_object_id_at(oid::core::SysTime t, ObjectId* out);

    // OutOfRange unless random fits 40 bits and increment fits 24 bits
    [[nodiscard]] oid::core::Status create_object_id(u32 timestamp,
        u64 random,
        u32 increment,
        ObjectId* out) noexcept;

} // namespace oid::id
