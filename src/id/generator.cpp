#include "oid/id/generator.hpp"

#include <chrono>

#include "oid/host/hashing.hpp"
#include "oid/host/host.hpp"
#include "oid/security/random.hpp"

namespace oid::id {
    namespace {
        [[nodiscard]] constexpr u32 compose_machine_pid(u32 machine, u16 process) noexcept {
            return ((machine & oid::core::kMask24) << 8) | ((static_cast<u32>(process) >> 8) & 0xffu);
        }

        [[nodiscard]] constexpr u32 compose_pid_increment(u16 process, u32 increment) noexcept {
            return (static_cast<u32>(process) << 24) | (increment & oid::core::kMask24);
        }

        [[nodiscard]] constexpr ObjectId compose_random(u32 timestamp, u64 random, u32 increment) noexcept {
            const u32 high = static_cast<u32>(random >> 8);
            const u32 low = (static_cast<u32>(random & 0xffu) << 24) | (increment & oid::core::kMask24);
            return ObjectId::from_words_unchecked(timestamp, high, low);
        }

        // process_id is the full id; only the random seed mixes all of it in
        [[nodiscard]] GeneratorSeed seed_from_parts(u32 machine,
            u16 process,
            u32 process_id,
            u64 clock_ticks,
            u32 initial_counter) noexcept {
            GeneratorSeed seed{};
            seed.machine = machine & oid::core::kMask24;
            seed.process = process;
            seed.counter = initial_counter;

            const u64 mixed = clock_ticks ^ static_cast<u64>(seed.machine) ^ static_cast<u64>(process_id);
            u64 random = 0;
            if (!oid::core::is_ok(oid::security::random40_from_seed(mixed, &random))) {
                random = mixed & oid::core::kMask40;
            }
            seed.random = random;
            return seed;
        }
    } // namespace

    GeneratorSeed generator_seed_from(const char* machine_name,
        u32 process_id,
        u64 clock_ticks,
        u32 initial_counter) noexcept {
        return seed_from_parts(oid::host::machine_name_hash24(machine_name),
                               static_cast<u16>(process_id & 0xffffu),
                               process_id,
                               clock_ticks,
                               initial_counter);
    }

    GeneratorSeed generator_seed_from_host() {
        const u64 ticks = oid::host::host_clock_ticks();

        u32 counter = 0;
        if (!oid::core::is_ok(oid::security::random_u32(&counter))) {
            counter = static_cast<u32>(ticks);
        }

        return seed_from_parts(oid::host::machine_discriminator(),
                               oid::host::process_discriminator(),
                               oid::host::process_id_or_zero(),
                               ticks,
                               counter);
    }

    Generator::Generator(const GeneratorSeed& seed) noexcept
        : seed_(seed), machine_pid_(compose_machine_pid(seed.machine, seed.process)), counter_(seed.counter) {
        seed_.machine &= oid::core::kMask24;
        seed_.random &= oid::core::kMask40;
    }

    u32 Generator::next_increment() noexcept {
        return (counter_.fetch_add(1, std::memory_order_relaxed) + 1) & oid::core::kMask24;
    }

    ObjectId Generator::next(u32 timestamp) noexcept {
        const u32 increment = next_increment();
        return ObjectId::from_words_unchecked(timestamp, machine_pid_, compose_pid_increment(seed_.process, increment));
    }

    ObjectId Generator::next_object_id(u32 timestamp) noexcept {
        const u32 increment = next_increment();
        return compose_random(timestamp, seed_.random, increment);
    }

    Generator& process_generator() {
        static Generator generator{generator_seed_from_host()};
        return generator;
    }

    u32 machine_hash24() {
        return process_generator().seed().machine;
    }

    u32 current_timestamp() noexcept {
        const auto secs = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch());
        return static_cast<u32>(static_cast<u64>(secs.count()));
    }

    ObjectId new_id() {
        return process_generator().next(current_timestamp());
    }

    ObjectId new_id(u32 timestamp) {
        return process_generator().next(timestamp);
    }

    oid::core::Status new_id_at(oid::core::SysTime t, ObjectId* out) {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::Invalid);
        }

        u32 timestamp = 0;
        const oid::core::Status s = timestamp_from_time(t, &timestamp);
        if (!oid::core::is_ok(s)) {
            return s;
        }

        *out = process_generator().next(timestamp);
        return oid::core::ok_status();
    }

    ObjectId new_object_id() {
        return process_generator().next_object_id(current_timestamp());
    }

    ObjectId new_object_id(u32 timestamp) {
        return process_generator().next_object_id(timestamp);
    }

    oid::core::Status new_object_id_at(oid::core::SysTime t, ObjectId* out) {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::Invalid);
        }

        u32 timestamp = 0;
        const oid::core::Status s = timestamp_from_time(t, &timestamp);
        if (!oid::core::is_ok(s)) {
            return s;
        }

        *out = process_generator().next_object_id(timestamp);
        return oid::core::ok_status();
    }

    oid::core::Status create_object_id(u32 timestamp, u64 random, u32 increment, ObjectId* out) noexcept {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::Invalid);
        }
        if (random > oid::core::kMask40) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::OutOfRange);
        }
        if (increment > oid::core::kMask24) {
            return oid::core::make_status(oid::core::StatusDomain::Id, oid::core::StatusCode::OutOfRange, increment);
        }

        *out = compose_random(timestamp, random, increment);
        return oid::core::ok_status();
    }

} // namespace oid::id
