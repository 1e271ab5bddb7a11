#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <thread>
#include <unordered_set>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

#include "oid/core/errors.hpp"
#include "oid/host/hashing.hpp"
#include "oid/host/host.hpp"
#include "oid/id/generator.hpp"
#include "oid/id/object_id.hpp"

using namespace std::chrono_literals;

namespace {
static oid::id::GeneratorSeed make_seed(oid::core::u32 counter) {
    oid::id::GeneratorSeed seed{};
    seed.machine = 0x123456u;
    seed.process = 0x789au;
    seed.random = 0xaabbccddeeull;
    seed.counter = counter;
    return seed;
}

static oid::core::u32 counter_delta(oid::core::u32 earlier, oid::core::u32 later) {
    return (later - earlier) & oid::core::kMask24;
}
} // namespace

TEST(Generator, MachineProcessLayout) {
    oid::id::Generator g{make_seed(10)};

    const oid::id::ObjectId id = g.next(0x01020304u);
    const std::array<oid::core::u8, 12> expected = {
        0x01, 0x02, 0x03, 0x04,
        0x12, 0x34, 0x56,
        0x78, 0x9a,
        0x00, 0x00, 0x0b,
    };
    EXPECT_EQ(id.bytes(), expected);
    EXPECT_EQ(id.timestamp(), 0x01020304u);
    EXPECT_EQ(id.machine(), 0x123456u);
    EXPECT_EQ(id.process(), 0x789au);
    EXPECT_EQ(id.counter(), 11u);
}

TEST(Generator, RandomizedLayout) {
    oid::id::Generator g{make_seed(0x112232u)};

    const oid::id::ObjectId id = g.next_object_id(0x65000000u);
    const std::array<oid::core::u8, 12> expected = {
        0x65, 0x00, 0x00, 0x00,
        0xaa, 0xbb, 0xcc, 0xdd,
        0xee, 0x11, 0x22, 0x33,
    };
    EXPECT_EQ(id.bytes(), expected);
}

TEST(Generator, SequentialCallsStepCounterByOne) {
    oid::id::Generator g{make_seed(0)};

    std::vector<oid::id::ObjectId> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.push_back(g.next(777));
    }

    for (size_t i = 1; i < ids.size(); ++i) {
        EXPECT_EQ(ids[i].timestamp(), ids[0].timestamp());
        EXPECT_EQ(ids[i].machine(), ids[0].machine());
        EXPECT_EQ(ids[i].process(), ids[0].process());
        EXPECT_EQ(ids[i].counter(), ids[i - 1].counter() + 1);
        EXPECT_LT(ids[i - 1], ids[i]);
    }
}

TEST(Generator, StrategiesShareOneCounter) {
    oid::id::Generator g{make_seed(100)};

    const oid::id::ObjectId a = g.next(5);
    const oid::id::ObjectId b = g.next_object_id(5);
    const oid::id::ObjectId c = g.next(5);

    EXPECT_EQ(a.counter(), 101u);
    EXPECT_EQ(b.counter(), 102u);
    EXPECT_EQ(c.counter(), 103u);
    EXPECT_EQ(g.next_increment(), 104u);
}

TEST(Generator, CounterWrapsAt24Bits) {
    oid::id::Generator g{make_seed(0x00fffffeu)};

    const oid::id::ObjectId last = g.next(9);
    const oid::id::ObjectId wrapped = g.next(9);
    EXPECT_EQ(last.counter(), 0xffffffu);
    EXPECT_EQ(wrapped.counter(), 0u);

    // not mitigated: the later id sorts first within the same second
    EXPECT_LT(wrapped, last);
}

TEST(Generator, CounterWrapsAtFullWord) {
    oid::id::Generator g{make_seed(0xffffffffu)};
    EXPECT_EQ(g.next_increment(), 0u);
    EXPECT_EQ(g.next_increment(), 1u);
}

TEST(Generator, SeedIsMaskedToFieldWidths) {
    oid::id::GeneratorSeed seed = make_seed(0);
    seed.machine = 0xff123456u;
    seed.random = 0xffffaabbccddeeull;
    oid::id::Generator g{seed};

    EXPECT_EQ(g.seed().machine, 0x123456u);
    EXPECT_EQ(g.seed().random, 0xaabbccddeeull);
    EXPECT_EQ(g.next(1).machine(), 0x123456u);
}

TEST(Generator, ConcurrentCallsNeverRepeat) {
    oid::id::Generator g{make_seed(0)};

    constexpr int kThreads = 8;
    constexpr int kPerThread = 10000;
    std::vector<std::vector<oid::id::ObjectId>> results(kThreads);

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&g, &results, t] {
            results[static_cast<size_t>(t)].reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                results[static_cast<size_t>(t)].push_back((i % 2 == 0) ? g.next(42) : g.next_object_id(42));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::unordered_set<oid::core::u32> counters;
    for (const auto& r : results) {
        for (const auto& id : r) {
            EXPECT_TRUE(counters.insert(id.counter()).second);
        }
    }
    EXPECT_EQ(counters.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(g.next_increment(), static_cast<oid::core::u32>(kThreads * kPerThread + 1));
}

TEST(GeneratorSeed, FromInputsIsDeterministic) {
    const oid::id::GeneratorSeed a = oid::id::generator_seed_from("build-07", 0x12345678u, 638400000000000000ull, 3);
    const oid::id::GeneratorSeed b = oid::id::generator_seed_from("build-07", 0x12345678u, 638400000000000000ull, 3);

    EXPECT_EQ(a.machine, oid::host::machine_name_hash24("build-07"));
    EXPECT_EQ(a.process, 0x5678u);
    EXPECT_EQ(a.counter, 3u);
    EXPECT_EQ(a.random & ~oid::core::kMask40, 0u);

    EXPECT_EQ(a.machine, b.machine);
    EXPECT_EQ(a.process, b.process);
    EXPECT_EQ(a.random, b.random);
}

TEST(GeneratorSeed, RandomDependsOnClock) {
    const oid::id::GeneratorSeed a = oid::id::generator_seed_from("build-07", 99, 1000, 0);
    const oid::id::GeneratorSeed b = oid::id::generator_seed_from("build-07", 99, 1001, 0);
    EXPECT_EQ(a.machine, b.machine);
    EXPECT_NE(a.random, b.random);
}

TEST(GeneratorSeed, FromHostUsesHostDiscriminators) {
    const oid::id::GeneratorSeed seed = oid::id::generator_seed_from_host();
    EXPECT_EQ(seed.machine, oid::host::machine_discriminator());
    EXPECT_EQ(seed.process, oid::host::process_discriminator());
    EXPECT_EQ(seed.random & ~oid::core::kMask40, 0u);
}

TEST(GeneratorSeed, FromHostMatchesProcessGenerator) {
    const oid::id::GeneratorSeed& live = oid::id::process_generator().seed();
    const oid::id::GeneratorSeed fresh = oid::id::generator_seed_from_host();
    EXPECT_EQ(live.machine, fresh.machine);
    EXPECT_EQ(live.process, fresh.process);
}

TEST(ProcessGenerator, BackToBackCallsDifferByOne) {
    const oid::id::ObjectId a = oid::id::new_id(1700000000u);
    const oid::id::ObjectId b = oid::id::new_id(1700000000u);

    EXPECT_EQ(a.timestamp(), b.timestamp());
    EXPECT_EQ(a.machine(), b.machine());
    EXPECT_EQ(a.process(), b.process());
    EXPECT_EQ(counter_delta(a.counter(), b.counter()), 1u);
}

TEST(ProcessGenerator, CarriesHostDiscriminators) {
    const oid::id::ObjectId id = oid::id::new_id();
    EXPECT_EQ(id.machine(), oid::id::machine_hash24());
    EXPECT_EQ(id.machine(), oid::host::machine_discriminator());
    EXPECT_EQ(id.process(), static_cast<oid::core::u16>(static_cast<oid::core::u32>(::getpid()) & 0xffffu));
}

TEST(ProcessGenerator, NowUsesCurrentSecond) {
    const oid::core::u32 before = oid::id::current_timestamp();
    const oid::id::ObjectId a = oid::id::new_id();
    const oid::id::ObjectId b = oid::id::new_object_id();
    const oid::core::u32 after = oid::id::current_timestamp();

    EXPECT_GE(a.timestamp(), before);
    EXPECT_LE(a.timestamp(), after);
    EXPECT_GE(b.timestamp(), before);
    EXPECT_LE(b.timestamp(), after);
}

TEST(ProcessGenerator, StrategiesShareProcessCounter) {
    const oid::id::ObjectId a = oid::id::new_id(10);
    const oid::id::ObjectId b = oid::id::new_object_id(10);
    const oid::id::ObjectId c = oid::id::new_id(10);

    EXPECT_EQ(counter_delta(a.counter(), b.counter()), 1u);
    EXPECT_EQ(counter_delta(b.counter(), c.counter()), 1u);
}

TEST(ProcessGenerator, RandomizedFieldsAreProcessStable) {
    const oid::id::ObjectId a = oid::id::new_object_id(20);
    const oid::id::ObjectId b = oid::id::new_object_id(21);

    EXPECT_TRUE(std::equal(a.bytes().begin() + 4, a.bytes().begin() + 9, b.bytes().begin() + 4));
    EXPECT_EQ(counter_delta(a.counter(), b.counter()), 1u);
    EXPECT_LT(a, b);
}

TEST(ProcessGenerator, CalendarOverloads) {
    oid::id::ObjectId a{};
    ASSERT_EQ(oid::id::new_id_at(oid::core::SysTime{1700000000s + 750ms}, &a).code, oid::core::StatusCode::Ok);
    EXPECT_EQ(a.timestamp(), 1700000000u);

    oid::id::ObjectId b{};
    ASSERT_EQ(oid::id::new_object_id_at(oid::core::SysTime{1700000001s}, &b).code, oid::core::StatusCode::Ok);
    EXPECT_EQ(b.timestamp(), 1700000001u);
    EXPECT_EQ(counter_delta(a.counter(), b.counter()), 1u);
}

TEST(ProcessGenerator, CalendarOutOfRangeConsumesNoCounter) {
    const oid::id::ObjectId before = oid::id::new_id(30);

    oid::id::ObjectId out{};
    EXPECT_EQ(oid::id::new_id_at(oid::core::SysTime{} - 1s, &out).code, oid::core::StatusCode::OutOfRange);
    EXPECT_EQ(oid::id::new_object_id_at(oid::core::SysTime{std::chrono::seconds{0x100000000LL}}, &out).code,
              oid::core::StatusCode::OutOfRange);
    EXPECT_EQ(oid::id::new_id_at(oid::core::SysTime{1s}, nullptr).code, oid::core::StatusCode::Invalid);
    EXPECT_EQ(out, oid::id::kEmptyObjectId);

    const oid::id::ObjectId after = oid::id::new_id(30);
    EXPECT_EQ(counter_delta(before.counter(), after.counter()), 1u);
}

TEST(CreateObjectId, ValidInputsLayout) {
    oid::id::ObjectId id{};
    ASSERT_EQ(oid::id::create_object_id(0x01020304u, 0xaabbccddeeull, 0x112233u, &id).code,
              oid::core::StatusCode::Ok);

    const std::array<oid::core::u8, 12> expected = {
        0x01, 0x02, 0x03, 0x04, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0x11, 0x22, 0x33,
    };
    EXPECT_EQ(id.bytes(), expected);
}

TEST(CreateObjectId, BoundaryValuesAccepted) {
    oid::id::ObjectId id{};
    ASSERT_EQ(oid::id::create_object_id(0xffffffffu, 0xffffffffffull, 0xffffffu, &id).code,
              oid::core::StatusCode::Ok);
    EXPECT_EQ(id, oid::id::kMaxObjectId);

    ASSERT_EQ(oid::id::create_object_id(0, 0, 0, &id).code, oid::core::StatusCode::Ok);
    EXPECT_EQ(id, oid::id::kEmptyObjectId);
}

TEST(CreateObjectId, RejectsWideRandomOrIncrement) {
    oid::id::ObjectId id{};

    const oid::core::Status r = oid::id::create_object_id(1, 0x10000000000ull, 0, &id);
    EXPECT_EQ(r.domain, oid::core::StatusDomain::Id);
    EXPECT_EQ(r.code, oid::core::StatusCode::OutOfRange);

    const oid::core::Status i = oid::id::create_object_id(1, 0, 0x1000000u, &id);
    EXPECT_EQ(i.code, oid::core::StatusCode::OutOfRange);
    EXPECT_EQ(i.aux, 0x1000000u);

    EXPECT_EQ(oid::id::create_object_id(1, 0, 0, nullptr).code, oid::core::StatusCode::Invalid);
    EXPECT_EQ(id, oid::id::kEmptyObjectId);
}
