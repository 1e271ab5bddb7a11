#include "oid/host/host.hpp"

#include <cerrno>
#include <cstddef>
#include <chrono>
#include <cstring>

#include <limits.h>
#include <unistd.h>

#include "oid/host/hashing.hpp"

namespace oid::host {
    namespace {
#if defined(HOST_NAME_MAX)
        constexpr std::size_t kHostNameCap = HOST_NAME_MAX + 1;
#else
        constexpr std::size_t kHostNameCap = 256;
#endif
    } // namespace

    oid::core::Status host_machine_name(std::string* out) {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Host, oid::core::StatusCode::Invalid);
        }

        char buf[kHostNameCap];
        std::memset(buf, 0, sizeof(buf));
        if (::gethostname(buf, sizeof(buf) - 1) != 0) {
            return oid::core::make_status(oid::core::StatusDomain::Host,
                                          oid::core::StatusCode::Unavailable,
                                          static_cast<u32>(errno));
        }

        out->assign(buf);
        return oid::core::ok_status();
    }

    oid::core::Status host_process_id(u32* out) noexcept {
        if (out == nullptr) {
            return oid::core::make_status(oid::core::StatusDomain::Host, oid::core::StatusCode::Invalid);
        }

        const pid_t pid = ::getpid();
        if (pid < 0) {
            return oid::core::make_status(oid::core::StatusDomain::Host, oid::core::StatusCode::Unavailable);
        }

        *out = static_cast<u32>(pid);
        return oid::core::ok_status();
    }

    u32 process_id_or_zero() noexcept {
        u32 pid = 0;
        if (!oid::core::is_ok(host_process_id(&pid))) {
            return 0;
        }
        return pid;
    }

    u16 process_discriminator() noexcept {
        return static_cast<u16>(process_id_or_zero() & 0xffffu);
    }

    u32 machine_discriminator() {
        static const u32 machine = [] {
            std::string name;
            if (!oid::core::is_ok(host_machine_name(&name))) {
                name.clear();
            }
            return machine_name_hash24(name.c_str());
        }();
        return machine;
    }

    u64 host_clock_ticks() noexcept {
        return static_cast<u64>(std::chrono::system_clock::now().time_since_epoch().count());
    }

} // namespace oid::host
