#include "oid/core/errors.hpp"

namespace oid::core {

    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok:
            return "ok";
        case StatusCode::Unknown:
            return "unknown";
        case StatusCode::Invalid:
            return "invalid";
        case StatusCode::InvalidLength:
            return "invalid_length";
        case StatusCode::OutOfRange:
            return "out_of_range";
        case StatusCode::Unavailable:
            return "unavailable";
        }
        return "unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core:
            return "core";
        case StatusDomain::Id:
            return "id";
        case StatusDomain::Host:
            return "host";
        case StatusDomain::Security:
            return "security";
        case StatusDomain::External:
            return "external";
        }
        return "unknown";
    }

    void status_print(std::FILE* out, const char* context, Status s) noexcept {
        if (out == nullptr) {
            return;
        }
        std::fprintf(out, "error: %s failed (code=%s, domain=%s, aux=%u)\n",
                     context != nullptr ? context : "operation",
                     status_code_name(s.code),
                     status_domain_name(s.domain),
                     s.aux);
    }

} // namespace oid::core
