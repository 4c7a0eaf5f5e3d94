#pragma once
/**
 * @file status.hpp
 * @brief Terminal status of a call (gRPC status code space).
 */

#include <cstdint>
#include <string>

namespace sticky::call {

    /// Canonical RPC status codes (numeric values match gRPC).
    enum class StatusCode : uint8_t {
        Ok                 = 0,
        Cancelled          = 1,
        Unknown            = 2,
        InvalidArgument    = 3,
        DeadlineExceeded   = 4,
        NotFound           = 5,
        AlreadyExists      = 6,
        PermissionDenied   = 7,
        ResourceExhausted  = 8,
        FailedPrecondition = 9,
        Aborted            = 10,
        OutOfRange         = 11,
        Unimplemented      = 12,
        Internal           = 13,
        Unavailable        = 14,
        DataLoss           = 15,
        Unauthenticated    = 16
    };

    const char* to_string(StatusCode c) noexcept;

    /** @struct Status
     *  @brief Code plus human-readable details.
     */
    struct Status {
        StatusCode  code{StatusCode::Ok}; ///< Terminal code
        std::string details;              ///< Server/transport message

        bool ok() const noexcept { return code == StatusCode::Ok; }

        bool operator==(const Status&) const = default;
    };

} // namespace sticky::call
