// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <system_error>

namespace evmpre
{
/// The precompile failure kinds.
///
/// Kinds are for diagnostics only: every failure has the same externally observable
/// gas/output contract.
enum ErrorCode : int
{
    SUCCESS = 0,
    NOT_PRECOMPILE,
    OUT_OF_GAS,
    INVALID_INPUT,
    INVALID_INPUT_LENGTH,
    INPUT_TOO_LARGE,
    INVALID_FIELD_ELEMENT,
    POINT_NOT_ON_CURVE,
    POINT_NOT_IN_SUBGROUP,
    INVALID_POINT,
    INVALID_SIGNATURE,
    INVALID_VERSIONED_HASH,
    VERIFICATION_FAILED,
    INVALID_FINAL_FLAG,
};

/// Obtains a reference to the static error category object for evmpre errors.
inline const std::error_category& evmpre_category() noexcept
{
    struct Category : std::error_category
    {
        [[nodiscard]] const char* name() const noexcept final { return "evmpre"; }

        [[nodiscard]] std::string message(int ev) const noexcept final
        {
            switch (ev)
            {
            case SUCCESS:
                return "success";
            case NOT_PRECOMPILE:
                return "address is not a precompile";
            case OUT_OF_GAS:
                return "out of gas";
            case INVALID_INPUT:
                return "invalid input";
            case INVALID_INPUT_LENGTH:
                return "invalid input length";
            case INPUT_TOO_LARGE:
                return "input too large";
            case INVALID_FIELD_ELEMENT:
                return "invalid field element encoding";
            case POINT_NOT_ON_CURVE:
                return "point not on curve";
            case POINT_NOT_IN_SUBGROUP:
                return "point not in subgroup";
            case INVALID_POINT:
                return "invalid curve point";
            case INVALID_SIGNATURE:
                return "invalid signature";
            case INVALID_VERSIONED_HASH:
                return "invalid versioned hash";
            case VERIFICATION_FAILED:
                return "verification failed";
            case INVALID_FINAL_FLAG:
                return "invalid final block indicator flag";
            default:
                return "unknown error";
            }
        }
    };

    static const Category category_instance;
    return category_instance;
}

/// Creates error_code object out of an evmpre error code value.
inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, evmpre_category()};
}
}  // namespace evmpre
