// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "bn254.hpp"

namespace evmpre::crypto::bn254
{
bool is_on_curve(const intx::uint256& x, const intx::uint256& y) noexcept
{
    if (x == 0 && y == 0)
        return true;

    const auto y2 = intx::mulmod(y, y, FIELD_PRIME);
    const auto x3 = intx::mulmod(intx::mulmod(x, x, FIELD_PRIME), x, FIELD_PRIME);
    return y2 == intx::addmod(x3, 3, FIELD_PRIME);
}
}  // namespace evmpre::crypto::bn254
