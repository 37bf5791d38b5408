// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "modexp.hpp"
#include <openssl/bn.h>
#include <limits>
#include <memory>

namespace evmpre::crypto
{
namespace
{
struct BnDeleter
{
    void operator()(BIGNUM* p) const noexcept { BN_free(p); }
};
struct BnCtxDeleter
{
    void operator()(BN_CTX* p) const noexcept { BN_CTX_free(p); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;

BnPtr load(std::span<const uint8_t> bytes) noexcept
{
    return BnPtr{BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr)};
}
}  // namespace

bool expmod_openssl(std::span<const uint8_t> base, std::span<const uint8_t> exp,
    std::span<const uint8_t> mod, uint8_t* output) noexcept
{
    static constexpr auto MAX_SIZE = static_cast<size_t>(std::numeric_limits<int>::max());
    if (base.size() > MAX_SIZE || exp.size() > MAX_SIZE || mod.size() > MAX_SIZE)
        return false;

    const auto b = load(base);
    const auto e = load(exp);
    const auto m = load(mod);
    const auto r = BnPtr{BN_new()};
    const std::unique_ptr<BN_CTX, BnCtxDeleter> ctx{BN_CTX_new()};
    if (!b || !e || !m || !r || !ctx || BN_is_zero(m.get()))
        return false;

    if (BN_mod_exp(r.get(), b.get(), e.get(), m.get(), ctx.get()) != 1)
        return false;

    return BN_bn2binpad(r.get(), output, static_cast<int>(mod.size())) >= 0;
}
}  // namespace evmpre::crypto
