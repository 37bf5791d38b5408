// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "secp256r1.hpp"
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <memory>

namespace evmpre::crypto::secp256r1
{
namespace
{
struct BnDeleter
{
    void operator()(BIGNUM* p) const noexcept { BN_free(p); }
};
struct EcGroupDeleter
{
    void operator()(EC_GROUP* p) const noexcept { EC_GROUP_free(p); }
};
struct EcPointDeleter
{
    void operator()(EC_POINT* p) const noexcept { EC_POINT_free(p); }
};
struct EcdsaSigDeleter
{
    void operator()(ECDSA_SIG* p) const noexcept { ECDSA_SIG_free(p); }
};
struct PkeyDeleter
{
    void operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter
{
    void operator()(EVP_PKEY_CTX* p) const noexcept { EVP_PKEY_CTX_free(p); }
};
struct OpensslDeleter
{
    void operator()(unsigned char* p) const noexcept { OPENSSL_free(p); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;

BnPtr to_bn(const intx::uint256& v) noexcept
{
    uint8_t bytes[32];
    intx::be::unsafe::store(bytes, v);
    return BnPtr{BN_bin2bn(bytes, static_cast<int>(sizeof(bytes)), nullptr)};
}

/// Checks that (x, y) is a point of the P-256 curve. The point at infinity is not.
bool is_on_curve(const intx::uint256& qx, const intx::uint256& qy) noexcept
{
    const std::unique_ptr<EC_GROUP, EcGroupDeleter> group{
        EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1)};
    if (!group)
        return false;
    const std::unique_ptr<EC_POINT, EcPointDeleter> point{EC_POINT_new(group.get())};
    const auto x = to_bn(qx);
    const auto y = to_bn(qy);
    if (!point || !x || !y)
        return false;

    // Setting the coordinates fails for points not on the curve.
    if (EC_POINT_set_affine_coordinates(group.get(), point.get(), x.get(), y.get(), nullptr) != 1)
        return false;
    return EC_POINT_is_on_curve(group.get(), point.get(), nullptr) == 1;
}

/// Builds the EVP public key object from the uncompressed point encoding.
std::unique_ptr<EVP_PKEY, PkeyDeleter> make_public_key(
    const intx::uint256& qx, const intx::uint256& qy) noexcept
{
    uint8_t encoded[65];
    encoded[0] = POINT_CONVERSION_UNCOMPRESSED;
    intx::be::unsafe::store(&encoded[1], qx);
    intx::be::unsafe::store(&encoded[33], qy);

    const std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)};
    if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1)
        return nullptr;

    char group_name[] = "prime256v1";
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group_name, 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, encoded, sizeof(encoded)),
        OSSL_PARAM_construct_end(),
    };

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, params) != 1)
        return nullptr;
    return std::unique_ptr<EVP_PKEY, PkeyDeleter>{pkey};
}
}  // namespace

ErrorCode verify(const uint8_t h[32], const intx::uint256& r, const intx::uint256& s,
    const intx::uint256& qx, const intx::uint256& qy) noexcept
{
    if (r == 0 || r >= ORDER || s == 0 || s >= ORDER)
        return INVALID_SIGNATURE;

    if (qx >= FIELD_PRIME || qy >= FIELD_PRIME)
        return INVALID_FIELD_ELEMENT;

    if (!is_on_curve(qx, qy))
        return POINT_NOT_ON_CURVE;

    const std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter> sig{ECDSA_SIG_new()};
    auto sig_r = to_bn(r);
    auto sig_s = to_bn(s);
    if (!sig || !sig_r || !sig_s)
        return INVALID_SIGNATURE;
    // The signature takes ownership of r and s.
    if (ECDSA_SIG_set0(sig.get(), sig_r.get(), sig_s.get()) != 1)
        return INVALID_SIGNATURE;
    sig_r.release();
    sig_s.release();

    unsigned char* der = nullptr;
    const auto der_size = i2d_ECDSA_SIG(sig.get(), &der);
    if (der_size <= 0)
        return INVALID_SIGNATURE;
    const std::unique_ptr<unsigned char, OpensslDeleter> der_guard{der};

    const auto pkey = make_public_key(qx, qy);
    if (!pkey)
        return POINT_NOT_ON_CURVE;

    const std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx{
        EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr)};
    if (!ctx || EVP_PKEY_verify_init(ctx.get()) != 1)
        return INVALID_SIGNATURE;

    return EVP_PKEY_verify(ctx.get(), der, static_cast<size_t>(der_size), h, 32) == 1 ?
               SUCCESS :
               INVALID_SIGNATURE;
}
}  // namespace evmpre::crypto::secp256r1
