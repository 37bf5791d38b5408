// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "kzg.hpp"
#include <c_kzg_4844.h>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace evmpre::crypto
{
namespace
{
struct FileDeleter
{
    void operator()(std::FILE* f) const noexcept { std::fclose(f); }
};

class CkzgVerifier : public KzgVerifier
{
    KZGSettings m_settings{};

public:
    explicit CkzgVerifier(const std::filesystem::path& trusted_setup)
    {
        const std::unique_ptr<std::FILE, FileDeleter> file{
            std::fopen(trusted_setup.string().c_str(), "r")};
        if (!file)
            throw std::runtime_error{"cannot open trusted setup file: " + trusted_setup.string()};

        if (load_trusted_setup_file(&m_settings, file.get()) != C_KZG_OK)
            throw std::runtime_error{"invalid trusted setup file: " + trusted_setup.string()};
    }

    ~CkzgVerifier() override { free_trusted_setup(&m_settings); }

    CkzgVerifier(const CkzgVerifier&) = delete;
    CkzgVerifier& operator=(const CkzgVerifier&) = delete;

    ErrorCode verify_proof(const uint8_t z[32], const uint8_t y[32], const uint8_t commitment[48],
        const uint8_t proof[48]) const noexcept override
    {
        // c-kzg reports non-canonical scalars as C_KZG_BADARGS, like invalid points.
        if (intx::be::unsafe::load<intx::uint256>(z) >= BLS_MODULUS ||
            intx::be::unsafe::load<intx::uint256>(y) >= BLS_MODULUS)
            return INVALID_FIELD_ELEMENT;

        Bytes48 c;
        Bytes32 zz;
        Bytes32 yy;
        Bytes48 pi;
        std::memcpy(c.bytes, commitment, sizeof(c.bytes));
        std::memcpy(zz.bytes, z, sizeof(zz.bytes));
        std::memcpy(yy.bytes, y, sizeof(yy.bytes));
        std::memcpy(pi.bytes, proof, sizeof(pi.bytes));

        bool ok = false;
        switch (verify_kzg_proof(&ok, &c, &zz, &yy, &pi, &m_settings))
        {
        case C_KZG_OK:
            return ok ? SUCCESS : VERIFICATION_FAILED;
        case C_KZG_BADARGS:
            // The field elements are checked above, so this is an invalid point.
            return INVALID_POINT;
        default:
            return VERIFICATION_FAILED;
        }
    }
};
}  // namespace

std::unique_ptr<KzgVerifier> create_ckzg_verifier(const std::filesystem::path& trusted_setup)
{
    return std::make_unique<CkzgVerifier>(trusted_setup);
}
}  // namespace evmpre::crypto
