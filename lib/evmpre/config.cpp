// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmpre/evmpre.hpp>
#include <nlohmann/json.hpp>
#include <istream>
#include <stdexcept>
#include <string>

namespace evmpre
{
namespace json = nlohmann;

evmc_revision to_revision(std::string_view name)
{
    if (name == "Frontier")
        return EVMC_FRONTIER;
    if (name == "Homestead")
        return EVMC_HOMESTEAD;
    if (name == "Tangerine Whistle" || name == "EIP150")
        return EVMC_TANGERINE_WHISTLE;
    if (name == "Spurious Dragon" || name == "EIP158")
        return EVMC_SPURIOUS_DRAGON;
    if (name == "Byzantium")
        return EVMC_BYZANTIUM;
    if (name == "Constantinople")
        return EVMC_CONSTANTINOPLE;
    if (name == "Petersburg" || name == "ConstantinopleFix")
        return EVMC_PETERSBURG;
    if (name == "Istanbul")
        return EVMC_ISTANBUL;
    if (name == "Berlin")
        return EVMC_BERLIN;
    if (name == "London" || name == "ArrowGlacier")
        return EVMC_LONDON;
    if (name == "Paris" || name == "Merge")
        return EVMC_PARIS;
    if (name == "Shanghai")
        return EVMC_SHANGHAI;
    if (name == "Cancun")
        return EVMC_CANCUN;
    if (name == "Prague")
        return EVMC_PRAGUE;
    if (name == "Osaka")
        return EVMC_OSAKA;
    throw std::invalid_argument{"unknown revision: " + std::string{name}};
}

namespace
{
template <typename T>
T from_json(const json::json& j, std::string_view key);

template <>
std::string from_json<std::string>(const json::json& j, std::string_view key)
{
    if (!j.is_string())
        throw std::invalid_argument{"config: " + std::string{key} + " must be a string"};
    return j.get<std::string>();
}

template <>
bool from_json<bool>(const json::json& j, std::string_view key)
{
    if (!j.is_boolean())
        throw std::invalid_argument{"config: " + std::string{key} + " must be a boolean"};
    return j.get<bool>();
}

template <>
size_t from_json<size_t>(const json::json& j, std::string_view key)
{
    if (!j.is_number_unsigned())
        throw std::invalid_argument{
            "config: " + std::string{key} + " must be a non-negative integer"};
    return j.get<size_t>();
}

Secp256k1Backend to_secp256k1_backend(std::string_view s)
{
    if (s == "libsecp256k1")
        return Secp256k1Backend::libsecp256k1;
    if (s == "silkpre")
        return Secp256k1Backend::silkpre;
    throw std::invalid_argument{"config: unknown secp256k1 backend: " + std::string{s}};
}

KzgBackend to_kzg_backend(std::string_view s)
{
    if (s == "blst")
        return KzgBackend::blst;
    if (s == "ckzg")
        return KzgBackend::ckzg;
    throw std::invalid_argument{"config: unknown kzg backend: " + std::string{s}};
}

ExpmodBackend to_expmod_backend(std::string_view s)
{
    if (s == "gmp")
        return ExpmodBackend::gmp;
    if (s == "openssl")
        return ExpmodBackend::openssl;
    throw std::invalid_argument{"config: unknown expmod backend: " + std::string{s}};
}
}  // namespace

Config load_config(std::istream& in)
{
    json::json j;
    try
    {
        j = json::json::parse(in);
    }
    catch (const json::json::parse_error& e)
    {
        throw std::invalid_argument{std::string{"config: "} + e.what()};
    }
    if (!j.is_object())
        throw std::invalid_argument{"config: must be a JSON object"};

    Config config;
    for (const auto& [key, value] : j.items())
    {
        if (key == "fork")
            config.revision = to_revision(from_json<std::string>(value, key));
        else if (key == "secp256k1")
            config.secp256k1 = to_secp256k1_backend(from_json<std::string>(value, key));
        else if (key == "kzg")
            config.kzg = to_kzg_backend(from_json<std::string>(value, key));
        else if (key == "kzg_trusted_setup")
            config.kzg_trusted_setup = from_json<std::string>(value, key);
        else if (key == "expmod")
            config.expmod = to_expmod_backend(from_json<std::string>(value, key));
        else if (key == "p256verify")
            config.p256verify = from_json<bool>(value, key);
        else if (key == "ecpairing_max_input_size")
            config.ecpairing_max_input_size = from_json<size_t>(value, key);
        else if (key == "bls12_g1msm_max_input_size")
            config.bls12_g1msm_max_input_size = from_json<size_t>(value, key);
        else if (key == "bls12_g2msm_max_input_size")
            config.bls12_g2msm_max_input_size = from_json<size_t>(value, key);
        else if (key == "bls12_pairing_check_max_input_size")
            config.bls12_pairing_check_max_input_size = from_json<size_t>(value, key);
        else
            throw std::invalid_argument{"config: unknown key: " + key};
    }
    return config;
}
}  // namespace evmpre
