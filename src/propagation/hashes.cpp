#include "propagation/hashes.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <memory>
#include <vector>

namespace apmcore::hashes {

namespace {

void xor_with_key(std::vector<uint8_t>& bytes, std::string_view key) {
    if (key.empty()) return;
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] ^= static_cast<uint8_t>(key[i % key.size()]);
    }
}

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::array<uint8_t, 16> md5(std::string_view data) {
    std::array<uint8_t, 16> digest{};
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    unsigned int len = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
        utils::log::error("MD5 digest failed; path hash will be degraded");
        digest.fill(0);
    }
    return digest;
}

} // anonymous namespace

std::string obfuscate_name_using_key(std::string_view name, std::string_view key) {
    std::vector<uint8_t> bytes(name.begin(), name.end());
    xor_with_key(bytes, key);
    return base64::encode(bytes);
}

Result<std::string> deobfuscate_name_using_key(std::string_view obfuscated, std::string_view key) {
    auto bytes = base64::decode(obfuscated);
    if (!bytes) {
        return Result<std::string>::error(ErrorCategory::DECODE_ERROR,
                                          "obfuscated value is not valid base64");
    }
    xor_with_key(*bytes, key);
    return Result<std::string>::ok(std::string(bytes->begin(), bytes->end()));
}

uint32_t get_hash(std::string_view app_name, std::string_view transaction_name) {
    std::string input;
    input.reserve(app_name.size() + 1 + transaction_name.size());
    input.append(app_name).append(";").append(transaction_name);

    const auto digest = md5(input);
    return (static_cast<uint32_t>(digest[12]) << 24) |
           (static_cast<uint32_t>(digest[13]) << 16) |
           (static_cast<uint32_t>(digest[14]) << 8) |
           static_cast<uint32_t>(digest[15]);
}

std::string calculate_path_hash(std::string_view app_name,
                                std::string_view path_name,
                                std::optional<std::string_view> referring_path_hash) {
    uint32_t referring = 0;
    if (referring_path_hash) {
        referring = utils::try_parse_int<uint32_t>(*referring_path_hash, 16).value_or(0);
    }

    const uint32_t rotated = (referring << 1) | (referring >> 31);
    return std::format("{:08x}", rotated ^ get_hash(app_name, path_name));
}

} // namespace apmcore::hashes
