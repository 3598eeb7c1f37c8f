#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace apmcore::hashes {

/**
 * @brief Obfuscate a header payload with the account's encoding key
 *
 * XOR of each byte with key[i % key.size()], then base64. An empty key
 * leaves the bytes as they are.
 */
[[nodiscard]] std::string obfuscate_name_using_key(std::string_view name, std::string_view key);

/**
 * @brief Reverse obfuscate_name_using_key
 * @return Plain text, or DECODE_ERROR when the input is not valid base64
 */
[[nodiscard]] Result<std::string> deobfuscate_name_using_key(std::string_view obfuscated,
                                                             std::string_view key);

/**
 * @brief Low 32 bits (big-endian) of MD5("<app_name>;<transaction_name>")
 */
[[nodiscard]] uint32_t get_hash(std::string_view app_name, std::string_view transaction_name);

/**
 * @brief Identify this transaction's position in a cross-process call chain
 *
 * rotl32(referring, 1) ^ get_hash(app, path), rendered as 8 lowercase hex
 * chars. A missing or unparsable referring hash counts as 0.
 */
[[nodiscard]] std::string calculate_path_hash(std::string_view app_name,
                                              std::string_view path_name,
                                              std::optional<std::string_view> referring_path_hash);

} // namespace apmcore::hashes
