#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nostrcast
{
namespace util
{
/**
 * @brief Encodes bytes as a lowercase hex string.
 */
std::string toHex(const uint8_t* data, size_t length);

std::string toHex(const std::vector<uint8_t>& data);

/**
 * @brief Decodes a hex string.
 * @throws `std::invalid_argument` if the string has odd length or contains non-hex characters.
 */
std::vector<uint8_t> fromHex(const std::string& hex);

/**
 * @brief Indicates whether the string is hex of exactly the given length.  A length of zero
 * accepts any even, non-empty length.
 */
bool isHex(const std::string& value, size_t length = 0);

std::string toLower(std::string value);

/**
 * @brief Percent-encodes every byte outside the RFC 3986 unreserved set.
 */
std::string percentEncode(const std::string& value);

/**
 * @brief Decodes `%XX` escapes and `+` in a URI query component.
 */
std::string percentDecode(const std::string& value);
} // namespace util
} // namespace nostrcast
