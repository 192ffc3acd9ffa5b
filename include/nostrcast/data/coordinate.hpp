#pragma once

#include <optional>
#include <string>

namespace nostrcast
{
namespace data
{
/**
 * @brief The address of a parameterized replaceable resource, written `<kind>:<pubkey>:<d>`.
 * @remark Coordinates arrive from relays with inconsistent pubkey casing.  Only normalized
 * coordinates may be used as lookup keys.
 */
struct Coordinate
{
    int kind = 0;
    std::string pubkey; ///< Lowercase hex pubkey of the resource author.
    std::string identifier; ///< Value of the resource's `d` tag.

    /**
     * @brief Lower-cases the pubkey segment of a coordinate, leaving the kind and identifier
     * untouched.
     * @remark Idempotent.  Strings with fewer than three segments are lower-cased entirely.
     */
    static std::string normalize(const std::string& coordinate);

    /**
     * @brief Parses a coordinate with a numeric kind and a 64-character hex pubkey.
     * @returns The parsed coordinate with a lowercase pubkey, or nothing if the shape is wrong.
     */
    static std::optional<Coordinate> parse(const std::string& coordinate);

    /**
     * @brief Builds a normalized coordinate string from its parts.
     */
    static std::string make(int kind, const std::string& pubkey, const std::string& identifier);

    std::string toString() const;
};
} // namespace data
} // namespace nostrcast
