/**
 * @file uuid.hpp
 * @brief RFC 4122 UUID value type
 *
 * A UUID is stored as four 32-bit words. In canonical text the words map
 * onto the five RFC 4122 fields like this:
 *
 *   123e4567-e89b-12d3-a456-426655440000
 *   aaaaaaaa-bbbb-bbbb-cccc-ccccdddddddd
 *   llllllll-mmmm-hhhh-ssss-nnnnnnnnnnnn
 *   xxxxxxxx-xxxx-Vxxx-Nxxx-xxxxxxxxxxxx
 *                 ^    ^
 *           Version    Variant
 */

#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <array>
#include <vector>
#include <optional>
#include <ostream>
#include <functional>

#include "types.hpp"
#include "result.hpp"
#include "uuid_error.hpp"

namespace uuidkit {

/// Known UUID versions (see RFC 4122; V2 is DCE Security)
enum class UuidVersion {
    V1 = 1,     // Timestamp and MAC address
    V2 = 2,     // DCE Security
    V3 = 3,     // MD5 name-based
    V4 = 4,     // Random
    V5 = 5,     // SHA-1 name-based
};

/// Known UUID variants
enum class UuidVariant {
    ReservedNcsBackwardsCompatible,
    IsoRfc4122Standard,
    ReservedMicrosoft,
    ReservedFuture,
};

/// Bit pattern in the top nibble of clock_seq_hi_and_reserved selecting the variant
uint32_t variantMask(UuidVariant variant);

const char* toString(UuidVersion version);
const char* toString(UuidVariant variant);

/**
 * @brief UUID (Universally Unique Identifier)
 *
 * Immutable. A default-constructed UUID is the nil UUID.
 */
class UUID {
public:
    using Words = std::array<uint32_t, 4>;

    /// Create the nil UUID
    constexpr UUID() : m_a(0), m_b(0), m_c(0), m_d(0) {}

    /// The all-zero UUID, 00000000-0000-0000-0000-000000000000
    static constexpr UUID nil() { return UUID(); }

    /**
     * @brief Create a UUID from the five canonical fields
     *
     *   llllllll-mmmm-hhhh-ssss-nnnnnnnnnnnn
     *
     * Each field must fit its width: l 32 bits, m/h/s 16 bits, n 48 bits.
     * The first field out of range is reported as ErrorCode::OutOfRange.
     */
    static Result<UUID, UuidError> fromFields(int64_t l, int64_t m, int64_t h, int64_t s, int64_t n);

    /**
     * @brief Pack the five canonical fields without validation
     *
     * Only for callers that already bounded the values. Bits of n above
     * bit 47 are dropped.
     */
    static UUID fromFieldsUnchecked(uint32_t l, uint16_t m, uint16_t h, uint16_t s, uint64_t n);

    /// Create a UUID directly from its four words (no validation)
    static constexpr UUID fromWords(const Words& words) {
        return UUID(words[0], words[1], words[2], words[3]);
    }

    /// Create a UUID from a word list, which must hold exactly four words
    static Result<UUID, UuidError> fromWordList(const std::vector<uint32_t>& words);

    /**
     * @brief Parse the canonical 36-character form (hex is case-insensitive)
     *
     * Fails with InvalidLength on a wrong length, and with InvalidFormat
     * naming the position of the first bad character otherwise.
     */
    static Result<UUID, UuidError> parse(std::string_view text);

    /// Parse, logging and returning the nil UUID on invalid input
    static UUID fromString(std::string_view text);

    /// Whether text is a 36-character 8-4-4-4-12 hex string. Never throws.
    static bool isValid(std::string_view text) noexcept;

    // ========== Decoded Fields ==========

    /// Version from the high nibble of time_hi_and_version; nullopt if not 1..5
    std::optional<UuidVersion> version() const;

    /// Variant from the top bits of clock_seq_hi_and_reserved; nullopt if 1111
    std::optional<UuidVariant> variant() const;

    /**
     * @brief Clock sequence with the variant bits removed
     *
     * For V1 this avoids duplicates when the clock or node changes, for
     * V3/V5 it is derived from the name, for V4 it is random.
     */
    uint16_t clock() const;

    /// 48-bit node, either a MAC address or random bits
    uint64_t node() const;

    /// Creation time for V1 UUIDs, truncated to whole seconds
    std::optional<UtcTime> time() const;

    /// 60-bit count of 100ns intervals since 1582-10-15 for V1 UUIDs
    std::optional<uint64_t> gregorianTicks() const;

    // ========== Raw RFC 4122 Fields ==========

    uint32_t timeLow() const { return m_a; }
    uint16_t timeMid() const { return static_cast<uint16_t>(m_b >> 16); }
    uint16_t timeHiAndVersion() const { return static_cast<uint16_t>(m_b & 0xffff); }
    uint16_t clockSeq() const { return static_cast<uint16_t>(m_c >> 16); }

    /// Check if UUID is null (all zeros)
    bool isNull() const {
        return m_a == 0 && m_b == 0 && m_c == 0 && m_d == 0;
    }

    Words toWords() const { return {m_a, m_b, m_c, m_d}; }

    /// Canonical lowercase form, e.g. "123e4567-e89b-12d3-a456-426655440000"
    std::string toString() const;

    bool operator==(const UUID& other) const {
        return m_a == other.m_a && m_b == other.m_b && m_c == other.m_c && m_d == other.m_d;
    }

    bool operator!=(const UUID& other) const {
        return !(*this == other);
    }

    bool operator<(const UUID& other) const {
        return toWords() < other.toWords();
    }

private:
    constexpr UUID(uint32_t a, uint32_t b, uint32_t c, uint32_t d)
        : m_a(a), m_b(b), m_c(c), m_d(d) {}

    uint32_t m_a;   // time_low
    uint32_t m_b;   // time_mid, time_hi_and_version
    uint32_t m_c;   // clock_seq_hi_and_reserved, clock_seq_low, node (high 16 bits)
    uint32_t m_d;   // node (low 32 bits)
};

std::ostream& operator<<(std::ostream& os, const UUID& uuid);

} // namespace uuidkit

// Hash support for std::unordered_map
namespace std {
template<>
struct hash<uuidkit::UUID> {
    size_t operator()(const uuidkit::UUID& uuid) const {
        size_t h = 0;
        for (uint32_t word : uuid.toWords()) {
            h ^= std::hash<uint32_t>{}(word) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};
} // namespace std
