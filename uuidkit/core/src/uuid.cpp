/**
 * @file uuid.cpp
 * @brief UUID packing, parsing, decoding and formatting
 */

#include <uuidkit/core/uuid.hpp>
#include <uuidkit/core/logger.hpp>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace uuidkit {

namespace {

constexpr std::size_t kCanonicalLength = 36;

/// Offsets of the hyphens in the canonical form
constexpr std::array<std::size_t, 4> kHyphenPositions = {8, 13, 18, 23};

constexpr uint64_t kPow2To32 = 0x100000000ULL;

struct VariantEntry {
    UuidVariant variant;
    uint32_t mask;
};

// Masks overlap: the order is the match priority.
constexpr std::array<VariantEntry, 4> kVariantTable = {{
    {UuidVariant::ReservedFuture, 0xe},                   // 1110
    {UuidVariant::ReservedMicrosoft, 0xc},                // 110x
    {UuidVariant::IsoRfc4122Standard, 0x8},               // 10xx
    {UuidVariant::ReservedNcsBackwardsCompatible, 0x0},   // 0xxx
}};

constexpr std::optional<UuidVariant> matchVariant(uint32_t digit) {
    for (const auto& entry : kVariantTable) {
        if ((digit & entry.mask) == entry.mask) {
            return entry.variant;
        }
    }
    return std::nullopt;
}

constexpr bool variantTableCoversAllDigits() {
    // 0xf is the unknown variant and never reaches the table.
    for (uint32_t digit = 0; digit < 0xf; ++digit) {
        if (!matchVariant(digit)) {
            return false;
        }
    }
    return true;
}

static_assert(variantTableCoversAllDigits(),
              "variant table must match every nibble except 0xf");

constexpr bool isHexDigit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

constexpr bool isHyphenPosition(std::size_t i) {
    for (std::size_t pos : kHyphenPositions) {
        if (pos == i) {
            return true;
        }
    }
    return false;
}

std::optional<UuidError> checkField(const char* name, int64_t value, int bits) {
    const int64_t upper = (int64_t{1} << bits) - 1;
    if (value < 0 || value > upper) {
        return UuidError::outOfRange(name, 0, upper, value);
    }
    return std::nullopt;
}

/// Parse length hex digits of text starting at offset
Result<uint64_t, UuidError> parseHexGroup(std::string_view text, std::size_t offset, std::size_t length) {
    const char* first = text.data() + offset;
    const char* last = first + length;

    uint64_t value = 0;
    std::from_chars_result res = std::from_chars(first, last, value, 16);
    if (res.ptr != last) {
        // from_chars stops at the first character that is not a hex digit
        return UuidError::invalidHexDigit(text, static_cast<std::size_t>(res.ptr - text.data()));
    }
    if (res.ec != std::errc{}) {
        return UuidError::invalidHexDigit(text, offset);
    }
    return value;
}

std::optional<UuidError> expectHyphen(std::string_view text, std::size_t position) {
    if (text[position] != '-') {
        return UuidError::unexpectedChar(text, position, '-');
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Variant / Version helpers
// ============================================================================

uint32_t variantMask(UuidVariant variant) {
    for (const auto& entry : kVariantTable) {
        if (entry.variant == variant) {
            return entry.mask;
        }
    }
    throw std::logic_error("variantMask: variant missing from table");
}

const char* toString(UuidVersion version) {
    switch (version) {
        case UuidVersion::V1: return "v1";
        case UuidVersion::V2: return "v2";
        case UuidVersion::V3: return "v3";
        case UuidVersion::V4: return "v4";
        case UuidVersion::V5: return "v5";
        default: return "unknown";
    }
}

const char* toString(UuidVariant variant) {
    switch (variant) {
        case UuidVariant::ReservedNcsBackwardsCompatible: return "reservedNcsBackwardsCompatible";
        case UuidVariant::IsoRfc4122Standard: return "isoRfc4122Standard";
        case UuidVariant::ReservedMicrosoft: return "reservedMicrosoft";
        case UuidVariant::ReservedFuture: return "reservedFuture";
        default: return "unknown";
    }
}

// ============================================================================
// Construction
// ============================================================================

Result<UUID, UuidError> UUID::fromFields(int64_t l, int64_t m, int64_t h, int64_t s, int64_t n) {
    for (auto err : {checkField("l", l, 32),
                     checkField("m", m, 16),
                     checkField("h", h, 16),
                     checkField("s", s, 16),
                     checkField("n", n, 48)}) {
        if (err) {
            UUIDKIT_LOG_DEBUG("Rejected UUID fields: {}", err->message());
            return *err;
        }
    }

    return fromFieldsUnchecked(static_cast<uint32_t>(l),
                               static_cast<uint16_t>(m),
                               static_cast<uint16_t>(h),
                               static_cast<uint16_t>(s),
                               static_cast<uint64_t>(n));
}

UUID UUID::fromFieldsUnchecked(uint32_t l, uint16_t m, uint16_t h, uint16_t s, uint64_t n) {
    const uint32_t a = l;
    const uint32_t b = (static_cast<uint32_t>(m) << 16) | h;
    const uint32_t c = (static_cast<uint32_t>(s) << 16) | static_cast<uint32_t>((n >> 32) & 0xffff);
    const uint32_t d = static_cast<uint32_t>(n & 0xffffffff);
    return UUID(a, b, c, d);
}

Result<UUID, UuidError> UUID::fromWordList(const std::vector<uint32_t>& words) {
    if (words.size() != 4) {
        return UuidError::wrongWordCount(words.size());
    }
    return UUID(words[0], words[1], words[2], words[3]);
}

// ============================================================================
// Parsing
// ============================================================================

Result<UUID, UuidError> UUID::parse(std::string_view text) {
    if (text.size() != kCanonicalLength) {
        auto err = UuidError::wrongTextLength(text, text.size());
        UUIDKIT_LOG_DEBUG("Rejected UUID text: {}", err.message());
        return err;
    }

    // llllllll-mmmm-hhhh-ssss-nnnnnnnnnnnn
    struct Group {
        std::size_t offset;
        std::size_t length;
    };
    constexpr std::array<Group, 5> kGroups = {{{0, 8}, {9, 4}, {14, 4}, {19, 4}, {24, 12}}};

    std::array<uint64_t, 5> fields{};
    for (std::size_t i = 0; i < kGroups.size(); ++i) {
        auto group = parseHexGroup(text, kGroups[i].offset, kGroups[i].length);
        if (!group) {
            UUIDKIT_LOG_DEBUG("Rejected UUID text: {}", group.error().message());
            return group.error();
        }
        fields[i] = group.value();

        if (i < kHyphenPositions.size()) {
            if (auto err = expectHyphen(text, kHyphenPositions[i])) {
                UUIDKIT_LOG_DEBUG("Rejected UUID text: {}", err->message());
                return *err;
            }
        }
    }

    // Group widths already bound every field.
    return fromFieldsUnchecked(static_cast<uint32_t>(fields[0]),
                               static_cast<uint16_t>(fields[1]),
                               static_cast<uint16_t>(fields[2]),
                               static_cast<uint16_t>(fields[3]),
                               fields[4]);
}

UUID UUID::fromString(std::string_view text) {
    auto parsed = parse(text);
    if (!parsed) {
        UUIDKIT_LOG_WARN("Invalid UUID string, using nil: {}", parsed.error().message());
        return nil();
    }
    return parsed.value();
}

bool UUID::isValid(std::string_view text) noexcept {
    if (text.size() != kCanonicalLength) {
        return false;
    }
    for (std::size_t i = 0; i < kCanonicalLength; ++i) {
        const bool ok = isHyphenPosition(i) ? text[i] == '-' : isHexDigit(text[i]);
        if (!ok) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Decoded Fields
// ============================================================================

std::optional<UuidVersion> UUID::version() const {
    const uint32_t code = (m_b & 0xf000) >> 12;
    if (code >= 1 && code <= 5) {
        return static_cast<UuidVersion>(code);
    }
    return std::nullopt;
}

std::optional<UuidVariant> UUID::variant() const {
    const uint32_t digit = m_c >> 28;
    if ((digit & 0xf) == 0xf) {
        return std::nullopt;
    }

    auto matched = matchVariant(digit);
    if (!matched) {
        UUIDKIT_LOG_CRITICAL("Variant table has no entry for digit {:#x}", digit);
        throw std::logic_error("UUID variant table is not exhaustive");
    }
    return matched;
}

uint16_t UUID::clock() const {
    auto v = variant();
    const uint32_t mask = v ? variantMask(*v) : 0x0;
    return static_cast<uint16_t>((m_c >> 16) - (mask << 12));
}

uint64_t UUID::node() const {
    return static_cast<uint64_t>(m_d) + static_cast<uint64_t>(m_c & 0xffff) * kPow2To32;
}

std::optional<uint64_t> UUID::gregorianTicks() const {
    if (version() != UuidVersion::V1) {
        return std::nullopt;
    }

    // llllllll-mmmm-xhhh: hi(12) . mid(16) . low(32)
    const uint64_t hi = m_b & 0x0fff;
    const uint64_t mid = m_b >> 16;
    const uint64_t low = m_a;
    return (hi << 48) | (mid << 32) | low;
}

std::optional<UtcTime> UUID::time() const {
    auto ticks = gregorianTicks();
    if (!ticks) {
        return std::nullopt;
    }

    const int64_t gregorianSeconds = static_cast<int64_t>(*ticks / kTicksPerSecond);
    const int64_t unixSeconds = gregorianSeconds - kGregorianToUnixSeconds;
    return UtcTime(Milliseconds(unixSeconds * 1000));
}

// ============================================================================
// Formatting
// ============================================================================

std::string UUID::toString() const {
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const UUID& uuid) {
    std::ios::fmtflags flags(os.flags());
    const char fill = os.fill();

    os << std::hex << std::nouppercase << std::setfill('0')
       << std::setw(8) << uuid.timeLow() << '-'
       << std::setw(4) << uuid.timeMid() << '-'
       << std::setw(4) << uuid.timeHiAndVersion() << '-'
       << std::setw(4) << uuid.clockSeq() << '-'
       << std::setw(12) << uuid.node();

    os.fill(fill);
    os.flags(flags);
    return os;
}

} // namespace uuidkit
