#pragma once

#include "UUIDDraft.h"

#include <string.h>
#include <ostream>
#include <string>

/**
 * 16-byte UUID in network (big-endian) byte order.
 *
 * Field layout is positional: version is the high nibble of byte 6, variant
 * the top two bits of byte 8. The bytes are fixed at construction.
 */
class UUIDValue {
public:
    /** @brief Nil UUID (all zero). */
    UUIDValue() noexcept {
        memset(_b, 0, sizeof(_b));
    }

    /**
     * @brief Build a UUID from 16 raw bytes.
     * @param bytes Source 16-byte array.
     */
    static UUIDValue fromBytes(const uint8_t bytes[16]) noexcept {
        UUIDValue v;
        memcpy(v._b, bytes, 16);
        return v;
    }

    /** @brief 00000000-0000-0000-0000-000000000000 */
    static UUIDValue nil() noexcept { return UUIDValue(); }

    /** @brief ffffffff-ffff-ffff-ffff-ffffffffffff */
    static UUIDValue max() noexcept {
        UUIDValue v;
        memset(v._b, 0xFF, sizeof(v._b));
        return v;
    }

    /**
     * @brief Access raw 16 bytes.
     * @return Pointer to internal byte array.
     */
    const uint8_t* data() const noexcept { return _b; }

    /** @brief Version field (0..15), high nibble of byte 6. */
    int version() const noexcept { return _b[6] >> 4; }

    /** @brief Variant field (0..3), top two bits of byte 8. RFC layout is 2. */
    int variant() const noexcept { return _b[8] >> 6; }

    bool isNil() const noexcept;
    bool isMax() const noexcept;

    /**
     * @brief Format UUID as text.
     * @param out Destination buffer (must be >= 37 bytes for dashed, >= 33 for raw).
     * @param buflen Length of destination buffer.
     * @param uppercase If true, uses UPPERCASE hex.
     * @param dashes If false, omits hyphens (32-char result).
     * @return true if successful, false if buffer is missing or too small.
     */
    bool toString(char* out, size_t buflen, bool uppercase = false, bool dashes = true) const noexcept;

    /** @brief Canonical 36-character lowercase form. */
    std::string toString() const;

    /**
     * @brief Parse the canonical "8-4-4-4-12" form.
     *
     * Exactly 36 characters, hyphens at 8, 13, 18 and 23, hex digits
     * everywhere else (either case). On failure @p out is left untouched.
     *
     * @param str Source string.
     * @param out Destination UUID.
     * @return UUID_OK or UUID_ERR_INVALID_FORMAT.
     */
    static UUIDStatus parse(const char* str, UUIDValue& out) noexcept;
    static UUIDStatus parse(const std::string& str, UUIDValue& out) noexcept;

    // --- Comparison Operators ---

    /** @brief Check if two UUIDs are identical. */
    bool operator==(const UUIDValue& other) const noexcept { return memcmp(_b, other._b, 16) == 0; }

    /** @brief Check if two UUIDs are different. */
    bool operator!=(const UUIDValue& other) const noexcept { return !(*this == other); }

    /** @brief Byte-wise ordering, matches creation order for v6 and v7. */
    bool operator<(const UUIDValue& other) const noexcept { return memcmp(_b, other._b, 16) < 0; }

    friend std::ostream& operator<<(std::ostream& os, const UUIDValue& uuid) {
        char buf[37];
        uuid.toString(buf, sizeof(buf));
        os << buf;
        return os;
    }

private:
    uint8_t _b[16];
};

inline bool equal(const UUIDValue& a, const UUIDValue& b) noexcept { return a == b; }
inline bool isNil(const UUIDValue& uuid) noexcept { return uuid.isNil(); }
inline bool isMax(const UUIDValue& uuid) noexcept { return uuid.isMax(); }
