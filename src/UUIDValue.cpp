#include "UUIDValue.h"

const char* uuidStatusString(UUIDStatus status) noexcept {
    switch (status) {
        case UUID_OK: return "ok";
        case UUID_ERR_ENTROPY: return "entropy source failure";
        case UUID_ERR_INVALID_FORMAT: return "invalid UUID";
    }
    return "unknown";
}

bool UUIDValue::isNil() const noexcept {
    uint8_t acc = 0;
    for (size_t i = 0; i < sizeof(_b); i++) acc |= _b[i];
    return acc == 0;
}

bool UUIDValue::isMax() const noexcept {
    uint8_t acc = 0xFF;
    for (size_t i = 0; i < sizeof(_b); i++) acc &= _b[i];
    return acc == 0xFF;
}

// Canonical "8-4-4-4-12" layout: byte count of each hyphen-separated group.
static const int kGroupBytes[5] = { 4, 2, 2, 2, 6 };

bool UUIDValue::toString(char* out, size_t buflen, bool uppercase, bool dashes) const noexcept {
    size_t required = dashes ? 37 : 33;
    if (!out || buflen < required) return false;

    const char* digits = uppercase ? "0123456789ABCDEF" : "0123456789abcdef";
    const uint8_t* p = _b;
    char* s = out;

    for (int g = 0; g < 5; g++) {
        if (dashes && g > 0) *s++ = '-';
        for (int k = 0; k < kGroupBytes[g]; k++, p++) {
            *s++ = digits[*p >> 4];
            *s++ = digits[*p & 0x0F];
        }
    }

    *s = '\0';
    return true;
}

std::string UUIDValue::toString() const {
    char buf[37];
    toString(buf, sizeof(buf));
    return std::string(buf, 36);
}

// Value of one hex digit, or -1.
static int nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    c = (char)(c | 0x20); // fold A-F onto a-f
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

static UUIDStatus parseCanonical(const char* str, size_t len, UUIDValue& out) noexcept {
    if (!str || len != 36) return UUID_ERR_INVALID_FORMAT;

    uint8_t bytes[16];
    uint8_t* dst = bytes;
    const char* p = str;

    // Hyphens must sit at offsets 8, 13, 18 and 23
    for (int g = 0; g < 5; g++) {
        if (g > 0 && *p++ != '-') return UUID_ERR_INVALID_FORMAT;
        for (int k = 0; k < kGroupBytes[g]; k++) {
            int hi = nibble(p[0]);
            int lo = nibble(p[1]);
            if (hi < 0 || lo < 0) return UUID_ERR_INVALID_FORMAT;
            *dst++ = (uint8_t)((hi << 4) | lo);
            p += 2;
        }
    }

    out = UUIDValue::fromBytes(bytes);
    return UUID_OK;
}

UUIDStatus UUIDValue::parse(const char* str, UUIDValue& out) noexcept {
    if (!str) return UUID_ERR_INVALID_FORMAT;
    return parseCanonical(str, strlen(str), out);
}

UUIDStatus UUIDValue::parse(const std::string& str, UUIDValue& out) noexcept {
    // size() rather than strlen() so embedded NULs are rejected
    return parseCanonical(str.data(), str.size(), out);
}
