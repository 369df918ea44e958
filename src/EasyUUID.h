#pragma once

#include "UUIDGenerator.h"

#include <string>
#include <string.h>

/*
 * EasyUUID - High-Level Wrapper over the default generators
 *
 * FEATURES:
 * - One process-wide generator per version, built on first use with the
 *   default sources (OpenSSL entropy, system clock).
 * - Internal buffer caching (toCharArray() returns stable pointer).
 *
 * Failures are returned to the caller, never retried.
 */
class EasyUUID final {
public:
    // --- Default generators ---

    static UUIDv6Generator& defaultV6() {
        static UUIDv6Generator g;
        return g;
    }

    static UUIDv7Generator& defaultV7() {
        static UUIDv7Generator g;
        return g;
    }

    static UUIDv8Generator& defaultV8() {
        static UUIDv8Generator g;
        return g;
    }

    static UUIDGenerator& defaultFor(UUIDVersion v) {
        switch (v) {
            case UUID_VERSION_6: return defaultV6();
            case UUID_VERSION_8: return defaultV8();
            case UUID_VERSION_7: break;
        }
        return defaultV7();
    }

    static UUIDStatus v6(UUIDValue& out) { return defaultV6().generate(out); }
    static UUIDStatus v7(UUIDValue& out) { return defaultV7().generate(out); }
    static UUIDStatus v8(UUIDValue& out) { return defaultV8().generate(out); }

    // --- Instance wrapper ---

    explicit EasyUUID(UUIDVersion v = UUID_VERSION_7) : _generator(defaultFor(v)) {
        memset(_cacheBuffer, 0, sizeof(_cacheBuffer));
    }

    /**
     * @brief Generates a new UUID from the default generator of this version.
     * Updates the internal string cache on success.
     */
    UUIDStatus generate() {
        UUIDStatus st = _generator.generate(_value);
        if (st == UUID_OK) {
            _value.toString(_cacheBuffer, sizeof(_cacheBuffer));
        }
        return st;
    }

    UUIDVersion version() const { return _generator.version(); }

    /** @brief Last generated UUID (nil before the first success). */
    const UUIDValue& value() const { return _value; }

    /**
     * @brief Returns pointer to internal char buffer.
     * Empty string until generate() succeeds.
     */
    const char* toCharArray() const { return _cacheBuffer; }

    /**
     * @brief Returns the UUID as text with optional formatting.
     * @param uppercase If true, uses UPPERCASE hex.
     * @param dashes If false, omits hyphens.
     */
    std::string toString(bool uppercase = false, bool dashes = true) const {
        char buf[37];
        _value.toString(buf, sizeof(buf), uppercase, dashes);
        return std::string(buf);
    }

    // Allows: std::string s = uuid;
    operator std::string() const {
        return toString();
    }

private:
    UUIDGenerator& _generator;
    UUIDValue _value;
    char _cacheBuffer[37];
};
