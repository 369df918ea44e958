#pragma once

#include "UUIDDraft.h"

/** @brief Wall-clock instant relative to the Unix epoch. */
struct UUIDTimestamp {
    int64_t seconds;      // Seconds since 1970-01-01T00:00:00Z (may be negative)
    uint32_t nanoseconds; // 0..999999999
};

class UUIDSources {
public:
    /**
     * Entropy callback. Must fill all @p len bytes of @p dest.
     * @return false if the source could not supply the bytes.
     */
    typedef bool (*fill_random_fn)(uint8_t* dest, size_t len, void* ctx);

    /** Clock callback. Must have sub-millisecond resolution for v6. */
    typedef UUIDTimestamp (*now_fn)(void* ctx);

    // --- Default Platform Implementations ---

    /** @brief OpenSSL RAND_bytes (CSPRNG, safe to call from several threads). */
    static bool default_fill_random(uint8_t* dest, size_t len, void* ctx) noexcept;

    /** @brief std::chrono::system_clock. */
    static UUIDTimestamp default_now(void* ctx) noexcept;
};
