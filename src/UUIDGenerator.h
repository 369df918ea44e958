#pragma once

#include "UUIDDraft.h"
#include "UUIDSources.h"
#include "UUIDValue.h"

#include <mutex>

/**
 * Common interface of the three generators.
 *
 * Time and entropy are injected through the constructor as a callback plus a
 * user context pointer; nullptr selects the UUIDSources defaults.
 */
class UUIDGenerator {
public:
    typedef UUIDSources::fill_random_fn fill_random_fn;
    typedef UUIDSources::now_fn now_fn;

    virtual ~UUIDGenerator() {}

    /**
     * @brief Generate a new UUID.
     * @param out Receives the UUID on success, untouched otherwise.
     * @return UUID_OK, or UUID_ERR_ENTROPY if the random source failed.
     */
    virtual UUIDStatus generate(UUIDValue& out) = 0;

    /** @brief Version number stamped into every generated UUID. */
    virtual UUIDVersion version() const = 0;

    UUIDGenerator(const UUIDGenerator&) = delete;
    UUIDGenerator& operator=(const UUIDGenerator&) = delete;

protected:
    UUIDGenerator(fill_random_fn rng, void* rng_ctx, now_fn now, void* now_ctx) noexcept;

    // Fills dest from the entropy source, logging on failure.
    bool readEntropy(uint8_t* dest, size_t len) const;
    UUIDTimestamp now() const { return _now(_now_ctx); }

private:
    fill_random_fn _rng;
    void* _rng_ctx;
    now_fn _now;
    void* _now_ctx;
};

/**
 * UUID version 6: 60-bit count of 100 ns intervals since 1582-10-15,
 * most significant bits first, then a 14-bit clock sequence and a 6-byte
 * node identifier.
 *
 * Thread Safety: generate() may be called concurrently. Timestamp, clock
 * sequence and node are read and updated under a per-instance mutex, so no
 * two calls on the same instance yield the same (timestamp, sequence) pair.
 *
 * Clock sequence:
 * - first call: 14 random bits,
 * - clock did not advance (or went back): previous value + 1, wrapping at 14 bits,
 * - clock advanced: previous value kept.
 */
class UUIDv6Generator final : public UUIDGenerator {
public:
    /**
     * @brief Initialize generator with optional custom RNG and Time sources.
     * @param rng Pointer to random fill function (nullptr for default).
     * @param rng_ctx User context for RNG.
     * @param now Pointer to time function (nullptr for default).
     * @param now_ctx User context for time.
     */
    UUIDv6Generator(fill_random_fn rng = nullptr, void* rng_ctx = nullptr,
                    now_fn now = nullptr, void* now_ctx = nullptr) noexcept;

    UUIDStatus generate(UUIDValue& out) override;
    UUIDVersion version() const override { return UUID_VERSION_6; }

    /**
     * @brief Fix the node identifier instead of drawing it from entropy.
     * @param node 6 bytes copied into bytes 10-15 of every UUID.
     */
    void setNode(const uint8_t node[6]);

    /** @brief True once the node is set, explicitly or by the first generate(). */
    bool hasNode() const;

    /**
     * @brief Copy the node identifier out.
     * @return false if no node has been set yet.
     */
    bool node(uint8_t out[6]) const;

    /** @brief Convert a clock reading to 100 ns ticks since 1582-10-15. */
    static int64_t gregorianTicks(const UUIDTimestamp& ts) noexcept;

private:
    mutable std::mutex _mutex;

    // State for Monotonicity
    int64_t _last_ticks;
    int32_t _last_sequence; // -1 until the first UUID is generated

    uint8_t _node[6];
    bool _has_node;
};

/**
 * UUID version 7: 48-bit Unix time in milliseconds followed by 74 random bits.
 *
 * Stateless. Ordering is only guaranteed at millisecond granularity; ties are
 * broken by the random tail, not by a counter.
 */
class UUIDv7Generator final : public UUIDGenerator {
public:
    UUIDv7Generator(fill_random_fn rng = nullptr, void* rng_ctx = nullptr,
                    now_fn now = nullptr, void* now_ctx = nullptr) noexcept;

    UUIDStatus generate(UUIDValue& out) override;
    UUIDVersion version() const override { return UUID_VERSION_7; }

    /** @brief Convert a clock reading to milliseconds since the Unix epoch. */
    static int64_t unixMillis(const UUIDTimestamp& ts) noexcept;
};

/**
 * UUID version 8 filled with 122 random bits. Stateless.
 */
class UUIDv8Generator final : public UUIDGenerator {
public:
    explicit UUIDv8Generator(fill_random_fn rng = nullptr, void* rng_ctx = nullptr) noexcept;

    UUIDStatus generate(UUIDValue& out) override;
    UUIDVersion version() const override { return UUID_VERSION_8; }
};
