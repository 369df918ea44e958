#include "UUIDGenerator.h"
#include "UUIDLog.h"

#include <string.h>

// --- INTERNAL HELPERS ---

// Writes the low (n * 8) bits of v into dest, most significant byte first.
static void putBigEndian(uint8_t* dest, uint64_t v, int n) noexcept {
    for (int i = n - 1; i >= 0; i--) {
        dest[i] = (uint8_t)(v & 0xFF);
        v >>= 8;
    }
}

static void stampVersionAndVariant(uint8_t b[16], UUIDVersion v) noexcept {
    b[6] = (b[6] & 0x0F) | (uint8_t)((uint8_t)v << 4);
    b[8] = (b[8] & 0x3F) | 0x80;
}

// --- UUIDGenerator ---

UUIDGenerator::UUIDGenerator(fill_random_fn rng, void* rng_ctx, now_fn now, void* now_ctx) noexcept
    : _rng(rng ? rng : &UUIDSources::default_fill_random), _rng_ctx(rng_ctx),
      _now(now ? now : &UUIDSources::default_now), _now_ctx(now_ctx)
{
}

bool UUIDGenerator::readEntropy(uint8_t* dest, size_t len) const {
    if (_rng(dest, len, _rng_ctx)) return true;
    UUIDLog::error("uuid v{}: entropy source failed to supply {} bytes", (int)version(), len);
    return false;
}

// --- UUIDv6Generator ---

UUIDv6Generator::UUIDv6Generator(fill_random_fn rng, void* rng_ctx, now_fn now, void* now_ctx) noexcept
    : UUIDGenerator(rng, rng_ctx, now, now_ctx),
      _last_ticks(0), _last_sequence(-1), _has_node(false)
{
    memset(_node, 0, sizeof(_node));
}

int64_t UUIDv6Generator::gregorianTicks(const UUIDTimestamp& ts) noexcept {
    return (ts.seconds + UUIDDRAFT_GREGORIAN_OFFSET_S) * 10000000LL + (int64_t)(ts.nanoseconds / 100);
}

void UUIDv6Generator::setNode(const uint8_t node[6]) {
    std::lock_guard<std::mutex> lock(_mutex);
    memcpy(_node, node, sizeof(_node));
    _has_node = true;
}

bool UUIDv6Generator::hasNode() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _has_node;
}

bool UUIDv6Generator::node(uint8_t out[6]) const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_has_node) return false;
    memcpy(out, _node, sizeof(_node));
    return true;
}

UUIDStatus UUIDv6Generator::generate(UUIDValue& out) {
    uint8_t b[16];

    {
        std::lock_guard<std::mutex> lock(_mutex);
        int64_t ticks = gregorianTicks(now());

        if (!_has_node) {
            uint8_t fresh[6];
            if (!readEntropy(fresh, sizeof(fresh))) return UUID_ERR_ENTROPY;
            memcpy(_node, fresh, sizeof(_node));
            _has_node = true;
            UUIDLog::debug("uuid v6: node initialised from entropy source");
        }

        int32_t sequence;
        if (_last_sequence < 0) {
            uint8_t seed[2];
            if (!readEntropy(seed, sizeof(seed))) return UUID_ERR_ENTROPY;
            sequence = ((seed[0] << 8) | seed[1]) & UUIDDRAFT_SEQUENCE_MASK;
        } else if (ticks <= _last_ticks) {
            if (ticks < _last_ticks) {
                UUIDLog::debug("uuid v6: clock moved back {} ticks", _last_ticks - ticks);
            }
            sequence = (_last_sequence + 1) & UUIDDRAFT_SEQUENCE_MASK;
            if (sequence == 0) {
                UUIDLog::debug("uuid v6: clock sequence wrapped at tick {}", ticks);
            }
        } else {
            sequence = _last_sequence;
        }

        _last_ticks = ticks;
        _last_sequence = sequence;

        uint64_t t = (uint64_t)ticks & 0x0FFFFFFFFFFFFFFFULL;
        putBigEndian(b, t >> 28, 4);     // time_high
        putBigEndian(b + 4, t >> 12, 2); // time_mid
        putBigEndian(b + 6, t, 2);       // time_low (12 bits) + version
        putBigEndian(b + 8, (uint64_t)sequence, 2);
        memcpy(b + 10, _node, sizeof(_node));
    }

    stampVersionAndVariant(b, UUID_VERSION_6);
    out = UUIDValue::fromBytes(b);
    return UUID_OK;
}

// --- UUIDv7Generator ---

UUIDv7Generator::UUIDv7Generator(fill_random_fn rng, void* rng_ctx, now_fn now, void* now_ctx) noexcept
    : UUIDGenerator(rng, rng_ctx, now, now_ctx)
{
}

int64_t UUIDv7Generator::unixMillis(const UUIDTimestamp& ts) noexcept {
    return ts.seconds * 1000LL + (int64_t)(ts.nanoseconds / 1000000);
}

UUIDStatus UUIDv7Generator::generate(UUIDValue& out) {
    uint8_t b[16];
    if (!readEntropy(b + 6, 10)) return UUID_ERR_ENTROPY;

    uint64_t ms = (uint64_t)unixMillis(now()) & 0x0000FFFFFFFFFFFFULL;
    putBigEndian(b, ms, 6);

    stampVersionAndVariant(b, UUID_VERSION_7);
    out = UUIDValue::fromBytes(b);
    return UUID_OK;
}

// --- UUIDv8Generator ---

UUIDv8Generator::UUIDv8Generator(fill_random_fn rng, void* rng_ctx) noexcept
    : UUIDGenerator(rng, rng_ctx, nullptr, nullptr)
{
}

UUIDStatus UUIDv8Generator::generate(UUIDValue& out) {
    uint8_t b[16];
    if (!readEntropy(b, sizeof(b))) return UUID_ERR_ENTROPY;

    stampVersionAndVariant(b, UUID_VERSION_8);
    out = UUIDValue::fromBytes(b);
    return UUID_OK;
}
