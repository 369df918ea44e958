#include "UUIDSources.h"

#include <chrono>
#include <climits>

#include <openssl/rand.h>

bool UUIDSources::default_fill_random(uint8_t* dest, size_t len, void* ctx) noexcept {
    (void)ctx;
    if (len == 0) return true;
    if (!dest || len > INT_MAX) return false;
    return RAND_bytes(dest, (int)len) == 1;
}

UUIDTimestamp UUIDSources::default_now(void* ctx) noexcept {
    (void)ctx;
    using namespace std::chrono;
    nanoseconds since = duration_cast<nanoseconds>(system_clock::now().time_since_epoch());
    seconds secs = duration_cast<seconds>(since);
    if (since < secs) secs -= seconds(1); // floor for pre-1970 clocks

    UUIDTimestamp ts;
    ts.seconds = (int64_t)secs.count();
    ts.nanoseconds = (uint32_t)(since - secs).count();
    return ts;
}
