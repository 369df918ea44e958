#pragma once

#define UUIDDRAFT_LIB_VERSION "1.0.0"

#include <stdint.h>
#include <stddef.h>

// Width of the v6 clock sequence after the variant bits are reserved.
#ifndef UUIDDRAFT_SEQUENCE_MASK
    #define UUIDDRAFT_SEQUENCE_MASK 0x3FFF
#endif

// Seconds between 1582-10-15T00:00:00Z and 1970-01-01T00:00:00Z
#ifndef UUIDDRAFT_GREGORIAN_OFFSET_S
    #define UUIDDRAFT_GREGORIAN_OFFSET_S 12219292800LL
#endif

enum UUIDVersion {
    UUID_VERSION_6 = 6, // Reordered Gregorian time + clock sequence + node
    UUID_VERSION_7 = 7, // Unix epoch milliseconds + random
    UUID_VERSION_8 = 8  // Fully random
};

enum UUIDStatus {
    UUID_OK = 0,
    UUID_ERR_ENTROPY,       // Random source could not supply the requested bytes
    UUID_ERR_INVALID_FORMAT // Text is not a canonical 36-character UUID
};

/**
 * @brief Human readable name of a status code.
 */
const char* uuidStatusString(UUIDStatus status) noexcept;
