#pragma once

#include <cstddef>
#include <cstdint>

namespace constants
{
    // Size of one Merkle leaf. Fixed across the system.
    constexpr std::size_t CHUNK_SIZE = 1024;

    constexpr std::size_t DEFAULT_BATCH_TARGET_BYTES = 10 * 1024 * 1024;

    // 1.5 GiB
    constexpr uint64_t MAX_FINGERPRINTABLE_BYTES = 1536ULL * 1024 * 1024;

    constexpr std::size_t DEFAULT_READ_FRAGMENT_BYTES = 64 * 1024;
}
