/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "secure_memory.h"

#include <cstring>

// Check for explicit_bzero availability
#if defined(__GLIBC__) && \
    (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 25))
#define CHALRESP_HAVE_EXPLICIT_BZERO 1
#elif defined(__OpenBSD__) || defined(__FreeBSD__) || defined(__NetBSD__)
#define CHALRESP_HAVE_EXPLICIT_BZERO 1
#else
#define CHALRESP_HAVE_EXPLICIT_BZERO 0
#endif

namespace YubiKeyChalResp {
namespace Shared {

void SecureMemory::secureZero(void *ptr, size_t size)
{
    if (!ptr || size == 0) {
        return;
    }

#if CHALRESP_HAVE_EXPLICIT_BZERO
    explicit_bzero(ptr, size);
#else
    // Volatile stores keep the compiler from eliding the wipe
    // NOLINTNEXTLINE(misc-const-correctness)
    volatile unsigned char *p = static_cast<volatile unsigned char *>(ptr);
    for (size_t i = 0; i < size; ++i) {
        p[i] = 0;
    }
#endif
}

void SecureMemory::wipeByteArray(QByteArray &data)
{
    if (data.isEmpty()) {
        return;
    }

    // Get mutable data pointer (detaches if shared)
    // NOLINTNEXTLINE(misc-const-correctness) - we need to modify data
    char *ptr = data.data();
    const qsizetype size = data.size();

    secureZero(ptr, static_cast<size_t>(size));

    // Clear the array (deallocates)
    data.clear();
}

} // namespace Shared
} // namespace YubiKeyChalResp
