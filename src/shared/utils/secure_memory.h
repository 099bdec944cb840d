/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>

namespace YubiKeyChalResp {
namespace Shared {

/**
 * @brief Utilities for secure memory handling of key material
 *
 * Provides secure wiping of buffers holding HMAC secrets, AES keys and
 * configuration payloads so they do not linger in memory dumps, core
 * dumps or swap after the configuration call that needed them.
 */
class SecureMemory
{
public:
    /**
     * @brief Securely zeroes a raw buffer
     * @param ptr Pointer to memory (may be null)
     * @param size Size in bytes
     *
     * Uses explicit_bzero if available, fallback to volatile stores.
     */
    static void secureZero(void *ptr, size_t size);

    /**
     * @brief Securely wipes QByteArray contents from memory
     * @param data QByteArray to wipe
     *
     * Overwrites the byte array with zeros, then clears it.
     * @note Wiping detaches a shared QByteArray first, so the caller must
     *       hold the only reference for the wipe to reach the original buffer.
     */
    static void wipeByteArray(QByteArray &data);

    /**
     * @brief RAII owner of secret bytes with automatic secure wiping
     *
     * Move-only: the secret has exactly one owner at a time and is zeroed
     * when that owner goes out of scope.
     *
     * Example:
     * @code
     * {
     *     SecureBytes secret(HmacKey::generate().bytes());
     *     auto config = SlotConfiguration::build(Mode::Sha1, std::move(secret), flags);
     *     // secret (and the moved-into copy) wiped when their scopes end
     * }
     * @endcode
     */
    class SecureBytes
    {
    public:
        /**
         * @brief Takes ownership of the given bytes
         *
         * The buffer is deep-copied into storage owned by this object and
         * the argument is wiped, so no second reference to the secret survives.
         */
        explicit SecureBytes(QByteArray data)
            : m_data(data.constData(), data.size())
        {
            SecureMemory::wipeByteArray(data);
        }

        SecureBytes() = default;

        ~SecureBytes() {
            SecureMemory::wipeByteArray(m_data);
        }

        SecureBytes(const SecureBytes &) = delete;
        SecureBytes &operator=(const SecureBytes &) = delete;

        SecureBytes(SecureBytes &&other) noexcept : m_data(std::move(other.m_data)) {}
        SecureBytes &operator=(SecureBytes &&other) noexcept {
            if (this != &other) {
                SecureMemory::wipeByteArray(m_data);
                m_data = std::move(other.m_data);
            }
            return *this;
        }

        const QByteArray &data() const { return m_data; }
        const char *constData() const { return m_data.constData(); }
        qsizetype size() const { return m_data.size(); }
        bool isEmpty() const { return m_data.isEmpty(); }

        /**
         * @brief Wipes the held bytes immediately
         */
        void wipe() { SecureMemory::wipeByteArray(m_data); }

    private:
        QByteArray m_data;
    };

private:
    SecureMemory() = delete;  // Static utility class
};

using SecureBytes = SecureMemory::SecureBytes;

} // namespace Shared
} // namespace YubiKeyChalResp
