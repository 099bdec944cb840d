/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "error_kind.h"

#include <QString>
#include <utility>

namespace YubiKeyChalResp {
namespace Shared {

/**
 * @brief Result type for unified error handling
 *
 * Holds either a value or a typed failure (ErrorKind plus a message).
 * Failures that happened after a command physically reached the device
 * are flagged with isOutcomeUnknown(): the token may or may not have
 * applied the command, and the caller has to re-read its status before
 * deciding what to do.
 *
 * @tparam T The type of the successful result value (must be default-constructible)
 *
 * Usage:
 * @code
 * Result<QByteArray> readResponse(int expected) {
 *     if (expected > MAX_RESPONSE) {
 *         return Result<QByteArray>::error(ErrorKind::InvalidArgument,
 *                                          QStringLiteral("Response too long"));
 *     }
 *     return Result<QByteArray>::success(collect(expected));
 * }
 *
 * auto result = readResponse(22);
 * if (result.isError()) {
 *     qCWarning(ChalRespProtocolLog) << errorKindName(result.errorKind()) << result.error();
 * }
 * @endcode
 */
template<typename T>
class Result {
public:
    /**
     * @brief Creates a successful result with a value
     * @param value The success value
     * @return Result containing the value
     */
    static Result success(T value) {
        return Result(std::move(value), ErrorKind::None, QString(), false);
    }

    /**
     * @brief Creates an error result
     * @param kind Failure category (must not be ErrorKind::None)
     * @param errorMessage Description of the error
     * @param outcomeUnknown true if the device may have applied the command anyway
     * @return Result containing the error
     */
    static Result error(ErrorKind kind, const QString &errorMessage, bool outcomeUnknown = false) {
        Q_ASSERT(kind != ErrorKind::None);
        return Result(T(), kind, errorMessage, outcomeUnknown);
    }

    /**
     * @brief Forwards the failure of a result of another type
     * @param other Failed result
     * @return Result carrying the same kind, message and outcome flag
     */
    template<typename U>
    static Result propagate(const Result<U> &other) {
        return error(other.errorKind(), other.error(), other.isOutcomeUnknown());
    }

    bool isSuccess() const {
        return m_kind == ErrorKind::None;
    }

    bool isError() const {
        return m_kind != ErrorKind::None;
    }

    /**
     * @brief Gets the success value
     * @warning Only call if isSuccess() returns true.
     */
    T value() const {
        Q_ASSERT(isSuccess());
        return m_value;
    }

    /**
     * @brief Moves the success value out of the result
     *
     * Required for move-only payloads such as SecureBytes.
     * @warning Only call once, and only if isSuccess() returns true.
     */
    T takeValue() {
        Q_ASSERT(isSuccess());
        return std::move(m_value);
    }

    /**
     * @brief Gets the success value or a default value if error
     */
    T valueOr(const T &defaultValue) const {
        return isSuccess() ? m_value : defaultValue;
    }

    /**
     * @brief Gets the error message
     * @return Error message, or empty string if successful
     */
    QString error() const {
        return m_error;
    }

    /**
     * @brief Gets the failure category
     * @return ErrorKind::None if successful
     */
    ErrorKind errorKind() const {
        return m_kind;
    }

    /**
     * @brief Whether the device state is indeterminate after this failure
     */
    bool isOutcomeUnknown() const {
        return m_outcomeUnknown;
    }

    explicit operator bool() const {
        return isSuccess();
    }

private:
    Result(T value, ErrorKind kind, QString error, bool outcomeUnknown)
        : m_value(std::move(value))
        , m_kind(kind)
        , m_error(std::move(error))
        , m_outcomeUnknown(outcomeUnknown)
    {
    }

    T m_value;
    ErrorKind m_kind;
    QString m_error;
    bool m_outcomeUnknown;
};

/**
 * @brief Specialization of Result for void (no value)
 *
 * Used for operations that don't return a value but can fail.
 */
template<>
class Result<void> {
public:
    static Result success() {
        return Result(ErrorKind::None, QString(), false);
    }

    static Result error(ErrorKind kind, const QString &errorMessage, bool outcomeUnknown = false) {
        Q_ASSERT(kind != ErrorKind::None);
        return Result(kind, errorMessage, outcomeUnknown);
    }

    template<typename U>
    static Result propagate(const Result<U> &other) {
        return error(other.errorKind(), other.error(), other.isOutcomeUnknown());
    }

    bool isSuccess() const {
        return m_kind == ErrorKind::None;
    }

    bool isError() const {
        return m_kind != ErrorKind::None;
    }

    QString error() const {
        return m_error;
    }

    ErrorKind errorKind() const {
        return m_kind;
    }

    bool isOutcomeUnknown() const {
        return m_outcomeUnknown;
    }

    explicit operator bool() const {
        return isSuccess();
    }

private:
    Result(ErrorKind kind, QString error, bool outcomeUnknown)
        : m_kind(kind)
        , m_error(std::move(error))
        , m_outcomeUnknown(outcomeUnknown)
    {
    }

    ErrorKind m_kind;
    QString m_error;
    bool m_outcomeUnknown;
};

} // namespace Shared
} // namespace YubiKeyChalResp
