/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "config/configuration_provider.h"
#include "config/configuration_keys.h"
#include <QString>
#include <KSharedConfig>
#include <KConfigGroup>
#include <QFileSystemWatcher>
#include <QObject>

namespace YubiKeyChalResp {
namespace Core {

/**
 * @brief Configuration reader for the protocol engine
 *
 * Reads the [Protocol] group of yubikey-chalresprc. Values that are
 * missing or not positive fall back to the built-in defaults.
 *
 * @note Inherits from both QObject (for signals) and ConfigurationProvider (pure interface)
 */
class EngineConfiguration : public QObject, public Shared::ConfigurationProvider
{
    Q_OBJECT

public:
    /**
     * @param configFile Absolute path of the file to read; empty for
     *        yubikey-chalresprc in the user's config directory
     */
    explicit EngineConfiguration(const QString &configFile = QString(), QObject *parent = nullptr);

    /**
     * @brief Reloads configuration from file
     */
    void reload() override;

    int pollIntervalMs() const override;
    int maxPollAttempts() const override;
    int touchWaitAttempts() const override;
    int usbTimeoutMs() const override;

    QString configPath() const { return m_configPath; }

Q_SIGNALS:
    /**
     * @brief Emitted when configuration has been reloaded
     *
     * Sessions do not listen for it. The owner of a long-lived session
     * re-applies PollPolicy::fromConfiguration() through setPollPolicy().
     */
    void configurationChanged();

private Q_SLOTS:
    void onConfigFileChanged(const QString &path);

private:
    int readPositive(const char *key, int defaultValue) const;

    QString m_configPath;
    KSharedConfig::Ptr m_config;
    KConfigGroup m_configGroup;
    QFileSystemWatcher *m_fileWatcher;
};

} // namespace Core
} // namespace YubiKeyChalResp
