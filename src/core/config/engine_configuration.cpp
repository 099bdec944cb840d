/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "engine_configuration.h"
#include "../logging_categories.h"
#include <QStandardPaths>
#include <QFile>

namespace YubiKeyChalResp {
namespace Core {
using namespace YubiKeyChalResp::Shared;

EngineConfiguration::EngineConfiguration(const QString &configFile, QObject *parent)
    : QObject(parent)
    , m_configPath(configFile.isEmpty()
                       ? QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
                             + QLatin1Char('/') + QLatin1String(ConfigKeys::CONFIG_FILE_NAME)
                       : configFile)
    , m_config(configFile.isEmpty()
                   ? KSharedConfig::openConfig(QLatin1String(ConfigKeys::CONFIG_FILE_NAME))
                   : KSharedConfig::openConfig(configFile, KConfig::SimpleConfig))
    , m_configGroup(m_config->group(QLatin1String(ConfigKeys::PROTOCOL_GROUP)))
    , m_fileWatcher(new QFileSystemWatcher(this))
{
    qCDebug(ChalRespSettingsLog) << "Watching config file:" << m_configPath;

    if (QFile::exists(m_configPath)) {
        m_fileWatcher->addPath(m_configPath);
    }

    connect(m_fileWatcher, &QFileSystemWatcher::fileChanged,
            this, &EngineConfiguration::onConfigFileChanged);
}

void EngineConfiguration::reload()
{
    m_config->reparseConfiguration();
    m_configGroup = m_config->group(QLatin1String(ConfigKeys::PROTOCOL_GROUP));
    Q_EMIT configurationChanged();
}

int EngineConfiguration::readPositive(const char *key, int defaultValue) const
{
    const int value = m_configGroup.readEntry(key, defaultValue);
    if (value <= 0) {
        qCWarning(ChalRespSettingsLog) << "Ignoring non-positive" << key << "=" << value
                                       << "- using" << defaultValue;
        return defaultValue;
    }
    return value;
}

int EngineConfiguration::pollIntervalMs() const
{
    return readPositive(ConfigKeys::POLL_INTERVAL_MS, ConfigKeys::DEFAULT_POLL_INTERVAL_MS);
}

int EngineConfiguration::maxPollAttempts() const
{
    return readPositive(ConfigKeys::MAX_POLL_ATTEMPTS, ConfigKeys::DEFAULT_MAX_POLL_ATTEMPTS);
}

int EngineConfiguration::touchWaitAttempts() const
{
    return readPositive(ConfigKeys::TOUCH_WAIT_ATTEMPTS, ConfigKeys::DEFAULT_TOUCH_WAIT_ATTEMPTS);
}

int EngineConfiguration::usbTimeoutMs() const
{
    return readPositive(ConfigKeys::USB_TIMEOUT_MS, ConfigKeys::DEFAULT_USB_TIMEOUT_MS);
}

void EngineConfiguration::onConfigFileChanged(const QString &path)
{
    qCDebug(ChalRespSettingsLog) << "Config file changed:" << path;

    reload();

    // QFileSystemWatcher drops the path when an editor replaces the file
    if (!m_fileWatcher->files().contains(path) && QFile::exists(path)) {
        m_fileWatcher->addPath(path);
    }
}

} // namespace Core
} // namespace YubiKeyChalResp
