/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>

#include <memory>

#include "core/config/engine_configuration.h"
#include "core/protocol/poll_policy.h"
#include "core/challenge_response_session.h"

using namespace YubiKeyChalResp::Core;
using namespace YubiKeyChalResp::Shared;

/**
 * @brief Tests for EngineConfiguration
 *
 * Reads protocol settings from a temporary KConfig file.
 */
class TestEngineConfiguration : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();

    void testDefaults_MissingFile();
    void testOverrides();
    void testNonPositiveFallsBackToDefault();
    void testReload_EmitsSignal();
    void testPollPolicyFromConfiguration();
    void testReload_ReappliedToSession();

private:
    QString writeConfig(const QByteArray &contents);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestEngineConfiguration::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

QString TestEngineConfiguration::writeConfig(const QByteArray &contents)
{
    const QString path = m_dir->filePath(QStringLiteral("yubikey-chalresprc"));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write(contents);
    file.close();
    return path;
}

void TestEngineConfiguration::testDefaults_MissingFile()
{
    EngineConfiguration config(m_dir->filePath(QStringLiteral("absent-rc")));

    QCOMPARE(config.pollIntervalMs(), ConfigKeys::DEFAULT_POLL_INTERVAL_MS);
    QCOMPARE(config.maxPollAttempts(), ConfigKeys::DEFAULT_MAX_POLL_ATTEMPTS);
    QCOMPARE(config.touchWaitAttempts(), ConfigKeys::DEFAULT_TOUCH_WAIT_ATTEMPTS);
    QCOMPARE(config.usbTimeoutMs(), ConfigKeys::DEFAULT_USB_TIMEOUT_MS);
}

void TestEngineConfiguration::testOverrides()
{
    const QString path = writeConfig("[Protocol]\n"
                                     "PollIntervalMs=25\n"
                                     "MaxPollAttempts=7\n"
                                     "TouchWaitAttempts=300\n"
                                     "UsbTimeoutMs=500\n");
    QVERIFY(!path.isEmpty());

    EngineConfiguration config(path);
    QCOMPARE(config.configPath(), path);
    QCOMPARE(config.pollIntervalMs(), 25);
    QCOMPARE(config.maxPollAttempts(), 7);
    QCOMPARE(config.touchWaitAttempts(), 300);
    QCOMPARE(config.usbTimeoutMs(), 500);
}

void TestEngineConfiguration::testNonPositiveFallsBackToDefault()
{
    const QString path = writeConfig("[Protocol]\n"
                                     "PollIntervalMs=0\n"
                                     "MaxPollAttempts=-3\n");
    QVERIFY(!path.isEmpty());

    EngineConfiguration config(path);
    QCOMPARE(config.pollIntervalMs(), ConfigKeys::DEFAULT_POLL_INTERVAL_MS);
    QCOMPARE(config.maxPollAttempts(), ConfigKeys::DEFAULT_MAX_POLL_ATTEMPTS);
}

void TestEngineConfiguration::testReload_EmitsSignal()
{
    const QString path = writeConfig("[Protocol]\nMaxPollAttempts=7\n");
    QVERIFY(!path.isEmpty());

    EngineConfiguration config(path);
    QCOMPARE(config.maxPollAttempts(), 7);

    QSignalSpy spy(&config, &EngineConfiguration::configurationChanged);
    QVERIFY(!writeConfig("[Protocol]\nMaxPollAttempts=42\n").isEmpty());
    config.reload();

    QVERIFY(spy.count() >= 1);
    QCOMPARE(config.maxPollAttempts(), 42);
}

void TestEngineConfiguration::testPollPolicyFromConfiguration()
{
    const QString path = writeConfig("[Protocol]\n"
                                     "PollIntervalMs=5\n"
                                     "TouchWaitAttempts=60\n");
    QVERIFY(!path.isEmpty());

    EngineConfiguration config(path);
    const PollPolicy policy = PollPolicy::fromConfiguration(config);
    QCOMPARE(policy.pollIntervalMs, 5);
    QCOMPARE(policy.maxAttempts, ConfigKeys::DEFAULT_MAX_POLL_ATTEMPTS);
    QCOMPARE(policy.touchWaitAttempts, 60);
}

void TestEngineConfiguration::testReload_ReappliedToSession()
{
    const QString path = writeConfig("[Protocol]\nMaxPollAttempts=7\n");
    QVERIFY(!path.isEmpty());

    EngineConfiguration config(path);
    ChallengeResponseSession session(nullptr, config);
    QCOMPARE(session.pollPolicy().maxAttempts, 7);

    connect(&config, &EngineConfiguration::configurationChanged, this, [&session, &config]() {
        session.setPollPolicy(PollPolicy::fromConfiguration(config));
    });

    QVERIFY(!writeConfig("[Protocol]\nMaxPollAttempts=42\nPollIntervalMs=3\n").isEmpty());
    config.reload();

    QCOMPARE(session.pollPolicy().maxAttempts, 42);
    QCOMPARE(session.pollPolicy().pollIntervalMs, 3);
}

QTEST_MAIN(TestEngineConfiguration)
#include "test_engine_configuration.moc"
