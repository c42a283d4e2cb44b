#include "backend/managers/app/SettingsManager.h"
#include <QSettings>
#include <QDebug>

namespace {
const char* const kPortEnv = "GAZE_ENGINE_PORT";
const char* const kTokenEnv = "GAZE_AUTH_TOKEN";

bool portFromEnvironment(quint16* port) {
    if (!qEnvironmentVariableIsSet(kPortEnv)) return false;
    bool ok = false;
    const uint value = qEnvironmentVariable(kPortEnv).toUInt(&ok);
    if (!ok || value == 0 || value > 65535) {
        qWarning() << "SettingsManager: Ignoring invalid" << kPortEnv << qEnvironmentVariable(kPortEnv);
        return false;
    }
    *port = static_cast<quint16>(value);
    return true;
}
}

SettingsManager::SettingsManager(QObject* parent)
    : QObject(parent)
    , m_store(new QSettings(QStringLiteral("Gaze"), QStringLiteral("LiveSync")))
{
}

SettingsManager::SettingsManager(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_store(new QSettings(iniPath, QSettings::IniFormat))
{
}

SettingsManager::~SettingsManager() {
    delete m_store;
}

QString SettingsManager::backoffModeToString(ConnectionManager::BackoffMode mode) {
    return mode == ConnectionManager::BackoffMode::Exponential ? QStringLiteral("exponential") : QStringLiteral("fixed");
}

ConnectionManager::BackoffMode SettingsManager::backoffModeFromString(const QString& value) {
    if (value.trimmed().compare(QStringLiteral("exponential"), Qt::CaseInsensitive) == 0) {
        return ConnectionManager::BackoffMode::Exponential;
    }
    return ConnectionManager::BackoffMode::Fixed;
}

void SettingsManager::loadSettings() {
    SyncSettings s;
    const uint storedPort = m_store->value("engine/port", CredentialResolver::DEFAULT_ENGINE_PORT).toUInt();
    if (storedPort > 0 && storedPort <= 65535) {
        s.enginePort = static_cast<quint16>(storedPort);
    }
    s.authToken = m_store->value("engine/token").toString();
    s.reconnect.mode = backoffModeFromString(m_store->value("connection/backoff", "fixed").toString());
    s.reconnect.baseDelayMs = m_store->value("connection/reconnectDelayMs", 3000).toInt();
    s.reconnect.maxDelayMs = m_store->value("connection/maxReconnectDelayMs", 30000).toInt();
    s.keepaliveIntervalMs = m_store->value("connection/keepaliveIntervalMs", PushConnection::DEFAULT_KEEPALIVE_INTERVAL_MS).toInt();
    s.downloadStallTimeoutMs = m_store->value("downloads/stallTimeoutMs", 120000).toInt();
    s.healthPollIntervalMs = m_store->value("health/pollIntervalMs", 5000).toInt();
    s.healthStartupTimeoutMs = m_store->value("health/startupTimeoutMs", 30000).toInt();

    quint16 envPort = 0;
    if (portFromEnvironment(&envPort)) {
        s.enginePort = envPort;
    }
    if (qEnvironmentVariableIsSet(kTokenEnv)) {
        s.authToken = qEnvironmentVariable(kTokenEnv);
    }

    m_settings = s;
    qDebug() << "SettingsManager: Settings loaded - port:" << s.enginePort
             << "token:" << (s.authToken.isEmpty() ? "none" : "set")
             << "backoff:" << backoffModeToString(s.reconnect.mode);
}

void SettingsManager::saveSettings() {
    m_store->setValue("engine/port", m_settings.enginePort);
    m_store->setValue("engine/token", m_settings.authToken);
    m_store->setValue("connection/backoff", backoffModeToString(m_settings.reconnect.mode));
    m_store->setValue("connection/reconnectDelayMs", m_settings.reconnect.baseDelayMs);
    m_store->setValue("connection/maxReconnectDelayMs", m_settings.reconnect.maxDelayMs);
    m_store->setValue("connection/keepaliveIntervalMs", m_settings.keepaliveIntervalMs);
    m_store->setValue("downloads/stallTimeoutMs", m_settings.downloadStallTimeoutMs);
    m_store->setValue("health/pollIntervalMs", m_settings.healthPollIntervalMs);
    m_store->setValue("health/startupTimeoutMs", m_settings.healthStartupTimeoutMs);
    m_store->sync();

    qDebug() << "SettingsManager: Settings saved";
    emit settingsChanged();
}

void SettingsManager::setEnginePort(quint16 port) {
    if (m_settings.enginePort != port) {
        m_settings.enginePort = port;
        saveSettings();
    }
}

void SettingsManager::setAuthToken(const QString& token) {
    if (m_settings.authToken != token) {
        m_settings.authToken = token;
        saveSettings();
    }
}

CredentialResolver::TokenProvider SettingsManager::tokenProvider() const {
    const QString stored = m_settings.authToken;
    return [stored](QString* token, QString* errorString) {
        const QString value = qEnvironmentVariableIsSet(kTokenEnv) ? qEnvironmentVariable(kTokenEnv) : stored;
        if (value.isEmpty()) {
            if (errorString) errorString->clear(); // no token configured is not an error
            return false;
        }
        *token = value;
        return true;
    };
}

CredentialResolver::PortProvider SettingsManager::portProvider() const {
    const quint16 stored = m_settings.enginePort;
    return [stored](quint16* port, QString* errorString) {
        quint16 envPort = 0;
        if (portFromEnvironment(&envPort)) {
            *port = envPort;
            return true;
        }
        if (stored == 0) {
            if (errorString) *errorString = QStringLiteral("no engine port configured");
            return false;
        }
        *port = stored;
        return true;
    };
}
