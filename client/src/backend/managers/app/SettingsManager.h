#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QString>
#include "backend/managers/network/ConnectionManager.h"
#include "backend/network/CredentialResolver.h"

class QSettings;

struct SyncSettings {
    quint16 enginePort = CredentialResolver::DEFAULT_ENGINE_PORT;
    QString authToken;                      // empty: unauthenticated engine
    ConnectionManager::ReconnectPolicy reconnect;
    int keepaliveIntervalMs = PushConnection::DEFAULT_KEEPALIVE_INTERVAL_MS;
    int downloadStallTimeoutMs = 120000;
    int healthPollIntervalMs = 5000;
    int healthStartupTimeoutMs = 30000;
};

/**
 * @brief Loads and persists live-sync configuration
 *
 * Values come from QSettings ("Gaze"/"LiveSync" by default). GAZE_ENGINE_PORT
 * and GAZE_AUTH_TOKEN in the environment take precedence over stored values.
 */
class SettingsManager : public QObject {
    Q_OBJECT

public:
    explicit SettingsManager(QObject* parent = nullptr);
    // Reads and writes an INI file instead of the platform store
    explicit SettingsManager(const QString& iniPath, QObject* parent = nullptr);
    ~SettingsManager() override;

    void loadSettings();
    void saveSettings();

    const SyncSettings& settings() const { return m_settings; }
    void setSettings(const SyncSettings& settings) { m_settings = settings; }

    void setEnginePort(quint16 port);
    void setAuthToken(const QString& token);

    // Providers read the environment on every call so a restarted engine is picked up
    CredentialResolver::TokenProvider tokenProvider() const;
    CredentialResolver::PortProvider portProvider() const;

    static QString backoffModeToString(ConnectionManager::BackoffMode mode);
    static ConnectionManager::BackoffMode backoffModeFromString(const QString& value);

signals:
    void settingsChanged();

private:
    QSettings* m_store;
    SyncSettings m_settings;
};

#endif // SETTINGSMANAGER_H
