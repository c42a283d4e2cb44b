#ifndef ENGINEHEALTHMONITOR_H
#define ENGINEHEALTHMONITOR_H

#include <QObject>
#include <QElapsedTimer>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QTimer>

class EngineApiClient;
class CredentialResolver;
struct ApiResult;

enum class EngineStatus {
    Disconnected,
    Starting,
    Connected
};

struct EngineHealth {
    QString status;             // "starting" | "ready" | "error"
    bool modelsReady = false;
    QStringList missingModels;
    QString engineUuid;
    qint64 uptimeMs = 0;
};

/**
 * @brief Tracks whether the engine answers GET /health
 *
 * While starting, polls with exponential backoff (100 ms doubling to 2 s)
 * until the startup deadline. Once healthy, re-checks on a fixed interval; a
 * failed check drops back to Starting and retries with the same backoff for
 * as long as it takes, since the deadline applies to the first start only.
 * A changed engine_uuid means the engine restarted, so cached credentials
 * are invalidated.
 */
class EngineHealthMonitor : public QObject {
    Q_OBJECT

public:
    EngineHealthMonitor(EngineApiClient* api, CredentialResolver* credentials, QObject* parent = nullptr);
    ~EngineHealthMonitor() override = default;

    void setPollInterval(int intervalMs) { m_pollIntervalMs = intervalMs; }
    void setStartupTimeout(int timeoutMs) { m_startupTimeoutMs = timeoutMs; }

    void start();
    void stop();

    EngineStatus status() const { return m_status; }
    bool isConnected() const { return m_status == EngineStatus::Connected; }
    EngineHealth lastHealth() const { return m_lastHealth; }

    static EngineHealth parseHealth(const QJsonObject& json);

signals:
    void statusChanged(EngineStatus status);
    void healthUpdated(const EngineHealth& health);
    void engineRestarted();
    // Only before the first healthy response; later outages keep polling
    void startupFailed(const QString& errorString);

private slots:
    void poll();

private:
    void onHealthResult(const ApiResult& result);
    void scheduleRetryPoll();
    void setStatus(EngineStatus status);

    EngineApiClient* m_api;
    CredentialResolver* m_credentials;
    QTimer* m_pollTimer;
    QElapsedTimer m_startupClock;
    EngineStatus m_status = EngineStatus::Disconnected;
    EngineHealth m_lastHealth;
    int m_pollIntervalMs = 5000;
    int m_startupTimeoutMs = 30000;
    int m_startupDelayMs = 100;
    bool m_running = false;
    bool m_startupPhase = false;  // true until the first healthy response
    bool m_requestInFlight = false;
};

#endif // ENGINEHEALTHMONITOR_H
