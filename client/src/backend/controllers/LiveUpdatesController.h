#ifndef LIVEUPDATESCONTROLLER_H
#define LIVEUPDATESCONTROLLER_H

#include <QObject>
#include <QString>

class CredentialResolver;
class EngineApiClient;
class EngineHealthMonitor;
class EventRouter;
class ConnectionManager;
class DownloadProgressReducer;
class ScanProgressReducer;
class JobProgressReducer;
class SnapshotFetcher;
class SnapshotReconciler;
struct SyncSettings;

/**
 * @brief Wires the push and pull paths into one live view
 *
 * Handles:
 * - Connection lifecycle driven by the enabling condition (engine reachable)
 * - Topic reducers subscribed to the shared EventRouter
 * - Snapshot fetching and reconciliation against the reducers
 *
 * Projections exist only while live updates are enabled; disabling cancels
 * every timer and clears them.
 */
class LiveUpdatesController : public QObject
{
    Q_OBJECT

public:
    LiveUpdatesController(CredentialResolver* credentials, EngineApiClient* api, QObject* parent = nullptr);
    ~LiveUpdatesController() override;

    void applySettings(const SyncSettings& settings);

    // Drive enablement from the health monitor's connected status
    void bindHealthMonitor(EngineHealthMonitor* monitor);

    void setEnabled(bool enabled);
    bool isEnabled() const { return m_enabled; }
    bool isLiveUpdatesConnected() const;

    EventRouter* router() const { return m_router; }
    ConnectionManager* connectionManager() const { return m_connectionManager; }
    DownloadProgressReducer* downloads() const { return m_downloads; }
    ScanProgressReducer* scans() const { return m_scans; }
    JobProgressReducer* jobs() const { return m_jobs; }
    SnapshotFetcher* snapshots() const { return m_snapshots; }
    SnapshotReconciler* reconciler() const { return m_reconciler; }

signals:
    void liveUpdatesConnected(bool connected);
    void enabledChanged(bool enabled);

private slots:
    void onEngineRestarted();

private:
    void clearProjections();

    CredentialResolver* m_credentials;
    EventRouter* m_router;
    ConnectionManager* m_connectionManager;
    DownloadProgressReducer* m_downloads;
    ScanProgressReducer* m_scans;
    JobProgressReducer* m_jobs;
    SnapshotFetcher* m_snapshots;
    SnapshotReconciler* m_reconciler;
    bool m_enabled = false;
};

#endif // LIVEUPDATESCONTROLLER_H
