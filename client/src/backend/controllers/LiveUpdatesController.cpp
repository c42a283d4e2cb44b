#include "backend/controllers/LiveUpdatesController.h"
#include "backend/controllers/SnapshotReconciler.h"
#include "backend/domain/progress/DownloadProgressReducer.h"
#include "backend/domain/progress/JobProgressReducer.h"
#include "backend/domain/progress/ScanProgressReducer.h"
#include "backend/managers/app/SettingsManager.h"
#include "backend/managers/network/ConnectionManager.h"
#include "backend/network/CredentialResolver.h"
#include "backend/network/EventRouter.h"
#include "backend/services/EngineHealthMonitor.h"
#include "backend/services/SnapshotFetcher.h"
#include <QDebug>

LiveUpdatesController::LiveUpdatesController(CredentialResolver* credentials, EngineApiClient* api, QObject* parent)
    : QObject(parent)
    , m_credentials(credentials)
    , m_router(new EventRouter(this))
    , m_connectionManager(new ConnectionManager(credentials, m_router, this))
    , m_downloads(new DownloadProgressReducer(this))
    , m_scans(new ScanProgressReducer(this))
    , m_jobs(new JobProgressReducer(this))
    , m_snapshots(new SnapshotFetcher(api, this))
    , m_reconciler(new SnapshotReconciler(m_snapshots, m_scans, m_jobs, this))
{
    connect(m_connectionManager, &ConnectionManager::connectedChanged,
            this, &LiveUpdatesController::liveUpdatesConnected);
}

LiveUpdatesController::~LiveUpdatesController() {
    // Tear down before the reducers so no close callback reaches a half-destroyed projection
    m_connectionManager->disconnectFromEngine();
}

void LiveUpdatesController::applySettings(const SyncSettings& settings) {
    m_connectionManager->setReconnectPolicy(settings.reconnect);
    m_connectionManager->setKeepaliveInterval(settings.keepaliveIntervalMs);
    m_downloads->setStallTimeout(settings.downloadStallTimeoutMs);
}

void LiveUpdatesController::bindHealthMonitor(EngineHealthMonitor* monitor) {
    if (!monitor) return;
    connect(monitor, &EngineHealthMonitor::statusChanged, this, [this](EngineStatus status) {
        // Starting is transitional; only Connected and Disconnected flip the condition
        if (status == EngineStatus::Connected) {
            setEnabled(true);
        } else if (status == EngineStatus::Disconnected) {
            setEnabled(false);
        }
    });
    connect(monitor, &EngineHealthMonitor::engineRestarted, this, &LiveUpdatesController::onEngineRestarted);
}

bool LiveUpdatesController::isLiveUpdatesConnected() const {
    return m_connectionManager->isConnected();
}

void LiveUpdatesController::setEnabled(bool enabled) {
    if (m_enabled == enabled) return;
    m_enabled = enabled;

    if (m_enabled) {
        qInfo() << "LiveUpdatesController: Enabling live updates";
        m_downloads->attach(m_router);
        m_scans->attach(m_router);
        m_jobs->attach(m_router);
        m_connectionManager->connectToEngine(m_credentials ? m_credentials->resolvePort() : CredentialResolver::DEFAULT_ENGINE_PORT, true);
        m_snapshots->refresh();
    } else {
        qInfo() << "LiveUpdatesController: Disabling live updates";
        m_connectionManager->setEnabled(false);
        m_downloads->detach();
        m_scans->detach();
        m_jobs->detach();
        clearProjections();
    }
    emit enabledChanged(m_enabled);
}

void LiveUpdatesController::onEngineRestarted() {
    if (!m_enabled) return;
    // The restarted engine issued a new token and possibly a new port
    qInfo() << "LiveUpdatesController: Engine restarted, reconnecting";
    clearProjections();
    m_connectionManager->connectToEngine(m_credentials ? m_credentials->resolvePort() : CredentialResolver::DEFAULT_ENGINE_PORT, true);
    m_snapshots->refresh();
}

void LiveUpdatesController::clearProjections() {
    m_downloads->clear();
    m_scans->clear();
    m_jobs->clear();
}
