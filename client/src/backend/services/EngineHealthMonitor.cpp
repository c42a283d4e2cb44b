#include "backend/services/EngineHealthMonitor.h"
#include "backend/network/EngineApiClient.h"
#include "backend/network/CredentialResolver.h"
#include <QJsonArray>
#include <QJsonObject>
#include <QPointer>
#include <QDebug>
#include <algorithm>

namespace {
const int kStartupInitialDelayMs = 100;
const int kStartupMaxDelayMs = 2000;
}

EngineHealthMonitor::EngineHealthMonitor(EngineApiClient* api, CredentialResolver* credentials, QObject* parent)
    : QObject(parent)
    , m_api(api)
    , m_credentials(credentials)
    , m_pollTimer(new QTimer(this))
{
    Q_ASSERT(m_api);
    m_pollTimer->setSingleShot(true);
    connect(m_pollTimer, &QTimer::timeout, this, &EngineHealthMonitor::poll);
}

EngineHealth EngineHealthMonitor::parseHealth(const QJsonObject& json) {
    EngineHealth health;
    health.status = json.value("status").toString();
    health.modelsReady = json.value("models_ready").toBool(false);
    for (const auto& v : json.value("missing_models").toArray()) {
        health.missingModels.append(v.toString());
    }
    health.engineUuid = json.value("engine_uuid").toString();
    health.uptimeMs = static_cast<qint64>(json.value("uptime_ms").toDouble());
    return health;
}

void EngineHealthMonitor::start() {
    m_running = true;
    m_startupPhase = true;
    m_startupDelayMs = kStartupInitialDelayMs;
    m_startupClock.start();
    setStatus(EngineStatus::Starting);
    poll();
}

void EngineHealthMonitor::stop() {
    m_running = false;
    m_pollTimer->stop();
    setStatus(EngineStatus::Disconnected);
}

void EngineHealthMonitor::poll() {
    if (!m_running || m_requestInFlight) return;
    m_requestInFlight = true;
    QPointer<EngineHealthMonitor> self(this);
    m_api->get(QStringLiteral("/health"), [self](const ApiResult& result) {
        if (!self) return;
        self->m_requestInFlight = false;
        self->onHealthResult(result);
    });
}

void EngineHealthMonitor::onHealthResult(const ApiResult& result) {
    if (!m_running) return;

    if (result.ok && result.isJson) {
        const EngineHealth health = parseHealth(result.json.object());
        if (!m_lastHealth.engineUuid.isEmpty() && !health.engineUuid.isEmpty()
            && health.engineUuid != m_lastHealth.engineUuid) {
            qInfo() << "EngineHealthMonitor: Engine restarted (" << m_lastHealth.engineUuid << "->" << health.engineUuid << ")";
            if (m_credentials) m_credentials->invalidateAll();
            emit engineRestarted();
        }
        m_lastHealth = health;
        m_startupPhase = false;
        emit healthUpdated(health);
        setStatus(EngineStatus::Connected);
        m_pollTimer->start(m_pollIntervalMs);
        return;
    }

    if (m_status == EngineStatus::Connected) {
        qWarning() << "EngineHealthMonitor: Health check failed:" << result.errorString;
        m_startupDelayMs = kStartupInitialDelayMs;
        setStatus(EngineStatus::Starting);
    }
    scheduleRetryPoll();
}

void EngineHealthMonitor::scheduleRetryPoll() {
    // The deadline only bounds the first start; a lost engine is polled until it returns
    if (m_startupPhase && m_startupClock.elapsed() >= m_startupTimeoutMs) {
        const QString error = QString("Engine startup timeout - make sure engine is running on port %1")
                                  .arg(m_credentials ? m_credentials->resolvePort() : CredentialResolver::DEFAULT_ENGINE_PORT);
        qWarning() << "EngineHealthMonitor:" << error;
        m_running = false;
        setStatus(EngineStatus::Disconnected);
        emit startupFailed(error);
        return;
    }
    m_pollTimer->start(m_startupDelayMs);
    m_startupDelayMs = std::min(m_startupDelayMs * 2, kStartupMaxDelayMs);
}

void EngineHealthMonitor::setStatus(EngineStatus status) {
    if (m_status == status) return;
    m_status = status;
    emit statusChanged(m_status);
}
