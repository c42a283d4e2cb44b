#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QDebug>
#include "backend/controllers/LiveUpdatesController.h"
#include "backend/controllers/SnapshotReconciler.h"
#include "backend/domain/catalog/VideoCollection.h"
#include "backend/domain/progress/DownloadProgressReducer.h"
#include "backend/domain/progress/JobProgressReducer.h"
#include "backend/domain/progress/ScanProgressReducer.h"
#include "backend/managers/app/SettingsManager.h"
#include "backend/managers/network/ConnectionManager.h"
#include "backend/network/CredentialResolver.h"
#include "backend/network/EngineApiClient.h"
#include "backend/services/EngineHealthMonitor.h"
#include "backend/services/SnapshotFetcher.h"

namespace {
void logCollection(const VideoCollection* videos) {
    qInfo().noquote() << QString("Collection for %1: %2 video(s)").arg(videos->libraryId()).arg(videos->size());
    for (const auto& video : videos->items()) {
        qInfo().noquote() << QString("  %1  %2  %3 (%4%)")
                                 .arg(video.videoId, video.filename, video.status)
                                 .arg(qRound(video.progress * 100.0));
    }
}

// Wire every observable transition to the log
void connectLogging(LiveUpdatesController* live, EngineHealthMonitor* health) {
    QObject::connect(health, &EngineHealthMonitor::statusChanged, live, [](EngineStatus status) {
        const char* name = status == EngineStatus::Connected ? "connected"
                         : status == EngineStatus::Starting ? "starting" : "disconnected";
        qInfo() << "Engine:" << name;
    });
    QObject::connect(health, &EngineHealthMonitor::healthUpdated, live, [](const EngineHealth& h) {
        if (!h.modelsReady && !h.missingModels.isEmpty()) {
            qInfo() << "Engine: missing models" << h.missingModels;
        }
    });

    QObject::connect(live, &LiveUpdatesController::liveUpdatesConnected, live, [](bool connected) {
        qInfo() << "Live updates:" << (connected ? "connected" : "disconnected");
    });
    QObject::connect(live->connectionManager(), &ConnectionManager::connectionAttempted, live, [](const QUrl& url) {
        qDebug().noquote() << "Live updates: connecting to" << url.adjusted(QUrl::RemoveQuery).toString();
    });
    QObject::connect(live->connectionManager(), &ConnectionManager::transportError, live, [](const QString& error) {
        qInfo().noquote() << "Live updates: transport error:" << error;
    });

    QObject::connect(live->downloads(), &ProgressReducer::entryUpdated, live, [](const QString& model, const Envelope& env) {
        qInfo().noquote() << QString("Download %1: %2% (%3/%4 bytes)")
                                 .arg(model).arg(qRound(env.progress() * 100.0))
                                 .arg(env.bytesDownloaded()).arg(env.bytesTotal());
    });
    QObject::connect(live->downloads(), &DownloadProgressReducer::downloadCompleted, live, [](const QString& model) {
        qInfo().noquote() << QString("Download %1: complete").arg(model);
    });
    QObject::connect(live->downloads(), &DownloadProgressReducer::downloadFailed, live, [](const QString& model, const QString& reason) {
        qWarning().noquote() << QString("Download %1: failed (%2)").arg(model, reason);
    });

    QObject::connect(live->scans(), &ProgressReducer::entryUpdated, live, [](const QString& libraryId, const Envelope& env) {
        qInfo().noquote() << QString("Scan %1: %2 - found %3, new %4, changed %5, deleted %6")
                                 .arg(libraryId, env.typeName())
                                 .arg(env.filesFound()).arg(env.filesNew())
                                 .arg(env.filesChanged()).arg(env.filesDeleted());
    });

    QObject::connect(live->jobs(), &JobProgressReducer::jobTransition, live, [](const Envelope& env) {
        if (env.type() == EnvelopeType::JobFailed) {
            qWarning().noquote() << QString("Job %1 (video %2): failed at %3 - %4 %5")
                                        .arg(env.jobId(), env.videoId(), env.stage(), env.errorCode(), env.errorMessage());
        } else {
            qInfo().noquote() << QString("Job %1 (video %2): %3 %4%")
                                     .arg(env.jobId(), env.videoId(), env.type() == EnvelopeType::JobComplete ? QStringLiteral("complete") : env.stage())
                                     .arg(qRound(env.progress() * 100.0));
        }
    });

    SnapshotFetcher* snapshots = live->snapshots();
    QObject::connect(snapshots, &SnapshotFetcher::librariesChanged, live, [](const QList<LibraryInfo>& libraries) {
        for (const auto& library : libraries) {
            qInfo().noquote() << QString("Library %1 \"%2\": %3/%4 indexed")
                                     .arg(library.libraryId, library.name)
                                     .arg(library.indexedCount).arg(library.videoCount);
        }
    });
    QObject::connect(snapshots, &SnapshotFetcher::videosFetched, live, [snapshots](const QString&, int) {
        logCollection(snapshots->videos());
    });
    QObject::connect(snapshots, &SnapshotFetcher::fetchFailed, live, [](const QString& what, const QString& error) {
        qWarning().noquote() << QString("Fetch of %1 failed: %2").arg(what, error);
    });
    QObject::connect(live->reconciler(), &SnapshotReconciler::itemReconciled, live, [snapshots](const QString& videoId) {
        const VideoInfo video = snapshots->videos()->item(videoId);
        qInfo().noquote() << QString("Video %1: %2 (%3%)").arg(videoId, video.status).arg(qRound(video.progress * 100.0));
    });
}
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("gaze-live-monitor");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Gaze");

    qSetMessagePattern("%{time hh:mm:ss.zzz} %{if-warning}W %{endif}%{if-critical}C %{endif}%{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Follows the Gaze engine's live updates and logs every transition.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption portOption(QStringList{"p", "port"}, "Engine port (overrides settings and GAZE_ENGINE_PORT).", "port");
    QCommandLineOption tokenOption(QStringList{"t", "token"}, "Bearer token (overrides settings and GAZE_AUTH_TOKEN).", "token");
    QCommandLineOption libraryOption(QStringList{"l", "library"}, "Library to display (default: all libraries).", "id");
    QCommandLineOption backoffOption("backoff", "Reconnect backoff: fixed or exponential.", "mode");
    QCommandLineOption verboseOption("verbose", "Enable debug output.");
    parser.addOption(portOption);
    parser.addOption(tokenOption);
    parser.addOption(libraryOption);
    parser.addOption(backoffOption);
    parser.addOption(verboseOption);
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption) ? QStringLiteral("*.debug=true")
                                                                 : QStringLiteral("*.debug=false"));

    SettingsManager settingsManager;
    settingsManager.loadSettings();
    SyncSettings settings = settingsManager.settings();

    CredentialResolver credentials(settingsManager.tokenProvider(), settingsManager.portProvider());

    if (parser.isSet(portOption)) {
        bool ok = false;
        const uint port = parser.value(portOption).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            qCritical().noquote() << "Invalid port:" << parser.value(portOption);
            return 1;
        }
        const quint16 fixedPort = static_cast<quint16>(port);
        credentials.setPortProvider([fixedPort](quint16* out, QString*) {
            *out = fixedPort;
            return true;
        });
    }
    if (parser.isSet(tokenOption)) {
        const QString fixedToken = parser.value(tokenOption);
        credentials.setTokenProvider([fixedToken](QString* out, QString*) {
            if (fixedToken.isEmpty()) return false;
            *out = fixedToken;
            return true;
        });
    }
    if (parser.isSet(backoffOption)) {
        settings.reconnect.mode = SettingsManager::backoffModeFromString(parser.value(backoffOption));
    }

    EngineApiClient api(&credentials);
    EngineHealthMonitor health(&api, &credentials);
    health.setPollInterval(settings.healthPollIntervalMs);
    health.setStartupTimeout(settings.healthStartupTimeoutMs);

    LiveUpdatesController live(&credentials, &api);
    live.applySettings(settings);
    if (parser.isSet(libraryOption)) {
        live.snapshots()->setInitialLibrary(parser.value(libraryOption));
    }
    live.bindHealthMonitor(&health);
    connectLogging(&live, &health);

    QObject::connect(&health, &EngineHealthMonitor::startupFailed, &app, [](const QString& error) {
        qCritical().noquote() << error;
        QCoreApplication::exit(1);
    });
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &live, [&live, &health]() {
        health.stop();
        live.setEnabled(false);
    });

    qInfo() << "Waiting for engine on port" << credentials.resolvePort();
    health.start();
    return app.exec();
}
