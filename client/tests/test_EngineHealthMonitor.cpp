#include <catch2/catch.hpp>
#include <QHostAddress>
#include <QJsonArray>
#include <QTcpServer>
#include "backend/network/CredentialResolver.h"
#include "backend/network/EngineApiClient.h"
#include "backend/services/EngineHealthMonitor.h"
#include "support/FakeEngineServer.h"
#include "support/TestUtils.h"

using namespace testutil;

namespace {
QJsonObject healthJson(const QString& uuid, bool modelsReady = true) {
    return QJsonObject{{"status", "ready"}, {"models_ready", modelsReady}, {"missing_models", QJsonArray()},
                       {"engine_uuid", uuid}, {"uptime_ms", 1200}};
}

struct HealthFixture {
    QList<EngineStatus> statuses;
    int tokenLookups = 0;
    FakeEngineServer engine;
    CredentialResolver credentials;
    EngineApiClient api{&credentials};
    EngineHealthMonitor monitor{&api, &credentials};

    HealthFixture() {
        REQUIRE(engine.listen());
        const quint16 port = engine.port();
        credentials.setPortProvider([port](quint16* out, QString*) {
            *out = port;
            return true;
        });
        credentials.setTokenProvider([this](QString* out, QString*) {
            ++tokenLookups;
            *out = QStringLiteral("token");
            return true;
        });
        monitor.setPollInterval(50);
        QObject::connect(&monitor, &EngineHealthMonitor::statusChanged, [this](EngineStatus s) { statuses.append(s); });
    }
};
}

TEST_CASE("EngineHealthMonitor parses the health payload", "[EngineHealthMonitor]") {
    const EngineHealth health = EngineHealthMonitor::parseHealth(QJsonObject{
        {"status", "starting"}, {"models_ready", false}, {"missing_models", QJsonArray{"whisper", "clip"}},
        {"engine_uuid", "uuid-1"}, {"uptime_ms", 4500}});
    CHECK(health.status == "starting");
    CHECK_FALSE(health.modelsReady);
    CHECK(health.missingModels == QStringList{"whisper", "clip"});
    CHECK(health.engineUuid == "uuid-1");
    CHECK(health.uptimeMs == 4500);
}

TEST_CASE("EngineHealthMonitor reports a reachable engine", "[EngineHealthMonitor]") {
    HealthFixture fx;
    fx.engine.setResponse("/health", FakeResponse::json(healthJson("uuid-1")));

    fx.monitor.start();
    REQUIRE(waitUntil([&fx]() { return fx.monitor.isConnected(); }));
    CHECK(fx.statuses == QList<EngineStatus>{EngineStatus::Starting, EngineStatus::Connected});
    CHECK(fx.monitor.lastHealth().engineUuid == "uuid-1");

    // Periodic checks continue once connected
    const int before = fx.engine.requestCount("/health");
    REQUIRE(waitUntil([&]() { return fx.engine.requestCount("/health") >= before + 2; }));

    fx.monitor.stop();
    CHECK(fx.monitor.status() == EngineStatus::Disconnected);
    pumpEvents(100); // let a request already on the wire land
    const int stopped = fx.engine.requestCount("/health");
    pumpEvents(200);
    CHECK(fx.engine.requestCount("/health") == stopped);
}

TEST_CASE("EngineHealthMonitor drops back to starting on a failed check", "[EngineHealthMonitor]") {
    HealthFixture fx;
    fx.engine.queueResponse("/health", FakeResponse::json(healthJson("uuid-1")));
    fx.engine.setResponse("/health", FakeResponse::text("shutting down", 503));

    fx.monitor.start();
    REQUIRE(waitUntil([&fx]() { return fx.statuses.size() >= 3; }));
    CHECK(fx.statuses.mid(0, 3) == QList<EngineStatus>{EngineStatus::Starting, EngineStatus::Connected, EngineStatus::Starting});
    fx.monitor.stop();
}

TEST_CASE("EngineHealthMonitor keeps polling a lost engine past the startup deadline", "[EngineHealthMonitor]") {
    HealthFixture fx;
    fx.monitor.setStartupTimeout(200);
    fx.engine.queueResponse("/health", FakeResponse::json(healthJson("uuid-1")));
    fx.engine.setResponse("/health", FakeResponse::text("restarting", 503));

    bool startupFailed = false;
    int restarts = 0;
    QObject::connect(&fx.monitor, &EngineHealthMonitor::startupFailed, [&startupFailed](const QString&) { startupFailed = true; });
    QObject::connect(&fx.monitor, &EngineHealthMonitor::engineRestarted, [&restarts]() { ++restarts; });

    fx.monitor.start();
    REQUIRE(waitUntil([&fx]() { return fx.statuses.size() >= 3; }));
    CHECK(fx.monitor.status() == EngineStatus::Starting);

    // Outage longer than the startup deadline
    pumpEvents(600);
    CHECK_FALSE(startupFailed);
    CHECK(fx.monitor.status() == EngineStatus::Starting);
    const int polls = fx.engine.requestCount("/health");
    REQUIRE(waitUntil([&]() { return fx.engine.requestCount("/health") > polls; }, 3000));

    fx.engine.setResponse("/health", FakeResponse::json(healthJson("uuid-2")));
    REQUIRE(waitUntil([&fx]() { return fx.monitor.isConnected(); }, 5000));
    CHECK(restarts == 1);
    CHECK_FALSE(fx.statuses.contains(EngineStatus::Disconnected));
    CHECK_FALSE(startupFailed);
    fx.monitor.stop();
}

TEST_CASE("EngineHealthMonitor detects an engine restart", "[EngineHealthMonitor]") {
    HealthFixture fx;
    fx.engine.queueResponse("/health", FakeResponse::json(healthJson("uuid-1")));
    fx.engine.setResponse("/health", FakeResponse::json(healthJson("uuid-2")));

    int restarts = 0;
    QObject::connect(&fx.monitor, &EngineHealthMonitor::engineRestarted, [&restarts]() { ++restarts; });

    fx.monitor.start();
    REQUIRE(waitUntil([&restarts]() { return restarts == 1; }));
    CHECK(fx.monitor.lastHealth().engineUuid == "uuid-2");

    // Credentials were dropped, so the next request resolves a fresh token
    const int lookups = fx.tokenLookups;
    REQUIRE(waitUntil([&]() { return fx.tokenLookups > lookups; }));
    pumpEvents(150);
    CHECK(restarts == 1);
    fx.monitor.stop();
}

TEST_CASE("EngineHealthMonitor gives up after the startup deadline", "[EngineHealthMonitor]") {
    quint16 deadPort = 0;
    {
        QTcpServer reserved;
        REQUIRE(reserved.listen(QHostAddress::LocalHost, 0));
        deadPort = reserved.serverPort();
    }

    CredentialResolver credentials(CredentialResolver::TokenProvider(), [deadPort](quint16* out, QString*) {
        *out = deadPort;
        return true;
    });
    EngineApiClient api(&credentials);
    EngineHealthMonitor monitor(&api, &credentials);
    monitor.setStartupTimeout(300);

    QString failure;
    QObject::connect(&monitor, &EngineHealthMonitor::startupFailed, [&failure](const QString& error) { failure = error; });

    monitor.start();
    CHECK(monitor.status() == EngineStatus::Starting);
    REQUIRE(waitUntil([&failure]() { return !failure.isEmpty(); }, 3000));
    CHECK(failure == QString("Engine startup timeout - make sure engine is running on port %1").arg(deadPort));
    CHECK(monitor.status() == EngineStatus::Disconnected);
}
