#include <catch2/catch.hpp>
#include <QSettings>
#include <QTemporaryDir>
#include "backend/managers/app/SettingsManager.h"
#include "support/TestUtils.h"

namespace {
// Keeps the process environment free of engine overrides for the test's duration
struct CleanEnvironment {
    CleanEnvironment() {
        qunsetenv("GAZE_ENGINE_PORT");
        qunsetenv("GAZE_AUTH_TOKEN");
    }
    ~CleanEnvironment() {
        qunsetenv("GAZE_ENGINE_PORT");
        qunsetenv("GAZE_AUTH_TOKEN");
    }
};
}

TEST_CASE("SettingsManager defaults", "[SettingsManager]") {
    CleanEnvironment env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    SettingsManager manager(dir.filePath("sync.ini"));
    manager.loadSettings();
    const SyncSettings& s = manager.settings();

    CHECK(s.enginePort == 48100);
    CHECK(s.authToken.isEmpty());
    CHECK(s.reconnect.mode == ConnectionManager::BackoffMode::Fixed);
    CHECK(s.reconnect.baseDelayMs == 3000);
    CHECK(s.reconnect.maxDelayMs == 30000);
    CHECK(s.keepaliveIntervalMs == 25000);
    CHECK(s.downloadStallTimeoutMs == 120000);
    CHECK(s.healthPollIntervalMs == 5000);
    CHECK(s.healthStartupTimeoutMs == 30000);
}

TEST_CASE("SettingsManager reads stored values and environment overrides", "[SettingsManager]") {
    CleanEnvironment env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("sync.ini");
    {
        QSettings store(path, QSettings::IniFormat);
        store.setValue("engine/port", 50123);
        store.setValue("engine/token", "stored-token");
        store.setValue("connection/backoff", "Exponential");
        store.setValue("connection/reconnectDelayMs", 500);
        store.setValue("downloads/stallTimeoutMs", 9000);
    }

    SettingsManager manager(path);
    manager.loadSettings();
    CHECK(manager.settings().enginePort == 50123);
    CHECK(manager.settings().authToken == "stored-token");
    CHECK(manager.settings().reconnect.mode == ConnectionManager::BackoffMode::Exponential);
    CHECK(manager.settings().reconnect.baseDelayMs == 500);
    CHECK(manager.settings().downloadStallTimeoutMs == 9000);

    SECTION("environment wins over the store") {
        qputenv("GAZE_ENGINE_PORT", "50999");
        qputenv("GAZE_AUTH_TOKEN", "env-token");
        manager.loadSettings();
        CHECK(manager.settings().enginePort == 50999);
        CHECK(manager.settings().authToken == "env-token");
    }

    SECTION("an invalid port in the environment is ignored") {
        qputenv("GAZE_ENGINE_PORT", "not-a-port");
        manager.loadSettings();
        CHECK(manager.settings().enginePort == 50123);
    }

    SECTION("providers consult the environment at call time") {
        const CredentialResolver::TokenProvider tokens = manager.tokenProvider();
        const CredentialResolver::PortProvider ports = manager.portProvider();

        QString token;
        QString error;
        REQUIRE(tokens(&token, &error));
        CHECK(token == "stored-token");

        qputenv("GAZE_AUTH_TOKEN", "rotated");
        qputenv("GAZE_ENGINE_PORT", "50500");
        REQUIRE(tokens(&token, &error));
        CHECK(token == "rotated");
        quint16 port = 0;
        REQUIRE(ports(&port, &error));
        CHECK(port == 50500);
    }
}

TEST_CASE("SettingsManager persists changes", "[SettingsManager]") {
    CleanEnvironment env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("sync.ini");

    int changes = 0;
    {
        SettingsManager manager(path);
        QObject::connect(&manager, &SettingsManager::settingsChanged, [&changes]() { ++changes; });
        manager.loadSettings();
        manager.setEnginePort(50200);
        manager.setEnginePort(50200);
        manager.setAuthToken("saved");
    }
    CHECK(changes == 2);

    SettingsManager reloaded(path);
    reloaded.loadSettings();
    CHECK(reloaded.settings().enginePort == 50200);
    CHECK(reloaded.settings().authToken == "saved");

    SECTION("an empty token leaves the resolver unauthenticated") {
        reloaded.setAuthToken(QString());
        QString token;
        QString error;
        CHECK_FALSE(reloaded.tokenProvider()(&token, &error));
        CHECK(error.isEmpty());
    }
}

TEST_CASE("SettingsManager backoff names", "[SettingsManager]") {
    CHECK(SettingsManager::backoffModeFromString("exponential") == ConnectionManager::BackoffMode::Exponential);
    CHECK(SettingsManager::backoffModeFromString(" EXPONENTIAL ") == ConnectionManager::BackoffMode::Exponential);
    CHECK(SettingsManager::backoffModeFromString("fixed") == ConnectionManager::BackoffMode::Fixed);
    CHECK(SettingsManager::backoffModeFromString("garbage") == ConnectionManager::BackoffMode::Fixed);
    CHECK(SettingsManager::backoffModeToString(ConnectionManager::BackoffMode::Exponential) == "exponential");
}
