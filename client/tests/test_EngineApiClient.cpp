#include <catch2/catch.hpp>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTcpServer>
#include "backend/network/CredentialResolver.h"
#include "backend/network/EngineApiClient.h"
#include "support/FakeEngineServer.h"
#include "support/TestUtils.h"

using namespace testutil;

namespace {
struct ApiFixture {
    FakeEngineServer engine;
    int tokenLookups = 0;
    bool tokenAvailable = true;
    CredentialResolver credentials;
    EngineApiClient api{&credentials};

    ApiFixture() {
        REQUIRE(engine.listen());
        const quint16 port = engine.port();
        credentials.setPortProvider([port](quint16* out, QString*) {
            *out = port;
            return true;
        });
        credentials.setTokenProvider([this](QString* out, QString*) {
            if (!tokenAvailable) return false;
            ++tokenLookups;
            *out = QString("token-%1").arg(tokenLookups);
            return true;
        });
    }

    ApiResult get(const QString& endpoint) {
        bool done = false;
        ApiResult captured;
        api.get(endpoint, [&done, &captured](const ApiResult& result) {
            captured = result;
            done = true;
        });
        REQUIRE(waitUntil([&done]() { return done; }));
        return captured;
    }
};
}

TEST_CASE("EngineApiClient attaches credentials", "[EngineApiClient]") {
    ApiFixture fx;
    fx.engine.setResponse("/libraries", FakeResponse::json(QJsonObject{{"libraries", QJsonArray()}}));

    const ApiResult result = fx.get("/libraries");
    REQUIRE(result.ok);
    CHECK(result.isJson);
    CHECK(result.statusCode == 200);

    const RecordedRequest request = fx.engine.lastRequest("/libraries");
    CHECK(request.method == "GET");
    CHECK(request.header("Authorization") == "Bearer token-1");
    CHECK(request.header("Content-Type") == "application/json");
    CHECK(fx.api.baseUrl() == QString("http://127.0.0.1:%1").arg(fx.engine.port()));

    SECTION("no token means no Authorization header") {
        fx.credentials.invalidateToken();
        fx.tokenAvailable = false;
        REQUIRE(fx.get("/libraries").ok);
        CHECK(fx.engine.lastRequest("/libraries").header("Authorization").isEmpty());
    }
}

TEST_CASE("EngineApiClient retries exactly once after 401", "[EngineApiClient]") {
    ApiFixture fx;

    SECTION("401 then success is invisible to the caller") {
        fx.engine.queueResponse("/videos", FakeResponse::text("expired", 401));
        fx.engine.setResponse("/videos", FakeResponse::json(QJsonObject{{"videos", QJsonArray()}, {"total", 0}}));

        const ApiResult result = fx.get("/videos");
        REQUIRE(result.ok);
        CHECK(result.errorString.isEmpty());
        CHECK(result.attempts == 2);
        CHECK(fx.engine.requestCount("/videos") == 2);
        CHECK(fx.api.requestsSent() == 2);

        // The retry carries a freshly resolved token
        const QList<RecordedRequest> requests = fx.engine.requests();
        CHECK(requests.at(0).header("Authorization") == "Bearer token-1");
        CHECK(requests.at(1).header("Authorization") == "Bearer token-2");
    }

    SECTION("a second 401 is a hard failure") {
        fx.engine.setResponse("/videos", FakeResponse::text("still expired", 401));

        const ApiResult result = fx.get("/videos");
        CHECK_FALSE(result.ok);
        CHECK(result.statusCode == 401);
        CHECK(result.errorString == "API request failed: 401 still expired");
        CHECK(fx.engine.requestCount("/videos") == 2);

        // Nothing further goes out after the failure is reported
        pumpEvents(100);
        CHECK(fx.engine.requestCount("/videos") == 2);
    }

    SECTION("other failures are not retried") {
        fx.engine.setResponse("/videos", FakeResponse::text("database locked", 500));

        const ApiResult result = fx.get("/videos");
        CHECK_FALSE(result.ok);
        CHECK(result.statusCode == 500);
        CHECK(result.errorString == "API request failed: 500 database locked");
        CHECK(result.attempts == 1);
        CHECK(fx.engine.requestCount("/videos") == 1);
    }
}

TEST_CASE("EngineApiClient interprets response bodies", "[EngineApiClient]") {
    ApiFixture fx;

    SECTION("JSON content type yields a document") {
        fx.engine.setResponse("/health", FakeResponse::json(QJsonObject{{"status", "ready"}}));
        const ApiResult result = fx.get("/health");
        REQUIRE(result.ok);
        REQUIRE(result.isJson);
        CHECK(result.json.object().value("status").toString() == "ready");
    }

    SECTION("other content types yield raw text") {
        fx.engine.setResponse("/version", FakeResponse::text("1.4.2"));
        const ApiResult result = fx.get("/version");
        REQUIRE(result.ok);
        CHECK_FALSE(result.isJson);
        CHECK(result.text == "1.4.2");
    }

    SECTION("an empty error body falls back to the status phrase") {
        FakeResponse missing;
        missing.status = 404;
        missing.contentType.clear();
        fx.engine.setResponse("/videos/gone", missing);

        const ApiResult result = fx.get("/videos/gone");
        CHECK_FALSE(result.ok);
        CHECK(result.errorString == "API request failed: 404 Not Found");
    }

    SECTION("a broken JSON body is reported") {
        FakeResponse broken;
        broken.body = "{\"status\":";
        fx.engine.setResponse("/health", broken);

        const ApiResult result = fx.get("/health");
        CHECK_FALSE(result.ok);
        CHECK(result.errorString.startsWith("API response is not valid JSON"));
    }
}

TEST_CASE("EngineApiClient content type handling", "[EngineApiClient]") {
    ApiFixture fx;
    fx.engine.setResponse("/libraries", FakeResponse::json(QJsonObject{{"library_id", "lib-1"}}, 201));

    SECTION("JSON bodies are sent as application/json") {
        bool done = false;
        fx.api.postJson("/libraries", QJsonObject{{"folder_path", "/media"}}, [&done](const ApiResult& result) {
            CHECK(result.ok);
            done = true;
        });
        REQUIRE(waitUntil([&done]() { return done; }));

        const RecordedRequest request = fx.engine.lastRequest("/libraries");
        CHECK(request.method == "POST");
        CHECK(request.header("Content-Type") == "application/json");
        CHECK(QJsonDocument::fromJson(request.body).object().value("folder_path").toString() == "/media");
    }

    SECTION("multipart bodies keep their own content type") {
        ApiRequest request;
        request.method = "POST";
        request.endpoint = "/libraries";
        request.formData = true;
        request.contentType = "multipart/form-data; boundary=gaze";
        request.body = "--gaze\r\nContent-Disposition: form-data; name=\"folder_path\"\r\n\r\n/media\r\n--gaze--\r\n";

        bool done = false;
        fx.api.send(request, [&done](const ApiResult&) { done = true; });
        REQUIRE(waitUntil([&done]() { return done; }));
        CHECK(fx.engine.lastRequest("/libraries").header("Content-Type") == "multipart/form-data; boundary=gaze");
    }
}

TEST_CASE("EngineApiClient reports an unreachable engine", "[EngineApiClient]") {
    // Reserve a port, then free it so nothing is listening
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

    bool done = false;
    ApiResult captured;
    api.get("/health", [&](const ApiResult& result) {
        captured = result;
        done = true;
    });
    REQUIRE(waitUntil([&done]() { return done; }));
    CHECK_FALSE(captured.ok);
    CHECK(captured.statusCode == 0);
    CHECK(captured.errorString.startsWith("API request failed: 0"));
}
