#include <gtest/gtest.h>
#include <QTest>
#include <functional>
#include <memory>
#include "LocalHttpServer.h"
#include "backend/domain/models/ApplianceTypes.h"
#include "backend/network/ControlPlaneClient.h"

TEST(ControlPlaneClient, UnauthorizedStatusesAreAuthFailures) {
    const KvmError unauthorized = ControlPlaneClient::errorForStatus(401, "{\"ok\":false,\"result\":{}}");
    EXPECT_EQ(unauthorized.kind(), KvmErrorKind::AuthenticationFailed);
    EXPECT_EQ(unauthorized.httpStatus(), 401);
    EXPECT_EQ(ControlPlaneClient::errorForStatus(403, QByteArray()).kind(), KvmErrorKind::AuthenticationFailed);
}

TEST(ControlPlaneClient, ErrorMessageFromEnvelope) {
    const KvmError error = ControlPlaneClient::errorForStatus(
        500, "{\"ok\":false,\"result\":{\"error\":\"MsdError\",\"error_msg\":\"Image is busy\"}}");
    EXPECT_EQ(error.kind(), KvmErrorKind::HttpError);
    EXPECT_EQ(error.httpStatus(), 500);
    EXPECT_EQ(error.message(), QString("Image is busy"));
}

TEST(ControlPlaneClient, ErrorMessageFallsBackToBody) {
    const KvmError error = ControlPlaneClient::errorForStatus(502, "Bad Gateway");
    EXPECT_EQ(error.kind(), KvmErrorKind::HttpError);
    EXPECT_EQ(error.message(), QString("Bad Gateway"));
}

TEST(ControlPlaneClient, UnwrapEnvelope) {
    QJsonValue result;
    ASSERT_TRUE(ControlPlaneClient::unwrapEnvelope("{\"ok\":true,\"result\":{\"online\":true}}", &result));
    EXPECT_TRUE(result.toObject().value("online").toBool());

    EXPECT_FALSE(ControlPlaneClient::unwrapEnvelope("{\"result\":{}}", &result));
    EXPECT_FALSE(ControlPlaneClient::unwrapEnvelope("{\"ok\":true}", &result));
    EXPECT_FALSE(ControlPlaneClient::unwrapEnvelope("[1,2]", &result));
    EXPECT_FALSE(ControlPlaneClient::unwrapEnvelope("not json", &result));
}

TEST(ControlPlaneClient, EdidFromEveryResponseShape) {
    EXPECT_EQ(ControlPlaneClient::edidFromBody("{\"ok\":true,\"result\":\"00FFFF\"}"), QString("00FFFF"));
    EXPECT_EQ(ControlPlaneClient::edidFromBody("{\"ok\":true,\"result\":{\"edid\":\"00AA\"}}"), QString("00AA"));
    EXPECT_EQ(ControlPlaneClient::edidFromBody("{\"ok\":true,\"result\":{\"EDID\":\"00BB\"}}"), QString("00BB"));
    EXPECT_EQ(ControlPlaneClient::edidFromBody("00CCDD"), QString("00CCDD"));
}

TEST(ControlPlaneClient, WriteResultsFromStreamedLines) {
    const QByteArray body =
        "{\"ok\":true,\"result\":{\"image\":{\"name\":\"a.iso\",\"size\":10,\"written\":5}}}\n"
        "\n"
        "{\"image\":{\"name\":\"a.iso\",\"size\":10,\"written\":10}}\n"
        "garbage\n";
    const QList<MsdWriteResult> results = ControlPlaneClient::writeResultsFromLines(body);
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results.at(0).imageName, QString("a.iso"));
    EXPECT_EQ(results.at(0).written, 5);
    EXPECT_EQ(results.at(1).written, 10);
    EXPECT_EQ(results.at(1).size, 10);
}

TEST(ApplianceTypes, RequiredFieldsAreChecked) {
    QJsonObject json;
    json["country_code"] = "US";
    json["is_inited"] = true;
    bool ok = false;
    const InitStatus status = InitStatus::fromJson(json, &ok);
    EXPECT_TRUE(ok);
    EXPECT_TRUE(status.isInited);

    json.remove("is_inited");
    InitStatus::fromJson(json, &ok);
    EXPECT_FALSE(ok);
}

class ControlPlaneHttpTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server.listen());
    }

    std::unique_ptr<ControlPlaneClient> makeClient(const QString& token = QString()) {
        auto client = std::make_unique<ControlPlaneClient>("127.0.0.1", server.port(), token);
        client->setScheme("http");
        return client;
    }

    // Runs one ErrorCallback call to completion
    KvmError await(const std::function<void(ErrorCallback)>& call) {
        bool done = false;
        KvmError result;
        call([&](const KvmError& error) {
            result = error;
            done = true;
        });
        EXPECT_TRUE(QTest::qWaitFor([&]() { return done; }, 10000));
        return result;
    }

    LocalHttpServer server;
};

TEST_F(ControlPlaneHttpTest, LoginPostsFormFieldsAndLaterRequestsCarryToken) {
    server.route("/api/auth/login", LocalHttpServer::json(200, "{\"ok\":true,\"result\":{\"token\":\"tok123\"}}"));
    server.route("/api/hid/set_connected", LocalHttpServer::json(200, "{\"ok\":true,\"result\":{}}"));
    auto client = makeClient();

    bool done = false;
    KvmError loginError;
    QString token;
    client->login("admin", "s3cret", [&](const KvmError& error, const QString& value) {
        loginError = error;
        token = value;
        done = true;
    });
    ASSERT_TRUE(QTest::qWaitFor([&]() { return done; }, 10000));
    EXPECT_FALSE(loginError.isError()) << loginError.toString().toStdString();
    EXPECT_EQ(token, QString("tok123"));
    EXPECT_EQ(client->authToken(), QString("tok123"));

    ASSERT_EQ(server.requests.size(), 1);
    const LocalHttpServer::Request login = server.requests.at(0);
    EXPECT_EQ(login.method, QByteArray("POST"));
    EXPECT_EQ(login.target, QByteArray("/api/auth/login"));
    EXPECT_TRUE(login.header("Content-Type").startsWith("multipart/form-data"));
    EXPECT_TRUE(login.body.contains("name=\"user\"\r\n\r\nadmin\r\n"));
    EXPECT_TRUE(login.body.contains("name=\"passwd\"\r\n\r\ns3cret\r\n"));
    EXPECT_TRUE(login.header("Cookie").isEmpty());

    const KvmError connectError = await([&](ErrorCallback callback) {
        client->setHidConnected(true, callback);
    });
    EXPECT_FALSE(connectError.isError()) << connectError.toString().toStdString();

    ASSERT_EQ(server.requests.size(), 2);
    const LocalHttpServer::Request connect = server.requests.at(1);
    EXPECT_EQ(connect.method, QByteArray("POST"));
    EXPECT_EQ(connect.target, QByteArray("/api/hid/set_connected?connected=true"));
    EXPECT_EQ(connect.header("Cookie"), QByteArray("auth_token=tok123"));
    EXPECT_EQ(connect.header("Content-Type"), QByteArray("application/x-www-form-urlencoded"));
}

TEST_F(ControlPlaneHttpTest, StoredTokenIsSentOnChecks) {
    server.route("/api/auth/check", LocalHttpServer::json(200, "{\"ok\":true,\"result\":{}}"));
    auto client = makeClient("tok123");

    const KvmError error = await([&](ErrorCallback callback) { client->checkAuth(callback); });
    EXPECT_FALSE(error.isError());
    ASSERT_EQ(server.requests.size(), 1);
    EXPECT_EQ(server.requests.at(0).method, QByteArray("GET"));
    EXPECT_EQ(server.requests.at(0).header("Cookie"), QByteArray("auth_token=tok123"));
}

TEST_F(ControlPlaneHttpTest, MalformedEnvelopeOnSuccessIsDecodingFailure) {
    LocalHttpServer::Response page;
    page.body = "<html>not json</html>";
    server.route("/api/auth/check", page);
    auto client = makeClient("tok123");

    const KvmError error = await([&](ErrorCallback callback) { client->checkAuth(callback); });
    EXPECT_EQ(error.kind(), KvmErrorKind::DecodingFailed);
}

TEST_F(ControlPlaneHttpTest, RejectedTokenIsAuthenticationFailure) {
    server.route("/api/auth/check",
                 LocalHttpServer::json(401, "{\"ok\":false,\"result\":{\"error_msg\":\"Bad token\"}}"));
    auto client = makeClient("stale");

    const KvmError error = await([&](ErrorCallback callback) { client->checkAuth(callback); });
    EXPECT_EQ(error.kind(), KvmErrorKind::AuthenticationFailed);
    EXPECT_EQ(error.httpStatus(), 401);
    EXPECT_EQ(error.message(), QString("Bad token"));
}

TEST_F(ControlPlaneHttpTest, NothingListeningIsConnectionFailure) {
    ControlPlaneClient client("127.0.0.1", closedLocalPort(), QString());
    client.setScheme("http");

    const KvmError error = await([&](ErrorCallback callback) { client.checkAuth(callback); });
    EXPECT_EQ(error.kind(), KvmErrorKind::ConnectionFailed);
}
