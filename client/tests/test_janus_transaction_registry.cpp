#include <gtest/gtest.h>
#include <QSet>
#include "backend/network/signaling/JanusTransactionRegistry.h"

TEST(JanusTransactionRegistry, IdsAreUniqueHex) {
    JanusTransactionRegistry registry;
    QSet<QString> seen;
    for (int i = 0; i < 100; ++i) {
        const QString id = registry.newTransactionId();
        EXPECT_EQ(id.size(), 32);
        EXPECT_FALSE(seen.contains(id));
        seen.insert(id);
    }
}

TEST(JanusTransactionRegistry, ResolvesAtMostOnce) {
    JanusTransactionRegistry registry;
    int calls = 0;
    QJsonObject received;
    const QString id = registry.registerWaiter([&](const KvmError& error, const QJsonObject& response) {
        EXPECT_FALSE(error.isError());
        received = response;
        ++calls;
    });

    QJsonObject response;
    response["janus"] = "success";
    EXPECT_TRUE(registry.resolve(id, response));
    EXPECT_FALSE(registry.resolve(id, response));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(received.value("janus").toString(), QString("success"));
    EXPECT_EQ(registry.pendingCount(), 0);
}

TEST(JanusTransactionRegistry, UnknownIdIsNotResolved) {
    JanusTransactionRegistry registry;
    EXPECT_FALSE(registry.resolve("deadbeef", QJsonObject()));
}

TEST(JanusTransactionRegistry, DuplicateRegistrationIsRefused) {
    JanusTransactionRegistry registry;
    EXPECT_TRUE(registry.registerWaiter(QString("abc"), [](const KvmError&, const QJsonObject&) {}));
    EXPECT_FALSE(registry.registerWaiter(QString("abc"), [](const KvmError&, const QJsonObject&) {}));
    EXPECT_EQ(registry.pendingCount(), 1);
}

TEST(JanusTransactionRegistry, FailAllFailsEveryWaiterOnce) {
    JanusTransactionRegistry registry;
    int failures = 0;
    for (int i = 0; i < 3; ++i) {
        registry.registerWaiter([&](const KvmError& error, const QJsonObject&) {
            EXPECT_EQ(error.kind(), KvmErrorKind::SignalingLost);
            ++failures;
        });
    }
    EXPECT_EQ(registry.failAll(KvmError::signalingLost("gone")), 3);
    EXPECT_EQ(failures, 3);
    EXPECT_EQ(registry.pendingCount(), 0);
    EXPECT_EQ(registry.failAll(KvmError::signalingLost("again")), 0);
}

TEST(JanusTransactionRegistry, CompletionMayRegisterFollowUp) {
    JanusTransactionRegistry registry;
    QString followUp;
    const QString first = registry.registerWaiter([&](const KvmError&, const QJsonObject&) {
        followUp = registry.registerWaiter([](const KvmError&, const QJsonObject&) {});
    });
    EXPECT_TRUE(registry.resolve(first, QJsonObject()));
    EXPECT_TRUE(registry.isPending(followUp));
    EXPECT_FALSE(registry.isPending(first));
}
