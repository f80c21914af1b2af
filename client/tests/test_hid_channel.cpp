#include <gtest/gtest.h>
#include <QSignalSpy>
#include "TestFakes.h"
#include "backend/domain/models/KvmDevice.h"
#include "backend/network/hid/HidChannel.h"
#include "backend/network/hid/HidWireCodec.h"
#include "backend/network/hid/MouseMoveCoalescer.h"

class HidChannelTest : public ::testing::Test {
protected:
    HidChannelTest()
        : socket(new FakeWebSocketChannel("hid"))
        , channel(socket)
        , device("manual-1", "Desk", "192.168.1.50", 443, KvmDeviceType::GlinetComet) {}

    void connectAndOpen() {
        channel.connectTo(device, "tok123");
        socket->simulateOpen();
    }

    FakeWebSocketChannel* socket;
    HidChannel channel;
    KvmDevice device;
};

TEST_F(HidChannelTest, OpensHidSocketWithAuthCookie) {
    channel.connectTo(device, "tok123");
    EXPECT_EQ(socket->openCount, 1);
    EXPECT_EQ(socket->lastRequest.url().toString(), QString("wss://192.168.1.50:443/api/ws"));
    EXPECT_EQ(socket->lastRequest.rawHeader("Cookie"), QByteArray("auth_token=tok123"));
}

TEST_F(HidChannelTest, SendsAreDroppedWhileClosed) {
    channel.sendKey("KeyA", true);
    channel.sendMouseMove(1, 1);
    channel.connectTo(device, "tok123");
    channel.sendMouseWheel(0, 1);
    EXPECT_TRUE(socket->sentBinary.isEmpty());
    EXPECT_FALSE(channel.isConnected());
}

TEST_F(HidChannelTest, WritesEncodedFramesOnceOpen) {
    QSignalSpy connectedSpy(&channel, &HidChannel::connected);
    connectAndOpen();
    EXPECT_EQ(connectedSpy.count(), 1);

    channel.sendKey("KeyA", true);
    channel.sendMouseButton("left", false);
    channel.sendMouseRelative(3, -3);
    ASSERT_EQ(socket->sentBinary.size(), 3);
    EXPECT_EQ(socket->sentBinary.at(0), HidWireCodec::encodeKey("KeyA", true));
    EXPECT_EQ(socket->sentBinary.at(1), HidWireCodec::encodeMouseButton("left", false));
    EXPECT_EQ(socket->sentBinary.at(2), HidWireCodec::encodeMouseRelative(3, -3));
}

TEST_F(HidChannelTest, FinishAppendsReleaseFrame) {
    connectAndOpen();
    channel.sendKey("Enter", false, true);
    ASSERT_EQ(socket->sentBinary.size(), 2);
    EXPECT_EQ(socket->sentBinary.at(1), HidWireCodec::encodeKeyFinish());
}

TEST_F(HidChannelTest, QueuedMovesAreCoalesced) {
    connectAndOpen();
    channel.queueMouseMove(1, 1);
    channel.queueMouseMove(2, 2);
    channel.queueMouseMove(100, -100);
    EXPECT_TRUE(socket->sentBinary.isEmpty());

    channel.moveCoalescer()->tick();
    ASSERT_EQ(socket->sentBinary.size(), 1);
    EXPECT_EQ(socket->sentBinary.first(), HidWireCodec::encodeMouseMove(100, -100));
}

TEST_F(HidChannelTest, ImmediateMoveSupersedesQueuedOne) {
    connectAndOpen();
    channel.queueMouseMove(1, 1);
    channel.sendMouseMove(50, 50);
    channel.moveCoalescer()->tick();
    ASSERT_EQ(socket->sentBinary.size(), 1);
    EXPECT_EQ(socket->sentBinary.first(), HidWireCodec::encodeMouseMove(50, 50));
}

TEST_F(HidChannelTest, RemoteCloseReportsLossOnce) {
    QSignalSpy lostSpy(&channel, &HidChannel::connectionLost);
    connectAndOpen();
    socket->simulateRemoteClose();
    emit socket->errorOccurred("late error");

    ASSERT_EQ(lostSpy.count(), 1);
    const KvmError error = lostSpy.first().first().value<KvmError>();
    EXPECT_EQ(error.kind(), KvmErrorKind::TransportFailed);
    EXPECT_FALSE(channel.isConnected());
}

TEST_F(HidChannelTest, LocalDisconnectIsNotALoss) {
    QSignalSpy lostSpy(&channel, &HidChannel::connectionLost);
    QSignalSpy disconnectedSpy(&channel, &HidChannel::disconnected);
    connectAndOpen();
    channel.disconnect();
    channel.disconnect();
    EXPECT_EQ(lostSpy.count(), 0);
    EXPECT_EQ(disconnectedSpy.count(), 1);
    EXPECT_EQ(socket->closeCount, 1);
}

TEST_F(HidChannelTest, KeepaliveAndInboundEvents) {
    QSignalSpy eventSpy(&channel, &HidChannel::eventReceived);
    connectAndOpen();

    EXPECT_TRUE(channel.sendEvent("ping", QJsonObject()));
    ASSERT_EQ(socket->sentText.size(), 1);
    EXPECT_EQ(socket->lastSentJson().value("event_type").toString(), QString("ping"));

    socket->simulateText("not json");
    socket->simulateText(R"({"event_type":"hid_state","event":{"online":true}})");
    ASSERT_EQ(eventSpy.count(), 1);
    EXPECT_EQ(eventSpy.first().at(0).toString(), QString("hid_state"));
}
