#include <gtest/gtest.h>
#include <QSignalSpy>
#include <QTest>
#include "LocalHttpServer.h"
#include "TestFakes.h"
#include "backend/managers/devices/DeviceDiscovery.h"

TEST(DeviceDiscovery, PrivateAddressRanges) {
    EXPECT_TRUE(DeviceDiscovery::isPrivateIPv4("10.1.2.3"));
    EXPECT_TRUE(DeviceDiscovery::isPrivateIPv4("192.168.200.5"));
    EXPECT_TRUE(DeviceDiscovery::isPrivateIPv4("172.16.0.1"));
    EXPECT_TRUE(DeviceDiscovery::isPrivateIPv4("172.31.255.1"));
    EXPECT_FALSE(DeviceDiscovery::isPrivateIPv4("172.32.0.1"));
    EXPECT_FALSE(DeviceDiscovery::isPrivateIPv4("8.8.8.8"));
    EXPECT_FALSE(DeviceDiscovery::isPrivateIPv4("fe80::1"));
}

TEST(DeviceDiscovery, TargetsCoverEveryHostAndPort) {
    const QList<DeviceDiscovery::Target> targets = DeviceDiscovery::buildTargets({ "192.168.1" });
    ASSERT_EQ(targets.size(), 254 * 4);
    EXPECT_EQ(targets.first(), DeviceDiscovery::Target("192.168.1.1", 443));
    EXPECT_EQ(targets.at(1).second, 8443);
    EXPECT_EQ(targets.last(), DeviceDiscovery::Target("192.168.1.254", 8080));
}

TEST(DeviceDiscovery, ApplianceSubnetIsAlwaysScanned) {
    EXPECT_TRUE(DeviceDiscovery::localNetworkPrefixes().contains("192.168.200"));
    EXPECT_TRUE(DeviceDiscovery::commonTargets().contains(DeviceDiscovery::Target("192.168.200.1", 80)));
}

TEST(DeviceDiscovery, LandingPageKeywords) {
    EXPECT_TRUE(DeviceDiscovery::looksLikeKvmPage("<title>GLKVM</title>"));
    EXPECT_TRUE(DeviceDiscovery::looksLikeKvmPage("<html>Comet control</html>"));
    EXPECT_FALSE(DeviceDiscovery::looksLikeKvmPage("<html>Router login</html>"));

    const QByteArray late = QByteArray(5000, ' ') + "kvmd";
    EXPECT_FALSE(DeviceDiscovery::looksLikeKvmPage(late));
}

class DeviceDiscoveryScanTest : public ::testing::Test {
protected:
    DeviceDiscoveryScanTest()
        : discovery(&reachability)
        , finishedSpy(&discovery, &DeviceDiscovery::scanFinished) {
        discovery.setCommonTargets({});
    }

    void SetUp() override {
        ASSERT_TRUE(server.listen());
    }

    QList<KvmDevice> runScan() {
        discovery.scan();
        EXPECT_TRUE(QTest::qWaitFor([&]() { return finishedSpy.count() > 0; }, 30000));
        if (finishedSpy.isEmpty()) return {};
        return finishedSpy.first().at(0).value<QList<KvmDevice>>();
    }

    LocalHttpServer server;
    FakeReachabilityProbe reachability;
    DeviceDiscovery discovery;
    QSignalSpy finishedSpy;
};

TEST_F(DeviceDiscoveryScanTest, RedirectFromApiIdentifiesAppliance) {
    LocalHttpServer::Response redirect;
    redirect.status = 302;
    redirect.headers.append({ "Location", "/login" });
    server.route("/api/auth/check", redirect);
    discovery.setTargets({ DeviceDiscovery::Target("127.0.0.1", server.port()) });

    const QList<KvmDevice> devices = runScan();
    ASSERT_EQ(devices.size(), 1);
    EXPECT_EQ(devices.at(0).getType(), KvmDeviceType::GlinetComet);
    EXPECT_EQ(devices.at(0).getPort(), server.port());
    EXPECT_EQ(server.paths(), QList<QByteArray>{ "/api/auth/check" });
}

TEST_F(DeviceDiscoveryScanTest, TransportErrorSkipsRestOfSchemeThenSniffsLandingPage) {
    LocalHttpServer::Response dropped;
    dropped.drop = true;
    server.route("/api/auth/check", dropped);
    LocalHttpServer::Response landing;
    landing.body = "<html><title>kvmd</title></html>";
    server.route("/", landing);
    discovery.setTargets({ DeviceDiscovery::Target("127.0.0.1", server.port()) });

    const QList<KvmDevice> devices = runScan();
    ASSERT_EQ(devices.size(), 1);
    EXPECT_EQ(devices.at(0).getType(), KvmDeviceType::Generic);

    const QList<QByteArray> paths = server.paths();
    EXPECT_TRUE(paths.contains("/api/auth/check"));
    EXPECT_FALSE(paths.contains("/api/init/is_inited"));
    EXPECT_TRUE(paths.contains("/"));
}

TEST_F(DeviceDiscoveryScanTest, UnidentifiedHostIsNotListed) {
    LocalHttpServer::Response page;
    page.body = "<html>Router login</html>";
    server.route("/", page);
    discovery.setTargets({ DeviceDiscovery::Target("127.0.0.1", server.port()) });

    EXPECT_TRUE(runScan().isEmpty());
    // Both API paths are tried over plain http before the landing page
    const QList<QByteArray> paths = server.paths();
    EXPECT_TRUE(paths.contains("/api/auth/check"));
    EXPECT_TRUE(paths.contains("/api/init/is_inited"));
    EXPECT_TRUE(paths.contains("/"));
}

TEST_F(DeviceDiscoveryScanTest, OpenCommonTargetIsListedWithoutIdentification) {
    const int closedPort = closedLocalPort();
    discovery.setTargets({ DeviceDiscovery::Target("127.0.0.1", closedPort) });
    discovery.setCommonTargets({ DeviceDiscovery::Target("127.0.0.2", closedPort) });
    reachability.reachable = true;

    const QList<KvmDevice> devices = runScan();
    ASSERT_EQ(devices.size(), 1);
    EXPECT_EQ(devices.at(0).getHost(), QString("127.0.0.2"));
    EXPECT_EQ(reachability.probed, QStringList{ QString("127.0.0.2:%1").arg(closedPort) });
    EXPECT_EQ(reachability.lastTimeoutMs, DeviceDiscovery::PORT_CHECK_TIMEOUT_MS);
}

TEST_F(DeviceDiscoveryScanTest, ClosedCommonTargetIsDropped) {
    const int closedPort = closedLocalPort();
    discovery.setTargets({ DeviceDiscovery::Target("127.0.0.1", closedPort) });
    discovery.setCommonTargets({ DeviceDiscovery::Target("127.0.0.2", closedPort) });
    reachability.reachable = false;

    EXPECT_TRUE(runScan().isEmpty());
}

TEST_F(DeviceDiscoveryScanTest, InFlightIsBoundedAndFinishFiresOnce) {
    const int closedPort = closedLocalPort();
    QList<DeviceDiscovery::Target> targets;
    for (int i = 0; i < 100; ++i) {
        targets.append(DeviceDiscovery::Target("127.0.0.1", closedPort));
    }
    discovery.setTargets(targets);
    discovery.setCommonTargets({ DeviceDiscovery::Target("127.0.0.2", closedPort) });
    reachability.reachable = false;
    QSignalSpy progressSpy(&discovery, &DeviceDiscovery::scanProgress);

    discovery.scan();
    EXPECT_EQ(discovery.inFlightCount(), DeviceDiscovery::MAX_IN_FLIGHT);
    ASSERT_TRUE(QTest::qWaitFor([&]() { return finishedSpy.count() > 0; }, 60000));
    EXPECT_EQ(discovery.inFlightCount(), 0);
    EXPECT_FALSE(discovery.isScanning());

    ASSERT_FALSE(progressSpy.isEmpty());
    EXPECT_EQ(progressSpy.last().at(0).toInt(), 101);
    EXPECT_EQ(progressSpy.last().at(1).toInt(), 101);

    QTest::qWait(200);
    EXPECT_EQ(finishedSpy.count(), 1);
}
