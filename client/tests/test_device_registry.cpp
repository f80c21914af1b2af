#include <gtest/gtest.h>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <memory>
#include "backend/managers/devices/DeviceRegistry.h"
#include "backend/managers/devices/DeviceStore.h"

TEST(KvmDevice, IdsAndEndpoints) {
    EXPECT_EQ(KvmDevice::savedIdFor("10.0.0.5", 443), QString("saved-10.0.0.5-443"));
    EXPECT_EQ(KvmDevice::savedIdFor("fe80::1", 443), QString("saved-fe80__1-443"));
    EXPECT_EQ(KvmDevice::endpointKey("GLKVM.local", 8443), QString("glkvm.local:8443"));

    KvmDevice v6("saved-fe80__1-443", "v6", "fe80::1", 443, KvmDeviceType::GlinetComet);
    EXPECT_EQ(v6.baseUrl(), QString("https://[fe80::1]:443"));
    KvmDevice v4("x", "v4", "10.0.0.5", 8443, KvmDeviceType::Generic);
    EXPECT_EQ(v4.baseUrl(), QString("https://10.0.0.5:8443"));
}

TEST(KvmDevice, OriginTaggedIds) {
    const KvmDevice manual = KvmDevice::createManual("10.0.0.9", 443);
    EXPECT_TRUE(manual.getId().startsWith("manual-"));
    EXPECT_TRUE(manual.isPinned());

    const KvmDevice scanned = KvmDevice::createDiscovered("10.0.0.9", 443, KvmDeviceType::GlinetComet, "GLKVM @ 10.0.0.9:443");
    EXPECT_EQ(scanned.getId(), QString("scanned-10.0.0.9-443"));
    EXPECT_FALSE(scanned.isPinned());
    EXPECT_TRUE(scanned.hasCapability(KvmCapability::PowerManagement));
}

TEST(KvmDevice, JsonRecordKeepsTokenAndCapabilities) {
    KvmDevice device = KvmDevice::createManual("10.0.0.5", 443);
    device.setName("Rack 3");
    device.setAuthToken("tok123");

    bool ok = false;
    const KvmDevice restored = KvmDevice::fromJson(device.toJson(), &ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(restored.getId(), QString("saved-10.0.0.5-443"));
    EXPECT_EQ(restored.getName(), QString("Rack 3"));
    EXPECT_EQ(restored.getAuthToken(), QString("tok123"));
    EXPECT_EQ(restored.getType(), KvmDeviceType::GlinetComet);
    EXPECT_EQ(restored.getCapabilities(), device.getCapabilities());
}

TEST(KvmDevice, InvalidRecordIsRejected) {
    QJsonObject json;
    json["host"] = "";
    json["port"] = 443;
    bool ok = true;
    KvmDevice::fromJson(json, &ok);
    EXPECT_FALSE(ok);
}

class DeviceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        store = DeviceStore(dir.filePath("devices.ini"));
        registry.reset(new DeviceRegistry(store));
    }

    QTemporaryDir dir;
    DeviceStore store;
    std::unique_ptr<DeviceRegistry> registry;
};

TEST_F(DeviceRegistryTest, StoreRoundTrip) {
    KvmDevice a("saved-10.0.0.1-443", "A", "10.0.0.1", 443, KvmDeviceType::GlinetComet);
    a.setAuthToken("t1");
    store.upsert(a);
    a.setName("A2");
    store.upsert(a);
    store.upsert(KvmDevice("saved-10.0.0.2-443", "B", "10.0.0.2", 443, KvmDeviceType::Generic));

    const QList<KvmDevice> loaded = store.loadDevices();
    ASSERT_EQ(loaded.size(), 2);
    EXPECT_EQ(loaded.at(0).getName(), QString("A2"));
    EXPECT_EQ(loaded.at(0).getAuthToken(), QString("t1"));

    EXPECT_TRUE(store.remove("10.0.0.2", 443));
    EXPECT_FALSE(store.remove("10.0.0.2", 443));
    EXPECT_EQ(store.loadDevices().size(), 1);
}

TEST_F(DeviceRegistryTest, TokenIsClearedByEmptyValue) {
    store.saveToken("tok123");
    EXPECT_EQ(store.loadToken(), QString("tok123"));
    store.saveToken(QString());
    EXPECT_TRUE(store.loadToken().isEmpty());
}

TEST_F(DeviceRegistryTest, PersistRewritesIdAndKeepsToken) {
    KvmDevice manual = registry->addManual("10.0.0.5", 443);
    ASSERT_TRUE(manual.isValid());
    manual.setAuthToken("tok123");

    const KvmDevice saved = registry->persist(manual);
    EXPECT_EQ(saved.getId(), QString("saved-10.0.0.5-443"));
    ASSERT_EQ(registry->getDevices().size(), 1);
    EXPECT_EQ(registry->getDevices().first().getId(), saved.getId());

    const QList<KvmDevice> records = store.loadDevices();
    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records.first().getAuthToken(), QString("tok123"));

    DeviceRegistry reloaded(store);
    reloaded.loadPersisted();
    bool found = false;
    const KvmDevice device = reloaded.findById("saved-10.0.0.5-443", &found);
    EXPECT_TRUE(found);
    EXPECT_EQ(device.getAuthToken(), QString("tok123"));
}

TEST_F(DeviceRegistryTest, AddManualTwiceReturnsExistingEntry) {
    const KvmDevice first = registry->addManual("10.0.0.5", 443);
    const KvmDevice second = registry->addManual("10.0.0.5", 443);
    EXPECT_EQ(first.getId(), second.getId());
    EXPECT_EQ(registry->getDevices().size(), 1);
    EXPECT_FALSE(registry->addManual("", 443).isValid());
    EXPECT_FALSE(registry->addManual("10.0.0.6", 70000).isValid());
}

TEST_F(DeviceRegistryTest, MergeDiscoveredKeepsPinnedEntries) {
    const KvmDevice manual = registry->addManual("10.0.0.5", 443);
    QSignalSpy spy(registry.get(), &DeviceRegistry::devicesChanged);

    registry->mergeDiscovered({
        KvmDevice::createDiscovered("10.0.0.5", 443, KvmDeviceType::GlinetComet, "GLKVM @ 10.0.0.5:443"),
        KvmDevice::createDiscovered("10.0.0.7", 443, KvmDeviceType::GlinetComet, "GLKVM @ 10.0.0.7:443"),
        KvmDevice::createDiscovered("10.0.0.7", 443, KvmDeviceType::Generic, "KVM @ 10.0.0.7:443"),
    });

    EXPECT_EQ(spy.count(), 1);
    const QList<KvmDevice> devices = registry->getDevices();
    ASSERT_EQ(devices.size(), 2);
    bool found = false;
    EXPECT_EQ(registry->findByEndpoint("10.0.0.5", 443, &found).getId(), manual.getId());
    EXPECT_TRUE(found);
    EXPECT_EQ(registry->findByEndpoint("10.0.0.7", 443).getType(), KvmDeviceType::GlinetComet);

    // A second scan drops stale discovered entries
    registry->mergeDiscovered({});
    ASSERT_EQ(registry->getDevices().size(), 1);
    EXPECT_EQ(registry->getDevices().first().getId(), manual.getId());
}

TEST_F(DeviceRegistryTest, SortIsCaseSensitive) {
    const QList<KvmDevice> sorted = DeviceRegistry::deduplicated({
        KvmDevice("a", "alpha", "10.0.0.1", 443, KvmDeviceType::Generic),
        KvmDevice("b", "Zeta", "10.0.0.2", 443, KvmDeviceType::Generic),
        KvmDevice("c", "Beta", "10.0.0.3", 443, KvmDeviceType::Generic),
    });
    ASSERT_EQ(sorted.size(), 3);
    EXPECT_EQ(sorted.at(0).getName(), QString("Beta"));
    EXPECT_EQ(sorted.at(1).getName(), QString("Zeta"));
    EXPECT_EQ(sorted.at(2).getName(), QString("alpha"));
}

TEST_F(DeviceRegistryTest, ActiveDeviceCannotBeForgotten) {
    KvmDevice saved = registry->persist(KvmDevice::createManual("10.0.0.5", 443));
    registry->setActiveEndpoint(saved.endpointKey());

    EXPECT_FALSE(registry->forget(saved));
    EXPECT_FALSE(registry->remove(saved));
    EXPECT_EQ(store.loadDevices().size(), 1);

    registry->setActiveEndpoint(QString());
    EXPECT_TRUE(registry->forget(saved));
    EXPECT_TRUE(store.loadDevices().isEmpty());
    EXPECT_TRUE(registry->getDevices().isEmpty());
}
