#include <unity.h>

#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "Database.hpp"
#include "DeviceRegistry.hpp"
#include "utils/logger.hpp"

static std::unique_ptr<Database> db;
static std::unique_ptr<DeviceRegistry> registry;

static std::string macFor(int n) {
  char buffer[18];
  snprintf(buffer, sizeof(buffer), "AA:BB:CC:DD:EE:%02X", n & 0xFF);
  return buffer;
}

static size_t deviceCount(DeviceRegistry &registry) {
  std::vector<Device> devices;
  TEST_ASSERT_TRUE(registry.listDevices(devices));
  return devices.size();
}

void setUp(void) {
  utils::logger::set_log_file("");
  db = std::make_unique<Database>(":memory:");
  registry = std::make_unique<DeviceRegistry>(*db);
}

void tearDown(void) {
  registry.reset();
  db.reset();
}

void test_registry_is_ready(void) {
  TEST_ASSERT_TRUE(db->isOpen());
  TEST_ASSERT_TRUE(registry->isReady());
  TEST_ASSERT_EQUAL(0, deviceCount(*registry));
}

void test_new_devices_get_sequential_nicknames(void) {
  Device device;
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(1), SensorType::Air, device));
  TEST_ASSERT_EQUAL_STRING("air1", device.nickname.c_str());
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(2), SensorType::Air, device));
  TEST_ASSERT_EQUAL_STRING("air2", device.nickname.c_str());
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(3), SensorType::Air, device));
  TEST_ASSERT_EQUAL_STRING("air3", device.nickname.c_str());

  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(4), SensorType::Tag, device));
  TEST_ASSERT_EQUAL_STRING("tag1", device.nickname.c_str());
  TEST_ASSERT_TRUE(device.sensor_type == SensorType::Tag);

  TEST_ASSERT_EQUAL(4, deviceCount(*registry));
}

void test_known_device_is_returned(void) {
  Device created, found;
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(1), SensorType::Air, created));
  TEST_ASSERT_TRUE(ResolveStatus::Existing ==
                   registry->resolve(macFor(1), SensorType::Air, found));
  TEST_ASSERT_EQUAL_STRING(created.nickname.c_str(), found.nickname.c_str());
  TEST_ASSERT_EQUAL(1, deviceCount(*registry));
}

void test_mac_is_case_insensitive(void) {
  Device device;
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve("aa:bb:cc:dd:ee:ff", SensorType::Tag,
                                     device));
  TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:FF", device.mac.c_str());
  TEST_ASSERT_TRUE(ResolveStatus::Existing ==
                   registry->resolve("AA-BB-CC-DD-EE-FF", SensorType::Tag,
                                     device));
  TEST_ASSERT_TRUE(registry->getDevice("aa:bb:cc:dd:ee:ff", device));
}

void test_type_conflict_keeps_stored_type(void) {
  Device device;
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(1), SensorType::Air, device));
  TEST_ASSERT_TRUE(ResolveStatus::TypeConflict ==
                   registry->resolve(macFor(1), SensorType::Tag, device));

  Device stored;
  TEST_ASSERT_TRUE(registry->getDevice(macFor(1), stored));
  TEST_ASSERT_TRUE(stored.sensor_type == SensorType::Air);
  TEST_ASSERT_EQUAL_STRING("air1", stored.nickname.c_str());
}

void test_nickname_fills_gaps(void) {
  Device air1;
  air1.mac = macFor(1);
  air1.sensor_type = SensorType::Air;
  air1.nickname = "air1";
  Device air3 = air1;
  air3.mac = macFor(3);
  air3.nickname = "air3";
  TEST_ASSERT_TRUE(ResolveStatus::Created == registry->upsert(air1));
  TEST_ASSERT_TRUE(ResolveStatus::Created == registry->upsert(air3));

  Device device;
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(9), SensorType::Air, device));
  TEST_ASSERT_EQUAL_STRING("air2", device.nickname.c_str());
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(10), SensorType::Air, device));
  TEST_ASSERT_EQUAL_STRING("air4", device.nickname.c_str());
}

void test_nickname_ignores_custom_names(void) {
  Device named;
  named.mac = macFor(1);
  named.sensor_type = SensorType::Air;
  named.nickname = "airy";
  TEST_ASSERT_TRUE(ResolveStatus::Created == registry->upsert(named));

  Device device;
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(2), SensorType::Air, device));
  TEST_ASSERT_EQUAL_STRING("air1", device.nickname.c_str());
}

void test_lookup_by_nickname(void) {
  Device device;
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(1), SensorType::Tag, device));

  Device found;
  TEST_ASSERT_TRUE(registry->getDeviceByNickname("TAG1", found));
  TEST_ASSERT_EQUAL_STRING(macFor(1).c_str(), found.mac.c_str());
  TEST_ASSERT_TRUE(registry->findDevice("tag1", found));
  TEST_ASSERT_TRUE(registry->findDevice(macFor(1), found));
  TEST_ASSERT_FALSE(registry->findDevice("tag2", found));
  TEST_ASSERT_FALSE(registry->findDevice("", found));
}

void test_upsert_updates_metadata(void) {
  Device device;
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(1), SensorType::Air, device));

  Device update;
  update.mac = macFor(1);
  update.sensor_type = SensorType::Air;
  update.nickname = "office";
  update.description = "Desk by the window";
  TEST_ASSERT_TRUE(ResolveStatus::Existing == registry->upsert(update));

  Device partial;
  partial.mac = macFor(1);
  partial.sensor_type = SensorType::Air;
  partial.ble_uuid = "1234-5678";
  TEST_ASSERT_TRUE(ResolveStatus::Existing == registry->upsert(partial));

  Device stored;
  TEST_ASSERT_TRUE(registry->getDevice(macFor(1), stored));
  TEST_ASSERT_EQUAL_STRING("office", stored.nickname.c_str());
  TEST_ASSERT_EQUAL_STRING("Desk by the window", stored.description.c_str());
  TEST_ASSERT_EQUAL_STRING("1234-5678", stored.ble_uuid.c_str());

  Device retype = partial;
  retype.sensor_type = SensorType::Tag;
  TEST_ASSERT_TRUE(ResolveStatus::TypeConflict == registry->upsert(retype));
}

void test_upsert_without_nickname_generates_one(void) {
  Device device;
  device.mac = macFor(1);
  device.sensor_type = SensorType::Tag;
  device.description = "Fridge";
  TEST_ASSERT_TRUE(ResolveStatus::Created == registry->upsert(device));

  Device stored;
  TEST_ASSERT_TRUE(registry->getDevice(macFor(1), stored));
  TEST_ASSERT_EQUAL_STRING("tag1", stored.nickname.c_str());
}

void test_nicknames_are_unique(void) {
  Device first;
  first.mac = macFor(1);
  first.sensor_type = SensorType::Air;
  first.nickname = "office";
  TEST_ASSERT_TRUE(ResolveStatus::Created == registry->upsert(first));

  Device second = first;
  second.mac = macFor(2);
  second.nickname = "OFFICE";
  TEST_ASSERT_TRUE(ResolveStatus::StorageError == registry->upsert(second));
  TEST_ASSERT_EQUAL(1, deviceCount(*registry));
}

void test_concurrent_resolution_gives_distinct_nicknames(void) {
  const int kThreads = 8;
  std::vector<Device> devices(kThreads);
  std::vector<ResolveStatus> results(kThreads, ResolveStatus::StorageError);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([i, &devices, &results]() {
      results[i] = registry->resolve(macFor(i + 1), SensorType::Air, devices[i]);
    });
  }
  for (auto &thread : threads)
    thread.join();

  std::set<std::string> nicknames;
  for (int i = 0; i < kThreads; i++) {
    TEST_ASSERT_TRUE(results[i] == ResolveStatus::Created);
    nicknames.insert(devices[i].nickname);
  }
  TEST_ASSERT_EQUAL(kThreads, nicknames.size());
  for (int i = 1; i <= kThreads; i++)
    TEST_ASSERT_TRUE(nicknames.count("air" + std::to_string(i)) == 1);
}

void test_list_devices_reports_failure(void) {
  Device device;
  TEST_ASSERT_TRUE(ResolveStatus::Created ==
                   registry->resolve(macFor(1), SensorType::Air, device));
  TEST_ASSERT_TRUE(SQLITE_OK == db->exec("ALTER TABLE devices RENAME TO old"));

  std::vector<Device> devices(3);
  TEST_ASSERT_FALSE(registry->listDevices(devices));
  TEST_ASSERT_EQUAL(0, devices.size());
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_registry_is_ready);
  RUN_TEST(test_new_devices_get_sequential_nicknames);
  RUN_TEST(test_known_device_is_returned);
  RUN_TEST(test_mac_is_case_insensitive);
  RUN_TEST(test_type_conflict_keeps_stored_type);
  RUN_TEST(test_nickname_fills_gaps);
  RUN_TEST(test_nickname_ignores_custom_names);
  RUN_TEST(test_lookup_by_nickname);
  RUN_TEST(test_upsert_updates_metadata);
  RUN_TEST(test_upsert_without_nickname_generates_one);
  RUN_TEST(test_nicknames_are_unique);
  RUN_TEST(test_concurrent_resolution_gives_distinct_nicknames);
  RUN_TEST(test_list_devices_reports_failure);
  return UNITY_END();
}
