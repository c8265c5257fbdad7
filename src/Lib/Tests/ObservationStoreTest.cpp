#include <SQLiteCpp/Database.h> // SQLite::{Database, OPEN_READWRITE}
#include <algorithm>             // std::ranges::is_sorted
#include <chrono>                // std::chrono::milliseconds
#include <filesystem>            // std::filesystem::{path, temp_directory_path, remove_all, exists}
#include <format>                // std::format
#include <future>                // std::{async, future, launch}
#include <latch>                 // std::latch
#include <thread>                // std::this_thread::sleep_for

#include <Clima/Services/Weather.hpp>
#include <Clima/Storage/ObservationStore.hpp>
#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using namespace clima::utils::types;
using clima::services::weather::Observation;
using clima::storage::ObservationStore;
using clima::storage::StoredObservation;
using enum clima::utils::error::ClimaErrorCode;

class ObservationStoreTest : public Test {
 protected:
  std::filesystem::path m_dir;
  std::filesystem::path m_dbPath;

  fn SetUp() -> void override {
    m_dir    = std::filesystem::temp_directory_path() / std::format("clima-store-{}", UnitTest::GetInstance()->current_test_info()->name());
    m_dbPath = m_dir / "nested" / "weather.db";

    std::filesystem::remove_all(m_dir);
  }

  fn TearDown() -> void override {
    std::error_code errc;
    std::filesystem::remove_all(m_dir, errc);
  }

  static fn Reading(const i64 tsUtc, const f64 tempC, String city = "Rio de Janeiro", String country = "BR") -> Observation {
    Observation obs;
    obs.cityName           = std::move(city);
    obs.countryCode        = std::move(country);
    obs.tsUtc              = tsUtc;
    obs.tz                 = "America/Sao_Paulo";
    obs.tempC              = tempC;
    obs.feelsLikeC         = tempC + 1.5;
    obs.humidity           = 70;
    obs.weatherDescription = "Céu limpo";
    return obs;
  }

  fn makeStore() const -> ObservationStore {
    ObservationStore store(m_dbPath);
    EXPECT_TRUE(store.ensureSchema().has_value());
    return store;
  }
};

// NOLINTBEGIN(modernize-use-trailing-return-type, cert-err58-cpp)
TEST_F(ObservationStoreTest, EnsureSchema_CreatesParentDirectories) {
  const ObservationStore store(m_dbPath);

  ASSERT_TRUE(store.ensureSchema().has_value());
  EXPECT_TRUE(std::filesystem::exists(m_dbPath));
}

TEST_F(ObservationStoreTest, EnsureSchema_IsRepeatable) {
  const ObservationStore store = makeStore();

  ASSERT_TRUE(store.insert(Reading(1700000000, 25.0)).value_or(false));
  EXPECT_TRUE(store.ensureSchema().has_value());
  EXPECT_EQ(store.count("Rio de Janeiro", "BR").value_or(-1), 1);
}

TEST_F(ObservationStoreTest, Insert_SameObservationTwiceKeepsOneRow) {
  const ObservationStore store = makeStore();
  const Observation      obs   = Reading(1700000000, 25.0);

  const Result<bool> first  = store.insert(obs);
  const Result<bool> second = store.insert(obs);

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(*first);
  EXPECT_FALSE(*second);
  EXPECT_EQ(store.count("Rio de Janeiro", "BR").value_or(-1), 1);
}

TEST_F(ObservationStoreTest, Insert_FirstWriteWinsForSameIdentity) {
  const ObservationStore store = makeStore();

  EXPECT_TRUE(store.insert(Reading(1700000000, 25.0)).value_or(false));
  EXPECT_FALSE(store.insert(Reading(1700000000, 30.0)).value_or(true));

  const Result<Vec<StoredObservation>> rows = store.fetchLatest("Rio de Janeiro", "BR", 1);

  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 1);
  EXPECT_DOUBLE_EQ(rows->front().observation.tempC.value_or(0.0), 25.0);
}

TEST_F(ObservationStoreTest, Insert_RoundTripsAllColumns) {
  const ObservationStore store = makeStore();

  Observation obs  = Reading(1700000000, 25.0);
  obs.lat          = -22.9;
  obs.lon          = -43.2;
  obs.pressure     = 1012.5;
  obs.windSpeed    = 3.6;
  obs.windDir      = 140;
  obs.clouds       = 40;
  obs.visibilityKm = 10.0;

  ASSERT_TRUE(store.insert(obs).value_or(false));

  const Result<Vec<StoredObservation>> rows = store.fetchLatest("Rio de Janeiro", "BR", 1);

  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 1);
  EXPECT_EQ(rows->front().observation, obs);
  EXPECT_GT(rows->front().id, 0);
  EXPECT_FALSE(rows->front().createdAt.empty());
}

TEST_F(ObservationStoreTest, Insert_MissingValuesRoundTripAsNone) {
  const ObservationStore store = makeStore();

  Observation obs;
  obs.cityName    = "Lisbon";
  obs.countryCode = "PT";
  obs.tsUtc       = 1700000000;

  ASSERT_TRUE(store.insert(obs).value_or(false));

  const Result<Vec<StoredObservation>> rows = store.fetchLatest("Lisbon", "PT", 1);

  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 1);
  EXPECT_FALSE(rows->front().observation.tempC.has_value());
  EXPECT_FALSE(rows->front().observation.humidity.has_value());
  EXPECT_EQ(rows->front().observation.tz, "UTC");
}

TEST_F(ObservationStoreTest, Insert_MissingIdentityIsInvalidArgument) {
  const ObservationStore store = makeStore();

  Observation obs = Reading(1700000000, 25.0);
  obs.countryCode = None;

  const Result<bool> inserted = store.insert(obs);

  ASSERT_FALSE(inserted.has_value());
  EXPECT_EQ(inserted.error().code, InvalidArgument);
}

TEST_F(ObservationStoreTest, FetchLatest_IsNewestFirstAndLimited) {
  const ObservationStore store = makeStore();

  for (const i64 tsUtc : { 1700000000, 1700007200, 1700003600, 1700010800 })
    ASSERT_TRUE(store.insert(Reading(tsUtc, 20.0)).value_or(false));

  const Result<Vec<StoredObservation>> rows = store.fetchLatest("Rio de Janeiro", "BR", 3);

  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 3);
  EXPECT_EQ(rows->at(0).observation.tsUtc, 1700010800);
  EXPECT_EQ(rows->at(1).observation.tsUtc, 1700007200);
  EXPECT_EQ(rows->at(2).observation.tsUtc, 1700003600);
}

TEST_F(ObservationStoreTest, FetchLatest_NegativeLimitIsInvalidArgument) {
  const ObservationStore store = makeStore();

  const Result<Vec<StoredObservation>> rows = store.fetchLatest("Rio de Janeiro", "BR", -1);

  ASSERT_FALSE(rows.has_value());
  EXPECT_EQ(rows.error().code, InvalidArgument);
}

TEST_F(ObservationStoreTest, FetchLatest_UnknownIdentityIsEmpty) {
  const ObservationStore store = makeStore();

  ASSERT_TRUE(store.insert(Reading(1700000000, 25.0)).value_or(false));

  const Result<Vec<StoredObservation>> rows = store.fetchLatest("Atlantis", "XX", 5);

  ASSERT_TRUE(rows.has_value());
  EXPECT_TRUE(rows->empty());
}

TEST_F(ObservationStoreTest, FetchRange_UnboundedReturnsAllAscending) {
  const ObservationStore store = makeStore();

  for (const i64 tsUtc : { 1700007200, 1700000000, 1700003600 })
    ASSERT_TRUE(store.insert(Reading(tsUtc, 20.0)).value_or(false));

  ASSERT_TRUE(store.insert(Reading(1700000000, 15.0, "Lisbon", "PT")).value_or(false));

  const Result<Vec<StoredObservation>> rows = store.fetchRange("Rio de Janeiro", "BR");

  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 3);
  EXPECT_TRUE(std::ranges::is_sorted(*rows, {}, [](const StoredObservation& row) { return row.observation.tsUtc; }));
}

TEST_F(ObservationStoreTest, FetchRange_BoundsAreInclusive) {
  const ObservationStore store = makeStore();

  for (const i64 tsUtc : { 1700000000, 1700003600, 1700007200, 1700010800 })
    ASSERT_TRUE(store.insert(Reading(tsUtc, 20.0)).value_or(false));

  const Result<Vec<StoredObservation>> rows = store.fetchRange("Rio de Janeiro", "BR", 1700003600, 1700007200);

  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 2);
  EXPECT_EQ(rows->front().observation.tsUtc, 1700003600);
  EXPECT_EQ(rows->back().observation.tsUtc, 1700007200);
}

TEST_F(ObservationStoreTest, FetchRange_SingleBound) {
  const ObservationStore store = makeStore();

  for (const i64 tsUtc : { 1700000000, 1700003600, 1700007200 })
    ASSERT_TRUE(store.insert(Reading(tsUtc, 20.0)).value_or(false));

  const Result<Vec<StoredObservation>> after  = store.fetchRange("Rio de Janeiro", "BR", 1700003600, None);
  const Result<Vec<StoredObservation>> before = store.fetchRange("Rio de Janeiro", "BR", None, 1700003600);

  ASSERT_TRUE(after.has_value());
  ASSERT_TRUE(before.has_value());
  EXPECT_EQ(after->size(), 2);
  EXPECT_EQ(before->size(), 2);
}

TEST_F(ObservationStoreTest, Readers_MissingDatabaseIsStoreUnavailable) {
  const ObservationStore store(m_dbPath);

  const Result<Vec<StoredObservation>> latest = store.fetchLatest("Rio de Janeiro", "BR", 5);
  const Result<Vec<StoredObservation>> range  = store.fetchRange("Rio de Janeiro", "BR");

  ASSERT_FALSE(latest.has_value());
  ASSERT_FALSE(range.has_value());
  EXPECT_EQ(latest.error().code, StoreUnavailable);
  EXPECT_EQ(range.error().code, StoreUnavailable);
  EXPECT_FALSE(std::filesystem::exists(m_dbPath));
}
TEST_F(ObservationStoreTest, Insert_ConcurrentDuplicatesCreateOneRow) {
  constexpr usize writerCount = 8;

  const ObservationStore store = makeStore();
  std::latch             start(writerCount);

  Vec<std::future<Result<bool>>> results;

  for (usize i = 0; i < writerCount; ++i)
    results.push_back(std::async(std::launch::async, [&store, &start, i] {
      start.arrive_and_wait();
      return store.insert(Reading(1700000000, 25.0 + static_cast<f64>(i)));
    }));

  usize created = 0;

  for (std::future<Result<bool>>& future : results) {
    const Result<bool> inserted = future.get();

    EXPECT_TRUE(inserted.has_value()) << inserted.error().message;

    if (inserted.value_or(false))
      ++created;
  }

  EXPECT_EQ(created, 1U);
  EXPECT_EQ(store.count("Rio de Janeiro", "BR").value_or(-1), 1);
}

TEST_F(ObservationStoreTest, LockedDatabase_WaitsForOtherWriter) {
  const ObservationStore store = makeStore();
  ASSERT_TRUE(store.insert(Reading(1700000000, 25.0)).value_or(false));

  SQLite::Database holder(m_dbPath.string(), SQLite::OPEN_READWRITE);
  holder.exec("BEGIN EXCLUSIVE");

  std::future<Result<>> schema = std::async(std::launch::async, [&store] { return store.ensureSchema(); });

  std::future<Result<Vec<StoredObservation>>> latest =
    std::async(std::launch::async, [&store] { return store.fetchLatest("Rio de Janeiro", "BR", 1); });

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  holder.exec("COMMIT");

  const Result<>                       schemaResult = schema.get();
  const Result<Vec<StoredObservation>> latestResult = latest.get();

  ASSERT_TRUE(schemaResult.has_value()) << schemaResult.error().message;
  ASSERT_TRUE(latestResult.has_value()) << latestResult.error().message;
  ASSERT_EQ(latestResult->size(), 1);
  EXPECT_EQ(latestResult->front().observation.tsUtc, 1700000000);
}
// NOLINTEND(modernize-use-trailing-return-type, cert-err58-cpp)

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
