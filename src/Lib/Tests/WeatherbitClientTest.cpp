#include <Clima/Services/Weather.hpp>
#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace clima::utils::types;
using clima::services::weather::Coords;
using clima::services::weather::HttpResponse;
using clima::services::weather::IHttpTransport;
using clima::services::weather::ProviderConfig;
using clima::services::weather::RawPayload;
using clima::services::weather::WeatherbitClient;
using clima::utils::error::ClimaError;
using enum clima::utils::error::ClimaErrorCode;

// NOLINTBEGIN(readability-identifier-naming)
class MockTransport : public IHttpTransport {
 public:
  MOCK_METHOD(Result<HttpResponse>, get, (const String&, i64), (override));
};
// NOLINTEND(readability-identifier-naming)

class WeatherbitClientTest : public Test {
 protected:
  static fn Config() -> ProviderConfig {
    return ProviderConfig {
      .apiKey      = "secret",
      .baseUrl     = "https://example.test/v2.0/current",
      .timeoutSecs = 7,
    };
  }

  // The client owns the mock; the raw pointer stays valid for as long as the client does.
  fn makeClient(ProviderConfig config = Config()) -> Result<WeatherbitClient> {
    auto transport = std::make_unique<StrictMock<MockTransport>>();
    m_transport    = transport.get();
    return WeatherbitClient::Create(std::move(config), std::move(transport));
  }

  StrictMock<MockTransport>* m_transport = nullptr;
};

// NOLINTBEGIN(modernize-use-trailing-return-type, cert-err58-cpp)
TEST_F(WeatherbitClientTest, Create_MissingKeyIsConfigurationError) {
  ProviderConfig config = Config();
  config.apiKey         = None;

  const Result<WeatherbitClient> client = WeatherbitClient::Create(config);

  ASSERT_FALSE(client.has_value());
  EXPECT_EQ(client.error().code, ConfigurationError);
}

TEST_F(WeatherbitClientTest, Create_EmptyKeyIsConfigurationError) {
  ProviderConfig config = Config();
  config.apiKey         = "";

  const Result<WeatherbitClient> client = WeatherbitClient::Create(config);

  ASSERT_FALSE(client.has_value());
  EXPECT_EQ(client.error().code, ConfigurationError);
}

TEST_F(WeatherbitClientTest, Create_NonPositiveTimeoutIsConfigurationError) {
  ProviderConfig config = Config();
  config.timeoutSecs    = 0;

  const Result<WeatherbitClient> client = WeatherbitClient::Create(config);

  ASSERT_FALSE(client.has_value());
  EXPECT_EQ(client.error().code, ConfigurationError);
}

TEST_F(WeatherbitClientTest, FetchByCity_BuildsEscapedQuery) {
  Result<WeatherbitClient> client = makeClient();
  ASSERT_TRUE(client.has_value());

  EXPECT_CALL(*m_transport, get("https://example.test/v2.0/current?city=Rio%20de%20Janeiro&country=BR&key=secret&lang=pt&units=M", 7))
    .WillOnce(Return(Result<HttpResponse>(HttpResponse { .status = 200, .body = R"({"data":[]})" })));

  const Result<RawPayload> payload = client->fetchByCity("Rio de Janeiro", "BR");

  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(payload->body, R"({"data":[]})");
}

TEST_F(WeatherbitClientTest, FetchByCity_EmptyCountryIsOmitted) {
  Result<WeatherbitClient> client = makeClient();
  ASSERT_TRUE(client.has_value());

  EXPECT_CALL(*m_transport, get(Not(HasSubstr("country=")), _))
    .WillOnce(Return(Result<HttpResponse>(HttpResponse { .status = 200, .body = "{}" })));

  EXPECT_TRUE(client->fetchByCity("Lisbon", "").has_value());
}

TEST_F(WeatherbitClientTest, FetchByCity_LangAndUnitsOverrideConfig) {
  Result<WeatherbitClient> client = makeClient();
  ASSERT_TRUE(client.has_value());

  EXPECT_CALL(*m_transport, get(AllOf(HasSubstr("lang=en"), HasSubstr("units=I")), _))
    .WillOnce(Return(Result<HttpResponse>(HttpResponse { .status = 200, .body = "{}" })));

  EXPECT_TRUE(client->fetchByCity("Denver", "US", "en", "I").has_value());
}

TEST_F(WeatherbitClientTest, FetchByCity_EscapesReservedCharacters) {
  Result<WeatherbitClient> client = makeClient();
  ASSERT_TRUE(client.has_value());

  EXPECT_CALL(*m_transport, get(HasSubstr("city=S%C3%A3o%20Paulo%26x%3D1"), _))
    .WillOnce(Return(Result<HttpResponse>(HttpResponse { .status = 200, .body = "{}" })));

  EXPECT_TRUE(client->fetchByCity("São Paulo&x=1", "BR").has_value());
}

TEST_F(WeatherbitClientTest, FetchByCity_EmptyCityIsInvalidArgument) {
  Result<WeatherbitClient> client = makeClient();
  ASSERT_TRUE(client.has_value());

  const Result<RawPayload> payload = client->fetchByCity("");

  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().code, InvalidArgument);
}

TEST_F(WeatherbitClientTest, FetchByCoords_SendsLatLon) {
  Result<WeatherbitClient> client = makeClient();
  ASSERT_TRUE(client.has_value());

  EXPECT_CALL(*m_transport, get(AllOf(HasSubstr("lat=-22.9"), HasSubstr("lon=-43.2"), Not(HasSubstr("city="))), _))
    .WillOnce(Return(Result<HttpResponse>(HttpResponse { .status = 200, .body = "{}" })));

  EXPECT_TRUE(client->fetchByCoords(Coords { .lat = -22.9, .lon = -43.2 }).has_value());
}

TEST_F(WeatherbitClientTest, NonSuccessStatusIsProviderError) {
  Result<WeatherbitClient> client = makeClient();
  ASSERT_TRUE(client.has_value());

  EXPECT_CALL(*m_transport, get(_, _))
    .WillOnce(Return(Result<HttpResponse>(HttpResponse { .status = 403, .body = R"({"error":"API key not valid, or not yet activated."})" })));

  const Result<RawPayload> payload = client->fetchByCity("Rio de Janeiro", "BR");

  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().code, ProviderError);
  EXPECT_THAT(payload.error().message, HasSubstr("403"));
  EXPECT_THAT(payload.error().message, HasSubstr("API key not valid"));
}

TEST_F(WeatherbitClientTest, ServerErrorWithoutJsonBodyIsProviderError) {
  Result<WeatherbitClient> client = makeClient();
  ASSERT_TRUE(client.has_value());

  EXPECT_CALL(*m_transport, get(_, _))
    .WillOnce(Return(Result<HttpResponse>(HttpResponse { .status = 503, .body = "<html>Service Unavailable</html>" })));

  const Result<RawPayload> payload = client->fetchByCity("Rio de Janeiro", "BR");

  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().code, ProviderError);
}

TEST_F(WeatherbitClientTest, TransportFailureIsProviderError) {
  Result<WeatherbitClient> client = makeClient();
  ASSERT_TRUE(client.has_value());

  EXPECT_CALL(*m_transport, get(_, _))
    .WillOnce(Return(Result<HttpResponse>(Err(ClimaError(Timeout, "Operation timed out after 7000 milliseconds")))));

  const Result<RawPayload> payload = client->fetchByCity("Rio de Janeiro", "BR");

  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().code, ProviderError);
  EXPECT_THAT(payload.error().message, HasSubstr("timed out"));
}
// NOLINTEND(modernize-use-trailing-return-type, cert-err58-cpp)

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
