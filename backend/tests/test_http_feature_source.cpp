#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geolink/errors.hpp"
#include "geolink/feature_source.hpp"

using namespace geolink;

namespace
{

// Mock HTTP client for testing
class MockHttpClient : public HttpClient
{
public:
    std::map<std::string, HttpResponse> responses;
    std::vector<std::string> requested;

    HttpResponse get(const std::string &url, std::chrono::milliseconds) override
    {
        requested.push_back(url);
        for (const auto &entry : responses)
        {
            if (url.rfind(entry.first, 0) == 0)
            {
                return entry.second;
            }
        }
        throw ProviderUnavailable("connection refused");
    }

    std::string escape(const std::string &value) override
    {
        std::string out;
        for (const char c : value)
        {
            if (c == ',')
            {
                out += "%2C";
            }
            else
            {
                out += c;
            }
        }
        return out;
    }
};

std::string connector_payload()
{
    const nlohmann::json payload = {
        {"type", "FeatureCollection"},
        {"features",
         {{{"type", "Feature"},
           {"id", "c1"},
           {"geometry", {{"type", "Point"}, {"coordinates", {0.0, 0.0}}}},
           {"properties", nlohmann::json::object()}}}},
    };
    return payload.dump();
}

const BoundingBox kBox{-0.5, -0.25, 0.5, 0.25};
const std::chrono::milliseconds kTimeout{500};

} // namespace

TEST(HttpFeatureSourceTest, BuildsCollectionUrl)
{
    MockHttpClient client;
    HttpFeatureSource source(client, {"https://catalog.example/"});

    EXPECT_EQ(source.build_url("https://catalog.example/", FeatureKind::road_segment, kBox, 50),
              "https://catalog.example/segments?bbox=-0.500000%2C-0.250000%2C0.500000%2C0.250000&limit=50");
}

TEST(HttpFeatureSourceTest, ParsesFirstHealthyEndpoint)
{
    MockHttpClient client;
    client.responses["https://primary.example"] = HttpResponse{200, connector_payload()};
    HttpFeatureSource source(client, {"https://primary.example", "https://mirror.example"});

    const auto features = source.query(FeatureKind::road_connector, kBox, 10, kTimeout);
    ASSERT_EQ(features.size(), 1u);
    EXPECT_EQ(features.front().id, "c1");
    EXPECT_EQ(client.requested.size(), 1u);
}

TEST(HttpFeatureSourceTest, FallsBackOnServerErrorAndInvalidJson)
{
    MockHttpClient client;
    client.responses["https://primary.example"] = HttpResponse{500, ""};
    client.responses["https://second.example"] = HttpResponse{200, "<html>busy</html>"};
    client.responses["https://third.example"] = HttpResponse{200, connector_payload()};
    HttpFeatureSource source(client, {"https://primary.example", "https://second.example", "https://third.example"});

    const auto features = source.query(FeatureKind::road_connector, kBox, 10, kTimeout);
    ASSERT_EQ(features.size(), 1u);
    EXPECT_EQ(client.requested.size(), 3u);
}

TEST(HttpFeatureSourceTest, FallsBackOnTransportFailure)
{
    MockHttpClient client;
    client.responses["https://mirror.example"] = HttpResponse{200, connector_payload()};
    HttpFeatureSource source(client, {"https://down.example", "https://mirror.example"});

    EXPECT_EQ(source.query(FeatureKind::road_connector, kBox, 10, kTimeout).size(), 1u);
}

TEST(HttpFeatureSourceTest, AllEndpointsFailingRaisesProviderUnavailable)
{
    MockHttpClient client;
    client.responses["https://primary.example"] = HttpResponse{503, ""};
    HttpFeatureSource source(client, {"https://primary.example", "https://down.example"});

    EXPECT_THROW(source.query(FeatureKind::place, kBox, 10, kTimeout), ProviderUnavailable);
}

TEST(HttpFeatureSourceTest, NoEndpointsRaisesProviderUnavailable)
{
    MockHttpClient client;
    HttpFeatureSource source(client, {});
    EXPECT_THROW(source.query(FeatureKind::place, kBox, 10, kTimeout), ProviderUnavailable);
}
