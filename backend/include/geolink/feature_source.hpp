#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geolink/types.hpp"

namespace geolink
{

class FeatureSource
{
public:
    virtual ~FeatureSource() = default;

    // Throws ProviderUnavailable on transport failure or timeout.
    virtual std::vector<Feature> query(FeatureKind kind, const BoundingBox &bbox, std::size_t limit,
                                       std::chrono::milliseconds timeout) = 0;
};

std::string collection_name(FeatureKind kind);

class StaticFeatureSource : public FeatureSource
{
public:
    void add(const Feature &feature);
    std::size_t add_collection(FeatureKind kind, const nlohmann::json &collection);
    // Reads <directory>/<collection>.geojson for every kind that has a file.
    std::size_t load_directory(const std::string &directory);

    std::vector<Feature> query(FeatureKind kind, const BoundingBox &bbox, std::size_t limit,
                               std::chrono::milliseconds timeout) override;

private:
    std::mutex mutex_;
    std::map<FeatureKind, std::vector<Feature>> features_;
};

struct HttpResponse
{
    long status = 0;
    std::string body;
};

// Interface for HTTP client (allows mocking in tests)
class HttpClient
{
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string &url, std::chrono::milliseconds timeout) = 0;
    virtual std::string escape(const std::string &value) = 0;
};

class CurlHttpClient : public HttpClient
{
public:
    explicit CurlHttpClient(std::string user_agent);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient &) = delete;
    CurlHttpClient &operator=(const CurlHttpClient &) = delete;

    HttpResponse get(const std::string &url, std::chrono::milliseconds timeout) override;
    std::string escape(const std::string &value) override;

private:
    std::string user_agent_;
};

class HttpFeatureSource : public FeatureSource
{
public:
    HttpFeatureSource(HttpClient &client, std::vector<std::string> endpoints);

    std::vector<Feature> query(FeatureKind kind, const BoundingBox &bbox, std::size_t limit,
                               std::chrono::milliseconds timeout) override;

    std::string build_url(const std::string &endpoint, FeatureKind kind, const BoundingBox &bbox, std::size_t limit);

private:
    HttpClient &client_;
    std::vector<std::string> endpoints_;
};

} // namespace geolink
