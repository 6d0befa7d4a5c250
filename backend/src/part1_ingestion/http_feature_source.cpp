#include "geolink/feature_source.hpp"

#include <curl/curl.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "geolink/errors.hpp"
#include "geolink/feature_parser.hpp"

namespace geolink
{
namespace
{

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp)
{
    static_cast<std::string *>(userp)->append(static_cast<char *>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent))
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient()
{
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(const std::string &url, std::chrono::milliseconds timeout)
{
    CURL *curl = curl_easy_init();
    if (!curl)
    {
        throw ProviderUnavailable("Failed to initialize CURL");
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
    {
        const std::string reason = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw ProviderUnavailable(reason);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_cleanup(curl);
    return response;
}

std::string CurlHttpClient::escape(const std::string &value)
{
    CURL *curl = curl_easy_init();
    if (!curl)
    {
        throw ProviderUnavailable("Failed to initialize CURL");
    }

    char *encoded = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
    std::string result = encoded ? std::string(encoded) : std::string();
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

HttpFeatureSource::HttpFeatureSource(HttpClient &client, std::vector<std::string> endpoints)
    : client_(client), endpoints_(std::move(endpoints))
{
}

std::string HttpFeatureSource::build_url(const std::string &endpoint, FeatureKind kind, const BoundingBox &bbox, std::size_t limit)
{
    std::ostringstream bbox_param;
    bbox_param << std::fixed << std::setprecision(6)
               << bbox.min_lon << "," << bbox.min_lat << "," << bbox.max_lon << "," << bbox.max_lat;

    std::string base = endpoint;
    while (!base.empty() && base.back() == '/')
    {
        base.pop_back();
    }

    return base + "/" + collection_name(kind) + "?bbox=" + client_.escape(bbox_param.str()) +
           "&limit=" + std::to_string(limit);
}

std::vector<Feature> HttpFeatureSource::query(FeatureKind kind, const BoundingBox &bbox, std::size_t limit,
                                              std::chrono::milliseconds timeout)
{
    if (endpoints_.empty())
    {
        throw ProviderUnavailable("No feature catalog endpoints configured");
    }

    std::string last_error;
    for (const auto &endpoint : endpoints_)
    {
        const std::string url = build_url(endpoint, kind, bbox, limit);

        HttpResponse response;
        try
        {
            response = client_.get(url, timeout);
        }
        catch (const ProviderUnavailable &ex)
        {
            last_error = ex.what();
            std::cout << "Connection failed: " << ex.what() << ", trying next server..." << std::endl;
            continue;
        }

        if (response.status != 200)
        {
            last_error = "HTTP " + std::to_string(response.status);
            std::cout << "HTTP " << response.status << " from " << endpoint << ", trying next server..." << std::endl;
            continue;
        }

        nlohmann::json payload = nlohmann::json::parse(response.body, nullptr, false);
        if (payload.is_discarded())
        {
            last_error = "invalid JSON payload";
            std::cerr << "Invalid JSON from " << endpoint << ", trying next server..." << std::endl;
            continue;
        }

        size_t skipped = 0;
        std::vector<Feature> features;
        try
        {
            features = parse_feature_collection(kind, payload, limit, &skipped);
        }
        catch (const GeometryParseError &ex)
        {
            last_error = ex.what();
            std::cerr << "Unexpected payload from " << endpoint << ": " << ex.what() << std::endl;
            continue;
        }
        std::cout << "Fetched " << features.size() << " " << collection_name(kind) << " from " << endpoint;
        if (skipped > 0)
        {
            std::cout << " (" << skipped << " malformed skipped)";
        }
        std::cout << std::endl;
        return features;
    }

    std::cerr << "All feature catalog servers failed" << std::endl;
    throw ProviderUnavailable("feature catalog unavailable: " + last_error);
}

} // namespace geolink
