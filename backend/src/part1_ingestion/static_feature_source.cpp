#include "geolink/feature_source.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <mutex>
#include <string>
#include <vector>

#include "geolink/errors.hpp"
#include "geolink/feature_parser.hpp"

namespace geolink
{

std::string collection_name(FeatureKind kind)
{
    switch (kind)
    {
    case FeatureKind::place:
        return "places";
    case FeatureKind::building:
        return "buildings";
    case FeatureKind::address:
        return "addresses";
    case FeatureKind::division:
        return "divisions";
    case FeatureKind::road_segment:
        return "segments";
    case FeatureKind::road_connector:
        return "connectors";
    }
    return "unknown";
}

void StaticFeatureSource::add(const Feature &feature)
{
    std::lock_guard<std::mutex> lock(mutex_);
    features_[feature.kind].push_back(feature);
}

std::size_t StaticFeatureSource::add_collection(FeatureKind kind, const nlohmann::json &collection)
{
    auto parsed = parse_feature_collection(kind, collection, std::numeric_limits<size_t>::max());

    std::lock_guard<std::mutex> lock(mutex_);
    auto &bucket = features_[kind];
    bucket.insert(bucket.end(), parsed.begin(), parsed.end());
    return parsed.size();
}

std::size_t StaticFeatureSource::load_directory(const std::string &directory)
{
    size_t total = 0;
    for (const auto kind : {FeatureKind::place, FeatureKind::building, FeatureKind::address,
                            FeatureKind::division, FeatureKind::road_segment, FeatureKind::road_connector})
    {
        const std::string path = directory + "/" + collection_name(kind) + ".geojson";
        std::ifstream in(path);
        if (!in.is_open())
        {
            continue;
        }

        const nlohmann::json collection = nlohmann::json::parse(in, nullptr, false);
        if (collection.is_discarded())
        {
            throw ConfigError("Unable to parse " + path);
        }

        const size_t added = add_collection(kind, collection);
        std::cout << "Loaded " << added << " " << collection_name(kind) << " from " << path << std::endl;
        total += added;
    }
    return total;
}

std::vector<Feature> StaticFeatureSource::query(FeatureKind kind, const BoundingBox &bbox, std::size_t limit,
                                                std::chrono::milliseconds)
{
    std::vector<Feature> result;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = features_.find(kind);
    if (it == features_.end())
    {
        return result;
    }

    for (const auto &feature : it->second)
    {
        if (result.size() >= limit)
        {
            break;
        }
        if (bbox.intersects(geometry_bounds(feature.geometry)))
        {
            result.push_back(feature);
        }
    }
    return result;
}

} // namespace geolink
