#pragma once

#include <stdexcept>
#include <string>

namespace geolink
{

class GeoLinkError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class MissingCoordinates : public GeoLinkError
{
public:
    explicit MissingCoordinates(const std::string &point_id)
        : GeoLinkError("point '" + point_id + "' has no coordinates") {}
};

class GeometryParseError : public GeoLinkError
{
public:
    using GeoLinkError::GeoLinkError;
};

class UnlinkedEndpoint : public GeoLinkError
{
public:
    explicit UnlinkedEndpoint(const std::string &message)
        : GeoLinkError(message) {}
};

class NodeNotFound : public GeoLinkError
{
public:
    explicit NodeNotFound(const std::string &key)
        : GeoLinkError("node '" + key + "' not found") {}
};

class ProviderUnavailable : public GeoLinkError
{
public:
    using GeoLinkError::GeoLinkError;
};

class InvalidRequest : public GeoLinkError
{
public:
    using GeoLinkError::GeoLinkError;
};

class ConfigError : public GeoLinkError
{
public:
    using GeoLinkError::GeoLinkError;
};

} // namespace geolink
