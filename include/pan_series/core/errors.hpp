#pragma once

#include "types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pan_series {

// Request parameters attached to fatal errors.
struct RequestContext {
    std::optional<BBox> bbox;
    std::optional<TimeRange> time_range;
    std::string collection_id;
    std::optional<Timestamp> timestamp;

    bool empty() const;
    std::string describe() const;
};

class PanSeriesError : public std::runtime_error {
public:
    explicit PanSeriesError(const std::string& message)
        : std::runtime_error(message) {}

    PanSeriesError(const std::string& message, RequestContext context)
        : std::runtime_error(with_context(message, context)),
          context_(std::move(context)) {}

    const RequestContext& context() const { return context_; }

private:
    static std::string with_context(const std::string& message, const RequestContext& context);

    RequestContext context_;
};

class ConfigurationError : public PanSeriesError {
public:
    explicit ConfigurationError(const std::string& message)
        : PanSeriesError("Configuration error: " + message) {}
};

class ValidationError : public PanSeriesError {
public:
    explicit ValidationError(const std::string& message)
        : PanSeriesError("Validation error: " + message) {}
};

class AuthError : public PanSeriesError {
public:
    explicit AuthError(const std::string& message)
        : PanSeriesError("Auth error: " + message), detail_(message) {}
    AuthError(const std::string& message, RequestContext context)
        : PanSeriesError("Auth error: " + message, std::move(context)), detail_(message) {}
    // Same failure, re-raised with the request that triggered it
    AuthError(const AuthError& cause, RequestContext context)
        : AuthError(cause.detail(), std::move(context)) {}

    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

// Raised by ImageryService implementations for failed network exchanges.
class TransportError : public PanSeriesError {
public:
    TransportError(const std::string& message, long http_status, bool transient)
        : PanSeriesError("Transport error: " + message),
          http_status_(http_status), transient_(transient) {}

    long http_status() const { return http_status_; }
    bool transient() const { return transient_; }

private:
    long http_status_;
    bool transient_;
};

class CollectionNotFoundError : public PanSeriesError {
public:
    CollectionNotFoundError(const std::string& message, RequestContext context)
        : PanSeriesError("Collection not found: " + message, std::move(context)) {}
};

class CatalogUnavailableError : public PanSeriesError {
public:
    CatalogUnavailableError(const std::string& message, RequestContext context)
        : PanSeriesError("Catalog unavailable: " + message, std::move(context)) {}
};

// One timestamp whose fetch failed. Not thrown; aggregated by the loader.
struct SceneFailure {
    Timestamp timestamp;
    std::string reason;
    std::vector<std::string> failed_bands;
    int attempts = 0;
};

class LoadError : public PanSeriesError {
public:
    LoadError(const std::string& message, RequestContext context,
              std::vector<SceneFailure> failures = {})
        : PanSeriesError("Load error: " + message, std::move(context)),
          failures_(std::move(failures)) {}

    const std::vector<SceneFailure>& failures() const { return failures_; }

private:
    std::vector<SceneFailure> failures_;
};

class FusionError : public PanSeriesError {
public:
    explicit FusionError(const std::string& message)
        : PanSeriesError("Fusion error: " + message) {}
    FusionError(const std::string& message, RequestContext context)
        : PanSeriesError("Fusion error: " + message, std::move(context)) {}
};

class IOError : public PanSeriesError {
public:
    explicit IOError(const std::string& message)
        : PanSeriesError("I/O error: " + message) {}
};

class ExportError : public PanSeriesError {
public:
    explicit ExportError(const std::string& message)
        : PanSeriesError("Export error: " + message) {}
    ExportError(const std::string& message, RequestContext context)
        : PanSeriesError("Export error: " + message, std::move(context)) {}
};

class StopRequested : public PanSeriesError {
public:
    StopRequested() : PanSeriesError("Stop requested by user") {}
};

} // namespace pan_series
