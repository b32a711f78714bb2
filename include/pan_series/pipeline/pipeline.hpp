#pragma once

#include "pan_series/config/configuration.hpp"
#include "pan_series/core/errors.hpp"
#include "pan_series/core/events.hpp"
#include "pan_series/model/product.hpp"
#include "pan_series/service/imagery_service.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace pan_series::pipeline {

struct ExportedFile {
    std::string region;
    std::string kind; // "analysis" | "display"
    Timestamp timestamp;
    fs::path path;
    std::string sha256;
};

struct RegionReport {
    std::string name;
    std::string status = "pending"; // ok | partial | error
    std::string error;
    std::string collection_id;
    size_t scenes_loaded = 0;
    std::vector<SceneFailure> scene_failures;
    std::vector<std::string> export_errors;
    std::vector<ExportedFile> files;
};

struct PipelineReport {
    std::string run_id;
    fs::path output_dir;
    std::vector<RegionReport> regions;

    // True when no region ended in error
    bool success() const;
    size_t file_count() const;
};

// Runs resolve -> load -> sharpen -> rescale -> export for every configured
// region. Each region, stack and output file is isolated: its failure is
// recorded in the report and the batch continues. AuthError and
// StopRequested end the whole run.
class PipelineRunner {
public:
    // Talks to the configured HTTP service with credentials from the config
    // or environment. Throws ConfigurationError before any network call when
    // the configuration or credentials are invalid.
    PipelineRunner(config::Config cfg, std::ostream& event_stream);

    PipelineRunner(config::Config cfg, std::shared_ptr<service::ImageryService> service,
                   std::ostream& event_stream);

    PipelineReport run(std::atomic<bool>* stop_flag = nullptr);

private:
    void run_region(const std::string& run_id, const config::RegionConfig& region,
                    RegionReport& report, std::atomic<bool>* stop_flag);

    config::Config cfg_;
    std::shared_ptr<service::ImageryService> service_;
    core::EventEmitter events_;
    std::map<std::string, model::Product> products_; // resolved once per run
};

// Writes manifest.json (run id plus every exported file and its SHA-256)
// into the report's output directory and returns its path.
fs::path write_manifest(const PipelineReport& report);

} // namespace pan_series::pipeline
