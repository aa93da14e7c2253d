/// @file main.cpp
/// @brief Sentinel command line entry point

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>

#include "api/drift_api.h"
#include "api/http_server.h"
#include "common/config.h"
#include "common/logging.h"
#include "data/csv_reader.h"
#include "data/csv_writer.h"
#include "data/synthetic.h"
#include "drift/drift_detector.h"
#include "drift/drift_report.h"

namespace {

constexpr int kExitNoDrift = 0;
constexpr int kExitError = 1;
constexpr int kExitDrift = 2;

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int) {
    g_shutdown_requested = true;
}

/// Options shared by every subcommand
struct GlobalOptions {
    std::string config_path;
    std::string log_level;
};

struct DetectOptions {
    std::string reference_path;
    std::string production_path;
    std::vector<std::string> categorical;
    std::optional<double> significance_level;
    std::optional<double> psi_threshold;
    std::optional<int64_t> psi_bins;
    std::optional<int64_t> workers;
    bool json = false;
    std::string output_path;
};

struct ServeOptions {
    std::optional<std::string> host;
    std::optional<int64_t> port;
};

struct GenerateOptions {
    std::string output_dir = "data/raw";
    size_t samples = 30000;
    uint64_t seed = 42;
    double reference_fraction = 0.7;
};

/// Load file and environment layers into the global configuration
bool LoadConfig(const GlobalOptions& options) {
    std::optional<std::filesystem::path> path;
    if (!options.config_path.empty()) {
        path = options.config_path;
    }
    auto status = sentinel::InitGlobalConfig(path);
    if (!status.ok()) {
        std::cerr << "Failed to load configuration: " << status.message() << std::endl;
        return false;
    }
    return true;
}

bool SetupLogging(const GlobalOptions& options, bool report_on_stdout) {
    auto log_config = sentinel::LogConfig::FromConfig(sentinel::GlobalConfig());
    if (!log_config.ok()) {
        std::cerr << "Invalid logging configuration: " << log_config.status().message()
                  << std::endl;
        return false;
    }
    if (!options.log_level.empty()) {
        auto level = sentinel::ParseLogLevel(options.log_level);
        if (!level.ok()) {
            std::cerr << level.status().message() << std::endl;
            return false;
        }
        log_config->level = *level;
    }
    log_config->console = report_on_stdout ? sentinel::ConsoleTarget::kStderr
                                           : sentinel::ConsoleTarget::kStdout;

    auto status = sentinel::ConfigureLogging(*log_config);
    if (!status.ok()) {
        std::cerr << status.message() << std::endl;
        return false;
    }
    return true;
}

int RunDetect(const GlobalOptions& global, const DetectOptions& options) {
    if (!LoadConfig(global)) {
        return kExitError;
    }
    // Reports own stdout
    if (!SetupLogging(global, true)) {
        return kExitError;
    }

    auto& config = sentinel::GlobalConfig();
    if (options.significance_level) {
        config.Set("detector.significance_level", *options.significance_level);
    }
    if (options.psi_threshold) {
        config.Set("detector.psi_threshold", *options.psi_threshold);
    }
    if (options.psi_bins) {
        config.Set("detector.psi_bins", *options.psi_bins);
    }
    if (options.workers) {
        config.Set("detector.num_workers", *options.workers);
    }
    if (!options.categorical.empty()) {
        config.Set("detector.categorical_features", options.categorical);
    }

    auto detector_config = sentinel::drift::DetectorConfig::FromConfig(config);
    if (!detector_config.ok()) {
        SENTINEL_LOG_ERROR("Invalid detector configuration: {}",
                           std::string_view(detector_config.status().message().data(), detector_config.status().message().size()));
        return kExitError;
    }

    sentinel::data::CsvReader reader;
    auto reference = reader.ReadFile(options.reference_path);
    if (!reference.ok()) {
        SENTINEL_LOG_ERROR("Failed to load reference data: {}", std::string_view(reference.status().message().data(), reference.status().message().size()));
        return kExitError;
    }
    auto production = reader.ReadFile(options.production_path);
    if (!production.ok()) {
        SENTINEL_LOG_ERROR("Failed to load production data: {}", std::string_view(production.status().message().data(), production.status().message().size()));
        return kExitError;
    }
    SENTINEL_LOG_INFO("Loaded reference {}x{} and production {}x{}",
                      reference->NumRows(), reference->NumColumns(),
                      production->NumRows(), production->NumColumns());

    auto detector = sentinel::drift::DriftDetector::Create(std::move(*detector_config));
    if (!detector.ok()) {
        SENTINEL_LOG_ERROR("Failed to create detector: {}", std::string_view(detector.status().message().data(), detector.status().message().size()));
        return kExitError;
    }

    auto report = (*detector)->Detect(*reference, *production);
    if (!report.ok()) {
        SENTINEL_LOG_ERROR("Drift detection failed: {}", std::string_view(report.status().message().data(), report.status().message().size()));
        return kExitError;
    }

    const std::string json = sentinel::drift::ReportToJsonText(*report, 2);
    if (options.json) {
        std::cout << json << std::endl;
    } else {
        std::cout << sentinel::drift::FormatReport(*report);
    }

    if (!options.output_path.empty()) {
        std::ofstream out(options.output_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            SENTINEL_LOG_ERROR("Cannot open {} for writing", options.output_path);
            return kExitError;
        }
        out << json << '\n';
        if (!out) {
            SENTINEL_LOG_ERROR("Failed writing report to {}", options.output_path);
            return kExitError;
        }
        SENTINEL_LOG_INFO("Report written to {}", options.output_path);
    }

    sentinel::FlushLogs();
    return report->drift_detected ? kExitDrift : kExitNoDrift;
}

int RunServe(const GlobalOptions& global, const ServeOptions& options) {
    if (!LoadConfig(global) || !SetupLogging(global, false)) {
        return kExitError;
    }

    auto& config = sentinel::GlobalConfig();
    if (options.host) {
        config.Set("server.host", *options.host);
    }
    if (options.port) {
        config.Set("server.port", *options.port);
    }

    auto api_config = sentinel::api::ApiConfig::FromConfig(config);
    if (!api_config.ok()) {
        SENTINEL_LOG_ERROR("Invalid API configuration: {}", std::string_view(api_config.status().message().data(), api_config.status().message().size()));
        return kExitError;
    }
    auto server_config = sentinel::api::ServerConfig::FromConfig(config);
    if (!server_config.ok()) {
        SENTINEL_LOG_ERROR("Invalid server configuration: {}", std::string_view(server_config.status().message().data(), server_config.status().message().size()));
        return kExitError;
    }

    auto api = std::make_shared<const sentinel::api::DriftApi>(std::move(*api_config));
    sentinel::api::HttpServer server(std::move(*server_config), api);

    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto status = server.Start();
    if (!status.ok()) {
        SENTINEL_LOG_ERROR("Failed to start HTTP server: {}", std::string_view(status.message().data(), status.message().size()));
        return kExitError;
    }

    SENTINEL_LOG_INFO("{} v{} is running. Press Ctrl+C to stop.",
                      sentinel::api::kServiceName, sentinel::api::kServiceVersion);

    while (!g_shutdown_requested.load() && server.IsRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    SENTINEL_LOG_INFO("Shutting down");
    server.Stop();
    sentinel::ShutdownLogging();
    return kExitNoDrift;
}

int RunGenerate(const GlobalOptions& global, const GenerateOptions& options) {
    if (!LoadConfig(global) || !SetupLogging(global, false)) {
        return kExitError;
    }

    sentinel::data::SyntheticCreditOptions synthetic;
    synthetic.samples = options.samples;
    synthetic.seed = options.seed;
    synthetic.reference_fraction = options.reference_fraction;

    auto split = sentinel::data::GenerateCreditSplit(synthetic);
    if (!split.ok()) {
        SENTINEL_LOG_ERROR("Failed to generate data: {}", std::string_view(split.status().message().data(), split.status().message().size()));
        return kExitError;
    }

    const std::filesystem::path dir(options.output_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        SENTINEL_LOG_ERROR("Cannot create {}: {}", dir.string(), ec.message());
        return kExitError;
    }

    sentinel::data::CsvWriter writer;
    const std::pair<const char*, const sentinel::data::Dataset*> outputs[] = {
        {"credit_default_full.csv", &split->full},
        {"reference_data.csv", &split->reference},
        {"production_data.csv", &split->production},
    };
    for (const auto& [file_name, dataset] : outputs) {
        const auto path = dir / file_name;
        auto status = writer.WriteFile(*dataset, path);
        if (!status.ok()) {
            SENTINEL_LOG_ERROR("Failed to write {}: {}", path.string(), std::string_view(status.message().data(), status.message().size()));
            return kExitError;
        }
        SENTINEL_LOG_INFO("Wrote {} ({} rows x {} columns)", path.string(),
                          dataset->NumRows(), dataset->NumColumns());
    }
    return kExitNoDrift;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Sentinel - drift detection for tabular ML data"};
    app.require_subcommand(1);

    GlobalOptions global;
    app.add_option("-c,--config", global.config_path, "Path to YAML configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--log-level", global.log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)");
    app.set_version_flag("-v,--version",
                         std::string("sentinel ") + std::string(sentinel::api::kServiceVersion));

    DetectOptions detect;
    auto* detect_cmd = app.add_subcommand("detect", "Compare a production CSV against a reference CSV");
    detect_cmd->add_option("-r,--reference", detect.reference_path, "Reference CSV")
        ->required()
        ->check(CLI::ExistingFile);
    detect_cmd->add_option("-p,--production", detect.production_path, "Production CSV")
        ->required()
        ->check(CLI::ExistingFile);
    detect_cmd->add_option("--categorical", detect.categorical,
                           "Categorical features (comma-separated), replaces auto-detection")
        ->delimiter(',');
    detect_cmd->add_option("--significance-level", detect.significance_level,
                           "p-value threshold for KS and Chi-square tests");
    detect_cmd->add_option("--psi-threshold", detect.psi_threshold, "PSI drift threshold");
    detect_cmd->add_option("--psi-bins", detect.psi_bins, "Requested PSI bin count");
    detect_cmd->add_option("--workers", detect.workers, "Worker threads for feature comparisons");
    detect_cmd->add_flag("--json", detect.json, "Print the report as JSON");
    detect_cmd->add_option("-o,--output", detect.output_path, "Write the JSON report to a file");

    ServeOptions serve;
    auto* serve_cmd = app.add_subcommand("serve", "Run the drift detection HTTP API");
    serve_cmd->add_option("--host", serve.host, "Listen address");
    serve_cmd->add_option("--port", serve.port, "Listen port");

    GenerateOptions generate;
    auto* generate_cmd = app.add_subcommand("generate", "Write a synthetic credit-default dataset");
    generate_cmd->add_option("-o,--output-dir", generate.output_dir, "Output directory")
        ->capture_default_str();
    generate_cmd->add_option("-n,--samples", generate.samples, "Number of rows")
        ->check(CLI::PositiveNumber);
    generate_cmd->add_option("--seed", generate.seed, "Random seed");
    generate_cmd->add_option("--reference-fraction", generate.reference_fraction,
                             "Share of rows in the reference split")
        ->check(CLI::Range(0.0, 1.0));

    CLI11_PARSE(app, argc, argv);

    if (*detect_cmd) {
        return RunDetect(global, detect);
    }
    if (*serve_cmd) {
        return RunServe(global, serve);
    }
    return RunGenerate(global, generate);
}
