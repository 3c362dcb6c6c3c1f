#pragma once

#include <string>

#include <toml++/toml.h>

class ConfigManager;

// Settings read from config.toml. Each member struct maps to one table:
//   [processing]  matching and OCR tuning
//   [paths]       output, logs, backup and roster locations
//   [logging]     log level and verbosity, handed to LogManager
//   [last_run]    written after each batch; never read back into a batch
struct SplitterConfig
{
    struct Processing
    {
        bool use_fuzzy_matching;
        int ocr_threshold;
        int fuzzy_match_threshold;
        int fuzzy_candidate_limit;
        double ocr_upscale_factor;
        std::string ocr_language;
        std::string document_label;
        bool backup_originals;
        bool write_report;
    };

    struct Paths
    {
        std::string output_dir;
        std::string logs_dir;
        std::string backup_dir;
        std::string roster_file;
    };

    struct Logging
    {
        int level;
        bool append;
        bool verbose;
    };

    struct LastRun
    {
        std::string source;
        std::string period;       // "MM/YYYY"
        std::string finished_at;
        std::string state;
        int identified_pages;
        int total_pages;
    };

    Processing processing;
    Paths paths;
    Logging logging;
    LastRun last_run;

    SplitterConfig() { applyDefaults(); }

    void applyDefaults();

    // Registers [processing], [paths], [logging] and [last_run] with the manager. The
    // config object must outlive the manager's load/save calls.
    void registerConfigHandler(ConfigManager& config);

    void loadProcessing(const toml::table& section);
    void loadPaths(const toml::table& section);
    void loadLogging(const toml::table& section);
    void loadLastRun(const toml::table& section);

    toml::table saveProcessing() const;
    toml::table savePaths() const;
    toml::table saveLogging() const;
    toml::table saveLastRun() const;
};
