#include "SplitterConfig.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <plog/Log.h>

namespace
{

template <typename T>
T clampSetting(const char* key, T value, T lo, T hi)
{
    T clamped = std::clamp(value, lo, hi);
    if (clamped != value)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Setting '") + key + "' out of range, clamped",
                                            "Value " + std::to_string(value) + " -> " + std::to_string(clamped));
    }
    return clamped;
}

void readNonEmpty(const toml::table& section, const char* key, std::string& out)
{
    if (auto v = section[key].value<std::string>())
    {
        if (!v->empty())
            out = *v;
        else
            PLOG_WARNING << "Ignoring empty value for '" << key << "'";
    }
}

} // namespace

void SplitterConfig::applyDefaults()
{
    processing.use_fuzzy_matching = false;
    processing.ocr_threshold = 50;
    processing.fuzzy_match_threshold = 75;
    processing.fuzzy_candidate_limit = 5;
    processing.ocr_upscale_factor = 2.0;
    processing.ocr_language = "por";
    processing.document_label = "Recibo";
    processing.backup_originals = true;
    processing.write_report = true;

    paths.output_dir = "./output";
    paths.logs_dir = "./logs";
    paths.backup_dir = "./backup";
    paths.roster_file = "all_employee.txt";

    logging.level = 4;
    logging.append = true;
    logging.verbose = false;

    last_run = LastRun{ "", "", "", "", 0, 0 };
}

void SplitterConfig::registerConfigHandler(ConfigManager& config)
{
    TableCallbacks processing_cb;
    processing_cb.load = [this](const toml::table& section) { loadProcessing(section); };
    processing_cb.save = [this]() -> toml::table { return saveProcessing(); };
    config.registerTable("processing", std::move(processing_cb),
                         {"use_fuzzy_matching", "ocr_threshold", "fuzzy_match_threshold", "fuzzy_candidate_limit",
                          "ocr_upscale_factor", "ocr_language", "document_label", "backup_originals",
                          "write_report"});

    TableCallbacks paths_cb;
    paths_cb.load = [this](const toml::table& section) { loadPaths(section); };
    paths_cb.save = [this]() -> toml::table { return savePaths(); };
    config.registerTable("paths", std::move(paths_cb), {"output_dir", "logs_dir", "backup_dir", "roster_file"});

    TableCallbacks logging_cb;
    logging_cb.load = [this](const toml::table& section) { loadLogging(section); };
    logging_cb.save = [this]() -> toml::table { return saveLogging(); };
    config.registerTable("logging", std::move(logging_cb), {"level", "append", "verbose"});

    TableCallbacks last_run_cb;
    last_run_cb.load = [this](const toml::table& section) { loadLastRun(section); };
    last_run_cb.save = [this]() -> toml::table { return saveLastRun(); };
    config.registerTable("last_run", std::move(last_run_cb),
                         {"source", "period", "finished_at", "state", "identified_pages", "total_pages"});
}

void SplitterConfig::loadProcessing(const toml::table& section)
{
    if (auto v = section["use_fuzzy_matching"].value<bool>())
        processing.use_fuzzy_matching = *v;
    if (auto v = section["ocr_threshold"].value<int>())
        processing.ocr_threshold = clampSetting("ocr_threshold", *v, 0, 100000);
    if (auto v = section["fuzzy_match_threshold"].value<int>())
        processing.fuzzy_match_threshold = clampSetting("fuzzy_match_threshold", *v, 0, 100);
    if (auto v = section["fuzzy_candidate_limit"].value<int>())
        processing.fuzzy_candidate_limit = clampSetting("fuzzy_candidate_limit", *v, 1, 100);
    if (auto v = section["ocr_upscale_factor"].value<double>())
        processing.ocr_upscale_factor = clampSetting("ocr_upscale_factor", *v, 0.5, 8.0);
    readNonEmpty(section, "ocr_language", processing.ocr_language);
    readNonEmpty(section, "document_label", processing.document_label);
    if (auto v = section["backup_originals"].value<bool>())
        processing.backup_originals = *v;
    if (auto v = section["write_report"].value<bool>())
        processing.write_report = *v;
}

void SplitterConfig::loadPaths(const toml::table& section)
{
    readNonEmpty(section, "output_dir", paths.output_dir);
    readNonEmpty(section, "logs_dir", paths.logs_dir);
    readNonEmpty(section, "backup_dir", paths.backup_dir);
    readNonEmpty(section, "roster_file", paths.roster_file);
}

void SplitterConfig::loadLogging(const toml::table& section)
{
    if (auto v = section["level"].value<int>())
        logging.level = clampSetting("level", *v, 0, 6);
    if (auto v = section["append"].value<bool>())
        logging.append = *v;
    if (auto v = section["verbose"].value<bool>())
        logging.verbose = *v;
}

void SplitterConfig::loadLastRun(const toml::table& section)
{
    last_run.source = section["source"].value_or(std::string{});
    last_run.period = section["period"].value_or(std::string{});
    last_run.finished_at = section["finished_at"].value_or(std::string{});
    last_run.state = section["state"].value_or(std::string{});
    last_run.identified_pages = section["identified_pages"].value_or(0);
    last_run.total_pages = section["total_pages"].value_or(0);
}

toml::table SplitterConfig::saveProcessing() const
{
    toml::table t;
    t.insert("use_fuzzy_matching", processing.use_fuzzy_matching);
    t.insert("ocr_threshold", processing.ocr_threshold);
    t.insert("fuzzy_match_threshold", processing.fuzzy_match_threshold);
    t.insert("fuzzy_candidate_limit", processing.fuzzy_candidate_limit);
    t.insert("ocr_upscale_factor", processing.ocr_upscale_factor);
    t.insert("ocr_language", processing.ocr_language);
    t.insert("document_label", processing.document_label);
    t.insert("backup_originals", processing.backup_originals);
    t.insert("write_report", processing.write_report);
    return t;
}

toml::table SplitterConfig::savePaths() const
{
    toml::table t;
    t.insert("output_dir", paths.output_dir);
    t.insert("logs_dir", paths.logs_dir);
    t.insert("backup_dir", paths.backup_dir);
    t.insert("roster_file", paths.roster_file);
    return t;
}

toml::table SplitterConfig::saveLogging() const
{
    toml::table t;
    t.insert("level", logging.level);
    t.insert("append", logging.append);
    t.insert("verbose", logging.verbose);
    return t;
}

toml::table SplitterConfig::saveLastRun() const
{
    // Nothing recorded yet: the table stays out of the file
    toml::table t;
    if (last_run.finished_at.empty())
        return t;
    t.insert("source", last_run.source);
    t.insert("period", last_run.period);
    t.insert("finished_at", last_run.finished_at);
    t.insert("state", last_run.state);
    t.insert("identified_pages", last_run.identified_pages);
    t.insert("total_pages", last_run.total_pages);
    return t;
}
