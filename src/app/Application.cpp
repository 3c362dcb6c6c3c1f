#include "Application.hpp"
#include "app/Version.hpp"
#include "config/ConfigManager.hpp"
#include "config/SplitterConfig.hpp"
#include "processing/Diagnostics.hpp"
#include "slipsort/acquisition/TextAcquirer.hpp"
#include "slipsort/batch/BatchProcessor.hpp"
#include "slipsort/batch/BatchReport.hpp"
#include "slipsort/batch/BatchWorker.hpp"
#include "slipsort/batch/Period.hpp"
#include "slipsort/batch/SourceBackup.hpp"
#include "slipsort/batch/UnmatchedPageLog.hpp"
#include "slipsort/document/DocumentFactory.hpp"
#include "slipsort/document/PdfMerger.hpp"
#include "slipsort/document/PdfSecurer.hpp"
#include "slipsort/matching/IdentityMatcher.hpp"
#include "slipsort/ocr/TesseractOcrEngine.hpp"
#include "slipsort/roster/Roster.hpp"
#include "slipsort/roster/RosterRepository.hpp"
#include "slipsort/routing/PageRouter.hpp"
#include "utils/CrashHandler.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitAborted = 2;

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void onInterrupt(int) { g_interrupted = 1; }

void flushErrorsOnCrash() { utils::ErrorReporter::FlushPending(); }

} // namespace

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
    {
        args_.emplace_back(argv[i]);
    }
}

Application::~Application() { cleanup(); }

int Application::run()
{
    std::string error;
    if (!parseCommandLine(args_, options_, error))
    {
        std::cerr << "slipsort: " << error << "\n\n" << usageText();
        return kExitFailure;
    }

    switch (options_.command)
    {
    case Command::Help:
        std::cout << usageText();
        return kExitOk;
    case Command::Version:
        std::cout << "slipsort " << SLIPSORT_VERSION_STRING << "\n";
        return kExitOk;
    default:
        break;
    }

    utils::ErrorReporter::BeginRun();
    if (!initializeConfig())
        return kExitFailure;

    if (!initializeLogging())
    {
        printErrorSummary();
        return kExitFailure;
    }

    PLOG_INFO << "slipsort " << SLIPSORT_VERSION_STRING << " starting";

    utils::CrashHandler::Initialize();
    utils::CrashHandler::RegisterFatalCleanup(flushErrorsOnCrash);

    int code = kExitFailure;
    switch (options_.command)
    {
    case Command::Process:
        utils::CrashHandler::SetContext("process");
        code = runProcess();
        break;
    case Command::Merge:
        utils::CrashHandler::SetContext("merge");
        code = runMerge();
        break;
    case Command::Roster:
        utils::CrashHandler::SetContext("roster");
        code = runRoster();
        break;
    case Command::Secure:
        utils::CrashHandler::SetContext("secure");
        code = runSecure();
        break;
    case Command::Config:
        utils::CrashHandler::SetContext("config");
        code = runConfig();
        break;
    default:
        break;
    }

    printErrorSummary();
    return code;
}

bool Application::initializeConfig()
{
    PROFILE_SCOPE_FUNCTION();

    config_ = std::make_unique<ConfigManager>(options_.config_path);
    settings_ = std::make_unique<SplitterConfig>();
    settings_->registerConfigHandler(*config_);

    if (!config_->load())
    {
        // Parse errors are reported; defaults stay in effect
        std::cerr << "slipsort: " << config_->lastError() << " (using defaults)\n";
    }

    applyCommandLineOverrides();
    return true;
}

void Application::applyCommandLineOverrides()
{
    if (options_.fuzzy)
        settings_->processing.use_fuzzy_matching = true;
    if (options_.threshold)
        settings_->processing.fuzzy_match_threshold = *options_.threshold;
    if (options_.output_dir)
        settings_->paths.output_dir = *options_.output_dir;
    if (options_.roster_file)
        settings_->paths.roster_file = *options_.roster_file;
    if (options_.verbose)
        settings_->logging.verbose = true;
    if (options_.no_backup)
        settings_->processing.backup_originals = false;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    utils::LogManager::Settings log_settings;
    log_settings.log_dir = settings_->paths.logs_dir;
    log_settings.level = utils::LogManager::SeverityFromLevel(settings_->logging.level);
    log_settings.append = settings_->logging.append;
    if (!utils::LogManager::Initialize(log_settings))
    {
        std::cerr << "slipsort: cannot create log directory " << log_settings.log_dir << "\n";
        return false;
    }

    const bool verbose = settings_->logging.verbose;
    bool registered = utils::LogManager::RegisterLogger<0>(
        { .name = "main", .filename = "slipsort.log", .add_console_appender = verbose });

    // Page text previews and fuzzy candidates; debug only with --verbose
    registered = utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
                     { .name = "pipeline",
                       .filename = "pipeline.log",
                       .level_override = verbose ? std::optional<plog::Severity>(plog::debug) : std::nullopt }) &&
                 registered;

#if SLIPSORT_PROFILING_LEVEL >= 1
    registered = utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>(
                     { .name = "profiling", .filename = "profiling.log" }) &&
                 registered;
#endif

    if (!registered)
        std::cerr << "slipsort: some log files could not be opened\n";

    processing::Diagnostics::SetVerbose(verbose);
    if (!utils::ErrorReporter::SetLogFile(utils::LogManager::LogPath("errors.log")))
        std::cerr << "slipsort: errors.log unavailable, problems go to slipsort.log only\n";
    logging_ready_ = true;
    return true;
}

int Application::runProcess()
{
    PROFILE_SCOPE_FUNCTION();

    const auto& processing_cfg = settings_->processing;
    const auto& paths = settings_->paths;

    std::string error;
    slipsort::Period period = slipsort::Period::current();
    if (!options_.year.empty() || !options_.month.empty())
    {
        auto parsed = slipsort::Period::parse(options_.year.empty() ? period.year : options_.year,
                                              options_.month.empty() ? period.month : options_.month, error);
        if (!parsed)
        {
            std::cerr << "slipsort: " << error << "\n";
            return kExitFailure;
        }
        period = *parsed;
    }

    slipsort::Roster roster;
    slipsort::RosterRepository repository(paths.roster_file);
    if (!repository.load(roster) || roster.empty())
    {
        std::cerr << "slipsort: no names loaded from " << paths.roster_file << "\n";
        return kExitFailure;
    }

    if (processing_cfg.backup_originals)
    {
        slipsort::SourceBackup backup(paths.backup_dir);
        std::string backup_path;
        if (!backup.backup(options_.source, backup_path, error))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Document, "Backup of source failed", error);
        }
    }

    slipsort::BatchOptions batch_options;
    batch_options.use_fuzzy_matching = processing_cfg.use_fuzzy_matching;
    batch_options.ocr_text_threshold = processing_cfg.ocr_threshold;
    batch_options.fuzzy_score_threshold = processing_cfg.fuzzy_match_threshold;
    batch_options.fuzzy_candidate_limit = static_cast<std::size_t>(processing_cfg.fuzzy_candidate_limit);
    batch_options.ocr_upscale_factor = processing_cfg.ocr_upscale_factor;
    batch_options.ocr_language = processing_cfg.ocr_language;

    slipsort::TesseractOcrEngine ocr;
    slipsort::TextAcquirer acquirer(&ocr);
    slipsort::IdentityMatcher matcher;
    slipsort::PageRouter router(paths.output_dir, processing_cfg.document_label);
    slipsort::UnmatchedPageLog unmatched_log(utils::LogManager::LogPath("unmatched_names.log"));

    slipsort::BatchProcessorCreateInfo create_info;
    create_info.acquirer = &acquirer;
    create_info.matcher = &matcher;
    create_info.router = &router;
    create_info.unmatched_log = &unmatched_log;
    create_info.open_document = slipsort::DocumentFactory::DefaultOpener();

    slipsort::BatchProcessor processor(create_info);
    slipsort::BatchWorker worker(processor);

    slipsort::BatchReportInfo report_info;
    report_info.source = options_.source;
    report_info.period = period;
    report_info.started_at = utils::ErrorReporter::GetTimestamp();

    slipsort::BatchRequest request;
    request.source_path = options_.source;
    request.period = period;
    request.roster = std::move(roster);
    request.options = batch_options;

    g_interrupted = 0;
    auto previous_handler = std::signal(SIGINT, onInterrupt);

    if (!worker.start(std::move(request)))
    {
        std::signal(SIGINT, previous_handler);
        std::cerr << "slipsort: could not start batch\n";
        return kExitFailure;
    }

    int last_reported = 0;
    bool cancel_sent = false;
    while (!worker.finished())
    {
        if (g_interrupted && !cancel_sent)
        {
            std::cout << "\nCancelling after the current page...\n";
            worker.requestCancel();
            cancel_sent = true;
        }

        auto [current, total] = worker.progress();
        if (current != last_reported && total > 0)
        {
            std::cout << "\rPage " << current << "/" << total << std::flush;
            last_reported = current;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (last_reported > 0)
        std::cout << "\n";

    int code = kExitOk;
    slipsort::BatchResult result;
    try
    {
        result = worker.wait();
    }
    catch (const slipsort::SourceUnavailableError& e)
    {
        std::signal(SIGINT, previous_handler);
        std::cerr << "slipsort: " << e.what() << "\n";
        return kExitFailure;
    }
    catch (const slipsort::BatchAbortedError& e)
    {
        std::cerr << "slipsort: batch aborted: " << e.what() << "\n";
        result = e.partial();
        code = kExitAborted;
    }
    catch (const std::exception& e)
    {
        // Already reported by the processor; only the handler and exit code remain
        std::signal(SIGINT, previous_handler);
        std::cerr << "slipsort: batch failed: " << e.what() << "\n";
        return kExitFailure;
    }
    std::signal(SIGINT, previous_handler);

    report_info.finished_at = utils::ErrorReporter::GetTimestamp();
    printSummary(result);
    recordLastRun(result, report_info);

    if (processing_cfg.write_report)
    {
        slipsort::BatchReport report;
        std::string report_path;
        if (report.write(paths.logs_dir, result, report_info, report_path, error))
            std::cout << "Report: " << report_path << "\n";
        else
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Unknown, "Failed to write batch report", error);
    }

    return code;
}

int Application::runMerge()
{
    slipsort::PdfMerger merger;
    std::string error;
    if (!merger.merge(options_.merge_inputs, options_.merge_output, error))
    {
        std::cerr << "slipsort: " << error << "\n";
        return kExitFailure;
    }
    std::cout << "Merged " << merger.mergedInputs().size() << " file(s) into " << options_.merge_output << "\n";
    return kExitOk;
}

int Application::runRoster()
{
    slipsort::RosterRepository repository(settings_->paths.roster_file);
    slipsort::Roster roster;
    bool loaded = repository.load(roster);

    if (options_.roster_action == "list")
    {
        if (!loaded)
        {
            std::cerr << "slipsort: cannot read " << repository.path() << "\n";
            return kExitFailure;
        }
        for (const auto& name : roster.names())
            std::cout << name << "\n";
        std::cout << roster.size() << " name(s)\n";
        return kExitOk;
    }

    bool changed = false;
    const std::string canonical = slipsort::Roster::canonicalize(options_.roster_name);
    if (options_.roster_action == "add")
    {
        changed = roster.add(options_.roster_name);
        std::cout << (changed ? "Added " : "Already present: ") << canonical << "\n";
    }
    else
    {
        changed = roster.remove(options_.roster_name);
        std::cout << (changed ? "Removed " : "Not found: ") << canonical << "\n";
    }

    if (changed && !repository.save(roster))
    {
        std::cerr << "slipsort: cannot write " << repository.path() << "\n";
        return kExitFailure;
    }
    return kExitOk;
}

int Application::runSecure()
{
    const char* password = std::getenv(options_.password_env.c_str());
    if (!password || !*password)
    {
        std::cerr << "slipsort: set the password in the environment variable " << options_.password_env << "\n";
        return kExitFailure;
    }

    slipsort::PdfSecurer securer;
    std::string error;
    if (!securer.secure(options_.secure_input, options_.secure_output, password, error))
    {
        std::cerr << "slipsort: " << error << "\n";
        return kExitFailure;
    }
    std::cout << "Encrypted copy written to " << options_.secure_output << "\n";
    return kExitOk;
}

int Application::runConfig()
{
    if (options_.config_action == "show")
    {
        std::cout << config_->compose() << "\n";
        return kExitOk;
    }

    if (config_->fileExists())
        std::cout << "Updating " << config_->path() << " (unknown keys are kept)\n";
    if (!config_->save())
    {
        std::cerr << "slipsort: " << config_->lastError() << "\n";
        return kExitFailure;
    }
    std::cout << "Wrote " << config_->path() << "\n";
    return kExitOk;
}

void Application::recordLastRun(const slipsort::BatchResult& result, const slipsort::BatchReportInfo& info)
{
    auto& last_run = settings_->last_run;
    last_run.source = info.source;
    last_run.period = info.period.month + "/" + info.period.year;
    last_run.finished_at = info.finished_at;
    last_run.state = slipsort::toString(result.final_state);
    last_run.identified_pages = result.identified_pages;
    last_run.total_pages = result.total_pages;

    if (!config_->saveTable("last_run"))
        PLOG_WARNING << "Last run not recorded in " << config_->path() << ": " << config_->lastError();
}

void Application::printSummary(const slipsort::BatchResult& result) const
{
    std::cout << "State:        " << slipsort::toString(result.final_state) << "\n"
              << "Pages:        " << result.pages_processed << "/" << result.total_pages << "\n"
              << "Identified:   " << result.identified_pages << "\n"
              << "Unidentified: " << result.unidentified_pages << "\n"
              << "People:       " << result.identities_found.size() << "\n";
    for (const auto& identity : result.identities_found)
        std::cout << "  " << identity << "\n";

    if (!result.errors.empty())
    {
        std::cout << "Errors:\n";
        for (const auto& error : result.errors)
            std::cout << "  " << error << "\n";
    }
}

void Application::printErrorSummary() const
{
    for (const auto& report : utils::ErrorReporter::TakePending())
    {
        if (report.severity == utils::ErrorSeverity::Info)
            continue;
        std::cerr << "[" << utils::ErrorReporter::SeverityToString(report.severity) << "] " << report.message;
        if (!report.details.empty())
            std::cerr << " (" << report.details << ")";
        std::cerr << "\n";
    }

    std::string summary = utils::ErrorReporter::FormatSummary(utils::ErrorReporter::Summary());
    if (!summary.empty())
        std::cerr << "slipsort: " << summary << "\n";
}

void Application::cleanup()
{
    if (logging_ready_)
    {
        utils::ErrorReporter::FlushPending();
        utils::LogManager::Shutdown();
        logging_ready_ = false;
    }
}
