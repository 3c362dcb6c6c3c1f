#pragma once

#include "CommandLine.hpp"

#include <memory>
#include <string>
#include <vector>

class ConfigManager;
struct SplitterConfig;

namespace slipsort
{
struct BatchResult;
struct BatchReportInfo;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool initializeLogging();
    bool initializeConfig();
    void applyCommandLineOverrides();

    int runProcess();
    int runMerge();
    int runRoster();
    int runSecure();
    int runConfig();

    void recordLastRun(const slipsort::BatchResult& result, const slipsort::BatchReportInfo& info);

    void printSummary(const slipsort::BatchResult& result) const;
    void printErrorSummary() const;
    void cleanup();

    std::vector<std::string> args_;
    CommandLineOptions options_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<SplitterConfig> settings_;
    bool logging_ready_ = false;
};
