#pragma once

#include <optional>
#include <string>
#include <vector>

enum class Command
{
    None,
    Help,
    Version,
    Process,
    Merge,
    Roster,
    Secure,
    Config
};

struct CommandLineOptions
{
    Command command = Command::None;
    std::string config_path = "config.toml";

    // process
    std::string source;
    std::string year;  // empty: current year
    std::string month; // empty: current month
    bool fuzzy = false;
    std::optional<int> threshold;
    std::optional<std::string> output_dir;
    std::optional<std::string> roster_file;
    bool verbose = false;
    bool no_backup = false;

    // merge
    std::string merge_output;
    std::vector<std::string> merge_inputs;

    // roster
    std::string roster_action; // list | add | remove
    std::string roster_name;

    // secure
    std::string secure_input;
    std::string secure_output;
    std::string password_env; // variable holding the password

    // config
    std::string config_action; // show | init
};

// Parses argv[1..]. On failure returns false with a message for the user.
bool parseCommandLine(const std::vector<std::string>& args, CommandLineOptions& out, std::string& outError);

std::string usageText();
