#include "CommandLine.hpp"

#include <charconv>
#include <cstddef>
#include <system_error>

namespace
{

bool takeValue(const std::vector<std::string>& args, size_t& i, const std::string& flag, std::string& out,
               std::string& outError)
{
    if (i + 1 >= args.size())
    {
        outError = "Missing value for " + flag;
        return false;
    }
    out = args[++i];
    return true;
}

bool parseInt(const std::string& text, int& out)
{
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

bool parseProcess(const std::vector<std::string>& args, size_t i, CommandLineOptions& out, std::string& outError)
{
    for (; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        std::string value;
        if (arg == "--year" || arg == "-y")
        {
            if (!takeValue(args, i, arg, out.year, outError))
                return false;
        }
        else if (arg == "--month" || arg == "-m")
        {
            if (!takeValue(args, i, arg, out.month, outError))
                return false;
        }
        else if (arg == "--fuzzy")
        {
            out.fuzzy = true;
        }
        else if (arg == "--threshold")
        {
            if (!takeValue(args, i, arg, value, outError))
                return false;
            int threshold = 0;
            if (!parseInt(value, threshold) || threshold < 0 || threshold > 100)
            {
                outError = "Threshold must be an integer between 0 and 100: '" + value + "'";
                return false;
            }
            out.threshold = threshold;
        }
        else if (arg == "--output" || arg == "-o")
        {
            if (!takeValue(args, i, arg, value, outError))
                return false;
            out.output_dir = value;
        }
        else if (arg == "--roster")
        {
            if (!takeValue(args, i, arg, value, outError))
                return false;
            out.roster_file = value;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            out.verbose = true;
        }
        else if (arg == "--no-backup")
        {
            out.no_backup = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            outError = "Unknown option: " + arg;
            return false;
        }
        else if (out.source.empty())
        {
            out.source = arg;
        }
        else
        {
            outError = "Unexpected argument: " + arg;
            return false;
        }
    }

    if (out.source.empty())
    {
        outError = "process: missing source PDF";
        return false;
    }
    return true;
}

} // namespace

bool parseCommandLine(const std::vector<std::string>& args, CommandLineOptions& out, std::string& outError)
{
    out = CommandLineOptions{};

    size_t i = 0;
    // Global options come before the command
    for (; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h")
        {
            out.command = Command::Help;
            return true;
        }
        if (arg == "--version")
        {
            out.command = Command::Version;
            return true;
        }
        if (arg == "--config")
        {
            if (!takeValue(args, i, arg, out.config_path, outError))
                return false;
            continue;
        }
        break;
    }

    if (i >= args.size())
    {
        outError = "Missing command";
        return false;
    }

    const std::string& command = args[i++];
    if (command == "process")
    {
        out.command = Command::Process;
        return parseProcess(args, i, out, outError);
    }

    if (command == "merge")
    {
        out.command = Command::Merge;
        if (args.size() - i < 2)
        {
            outError = "merge: expected <output.pdf> <input.pdf>...";
            return false;
        }
        out.merge_output = args[i++];
        out.merge_inputs.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
        return true;
    }

    if (command == "roster")
    {
        out.command = Command::Roster;
        for (; i < args.size(); ++i)
        {
            if (args[i] == "--roster")
            {
                std::string value;
                if (!takeValue(args, i, args[i], value, outError))
                    return false;
                out.roster_file = value;
            }
            else if (out.roster_action.empty())
            {
                out.roster_action = args[i];
            }
            else if (out.roster_name.empty())
            {
                out.roster_name = args[i];
            }
            else
            {
                // Unquoted names arrive split on spaces
                out.roster_name += " " + args[i];
            }
        }

        if (out.roster_action == "list")
            return true;
        if (out.roster_action == "add" || out.roster_action == "remove")
        {
            if (out.roster_name.empty())
            {
                outError = "roster " + out.roster_action + ": missing name";
                return false;
            }
            return true;
        }
        outError = "roster: expected list, add or remove";
        return false;
    }

    if (command == "secure")
    {
        out.command = Command::Secure;
        out.password_env = "SLIPSORT_PASSWORD";
        for (; i < args.size(); ++i)
        {
            if (args[i] == "--password-env")
            {
                if (!takeValue(args, i, args[i], out.password_env, outError))
                    return false;
            }
            else if (!args[i].empty() && args[i][0] == '-')
            {
                outError = "Unknown option: " + args[i];
                return false;
            }
            else if (out.secure_input.empty())
            {
                out.secure_input = args[i];
            }
            else if (out.secure_output.empty())
            {
                out.secure_output = args[i];
            }
            else
            {
                outError = "Unexpected argument: " + args[i];
                return false;
            }
        }
        if (out.secure_output.empty())
        {
            outError = "secure: expected <input.pdf> <output.pdf>";
            return false;
        }
        return true;
    }

    if (command == "config")
    {
        out.command = Command::Config;
        if (i + 1 != args.size() || (args[i] != "show" && args[i] != "init"))
        {
            outError = "config: expected show or init";
            return false;
        }
        out.config_action = args[i];
        return true;
    }

    outError = "Unknown command: " + command;
    return false;
}

std::string usageText()
{
    return "Usage: slipsort [--config FILE] <command> [options]\n"
           "\n"
           "Commands:\n"
           "  process <source.pdf> [--year YYYY] [--month MM] [--fuzzy] [--threshold N]\n"
           "          [--output DIR] [--roster FILE] [--no-backup] [--verbose]\n"
           "      Split a payroll document into one file per person.\n"
           "  merge <output.pdf> <input.pdf>...\n"
           "      Concatenate PDFs.\n"
           "  roster list | add <name> | remove <name> [--roster FILE]\n"
           "      Manage the name list.\n"
           "  secure <input.pdf> <output.pdf> [--password-env VAR]\n"
           "      Write a password-protected copy. The password is read from the\n"
           "      environment variable VAR (default SLIPSORT_PASSWORD).\n"
           "  config show | init\n"
           "      Print the effective settings, or write them to the config file.\n"
           "\n"
           "Options:\n"
           "  -h, --help     Show this help\n"
           "  --version      Show version\n";
}
