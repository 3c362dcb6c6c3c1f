#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace
{

std::vector<std::string> splitPath(const std::string& path)
{
    std::vector<std::string> segments;
    std::istringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '.'))
        segments.push_back(segment);
    return segments;
}

bool owns(const std::vector<std::string>& keys, std::string_view key)
{
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

// Null when a segment is missing or is not a table.
const toml::table* findTable(const toml::table& root, const std::string& path)
{
    const toml::table* current = &root;
    for (const auto& segment : splitPath(path))
    {
        current = current->get_as<toml::table>(segment);
        if (!current)
            return nullptr;
    }
    return current;
}

// Creates missing tables along the way. Null when a segment holds a non-table.
toml::table* ensureTable(toml::table& root, const std::string& path)
{
    toml::table* current = &root;
    for (const auto& segment : splitPath(path))
    {
        if (segment.empty())
            return nullptr;
        // Leaves an existing value in place
        auto it = current->insert(segment, toml::table{}).first;
        current = it->second.as_table();
        if (!current)
            return nullptr;
    }
    return current;
}

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , root_(std::make_unique<toml::table>())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        for (const auto& key : ownedKeys)
        {
            if (owns(handler.ownedKeys, key))
            {
                last_error_ = "Key '" + key + "' in [" + path + "] is already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::fileExists() const
{
    std::error_code ec;
    return fs::is_regular_file(config_path_, ec);
}

bool ConfigManager::load()
{
    last_error_.clear();
    parse_failed_ = false;
    if (!fileExists())
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        return true;
    }

    toml::table parsed;
    try
    {
        parsed = toml::parse_file(config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        const auto& where = pe.source().begin;
        last_error_ = "config parse error at " + config_path_ + ":" + std::to_string(where.line) + ":" +
                      std::to_string(where.column) + ": " + std::string(pe.description());
        parse_failed_ = true;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors, defaults in effect", last_error_);
        return false;
    }

    *root_ = std::move(parsed);
    static const toml::table kEmpty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = findTable(*root_, handler.path);
        handler.callbacks.load(section ? *section : kEmpty);
    }
    PLOG_INFO << "Loaded config from " << config_path_;
    return true;
}

toml::table ConfigManager::compose() const
{
    toml::table document = *root_;
    for (const auto& handler : handlers_)
        applyHandler(document, handler);
    return document;
}

bool ConfigManager::save()
{
    last_error_.clear();
    toml::table document = *root_;
    for (const auto& handler : handlers_)
    {
        if (!applyHandler(document, handler))
        {
            last_error_ = "[" + handler.path + "] is not a table in " + config_path_;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
    }
    return writeDocument(document);
}

bool ConfigManager::saveTable(const std::string& path)
{
    last_error_.clear();
    toml::table document = *root_;
    bool found = false;
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        found = true;
        if (!applyHandler(document, handler))
        {
            last_error_ = "[" + path + "] is not a table in " + config_path_;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
    }

    if (!found)
    {
        last_error_ = "No settings registered for [" + path + "]";
        PLOG_ERROR << last_error_;
        return false;
    }
    return writeDocument(document);
}

const toml::table& ConfigManager::root() const { return *root_; }

bool ConfigManager::applyHandler(toml::table& document, const HandlerEntry& handler) const
{
    toml::table values = handler.callbacks.save();
    for (const auto& entry : values)
    {
        if (!owns(handler.ownedKeys, entry.first.str()))
            PLOG_WARNING << "[" << handler.path << "] handler wrote unregistered key '" << entry.first.str()
                         << "', dropped";
    }

    // An empty handler table does not add its header to the file
    if (values.empty() && !findTable(document, handler.path))
        return true;

    toml::table* target = ensureTable(document, handler.path);
    if (!target)
    {
        PLOG_WARNING << "Config path '" << handler.path << "' is not a table; its settings are not written";
        return false;
    }

    for (const auto& key : handler.ownedKeys)
    {
        if (values.contains(key))
            target->insert_or_assign(key, values[key]);
        else
            target->erase(key);
    }
    return true;
}

bool ConfigManager::writeDocument(const toml::table& document)
{
    if (parse_failed_)
    {
        last_error_ = config_path_ + " has parse errors; fix it before settings can be written";
        PLOG_WARNING << last_error_;
        return false;
    }

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "cannot create " + tmp;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
        ofs << document << '\n';
        if (!ofs.flush())
        {
            last_error_ = "write error on " + tmp;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = "cannot replace " + config_path_ + ": " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          last_error_);
        fs::remove(tmp, ec);
        return false;
    }

    *root_ = document;
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}
