#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns config.toml. Each settings group registers the dotted table path it
// lives in and the keys it writes. Keys no group owns (operator notes,
// settings of other versions) are carried through every write.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    // False if another handler already owns one of the keys at the same path.
    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Hands each registered table to its handler. A missing file is not an
    // error; on a parse error handlers keep their values and false is returned.
    bool load();

    // The document save() would write: the parsed file with every handler's keys.
    toml::table compose() const;

    // Writes every table, or just the one registered at `path`. Atomic. Refused
    // while the file on disk has parse errors, so a typo never costs its contents.
    bool save();
    bool saveTable(const std::string& path);

    bool fileExists() const;
    const toml::table& root() const;
    const std::string& path() const { return config_path_; }
    const std::string& lastError() const { return last_error_; }

private:
    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    bool applyHandler(toml::table& document, const HandlerEntry& handler) const;
    bool writeDocument(const toml::table& document);

    std::string config_path_;
    std::string last_error_;
    bool parse_failed_ = false;
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
