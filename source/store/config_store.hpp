#ifndef CLAWMCPS_CONFIG_STORE_HPP
#define CLAWMCPS_CONFIG_STORE_HPP

// Flat key = value configuration file (BareClaw's config.toml) with one
// composite key whose quoted value packs a registry of external MCP servers:
//
//     mcp_servers = "fs=npx server-fs /tmp|git=uvx mcp-server-git"
//
// Only the composite line is ever decomposed and rewritten. Every other line
// keeps its exact bytes and position.

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace config_store {

// Name of the composite key holding the MCP server registry.
extern const char *const MCP_SERVERS_KEY;

struct ServerEntry {
    std::string name;
    std::string command;

    bool operator==(const ServerEntry &other) const {
        return name == other.name && command == other.command;
    }
};

// Ordered name -> command mapping over the entries of a composite value.
// Entries are '|'-separated; each splits on its first '=' (the command may
// contain '=', the name may not). Segments without '=' are kept verbatim so a
// rewrite does not lose them, but they are not reported by entries().
class ServerRegistry {
public:
    static ServerRegistry parse(const std::string &value);
    std::string serialize() const;

    std::vector<ServerEntry> entries() const;
    std::optional<std::string> find(const std::string &name) const;

    // Removes every entry named exactly `name`, then appends the new one.
    void upsert(const std::string &name, const std::string &command);

    // Removes every entry named exactly `name`; returns how many there were.
    size_t remove(const std::string &name);

private:
    struct Segment {
        std::string name;
        std::string command;
        bool has_separator = true;
    };

    std::vector<Segment> segments_;
};

// The text of a configuration file as an ordered sequence of lines, each
// tagged with its key (empty for blank lines, comments and sections).
class ConfigDocument {
public:
    static ConfigDocument parse(const std::string &text);
    std::string serialize() const;

    std::vector<std::string> lines() const;

    // Pairs of the composite field; empty when the field is absent.
    std::vector<ServerEntry> get_composite(const std::string &key_name) const;

    // Copy of this document with (name, command) upserted into the composite
    // field. Creates the field on a new last line if it does not exist.
    ConfigDocument upsert(const std::string &key_name, const std::string &name,
                          const std::string &command) const;

    // Copy of this document with every entry named `name` removed from the
    // composite field, plus the number of entries removed.
    std::pair<ConfigDocument, size_t> remove(const std::string &key_name, const std::string &name) const;

    // Unquoted value of a scalar key, for read-only lookups. Never rewrites.
    std::optional<std::string> scalar_value(const std::string &key) const;

    bool operator==(const ConfigDocument &other) const {
        return serialize() == other.serialize();
    }

private:
    struct Line {
        std::string key;
        std::string raw;
    };

    // Index of the first line whose key is key_name.
    std::optional<size_t> find_line(const std::string &key_name) const;

    std::vector<Line> lines_;
    bool trailing_newline_ = true;
};

enum class ConfigStatus {
    ok,
    not_initialized, // the file does not exist; it is never created here
    io_error,
};

struct ConfigLoadResult {
    ConfigStatus status = ConfigStatus::io_error;
    ConfigDocument document;
    std::string error_message;
};

struct ConfigUpdateResult {
    ConfigStatus status = ConfigStatus::io_error;
    bool changed = false;
    size_t removed_count = 0;
    std::string error_message;
};

// The persisted configuration file at an injected path.
// Mutations run as one read-modify-write under an exclusive file lock, so
// concurrent updates (threads or processes) cannot lose each other's changes.
class ConfigFile {
public:
    explicit ConfigFile(std::string path);

    const std::string &path() const { return path_; }

    ConfigLoadResult load() const;

    ConfigUpdateResult update(const std::function<ConfigDocument(const ConfigDocument &)> &mutator);

    ConfigUpdateResult upsert_server(const std::string &name, const std::string &command);
    ConfigUpdateResult remove_server(const std::string &name);

private:
    std::string path_;
};

} // namespace config_store

#endif // CLAWMCPS_CONFIG_STORE_HPP
