#include "store/config_store.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace config_store {

const char *const MCP_SERVERS_KEY = "mcp_servers";

namespace {

std::string trim(const std::string &text) {
    size_t begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

// Key of a key = value line; empty for blank lines, comments and [sections].
std::string extract_key(const std::string &raw) {
    std::string stripped = trim(raw);
    if (stripped.empty() || stripped[0] == '#' || stripped[0] == '[') {
        return "";
    }
    size_t separator = stripped.find('=');
    if (separator == std::string::npos) {
        return "";
    }
    return trim(stripped.substr(0, separator));
}

// A composite line split around its quoted value: prefix keeps everything up
// to and including the opening quote, suffix the closing quote and anything
// after it.
struct CompositeLine {
    std::string prefix;
    ServerRegistry registry;
    std::string suffix;

    static CompositeLine parse(const std::string &raw) {
        CompositeLine line;
        size_t separator = raw.find('=');
        size_t open_quote = raw.find('"', separator + 1);
        size_t close_quote = raw.rfind('"');

        if (open_quote != std::string::npos && close_quote > open_quote) {
            line.prefix = raw.substr(0, open_quote + 1);
            line.registry = ServerRegistry::parse(raw.substr(open_quote + 1, close_quote - open_quote - 1));
            line.suffix = raw.substr(close_quote);
            return line;
        }

        if (open_quote != std::string::npos) {
            // Opening quote without a closing one: the rest is the value.
            line.prefix = raw.substr(0, open_quote + 1);
            line.registry = ServerRegistry::parse(trim(raw.substr(open_quote + 1)));
            line.suffix = "\"";
            return line;
        }

        // Unquoted value: it gets quoted when the line is rewritten.
        size_t value_begin = raw.find_first_not_of(" \t", separator + 1);
        if (value_begin == std::string::npos) {
            value_begin = raw.size();
        }
        line.prefix = raw.substr(0, value_begin) + "\"";
        line.registry = ServerRegistry::parse(trim(raw.substr(value_begin)));
        line.suffix = "\"";
        return line;
    }

    std::string serialize() const {
        return prefix + registry.serialize() + suffix;
    }
};

std::string new_composite_line(const std::string &key_name, const ServerRegistry &registry) {
    return key_name + " = \"" + registry.serialize() + "\"";
}

} // namespace

// ---------------------------------------------------------------------------
// ServerRegistry
// ---------------------------------------------------------------------------

ServerRegistry ServerRegistry::parse(const std::string &value) {
    ServerRegistry registry;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find('|', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        std::string segment = value.substr(start, end - start);
        if (!segment.empty()) {
            Segment parsed;
            size_t separator = segment.find('=');
            if (separator == std::string::npos) {
                parsed.name = segment;
                parsed.has_separator = false;
            } else {
                parsed.name = segment.substr(0, separator);
                parsed.command = segment.substr(separator + 1);
            }
            registry.segments_.push_back(parsed);
        }
        start = end + 1;
    }
    return registry;
}

std::string ServerRegistry::serialize() const {
    std::string value;
    for (const auto &segment : segments_) {
        if (!value.empty()) {
            value += "|";
        }
        value += segment.name;
        if (segment.has_separator) {
            value += "=" + segment.command;
        }
    }
    return value;
}

std::vector<ServerEntry> ServerRegistry::entries() const {
    std::vector<ServerEntry> result;
    for (const auto &segment : segments_) {
        if (segment.has_separator) {
            result.push_back({segment.name, segment.command});
        }
    }
    return result;
}

std::optional<std::string> ServerRegistry::find(const std::string &name) const {
    for (const auto &segment : segments_) {
        if (segment.has_separator && segment.name == name) {
            return segment.command;
        }
    }
    return std::nullopt;
}

void ServerRegistry::upsert(const std::string &name, const std::string &command) {
    remove(name);
    segments_.push_back({name, command, true});
}

size_t ServerRegistry::remove(const std::string &name) {
    size_t before = segments_.size();
    segments_.erase(std::remove_if(segments_.begin(), segments_.end(),
                                   [&name](const Segment &segment) { return segment.name == name; }),
                    segments_.end());
    return before - segments_.size();
}

// ---------------------------------------------------------------------------
// ConfigDocument
// ---------------------------------------------------------------------------

ConfigDocument ConfigDocument::parse(const std::string &text) {
    ConfigDocument document;
    if (text.empty()) {
        return document;
    }

    std::string body = text;
    document.trailing_newline_ = (body.back() == '\n');
    if (document.trailing_newline_) {
        body.pop_back();
    }

    size_t start = 0;
    while (true) {
        size_t end = body.find('\n', start);
        std::string raw = body.substr(start, end == std::string::npos ? std::string::npos : end - start);
        document.lines_.push_back({extract_key(raw), raw});
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return document;
}

std::string ConfigDocument::serialize() const {
    if (lines_.empty()) {
        return "";
    }
    std::string text;
    for (size_t index = 0; index < lines_.size(); ++index) {
        if (index > 0) {
            text += "\n";
        }
        text += lines_[index].raw;
    }
    if (trailing_newline_) {
        text += "\n";
    }
    return text;
}

std::vector<std::string> ConfigDocument::lines() const {
    std::vector<std::string> result;
    result.reserve(lines_.size());
    for (const auto &line : lines_) {
        result.push_back(line.raw);
    }
    return result;
}

std::optional<size_t> ConfigDocument::find_line(const std::string &key_name) const {
    for (size_t index = 0; index < lines_.size(); ++index) {
        if (lines_[index].key == key_name) {
            return index;
        }
    }
    return std::nullopt;
}

std::vector<ServerEntry> ConfigDocument::get_composite(const std::string &key_name) const {
    std::optional<size_t> index = find_line(key_name);
    if (!index) {
        return {};
    }
    return CompositeLine::parse(lines_[*index].raw).registry.entries();
}

ConfigDocument ConfigDocument::upsert(const std::string &key_name, const std::string &name,
                                      const std::string &command) const {
    ConfigDocument updated = *this;
    std::optional<size_t> index = find_line(key_name);

    if (!index) {
        ServerRegistry registry;
        registry.upsert(name, command);
        updated.lines_.push_back({key_name, new_composite_line(key_name, registry)});
        return updated;
    }

    CompositeLine composite = CompositeLine::parse(lines_[*index].raw);
    composite.registry.upsert(name, command);
    updated.lines_[*index].raw = composite.serialize();
    return updated;
}

std::pair<ConfigDocument, size_t> ConfigDocument::remove(const std::string &key_name,
                                                         const std::string &name) const {
    std::optional<size_t> index = find_line(key_name);
    if (!index) {
        return {*this, 0};
    }

    CompositeLine composite = CompositeLine::parse(lines_[*index].raw);
    size_t removed_count = composite.registry.remove(name);
    if (removed_count == 0) {
        return {*this, 0};
    }

    ConfigDocument updated = *this;
    updated.lines_[*index].raw = composite.serialize();
    return {updated, removed_count};
}

std::optional<std::string> ConfigDocument::scalar_value(const std::string &key) const {
    std::optional<size_t> index = find_line(key);
    if (!index) {
        return std::nullopt;
    }
    const std::string &raw = lines_[*index].raw;
    std::string value = trim(raw.substr(raw.find('=') + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

// ---------------------------------------------------------------------------
// ConfigFile
// ---------------------------------------------------------------------------

ConfigFile::ConfigFile(std::string path) : path_(std::move(path)) {}

ConfigLoadResult ConfigFile::load() const {
    ConfigLoadResult result;

    std::error_code error;
    if (!std::filesystem::exists(path_, error)) {
        result.status = error ? ConfigStatus::io_error : ConfigStatus::not_initialized;
        result.error_message = error ? error.message() : "";
        return result;
    }

    std::string contents;
    if (!platform::read_file_locked(path_, contents)) {
        result.status = ConfigStatus::io_error;
        result.error_message = "Cannot read " + path_;
        return result;
    }

    result.status = ConfigStatus::ok;
    result.document = ConfigDocument::parse(contents);
    return result;
}

ConfigUpdateResult ConfigFile::update(const std::function<ConfigDocument(const ConfigDocument &)> &mutator) {
    ConfigUpdateResult result;

    platform::FileUpdateResult file_result = platform::update_file_locked(
        path_, [&mutator](const std::string &contents) -> std::optional<std::string> {
            return mutator(ConfigDocument::parse(contents)).serialize();
        });

    switch (file_result.status) {
    case platform::FileUpdateStatus::updated:
        result.status = ConfigStatus::ok;
        result.changed = true;
        break;
    case platform::FileUpdateStatus::unchanged:
        result.status = ConfigStatus::ok;
        result.changed = false;
        break;
    case platform::FileUpdateStatus::not_found:
        result.status = ConfigStatus::not_initialized;
        break;
    case platform::FileUpdateStatus::io_error:
        result.status = ConfigStatus::io_error;
        result.error_message = file_result.error_message;
        break;
    }
    return result;
}

ConfigUpdateResult ConfigFile::upsert_server(const std::string &name, const std::string &command) {
    debug_log::log("config: upsert " + std::string(MCP_SERVERS_KEY) + " entry '" + name + "' in " + path_);
    return update([&name, &command](const ConfigDocument &document) {
        return document.upsert(MCP_SERVERS_KEY, name, command);
    });
}

ConfigUpdateResult ConfigFile::remove_server(const std::string &name) {
    debug_log::log("config: remove " + std::string(MCP_SERVERS_KEY) + " entry '" + name + "' in " + path_);
    size_t removed_count = 0;
    ConfigUpdateResult result = update([&name, &removed_count](const ConfigDocument &document) {
        std::pair<ConfigDocument, size_t> outcome = document.remove(MCP_SERVERS_KEY, name);
        removed_count = outcome.second;
        return outcome.first;
    });
    result.removed_count = removed_count;
    return result;
}

} // namespace config_store
