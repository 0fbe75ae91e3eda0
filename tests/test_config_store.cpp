// Tests for the config store: composite-field decomposition, upsert/remove
// semantics, byte-for-byte preservation of other lines, and the locked
// read-modify-write on the persisted file.

#include "store/config_store.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace test_config_store {

using config_store::ConfigDocument;
using config_store::ServerEntry;
using test_support::check;
using test_support::check_equal;

static const std::string KEY = config_store::MCP_SERVERS_KEY;

static bool same_entries_as_set(std::vector<ServerEntry> actual, std::vector<ServerEntry> expected) {
    auto by_name = [](const ServerEntry &left, const ServerEntry &right) {
        return left.name < right.name || (left.name == right.name && left.command < right.command);
    };
    std::sort(actual.begin(), actual.end(), by_name);
    std::sort(expected.begin(), expected.end(), by_name);
    return actual == expected;
}

static size_t count_named(const std::vector<ServerEntry> &entries, const std::string &name) {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [&name](const ServerEntry &entry) { return entry.name == name; }));
}

static bool test_absent_field_reads_empty() {
    ConfigDocument document = ConfigDocument::parse("default_provider = \"ollama\"\napi_key = \"\"\n");
    std::string before = document.serialize();
    bool success = check(document.get_composite(KEY).empty(), "Absent composite field reads as empty");
    success &= check_equal(document.serialize(), before, "Reading does not modify the document");
    return success;
}

static bool test_parse_entries() {
    ConfigDocument document =
        ConfigDocument::parse("mcp_servers = \"fs=npx server --root=/tmp||git=uvx mcp-git|\"\n");
    std::vector<ServerEntry> entries = document.get_composite(KEY);
    bool success = check(entries.size() == 2, "Empty segments are skipped");
    success &= check(entries.size() == 2 && entries[0].name == "fs" && entries[0].command == "npx server --root=/tmp",
                     "Entry splits on the first '=' only");
    success &= check(entries.size() == 2 && entries[1].name == "git" && entries[1].command == "uvx mcp-git",
                     "Entries keep their stored order");
    return success;
}

static bool test_upsert_preserves_other_lines() {
    ConfigDocument document = ConfigDocument::parse("a=1\nmcp_servers=\"x=y\"\nb=2");
    ConfigDocument updated = document.upsert(KEY, "z", "cmd");
    std::vector<std::string> lines = updated.lines();

    bool success = check(lines.size() == 3, "Upsert keeps the line count");
    if (lines.size() != 3) {
        return false;
    }
    success &= check_equal(lines[0], "a=1", "Line before the composite line is unchanged");
    success &= check_equal(lines[2], "b=2", "Line after the composite line is unchanged");
    success &= check(same_entries_as_set(updated.get_composite(KEY), {{"x", "y"}, {"z", "cmd"}}),
                     "Composite line decomposes to {x:y, z:cmd}");
    success &= check_equal(lines[1], "mcp_servers=\"x=y|z=cmd\"", "Only the quoted value is rewritten");
    success &= check_equal(updated.serialize(), "a=1\nmcp_servers=\"x=y|z=cmd\"\nb=2",
                           "Missing final newline stays missing");
    return success;
}

static bool test_upsert_is_idempotent() {
    ConfigDocument document = ConfigDocument::parse("mcp_servers = \"x=y\"\n");
    ConfigDocument once = document.upsert(KEY, "z", "run z");
    ConfigDocument twice = once.upsert(KEY, "z", "run z");

    bool success = check(same_entries_as_set(once.get_composite(KEY), twice.get_composite(KEY)),
                         "Upserting the same pair twice gives the same entries as once");
    success &= check(count_named(twice.get_composite(KEY), "z") == 1, "Exactly one entry for the name");
    return success;
}

static bool test_upsert_replaces_and_moves_to_end() {
    ConfigDocument document = ConfigDocument::parse("mcp_servers = \"a=1|b=2|a=3|c=4\"\n");
    ConfigDocument updated = document.upsert(KEY, "a", "new");
    std::vector<ServerEntry> entries = updated.get_composite(KEY);

    bool success = check(count_named(entries, "a") == 1, "All duplicates of the name are replaced by one entry");
    success &= check(!entries.empty() && entries.back().name == "a" && entries.back().command == "new",
                     "Replaced entry is appended at the end");
    success &= check_equal(updated.serialize(), "mcp_servers = \"b=2|c=4|a=new\"\n",
                           "Remaining entries keep their relative order");
    return success;
}

static bool test_upsert_does_not_match_prefix() {
    ConfigDocument document = ConfigDocument::parse("mcp_servers = \"abc=keep\"\n");
    ConfigDocument updated = document.upsert(KEY, "ab", "other");
    return check(same_entries_as_set(updated.get_composite(KEY), {{"abc", "keep"}, {"ab", "other"}}),
                 "Upsert of 'ab' leaves 'abc' alone");
}

static bool test_upsert_creates_field() {
    ConfigDocument document = ConfigDocument::parse("# BareClaw\ndefault_model = \"m\"\n");
    ConfigDocument updated = document.upsert(KEY, "fs", "npx fs");
    bool success = check_equal(updated.serialize(), "# BareClaw\ndefault_model = \"m\"\nmcp_servers = \"fs=npx fs\"\n",
                               "Absent field is appended as a new last line");

    ConfigDocument empty_document = ConfigDocument::parse("");
    success &= check_equal(empty_document.upsert(KEY, "fs", "npx fs").serialize(), "mcp_servers = \"fs=npx fs\"\n",
                           "Empty document gets a single composite line");
    return success;
}

static bool test_whitespace_and_comments_preserved() {
    std::string text =
        "default_provider   = \"ollama\"   \n"
        "\n"
        "  # Channel tokens\r\n"
        "discord_token   = \"abc=def|ghi\"\n"
        "mcp_servers    =   \"x=y\"   # registry\n"
        "[section]\n";
    ConfigDocument updated = ConfigDocument::parse(text).upsert(KEY, "z", "q");
    std::vector<std::string> before = ConfigDocument::parse(text).lines();
    std::vector<std::string> after = updated.lines();

    bool success = check(before.size() == after.size(), "Line count preserved");
    if (before.size() != after.size()) {
        return false;
    }
    bool others_identical = true;
    for (size_t index = 0; index < before.size(); ++index) {
        if (index != 4) {
            others_identical &= (before[index] == after[index]);
        }
    }
    success &= check(others_identical, "Every non-composite line is byte-identical (spacing, comments, CR)");
    success &= check_equal(after[4], "mcp_servers    =   \"x=y|z=q\"   # registry",
                           "Composite line keeps its spacing and trailing comment");
    success &= check(ConfigDocument::parse(text).get_composite("discord_token").size() == 1 &&
                         ConfigDocument::parse(text).serialize() == text,
                     "Parse then serialize round-trips the original text");
    return success;
}

static bool test_remove_no_match() {
    ConfigDocument document = ConfigDocument::parse("a=1\nmcp_servers = \"abc=x|abcd=y\"\n");
    std::pair<ConfigDocument, size_t> outcome = document.remove(KEY, "ab");
    bool success = check(outcome.second == 0, "Removing an absent name reports 0");
    success &= check_equal(outcome.first.serialize(), document.serialize(), "Document is unchanged");
    success &= check(outcome.first.get_composite(KEY).size() == 2, "'ab' does not remove 'abc' or 'abcd'");
    return success;
}

static bool test_remove_absent_field() {
    ConfigDocument document = ConfigDocument::parse("a=1\n");
    std::pair<ConfigDocument, size_t> outcome = document.remove(KEY, "x");
    return check(outcome.second == 0 && outcome.first.serialize() == "a=1\n",
                 "Removing from an absent field reports 0 and changes nothing");
}

static bool test_remove_counts_all_matches() {
    ConfigDocument document = ConfigDocument::parse("mcp_servers = \"a=1|b=2|a=3\"\nz=9\n");
    std::pair<ConfigDocument, size_t> outcome = document.remove(KEY, "a");
    bool success = check(outcome.second == 2, "Every entry with the exact name is removed and counted");
    success &= check_equal(outcome.first.serialize(), "mcp_servers = \"b=2\"\nz=9\n", "Remaining entries rewritten");

    std::pair<ConfigDocument, size_t> emptied = outcome.first.remove(KEY, "b");
    success &= check_equal(emptied.first.serialize(), "mcp_servers = \"\"\nz=9\n",
                           "Removing the last entry leaves an empty quoted value");
    return success;
}

static bool test_malformed_segment_preserved() {
    ConfigDocument document = ConfigDocument::parse("mcp_servers = \"legacy|x=y\"\n");
    bool success = check(document.get_composite(KEY).size() == 1, "Segment without '=' is not reported");
    ConfigDocument updated = document.upsert(KEY, "z", "w");
    success &= check_equal(updated.serialize(), "mcp_servers = \"legacy|x=y|z=w\"\n",
                           "Segment without '=' survives a rewrite");
    return success;
}

static bool test_scalar_value() {
    ConfigDocument document = ConfigDocument::parse("discord_token   = \"Bot.abc=\"\nplain = 42\n");
    bool success = check(document.scalar_value("discord_token") == std::optional<std::string>("Bot.abc="),
                         "Quoted scalar value is unquoted");
    success &= check(document.scalar_value("plain") == std::optional<std::string>("42"), "Unquoted scalar value");
    success &= check(!document.scalar_value("missing").has_value(), "Missing scalar key is nullopt");
    return success;
}

static bool test_registry_find() {
    config_store::ServerRegistry registry = config_store::ServerRegistry::parse("a=1|b=x=y");
    bool success = check(registry.find("b") == std::optional<std::string>("x=y"), "find returns the command");
    success &= check(!registry.find("c").has_value(), "find of an absent name is nullopt");
    return success;
}

static bool test_file_not_initialized() {
    test_support::TemporaryDirectory scratch;
    config_store::ConfigFile config_file(scratch.file("config.toml"));

    bool success = check(config_file.load().status == config_store::ConfigStatus::not_initialized,
                         "Loading a missing file reports not_initialized");
    config_store::ConfigUpdateResult result = config_file.upsert_server("x", "y");
    success &= check(result.status == config_store::ConfigStatus::not_initialized,
                     "Updating a missing file reports not_initialized");
    success &= check(!std::filesystem::exists(config_file.path()), "No default file is created");
    return success;
}

static bool test_file_round_trip() {
    test_support::TemporaryDirectory scratch;
    std::string path = scratch.write("config.toml", "default_model = \"m\"\n");
    config_store::ConfigFile config_file(path);

    config_store::ConfigUpdateResult added = config_file.upsert_server("fs", "npx fs");
    bool success = check(added.status == config_store::ConfigStatus::ok && added.changed, "Upsert persisted");
    success &= check_equal(test_support::read_text(path), "default_model = \"m\"\nmcp_servers = \"fs=npx fs\"\n",
                           "File holds the new composite line");

    config_store::ConfigUpdateResult again = config_file.upsert_server("fs", "npx fs");
    success &= check(again.status == config_store::ConfigStatus::ok && !again.changed,
                     "Replaying the same upsert leaves the file unchanged");

    config_store::ConfigUpdateResult removed = config_file.remove_server("fs");
    success &= check(removed.removed_count == 1, "Remove reports one entry");
    config_store::ConfigUpdateResult missing = config_file.remove_server("fs");
    success &= check(missing.status == config_store::ConfigStatus::ok && missing.removed_count == 0 &&
                         !missing.changed,
                     "Second remove reports 0 and does not write");
    return success;
}

static bool test_concurrent_upserts_are_not_lost() {
    test_support::TemporaryDirectory scratch;
    std::string path = scratch.write("config.toml", "a=1\nmcp_servers = \"\"\nb=2\n");

    const int writer_count = 8;
    const int upserts_per_writer = 10;
    std::vector<std::thread> writers;
    for (int writer = 0; writer < writer_count; ++writer) {
        writers.emplace_back([writer, &path]() {
            // Separate ConfigFile objects: the lock lives on the file, not the object.
            config_store::ConfigFile config_file(path);
            for (int index = 0; index < upserts_per_writer; ++index) {
                config_file.upsert_server("w" + std::to_string(writer) + "-" + std::to_string(index), "cmd");
            }
        });
    }
    for (auto &writer : writers) {
        writer.join();
    }

    config_store::ConfigLoadResult loaded = config_store::ConfigFile(path).load();
    std::vector<ServerEntry> entries = loaded.document.get_composite(KEY);
    bool success = check(entries.size() == static_cast<size_t>(writer_count * upserts_per_writer),
                         "Concurrent upserts from 8 threads all survive");
    std::vector<std::string> lines = loaded.document.lines();
    success &= check(lines.size() == 3 && lines[0] == "a=1" && lines[2] == "b=2",
                     "Concurrent upserts keep the other lines in place");
    return success;
}

static bool test_loads_never_see_a_partial_file() {
    test_support::TemporaryDirectory scratch;
    std::string body;
    for (int index = 0; index < 2000; ++index) {
        body += "setting_" + std::to_string(index) + " = \"value\"\n";
    }
    body += "discord_token = \"secret\"\n";
    std::string path = scratch.write("config.toml", body);

    std::atomic<bool> writing{true};
    std::thread writer([&path, &writing]() {
        config_store::ConfigFile config_file(path);
        for (int index = 0; index < 200; ++index) {
            config_file.upsert_server("s" + std::to_string(index % 7), "cmd " + std::to_string(index));
        }
        writing = false;
    });

    int load_count = 0;
    int torn_count = 0;
    config_store::ConfigFile reader(path);
    while (writing || load_count == 0) {
        config_store::ConfigLoadResult loaded = reader.load();
        ++load_count;
        if (loaded.status != config_store::ConfigStatus::ok ||
            loaded.document.scalar_value("discord_token") != std::optional<std::string>("secret")) {
            ++torn_count;
        }
    }
    writer.join();

    return check(torn_count == 0, "All " + std::to_string(load_count) +
                                      " loads during concurrent upserts see a complete file");
}

static bool test_update_keeps_mode_and_leaves_no_temporaries() {
    test_support::TemporaryDirectory scratch;
    std::string path = scratch.write("config.toml", "a=1\n");
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    config_store::ConfigFile config_file(path);
    bool success = check(config_file.upsert_server("fs", "npx fs").changed, "Upsert persisted");
    success &= check(std::filesystem::status(path).permissions() ==
                         (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write),
                     "Rewritten file keeps its permission bits");

    std::vector<std::string> names;
    for (const auto &entry : std::filesystem::directory_iterator(scratch.path())) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    success &= check(names == std::vector<std::string>{"config.toml", "config.toml.lock"},
                     "Only the config and its lock file remain after an update");
    return success;
}

static bool test_lone_opening_quote() {
    ConfigDocument document = ConfigDocument::parse("mcp_servers = \"\n");
    bool success = check(document.get_composite(KEY).empty(), "Lone opening quote reads as an empty value");
    ConfigDocument updated = document.upsert(KEY, "x", "y");
    success &= check_equal(updated.serialize(), "mcp_servers = \"x=y\"\n",
                           "Lone opening quote is completed on rewrite");

    ConfigDocument unterminated = ConfigDocument::parse("mcp_servers = \"a=b\n");
    success &= check(unterminated.get_composite(KEY) == std::vector<ServerEntry>{{"a", "b"}},
                     "Unterminated quoted value still yields its entries");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_absent_field_reads_empty();
    all_passed &= test_parse_entries();
    all_passed &= test_upsert_preserves_other_lines();
    all_passed &= test_upsert_is_idempotent();
    all_passed &= test_upsert_replaces_and_moves_to_end();
    all_passed &= test_upsert_does_not_match_prefix();
    all_passed &= test_upsert_creates_field();
    all_passed &= test_whitespace_and_comments_preserved();
    all_passed &= test_remove_no_match();
    all_passed &= test_remove_absent_field();
    all_passed &= test_remove_counts_all_matches();
    all_passed &= test_malformed_segment_preserved();
    all_passed &= test_scalar_value();
    all_passed &= test_registry_find();
    all_passed &= test_file_not_initialized();
    all_passed &= test_file_round_trip();
    all_passed &= test_concurrent_upserts_are_not_lost();
    all_passed &= test_loads_never_see_a_partial_file();
    all_passed &= test_update_keeps_mode_and_leaves_no_temporaries();
    all_passed &= test_lone_opening_quote();
    return all_passed;
}

} // namespace test_config_store
