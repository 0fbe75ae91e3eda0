#include "store/memory_store.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace memory_store {

const char *const ENTRY_EXTENSION = ".md";

namespace {

// Walks directory and calls visit(relative_path) for each regular file.
// Returns false if the directory does not exist.
template <typename Visitor>
bool walk_files(const std::string &directory, std::string &error_message, Visitor visit) {
    std::error_code error;
    if (!fs::is_directory(directory, error)) {
        return false;
    }

    fs::recursive_directory_iterator iterator(directory, fs::directory_options::skip_permission_denied, error);
    fs::recursive_directory_iterator end;
    while (!error && iterator != end) {
        std::error_code entry_error;
        if (iterator->is_regular_file(entry_error)) {
            visit(iterator->path(), iterator->path().lexically_relative(directory));
        }
        iterator.increment(error);
    }
    if (error) {
        error_message = error.message();
    }
    return true;
}

std::string key_from_relative_path(const fs::path &relative_path) {
    fs::path without_extension = relative_path;
    without_extension.replace_extension();
    return without_extension.generic_string();
}

} // namespace

Listing list_keys(const std::string &memory_directory) {
    Listing listing;
    listing.directory_exists = walk_files(memory_directory, listing.error_message,
        [&listing](const fs::path &, const fs::path &relative_path) {
            if (relative_path.extension() == ENTRY_EXTENSION) {
                listing.items.push_back(key_from_relative_path(relative_path));
            }
        });
    std::sort(listing.items.begin(), listing.items.end());
    return listing;
}

DeleteResult delete_by_prefix(const std::string &memory_directory, const std::string &prefix) {
    DeleteResult result;

    // Collect first: removing while a recursive iterator is live is unspecified.
    std::vector<fs::path> doomed;
    std::string walk_error;
    result.directory_exists = walk_files(memory_directory, walk_error,
        [&doomed, &prefix](const fs::path &absolute_path, const fs::path &relative_path) {
            if (relative_path.extension() != ENTRY_EXTENSION) {
                return;
            }
            std::string key = key_from_relative_path(relative_path);
            if (key.compare(0, prefix.size(), prefix) == 0) {
                doomed.push_back(absolute_path);
            }
        });
    result.error_message = walk_error;

    for (const auto &path : doomed) {
        std::error_code error;
        if (fs::remove(path, error)) {
            result.deleted_count++;
            continue;
        }
        if (error) {
            result.failed_count++;
            if (result.error_message.empty()) {
                result.error_message = path.string() + ": " + error.message();
            }
        }
    }

    debug_log::log("memory: deleted " + std::to_string(result.deleted_count) + " entr" +
                   (result.deleted_count == 1 ? "y" : "ies") + " with prefix '" + prefix + "'");
    return result;
}

Listing list_files_recursive(const std::string &directory) {
    Listing listing;
    listing.directory_exists = walk_files(directory, listing.error_message,
        [&listing](const fs::path &, const fs::path &relative_path) {
            listing.items.push_back(relative_path.generic_string());
        });
    std::sort(listing.items.begin(), listing.items.end());
    return listing;
}

} // namespace memory_store
