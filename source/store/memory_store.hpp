#ifndef CLAWMCPS_MEMORY_STORE_HPP
#define CLAWMCPS_MEMORY_STORE_HPP

// Filesystem key/value store written by the BareClaw agent: one file per
// entry, <memory_dir>/<key>.md, where keys may contain '/' (nested
// directories). Contents are opaque here; entries are only listed or deleted.

#include <cstddef>
#include <string>
#include <vector>

namespace memory_store {

// Extension of every memory entry file.
extern const char *const ENTRY_EXTENSION;

// Result of a directory listing. directory_exists == false is the
// "not yet created" signal, not an error.
struct Listing {
    bool directory_exists = false;
    std::vector<std::string> items; // sorted lexicographically
    std::string error_message;      // set when the walk failed part-way
};

struct DeleteResult {
    bool directory_exists = false;
    size_t deleted_count = 0;
    size_t failed_count = 0;
    std::string error_message; // first failure, if any
};

// Keys of all entries under memory_directory, recursively.
Listing list_keys(const std::string &memory_directory);

// Delete every entry whose key starts with prefix (plain string prefix, not
// path-aware). Zero matches and a missing directory both report 0.
DeleteResult delete_by_prefix(const std::string &memory_directory, const std::string &prefix);

// Every regular file under directory as a generic relative path.
Listing list_files_recursive(const std::string &directory);

} // namespace memory_store

#endif // CLAWMCPS_MEMORY_STORE_HPP
