#ifndef CLAWMCPS_DOTENV_HPP
#define CLAWMCPS_DOTENV_HPP

// Minimal dotenv (.env) reader used to feed test credentials to child processes.

#include <map>
#include <string>

namespace dotenv {

// Parse KEY=VALUE lines. Blank lines and lines starting with '#' are skipped,
// a leading "export " is accepted, whitespace around key and value is trimmed,
// and one pair of matching single or double quotes around the value is removed.
// Lines without '=' or with an empty key are ignored. Later keys win.
std::map<std::string, std::string> parse(const std::string &text);

// Parse the file at file_path. A missing or unreadable file yields an empty map.
std::map<std::string, std::string> load_file(const std::string &file_path);

} // namespace dotenv

#endif // CLAWMCPS_DOTENV_HPP
