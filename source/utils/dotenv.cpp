#include "utils/dotenv.hpp"
#include "platform/platform_abi.hpp"

#include <sstream>

namespace dotenv {

static std::string trim(const std::string &text) {
    size_t begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

static std::string unquote(const std::string &value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' || first == '\'') && first == last) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

std::map<std::string, std::string> parse(const std::string &text) {
    std::map<std::string, std::string> values;
    std::istringstream stream(text);
    std::string raw_line;

    while (std::getline(stream, raw_line)) {
        std::string line = trim(raw_line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t separator = line.find('=');
        if (separator == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, separator));
        if (key.empty()) {
            continue;
        }
        values[key] = unquote(trim(line.substr(separator + 1)));
    }
    return values;
}

std::map<std::string, std::string> load_file(const std::string &file_path) {
    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        return {};
    }
    return parse(contents);
}

} // namespace dotenv
