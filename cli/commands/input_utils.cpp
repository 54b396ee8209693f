#include "commands/input_utils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "confens/errors/confens_error.h"
#include "confens/io/pdb_parser.h"

namespace confens {
namespace commands {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool IEndsWith(const std::string& value, const std::string& suffix) {
    if (value.length() < suffix.length()) {
        return false;
    }
    return std::equal(suffix.rbegin(), suffix.rend(), value.rbegin(),
                      [](char a, char b) { return std::tolower(a) == std::tolower(b); });
}

std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> ParseFileList(const std::string& list_path) {
    std::ifstream file(list_path);
    if (!file) {
        throw errors::FileNotFoundError(list_path, "input list file");
    }

    std::filesystem::path base_dir = std::filesystem::absolute(list_path).parent_path();
    std::vector<std::string> paths;
    std::string line;
    while (std::getline(file, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        std::filesystem::path candidate(line);
        if (!candidate.is_absolute()) {
            candidate = base_dir / candidate;
        }
        paths.push_back(candidate.string());
    }
    return paths;
}

std::vector<std::string> ScanDirectory(const std::string& dir_path) {
    std::filesystem::path dir(dir_path);
    if (!std::filesystem::exists(dir) || !std::filesystem::is_directory(dir)) {
        throw errors::FileNotFoundError(dir_path, "directory");
    }

    std::vector<std::string> paths;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && IsStructureExtension(entry.path().string())) {
            paths.push_back(entry.path().string());
        }
    }

    std::sort(paths.begin(), paths.end());
    return paths;
}

}  // namespace

bool IsStructureExtension(const std::string& path) {
    std::string lower = ToLower(path);
    if (IEndsWith(lower, ".gz")) {
        lower = lower.substr(0, lower.size() - 3);
    }
    return IEndsWith(lower, ".pdb") || IEndsWith(lower, ".ent");
}

std::vector<std::string> ResolveInputs(const std::vector<std::string>& inputs,
                                       const std::string& input_list,
                                       const std::string& input_dir) {
    int specified = 0;
    if (!inputs.empty())
        specified++;
    if (!input_list.empty())
        specified++;
    if (!input_dir.empty())
        specified++;

    if (specified == 0) {
        throw errors::ValidationError(
            "No inputs provided",
            "Provide one of: positional inputs, --input-list, or --input-dir");
    }
    if (specified > 1) {
        throw errors::ValidationError(
            "Multiple input methods specified",
            "Specify only one of: positional inputs, --input-list, or --input-dir");
    }

    if (!inputs.empty()) {
        return inputs;
    }
    if (!input_list.empty()) {
        return ParseFileList(input_list);
    }
    return ScanDirectory(input_dir);
}

std::shared_ptr<const io::Structure> LoadStructureOrNull(const std::string& path,
                                                         common::Observer& observer) {
    try {
        io::PDBParser parser;
        return std::make_shared<const io::Structure>(parser.parse_file(path));
    } catch (const errors::FileNotFoundError& e) {
        observer.warning(std::string("Structure unavailable: ") + e.what());
    } catch (const errors::FormatError& e) {
        observer.warning(std::string("Structure unreadable: ") + e.what());
    }
    return nullptr;
}

void WriteLines(const std::string& path, const std::vector<std::string>& lines) {
    if (path.empty()) {
        for (const auto& line : lines) {
            std::cout << line << "\n";
        }
        std::cout.flush();
        return;
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        throw errors::FileWriteError(path);
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    if (!out) {
        throw errors::FileWriteError(path, "write failed");
    }
}

}  // namespace commands
}  // namespace confens
