#include "structure_source.h"

#include "pdb_parser.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace confens {
namespace io {

DirectorySource::DirectorySource(std::vector<std::string> directories)
    : directories_(std::move(directories)) {
    if (directories_.empty()) {
        directories_.push_back(".");
    }
}

std::string DirectorySource::find_file(const std::string& identifier) const {
    if (identifier.empty()) {
        return "";
    }

    std::string lower = identifier;
    std::string upper = identifier;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::vector<std::string> spellings = {identifier};
    if (lower != identifier) spellings.push_back(lower);
    if (upper != identifier && upper != lower) spellings.push_back(upper);

    for (const auto& dir : directories_) {
        for (const auto& id : spellings) {
            const std::string candidates[] = {id + ".pdb",         id + ".pdb.gz",
                                              id + ".ent",         id + ".ent.gz",
                                              "pdb" + id + ".ent", "pdb" + id + ".ent.gz"};
            for (const auto& name : candidates) {
                fs::path path = fs::path(dir) / name;
                std::error_code ec;
                if (fs::is_regular_file(path, ec)) {
                    return path.string();
                }
            }
        }
    }
    return "";
}

std::shared_ptr<Structure> DirectorySource::fetch(const std::string& identifier) {
    std::string path = find_file(identifier);
    if (path.empty()) {
        return nullptr;
    }
    PDBParser parser;
    return std::make_shared<Structure>(parser.parse_file(path));
}

}  // namespace io
}  // namespace confens
