#include "pdb_parser.h"

#include "confens/errors/confens_error.h"

#include <zlib.h>

#include <fstream>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

namespace confens {
namespace io {

namespace {

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string column(const std::string& line, size_t start, size_t length) {
    if (start >= line.size()) return "";
    return line.substr(start, length);
}

}  // namespace

std::string read_text_file(const std::string& filename) {
    if (ends_with(filename, ".gz")) {
        gzFile gz = gzopen(filename.c_str(), "rb");
        if (gz == nullptr) {
            throw errors::FileNotFoundError(filename, "Structure file");
        }

        std::string text;
        char buffer[65536];
        int n;
        while ((n = gzread(gz, buffer, sizeof(buffer))) > 0) {
            text.append(buffer, static_cast<size_t>(n));
        }
        bool failed = n < 0;
        gzclose(gz);
        if (failed) {
            throw errors::FormatError(filename, "corrupt gzip stream");
        }
        return text;
    }

    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw errors::FileNotFoundError(filename, "Structure file");
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

Structure PDBParser::parse_file(const std::string& filename) const {
    std::istringstream in(read_text_file(filename));
    return parse(in, title_from_path(filename), filename);
}

Structure PDBParser::parse_string(const std::string& text, const std::string& title) const {
    std::istringstream in(text);
    return parse(in, title);
}

Structure PDBParser::parse(std::istream& in, const std::string& title,
                           const std::string& source) const {
    Structure structure(title);

    // Atoms are collected from the first model only; later models contribute
    // coordinates, which must line up one to one.
    std::vector<AtomRecord> atoms;
    std::vector<std::vector<float>> models;
    std::vector<float> current;
    bool atoms_fixed = false;

    auto close_model = [&](int line_no) {
        if (current.empty()) return;
        if (!atoms_fixed) {
            atoms_fixed = true;
        } else if (current.size() != atoms.size() * 3) {
            throw errors::FormatError(source, "model ending at line " + std::to_string(line_no) +
                                                  " has " + std::to_string(current.size() / 3) +
                                                  " atoms, expected " +
                                                  std::to_string(atoms.size()));
        }
        models.push_back(std::move(current));
        current.clear();
    };

    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string_view record = std::string_view(line).substr(0, 6);

        if (record.substr(0, 5) == "MODEL") {
            close_model(line_no);
            continue;
        }
        if (record == "ENDMDL") {
            close_model(line_no);
            continue;
        }

        bool is_atom = record.substr(0, 4) == "ATOM";
        bool is_hetatm = record == "HETATM";
        if (!is_atom && !is_hetatm) {
            continue;
        }
        if (line.size() < 54) {
            throw errors::FormatError(source, "line " + std::to_string(line_no) +
                                                  " is too short for an atom record");
        }

        // Keep only the first alternate location
        char altloc = line[16];
        if (altloc != ' ' && altloc != 'A') {
            continue;
        }

        float xyz[3];
        try {
            xyz[0] = std::stof(line.substr(30, 8));
            xyz[1] = std::stof(line.substr(38, 8));
            xyz[2] = std::stof(line.substr(46, 8));
        } catch (const std::exception&) {
            throw errors::FormatError(source, "invalid coordinates on line " +
                                                  std::to_string(line_no));
        }
        current.insert(current.end(), xyz, xyz + 3);

        if (atoms_fixed) {
            continue;
        }

        AtomRecord atom;
        atom.hetero = is_hetatm;
        atom.name = trim(line.substr(12, 4));
        atom.altloc = altloc;
        atom.resname = trim(line.substr(17, 3));
        atom.chain_id = line[21];
        atom.icode = line[26];

        try {
            std::string serial = trim(line.substr(6, 5));
            atom.serial = serial.empty() ? static_cast<int>(atoms.size()) + 1 : std::stoi(serial);
            atom.resnum = std::stoi(trim(line.substr(22, 4)));

            std::string occupancy = trim(column(line, 54, 6));
            std::string bfactor = trim(column(line, 60, 6));
            atom.occupancy = occupancy.empty() ? 1.0f : std::stof(occupancy);
            atom.bfactor = bfactor.empty() ? 0.0f : std::stof(bfactor);
        } catch (const std::exception&) {
            throw errors::FormatError(source, "invalid atom record on line " +
                                                  std::to_string(line_no));
        }
        atom.element = trim(column(line, 76, 2));

        atoms.push_back(std::move(atom));
    }

    close_model(line_no);

    if (atoms.empty()) {
        throw errors::FormatError(source, "no ATOM or HETATM records");
    }

    for (auto& atom : atoms) {
        structure.add_atom(std::move(atom));
    }
    for (auto& coords : models) {
        structure.add_coordset(std::move(coords));
    }
    return structure;
}

std::string PDBParser::title_from_path(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);

    if (ends_with(name, ".gz")) {
        name = name.substr(0, name.size() - 3);
    }
    size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    if (name.size() == 7 && name.compare(0, 3, "pdb") == 0) {
        name = name.substr(3);
    }
    return name;
}

std::string PDBParser::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

}  // namespace io
}  // namespace confens
