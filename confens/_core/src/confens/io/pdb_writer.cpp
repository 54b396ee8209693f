#include "pdb_writer.h"

#include "confens/errors/confens_error.h"

#include <zlib.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace confens {
namespace io {

namespace {

// Atom names shorter than four characters start in column 14 unless the
// element symbol has two letters.
std::string format_atom_name(const AtomRecord& atom) {
    const std::string& name = atom.name;
    if (name.size() >= 4 || atom.element.size() == 2) {
        std::string padded = name;
        padded.resize(4, ' ');
        return padded.substr(0, 4);
    }
    std::string padded = " " + name;
    padded.resize(4, ' ');
    return padded;
}

void write_atoms(std::ostream& out, const Structure& structure, const std::vector<float>* coords) {
    const auto& atoms = structure.atoms();

    for (size_t i = 0; i < atoms.size(); ++i) {
        const AtomRecord& atom = atoms[i];
        const float x = coords != nullptr ? (*coords)[i * 3 + 0] : 0.0f;
        const float y = coords != nullptr ? (*coords)[i * 3 + 1] : 0.0f;
        const float z = coords != nullptr ? (*coords)[i * 3 + 2] : 0.0f;

        out << (atom.hetero ? "HETATM" : "ATOM  ") << std::setw(5) << (atom.serial % 100000)
            << " " << format_atom_name(atom) << atom.altloc << std::setw(3) << std::right
            << atom.resname.substr(0, 3) << " " << atom.chain_id << std::setw(4)
            << (atom.resnum % 10000) << atom.icode << "   " << std::fixed << std::setprecision(3)
            << std::setw(8) << x << std::setw(8) << y << std::setw(8) << z << std::setw(6)
            << std::setprecision(2) << atom.occupancy << std::setw(6) << std::setprecision(2)
            << atom.bfactor << "          " << std::setw(2) << atom.element.substr(0, 2) << "\n";
    }
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

void write_pdb(std::ostream& out, const Structure& structure, int coordset) {
    if (structure.num_coordsets() == 0) {
        write_atoms(out, structure, nullptr);
    } else if (coordset >= 0 || structure.num_coordsets() == 1) {
        write_atoms(out, structure, &structure.coords(coordset >= 0 ? coordset : 0));
    } else {
        for (int model = 0; model < structure.num_coordsets(); ++model) {
            out << "MODEL     " << std::setw(4) << (model + 1) << "\n";
            write_atoms(out, structure, &structure.coords(model));
            out << "ENDMDL\n";
        }
    }
    out << "END\n";
}

std::string to_pdb_string(const Structure& structure, int coordset) {
    std::ostringstream oss;
    write_pdb(oss, structure, coordset);
    return oss.str();
}

void write_text_file(const std::string& path, const std::string& text) {
    if (ends_with(path, ".gz")) {
        gzFile gz = gzopen(path.c_str(), "wb");
        if (gz == nullptr) {
            throw errors::FileWriteError(path, "gzopen failed");
        }
        int written = text.empty() ? 0 : gzwrite(gz, text.data(), static_cast<unsigned>(text.size()));
        int status = gzclose(gz);
        if (written != static_cast<int>(text.size()) || status != Z_OK) {
            throw errors::FileWriteError(path, "gzip write failed");
        }
        return;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw errors::FileWriteError(path);
    }
    file << text;
    if (!file) {
        throw errors::FileWriteError(path, "write failed");
    }
}

void write_pdb_file(const std::string& path, const Structure& structure, int coordset) {
    write_text_file(path, to_pdb_string(structure, coordset));
}

}  // namespace io
}  // namespace confens
