/**
 * PDB Parser - multi-model reader for ATOM/HETATM records
 *
 * Reads every model of a PDB file into one Structure (one coordinate set per
 * model). Files ending in .gz are decompressed with zlib.
 *
 * Usage:
 *   PDBParser parser;
 *   auto structure = parser.parse_file("1abc.pdb.gz");
 *   auto ca = structure.select("calpha");
 */

#pragma once

#include "structure.h"

#include <istream>
#include <string>

namespace confens {
namespace io {

class PDBParser {
public:
    /**
     * Parse a PDB file (plain or gzip-compressed).
     *
     * The title is derived from the file name (see title_from_path).
     *
     * @throws FileNotFoundError if the file cannot be opened
     * @throws FormatError on malformed records or inconsistent models
     */
    Structure parse_file(const std::string& filename) const;

    /// Parse PDB-format text held in memory.
    Structure parse_string(const std::string& text, const std::string& title = "") const;

    /**
     * Parse PDB-format text from a stream.
     *
     * @param source Name used in error messages
     */
    Structure parse(std::istream& in, const std::string& title,
                    const std::string& source = "<stream>") const;

    /**
     * Title for a structure read from path: the file name without .gz and the
     * following extension; "pdbXXXX" names are shortened to "XXXX".
     */
    static std::string title_from_path(const std::string& path);

private:
    static std::string trim(const std::string& str);
};

/// Read a whole file into memory, decompressing it when the name ends in .gz.
std::string read_text_file(const std::string& filename);

}  // namespace io
}  // namespace confens
