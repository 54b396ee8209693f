/**
 * PDB Writer
 *
 * Writes a Structure as ATOM/HETATM records. Structures with more than one
 * coordinate set are written as MODEL/ENDMDL blocks. Paths ending in .gz are
 * compressed with zlib.
 */

#pragma once

#include "structure.h"

#include <ostream>
#include <string>

namespace confens {
namespace io {

/**
 * Write PDB-format text to a stream.
 *
 * @param coordset Coordinate set to write; -1 writes every coordinate set
 */
void write_pdb(std::ostream& out, const Structure& structure, int coordset = -1);

/// PDB-format text of a structure.
std::string to_pdb_string(const Structure& structure, int coordset = -1);

/**
 * Write a structure to a file (gzip-compressed when the path ends in .gz).
 *
 * @throws FileWriteError if the file cannot be written
 */
void write_pdb_file(const std::string& path, const Structure& structure, int coordset = -1);

/// Write text to a file, gzip-compressed when the path ends in .gz.
void write_text_file(const std::string& path, const std::string& text);

}  // namespace io
}  // namespace confens
