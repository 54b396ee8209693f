#pragma once

#include <memory>
#include <string>
#include <vector>

#include "confens/common/observer.h"
#include "confens/io/structure.h"

namespace confens {
namespace commands {

bool IsStructureExtension(const std::string& path);

/**
 * Structure paths from exactly one of: positional inputs, a list file (one
 * path per line, '#' comments, relative to the list's folder) or a folder scan.
 *
 * @throws ValidationError if none or several input methods are given
 */
std::vector<std::string> ResolveInputs(const std::vector<std::string>& inputs,
                                       const std::string& input_list,
                                       const std::string& input_dir);

/**
 * Parse a structure file; a missing or unreadable file yields nullptr and a
 * warning so the builder can report it as unmapped.
 */
std::shared_ptr<const io::Structure> LoadStructureOrNull(const std::string& path,
                                                         common::Observer& observer);

/**
 * Write lines to a file, or to stdout when path is empty.
 *
 * @throws FileWriteError if the file cannot be written
 */
void WriteLines(const std::string& path, const std::vector<std::string>& lines);

}  // namespace commands
}  // namespace confens
