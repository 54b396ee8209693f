/**
 * Lookup of source structures by identifier (e.g. a 4-character PDB code).
 */

#pragma once

#include "structure.h"

#include <memory>
#include <string>
#include <vector>

namespace confens {
namespace io {

class StructureSource {
public:
    virtual ~StructureSource() = default;

    /**
     * Fetch a structure by identifier.
     *
     * @return The structure, or nullptr when it is not available
     */
    virtual std::shared_ptr<Structure> fetch(const std::string& identifier) = 0;
};

/**
 * Looks identifiers up as files in local directories.
 *
 * For identifier "1abc" each directory is searched, in order, for
 * 1abc.pdb, 1abc.pdb.gz, 1abc.ent, 1abc.ent.gz, pdb1abc.ent and
 * pdb1abc.ent.gz, trying the identifier as given, then lower case, then
 * upper case.
 */
class DirectorySource : public StructureSource {
public:
    explicit DirectorySource(std::vector<std::string> directories);

    std::shared_ptr<Structure> fetch(const std::string& identifier) override;

    /// Path of the first matching file, or an empty string.
    std::string find_file(const std::string& identifier) const;

    const std::vector<std::string>& directories() const { return directories_; }

private:
    std::vector<std::string> directories_;
};

}  // namespace io
}  // namespace confens
