/**
 * Alignment export: replays the stored transformations of an ensemble onto
 * the source structure files and writes the aligned structures.
 *
 * The first id_length characters of a conformation label identify the source
 * structure. A label ending in "m<digits>", with the 'm' past
 * min_model_offset, designates a 1-based model; otherwise the structure's
 * active model is used. Conformations that share an identifier accumulate
 * into one output file, written once at the end as
 * <outdir>/<identifier><suffix>.pdb[.gz].
 */

#pragma once

#include "ensemble.h"

#include "confens/common/observer.h"
#include "confens/io/structure_source.h"

#include <optional>
#include <string>
#include <vector>

namespace confens {
namespace ensemble {

/**
 * Configuration for align_pdb_ensemble.
 */
struct AlignExportConfig {
    std::string suffix = "_aligned";
    std::string outdir = ".";
    bool gzip = false;
    int id_length = 4;         // Label prefix naming the source structure
    int min_model_offset = 3;  // The model 'm' must sit after this label position

    AlignExportConfig() = default;
};

/**
 * Align the source structures of every conformation.
 *
 * A missing or unreadable source structure, or an out-of-range model, yields
 * a warning and a null entry; processing continues with the next conformation.
 *
 * @return Output path per conformation, in input order (paths repeat when
 *         several models of one structure are aligned)
 * @throws PreconditionError if the ensemble has no presence weights
 * @throws ValidationError if any conformation lacks a transformation
 * @throws FileNotFoundError if outdir does not exist
 */
std::vector<std::optional<std::string>> align_pdb_ensemble(
    const Ensemble& ensemble, io::StructureSource& source,
    const AlignExportConfig& config = AlignExportConfig(),
    common::Observer& observer = common::null_observer());

/**
 * Align the source structure of a single conformation.
 */
std::optional<std::string> align_pdb_ensemble(const Conformation& conformation,
                                              io::StructureSource& source,
                                              const AlignExportConfig& config = AlignExportConfig(),
                                              common::Observer& observer = common::null_observer());

/**
 * Model designated by a label: the 1-based number after the last 'm' when
 * that position exceeds min_model_offset and the rest is all digits.
 */
std::optional<int> model_from_label(const std::string& label, int min_model_offset = 3);

}  // namespace ensemble
}  // namespace confens
