#include "align_export.h"

#include "confens/errors/confens_error.h"
#include "confens/errors/validators.h"
#include "confens/io/pdb_writer.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <memory>

namespace fs = std::filesystem;

namespace confens {
namespace ensemble {

namespace {

constexpr const char* kProgressKey = "align_pdb_ensemble";

struct SourceEntry {
    std::shared_ptr<io::Structure> pristine;  // as fetched, never modified
    io::Structure working;                // transformed models replaced in place
    bool touched = false;
    bool unreadable = false;
};

std::vector<std::optional<std::string>> align_conformations(
    const std::vector<Conformation>& conformations, io::StructureSource& source,
    const AlignExportConfig& config, common::Observer& observer) {
    for (const auto& conf : conformations) {
        if (!conf.ensemble().has_presence_weights()) {
            throw errors::PreconditionError("align_pdb_ensemble", "a PDB ensemble");
        }
        if (!conf.transformation()) {
            throw errors::ValidationError(
                "transformations are not calculated for conformation '" + conf.label() + "'",
                "Call superpose or iterpose first");
        }
    }
    validation::validate_positive(config.id_length, "id_length");
    validation::validate_directory_exists(config.outdir);

    std::map<std::string, SourceEntry> entries;
    std::vector<std::string> write_order;
    std::vector<std::optional<std::string>> output;
    output.reserve(conformations.size());

    const int total = static_cast<int>(conformations.size());
    for (int c = 0; c < total; c++) {
        const Conformation& conf = conformations[c];
        const std::string& label = conf.label();
        const std::string id = label.substr(0, static_cast<size_t>(config.id_length));

        observer.progress(c, total, "Aligning " + label, kProgressKey);

        auto it = entries.find(id);
        if (it == entries.end()) {
            SourceEntry entry;
            try {
                entry.pristine = source.fetch(id);
            } catch (const errors::ConfensError& e) {
                observer.warning("Structure file for " + id + " could not be read: " + e.what());
                entry.unreadable = true;
            }
            if (entry.pristine) {
                entry.working = *entry.pristine;
            }
            it = entries.emplace(id, std::move(entry)).first;
        }
        SourceEntry& entry = it->second;

        if (!entry.pristine) {
            if (!entry.unreadable) {
                observer.warning("Structure file for conformation " + label + " is not found.");
            }
            output.emplace_back(std::nullopt);
            continue;
        }
        observer.info("Parsing structure " + id + " for conformation " + label + ".");

        int state = entry.pristine->active_coordset();
        std::optional<int> model = model_from_label(label, config.min_model_offset);
        if (model) {
            observer.info("Applying transformation to model " + std::to_string(*model) + ".");
            state = *model - 1;
        }
        if (state < 0 || state >= entry.pristine->num_coordsets()) {
            observer.warning("Model number " + std::to_string(model.value_or(state + 1)) +
                             " for " + id + " is out of range.");
            output.emplace_back(std::nullopt);
            continue;
        }

        std::vector<float> coords = entry.pristine->coords(state);
        conf.transformation()->apply(coords);
        entry.working.set_coords(std::move(coords), state);

        if (!entry.touched) {
            entry.touched = true;
            write_order.push_back(id);
        }

        std::string filename = id + config.suffix + ".pdb" + (config.gzip ? ".gz" : "");
        output.emplace_back((fs::path(config.outdir) / filename).lexically_normal().string());
    }
    observer.progress(total, total, "Aligned " + std::to_string(total) + " conformations",
                      kProgressKey);
    observer.progress_done(kProgressKey);

    // Each identifier is written once, after all its models are transformed
    for (const auto& id : write_order) {
        std::string filename = id + config.suffix + ".pdb" + (config.gzip ? ".gz" : "");
        io::write_pdb_file((fs::path(config.outdir) / filename).string(), entries.at(id).working);
    }

    return output;
}

}  // namespace

std::optional<int> model_from_label(const std::string& label, int min_model_offset) {
    size_t pos = label.rfind('m');
    if (pos == std::string::npos || static_cast<int>(pos) <= min_model_offset) {
        return std::nullopt;
    }
    std::string digits = label.substr(pos + 1);
    if (digits.empty() || digits.size() > 9 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoi(digits);
}

std::vector<std::optional<std::string>> align_pdb_ensemble(const Ensemble& ensemble,
                                                           io::StructureSource& source,
                                                           const AlignExportConfig& config,
                                                           common::Observer& observer) {
    if (!ensemble.has_presence_weights()) {
        throw errors::PreconditionError("align_pdb_ensemble", "a PDB ensemble");
    }
    std::vector<Conformation> conformations;
    conformations.reserve(ensemble.num_conformations());
    for (int i = 0; i < ensemble.num_conformations(); i++) {
        conformations.push_back(ensemble.conformation(i));
    }
    return align_conformations(conformations, source, config, observer);
}

std::optional<std::string> align_pdb_ensemble(const Conformation& conformation,
                                              io::StructureSource& source,
                                              const AlignExportConfig& config,
                                              common::Observer& observer) {
    return align_conformations({conformation}, source, config, observer).front();
}

}  // namespace ensemble
}  // namespace confens
