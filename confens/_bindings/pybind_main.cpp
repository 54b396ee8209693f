/**
 * PyBind11 entry point for confens.
 *
 * Exposes the structure and ensemble types, the builder, occupancy/trim,
 * refinement, alignment export and the ensemble archive. Coordinates cross
 * the boundary as float32 NumPy arrays.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "numpy_utils.h"  // Local to _bindings directory
#include "confens/common/observer.h"
#include "confens/ensemble/align_export.h"
#include "confens/ensemble/builder.h"
#include "confens/ensemble/ensemble.h"
#include "confens/ensemble/occupancy.h"
#include "confens/ensemble/refine.h"
#include "confens/errors/confens_error.h"
#include "confens/errors/error_categories.h"
#include "confens/io/ensemble_archive.h"
#include "confens/io/pdb_parser.h"
#include "confens/io/pdb_writer.h"
#include "confens/io/structure_source.h"
#include "confens/mapping/chain_mapper.h"

namespace py = pybind11;

using confens::ensemble::Ensemble;
using confens::ensemble::EnsembleKind;
using confens::io::Structure;
using confens::bindings::make_array_from_vector;

namespace {

using FloatArray = py::array_t<float, py::array::c_style | py::array::forcecast>;

EnsembleKind ParseKind(const std::string& kind) {
    if (kind == "PDB") return EnsembleKind::PDB;
    if (kind == "Plain") return EnsembleKind::Plain;
    throw confens::errors::ValidationError("kind", kind, "one of: PDB, Plain");
}

// Observer for Python callers: console output unless verbose is off
std::unique_ptr<confens::common::Observer> MakeObserver(bool verbose) {
    if (verbose) {
        return std::make_unique<confens::common::ConsoleObserver>(false);
    }
    return std::make_unique<confens::common::NullObserver>();
}

confens::ensemble::ConformationRef ToConformationRef(const py::handle& obj) {
    if (py::isinstance<py::int_>(obj)) {
        return confens::ensemble::ConformationRef::at(obj.cast<int>());
    }
    if (py::isinstance<py::str>(obj)) {
        return confens::ensemble::ConformationRef::by_label(obj.cast<std::string>());
    }
    throw confens::errors::ValidationError("conformation", std::string(py::str(obj)),
                                           "an index (int) or a label (str)");
}

py::array_t<float> CoordsArray(const std::vector<float>& coords) {
    return make_array_from_vector<float>({coords.size() / 3, 3}, coords);
}

py::array_t<float> StructureCoords(const Structure& s, int coordset) {
    return CoordsArray(s.coords(coordset));
}

py::array_t<float> EnsembleConfs(const Ensemble& ens, bool selected) {
    size_t M = static_cast<size_t>(ens.num_conformations());
    size_t n = static_cast<size_t>(ens.num_atoms(selected));
    return make_array_from_vector<float>({M, n, 3}, ens.confs(selected));
}

py::object EnsembleWeights(const Ensemble& ens, bool selected) {
    if (!ens.has_weights()) {
        return py::none();
    }
    size_t n = static_cast<size_t>(ens.num_atoms(selected));
    if (ens.has_presence_weights()) {
        size_t M = static_cast<size_t>(ens.num_conformations());
        return make_array_from_vector<float>({M, n}, ens.weights(selected));
    }
    return make_array_from_vector<float>({n}, ens.weights(selected));
}

py::object EnsembleTransformation(const Ensemble& ens, int index) {
    const auto& t = ens.transformation(index);
    if (!t) {
        return py::none();
    }
    auto matrix = t->matrix();
    return make_array_from_vector<float>({4, 4}, std::vector<float>(matrix.begin(), matrix.end()));
}

void EnsembleAddConformation(Ensemble& ens, const FloatArray& coords,
                             std::optional<FloatArray> weights, const std::string& label,
                             const std::string& msa_row) {
    confens::bindings::validate_coords_array(coords, "coords");
    std::vector<float> w;
    if (weights) {
        confens::bindings::validate_1d_array(*weights, static_cast<size_t>(coords.shape(0)),
                                             "weights");
        w = confens::bindings::to_vector<float>(*weights);
    }
    ens.add_conformation(confens::bindings::to_vector<float>(coords), std::move(w), label,
                         msa_row);
}

void EnsembleSetCoords(Ensemble& ens, const FloatArray& coords) {
    confens::bindings::validate_coords_array(coords, "coords");
    ens.set_coords(confens::bindings::to_vector<float>(coords));
}

py::dict EnsembleData(const Ensemble& ens) {
    py::dict out;
    for (const auto& entry : *ens.data()) {
        out[py::str(entry.first)] =
            make_array_from_vector<float>({entry.second.size()}, entry.second);
    }
    return out;
}

py::tuple BuildPdbEnsemble(const std::vector<std::optional<Structure>>& structures,
                           const py::object& reference, const std::string& title,
                           const std::vector<std::string>& labels, const std::string& subset,
                           bool degeneracy, std::optional<float> occupancy,
                           const std::string& superpose, float tolerance, int max_iterations,
                           float seqid, float overlap, bool verbose) {
    std::vector<std::shared_ptr<const Structure>> inputs;
    inputs.reserve(structures.size());
    for (const auto& s : structures) {
        inputs.push_back(s ? std::make_shared<const Structure>(*s) : nullptr);
    }

    confens::ensemble::ReferenceSpec spec = confens::ensemble::ReferenceSpec::first();
    if (reference.is_none()) {
        spec = confens::ensemble::ReferenceSpec::first();
    } else if (py::isinstance<py::int_>(reference)) {
        spec = confens::ensemble::ReferenceSpec::at(reference.cast<int>());
    } else if (py::isinstance<Structure>(reference)) {
        spec = confens::ensemble::ReferenceSpec::from_structure(
            std::make_shared<const Structure>(reference.cast<const Structure&>()));
    } else if (py::isinstance<Ensemble>(reference)) {
        spec = confens::ensemble::ReferenceSpec::extend(reference.cast<const Ensemble&>());
    } else {
        throw confens::errors::ValidationError("reference", std::string(py::str(reference)),
                                               "None, an index, a Structure or an Ensemble");
    }

    confens::ensemble::BuildConfig config;
    config.title = title;
    config.labels = labels;
    config.subset = subset;
    config.degeneracy = degeneracy;
    config.occupancy = occupancy;
    if (superpose == "iter") {
        config.superpose = confens::ensemble::SuperposeMode::Iterative;
    } else if (superpose == "once") {
        config.superpose = confens::ensemble::SuperposeMode::Once;
    } else {
        throw confens::errors::ValidationError("superpose", superpose, "one of: iter, once");
    }
    config.tolerance = tolerance;
    config.max_iterations = max_iterations;

    confens::mapping::ChainMapperConfig mapper_config;
    mapper_config.seqid = seqid;
    mapper_config.overlap = overlap;
    confens::mapping::ChainMapper mapper(mapper_config);

    auto observer = MakeObserver(verbose);
    std::vector<std::string> unmapped;
    Ensemble result =
        confens::ensemble::build_pdb_ensemble(inputs, spec, config, mapper, *observer, &unmapped);
    return py::make_tuple(std::move(result), unmapped);
}

Ensemble RefineEnsemble(const Ensemble& ens, std::optional<float> lower,
                        std::optional<float> upper, const py::object& reference,
                        const py::list& protected_confs, bool verbose) {
    confens::ensemble::RefineConfig config;
    config.lower = lower;
    config.upper = upper;
    config.reference = ToConformationRef(reference);
    for (const auto& item : protected_confs) {
        config.protected_confs.push_back(ToConformationRef(item));
    }
    auto observer = MakeObserver(verbose);
    return confens::ensemble::refine_ensemble(ens, config, *observer);
}

std::vector<std::optional<std::string>> AlignPdbEnsemble(const Ensemble& ens,
                                                         const std::vector<std::string>& pdb_dirs,
                                                         const std::string& suffix,
                                                         const std::string& outdir, bool gzip,
                                                         bool verbose) {
    confens::io::DirectorySource source(pdb_dirs);
    confens::ensemble::AlignExportConfig config;
    config.suffix = suffix;
    config.outdir = outdir;
    config.gzip = gzip;
    auto observer = MakeObserver(verbose);
    return confens::ensemble::align_pdb_ensemble(ens, source, config, *observer);
}

}  // namespace

PYBIND11_MODULE(_confens_cpp, m) {
    m.doc() = "confens - structural ensemble assembly and curation";
    m.attr("__version__") = "0.1.0";

    // ----------------------- Custom Exception Types -----------------------
    static py::exception<confens::errors::ConfensError> exc_confens(m, "ConfensError");
    static py::exception<confens::errors::FileNotFoundError> exc_file_not_found(m, "FileNotFoundError", PyExc_FileNotFoundError);
    static py::exception<confens::errors::FileWriteError> exc_file_write(m, "FileWriteError", PyExc_OSError);
    static py::exception<confens::errors::ValidationError> exc_validation(m, "ValidationError", PyExc_ValueError);
    static py::exception<confens::errors::FormatError> exc_format(m, "FormatError", PyExc_ValueError);
    static py::exception<confens::errors::DimensionError> exc_dimension(m, "DimensionError", PyExc_ValueError);
    static py::exception<confens::errors::PreconditionError> exc_precondition(m, "PreconditionError", PyExc_ValueError);
    static py::exception<confens::errors::LookupError> exc_lookup(m, "LookupError", PyExc_KeyError);
    static py::exception<confens::errors::AlgorithmError> exc_algorithm(m, "AlgorithmError", PyExc_RuntimeError);

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const confens::errors::FileNotFoundError& e) {
            py::set_error(exc_file_not_found, e.formatted().c_str());
        } catch (const confens::errors::FileWriteError& e) {
            py::set_error(exc_file_write, e.formatted().c_str());
        } catch (const confens::errors::ValidationError& e) {
            py::set_error(exc_validation, e.formatted().c_str());
        } catch (const confens::errors::FormatError& e) {
            py::set_error(exc_format, e.formatted().c_str());
        } catch (const confens::errors::DimensionError& e) {
            py::set_error(exc_dimension, e.formatted().c_str());
        } catch (const confens::errors::PreconditionError& e) {
            py::set_error(exc_precondition, e.formatted().c_str());
        } catch (const confens::errors::LookupError& e) {
            py::set_error(exc_lookup, e.formatted().c_str());
        } catch (const confens::errors::AlgorithmError& e) {
            py::set_error(exc_algorithm, e.formatted().c_str());
        } catch (const confens::errors::ConfensError& e) {
            py::set_error(exc_confens, e.formatted().c_str());
        }
    });

    py::enum_<confens::errors::ErrorCategory>(m, "ErrorCategory")
        .value("FileIO", confens::errors::ErrorCategory::FileIO)
        .value("Validation", confens::errors::ErrorCategory::Validation)
        .value("Format", confens::errors::ErrorCategory::Format)
        .value("Algorithm", confens::errors::ErrorCategory::Algorithm)
        .value("Precondition", confens::errors::ErrorCategory::Precondition)
        .value("Lookup", confens::errors::ErrorCategory::Lookup)
        .export_values();

    // ----------------------- Structure -----------------------
    py::class_<Structure>(m, "Structure")
        .def_property("title", &Structure::title, &Structure::set_title)
        .def_property_readonly("num_atoms", &Structure::num_atoms)
        .def_property_readonly("num_coordsets", &Structure::num_coordsets)
        .def_property("active_coordset", &Structure::active_coordset,
                      &Structure::set_active_coordset)
        .def("coords", &StructureCoords, py::arg("coordset") = -1,
             "Coordinates of a coordinate set as (N, 3); -1 selects the active one")
        .def("select", &Structure::select, py::arg("subset"),
             "New structure holding the atoms matching a selection keyword")
        .def("chain_ids", &Structure::chain_ids)
        .def("write", [](const Structure& s, const std::string& path, int coordset) {
                 confens::io::write_pdb_file(path, s, coordset);
             },
             py::arg("path"), py::arg("coordset") = -1,
             "Write PDB (gzip-compressed when path ends in .gz)");

    m.def("parse_pdb",
          [](const std::string& path) { return confens::io::PDBParser().parse_file(path); },
          py::arg("path"), "Parse a PDB file (.pdb, .ent, optionally .gz)");

    // ----------------------- Ensemble -----------------------
    py::class_<Ensemble>(m, "Ensemble")
        .def(py::init([](const std::string& title, const std::string& kind) {
                 return Ensemble(title, ParseKind(kind));
             }),
             py::arg("title") = "Unknown", py::arg("kind") = "PDB")
        .def_property("title", &Ensemble::title, &Ensemble::set_title)
        .def_property_readonly("kind", [](const Ensemble& e) {
            return std::string(confens::ensemble::kind_to_string(e.kind()));
        })
        .def("__len__", &Ensemble::num_conformations)
        .def("num_atoms", &Ensemble::num_atoms, py::arg("selected") = true)
        .def("num_conformations", &Ensemble::num_conformations)
        .def("set_atoms", &Ensemble::set_atoms, py::arg("atoms"))
        .def("atoms", &Ensemble::atoms, py::arg("selected") = true)
        .def("set_coords", &EnsembleSetCoords, py::arg("coords"))
        .def("coords", [](const Ensemble& e, bool selected) -> py::object {
                 if (!e.has_coords()) return py::none();
                 return CoordsArray(e.coords(selected));
             },
             py::arg("selected") = true)
        .def("add_conformation", &EnsembleAddConformation, py::arg("coords"),
             py::arg("weights") = py::none(), py::arg("label") = "", py::arg("msa_row") = "")
        .def("confs", &EnsembleConfs, py::arg("selected") = true)
        .def("weights", &EnsembleWeights, py::arg("selected") = true)
        .def("set_weights", [](Ensemble& e, const FloatArray& w) {
            e.set_weights(confens::bindings::to_vector<float>(w));
        }, py::arg("weights"))
        .def_property_readonly("labels", &Ensemble::labels)
        .def("find_label", &Ensemble::find_label, py::arg("label"))
        .def("transformation", &EnsembleTransformation, py::arg("index"),
             "4x4 row-major transformation or None")
        .def_property_readonly("msa", &Ensemble::msa_rows)
        .def("indices", &Ensemble::indices)
        .def("select", &Ensemble::select, py::arg("positions"))
        .def("set_indices", &Ensemble::set_indices, py::arg("indices"))
        .def("clear_selection", &Ensemble::clear_selection)
        .def("subset", &Ensemble::subset, py::arg("indices"))
        .def_property_readonly("data", &EnsembleData)
        .def("set_data", &Ensemble::set_data, py::arg("key"), py::arg("values"))
        .def("rmsds", [](const Ensemble& e, bool selected) {
                 std::vector<float> r = e.rmsds(selected);
                 return make_array_from_vector<float>({r.size()}, r);
             },
             py::arg("selected") = true)
        .def("pairwise_rmsds", [](const Ensemble& e, bool selected) {
                 size_t M = static_cast<size_t>(e.num_conformations());
                 return make_array_from_vector<float>({M, M}, e.pairwise_rmsds(selected));
             },
             py::arg("selected") = true)
        .def("mean_coords", [](const Ensemble& e, bool selected) {
                 return CoordsArray(e.mean_coords(selected));
             },
             py::arg("selected") = true)
        .def("superpose", &Ensemble::superpose)
        .def("iterpose", [](Ensemble& e, float tol, int max_iterations, bool verbose) {
                 auto observer = MakeObserver(verbose);
                 return e.iterpose(tol, max_iterations, *observer);
             },
             py::arg("tolerance") = 1e-4f, py::arg("max_iterations") = 100,
             py::arg("verbose") = false);

    // ----------------------- Pipeline -----------------------
    m.def("build_pdb_ensemble", &BuildPdbEnsemble,
          py::arg("structures"),
          py::arg("reference") = py::none(),
          py::arg("title") = "Unknown",
          py::arg("labels") = std::vector<std::string>(),
          py::arg("subset") = "calpha",
          py::arg("degeneracy") = true,
          py::arg("occupancy") = py::none(),
          py::arg("superpose") = "iter",
          py::arg("tolerance") = 1e-4f,
          py::arg("max_iterations") = 100,
          py::arg("seqid") = 90.0f,
          py::arg("overlap") = 70.0f,
          py::arg("verbose") = false,
          "Build an ensemble; returns (ensemble, unmapped_labels). Structures may be None.");

    m.def("calc_occupancies", [](const Ensemble& e, bool normed) {
              std::vector<float> occ = confens::ensemble::calc_occupancies(e, normed);
              return make_array_from_vector<float>({occ.size()}, occ);
          },
          py::arg("ensemble"), py::arg("normed") = false);

    m.def("trim_pdb_ensemble", [](const Ensemble& e, std::optional<float> occupancy, bool hard) {
              confens::ensemble::TrimConfig config;
              config.occupancy = occupancy;
              config.hard = hard;
              return confens::ensemble::trim_pdb_ensemble(e, config);
          },
          py::arg("ensemble"), py::arg("occupancy") = py::none(), py::arg("hard") = false);

    m.def("refine_ensemble", &RefineEnsemble,
          py::arg("ensemble"),
          py::arg("lower") = 0.5f,
          py::arg("upper") = 10.0f,
          py::arg("reference") = 0,
          py::arg("protected") = py::list(),
          py::arg("verbose") = false,
          "Remove conformations violating pairwise RMSD bounds; None disables a bound.");

    m.def("align_pdb_ensemble", &AlignPdbEnsemble,
          py::arg("ensemble"),
          py::arg("pdb_dirs") = std::vector<std::string>{"."},
          py::arg("suffix") = "_aligned",
          py::arg("outdir") = ".",
          py::arg("gzip") = false,
          py::arg("verbose") = false);

    // ----------------------- Archive -----------------------
    m.def("save_ensemble", &confens::io::save_ensemble, py::arg("ensemble"),
          py::arg("filename") = "");
    m.def("load_ensemble", &confens::io::load_ensemble, py::arg("filename"));
}
