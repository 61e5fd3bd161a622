/*
  This file is part of the tree-seq-lib coalescent tree sequence
  analysis software.
  Copyright (C) 2024 tree-seq-lib Developers.

  This program is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  This program is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "coalescence_record.hpp"
#include "constants.hpp"
#include "diff_iterator.hpp"
#include "errors.hpp"
#include "haplotype_generator.hpp"
#include "newick_generator.hpp"
#include "population_model.hpp"
#include "serialize_tree_sequence.hpp"
#include "simulation_parameters.hpp"
#include "sparse_tree_iterator.hpp"
#include "tree_seq_utils.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"

#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <array>
#include <sstream>
#include <vector>

namespace py = pybind11;
using std::vector;

PYBIND11_MODULE(tree_seq_lib_pybind, m) {
  py::register_exception<MalformedInputError>(m, "MalformedInputError", PyExc_ValueError);
  py::register_exception<IncompleteCoalescenceError>(m, "IncompleteCoalescenceError",
                                                     PyExc_RuntimeError);
  py::register_exception<UnterminatedAncestryError>(m, "UnterminatedAncestryError",
                                                    PyExc_RuntimeError);
  py::register_exception<CapacityExceededError>(m, "CapacityExceededError", PyExc_MemoryError);

  py::enum_<PopulationModelType>(m, "PopulationModelType")
      .value("constant", PopulationModelType::constant)
      .value("exponential", PopulationModelType::exponential);

  py::class_<PopulationModel>(m, "PopulationModel")
      .def_static("constant", &PopulationModel::constant, py::arg("start_time"),
                  py::arg("size") = 1.0)
      .def_static("exponential", &PopulationModel::exponential, py::arg("start_time"),
                  py::arg("alpha"))
      .def_readonly("type", &PopulationModel::type)
      .def_readonly("start_time", &PopulationModel::start_time)
      .def_readonly("size", &PopulationModel::size)
      .def_readonly("alpha", &PopulationModel::alpha)
      .def("__repr__", [](const PopulationModel& model) {
        std::ostringstream oss;
        oss << model;
        return oss.str();
      });

  py::class_<SimulationParameters>(m, "SimulationParameters")
      .def(py::init<>())
      .def_readwrite("sample_size", &SimulationParameters::sample_size)
      .def_readwrite("num_loci", &SimulationParameters::num_loci)
      .def_readwrite("scaled_recombination_rate", &SimulationParameters::scaled_recombination_rate)
      .def_readwrite("population_models", &SimulationParameters::population_models)
      .def_readwrite("random_seed", &SimulationParameters::random_seed);

  py::class_<EdgeRecord>(m, "EdgeRecord")
      .def_readonly("children", &EdgeRecord::children)
      .def_readonly("parent", &EdgeRecord::parent)
      .def_readonly("time", &EdgeRecord::time)
      .def("__repr__", [](const EdgeRecord& edge) {
        std::ostringstream oss;
        oss << edge;
        return oss.str();
      });

  py::class_<TreeDiff>(m, "TreeDiff")
      .def_readonly("length", &TreeDiff::length)
      .def_readonly("records_out", &TreeDiff::records_out)
      .def_readonly("records_in", &TreeDiff::records_in);

  py::class_<SparseTree>(m, "SparseTree")
      .def_readonly("length", &SparseTree::length)
      .def_readonly("parent", &SparseTree::parent)
      .def_readonly("time", &SparseTree::time)
      .def("root", &SparseTree::root)
      .def("mrca", &SparseTree::mrca, py::arg("u"), py::arg("v"))
      .def("tmrca", &SparseTree::tmrca, py::arg("u"), py::arg("v"));

  py::class_<DiffIterator>(m, "DiffIterator")
      .def("__iter__", [](DiffIterator& it) -> DiffIterator& { return it; })
      .def("__next__", [](DiffIterator& it) {
        auto diff = it.next();
        if (!diff) {
          throw py::stop_iteration();
        }
        return *diff;
      });

  py::class_<SparseTreeIterator>(m, "SparseTreeIterator")
      .def("__iter__", [](SparseTreeIterator& it) -> SparseTreeIterator& { return it; })
      .def("__next__", [](SparseTreeIterator& it) {
        auto tree = it.next();
        if (!tree) {
          throw py::stop_iteration();
        }
        return *tree;
      });

  py::class_<NewickGenerator>(m, "NewickGenerator")
      .def("__iter__", [](NewickGenerator& it) -> NewickGenerator& { return it; })
      .def("__next__", [](NewickGenerator& it) {
        auto tree = it.next();
        if (!tree) {
          throw py::stop_iteration();
        }
        return *tree;
      });

  py::class_<TreeSequence>(m, "TreeSequence")
      .def(py::init<vector<locus_t>, vector<locus_t>, vector<locus_t>,
                    vector<std::array<node_id_t, 2>>, vector<node_id_t>, vector<ts_real_t>,
                    SimulationParameters>(),
           "Construct a tree sequence from record columns", py::arg("breakpoints"),
           py::arg("left"), py::arg("right"), py::arg("children"), py::arg("parent"),
           py::arg("time"), py::arg("parameters"))
      .def("get_sample_size", &TreeSequence::get_sample_size)
      .def("get_num_loci", &TreeSequence::get_num_loci)
      .def("get_num_records", &TreeSequence::get_num_records)
      .def("get_breakpoints", &TreeSequence::get_breakpoints)
      .def("get_parameters", &TreeSequence::get_parameters)
      .def("__str__",
           [](const TreeSequence& ts) {
             std::ostringstream oss;
             ts.print_state(oss);
             return oss.str();
           })
      // The iterators refer to the tree sequence, so keep it alive while they are in use
      .def("diffs", &TreeSequence::diffs, py::arg("all_breaks") = false, py::keep_alive<0, 1>())
      .def("sparse_trees", &TreeSequence::sparse_trees, py::keep_alive<0, 1>())
      .def("newick_trees", &TreeSequence::newick_trees,
           py::arg("precision") = tsl::default_newick_precision, py::arg("all_breaks") = false,
           py::keep_alive<0, 1>());

  py::class_<HaplotypeGenerator>(m, "HaplotypeGenerator")
      .def(py::init<const TreeSequence&, ts_real_t, unsigned, std::size_t>(),
           py::arg("tree_sequence"), py::arg("scaled_mutation_rate"), py::arg("random_seed") = 0,
           py::arg("max_segregating_sites") = 0)
      .def("get_random_seed", &HaplotypeGenerator::get_random_seed)
      .def("get_num_segregating_sites", &HaplotypeGenerator::get_num_segregating_sites)
      .def("get_haplotypes", &HaplotypeGenerator::get_haplotypes)
      .def("haplotype_strings", &HaplotypeGenerator::haplotype_strings)
      .def("get_mutation_nodes", &HaplotypeGenerator::get_mutation_nodes)
      .def("get_site_loci", &HaplotypeGenerator::get_site_loci);

  m.def("dump_tree_sequence", &ts_utils::dump_tree_sequence, py::arg("tree_sequence"),
        py::arg("file_name"), "Write a tree sequence to an HDF5 tree file.");
  m.def("load_tree_sequence", &ts_utils::load_tree_sequence, py::arg("file_name"),
        "Read a tree sequence from an HDF5 tree file.");
  m.def("validate_tree_sequence_file", &ts_utils::validate_tree_sequence_file,
        py::arg("file_name"), "Validates the integrity of a tree file.");
  m.def("write_newick_trees", &ts_utils::write_newick_trees, py::arg("tree_sequence"),
        py::arg("file_name") = "", py::arg("precision") = tsl::default_newick_precision,
        py::arg("all_breaks") = false, "Write one [length]newick line per interval");
  m.def("write_haplotypes", &ts_utils::write_haplotypes, py::arg("generator"),
        py::arg("num_loci"), py::arg("file_name") = "", "Write haplotypes in ms format");
  m.def("current_environment", []() { return ts_utils::current_environment().dump(); },
        "JSON description of the build environment");
}
