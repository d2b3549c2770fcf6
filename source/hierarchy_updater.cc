// -----------------------------------------------------------------------------
//
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception OR LGPL-2.1-or-later
// Copyright (C) XXXX - YYYY by the cutMG authors
//
// This file is part of the cutMG library.
//
// Detailed license information governing the source code
// can be found in LICENSE.md at the top level directory.
//
// -----------------------------------------------------------------------------

#include <deal.II/base/logstream.h>

#include <hierarchy_updater.h>
#include <interface_band.h>
#include <utils.h>

#include <algorithm>

namespace dealii::CutMG
{
  HierarchyUpdater::AdditionalData::AdditionalData(
    const unsigned int         n_band_layers,
    const CoarseOperatorPolicy policy,
    const Formulation         &formulation)
    : n_band_layers(n_band_layers)
    , policy(policy)
    , formulation(formulation)
  {}



  HierarchyUpdater::HierarchyUpdater(LevelHierarchy             &hierarchy,
                                     const AssemblyService      &assembly,
                                     const ProlongationProvider &prolongation,
                                     const AdditionalData       &data)
    : hierarchy(&hierarchy)
    , assembly(&assembly)
    , prolongation(&prolongation)
    , additional_data(data)
  {}



  void
  HierarchyUpdater::assemble_level(const GeometrySnapshot &snapshot,
                                   const unsigned int      level,
                                   AssembledLevel         &assembled) const
  {
    AssertIndexRange(level, snapshot.n_levels());
    const LevelGeometry &geometry = snapshot.levels[level];

    assembled.active_dofs = assembly->active_dofs(snapshot, level);
    AssertThrow(assembled.active_dofs.size() == geometry.n_dofs,
                ExcInconsistentDimension(assembled.active_dofs.size(),
                                         geometry.n_dofs));
    assembled.active_dofs.compress();

    SparsityPattern      full_sparsity;
    SparseMatrix<double> full_matrix;
    assembly->assemble_matrix(snapshot,
                              level,
                              additional_data.formulation,
                              full_sparsity,
                              full_matrix);

    Utils::extract_submatrix(full_matrix,
                             assembled.active_dofs,
                             assembled.active_dofs,
                             assembled.sparsity_pattern,
                             assembled.matrix);

    assembled.band_dofs = select_band(assembled.active_dofs,
                                      geometry,
                                      additional_data.n_band_layers);
  }



  void
  HierarchyUpdater::assemble_prolongation(const GeometrySnapshot &snapshot,
                                          const unsigned int      to_level,
                                          const IndexSet &fine_active_dofs,
                                          SparsityPattern      &sparsity,
                                          SparseMatrix<double> &matrix) const
  {
    Assert(to_level > 0, ExcInternalError());

    SparsityPattern      full_sparsity;
    SparseMatrix<double> full_prolongation;
    prolongation->fill_prolongation(snapshot,
                                    to_level,
                                    full_sparsity,
                                    full_prolongation);

    Utils::extract_submatrix(full_prolongation,
                             fine_active_dofs,
                             (*hierarchy)[to_level - 1].active_dofs,
                             sparsity,
                             matrix);
  }



  void
  HierarchyUpdater::initialize(const GeometrySnapshot &snapshot)
  {
    AssertThrow(snapshot.n_levels() > 0,
                ExcMessage("The geometry snapshot does not contain any level."));

    AssembledLevel coarse;
    assemble_level(snapshot, 0, coarse);
    hierarchy->initialize(coarse.matrix,
                          coarse.active_dofs,
                          coarse.band_dofs,
                          snapshot.version);

    {
      LogStream::Prefix prefix("HierarchyUpdater");
      deallog << "Level 0: " << coarse.active_dofs.n_elements() << " of "
              << coarse.active_dofs.size() << " DoFs active, "
              << coarse.band_dofs.n_elements() << " in the band" << std::endl;
    }

    while (hierarchy->n_levels() < snapshot.n_levels())
      append_level(snapshot);
  }



  void
  HierarchyUpdater::append_level(const GeometrySnapshot &snapshot)
  {
    const unsigned int level = hierarchy->n_levels();

    AssembledLevel fine;
    assemble_level(snapshot, level, fine);

    SparsityPattern      prolongation_sparsity;
    SparseMatrix<double> prolongation_matrix;
    assemble_prolongation(snapshot,
                          level,
                          fine.active_dofs,
                          prolongation_sparsity,
                          prolongation_matrix);

    hierarchy->append_level(prolongation_matrix, fine.active_dofs);
    hierarchy->rebuild_level(level,
                             fine.matrix,
                             fine.active_dofs,
                             fine.band_dofs,
                             snapshot.version);

    LogStream::Prefix prefix("HierarchyUpdater");
    deallog << "Level " << level << ": " << fine.active_dofs.n_elements()
            << " of " << fine.active_dofs.size() << " DoFs active, "
            << fine.band_dofs.n_elements() << " in the band" << std::endl;
  }



  void
  HierarchyUpdater::rebuild_level(const GeometrySnapshot &snapshot,
                                  const unsigned int      level)
  {
    AssembledLevel assembled;
    assemble_level(snapshot, level, assembled);
    hierarchy->rebuild_level(level,
                             assembled.matrix,
                             assembled.active_dofs,
                             assembled.band_dofs,
                             snapshot.version);

    LogStream::Prefix prefix("HierarchyUpdater");
    deallog << "Rebuilt level " << level << " for geometry version "
            << snapshot.version << ": " << assembled.active_dofs.n_elements()
            << " DoFs active, " << assembled.band_dofs.n_elements()
            << " in the band" << std::endl;
  }



  void
  HierarchyUpdater::rebuild_levels(const GeometrySnapshot          &snapshot,
                                   const std::vector<unsigned int> &levels)
  {
    if (levels.empty())
      return;

    // The number of active DoFs may change on every rebuilt level, so all
    // matrices are replaced before any prolongation is assembled.
    for (const unsigned int level : levels)
      rebuild_level(snapshot, level);

    for (unsigned int level = 1; level < hierarchy->n_levels(); ++level)
      {
        const bool touched =
          std::find(levels.begin(), levels.end(), level) != levels.end() ||
          std::find(levels.begin(), levels.end(), level - 1) != levels.end();
        if (!touched)
          continue;

        SparsityPattern      prolongation_sparsity;
        SparseMatrix<double> prolongation_matrix;
        assemble_prolongation(snapshot,
                              level,
                              (*hierarchy)[level].active_dofs,
                              prolongation_sparsity,
                              prolongation_matrix);
        hierarchy->set_prolongation(level, prolongation_matrix);
      }
  }



  void
  HierarchyUpdater::on_refine(const GeometrySnapshot &snapshot)
  {
    AssertThrow(hierarchy->n_levels() > 0,
                ExcMessage("The hierarchy has to be initialized before the "
                           "mesh can be refined."));
    AssertThrow(snapshot.n_levels() == hierarchy->n_levels() + 1,
                ExcInconsistentDimension(snapshot.n_levels(),
                                         hierarchy->n_levels() + 1));

    if (additional_data.policy ==
        CoarseOperatorPolicy::reassemble_on_geometry_change)
      {
        std::vector<unsigned int> stale_levels;
        for (unsigned int level = 0; level < hierarchy->n_levels(); ++level)
          if ((*hierarchy)[level].geometry_version != snapshot.version)
            stale_levels.push_back(level);
        rebuild_levels(snapshot, stale_levels);
      }

    append_level(snapshot);
  }



  void
  HierarchyUpdater::on_geometry_change(const GeometrySnapshot &snapshot)
  {
    AssertThrow(hierarchy->n_levels() > 0,
                ExcMessage("The hierarchy has to be initialized before the "
                           "geometry can be updated."));
    AssertThrow(snapshot.n_levels() == hierarchy->n_levels(),
                ExcInconsistentDimension(snapshot.n_levels(),
                                         hierarchy->n_levels()));

    const unsigned int max_level = hierarchy->max_level();

    std::vector<unsigned int> levels;
    if (additional_data.policy ==
        CoarseOperatorPolicy::reassemble_on_geometry_change)
      for (unsigned int level = 0; level < max_level; ++level)
        if ((*hierarchy)[level].geometry_version != snapshot.version)
          levels.push_back(level);
    levels.push_back(max_level);

    rebuild_levels(snapshot, levels);
  }



  const HierarchyUpdater::AdditionalData &
  HierarchyUpdater::get_additional_data() const
  {
    return additional_data;
  }
} // namespace dealii::CutMG
