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

#include <level_hierarchy.h>
#include <utils.h>

namespace dealii::CutMG
{
  IndexSet
  LevelHierarchy::validated_band(const IndexSet &active_dofs,
                                 const IndexSet &band_dofs)
  {
    // a default-constructed IndexSet stands for an empty band
    if (band_dofs.size() == 0)
      return IndexSet(active_dofs.size());

    AssertThrow(band_dofs.size() == active_dofs.size(),
                ExcInconsistentDimension(band_dofs.size(), active_dofs.size()));

    IndexSet outside_band = band_dofs;
    outside_band.subtract_set(active_dofs);
    AssertThrow(outside_band.is_empty(),
                ExcInvalidBandSelection(
                  std::to_string(outside_band.n_elements()) +
                  " band DoFs are not active on this level."));

    IndexSet band = band_dofs;
    band.compress();
    return band;
  }



  void
  LevelHierarchy::initialize(const SparseMatrix<double> &coarse_matrix,
                             const IndexSet             &coarse_active_dofs,
                             const IndexSet             &coarse_band_dofs,
                             const unsigned int          geometry_version)
  {
    levels.clear();
    levels.push_back(std::make_unique<Level>());
    levels.back()->index = 0;
    rebuild_level(0,
                  coarse_matrix,
                  coarse_active_dofs,
                  coarse_band_dofs,
                  geometry_version);
  }



  void
  LevelHierarchy::append_level(const SparseMatrix<double> &prolongation,
                               const IndexSet             &active_dofs)
  {
    AssertThrow(!levels.empty(),
                ExcMessage("The hierarchy must be initialized on the coarsest "
                           "level before finer levels can be appended."));

    const Level &coarse = *levels.back();
    AssertThrow(Utils::n_columns(prolongation) == coarse.n_active_dofs(),
                ExcInconsistentDimension(Utils::n_columns(prolongation),
                                         coarse.n_active_dofs()));
    AssertThrow(Utils::n_rows(prolongation) == active_dofs.n_elements(),
                ExcInconsistentDimension(Utils::n_rows(prolongation),
                                         active_dofs.n_elements()));

    auto level         = std::make_unique<Level>();
    level->index       = levels.size();
    level->active_dofs = active_dofs;
    level->active_dofs.compress();
    level->band_dofs = IndexSet(active_dofs.size());
    Utils::copy_sparse_matrix(prolongation,
                              level->prolongation_sparsity_pattern,
                              level->prolongation);

    levels.push_back(std::move(level));
  }



  void
  LevelHierarchy::rebuild_level(const unsigned int          level_index,
                                const SparseMatrix<double> &matrix,
                                const IndexSet             &active_dofs,
                                const IndexSet             &band_dofs,
                                const unsigned int          geometry_version)
  {
    AssertThrow(level_index < levels.size(),
                ExcIndexRange(level_index, 0, levels.size()));
    AssertThrow(Utils::n_rows(matrix) == active_dofs.n_elements(),
                ExcInconsistentDimension(Utils::n_rows(matrix),
                                         active_dofs.n_elements()));
    AssertThrow(Utils::n_columns(matrix) == active_dofs.n_elements(),
                ExcInconsistentDimension(Utils::n_columns(matrix),
                                         active_dofs.n_elements()));

    // Validate before modifying anything, so that a failed rebuild leaves the
    // level untouched.
    IndexSet band = validated_band(active_dofs, band_dofs);

    Level &level      = *levels[level_index];
    level.active_dofs = active_dofs;
    level.active_dofs.compress();
    level.band_dofs = std::move(band);
    Utils::copy_sparse_matrix(matrix, level.sparsity_pattern, level.matrix);
    level.geometry_version = geometry_version;
  }



  void
  LevelHierarchy::set_prolongation(const unsigned int          level_index,
                                   const SparseMatrix<double> &prolongation)
  {
    AssertThrow(level_index > 0 && level_index < levels.size(),
                ExcIndexRange(level_index, 1, levels.size()));

    const Level &coarse = *levels[level_index - 1];
    Level       &fine   = *levels[level_index];
    AssertThrow(Utils::n_columns(prolongation) == coarse.n_active_dofs(),
                ExcInconsistentDimension(Utils::n_columns(prolongation),
                                         coarse.n_active_dofs()));
    AssertThrow(Utils::n_rows(prolongation) == fine.n_active_dofs(),
                ExcInconsistentDimension(Utils::n_rows(prolongation),
                                         fine.n_active_dofs()));

    Utils::copy_sparse_matrix(prolongation,
                              fine.prolongation_sparsity_pattern,
                              fine.prolongation);
  }



  void
  LevelHierarchy::check_consistency() const
  {
    AssertThrow(!levels.empty(), ExcNotInitialized());

    for (unsigned int l = 0; l < levels.size(); ++l)
      {
        const Level &level = *levels[l];
        AssertThrow(Utils::n_rows(level.matrix) == level.n_active_dofs(),
                    ExcInconsistentDimension(Utils::n_rows(level.matrix),
                                             level.n_active_dofs()));
        AssertThrow(Utils::n_columns(level.matrix) == level.n_active_dofs(),
                    ExcInconsistentDimension(Utils::n_columns(level.matrix),
                                             level.n_active_dofs()));

        if (l == 0)
          continue;

        const Level &coarse = *levels[l - 1];
        AssertThrow(Utils::n_rows(level.prolongation) == level.n_active_dofs(),
                    ExcInconsistentDimension(Utils::n_rows(level.prolongation),
                                             level.n_active_dofs()));
        AssertThrow(Utils::n_columns(level.prolongation) == coarse.n_active_dofs(),
                    ExcInconsistentDimension(Utils::n_columns(level.prolongation),
                                             coarse.n_active_dofs()));
      }
  }



  void
  LevelHierarchy::clear()
  {
    levels.clear();
  }
} // namespace dealii::CutMG
