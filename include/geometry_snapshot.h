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


#ifndef geometry_snapshot_h
#define geometry_snapshot_h

#include <deal.II/base/index_set.h>
#include <deal.II/base/types.h>

#include <deal.II/non_matching/mesh_classifier.h>

#include <vector>

namespace dealii::CutMG
{
  /**
   * Everything the multigrid hierarchy needs to know about one mesh level:
   * the size of the finite element space on that level, the DoFs of every
   * cell, and the location of every cell with respect to the zero level set.
   *
   * Cells are identified by their position in the two vectors, which must
   * have the same length.
   */
  struct LevelGeometry
  {
    types::global_dof_index n_dofs = 0;

    std::vector<std::vector<types::global_dof_index>> cell_dofs;

    std::vector<NonMatching::LocationToLevelSet> cell_locations;

    unsigned int
    n_cells() const
    {
      return cell_dofs.size();
    }
  };



  /**
   * Immutable view of the geometry at one point in time. Each refinement or
   * level-set update produces a new snapshot with a larger @p version, so
   * that a level of the hierarchy can record which geometry its matrix was
   * assembled from.
   */
  struct GeometrySnapshot
  {
    unsigned int version = 0;

    /**
     * One entry per mesh level, 0 being the coarsest.
     */
    std::vector<LevelGeometry> levels;

    unsigned int
    n_levels() const
    {
      return levels.size();
    }
  };



  /**
   * Classify cells from the values of the level set function at their
   * vertices: a cell is inside if all values are negative, outside if all
   * values are positive, and intersected otherwise. A cell without any vertex
   * value is left unassigned.
   */
  std::vector<NonMatching::LocationToLevelSet>
  classify_cells(const std::vector<std::vector<double>> &cell_level_set_values);



  /**
   * Return the DoFs of all cells of @p geometry whose location is one of
   * @p locations, as an IndexSet over the level finite element space.
   *
   * A typical use is the active set of a fictitious domain discretization,
   * i.e. the DoFs of all inside and intersected cells.
   */
  IndexSet
  extract_dofs_of_cells(
    const LevelGeometry                                &geometry,
    const std::vector<NonMatching::LocationToLevelSet> &locations);
} // namespace dealii::CutMG

#endif
