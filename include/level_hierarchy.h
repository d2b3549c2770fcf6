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


#ifndef level_hierarchy_h
#define level_hierarchy_h

#include <deal.II/base/index_set.h>
#include <deal.II/base/numbers.h>
#include <deal.II/base/subscriptor.h>

#include <deal.II/lac/sparse_matrix.h>
#include <deal.II/lac/sparsity_pattern.h>

#include <exceptions.h>

#include <memory>
#include <vector>

namespace dealii::CutMG
{
  /**
   * Data stored for one level of the multigrid hierarchy.
   *
   * The index sets live in the full finite element space of the level. All
   * matrices and vectors use the compressed numbering of the active DoFs, i.e.
   * the global DoF `i` has local index `active_dofs.index_within_set(i)`.
   */
  struct Level
  {
    Level() = default;

    /**
     * Ordinal of the level, 0 being the coarsest one.
     */
    unsigned int index = 0;

    IndexSet active_dofs;

    /**
     * Active DoFs whose support touches the interface. Always a subset of
     * @p active_dofs.
     */
    IndexSet band_dofs;

    SparsityPattern      sparsity_pattern;
    SparseMatrix<double> matrix;

    /**
     * Prolongation from level `index - 1` to this level: as many rows as
     * active DoFs here, as many columns as active DoFs on the coarser level.
     * Empty on level 0.
     */
    SparsityPattern      prolongation_sparsity_pattern;
    SparseMatrix<double> prolongation;

    /**
     * Version of the geometry snapshot @p matrix was assembled from.
     */
    unsigned int geometry_version = numbers::invalid_unsigned_int;

    types::global_dof_index
    n_active_dofs() const
    {
      return active_dofs.n_elements();
    }

    types::global_dof_index
    n_band_dofs() const
    {
      return band_dofs.n_elements();
    }
  };



  /**
   * Ordered sequence of Level objects from the coarsest (0) to the finest
   * mesh. The hierarchy grows by one level per refinement; existing levels are
   * modified only through rebuild_level() and set_prolongation().
   *
   * The class does not assemble anything: matrices and transfer operators are
   * provided by the caller (see HierarchyUpdater).
   */
  class LevelHierarchy : public Subscriptor
  {
  public:
    LevelHierarchy() = default;

    /**
     * Discard all levels and create level 0 from the given matrix, its active
     * DoFs and (optionally) its interface band. The matrix is copied.
     */
    void
    initialize(const SparseMatrix<double> &coarse_matrix,
               const IndexSet             &coarse_active_dofs,
               const IndexSet             &coarse_band_dofs = IndexSet(),
               const unsigned int geometry_version = numbers::invalid_unsigned_int);

    /**
     * Add a finer level with active DoFs @p active_dofs and an empty matrix.
     * The @p prolongation maps the active DoFs of the current finest level to
     * @p active_dofs. Use rebuild_level() to set the matrix and the band.
     */
    void
    append_level(const SparseMatrix<double> &prolongation,
                 const IndexSet             &active_dofs);

    /**
     * Replace matrix, active DoFs and band DoFs of level @p level in place.
     * An empty @p band_dofs (default-constructed IndexSet) means "no band".
     *
     * This does not touch the transfer operators: if the number of active DoFs
     * changes, the caller is responsible for calling set_prolongation() on the
     * affected levels.
     */
    void
    rebuild_level(const unsigned int          level,
                  const SparseMatrix<double> &matrix,
                  const IndexSet             &active_dofs,
                  const IndexSet             &band_dofs,
                  const unsigned int          geometry_version);

    /**
     * Replace the prolongation from level `level - 1` to level @p level.
     */
    void
    set_prolongation(const unsigned int          level,
                     const SparseMatrix<double> &prolongation);

    /**
     * Verify that every level matrix is square with as many rows as active
     * DoFs and that every prolongation connects the active spaces of
     * consecutive levels. Throws ExcInconsistentDimension otherwise.
     */
    void
    check_consistency() const;

    void
    clear();

    unsigned int
    n_levels() const;

    unsigned int
    min_level() const;

    unsigned int
    max_level() const;

    const Level &
    operator[](const unsigned int level) const;

  private:
    /**
     * Throw if @p band_dofs is not a subset of @p active_dofs.
     */
    static IndexSet
    validated_band(const IndexSet &active_dofs, const IndexSet &band_dofs);

    /**
     * Levels are stored through pointers since the matrices keep a pointer to
     * the sparsity pattern of the same Level object.
     */
    std::vector<std::unique_ptr<Level>> levels;
  };



  inline unsigned int
  LevelHierarchy::n_levels() const
  {
    return levels.size();
  }



  inline unsigned int
  LevelHierarchy::min_level() const
  {
    return 0;
  }



  inline unsigned int
  LevelHierarchy::max_level() const
  {
    Assert(!levels.empty(), ExcNotInitialized());
    return levels.size() - 1;
  }



  inline const Level &
  LevelHierarchy::operator[](const unsigned int level) const
  {
    AssertIndexRange(level, levels.size());
    return *levels[level];
  }
} // namespace dealii::CutMG

#endif
