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


#ifndef hierarchy_updater_h
#define hierarchy_updater_h

#include <deal.II/base/index_set.h>
#include <deal.II/base/smartpointer.h>
#include <deal.II/base/subscriptor.h>

#include <deal.II/lac/sparse_matrix.h>
#include <deal.II/lac/sparsity_pattern.h>

#include <exceptions.h>
#include <formulation.h>
#include <geometry_snapshot.h>
#include <level_hierarchy.h>

#include <vector>

namespace dealii::CutMG
{
  /**
   * Interface to the code that discretizes the problem on one mesh level.
   * All index sets and matrices refer to the full finite element space of the
   * level, i.e. to `snapshot.levels[level].n_dofs` DoFs.
   */
  class AssemblyService : public Subscriptor
  {
  public:
    virtual ~AssemblyService() = default;

    /**
     * DoFs of @p level that carry unknowns for the geometry of @p snapshot.
     */
    virtual IndexSet
    active_dofs(const GeometrySnapshot &snapshot,
                const unsigned int      level) const = 0;

    /**
     * Assemble the system matrix of @p level. The matrix is square with
     * `snapshot.levels[level].n_dofs` rows; rows of inactive DoFs are
     * ignored by the caller. Both @p sparsity and @p matrix are overwritten.
     */
    virtual void
    assemble_matrix(const GeometrySnapshot &snapshot,
                    const unsigned int      level,
                    const Formulation      &formulation,
                    SparsityPattern        &sparsity,
                    SparseMatrix<double>   &matrix) const = 0;
  };



  /**
   * Interface to the code that knows how to interpolate finite element
   * functions from one mesh level to the next finer one.
   */
  class ProlongationProvider : public Subscriptor
  {
  public:
    virtual ~ProlongationProvider() = default;

    /**
     * Fill the interpolation matrix from level `to_level - 1` to @p to_level,
     * with as many rows as DoFs on @p to_level and as many columns as DoFs on
     * the coarser level (full spaces).
     */
    virtual void
    fill_prolongation(const GeometrySnapshot &snapshot,
                      const unsigned int      to_level,
                      SparsityPattern        &sparsity,
                      SparseMatrix<double>   &matrix) const = 0;
  };



  /**
   * What happens to the coarse level matrices when the geometry changes.
   */
  enum class CoarseOperatorPolicy
  {
    /**
     * Coarse levels keep the operator they were built with. Only the finest
     * level follows the geometry.
     */
    keep_fixed,
    /**
     * Every level whose matrix was assembled for an older geometry version is
     * assembled again.
     */
    reassemble_on_geometry_change
  };



  /**
   * Keeps a LevelHierarchy in sync with the mesh and the geometry: after each
   * refinement it derives the active DoFs and the interface band of the new
   * level, has its matrix and the prolongation from the previous level
   * assembled by the injected services, and appends the level. After a change
   * of the level set, it refreshes the affected levels according to the
   * CoarseOperatorPolicy.
   *
   * Matrices delivered by the services act on full level spaces and are
   * restricted to the active DoFs here.
   */
  class HierarchyUpdater
  {
  public:
    struct AdditionalData
    {
      AdditionalData(
        const unsigned int         n_band_layers = 0,
        const CoarseOperatorPolicy policy = CoarseOperatorPolicy::keep_fixed,
        const Formulation         &formulation = PenaltyFormulation());

      /**
       * Number of cell layers the interface band is extended by, see
       * select_band().
       */
      unsigned int n_band_layers;

      CoarseOperatorPolicy policy;

      Formulation formulation;
    };

    HierarchyUpdater(LevelHierarchy             &hierarchy,
                     const AssemblyService      &assembly,
                     const ProlongationProvider &prolongation,
                     const AdditionalData       &data = AdditionalData());

    /**
     * Discard the content of the hierarchy and build it from @p snapshot:
     * level 0 first, then one level per further level of the snapshot, as if
     * the mesh had been refined that many times.
     */
    void
    initialize(const GeometrySnapshot &snapshot);

    /**
     * The mesh has been refined once: @p snapshot must have exactly one level
     * more than the hierarchy. The new finest level is assembled and appended.
     */
    void
    on_refine(const GeometrySnapshot &snapshot);

    /**
     * The level set has changed on an unchanged mesh: @p snapshot must have
     * as many levels as the hierarchy. The finest level is always rebuilt,
     * the coarser ones according to the policy. Prolongations touching a
     * rebuilt level are reassembled.
     */
    void
    on_geometry_change(const GeometrySnapshot &snapshot);

    const AdditionalData &
    get_additional_data() const;

  private:
    /**
     * Active DoFs, band and compressed matrix of one level.
     */
    struct AssembledLevel
    {
      IndexSet             active_dofs;
      IndexSet             band_dofs;
      SparsityPattern      sparsity_pattern;
      SparseMatrix<double> matrix;
    };

    void
    assemble_level(const GeometrySnapshot &snapshot,
                   const unsigned int      level,
                   AssembledLevel         &assembled) const;

    /**
     * The prolongation into @p to_level restricted to the active DoFs stored
     * in the hierarchy on both levels, or to @p fine_active_dofs on the finer
     * one.
     */
    void
    assemble_prolongation(const GeometrySnapshot &snapshot,
                          const unsigned int      to_level,
                          const IndexSet         &fine_active_dofs,
                          SparsityPattern        &sparsity,
                          SparseMatrix<double>   &matrix) const;

    void
    append_level(const GeometrySnapshot &snapshot);

    void
    rebuild_level(const GeometrySnapshot &snapshot, const unsigned int level);

    /**
     * Rebuild the given levels, then reassemble every prolongation into or
     * out of one of them.
     */
    void
    rebuild_levels(const GeometrySnapshot          &snapshot,
                   const std::vector<unsigned int> &levels);

    SmartPointer<LevelHierarchy, HierarchyUpdater> hierarchy;

    SmartPointer<const AssemblyService, HierarchyUpdater> assembly;

    SmartPointer<const ProlongationProvider, HierarchyUpdater> prolongation;

    AdditionalData additional_data;
  };
} // namespace dealii::CutMG

#endif
