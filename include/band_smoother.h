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


#ifndef band_smoother_h
#define band_smoother_h

#include <deal.II/base/mg_level_object.h>
#include <deal.II/base/smartpointer.h>

#include <deal.II/lac/sparse_direct.h>
#include <deal.II/lac/sparse_matrix.h>
#include <deal.II/lac/sparsity_pattern.h>
#include <deal.II/lac/vector.h>

#include <deal.II/multigrid/mg_base.h>

#include <exceptions.h>
#include <interface_band.h>
#include <level_hierarchy.h>

namespace dealii::CutMG
{
  /**
   * Multigrid smoother for unfitted interface discretizations. One step of the
   * smoother consists of
   *
   * 1. one symmetric Gauss-Seidel sweep on the system of all active DoFs of
   *    the level, followed by
   * 2. an exact correction on the interface band: with r = rhs - A u, the
   *    reduced system A_band d = R r is solved with a sparse direct solver and
   *    u is updated by R^T d.
   *
   * After each step the residual restricted to the band vanishes. A_band =
   * R A R^T is extracted from the level matrix and factorized in initialize().
   * On a level without band DoFs the second stage does nothing.
   */
  class InterfaceBandSmoother : public MGSmootherBase<Vector<double>>
  {
  public:
    struct AdditionalData
    {
      AdditionalData(const unsigned int n_steps                       = 1,
                     const double       relaxation                    = 1.,
                     const bool         skip_singular_band_correction = false);

      /**
       * Number of (relaxation, band correction) pairs per call of smooth().
       */
      unsigned int n_steps;

      /**
       * Relaxation factor of the SSOR sweep. 1 is symmetric Gauss-Seidel.
       */
      double relaxation;

      /**
       * If true, a level whose band system cannot be factorized runs without
       * the band correction instead of throwing ExcSingularBandSystem.
       */
      bool skip_singular_band_correction;
    };

    InterfaceBandSmoother() = default;

    /**
     * Set up the band restrictions and factorize the band systems of all
     * levels of @p hierarchy. Only a pointer to the hierarchy is stored.
     */
    void
    initialize(const LevelHierarchy &hierarchy,
               const AdditionalData &data = AdditionalData());

    void
    clear() override;

    void
    smooth(const unsigned int    level,
           Vector<double>       &u,
           const Vector<double> &rhs) const override;

    /**
     * Adjoint of smooth(): each step applies the band correction first and the
     * SSOR sweep afterwards. Used as post-smoother, it keeps the V-cycle
     * symmetric.
     */
    void
    smooth_adjoint(const unsigned int    level,
                   Vector<double>       &u,
                   const Vector<double> &rhs) const;

    /**
     * First stage of a smoothing step: one SSOR sweep on the full level system.
     */
    void
    relax(const unsigned int    level,
          Vector<double>       &u,
          const Vector<double> &rhs) const;

    /**
     * Second stage of a smoothing step: the exact correction on the interface
     * band. Does nothing if the level has no band or its correction is
     * disabled.
     */
    void
    correct_interface(const unsigned int    level,
                      Vector<double>       &u,
                      const Vector<double> &rhs) const;

    /**
     * Whether the band correction is performed on @p level.
     */
    bool
    has_band_correction(const unsigned int level) const;

    const BandRestriction &
    get_band_restriction(const unsigned int level) const;

    /**
     * The reduced band matrix R A R^T of @p level.
     */
    const SparseMatrix<double> &
    get_band_matrix(const unsigned int level) const;

  private:
    /**
     * Everything the band correction needs on one level.
     */
    struct BandSystem
    {
      BandRestriction      restriction;
      SparsityPattern      sparsity_pattern;
      SparseMatrix<double> matrix;
      SparseDirectUMFPACK  solver;
      bool                 factorized = false;

      mutable Vector<double> residual;
      mutable Vector<double> band_residual;
      mutable Vector<double> band_correction;
    };

    void
    setup_band_system(const unsigned int level);

    SmartPointer<const LevelHierarchy, InterfaceBandSmoother> hierarchy;

    AdditionalData additional_data;

    MGLevelObject<BandSystem> band_systems;
  };
} // namespace dealii::CutMG

#endif
