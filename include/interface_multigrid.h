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


#ifndef interface_multigrid_h
#define interface_multigrid_h

#include <deal.II/base/mg_level_object.h>
#include <deal.II/base/smartpointer.h>
#include <deal.II/base/subscriptor.h>

#include <deal.II/lac/vector.h>

#include <band_smoother.h>
#include <level_hierarchy.h>
#include <mg_transfer_hierarchy.h>
#include <multigrid_utils.h>

#include <vector>

namespace dealii::CutMG
{
  /**
   * Outcome of InterfaceMultigrid::iterate().
   */
  struct IterationResult
  {
    unsigned int n_iterations = 0;

    /**
     * False if the tolerance was not reached within the allowed number of
     * iterations. The iterate is still the last one computed.
     */
    bool converged = false;

    /**
     * Euclidean norm of the final residual rhs - A x.
     */
    double residual = 0.;

    /**
     * Residual norm before every iteration and after the last one.
     */
    std::vector<double> residual_history;
  };



  /**
   * Geometric multigrid V-cycle on a LevelHierarchy, with the
   * InterfaceBandSmoother on all levels but the coarsest one and a direct
   * solver on level 0. Post-smoothing uses the adjoint of the pre-smoother,
   * so that one cycle is a symmetric operator for a symmetric hierarchy.
   *
   * The object can be used in two ways:
   * - as a preconditioner: vmult() applies one V-cycle with zero initial guess,
   *   so it can be handed to any deal.II solver, e.g.
   *   @code
   *   SolverCG<Vector<double>> cg(control);
   *   cg.solve(hierarchy[hierarchy.max_level()].matrix, x, b, mg);
   *   @endcode
   * - as a standalone solver through iterate().
   *
   * Only a pointer to the hierarchy is stored. After the hierarchy has been
   * extended or rebuilt, initialize() needs to be called again.
   */
  class InterfaceMultigrid : public Subscriptor
  {
  public:
    struct AdditionalData
    {
      AdditionalData(const unsigned int n_smoothing_steps             = 1,
                     const double       relaxation                    = 1.,
                     const bool         skip_singular_band_correction = false);

      /**
       * Number of smoothing steps before and after the coarse correction.
       */
      unsigned int n_smoothing_steps;

      double relaxation;

      bool skip_singular_band_correction;
    };

    InterfaceMultigrid() = default;

    /**
     * Check the hierarchy, factorize the coarse matrix and the band systems
     * and allocate the level vectors.
     */
    void
    initialize(const LevelHierarchy &hierarchy,
               const AdditionalData &data = AdditionalData());

    void
    clear();

    /**
     * One V-cycle with zero initial guess: dst = M^{-1} src.
     */
    void
    vmult(Vector<double> &dst, const Vector<double> &src) const;

    /**
     * One V-cycle applied to the residual of @p x: dst = M^{-1} (rhs - A x).
     * The result vanishes if @p x solves the finest level system.
     */
    void
    correction(const Vector<double> &rhs,
               const Vector<double> &x,
               Vector<double>       &dst) const;

    /**
     * Stationary iteration x := x + M^{-1}(rhs - A x), starting from the
     * given @p x, until ||rhs - A x|| <= tolerance * ||rhs|| or
     * @p max_iterations steps have been done. For a zero right hand side the
     * tolerance is absolute.
     *
     * Failure to converge is reported in the returned object and not thrown.
     */
    IterationResult
    iterate(const Vector<double> &rhs,
            Vector<double>       &x,
            const double          tolerance,
            const unsigned int    max_iterations) const;

    const InterfaceBandSmoother &
    get_smoother() const;

    unsigned int
    n_levels() const;

  private:
    /**
     * Compute solution[level] from defect[level] with one V-cycle.
     */
    void
    level_v_step(const unsigned int level) const;

    SmartPointer<const LevelHierarchy, InterfaceMultigrid> hierarchy;

    AdditionalData additional_data;

    InterfaceBandSmoother smoother;

    MGTransferHierarchy transfer;

    MGCoarseGridDirectSolver<Vector<double>> coarse_solver;

    mutable MGLevelObject<Vector<double>> defect;

    mutable MGLevelObject<Vector<double>> solution;

    mutable MGLevelObject<Vector<double>> t;
  };
} // namespace dealii::CutMG

#endif
