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

#include <deal.II/lac/solver_control.h>
#include <deal.II/lac/solver_richardson.h>

#include <interface_multigrid.h>

namespace dealii::CutMG
{
  InterfaceMultigrid::AdditionalData::AdditionalData(
    const unsigned int n_smoothing_steps,
    const double       relaxation,
    const bool         skip_singular_band_correction)
    : n_smoothing_steps(n_smoothing_steps)
    , relaxation(relaxation)
    , skip_singular_band_correction(skip_singular_band_correction)
  {}



  void
  InterfaceMultigrid::initialize(const LevelHierarchy &hierarchy_,
                                 const AdditionalData &data)
  {
    AssertThrow(hierarchy_.n_levels() > 0, ExcNotInitialized());
    hierarchy_.check_consistency();

    hierarchy       = &hierarchy_;
    additional_data = data;

    const unsigned int max_level = hierarchy->max_level();

    coarse_solver.initialize((*hierarchy)[0].matrix);
    transfer.initialize(*hierarchy);
    smoother.initialize(
      *hierarchy,
      InterfaceBandSmoother::AdditionalData(
        data.n_smoothing_steps,
        data.relaxation,
        data.skip_singular_band_correction));

    defect.resize(0, max_level);
    solution.resize(0, max_level);
    t.resize(0, max_level);
    for (unsigned int level = 0; level <= max_level; ++level)
      {
        const types::global_dof_index n = (*hierarchy)[level].n_active_dofs();
        defect[level].reinit(n);
        solution[level].reinit(n);
        t[level].reinit(n);
      }

    LogStream::Prefix prefix("InterfaceMultigrid");
    deallog << "Levels: " << hierarchy->n_levels() << std::endl;
    for (unsigned int level = 0; level <= max_level; ++level)
      deallog << "Level " << level << ": "
              << (*hierarchy)[level].n_active_dofs() << " active DoFs, "
              << (*hierarchy)[level].n_band_dofs() << " band DoFs"
              << std::endl;
  }



  void
  InterfaceMultigrid::clear()
  {
    smoother.clear();
    transfer.clear();
    coarse_solver.clear();
    defect.resize(0, 0);
    solution.resize(0, 0);
    t.resize(0, 0);
    hierarchy = nullptr;
  }



  void
  InterfaceMultigrid::level_v_step(const unsigned int level) const
  {
    if (level == 0)
      {
        coarse_solver(level, solution[level], defect[level]);
        return;
      }

    solution[level] = 0.;
    smoother.smooth(level, solution[level], defect[level]);

    // t = defect - A solution, handed down as the coarse right hand side
    (*hierarchy)[level].matrix.residual(t[level],
                                        solution[level],
                                        defect[level]);
    defect[level - 1] = 0.;
    transfer.restrict_and_add(level, defect[level - 1], t[level]);

    level_v_step(level - 1);

    transfer.prolongate_and_add(level, solution[level], solution[level - 1]);

    smoother.smooth_adjoint(level, solution[level], defect[level]);
  }



  void
  InterfaceMultigrid::vmult(Vector<double>       &dst,
                            const Vector<double> &src) const
  {
    Assert(hierarchy != nullptr, ExcNotInitialized());
    const unsigned int max_level = hierarchy->max_level();
    AssertDimension(src.size(), defect[max_level].size());
    AssertDimension(dst.size(), defect[max_level].size());

    defect[max_level] = src;
    level_v_step(max_level);
    dst = solution[max_level];
  }



  void
  InterfaceMultigrid::correction(const Vector<double> &rhs,
                                 const Vector<double> &x,
                                 Vector<double>       &dst) const
  {
    Assert(hierarchy != nullptr, ExcNotInitialized());
    const unsigned int max_level = hierarchy->max_level();

    Vector<double> residual(rhs.size());
    (*hierarchy)[max_level].matrix.residual(residual, x, rhs);
    vmult(dst, residual);
  }



  IterationResult
  InterfaceMultigrid::iterate(const Vector<double> &rhs,
                              Vector<double>       &x,
                              const double          tolerance,
                              const unsigned int    max_iterations) const
  {
    Assert(hierarchy != nullptr, ExcNotInitialized());
    const SparseMatrix<double> &matrix =
      (*hierarchy)[hierarchy->max_level()].matrix;
    AssertThrow(x.size() == rhs.size(),
                ExcInconsistentDimension(x.size(), rhs.size()));

    const double rhs_norm = rhs.l2_norm();
    const double threshold =
      (rhs_norm > 0.) ? tolerance * rhs_norm : tolerance;

    SolverControl control(max_iterations, threshold, false, false);
    control.enable_history_data();
    SolverRichardson<Vector<double>> richardson(control);

    IterationResult result;
    try
      {
        richardson.solve(matrix, x, rhs, *this);
        result.converged = true;
      }
    catch (const SolverControl::NoConvergence &exc)
      {
        result.converged = false;

        LogStream::Prefix prefix("InterfaceMultigrid");
        deallog << "No convergence after " << exc.last_step
                << " iterations, residual " << exc.last_residual << std::endl;
      }

    result.n_iterations     = control.last_step();
    result.residual         = control.last_value();
    result.residual_history = control.get_history_data();

    return result;
  }



  const InterfaceBandSmoother &
  InterfaceMultigrid::get_smoother() const
  {
    return smoother;
  }



  unsigned int
  InterfaceMultigrid::n_levels() const
  {
    return (hierarchy != nullptr) ? hierarchy->n_levels() : 0;
  }
} // namespace dealii::CutMG
