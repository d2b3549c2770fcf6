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


// Solve the interface problem -(beta u')' = 1 on (0,1), u(0) = u(1) = 0, with
// beta = beta_minus for x < alpha and beta = beta_plus otherwise, on a
// sequence of uniformly refined meshes which do not resolve the interface.
// After each refinement the hierarchy is extended by one level and the system
// is solved with CG preconditioned by one V-cycle and with the standalone
// multigrid iteration. Finally the interface is moved and the hierarchy is
// updated on the finest mesh.


#include <deal.II/base/conditional_ostream.h>
#include <deal.II/base/logstream.h>
#include <deal.II/base/timer.h>

#include <deal.II/lac/dynamic_sparsity_pattern.h>
#include <deal.II/lac/solver_cg.h>
#include <deal.II/lac/solver_control.h>
#include <deal.II/lac/sparse_matrix.h>
#include <deal.II/lac/sparsity_pattern.h>
#include <deal.II/lac/vector.h>

#include <formulation.h>
#include <geometry_snapshot.h>
#include <hierarchy_updater.h>
#include <interface_multigrid.h>
#include <level_hierarchy.h>

#include <algorithm>
#include <cmath>
#include <iostream>

using namespace dealii;
using namespace dealii::CutMG;



/**
 * Piecewise linear elements on the uniform meshes of (0,1) obtained from
 * n_coarse_cells cells by repeated bisection. The cut cell uses the volume
 * averaged coefficient, a ghost penalty acts on the derivative jumps at the
 * vertices of the cut cell.
 */
class InterfaceDiscretization : public AssemblyService,
                                public ProlongationProvider
{
public:
  InterfaceDiscretization(const unsigned int n_coarse_cells,
                          const double       beta_minus,
                          const double       beta_plus);

  void
  set_interface(const double alpha);

  GeometrySnapshot
  make_snapshot(const unsigned int n_levels, const unsigned int version) const;

  IndexSet
  active_dofs(const GeometrySnapshot &snapshot,
              const unsigned int      level) const override;

  void
  assemble_matrix(const GeometrySnapshot &snapshot,
                  const unsigned int      level,
                  const Formulation      &formulation,
                  SparsityPattern        &sparsity,
                  SparseMatrix<double>   &matrix) const override;

  void
  fill_prolongation(const GeometrySnapshot &snapshot,
                    const unsigned int      to_level,
                    SparsityPattern        &sparsity,
                    SparseMatrix<double>   &matrix) const override;

  Vector<double>
  assemble_rhs(const GeometrySnapshot &snapshot,
               const unsigned int      level) const;

  /**
   * Maximum difference between the nodal values of @p solution and the
   * exact solution.
   */
  double
  nodal_error(const GeometrySnapshot &snapshot,
              const unsigned int      level,
              const Vector<double>   &solution) const;

private:
  double
  exact_solution(const double x) const;

  const unsigned int n_coarse_cells;
  const double       beta_minus;
  const double       beta_plus;
  double             alpha;
};



InterfaceDiscretization::InterfaceDiscretization(
  const unsigned int n_coarse_cells,
  const double       beta_minus,
  const double       beta_plus)
  : n_coarse_cells(n_coarse_cells)
  , beta_minus(beta_minus)
  , beta_plus(beta_plus)
  , alpha(0.5)
{}



void
InterfaceDiscretization::set_interface(const double alpha_)
{
  Assert(alpha_ > 0. && alpha_ < 1., ExcMessage("Interface outside (0,1)."));
  alpha = alpha_;
}



GeometrySnapshot
InterfaceDiscretization::make_snapshot(const unsigned int n_levels,
                                       const unsigned int version) const
{
  GeometrySnapshot snapshot;
  snapshot.version = version;
  snapshot.levels.resize(n_levels);
  for (unsigned int l = 0; l < n_levels; ++l)
    {
      const unsigned int n_cells = n_coarse_cells << l;
      const double       h       = 1. / n_cells;

      LevelGeometry &geometry = snapshot.levels[l];
      geometry.n_dofs         = n_cells + 1;
      geometry.cell_dofs.resize(n_cells);

      std::vector<std::vector<double>> level_set_values(n_cells);
      for (unsigned int c = 0; c < n_cells; ++c)
        {
          geometry.cell_dofs[c] = {c, c + 1};
          level_set_values[c]   = {c * h - alpha, (c + 1) * h - alpha};
        }
      geometry.cell_locations = classify_cells(level_set_values);
    }
  return snapshot;
}



IndexSet
InterfaceDiscretization::active_dofs(const GeometrySnapshot &snapshot,
                                     const unsigned int      level) const
{
  IndexSet active(snapshot.levels[level].n_dofs);
  active.add_range(1, snapshot.levels[level].n_dofs - 1);
  return active;
}



void
InterfaceDiscretization::assemble_matrix(const GeometrySnapshot &snapshot,
                                         const unsigned int      level,
                                         const Formulation      &formulation,
                                         SparsityPattern        &sparsity,
                                         SparseMatrix<double>   &matrix) const
{
  const LevelGeometry &geometry = snapshot.levels[level];
  const unsigned int   n_cells  = geometry.n_cells();
  const double         h        = 1. / n_cells;
  const double         gamma    = ghost_penalty_parameter(formulation);

  const auto is_cut = [&](const unsigned int c) {
    return geometry.cell_locations[c] ==
           NonMatching::LocationToLevelSet::intersected;
  };

  DynamicSparsityPattern dsp(geometry.n_dofs, geometry.n_dofs);
  for (unsigned int c = 0; c < n_cells; ++c)
    for (unsigned int i = c; i <= c + 1; ++i)
      for (unsigned int j = c; j <= c + 1; ++j)
        dsp.add(i, j);
  for (unsigned int v = 1; v < n_cells; ++v)
    if (is_cut(v - 1) || is_cut(v))
      for (unsigned int i = v - 1; i <= v + 1; ++i)
        for (unsigned int j = v - 1; j <= v + 1; ++j)
          dsp.add(i, j);

  matrix.clear();
  sparsity.copy_from(dsp);
  matrix.reinit(sparsity);

  for (unsigned int c = 0; c < n_cells; ++c)
    {
      const double theta = std::clamp((alpha - c * h) / h, 0., 1.);
      const double beta  = theta * beta_minus + (1. - theta) * beta_plus;
      matrix.add(c, c, beta / h);
      matrix.add(c + 1, c + 1, beta / h);
      matrix.add(c, c + 1, -beta / h);
      matrix.add(c + 1, c, -beta / h);
    }

  const double jump[3]         = {1., -2., 1.};
  const double penalty_scaling = gamma * std::max(beta_minus, beta_plus) / h;
  for (unsigned int v = 1; v < n_cells; ++v)
    if (is_cut(v - 1) || is_cut(v))
      for (unsigned int i = 0; i < 3; ++i)
        for (unsigned int j = 0; j < 3; ++j)
          matrix.add(v - 1 + i, v - 1 + j, penalty_scaling * jump[i] * jump[j]);
}



void
InterfaceDiscretization::fill_prolongation(const GeometrySnapshot &snapshot,
                                           const unsigned int      to_level,
                                           SparsityPattern        &sparsity,
                                           SparseMatrix<double>   &matrix) const
{
  const types::global_dof_index n_fine = snapshot.levels[to_level].n_dofs;
  const types::global_dof_index n_coarse =
    snapshot.levels[to_level - 1].n_dofs;

  DynamicSparsityPattern dsp(n_fine, n_coarse);
  for (types::global_dof_index i = 0; i < n_fine; ++i)
    {
      dsp.add(i, i / 2);
      if (i % 2 == 1)
        dsp.add(i, i / 2 + 1);
    }

  matrix.clear();
  sparsity.copy_from(dsp);
  matrix.reinit(sparsity);

  for (types::global_dof_index i = 0; i < n_fine; ++i)
    if (i % 2 == 0)
      matrix.set(i, i / 2, 1.);
    else
      {
        matrix.set(i, i / 2, 0.5);
        matrix.set(i, i / 2 + 1, 0.5);
      }
}



Vector<double>
InterfaceDiscretization::assemble_rhs(const GeometrySnapshot &snapshot,
                                      const unsigned int      level) const
{
  const IndexSet active = active_dofs(snapshot, level);
  const double   h      = 1. / snapshot.levels[level].n_cells();

  Vector<double> rhs(active.n_elements());
  rhs = h;
  return rhs;
}



double
InterfaceDiscretization::exact_solution(const double x) const
{
  // the flux beta u' = C - x is continuous across the interface
  const double r = beta_plus / beta_minus;
  const double C =
    (1. - alpha * alpha + r * alpha * alpha) / (2. * (alpha * r - alpha + 1.));

  if (x < alpha)
    return (C * x - 0.5 * x * x) / beta_minus;
  return (C * x - 0.5 * x * x + 0.5 - C) / beta_plus;
}



double
InterfaceDiscretization::nodal_error(const GeometrySnapshot &snapshot,
                                     const unsigned int      level,
                                     const Vector<double>   &solution) const
{
  const IndexSet active = active_dofs(snapshot, level);
  const double   h      = 1. / snapshot.levels[level].n_cells();

  double error = 0.;
  for (const types::global_dof_index dof : active)
    error = std::max(error,
                     std::abs(solution(active.index_within_set(dof)) -
                              exact_solution(dof * h)));
  return error;
}



class InterfaceProblem
{
public:
  InterfaceProblem(const unsigned int n_refinements);

  void
  run();

private:
  void
  solve(const GeometrySnapshot &snapshot);

  const unsigned int n_refinements;

  ConditionalOStream pcout;
  TimerOutput        computing_timer;

  InterfaceDiscretization discretization;
  LevelHierarchy          hierarchy;
  HierarchyUpdater        updater;
  InterfaceMultigrid      multigrid;

  unsigned int geometry_version;
};



InterfaceProblem::InterfaceProblem(const unsigned int n_refinements)
  : n_refinements(n_refinements)
  , pcout(std::cout, true)
  , computing_timer(pcout, TimerOutput::summary, TimerOutput::wall_times)
  , discretization(4, 1., 100.)
  , updater(hierarchy,
            discretization,
            discretization,
            HierarchyUpdater::AdditionalData(
              1,
              CoarseOperatorPolicy::reassemble_on_geometry_change,
              PenaltyFormulation()))
  , geometry_version(0)
{}



void
InterfaceProblem::solve(const GeometrySnapshot &snapshot)
{
  const unsigned int          finest = hierarchy.max_level();
  const SparseMatrix<double> &matrix = hierarchy[finest].matrix;
  const Vector<double> rhs = discretization.assemble_rhs(snapshot, finest);

  {
    TimerOutput::Scope t(computing_timer, "Setup multigrid");
    multigrid.initialize(hierarchy);
  }

  {
    TimerOutput::Scope t(computing_timer, "Solve: CG + multigrid");

    Vector<double>           solution(rhs.size());
    SolverControl            control(200, 1e-10 * rhs.l2_norm());
    SolverCG<Vector<double>> cg(control);
    cg.solve(matrix, solution, rhs, multigrid);

    pcout << "   CG + multigrid:     " << control.last_step()
          << " iterations, nodal error "
          << discretization.nodal_error(snapshot, finest, solution)
          << std::endl;
  }

  {
    TimerOutput::Scope t(computing_timer, "Solve: multigrid");

    Vector<double>        solution(rhs.size());
    const IterationResult result =
      multigrid.iterate(rhs, solution, 1e-10, 200);

    pcout << "   Multigrid:          " << result.n_iterations
          << " iterations, " << (result.converged ? "converged" : "not converged")
          << ", residual " << result.residual << std::endl;
    if (result.n_iterations > 0)
      pcout << "   Average rate:       "
            << std::pow(result.residual / result.residual_history.front(),
                        1. / result.n_iterations)
            << std::endl;
  }
}



void
InterfaceProblem::run()
{
  discretization.set_interface(0.3);

  {
    TimerOutput::Scope t(computing_timer, "Build hierarchy");
    updater.initialize(discretization.make_snapshot(1, geometry_version));
  }

  for (unsigned int cycle = 1; cycle <= n_refinements; ++cycle)
    {
      const GeometrySnapshot snapshot =
        discretization.make_snapshot(cycle + 1, geometry_version);
      {
        TimerOutput::Scope t(computing_timer, "Build hierarchy");
        updater.on_refine(snapshot);
      }

      pcout << "Cycle " << cycle << ": " << hierarchy.n_levels()
            << " levels, " << hierarchy[hierarchy.max_level()].n_active_dofs()
            << " DoFs, " << hierarchy[hierarchy.max_level()].n_band_dofs()
            << " in the interface band" << std::endl;
      solve(snapshot);
    }

  for (const double alpha : {0.41, 0.66})
    {
      discretization.set_interface(alpha);
      ++geometry_version;

      const GeometrySnapshot snapshot =
        discretization.make_snapshot(hierarchy.n_levels(), geometry_version);
      {
        TimerOutput::Scope t(computing_timer, "Update geometry");
        updater.on_geometry_change(snapshot);
      }

      pcout << "Interface at " << alpha << ": "
            << hierarchy[hierarchy.max_level()].n_band_dofs()
            << " DoFs in the interface band" << std::endl;
      solve(snapshot);
    }
}



int
main()
{
  try
    {
      deallog.depth_console(2);

      InterfaceProblem problem(7);
      problem.run();
    }
  catch (const std::exception &exc)
    {
      std::cerr << std::endl
                << "----------------------------------------------------"
                << std::endl;
      std::cerr << "Exception on processing: " << std::endl
                << exc.what() << std::endl
                << "Aborting!" << std::endl
                << "----------------------------------------------------"
                << std::endl;
      return 1;
    }

  return 0;
}
