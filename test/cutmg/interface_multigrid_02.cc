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


// Multigrid on the 1D interface problem with the coefficient jump 1:10:
// - the exact solution is a fixed point of the V-cycle,
// - the residual of the stationary iteration decreases in every step,
// - running out of iterations is reported in the result,
// - a zero right hand side and a single level are handled.


#include <hierarchy_updater.h>
#include <interface_multigrid.h>
#include <level_hierarchy.h>

#include "../tests.h"


void
test_fixed_point()
{
  const Tests::InterfaceModel1D model(4, 0.3, 1., 10.);
  LevelHierarchy                hierarchy;
  HierarchyUpdater              updater(hierarchy, model, model);

  const GeometrySnapshot snapshot = model.make_snapshot(4, 0);
  updater.initialize(snapshot);

  InterfaceMultigrid mg;
  mg.initialize(hierarchy);

  const SparseMatrix<double> &matrix = hierarchy[3].matrix;
  const Vector<double>        rhs    = model.right_hand_side(snapshot, 3);
  const Vector<double>        x      = Tests::solve_directly(matrix, rhs);

  Vector<double> correction(x.size());
  mg.correction(rhs, x, correction);
  std::cout << "Correction of the exact solution: " << correction.linfty_norm()
            << std::endl;
  AssertThrow(correction.linfty_norm() < 1e-10 * x.linfty_norm(),
              ExcMessage("The V-cycle changes the exact solution."));
}



void
test_monotone_convergence(const Formulation &formulation)
{
  const Tests::InterfaceModel1D          model(4, 0.3, 1., 10.);
  const HierarchyUpdater::AdditionalData data(0,
                                              CoarseOperatorPolicy::keep_fixed,
                                              formulation);

  LevelHierarchy   hierarchy;
  HierarchyUpdater updater(hierarchy, model, model, data);

  const GeometrySnapshot snapshot = model.make_snapshot(5, 0);
  updater.initialize(snapshot);

  InterfaceMultigrid mg;
  mg.initialize(hierarchy, InterfaceMultigrid::AdditionalData(2));

  const Vector<double> rhs = model.right_hand_side(snapshot, 4);
  Vector<double>       x(rhs.size());

  const IterationResult result = mg.iterate(rhs, x, 1e-10, 50);
  std::cout << "Formulation " << formulation_name(formulation) << ": "
            << result.n_iterations << " iterations, residual "
            << result.residual << std::endl;

  AssertThrow(result.converged, ExcMessage("Multigrid did not converge."));
  AssertThrow(result.residual <= 1e-10 * rhs.l2_norm(), ExcInternalError());
  AssertThrow(result.residual_history.size() == result.n_iterations + 1,
              ExcInternalError());
  for (unsigned int k = 1; k < result.residual_history.size(); ++k)
    {
      std::cout << "  step " << k << ": rate "
                << result.residual_history[k] / result.residual_history[k - 1]
                << std::endl;
      AssertThrow(result.residual_history[k] <
                    result.residual_history[k - 1],
                  ExcMessage("The residual increased in step " +
                             std::to_string(k)));
    }

  // the iterate matches the direct solution
  Vector<double> error = Tests::solve_directly(hierarchy[4].matrix, rhs);
  error -= x;
  AssertThrow(error.linfty_norm() < 1e-8, ExcInternalError());
}



void
test_no_convergence()
{
  const Tests::InterfaceModel1D model(4, 0.3, 1., 10.);
  LevelHierarchy                hierarchy;
  HierarchyUpdater              updater(hierarchy, model, model);

  const GeometrySnapshot snapshot = model.make_snapshot(4, 0);
  updater.initialize(snapshot);

  InterfaceMultigrid mg;
  mg.initialize(hierarchy);

  const Vector<double> rhs = model.right_hand_side(snapshot, 3);
  Vector<double>       x(rhs.size());

  const IterationResult result = mg.iterate(rhs, x, 1e-14, 1);
  AssertThrow(!result.converged, ExcInternalError());
  AssertThrow(result.n_iterations == 1, ExcInternalError());
  AssertThrow(result.residual_history.size() == 2, ExcInternalError());
  AssertThrow(result.residual == result.residual_history.back(),
              ExcInternalError());
  AssertThrow(result.residual < rhs.l2_norm(), ExcInternalError());

  // the iteration can be resumed from the returned iterate
  const IterationResult resumed = mg.iterate(rhs, x, 1e-10, 50);
  AssertThrow(resumed.converged, ExcInternalError());
  AssertThrow(resumed.residual_history.front() == result.residual,
              ExcInternalError());

  std::cout << "No convergence reported: OK" << std::endl;
}



void
test_degenerate_cases()
{
  const Tests::InterfaceModel1D model(4, 0.3, 1., 10.);

  // zero right hand side: nothing to do
  {
    LevelHierarchy   hierarchy;
    HierarchyUpdater updater(hierarchy, model, model);
    updater.initialize(model.make_snapshot(3, 0));

    InterfaceMultigrid mg;
    mg.initialize(hierarchy);

    const Vector<double> rhs(hierarchy[2].n_active_dofs());
    Vector<double>       x(rhs.size());
    const IterationResult result = mg.iterate(rhs, x, 1e-10, 10);
    AssertThrow(result.converged, ExcInternalError());
    AssertThrow(result.n_iterations == 0, ExcInternalError());
    AssertThrow(x.l2_norm() == 0., ExcInternalError());
  }

  // a single level is solved directly
  {
    LevelHierarchy   hierarchy;
    HierarchyUpdater updater(hierarchy, model, model);
    const GeometrySnapshot snapshot = model.make_snapshot(1, 0);
    updater.initialize(snapshot);
    AssertThrow(hierarchy.n_levels() == 1, ExcInternalError());

    InterfaceMultigrid mg;
    mg.initialize(hierarchy);

    const Vector<double> rhs = model.right_hand_side(snapshot, 0);
    Vector<double>       x(rhs.size());
    mg.vmult(x, rhs);

    Vector<double> error = Tests::solve_directly(hierarchy[0].matrix, rhs);
    error -= x;
    AssertThrow(error.linfty_norm() < 1e-14, ExcInternalError());

    x = 0.;
    const IterationResult result = mg.iterate(rhs, x, 1e-10, 10);
    AssertThrow(result.converged && result.n_iterations == 1,
                ExcInternalError());
  }

  std::cout << "Degenerate cases: OK" << std::endl;
}



int
main()
{
  test_fixed_point();
  test_monotone_convergence(PenaltyFormulation{20., 0.});
  test_monotone_convergence(PenaltyFormulation());
  test_monotone_convergence(MixedFormulation());
  test_no_convergence();
  test_degenerate_cases();

  return 0;
}
