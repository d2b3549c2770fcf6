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


// Build the hierarchy of the 1D model problem level by level and move the
// interface:
// - every prolongation maps between the active spaces of consecutive levels
//   and reproduces constants wherever all coarse parents are active,
// - refining with a snapshot of the wrong size is rejected,
// - under keep_fixed only the finest level follows a geometry change, under
//   reassemble_on_geometry_change all levels do.


#include <hierarchy_updater.h>
#include <interface_multigrid.h>
#include <level_hierarchy.h>
#include <utils.h>

#include "../tests.h"


// The full-space parents of the fine DoF i in the model problem.
std::vector<types::global_dof_index>
coarse_parents(const types::global_dof_index i)
{
  if (i % 2 == 0)
    return {i / 2};
  return {(i - 1) / 2, (i + 1) / 2};
}



void
check_prolongations(const LevelHierarchy &hierarchy)
{
  for (unsigned int l = 1; l < hierarchy.n_levels(); ++l)
    {
      const Level &fine   = hierarchy[l];
      const Level &coarse = hierarchy[l - 1];

      AssertThrow(Utils::n_rows(fine.prolongation) == fine.n_active_dofs(),
                  ExcInternalError());
      AssertThrow(Utils::n_columns(fine.prolongation) ==
                    coarse.n_active_dofs(),
                  ExcInternalError());

      Vector<double> ones(coarse.n_active_dofs());
      ones = 1.;
      Vector<double> prolonged(fine.n_active_dofs());
      fine.prolongation.vmult(prolonged, ones);

      unsigned int n_checked = 0;
      for (const types::global_dof_index dof : fine.active_dofs)
        {
          const auto parents = coarse_parents(dof);
          if (std::all_of(parents.begin(),
                          parents.end(),
                          [&](const types::global_dof_index p) {
                            return coarse.active_dofs.is_element(p);
                          }))
            {
              AssertThrow(std::abs(prolonged(
                                     fine.active_dofs.index_within_set(dof)) -
                                   1.) < 1e-14,
                          ExcMessage("Constants are not reproduced on level " +
                                     std::to_string(l)));
              ++n_checked;
            }
        }
      std::cout << "Level " << l << ": " << fine.n_active_dofs() << " x "
                << coarse.n_active_dofs() << " prolongation, " << n_checked
                << " rows reproduce constants" << std::endl;
      AssertThrow(n_checked > 0, ExcInternalError());
    }
}



void
test_refinement()
{
  const Tests::InterfaceModel1D model(4, 0.3);
  LevelHierarchy                hierarchy;
  HierarchyUpdater              updater(hierarchy, model, model);

  updater.initialize(model.make_snapshot(1, 0));
  AssertThrow(hierarchy.n_levels() == 1, ExcInternalError());
  AssertThrow(hierarchy[0].active_dofs == Tests::index_set(5, {1, 2, 3}),
              ExcInternalError());
  AssertThrow(hierarchy[0].band_dofs == Tests::index_set(5, {1, 2}),
              ExcInternalError());

  for (unsigned int n_levels = 2; n_levels <= 4; ++n_levels)
    {
      updater.on_refine(model.make_snapshot(n_levels, 0));
      AssertThrow(hierarchy.n_levels() == n_levels, ExcInternalError());

      const Level &finest = hierarchy[n_levels - 1];
      AssertThrow(finest.n_active_dofs() == (4u << (n_levels - 1)) - 1,
                  ExcInternalError());
      AssertThrow(finest.n_band_dofs() == 2, ExcInternalError());
      AssertThrow(finest.geometry_version == 0, ExcInternalError());
    }
  AssertThrow(hierarchy[1].band_dofs == Tests::index_set(9, {2, 3}),
              ExcInternalError());

  hierarchy.check_consistency();
  check_prolongations(hierarchy);

  // the snapshot has to have exactly one level more than the hierarchy
  for (const unsigned int n_levels : {4u, 6u})
    {
      bool caught = false;
      try
        {
          updater.on_refine(model.make_snapshot(n_levels, 0));
        }
      catch (const ExcInconsistentDimension &)
        {
          caught = true;
        }
      AssertThrow(caught, ExcInternalError());
    }
  AssertThrow(hierarchy.n_levels() == 4, ExcInternalError());

  std::cout << "Refinement: OK" << std::endl;
}



void
test_wider_band()
{
  const Tests::InterfaceModel1D          model(4, 0.3);
  const HierarchyUpdater::AdditionalData data(1);
  LevelHierarchy                         hierarchy;
  HierarchyUpdater updater(hierarchy, model, model, data);

  updater.initialize(model.make_snapshot(2, 0));
  AssertThrow(hierarchy[0].band_dofs == Tests::index_set(5, {1, 2, 3}),
              ExcInternalError());
  AssertThrow(hierarchy[1].band_dofs == Tests::index_set(9, {1, 2, 3, 4}),
              ExcInternalError());

  std::cout << "Band with one extension layer: OK" << std::endl;
}



void
test_geometry_change(const CoarseOperatorPolicy policy)
{
  // fictitious domain (0, alpha): the active DoFs follow the interface
  Tests::InterfaceModel1D model(4, 0.3, 1., 1., true);

  const HierarchyUpdater::AdditionalData data(0, policy);
  LevelHierarchy                         hierarchy;
  HierarchyUpdater updater(hierarchy, model, model, data);

  updater.initialize(model.make_snapshot(2, 0));
  AssertThrow(hierarchy[0].active_dofs == Tests::index_set(5, {1, 2}),
              ExcInternalError());
  AssertThrow(hierarchy[1].active_dofs == Tests::index_set(9, {1, 2, 3}),
              ExcInternalError());

  model.set_interface_position(0.6);
  updater.on_geometry_change(model.make_snapshot(2, 1));
  hierarchy.check_consistency();

  AssertThrow(hierarchy[1].active_dofs == Tests::index_set(9, {1, 2, 3, 4, 5}),
              ExcInternalError());
  AssertThrow(hierarchy[1].band_dofs == Tests::index_set(9, {4, 5}),
              ExcInternalError());
  AssertThrow(hierarchy[1].geometry_version == 1, ExcInternalError());

  if (policy == CoarseOperatorPolicy::keep_fixed)
    {
      AssertThrow(hierarchy[0].active_dofs == Tests::index_set(5, {1, 2}),
                  ExcInternalError());
      AssertThrow(hierarchy[0].geometry_version == 0, ExcInternalError());
    }
  else
    {
      AssertThrow(hierarchy[0].active_dofs == Tests::index_set(5, {1, 2, 3}),
                  ExcInternalError());
      AssertThrow(hierarchy[0].band_dofs == Tests::index_set(5, {2, 3}),
                  ExcInternalError());
      AssertThrow(hierarchy[0].geometry_version == 1, ExcInternalError());
    }
  check_prolongations(hierarchy);

  // refining after the change: stale coarse levels are only rebuilt under
  // reassemble_on_geometry_change
  updater.on_refine(model.make_snapshot(3, 2));
  hierarchy.check_consistency();
  check_prolongations(hierarchy);
  AssertThrow(hierarchy[2].geometry_version == 2, ExcInternalError());
  AssertThrow(hierarchy[2].active_dofs.n_elements() == 10, ExcInternalError());
  const unsigned int expected_coarse_version =
    (policy == CoarseOperatorPolicy::keep_fixed) ? 0 : 2;
  AssertThrow(hierarchy[0].geometry_version == expected_coarse_version,
              ExcInternalError());

  // a geometry change has to keep the number of levels
  bool caught = false;
  try
    {
      updater.on_geometry_change(model.make_snapshot(2, 3));
    }
  catch (const ExcInconsistentDimension &)
    {
      caught = true;
    }
  AssertThrow(caught, ExcInternalError());

  if (policy == CoarseOperatorPolicy::reassemble_on_geometry_change)
    {
      InterfaceMultigrid mg;
      mg.initialize(hierarchy);
      const Vector<double> rhs =
        model.right_hand_side(model.make_snapshot(3, 2), 2);
      Vector<double>        x(rhs.size());
      const IterationResult result = mg.iterate(rhs, x, 1e-8, 30);
      std::cout << "Iterations after the update: " << result.n_iterations
                << std::endl;
      AssertThrow(result.converged, ExcInternalError());
    }

  std::cout << "Geometry change: OK" << std::endl;
}



int
main()
{
  test_refinement();
  test_wider_band();
  test_geometry_change(CoarseOperatorPolicy::keep_fixed);
  test_geometry_change(CoarseOperatorPolicy::reassemble_on_geometry_change);

  return 0;
}
