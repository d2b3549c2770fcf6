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

#include <exceptions.h>
#include <geometry_snapshot.h>

#include <algorithm>

namespace dealii::CutMG
{
  std::vector<NonMatching::LocationToLevelSet>
  classify_cells(const std::vector<std::vector<double>> &cell_level_set_values)
  {
    std::vector<NonMatching::LocationToLevelSet> locations(
      cell_level_set_values.size(), NonMatching::LocationToLevelSet::unassigned);

    for (unsigned int c = 0; c < cell_level_set_values.size(); ++c)
      {
        const std::vector<double> &values = cell_level_set_values[c];
        if (values.empty())
          continue;

        const bool all_negative =
          std::all_of(values.begin(), values.end(), [](const double v) {
            return v < 0.;
          });
        const bool all_positive =
          std::all_of(values.begin(), values.end(), [](const double v) {
            return v > 0.;
          });

        if (all_negative)
          locations[c] = NonMatching::LocationToLevelSet::inside;
        else if (all_positive)
          locations[c] = NonMatching::LocationToLevelSet::outside;
        else
          locations[c] = NonMatching::LocationToLevelSet::intersected;
      }

    return locations;
  }



  IndexSet
  extract_dofs_of_cells(
    const LevelGeometry                                &geometry,
    const std::vector<NonMatching::LocationToLevelSet> &locations)
  {
    AssertThrow(geometry.cell_locations.size() == geometry.cell_dofs.size(),
                ExcInconsistentDimension(geometry.cell_locations.size(),
                                         geometry.cell_dofs.size()));

    IndexSet dofs(geometry.n_dofs);
    for (unsigned int c = 0; c < geometry.n_cells(); ++c)
      if (std::find(locations.begin(),
                    locations.end(),
                    geometry.cell_locations[c]) != locations.end())
        for (const types::global_dof_index dof : geometry.cell_dofs[c])
          {
            AssertThrow(dof < geometry.n_dofs,
                        ExcInconsistentDimension(dof, geometry.n_dofs));
            dofs.add_index(dof);
          }

    dofs.compress();
    return dofs;
  }
} // namespace dealii::CutMG
