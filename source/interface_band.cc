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

#include <interface_band.h>

#include <string>

namespace dealii::CutMG
{
  namespace
  {
    void
    check_geometry(const IndexSet &active_dofs, const LevelGeometry &geometry)
    {
      AssertThrow(geometry.cell_locations.size() == geometry.cell_dofs.size(),
                  ExcInvalidBandSelection(
                    "the classification describes " +
                    std::to_string(geometry.cell_locations.size()) +
                    " cells, but DoFs are given for " +
                    std::to_string(geometry.cell_dofs.size()) + " cells."));
      AssertThrow(geometry.n_dofs == active_dofs.size(),
                  ExcInvalidBandSelection(
                    "the geometry describes a space with " +
                    std::to_string(geometry.n_dofs) +
                    " DoFs, but the active DoFs live in a space with " +
                    std::to_string(active_dofs.size()) + " DoFs."));

      for (unsigned int c = 0; c < geometry.n_cells(); ++c)
        {
          AssertThrow(geometry.cell_locations[c] !=
                        NonMatching::LocationToLevelSet::unassigned,
                      ExcInvalidBandSelection("cell " + std::to_string(c) +
                                              " has not been classified."));
          for (const types::global_dof_index dof : geometry.cell_dofs[c])
            AssertThrow(dof < geometry.n_dofs,
                        ExcInvalidBandSelection(
                          "cell " + std::to_string(c) + " references DoF " +
                          std::to_string(dof) +
                          ", which is not covered by the level space."));
        }
    }
  } // namespace



  IndexSet
  select_band(const IndexSet      &active_dofs,
              const LevelGeometry &geometry,
              const unsigned int   n_extension_layers)
  {
    check_geometry(active_dofs, geometry);

    const unsigned int n_cells = geometry.n_cells();
    std::vector<bool>  in_band(n_cells, false);
    bool               any_cut = false;
    for (unsigned int c = 0; c < n_cells; ++c)
      if (geometry.cell_locations[c] ==
          NonMatching::LocationToLevelSet::intersected)
        {
          in_band[c] = true;
          any_cut    = true;

          for (const types::global_dof_index dof : geometry.cell_dofs[c])
            AssertThrow(active_dofs.is_element(dof),
                        ExcInvalidBandSelection(
                          "DoF " + std::to_string(dof) +
                          " of the intersected cell " + std::to_string(c) +
                          " is not active."));
        }

    IndexSet band(active_dofs.size());
    if (!any_cut)
      return band;

    if (n_extension_layers > 0)
      {
        // cells around every DoF
        std::vector<std::vector<unsigned int>> dof_to_cells(geometry.n_dofs);
        for (unsigned int c = 0; c < n_cells; ++c)
          for (const types::global_dof_index dof : geometry.cell_dofs[c])
            dof_to_cells[dof].push_back(c);

        for (unsigned int layer = 0; layer < n_extension_layers; ++layer)
          {
            std::vector<bool> next = in_band;
            for (unsigned int c = 0; c < n_cells; ++c)
              if (in_band[c])
                for (const types::global_dof_index dof : geometry.cell_dofs[c])
                  for (const unsigned int neighbor : dof_to_cells[dof])
                    next[neighbor] = true;
            in_band.swap(next);
          }
      }

    for (unsigned int c = 0; c < n_cells; ++c)
      if (in_band[c])
        for (const types::global_dof_index dof : geometry.cell_dofs[c])
          if (active_dofs.is_element(dof))
            band.add_index(dof);

    band.compress();
    return band;
  }



  BandRestriction::BandRestriction(const IndexSet &active_dofs,
                                   const IndexSet &band_dofs)
  {
    reinit(active_dofs, band_dofs);
  }



  void
  BandRestriction::reinit(const IndexSet &active_dofs,
                          const IndexSet &band_dofs)
  {
    AssertThrow(band_dofs.size() == active_dofs.size(),
                ExcInconsistentDimension(band_dofs.size(), active_dofs.size()));

    n_active = active_dofs.n_elements();
    positions.clear();
    positions.reserve(band_dofs.n_elements());
    for (const types::global_dof_index dof : band_dofs)
      {
        AssertThrow(active_dofs.is_element(dof),
                    ExcInvalidBandSelection("band DoF " + std::to_string(dof) +
                                            " is not active."));
        positions.push_back(active_dofs.index_within_set(dof));
      }
  }



  void
  BandRestriction::restrict_vector(const Vector<double> &full,
                                   Vector<double>       &band) const
  {
    AssertDimension(full.size(), n_active);
    band.reinit(positions.size());
    for (unsigned int i = 0; i < positions.size(); ++i)
      band(i) = full(positions[i]);
  }



  void
  BandRestriction::extend_add(const Vector<double> &band,
                              Vector<double>       &full) const
  {
    AssertDimension(full.size(), n_active);
    AssertDimension(band.size(), positions.size());
    for (unsigned int i = 0; i < positions.size(); ++i)
      full(positions[i]) += band(i);
  }
} // namespace dealii::CutMG
