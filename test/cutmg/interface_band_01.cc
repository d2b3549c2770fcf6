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


// Select the interface band on a line of six cells: cut cells only, extended
// by one and two layers, with a partially inactive space, with the cells
// stored in reverse order, without any cut cell, and with classifications
// that do not fit the active DoFs.


#include <interface_band.h>

#include "../tests.h"


using Location = NonMatching::LocationToLevelSet;



LevelGeometry
make_line(const std::vector<Location> &locations)
{
  LevelGeometry geometry;
  geometry.n_dofs = locations.size() + 1;
  for (unsigned int c = 0; c < locations.size(); ++c)
    geometry.cell_dofs.push_back({c, c + 1});
  geometry.cell_locations = locations;
  return geometry;
}



template <typename Function>
bool
throws_invalid_selection(const Function &f)
{
  try
    {
      f();
    }
  catch (const ExcInvalidBandSelection &exc)
    {
      std::cout << "Caught: ";
      exc.print_info(std::cout);
      return true;
    }
  return false;
}



void
test_selection()
{
  const LevelGeometry geometry = make_line({Location::inside,
                                            Location::inside,
                                            Location::intersected,
                                            Location::outside,
                                            Location::outside,
                                            Location::outside});
  const IndexSet      all      = complete_index_set(7);

  const IndexSet band = select_band(all, geometry);
  AssertThrow(band == Tests::index_set(7, {2, 3}), ExcInternalError());
  std::cout << "Band: ";
  band.print(std::cout);
  std::cout << std::endl;

  const IndexSet band_1 = select_band(all, geometry, 1);
  AssertThrow(band_1 == Tests::index_set(7, {1, 2, 3, 4}), ExcInternalError());

  const IndexSet band_2 = select_band(all, geometry, 2);
  AssertThrow(band_2 == Tests::index_set(7, {0, 1, 2, 3, 4, 5}),
              ExcInternalError());

  // the extension keeps to the active DoFs
  const IndexSet interior = Tests::index_set(7, {1, 2, 3, 4, 5});
  AssertThrow(select_band(interior, geometry, 3) == interior,
              ExcInternalError());

  // the result does not depend on the order of the cells
  LevelGeometry reversed;
  reversed.n_dofs = geometry.n_dofs;
  reversed.cell_dofs.assign(geometry.cell_dofs.rbegin(),
                            geometry.cell_dofs.rend());
  reversed.cell_locations.assign(geometry.cell_locations.rbegin(),
                                 geometry.cell_locations.rend());
  AssertThrow(select_band(all, reversed) == band, ExcInternalError());
  AssertThrow(select_band(all, reversed, 1) == band_1, ExcInternalError());

  // two separate cut cells
  const LevelGeometry two_cuts = make_line({Location::intersected,
                                            Location::inside,
                                            Location::inside,
                                            Location::inside,
                                            Location::inside,
                                            Location::intersected});
  AssertThrow(select_band(all, two_cuts) == Tests::index_set(7, {0, 1, 5, 6}),
              ExcInternalError());

  std::cout << "Selection: OK" << std::endl;
}



void
test_empty_band()
{
  const LevelGeometry geometry = make_line({Location::inside,
                                            Location::inside,
                                            Location::inside,
                                            Location::outside,
                                            Location::outside,
                                            Location::outside});

  for (const unsigned int n_layers : {0u, 1u, 4u})
    {
      const IndexSet band =
        select_band(complete_index_set(7), geometry, n_layers);
      AssertThrow(band.size() == 7, ExcInternalError());
      AssertThrow(band.n_elements() == 0, ExcInternalError());
    }

  std::cout << "Empty band: OK" << std::endl;
}



void
test_invalid_input()
{
  const LevelGeometry geometry = make_line({Location::inside,
                                            Location::inside,
                                            Location::intersected,
                                            Location::outside,
                                            Location::outside,
                                            Location::outside});

  // classification and cell DoFs of different length
  {
    LevelGeometry wrong = geometry;
    wrong.cell_locations.pop_back();
    AssertThrow(throws_invalid_selection(
                  [&]() { select_band(complete_index_set(7), wrong); }),
                ExcInternalError());
  }

  // active DoFs of a different space
  AssertThrow(throws_invalid_selection(
                [&]() { select_band(complete_index_set(8), geometry); }),
              ExcInternalError());

  // unclassified cell
  {
    LevelGeometry wrong     = geometry;
    wrong.cell_locations[4] = Location::unassigned;
    AssertThrow(throws_invalid_selection(
                  [&]() { select_band(complete_index_set(7), wrong); }),
                ExcInternalError());
  }

  // DoF outside the level space
  {
    LevelGeometry wrong = geometry;
    wrong.cell_dofs[5]  = {5, 7};
    AssertThrow(throws_invalid_selection(
                  [&]() { select_band(complete_index_set(7), wrong); }),
                ExcInternalError());
  }

  // inactive DoF on the cut cell
  AssertThrow(throws_invalid_selection([&]() {
                select_band(Tests::index_set(7, {0, 1, 2, 4, 5, 6}), geometry);
              }),
              ExcInternalError());

  std::cout << "Invalid input: OK" << std::endl;
}



int
main()
{
  test_selection();
  test_empty_band();
  test_invalid_input();

  return 0;
}
