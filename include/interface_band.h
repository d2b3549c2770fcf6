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


#ifndef interface_band_h
#define interface_band_h

#include <deal.II/base/index_set.h>

#include <deal.II/lac/vector.h>

#include <exceptions.h>
#include <geometry_snapshot.h>

#include <vector>

namespace dealii::CutMG
{
  /**
   * Return the active DoFs of a level whose support touches at least one
   * intersected cell of @p geometry.
   *
   * If @p n_extension_layers is positive, the set of intersected cells is
   * grown that many times by all cells sharing a DoF with it, so that the band
   * covers the patches on which a ghost penalty acts. Cells added this way
   * contribute only their active DoFs.
   *
   * The result is an IndexSet over the level space, hence independent of the
   * order in which cells are stored. If no cell is intersected, the returned
   * set is empty.
   *
   * Throws ExcInvalidBandSelection if the classification does not describe
   * the level space of @p active_dofs: lists of different length, DoFs
   * outside the space, unassigned cells, or inactive DoFs on an intersected
   * cell.
   */
  IndexSet
  select_band(const IndexSet      &active_dofs,
              const LevelGeometry &geometry,
              const unsigned int   n_extension_layers = 0);



  /**
   * The restriction R from the vector of all active DoFs of a level to the
   * vector of its band DoFs, and the corresponding extension R^T.
   *
   * Both vectors use compressed numberings: the position of a DoF within the
   * active IndexSet, respectively within the band IndexSet.
   */
  class BandRestriction
  {
  public:
    BandRestriction() = default;

    BandRestriction(const IndexSet &active_dofs, const IndexSet &band_dofs);

    void
    reinit(const IndexSet &active_dofs, const IndexSet &band_dofs);

    /**
     * band = R * full.
     */
    void
    restrict_vector(const Vector<double> &full, Vector<double> &band) const;

    /**
     * full += R^T * band.
     */
    void
    extend_add(const Vector<double> &band, Vector<double> &full) const;

    /**
     * Position of every band DoF within the active DoFs, in increasing order.
     */
    const std::vector<types::global_dof_index> &
    band_positions() const;

    types::global_dof_index
    n_band_dofs() const;

    types::global_dof_index
    n_active_dofs() const;

    bool
    empty() const;

  private:
    types::global_dof_index n_active = 0;

    std::vector<types::global_dof_index> positions;
  };



  inline const std::vector<types::global_dof_index> &
  BandRestriction::band_positions() const
  {
    return positions;
  }



  inline types::global_dof_index
  BandRestriction::n_band_dofs() const
  {
    return positions.size();
  }



  inline types::global_dof_index
  BandRestriction::n_active_dofs() const
  {
    return n_active;
  }



  inline bool
  BandRestriction::empty() const
  {
    return positions.empty();
  }
} // namespace dealii::CutMG

#endif
