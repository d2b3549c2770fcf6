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

#include <band_smoother.h>
#include <utils.h>

namespace dealii::CutMG
{
  InterfaceBandSmoother::AdditionalData::AdditionalData(
    const unsigned int n_steps,
    const double       relaxation,
    const bool         skip_singular_band_correction)
    : n_steps(n_steps)
    , relaxation(relaxation)
    , skip_singular_band_correction(skip_singular_band_correction)
  {}



  void
  InterfaceBandSmoother::initialize(const LevelHierarchy &hierarchy_,
                                    const AdditionalData &data)
  {
    AssertThrow(hierarchy_.n_levels() > 0, ExcNotInitialized());
    AssertThrow(data.relaxation > 0. && data.relaxation < 2.,
                ExcMessage("The SSOR relaxation factor must lie in (0,2)."));

    hierarchy       = &hierarchy_;
    additional_data = data;

    band_systems.resize(0, hierarchy->max_level());
    for (unsigned int level = 0; level <= hierarchy->max_level(); ++level)
      setup_band_system(level);
  }



  void
  InterfaceBandSmoother::setup_band_system(const unsigned int level)
  {
    const Level &level_data = (*hierarchy)[level];
    BandSystem  &system     = band_systems[level];

    system.restriction.reinit(level_data.active_dofs, level_data.band_dofs);
    system.factorized = false;
    system.solver.clear();
    system.matrix.clear();

    if (system.restriction.empty())
      return;

    // The level matrix is numbered by position within the active DoFs, so the
    // band is described by the same positions here.
    IndexSet band_positions(level_data.n_active_dofs());
    band_positions.add_indices(system.restriction.band_positions().begin(),
                               system.restriction.band_positions().end());
    band_positions.compress();

    Utils::extract_submatrix(level_data.matrix,
                             band_positions,
                             band_positions,
                             system.sparsity_pattern,
                             system.matrix);

    try
      {
        system.solver.initialize(system.matrix);
        system.factorized = true;
      }
    catch (const SparseDirectUMFPACK::ExcUMFPACKError &)
      {
        system.solver.clear();
        AssertThrow(additional_data.skip_singular_band_correction,
                    ExcSingularBandSystem(level,
                                          system.restriction.n_band_dofs()));

        LogStream::Prefix prefix("InterfaceBandSmoother");
        deallog << "Band system on level " << level << " with "
                << system.restriction.n_band_dofs()
                << " DoFs is singular, band correction disabled" << std::endl;
      }
  }



  void
  InterfaceBandSmoother::clear()
  {
    band_systems.resize(0, 0);
    hierarchy = nullptr;
  }



  void
  InterfaceBandSmoother::smooth(const unsigned int    level,
                                Vector<double>       &u,
                                const Vector<double> &rhs) const
  {
    for (unsigned int step = 0; step < additional_data.n_steps; ++step)
      {
        relax(level, u, rhs);
        correct_interface(level, u, rhs);
      }
  }



  void
  InterfaceBandSmoother::smooth_adjoint(const unsigned int    level,
                                        Vector<double>       &u,
                                        const Vector<double> &rhs) const
  {
    for (unsigned int step = 0; step < additional_data.n_steps; ++step)
      {
        correct_interface(level, u, rhs);
        relax(level, u, rhs);
      }
  }



  void
  InterfaceBandSmoother::relax(const unsigned int    level,
                               Vector<double>       &u,
                               const Vector<double> &rhs) const
  {
    Assert(hierarchy != nullptr, ExcNotInitialized());
    const SparseMatrix<double> &matrix = (*hierarchy)[level].matrix;
    AssertDimension(u.size(), matrix.m());
    AssertDimension(rhs.size(), matrix.m());

    matrix.SSOR_step(u, rhs, additional_data.relaxation);
  }



  void
  InterfaceBandSmoother::correct_interface(const unsigned int    level,
                                           Vector<double>       &u,
                                           const Vector<double> &rhs) const
  {
    Assert(hierarchy != nullptr, ExcNotInitialized());
    const BandSystem &system = band_systems[level];
    if (!system.factorized)
      return;

    const SparseMatrix<double> &matrix = (*hierarchy)[level].matrix;
    system.residual.reinit(u.size(), true);
    matrix.residual(system.residual, u, rhs);

    system.restriction.restrict_vector(system.residual, system.band_residual);
    system.band_correction.reinit(system.band_residual.size(), true);
    system.solver.vmult(system.band_correction, system.band_residual);
    system.restriction.extend_add(system.band_correction, u);
  }



  bool
  InterfaceBandSmoother::has_band_correction(const unsigned int level) const
  {
    return band_systems[level].factorized;
  }



  const BandRestriction &
  InterfaceBandSmoother::get_band_restriction(const unsigned int level) const
  {
    return band_systems[level].restriction;
  }



  const SparseMatrix<double> &
  InterfaceBandSmoother::get_band_matrix(const unsigned int level) const
  {
    return band_systems[level].matrix;
  }
} // namespace dealii::CutMG
