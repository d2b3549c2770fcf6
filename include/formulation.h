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


#ifndef formulation_h
#define formulation_h

#include <deal.II/base/config.h>

#include <string>
#include <variant>

namespace dealii::CutMG
{
  /**
   * Symmetric Nitsche formulation: the interface conditions are imposed weakly
   * through a penalty and flux averages, the cut cells are stabilized with a
   * ghost penalty.
   */
  struct PenaltyFormulation
  {
    double nitsche_penalty = 20.;

    double ghost_penalty = 0.1;
  };



  /**
   * Mixed formulation with a Lagrange multiplier on the interface. Only the
   * ghost penalty acts on the primal cut cells.
   */
  struct MixedFormulation
  {
    double ghost_penalty = 0.1;
  };



  /**
   * The formulation an assembly service is asked to discretize. The multigrid
   * components never look into it, they only hand it on.
   */
  using Formulation = std::variant<PenaltyFormulation, MixedFormulation>;



  /**
   * Ghost penalty parameter of any formulation.
   */
  inline double
  ghost_penalty_parameter(const Formulation &formulation)
  {
    return std::visit([](const auto &f) { return f.ghost_penalty; },
                      formulation);
  }



  inline std::string
  formulation_name(const Formulation &formulation)
  {
    return std::holds_alternative<PenaltyFormulation>(formulation) ?
             "penalty" :
             "mixed";
  }
} // namespace dealii::CutMG

#endif
