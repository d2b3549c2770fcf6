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


#ifndef exceptions_h
#define exceptions_h

#include <deal.II/base/exceptions.h>

#include <string>

namespace dealii::CutMG
{
  /**
   * An operand handed to the level hierarchy (matrix, prolongation, index
   * set) does not have the size implied by the data already stored.
   */
  DeclException2(ExcInconsistentDimension,
                 std::size_t,
                 std::size_t,
                 << "Inconsistent dimension in the multigrid hierarchy: found "
                 << arg1 << " but expected " << arg2 << ".");

  /**
   * The direct factorization of the reduced interface-band system failed.
   */
  DeclException2(ExcSingularBandSystem,
                 unsigned int,
                 std::size_t,
                 << "The interface-band system on level " << arg1 << " ("
                 << arg2 << " DoFs) is singular and cannot be factorized.");

  /**
   * The cut-cell classification does not match the active DoFs or the finite
   * element space of the level it is supposed to describe.
   */
  DeclException1(ExcInvalidBandSelection,
                 std::string,
                 << "Invalid interface band selection: " << arg1);
} // namespace dealii::CutMG

#endif
