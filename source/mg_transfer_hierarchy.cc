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

#include <mg_transfer_hierarchy.h>

namespace dealii::CutMG
{
  MGTransferHierarchy::MGTransferHierarchy(const LevelHierarchy &hierarchy_)
  {
    initialize(hierarchy_);
  }



  void
  MGTransferHierarchy::initialize(const LevelHierarchy &hierarchy_)
  {
    Assert(hierarchy_.n_levels() > 0, ExcInternalError());
    hierarchy = &hierarchy_;
  }



  void
  MGTransferHierarchy::clear()
  {
    hierarchy = nullptr;
  }



  void
  MGTransferHierarchy::prolongate(const unsigned int    to_level,
                                  Vector<double>       &dst,
                                  const Vector<double> &src) const
  {
    dst = 0.;
    prolongate_and_add(to_level, dst, src);
  }



  void
  MGTransferHierarchy::prolongate_and_add(const unsigned int    to_level,
                                          Vector<double>       &dst,
                                          const Vector<double> &src) const
  {
    Assert(hierarchy != nullptr, ExcNotInitialized());
    Assert(to_level > 0, ExcIndexRange(to_level, 1, hierarchy->n_levels()));

    const SparseMatrix<double> &prolongation =
      (*hierarchy)[to_level].prolongation;
    AssertDimension(dst.size(), prolongation.m());
    AssertDimension(src.size(), prolongation.n());

    prolongation.vmult_add(dst, src);
  }



  void
  MGTransferHierarchy::restrict_and_add(const unsigned int    from_level,
                                        Vector<double>       &dst,
                                        const Vector<double> &src) const
  {
    Assert(hierarchy != nullptr, ExcNotInitialized());
    Assert(from_level > 0,
           ExcIndexRange(from_level, 1, hierarchy->n_levels()));

    const SparseMatrix<double> &prolongation =
      (*hierarchy)[from_level].prolongation;
    AssertDimension(dst.size(), prolongation.n());
    AssertDimension(src.size(), prolongation.m());

    prolongation.Tvmult_add(dst, src);
  }
} // namespace dealii::CutMG
