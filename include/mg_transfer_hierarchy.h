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


#ifndef mg_transfer_hierarchy_h
#define mg_transfer_hierarchy_h


#include <deal.II/base/config.h>

#include <deal.II/base/smartpointer.h>

#include <deal.II/lac/vector.h>

#include <deal.II/multigrid/mg_base.h>

#include <level_hierarchy.h>

namespace dealii::CutMG
{
  /**
   * This class implements the transfer between consecutive levels of a
   * LevelHierarchy, i.e. between the spaces of active DoFs of two meshes. The
   * prolongation matrices stored in the hierarchy are used as they are and
   * their transposes are used for the restriction.
   *
   * Only a pointer to the hierarchy is stored, so its lifetime needs to
   * exceed the usage in this class.
   */
  class MGTransferHierarchy : public MGTransferBase<Vector<double>>
  {
  public:
    MGTransferHierarchy() = default;

    /**
     * Constructor. It takes the hierarchy holding the transfer matrices.
     */
    MGTransferHierarchy(const LevelHierarchy &hierarchy);

    void
    initialize(const LevelHierarchy &hierarchy);

    void
    clear();

    /**
     * Perform prolongation from a coarse level vector @p src to a fine one
     * @p dst. The previous content of dst is overwritten.
     */
    void
    prolongate(const unsigned int    to_level,
               Vector<double>       &dst,
               const Vector<double> &src) const override;


    /**
     * Perform prolongation, summing into the previous content of dst.
     */
    void
    prolongate_and_add(const unsigned int    to_level,
                       Vector<double>       &dst,
                       const Vector<double> &src) const override;


    /**
     * Perform restriction with the transpose of the prolongation, summing into
     * the previous content of dst.
     */
    void
    restrict_and_add(const unsigned int    from_level,
                     Vector<double>       &dst,
                     const Vector<double> &src) const override;

  private:
    SmartPointer<const LevelHierarchy, MGTransferHierarchy> hierarchy;
  };

} // namespace dealii::CutMG


#endif
