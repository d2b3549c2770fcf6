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


#ifndef multigrid_utils_h
#define multigrid_utils_h


#include <deal.II/base/config.h>

#include <deal.II/lac/sparse_direct.h>
#include <deal.II/lac/sparse_matrix.h>

#include <deal.II/multigrid/mg_base.h>


namespace dealii::CutMG
{
  /**
   * Coarse grid multigrid operator for a direct solver.
   *
   * The matrix of the coarsest level is factorized once in initialize() and
   * every call of operator() performs a forward/backward substitution. The
   * default solver is UMFPACK; any type with the interface of
   * SparseDirectUMFPACK (initialize() and vmult()) can be used.
   */
  template <typename VectorType,
            typename MatrixType       = SparseMatrix<double>,
            typename DirectSolverType = SparseDirectUMFPACK>
  class MGCoarseGridDirectSolver : public MGCoarseGridBase<VectorType>
  {
  public:
    /**
     * Default constructor.
     */
    MGCoarseGridDirectSolver() = default;

    /**
     * Constructor. Factorizes @p matrix right away.
     */
    MGCoarseGridDirectSolver(const MatrixType &matrix);

    /**
     * Compute the factorization of @p matrix. The matrix itself is not
     * referenced afterwards.
     */
    void
    initialize(const MatrixType &matrix);

    /**
     * Release the factorization.
     */
    void
    clear();

    /**
     * Implementation of the abstract function. Solves the coarse system with
     * right hand side @p src exactly.
     */
    virtual void
    operator()(const unsigned int level,
               VectorType        &dst,
               const VectorType  &src) const override;

  private:
    DirectSolverType solver;

    bool initialized = false;
  };



  /* ------------------ Functions for MGCoarseGridDirectSolver ------------ */

  template <typename VectorType, typename MatrixType, typename DirectSolverType>
  MGCoarseGridDirectSolver<VectorType, MatrixType, DirectSolverType>::
    MGCoarseGridDirectSolver(const MatrixType &matrix)
  {
    initialize(matrix);
  }



  template <typename VectorType, typename MatrixType, typename DirectSolverType>
  void
  MGCoarseGridDirectSolver<VectorType, MatrixType, DirectSolverType>::
    initialize(const MatrixType &matrix)
  {
    solver.initialize(matrix);
    initialized = true;
  }



  template <typename VectorType, typename MatrixType, typename DirectSolverType>
  void
  MGCoarseGridDirectSolver<VectorType, MatrixType, DirectSolverType>::clear()
  {
    solver.clear();
    initialized = false;
  }



  template <typename VectorType, typename MatrixType, typename DirectSolverType>
  void
  MGCoarseGridDirectSolver<VectorType, MatrixType, DirectSolverType>::
  operator()(const unsigned int /*level*/,
             VectorType       &dst,
             const VectorType &src) const
  {
    Assert(initialized, ExcNotInitialized());

    dst = 0;
    solver.vmult(dst, src);
  }


} // namespace dealii::CutMG

#endif
