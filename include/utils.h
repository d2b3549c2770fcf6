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


#ifndef utils_h
#define utils_h

#include <deal.II/base/index_set.h>

#include <deal.II/lac/dynamic_sparsity_pattern.h>
#include <deal.II/lac/sparse_matrix.h>
#include <deal.II/lac/sparsity_pattern.h>

#include <exceptions.h>


namespace dealii::CutMG::Utils
{
  /**
   * Number of rows of @p matrix, zero if no sparsity pattern is attached.
   */
  template <typename Number>
  inline types::global_dof_index
  n_rows(const SparseMatrix<Number> &matrix)
  {
    return matrix.empty() ? 0 : matrix.m();
  }



  /**
   * Number of columns of @p matrix, zero if no sparsity pattern is attached.
   */
  template <typename Number>
  inline types::global_dof_index
  n_columns(const SparseMatrix<Number> &matrix)
  {
    return matrix.empty() ? 0 : matrix.n();
  }



  /**
   * Copy @p src into @p dst. Since a SparseMatrix only stores a pointer to its
   * pattern, the pattern is copied into @p sp first and @p dst is then
   * attached to it. Any previous content of @p sp and @p dst is discarded.
   */
  template <typename Number>
  void
  copy_sparse_matrix(const SparseMatrix<Number> &src,
                     SparsityPattern            &sp,
                     SparseMatrix<Number>       &dst)
  {
    dst.clear();
    if (src.empty())
      {
        sp.reinit(0, 0, 0);
        return;
      }

    DynamicSparsityPattern dsp(src.m(), src.n());
    for (auto entry = src.begin(); entry != src.end(); ++entry)
      dsp.add(entry->row(), entry->column());

    sp.copy_from(dsp);
    dst.reinit(sp);

    for (auto entry = src.begin(); entry != src.end(); ++entry)
      dst.set(entry->row(), entry->column(), entry->value());
  }



  /**
   * Given a matrix @p src acting on full level spaces, fill @p dst with the
   * block of rows in @p row_set and columns in @p col_set. Rows and columns of
   * @p dst are numbered by their position within the respective IndexSet,
   * i.e. @p dst is the compressed operator R_row * src * R_col^T.
   *
   * The matrix @p dst (as well as @p sp) are overwritten.
   */
  template <typename Number>
  void
  extract_submatrix(const SparseMatrix<Number> &src,
                    const IndexSet             &row_set,
                    const IndexSet             &col_set,
                    SparsityPattern            &sp,
                    SparseMatrix<Number>       &dst)
  {
    AssertThrow(row_set.size() == n_rows(src),
                ExcInconsistentDimension(row_set.size(), n_rows(src)));
    AssertThrow(col_set.size() == n_columns(src),
                ExcInconsistentDimension(col_set.size(), n_columns(src)));

    dst.clear();

    DynamicSparsityPattern dsp(row_set.n_elements(), col_set.n_elements());
    for (const types::global_dof_index row : row_set)
      {
        const types::global_dof_index local_row = row_set.index_within_set(row);
        for (auto entry = src.begin(row); entry != src.end(row); ++entry)
          if (col_set.is_element(entry->column()))
            dsp.add(local_row, col_set.index_within_set(entry->column()));
      }

    sp.copy_from(dsp);
    dst.reinit(sp);

    for (const types::global_dof_index row : row_set)
      {
        const types::global_dof_index local_row = row_set.index_within_set(row);
        for (auto entry = src.begin(row); entry != src.end(row); ++entry)
          if (col_set.is_element(entry->column()))
            dst.add(local_row,
                    col_set.index_within_set(entry->column()),
                    entry->value());
      }
  }
} // namespace dealii::CutMG::Utils

#endif
