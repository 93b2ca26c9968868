#pragma once

#include "celio/spec/registry.hpp"

#include <string>
#include <variant>
#include <vector>

// =============================================================================
// FILE: celio/spec/anndata.hpp
// BRIEF: Partial reads of a whole annotated-matrix container
//
// DESIGN NOTES:
// - Row and column selectors are normalized once against the stored obs / var
//   indices, then shared by every dependent slot:
//       obs, obsm        -> (rows, :)
//       var, varm        -> (cols, :)
//       obsp             -> (rows, rows)
//       varp             -> (cols, cols)
//       X, layers        -> (rows, cols)
//       uns              -> no index selection
// =============================================================================

namespace celio::spec {

/// One axis request: a slice, integer positions, a boolean mask over the
/// axis, or labels looked up in the stored index.
using IndexSpec = std::variant<Slice, std::vector<Index>, std::vector<bool>,
                               std::vector<std::string>>;

/// Resolve an IndexSpec against the stored index of its axis.
/// A mask of the wrong length raises DimensionError; an unknown label raises
/// ValueError; labels against a non-text index raise TypeMismatchError.
[[nodiscard]] AxisSelector normalize_index(const IndexSpec& spec, const DenseArray& axis_index);

/* =============================================================================
 * STRUCT: PartialReadOptions
 * =============================================================================
 * FIELDS:
 *     obs_idx, var_idx - Row / column requests (default: everything)
 *     X                - Read the matrix; false substitutes an empty CSR
 *                        matrix of the selected shape
 *     obs ... uns      - Key filters forwarded into each slot
 * -------------------------------------------------------------------------- */
struct PartialReadOptions {
    IndexSpec obs_idx = Slice::all();
    IndexSpec var_idx = Slice::all();
    bool X = true;
    ItemFilter obs;
    ItemFilter var;
    ItemFilter obsm;
    ItemFilter varm;
    ItemFilter obsp;
    ItemFilter varp;
    ItemFilter layers;
    ItemFilter uns;
};

/// Read a subset of the container stored at `root`.
[[nodiscard]] AnnData read_partial(const GroupNode& root,
                                   const PartialReadOptions& options = {},
                                   const IORegistry& registry = default_registry());

} // namespace celio::spec
