#ifndef DPOUTPUT_TORCH_CATEGORY_HPP
#define DPOUTPUT_TORCH_CATEGORY_HPP

#include <cstdint>
#include <string>

#include <torch/script.h>

#include "dpoutput/torch/exports.h"

namespace dpoutput_torch {

class OutputVariableDefHolder;
/// TorchScript will always manipulate `OutputVariableDefHolder` through a
/// `torch::intrusive_ptr`
using OutputVariableDef = torch::intrusive_ptr<OutputVariableDefHolder>;

/// Operations that can be applied to an output variable to derive a new one.
/// The category of a variable is the bitwise OR of the operations applied to
/// the base variable it comes from.
enum class OutputVariableOperation: int64_t {
    /// No operation
    NONE = 0,
    /// Sum over the atoms of a system
    REDU = 1,
    /// Derivative with respect to the atomic coordinates
    DERV_R = 2,
    /// Derivative with respect to the cell tensor
    DERV_C = 4,
    /// Second derivative with respect to the atomic coordinates
    SEC_DERV_R = 8,
    /// Magnetic part of a derivative
    MAG = 16,
};

/// Named categories of output variables
enum class OutputVariableCategory: int64_t {
    /// Output of the fitting network (e.g. atomic energy)
    OUT = 0,
    /// Reduced output (e.g. system energy)
    REDU = 1,
    /// Negative derivative w.r.t. coordinates (e.g. force)
    DERV_R = 2,
    /// Atomic component of the virial, see PRB 104, 224202 (2021)
    DERV_C = 4,
    /// Virial, the transposed negative gradient with respect to the cell
    /// tensor times the cell tensor, see eq 40 JCP 159, 054801 (2023)
    DERV_C_REDU = 5,
    /// Hessian, the second derivative w.r.t. coordinates
    DERV_R_DERV_R = 10,
    /// Magnetic part of the negative derivative w.r.t. coordinates
    DERV_R_MAG = 18,
    /// Magnetic part of the atomic virial
    DERV_C_MAG = 20,
};

/// Union of the bits of all known operations, any valid category is a subset
/// of these bits
constexpr int64_t ALL_OPERATIONS_MASK = 31;

inline int64_t to_int(OutputVariableOperation op) {
    return static_cast<int64_t>(op);
}

inline int64_t to_int(OutputVariableCategory category) {
    return static_cast<int64_t>(category);
}

/// Convert an integer (coming from TorchScript) to an operation, throwing if
/// it does not correspond to a known operation
DPOUTPUT_TORCH_EXPORT OutputVariableOperation to_operation(int64_t value);

/// Get the name of an operation, e.g. `"DERV_R"`
DPOUTPUT_TORCH_EXPORT std::string operation_name(OutputVariableOperation op);

/// Get a human-readable name for a category: the name of the category if it
/// is one of `OutputVariableCategory`, or the operations it contains joined
/// with `|` otherwise.
DPOUTPUT_TORCH_EXPORT std::string category_name(int64_t category);

/// Apply the operation `op` to the category of `var_def`, and return the new
/// category.
///
/// `REDU` and `DERV_C` can only be applied once. Applying `DERV_R` to a
/// variable that is already a coordinate derivative records a second
/// derivative (`SEC_DERV_R`), and a third application is an error. Other
/// operations are not supported.
DPOUTPUT_TORCH_EXPORT int64_t apply_operation(
    const OutputVariableDef& var_def,
    OutputVariableOperation op
);

/// Check if the operation `op` was already applied to `var_def`
DPOUTPUT_TORCH_EXPORT bool check_operation_applied(
    const OutputVariableDef& var_def,
    OutputVariableOperation op
);

/// Check if `var_def` was obtained through a derivative
DPOUTPUT_TORCH_EXPORT bool check_deriv(const OutputVariableDef& var_def);

}

#endif
