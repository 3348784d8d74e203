#ifndef DPOUTPUT_TORCH_OUTPUTS_HPP
#define DPOUTPUT_TORCH_OUTPUTS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <torch/script.h>

#include "dpoutput/torch/exports.h"
#include "dpoutput/torch/variable.hpp"
#include "dpoutput/torch/output_def.hpp"

namespace dpoutput_torch {

/// Outputs of a fitting network or a model, indexed by variable name
using TensorDict = c10::Dict<std::string, torch::Tensor>;

/// Check that `shape` matches the definition `def_shape`. Both must have the
/// same length. If the last entry of `def_shape` is -1, the last dimension of
/// `shape` can take any value.
DPOUTPUT_TORCH_EXPORT void check_shape(
    const std::vector<int64_t>& shape,
    const std::vector<int64_t>& def_shape
);

/// Check that the shape of `var` matches the definition in `var_def`:
/// `[nframes, nloc, *shape]` for atomic variables and `[nframes, *shape]`
/// for the other ones.
DPOUTPUT_TORCH_EXPORT void check_var(const torch::Tensor& var, const OutputVariableDef& var_def);

/// Check that the `outputs` of a model conform to `output_def`. For each
/// fitting-level variable, this checks the variable itself, and its reduced
/// and derivative variables if they are defined.
DPOUTPUT_TORCH_EXPORT void model_check_output(
    const ModelOutputDef& output_def,
    const TensorDict& outputs
);

/// Check that the `outputs` of a fitting network conform to `output_def`
DPOUTPUT_TORCH_EXPORT void fitting_check_output(
    const FittingOutputDef& output_def,
    const TensorDict& outputs
);

}

#endif
