#ifndef DPOUTPUT_TORCH_MISC_HPP
#define DPOUTPUT_TORCH_MISC_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <torch/types.h>

#include "dpoutput/torch/exports.h"
#include "dpoutput/torch/variable.hpp"
#include "dpoutput/torch/output_def.hpp"

namespace dpoutput_torch {

/// Get the runtime version of dpoutput-torch as a string
DPOUTPUT_TORCH_EXPORT std::string version();

/// Get the names of the outputs an evaluator should request from a model
/// with the given `output_def`. If `atomic` is false, only per-system
/// quantities and forces are requested.
DPOUTPUT_TORCH_EXPORT std::vector<std::string> requested_outputs(
    const ModelOutputDef& output_def,
    bool atomic
);

/// Get the shape of the array an evaluator returns for `var_def`, for
/// `nframes` frames of `natoms` atoms each.
DPOUTPUT_TORCH_EXPORT std::vector<int64_t> evaluation_shape(
    const OutputVariableDef& var_def,
    int64_t nframes,
    int64_t natoms
);

}

#endif
