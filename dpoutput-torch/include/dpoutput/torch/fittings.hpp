#ifndef DPOUTPUT_TORCH_FITTINGS_HPP
#define DPOUTPUT_TORCH_FITTINGS_HPP

#include <cstdint>
#include <string>

#include "dpoutput/torch/exports.h"
#include "dpoutput/torch/output_def.hpp"

namespace dpoutput_torch {

/// Output definition of an energy fitting network: a reducible atomic energy
/// of shape `[1]`, giving forces and virial.
DPOUTPUT_TORCH_EXPORT FittingOutputDef energy_fitting_output_def(
    const std::string& name = "energy",
    bool r_hessian = false,
    bool magnetic = false
);

/// Output definition of a dipole fitting network: a reducible atomic dipole
/// of shape `[3]`.
DPOUTPUT_TORCH_EXPORT FittingOutputDef dipole_fitting_output_def(
    const std::string& name = "dipole",
    bool r_differentiable = true,
    bool c_differentiable = true
);

/// Output definition of a polarizability fitting network: a reducible
/// atomic polarizability of shape `[3, 3]`.
DPOUTPUT_TORCH_EXPORT FittingOutputDef polarizability_fitting_output_def(
    const std::string& name = "polarizability"
);

/// Output definition of a density of states fitting network, with
/// `numb_dos` points. `numb_dos = -1` accepts any number of points.
DPOUTPUT_TORCH_EXPORT FittingOutputDef dos_fitting_output_def(int64_t numb_dos);

/// Output definition of a generic property fitting network, predicting
/// `task_dim` values for each atom.
DPOUTPUT_TORCH_EXPORT FittingOutputDef property_fitting_output_def(
    const std::string& name,
    int64_t task_dim,
    bool intensive = false
);

}

#endif
