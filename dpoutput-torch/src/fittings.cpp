#include <string>
#include <vector>

#include <torch/script.h>

#include "dpoutput/torch/variable.hpp"
#include "dpoutput/torch/output_def.hpp"
#include "dpoutput/torch/fittings.hpp"

using namespace dpoutput_torch;

FittingOutputDef dpoutput_torch::energy_fitting_output_def(
    const std::string& name,
    bool r_hessian,
    bool magnetic
) {
    return torch::make_intrusive<FittingOutputDefHolder>(std::vector<OutputVariableDef>{
        torch::make_intrusive<OutputVariableDefHolder>(
            name,
            std::vector<int64_t>{1},
            /*reducible=*/ true,
            /*r_differentiable=*/ true,
            /*c_differentiable=*/ true,
            /*atomic=*/ true,
            to_int(OutputVariableCategory::OUT),
            r_hessian,
            magnetic
        ),
    });
}

FittingOutputDef dpoutput_torch::dipole_fitting_output_def(
    const std::string& name,
    bool r_differentiable,
    bool c_differentiable
) {
    return torch::make_intrusive<FittingOutputDefHolder>(std::vector<OutputVariableDef>{
        torch::make_intrusive<OutputVariableDefHolder>(
            name,
            std::vector<int64_t>{3},
            /*reducible=*/ true,
            r_differentiable,
            c_differentiable
        ),
    });
}

FittingOutputDef dpoutput_torch::polarizability_fitting_output_def(const std::string& name) {
    return torch::make_intrusive<FittingOutputDefHolder>(std::vector<OutputVariableDef>{
        torch::make_intrusive<OutputVariableDefHolder>(
            name,
            std::vector<int64_t>{3, 3},
            /*reducible=*/ true
        ),
    });
}

FittingOutputDef dpoutput_torch::dos_fitting_output_def(int64_t numb_dos) {
    if (numb_dos == 0 || numb_dos < -1) {
        C10_THROW_ERROR(ValueError,
            "invalid number of DOS points: expected a positive value or -1, got " +
            std::to_string(numb_dos)
        );
    }

    return torch::make_intrusive<FittingOutputDefHolder>(std::vector<OutputVariableDef>{
        torch::make_intrusive<OutputVariableDefHolder>(
            "dos",
            std::vector<int64_t>{numb_dos},
            /*reducible=*/ true
        ),
    });
}

FittingOutputDef dpoutput_torch::property_fitting_output_def(
    const std::string& name,
    int64_t task_dim,
    bool intensive
) {
    if (task_dim <= 0) {
        C10_THROW_ERROR(ValueError,
            "invalid dimension for property '" + name + "': expected a positive value, got " +
            std::to_string(task_dim)
        );
    }

    return torch::make_intrusive<FittingOutputDefHolder>(std::vector<OutputVariableDef>{
        torch::make_intrusive<OutputVariableDefHolder>(
            name,
            std::vector<int64_t>{task_dim},
            /*reducible=*/ true,
            /*r_differentiable=*/ false,
            /*c_differentiable=*/ false,
            /*atomic=*/ true,
            to_int(OutputVariableCategory::OUT),
            /*r_hessian=*/ false,
            /*magnetic=*/ false,
            intensive
        ),
    });
}
