#include <torch/script.h>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "dpoutput/torch/category.hpp"
#include "dpoutput/torch/variable.hpp"

#include "./internal/utils.hpp"

using namespace dpoutput_torch;
using dpoutput_torch::details::format_shape;
using dpoutput_torch::details::python_bool;

OutputVariableDefHolder::OutputVariableDefHolder(
    std::string name,
    std::vector<int64_t> shape,
    bool reducible,
    bool r_differentiable,
    bool c_differentiable,
    bool atomic,
    int64_t category,
    bool r_hessian,
    bool magnetic,
    bool intensive
):
    name_(std::move(name)),
    shape_(std::move(shape)),
    output_size_(1),
    reducible_(reducible),
    r_differentiable_(r_differentiable),
    c_differentiable_(c_differentiable),
    atomic_(atomic),
    category_(category),
    r_hessian_(r_hessian),
    magnetic_(magnetic),
    intensive_(intensive)
{
    auto error_prefix = "invalid output variable '" + name_ + "': ";

    if (name_.empty()) {
        C10_THROW_ERROR(ValueError, "invalid output variable: the name can not be empty");
    }

    bool wildcard = false;
    for (auto dim: shape_) {
        if (dim == -1) {
            wildcard = true;
        } else if (dim < 0) {
            C10_THROW_ERROR(ValueError,
                error_prefix + "shape " + format_shape(shape_) + " contains a negative "
                "dimension, only -1 is allowed for dimensions of unknown size"
            );
        } else {
            output_size_ *= dim;
        }
    }
    if (wildcard) {
        output_size_ = -1;
    }

    if (category_ < 0 || (category_ & ~ALL_OPERATIONS_MASK) != 0) {
        C10_THROW_ERROR(ValueError,
            error_prefix + "category " + std::to_string(category_) +
            " is not a combination of known operations"
        );
    }

    if (c_differentiable_ && !r_differentiable_) {
        C10_THROW_ERROR(ValueError,
            error_prefix + "c_differentiable requires r_differentiable"
        );
    }

    if (reducible_ && !atomic_) {
        C10_THROW_ERROR(ValueError,
            error_prefix + "a reducible variable should be atomic"
        );
    }

    if (intensive_ && !reducible_) {
        C10_THROW_ERROR(ValueError,
            error_prefix + "an intensive variable should be reducible"
        );
    }

    if (r_hessian_) {
        if (!reducible_) {
            C10_THROW_ERROR(ValueError,
                error_prefix + "only reducible variable can calculate hessian"
            );
        }
        if (!r_differentiable_) {
            C10_THROW_ERROR(ValueError,
                error_prefix + "only r_differentiable variable can calculate hessian"
            );
        }
    }
}

OutputVariableDef OutputVariableDefHolder::squeeze(int64_t dim) const {
    auto state = this->state();
    auto& shape = std::get<1>(state);

    auto ndim = static_cast<int64_t>(shape.size());
    if (dim < 0) {
        dim += ndim;
    }

    if (dim >= 0 && dim < ndim && shape[static_cast<size_t>(dim)] == 1) {
        shape.erase(shape.begin() + dim);
    }

    return OutputVariableDefHolder::from_state(state);
}

bool OutputVariableDefHolder::equals(const OutputVariableDef& other) const {
    return other && this->state() == other->state();
}

std::string OutputVariableDefHolder::repr() const {
    std::ostringstream oss;
    oss << "OutputVariableDef(name='" << name_ << "', shape=" << format_shape(shape_);
    oss << ", reducible=" << python_bool(reducible_);
    oss << ", r_differentiable=" << python_bool(r_differentiable_);
    oss << ", c_differentiable=" << python_bool(c_differentiable_);
    oss << ", atomic=" << python_bool(atomic_);
    oss << ", category=" << category_name(category_);
    if (r_hessian_) {
        oss << ", r_hessian=True";
    }
    if (magnetic_) {
        oss << ", magnetic=True";
    }
    if (intensive_) {
        oss << ", intensive=True";
    }
    oss << ")";
    return oss.str();
}

OutputVariableDefHolder::State OutputVariableDefHolder::state() const {
    return State(
        name_,
        shape_,
        reducible_,
        r_differentiable_,
        c_differentiable_,
        atomic_,
        category_,
        r_hessian_,
        magnetic_,
        intensive_
    );
}

OutputVariableDef OutputVariableDefHolder::from_state(const State& state) {
    return torch::make_intrusive<OutputVariableDefHolder>(
        std::get<0>(state),
        std::get<1>(state),
        std::get<2>(state),
        std::get<3>(state),
        std::get<4>(state),
        std::get<5>(state),
        std::get<6>(state),
        std::get<7>(state),
        std::get<8>(state),
        std::get<9>(state)
    );
}
