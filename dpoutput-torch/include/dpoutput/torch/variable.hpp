#ifndef DPOUTPUT_TORCH_VARIABLE_HPP
#define DPOUTPUT_TORCH_VARIABLE_HPP

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

#include <torch/script.h>

#include "dpoutput/torch/exports.h"
#include "dpoutput/torch/category.hpp"

namespace dpoutput_torch {

/// Definition of one output variable of a fitting network or a model: its
/// name, its shape, and how it can be reduced and differentiated.
///
/// Atomic variables are defined for each local atom, and stored in arrays of
/// shape `[nframes, nloc, *shape]`. Non-atomic variables are defined once per
/// system and stored in arrays of shape `[nframes, *shape]`.
///
/// Definitions can not be modified after construction.
class DPOUTPUT_TORCH_EXPORT OutputVariableDefHolder: public torch::CustomClassHolder {
public:
    /// Create a new variable definition, checking that the flags are
    /// consistent with each other.
    ///
    /// @param name name of the variable. Names ending in `_redu`, `_derv_r`,
    ///     `_derv_c`, `_derv_r_mag`, `_derv_c_mag` or `_derv_r_derv_r` are
    ///     reserved for derived variables
    /// @param shape shape of the variable for one atom (or one system if the
    ///     variable is not atomic). `-1` is used for dimensions of unknown size
    /// @param reducible can this variable be summed over atoms
    /// @param r_differentiable should the derivative w.r.t. atomic
    ///     coordinates be computed (e.g. forces)
    /// @param c_differentiable should the derivative w.r.t. the cell tensor
    ///     be computed (e.g. virial). This requires `r_differentiable`
    /// @param atomic is the variable defined for each atom
    /// @param category operations applied to obtain this variable, see
    ///     `OutputVariableOperation`
    /// @param r_hessian should the second derivative w.r.t. atomic
    ///     coordinates be computed
    /// @param magnetic do the derivatives of this variable have magnetic parts
    /// @param intensive is the reduced variable independent of the system size
    OutputVariableDefHolder(
        std::string name,
        std::vector<int64_t> shape,
        bool reducible = false,
        bool r_differentiable = false,
        bool c_differentiable = false,
        bool atomic = true,
        int64_t category = to_int(OutputVariableCategory::OUT),
        bool r_hessian = false,
        bool magnetic = false,
        bool intensive = false
    );

    ~OutputVariableDefHolder() override = default;

    /// name of this variable
    const std::string& name() const {
        return name_;
    }

    /// shape of this variable for a single atom or system
    std::vector<int64_t> shape() const {
        return shape_;
    }

    /// number of elements in this variable for a single atom or system, or
    /// -1 if the shape contains a dimension of unknown size
    int64_t size() const {
        return output_size_;
    }

    bool reducible() const {
        return reducible_;
    }

    bool r_differentiable() const {
        return r_differentiable_;
    }

    bool c_differentiable() const {
        return c_differentiable_;
    }

    bool atomic() const {
        return atomic_;
    }

    bool intensive() const {
        return intensive_;
    }

    bool r_hessian() const {
        return r_hessian_;
    }

    bool magnetic() const {
        return magnetic_;
    }

    int64_t category() const {
        return category_;
    }

    /// Get a copy of this definition without the dimension `dim`, if it
    /// exists and has size 1. Negative values of `dim` count from the end of
    /// the shape. Otherwise, the copy has the same shape as this definition.
    OutputVariableDef squeeze(int64_t dim) const;

    /// Check if this definition and `other` have the same fields
    bool equals(const OutputVariableDef& other) const;

    /// Get a string representation of this definition
    std::string repr() const;

    /// State of this definition, used to pickle it from TorchScript
    using State = std::tuple<
        std::string, std::vector<int64_t>, bool, bool, bool, bool, int64_t, bool, bool, bool
    >;

    /// Get the state of this definition
    State state() const;

    /// Re-create a definition from its state
    static OutputVariableDef from_state(const State& state);

private:
    std::string name_;
    std::vector<int64_t> shape_;
    int64_t output_size_;
    bool reducible_;
    bool r_differentiable_;
    bool c_differentiable_;
    bool atomic_;
    int64_t category_;
    bool r_hessian_;
    bool magnetic_;
    bool intensive_;
};

}

#endif
