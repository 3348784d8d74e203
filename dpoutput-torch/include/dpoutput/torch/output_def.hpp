#ifndef DPOUTPUT_TORCH_OUTPUT_DEF_HPP
#define DPOUTPUT_TORCH_OUTPUT_DEF_HPP

#include <string>
#include <tuple>
#include <vector>

#include <torch/script.h>

#include "dpoutput/torch/exports.h"
#include "dpoutput/torch/variable.hpp"

namespace dpoutput_torch {

/// Ordered mapping from variable names to their definitions
using OutputVariableDefs = torch::Dict<std::string, OutputVariableDef>;

/// Name of the reduced variable derived from `name`
DPOUTPUT_TORCH_EXPORT std::string get_reduce_name(const std::string& name);

/// Names of the derivatives of `name` w.r.t. coordinates and cell
DPOUTPUT_TORCH_EXPORT std::tuple<std::string, std::string> get_deriv_name(const std::string& name);

/// Names of the magnetic parts of the derivatives of `name` w.r.t.
/// coordinates and cell
DPOUTPUT_TORCH_EXPORT std::tuple<std::string, std::string> get_deriv_name_mag(const std::string& name);

/// Name of the second derivative of `name` w.r.t. coordinates
DPOUTPUT_TORCH_EXPORT std::string get_hessian_name(const std::string& name);

/// Create the definitions of the reduced variables for all reducible
/// variables in `defs`
DPOUTPUT_TORCH_EXPORT OutputVariableDefs do_reduce(const OutputVariableDefs& defs);

/// Create the definitions of the derivatives of all differentiable variables
/// in `defs`. The first mapping contains the derivatives w.r.t. coordinates
/// (and the magnetic part of the derivatives w.r.t. cell), the second one
/// the derivatives w.r.t. cell.
DPOUTPUT_TORCH_EXPORT std::tuple<OutputVariableDefs, OutputVariableDefs> do_derivative(
    const OutputVariableDefs& defs
);

/// Create the definitions of the atomic masks for the variables in `defs`
DPOUTPUT_TORCH_EXPORT OutputVariableDefs do_mask(const OutputVariableDefs& defs);


class FittingOutputDefHolder;
using FittingOutputDef = torch::intrusive_ptr<FittingOutputDefHolder>;

/// Definition of all the outputs of a fitting network, which are computed
/// for each local atom.
class DPOUTPUT_TORCH_EXPORT FittingOutputDefHolder: public torch::CustomClassHolder {
public:
    /// Create a new fitting output definition from a list of variables. If
    /// multiple variables share the same name, the last one is used.
    explicit FittingOutputDefHolder(const std::vector<OutputVariableDef>& var_defs);

    ~FittingOutputDefHolder() override = default;

    /// Get the definition of the variable with the given `name`
    OutputVariableDef get(const std::string& name) const;

    /// Check if this definition contains a variable with the given `name`
    bool contains(const std::string& name) const;

    /// Get all the definitions, in declaration order
    OutputVariableDefs get_data() const {
        return var_defs_.copy();
    }

    /// Get the names of all variables, in declaration order
    std::vector<std::string> keys() const;

    std::string repr() const;

    /// Get the list of definitions, used to pickle this class from TorchScript
    std::vector<OutputVariableDef> state() const;

private:
    OutputVariableDefs var_defs_;
};


class ModelOutputDefHolder;
using ModelOutputDef = torch::intrusive_ptr<ModelOutputDefHolder>;

/// Definition of all the outputs of a model.
///
/// The model reduces and differentiates the fitting network outputs when
/// applicable. If a variable is called `foo`, the reduced variable is called
/// `foo_redu`, the derivative w.r.t. coordinates `foo_derv_r`, the derivative
/// w.r.t. cell `foo_derv_c`, and the second derivative w.r.t. coordinates
/// `foo_derv_r_derv_r`.
class DPOUTPUT_TORCH_EXPORT ModelOutputDefHolder: public torch::CustomClassHolder {
public:
    /// Derive all model outputs from the fitting network outputs
    explicit ModelOutputDefHolder(FittingOutputDef fit_defs);

    ~ModelOutputDefHolder() override = default;

    /// Get the definition of the variable with the given `name`
    OutputVariableDef get(const std::string& name) const;

    /// Check if this definition contains a variable with the given `name`
    bool contains(const std::string& name) const;

    /// Get all the definitions
    OutputVariableDefs get_data() const {
        return var_defs_.copy();
    }

    /// The fitting network definition this was created from
    FittingOutputDef fitting_output_def() const {
        return def_outp_;
    }

    std::vector<std::string> keys() const;
    std::vector<std::string> keys_outp() const;
    std::vector<std::string> keys_redu() const;
    std::vector<std::string> keys_derv_r() const;
    std::vector<std::string> keys_hess_r() const;
    std::vector<std::string> keys_derv_c() const;
    std::vector<std::string> keys_derv_c_redu() const;

    std::string repr() const;

private:
    FittingOutputDef def_outp_;
    OutputVariableDefs def_redu_;
    OutputVariableDefs def_derv_r_;
    OutputVariableDefs def_derv_c_;
    OutputVariableDefs def_hess_r_;
    OutputVariableDefs def_derv_c_redu_;
    OutputVariableDefs def_mask_;

    OutputVariableDefs var_defs_;
};

}

#endif
