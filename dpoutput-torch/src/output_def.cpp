#include <torch/script.h>

#include <array>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include "dpoutput/torch/category.hpp"
#include "dpoutput/torch/variable.hpp"
#include "dpoutput/torch/output_def.hpp"

#include "./internal/utils.hpp"

using namespace dpoutput_torch;
using dpoutput_torch::details::ends_with;
using dpoutput_torch::details::join_names;

// longest suffixes first, for the error message to name the full suffix
static const std::array<const char*, 6> RESERVED_SUFFIXES = {
    "_derv_r_derv_r",
    "_derv_r_mag",
    "_derv_c_mag",
    "_derv_r",
    "_derv_c",
    "_redu",
};

static std::vector<std::string> dict_keys(const OutputVariableDefs& defs) {
    auto keys = std::vector<std::string>();
    keys.reserve(defs.size());
    for (const auto& entry: defs) {
        keys.emplace_back(entry.key());
    }
    return keys;
}

static std::vector<int64_t> append_dim(std::vector<int64_t> shape, int64_t dim) {
    shape.push_back(dim);
    return shape;
}

std::string dpoutput_torch::get_reduce_name(const std::string& name) {
    return name + "_redu";
}

std::tuple<std::string, std::string> dpoutput_torch::get_deriv_name(const std::string& name) {
    return std::make_tuple(name + "_derv_r", name + "_derv_c");
}

std::tuple<std::string, std::string> dpoutput_torch::get_deriv_name_mag(const std::string& name) {
    return std::make_tuple(name + "_derv_r_mag", name + "_derv_c_mag");
}

std::string dpoutput_torch::get_hessian_name(const std::string& name) {
    return name + "_derv_r_derv_r";
}

OutputVariableDefs dpoutput_torch::do_reduce(const OutputVariableDefs& defs) {
    auto def_redu = OutputVariableDefs();
    for (const auto& entry: defs) {
        const auto& var_def = entry.value();
        if (!var_def->reducible()) {
            continue;
        }

        auto name = get_reduce_name(entry.key());
        def_redu.insert(name, torch::make_intrusive<OutputVariableDefHolder>(
            name,
            var_def->shape(),
            /*reducible=*/ false,
            /*r_differentiable=*/ false,
            /*c_differentiable=*/ false,
            /*atomic=*/ false,
            /*category=*/ apply_operation(var_def, OutputVariableOperation::REDU)
        ));
    }
    return def_redu;
}

std::tuple<OutputVariableDefs, OutputVariableDefs> dpoutput_torch::do_derivative(
    const OutputVariableDefs& defs
) {
    auto def_derv_r = OutputVariableDefs();
    auto def_derv_c = OutputVariableDefs();

    for (const auto& entry: defs) {
        const auto& name = entry.key();
        const auto& var_def = entry.value();

        std::string name_r, name_c, name_r_mag, name_c_mag;
        std::tie(name_r, name_c) = get_deriv_name(name);
        std::tie(name_r_mag, name_c_mag) = get_deriv_name_mag(name);

        if (var_def->r_differentiable()) {
            // only the derivatives of base variables can be differentiated
            // again, to get the hessian
            auto hessian = var_def->r_hessian()
                && var_def->category() == to_int(OutputVariableCategory::OUT);
            auto category = apply_operation(var_def, OutputVariableOperation::DERV_R);

            def_derv_r.insert(name_r, torch::make_intrusive<OutputVariableDefHolder>(
                name_r,
                append_dim(var_def->shape(), 3),
                /*reducible=*/ false,
                /*r_differentiable=*/ hessian,
                /*c_differentiable=*/ false,
                /*atomic=*/ true,
                category
            ));

            if (var_def->magnetic()) {
                def_derv_r.insert(name_r_mag, torch::make_intrusive<OutputVariableDefHolder>(
                    name_r_mag,
                    append_dim(var_def->shape(), 3),
                    /*reducible=*/ false,
                    /*r_differentiable=*/ hessian,
                    /*c_differentiable=*/ false,
                    /*atomic=*/ true,
                    category,
                    /*r_hessian=*/ false,
                    /*magnetic=*/ true
                ));
            }
        }

        if (var_def->c_differentiable()) {
            TORCH_INTERNAL_ASSERT(var_def->r_differentiable());
            auto category = apply_operation(var_def, OutputVariableOperation::DERV_C);

            def_derv_c.insert(name_c, torch::make_intrusive<OutputVariableDefHolder>(
                name_c,
                append_dim(var_def->shape(), 9),
                /*reducible=*/ true,
                /*r_differentiable=*/ false,
                /*c_differentiable=*/ false,
                /*atomic=*/ true,
                category
            ));

            if (var_def->magnetic()) {
                // the magnetic virial goes with the coordinate derivatives
                def_derv_r.insert(name_c_mag, torch::make_intrusive<OutputVariableDefHolder>(
                    name_c_mag,
                    append_dim(var_def->shape(), 9),
                    /*reducible=*/ true,
                    /*r_differentiable=*/ false,
                    /*c_differentiable=*/ false,
                    /*atomic=*/ true,
                    category,
                    /*r_hessian=*/ false,
                    /*magnetic=*/ true
                ));
            }
        }
    }

    return std::make_tuple(def_derv_r, def_derv_c);
}

OutputVariableDefs dpoutput_torch::do_mask(const OutputVariableDefs& defs) {
    auto def_mask = OutputVariableDefs();
    // atomic mask, for evaluations with virtual atoms
    def_mask.insert("mask", torch::make_intrusive<OutputVariableDefHolder>(
        "mask", std::vector<int64_t>{1}
    ));

    for (const auto& entry: defs) {
        if (entry.value()->magnetic()) {
            def_mask.insert("mask_mag", torch::make_intrusive<OutputVariableDefHolder>(
                "mask_mag", std::vector<int64_t>{1}
            ));
            break;
        }
    }

    return def_mask;
}

/******************************************************************************/

FittingOutputDefHolder::FittingOutputDefHolder(const std::vector<OutputVariableDef>& var_defs) {
    for (const auto& var_def: var_defs) {
        if (!var_def) {
            C10_THROW_ERROR(ValueError, "invalid fitting output definition: got a null variable");
        }

        const auto& name = var_def->name();
        for (const auto* suffix: RESERVED_SUFFIXES) {
            if (ends_with(name, suffix)) {
                C10_THROW_ERROR(ValueError,
                    "invalid name for fitting output '" + name + "': the '" + suffix +
                    "' suffix is reserved for derived variables"
                );
            }
        }

        if (var_defs_.contains(name)) {
            TORCH_WARN(
                "fitting output '", name, "' is defined multiple times, "
                "only the last definition will be used"
            );
        }
        // the variables are not shared with the caller
        var_defs_.insert_or_assign(name, OutputVariableDefHolder::from_state(var_def->state()));
    }
}

OutputVariableDef FittingOutputDefHolder::get(const std::string& name) const {
    auto it = var_defs_.find(name);
    if (it == var_defs_.end()) {
        C10_THROW_ERROR(IndexError,
            "output variable '" + name + "' is not defined in this fitting output, "
            "available variables are " + join_names(this->keys())
        );
    }
    return it->value();
}

bool FittingOutputDefHolder::contains(const std::string& name) const {
    return var_defs_.contains(name);
}

std::vector<std::string> FittingOutputDefHolder::keys() const {
    return dict_keys(var_defs_);
}

std::string FittingOutputDefHolder::repr() const {
    std::ostringstream oss;
    oss << "FittingOutputDef([";
    for (const auto& entry: var_defs_) {
        oss << "\n    " << entry.value()->repr() << ",";
    }
    if (!var_defs_.empty()) {
        oss << "\n";
    }
    oss << "])";
    return oss.str();
}

std::vector<OutputVariableDef> FittingOutputDefHolder::state() const {
    auto state = std::vector<OutputVariableDef>();
    state.reserve(var_defs_.size());
    for (const auto& entry: var_defs_) {
        state.emplace_back(entry.value());
    }
    return state;
}

/******************************************************************************/

ModelOutputDefHolder::ModelOutputDefHolder(FittingOutputDef fit_defs):
    def_outp_(std::move(fit_defs))
{
    if (!def_outp_) {
        C10_THROW_ERROR(ValueError, "invalid model output definition: got a null fitting output definition");
    }

    auto outp = def_outp_->get_data();
    def_redu_ = do_reduce(outp);
    std::tie(def_derv_r_, def_derv_c_) = do_derivative(outp);
    def_hess_r_ = std::get<0>(do_derivative(def_derv_r_));
    def_derv_c_redu_ = do_reduce(def_derv_c_);
    def_mask_ = do_mask(outp);

    auto all_defs = std::array<const OutputVariableDefs*, 7>{
        &outp,
        &def_redu_,
        &def_derv_c_,
        &def_derv_r_,
        &def_derv_c_redu_,
        &def_hess_r_,
        &def_mask_,
    };

    for (const auto* defs: all_defs) {
        for (const auto& entry: *defs) {
            auto inserted = var_defs_.insert(entry.key(), entry.value());
            if (!inserted.second) {
                C10_THROW_ERROR(ValueError,
                    "invalid model output definition: the variable '" + entry.key() +
                    "' is defined multiple times"
                );
            }
        }
    }
}

OutputVariableDef ModelOutputDefHolder::get(const std::string& name) const {
    auto it = var_defs_.find(name);
    if (it == var_defs_.end()) {
        C10_THROW_ERROR(IndexError,
            "output variable '" + name + "' is not defined in this model output, "
            "available variables are " + join_names(this->keys())
        );
    }
    return it->value();
}

bool ModelOutputDefHolder::contains(const std::string& name) const {
    return var_defs_.contains(name);
}

std::vector<std::string> ModelOutputDefHolder::keys() const {
    return dict_keys(var_defs_);
}

std::vector<std::string> ModelOutputDefHolder::keys_outp() const {
    return def_outp_->keys();
}

std::vector<std::string> ModelOutputDefHolder::keys_redu() const {
    return dict_keys(def_redu_);
}

std::vector<std::string> ModelOutputDefHolder::keys_derv_r() const {
    return dict_keys(def_derv_r_);
}

std::vector<std::string> ModelOutputDefHolder::keys_hess_r() const {
    return dict_keys(def_hess_r_);
}

std::vector<std::string> ModelOutputDefHolder::keys_derv_c() const {
    return dict_keys(def_derv_c_);
}

std::vector<std::string> ModelOutputDefHolder::keys_derv_c_redu() const {
    return dict_keys(def_derv_c_redu_);
}

std::string ModelOutputDefHolder::repr() const {
    std::ostringstream oss;
    oss << "ModelOutputDef([";
    for (const auto& entry: var_defs_) {
        oss << "\n    " << entry.value()->repr() << ",";
    }
    if (!var_defs_.empty()) {
        oss << "\n";
    }
    oss << "])";
    return oss.str();
}
