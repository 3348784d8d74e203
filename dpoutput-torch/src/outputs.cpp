#include <string>
#include <vector>

#include <torch/script.h>

#include "dpoutput/torch/variable.hpp"
#include "dpoutput/torch/output_def.hpp"
#include "dpoutput/torch/outputs.hpp"

#include "./internal/utils.hpp"

using namespace dpoutput_torch;
using dpoutput_torch::details::format_shape;

static std::vector<int64_t> slice_from(const torch::Tensor& var, size_t start) {
    auto sizes = var.sizes();
    if (start >= sizes.size()) {
        return {};
    }
    return std::vector<int64_t>(sizes.begin() + static_cast<std::ptrdiff_t>(start), sizes.end());
}

/// Compare `shape` with `def_shape`, assuming they have the same length
static void check_shape_content(
    const std::string& context,
    const std::vector<int64_t>& shape,
    const std::vector<int64_t>& def_shape
) {
    if (!def_shape.empty() && def_shape.back() == -1) {
        // the last dimension can have any size
        auto prefix = std::vector<int64_t>(shape.begin(), shape.end() - 1);
        auto def_prefix = std::vector<int64_t>(def_shape.begin(), def_shape.end() - 1);
        if (prefix != def_prefix) {
            C10_THROW_ERROR(ValueError,
                context + format_shape(prefix) + " shape not matching def " + format_shape(def_prefix)
            );
        }
    } else if (shape != def_shape) {
        C10_THROW_ERROR(ValueError,
            context + format_shape(shape) + " shape not matching def " + format_shape(def_shape)
        );
    }
}

void dpoutput_torch::check_shape(
    const std::vector<int64_t>& shape,
    const std::vector<int64_t>& def_shape
) {
    if (shape.size() != def_shape.size()) {
        C10_THROW_ERROR(ValueError,
            format_shape(shape) + " length not matching def " + format_shape(def_shape)
        );
    }
    check_shape_content("", shape, def_shape);
}

void dpoutput_torch::check_var(const torch::Tensor& var, const OutputVariableDef& var_def) {
    const auto& name = var_def->name();
    auto context = "invalid shape for '" + name + "' output: ";
    if (!var.defined()) {
        C10_THROW_ERROR(ValueError,
            "invalid value for '" + name + "' output: the tensor is undefined"
        );
    }

    auto def_shape = var_def->shape();
    // atomic variables are [nframes, nloc, *shape], the other ones
    // are [nframes, *shape]
    size_t leading = var_def->atomic() ? 2 : 1;
    auto shape = slice_from(var, leading);
    if (var.dim() != static_cast<int64_t>(def_shape.size() + leading)) {
        C10_THROW_ERROR(ValueError,
            context + format_shape(shape) + " length not matching def " + format_shape(def_shape) +
            " (full shape is " + format_shape(var.sizes().vec()) + ")"
        );
    }

    check_shape_content(context, shape, def_shape);
}

static torch::Tensor get_output(const TensorDict& outputs, const std::string& name) {
    auto it = outputs.find(name);
    if (it == outputs.end()) {
        C10_THROW_ERROR(ValueError,
            "the model did not produce the '" + name + "' output, which is "
            "required by its output definition"
        );
    }
    return it->value();
}

void dpoutput_torch::model_check_output(
    const ModelOutputDef& output_def,
    const TensorDict& outputs
) {
    for (const auto& name: output_def->keys_outp()) {
        auto var_def = output_def->get(name);
        check_var(get_output(outputs, name), var_def);

        if (var_def->reducible()) {
            auto name_redu = get_reduce_name(name);
            check_var(get_output(outputs, name_redu), output_def->get(name_redu));
        }

        auto names_derv = get_deriv_name(name);
        if (var_def->r_differentiable()) {
            const auto& name_r = std::get<0>(names_derv);
            check_var(get_output(outputs, name_r), output_def->get(name_r));
        }

        if (var_def->c_differentiable()) {
            TORCH_INTERNAL_ASSERT(var_def->r_differentiable());
            const auto& name_c = std::get<1>(names_derv);
            check_var(get_output(outputs, name_c), output_def->get(name_c));
        }
    }
}

void dpoutput_torch::fitting_check_output(
    const FittingOutputDef& output_def,
    const TensorDict& outputs
) {
    for (const auto& name: output_def->keys()) {
        check_var(get_output(outputs, name), output_def->get(name));
    }
}
