#include <torch/torch.h>

#include "dpoutput/torch/version.h"
#include "dpoutput/torch/misc.hpp"
#include "dpoutput/torch/category.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "./internal/utils.hpp"

namespace dpoutput_torch {

std::string version() {
    return DPOUTPUT_TORCH_VERSION;
}

// categories of the outputs evaluators request when they do not need
// per-atom values
static const std::array<OutputVariableCategory, 4> SYSTEM_CATEGORIES = {
    OutputVariableCategory::REDU,
    OutputVariableCategory::DERV_R,
    OutputVariableCategory::DERV_C_REDU,
    OutputVariableCategory::DERV_R_DERV_R,
};

std::vector<std::string> requested_outputs(
    const ModelOutputDef& output_def,
    bool atomic
) {
    if (atomic) {
        return output_def->keys();
    }

    auto requested = std::vector<std::string>();
    for (const auto& entry: output_def->get_data()) {
        auto category = entry.value()->category();
        auto is_system = std::any_of(SYSTEM_CATEGORIES.begin(), SYSTEM_CATEGORIES.end(),
            [&](OutputVariableCategory c) { return to_int(c) == category; }
        );
        if (is_system) {
            requested.emplace_back(entry.key());
        }
    }
    return requested;
}

std::vector<int64_t> evaluation_shape(
    const OutputVariableDef& var_def,
    int64_t nframes,
    int64_t natoms
) {
    if (nframes < 0 || natoms < 0) {
        C10_THROW_ERROR(ValueError,
            "invalid number of frames or atoms: expected non-negative values, got nframes=" +
            std::to_string(nframes) + " and natoms=" + std::to_string(natoms)
        );
    }

    auto shape = var_def->shape();
    if (var_def->size() < 0) {
        TORCH_WARN(
            "the shape of '", var_def->name(), "' (", details::format_shape(shape), ") ",
            "contains a dimension of unknown size, it will be kept as -1"
        );
    }

    auto result = std::vector<int64_t>{nframes};
    auto category = var_def->category();
    if (category == to_int(OutputVariableCategory::DERV_R_DERV_R)) {
        // [nframes, *base_shape, 3 * natoms, 3 * natoms], omitting scalar
        // base shapes
        if (shape.size() < 2) {
            C10_THROW_ERROR(ValueError,
                "invalid shape for hessian '" + var_def->name() + "': expected at least "
                "two dimensions, got " + details::format_shape(shape)
            );
        }
        auto base = std::vector<int64_t>(shape.begin(), shape.end() - 2);
        if (!(base.size() == 1 && base[0] == 1)) {
            result.insert(result.end(), base.begin(), base.end());
        }
        result.push_back(3 * natoms);
        result.push_back(3 * natoms);
        return result;
    }

    if (category == to_int(OutputVariableCategory::OUT)
        || category == to_int(OutputVariableCategory::DERV_R)
        || category == to_int(OutputVariableCategory::DERV_C)) {
        if (var_def->atomic()) {
            result.push_back(natoms);
        }
    } else if (category != to_int(OutputVariableCategory::REDU)
        && category != to_int(OutputVariableCategory::DERV_C_REDU)) {
        C10_THROW_ERROR(ValueError,
            "can not evaluate '" + var_def->name() + "': unknown category " +
            category_name(category)
        );
    }

    result.insert(result.end(), shape.begin(), shape.end());
    return result;
}

} // namespace dpoutput_torch
