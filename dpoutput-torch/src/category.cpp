#include <torch/script.h>

#include <array>
#include <string>
#include <utility>

#include "dpoutput/torch/category.hpp"
#include "dpoutput/torch/variable.hpp"

using namespace dpoutput_torch;

static const std::array<std::pair<OutputVariableOperation, const char*>, 5> OPERATION_NAMES = {{
    {OutputVariableOperation::REDU, "REDU"},
    {OutputVariableOperation::DERV_R, "DERV_R"},
    {OutputVariableOperation::DERV_C, "DERV_C"},
    {OutputVariableOperation::SEC_DERV_R, "SEC_DERV_R"},
    {OutputVariableOperation::MAG, "MAG"},
}};

static const std::array<std::pair<OutputVariableCategory, const char*>, 8> CATEGORY_NAMES = {{
    {OutputVariableCategory::OUT, "OUT"},
    {OutputVariableCategory::REDU, "REDU"},
    {OutputVariableCategory::DERV_R, "DERV_R"},
    {OutputVariableCategory::DERV_C, "DERV_C"},
    {OutputVariableCategory::DERV_C_REDU, "DERV_C_REDU"},
    {OutputVariableCategory::DERV_R_DERV_R, "DERV_R_DERV_R"},
    {OutputVariableCategory::DERV_R_MAG, "DERV_R_MAG"},
    {OutputVariableCategory::DERV_C_MAG, "DERV_C_MAG"},
}};

OutputVariableOperation dpoutput_torch::to_operation(int64_t value) {
    if (value == to_int(OutputVariableOperation::NONE)) {
        return OutputVariableOperation::NONE;
    }

    for (const auto& entry: OPERATION_NAMES) {
        if (to_int(entry.first) == value) {
            return entry.first;
        }
    }

    C10_THROW_ERROR(NotImplementedError,
        "operation " + std::to_string(value) + " not supported"
    );
}

std::string dpoutput_torch::operation_name(OutputVariableOperation op) {
    for (const auto& entry: OPERATION_NAMES) {
        if (entry.first == op) {
            return entry.second;
        }
    }
    return "NONE";
}

std::string dpoutput_torch::category_name(int64_t category) {
    for (const auto& entry: CATEGORY_NAMES) {
        if (to_int(entry.first) == category) {
            return entry.second;
        }
    }

    std::string name;
    int64_t remaining = category;
    for (const auto& entry: OPERATION_NAMES) {
        auto bit = to_int(entry.first);
        if ((category & bit) == bit) {
            if (!name.empty()) {
                name += "|";
            }
            name += entry.second;
            remaining &= ~bit;
        }
    }

    if (remaining != 0) {
        if (!name.empty()) {
            name += "|";
        }
        name += std::to_string(remaining);
    }

    return name;
}

bool dpoutput_torch::check_operation_applied(
    const OutputVariableDef& var_def,
    OutputVariableOperation op
) {
    auto bits = to_int(op);
    return (var_def->category() & bits) == bits;
}

bool dpoutput_torch::check_deriv(const OutputVariableDef& var_def) {
    return check_operation_applied(var_def, OutputVariableOperation::DERV_R)
        || check_operation_applied(var_def, OutputVariableOperation::SEC_DERV_R)
        || check_operation_applied(var_def, OutputVariableOperation::DERV_C);
}

int64_t dpoutput_torch::apply_operation(
    const OutputVariableDef& var_def,
    OutputVariableOperation op
) {
    if (op == OutputVariableOperation::REDU || op == OutputVariableOperation::DERV_C) {
        if (check_operation_applied(var_def, op)) {
            C10_THROW_ERROR(ValueError,
                "operation " + operation_name(op) + " has been applied to '" +
                var_def->name() + "'"
            );
        }
    } else if (op == OutputVariableOperation::DERV_R) {
        if (check_operation_applied(var_def, OutputVariableOperation::DERV_R)) {
            // a derivative of a derivative is a second derivative
            op = OutputVariableOperation::SEC_DERV_R;
            if (check_operation_applied(var_def, OutputVariableOperation::SEC_DERV_R)) {
                C10_THROW_ERROR(ValueError,
                    "operation " + operation_name(op) + " has been applied twice to '" +
                    var_def->name() + "'"
                );
            }
        }
    } else {
        C10_THROW_ERROR(NotImplementedError,
            "operation " + operation_name(op) + " not supported"
        );
    }

    return var_def->category() | to_int(op);
}
