#include <memory>
#include <utility>
#include <vector>

#include <torch/script.h>

#include "dpoutput/torch/checked.hpp"
#include "dpoutput/torch/outputs.hpp"

using namespace dpoutput_torch;

CheckedFitting::CheckedFitting(std::shared_ptr<AtomisticFitting> fitting):
    fitting_(std::move(fitting))
{
    if (!fitting_) {
        C10_THROW_ERROR(ValueError, "can not check the outputs of a null fitting network");
    }

    output_def_ = fitting_->output_def();
    if (!output_def_) {
        C10_THROW_ERROR(ValueError, "the fitting network returned a null output definition");
    }
}

TensorDict CheckedFitting::forward(const std::vector<torch::IValue>& inputs) {
    auto outputs = fitting_->forward(inputs);
    fitting_check_output(output_def_, outputs);
    return outputs;
}

CheckedModel::CheckedModel(std::shared_ptr<AtomisticModel> model):
    model_(std::move(model))
{
    if (!model_) {
        C10_THROW_ERROR(ValueError, "can not check the outputs of a null model");
    }

    output_def_ = model_->output_def();
    if (!output_def_) {
        C10_THROW_ERROR(ValueError, "the model returned a null output definition");
    }
}

TensorDict CheckedModel::forward(const std::vector<torch::IValue>& inputs) {
    auto outputs = model_->forward(inputs);
    model_check_output(output_def_, outputs);
    return outputs;
}
