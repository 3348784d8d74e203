#ifndef DPOUTPUT_TORCH_CHECKED_HPP
#define DPOUTPUT_TORCH_CHECKED_HPP

#include <memory>
#include <vector>

#include <torch/script.h>

#include "dpoutput/torch/exports.h"
#include "dpoutput/torch/output_def.hpp"
#include "dpoutput/torch/outputs.hpp"

namespace dpoutput_torch {

/// Interface for fitting networks, computing per-atom outputs
class DPOUTPUT_TORCH_EXPORT AtomisticFitting {
public:
    virtual ~AtomisticFitting() = default;

    /// Get the definition of the outputs of this fitting network
    virtual FittingOutputDef output_def() const = 0;

    /// Run the fitting network on the given `inputs`
    virtual TensorDict forward(const std::vector<torch::IValue>& inputs) = 0;
};

/// Interface for models, computing the fitting outputs together with their
/// reductions and derivatives
class DPOUTPUT_TORCH_EXPORT AtomisticModel {
public:
    virtual ~AtomisticModel() = default;

    /// Get the definition of the outputs of this model
    virtual ModelOutputDef output_def() const = 0;

    /// Run the model on the given `inputs`
    virtual TensorDict forward(const std::vector<torch::IValue>& inputs) = 0;
};

/// Wrapper around a fitting network checking every output it produces
/// against its output definition.
class DPOUTPUT_TORCH_EXPORT CheckedFitting final: public AtomisticFitting {
public:
    /// Wrap `fitting`, storing its output definition
    explicit CheckedFitting(std::shared_ptr<AtomisticFitting> fitting);

    FittingOutputDef output_def() const override {
        return output_def_;
    }

    /// Run the wrapped fitting network, and check its outputs before
    /// returning them
    TensorDict forward(const std::vector<torch::IValue>& inputs) override;

    /// Get the wrapped fitting network
    const std::shared_ptr<AtomisticFitting>& inner() const {
        return fitting_;
    }

private:
    std::shared_ptr<AtomisticFitting> fitting_;
    FittingOutputDef output_def_;
};

/// Wrapper around a model checking every output it produces against its
/// output definition.
class DPOUTPUT_TORCH_EXPORT CheckedModel final: public AtomisticModel {
public:
    /// Wrap `model`, storing its output definition
    explicit CheckedModel(std::shared_ptr<AtomisticModel> model);

    ModelOutputDef output_def() const override {
        return output_def_;
    }

    /// Run the wrapped model, and check its outputs before returning them
    TensorDict forward(const std::vector<torch::IValue>& inputs) override;

    /// Get the wrapped model
    const std::shared_ptr<AtomisticModel>& inner() const {
        return model_;
    }

private:
    std::shared_ptr<AtomisticModel> model_;
    ModelOutputDef output_def_;
};

}

#endif
