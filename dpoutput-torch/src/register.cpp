#include <torch/script.h>

#include "dpoutput/torch/category.hpp"
#include "dpoutput/torch/variable.hpp"
#include "dpoutput/torch/output_def.hpp"
#include "dpoutput/torch/outputs.hpp"
#include "dpoutput/torch/misc.hpp"

using namespace dpoutput_torch;

TORCH_LIBRARY(dpoutput, m) {
    // There is no way to access the docstrings from Python, so we don't bother
    // setting them to something useful here.
    const std::string DOCSTRING;

    m.class_<OutputVariableDefHolder>("OutputVariableDef")
        .def(
            torch::init<
                std::string,
                std::vector<int64_t>,
                bool,
                bool,
                bool,
                bool,
                int64_t,
                bool,
                bool,
                bool
            >(),
            DOCSTRING, {
                torch::arg("name"),
                torch::arg("shape"),
                torch::arg("reducible") = false,
                torch::arg("r_differentiable") = false,
                torch::arg("c_differentiable") = false,
                torch::arg("atomic") = true,
                torch::arg("category") = to_int(OutputVariableCategory::OUT),
                torch::arg("r_hessian") = false,
                torch::arg("magnetic") = false,
                torch::arg("intensive") = false,
            }
        )
        .def_property("name", &OutputVariableDefHolder::name)
        .def_property("shape", &OutputVariableDefHolder::shape)
        .def_property("size", &OutputVariableDefHolder::size)
        .def_property("reducible", &OutputVariableDefHolder::reducible)
        .def_property("r_differentiable", &OutputVariableDefHolder::r_differentiable)
        .def_property("c_differentiable", &OutputVariableDefHolder::c_differentiable)
        .def_property("atomic", &OutputVariableDefHolder::atomic)
        .def_property("intensive", &OutputVariableDefHolder::intensive)
        .def_property("r_hessian", &OutputVariableDefHolder::r_hessian)
        .def_property("magnetic", &OutputVariableDefHolder::magnetic)
        .def_property("category", &OutputVariableDefHolder::category)
        .def("squeeze", &OutputVariableDefHolder::squeeze, DOCSTRING, {torch::arg("dim")})
        .def("__repr__", &OutputVariableDefHolder::repr)
        .def("__str__", &OutputVariableDefHolder::repr)
        .def("__eq__", &OutputVariableDefHolder::equals, DOCSTRING, {torch::arg("other")})
        .def("__ne__", [](const OutputVariableDef& self, const OutputVariableDef& other) {
            return !self->equals(other);
        })
        .def_pickle(
            [](const OutputVariableDef& self) -> OutputVariableDefHolder::State {
                return self->state();
            },
            [](const OutputVariableDefHolder::State& state) -> OutputVariableDef {
                return OutputVariableDefHolder::from_state(state);
            }
        );


    m.class_<FittingOutputDefHolder>("FittingOutputDef")
        .def(
            torch::init<std::vector<OutputVariableDef>>(), DOCSTRING,
            {torch::arg("var_defs")}
        )
        .def("__getitem__", &FittingOutputDefHolder::get, DOCSTRING, {torch::arg("key")})
        .def("__contains__", &FittingOutputDefHolder::contains, DOCSTRING, {torch::arg("key")})
        .def("__repr__", &FittingOutputDefHolder::repr)
        .def("__str__", &FittingOutputDefHolder::repr)
        .def("get_data", &FittingOutputDefHolder::get_data)
        .def("keys", &FittingOutputDefHolder::keys)
        .def_pickle(
            [](const FittingOutputDef& self) -> std::vector<OutputVariableDef> {
                return self->state();
            },
            [](const std::vector<OutputVariableDef>& state) -> FittingOutputDef {
                return torch::make_intrusive<FittingOutputDefHolder>(state);
            }
        );


    m.class_<ModelOutputDefHolder>("ModelOutputDef")
        .def(
            torch::init<FittingOutputDef>(), DOCSTRING,
            {torch::arg("fit_defs")}
        )
        .def("__getitem__", &ModelOutputDefHolder::get, DOCSTRING, {torch::arg("key")})
        .def("__contains__", &ModelOutputDefHolder::contains, DOCSTRING, {torch::arg("key")})
        .def("__repr__", &ModelOutputDefHolder::repr)
        .def("__str__", &ModelOutputDefHolder::repr)
        .def("get_data", &ModelOutputDefHolder::get_data)
        .def_property("def_outp", &ModelOutputDefHolder::fitting_output_def)
        .def("keys", &ModelOutputDefHolder::keys)
        .def("keys_outp", &ModelOutputDefHolder::keys_outp)
        .def("keys_redu", &ModelOutputDefHolder::keys_redu)
        .def("keys_derv_r", &ModelOutputDefHolder::keys_derv_r)
        .def("keys_hess_r", &ModelOutputDefHolder::keys_hess_r)
        .def("keys_derv_c", &ModelOutputDefHolder::keys_derv_c)
        .def("keys_derv_c_redu", &ModelOutputDefHolder::keys_derv_c_redu)
        .def_pickle(
            // the derived definitions are re-created from the fitting
            // definition when loading
            [](const ModelOutputDef& self) -> FittingOutputDef {
                return self->fitting_output_def();
            },
            [](const FittingOutputDef& state) -> ModelOutputDef {
                return torch::make_intrusive<ModelOutputDefHolder>(state);
            }
        );

    // standalone functions
    m.def("version() -> str", version);

    m.def("apply_operation(__torch__.torch.classes.dpoutput.OutputVariableDef var_def, int op) -> int",
        [](const OutputVariableDef& var_def, int64_t op) {
            return apply_operation(var_def, to_operation(op));
        }
    );
    m.def("check_operation_applied(__torch__.torch.classes.dpoutput.OutputVariableDef var_def, int op) -> bool",
        [](const OutputVariableDef& var_def, int64_t op) {
            return check_operation_applied(var_def, to_operation(op));
        }
    );
    m.def("check_deriv(__torch__.torch.classes.dpoutput.OutputVariableDef var_def) -> bool", check_deriv);

    m.def("requested_outputs(__torch__.torch.classes.dpoutput.ModelOutputDef output_def, bool atomic) -> str[]", requested_outputs);
    m.def("evaluation_shape(__torch__.torch.classes.dpoutput.OutputVariableDef var_def, int nframes, int natoms) -> int[]", evaluation_shape);

    // The checking functions have no outputs, so we manually construct their
    // schema to set AliasAnalysisKind to CONSERVATIVE. In turn, this make it
    // so the TorchScript compiler knows these functions have side-effects,
    // and does not remove them from the graph.

    // "check_shape(int[] shape, int[] def_shape) -> ()"
    auto schema = c10::FunctionSchema(
        /*name=*/"check_shape",
        /*overload_name=*/"check_shape",
        /*arguments=*/{
            c10::Argument("shape", c10::getTypePtr<std::vector<int64_t>>()),
            c10::Argument("def_shape", c10::getTypePtr<std::vector<int64_t>>()),
        },
        /*returns=*/{}
    );
    schema.setAliasAnalysis(c10::AliasAnalysisKind::CONSERVATIVE);
    m.def(std::move(schema), check_shape);

    // "check_var(Tensor var, __torch__.torch.classes.dpoutput.OutputVariableDef var_def) -> ()"
    schema = c10::FunctionSchema(
        /*name=*/"check_var",
        /*overload_name=*/"check_var",
        /*arguments=*/{
            c10::Argument("var", c10::getTypePtr<torch::Tensor>()),
            c10::Argument("var_def", c10::getTypePtr<OutputVariableDef>()),
        },
        /*returns=*/{}
    );
    schema.setAliasAnalysis(c10::AliasAnalysisKind::CONSERVATIVE);
    m.def(std::move(schema), check_var);

    // "model_check_output("
    //     "__torch__.torch.classes.dpoutput.ModelOutputDef output_def, "
    //     "Dict[str, Tensor] outputs"
    // ") -> ()",
    schema = c10::FunctionSchema(
        /*name=*/"model_check_output",
        /*overload_name=*/"model_check_output",
        /*arguments=*/{
            c10::Argument("output_def", c10::getTypePtr<ModelOutputDef>()),
            c10::Argument("outputs", c10::getTypePtr<TensorDict>()),
        },
        /*returns=*/{}
    );
    schema.setAliasAnalysis(c10::AliasAnalysisKind::CONSERVATIVE);
    m.def(std::move(schema), model_check_output);

    // "fitting_check_output("
    //     "__torch__.torch.classes.dpoutput.FittingOutputDef output_def, "
    //     "Dict[str, Tensor] outputs"
    // ") -> ()",
    schema = c10::FunctionSchema(
        /*name=*/"fitting_check_output",
        /*overload_name=*/"fitting_check_output",
        /*arguments=*/{
            c10::Argument("output_def", c10::getTypePtr<FittingOutputDef>()),
            c10::Argument("outputs", c10::getTypePtr<TensorDict>()),
        },
        /*returns=*/{}
    );
    schema.setAliasAnalysis(c10::AliasAnalysisKind::CONSERVATIVE);
    m.def(std::move(schema), fitting_check_output);
}
