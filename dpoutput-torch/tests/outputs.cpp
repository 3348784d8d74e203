#include <torch/torch.h>

#include "dpoutput/torch.hpp"
using namespace dpoutput_torch;

#include <catch.hpp>
using namespace Catch::Matchers;

static TensorDict energy_outputs(int64_t nframes, int64_t natoms) {
    auto outputs = TensorDict();
    outputs.insert("energy", torch::zeros({nframes, natoms, 1}));
    outputs.insert("energy_redu", torch::zeros({nframes, 1}));
    outputs.insert("energy_derv_r", torch::zeros({nframes, natoms, 1, 3}));
    outputs.insert("energy_derv_c", torch::zeros({nframes, natoms, 1, 9}));
    return outputs;
}

TEST_CASE("Check shapes") {
    CHECK_NOTHROW(check_shape({4, 5}, {4, 5}));
    CHECK_NOTHROW(check_shape({}, {}));

    // the last dimension can have any size
    CHECK_NOTHROW(check_shape({4, 5}, {4, -1}));
    CHECK_NOTHROW(check_shape({4, 100}, {4, -1}));
    CHECK_NOTHROW(check_shape({7}, {-1}));

    CHECK_THROWS_AS(check_shape({4, 5}, {3, 5}), c10::ValueError);
    CHECK_THROWS_WITH(
        check_shape({4, 5}, {3, 5}),
        StartsWith("[4, 5] shape not matching def [3, 5]")
    );
    CHECK_THROWS_WITH(
        check_shape({3, 5}, {4, -1}),
        StartsWith("[3] shape not matching def [4]")
    );

    CHECK_THROWS_AS(check_shape({4}, {4, 5}), c10::ValueError);
    CHECK_THROWS_WITH(
        check_shape({4}, {4, 5}),
        StartsWith("[4] length not matching def [4, 5]")
    );
    CHECK_THROWS_WITH(
        check_shape({4, 5, 1}, {4, -1}),
        StartsWith("[4, 5, 1] length not matching def [4, -1]")
    );

    // -1 is only a wildcard in the last position
    CHECK_THROWS_WITH(
        check_shape({4, 5}, {-1, 5}),
        StartsWith("[4, 5] shape not matching def [-1, 5]")
    );
}

TEST_CASE("Check variables") {
    SECTION("atomic variable") {
        auto var_def = torch::make_intrusive<OutputVariableDefHolder>(
            "dipole", std::vector<int64_t>{3}, /*reducible=*/ true
        );

        CHECK_NOTHROW(check_var(torch::zeros({2, 5, 3}), var_def));
        // any number of frames and atoms
        CHECK_NOTHROW(check_var(torch::zeros({1, 0, 3}), var_def));

        CHECK_THROWS_WITH(
            check_var(torch::zeros({2, 5, 4}), var_def),
            StartsWith("invalid shape for 'dipole' output: [4] shape not matching def [3]")
        );
        CHECK_THROWS_WITH(
            check_var(torch::zeros({2, 3}), var_def),
            StartsWith("invalid shape for 'dipole' output: [] length not matching def [3] (full shape is [2, 3])")
        );
        CHECK_THROWS_WITH(
            check_var(torch::zeros({2, 5, 3, 1}), var_def),
            StartsWith("invalid shape for 'dipole' output: [3, 1] length not matching def [3] (full shape is [2, 5, 3, 1])")
        );
    }

    SECTION("non-atomic variable") {
        auto var_def = torch::make_intrusive<OutputVariableDefHolder>(
            "dipole_redu", std::vector<int64_t>{3},
            false, false, false, /*atomic=*/ false,
            to_int(OutputVariableCategory::REDU)
        );

        CHECK_NOTHROW(check_var(torch::zeros({2, 3}), var_def));

        CHECK_THROWS_WITH(
            check_var(torch::zeros({2, 5, 3}), var_def),
            StartsWith("invalid shape for 'dipole_redu' output: [5, 3] length not matching def [3]")
        );
        CHECK_THROWS_WITH(
            check_var(torch::zeros({2, 2}), var_def),
            StartsWith("invalid shape for 'dipole_redu' output: [2] shape not matching def [3]")
        );
    }

    SECTION("unknown size") {
        auto var_def = torch::make_intrusive<OutputVariableDefHolder>(
            "dos", std::vector<int64_t>{-1}, /*reducible=*/ true
        );
        CHECK_NOTHROW(check_var(torch::zeros({2, 5, 100}), var_def));
        CHECK_NOTHROW(check_var(torch::zeros({2, 5, 7}), var_def));
        CHECK_THROWS_AS(check_var(torch::zeros({2, 5}), var_def), c10::ValueError);
    }

    SECTION("undefined tensor") {
        auto var_def = torch::make_intrusive<OutputVariableDefHolder>(
            "energy", std::vector<int64_t>{1}
        );
        CHECK_THROWS_WITH(
            check_var(torch::Tensor(), var_def),
            StartsWith("invalid value for 'energy' output: the tensor is undefined")
        );
    }
}

TEST_CASE("Check model outputs") {
    auto output_def = torch::make_intrusive<ModelOutputDefHolder>(energy_fitting_output_def());

    SECTION("valid outputs") {
        auto outputs = energy_outputs(2, 6);
        CHECK_NOTHROW(model_check_output(output_def, outputs));

        // additional outputs are not checked
        outputs.insert("energy_derv_c_redu", torch::zeros({2, 1, 9}));
        outputs.insert("something_else", torch::zeros({3}));
        CHECK_NOTHROW(model_check_output(output_def, outputs));
    }

    SECTION("missing outputs") {
        for (const auto* name: {"energy", "energy_redu", "energy_derv_r", "energy_derv_c"}) {
            auto outputs = energy_outputs(2, 6);
            outputs.erase(name);
            CHECK_THROWS_WITH(
                model_check_output(output_def, outputs),
                StartsWith(std::string("the model did not produce the '") + name + "' output")
            );
        }
    }

    SECTION("invalid shapes") {
        auto outputs = energy_outputs(2, 6);
        outputs.insert_or_assign("energy_derv_r", torch::zeros({2, 6, 3}));
        CHECK_THROWS_WITH(
            model_check_output(output_def, outputs),
            StartsWith("invalid shape for 'energy_derv_r' output: [3] length not matching def [1, 3]")
        );

        outputs = energy_outputs(2, 6);
        outputs.insert_or_assign("energy_redu", torch::zeros({2, 6, 1}));
        CHECK_THROWS_WITH(
            model_check_output(output_def, outputs),
            StartsWith("invalid shape for 'energy_redu' output")
        );

        outputs = energy_outputs(2, 6);
        outputs.insert_or_assign("energy_derv_c", torch::zeros({2, 6, 1, 3}));
        CHECK_THROWS_WITH(
            model_check_output(output_def, outputs),
            StartsWith("invalid shape for 'energy_derv_c' output: [1, 3] shape not matching def [1, 9]")
        );
    }

    SECTION("not differentiable") {
        output_def = torch::make_intrusive<ModelOutputDefHolder>(dipole_fitting_output_def("dipole", false, false));

        auto outputs = TensorDict();
        outputs.insert("dipole", torch::zeros({2, 6, 3}));
        CHECK_THROWS_WITH(
            model_check_output(output_def, outputs),
            StartsWith("the model did not produce the 'dipole_redu' output")
        );

        outputs.insert("dipole_redu", torch::zeros({2, 3}));
        CHECK_NOTHROW(model_check_output(output_def, outputs));
    }
}

TEST_CASE("Check fitting outputs") {
    auto output_def = torch::make_intrusive<FittingOutputDefHolder>(std::vector<OutputVariableDef>{
        torch::make_intrusive<OutputVariableDefHolder>("energy", std::vector<int64_t>{1}, true, true, true),
        torch::make_intrusive<OutputVariableDefHolder>("dos", std::vector<int64_t>{-1}, true),
    });

    auto outputs = TensorDict();
    outputs.insert("energy", torch::zeros({2, 6, 1}));
    outputs.insert("dos", torch::zeros({2, 6, 250}));
    CHECK_NOTHROW(fitting_check_output(output_def, outputs));

    // fitting networks do not compute derivatives
    outputs.insert("energy_derv_r", torch::zeros({2}));
    CHECK_NOTHROW(fitting_check_output(output_def, outputs));

    outputs.erase("dos");
    CHECK_THROWS_WITH(
        fitting_check_output(output_def, outputs),
        StartsWith("the model did not produce the 'dos' output")
    );

    outputs.insert("dos", torch::zeros({2, 250}));
    CHECK_THROWS_WITH(
        fitting_check_output(output_def, outputs),
        StartsWith("invalid shape for 'dos' output: [] length not matching def [-1]")
    );
}
