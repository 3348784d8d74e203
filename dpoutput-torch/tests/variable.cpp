#include <torch/torch.h>

#include "dpoutput/torch.hpp"
using namespace dpoutput_torch;

#include <catch.hpp>
using namespace Catch::Matchers;

TEST_CASE("Output variable definitions") {
    SECTION("defaults") {
        auto var = torch::make_intrusive<OutputVariableDefHolder>("energy", std::vector<int64_t>{1});
        CHECK(var->name() == "energy");
        CHECK(var->shape() == std::vector<int64_t>{1});
        CHECK(var->size() == 1);
        CHECK_FALSE(var->reducible());
        CHECK_FALSE(var->r_differentiable());
        CHECK_FALSE(var->c_differentiable());
        CHECK(var->atomic());
        CHECK_FALSE(var->intensive());
        CHECK_FALSE(var->r_hessian());
        CHECK_FALSE(var->magnetic());
        CHECK(var->category() == to_int(OutputVariableCategory::OUT));
    }

    SECTION("size") {
        auto var = torch::make_intrusive<OutputVariableDefHolder>("polar", std::vector<int64_t>{3, 3});
        CHECK(var->size() == 9);

        var = torch::make_intrusive<OutputVariableDefHolder>("scalar", std::vector<int64_t>{});
        CHECK(var->size() == 1);

        var = torch::make_intrusive<OutputVariableDefHolder>("empty", std::vector<int64_t>{4, 0});
        CHECK(var->size() == 0);

        // unknown dimensions are not counted
        var = torch::make_intrusive<OutputVariableDefHolder>("dos", std::vector<int64_t>{2, -1});
        CHECK(var->size() == -1);
    }

    SECTION("valid flags") {
        // all combinations of flags satisfying the invariants
        for (int flags = 0; flags < 64; flags++) {
            bool reducible = flags & 1;
            bool r_differentiable = flags & 2;
            bool c_differentiable = flags & 4;
            bool atomic = flags & 8;
            bool r_hessian = flags & 16;
            bool intensive = flags & 32;

            bool valid = (!c_differentiable || r_differentiable)
                && (!reducible || atomic)
                && (!intensive || reducible)
                && (!r_hessian || (reducible && r_differentiable));

            auto create = [&]() {
                return torch::make_intrusive<OutputVariableDefHolder>(
                    "foo", std::vector<int64_t>{2, 3},
                    reducible, r_differentiable, c_differentiable, atomic,
                    to_int(OutputVariableCategory::OUT),
                    r_hessian,
                    /*magnetic=*/ false,
                    intensive
                );
            };

            if (valid) {
                CHECK(create()->size() == 6);
            } else {
                CHECK_THROWS_AS(create(), c10::ValueError);
            }
        }
    }

    SECTION("invalid flags") {
        auto shape = std::vector<int64_t>{1};
        CHECK_THROWS_WITH(
            torch::make_intrusive<OutputVariableDefHolder>("foo", shape, false, false, true),
            StartsWith("invalid output variable 'foo': c_differentiable requires r_differentiable")
        );
        CHECK_THROWS_WITH(
            torch::make_intrusive<OutputVariableDefHolder>("foo", shape, true, false, false, false),
            StartsWith("invalid output variable 'foo': a reducible variable should be atomic")
        );
        CHECK_THROWS_WITH(
            torch::make_intrusive<OutputVariableDefHolder>("foo", shape, false, false, false, true, 0, false, false, true),
            StartsWith("invalid output variable 'foo': an intensive variable should be reducible")
        );
        CHECK_THROWS_WITH(
            torch::make_intrusive<OutputVariableDefHolder>("foo", shape, false, true, false, true, 0, true),
            StartsWith("invalid output variable 'foo': only reducible variable can calculate hessian")
        );
        CHECK_THROWS_WITH(
            torch::make_intrusive<OutputVariableDefHolder>("foo", shape, true, false, false, true, 0, true),
            StartsWith("invalid output variable 'foo': only r_differentiable variable can calculate hessian")
        );
    }

    SECTION("invalid shape, name and category") {
        CHECK_THROWS_WITH(
            torch::make_intrusive<OutputVariableDefHolder>("foo", std::vector<int64_t>{3, -2}),
            StartsWith("invalid output variable 'foo': shape [3, -2] contains a negative dimension")
        );
        CHECK_THROWS_WITH(
            torch::make_intrusive<OutputVariableDefHolder>("", std::vector<int64_t>{3}),
            StartsWith("invalid output variable: the name can not be empty")
        );
        CHECK_THROWS_WITH(
            torch::make_intrusive<OutputVariableDefHolder>("foo", std::vector<int64_t>{3}, false, false, false, true, 32),
            StartsWith("invalid output variable 'foo': category 32 is not a combination of known operations")
        );
        CHECK_THROWS_WITH(
            torch::make_intrusive<OutputVariableDefHolder>("foo", std::vector<int64_t>{3}, false, false, false, true, -1),
            StartsWith("invalid output variable 'foo': category -1 is not a combination of known operations")
        );
    }
}

TEST_CASE("Squeeze output variables") {
    auto var = torch::make_intrusive<OutputVariableDefHolder>(
        "foo", std::vector<int64_t>{1, 3, 1}, /*reducible=*/ true
    );

    // not a unit dimension
    auto squeezed = var->squeeze(1);
    CHECK(squeezed->shape() == std::vector<int64_t>{1, 3, 1});
    CHECK(squeezed->equals(var));

    // out of bounds
    CHECK(var->squeeze(3)->shape() == std::vector<int64_t>{1, 3, 1});
    CHECK(var->squeeze(-4)->shape() == std::vector<int64_t>{1, 3, 1});

    squeezed = var->squeeze(-1);
    CHECK(squeezed->shape() == std::vector<int64_t>{1, 3});
    CHECK(squeezed->size() == 3);
    CHECK(squeezed->reducible());

    squeezed = squeezed->squeeze(0);
    CHECK(squeezed->shape() == std::vector<int64_t>{3});

    // the initial definition is not modified
    CHECK(var->shape() == std::vector<int64_t>{1, 3, 1});
    CHECK(squeezed.get() != var.get());
}

TEST_CASE("Output variable representation and equality") {
    auto var = torch::make_intrusive<OutputVariableDefHolder>(
        "energy_derv_c", std::vector<int64_t>{1, 9},
        true, false, false, true,
        to_int(OutputVariableCategory::DERV_C),
        false,
        /*magnetic=*/ true
    );

    CHECK(var->repr() ==
        "OutputVariableDef(name='energy_derv_c', shape=[1, 9], reducible=True, "
        "r_differentiable=False, c_differentiable=False, atomic=True, "
        "category=DERV_C, magnetic=True)"
    );

    auto same = OutputVariableDefHolder::from_state(var->state());
    CHECK(same->equals(var));
    CHECK(var->equals(same));
    // comparing the handles compares the definitions identity
    CHECK(same != var);

    auto other = torch::make_intrusive<OutputVariableDefHolder>("energy_derv_c", std::vector<int64_t>{1, 9});
    CHECK_FALSE(other->equals(var));
    CHECK_FALSE(var->equals(OutputVariableDef()));
}
