#ifndef DPOUTPUT_TORCH_HPP
#define DPOUTPUT_TORCH_HPP

#include "dpoutput/torch/version.h"     // IWYU pragma: export
#include "dpoutput/torch/exports.h"     // IWYU pragma: export

#include "dpoutput/torch/category.hpp"  // IWYU pragma: export
#include "dpoutput/torch/variable.hpp"  // IWYU pragma: export
#include "dpoutput/torch/output_def.hpp"  // IWYU pragma: export
#include "dpoutput/torch/outputs.hpp"   // IWYU pragma: export
#include "dpoutput/torch/checked.hpp"   // IWYU pragma: export
#include "dpoutput/torch/fittings.hpp"  // IWYU pragma: export
#include "dpoutput/torch/misc.hpp"      // IWYU pragma: export

#endif
