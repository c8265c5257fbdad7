#include <Clima/Utils/Definitions.hpp>
#include <Clima/Utils/Types.hpp>

#include "gtest/gtest.h"

using clima::utils::types::i32;

fn main(i32 argc, char** argv) -> i32 {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
