#pragma once

#include "fauna/foundation.hpp"

namespace fauna::to_frame_store
{
string brief() noexcept;
int run_main(int argc, char** argv);
} // namespace fauna::to_frame_store
