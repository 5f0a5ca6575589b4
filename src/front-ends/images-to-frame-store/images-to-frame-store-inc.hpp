#pragma once

#include "fauna/foundation.hpp"

namespace fauna::images_to_frame_store
{
string brief() noexcept;
int run_main(int argc, char** argv);
} // namespace fauna::images_to_frame_store
