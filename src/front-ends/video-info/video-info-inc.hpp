#pragma once

#include "fauna/foundation.hpp"

namespace fauna::video_info
{
string brief() noexcept;
int run_main(int argc, char** argv);
} // namespace fauna::video_info
