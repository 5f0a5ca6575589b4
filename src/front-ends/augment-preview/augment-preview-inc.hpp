#pragma once

#include "fauna/foundation.hpp"

namespace fauna::augment_preview
{
string brief() noexcept;
int run_main(int argc, char** argv);
} // namespace fauna::augment_preview
