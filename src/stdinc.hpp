
#ifndef FAUNA__x__STDINC_HPP
#define FAUNA__x__STDINC_HPP

// Keep this small
#include "fauna/foundation.hpp"

#ifdef __cplusplus

#include "fauna/utils/string-utils.hpp"
#include "fauna/utils/tick-tock.hpp"

#include <string_view>

#endif

#endif
