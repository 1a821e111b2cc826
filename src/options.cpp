#include "options.hpp"

options_t _options;
