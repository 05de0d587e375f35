#pragma once

#include <strata/strata.hpp>
