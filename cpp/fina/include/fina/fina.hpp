#pragma once

#include "aggregator.hpp"
#include "dates.hpp"
#include "errors.hpp"
#include "fina_data.hpp"
#include "planner.hpp"
#include "reader.hpp"
#include "types.hpp"
