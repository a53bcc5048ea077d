#pragma once

// Umbrella header for the Airfield core library

#include "airfield/types.hpp"
#include "airfield/log.hpp"
#include "airfield/geo.hpp"
#include "airfield/results.hpp"
#include "airfield/network.hpp"
#include "airfield/config.hpp"
#include "airfield/search_index.hpp"
#include "airfield/input.hpp"
#include "airfield/airfield.hpp"
