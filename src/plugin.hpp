#pragma once
#include <rack.hpp>

using namespace rack;

extern Plugin* pluginInstance;

#include "utilities.hpp"

extern Model* modelPrism;
