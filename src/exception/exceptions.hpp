#pragma once
#include "relay_exception.hpp"
