#pragma once

#include "engine.hpp"
#include "reader.hpp"
#include "table.hpp"
