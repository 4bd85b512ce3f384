#pragma once

#include <tabula/memory/memory.hpp>
