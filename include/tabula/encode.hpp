#pragma once

#include <tabula/encode/error.hpp>
#include <tabula/encode/hex.hpp>
