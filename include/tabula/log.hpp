#pragma once

#include <tabula/log/log.hpp>
