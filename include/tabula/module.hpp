#pragma once

#include <tabula/module/arguments.hpp>
#include <tabula/module/balances.hpp>
#include <tabula/module/builder.hpp>
#include <tabula/module/context.hpp>
#include <tabula/module/descriptor.hpp>
#include <tabula/module/error.hpp>
#include <tabula/module/registry.hpp>
