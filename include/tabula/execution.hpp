#pragma once

#include <tabula/execution/call_stack.hpp>
#include <tabula/execution/error.hpp>
#include <tabula/execution/execution_context.hpp>
#include <tabula/execution/executor.hpp>
