#pragma once

#include <cstddef>
#include <string_view>
#include <system_error>
#include <vector>

namespace tabula::execution {

struct stack_frame final
{
  std::string_view module;
  std::string_view method;
};

class call_stack final
{
public:
  static constexpr std::size_t default_stack_limit = 32;

  call_stack( std::size_t stack_limit = default_stack_limit );

  std::error_code push_frame( stack_frame&& f ) noexcept;
  const stack_frame& peek_frame() const;
  stack_frame pop_frame();
  std::size_t size() const noexcept;
  bool empty() const noexcept;

  /**
   * The frame below the top, if any.
   */
  const stack_frame* caller_frame() const noexcept;

private:
  std::vector< stack_frame > _stack;
  std::size_t _limit;
};

struct frame_guard final
{
  frame_guard( const frame_guard& )            = delete;
  frame_guard( frame_guard&& )                 = delete;
  frame_guard& operator=( const frame_guard& ) = delete;
  frame_guard& operator=( frame_guard&& )      = delete;

  frame_guard( call_stack& stack ):
      _call_stack( &stack )
  {}

  ~frame_guard()
  {
    _call_stack->pop_frame();
  }

private:
  call_stack* _call_stack;
};

} // namespace tabula::execution
