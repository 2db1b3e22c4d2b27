#pragma once

#include <string>
#include <ostream>

namespace mfdl
{
  // Shells we can generate a completion script for.
  //
  enum class completion_shell
  {
    bash,
    zsh,
    fish,
    powershell,
    elvish
  };

  // Parse the shell name. Throw std::invalid_argument if unknown.
  //
  completion_shell
  to_completion_shell (const std::string&);

  // Write the completion script for the shell.
  //
  void
  print_completion (std::ostream&, completion_shell);
}
