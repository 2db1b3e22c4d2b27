#include <mfdl/mfdl-completion.hxx>

#include <stdexcept>

using namespace std;

namespace mfdl
{
  completion_shell
  to_completion_shell (const string& s)
  {
    if (s == "bash") return completion_shell::bash;
    if (s == "zsh")  return completion_shell::zsh;
    if (s == "fish") return completion_shell::fish;
    if (s == "powershell") return completion_shell::powershell;
    if (s == "elvish") return completion_shell::elvish;

    throw invalid_argument ("unsupported shell '" + s + "' (expected bash, "
                            "zsh, fish, powershell, or elvish)");
  }

  static const char bash_script[] = R"~(# mfdl bash completion
_mfdl ()
{
  local cur prev opts
  COMPREPLY=()
  cur="${COMP_WORDS[COMP_CWORD]}"
  prev="${COMP_WORDS[COMP_CWORD-1]}"
  opts="--help --version --urls -u --dest -d --workers -w --clean -c --completion --no-progress --verbose -v --max-retries --connect-timeout --timeout --insecure"

  case "${prev}" in
    --dest|-d)
      COMPREPLY=( $(compgen -d -- "${cur}") )
      return 0
      ;;
    --completion)
      COMPREPLY=( $(compgen -W "bash zsh fish powershell elvish" -- "${cur}") )
      return 0
      ;;
    --urls|-u|--workers|-w|--max-retries|--connect-timeout|--timeout)
      return 0
      ;;
  esac

  COMPREPLY=( $(compgen -W "${opts}" -- "${cur}") )
  return 0
}
complete -F _mfdl mfdl
)~";

  static const char zsh_script[] = R"~(#compdef mfdl

_arguments \
  '--help[print usage information and exit]' \
  '--version[print version and exit]' \
  '(-u --urls)'{-u,--urls}'[comma-separated list of URLs]:list:' \
  '(-d --dest)'{-d,--dest}'[destination directory]:dir:_directories' \
  '(-w --workers)'{-w,--workers}'[maximum parallel downloads]:num:' \
  '(-c --clean)'{-c,--clean}'[remove the destination directory first]' \
  '--completion[print completion script]:shell:(bash zsh fish powershell elvish)' \
  '--no-progress[do not display progress bars]' \
  '(-v --verbose)'{-v,--verbose}'[print a line for each finished file]' \
  '--max-retries[throttled requests before giving up]:num:' \
  '--connect-timeout[connection timeout in seconds]:sec:' \
  '--timeout[inactivity timeout in seconds]:sec:' \
  '--insecure[do not verify TLS certificates]'
)~";

  static const char fish_script[] = R"~(# mfdl fish completion
complete -c mfdl -l help -d 'Print usage information and exit'
complete -c mfdl -l version -d 'Print version and exit'
complete -c mfdl -s u -l urls -r -d 'Comma-separated list of URLs'
complete -c mfdl -s d -l dest -r -a '(__fish_complete_directories)' -d 'Destination directory'
complete -c mfdl -s w -l workers -r -d 'Maximum parallel downloads'
complete -c mfdl -s c -l clean -d 'Remove the destination directory first'
complete -c mfdl -l completion -r -a 'bash zsh fish powershell elvish' -d 'Print completion script'
complete -c mfdl -l no-progress -d 'Do not display progress bars'
complete -c mfdl -s v -l verbose -d 'Print a line for each finished file'
complete -c mfdl -l max-retries -r -d 'Throttled requests before giving up'
complete -c mfdl -l connect-timeout -r -d 'Connection timeout in seconds'
complete -c mfdl -l timeout -r -d 'Inactivity timeout in seconds'
complete -c mfdl -l insecure -d 'Do not verify TLS certificates'
)~";

  static const char powershell_script[] = R"~(# mfdl PowerShell completion
using namespace System.Management.Automation

Register-ArgumentCompleter -Native -CommandName 'mfdl' -ScriptBlock {
  param($wordToComplete, $commandAst, $cursorPosition)

  $prev = $commandAst.CommandElements |
    Where-Object { $_.Extent.EndOffset -lt $cursorPosition } |
    Select-Object -Last 1

  if ($prev -and $prev.ToString() -eq '--completion') {
    'bash', 'zsh', 'fish', 'powershell', 'elvish' |
      Where-Object { $_ -like "$wordToComplete*" } |
      ForEach-Object {
        [CompletionResult]::new($_, $_, [CompletionResultType]::ParameterValue, $_)
      }
    return
  }

  $options = @(
    @('--help', 'Print usage information and exit'),
    @('--version', 'Print version and exit'),
    @('--urls', 'Comma-separated list of URLs'),
    @('-u', 'Comma-separated list of URLs'),
    @('--dest', 'Destination directory'),
    @('-d', 'Destination directory'),
    @('--workers', 'Maximum parallel downloads'),
    @('-w', 'Maximum parallel downloads'),
    @('--clean', 'Remove the destination directory first'),
    @('-c', 'Remove the destination directory first'),
    @('--completion', 'Print completion script'),
    @('--no-progress', 'Do not display progress bars'),
    @('--verbose', 'Print a line for each finished file'),
    @('-v', 'Print a line for each finished file'),
    @('--max-retries', 'Throttled requests before giving up'),
    @('--connect-timeout', 'Connection timeout in seconds'),
    @('--timeout', 'Inactivity timeout in seconds'),
    @('--insecure', 'Do not verify TLS certificates')
  )

  $options |
    Where-Object { $_[0] -like "$wordToComplete*" } |
    ForEach-Object {
      [CompletionResult]::new($_[0], $_[0], [CompletionResultType]::ParameterName, $_[1])
    }
}
)~";

  static const char elvish_script[] = R"~(# mfdl elvish completion
set edit:completion:arg-completer[mfdl] = {|@words|
  var n = (count $words)

  if (> $n 2) {
    var prev = $words[-2]

    if (eq $prev --completion) {
      put bash zsh fish powershell elvish
      return
    }

    if (has-value [--dest -d] $prev) {
      edit:complete-filename $words[-1]
      return
    }
  }

  put --help --version --urls -u --dest -d --workers -w --clean -c ^
      --completion --no-progress --verbose -v --max-retries ^
      --connect-timeout --timeout --insecure
}
)~";

  void
  print_completion (ostream& o, completion_shell s)
  {
    switch (s)
    {
    case completion_shell::bash: o << bash_script; break;
    case completion_shell::zsh:  o << zsh_script;  break;
    case completion_shell::fish: o << fish_script; break;
    case completion_shell::powershell: o << powershell_script; break;
    case completion_shell::elvish: o << elvish_script; break;
    }
  }
}
