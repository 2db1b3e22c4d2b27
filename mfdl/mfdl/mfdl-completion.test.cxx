#include <mfdl/mfdl-completion.hxx>

#include <string>
#include <vector>
#include <cassert>
#include <sstream>
#include <stdexcept>

using namespace std;
using namespace mfdl;

static string
script (completion_shell s)
{
  ostringstream o;
  print_completion (o, s);
  return o.str ();
}

static void
test_shells ()
{
  assert (to_completion_shell ("bash") == completion_shell::bash);
  assert (to_completion_shell ("zsh") == completion_shell::zsh);
  assert (to_completion_shell ("fish") == completion_shell::fish);
  assert (to_completion_shell ("powershell") == completion_shell::powershell);
  assert (to_completion_shell ("elvish") == completion_shell::elvish);

  for (const char* s: {"", "Bash", "tcsh", "pwsh"})
  {
    bool thrown (false);
    try
    {
      to_completion_shell (s);
    }
    catch (const invalid_argument&)
    {
      thrown = true;
    }
    assert (thrown);
  }
}

// Every script completes the options and offers every shell for
// --completion.
//
static void
test_scripts ()
{
  vector<completion_shell> all {completion_shell::bash,
                                completion_shell::zsh,
                                completion_shell::fish,
                                completion_shell::powershell,
                                completion_shell::elvish};

  for (completion_shell s: all)
  {
    string t (script (s));

    assert (t.find ("mfdl") != string::npos);
    assert (t.find ("no-progress") != string::npos);
    assert (t.find ("insecure") != string::npos);

    for (const char* n: {"bash", "zsh", "fish", "powershell", "elvish"})
      assert (t.find (n) != string::npos);
  }

  assert (script (completion_shell::powershell).find (
            "Register-ArgumentCompleter") != string::npos);
  assert (script (completion_shell::elvish).find (
            "edit:completion:arg-completer[mfdl]") != string::npos);
}

int
main ()
{
  test_shells ();
  test_scripts ();
}
