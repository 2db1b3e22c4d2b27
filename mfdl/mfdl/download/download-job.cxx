#include <mfdl/download/download-job.hxx>

#include <utility>

#include <mfdl/http/http-url.hxx>

using namespace std;

namespace mfdl
{
  download_job::
  download_job (string u, fs::path t)
    : url (move (u)),
      name (t.filename ().string ()),
      target (move (t)),
      partial (partial_path (target))
  {
  }

  fs::path
  partial_path (const fs::path& t)
  {
    fs::path r (t);
    r += partial_suffix;
    return r;
  }

  download_job
  make_download_job (string url, const fs::path& dir)
  {
    string n (url_filename (url));
    return download_job (move (url), dir / n);
  }
}
