#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

#include <mfdl/download/download-types.hxx>

namespace mfdl
{
  namespace fs = std::filesystem;

  // Suffix appended to the destination file name while it is in progress.
  //
  inline constexpr const char partial_suffix[] = ".part";

  // A single URL-to-file download.
  //
  // The paths are fixed when the job is created; the offset and size are
  // filled in (and may be refined) by the state machine as it runs.
  //
  struct download_job
  {
    std::string   url;
    std::string   name;          // Destination file name (for display).
    fs::path      target;        // Final destination.
    fs::path      partial;       // In-progress counterpart of target.
    std::uint64_t resume_offset {0};
    std::uint64_t expected_size {0}; // 0 if unknown.

    download_job () = default;

    download_job (std::string u, fs::path t);

    bool
    valid () const
    {
      return !url.empty () && !target.empty ();
    }
  };

  inline bool
  operator== (const download_job& x, const download_job& y)
  {
    return x.url == y.url && x.target == y.target;
  }

  inline bool
  operator!= (const download_job& x, const download_job& y)
  {
    return !(x == y);
  }

  // Return the in-progress path for the specified destination, that is, the
  // destination with the partial suffix appended.
  //
  fs::path
  partial_path (const fs::path& target);

  // Create the job for downloading the URL into the directory. The file name
  // is the URL's last path segment.
  //
  download_job
  make_download_job (std::string url, const fs::path& dir);
}
