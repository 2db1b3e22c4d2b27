#pragma once

#include <string>
#include <vector>
#include <optional>

namespace mfdl
{
  // URL parts structure.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
  };

  // Parse a simple URL string into its components.
  //
  // Note that we are doing this manually here to avoid introducing a
  // dependency on a full-blown URI library. This handles the standard
  // scheme://host:port/path format but does not understand IPv6 literals or
  // user info.
  //
  url_parts
  parse_url (const std::string&);

  // Return the URL in a normalized form if it is an absolute http:// or
  // https:// URL with a non-empty host and a valid port. Otherwise return
  // nullopt.
  //
  std::optional<std::string>
  validate_url (const std::string&);

  // Split a comma-separated URL list, trimming whitespace and dropping
  // empty and malformed entries. Malformed entries are appended to
  // rejected, if specified.
  //
  std::vector<std::string>
  split_url_list (const std::string&,
                  std::vector<std::string>* rejected = nullptr);

  // Return the last path segment of the URL, ignoring the query and
  // fragment, or "downloaded_file" if there is none.
  //
  std::string
  url_filename (const std::string&);
}
