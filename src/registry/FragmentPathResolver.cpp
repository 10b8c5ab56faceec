#include "datamodel-schema/registry/FragmentPathResolver.hpp"

#include <filesystem>
#include <string>

namespace dmschema {
namespace registry {

static std::string strip_file_scheme(const std::string &s) {
  const std::string file_scheme = "file://";
  if (s.rfind(file_scheme, 0) == 0) {
    std::string out = s.substr(file_scheme.size());
#ifdef _WIN32
    // "file:///C:/path..." leaves a slash in front of the drive letter
    if (out.size() >= 3 && out[0] == '/' && out[2] == ':') {
      out.erase(0, 1);
    }
#endif
    return out;
  }
  return s;
}

static bool is_regular(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

std::optional<std::string>
resolve_fragment_path(const std::string &ref,
                      const std::string &referrer_source,
                      const std::vector<std::string> &search_paths) {
  std::string candidate = strip_file_scheme(ref);
  if (candidate.empty()) {
    return std::nullopt;
  }

  std::filesystem::path p(candidate);

  if (p.is_absolute()) {
    if (is_regular(p)) {
      return std::filesystem::canonical(p).string();
    }
    return std::nullopt;
  }

  // Colocated fragments take precedence over the search paths
  if (!referrer_source.empty()) {
    std::filesystem::path attempt =
        std::filesystem::path(referrer_source).parent_path() / p;
    if (is_regular(attempt)) {
      return std::filesystem::canonical(attempt).string();
    }
  }

  for (const auto &dir : search_paths) {
    std::filesystem::path attempt = std::filesystem::path(dir) / p;
    if (is_regular(attempt)) {
      return std::filesystem::canonical(attempt).string();
    }
  }

  return std::nullopt;
}

} // namespace registry
} // namespace dmschema
