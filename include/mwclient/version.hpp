#pragma once

#include <regex>
#include <stdexcept>
#include <string>

namespace mwclient {

enum class server_flavor { unknown, scale, community };

/// Parsed middleware version, e.g. "TrueNAS-SCALE-24.10.2.4".
struct server_version {
  int major = 0;
  int minor = 0;
  int patch = 0;
  int build = 0;
  server_flavor flavor = server_flavor::unknown;
  std::string raw;

  /// -1, 0 or 1.
  int compare(const server_version &other) const {
    if (major != other.major)
      return major < other.major ? -1 : 1;
    if (minor != other.minor)
      return minor < other.minor ? -1 : 1;
    if (patch != other.patch)
      return patch < other.patch ? -1 : 1;
    if (build != other.build)
      return build < other.build ? -1 : 1;
    return 0;
  }

  bool at_least(int want_major, int want_minor) const {
    if (major != want_major)
      return major > want_major;
    return minor >= want_minor;
  }

  std::string str() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." +
           std::to_string(patch) + "." + std::to_string(build);
  }
};

/// Throws std::invalid_argument when no dotted version is present.
inline server_version parse_version(const std::string &raw) {
  static const std::regex version_re(R"((\d+)\.(\d+)\.(\d+)(?:\.(\d+))?)");

  server_version v;
  v.raw = raw;
  if (raw.find("SCALE") != std::string::npos)
    v.flavor = server_flavor::scale;
  else if (raw.find("COMMUNITY") != std::string::npos)
    v.flavor = server_flavor::community;

  std::smatch m;
  if (!std::regex_search(raw, m, version_re))
    throw std::invalid_argument("unable to parse version from \"" + raw + "\"");

  try {
    v.major = std::stoi(m[1].str());
    v.minor = std::stoi(m[2].str());
    v.patch = std::stoi(m[3].str());
    if (m[4].matched)
      v.build = std::stoi(m[4].str());
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("version component out of range in \"" + raw +
                                "\"");
  }
  return v;
}

} // namespace mwclient
