/**
 * @file path_utils.cpp
 * @brief Suffix-chain and URL helpers
 */

#include "StaticI18n/i18n/path_utils.hpp"
#include <algorithm>

namespace StaticI18n::i18n::paths {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> splitSegments(const std::string& path) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) {
      end = path.size();
    }
    std::string segment = path.substr(start, end - start);
    if (segment.empty() || segment == ".") {
      // skip
    } else if (segment == ".." && !segments.empty() && segments.back() != "..") {
      segments.pop_back();
    } else {
      segments.push_back(std::move(segment));
    }
    start = end + 1;
  }
  return segments;
}

} // namespace

std::vector<std::string> suffixes(const fs::path& path) {
  std::vector<std::string> result;
  const std::string name = path.filename().string();
  if (name.empty() || name.back() == '.' || name == "..") {
    return result;
  }

  const size_t firstNonDot = name.find_first_not_of('.');
  if (firstNonDot == std::string::npos) {
    return result;
  }

  size_t pos = name.find('.', firstNonDot);
  while (pos != std::string::npos) {
    size_t next = name.find('.', pos + 1);
    result.push_back(name.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
    pos = next;
  }
  return result;
}

std::string suffix(const fs::path& path) {
  auto parts = suffixes(path);
  return parts.empty() ? std::string() : parts.back();
}

std::string stem(const fs::path& path) {
  const std::string name = path.filename().string();
  const std::string last = suffix(path);
  return name.substr(0, name.size() - last.size());
}

fs::path withSuffix(const fs::path& path, const std::string& newSuffix) {
  if (!path.has_filename()) {
    return path;
  }
  return path.parent_path() / (stem(path) + newSuffix);
}

std::string normalize(const fs::path& path) {
  std::string normal = path.lexically_normal().generic_string();
  if (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  return normal;
}

std::string toPosix(const fs::path& path) {
  return path.generic_string();
}

std::string percentEncode(std::string_view url) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string encoded;
  encoded.reserve(url.size());
  for (char c : url) {
    const auto byte = static_cast<unsigned char>(c);
    const bool unreserved = (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z') ||
                            (byte >= '0' && byte <= '9') || byte == '-' || byte == '.' ||
                            byte == '_' || byte == '~' || byte == '/';
    if (unreserved) {
      encoded += c;
    } else {
      encoded += '%';
      encoded += kHex[byte >> 4];
      encoded += kHex[byte & 0x0F];
    }
  }
  return encoded;
}

std::string relativeUrl(const std::string& url, const std::string& other) {
  std::string base = other;
  if (base != ".") {
    const size_t slash = base.rfind('/');
    const std::string tail = slash == std::string::npos ? base : base.substr(slash + 1);
    if (tail.find('.') != std::string::npos) {
      base = slash == std::string::npos ? std::string() : base.substr(0, slash);
    }
  }

  const auto target = splitSegments(url);
  const auto start = splitSegments(base);

  size_t common = 0;
  while (common < target.size() && common < start.size() && target[common] == start[common]) {
    ++common;
  }

  std::string relative;
  for (size_t i = common; i < start.size(); ++i) {
    relative += relative.empty() ? ".." : "/..";
  }
  for (size_t i = common; i < target.size(); ++i) {
    if (!relative.empty()) {
      relative += '/';
    }
    relative += target[i];
  }
  if (relative.empty()) {
    relative = ".";
  }

  if (!url.empty() && url.back() == '/') {
    relative += '/';
  }
  return relative;
}

} // namespace StaticI18n::i18n::paths
