#include "Utility.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace XmlJsonBridge {

std::string read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    throw std::runtime_error("Failed to open file: " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

void write_file(const std::string &path, const std::string &data) {
  std::ofstream ofs(path, std::ios::binary);
  if (!ofs)
    throw std::runtime_error("Failed to write file: " + path);
  ofs << data;
  if (!ofs)
    throw std::runtime_error("Failed to write file: " + path);
}

std::string trim(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

bool is_whitespace_only(const char *s) {
  if (!s)
    return true;
  while (*s) {
    if (!std::isspace(static_cast<unsigned char>(*s)))
      return false;
    ++s;
  }
  return true;
}

} // namespace XmlJsonBridge
