#pragma once
#include <string>

namespace XmlJsonBridge {

// Whole-file helpers; both throw std::runtime_error when the file cannot be
// opened.
std::string read_file(const std::string &path);
void write_file(const std::string &path, const std::string &data);

std::string trim(const std::string &s);
bool is_whitespace_only(const char *s);

} // namespace XmlJsonBridge
