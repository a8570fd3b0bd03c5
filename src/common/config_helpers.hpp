#pragma once

#include <initializer_list>
#include <string>

#include <cstdint>

namespace q2browse::config {

bool ReadBoolConfig(std::initializer_list<const char*> paths, bool defaultValue);
uint16_t ReadUInt16Config(std::initializer_list<const char*> paths, uint16_t defaultValue);
int ReadIntConfig(std::initializer_list<const char*> paths, int defaultValue);
std::string ReadStringConfig(const char *path, const std::string &defaultValue);

} // namespace q2browse::config
