#include "discovery/oui.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace netmon_agent::discovery {
namespace {

std::string hex_key(const std::string& text, std::size_t max_digits) {
  std::string key;
  for (const char c : text) {
    if (std::isxdigit(static_cast<unsigned char>(c)) != 0) {
      key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
      if (key.size() == max_digits) {
        break;
      }
    } else if (c != ':' && c != '-' && c != '.') {
      break;
    }
  }
  return key;
}

std::string trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

}  // namespace

OuiDatabase OuiDatabase::load(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return OuiDatabase{};
  }
  std::ostringstream content;
  content << input.rdbuf();
  return parse(content.str());
}

OuiDatabase OuiDatabase::parse(const std::string& text) {
  OuiDatabase database;
  std::istringstream input(text);
  std::string line;
  while (std::getline(input, line)) {
    const auto marker = line.find("(hex)");
    if (marker == std::string::npos) {
      continue;
    }
    const std::string prefix = trim(line.substr(0, marker));
    const std::string vendor = trim(line.substr(marker + 5));
    if (!vendor.empty()) {
      database.add(prefix, vendor);
    }
  }
  return database;
}

void OuiDatabase::add(const std::string& prefix, std::string vendor) {
  const std::string key = hex_key(prefix, 6);
  if (key.size() == 6) {
    vendors_[key] = std::move(vendor);
  }
}

std::optional<std::string> OuiDatabase::lookup(const std::string& mac) const {
  const std::string key = hex_key(mac, 6);
  if (key.size() != 6) {
    return std::nullopt;
  }
  const auto it = vendors_.find(key);
  if (it == vendors_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace netmon_agent::discovery
