#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace netmon_agent::discovery {

// IEEE OUI vendor registry keyed by the first three MAC octets ("AABBCC").
class OuiDatabase {
 public:
  OuiDatabase() = default;

  // Reads the IEEE oui.txt format ("00-00-0C   (hex)\t\tCisco Systems, Inc").
  // A missing file yields an empty database.
  static OuiDatabase load(const std::string& path);
  static OuiDatabase parse(const std::string& text);

  void add(const std::string& prefix, std::string vendor);
  [[nodiscard]] std::optional<std::string> lookup(const std::string& mac) const;
  [[nodiscard]] std::size_t size() const noexcept { return vendors_.size(); }

 private:
  std::unordered_map<std::string, std::string> vendors_{};
};

}  // namespace netmon_agent::discovery
