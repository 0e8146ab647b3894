#include "nr/exec/allowlist.h"

#include <algorithm>
#include <array>

#include "nr/error.h"

namespace nr::exec {

namespace {

constexpr std::array<std::string_view, 28> kBuiltInTools{
    "netreaper",   "nmap",        "arp-scan",  "netdiscover", "masscan",     "dnsenum",
    "dnsrecon",    "enum4linux",  "onesixtyone", "nikto",     "sslscan",     "sslyze",
    "nuclei",      "gobuster",    "dirb",      "feroxbuster", "sqlmap",      "commix",
    "xsstrike",    "hashcat",     "aircrack-ng", "airmon-ng", "airodump-ng", "aireplay-ng",
    "hcxpcapngtool", "reaver",    "wifite",    "bettercap"};

constexpr std::array<std::string_view, 2> kAliasDirectories{"/usr/bin/", "/usr/local/bin/"};

bool IsSafeIdentifier(std::string_view id) {
  if (id.empty() || id.size() > 64) {
    return false;
  }
  return std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
           c == '_' || c == '.';
  });
}

bool IsSafeAbsolutePath(std::string_view path) {
  if (path.size() < 2 || path.front() != '/' || path.back() == '/') {
    return false;
  }
  if (path.find("/../") != std::string_view::npos || path.find("/./") != std::string_view::npos ||
      path.ends_with("/..") || path.ends_with("/.") || path.find("//") != std::string_view::npos) {
    return false;
  }
  return std::all_of(path.begin(), path.end(), [](char c) {
    return static_cast<unsigned char>(c) > 0x20 && c != 0x7F && c != '\\';
  });
}

[[noreturn]] void ThrowConfig(const std::string& message) {
  throw Error(ErrorDomain::Config, errors::config::kInvalidValue, message);
}

}  // namespace

Allowlist::Allowlist(std::vector<AllowlistEntry> entries) : entries_(std::move(entries)) {
  for (size_t i = 0; i < entries_.size(); ++i) {
    auto& entry = entries_[i];
    if (!IsSafeIdentifier(entry.id)) {
      ThrowConfig("Allowlist entry has an invalid id");
    }
    if (entry.executable.empty()) {
      entry.executable = entry.id;
    } else if (!IsSafeIdentifier(entry.executable) && !IsSafeAbsolutePath(entry.executable)) {
      ThrowConfig("Allowlist entry " + entry.id + " has an invalid executable");
    }
    if (!index_.emplace(entry.id, i).second) {
      ThrowConfig("Duplicate allowlist name " + entry.id);
    }
    for (const auto& alias : entry.aliases) {
      if (!IsSafeAbsolutePath(alias)) {
        ThrowConfig("Allowlist entry " + entry.id + " has an alias that is not an absolute path");
      }
      if (!index_.emplace(alias, i).second) {
        ThrowConfig("Duplicate allowlist name " + alias);
      }
    }
  }
}

Allowlist Allowlist::BuiltIn() {
  std::vector<AllowlistEntry> entries;
  entries.reserve(kBuiltInTools.size());
  for (auto tool : kBuiltInTools) {
    AllowlistEntry entry;
    entry.id = std::string(tool);
    for (auto dir : kAliasDirectories) {
      entry.aliases.push_back(std::string(dir) + std::string(tool));
    }
    entries.push_back(std::move(entry));
  }
  return Allowlist(std::move(entries));
}

const AllowlistEntry* Allowlist::Resolve(std::string_view token) const {
  auto it = index_.find(std::string(token));
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

}  // namespace nr::exec
