#pragma once
// TSK402_Command_Validation closed program allowlist

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nr::exec {

struct AllowlistEntry {
  std::string id;                   // canonical identifier, also the first token clients send
  std::string executable;           // handed to execvp; defaults to id
  std::vector<std::string> aliases; // absolute paths accepted in place of id
};

// A closed set of literal program names. Lookup is an exact byte match of the
// first command token against an id or one of its aliases; there are no
// patterns, prefixes or case folding.
class Allowlist {
 public:
  Allowlist() = default;
  // Throws nr::Error{ErrorDomain::Config} on an invalid or duplicate entry.
  explicit Allowlist(std::vector<AllowlistEntry> entries);

  // Security tooling the gateway fronts by default.
  static Allowlist BuiltIn();

  const AllowlistEntry* Resolve(std::string_view token) const;
  const std::vector<AllowlistEntry>& entries() const noexcept { return entries_; }
  bool empty() const noexcept { return entries_.empty(); }

 private:
  std::vector<AllowlistEntry> entries_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace nr::exec
