#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/model/types.hpp"

namespace sentinel {

// Role membership for one registry. The owner passes every role check implicitly and is
// also granted explicit membership in every managed role on construction and on transfer.
// Not synchronized; the owning registry serializes access.
class AccessControl {
public:
  AccessControl(Principal owner, std::initializer_list<Role> managed_roles);

  Result grant(const Principal& caller, Role role, const Principal& principal);
  Result revoke(const Principal& caller, Role role, const Principal& principal);
  Result transfer_ownership(const Principal& caller, const Principal& new_owner);

  [[nodiscard]] Result authorize(const Principal& caller, Role role, std::string_view operation) const;
  [[nodiscard]] Result authorize_owner(const Principal& caller, std::string_view operation) const;

  [[nodiscard]] bool manages(Role role) const;
  [[nodiscard]] bool is_owner(const Principal& principal) const;
  [[nodiscard]] bool has_role(const Principal& principal, Role role) const;
  [[nodiscard]] const Principal& owner() const { return owner_; }
  [[nodiscard]] std::vector<std::string> members(Role role) const;

private:
  Result validate_role_change(const Principal& caller, Role role, const Principal& principal,
                              std::string_view operation) const;

  Principal owner_;
  std::vector<Role> managed_roles_;
  std::unordered_map<Role, std::unordered_set<std::string>> members_;
};

}  // namespace sentinel
