#include "core/access/access_control.hpp"

#include <algorithm>
#include <utility>

#include "core/model/names.hpp"

namespace sentinel {

AccessControl::AccessControl(Principal owner, std::initializer_list<Role> managed_roles)
    : owner_(std::move(owner)), managed_roles_(managed_roles) {
  for (const Role role : managed_roles_) {
    auto& set = members_[role];
    if (!owner_.empty()) {
      set.insert(owner_.value);
    }
  }
}

bool AccessControl::manages(Role role) const {
  return std::ranges::find(managed_roles_, role) != managed_roles_.end();
}

bool AccessControl::is_owner(const Principal& principal) const {
  return !principal.empty() && principal == owner_;
}

bool AccessControl::has_role(const Principal& principal, Role role) const {
  if (principal.empty()) {
    return false;
  }
  if (is_owner(principal)) {
    return true;
  }
  const auto it = members_.find(role);
  return it != members_.end() && it->second.contains(principal.value);
}

std::vector<std::string> AccessControl::members(Role role) const {
  std::vector<std::string> out;
  const auto it = members_.find(role);
  if (it == members_.end()) {
    return out;
  }
  out.assign(it->second.begin(), it->second.end());
  std::ranges::sort(out);
  return out;
}

Result AccessControl::authorize(const Principal& caller, Role role, std::string_view operation) const {
  if (!has_role(caller, role)) {
    return Result::failure(ErrorCode::Unauthorized, "`" + std::string{operation} + "` requires the " +
                                                        std::string{role_name(role)} + " role.");
  }
  return Result::success();
}

Result AccessControl::authorize_owner(const Principal& caller, std::string_view operation) const {
  if (!is_owner(caller)) {
    return Result::failure(ErrorCode::Unauthorized,
                           "`" + std::string{operation} + "` is restricted to the registry owner.");
  }
  return Result::success();
}

Result AccessControl::validate_role_change(const Principal& caller, Role role, const Principal& principal,
                                           std::string_view operation) const {
  if (const Result auth = authorize_owner(caller, operation); !auth.ok) {
    return auth;
  }
  if (!manages(role)) {
    return Result::failure(ErrorCode::InvalidInput,
                           "Role " + std::string{role_name(role)} + " is not used by this registry.");
  }
  if (principal.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Role changes require a non-empty principal.");
  }
  return Result::success();
}

Result AccessControl::grant(const Principal& caller, Role role, const Principal& principal) {
  if (const Result valid = validate_role_change(caller, role, principal, "grant_role"); !valid.ok) {
    return valid;
  }
  if (!members_[role].insert(principal.value).second) {
    return Result::failure(ErrorCode::NoOpRejected,
                           principal.value + " already holds the " + std::string{role_name(role)} + " role.");
  }
  return Result::success("Role granted.");
}

Result AccessControl::revoke(const Principal& caller, Role role, const Principal& principal) {
  if (const Result valid = validate_role_change(caller, role, principal, "revoke_role"); !valid.ok) {
    return valid;
  }
  if (is_owner(principal)) {
    return Result::failure(ErrorCode::InvalidInput, "The registry owner cannot be removed from a role.");
  }
  if (members_[role].erase(principal.value) == 0U) {
    return Result::failure(ErrorCode::NoOpRejected,
                           principal.value + " does not hold the " + std::string{role_name(role)} + " role.");
  }
  return Result::success("Role revoked.");
}

Result AccessControl::transfer_ownership(const Principal& caller, const Principal& new_owner) {
  if (const Result auth = authorize_owner(caller, "transfer_ownership"); !auth.ok) {
    return auth;
  }
  if (new_owner.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "New owner must be a non-empty principal.");
  }
  if (new_owner == owner_) {
    return Result::failure(ErrorCode::InvalidInput, "New owner is already the registry owner.");
  }

  owner_ = new_owner;
  for (const Role role : managed_roles_) {
    members_[role].insert(owner_.value);
  }
  return Result::success("Ownership transferred.");
}

}  // namespace sentinel
