#include "catalog/access_control.h"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.h"
#include "utilities/hasher.hpp"
#include "utilities/logger.h"

namespace wttp {

RoleId AccessControl::roleId(const std::string &name) {
  return sha256(name.data(), name.size());
}

const RoleId AccessControl::SUPER_ADMIN_ROLE =
    AccessControl::roleId("SUPER_ADMIN_ROLE");
const RoleId AccessControl::SITE_ADMIN_ROLE =
    AccessControl::roleId("SITE_ADMIN_ROLE");
const RoleId AccessControl::PUBLIC_ROLE = [] {
  RoleId r;
  r.fill(0xff);
  return r;
}();

static std::string roleLabel(const RoleId &role) {
  if (role == AccessControl::SUPER_ADMIN_ROLE)
    return "SUPER_ADMIN_ROLE";
  if (role == AccessControl::SITE_ADMIN_ROLE)
    return "SITE_ADMIN_ROLE";
  if (role == AccessControl::PUBLIC_ROLE)
    return "PUBLIC_ROLE";
  return digestToCid(role);
}

AccessControl::AccessControl(Identity superAdmin)
    : superAdmin_(std::move(superAdmin)) {
  if (superAdmin_.empty()) {
    ThrowMalformedParameter("Super admin identity must not be empty");
  }
}

bool AccessControl::hasRole(const RoleId &role,
                            const Identity &account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (role == SUPER_ADMIN_ROLE)
    return account == superAdmin_;
  auto it = members_.find(role);
  return it != members_.end() && it->second.count(account) > 0;
}

bool AccessControl::isSuperAdmin(const Identity &account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return account == superAdmin_;
}

bool AccessControl::isSiteAdminLocked(const Identity &account) const {
  if (account == superAdmin_)
    return true;
  auto it = members_.find(SITE_ADMIN_ROLE);
  return it != members_.end() && it->second.count(account) > 0;
}

bool AccessControl::isSiteAdmin(const Identity &account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return isSiteAdminLocked(account);
}

bool AccessControl::authorizes(const RoleId &resourceAdminRole,
                               const Identity &caller) const {
  if (resourceAdminRole == PUBLIC_ROLE)
    return true;
  std::lock_guard<std::mutex> lock(mutex_);
  if (isSiteAdminLocked(caller))
    return true;
  if (isZero(resourceAdminRole))
    return false;
  auto it = members_.find(resourceAdminRole);
  return it != members_.end() && it->second.count(caller) > 0;
}

bool AccessControl::canAdminister(const Identity &caller,
                                  const RoleId &role) const {
  if (role == SUPER_ADMIN_ROLE || role == PUBLIC_ROLE || isZero(role))
    return false;
  if (role == SITE_ADMIN_ROLE)
    return caller == superAdmin_;
  return isSiteAdminLocked(caller);
}

void AccessControl::grantRole(const Identity &caller, const RoleId &role,
                              const Identity &account) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (canAdminister(caller, role)) {
      members_[role].insert(account);
      Logger::getInstance().log(LogLevel::INFO, "Role granted",
                                {{"role", roleLabel(role)},
                                 {"account", account},
                                 {"by", caller}});
      return;
    }
  }
  ThrowPermissionDenied(caller, "grant " + roleLabel(role) + " to", account);
}

void AccessControl::revokeRole(const Identity &caller, const RoleId &role,
                               const Identity &account) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (canAdminister(caller, role)) {
      auto it = members_.find(role);
      if (it != members_.end()) {
        it->second.erase(account);
      }
      Logger::getInstance().log(LogLevel::INFO, "Role revoked",
                                {{"role", roleLabel(role)},
                                 {"account", account},
                                 {"by", caller}});
      return;
    }
  }
  ThrowPermissionDenied(caller, "revoke " + roleLabel(role) + " from",
                        account);
}

RoleId AccessControl::createResourceRole(const Identity &caller,
                                         const std::string &name) {
  RoleId role = roleId(name);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isSiteAdminLocked(caller) && role != SUPER_ADMIN_ROLE &&
        role != SITE_ADMIN_ROLE) {
      resourceRoles_.insert(role);
      members_[role];
      Logger::getInstance().log(LogLevel::INFO, "Resource role created",
                                {{"role", name}, {"by", caller}});
      return role;
    }
  }
  ThrowPermissionDenied(caller, "create role", name);
}

bool AccessControl::isResourceRole(const RoleId &role) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resourceRoles_.count(role) > 0;
}

void AccessControl::changeSuperAdmin(const Identity &caller,
                                     const Identity &next) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller == superAdmin_ && !next.empty()) {
      superAdmin_ = next;
      Logger::getInstance().log(LogLevel::WARN, "Super admin changed",
                                {{"from", caller}, {"to", next}});
      return;
    }
  }
  ThrowPermissionDenied(caller, "transfer SUPER_ADMIN_ROLE to", next);
}

Identity AccessControl::superAdmin() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return superAdmin_;
}

bool AccessControl::loadPolicy(const std::string &path) {
  try {
    YAML::Node config = YAML::LoadFile(path);
    applyPolicy(config["roles"]);
    return true;
  } catch (const YAML::Exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "Failed to load role policy",
                              {{"file", path}, {"reason", e.what()}});
    return false;
  }
}

void AccessControl::applyPolicy(const YAML::Node &roles) {
  if (!roles || !roles.IsMap()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : roles) {
    const std::string name = entry.first.as<std::string>();
    RoleId role = roleId(name);
    if (role == SUPER_ADMIN_ROLE) {
      continue;
    }
    if (role != SITE_ADMIN_ROLE) {
      resourceRoles_.insert(role);
    }
    for (const auto &member : entry.second) {
      members_[role].insert(member.as<std::string>());
    }
  }
}

YAML::Node AccessControl::exportState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  YAML::Node node;
  node["super_admin"] = superAdmin_;
  YAML::Node roles(YAML::NodeType::Sequence);
  for (const auto &kv : members_) {
    YAML::Node entry;
    entry["role"] = digestToCid(kv.first);
    entry["resource_role"] = resourceRoles_.count(kv.first) > 0;
    YAML::Node members(YAML::NodeType::Sequence);
    for (const auto &m : kv.second) {
      members.push_back(m);
    }
    entry["members"] = members;
    roles.push_back(entry);
  }
  node["roles"] = roles;
  return node;
}

void AccessControl::importState(const YAML::Node &node) {
  if (!node) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (node["super_admin"]) {
    superAdmin_ = node["super_admin"].as<std::string>();
  }
  if (node["roles"]) {
    for (const auto &entry : node["roles"]) {
      RoleId role = cidToDigest(entry["role"].as<std::string>());
      if (entry["resource_role"] && entry["resource_role"].as<bool>()) {
        resourceRoles_.insert(role);
      }
      auto &members = members_[role];
      for (const auto &m : entry["members"]) {
        members.insert(m.as<std::string>());
      }
    }
  }
}

} // namespace wttp
