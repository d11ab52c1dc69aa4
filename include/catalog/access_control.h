#pragma once
#ifndef WTTP_ACCESS_CONTROL_H
#define WTTP_ACCESS_CONTROL_H

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

#include "storage/types.hpp"
#include "utilities/digest.hpp"

namespace wttp {

using RoleId = Digest;

/**
 * @brief Hierarchical role model: super-admin > site-admin > resource roles.
 *
 * The super admin bypasses every check. Site admins are appointed by the
 * super admin and may create, grant and revoke resource-admin roles. A
 * header's resourceAdmin names the role allowed to mutate resources bound
 * to it; PUBLIC_ROLE there lets anyone mutate.
 */
class AccessControl {
public:
  /// Role id for a role name (SHA-256 of the name).
  static RoleId roleId(const std::string &name);

  static const RoleId SUPER_ADMIN_ROLE;
  static const RoleId SITE_ADMIN_ROLE;
  /// All-ones sentinel; never granted, matches every caller.
  static const RoleId PUBLIC_ROLE;

  explicit AccessControl(Identity superAdmin);

  bool hasRole(const RoleId &role, const Identity &account) const;
  bool isSuperAdmin(const Identity &account) const;
  /// Super admins count as site admins.
  bool isSiteAdmin(const Identity &account) const;

  /**
   * @brief isSiteAdmin(caller) OR role == PUBLIC_ROLE OR hasRole(role, caller).
   */
  bool authorizes(const RoleId &resourceAdminRole,
                  const Identity &caller) const;

  /**
   * @brief Grant @p role to @p account.
   * @throw PermissionDenied If @p caller may not administer @p role.
   */
  void grantRole(const Identity &caller, const RoleId &role,
                 const Identity &account);

  /**
   * @brief Revoke @p role from @p account.
   * @throw PermissionDenied If @p caller may not administer @p role.
   */
  void revokeRole(const Identity &caller, const RoleId &role,
                  const Identity &account);

  /**
   * @brief Create a named resource-admin role.
   * @throw PermissionDenied If @p caller is not a site admin or the name
   *        collides with a reserved role.
   */
  RoleId createResourceRole(const Identity &caller, const std::string &name);

  bool isResourceRole(const RoleId &role) const;

  /// Transfer the super-admin role. Only the current super admin may.
  void changeSuperAdmin(const Identity &caller, const Identity &next);

  Identity superAdmin() const;

  /**
   * @brief Seed role membership from a YAML policy file.
   *
   * Format: `roles: {ROLE_NAME: [identity, ...]}`. SUPER_ADMIN_ROLE entries
   * are ignored; the super admin comes from the constructor.
   *
   * @return True on success.
   */
  bool loadPolicy(const std::string &path);
  void applyPolicy(const YAML::Node &roles);

  YAML::Node exportState() const;
  void importState(const YAML::Node &node);

private:
  // Caller must hold mutex_.
  bool canAdminister(const Identity &caller, const RoleId &role) const;
  bool isSiteAdminLocked(const Identity &account) const;

  mutable std::mutex mutex_;
  Identity superAdmin_;
  std::unordered_map<RoleId, std::unordered_set<Identity>, DigestHash>
      members_;
  std::unordered_set<RoleId, DigestHash> resourceRoles_;
};

} // namespace wttp

#endif // WTTP_ACCESS_CONTROL_H
