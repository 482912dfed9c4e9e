// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_ADMIN_ACL_H
#define MINTSUITE_ADMIN_ACL_H

/**
 * @file admin_acl.h
 * @brief Admin access control for the minter suite
 *
 * Privileged contracts (core contracts, the core registry, the minter
 * filter) are owned by an admin ACL contract rather than by a raw
 * address. Authorization questions are forwarded to the owner through
 * Allowed(sender, contract, selector).
 *
 * AdminACLV0 grants every selector to a single super admin.
 */

#include <mintsuite/chain.h>

#include <string>

namespace mintsuite {

/**
 * @brief Access control list answering "may sender call selector on contract"
 */
class IAdminACL
{
public:
    virtual ~IAdminACL() {}

    virtual std::string AdminACLType() const = 0;

    virtual bool Allowed(const uint160& sender, const uint160& contract, const std::string& selector) const = 0;
};

/**
 * @brief Contract owned by an admin ACL contract
 *
 * Ownership transfer is only possible through the owning ACL (the owner is
 * a contract). Renouncing ownership is disabled by default: a contract
 * without an owner could never be administered again.
 */
class AdminACLOwned : public Contract
{
public:
    AdminACLOwned(Chain& chain, const uint160& ownerAdminACL);

    /** Current owner (an admin ACL contract) */
    uint160 Owner() const;

    /**
     * @brief Transfer ownership to another admin ACL
     * @throws RevertError if the caller is not the owner or newOwner is null
     */
    void TransferOwnership(const CallContext& ctx, const uint160& newOwner);

    /** @throws RevertError always, unless overridden */
    virtual void RenounceOwnership(const CallContext& ctx);

    /** True if the owning ACL allows sender to call selector on contract */
    bool OwnerAdminACLAllowed(const uint160& sender, const uint160& contract, const std::string& selector) const;

protected:
    /** Revert with reason unless the owning ACL allows sender to call selector on this contract */
    void RequireAdminACL(const uint160& sender, const std::string& selector, const std::string& reason) const;

private:
    Snapshotted<uint160> owner_;
};

/**
 * @brief Admin ACL granting every selector to a single super admin
 */
class AdminACLV0 : public Contract, public IAdminACL
{
public:
    AdminACLV0(Chain& chain, const uint160& superAdmin);

    std::string AdminACLType() const override { return "AdminACLV0"; }

    bool Allowed(const uint160& sender, const uint160& contract, const std::string& selector) const override;

    uint160 SuperAdmin() const;

    /**
     * @brief Hand the super admin role to a new address
     * @throws RevertError "Only superAdmin" if the caller is not the super admin
     */
    void ChangeSuperAdmin(const CallContext& ctx, const uint160& newSuperAdmin);

    /**
     * @brief Move ownership of a contract owned by this ACL to another ACL
     * @param contract Contract owned by this ACL
     * @param newAdminACL New owning ACL
     */
    void TransferOwnershipOn(const CallContext& ctx, const uint160& contract, const uint160& newAdminACL);

    /** Ask a contract owned by this ACL to renounce its owner */
    void RenounceOwnershipOn(const CallContext& ctx, const uint160& contract);

private:
    void RequireSuperAdmin(const CallContext& ctx) const;

    Snapshotted<uint160> superAdmin_;
};

/**
 * @brief Ask the admin ACL at aclAddress whether sender may call selector on contract
 * @return false if aclAddress is not an admin ACL contract
 */
bool AdminACLAllowed(const Chain& chain, const uint160& aclAddress, const uint160& sender,
                     const uint160& contract, const std::string& selector);

} // namespace mintsuite

#endif // MINTSUITE_ADMIN_ACL_H
