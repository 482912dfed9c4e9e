// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/admin_acl.h>

#include <util.h>

namespace mintsuite {

bool AdminACLAllowed(const Chain& chain, const uint160& aclAddress, const uint160& sender,
                     const uint160& contract, const std::string& selector)
{
    const IAdminACL* acl = chain.GetContractAs<IAdminACL>(aclAddress);
    if (acl == nullptr) {
        return false;
    }
    return acl->Allowed(sender, contract, selector);
}

// ============================================================================
// AdminACLOwned
// ============================================================================

AdminACLOwned::AdminACLOwned(Chain& chain, const uint160& ownerAdminACL)
    : Contract(chain)
    , owner_(ownerAdminACL)
{
    Track(owner_);
}

uint160 AdminACLOwned::Owner() const
{
    return *owner_;
}

void AdminACLOwned::TransferOwnership(const CallContext& ctx, const uint160& newOwner)
{
    Require(ctx.sender == *owner_, "Ownable: caller is not the owner");
    Require(!newOwner.IsNull(), "Ownable: new owner is the zero address");

    chain_.EmitEvent(EventLog(address_, "OwnershipTransferred")
        .Add("previousOwner", *owner_)
        .Add("newOwner", newOwner));
    *owner_ = newOwner;
}

void AdminACLOwned::RenounceOwnership(const CallContext& ctx)
{
    Require(ctx.sender == *owner_, "Ownable: caller is not the owner");
    throw RevertError("Cannot renounce ownership");
}

bool AdminACLOwned::OwnerAdminACLAllowed(const uint160& sender, const uint160& contract, const std::string& selector) const
{
    return AdminACLAllowed(chain_, *owner_, sender, contract, selector);
}

void AdminACLOwned::RequireAdminACL(const uint160& sender, const std::string& selector, const std::string& reason) const
{
    Require(OwnerAdminACLAllowed(sender, address_, selector), reason);
}

// ============================================================================
// AdminACLV0
// ============================================================================

AdminACLV0::AdminACLV0(Chain& chain, const uint160& superAdmin)
    : Contract(chain)
    , superAdmin_(superAdmin)
{
    Track(superAdmin_);
}

bool AdminACLV0::Allowed(const uint160& sender, const uint160& contract, const std::string& selector) const
{
    return sender == *superAdmin_;
}

uint160 AdminACLV0::SuperAdmin() const
{
    return *superAdmin_;
}

void AdminACLV0::RequireSuperAdmin(const CallContext& ctx) const
{
    Require(ctx.sender == *superAdmin_, "Only superAdmin");
}

void AdminACLV0::ChangeSuperAdmin(const CallContext& ctx, const uint160& newSuperAdmin)
{
    RequireSuperAdmin(ctx);
    Require(!newSuperAdmin.IsNull(), "Only non-zero address");

    chain_.EmitEvent(EventLog(address_, "SuperAdminTransferred")
        .Add("previousSuperAdmin", *superAdmin_)
        .Add("newSuperAdmin", newSuperAdmin));
    LogPrint(MSLog::CORE, "AdminACL: Super admin changed from %s to %s\n",
             superAdmin_->ToString(), newSuperAdmin.ToString());
    *superAdmin_ = newSuperAdmin;
}

void AdminACLV0::TransferOwnershipOn(const CallContext& ctx, const uint160& contract, const uint160& newAdminACL)
{
    RequireSuperAdmin(ctx);
    Require(chain_.GetContractAs<IAdminACL>(newAdminACL) != nullptr, "AdminACLV0: new admin ACL must be an ACL");

    AdminACLOwned& owned = ContractAt<AdminACLOwned>(contract, "AdminACLV0: contract is not ACL-owned");
    owned.TransferOwnership(Self(), newAdminACL);
}

void AdminACLV0::RenounceOwnershipOn(const CallContext& ctx, const uint160& contract)
{
    RequireSuperAdmin(ctx);

    AdminACLOwned& owned = ContractAt<AdminACLOwned>(contract, "AdminACLV0: contract is not ACL-owned");
    owned.RenounceOwnership(Self());
}

} // namespace mintsuite
