#pragma once

namespace sentinel::ledger {

/// One vault per owner, keyed by the owner's address.
struct single_vault_tag {};

/// Any number of vaults per owner, addressed by sequential ids.
struct multi_vault_tag {};

/// Vault ledger, specialised per model. The two models have different
/// identity and indexing rules and are never mixed in one ledger.
template <typename Model>
class ledger;

}  // namespace sentinel::ledger
