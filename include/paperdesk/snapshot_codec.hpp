#pragma once

#include <functional>
#include <string>
#include <vector>
#include "ledger_store.hpp"
#include "types.hpp"

namespace paperdesk {

// What a load had to do to bring a stored document up to date.
struct LoadReport {
    int source_version = 0;
    bool migrated = false;
    std::vector<std::string> repairs;

    bool changed() const { return migrated || !repairs.empty(); }
};

// Ledger <-> versioned snapshot document.
//
// Version history:
//   0  plain file, accounts keyed by display name
//   5  accounts keyed by immutable UUID, agent_name_to_uuid index
//   6  agent_name_to_id index, per-account is_test, poly_cost_basis
class SnapshotCodec {
public:
    static constexpr int kVersion = 6;

    using IdGenerator = std::function<std::string()>;

    static Json encode(const LedgerStore& store);

    // Migrates and repairs the document into store. Keys absent from the
    // document leave the store's current (seeded) prices and markets alone.
    // Tolerates any subset of keys; never throws on wrong-typed fields.
    static LoadReport decode(const Json& document, LedgerStore& store, const IdGenerator& new_id);

    static int version_of(const Json& document);

    // Brings any older document to kVersion.
    static Json migrate(Json document, const IdGenerator& new_id, LoadReport* report = nullptr);

    static Json migrate_v0_to_v5(Json document, const IdGenerator& new_id);
    static Json migrate_v5_to_v6(Json document);
};

} // namespace paperdesk
