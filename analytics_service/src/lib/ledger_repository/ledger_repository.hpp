#pragma once

#include <stdexcept>
#include <string>

#include <userver/storages/postgres/cluster.hpp>

#include <ledger/ledger.pb.h>

namespace finance_analytics {

class LedgerUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read-only access to stored ledgers. Analysis never writes back.
class LedgerRepository {
public:
    explicit LedgerRepository(userver::storages::postgres::ClusterPtr pg_cluster);
    virtual ~LedgerRepository() = default;

    // Categories and transactions of one account, transactions ordered by date.
    // Throws LedgerUnavailableError when the database cannot be queried.
    virtual ledger::LedgerSnapshot LoadSnapshot(const std::string& account_id) const;

private:
    static ledger::Transaction::TransactionType StringToTransactionType(const std::string& str);

    userver::storages::postgres::ClusterPtr pg_cluster_;
};

}  // namespace finance_analytics
