#include "ledger_repository.hpp"

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/storages/postgres/component.hpp>

namespace finance_analytics {

LedgerRepository::LedgerRepository(userver::storages::postgres::ClusterPtr pg_cluster)
    : pg_cluster_(std::move(pg_cluster)) {}

ledger::LedgerSnapshot LedgerRepository::LoadSnapshot(const std::string& account_id) const {
    ledger::LedgerSnapshot snapshot;
    try {
        // One transaction so categories and transactions come from the same
        // database state
        auto trx = pg_cluster_->Begin(
            "load_ledger_snapshot",
            userver::storages::postgres::ClusterHostType::kSlave,
            userver::storages::postgres::TransactionOptions{
                userver::storages::postgres::IsolationLevel::kRepeatableRead,
                userver::storages::postgres::TransactionOptions::kReadOnly});

        auto categories = trx.Execute(
            "SELECT name, monthly_budget::double precision AS monthly_budget "
            "FROM ledger_categories "
            "WHERE account_id = $1 "
            "ORDER BY name",
            account_id);
        for (const auto& row : categories) {
            auto* category = snapshot.add_categories();
            category->set_name(row["name"].As<std::string>());
            if (!row["monthly_budget"].IsNull()) {
                category->set_monthly_budget(row["monthly_budget"].As<double>());
            }
        }

        auto transactions = trx.Execute(
            "SELECT id, to_char(occurred_on, 'YYYY-MM-DD') AS date, description, "
            "amount::double precision AS amount, category, type::text AS type "
            "FROM ledger_transactions "
            "WHERE account_id = $1 "
            "ORDER BY occurred_on, id",
            account_id);
        for (const auto& row : transactions) {
            auto* tx = snapshot.add_transactions();
            tx->set_id(row["id"].As<int64_t>());
            tx->set_date(row["date"].As<std::string>());
            tx->set_description(row["description"].As<std::string>());
            tx->set_amount(row["amount"].As<double>());
            tx->set_category(row["category"].As<std::string>());
            tx->set_type(StringToTransactionType(row["type"].As<std::string>()));
        }
        trx.Commit();
    } catch (const std::exception& e) {
        LOG_ERROR() << "Failed to load ledger for account " << account_id << ": " << e.what();
        throw LedgerUnavailableError(
            fmt::format("Ledger for account {} is unavailable: {}", account_id, e.what()));
    }

    LOG_INFO() << fmt::format("Loaded ledger for account {}: {} categories, {} transactions",
                              account_id, snapshot.categories_size(), snapshot.transactions_size());
    return snapshot;
}

ledger::Transaction::TransactionType LedgerRepository::StringToTransactionType(
    const std::string& str) {
    if (str == "INCOME") return ledger::Transaction::INCOME;
    if (str == "EXPENSE") return ledger::Transaction::EXPENSE;
    // Falls back to the sign convention of the stored amount
    return ledger::Transaction::TRANSACTION_TYPE_UNSPECIFIED;
}

}  // namespace finance_analytics
