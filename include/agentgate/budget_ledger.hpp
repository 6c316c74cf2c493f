#pragma once

#include "agentgate/types.hpp"
#include "agentgate/config.hpp"
#include "agentgate/monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agentgate {

struct Reservation {
    ReservationId id{0};
    AgentId agent_id;
    Money amount{0};
    Timestamp created_at{};
    Timestamp expires_at{};
    ReservationState state{ReservationState::Pending};
};

// Persisted form of one agent's budget
struct StoredBudget {
    Money limit{0};
    Money spent{0};
};

struct BudgetSnapshot {
    AgentId agent_id;
    Money limit{0};
    Money spent{0};
    Money pending{0};
    std::size_t outstanding_reservations{0};

    Money remaining() const noexcept { return limit - spent - pending; }
};

// Durable budget storage (consumed). Implementations throw
// LedgerStoreException on failure; the ledger keeps its in-memory state
// authoritative and reports the failure to the monitor.
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    virtual std::optional<StoredBudget> get_budget(const AgentId& agent_id) = 0;
    virtual void put_budget(const AgentId& agent_id, const StoredBudget& budget) = 0;
    virtual bool remove_budget(const AgentId& agent_id) = 0;

    virtual void begin_reservation(const Reservation& reservation) = 0;
    virtual void commit_reservation(const Reservation& reservation, Money actual_cost) = 0;
    virtual void release_reservation(const Reservation& reservation) = 0;
};

class InMemoryLedgerStore : public LedgerStore {
public:
    std::optional<StoredBudget> get_budget(const AgentId& agent_id) override;
    void put_budget(const AgentId& agent_id, const StoredBudget& budget) override;
    bool remove_budget(const AgentId& agent_id) override;

    void begin_reservation(const Reservation& reservation) override;
    void commit_reservation(const Reservation& reservation, Money actual_cost) override;
    void release_reservation(const Reservation& reservation) override;

    std::optional<Reservation> find_reservation(ReservationId id) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<AgentId, StoredBudget> budgets_;
    std::unordered_map<ReservationId, Reservation> reservations_;
};

enum class ReserveStatus {
    Reserved,
    BudgetExceeded,
    UnknownAgent,
    InvalidAmount
};

struct ReserveResult {
    ReserveStatus status{ReserveStatus::UnknownAgent};
    std::optional<Reservation> reservation;
    Money remaining{0};

    bool ok() const noexcept { return status == ReserveStatus::Reserved; }
};

enum class SettleStatus {
    Committed,
    CommittedAfterExpiry,
    Released,
    AlreadyResolved,
    UnknownReservation,
    InvalidAmount
};

struct SettleResult {
    SettleStatus status{SettleStatus::UnknownReservation};
    Money charged{0};
    Money remaining{0};
    bool overrun{false};
    bool soft_limit_crossed{false};
};

// Per-agent spend accounting with reserve/commit/release.
//
// Admission guarantees spent + pending + amount <= limit. Commits always
// succeed and may push spent past the limit (overrun). Each reservation is
// resolved exactly once; repeat settlement returns AlreadyResolved.
class BudgetLedger {
public:
    explicit BudgetLedger(LedgerConfig config = LedgerConfig{},
                          std::shared_ptr<LedgerStore> store = std::make_shared<InMemoryLedgerStore>());
    ~BudgetLedger();

    BudgetLedger(const BudgetLedger&) = delete;
    BudgetLedger& operator=(const BudgetLedger&) = delete;

    // ==================== Accounts ====================

    // Throws AgentAlreadyRegisteredException if the account is loaded
    void open_account(const AgentId& agent_id, Money limit, Money spent = 0);

    // Throws AgentNotFoundException
    void set_limit(const AgentId& agent_id, Money limit);

    bool close_account(const AgentId& agent_id);

    std::optional<BudgetSnapshot> snapshot(const AgentId& agent_id);
    std::optional<Money> remaining(const AgentId& agent_id);

    // ==================== Reservations ====================

    ReserveResult reserve(const AgentId& agent_id, Money estimated_cost);
    SettleResult commit(ReservationId id, Money actual_cost);
    SettleResult release(ReservationId id);

    std::optional<Reservation> find_reservation(ReservationId id) const;

    // ==================== Expiry ====================

    // Expires overdue pending reservations and purges old resolved records.
    // Returns the number of reservations expired.
    std::size_t sweep();

    void start();
    void stop();
    bool is_running() const noexcept;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct ReservationRecord {
        Reservation reservation;
        Timestamp resolved_at{};
    };

    struct Account {
        std::mutex mutex;
        Money limit{0};
        Money spent{0};
        Money pending{0};
        bool soft_limit_signalled{false};
        std::unordered_map<ReservationId, ReservationRecord> reservations;
    };

    LedgerConfig config_;
    std::shared_ptr<LedgerStore> store_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::shared_mutex accounts_mutex_;
    std::unordered_map<AgentId, std::shared_ptr<Account>> accounts_;

    mutable std::mutex index_mutex_;
    std::unordered_map<ReservationId, AgentId> index_;

    std::atomic<ReservationId> next_reservation_id_{1};

    // Sweeper
    std::thread sweeper_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::shared_ptr<Account> find_account(const AgentId& agent_id) const;
    std::shared_ptr<Account> load_account(const AgentId& agent_id);
    std::shared_ptr<Account> account_for(ReservationId id, AgentId& agent_id) const;

    bool crosses_soft_limit(const Account& account) const;
    void sweep_loop();
    void report_store_failure(const std::string& what, const AgentId& agent_id,
                              std::optional<ReservationId> reservation_id = std::nullopt);
};

inline const char* to_string(ReserveStatus s) {
    switch (s) {
        case ReserveStatus::Reserved:       return "Reserved";
        case ReserveStatus::BudgetExceeded: return "BudgetExceeded";
        case ReserveStatus::UnknownAgent:   return "UnknownAgent";
        case ReserveStatus::InvalidAmount:  return "InvalidAmount";
    }
    return "Unknown";
}

inline const char* to_string(SettleStatus s) {
    switch (s) {
        case SettleStatus::Committed:            return "Committed";
        case SettleStatus::CommittedAfterExpiry: return "CommittedAfterExpiry";
        case SettleStatus::Released:             return "Released";
        case SettleStatus::AlreadyResolved:      return "AlreadyResolved";
        case SettleStatus::UnknownReservation:   return "UnknownReservation";
        case SettleStatus::InvalidAmount:        return "InvalidAmount";
    }
    return "Unknown";
}

} // namespace agentgate
