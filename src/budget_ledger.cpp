#include "agentgate/budget_ledger.hpp"
#include "agentgate/exceptions.hpp"

#include <cmath>

namespace agentgate {

// ========== InMemoryLedgerStore ==========

std::optional<StoredBudget> InMemoryLedgerStore::get_budget(const AgentId& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(agent_id);
    if (it == budgets_.end()) return std::nullopt;
    return it->second;
}

void InMemoryLedgerStore::put_budget(const AgentId& agent_id, const StoredBudget& budget) {
    std::lock_guard<std::mutex> lock(mutex_);
    budgets_[agent_id] = budget;
}

bool InMemoryLedgerStore::remove_budget(const AgentId& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return budgets_.erase(agent_id) > 0;
}

void InMemoryLedgerStore::begin_reservation(const Reservation& reservation) {
    std::lock_guard<std::mutex> lock(mutex_);
    reservations_[reservation.id] = reservation;
}

void InMemoryLedgerStore::commit_reservation(const Reservation& reservation, Money actual_cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    reservations_[reservation.id] = reservation;
    auto it = budgets_.find(reservation.agent_id);
    if (it != budgets_.end()) {
        it->second.spent += actual_cost;
    }
}

void InMemoryLedgerStore::release_reservation(const Reservation& reservation) {
    std::lock_guard<std::mutex> lock(mutex_);
    reservations_[reservation.id] = reservation;
}

std::optional<Reservation> InMemoryLedgerStore::find_reservation(ReservationId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(id);
    if (it == reservations_.end()) return std::nullopt;
    return it->second;
}

// ========== BudgetLedger ==========

BudgetLedger::BudgetLedger(LedgerConfig config, std::shared_ptr<LedgerStore> store)
    : config_(std::move(config))
    , store_(std::move(store))
{
    if (!store_) {
        throw InvalidConfigException("BudgetLedger requires a ledger store");
    }
}

BudgetLedger::~BudgetLedger() {
    if (running_.load()) {
        stop();
    }
}

// ==================== Accounts ====================

void BudgetLedger::open_account(const AgentId& agent_id, Money limit, Money spent) {
    if (agent_id.empty()) {
        throw InvalidRequestException("Agent id must not be empty");
    }
    if (limit < 0 || spent < 0) {
        throw InvalidRequestException("Budget limit and spend must be non-negative");
    }

    auto account = std::make_shared<Account>();
    account->limit = limit;
    account->spent = spent;
    account->soft_limit_signalled = crosses_soft_limit(*account);

    {
        std::unique_lock lock(accounts_mutex_);
        if (!accounts_.try_emplace(agent_id, account).second) {
            throw AgentAlreadyRegisteredException(agent_id);
        }
    }

    try {
        store_->put_budget(agent_id, StoredBudget{limit, spent});
    } catch (const LedgerStoreException& e) {
        report_store_failure(e.what(), agent_id);
    }
}

void BudgetLedger::set_limit(const AgentId& agent_id, Money limit) {
    if (limit < 0) {
        throw InvalidRequestException("Budget limit must be non-negative");
    }
    auto account = load_account(agent_id);
    if (!account) {
        throw AgentNotFoundException(agent_id);
    }

    StoredBudget stored;
    {
        std::lock_guard<std::mutex> lock(account->mutex);
        account->limit = limit;
        // Re-arm the soft-limit signal once spend is back below the threshold
        account->soft_limit_signalled = crosses_soft_limit(*account);
        stored = StoredBudget{account->limit, account->spent};
    }

    try {
        store_->put_budget(agent_id, stored);
    } catch (const LedgerStoreException& e) {
        report_store_failure(e.what(), agent_id);
    }
}

bool BudgetLedger::close_account(const AgentId& agent_id) {
    std::shared_ptr<Account> account;
    {
        std::unique_lock lock(accounts_mutex_);
        auto it = accounts_.find(agent_id);
        if (it != accounts_.end()) {
            account = it->second;
            accounts_.erase(it);
        }
    }

    if (account) {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        std::lock_guard<std::mutex> lock(account->mutex);
        for (auto& [id, _] : account->reservations) {
            index_.erase(id);
        }
    }

    bool removed = false;
    try {
        removed = store_->remove_budget(agent_id);
    } catch (const LedgerStoreException& e) {
        report_store_failure(e.what(), agent_id);
    }
    return account != nullptr || removed;
}

std::optional<BudgetSnapshot> BudgetLedger::snapshot(const AgentId& agent_id) {
    auto account = load_account(agent_id);
    if (!account) return std::nullopt;

    std::lock_guard<std::mutex> lock(account->mutex);
    BudgetSnapshot snap;
    snap.agent_id = agent_id;
    snap.limit = account->limit;
    snap.spent = account->spent;
    snap.pending = account->pending;
    for (auto& [_, record] : account->reservations) {
        if (record.reservation.state == ReservationState::Pending) {
            ++snap.outstanding_reservations;
        }
    }
    return snap;
}

std::optional<Money> BudgetLedger::remaining(const AgentId& agent_id) {
    auto snap = snapshot(agent_id);
    if (!snap.has_value()) return std::nullopt;
    return snap->remaining();
}

// ==================== Reservations ====================

ReserveResult BudgetLedger::reserve(const AgentId& agent_id, Money estimated_cost) {
    ReserveResult result;
    if (estimated_cost < 0) {
        result.status = ReserveStatus::InvalidAmount;
        return result;
    }

    auto account = load_account(agent_id);
    if (!account) {
        result.status = ReserveStatus::UnknownAgent;
        return result;
    }

    Reservation reservation;
    {
        std::lock_guard<std::mutex> lock(account->mutex);
        Money available = account->limit - account->spent - account->pending;
        if (estimated_cost > available) {
            result.status = ReserveStatus::BudgetExceeded;
            result.remaining = available;
            return result;
        }

        auto now = Clock::now();
        reservation.id = next_reservation_id_.fetch_add(1);
        reservation.agent_id = agent_id;
        reservation.amount = estimated_cost;
        reservation.created_at = now;
        reservation.expires_at = now + config_.reservation_ttl;
        reservation.state = ReservationState::Pending;

        account->pending += estimated_cost;
        account->reservations.emplace(reservation.id, ReservationRecord{reservation, Timestamp{}});
        result.remaining = account->limit - account->spent - account->pending;
    }

    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        index_[reservation.id] = agent_id;
    }

    try {
        store_->begin_reservation(reservation);
    } catch (const LedgerStoreException& e) {
        report_store_failure(e.what(), agent_id, reservation.id);
    }

    auto event = make_event(EventType::ReservationCreated, "Reservation created");
    event.agent_id = agent_id;
    event.reservation_id = reservation.id;
    event.amount = estimated_cost;
    emit(std::atomic_load(&monitor_), std::move(event));

    result.status = ReserveStatus::Reserved;
    result.reservation = std::move(reservation);
    return result;
}

SettleResult BudgetLedger::commit(ReservationId id, Money actual_cost) {
    SettleResult result;
    if (actual_cost < 0) {
        result.status = SettleStatus::InvalidAmount;
        return result;
    }

    AgentId agent_id;
    auto account = account_for(id, agent_id);
    if (!account) {
        result.status = SettleStatus::UnknownReservation;
        return result;
    }

    Reservation settled;
    Money limit = 0;
    Money spent = 0;
    {
        std::lock_guard<std::mutex> lock(account->mutex);
        auto it = account->reservations.find(id);
        if (it == account->reservations.end()) {
            result.status = SettleStatus::UnknownReservation;
            return result;
        }

        auto& record = it->second;
        switch (record.reservation.state) {
            case ReservationState::Committed:
            case ReservationState::Released:
                result.status = SettleStatus::AlreadyResolved;
                result.remaining = account->limit - account->spent - account->pending;
                return result;
            case ReservationState::Pending:
                account->pending -= record.reservation.amount;
                result.status = SettleStatus::Committed;
                break;
            case ReservationState::Expired:
                // Pending was already returned at expiry; provider spend is still charged
                result.status = SettleStatus::CommittedAfterExpiry;
                break;
        }

        account->spent += actual_cost;
        record.reservation.state = ReservationState::Committed;
        record.resolved_at = Clock::now();

        result.charged = actual_cost;
        result.overrun = account->spent > account->limit;
        result.remaining = account->limit - account->spent - account->pending;
        if (!account->soft_limit_signalled && crosses_soft_limit(*account)) {
            account->soft_limit_signalled = true;
            result.soft_limit_crossed = true;
        }

        settled = record.reservation;
        limit = account->limit;
        spent = account->spent;
    }

    try {
        store_->commit_reservation(settled, actual_cost);
    } catch (const LedgerStoreException& e) {
        report_store_failure(e.what(), agent_id, id);
    }

    auto event = make_event(EventType::ReservationCommitted,
                            std::string("Reservation ") + to_string(result.status) +
                            " (estimated " + std::to_string(settled.amount) + ")");
    event.agent_id = agent_id;
    event.reservation_id = id;
    event.amount = actual_cost;
    emit(std::atomic_load(&monitor_), std::move(event));

    if (result.overrun) {
        auto overrun = make_event(EventType::BudgetOverrun,
                                  "Spend " + std::to_string(spent) + " exceeds limit " +
                                  std::to_string(limit));
        overrun.agent_id = agent_id;
        overrun.reservation_id = id;
        overrun.amount = spent - limit;
        emit(std::atomic_load(&monitor_), std::move(overrun));
    }
    if (result.soft_limit_crossed) {
        auto soft = make_event(EventType::BudgetSoftLimitReached,
                               "Spend " + std::to_string(spent) + " of limit " +
                               std::to_string(limit));
        soft.agent_id = agent_id;
        soft.amount = spent;
        emit(std::atomic_load(&monitor_), std::move(soft));
    }
    return result;
}

SettleResult BudgetLedger::release(ReservationId id) {
    SettleResult result;

    AgentId agent_id;
    auto account = account_for(id, agent_id);
    if (!account) {
        result.status = SettleStatus::UnknownReservation;
        return result;
    }

    Reservation settled;
    {
        std::lock_guard<std::mutex> lock(account->mutex);
        auto it = account->reservations.find(id);
        if (it == account->reservations.end()) {
            result.status = SettleStatus::UnknownReservation;
            return result;
        }

        auto& record = it->second;
        if (record.reservation.state != ReservationState::Pending) {
            result.status = SettleStatus::AlreadyResolved;
            result.remaining = account->limit - account->spent - account->pending;
            return result;
        }

        account->pending -= record.reservation.amount;
        record.reservation.state = ReservationState::Released;
        record.resolved_at = Clock::now();

        result.status = SettleStatus::Released;
        result.remaining = account->limit - account->spent - account->pending;
        settled = record.reservation;
    }

    try {
        store_->release_reservation(settled);
    } catch (const LedgerStoreException& e) {
        report_store_failure(e.what(), agent_id, id);
    }

    auto event = make_event(EventType::ReservationReleased, "Reservation released");
    event.agent_id = agent_id;
    event.reservation_id = id;
    event.amount = settled.amount;
    emit(std::atomic_load(&monitor_), std::move(event));
    return result;
}

std::optional<Reservation> BudgetLedger::find_reservation(ReservationId id) const {
    AgentId agent_id;
    auto account = account_for(id, agent_id);
    if (!account) return std::nullopt;

    std::lock_guard<std::mutex> lock(account->mutex);
    auto it = account->reservations.find(id);
    if (it == account->reservations.end()) return std::nullopt;
    return it->second.reservation;
}

// ==================== Expiry ====================

std::size_t BudgetLedger::sweep() {
    std::vector<std::shared_ptr<Account>> accounts;
    {
        std::shared_lock lock(accounts_mutex_);
        accounts.reserve(accounts_.size());
        for (auto& [_, account] : accounts_) {
            accounts.push_back(account);
        }
    }

    auto now = Clock::now();
    std::vector<Reservation> expired;
    std::vector<ReservationId> purged;

    for (auto& account : accounts) {
        std::lock_guard<std::mutex> lock(account->mutex);
        for (auto it = account->reservations.begin(); it != account->reservations.end();) {
            auto& record = it->second;
            if (record.reservation.state == ReservationState::Pending) {
                if (record.reservation.expires_at <= now) {
                    account->pending -= record.reservation.amount;
                    record.reservation.state = ReservationState::Expired;
                    record.resolved_at = now;
                    expired.push_back(record.reservation);
                }
                ++it;
            } else if (now - record.resolved_at >= config_.expired_retention) {
                purged.push_back(it->first);
                it = account->reservations.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (!purged.empty()) {
        std::lock_guard<std::mutex> lock(index_mutex_);
        for (auto id : purged) {
            index_.erase(id);
        }
    }

    for (auto& reservation : expired) {
        try {
            store_->release_reservation(reservation);
        } catch (const LedgerStoreException& e) {
            report_store_failure(e.what(), reservation.agent_id, reservation.id);
        }

        auto event = make_event(EventType::ReservationExpired,
                                "Reservation expired unresolved; hold returned");
        event.agent_id = reservation.agent_id;
        event.reservation_id = reservation.id;
        event.amount = reservation.amount;
        emit(std::atomic_load(&monitor_), std::move(event));
    }
    return expired.size();
}

void BudgetLedger::start() {
    if (!config_.enable_expiry_sweep || running_.exchange(true)) {
        return;
    }
    sweeper_thread_ = std::thread(&BudgetLedger::sweep_loop, this);
}

void BudgetLedger::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
}

bool BudgetLedger::is_running() const noexcept {
    return running_.load();
}

void BudgetLedger::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

// ==================== Internal Helpers ====================

std::shared_ptr<BudgetLedger::Account> BudgetLedger::find_account(const AgentId& agent_id) const {
    std::shared_lock lock(accounts_mutex_);
    auto it = accounts_.find(agent_id);
    if (it == accounts_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<BudgetLedger::Account> BudgetLedger::load_account(const AgentId& agent_id) {
    if (auto account = find_account(agent_id)) {
        return account;
    }

    // Outside every lock: the store may be remote
    std::optional<StoredBudget> stored;
    try {
        stored = store_->get_budget(agent_id);
    } catch (const LedgerStoreException& e) {
        report_store_failure(e.what(), agent_id);
        return nullptr;
    }
    if (!stored.has_value()) {
        return nullptr;
    }

    auto account = std::make_shared<Account>();
    account->limit = stored->limit;
    account->spent = stored->spent;
    account->soft_limit_signalled = crosses_soft_limit(*account);

    std::unique_lock lock(accounts_mutex_);
    // A concurrent loader may have won; keep its account
    return accounts_.try_emplace(agent_id, std::move(account)).first->second;
}

std::shared_ptr<BudgetLedger::Account> BudgetLedger::account_for(ReservationId id,
                                                                 AgentId& agent_id) const {
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = index_.find(id);
        if (it == index_.end()) return nullptr;
        agent_id = it->second;
    }
    return find_account(agent_id);
}

bool BudgetLedger::crosses_soft_limit(const Account& account) const {
    if (account.limit <= 0) return false;
    auto threshold = static_cast<Money>(
        std::llround(static_cast<double>(account.limit) * config_.soft_limit_fraction));
    return account.spent >= threshold;
}

void BudgetLedger::sweep_loop() {
    while (running_.load()) {
        sweep();

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.sweep_interval, [this] {
            return !running_.load();
        });
    }
}

void BudgetLedger::report_store_failure(const std::string& what, const AgentId& agent_id,
                                        std::optional<ReservationId> reservation_id) {
    auto event = make_event(EventType::LedgerPersistenceFailed, what);
    event.agent_id = agent_id;
    event.reservation_id = reservation_id;
    emit(std::atomic_load(&monitor_), std::move(event));
}

} // namespace agentgate
