#include <gtest/gtest.h>
#include <agentgate/agentgate.hpp>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace agentgate;
using namespace std::chrono_literals;

class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }
    std::vector<MonitorEvent> get_events_of_type(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MonitorEvent> filtered;
        for (const auto& e : events_) {
            if (e.type == type) filtered.push_back(e);
        }
        return filtered;
    }

private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events_;
};

// Store that fails every write
class BrokenStore : public InMemoryLedgerStore {
public:
    void begin_reservation(const Reservation&) override {
        throw LedgerStoreException("disk full");
    }
    void commit_reservation(const Reservation&, Money) override {
        throw LedgerStoreException("disk full");
    }
};

// ===========================================================================
// Fixture
// ===========================================================================

class BudgetLedgerTest : public ::testing::Test {
protected:
    LedgerConfig cfg;
    std::shared_ptr<InMemoryLedgerStore> store = std::make_shared<InMemoryLedgerStore>();
    std::shared_ptr<TestMonitor> monitor = std::make_shared<TestMonitor>();
    std::unique_ptr<BudgetLedger> ledger;

    void SetUp() override {
        cfg.enable_expiry_sweep = false;
        make_ledger();
    }

    void make_ledger() {
        ledger = std::make_unique<BudgetLedger>(cfg, store);
        ledger->set_monitor(monitor);
    }
};

// ===========================================================================
// Accounts
// ===========================================================================

TEST_F(BudgetLedgerTest, OpenAccountAndSnapshot) {
    ledger->open_account("agent-1", usd_to_micros(10.0));

    auto snap = ledger->snapshot("agent-1");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->limit, 10'000'000);
    EXPECT_EQ(snap->spent, 0);
    EXPECT_EQ(snap->pending, 0);
    EXPECT_EQ(snap->remaining(), 10'000'000);
}

TEST_F(BudgetLedgerTest, DuplicateAccountRejected) {
    ledger->open_account("agent-1", 100);
    EXPECT_THROW(ledger->open_account("agent-1", 100), AgentAlreadyRegisteredException);
}

TEST_F(BudgetLedgerTest, NegativeLimitRejected) {
    EXPECT_THROW(ledger->open_account("agent-1", -1), InvalidRequestException);
}

TEST_F(BudgetLedgerTest, UnknownAgentHasNoSnapshot) {
    EXPECT_FALSE(ledger->snapshot("ghost").has_value());
    EXPECT_FALSE(ledger->remaining("ghost").has_value());
    EXPECT_THROW(ledger->set_limit("ghost", 100), AgentNotFoundException);
}

TEST_F(BudgetLedgerTest, AccountLoadedLazilyFromStore) {
    store->put_budget("agent-9", StoredBudget{1000, 400});

    auto snap = ledger->snapshot("agent-9");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->limit, 1000);
    EXPECT_EQ(snap->spent, 400);
    EXPECT_EQ(ledger->reserve("agent-9", 600).status, ReserveStatus::Reserved);
}

TEST_F(BudgetLedgerTest, CloseAccount) {
    ledger->open_account("agent-1", 100);
    EXPECT_TRUE(ledger->close_account("agent-1"));
    EXPECT_FALSE(ledger->snapshot("agent-1").has_value());
    EXPECT_FALSE(ledger->close_account("agent-1"));
}

// ===========================================================================
// Reserve / commit / release
// ===========================================================================

TEST_F(BudgetLedgerTest, ReserveHoldsFunds) {
    ledger->open_account("agent-1", 1000);

    auto r = ledger->reserve("agent-1", 300);
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.reservation.has_value());
    EXPECT_EQ(r.reservation->amount, 300);
    EXPECT_EQ(r.reservation->state, ReservationState::Pending);
    EXPECT_EQ(r.remaining, 700);

    auto snap = ledger->snapshot("agent-1");
    EXPECT_EQ(snap->pending, 300);
    EXPECT_EQ(snap->outstanding_reservations, 1u);
    EXPECT_TRUE(store->find_reservation(r.reservation->id).has_value());
}

TEST_F(BudgetLedgerTest, ReserveBeyondRemainingIsRefused) {
    ledger->open_account("agent-1", 1000);
    ASSERT_TRUE(ledger->reserve("agent-1", 800).ok());

    auto r = ledger->reserve("agent-1", 201);
    EXPECT_EQ(r.status, ReserveStatus::BudgetExceeded);
    EXPECT_EQ(r.remaining, 200);
    EXPECT_FALSE(r.reservation.has_value());
    EXPECT_EQ(ledger->snapshot("agent-1")->pending, 800);
}

TEST_F(BudgetLedgerTest, ReserveExactRemainderSucceeds) {
    ledger->open_account("agent-1", 1000);
    EXPECT_TRUE(ledger->reserve("agent-1", 1000).ok());
    EXPECT_EQ(ledger->remaining("agent-1"), 0);
}

TEST_F(BudgetLedgerTest, ZeroCostReservationAllowed) {
    ledger->open_account("agent-1", 0);
    EXPECT_TRUE(ledger->reserve("agent-1", 0).ok());
}

TEST_F(BudgetLedgerTest, ReserveInvalidAndUnknown) {
    ledger->open_account("agent-1", 1000);
    EXPECT_EQ(ledger->reserve("agent-1", -5).status, ReserveStatus::InvalidAmount);
    EXPECT_EQ(ledger->reserve("ghost", 5).status, ReserveStatus::UnknownAgent);
}

TEST_F(BudgetLedgerTest, CommitChargesActualCost) {
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 300);

    auto settled = ledger->commit(r.reservation->id, 120);
    EXPECT_EQ(settled.status, SettleStatus::Committed);
    EXPECT_EQ(settled.charged, 120);
    EXPECT_EQ(settled.remaining, 880);
    EXPECT_FALSE(settled.overrun);

    auto snap = ledger->snapshot("agent-1");
    EXPECT_EQ(snap->spent, 120);
    EXPECT_EQ(snap->pending, 0);
    EXPECT_EQ(store->get_budget("agent-1")->spent, 120);
}

TEST_F(BudgetLedgerTest, CommitAboveEstimateOverrunsAndSignals) {
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 900);

    auto settled = ledger->commit(r.reservation->id, 1100);
    EXPECT_EQ(settled.status, SettleStatus::Committed);
    EXPECT_TRUE(settled.overrun);
    EXPECT_EQ(settled.remaining, -100);

    auto overruns = monitor->get_events_of_type(EventType::BudgetOverrun);
    ASSERT_EQ(overruns.size(), 1u);
    EXPECT_EQ(overruns[0].amount, 100);

    // Further admission is blocked while overrun
    EXPECT_EQ(ledger->reserve("agent-1", 1).status, ReserveStatus::BudgetExceeded);
}

TEST_F(BudgetLedgerTest, DuplicateCommitIsNoOp) {
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 300);

    ASSERT_EQ(ledger->commit(r.reservation->id, 200).status, SettleStatus::Committed);
    auto again = ledger->commit(r.reservation->id, 200);
    EXPECT_EQ(again.status, SettleStatus::AlreadyResolved);
    EXPECT_EQ(again.charged, 0);
    EXPECT_EQ(ledger->snapshot("agent-1")->spent, 200);
}

TEST_F(BudgetLedgerTest, ReleaseReturnsHold) {
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 300);

    auto released = ledger->release(r.reservation->id);
    EXPECT_EQ(released.status, SettleStatus::Released);
    EXPECT_EQ(released.remaining, 1000);
    EXPECT_EQ(ledger->snapshot("agent-1")->spent, 0);

    EXPECT_EQ(ledger->release(r.reservation->id).status, SettleStatus::AlreadyResolved);
    EXPECT_EQ(ledger->commit(r.reservation->id, 10).status, SettleStatus::AlreadyResolved);
    EXPECT_EQ(ledger->snapshot("agent-1")->spent, 0);
}

TEST_F(BudgetLedgerTest, UnknownReservation) {
    EXPECT_EQ(ledger->commit(424242, 1).status, SettleStatus::UnknownReservation);
    EXPECT_EQ(ledger->release(424242).status, SettleStatus::UnknownReservation);
    EXPECT_FALSE(ledger->find_reservation(424242).has_value());
}

TEST_F(BudgetLedgerTest, NegativeActualCostRejected) {
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 300);
    EXPECT_EQ(ledger->commit(r.reservation->id, -1).status, SettleStatus::InvalidAmount);
    EXPECT_EQ(ledger->find_reservation(r.reservation->id)->state, ReservationState::Pending);
}

TEST_F(BudgetLedgerTest, SoftLimitSignalledOnce) {
    cfg.soft_limit_fraction = 0.5;
    make_ledger();
    ledger->open_account("agent-1", 1000);

    auto a = ledger->reserve("agent-1", 100);
    EXPECT_FALSE(ledger->commit(a.reservation->id, 100).soft_limit_crossed);

    auto b = ledger->reserve("agent-1", 500);
    EXPECT_TRUE(ledger->commit(b.reservation->id, 450).soft_limit_crossed);

    auto c = ledger->reserve("agent-1", 100);
    EXPECT_FALSE(ledger->commit(c.reservation->id, 50).soft_limit_crossed);

    EXPECT_EQ(monitor->get_events_of_type(EventType::BudgetSoftLimitReached).size(), 1u);

    // Raising the limit re-arms the signal
    ledger->set_limit("agent-1", 10000);
    auto d = ledger->reserve("agent-1", 5000);
    EXPECT_TRUE(ledger->commit(d.reservation->id, 4500).soft_limit_crossed);
}

// ===========================================================================
// Expiry
// ===========================================================================

TEST_F(BudgetLedgerTest, SweepExpiresOverdueReservations) {
    cfg.reservation_ttl = 20ms;
    make_ledger();
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 400);

    EXPECT_EQ(ledger->sweep(), 0u);
    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(ledger->sweep(), 1u);

    EXPECT_EQ(ledger->find_reservation(r.reservation->id)->state, ReservationState::Expired);
    EXPECT_EQ(ledger->snapshot("agent-1")->pending, 0);
    EXPECT_EQ(monitor->get_events_of_type(EventType::ReservationExpired).size(), 1u);
}

TEST_F(BudgetLedgerTest, LateCommitAfterExpiryStillCharges) {
    cfg.reservation_ttl = 10ms;
    make_ledger();
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 400);
    std::this_thread::sleep_for(30ms);
    ledger->sweep();

    auto settled = ledger->commit(r.reservation->id, 350);
    EXPECT_EQ(settled.status, SettleStatus::CommittedAfterExpiry);
    EXPECT_EQ(settled.charged, 350);

    auto snap = ledger->snapshot("agent-1");
    EXPECT_EQ(snap->spent, 350);
    EXPECT_EQ(snap->pending, 0);
    EXPECT_EQ(ledger->commit(r.reservation->id, 350).status, SettleStatus::AlreadyResolved);
}

TEST_F(BudgetLedgerTest, ResolvedRecordsPurgedAfterRetention) {
    cfg.expired_retention = 10ms;
    make_ledger();
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 100);
    ledger->commit(r.reservation->id, 100);

    std::this_thread::sleep_for(30ms);
    ledger->sweep();

    EXPECT_FALSE(ledger->find_reservation(r.reservation->id).has_value());
    // Still non-mutating once the record is gone
    EXPECT_EQ(ledger->commit(r.reservation->id, 100).status, SettleStatus::UnknownReservation);
    EXPECT_EQ(ledger->snapshot("agent-1")->spent, 100);
}

TEST_F(BudgetLedgerTest, BackgroundSweeperExpiresReservations) {
    cfg.enable_expiry_sweep = true;
    cfg.reservation_ttl = 20ms;
    cfg.sweep_interval = 10ms;
    make_ledger();
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 1000);

    ledger->start();
    EXPECT_TRUE(ledger->is_running());
    std::this_thread::sleep_for(150ms);
    ledger->stop();
    EXPECT_FALSE(ledger->is_running());

    EXPECT_EQ(ledger->find_reservation(r.reservation->id)->state, ReservationState::Expired);
    EXPECT_EQ(ledger->remaining("agent-1"), 1000);
}

// ===========================================================================
// Persistence failures
// ===========================================================================

TEST(BudgetLedgerStoreFailureTest, WriteFailuresReportedNotThrown) {
    auto monitor = std::make_shared<TestMonitor>();
    BudgetLedger ledger(LedgerConfig{}, std::make_shared<BrokenStore>());
    ledger.set_monitor(monitor);
    ledger.open_account("agent-1", 1000);

    auto r = ledger.reserve("agent-1", 100);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(ledger.commit(r.reservation->id, 50).status, SettleStatus::Committed);
    EXPECT_EQ(ledger.snapshot("agent-1")->spent, 50);
    EXPECT_EQ(monitor->get_events_of_type(EventType::LedgerPersistenceFailed).size(), 2u);
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_F(BudgetLedgerTest, ConcurrentReservationsNeverExceedLimit) {
    constexpr int THREADS = 16;
    constexpr int PER_THREAD = 50;
    ledger->open_account("agent-1", 300);

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < PER_THREAD; ++i) {
                if (ledger->reserve("agent-1", 1).ok()) {
                    admitted++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(admitted.load(), 300);
    auto snap = ledger->snapshot("agent-1");
    EXPECT_EQ(snap->pending, 300);
    EXPECT_EQ(snap->remaining(), 0);
}

TEST_F(BudgetLedgerTest, ConcurrentCommitOfSameReservationChargesOnce) {
    ledger->open_account("agent-1", 1000);
    auto r = ledger->reserve("agent-1", 500);
    auto id = r.reservation->id;

    std::atomic<int> committed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            if (ledger->commit(id, 400).status == SettleStatus::Committed) {
                committed++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(committed.load(), 1);
    EXPECT_EQ(ledger->snapshot("agent-1")->spent, 400);
}
