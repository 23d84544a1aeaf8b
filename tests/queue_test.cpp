/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/clock.hpp"
#include "quay/queue.hpp"
#include "quay/store.hpp"
#include "test_harness.hpp"
#include <mutex>
#include <set>
#include <vector>

using namespace quay;
using namespace quay::test;

namespace {

const Millis kLease{1000};

// FileStore whose job writes can be made to fail, to simulate a store outage.
class FlakyStore final : public Store {
public:
    explicit FlakyStore(FileStore& inner) : inner_(inner) {}

    bool persist(const Job& job) noexcept override { return !failJobs && inner_.persist(job); }
    bool persist(const ExecutionRecord& record) noexcept override { return inner_.persist(record); }
    std::optional<Job> loadJob(const JobId& id) const noexcept override { return inner_.loadJob(id); }
    std::vector<Job> listJobs(const JobFilter& filter) const noexcept override { return inner_.listJobs(filter); }
    std::vector<ExecutionRecord> listRecords(const RecordFilter& filter) const noexcept override {
        return inner_.listRecords(filter);
    }
    bool reachable() const noexcept override { return inner_.reachable(); }

    std::atomic<bool> failJobs{false};

private:
    FileStore& inner_;
};

struct Fixture {
    TempWorkspace ws;
    FileStore store;
    ManualClock clock;
    Queue queue;

    explicit Fixture(const std::string& tag, QueueConfig config = {})
        : ws(tag), store(ws.path()), queue(store, clock, config) {
        expect(store.open(), "store opens");
        expect(queue.recover(), "queue recovers");
    }

    JobId enqueue(const std::string& payload, int maxAttempts = 3, Millis delay = Millis(0)) {
        EnqueueOptions options;
        options.maxAttempts = maxAttempts;
        options.delay = delay;
        auto result = queue.enqueue(payload, options);
        expect(result.ok, "enqueue " + payload + ": " + result.message);
        return result.id;
    }

    std::vector<ExecutionRecord> records(const JobId& id) const {
        RecordFilter filter;
        filter.jobId = id;
        return store.listRecords(filter);
    }
};

void test_enqueue_validation() {
    QueueConfig config;
    config.maxPayloadBytes = 16;
    Fixture f("queue_validation", config);

    auto empty = f.queue.enqueue("");
    expect(!empty && empty.error == ErrorKind::InvalidRequest, "empty payload rejected");

    auto oversized = f.queue.enqueue(std::string(17, 'x'));
    expect(!oversized && oversized.error == ErrorKind::InvalidRequest, "oversized payload rejected");

    EnqueueOptions zeroAttempts;
    zeroAttempts.maxAttempts = 0;
    auto zero = f.queue.enqueue("true", zeroAttempts);
    expect(!zero && zero.error == ErrorKind::InvalidRequest, "max_attempts 0 rejected");

    EnqueueOptions badId;
    badId.id = std::string("../escape");
    expect(!f.queue.enqueue("true", badId), "path-like id rejected");

    EnqueueOptions named;
    named.id = std::string("nightly-report");
    auto first = f.queue.enqueue("true", named);
    expect(first.ok && first.id == "nightly-report", "explicit id used");
    auto again = f.queue.enqueue("true", named);
    expect(!again && again.error == ErrorKind::InvalidRequest, "duplicate id rejected");

    auto defaults = f.queue.get("nightly-report");
    expect(defaults && defaults->maxAttempts == QueueConfig{}.defaultMaxAttempts, "default max attempts applied");
    expect(defaults->state == JobState::Waiting && defaults->attempts == 0, "new job is waiting");

    f.queue.setDraining(true);
    auto drained = f.queue.enqueue("true");
    expect(!drained && drained.error == ErrorKind::Draining, "enqueue refused while draining");
    f.queue.setDraining(false);
    expect(f.queue.enqueue("true").ok, "enqueue accepted again");
}

void test_claim_is_fifo_and_exclusive() {
    Fixture f("queue_fifo");
    JobId a = f.enqueue("a");
    f.clock.advance(Millis(1));
    JobId b = f.enqueue("b");

    auto first = f.queue.claim("w1", kLease).job;
    expect(first && first->id == a, "oldest job claimed first");
    expect(first->state == JobState::Active && first->lease, "claimed job is active with a lease");
    expect(first->lease->workerId == "w1", "lease names the claimer");
    expect(first->lease->expiresAt - first->lease->acquiredAt == kLease, "lease duration applied");

    auto second = f.queue.claim("w2", kLease).job;
    expect(second && second->id == b, "next job goes to the next claimer");
    auto empty = f.queue.claim("w3", kLease);
    expect(!empty && empty.error == ErrorKind::None, "nothing left to claim");
    expect(f.queue.claim("", kLease).error == ErrorKind::InvalidRequest, "claim without a worker id refused");

    auto persisted = f.store.loadJob(a);
    expect(persisted && persisted->state == JobState::Active && persisted->lease->workerId == "w1",
           "claim persisted before it is returned");
}

void test_racing_claimers_get_one_job() {
    for (int round = 0; round < 20; ++round) {
        Fixture f("queue_race");
        JobId id = f.enqueue("race");

        std::atomic<bool> go{false};
        std::atomic<int> winners{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&, i] {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                if (auto job = f.queue.claim("w" + std::to_string(i), kLease).job) {
                    expect(job->id == id, "claimed the only job");
                    winners.fetch_add(1);
                }
            });
        }
        go.store(true);
        for (auto& t : threads) {
            t.join();
        }
        expect(winners.load() == 1, "exactly one racing claimer receives the job");
    }
}

void test_concurrent_claims_never_duplicate() {
    Fixture f("queue_many");
    std::set<JobId> enqueued;
    for (int i = 0; i < 100; ++i) {
        enqueued.insert(f.enqueue("job " + std::to_string(i)));
    }

    std::mutex mutex;
    std::multiset<JobId> claimed;
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&, i] {
            const WorkerId worker = "w" + std::to_string(i);
            while (auto job = f.queue.claim(worker, kLease).job) {
                std::lock_guard<std::mutex> lock(mutex);
                claimed.insert(job->id);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    expect(claimed.size() == enqueued.size(), "every job claimed");
    for (const auto& id : enqueued) {
        expect(claimed.count(id) == 1, "job claimed exactly once: " + id);
    }
    expect(f.queue.counts().active == 100, "all jobs active");
}

void test_ack_completes_and_records() {
    Fixture f("queue_ack");
    JobId id = f.enqueue("work");
    auto job = f.queue.claim("w1", kLease).job;
    expect(job.has_value(), "claimed");

    f.clock.advance(Millis(250));
    auto settlement = f.queue.ack(id, "w1", "output");
    expect(settlement && settlement.decision == Decision::Completed, "ack accepted");
    expect(settlement.record && settlement.record->attempt == 1, "first attempt recorded");
    expect(settlement.record->outcome == Outcome::Success, "success outcome");
    expect(settlement.record->finishedAt - settlement.record->startedAt == Millis(250), "attempt timing recorded");

    auto stored = f.queue.get(id);
    expect(stored && stored->state == JobState::Completed && stored->attempts == 1, "job completed");
    expect(stored->result == "output" && !stored->lease, "result kept, lease released");
    expect(f.records(id).size() == 1, "one record persisted");

    auto late = f.queue.ack(id, "w1", "again");
    expect(!late && late.error == ErrorKind::NotOwner, "second ack refused");
    expect(!f.queue.claim("w2", kLease).job, "completed job never re-leased");

    QueueCounts counts = f.queue.counts();
    expect(counts.completed == 1 && counts.total() == 1, "counts track completed jobs");
}

void test_settlement_errors() {
    Fixture f("queue_errors");
    JobId id = f.enqueue("work");
    expect(f.queue.claim("owner", kLease).job.has_value(), "claimed");

    auto unknown = f.queue.ack("no-such-job", "owner", "");
    expect(!unknown && unknown.error == ErrorKind::UnknownJob, "unknown job");

    auto stranger = f.queue.ack(id, "stranger", "");
    expect(!stranger && stranger.error == ErrorKind::NotOwner, "other worker is not the owner");

    auto successNack = f.queue.nack(id, "owner", "x", Outcome::Success);
    expect(!successNack && successNack.error == ErrorKind::InvalidRequest, "nack with success outcome refused");

    f.clock.advance(kLease);
    auto expired = f.queue.ack(id, "owner", "");
    expect(!expired && expired.error == ErrorKind::LeaseExpired, "expired lease refused");
    expect(f.queue.extendLease(id, "owner", kLease) == ErrorKind::LeaseExpired, "expired lease not extended");
    expect(f.records(id).empty(), "rejected settlements record nothing");
}

void test_crashed_worker_job_reclaimed_after_expiry() {
    Fixture f("queue_crash");
    JobId id = f.enqueue("work", 3);
    expect(f.queue.claim("crashy", kLease).job.has_value(), "claimed");

    f.clock.advance(kLease - Millis(1));
    expect(f.queue.reap() == 0, "live lease not reaped");
    expect(!f.queue.claim("w2", kLease).job, "leased job not claimable");

    f.clock.advance(Millis(1));
    expect(f.queue.reap() == 1, "expired lease reaped");
    auto job = f.queue.get(id);
    expect(job && job->state == JobState::Waiting, "job waiting again");
    expect(job->attempts == 1 && !job->lease, "reclaim consumed an attempt");

    auto again = f.queue.claim("w2", kLease).job;
    expect(again && again->id == id && again->currentAttempt() == 2, "re-claimed as attempt 2");

    f.clock.advance(kLease);
    expect(f.queue.reap() == 1, "second expiry reaped");
    expect(f.queue.get(id)->attempts == 2, "attempts +1 per reclaim");

    auto records = f.records(id);
    expect(records.size() == 2, "one record per lost attempt");
    expect(records[0].attempt == 1 && records[0].workerId == "crashy" && records[0].outcome == Outcome::Timeout,
           "first lost attempt recorded");
    expect(records[1].attempt == 2 && records[1].workerId == "w2" && records[1].resultOrError == "lease expired",
           "second lost attempt recorded");
}

void test_reclaim_exhausts_attempts() {
    Fixture f("queue_reclaim_exhaust");
    JobId id = f.enqueue("work", 1);
    expect(f.queue.claim("crashy", kLease).job.has_value(), "claimed");

    f.clock.advance(kLease);
    expect(f.queue.reap() == 1, "reaped");
    auto job = f.queue.get(id);
    expect(job && job->state == JobState::Failed && job->attempts == 1, "job failed on last reclaim");

    auto records = f.records(id);
    expect(records.size() == 1 && records[0].outcome == Outcome::Timeout, "terminal timeout record");
    expect(records[0].workerId == "crashy", "record names the lost worker");
    expect(!f.queue.claim("w2", kLease).job, "failed job never re-leased");
}

void test_extend_lease_keeps_job() {
    Fixture f("queue_extend");
    JobId id = f.enqueue("work");
    expect(f.queue.claim("w1", kLease).job.has_value(), "claimed");

    for (int i = 0; i < 5; ++i) {
        f.clock.advance(kLease / 2);
        expect(f.queue.extendLease(id, "w1", kLease) == ErrorKind::None, "lease extended");
        expect(f.queue.reap() == 0, "extended lease not reaped");
    }
    expect(f.queue.extendLease(id, "w2", kLease) == ErrorKind::NotOwner, "stranger cannot extend");
    expect(f.queue.extendLease(id, "w1", Millis(0)) == ErrorKind::InvalidRequest, "zero extension refused");
    expect(f.store.loadJob(id)->lease->expiresAt == f.queue.get(id)->lease->expiresAt, "extension persisted");
}

void test_max_attempts_exhausted_by_failures() {
    Fixture f("queue_failures");
    JobId id = f.enqueue("flaky", 3);

    for (int attempt = 1; attempt <= 3; ++attempt) {
        auto job = f.queue.claim("w1", kLease).job;
        expect(job && job->currentAttempt() == attempt, "attempt " + std::to_string(attempt) + " claimed");
        auto settlement = f.queue.nack(id, "w1", "exit code 1");
        if (attempt < 3) {
            expect(settlement.decision == Decision::Rescheduled, "rescheduled");
            expect(settlement.error == ErrorKind::ExecutionFailure, "failure classified");
        } else {
            expect(settlement.decision == Decision::Failed, "terminal on last attempt");
            expect(settlement.error == ErrorKind::TerminalFailure, "terminal failure reported");
        }
    }

    auto job = f.queue.get(id);
    expect(job && job->state == JobState::Failed && job->attempts == 3, "job failed after 3 attempts");
    expect(job->lastError == "exit code 1", "last error kept");
    expect(!f.queue.claim("w1", kLease).job, "failed job never claimed again");

    auto records = f.records(id);
    expect(records.size() == 3, "three records");
    for (int i = 0; i < 3; ++i) {
        expect(records[i].attempt == i + 1 && records[i].outcome == Outcome::Failure, "failure record per attempt");
    }
    expect(f.queue.counts().failed == 1, "failed counted");
}

void test_nack_with_retry_delay() {
    Fixture f("queue_retry_delay");
    JobId id = f.enqueue("work");
    expect(f.queue.claim("w1", kLease).job.has_value(), "claimed");

    auto settlement = f.queue.nack(id, "w1", "took too long", Outcome::Timeout, Millis(2000));
    expect(settlement.decision == Decision::Rescheduled, "rescheduled");
    expect(settlement.error == ErrorKind::ExecutionTimeout, "timeout classified");
    expect(settlement.record && settlement.record->outcome == Outcome::Timeout, "timeout record");

    auto job = f.queue.get(id);
    expect(job && job->state == JobState::Delayed, "delayed for backoff");
    expect(settlement.nextEligibleAt == job->availableAt, "next eligible time reported");

    f.clock.advance(Millis(1999));
    expect(!f.queue.claim("w1", kLease).job, "not claimable during backoff");
    f.clock.advance(Millis(1));
    auto retry = f.queue.claim("w1", kLease).job;
    expect(retry && retry->id == id && retry->currentAttempt() == 2, "claimable once backoff passes");
}

void test_delayed_job_not_claimable_early() {
    Fixture f("queue_delay");
    JobId id = f.enqueue("later", 3, std::chrono::seconds(60));
    expect(f.queue.get(id)->state == JobState::Delayed, "stored as delayed");
    expect(f.queue.counts().delayed == 1, "counted as delayed");

    expect(!f.queue.claim("w1", kLease).job, "nothing at t=0");
    f.clock.advance(Millis(59999));
    expect(f.queue.promoteDelayed() == 0, "not promoted early");
    expect(!f.queue.claim("w1", kLease).job, "nothing just before 60s");

    f.clock.advance(Millis(1));
    auto job = f.queue.claim("w1", kLease).job;
    expect(job && job->id == id, "claimable at 60s");
}

void test_promote_delayed_sweep() {
    Fixture f("queue_promote");
    JobId id = f.enqueue("later", 3, Millis(500));
    f.clock.advance(Millis(500));
    expect(f.queue.promoteDelayed() == 1, "promoted by the sweep");
    expect(f.store.loadJob(id)->state == JobState::Waiting, "promotion persisted");
    expect(f.queue.waitForWork(Millis(1)), "work available after promotion");
}

void test_revoke_worker() {
    Fixture f("queue_revoke");
    JobId a = f.enqueue("a");
    JobId b = f.enqueue("b");
    expect(f.queue.claim("dead", kLease).job.has_value(), "a claimed");
    expect(f.queue.claim("alive", kLease).job.has_value(), "b claimed");

    expect(f.queue.revokeWorker("dead") == 1, "one lease revoked");
    auto ja = f.queue.get(a);
    expect(ja->state == JobState::Waiting && ja->attempts == 1, "revoked job waiting again");
    expect(f.queue.get(b)->state == JobState::Active, "other worker keeps its lease");

    auto late = f.queue.ack(a, "dead", "late result");
    expect(!late && late.error == ErrorKind::NotOwner, "revoked worker cannot settle");
}

void test_recover_after_restart() {
    TempWorkspace ws("queue_recover");
    ManualClock clock;
    JobId waiting, delayed, staleActive, liveActive, done;
    {
        FileStore store(ws.path());
        expect(store.open(), "store opens");
        Queue queue(store, clock);
        expect(queue.recover(), "fresh recover");

        EnqueueOptions later;
        later.delay = std::chrono::seconds(30);
        staleActive = queue.enqueue("stale").id;
        liveActive = queue.enqueue("live").id;
        done = queue.enqueue("done").id;
        waiting = queue.enqueue("waiting").id;
        delayed = queue.enqueue("delayed", later).id;

        expect(queue.claim("old-1", Millis(1000)).job.has_value(), "stale claimed");
        expect(queue.claim("old-2", Millis(60000)).job.has_value(), "live claimed");
        expect(queue.claim("old-3", Millis(60000)).job.has_value(), "done claimed");
        expect(queue.ack(done, "old-3", "ok").decision == Decision::Completed, "done acked");
        // Process dies here.
    }

    clock.advance(Millis(5000));
    FileStore store(ws.path());
    expect(store.open(), "store reopens");
    Queue queue(store, clock);
    expect(queue.recover(), "recover");

    auto counts = queue.counts();
    expect(counts.completed == 1, "completed job counted");
    expect(counts.delayed == 1, "delayed job restored");
    expect(counts.active == 1, "live lease stays active");
    expect(counts.waiting == 2, "waiting job plus reclaimed stale job");

    auto stale = queue.get(staleActive);
    expect(stale->state == JobState::Waiting && stale->attempts == 1, "expired lease reclaimed on recovery");
    expect(queue.get(liveActive)->lease->workerId == "old-2", "live lease kept");

    auto next = queue.claim("new", Millis(1000)).job;
    expect(next && next->id == waiting, "waiting order preserved");
    auto reclaimed = queue.claim("new-2", Millis(1000)).job;
    expect(reclaimed && reclaimed->id == staleActive, "reclaimed job queued behind");

    clock.advance(std::chrono::seconds(60));
    expect(queue.reap() >= 1, "old live lease reaped once expired");
    expect(queue.get(liveActive)->state == JobState::Waiting, "orphan of dead process returns to waiting");
}

void test_requeue_failed_job() {
    Fixture f("queue_requeue");
    JobId id = f.enqueue("retry me", 1);
    expect(f.queue.claim("w1", kLease).job.has_value(), "claimed");
    expect(f.queue.nack(id, "w1", "boom").decision == Decision::Failed, "failed");

    auto again = f.queue.requeue(id);
    expect(again.ok && again.id != id, "requeued under a new id");
    auto job = f.queue.get(again.id);
    expect(job && job->payload == "retry me" && job->maxAttempts == 1 && job->attempts == 0,
           "payload and attempt budget carried over");
    expect(f.queue.get(id)->state == JobState::Failed, "original stays failed");

    JobId pending = f.enqueue("pending");
    expect(f.queue.requeue(pending).error == ErrorKind::InvalidRequest, "only failed jobs requeue");
    expect(f.queue.requeue("ghost").error == ErrorKind::UnknownJob, "unknown job");
}

void test_claim_survives_store_failure() {
    TempWorkspace ws("queue_flaky");
    FileStore files(ws.path());
    expect(files.open(), "store opens");
    FlakyStore store(files);
    ManualClock clock;
    Queue queue(store, clock);
    expect(queue.recover(), "recover");

    JobId id = queue.enqueue("work").id;
    store.failJobs = true;
    auto failed = queue.claim("w1", kLease);
    expect(!failed && failed.error == ErrorKind::TransientError, "claim reports the store failure");
    expect(queue.get(id)->state == JobState::Waiting, "job still waiting");
    auto refused = queue.enqueue("more");
    expect(!refused && refused.error == ErrorKind::TransientError, "enqueue reports transient error");

    store.failJobs = false;
    auto job = queue.claim("w1", kLease).job;
    expect(job && job->id == id, "job claimable once the store is back");
}

} // namespace

int main() {
    quietLogs();
    std::cout << "=== quay Queue Test Suite ===\n";

    std::cout << "\n[Enqueue & Claim]\n";
    run_test("enqueue validation", test_enqueue_validation);
    run_test("claim is FIFO and exclusive", test_claim_is_fifo_and_exclusive);
    run_test("racing claimers get one job", test_racing_claimers_get_one_job);
    run_test("concurrent claims never duplicate", test_concurrent_claims_never_duplicate);

    std::cout << "\n[Settlement]\n";
    run_test("ack completes and records", test_ack_completes_and_records);
    run_test("settlement errors", test_settlement_errors);
    run_test("max attempts exhausted by failures", test_max_attempts_exhausted_by_failures);
    run_test("nack with retry delay", test_nack_with_retry_delay);

    std::cout << "\n[Leases]\n";
    run_test("crashed worker job reclaimed after expiry", test_crashed_worker_job_reclaimed_after_expiry);
    run_test("reclaim exhausts attempts", test_reclaim_exhausts_attempts);
    run_test("extend lease keeps job", test_extend_lease_keeps_job);
    run_test("revoke worker", test_revoke_worker);

    std::cout << "\n[Delays & Recovery]\n";
    run_test("delayed job not claimable early", test_delayed_job_not_claimable_early);
    run_test("promote delayed sweep", test_promote_delayed_sweep);
    run_test("recover after restart", test_recover_after_restart);
    run_test("requeue failed job", test_requeue_failed_job);
    run_test("claim survives store failure", test_claim_survives_store_failure);

    return finish("Queue");
}
