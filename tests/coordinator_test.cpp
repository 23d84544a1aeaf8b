/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/clock.hpp"
#include "quay/coordinator.hpp"
#include "quay/queue.hpp"
#include "quay/store.hpp"
#include "test_harness.hpp"

using namespace quay;
using namespace quay::test;

namespace {

const Millis kLease{30000};

struct Fixture {
    TempWorkspace ws;
    FileStore store;
    ManualClock clock;
    Queue queue;
    Coordinator coordinator;

    explicit Fixture(const std::string& tag)
        : ws(tag), store(ws.path()), queue(store, clock), coordinator(queue, clock, config()) {
        expect(store.open(), "store opens");
        expect(queue.recover(), "queue recovers");
    }

    static CoordinatorConfig config() {
        CoordinatorConfig c;
        c.heartbeatInterval = Millis(1000);
        c.livenessFactor = 3;
        return c;
    }

    JobId enqueue(const std::string& payload) {
        auto result = queue.enqueue(payload);
        expect(result.ok, "enqueue " + payload);
        return result.id;
    }
};

void test_register_and_heartbeat() {
    Fixture f("coord_register");
    expect(f.coordinator.registerWorker("w1") == ErrorKind::None, "register w1");
    expect(f.coordinator.registerWorker("") == ErrorKind::InvalidRequest, "empty id refused");
    expect(f.coordinator.heartbeat("ghost") == ErrorKind::UnknownWorker, "unknown worker heartbeat");

    auto w = f.coordinator.worker("w1");
    expect(w && w->status == WorkerStatus::Idle && !w->currentJob, "registered idle");
    expect(w->registeredAt == f.clock.now(), "registration time");

    f.clock.advance(Millis(700));
    expect(f.coordinator.heartbeat("w1") == ErrorKind::None, "heartbeat accepted");
    expect(f.coordinator.worker("w1")->lastHeartbeatAt == f.clock.now(), "heartbeat time recorded");

    expect(f.coordinator.registerWorker("w1") == ErrorKind::None, "re-register of a live worker is harmless");
    expect(f.coordinator.worker("w1")->registeredAt + Millis(700) == f.clock.now(), "registration time kept");
    expect(f.coordinator.listLiveWorkers().size() == 1, "one live worker");
}

void test_silent_worker_declared_dead() {
    Fixture f("coord_dead");
    JobId id = f.enqueue("work");
    expect(f.coordinator.registerWorker("steady") == ErrorKind::None, "register steady");
    expect(f.coordinator.registerWorker("silent") == ErrorKind::None, "register silent");

    auto job = f.coordinator.claim("silent", kLease).job;
    expect(job && job->id == id, "silent worker holds the job");
    expect(f.coordinator.worker("silent")->status == WorkerStatus::Busy, "busy while holding");

    for (int i = 0; i < 3; ++i) {
        f.clock.advance(Millis(1000));
        expect(f.coordinator.heartbeat("steady") == ErrorKind::None, "steady heartbeat");
    }
    expect(f.coordinator.sweep() == 0, "silent for exactly the window is still alive");

    f.clock.advance(Millis(1));
    expect(f.coordinator.sweep() == 1, "silent worker dies past the window");

    auto silent = f.coordinator.worker("silent");
    expect(silent && silent->status == WorkerStatus::Dead && !silent->currentJob, "marked dead");
    expect(f.coordinator.worker("steady")->status == WorkerStatus::Idle, "steady worker unaffected");

    auto live = f.coordinator.listLiveWorkers();
    expect(live.size() == 1 && live.count("steady") == 1, "only steady is live");

    auto reclaimed = f.queue.get(id);
    expect(reclaimed && reclaimed->state == JobState::Waiting, "lease revoked before expiry");
    expect(reclaimed->attempts == 1, "revocation consumed an attempt");

    auto late = f.queue.ack(id, "silent", "late");
    expect(!late && late.error == ErrorKind::NotOwner, "dead worker cannot settle");

    auto taken = f.coordinator.claim("steady", kLease).job;
    expect(taken && taken->id == id, "job handed to a live worker");
    expect(f.coordinator.sweep() == 0, "dead workers are not counted twice");
}

void test_dead_worker_must_register_again() {
    Fixture f("coord_revive");
    expect(f.coordinator.registerWorker("w1") == ErrorKind::None, "register");
    f.clock.advance(Millis(3001));
    expect(f.coordinator.sweep() == 1, "dies");

    f.enqueue("work");
    expect(f.coordinator.heartbeat("w1") == ErrorKind::UnknownWorker, "dead worker heartbeat refused");
    expect(f.coordinator.claim("w1", kLease).error == ErrorKind::UnknownWorker, "dead worker cannot claim");

    expect(f.coordinator.registerWorker("w1") == ErrorKind::None, "re-register");
    auto w = f.coordinator.worker("w1");
    expect(w->status == WorkerStatus::Idle && w->registeredAt == f.clock.now(), "revived as new registration");
    expect(f.coordinator.claim("w1", kLease).job.has_value(), "claims after re-registering");
}

void test_one_lease_per_worker() {
    Fixture f("coord_busy");
    JobId a = f.enqueue("a");
    JobId b = f.enqueue("b");
    expect(f.coordinator.registerWorker("w1") == ErrorKind::None, "register");
    expect(f.coordinator.claim("stranger", kLease).error == ErrorKind::UnknownWorker,
           "unregistered worker cannot claim");

    auto first = f.coordinator.claim("w1", kLease).job;
    expect(first && first->id == a, "first claim");
    expect(f.coordinator.worker("w1")->currentJob == a, "current job tracked");
    auto busy = f.coordinator.claim("w1", kLease);
    expect(!busy && busy.error == ErrorKind::InvalidRequest, "busy worker cannot claim a second job");
    expect(f.queue.get(b)->state == JobState::Waiting, "second job untouched");

    expect(f.queue.ack(a, "w1", "done").decision == Decision::Completed, "ack");
    f.coordinator.release("w1");
    expect(f.coordinator.worker("w1")->status == WorkerStatus::Idle, "idle after release");

    auto second = f.coordinator.claim("w1", kLease).job;
    expect(second && second->id == b, "claims again once released");
    f.coordinator.release("w1");

    auto none = f.coordinator.claim("w1", kLease);
    expect(!none && none.error == ErrorKind::None, "empty queue");
    expect(f.coordinator.worker("w1")->status == WorkerStatus::Idle, "empty claim leaves the worker idle");
}

void test_deregister_revokes_lease() {
    Fixture f("coord_deregister");
    JobId id = f.enqueue("work");
    expect(f.coordinator.registerWorker("w1") == ErrorKind::None, "register");
    expect(f.coordinator.claim("w1", kLease).job.has_value(), "claimed");

    f.coordinator.deregister("w1");
    expect(!f.coordinator.worker("w1"), "worker forgotten");
    expect(f.queue.get(id)->state == JobState::Waiting, "job returned to waiting");
    expect(f.coordinator.heartbeat("w1") == ErrorKind::UnknownWorker, "heartbeat after deregister refused");
    f.coordinator.deregister("w1");
}

void test_concurrent_workers_share_queue() {
    Fixture f("coord_concurrent");
    for (int i = 0; i < 40; ++i) {
        f.enqueue("job " + std::to_string(i));
    }

    std::atomic<int> completed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            const WorkerId id = "w" + std::to_string(i);
            expect(f.coordinator.registerWorker(id) == ErrorKind::None, "register " + id);
            while (auto job = f.coordinator.claim(id, kLease).job) {
                expect(f.coordinator.heartbeat(id) == ErrorKind::None, "heartbeat " + id);
                if (f.queue.ack(job->id, id, "ok")) {
                    completed.fetch_add(1);
                }
                f.coordinator.release(id);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    expect(completed.load() == 40, "every job completed once");
    expect(f.queue.counts().completed == 40, "queue agrees");
    for (const auto& w : f.coordinator.workers()) {
        expect(w.status == WorkerStatus::Idle, "all workers idle at the end");
    }
}

} // namespace

int main() {
    quietLogs();
    std::cout << "=== quay Coordinator Test Suite ===\n";

    run_test("register and heartbeat", test_register_and_heartbeat);
    run_test("silent worker declared dead", test_silent_worker_declared_dead);
    run_test("dead worker must register again", test_dead_worker_must_register_again);
    run_test("one lease per worker", test_one_lease_per_worker);
    run_test("deregister revokes lease", test_deregister_revokes_lease);
    run_test("concurrent workers share queue", test_concurrent_workers_share_queue);

    return finish("Coordinator");
}
