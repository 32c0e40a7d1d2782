#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "application/BackupOrchestrator.hpp"
#include "application/ShutdownSignal.hpp"
#include "domain/ContentHasher.hpp"
#include "domain/MonitorConfig.hpp"
#include "infrastructure/BackupLedger.hpp"
#include "infrastructure/Md5ContentHasher.hpp"

using namespace stablecopy;
using application::BackupOrchestrator;
using application::CopyOutcome;
using application::CycleReport;
using application::ShutdownSignal;
namespace fs = std::filesystem;

namespace {

class FailingHasher : public domain::ContentHasher {
public:
    domain::HashResult hash(const std::string&) const override {
        domain::HashResult result;
        result.ok = false;
        result.error = "simulated read failure";
        return result;
    }
    std::string algorithm() const override { return "failing"; }
};

// Hashes normally but raises the stop flag the first time it runs, as a signal
// arriving during the first copy of a cycle would.
class StopOnFirstHash : public domain::ContentHasher {
public:
    explicit StopOnFirstHash(ShutdownSignal& signal) : m_signal(signal) {}

    domain::HashResult hash(const std::string& path) const override {
        m_signal.notifyFromSignalHandler();
        return m_inner.hash(path);
    }
    std::string algorithm() const override { return m_inner.algorithm(); }

private:
    ShutdownSignal& m_signal;
    infrastructure::Md5ContentHasher m_inner;
};

struct Fixture {
    fs::path root;
    domain::MonitorConfig config;
    std::shared_ptr<infrastructure::BackupLedger> ledger;
    std::shared_ptr<const domain::ContentHasher> hasher;
};

Fixture MakeFixture(const std::string& name, std::int64_t interval = 1, std::int64_t threshold = 2) {
    Fixture f;
    f.root = fs::temp_directory_path() / "stablecopy-tests" / name;
    std::error_code ec;
    fs::remove_all(f.root, ec);
    fs::create_directories(f.root / "watch");

    f.config.monitorDir = f.root / "watch";
    f.config.destBaseDir = f.root / "backup";
    f.config.destSubdirName = "saved";
    f.config.fileExtensions = {".tgz"};
    f.config.checkIntervalSeconds = interval;
    f.config.stableThresholdSeconds = threshold;
    f.config.ledgerPath = f.root / "state" / "backup_state.json";
    f.config.saveAfterEachCopy = true;

    f.ledger = std::make_shared<infrastructure::BackupLedger>(f.config.ledgerPath);
    f.hasher = std::make_shared<infrastructure::Md5ContentHasher>();
    return f;
}

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void testStableFileCopiedOnThirdScan() {
    Fixture f = MakeFixture("orch-scenario");
    WriteFile(f.config.monitorDir / "a.tgz", std::string(100, 'a'));
    WriteFile(f.config.monitorDir / "notes.txt", "ignored");
    fs::create_directories(f.config.monitorDir / "folder.tgz");

    BackupOrchestrator orchestrator(f.config, f.ledger, f.hasher);
    orchestrator.initialize();
    assert(fs::is_directory(f.root / "backup" / "saved"));
    assert(orchestrator.destDir() == f.root / "backup" / "saved");

    CycleReport r1 = orchestrator.runOnce();
    assert(r1.candidates == 1);
    assert(r1.admitted == 1);
    assert(r1.copied == 0);

    CycleReport r2 = orchestrator.runOnce();
    assert(r2.promoted == 0);
    assert(orchestrator.tracker().find((f.config.monitorDir / "a.tgz").string())->stableCount == 1);

    CycleReport r3 = orchestrator.runOnce();
    assert(r3.promoted == 1);
    assert(r3.copied == 1);

    const fs::path copy = orchestrator.destDir() / "a.tgz";
    assert(fs::exists(copy));
    assert(ReadFile(copy) == std::string(100, 'a'));
    assert(!fs::exists(orchestrator.destDir() / "a.tgz.part"));
    assert(!fs::exists(orchestrator.destDir() / "notes.txt"));

    assert(f.ledger->size() == 1);
    assert(f.ledger->entries()[0].key.relativePath == "a.tgz");
    assert(f.ledger->entries()[0].key.contentHash == f.hasher->hash((f.config.monitorDir / "a.tgz").string()).digest);

    // Saved after the copying cycle.
    assert(fs::exists(f.config.ledgerPath));
    assert(!f.ledger->isDirty());

    // Metadata travels with the bytes.
    assert(fs::last_write_time(copy) == fs::last_write_time(f.config.monitorDir / "a.tgz"));
    assert(fs::status(copy).permissions() == fs::status(f.config.monitorDir / "a.tgz").permissions());

    // Idempotence: more passes over the unchanged tree never copy again.
    fs::remove(copy);
    for (int i = 0; i < 6; ++i) {
        CycleReport r = orchestrator.runOnce();
        assert(r.copied == 0);
    }
    assert(!fs::exists(copy));
    assert(f.ledger->size() == 1);

    fs::remove_all(f.root);
}

void testDedupAfterRecreate() {
    Fixture f = MakeFixture("orch-dedup", 1, 1);
    const fs::path source = f.config.monitorDir / "b.tgz";
    WriteFile(source, "package-b-contents");

    BackupOrchestrator orchestrator(f.config, f.ledger, f.hasher);
    orchestrator.initialize();
    orchestrator.runOnce();
    CycleReport copied = orchestrator.runOnce();
    assert(copied.copied == 1);
    const fs::path copy = orchestrator.destDir() / "b.tgz";
    assert(fs::exists(copy));

    // Source deleted, destination copy removed too, then identical content re-created.
    fs::remove(source);
    fs::remove(copy);
    orchestrator.runOnce();
    WriteFile(source, "package-b-contents");

    CycleReport admitted = orchestrator.runOnce();
    assert(admitted.admitted == 1);
    CycleReport skipped = orchestrator.runOnce();
    assert(skipped.promoted == 1);
    assert(skipped.dedupSkipped == 1);
    assert(skipped.copied == 0);
    assert(skipped.copyFailures == 0 && skipped.hashFailures == 0);
    assert(!fs::exists(copy));

    // Different content under the same name is a new fact and is copied.
    WriteFile(source, "package-b-contents-v2");
    orchestrator.runOnce();
    CycleReport changed = orchestrator.runOnce();
    assert(changed.copied == 1);
    assert(ReadFile(copy) == "package-b-contents-v2");
    assert(f.ledger->size() == 2);

    fs::remove_all(f.root);
}

void testGrowingAndDeletedFilesNeverCopied() {
    Fixture f = MakeFixture("orch-unstable");
    const fs::path growing = f.config.monitorDir / "grow.tgz";
    const fs::path doomed = f.config.monitorDir / "doomed.tgz";
    WriteFile(doomed, "short-lived");

    BackupOrchestrator orchestrator(f.config, f.ledger, f.hasher);
    orchestrator.initialize();

    std::string content;
    for (int i = 0; i < 8; ++i) {
        content += "more-data-";
        WriteFile(growing, content);
        if (i == 1) fs::remove(doomed);
        CycleReport r = orchestrator.runOnce();
        assert(r.copied == 0);
        assert(r.promoted == 0);
    }
    assert(!orchestrator.tracker().isTracked(doomed.string()));
    assert(orchestrator.tracker().find(growing.string())->stableCount == 0);
    assert(f.ledger->size() == 0);
    assert(fs::is_empty(orchestrator.destDir()));

    fs::remove_all(f.root);
}

void testZeroThreshold() {
    Fixture f = MakeFixture("orch-zero", 1, 0);
    WriteFile(f.config.monitorDir / "z.tgz", "zero");

    BackupOrchestrator orchestrator(f.config, f.ledger, f.hasher);
    orchestrator.initialize();
    CycleReport first = orchestrator.runOnce();
    assert(first.admitted == 1 && first.copied == 0);
    CycleReport second = orchestrator.runOnce();
    assert(second.copied == 1);

    fs::remove_all(f.root);
}

void testHashFailureCopiesNothing() {
    Fixture f = MakeFixture("orch-hashfail", 1, 1);
    f.hasher = std::make_shared<FailingHasher>();
    WriteFile(f.config.monitorDir / "h.tgz", "hash-me");

    BackupOrchestrator orchestrator(f.config, f.ledger, f.hasher);
    orchestrator.initialize();
    orchestrator.runOnce();
    CycleReport r = orchestrator.runOnce();
    assert(r.promoted == 1);
    assert(r.hashFailures == 1);
    assert(r.copied == 0);
    assert(f.ledger->size() == 0);
    assert(!fs::exists(orchestrator.destDir() / "h.tgz"));
    assert(!orchestrator.tracker().isTracked((f.config.monitorDir / "h.tgz").string()));

    assert(orchestrator.copyStableFile((f.config.monitorDir / "h.tgz").string()) == CopyOutcome::HashFailed);
    fs::remove_all(f.root);
}

void testCopyFailureLeavesLedgerUntouched() {
    Fixture f = MakeFixture("orch-copyfail", 1, 1);
    const fs::path source = f.config.monitorDir / "c.tgz";
    WriteFile(source, "copy-me");

    BackupOrchestrator orchestrator(f.config, f.ledger, f.hasher);
    orchestrator.initialize();

    // Destination vanishes after startup.
    fs::remove_all(orchestrator.destDir());

    orchestrator.runOnce();
    CycleReport failed = orchestrator.runOnce();
    assert(failed.promoted == 1);
    assert(failed.copyFailures == 1);
    assert(f.ledger->size() == 0);
    assert(!f.ledger->isDirty());

    // Re-discovered from scratch on the next cycle.
    CycleReport again = orchestrator.runOnce();
    assert(again.admitted == 1);
    assert(orchestrator.tracker().find(source.string())->stableCount == 0);

    fs::remove_all(f.root);
}

void testDestinationCreationFailureIsFatal() {
    Fixture f = MakeFixture("orch-nodest");
    WriteFile(f.root / "not-a-dir", "x");
    f.config.destBaseDir = f.root / "not-a-dir";

    BackupOrchestrator orchestrator(f.config, f.ledger, f.hasher);
    bool threw = false;
    try {
        orchestrator.initialize();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    fs::remove_all(f.root);
}

void testLedgerSurvivesRestart() {
    Fixture f = MakeFixture("orch-restart", 1, 1);
    WriteFile(f.config.monitorDir / "r.tgz", "restart-me");

    {
        BackupOrchestrator first(f.config, f.ledger, f.hasher);
        first.initialize();
        first.runOnce();
        assert(first.runOnce().copied == 1);
    }

    // A fresh ledger instance, as in a new process, loads the saved store on initialize.
    auto freshLedger = std::make_shared<infrastructure::BackupLedger>(f.config.ledgerPath);
    BackupOrchestrator second(f.config, freshLedger, f.hasher);
    second.initialize();
    assert(freshLedger->size() == 1);
    second.runOnce();
    CycleReport r = second.runOnce();
    assert(r.dedupSkipped == 1);
    assert(r.copied == 0);

    fs::remove_all(f.root);
}

void testRunStopsPromptlyAndSavesLedger() {
    Fixture f = MakeFixture("orch-run", 60, 120);
    WriteFile(f.config.monitorDir / "slow.tgz", "waiting");

    BackupOrchestrator orchestrator(f.config, f.ledger, f.hasher);
    orchestrator.initialize();
    f.ledger->record("previous.tgz", "0123456789abcdef0123456789abcdef");

    ShutdownSignal signal;
    const auto started = std::chrono::steady_clock::now();
    std::thread stopper([&signal]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        signal.requestStop();
    });
    orchestrator.run(signal);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    assert(elapsed < std::chrono::seconds(5));
    assert(fs::exists(f.config.ledgerPath));
    assert(!f.ledger->isDirty());

    infrastructure::BackupLedger reloaded(f.config.ledgerPath);
    assert(reloaded.loadFromDisk().ok);
    assert(reloaded.isAlreadyBackedUp("previous.tgz", "0123456789abcdef0123456789abcdef"));

    fs::remove_all(f.root);
}

void testSignalHandlerPathWakesWaiter() {
    ShutdownSignal signal;
    assert(!signal.stopRequested());
    assert(!signal.waitFor(std::chrono::milliseconds(10)));

    std::thread notifier([&signal]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        signal.notifyFromSignalHandler();
    });
    const auto started = std::chrono::steady_clock::now();
    const bool stopped = signal.waitFor(std::chrono::seconds(30));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    notifier.join();

    assert(stopped);
    assert(elapsed < ShutdownSignal::kWaitSlice + std::chrono::seconds(1));

    // Once set, later waits return immediately.
    assert(signal.waitFor(std::chrono::seconds(30)));
}

void testStopDuringCycleDefersRestAndKeepsCopies() {
    Fixture f = MakeFixture("orch-stop-mid-cycle", 1, 1);
    WriteFile(f.config.monitorDir / "first.tgz", "first-package");
    WriteFile(f.config.monitorDir / "second.tgz", "second-package");
    f.config.saveAfterEachCopy = false;

    ShutdownSignal signal;
    f.hasher = std::make_shared<StopOnFirstHash>(signal);
    BackupOrchestrator orchestrator(f.config, f.ledger, f.hasher);
    orchestrator.initialize();

    orchestrator.runOnce(&signal);
    CycleReport r = orchestrator.runOnce(&signal);
    assert(r.promoted == 2);
    assert(r.copied == 1);
    assert(r.deferred == 1);
    assert(fs::exists(orchestrator.destDir() / "first.tgz"));
    assert(!fs::exists(orchestrator.destDir() / "second.tgz"));

    // The copy finished before the stop is still owed to the store.
    assert(f.ledger->isDirty());
    assert(f.ledger->saveToDisk().ok);
    infrastructure::BackupLedger reloaded(f.config.ledgerPath);
    assert(reloaded.loadFromDisk().ok);
    assert(reloaded.size() == 1);
    assert(reloaded.entries()[0].key.relativePath == "first.tgz");

    fs::remove_all(f.root);
}

void testHugeWaitStillSleeps() {
    ShutdownSignal signal;
    std::thread stopper([&signal]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        signal.requestStop();
    });
    const auto started = std::chrono::steady_clock::now();
    const bool stopped = signal.waitFor(std::chrono::milliseconds::max());
    const auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    // Returned because of the stop, not because the deadline wrapped into the past.
    assert(stopped);
    assert(elapsed >= std::chrono::milliseconds(250));

    ShutdownSignal other;
    std::thread stopper2([&other]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        other.requestStop();
    });
    const auto started2 = std::chrono::steady_clock::now();
    const bool stopped2 = other.waitFor(std::chrono::seconds(domain::MonitorConfig::kMaxCheckIntervalSeconds));
    const auto elapsed2 = std::chrono::steady_clock::now() - started2;
    stopper2.join();
    assert(stopped2);
    assert(elapsed2 >= std::chrono::milliseconds(250));
}

} // namespace

int main() {
    std::cout << "[Test] Starting BackupOrchestrator Test..." << std::endl;

    testStableFileCopiedOnThirdScan();
    testDedupAfterRecreate();
    testGrowingAndDeletedFilesNeverCopied();
    testZeroThreshold();
    testHashFailureCopiesNothing();
    testCopyFailureLeavesLedgerUntouched();
    testDestinationCreationFailureIsFatal();
    testLedgerSurvivesRestart();
    testRunStopsPromptlyAndSavesLedger();
    testSignalHandlerPathWakesWaiter();
    testStopDuringCycleDefersRestAndKeepsCopies();
    testHugeWaitStillSleeps();

    std::cout << "[PASS] BackupOrchestrator Test." << std::endl;
    return 0;
}
