#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

#include "tickdb/etl/engine.hpp"
#include "tickdb/etl/poll_control.hpp"
#include "tickdb/scid/constants.hpp"

#include "common/test_check.hpp"
#include "common/scid_fixture.hpp"

using namespace tickdb;
using namespace tickdb::etl;
using namespace tickdb::test;
using namespace std::chrono_literals;


namespace {

core::Config make_config(const ScidFixture& fx) {
    core::Config cfg;
    cfg.sc_root = fx.root();
    cfg.db_path = fx.db_path();
    cfg.sleep_int = 0.01;
    return cfg;
}

core::ContractConfig contract(const std::string& id, bool tas, bool depth) {
    core::ContractConfig c;
    c.id = id;
    c.tas_enabled = tas;
    c.depth_enabled = depth;
    return c;
}

int64_t rows(sink::Database& db, const std::string& id, StreamKind kind) {
    int64_t n = -1;
    TEST_CHECK_OK(db.row_count(id, kind, n));
    return n;
}

} // namespace


// -----------------------------------------------------------------------------
// Time and sales
// -----------------------------------------------------------------------------
void test_tas_checkpoint_is_monotonic() {
    std::cout << "[TEST] tas checkpoint is monotonic" << std::endl;
    ScidFixture fx("eng_tas");
    fx.write_tas("ES", tas_series(1000, 5));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", true, false));
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(1ms);

    {
        Engine engine(cfg, db, control);
        TEST_CHECK_OK(engine.run_tas(false));
    }
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == 5);
    TEST_CHECK(rows(db, "ES", StreamKind::Tas) == 5);

    fx.append_tas("ES", tas_series(2000, 3));
    {
        Engine engine(cfg, db, control);
        TEST_CHECK_OK(engine.run_tas(false));
    }
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == 8);
    TEST_CHECK(rows(db, "ES", StreamKind::Tas) == 8);

    // Nothing new: checkpoint and table unchanged
    {
        Engine engine(cfg, db, control);
        TEST_CHECK_OK(engine.run_tas(false));
    }
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == 8);
    TEST_CHECK(rows(db, "ES", StreamKind::Tas) == 8);
    std::cout << "[TEST] OK" << std::endl;
}

void test_tas_backlog_larger_than_one_batch() {
    std::cout << "[TEST] tas backlog larger than one batch" << std::endl;
    const std::size_t n = scid::DECODE_BATCH_RECORDS + 7;
    ScidFixture fx("eng_tas_backlog");
    fx.write_tas("ES", tas_series(1, n));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", true, false));
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(1ms);

    // One-shot run still reaches the end of the file
    Engine engine(cfg, db, control);
    TEST_CHECK_OK(engine.run_tas(false));
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == static_cast<int64_t>(n));
    TEST_CHECK(rows(db, "ES", StreamKind::Tas) == static_cast<int64_t>(n));
    std::cout << "[TEST] OK" << std::endl;
}

void test_tas_missing_file_is_soft() {
    std::cout << "[TEST] tas missing file is soft" << std::endl;
    ScidFixture fx("eng_tas_missing");
    fx.write_tas("NQ", tas_series(1, 4));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", true, false));
    cfg.contracts.push_back(contract("NQ", true, false));
    cfg.contracts[0].checkpoint_tas = 17;
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(1ms);

    Engine engine(cfg, db, control);
    TEST_CHECK_OK(engine.run_tas(false));
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == 17);
    TEST_CHECK(cfg.contracts[1].checkpoint_tas == 4);
    std::cout << "[TEST] OK" << std::endl;
}

void test_tas_storage_failure_keeps_checkpoint() {
    std::cout << "[TEST] tas storage failure keeps checkpoint" << std::endl;
    ScidFixture fx("eng_tas_storage");
    fx.write_tas("ES", tas_series(1, 6));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", true, false));
    cfg.contracts[0].checkpoint_tas = 2;
    sink::Database db; // never opened
    PollControl control(1ms);

    Engine engine(cfg, db, control);
    TEST_CHECK_OK(engine.run_tas(false));
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == 2);
    std::cout << "[TEST] OK" << std::endl;
}

void test_tas_failure_after_committed_batch_keeps_checkpoint() {
    std::cout << "[TEST] tas failure after committed batch keeps checkpoint" << std::endl;
    ScidFixture fx("eng_tas_late_failure");
    fx.write_tas("ES", tas_series(1, 4));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", true, false));
    cfg.contracts[0].checkpoint_tas = 1;
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(5ms);

    Status run_status = Status::STORAGE_FAILED;
    Engine engine(cfg, db, control);
    std::thread runner([&] { run_status = engine.run_tas(true); });

    // First batch (records 1..3) lands
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (rows(db, "ES", StreamKind::Tas) < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    TEST_CHECK(rows(db, "ES", StreamKind::Tas) == 3);

    // Next batch cannot be stored: the worker gives up on its own
    db.close();
    fx.append_tas("ES", tas_series(100, 2));
    runner.join();

    TEST_CHECK_OK(run_status);
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == 1);

    // The committed batch stays in the table; it is simply not credited
    TEST_CHECK_OK(db.open(cfg.db_path));
    TEST_CHECK(rows(db, "ES", StreamKind::Tas) == 3);
    std::cout << "[TEST] OK" << std::endl;
}

void test_tas_disabled_contract_untouched() {
    std::cout << "[TEST] tas disabled contract untouched" << std::endl;
    ScidFixture fx("eng_tas_disabled");
    fx.write_tas("ES", tas_series(1, 3));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", false, false));
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(1ms);

    Engine engine(cfg, db, control);
    TEST_CHECK_OK(engine.run(false));
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == 0);
    TEST_CHECK(rows(db, "ES", StreamKind::Tas) == 0);
    std::cout << "[TEST] OK" << std::endl;
}

// -----------------------------------------------------------------------------
// Market depth
// -----------------------------------------------------------------------------
void test_depth_resumes_and_advances_to_last_shard() {
    std::cout << "[TEST] depth resumes and advances to last shard" << std::endl;
    ScidFixture fx("eng_depth");
    fx.write_depth("ES", "2025-03-31", depth_series(100, 3));
    fx.write_depth("ES", "2025-04-01", depth_series(200, 10));
    fx.write_depth("ES", "2025-04-02", depth_series(300, 4));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", false, true));
    cfg.contracts[0].checkpoint_depth = core::DepthCheckpoint{"2025-04-01", 5};
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(1ms);

    Engine engine(cfg, db, control);
    TEST_CHECK_OK(engine.run_depth(false));
    TEST_CHECK((cfg.contracts[0].checkpoint_depth == core::DepthCheckpoint{"2025-04-02", 4}));
    // 5 remaining of 2025-04-01 + 4 of 2025-04-02; 2025-03-31 skipped
    TEST_CHECK(rows(db, "ES", StreamKind::Depth) == 9);

    // Re-running the same range is harmless for depth
    cfg.contracts[0].checkpoint_depth = core::DepthCheckpoint{"2025-04-01", 5};
    TEST_CHECK_OK(engine.run_depth(false));
    TEST_CHECK(rows(db, "ES", StreamKind::Depth) == 9);
    std::cout << "[TEST] OK" << std::endl;
}

void test_depth_format_error_keeps_previous_shard() {
    std::cout << "[TEST] depth format error keeps previous shard" << std::endl;
    ScidFixture fx("eng_depth_format");
    fx.write_depth("ES", "2025-03-31", depth_series(100, 3));
    fx.write_depth("ES", "2025-04-01", depth_series(200, 10));
    // 2025-04-02 carries an intraday header: not a depth file
    std::vector<uint8_t> bytes(scid::DEPTH_HEADER_LEN, 0);
    scid::IntradayHeader{}.serialize(bytes.data());
    fx.write_raw(fx.depth_path("ES", "2025-04-02"), bytes);
    fx.append_depth("ES", "2025-04-02", depth_series(300, 4));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", false, true));
    cfg.contracts[0].checkpoint_depth = core::DepthCheckpoint{"2025-04-01", 5};
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(1ms);

    Engine engine(cfg, db, control);
    TEST_CHECK_OK(engine.run_depth(false));
    TEST_CHECK((cfg.contracts[0].checkpoint_depth == core::DepthCheckpoint{"2025-04-01", 10}));

    // Already at the end of 2025-04-01: stays there
    TEST_CHECK_OK(engine.run_depth(false));
    TEST_CHECK((cfg.contracts[0].checkpoint_depth == core::DepthCheckpoint{"2025-04-01", 10}));
    std::cout << "[TEST] OK" << std::endl;
}

void test_depth_missing_directory() {
    std::cout << "[TEST] depth missing directory" << std::endl;
    ScidFixture fx("eng_depth_nodir");
    fx.write_tas("ES", tas_series(1, 2));
    std::filesystem::remove_all(core::depth_dir(fx.root()));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", true, true));
    cfg.contracts[0].checkpoint_depth = core::DepthCheckpoint{"2025-04-01", 3};
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(1ms);

    Engine engine(cfg, db, control);
    TEST_CHECK_STATUS(engine.run_depth(false), Status::DIRECTORY_NOT_FOUND);
    // The TAS phase of a full run is unaffected
    TEST_CHECK_STATUS(engine.run(false), Status::DIRECTORY_NOT_FOUND);
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == 2);
    TEST_CHECK((cfg.contracts[0].checkpoint_depth == core::DepthCheckpoint{"2025-04-01", 3}));
    std::cout << "[TEST] OK" << std::endl;
}

void test_depth_contracts_are_independent() {
    std::cout << "[TEST] depth contracts are independent" << std::endl;
    ScidFixture fx("eng_depth_multi");
    fx.write_depth("ES", "2025-04-01", depth_series(100, 6));
    fx.write_depth("NQ", "2025-04-01", depth_series(100, 2));
    std::vector<uint8_t> garbage(scid::DEPTH_HEADER_LEN, 0xAB);
    fx.write_raw(fx.depth_path("CL", "2025-04-01"), garbage);

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", false, true));
    cfg.contracts.push_back(contract("CL", false, true));
    cfg.contracts.push_back(contract("NQ", false, true));
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(1ms);

    Engine engine(cfg, db, control);
    TEST_CHECK_OK(engine.run_depth(false));
    TEST_CHECK((cfg.contracts[0].checkpoint_depth == core::DepthCheckpoint{"2025-04-01", 6}));
    TEST_CHECK(cfg.contracts[1].checkpoint_depth.date.empty());
    TEST_CHECK((cfg.contracts[2].checkpoint_depth == core::DepthCheckpoint{"2025-04-01", 2}));
    std::cout << "[TEST] OK" << std::endl;
}

// -----------------------------------------------------------------------------
// Continuous mode
// -----------------------------------------------------------------------------
void test_continuous_tails_until_stopped() {
    std::cout << "[TEST] continuous tails until stopped" << std::endl;
    ScidFixture fx("eng_follow");
    fx.write_tas("ES", tas_series(1000, 2));
    fx.write_depth("ES", "2025-03-31", depth_series(100, 3));
    fx.write_depth("ES", "2025-04-01", depth_series(200, 1));

    auto cfg = make_config(fx);
    cfg.contracts.push_back(contract("ES", true, true));
    sink::Database db;
    TEST_CHECK_OK(db.open(cfg.db_path));
    PollControl control(5ms);

    Status run_status = Status::STORAGE_FAILED;
    Engine engine(cfg, db, control);
    std::thread runner([&] { run_status = engine.run(true); });

    auto wait_rows = [&](StreamKind kind, int64_t n) {
        const auto deadline = std::chrono::steady_clock::now() + 10s;
        while (std::chrono::steady_clock::now() < deadline) {
            if (rows(db, "ES", kind) >= n) return true;
            std::this_thread::sleep_for(5ms);
        }
        return false;
    };

    TEST_CHECK(wait_rows(StreamKind::Tas, 2));
    TEST_CHECK(wait_rows(StreamKind::Depth, 4));

    // Writers keep appending while the engine tails
    fx.append_tas("ES", tas_series(2000, 3));
    fx.append_depth("ES", "2025-04-01", depth_series(201, 5));
    TEST_CHECK(wait_rows(StreamKind::Tas, 5));
    TEST_CHECK(wait_rows(StreamKind::Depth, 9));

    control.request_stop();
    runner.join();

    TEST_CHECK_OK(run_status);
    TEST_CHECK(cfg.contracts[0].checkpoint_tas == 5);
    TEST_CHECK((cfg.contracts[0].checkpoint_depth == core::DepthCheckpoint{"2025-04-01", 6}));
    std::cout << "[TEST] OK" << std::endl;
}

void test_poll_control_stop() {
    std::cout << "[TEST] poll control stop" << std::endl;
    PollControl control(10s);
    TEST_CHECK(!control.stop_requested());

    const auto t0 = std::chrono::steady_clock::now();
    std::thread waker([&] {
        std::this_thread::sleep_for(20ms);
        control.request_stop();
    });
    TEST_CHECK(!control.wait());
    waker.join();
    TEST_CHECK(std::chrono::steady_clock::now() - t0 < 5s);
    TEST_CHECK(control.stop_requested());
    TEST_CHECK(!control.wait());

    PollControl quick(1ms);
    TEST_CHECK(quick.wait());
    quick.signal_stop();
    TEST_CHECK(!quick.wait());

    TEST_CHECK(PollControl::from_seconds(1.5).interval() == 1500ms);
    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_tas_checkpoint_is_monotonic();
    test_tas_backlog_larger_than_one_batch();
    test_tas_missing_file_is_soft();
    test_tas_storage_failure_keeps_checkpoint();
    test_tas_failure_after_committed_batch_keeps_checkpoint();
    test_tas_disabled_contract_untouched();
    test_depth_resumes_and_advances_to_last_shard();
    test_depth_format_error_keeps_previous_shard();
    test_depth_missing_directory();
    test_depth_contracts_are_independent();
    test_continuous_tails_until_stopped();
    test_poll_control_stop();

    std::cout << "\n[ALL ENGINE TESTS PASSED]" << std::endl;
    return 0;
}
