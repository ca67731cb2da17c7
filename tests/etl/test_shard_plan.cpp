#include <iostream>
#include <vector>

#include "tickdb/etl/shard.hpp"
#include "tickdb/etl/engine.hpp"

#include "common/test_check.hpp"
#include "common/scid_fixture.hpp"

using namespace tickdb;
using namespace tickdb::etl;
using namespace tickdb::test;


void test_list_filters_and_sorts() {
    std::cout << "[TEST] list filters and sorts" << std::endl;
    ScidFixture fx("plan_list");
    fx.write_depth("ES", "2025-04-02", {});
    fx.write_depth("ES", "2025-03-31", {});
    fx.write_depth("ES", "2025-04-01", {});
    fx.write_depth("NQ", "2025-04-01", {});
    fx.write_depth("ES.X", "2025-04-01", {});
    fx.write_raw(fx.root() + "/Data/MarketDepthData/ES.2025-04-01.depth.bak", {});
    fx.write_raw(fx.root() + "/Data/MarketDepthData/ES.20250401.depth", {});

    std::vector<DepthShard> shards;
    TEST_CHECK_OK(list_depth_shards(core::depth_dir(fx.root()), "ES", shards));
    TEST_CHECK(shards.size() == 3);
    TEST_CHECK(shards[0].date == "2025-03-31");
    TEST_CHECK(shards[1].date == "2025-04-01");
    TEST_CHECK(shards[2].date == "2025-04-02");
    TEST_CHECK(shards[1].path.filename() == "ES.2025-04-01.depth");
    std::cout << "[TEST] OK" << std::endl;
}

void test_list_missing_directory() {
    std::cout << "[TEST] list missing directory" << std::endl;
    ScidFixture fx("plan_nodir");
    std::vector<DepthShard> shards;
    TEST_CHECK_STATUS(list_depth_shards(fx.root() + "/nowhere", "ES", shards), Status::DIRECTORY_NOT_FOUND);
    TEST_CHECK(shards.empty());
    std::cout << "[TEST] OK" << std::endl;
}

void test_select_resumes_checkpoint_shard() {
    std::cout << "[TEST] select resumes checkpoint shard" << std::endl;
    std::vector<DepthShard> sorted = {
        {"2025-03-31", "a", 0},
        {"2025-04-01", "b", 0},
        {"2025-04-02", "c", 0},
    };
    auto selected = select_shards(sorted, core::DepthCheckpoint{"2025-04-01", 5});
    TEST_CHECK(selected.size() == 2);
    TEST_CHECK(selected[0].date == "2025-04-01");
    TEST_CHECK(selected[0].start_rec == 5);
    TEST_CHECK(selected[1].date == "2025-04-02");
    TEST_CHECK(selected[1].start_rec == 0);
    std::cout << "[TEST] OK" << std::endl;
}

void test_select_edge_cases() {
    std::cout << "[TEST] select edge cases" << std::endl;
    std::vector<DepthShard> sorted = {
        {"2025-03-31", "a", 0},
        {"2025-04-02", "c", 0},
    };
    // No checkpoint yet: everything from the start
    auto all = select_shards(sorted, core::DepthCheckpoint{});
    TEST_CHECK(all.size() == 2);
    TEST_CHECK(all[0].start_rec == 0 && all[1].start_rec == 0);

    // Checkpoint shard gone: only later shards, from the start
    auto later = select_shards(sorted, core::DepthCheckpoint{"2025-04-01", 9});
    TEST_CHECK(later.size() == 1);
    TEST_CHECK(later[0].date == "2025-04-02");
    TEST_CHECK(later[0].start_rec == 0);

    // Nothing newer
    auto none = select_shards(sorted, core::DepthCheckpoint{"2025-05-01", 3});
    TEST_CHECK(none.empty());
    std::cout << "[TEST] OK" << std::endl;
}

void test_checkpoint_advances_over_successful_prefix() {
    std::cout << "[TEST] checkpoint advances over successful prefix" << std::endl;
    const core::DepthCheckpoint before{"2025-04-01", 5};

    auto all_ok = advance_depth_checkpoint(before, {
        {"2025-04-01", Status::OK, 10},
        {"2025-04-02", Status::OK, 42},
    });
    TEST_CHECK((all_ok == core::DepthCheckpoint{"2025-04-02", 42}));

    auto last_failed = advance_depth_checkpoint(before, {
        {"2025-04-01", Status::OK, 10},
        {"2025-04-02", Status::INVALID_HEADER, 0},
    });
    TEST_CHECK((last_failed == core::DepthCheckpoint{"2025-04-01", 10}));

    // A failure in the middle stops the advance even if later shards succeeded
    auto middle_failed = advance_depth_checkpoint(before, {
        {"2025-04-01", Status::STORAGE_FAILED, 5},
        {"2025-04-02", Status::OK, 42},
    });
    TEST_CHECK(middle_failed == before);

    auto nothing = advance_depth_checkpoint(before, {});
    TEST_CHECK(nothing == before);
    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_list_filters_and_sorts();
    test_list_missing_directory();
    test_select_resumes_checkpoint_shard();
    test_select_edge_cases();
    test_checkpoint_advances_over_successful_prefix();

    std::cout << "\n[ALL SHARD PLAN TESTS PASSED]" << std::endl;
    return 0;
}
