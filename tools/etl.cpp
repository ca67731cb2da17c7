// ============================================================================
// tickdb-etl
//
// Loads new Sierra Chart records of every configured contract into the
// SQLite store and writes the advanced checkpoints back to the config.
//
//   tickdb-etl 0 -c config.json     one pass over every file, then exit
//   tickdb-etl 1 -c config.json     keep tailing until Ctrl+C / SIGTERM
// ============================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>

#include "tickdb.hpp"

#include "common/cli/etl_params.hpp"

// -----------------------------------------------------------------------------
// Signal handling
// -----------------------------------------------------------------------------
std::atomic<tickdb::etl::PollControl*> g_control{nullptr};

void on_signal(int) {
    if (auto* control = g_control.load()) {
        control->signal_stop();
    }
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    using namespace tickdb;

    const auto t0 = std::chrono::steady_clock::now();
    const auto params = tools::cli::etl::configure(argc, argv, "tickdb ETL: Sierra Chart tick files to SQLite");
    params.dump("tickdb-etl", std::cout);

    // -------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------
    core::Config config;
    Status status = core::Config::load(params.config_path, config);
    if (status != Status::OK) {
        TDB_FATAL("[ETL] Cannot start without a valid configuration (" << to_string(status) << ")");
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // Sink
    // -------------------------------------------------------------
    sink::Database db;
    status = db.open(config.db_path);
    if (status != Status::OK) {
        TDB_FATAL("[ETL] Cannot open the database " << config.db_path << " (" << to_string(status) << ")");
        return EXIT_FAILURE;
    }

    auto control = etl::PollControl::from_seconds(config.sleep_int);
    g_control.store(&control);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // -------------------------------------------------------------
    // Run
    // -------------------------------------------------------------
    etl::Engine engine(config, db, control);
    status = engine.run(params.continuous());
    if (status != Status::OK) {
        TDB_WARN("[ETL] Run finished with errors (" << to_string(status) << ")");
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_control.store(nullptr);

    // -------------------------------------------------------------
    // Persist checkpoints
    // -------------------------------------------------------------
    int rc = EXIT_SUCCESS;
    status = config.save(params.config_path);
    if (status != Status::OK) {
        TDB_ERROR("[ETL] Checkpoints could not be saved (" << to_string(status) << ")");
        rc = EXIT_FAILURE;
    }
    else {
        TDB_INFO("[ETL] Configuration saved to " << params.config_path);
    }
    db.close();

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;
    TDB_INFO("[ETL] Elapsed: " << std::fixed << std::setprecision(2) << elapsed.count() << "s");
    return rc;
}
