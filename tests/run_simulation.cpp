#include <gtest/gtest.h>
#include <glog/logging.h>
#include <iostream>

#include <fstream>
#include <string>

#include <../src/simulation/config.hpp>
#include <../src/simulation/simulation.hpp>
#include <../src/simulation/summary.hpp>


std::ofstream result_forks("forks_result.csv", std::ios::out);


void write_summary(std::ofstream& file, const std::string& sim_type, size_t run_id, const Simulation& sim) {
    RunSummary summary = summarize(sim.trace(), sim.snapshot(), 1);

    file << sim_type << ","
         << run_id << ","
         << sim.node_ids().size() << ","
         << summary.blocks_mined << ","
         << summary.forks << ","
         << summary.mean_propagation_delay << ","
         << summary.max_propagation_delay << ","
         << summary.distinct_heads << ","
         << (summary.convergence_time ? std::to_string(*summary.convergence_time) : "never") << "\n";
    file.flush();
}

void run_simulation(SimulationConfig& config, std::ofstream& file, size_t run_id) {
    Simulation sim(config);
    sim.run();

    sim.write_results(file, run_id);

    EXPECT_TRUE(sim.unresolved_orphans().empty());
}

SimulationConfig sweep_config(ConsensusKind kind, TopologyKind topology, size_t n, uint64_t seed) {
    SimulationConfig config;
    config.topology_kind = topology;
    config.node_count = n;
    config.topology.expected_peers = 4;
    config.topology.max_attempts = 1000;
    config.consensus.kind = kind;
    config.consensus.block_rate = 0.25;
    config.latency.kind = LatencyKind::Exponential;
    config.latency.min = 0.05;
    config.latency.mean = 0.3;
    config.weights.kind = WeightKind::Exponential;
    config.weights.mean = 1.0;
    config.horizon.max_blocks = 50;
    config.start_jitter = 1.0;
    config.seed = seed;
    return config;
}

TEST(Sweep, Consensus) {
    std::ofstream result_file("consensus_result.csv", std::ios::out);

    for (ConsensusKind kind : {ConsensusKind::PoW, ConsensusKind::PoS, ConsensusKind::GHOST}) {
        for (size_t n = 4; n <= 31; n += 9) {
            for (size_t i = 0; i < 5; ++i) {
                SimulationConfig config = sweep_config(kind, TopologyKind::Random, n, i);
                run_simulation(config, result_file, i);
            }
        }
    }
}

TEST(Sweep, Topologies) {
    std::ofstream result_file("topology_result.csv", std::ios::out);

    for (TopologyKind topology : {TopologyKind::Random, TopologyKind::Ring, TopologyKind::Star,
                                  TopologyKind::FullyConnected}) {
        for (size_t i = 0; i < 5; ++i) {
            SimulationConfig config = sweep_config(ConsensusKind::PoW, topology, 16, i);
            run_simulation(config, result_file, i);
        }
    }
}

TEST(Sweep, BlockRate) {
    for (double rate : {0.05, 0.25, 1.0, 4.0}) {
        for (size_t i = 0; i < 5; ++i) {
            SimulationConfig config = sweep_config(ConsensusKind::GHOST, TopologyKind::Random, 16, i);
            config.consensus.block_rate = rate;

            Simulation sim(config);
            sim.run();
            write_summary(result_forks, "GHOST/" + std::to_string(rate), i, sim);
        }
    }
}

TEST(Sweep, LossyLinks) {
    std::ofstream result_file("lossy_result.csv", std::ios::out);

    for (double drop_rate : {0.0, 0.1, 0.3}) {
        for (size_t i = 0; i < 5; ++i) {
            SimulationConfig config = sweep_config(ConsensusKind::PoW, TopologyKind::Random, 16, i);
            config.drop_rate = drop_rate;
            config.fetch_missing_parents = true;
            config.fork_check_interval = 2.0;
            config.horizon.max_time = 400.0;

            Simulation sim(config);
            sim.run();
            sim.write_results(result_file, i);
            write_summary(result_forks, "Lossy/" + std::to_string(drop_rate), i, sim);
        }
    }
}

int main(int argc, char **argv) {
    // FLAGS_log_dir = "./log";
    FLAGS_v = -1;
    FLAGS_minloglevel = -1;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
