#include "simulation.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <glog/logging.h>

#include "../core/errors.hpp"

namespace {

std::vector<NodeId> sequential_ids(size_t n) {
    std::vector<NodeId> ids(n);
    for (size_t i = 0; i < n; ++i) {
        ids[i] = static_cast<NodeId>(i);
    }
    return ids;
}

std::string topology_name(const SimulationConfig& config) {
    if (!config.edges.empty()) {
        return "Custom";
    }
    switch (config.topology_kind) {
        case TopologyKind::Random:
            return "Random";
        case TopologyKind::Ring:
            return "Ring";
        case TopologyKind::Star:
            return "Star";
        case TopologyKind::FullyConnected:
            return "FullyConnected";
    }
    return "Unknown";
}

} // namespace

Simulation::Simulation(SimulationConfig config)
    : config_(validated(std::move(config))),
      ctx_(config_.seed, config_.horizon.max_blocks),
      ids_(sequential_ids(config_.node_count)),
      topology_(build_topology(config_, ids_, ctx_.rng)) {
    std::unordered_map<NodeId, double> weights = generate_weights();
    pick_miners(weights);

    consensus_ = std::make_unique<ConsensusEngine>(config_.consensus, std::move(weights), config_.seed);
    network_ = std::make_unique<Network>(topology_, config_.latency, config_.drop_rate);
    generate_nodes();

    LOG(INFO) << "simulation: " << to_string(config_.consensus.kind) << " on " << topology_name(config_)
              << " of " << ids_.size() << " nodes, " << topology_.edge_count() << " edges, "
              << miners_.size() << " miners, seed " << config_.seed;
}

SimulationConfig Simulation::validated(SimulationConfig config) {
    validate_config(config);
    return config;
}

Topology Simulation::build_topology(const SimulationConfig& config,
                                    const std::vector<NodeId>& ids,
                                    std::mt19937_64& rng) {
    if (!config.edges.empty()) {
        return Topology::from_edges(ids, config.edges, config.latency, rng);
    }
    return Topology::build(config.topology_kind, ids, config.topology, config.latency, rng);
}

std::unordered_map<NodeId, double> Simulation::generate_weights() {
    const WeightModel& model = config_.weights;
    std::unordered_map<NodeId, double> weights;

    for (size_t i = 0; i < ids_.size(); ++i) {
        NodeId id = ids_[i];
        double w = 1.0;
        if (model.sampler) {
            w = model.sampler(id, ctx_.rng);
        } else {
            switch (model.kind) {
                case WeightKind::Equal:
                    w = 1.0;
                    break;
                case WeightKind::Uniform:
                    w = std::uniform_real_distribution<double>(model.min, model.max)(ctx_.rng);
                    break;
                case WeightKind::Exponential:
                    w = std::exponential_distribution<double>(1.0 / model.mean)(ctx_.rng);
                    break;
                case WeightKind::Explicit:
                    w = model.values[i];
                    break;
            }
        }
        weights[id] = w;
    }

    return weights;
}

void Simulation::pick_miners(const std::unordered_map<NodeId, double>& weights) {
    std::vector<NodeId> candidates;
    for (NodeId id : ids_) {
        if (weights.at(id) > 0) {
            candidates.push_back(id);
        }
    }

    if (config_.miner_count == 0 || config_.miner_count >= candidates.size()) {
        miners_ = candidates;
        return;
    }

    std::shuffle(candidates.begin(), candidates.end(), ctx_.rng);
    candidates.resize(config_.miner_count);
    std::sort(candidates.begin(), candidates.end());
    miners_ = candidates;
}

void Simulation::generate_nodes() {
    for (NodeId id : ids_) {
        managers_.push_back(std::make_unique<NetManager>(id, *network_));
        nodes_.push_back(std::make_unique<Node>(
            id, *consensus_, *managers_.back(), ctx_.genesis, config_.fetch_missing_parents));
        index_[id] = nodes_.size() - 1;
    }
}

void Simulation::start() {
    if (started_) {
        return;
    }
    started_ = true;

    if (config_.autostart_mining) {
        for (NodeId id : miners_) {
            SimTime at = 0;
            if (config_.start_jitter > 0) {
                at = std::uniform_real_distribution<double>(0, config_.start_jitter)(ctx_.rng);
            }
            node(id).start_mining(ctx_, ctx_.now() + at);
        }
    }

    if (config_.fork_check_interval > 0) {
        for (auto& n : nodes_) {
            n->start_fork_checks(ctx_, config_.fork_check_interval);
        }
    }
}

bool Simulation::halted() const {
    if (ctx_.queue.is_empty()) {
        return true;
    }
    return config_.horizon.max_time.has_value() && ctx_.queue.next_time() > *config_.horizon.max_time;
}

bool Simulation::step() {
    start();
    if (halted()) {
        return false;
    }
    dispatch(ctx_.queue.pop_next());
    return true;
}

void Simulation::run_until(SimTime t) {
    start();
    while (!halted() && ctx_.queue.next_time() <= t) {
        dispatch(ctx_.queue.pop_next());
    }
}

void Simulation::run() {
    while (step()) {
    }
    finish();
}

void Simulation::dispatch(const Event& event) {
    ctx_.advance_to(event.time);
    node(event.target).handle_event(event, ctx_);
}

void Simulation::schedule_mine(NodeId id, SimTime at, std::optional<double> draw) {
    if (!index_.contains(id)) {
        throw std::out_of_range("no node " + std::to_string(id));
    }
    if (at < ctx_.now()) {
        throw std::invalid_argument("cannot schedule mining in the past");
    }
    ctx_.schedule(Event::mine_attempt(id, MiningToken{0, true, draw}), at);
}

void Simulation::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;

    std::vector<TraceRecord> orphans = unresolved_orphans();
    for (const auto& record : orphans) {
        ctx_.trace.append(record);
    }

    std::set<BlockId> heads;
    for (const auto& n : nodes_) {
        heads.insert(n->head());
    }
    LOG(INFO) << "simulation halted at t = " << ctx_.now() << ": " << ctx_.mined_blocks() << " blocks mined, "
              << heads.size() << " distinct head(s), " << orphans.size() << " unresolved orphan(s), "
              << network_->sent() << " message(s) sent, " << network_->dropped() << " dropped";
    if (!orphans.empty()) {
        LOG(WARNING) << orphans.size() << " block(s) never found their parent";
    }
}

std::vector<TraceRecord> Simulation::unresolved_orphans() const {
    if (finished_) {
        return ctx_.trace.of_kind(TraceKind::Unresolved);
    }

    std::vector<TraceRecord> orphans;
    for (const auto& n : nodes_) {
        for (const BlockPtr& block : n->pending_blocks()) {
            TraceRecord record;
            record.time = ctx_.now();
            record.node = n->get_id();
            record.block_id = block->id;
            record.parent_id = block->parent_id;
            record.block_height = block->height;
            record.kind = TraceKind::Unresolved;
            record.head = n->head();
            record.head_height = n->get_ledger().head_block().height;
            record.detail = "missing parent " + std::to_string(block->parent_id);
            orphans.push_back(std::move(record));
        }
    }
    return orphans;
}

std::vector<NodeSnapshot> Simulation::snapshot() const {
    std::vector<NodeSnapshot> result;
    for (const auto& n : nodes_) {
        NodeSnapshot snap;
        snap.id = n->get_id();
        snap.weight = n->get_weight();
        snap.miner = std::find(miners_.begin(), miners_.end(), snap.id) != miners_.end();
        snap.head = n->head();
        snap.head_height = n->get_ledger().head_block().height;
        snap.pending = n->pending_count();
        snap.blocks = n->get_ledger().block_ids();
        snap.metrics = n->get_metrics();
        result.push_back(std::move(snap));
    }
    return result;
}

Node& Simulation::node(NodeId id) {
    return *nodes_.at(index_.at(id));
}

const Node& Simulation::node(NodeId id) const {
    return *nodes_.at(index_.at(id));
}

void Simulation::write_results(std::ofstream& file, size_t run_id) {
    std::set<BlockId> heads;
    uint64_t max_height = 0;
    size_t rejected = 0;
    size_t reorgs = 0;
    for (const auto& n : nodes_) {
        heads.insert(n->head());
        max_height = std::max(max_height, n->get_ledger().head_block().height);
        rejected += n->get_metrics().blocks_rejected;
        reorgs += n->get_metrics().reorgs;
    }

    file << to_string(config_.consensus.kind) << ","
         << topology_name(config_) << ","
         << run_id << ","
         << ids_.size() << ","
         << config_.seed << ","
         << ctx_.now() << ","
         << ctx_.mined_blocks() << ","
         << max_height << ","
         << heads.size() << ","
         << reorgs << ","
         << rejected << ","
         << network_->sent() << ","
         << network_->dropped() << ","
         << unresolved_orphans().size() << "\n";
    file.flush();
}
