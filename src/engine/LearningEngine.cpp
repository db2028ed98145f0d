#include "engine/LearningEngine.h"
#include "engine/PerformanceStore.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "common/TimeUtils.h"

#include <utility>

namespace tradebrain {
namespace engine {

namespace {
constexpr const char* kLearnerFile = "memory.json";
constexpr const char* kBanditFile = "rl_state.json";
constexpr const char* kAllocationFile = "auto_allocation.json";

// false: the component keeps its fresh state
bool reportLoad(const char* name, const core::StateLoadResult& result) {
    if (result.ok()) {
        if (result.snapshot->schema_version != learning::LearnerState::kSchemaVersion) {
            LOG_WARN("{}: schema_version {} (expected {}), reading what is compatible",
                     name, result.snapshot->schema_version, learning::LearnerState::kSchemaVersion);
        }
        return true;
    }
    if (result.status == core::StateStoreStatus::NOT_FOUND) {
        LOG_INFO("{}: no snapshot, starting fresh", name);
    } else {
        LOG_ERROR("{}: load failed ({}): {} - starting fresh",
                  name, core::toString(result.status), result.message);
    }
    return false;
}
}

LearningEngine::LearningEngine(EngineConfig config)
    : config_(std::move(config))
{
    confidence_ = std::make_unique<learning::ConfidenceEngine>(config_.learning);
    allocator_ = std::make_unique<allocation::FitnessAllocator>(config_.allocation);
    initStores();
}

LearningEngine::LearningEngine(EngineConfig config, RandomEngine rng)
    : LearningEngine(std::move(config), std::move(rng), common::Clock()) {}

LearningEngine::LearningEngine(EngineConfig config, RandomEngine rng, common::Clock clock)
    : config_(std::move(config))
{
    confidence_ = std::make_unique<learning::ConfidenceEngine>(config_.learning, std::move(rng), std::move(clock));
    allocator_ = std::make_unique<allocation::FitnessAllocator>(config_.allocation);
    initStores();
}

LearningEngine::~LearningEngine() {
    if (writer_) {
        writer_->stop();
    }
}

void LearningEngine::initStores() {
    if (!config_.state.persist) {
        LOG_INFO("LearningEngine: persistence disabled, state lives in memory only");
        return;
    }

    state_dir_ = utils::PathUtils::resolveWritableDir(config_.state.dir, config_.state.fallback_dir);
    learner_store_ = std::make_unique<core::JsonStateStore>(state_dir_ / kLearnerFile);
    bandit_store_ = std::make_unique<core::JsonStateStore>(state_dir_ / kBanditFile);
    allocation_store_ = std::make_unique<core::JsonStateStore>(state_dir_ / kAllocationFile);

    if (config_.state.async_writes) {
        writer_ = std::make_unique<core::AsyncSnapshotWriter>();
    }
    LOG_INFO("LearningEngine: state dir {} ({} writes)",
             state_dir_.string(), writer_ ? "async" : "sync");
}

// ===== lifecycle =====

void LearningEngine::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!learner_store_) {
        return;
    }

    // Bandit first: restoring the learner recomputes adjustments from it.
    const auto bandit = bandit_store_->load();
    if (reportLoad(kBanditFile, bandit)) {
        try {
            confidence_->restoreBandit(bandit.snapshot->payload);
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("{}: malformed content ({}) - starting fresh", kBanditFile, e.what());
            confidence_->resetBandit();
        }
    }

    const auto learner = learner_store_->load();
    if (reportLoad(kLearnerFile, learner)) {
        try {
            confidence_->restoreLearner(learning::LearnerState::fromJson(learner.snapshot->payload));
            LOG_INFO("{}: restored {} trades (lifetime {})", kLearnerFile,
                     confidence_->getTradeCount(), confidence_->state().total_trade_count);
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("{}: malformed content ({}) - starting fresh", kLearnerFile, e.what());
            confidence_->resetLearner();
        }
    }

    const auto alloc = allocation_store_->load();
    if (reportLoad(kAllocationFile, alloc)) {
        try {
            allocator_->restore(alloc.snapshot->payload);
            LOG_INFO("{}: restored ({} rebalances, enabled={})", kAllocationFile,
                     allocator_->totalRebalances(), allocator_->isEnabled());
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("{}: malformed content ({}) - starting fresh", kAllocationFile, e.what());
            allocator_->reset();
        }
    }
}

void LearningEngine::flush() {
    if (writer_) {
        writer_->flush();
    }
}

void LearningEngine::saveAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    persistBandit();
    persistLearner();
    persistAllocator();
}

void LearningEngine::persist(core::JsonStateStore* store, nlohmann::json payload) {
    if (store == nullptr) {
        return;
    }

    core::StateSnapshot snapshot;
    snapshot.schema_version = learning::LearnerState::kSchemaVersion;
    snapshot.saved_at_ms = common::nowMs();
    snapshot.payload = std::move(payload);

    if (writer_) {
        if (!writer_->enqueue(store, std::move(snapshot))) {
            LOG_WARN("Snapshot writer stopped, dropping write to {}", store->describe());
        }
        return;
    }

    const auto result = store->save(snapshot);
    if (!result.ok()) {
        LOG_ERROR("Snapshot write failed [{}]: {} ({})",
                  store->describe(), core::toString(result.status), result.message);
    }
}

void LearningEngine::persistLearner() {
    persist(learner_store_.get(), confidence_->learnerSnapshot());
}

void LearningEngine::persistBandit() {
    persist(bandit_store_.get(), confidence_->banditSnapshot());
}

void LearningEngine::persistAllocator() {
    persist(allocation_store_.get(), allocator_->toJson());
}

// ===== inbound =====

learning::TradeAnalysis LearningEngine::recordTrade(const TradeOutcome& outcome,
                                                    const std::string& regime,
                                                    const std::string& session,
                                                    const IndicatorSnapshot& indicators) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto analysis = confidence_->analyzeTrade(outcome, regime, session, indicators);
    persistLearner();
    persistBandit();
    return analysis;
}

learning::SignalDecision LearningEngine::shouldOverrideSignal(const std::string& strategy,
                                                              const std::string& regime,
                                                              const IndicatorSnapshot& indicators) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto decision = confidence_->shouldOverrideSignal(strategy, regime, indicators);
    if (decision.skip) {
        LOG_INFO("Signal skipped [{} / {}]: {}", strategy, regime, decision.reason);
    } else {
        LOG_DEBUG("Signal allowed [{} / {}]: {}", strategy, regime, learning::toString(decision.code));
    }
    return decision;
}

std::optional<allocation::RebalanceResult> LearningEngine::onTradeCompleted(
    const allocation::ExperienceMap& experience,
    const allocation::AllocationMap& current_allocations) {
    std::optional<allocation::RebalanceResult> result;
    std::shared_ptr<core::IAllocationSink> sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = completeTrade(experience,
                               confidence_->getStrategyConfidenceAdjustments(),
                               confidence_->getRlStats(),
                               current_allocations);
        sink = sink_;
    }
    if (result) {
        deliver(sink, *result);
    }
    return result;
}

std::optional<allocation::RebalanceResult> LearningEngine::onTradeCompleted(
    const allocation::ExperienceMap& experience,
    const learning::AdjustmentMap& adjustments,
    const learning::RlStats& rl_stats,
    const allocation::AllocationMap& current_allocations) {
    std::optional<allocation::RebalanceResult> result;
    std::shared_ptr<core::IAllocationSink> sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = completeTrade(experience, adjustments, rl_stats, current_allocations);
        sink = sink_;
    }
    if (result) {
        deliver(sink, *result);
    }
    return result;
}

std::optional<allocation::RebalanceResult> LearningEngine::completeTrade(
    const allocation::ExperienceMap& experience,
    const learning::AdjustmentMap& adjustments,
    const learning::RlStats& rl_stats,
    const allocation::AllocationMap& current_allocations) {
    auto result = allocator_->onTradeCompleted(experience, adjustments, rl_stats, current_allocations);
    if (allocator_->isEnabled()) {
        persistAllocator();
    }
    return result;
}

// Runs without mutex_ held: sinks may call back into the engine.
void LearningEngine::deliver(const std::shared_ptr<core::IAllocationSink>& sink,
                             const allocation::RebalanceResult& result) {
    if (!sink) {
        return;
    }
    if (!sink->append(result)) {
        LOG_ERROR("Allocation sink rejected rebalance #{}", result.rebalance_number);
    }
}

void LearningEngine::notifyRegimeChange(const std::string& from_regime,
                                        const std::string& to_regime,
                                        long long at_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    confidence_->notifyRegimeChange(from_regime, to_regime, at_ms);
}

void LearningEngine::setAutoAllocationEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    allocator_->setEnabled(enabled);
    persistAllocator();
}

void LearningEngine::setAllocationSink(std::shared_ptr<core::IAllocationSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

// ===== outbound =====

learning::AdjustmentMap LearningEngine::getStrategyConfidenceAdjustments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confidence_->getStrategyConfidenceAdjustments();
}

learning::RlStats LearningEngine::getRlStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confidence_->getRlStats();
}

nlohmann::json LearningEngine::getAllocationStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocator_->getStatus();
}

std::vector<std::string> LearningEngine::getLearnedInsights(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confidence_->getLearnedInsights(limit);
}

std::string LearningEngine::getMarketMemory(const std::string& current_regime) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confidence_->getMarketMemory(current_regime);
}

learning::StreakMap LearningEngine::getStreaks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confidence_->getStreaks();
}

nlohmann::json LearningEngine::getPerformanceReport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out;
    out["regime"] = confidence_->getRegimePerformance();
    out["session"] = confidence_->getSessionPerformance();
    out["rsi_zone"] = confidence_->getRsiZonePerformance();
    out["hour"] = confidence_->getHourPerformance();
    out["dow"] = confidence_->getDowPerformance();
    out["transition"] = confidence_->getTransitionPerformance();

    PerformanceStore store;
    store.rebuild(confidence_->state().history);
    const auto statsJson = [](const StrategyPerformanceStats& s) {
        return nlohmann::json{
            {"trades", s.trades},
            {"wins", s.wins},
            {"win_rate", roundTo(s.winRate(), 3)},
            {"net_profit", roundTo(s.net_profit, 2)},
            {"expectancy", roundTo(s.expectancy(), 2)},
            {"profit_factor", roundTo(s.profitFactor(), 2)},
            {"streak", std::string(toString(s.streak_type)) + ":" + std::to_string(s.current_streak)}
        };
    };
    nlohmann::json by_strategy = nlohmann::json::object();
    for (const auto& entry : store.byStrategy()) {
        by_strategy[entry.first] = statsJson(entry.second);
    }
    nlohmann::json by_bucket = nlohmann::json::object();
    for (const auto& entry : store.byBucket()) {
        by_bucket[entry.first.first + "|" + entry.first.second] = statsJson(entry.second);
    }
    out["strategy"] = std::move(by_strategy);
    out["strategy_regime"] = std::move(by_bucket);
    return out;
}

allocation::ExperienceMap LearningEngine::deriveExperience() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PerformanceStore store;
    store.rebuild(confidence_->state().history);
    return store.experience();
}

std::size_t LearningEngine::getTradeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confidence_->getTradeCount();
}

double LearningEngine::getExplorationRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confidence_->effectiveExplorationRate();
}

allocation::AllocationMap LearningEngine::lastAllocations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocator_->lastAllocations();
}

} // namespace engine
} // namespace tradebrain
