#include "learning/BanditStore.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>

using namespace tradebrain;
using namespace tradebrain::learning;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}
}

int main() {
    std::cout << "[TEST] Starting BanditStore Test..." << std::endl;

    BanditStore bandit;

    // 1. Unseen contexts answer from the prior without being created
    assert(near(bandit.expectedValue("A", "TRENDING_UP", "moderate"), 2.0 / 3.0));
    assert(near(bandit.expectedValue("A", "TRENDING_UP", "conservative"), 0.5));
    assert(near(bandit.expectedValue("A", "TRENDING_UP", "turbo"), 0.5));
    const auto prior_best = bandit.bestExpected("A", "TRENDING_UP");
    assert(prior_best.first == "moderate");
    assert(near(prior_best.second, 2.0 / 3.0));
    assert(!bandit.hasContext("A", "TRENDING_UP"));
    assert(bandit.contextCount() == 0);

    // 2. Unknown presets never create arms
    bandit.update("A", "TRENDING_UP", "turbo", 1.0);
    assert(bandit.contextCount() == 0);

    // 3. Updates are capped at 2.0 and never shrink a parameter
    bandit.update("A", "TRENDING_UP", "moderate", 5.0);
    auto moderate = bandit.arm("A", "TRENDING_UP", "moderate");
    assert(moderate.has_value());
    assert(near(moderate->alpha, 4.0));
    assert(near(moderate->beta, 1.0));

    bandit.update("A", "TRENDING_UP", "moderate", -0.5);
    bandit.update("A", "TRENDING_UP", "moderate", -9.0);
    moderate = bandit.arm("A", "TRENDING_UP", "moderate");
    assert(near(moderate->alpha, 4.0));
    assert(near(moderate->beta, 3.5));

    bandit.update("A", "TRENDING_UP", "conservative", 0.0);
    const auto conservative = bandit.arm("A", "TRENDING_UP", "conservative");
    assert(near(conservative->alpha, 1.0));
    assert(near(conservative->beta, 1.0));

    // 4. Thompson sampling follows a dominant arm
    for (int i = 0; i < 20; ++i) {
        bandit.update("B", "RANGING", "aggressive", 2.0);
        bandit.update("B", "RANGING", "conservative", -2.0);
        bandit.update("B", "RANGING", "moderate", -2.0);
    }
    RandomEngine rng(42);
    std::map<std::string, int> picks;
    for (int i = 0; i < 1000; ++i) {
        picks[bandit.selectPreset("B", "RANGING", rng)]++;
    }
    if (picks["aggressive"] < 990) {
        std::cerr << "[TEST] dominant arm picked only " << picks["aggressive"] << " times\n";
        return 1;
    }
    assert(bandit.bestExpected("B", "RANGING").first == "aggressive");

    // 5. selectPreset creates the context with the seeded priors
    bandit.selectPreset("C", "VOLATILE", rng);
    assert(bandit.hasContext("C", "VOLATILE"));
    assert(near(bandit.arm("C", "VOLATILE", "moderate")->alpha, 2.0));

    // 6. Dashboard view keyed "strategy_regime"
    const auto dist = bandit.distributions();
    assert(dist.contains("A_TRENDING_UP"));
    assert(near(dist["A_TRENDING_UP"]["moderate"]["alpha"].get<double>(), 4.0));
    assert(near(dist["A_TRENDING_UP"]["moderate"]["expected"].get<double>(), 0.533));

    // 7. Snapshot keys and restore
    const auto snapshot = bandit.toJson();
    assert(snapshot.contains("A|TRENDING_UP"));
    assert(snapshot["A|TRENDING_UP"]["moderate"].is_array());

    BanditStore restored;
    assert(restored.fromJson(snapshot) == bandit.contextCount());
    assert(near(restored.arm("A", "TRENDING_UP", "moderate")->beta, 3.5));
    assert(restored.bestExpected("B", "RANGING").first == "aggressive");

    // 8. Malformed entries are dropped or fall back to the prior
    nlohmann::json messy = {
        {"D|TRENDING_DOWN", {
            {"moderate", {3.0, 4.0}},
            {"turbo", {1.0, 1.0}},
            {"aggressive", {-1.0, 2.0}},
            {"conservative", "bad"}
        }},
        {"no-separator", {{"moderate", {5.0, 5.0}}}},
        {"E|HIGH|VOL", {{"moderate", {6.0, 2.0}}}}
    };
    BanditStore partial;
    assert(partial.fromJson(messy) == 2);
    assert(near(partial.arm("D", "TRENDING_DOWN", "moderate")->alpha, 3.0));
    assert(near(partial.arm("D", "TRENDING_DOWN", "aggressive")->alpha, 1.0));
    assert(near(partial.arm("D", "TRENDING_DOWN", "conservative")->beta, 1.0));
    assert(partial.hasContext("E", "HIGH|VOL"));
    assert(!partial.hasContext("no-separator", ""));

    assert(partial.fromJson(nlohmann::json::array()) == 0);
    assert(partial.contextCount() == 0);

    // 9. Non-finite rewards leave the arms untouched
    BanditStore guarded;
    guarded.update("A", "RANGING", "moderate", 1.0);
    guarded.update("A", "RANGING", "moderate", std::nan(""));
    guarded.update("A", "RANGING", "moderate", -std::numeric_limits<double>::infinity());
    guarded.update("F", "RANGING", "moderate", std::numeric_limits<double>::quiet_NaN());
    assert(near(guarded.arm("A", "RANGING", "moderate")->alpha, 3.0));
    assert(near(guarded.arm("A", "RANGING", "moderate")->beta, 1.0));
    assert(!guarded.hasContext("F", "RANGING"));

    BanditStore reloaded;
    assert(reloaded.fromJson(guarded.toJson()) == 1);
    assert(near(reloaded.arm("A", "RANGING", "moderate")->alpha, 3.0));

    std::cout << "[TEST] BanditStore PASSED" << std::endl;
    return 0;
}
