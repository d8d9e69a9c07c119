#define BOOST_TEST_MODULE PopulationModelTests
#include <boost/test/unit_test.hpp>

#include "population_model.h"
#include "simulation_context.h"

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>

namespace {

size_t countWarnings(const PopulationEvaluation& eval, PopulationWarningKind kind) {
    return static_cast<size_t>(std::count_if(eval.warnings.begin(), eval.warnings.end(),
                                             [kind](const PopulationWarning& w) { return w.kind == kind; }));
}

} // namespace

class PopulationFixture {
public:
    PopulationFixture() : model(config.population) {}

protected:
    SimulationConfig config;
    PopulationModel model;
};

// ============================================================================
// DERIVED QUANTITIES
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DerivedTests, PopulationFixture)

BOOST_AUTO_TEST_CASE(TestHappinessMovesByAtMostOneStep) {
    BOOST_CHECK_CLOSE(model.stepHappiness(50.0, 65.0), 60.0, 1e-9);
    BOOST_CHECK_CLOSE(model.stepHappiness(50.0, 45.0), 45.0, 1e-9);
    BOOST_CHECK_CLOSE(model.stepHappiness(5.0, 0.0), 0.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(TestTargetHappiness) {
    BOOST_CHECK_CLOSE(model.targetHappiness(50.0, true, false), 65.0, 1e-9);
    BOOST_CHECK_CLOSE(model.targetHappiness(50.0, false, false), 25.0, 1e-9);
    BOOST_CHECK_CLOSE(model.targetHappiness(50.0, true, true), 55.0, 1e-9);
    BOOST_CHECK_CLOSE(model.targetHappiness(95.0, true, false), 100.0, 1e-9);
    BOOST_CHECK_CLOSE(model.targetHappiness(10.0, false, true), 0.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(TestGrowthRate) {
    BOOST_CHECK_EQUAL(model.growthRate(80.0, 0, true), 0.0);
    BOOST_CHECK_CLOSE(model.growthRate(80.0, 20, false), -0.05, 1e-9);
    BOOST_CHECK_CLOSE(model.growthRate(100.0, 20, true), 0.02, 1e-9);
    BOOST_CHECK_SMALL(model.growthRate(35.0, 20, true), 1e-12);
    BOOST_CHECK(model.growthRate(20.0, 20, true) < 0.0);
}

BOOST_AUTO_TEST_CASE(TestMigrationChances) {
    BOOST_CHECK_CLOSE(model.immigrationChance(100.0, 5, 20), 0.25, 1e-9);
    BOOST_CHECK_EQUAL(model.immigrationChance(100.0, 20, 20), 0.0);
    BOOST_CHECK_EQUAL(model.immigrationChance(40.0, 5, 20), 0.0);
    BOOST_CHECK_CLOSE(model.emigrationChance(0.0), 0.25, 1e-9);
    BOOST_CHECK_EQUAL(model.emigrationChance(60.0), 0.0);
}

BOOST_AUTO_TEST_CASE(TestDescriptions) {
    BOOST_CHECK_EQUAL(std::string(happinessDescription(85.0)), "Ecstatic");
    BOOST_CHECK_EQUAL(std::string(happinessDescription(60.0)), "Content");
    BOOST_CHECK_EQUAL(std::string(happinessDescription(45.0)), "Neutral");
    BOOST_CHECK_EQUAL(std::string(happinessDescription(20.0)), "Unhappy");
    BOOST_CHECK_EQUAL(std::string(happinessDescription(19.9)), "Miserable");
    BOOST_CHECK_EQUAL(std::string(populationWarningKindName(PopulationWarningKind::LowHappiness)), "low_happiness");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// EVALUATION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(EvaluationTests, PopulationFixture)

BOOST_AUTO_TEST_CASE(TestUninitialisedPopulationSkipped) {
    PopulationInputs in;
    in.current = 0;
    in.capacity = 10;
    std::mt19937_64 rng(1);
    const PopulationEvaluation eval = model.evaluate(in, rng);
    BOOST_CHECK(!eval.evaluated);
    BOOST_CHECK(!eval.changed());
    BOOST_CHECK(eval.warnings.empty());
}

BOOST_AUTO_TEST_CASE(TestPopulationStaysWithinBounds) {
    std::mt19937_64 inputs(2024);
    std::uniform_int_distribution<int> current(1, 60);
    std::uniform_int_distribution<int> capacity(0, 60);
    std::uniform_real_distribution<double> happiness(0.0, 100.0);
    std::uniform_real_distribution<double> elapsed(0.0, 72000.0);
    std::bernoulli_distribution sufficient(0.5);

    for (int i = 0; i < 500; ++i) {
        PopulationInputs in;
        in.current = current(inputs);
        in.capacity = capacity(inputs);
        in.happiness = happiness(inputs);
        in.morale = happiness(inputs);
        in.resourcesSufficient = sufficient(inputs);
        in.elapsedSeconds = elapsed(inputs);

        std::mt19937_64 rng(static_cast<std::uint64_t>(i));
        const PopulationEvaluation eval = model.evaluate(in, rng);
        BOOST_REQUIRE(eval.evaluated);
        BOOST_CHECK_GE(eval.current, 1);
        BOOST_CHECK_LE(eval.current, std::max(1, in.capacity));
        BOOST_CHECK_GE(eval.happiness, 0.0);
        BOOST_CHECK_LE(eval.happiness, 100.0);
    }
}

BOOST_AUTO_TEST_CASE(TestSeededEvaluationIsDeterministic) {
    PopulationInputs in;
    in.current = 40;
    in.capacity = 60;
    in.happiness = 90.0;
    in.morale = 90.0;
    in.elapsedSeconds = 7200.0;

    for (std::uint64_t seed = 0; seed < 50; ++seed) {
        std::mt19937_64 a(seed);
        std::mt19937_64 b(seed);
        const PopulationEvaluation first = model.evaluate(in, a);
        const PopulationEvaluation second = model.evaluate(in, b);
        BOOST_CHECK_EQUAL(first.current, second.current);
        BOOST_CHECK_EQUAL(first.immigrants, second.immigrants);
        BOOST_CHECK_EQUAL(first.emigrants, second.emigrants);
        BOOST_CHECK_EQUAL(first.warnings.size(), second.warnings.size());
    }
}

BOOST_AUTO_TEST_CASE(TestExactlyOneLowHappinessWarning) {
    PopulationInputs in;
    in.current = 20;
    in.capacity = 30;
    in.happiness = 20.0;
    in.morale = 10.0;
    in.resourcesSufficient = false;
    in.elapsedSeconds = 600.0;

    for (std::uint64_t seed = 0; seed < 100; ++seed) {
        std::mt19937_64 rng(seed);
        const PopulationEvaluation eval = model.evaluate(in, rng);
        BOOST_REQUIRE(eval.happiness < 35.0);
        BOOST_REQUIRE(eval.emigrationChance > 0.0);
        BOOST_CHECK_EQUAL(countWarnings(eval, PopulationWarningKind::LowHappiness), 1u);
        BOOST_CHECK_EQUAL(countWarnings(eval, PopulationWarningKind::EmigrationRisk),
                          eval.emigrationTriggered ? 1u : 0u);
    }
}

BOOST_AUTO_TEST_CASE(TestContentSettlementHasNoLowHappinessWarning) {
    PopulationInputs in;
    in.current = 10;
    in.capacity = 20;
    in.happiness = 70.0;
    in.morale = 70.0;
    std::mt19937_64 rng(3);
    const PopulationEvaluation eval = model.evaluate(in, rng);
    BOOST_CHECK_EQUAL(countWarnings(eval, PopulationWarningKind::LowHappiness), 0u);
    BOOST_CHECK(!eval.emigrationTriggered);
}

BOOST_AUTO_TEST_CASE(TestNoHousingKeepsFloorAndWarns) {
    PopulationInputs in;
    in.current = 5;
    in.capacity = 0;
    in.happiness = 50.0;
    in.morale = 50.0;
    std::mt19937_64 rng(9);
    const PopulationEvaluation eval = model.evaluate(in, rng);
    BOOST_CHECK_EQUAL(eval.current, 1);
    BOOST_CHECK_EQUAL(eval.growthRate, 0.0);
    BOOST_CHECK_GE(countWarnings(eval, PopulationWarningKind::NoHousing), 1u);
    BOOST_CHECK(eval.status == PopulationStatus::Declining);
}

BOOST_AUTO_TEST_CASE(TestStarvationShrinksButNeverBelowOne) {
    PopulationInputs in;
    in.current = 100;
    in.capacity = 120;
    in.happiness = 50.0;
    in.morale = 50.0;
    in.resourcesSufficient = false;
    in.elapsedSeconds = 10 * 3600.0;
    std::mt19937_64 rng(11);
    PopulationEvaluation eval = model.evaluate(in, rng);
    BOOST_CHECK(eval.status == PopulationStatus::Declining);
    BOOST_CHECK_LT(eval.grown, 100);

    in.current = 1;
    in.elapsedSeconds = 1000 * 3600.0;
    eval = model.evaluate(in, rng);
    BOOST_CHECK_EQUAL(eval.current, 1);
}

BOOST_AUTO_TEST_CASE(TestImmigrationRespectsBatchAndCapacity) {
    PopulationInputs in;
    in.current = 18;
    in.capacity = 20;
    in.happiness = 100.0;
    in.morale = 100.0;
    in.elapsedSeconds = 0.0;

    int arrivals = 0;
    for (std::uint64_t seed = 0; seed < 400; ++seed) {
        std::mt19937_64 rng(seed);
        const PopulationEvaluation eval = model.evaluate(in, rng);
        BOOST_CHECK_LE(eval.immigrants, 2);
        BOOST_CHECK_LE(eval.current, 20);
        if (eval.settlersArrived()) {
            ++arrivals;
            BOOST_CHECK(eval.immigrationTriggered);
            BOOST_CHECK(eval.status == PopulationStatus::Growing);
        }
    }
    // Chance is 0.25 per evaluation.
    BOOST_CHECK_GT(arrivals, 40);
    BOOST_CHECK_LT(arrivals, 180);
}

BOOST_AUTO_TEST_CASE(TestLongAbsenceFillsHousingWithoutOverflow) {
    PopulationInputs in;
    in.current = 50;
    in.capacity = 100;
    in.happiness = 100.0;
    in.morale = 100.0;
    in.resourcesSufficient = true;
    in.elapsedSeconds = 90 * 86400.0;

    for (std::uint64_t seed = 0; seed < 20; ++seed) {
        std::mt19937_64 rng(seed);
        const PopulationEvaluation eval = model.evaluate(in, rng);
        BOOST_CHECK_EQUAL(eval.grown, 100);
        BOOST_CHECK_EQUAL(eval.current, 100);
        BOOST_CHECK_EQUAL(eval.immigrants, 0);
        BOOST_CHECK(eval.status == PopulationStatus::Growing);
    }

    // Far beyond any representable growth factor.
    in.elapsedSeconds = 1.0e12;
    std::mt19937_64 rng(3);
    const PopulationEvaluation eval = model.evaluate(in, rng);
    BOOST_CHECK_EQUAL(eval.current, 100);
}

BOOST_AUTO_TEST_CASE(TestLongStarvationStaysAtFloor) {
    PopulationInputs in;
    in.current = 50;
    in.capacity = 100;
    in.happiness = 50.0;
    in.morale = 50.0;
    in.resourcesSufficient = false;
    in.elapsedSeconds = 1.0e12;
    std::mt19937_64 rng(5);
    const PopulationEvaluation eval = model.evaluate(in, rng);
    BOOST_CHECK_EQUAL(eval.grown, 0);
    BOOST_CHECK_EQUAL(eval.current, 1);
}

BOOST_AUTO_TEST_SUITE_END()
