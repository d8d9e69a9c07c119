#define BOOST_TEST_MODULE ConsumptionModelTests
#include <boost/test/unit_test.hpp>

#include "consumption_model.h"
#include "simulation_context.h"
#include "structure.h"

#include <string>
#include <vector>

namespace {

Structure building(const std::string& id, const std::string& modifier, double value) {
    Structure s;
    s.id = id;
    s.name = "House";
    s.category = StructureCategory::Building;
    s.buildingType = BuildingType::HOUSE;
    s.modifiers.push_back({modifier, value});
    return s;
}

} // namespace

class ConsumptionFixture {
public:
    ConsumptionFixture() : model(config.consumption, config.scheduler.ticksPerHour()) {}

protected:
    SimulationConfig config;
    ConsumptionModel model;
};

BOOST_FIXTURE_TEST_SUITE(ConsumptionTests, ConsumptionFixture)

BOOST_AUTO_TEST_CASE(TestZeroElapsedTicksConsumesNothing) {
    BOOST_CHECK(model.calculateConsumption(50, 12, 0).allZero());
}

BOOST_AUTO_TEST_CASE(TestPerTickRatesAtSixtyHertz) {
    const ResourceAmounts used = model.calculateConsumption(10, 3, 60);
    BOOST_CHECK_CLOSE(used.food, 10 * 0.005 * 60, 1e-9);
    BOOST_CHECK_CLOSE(used.water, 10 * 0.01 * 60, 1e-9);
    BOOST_CHECK_CLOSE(used.wood, 3 * 0.001 * 60, 1e-9);
    BOOST_CHECK_CLOSE(used.stone, 3 * 0.0005 * 60, 1e-9);
    BOOST_CHECK_CLOSE(used.ore, 3 * 0.00025 * 60, 1e-9);
}

BOOST_AUTO_TEST_CASE(TestWorldMultiplierScalesEverything) {
    const ResourceAmounts base = model.calculateConsumption(4, 2, 600);
    const ResourceAmounts doubled = model.calculateConsumption(4, 2, 600, 2.0);
    for (Resource::Type type : Resource::kAllTypes) {
        BOOST_CHECK_CLOSE(doubled.get(type), 2.0 * base.get(type), 1e-9);
    }
}

BOOST_AUTO_TEST_CASE(TestShortagePredicateUsesOneHourBuffer) {
    ResourceAmounts stock;
    stock.food = 10 * 1080.0;
    stock.water = 10 * 2160.0;
    BOOST_CHECK(model.hasResourcesForPopulation(10, 0, stock));

    stock.food -= 1.0;
    BOOST_CHECK(!model.hasResourcesForPopulation(10, 0, stock));
}

BOOST_AUTO_TEST_CASE(TestMarginalDeficitStillSufficient) {
    // A small stock drop below the per-cycle draw does not flip the signal while the buffer holds.
    ResourceAmounts stock = ResourceAmounts::uniform(1.0e6);
    const ResourceAmounts perCycle = model.calculateConsumption(10, 5, 60);
    stock = subtractResources(stock, perCycle);
    BOOST_CHECK(model.hasResourcesForPopulation(10, 5, stock));
}

BOOST_AUTO_TEST_CASE(TestPopulationCapacity) {
    BOOST_CHECK_EQUAL(model.populationCapacity({}), 10);

    std::vector<Structure> structures;
    structures.push_back(building("h1", "population_capacity", 5.0));
    structures.push_back(building("t1", "Population Capacity", 2.0));
    BOOST_CHECK_EQUAL(model.populationCapacity(structures), 17);

    structures.push_back(building("ruin", "population_capacity", -40.0));
    BOOST_CHECK_EQUAL(model.populationCapacity(structures), 0);
}

BOOST_AUTO_TEST_CASE(TestMorale) {
    BOOST_CHECK_CLOSE(settlementMorale({}), 50.0, 1e-9);

    std::vector<Structure> structures;
    structures.push_back(building("tavern", "morale_boost", 10.0));
    structures.push_back(building("shrine", "Morale Boost", 5.0));
    BOOST_CHECK_CLOSE(settlementMorale(structures), 65.0, 1e-9);

    structures.push_back(building("festival", "morale_boost", 80.0));
    BOOST_CHECK_CLOSE(settlementMorale(structures), 100.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(TestSummary) {
    const ConsumptionSummary summary = model.summarize(20, 4);
    BOOST_CHECK_EQUAL(summary.population, 20);
    BOOST_CHECK_EQUAL(summary.structureCount, 4);
    BOOST_CHECK_CLOSE(summary.perHour.food, 20 * 1080.0, 1e-9);
    BOOST_CHECK_CLOSE(summary.perSecond.food, 20 * 1080.0 / 3600.0, 1e-9);
    BOOST_CHECK_CLOSE(summary.perSecond.ore, 4 * 0.9 / 3600.0, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
