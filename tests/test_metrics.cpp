#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "metrics/metric_aggregator.hpp"
#include "metrics/recorders.hpp"
#include "tracing/transaction.hpp"

#include <thread>

using namespace apmcore;
using namespace std::chrono_literals;

// ============================================================================
// MetricAggregator
// ============================================================================

TEST_CASE("MetricAggregator: accumulates call statistics", "[metrics]") {
    MetricAggregator metrics;
    metrics.measure("External/all", 100ms, 40ms);
    metrics.measure("External/all", 300ms, 300ms);

    const auto stats = metrics.get_unscoped("External/all");
    REQUIRE(stats.has_value());
    REQUIRE(stats->call_count == 2);
    REQUIRE(stats->total_seconds == Catch::Approx(0.4));
    REQUIRE(stats->exclusive_seconds == Catch::Approx(0.34));
    REQUIRE(stats->min_seconds == Catch::Approx(0.1));
    REQUIRE(stats->max_seconds == Catch::Approx(0.3));
}

TEST_CASE("MetricAggregator: scoped and unscoped are separate", "[metrics]") {
    MetricAggregator metrics;
    metrics.measure_scoped("WebTransaction/Uri/a", "External/host/http", 10ms, 10ms);
    metrics.measure("External/host/http", 10ms, 10ms);
    metrics.measure_scoped("WebTransaction/Uri/b", "External/host/http", 10ms, 10ms);

    REQUIRE(metrics.size() == 3);
    REQUIRE(metrics.get_unscoped("External/host/http")->call_count == 1);
    REQUIRE(metrics.get_scoped("WebTransaction/Uri/a", "External/host/http")->call_count == 1);
    REQUIRE_FALSE(metrics.get_scoped("WebTransaction/Uri/c", "External/host/http").has_value());
    REQUIRE(metrics.scoped().size() == 2);
    REQUIRE(metrics.unscoped().size() == 1);

    metrics.clear();
    REQUIRE(metrics.size() == 0);
}

// ============================================================================
// Exclusive time
// ============================================================================

TEST_CASE("Recorders: exclusive time without children is the whole duration", "[metrics]") {
    auto tx = Transaction::create(TransactionType::WEB);
    auto segment = tx->root_segment()->add_child("work");
    std::this_thread::sleep_for(2ms);
    segment->end();

    REQUIRE(recorders::exclusive_duration(*segment) == segment->duration());
}

TEST_CASE("Recorders: exclusive time subtracts a nested child", "[metrics]") {
    auto tx = Transaction::create(TransactionType::WEB);
    auto parent = tx->root_segment()->add_child("parent");
    std::this_thread::sleep_for(2ms);
    auto child = parent->add_child("child");
    std::this_thread::sleep_for(3ms);
    child->end();
    std::this_thread::sleep_for(2ms);
    parent->end();

    REQUIRE(recorders::exclusive_duration(*parent) == parent->duration() - child->duration());
}

TEST_CASE("Recorders: overlapping children are not double counted", "[metrics]") {
    auto tx = Transaction::create(TransactionType::WEB);
    auto parent = tx->root_segment()->add_child("parent");
    auto a = parent->add_child("a");
    auto b = parent->add_child("b");
    std::this_thread::sleep_for(3ms);
    a->end();
    b->end();
    std::this_thread::sleep_for(1ms);
    parent->end();

    const auto exclusive = recorders::exclusive_duration(*parent);
    REQUIRE(exclusive > parent->duration() - a->duration() - b->duration());
    REQUIRE(exclusive <= parent->duration() - a->duration());
    REQUIRE(exclusive.count() >= 0);
}

// ============================================================================
// Recorders
// ============================================================================

TEST_CASE("Recorders: record_generic uses the segment name", "[metrics]") {
    MetricAggregator metrics;
    auto tx = Transaction::create(TransactionType::BACKGROUND);
    tx->set_name("Job/run");
    auto segment = tx->root_segment()->add_child("Custom/step");
    segment->end();

    recorders::record_generic()(*segment, *tx, metrics);

    REQUIRE(metrics.get_unscoped("Custom/step")->call_count == 1);
    REQUIRE(metrics.get_scoped("OtherTransaction/Job/run", "Custom/step")->call_count == 1);
}

TEST_CASE("Recorders: record_external rollups for background work", "[metrics]") {
    MetricAggregator metrics;
    auto tx = Transaction::create(TransactionType::BACKGROUND);
    auto segment = tx->root_segment()->add_child("External/queue.local/");
    segment->end();

    recorders::record_external("queue.local", "http")(*segment, *tx, metrics);

    REQUIRE(metrics.get_unscoped("External/queue.local/http").has_value());
    REQUIRE(metrics.get_unscoped("External/queue.local/all").has_value());
    REQUIRE(metrics.get_unscoped("External/all").has_value());
    REQUIRE(metrics.get_unscoped("External/allOther").has_value());
    REQUIRE_FALSE(metrics.get_unscoped("External/allWeb").has_value());

    // No transaction name, no scoped metric
    REQUIRE(metrics.scoped().empty());
}
