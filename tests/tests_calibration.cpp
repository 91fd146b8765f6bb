/*!
 * @file
 * @brief Calibration lock and clear tests.
 */

#include "core/CalibrationController.hpp"
#include "core/Normalizer.hpp"
#include "core/RangeTracker.hpp"

#include <catch2/catch.hpp>

#include <initializer_list>

using core::CalibrationController;
using core::CalibrationStatus;
using core::Command;
using core::Hand;
using core::MetricKey;
using core::MetricName;
using core::RangeTracker;

static void feed(RangeTracker& tracker, const MetricKey& key, std::initializer_list<float> values) {
	for (float v : values) {
		tracker.update(key, v);
	}
}

TEST_CASE("CalibrationController locks")
{
	RangeTracker tracker;
	CalibrationController calibration(tracker);
	const MetricKey left{Hand::Left, MetricName::TipToMcp1};

	feed(tracker, left, {10.0f, 30.0f});
	REQUIRE(calibration.status(Hand::Left) == CalibrationStatus::Unlocked);

	SECTION("max lock freezes the max")
	{
		calibration.lockMax(Hand::Left);
		CHECK(calibration.status(Hand::Left) == CalibrationStatus::MaxLocked);

		tracker.update(left, 50.0f);
		CHECK(tracker.effectiveRange(left).max == 30.0f);
		// Tracking is gated entirely while the max is locked
		CHECK(*tracker.globalMax(left) == 30.0f);

		tracker.update(left, 1.0f);
		CHECK(*tracker.globalMin(left) == 10.0f);
	}
	SECTION("min lock alone does not stop tracking")
	{
		calibration.lockMin(Hand::Left);
		CHECK(calibration.status(Hand::Left) == CalibrationStatus::MinLocked);

		tracker.update(left, 5.0f);
		tracker.update(left, 50.0f);
		CHECK(*tracker.globalMin(left) == 5.0f);

		auto range = tracker.effectiveRange(left);
		CHECK(range.min == 10.0f);
		CHECK(range.max == 50.0f);
	}
	SECTION("both locked")
	{
		calibration.lockMin(Hand::Left);
		calibration.lockMax(Hand::Left);
		CHECK(calibration.status(Hand::Left) == CalibrationStatus::BothLocked);

		core::Normalizer normalizer(tracker);
		CHECK(normalizer.normalize(left, 20.0f) == Approx(0.5f));
		CHECK(normalizer.normalize(left, 90.0f) == 1.0f);
	}
	SECTION("relocking replaces the previous lock")
	{
		calibration.lockMin(Hand::Left);
		tracker.update(left, 2.0f);
		calibration.lockMin(Hand::Left);
		CHECK(tracker.effectiveRange(left).min == 2.0f);
	}
	SECTION("locking is idempotent")
	{
		calibration.lockMax(Hand::Left);
		calibration.lockMax(Hand::Left);
		CHECK(tracker.effectiveRange(left).max == 30.0f);
		CHECK(tracker.state().lockedMax[0].count() == 1);
	}
	SECTION("unobserved keys are not locked")
	{
		const MetricKey unseen{Hand::Left, MetricName::McpToMcp};
		calibration.lockMax(Hand::Left);
		CHECK_FALSE(tracker.isMaxLocked(unseen));

		tracker.update(unseen, 12.0f);
		CHECK(*tracker.globalMax(unseen) == 12.0f);
	}
}

TEST_CASE("CalibrationController lock on an empty hand")
{
	RangeTracker tracker;
	CalibrationController calibration(tracker);

	calibration.lockMin(Hand::Right);
	calibration.lockMax(Hand::Right);
	CHECK(calibration.status(Hand::Right) == CalibrationStatus::Unlocked);
}

TEST_CASE("CalibrationController clear")
{
	RangeTracker locked;
	RangeTracker fresh;
	CalibrationController calibration(locked);
	const MetricKey key{Hand::Right, MetricName::AvgTipToWrist};

	feed(locked, key, {10.0f, 30.0f});
	feed(fresh, key, {10.0f, 30.0f});

	calibration.lockMin(Hand::Right);
	calibration.lockMax(Hand::Right);
	calibration.clear(Hand::Right);
	CHECK(calibration.status(Hand::Right) == CalibrationStatus::Unlocked);

	SECTION("global range survives a clear")
	{
		CHECK(*locked.globalMin(key) == 10.0f);
		CHECK(*locked.globalMax(key) == 30.0f);
	}
	SECTION("behaves like a never-locked hand afterwards")
	{
		feed(locked, key, {5.0f, 40.0f, 22.0f});
		feed(fresh, key, {5.0f, 40.0f, 22.0f});

		core::Normalizer a(locked);
		core::Normalizer b(fresh);
		CHECK(locked.effectiveRange(key).min == fresh.effectiveRange(key).min);
		CHECK(locked.effectiveRange(key).max == fresh.effectiveRange(key).max);
		CHECK(a.normalize(key, 22.0f) == b.normalize(key, 22.0f));
	}
	SECTION("clearing twice is harmless")
	{
		calibration.clear(Hand::Right);
		CHECK(calibration.status(Hand::Right) == CalibrationStatus::Unlocked);
	}
}

TEST_CASE("CalibrationController keeps hands isolated")
{
	RangeTracker tracker;
	CalibrationController calibration(tracker);

	for (MetricName metric : core::ALL_METRICS) {
		feed(tracker, {Hand::Left, metric}, {1.0f, 2.0f});
		feed(tracker, {Hand::Right, metric}, {100.0f, 200.0f});
	}
	const core::RangeState before = tracker.state();

	calibration.lockMin(Hand::Left);
	calibration.lockMax(Hand::Left);
	for (MetricName metric : core::ALL_METRICS) {
		tracker.update({Hand::Left, metric}, 0.5f);
	}

	CHECK(calibration.status(Hand::Right) == CalibrationStatus::Unlocked);
	for (MetricName metric : core::ALL_METRICS) {
		const MetricKey right{Hand::Right, metric};
		CHECK(tracker.globalMin(right) == before.globalMin[right.index()]);
		CHECK(tracker.globalMax(right) == before.globalMax[right.index()]);
		CHECK_FALSE(tracker.isMaxLocked(right));

		// Right keeps tracking while Left is locked
		tracker.update(right, 300.0f);
		CHECK(tracker.effectiveRange(right).max == 300.0f);
	}

	calibration.clear(Hand::Right);
	CHECK(calibration.status(Hand::Left) == CalibrationStatus::BothLocked);
}

TEST_CASE("CalibrationController commands")
{
	RangeTracker tracker;
	CalibrationController calibration(tracker);
	for (Hand hand : core::ALL_HANDS) {
		tracker.update({hand, MetricName::TipToMcp0}, 4.0f);
	}

	CHECK(calibration.apply(Command::LockMinLeft));
	CHECK(calibration.apply(Command::LockMaxRight));
	CHECK(calibration.status(Hand::Left) == CalibrationStatus::MinLocked);
	CHECK(calibration.status(Hand::Right) == CalibrationStatus::MaxLocked);

	CHECK(calibration.apply(Command::LockMaxLeft));
	CHECK(calibration.apply(Command::LockMinRight));
	CHECK(calibration.status(Hand::Left) == CalibrationStatus::BothLocked);
	CHECK(calibration.status(Hand::Right) == CalibrationStatus::BothLocked);

	SECTION("clear applies to both hands")
	{
		CHECK(calibration.apply(Command::ClearCalibration));
		CHECK(calibration.status(Hand::Left) == CalibrationStatus::Unlocked);
		CHECK(calibration.status(Hand::Right) == CalibrationStatus::Unlocked);
	}
	SECTION("quit is not a calibration command")
	{
		CHECK_FALSE(calibration.apply(Command::Quit));
		CHECK(calibration.status(Hand::Left) == CalibrationStatus::BothLocked);
	}
}
