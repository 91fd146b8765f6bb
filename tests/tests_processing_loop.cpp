/*!
 * @file
 * @brief Frame loop tests with scripted camera, detector and keys.
 */

#include "core/CalibrationController.hpp"
#include "core/EngineState.hpp"
#include "core/FrameProcessor.hpp"
#include "core/ProcessingLoop.hpp"
#include "inference/LandmarkDetector.hpp"
#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <deque>
#include <utility>
#include <vector>

using core::Hand;
using core::MetricKey;
using core::MetricName;

namespace {

constexpr int WIDTH = 640;
constexpr int HEIGHT = 480;

class ScriptedSource : public core::FrameSource {
public:
	explicit ScriptedSource(int frames) : remaining(frames) {}

	bool read(cv::Mat& frame) override
	{
		if (remaining <= 0) {
			return false;
		}
		remaining--;
		frame = cv::Mat::zeros(HEIGHT, WIDTH, CV_8UC3);
		return true;
	}

	int remaining;
};

// One labelled left hand per frame, fingertip height taken from the script
class ScriptedDetector : public inference::LandmarkDetector {
public:
	explicit ScriptedDetector(std::deque<float> tips) : tipY(std::move(tips)) {}

	std::vector<core::HandFrame> detect(const cv::Mat& frame) override
	{
		REQUIRE(frame.cols == WIDTH);
		if (tipY.empty()) {
			return {};
		}
		core::HandFrame hand;
		hand.landmarks = test::openHand(tipY.front());
		hand.label = Hand::Left;
		tipY.pop_front();
		return {hand};
	}

	std::deque<float> tipY;
};

class ScriptedDisplay : public core::FrameDisplay {
public:
	explicit ScriptedDisplay(std::deque<int> script) : keys(std::move(script)) {}

	void show(const cv::Mat& frame) override
	{
		(void)frame;
		shown++;
	}

	int pollKey() override
	{
		if (keys.empty()) {
			return -1;
		}
		int key = keys.front();
		keys.pop_front();
		return key;
	}

	std::deque<int> keys;
	int shown = 0;
};

struct Fixture {
	core::EngineState state{3};
	test::RecordingSink sink;
	core::FrameProcessor processor{state, sink};
	core::CalibrationController calibration{state.ranges};
	std::atomic<bool> running{true};
};

} // namespace

TEST_CASE("ProcessingLoop stops on an unreadable frame")
{
	Fixture f;
	ScriptedSource source(3);
	ScriptedDetector detector({0.3f, 0.3f, 0.3f});
	ScriptedDisplay display(std::deque<int>{});

	core::ProcessingLoop loop(source, detector, f.processor, f.calibration, &display, f.running);
	CHECK(loop.run() == 3);
	CHECK(display.shown == 3);
	CHECK(f.sink.messages.size() == 3);
	// Not a quit, the flag is untouched
	CHECK(f.running);
}

TEST_CASE("ProcessingLoop quit key")
{
	Fixture f;
	ScriptedSource source(10);
	ScriptedDetector detector(std::deque<float>{});
	ScriptedDisplay display({-1, 'q', -1});

	core::ProcessingLoop loop(source, detector, f.processor, f.calibration, &display, f.running);
	CHECK(loop.run() == 2);
	CHECK_FALSE(f.running);
	CHECK(source.remaining == 8);
	CHECK(f.sink.messages.empty());
}

TEST_CASE("ProcessingLoop honours a cleared running flag")
{
	Fixture f;
	ScriptedSource source(10);
	ScriptedDetector detector({0.3f});
	f.running = false;

	core::ProcessingLoop loop(source, detector, f.processor, f.calibration, nullptr, f.running);
	CHECK(loop.run() == 0);
	CHECK(source.remaining == 10);
}

TEST_CASE("ProcessingLoop runs headless")
{
	Fixture f;
	ScriptedSource source(4);
	ScriptedDetector detector({0.3f, 0.2f});

	core::ProcessingLoop loop(source, detector, f.processor, f.calibration, nullptr, f.running);
	CHECK(loop.run() == 4);
	// Frames without a detected hand send nothing
	REQUIRE(f.sink.messages.size() == 2);
	CHECK(f.sink.messages[1].hand == Hand::Left);
}

TEST_CASE("ProcessingLoop applies calibration between frames")
{
	Fixture f;
	const MetricKey key{Hand::Left, MetricName::TipToMcp0};

	// Tip to knuckle: 144, 192, 240 px
	ScriptedSource source(3);
	ScriptedDetector detector({0.3f, 0.2f, 0.1f});
	// Lock the left max after the second frame
	ScriptedDisplay display({-1, '4', -1});

	core::ProcessingLoop loop(source, detector, f.processor, f.calibration, &display, f.running);
	CHECK(loop.run() == 3);

	CHECK(f.calibration.status(Hand::Left) == core::CalibrationStatus::MaxLocked);
	// Second frame was tracked before the lock, third was gated
	CHECK(*f.state.ranges.globalMax(key) == Approx(192.0f));
	CHECK(f.state.ranges.effectiveRange(key).max == Approx(192.0f));

	REQUIRE(f.sink.messages.size() == 3);
	const size_t i = static_cast<size_t>(MetricName::TipToMcp0);
	// Window of 3: (0 + 1 + 1) / 3, third value clamped to 1
	CHECK(f.sink.messages[2].values[i] == Approx(2.0f / 3.0f));
}

TEST_CASE("ProcessingLoop clear key")
{
	Fixture f;
	ScriptedSource source(3);
	ScriptedDetector detector({0.3f, 0.2f, 0.1f});
	ScriptedDisplay display({'3', 'c', -1});

	core::ProcessingLoop loop(source, detector, f.processor, f.calibration, &display, f.running);
	CHECK(loop.run() == 3);
	CHECK(f.calibration.status(Hand::Left) == core::CalibrationStatus::Unlocked);
	CHECK(*f.state.ranges.globalMax({Hand::Left, MetricName::TipToMcp0}) == Approx(240.0f));
}
