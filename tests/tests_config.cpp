/*!
 * @file
 * @brief Command line and config file tests.
 */

#include "core/Config.hpp"

#include <catch2/catch.hpp>
#include <opencv2/core/persistence.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using core::AppConfig;
using core::ConfigError;

namespace {

AppConfig parse(std::vector<std::string> args) {
	args.insert(args.begin(), "hand_squeeze");
	std::vector<char*> argv;
	for (auto& arg : args) {
		argv.push_back(arg.data());
	}
	return AppConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("AppConfig defaults")
{
	AppConfig config = parse({});
	CHECK(config.cameraIndex == 0);
	CHECK(config.mirror);
	CHECK(config.showPreview);
	CHECK(config.oscHost == "127.0.0.1");
	CHECK(config.oscPort == "57120");
	CHECK(config.smoothingWindow == 5);
	CHECK(config.maxHands == 2);
	CHECK(config.detectionConfidence == Approx(0.7f));
	CHECK(config.logLevel == core::LogLevel::INFO);
	CHECK_FALSE(config.showHelp);
}

TEST_CASE("AppConfig flags")
{
	AppConfig config = parse({"--camera", "1", "--host", "10.0.0.2", "--port", "9000",
	                          "--window", "8", "--max-hands", "1", "--no-mirror",
	                          "--no-preview", "-v"});
	CHECK(config.cameraIndex == 1);
	CHECK(config.oscHost == "10.0.0.2");
	CHECK(config.oscPort == "9000");
	CHECK(config.smoothingWindow == 8);
	CHECK(config.maxHands == 1);
	CHECK_FALSE(config.mirror);
	CHECK_FALSE(config.showPreview);
	CHECK(config.logLevel == core::LogLevel::DEBUG);

	SECTION("help skips validation")
	{
		CHECK(parse({"--window", "0", "--help"}).showHelp);
	}
}

TEST_CASE("AppConfig rejects bad input")
{
	CHECK_THROWS_AS(parse({"--bogus"}), ConfigError);
	CHECK_THROWS_AS(parse({"--camera"}), ConfigError);
	CHECK_THROWS_AS(parse({"--camera", "one"}), ConfigError);
	CHECK_THROWS_AS(parse({"--window", "0"}), ConfigError);
	CHECK_THROWS_AS(parse({"--window", "1000"}), ConfigError);
	CHECK_THROWS_AS(parse({"--max-hands", "3"}), ConfigError);
	CHECK_THROWS_AS(parse({"--host", ""}), ConfigError);
	CHECK_THROWS_AS(parse({"--config", "/nonexistent/hand_squeeze.yml"}), ConfigError);
}

TEST_CASE("AppConfig file layer")
{
	const auto path = (std::filesystem::temp_directory_path() / "hand_squeeze_test_config.yml").string();
	{
		cv::FileStorage fs(path, cv::FileStorage::WRITE);
		fs << "camera_index" << 3;
		fs << "mirror" << 0;
		fs << "osc_host" << "192.168.1.20";
		fs << "osc_port" << 7000;
		fs << "smoothing_window" << 10;
		fs << "handedness_confidence" << 0.8;
	}

	SECTION("file values replace defaults")
	{
		AppConfig config = parse({"--config", path});
		CHECK(config.cameraIndex == 3);
		CHECK_FALSE(config.mirror);
		CHECK(config.oscHost == "192.168.1.20");
		CHECK(config.oscPort == "7000");
		CHECK(config.smoothingWindow == 10);
		CHECK(config.handednessConfidence == Approx(0.8f));
		// Absent keys keep their defaults
		CHECK(config.maxHands == 2);
	}
	SECTION("flags override the file regardless of order")
	{
		AppConfig config = parse({"--port", "8000", "--config", path});
		CHECK(config.oscPort == "8000");
		CHECK(config.cameraIndex == 3);
	}

	std::filesystem::remove(path);
}

TEST_CASE("AppConfig file booleans")
{
	const auto path = (std::filesystem::temp_directory_path() / "hand_squeeze_test_bools.yml").string();
	auto write = [&](const std::string& body) {
		std::ofstream out(path);
		out << "%YAML:1.0\n---\n" << body;
	};

	SECTION("false and no switch features off")
	{
		write("mirror: false\nshow_preview: No\nverbose: off\n");
		AppConfig config = parse({"--config", path});
		CHECK_FALSE(config.mirror);
		CHECK_FALSE(config.showPreview);
		CHECK(config.logLevel == core::LogLevel::INFO);
	}
	SECTION("true and yes switch features on")
	{
		write("mirror: TRUE\nshow_preview: yes\nverbose: true\n");
		AppConfig config = parse({"--config", path, "--no-mirror"});
		CHECK_FALSE(config.mirror);
		CHECK(config.showPreview);
		CHECK(config.logLevel == core::LogLevel::DEBUG);
	}
	SECTION("anything else is rejected")
	{
		write("show_preview: maybe\n");
		CHECK_THROWS_AS(parse({"--config", path}), ConfigError);
	}

	std::filesystem::remove(path);
}
