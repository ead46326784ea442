/**
 * @file config_loader_test.cpp
 * @brief Unit tests for JSON configuration loading
 *
 * @see include/pacs/forward/config/config_loader.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "pacs/forward/config/config_loader.h"

#include "utils/test_helpers.h"

#include <cstdlib>
#include <string>

namespace pacs::forward::config {
namespace {

using namespace ::testing;
using namespace pacs::forward::test;

constexpr std::string_view BASIC_JSON = R"({
  "listeners": [{"name": "Listener_1", "port": 11112, "ae_title": "AE_1",
                 "output_dir": "/tmp/Listener_1"}],
  "endpoints": [
    {"type": "dicom", "name": "DSE_1", "address": "192.168.1.10", "port": 106,
     "calling_ae": "AET_1", "called_ae": "DSE_1"},
    {"type": "directory", "name": "DE_1", "path": "/tmp/DE_1"}],
  "routes": [{"name": "Listener_1", "endpoints": ["DE_1", "DSE_1"]}],
  "manager": {"max_stop_attempts": 5},
  "worker": {"buffer_size": 10, "minimum_age_ms": 2000, "idle_backoff_ms": 50,
             "max_parallel_deliveries": 3},
  "logging": {"level": "debug"}
})";

class ConfigLoaderTest : public pacs_forward_test {
protected:
    void TearDown() override {
        ::unsetenv("PACS_FORWARD_TEST_PORT");
        ::unsetenv("PACS_FORWARD_TEST_DIR");
        pacs_forward_test::TearDown();
    }
};

TEST_F(ConfigLoaderTest, LoadJsonStringBasic) {
    auto result = config_loader::load_json_string(BASIC_JSON);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    const auto& config = *result;
    ASSERT_EQ(config.listeners.size(), 1u);
    EXPECT_EQ(config.listeners[0].port, 11112);
    EXPECT_EQ(config.listeners[0].ae_title, "AE_1");

    ASSERT_EQ(config.endpoints.size(), 2u);
    const auto* dse = std::get_if<network_endpoint>(&config.endpoints[0]);
    ASSERT_NE(dse, nullptr);
    EXPECT_EQ(dse->called_ae, "DSE_1");
    EXPECT_TRUE(std::holds_alternative<directory_endpoint>(config.endpoints[1]));

    ASSERT_EQ(config.routes.size(), 1u);
    EXPECT_THAT(config.routes[0].endpoints, ElementsAre("DE_1", "DSE_1"));

    EXPECT_EQ(config.manager.max_stop_attempts, 5u);
    EXPECT_EQ(config.worker.buffer_size, 10u);
    EXPECT_EQ(config.worker.minimum_age, std::chrono::milliseconds(2000));
    EXPECT_EQ(config.worker.idle_backoff, std::chrono::milliseconds(50));
    EXPECT_EQ(config.worker.max_parallel_deliveries, 3u);
    EXPECT_EQ(config.logging.level, log_level::debug);
    EXPECT_EQ(config.tools.storescu, "storescu");
}

TEST_F(ConfigLoaderTest, EmptyContentFails) {
    auto result = config_loader::load_json_string("  \n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, config_error::empty_config);
}

TEST_F(ConfigLoaderTest, MalformedJsonFails) {
    auto result = config_loader::load_json_string("{\"listeners\": [");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, config_error::parse_error);
}

TEST_F(ConfigLoaderTest, UnknownEndpointTypeFails) {
    auto result = config_loader::load_json_string(
        R"({"endpoints": [{"type": "ftp", "name": "X"}]})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, config_error::invalid_value);
}

TEST_F(ConfigLoaderTest, MissingRequiredFieldFails) {
    auto result = config_loader::load_json_string(
        R"({"listeners": [{"name": "L", "port": 104, "ae_title": "AE"}]})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, config_error::missing_required_field);
    EXPECT_THAT(result.error().message, HasSubstr("output_dir"));
}

TEST_F(ConfigLoaderTest, PortOutOfRangeFails) {
    auto result = config_loader::load_json_string(
        R"({"listeners": [{"name": "L", "port": 70000, "ae_title": "AE",
                           "output_dir": "/tmp/x"}]})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, config_error::invalid_value);
}

TEST_F(ConfigLoaderTest, EnvironmentVariablesExpanded) {
    ::setenv("PACS_FORWARD_TEST_PORT", "4242", 1);
    ::setenv("PACS_FORWARD_TEST_DIR", "/data/in", 1);

    auto result = config_loader::load_json_string(
        R"({"listeners": [{"name": "L", "port": "${PACS_FORWARD_TEST_PORT}",
                           "ae_title": "${PACS_FORWARD_TEST_AE:-DEFAULT_AE}",
                           "output_dir": "${PACS_FORWARD_TEST_DIR}/l"}]})");
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->listeners[0].port, 4242);
    EXPECT_EQ(result->listeners[0].ae_title, "DEFAULT_AE");
    EXPECT_EQ(result->listeners[0].output_dir, "/data/in/l");
}

TEST_F(ConfigLoaderTest, ExpandEnvVarsMissingFails) {
    auto result = config_loader::expand_env_vars("${PACS_FORWARD_UNSET_VARIABLE}");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, config_error::env_var_not_found);

    auto unclosed = config_loader::expand_env_vars("${OPEN");
    ASSERT_FALSE(unclosed.has_value());
    EXPECT_EQ(unclosed.error().code, config_error::parse_error);

    auto plain = config_loader::expand_env_vars("no variables");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, "no variables");
}

TEST_F(ConfigLoaderTest, LoadMissingFileFails) {
    auto result = config_loader::load(root() / "missing.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, config_error::file_not_found);
}

TEST_F(ConfigLoaderTest, LoadRejectsNonJsonExtension) {
    auto path = root() / "config.toml";
    write_file(path, "[listeners]");
    auto result = config_loader::load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, config_error::invalid_format);
}

TEST_F(ConfigLoaderTest, SaveAndReloadPreservesConfiguration) {
    auto sample = config_loader::sample_config();
    auto path = root() / "nested" / "config.json";

    auto saved = config_loader::save_json(sample, path);
    ASSERT_TRUE(saved.has_value()) << saved.error().to_string();

    auto loaded = config_loader::load(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().to_string();
    EXPECT_EQ(config_loader::to_json(*loaded), config_loader::to_json(sample));
}

TEST_F(ConfigLoaderTest, LoadAndValidateReportsValidationErrors) {
    auto path = root() / "invalid.json";
    write_file(path, R"({"routes": [{"name": "ghost", "endpoints": ["x"]}]})");

    auto result = config_loader::load_and_validate(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, config_error::validation_error);
    EXPECT_FALSE(result.error().validation_errors.empty());
}

TEST_F(ConfigLoaderTest, SampleConfigShape) {
    auto sample = config_loader::sample_config();
    EXPECT_EQ(sample.listeners.size(), 2u);
    EXPECT_EQ(sample.endpoints.size(), 4u);
    ASSERT_EQ(sample.routes.size(), 2u);
    EXPECT_THAT(sample.routes[0].endpoints, ElementsAre("DSE_1", "DE_1"));
    EXPECT_EQ(sample.manager.max_stop_attempts, 100u);

    auto json = config_loader::to_json(sample);
    EXPECT_THAT(json, HasSubstr("\"type\": \"directory\""));
}

}  // namespace
}  // namespace pacs::forward::config
