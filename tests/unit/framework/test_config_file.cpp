#include <cstdio>
#include <fstream>
#include <string>

#include <stdlib.h>
#include <unistd.h>

#include "catch.hpp"

#include "config/ipam_config_file.hpp"
#include "core/ipam_log.h"

using namespace ipam::config::file;

static constexpr std::string_view test_document = R"(
log:
  level: debug
limiter:
  max_queue_size: 50
  max_wait_time: 2500
  pools:
    - 172.18.40.0/24
    - abcd:1234::/120
)";

TEST_CASE("check config file loading", "[config file]")
{
    SECTION("load a document from a string")
    {
        auto root = load_string(test_document);
        REQUIRE(root);
        REQUIRE(root->IsMap());
    }

    SECTION("malformed documents are reported")
    {
        auto root = load_string("limiter: [1, 2");
        REQUIRE(!root);
        REQUIRE(!root.error().empty());
    }

    SECTION("load a document from a file")
    {
        char name[] = "/tmp/ipam_config_XXXXXX";
        int fd = mkstemp(name);
        REQUIRE(fd != -1);
        close(fd);

        {
            std::ofstream file(name);
            file << test_document;
        }

        auto root = load_file(name);
        std::remove(name);

        REQUIRE(root);
        REQUIRE(get_param<int>(*root, "limiter.max_queue_size").value() == 50);
    }

    SECTION("missing files are reported")
    {
        auto root = load_file("/nonexistent/ipam.yaml");
        REQUIRE(!root);
        REQUIRE(root.error().find("/nonexistent/ipam.yaml") != std::string::npos);
    }
}

TEST_CASE("check config parameter lookup", "[config file]")
{
    auto root = load_string(test_document).value();

    SECTION("node lookup by path")
    {
        auto node = get_param(root, "limiter");
        REQUIRE(node);
        REQUIRE(node->IsMap());

        auto pools = get_param(root, "limiter.pools");
        REQUIRE(pools);
        REQUIRE(pools->IsSequence());
        REQUIRE(pools->size() == 2);

        REQUIRE(!get_param(root, "limiter.missing"));
        REQUIRE(!get_param(root, "limiter.max_queue_size.deeper"));
        REQUIRE(!get_param(root, "nope"));
    }

    SECTION("typed lookup by path")
    {
        REQUIRE(get_param<std::string>(root, "log.level").value() == "debug");
        REQUIRE(get_param<long>(root, "limiter.max_wait_time").value() == 2500);
        REQUIRE(!get_param<int>(root, "limiter.missing"));
        REQUIRE_THROWS_AS(get_param<int>(root, "log.level"), YAML::BadConversion);
    }
}

TEST_CASE("check log level configuration", "[config file]")
{
    auto saved = ipam_log_level_get();

    SECTION("level by name")
    {
        auto root = load_string("log:\n  level: warning\n").value();
        REQUIRE(apply_log_level(root));
        REQUIRE(ipam_log_level_get() == IPAM_LOG_WARNING);
    }

    SECTION("level by number")
    {
        auto root = load_string("log:\n  level: 5\n").value();
        REQUIRE(apply_log_level(root));
        REQUIRE(ipam_log_level_get() == IPAM_LOG_DEBUG);
    }

    SECTION("no level leaves the current one alone")
    {
        ipam_log_level_set(IPAM_LOG_ERROR);
        auto root = load_string("limiter: {}\n").value();
        REQUIRE(apply_log_level(root));
        REQUIRE(ipam_log_level_get() == IPAM_LOG_ERROR);
    }

    SECTION("bad level is reported")
    {
        ipam_log_level_set(IPAM_LOG_ERROR);
        auto root = load_string("log:\n  level: loud\n").value();
        auto result = apply_log_level(root);
        REQUIRE(!result);
        REQUIRE(result.error().find("loud") != std::string::npos);
        REQUIRE(ipam_log_level_get() == IPAM_LOG_ERROR);
    }

    ipam_log_level_set(saved);
}
