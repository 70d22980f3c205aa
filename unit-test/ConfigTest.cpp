#include "common/exceptions.hpp"
#include "config.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "scoring/aggregator.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;
using namespace grader::test;

class ConfigTest : public ::testing::Test {
protected:
    temp_directory dir{"config-test"};

    filesystem::path write_config(const string &content) {
        filesystem::path file = dir.path / "grader.json";
        write_file_content(file, content);
        return file;
    }
};

TEST_F(ConfigTest, DefaultValuesTest) {
    auto config = load_config(write_config(R"({
        "run_dir": "/tmp/rag-grader-test",
        "rubric": [{"id": "docs", "kind": "static_check",
                    "rules": [{"type": "file_exists", "paths": ["README.md"]}]}]
    })"));

    EXPECT_DOUBLE_EQ(config.sandbox_timeout_seconds, 60);
    EXPECT_EQ(config.sandbox_memory_limit, 2097152u);
    EXPECT_EQ(config.max_concurrency, 4u);
    EXPECT_DOUBLE_EQ(config.acquisition_timeout_seconds, 60);
    EXPECT_EQ(config.run_dir, filesystem::path("/tmp/rag-grader-test"));
    EXPECT_EQ(config.languages.size(), 4u);
    ASSERT_EQ(config.grade_thresholds.size(), 5u);
    EXPECT_EQ(config.grade_thresholds.front().letter, "A");

    ASSERT_EQ(config.rubric.size(), 1u);
    auto &criterion = config.rubric[0];
    EXPECT_EQ(criterion.name, "docs");
    EXPECT_DOUBLE_EQ(criterion.weight, 1);
    EXPECT_DOUBLE_EQ(criterion.max_score, 100);
    EXPECT_EQ(criterion.kind(), criterion_kind::STATIC_CHECK);
    auto &rule = get<static_check_spec>(criterion.detail).rules.at(0);
    EXPECT_EQ(rule.kind, static_rule_kind::FILE_EXISTS);
    EXPECT_DOUBLE_EQ(rule.points, 1);
}

TEST_F(ConfigTest, CriterionKindsTest) {
    write_files(dir.path, {{"harness/test.sh", "echo '{\"passed\": 1, \"total\": 1}'"}});
    auto config = load_config(write_config(R"({
        "sandbox_timeout_seconds": 30,
        "grade_thresholds": [[85, "Pass"], {"score": 0, "grade": "Fail"}],
        "rubric": [
            {"id": "tests", "kind": "functional_test", "weight": 3, "max_score": 10,
             "command": ["sh", "${fixture}/test.sh"], "fixtures": {"test.sh": "harness/test.sh"},
             "environment": {"MODE": "ci"}, "timeout_seconds": 5},
            {"id": "deps", "kind": "functional_test", "scoring": "exit_status", "command": ["${install_command}"]},
            {"id": "quality", "kind": "retrieval_metric", "metric": "recall_at_k", "k": 3, "nondeterministic": true,
             "command": ["python3", "eval.py"],
             "queries": [{"id": "q1", "question": "What?", "relevant_documents": ["a.txt"]}]},
            {"id": "env", "kind": "static_check", "rules": [{"type": "env_template", "variables": ["PORT"]}]}
        ]
    })"));

    EXPECT_DOUBLE_EQ(config.sandbox_timeout_seconds, 30);
    ASSERT_EQ(config.grade_thresholds.size(), 2u);
    EXPECT_EQ(config.grade_thresholds[0].letter, "Pass");
    EXPECT_DOUBLE_EQ(config.grade_thresholds[1].score, 0);

    ASSERT_EQ(config.rubric.size(), 4u);
    auto &tests = get<functional_test_spec>(config.rubric[0].detail);
    EXPECT_EQ(tests.scoring, functional_test_spec::scoring_mode::ASSERTIONS);
    EXPECT_EQ(tests.environment.at("MODE"), "ci");
    ASSERT_EQ(tests.fixtures.size(), 1u);
    auto fixture = dynamic_pointer_cast<local_asset>(tests.fixtures[0]);
    ASSERT_TRUE(fixture);
    EXPECT_EQ(fixture->path, (dir.path / "harness" / "test.sh").lexically_normal());

    EXPECT_EQ(get<functional_test_spec>(config.rubric[1].detail).scoring, functional_test_spec::scoring_mode::EXIT_STATUS);

    EXPECT_TRUE(config.rubric[2].declares_nondeterminism);
    auto &quality = get<retrieval_metric_spec>(config.rubric[2].detail);
    EXPECT_EQ(quality.metric, retrieval_metric::RECALL_AT_K);
    EXPECT_EQ(quality.k, 3u);
    ASSERT_EQ(quality.queries.size(), 1u);
    EXPECT_EQ(quality.queries[0].relevant_documents, vector<string>{"a.txt"});

    auto &env = get<static_check_spec>(config.rubric[3].detail).rules.at(0);
    EXPECT_EQ(env.paths, (vector<string>{".env.example", ".env.template", ".env.sample"}));
}

TEST_F(ConfigTest, InvalidConfigTest) {
    EXPECT_THROW(load_config(dir.path / "missing.json"), configuration_error);
    EXPECT_THROW(load_config(write_config("{ not json")), configuration_error);
    EXPECT_THROW(load_config(write_config(R"({"rubric": [{"id": "x", "kind": "unknown"}]})")), configuration_error);
    EXPECT_THROW(load_config(write_config(R"({"rubric": [{"id": "x", "kind": "functional_test", "command": []}]})")), configuration_error);
    EXPECT_THROW(load_config(write_config(R"({"rubric": [{"id": "x", "kind": "static_check", "rules": []}]})")), configuration_error);
    EXPECT_THROW(load_config(write_config(R"({"rubric": [{"id": "x", "kind": "static_check",
        "rules": [{"type": "source_pattern", "pattern": "(unclosed"}]}]})")), configuration_error);
    EXPECT_THROW(load_config(write_config(R"({"rubric": [{"id": "x", "kind": "retrieval_metric", "metric": "mrr",
        "command": ["run"], "queries": []}]})")), configuration_error);
    EXPECT_THROW(load_config(write_config(R"({"sandbox_timeout_seconds": 0, "rubric": []})")), configuration_error);
    EXPECT_THROW(load_config(write_config(R"({"max_concurrency": "four", "rubric": []})")), configuration_error);
}

TEST_F(ConfigTest, BundledConfigTest) {
    filesystem::path bundled = filesystem::path(__FILE__).parent_path().parent_path() / "config" / "grader.json";
    auto config = load_config(bundled);

    ASSERT_EQ(config.rubric.size(), 7u);
    EXPECT_NO_THROW(validate_rubric(config.rubric));
    EXPECT_NO_THROW(validate_thresholds(config.grade_thresholds));

    double total_weight = 0;
    for (auto &criterion : config.rubric) total_weight += criterion.weight;
    EXPECT_DOUBLE_EQ(total_weight, 100);

    auto &upload = get<functional_test_spec>(config.rubric[4].detail);
    for (auto &fixture : upload.fixtures) {
        auto local = dynamic_pointer_cast<local_asset>(fixture);
        ASSERT_TRUE(local);
        EXPECT_TRUE(filesystem::exists(local->path)) << local->path;
    }
}
