#include "common/exceptions.hpp"
#include "engine.hpp"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;
using namespace grader::test;

class EngineTest : public ::testing::Test {
protected:
    temp_directory dir{"engine-test"};

    grader_config make_config() {
        grader_config config = test_config(dir.path / "run");

        rubric_criterion readme;
        readme.id = "readme";
        readme.name = "Documentation";
        readme.weight = 1;
        readme.max_score = 10;
        static_rule rule;
        rule.kind = static_rule_kind::FILE_EXISTS;
        rule.paths = {"README.md"};
        readme.detail = static_check_spec{{rule}};
        config.rubric.push_back(readme);

        rubric_criterion tests;
        tests.id = "tests";
        tests.name = "Functional Tests";
        tests.weight = 3;
        tests.max_score = 20;
        functional_test_spec spec;
        spec.command = {"sh", "-c", "echo '{\"passed\": 3, \"total\": 4, \"failures\": [\"query\"]}'"};
        tests.detail = spec;
        config.rubric.push_back(tests);
        return config;
    }

    filesystem::path make_repo(const map<string, string> &files) {
        filesystem::path repo = dir.path / "submissions" / random_uuid();
        filesystem::create_directories(repo);
        write_files(repo, files);
        return repo;
    }
};

TEST_F(EngineTest, GradeSubmissionTest) {
    grading_engine engine(make_config());
    auto repo = make_repo(python_project());

    auto result = engine.grade_submission(repo.string());

    ASSERT_TRUE(result.success) << result.error->message;
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[0].criterion_id, "readme");
    EXPECT_DOUBLE_EQ(result.entries[0].raw_score, 10);
    EXPECT_EQ(result.entries[1].criterion_id, "tests");
    EXPECT_DOUBLE_EQ(result.entries[1].raw_score, 15);

    // (1 * 1.0 + 3 * 0.75) / 4 = 81.25
    EXPECT_DOUBLE_EQ(result.total_score, 81.3);
    EXPECT_EQ(result.grade, "B");
    EXPECT_EQ(result.submission_id, repo.string());
    EXPECT_EQ(result.payload.language, "python");
    EXPECT_EQ(result.payload.entry_point, "main.py");
    ASSERT_EQ(result.payload.criteria.size(), 2u);
    EXPECT_EQ(result.payload.criteria[1].name, "Functional Tests");

    // 评测完成后删除代码快照和运行目录
    EXPECT_TRUE(filesystem::is_empty(engine.get_config().run_dir));
}

TEST_F(EngineTest, DeterministicTest) {
    grading_engine engine(make_config());
    auto repo = make_repo(python_project());

    auto first = engine.grade_submission(repo.string());
    auto second = engine.grade_submission(repo.string());

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_NE(first.grading_id, second.grading_id);
    EXPECT_DOUBLE_EQ(first.total_score, second.total_score);
    EXPECT_EQ(first.grade, second.grade);
    ASSERT_EQ(first.entries.size(), second.entries.size());
    for (size_t i = 0; i < first.entries.size(); ++i)
        EXPECT_DOUBLE_EQ(first.entries[i].raw_score, second.entries[i].raw_score);
}

TEST_F(EngineTest, AcquisitionFailureTest) {
    grading_engine engine(make_config());

    auto result = engine.grade_submission((dir.path / "does-not-exist").string());

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.entries.empty());
    EXPECT_DOUBLE_EQ(result.total_score, 0);
    EXPECT_EQ(result.grade, "F");
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::NOT_FOUND);
    EXPECT_FALSE(result.payload.success);
}

TEST_F(EngineTest, MalformedSubmissionTest) {
    grading_engine engine(make_config());
    auto repo = make_repo({{"README.md", "# notes only\n"}});

    auto result = engine.grade_submission(repo.string());

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::MALFORMED);
}

TEST_F(EngineTest, CancelledSubmissionTest) {
    grading_engine engine(make_config());
    auto repo = make_repo(python_project());

    cancellation_token token;
    token.cancel();
    auto result = engine.grade_submission(repo.string(), token);

    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::CANCELLED);
}

TEST_F(EngineTest, InvalidConfigurationTest) {
    auto duplicated = make_config();
    duplicated.rubric.push_back(duplicated.rubric[0]);
    EXPECT_THROW(grading_engine{duplicated}, aggregation_error);

    auto no_weight = make_config();
    for (auto &criterion : no_weight.rubric) criterion.weight = 0;
    EXPECT_THROW(grading_engine{no_weight}, aggregation_error);

    auto thresholds = make_config();
    thresholds.grade_thresholds = {{60, "Pass"}, {80, "Good"}, {0, "Fail"}};
    EXPECT_THROW(grading_engine{thresholds}, configuration_error);

    auto runguard = make_config();
    runguard.runguard = dir.path / "no-runguard";
    EXPECT_THROW(grading_engine{runguard}, configuration_error);

    auto fixture = make_config();
    get<functional_test_spec>(fixture.rubric[1].detail).fixtures.push_back(
        make_shared<local_asset>("test.sh", dir.path / "missing.sh"));
    EXPECT_THROW(grading_engine{fixture}, configuration_error);
}

TEST_F(EngineTest, GradeBatchTest) {
    grading_engine engine(make_config());
    vector<string> references = {
        make_repo(python_project()).string(),
        (dir.path / "missing").string(),
        make_repo(python_project()).string()};

    auto results = engine.grade_batch(references, 2);

    ASSERT_EQ(results.size(), 3u);
    for (size_t i = 0; i < results.size(); ++i)
        EXPECT_EQ(results[i].submission_id, references[i]);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[1].success);
    EXPECT_TRUE(results[2].success);
    EXPECT_DOUBLE_EQ(results[0].total_score, results[2].total_score);
}
