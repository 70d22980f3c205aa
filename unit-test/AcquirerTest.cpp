#include <unistd.h>
#include "acquire/acquirer.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;
using namespace grader::test;

class AcquirerTest : public ::testing::Test {
protected:
    temp_directory dir{"acquirer-test"};
    shared_ptr<const grader_config> config = make_shared<const grader_config>(test_config(dir.path / "run"));
    sandbox runner{config};
    acquirer fetcher{config, runner};
    cancellation_token token;

    filesystem::path make_repo(const map<string, string> &files) {
        filesystem::path repo = dir.path / ("repo-" + random_uuid());
        filesystem::create_directories(repo);
        write_files(repo, files);
        return repo;
    }

    error_kind acquire_error(const string &reference) {
        try {
            fetcher.acquire(reference, "grade_" + random_uuid(), token);
        } catch (acquisition_error &e) {
            return e.kind();
        }
        ADD_FAILURE() << "acquisition of " << reference << " should fail";
        return error_kind::INTERNAL;
    }
};

TEST_F(AcquirerTest, ParseReferenceTest) {
    EXPECT_EQ(parse_reference("https://github.com/owner/rag-app.git").type, reference_type::REMOTE);
    EXPECT_EQ(parse_reference("git@github.com:owner/rag-app.git").type, reference_type::REMOTE);
    EXPECT_EQ(parse_reference("ssh://git@example.com:2222/owner/rag-app").type, reference_type::REMOTE);

    auto local = parse_reference("file:///home/student/rag-app");
    EXPECT_EQ(local.type, reference_type::LOCAL);
    EXPECT_EQ(local.location, "/home/student/rag-app");
    EXPECT_EQ(parse_reference("/home/student/rag-app").type, reference_type::LOCAL);
}

TEST_F(AcquirerTest, MalformedReferenceTest) {
    EXPECT_EQ(acquire_error(""), error_kind::MALFORMED);
    EXPECT_EQ(acquire_error("not a reference"), error_kind::MALFORMED);
    EXPECT_EQ(acquire_error("--upload-pack=touch /tmp/pwned"), error_kind::MALFORMED);
    EXPECT_EQ(acquire_error("relative/path"), error_kind::MALFORMED);
    EXPECT_EQ(acquire_error("https://github.com/owner/repo\n--bad"), error_kind::MALFORMED);
    EXPECT_EQ(acquire_error("ftp://example.com/repo"), error_kind::MALFORMED);
}

TEST_F(AcquirerTest, LocalRepositoryTest) {
    auto repo = make_repo(python_project());
    workspace ws = fetcher.acquire(repo.string(), "grade_local", token);

    EXPECT_EQ(ws.root, config->run_dir / "grade_local");
    EXPECT_EQ(ws.language.name, "python");
    EXPECT_EQ(ws.entry_point, "main.py");
    EXPECT_EQ(ws.env_template, ".env.example");
    EXPECT_TRUE(ws.has_readme);
    EXPECT_TRUE(filesystem::is_regular_file(ws.snapshot / "requirements.txt"));
}

TEST_F(AcquirerTest, SnapshotIsReadOnlyTest) {
    auto repo = make_repo(python_project());
    workspace ws = fetcher.acquire("file://" + repo.string(), "grade_readonly", token);

    auto perms = filesystem::status(ws.snapshot / "main.py").permissions();
    EXPECT_EQ(perms & filesystem::perms::owner_write, filesystem::perms::none);
    perms = filesystem::status(ws.snapshot).permissions();
    EXPECT_EQ(perms & filesystem::perms::owner_write, filesystem::perms::none);
}

TEST_F(AcquirerTest, GitDirectoryExcludedTest) {
    auto files = python_project();
    files[".git/HEAD"] = "ref: refs/heads/main\n";
    auto repo = make_repo(files);
    workspace ws = fetcher.acquire(repo.string(), "grade_git", token);
    EXPECT_FALSE(filesystem::exists(ws.snapshot / ".git"));
}

TEST_F(AcquirerTest, WorkspaceCleanupTest) {
    auto repo = make_repo(python_project());
    filesystem::path root;
    {
        workspace ws = fetcher.acquire(repo.string(), "grade_cleanup", token);
        root = ws.root;
        ASSERT_TRUE(filesystem::exists(root));
    }
    EXPECT_FALSE(filesystem::exists(root));
}

TEST_F(AcquirerTest, NotFoundTest) {
    EXPECT_EQ(acquire_error((dir.path / "missing").string()), error_kind::NOT_FOUND);
    EXPECT_FALSE(filesystem::exists(config->run_dir) && !filesystem::is_empty(config->run_dir));
}

TEST_F(AcquirerTest, NotADirectoryTest) {
    auto repo = make_repo({{"file.txt", "hello"}});
    EXPECT_EQ(acquire_error((repo / "file.txt").string()), error_kind::MALFORMED);
}

TEST_F(AcquirerTest, NoRecognizableProjectTest) {
    auto repo = make_repo({{"notes.txt", "hello"}});
    EXPECT_EQ(acquire_error(repo.string()), error_kind::MALFORMED);
}

TEST_F(AcquirerTest, NoEntryPointTest) {
    auto repo = make_repo({{"requirements.txt", "flask\n"}, {"lib/helper.py", ""}});
    EXPECT_EQ(acquire_error(repo.string()), error_kind::MALFORMED);
    // 失败时工作区也需要被删除
    EXPECT_TRUE(!filesystem::exists(config->run_dir) || filesystem::is_empty(config->run_dir));
}

TEST_F(AcquirerTest, LanguageDetectionTest) {
    auto node = make_repo({{"package.json", "{}"}, {"index.js", ""}});
    workspace ws = fetcher.acquire(node.string(), "grade_node", token);
    EXPECT_EQ(ws.language.name, "nodejs");
    EXPECT_EQ(ws.entry_point, "index.js");
    EXPECT_FALSE(ws.has_readme);
    EXPECT_TRUE(ws.env_template.empty());
}

TEST_F(AcquirerTest, CancelledTest) {
    auto repo = make_repo(python_project());
    token.cancel();
    EXPECT_THROW(fetcher.acquire(repo.string(), "grade_cancelled", token), cancelled_error);
}

TEST_F(AcquirerTest, MissingFileUrlTest) {
    EXPECT_EQ(acquire_error("file:///nonexistent/repository"), error_kind::NOT_FOUND);
}

TEST_F(AcquirerTest, InvalidUtf8ReferenceTest) {
    EXPECT_EQ(acquire_error(string("/home/student/rag-\xff")), error_kind::MALFORMED);
    EXPECT_EQ(acquire_error(string("https://github.com/owner/\xc0\xae")), error_kind::MALFORMED);
}

TEST_F(AcquirerTest, ClassifyCloneFailureTest) {
    EXPECT_EQ(classify_clone_failure("fatal: Authentication failed for 'https://github.com/owner/private.git/'"),
              error_kind::UNAUTHORIZED);
    EXPECT_EQ(classify_clone_failure("git@github.com: Permission denied (publickey).\r\n"
                                     "fatal: Could not read from remote repository.\n"),
              error_kind::UNAUTHORIZED);
    EXPECT_EQ(classify_clone_failure("fatal: could not read Username for 'https://github.com': terminal prompts disabled"),
              error_kind::UNAUTHORIZED);
    EXPECT_EQ(classify_clone_failure("remote: Repository not found.\nfatal: repository 'https://github.com/owner/missing.git/' not found"),
              error_kind::NOT_FOUND);
    EXPECT_EQ(classify_clone_failure("fatal: unable to access 'https://nohost.invalid/': Could not resolve host: nohost.invalid"),
              error_kind::NOT_FOUND);
}

TEST_F(AcquirerTest, LocalUnauthorizedTest) {
    if (geteuid() == 0) GTEST_SKIP() << "root can read any directory";

    auto repo = make_repo(python_project());
    filesystem::permissions(repo, filesystem::perms::none);
    error_kind kind = acquire_error(repo.string());
    filesystem::permissions(repo, filesystem::perms::owner_all);
    EXPECT_EQ(kind, error_kind::UNAUTHORIZED);
}

class FakeGitTest : public AcquirerTest {
protected:
    /**
     * @brief 使用 script 代替 git 可执行文件
     */
    unique_ptr<acquirer> fetcher_with_git(const string &script, double timeout) {
        filesystem::path git = dir.path / "fake-git";
        write_file_content(git, "#!/bin/sh\n" + script);
        filesystem::permissions(git, filesystem::perms::owner_all);

        grader_config fake = test_config(dir.path / "run");
        fake.git = git.string();
        fake.acquisition_timeout_seconds = timeout;
        fake_config = make_shared<const grader_config>(fake);
        fake_runner = make_unique<sandbox>(fake_config);
        return make_unique<acquirer>(fake_config, *fake_runner);
    }

    error_kind clone_error(const acquirer &fake) {
        try {
            fake.acquire("https://github.com/owner/rag-app.git", "grade_" + random_uuid(), token);
        } catch (acquisition_error &e) {
            return e.kind();
        }
        ADD_FAILURE() << "clone should fail";
        return error_kind::INTERNAL;
    }

private:
    shared_ptr<const grader_config> fake_config;
    unique_ptr<sandbox> fake_runner;
};

TEST_F(FakeGitTest, CloneTimeoutTest) {
    auto fake = fetcher_with_git("exec sleep 30\n", 1);
    elapsed_time timer;
    EXPECT_EQ(clone_error(*fake), error_kind::TIMEOUT);
    EXPECT_LT(timer.seconds(), 10);
    EXPECT_TRUE(!filesystem::exists(config->run_dir) || filesystem::is_empty(config->run_dir));
}

TEST_F(FakeGitTest, CloneUnauthorizedTest) {
    auto fake = fetcher_with_git("echo \"fatal: Authentication failed for '$7'\" >&2\nexit 128\n", 10);
    EXPECT_EQ(clone_error(*fake), error_kind::UNAUTHORIZED);
}

TEST_F(FakeGitTest, CloneNotFoundTest) {
    auto fake = fetcher_with_git("echo 'remote: Repository not found.' >&2\nexit 128\n", 10);
    EXPECT_EQ(clone_error(*fake), error_kind::NOT_FOUND);
}
