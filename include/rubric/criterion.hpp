#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>
#include "asset.hpp"

namespace grader {

/**
 * @brief 评分项的评测方式
 * 枚举值的顺序与 rubric_criterion::detail 中 variant 的类型顺序一致
 */
enum class criterion_kind {
    /**
     * @brief 在沙箱中运行测试脚本，按照通过的断言比例给分
     */
    FUNCTIONAL_TEST = 0,

    /**
     * @brief 在沙箱中运行检索测试脚本，根据检索质量指标给分
     */
    RETRIEVAL_METRIC = 1,

    /**
     * @brief 只读检查代码快照，不运行选手代码
     */
    STATIC_CHECK = 2
};

const char *get_display_message(criterion_kind);

/**
 * @brief 功能测试评分项
 *
 * 测试脚本的标准输出中需要包含以下任意一种格式的测试结果，以最后出现的为准：
 * 1. 单独一行的 json 对象 {"passed": 3, "total": 4, "failures": ["upload"]}
 * 2. GoogleTest 的统计输出 "[==========] 4 tests from 1 test suite ran." 和 "[  PASSED  ] 3 tests."
 */
struct functional_test_spec {
    enum class scoring_mode {
        /**
         * @brief 按照测试脚本报告的断言通过比例给分
         */
        ASSERTIONS,

        /**
         * @brief 将整个命令视为一个断言，退出码为 0 即通过
         * 用于检查依赖安装、应用启动等没有测试报告的步骤
         */
        EXIT_STATUS
    };

    /**
     * @brief 测试命令，支持 ${workspace}、${fixture} 等占位符
     */
    std::vector<std::string> command;

    scoring_mode scoring = scoring_mode::ASSERTIONS;

    /**
     * @brief 额外的环境变量，会覆盖全局配置中的同名环境变量
     */
    std::map<std::string, std::string> environment;

    /**
     * @brief 需要放到 ${fixture} 目录中的文件，比如测试脚本
     */
    std::vector<asset_ptr> fixtures;
};

enum class retrieval_metric {
    PRECISION_AT_K,
    RECALL_AT_K,
    MRR,

    /**
     * @brief 回答中包含的期望关键词的比例（忽略大小写）
     */
    KEYWORD_RELEVANCE
};

const char *get_display_message(retrieval_metric);

struct retrieval_query {
    std::string id;
    std::string question;

    /**
     * @brief 与该问题相关的文档 id，用于计算 precision@k、recall@k、MRR
     */
    std::vector<std::string> relevant_documents;

    /**
     * @brief 回答中应当出现的关键词，用于计算 keyword_relevance
     */
    std::vector<std::string> expected_keywords;
};

/**
 * @brief 检索质量评分项
 *
 * 评测时会将所有问题写入 ${fixture}/fixture.json，并通过环境变量 GRADER_FIXTURE 传给测试脚本。
 * 测试脚本需要在标准输出中打印一行 json：
 * {"results": [{"id": "q1", "query": "...", "retrieved": ["doc1", "doc2"], "answer": "..."}]}
 */
struct retrieval_metric_spec {
    std::vector<std::string> command;
    retrieval_metric metric = retrieval_metric::PRECISION_AT_K;
    size_t k = 5;
    std::vector<retrieval_query> queries;
    std::map<std::string, std::string> environment;

    /**
     * @brief 检索测试用的文档等文件，文档通常放在 documents/ 子目录下
     */
    std::vector<asset_ptr> fixtures;

    /**
     * @brief 指标值线性映射到 [0, max_score] 时的下界和上界
     * 指标值不超过 metric_floor 时得 0 分，不小于 metric_ceiling 时得满分
     */
    double metric_floor = 0;
    double metric_ceiling = 1;
};

enum class static_rule_kind {
    /**
     * @brief paths 中任意一个文件存在即得分
     */
    FILE_EXISTS,

    /**
     * @brief 存在环境变量模板文件，并按照其中声明的 variables 比例给分
     */
    ENV_TEMPLATE,

    /**
     * @brief 源代码中能找到匹配 pattern 的内容即得分
     */
    SOURCE_PATTERN,

    /**
     * @brief 识别到了项目语言和入口文件即得分
     */
    ENTRY_POINT
};

struct static_rule {
    static_rule_kind kind = static_rule_kind::FILE_EXISTS;
    std::string description;
    double points = 1;
    std::vector<std::string> paths;
    std::vector<std::string> variables;
    std::string pattern;
    std::vector<std::string> extensions;
    std::vector<std::string> excluded_directories;
    bool ignore_case = false;
};

struct static_check_spec {
    std::vector<static_rule> rules;
};

/**
 * @brief 评分表中的一个评分项
 * 评分表在配置加载后不再修改，所有 worker 共享只读访问。
 */
struct rubric_criterion {
    /**
     * @brief 评分项的唯一标识
     */
    std::string id;

    std::string name;

    /**
     * @brief 评分项权重，不要求所有权重和为 1，汇总时会归一化
     */
    double weight = 1;

    /**
     * @brief 评分项的满分
     */
    double max_score = 100;

    /**
     * @brief 单次沙箱运行的时钟时间限制，为 0 时使用全局配置 sandbox_timeout_seconds
     */
    double timeout_seconds = 0;

    /**
     * @brief 评分项是否存在固有的不确定性（比如依赖运行时间的检查）
     */
    bool declares_nondeterminism = false;

    std::variant<functional_test_spec, retrieval_metric_spec, static_check_spec> detail;

    criterion_kind kind() const;
};

void from_json(const nlohmann::json &j, retrieval_query &query);
void from_json(const nlohmann::json &j, static_rule &rule);
void from_json(const nlohmann::json &j, rubric_criterion &criterion);

}  // namespace grader
