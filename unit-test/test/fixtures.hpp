#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "workspace.hpp"

namespace grader::test {

/**
 * @brief 测试用的临时文件夹，析构时删除
 */
struct temp_directory {
    std::filesystem::path path;

    explicit temp_directory(const std::string &prefix)
        : path(std::filesystem::temp_directory_path() / (prefix + "-" + random_uuid())) {
        std::filesystem::create_directories(path);
    }

    ~temp_directory() {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) set_tree_writable(path, true);
        std::filesystem::remove_all(path, ec);
    }
};

/**
 * @brief 在 dir 中创建文件，自动创建父文件夹
 */
inline void write_files(const std::filesystem::path &dir, const std::map<std::string, std::string> &files) {
    for (auto &[name, content] : files) {
        std::filesystem::path file = dir / name;
        std::filesystem::create_directories(file.parent_path());
        write_file_content(file, content);
    }
}

/**
 * @brief 一个结构完整的 Python RAG 项目
 */
inline std::map<std::string, std::string> python_project() {
    return {
        {"requirements.txt", "fastapi\nchromadb\nsentence-transformers\ngoogle-generativeai\n"},
        {"main.py", "import os\nCHUNK_LENGTH = int(os.getenv('CHUNK_LENGTH', '500'))\n"
                    "EMBED_MODEL = 'all-MiniLM-L6-v2'\nimport chromadb\n"},
        {"README.md", "# RAG service\n"},
        {".env.example", "HF_API_KEY=\nexport GEMINI_API_KEY=\n# PORT=8000\nCHUNK_LENGTH = 500\n"}};
}

/**
 * @brief 单元测试使用的配置，runguard 为构建目录中的 runguard
 */
inline grader_config test_config(const std::filesystem::path &run_dir) {
    grader_config config;
    config.run_dir = run_dir;
    config.runguard = RUNGUARD_PATH;
    config.sandbox_timeout_seconds = 10;
    config.sandbox_memory_limit = 0;
    config.sandbox_process_limit = 0;
    config.sandbox_output_limit = 4096;
    config.acquisition_timeout_seconds = 10;
    config.languages = default_language_profiles();
    config.grade_thresholds = default_grade_thresholds();
    return config;
}

/**
 * @brief 创建一个工作区，代码快照为 files
 */
inline workspace make_workspace(const std::filesystem::path &root, const std::map<std::string, std::string> &files) {
    workspace ws(root);
    std::filesystem::create_directories(ws.snapshot);
    write_files(ws.snapshot, files);
    for (auto &profile : default_language_profiles())
        if (profile.name == "python") ws.language = profile;
    ws.entry_point = "main.py";
    return ws;
}

}  // namespace grader::test
