#include "workspace.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace() {}

workspace::workspace(const fs::path &root) : root(root), snapshot(root / "snapshot") {}

workspace::workspace(workspace &&other) {
    *this = move(other);
}

workspace::~workspace() {
    release();
}

workspace &workspace::operator=(workspace &&other) {
    if (this == &other) return *this;
    release();
    root = move(other.root);
    snapshot = move(other.snapshot);
    language = move(other.language);
    entry_point = move(other.entry_point);
    env_template = move(other.env_template);
    has_readme = other.has_readme;
    keep = other.keep;
    other.root.clear();
    other.snapshot.clear();
    return *this;
}

void workspace::release() noexcept {
    if (root.empty()) return;
    if (keep) {
        LOG(INFO) << "Keeping workspace " << root;
        root.clear();
        return;
    }

    try {
        // 冻结的快照没有写权限，删除前需要恢复
        set_tree_writable(root, true);
    } catch (fs::filesystem_error &e) {
        LOG(WARNING) << "Unable to restore permissions of " << root << ": " << e.what();
    }

    error_code ec;
    fs::remove_all(root, ec);
    if (ec) LOG(ERROR) << "Unable to remove workspace " << root << ": " << ec.message();
    root.clear();
}

}  // namespace grader
