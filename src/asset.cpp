#include "asset.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;

asset::asset(const string &name) : name(name) {}

asset::~asset() {}

local_asset::local_asset(const string &name, const filesystem::path &path)
    : asset(name), path(path) {}

void local_asset::fetch(const filesystem::path &dir) const {
    filesystem::path target = dir / assert_safe_path(name);
    filesystem::create_directories(target.parent_path());
    if (filesystem::is_directory(path))
        copy_directory(path, target);
    else
        filesystem::copy_file(path, target, filesystem::copy_options::overwrite_existing);
}

text_asset::text_asset(const string &name, const string &text)
    : asset(name), text(text) {}

void text_asset::fetch(const filesystem::path &dir) const {
    filesystem::path target = dir / assert_safe_path(name);
    filesystem::create_directories(target.parent_path());
    write_file_content(target, text);
}

}  // namespace grader
