#include "common/io_utils.hpp"
#include <fstream>
#include <system_error>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

/**
 * @brief 从 i 开始的合法 UTF-8 字符的字节数，不合法时返回 0
 * 按照 RFC 3629 检查，过长编码和代理区 (U+D800 到 U+DFFF) 都不合法。
 */
static size_t utf8_sequence_length(const string &string, size_t i) {
    unsigned char c = string[i];
    size_t n;
    unsigned char lo = 0x80, hi = 0xBF;  // 第二个字节的范围
    if (c <= 0x7F)
        return 1;
    else if (0xC2 <= c && c <= 0xDF)
        n = 1;
    else if (c == 0xE0)
        n = 2, lo = 0xA0;
    else if (c == 0xED)
        n = 2, hi = 0x9F;
    else if (0xE1 <= c && c <= 0xEF)
        n = 2;
    else if (c == 0xF0)
        n = 3, lo = 0x90;
    else if (c == 0xF4)
        n = 3, hi = 0x8F;
    else if (0xF1 <= c && c <= 0xF3)
        n = 3;
    else
        return 0;
    if (i + n >= string.size()) return 0;
    unsigned char second = string[i + 1];
    if (second < lo || second > hi) return 0;
    for (size_t j = 2; j <= n; j++)
        if (((unsigned char)string[i + j] & 0xC0) != 0x80) return 0;
    return n + 1;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0, length; i < string.size(); i += length)
        if ((length = utf8_sequence_length(string, i)) == 0) return false;
    return true;
}

string utf8_truncate(const string &string, size_t max_bytes) {
    if (string.size() <= max_bytes) return string;
    size_t end = max_bytes;
    // 回退到一个字符的起始字节（非 10bbbbbb）
    while (end > 0 && (((unsigned char)string[end]) & 0xC0) == 0x80) --end;
    return string.substr(0, end);
}

string utf8_sanitize(const string &string) {
    std::string result;
    result.reserve(string.size());
    for (size_t i = 0; i < string.size();) {
        size_t length = utf8_sequence_length(string, i);
        if (length == 0) {
            result += "\xEF\xBF\xBD";  // U+FFFD
            ++i;
        } else {
            result.append(string, i, length);
            i += length;
        }
    }
    return result;
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("..") != string::npos || fs::path(subpath).is_absolute())
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

void copy_directory(const fs::path &from, const fs::path &to, const set<string> &excluded) {
    fs::create_directories(to);
    for (auto it = fs::recursive_directory_iterator(from); it != fs::recursive_directory_iterator(); ++it) {
        const fs::path &source = it->path();
        if (excluded.count(source.filename().string())) {
            if (it->is_directory()) it.disable_recursion_pending();
            continue;
        }

        fs::path target = to / fs::relative(source, from);
        if (it->is_symlink()) {
            fs::copy_symlink(source, target);
            if (it->is_directory()) it.disable_recursion_pending();
        } else if (it->is_directory()) {
            fs::create_directories(target);
        } else if (it->is_regular_file()) {
            fs::copy_file(source, target, fs::copy_options::overwrite_existing);
        }
        // 忽略设备文件、管道等特殊文件
    }
}

void set_tree_writable(const fs::path &dir, bool writable) {
    if (!fs::exists(fs::symlink_status(dir))) return;

    auto apply = [writable](const fs::path &path) {
        if (writable)
            fs::permissions(path, fs::perms::owner_write, fs::perm_options::add | fs::perm_options::nofollow);
        else
            fs::permissions(path, fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write,
                            fs::perm_options::remove | fs::perm_options::nofollow);
    };

    if (writable) apply(dir);
    for (auto &entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_symlink()) continue;
        apply(entry.path());
    }
    if (!writable) apply(dir);
}

}  // namespace grader
