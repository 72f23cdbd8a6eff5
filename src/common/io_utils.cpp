#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <iterator>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw internal_error("Unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw internal_error("Unable to create file " + path.string());
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout) throw internal_error("Unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath == "." || subpath == ".." ||
        subpath.find('/') != string::npos || subpath.find('\0') != string::npos)
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

string random_uuid() {
    // random_generator 不是线程安全的，每个线程持有一个
    thread_local boost::uuids::random_generator generator;
    return boost::lexical_cast<string>(generator());
}

scoped_directory::scoped_directory() {}

scoped_directory::scoped_directory(const fs::path &parent, const string &prefix, bool keep)
    : dir(parent / (prefix + "-" + random_uuid())), keep(keep) {
    error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        dir.clear();
        throw internal_error("Unable to create directory " + (parent / prefix).string() + ": " + ec.message());
    }
}

scoped_directory::scoped_directory(scoped_directory &&other) noexcept
    : dir(move(other.dir)), keep(other.keep) {
    other.dir.clear();
}

scoped_directory &scoped_directory::operator=(scoped_directory &&other) noexcept {
    if (this != &other) {
        release();
        dir = move(other.dir);
        keep = other.keep;
        other.dir.clear();
    }
    return *this;
}

scoped_directory::~scoped_directory() {
    release();
}

const fs::path &scoped_directory::path() const {
    return dir;
}

/**
 * @brief 为目录树中的所有目录加上属主的读写执行权限
 * 选手程序以评测进程的用户运行，可以 chmod 自己创建的子目录使其无法删除
 */
static void restore_owner_permissions(const fs::path &root) {
    error_code ec;
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        error_code entry_ec;
        // 不跟随符号链接，避免修改目录树之外的文件
        if (it->symlink_status(entry_ec).type() == fs::file_type::directory)
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, entry_ec);
    }
}

void scoped_directory::release() noexcept {
    if (dir.empty()) return;
    if (keep) {
        LOG(INFO) << "Keeping directory " << dir << " for inspection";
    } else {
        error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            restore_owner_permissions(dir);
            ec.clear();
            fs::remove_all(dir, ec);
        }
        if (ec) LOG(ERROR) << "Unable to delete directory " << dir << ": " << ec.message();
    }
    dir.clear();
}

}  // namespace grader
