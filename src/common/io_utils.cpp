#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <system_error>
#include "common/defer.hpp"

namespace orbit {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content, fs::perms perms) {
    // O_EXCL 保证不会覆盖其他 worker 正在使用的文件
    int fd = open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to create file " + path.string());
    defer { close(fd); };

    const char *data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "unable to write file " + path.string());
        }
        data += written;
        remaining -= (size_t)written;
    }

    fs::permissions(path, perms, fs::perm_options::replace);
}

size_t count_files_in_directory(const fs::path &dir) {
    if (!fs::is_directory(dir))
        return 0;
    return (size_t)count_if(fs::directory_iterator(dir), fs::directory_iterator{},
                            [](const fs::directory_entry &) { return true; });
}

}  // namespace orbit
