/*
    Sandgate - sandbox egress gateway with TLS inspection and credential injection.
    Copyright (c) 2014, Ales Stibal <astib@mag0.net>, All rights reserved.

    Sandgate is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    Sandgate is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with Sandgate.  If not, see <http://www.gnu.org/licenses/>.

    Linking Sandgate statically or dynamically with other modules is
    making a combined work based on Sandgate. Thus, the terms and
    conditions of the GNU General Public License cover the whole combination.

    In addition, as a special exception, the copyright holders of Sandgate
    give you permission to combine Sandgate with free software programs
    or libraries that are released under the GNU LGPL and with code
    included in the standard release of OpenSSL under the OpenSSL's license
    (or modified versions of such code, with unchanged license).
    You may copy and distribute such a system following the terms
    of the GNU GPL for Sandgate and the licenses of the other code
    concerned, provided that you include the source code of that other code
    when and as the GNU GPL requires distribution of source code.

    Note that people who make modified versions of Sandgate are not
    obligated to grant this special exception for their modified versions;
    it is their choice whether to do so. The GNU General Public License
    gives permission to release a modified version without this exception;
    this exception also makes it possible to release a modified version
    which carries forward this exception.
*/

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <utils/fs.hpp>
#include <log/logan.hpp>
#include <display.hpp>


namespace sg::fs {

    static logan_lite& get_log() {
        static logan_lite log_("utils.fs");
        return log_;
    }


    bool is_dir(std::string const& v) {
        auto const& log = sg::fs::get_log();

        if (  struct stat sb{} ; ::stat(v.c_str(), &sb) >= 0) {
            _deb("is_dir: '%s' exists", v.c_str());
            if ((sb.st_mode & S_IFMT) == S_IFDIR) {
                _deb("is_dir: '%s' is directory", v.c_str());
                return true;
            } else {
                _deb("is_dir: '%s' is not directory", v.c_str());
            }
        } else {
            _deb("is_dir: '%s' does not exist", v.c_str());
        }

        return false;
    }

    bool is_file(std::string const& v) {
        auto const& log = sg::fs::get_log();

        if (struct stat sb{}; ::stat(v.c_str(), &sb) >= 0) {
            _deb("is_file: '%s' exists", v.c_str());
            if ((sb.st_mode & S_IFMT) == S_IFREG) {
                _deb("is_file: '%s' is file", v.c_str());
                return true;
            }
            else {
                _deb("is_file: '%s' is not file", v.c_str());
            }
        } else {
            _deb("is_file: '%s' does not exist", v.c_str());
        }

        return false;
    }

    bool make_dirs(std::string const& path, mode_t mode) {
        auto const& log = sg::fs::get_log();

        if(path.empty()) return false;
        if(is_dir(path)) return true;

        auto slash = path.find_last_of('/');
        if(slash != std::string::npos and slash > 0) {
            if(not make_dirs(path.substr(0, slash), mode)) {
                return false;
            }
        }

        if(::mkdir(path.c_str(), mode) < 0 and errno != EEXIST) {
            _err("make_dirs: cannot create '%s': %s", path.c_str(), string_error().c_str());
            return false;
        }

        return is_dir(path);
    }

    std::optional<std::string> read_file(std::string const& path, std::size_t max_size) {
        auto const& log = sg::fs::get_log();

        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if(fd < 0) {
            _dia("read_file: cannot open '%s': %s", path.c_str(), string_error().c_str());
            return std::nullopt;
        }

        std::string ret;
        char buf[4096];
        bool ok = true;

        while(true) {
            auto n = ::read(fd, buf, sizeof(buf));
            if(n < 0) {
                if(errno == EINTR) continue;
                _err("read_file: read error on '%s': %s", path.c_str(), string_error().c_str());
                ok = false;
                break;
            }
            if(n == 0) break;

            if(ret.size() + static_cast<std::size_t>(n) > max_size) {
                _err("read_file: '%s' exceeds %zu bytes", path.c_str(), max_size);
                ok = false;
                break;
            }
            ret.append(buf, static_cast<std::size_t>(n));
        }

        ::close(fd);

        if(not ok) return std::nullopt;
        return ret;
    }

    bool write_file_atomic(std::string const& path, std::string const& content, mode_t mode) {
        auto const& log = sg::fs::get_log();

        auto tmp = path + ".tmp";
        ::unlink(tmp.c_str());

        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
        if(fd < 0) {
            _err("write_file_atomic: cannot create '%s': %s", tmp.c_str(), string_error().c_str());
            return false;
        }

        // umask may have trimmed the mode
        if(::fchmod(fd, mode) < 0) {
            _err("write_file_atomic: cannot chmod '%s': %s", tmp.c_str(), string_error().c_str());
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }

        std::size_t written = 0;
        while(written < content.size()) {
            auto n = ::write(fd, content.data() + written, content.size() - written);
            if(n < 0) {
                if(errno == EINTR) continue;

                _err("write_file_atomic: write error on '%s': %s", tmp.c_str(), string_error().c_str());
                ::close(fd);
                ::unlink(tmp.c_str());
                return false;
            }
            written += static_cast<std::size_t>(n);
        }

        if(::fsync(fd) < 0) {
            _war("write_file_atomic: fsync failed on '%s': %s", tmp.c_str(), string_error().c_str());
        }
        ::close(fd);

        if(::rename(tmp.c_str(), path.c_str()) < 0) {
            _err("write_file_atomic: cannot rename '%s' to '%s': %s", tmp.c_str(), path.c_str(), string_error().c_str());
            ::unlink(tmp.c_str());
            return false;
        }

        _dia("write_file_atomic: '%s' written, %zu bytes, mode %04o", path.c_str(), content.size(), mode);
        return true;
    }

    std::optional<FileStamp> stamp(std::string const& path) {
        struct stat sb{};
        if(::stat(path.c_str(), &sb) < 0) {
            return std::nullopt;
        }

        FileStamp ret;
        ret.inode = sb.st_ino;
        ret.size = sb.st_size;
        ret.mtime_sec = sb.st_mtim.tv_sec;
        ret.mtime_nsec = sb.st_mtim.tv_nsec;
        return ret;
    }

    std::optional<mode_t> file_mode(std::string const& path) {
        struct stat sb{};
        if(::stat(path.c_str(), &sb) < 0) {
            return std::nullopt;
        }
        return sb.st_mode & 07777;
    }
}
