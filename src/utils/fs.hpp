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

#ifndef SANDGATE_UTILS_FS_HPP
#define SANDGATE_UTILS_FS_HPP

#include <sys/types.h>
#include <sys/stat.h>

#include <string>
#include <optional>

namespace sg::fs {

    bool is_dir(std::string const& v);
    bool is_file(std::string const& v);

    // create directory (and parents) with given mode, true if it exists afterwards
    bool make_dirs(std::string const& path, mode_t mode);

    // read whole file, refusing files bigger than max_size
    std::optional<std::string> read_file(std::string const& path, std::size_t max_size);

    // write file via temporary file and rename(), created with 'mode' from the start
    bool write_file_atomic(std::string const& path, std::string const& content, mode_t mode);

    // identity of file content as seen by stat(): changes when the file is replaced or rewritten
    struct FileStamp {
        ino_t inode = 0;
        off_t size = 0;
        time_t mtime_sec = 0;
        long mtime_nsec = 0;

        bool operator==(FileStamp const& r) const {
            return inode == r.inode and size == r.size and mtime_sec == r.mtime_sec and mtime_nsec == r.mtime_nsec;
        }
        bool operator!=(FileStamp const& r) const { return not (*this == r); }
    };

    std::optional<FileStamp> stamp(std::string const& path);
    std::optional<mode_t> file_mode(std::string const& path);
}

#endif
