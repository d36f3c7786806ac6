#include "stash/storage/source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace stash::storage {

using namespace stash::core;

Status MemorySource::read(BufferMut out, u32* n) noexcept {
    if (!n || (out.len > 0 && !out.data) || !buffer_ok(data_)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    const u32 take = std::min(out.len, data_.len - pos_);
    if (take > 0) {
        std::memcpy(out.data, data_.data + pos_, take);
    }
    pos_ += take;
    *n = take;
    return ok_status();
}

FileSource::~FileSource() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Status FileSource::open(const std::string& path) noexcept {
    if (fd_ >= 0) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound);
        }
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
    }
    return ok_status();
}

Status FileSource::read(BufferMut out, u32* n) noexcept {
    if (!n || fd_ < 0 || (out.len > 0 && !out.data)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    for (;;) {
        const ssize_t r = ::read(fd_, out.data, out.len);
        if (r < 0) {
            if (errno == EINTR) continue;
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
        }
        *n = static_cast<u32>(r);
        return ok_status();
    }
}

} // namespace stash::storage
