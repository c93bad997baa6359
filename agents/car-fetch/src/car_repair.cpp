#include "../include/car_repair.hpp"
#include "../include/car_scan.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/ioctl.h>
#include <linux/fs.h>
#elif defined(__APPLE__)
#include <sys/attr.h>
#include <sys/clonefile.h>
#endif

namespace fs = std::filesystem;

namespace {
struct Fd {
    int fd{-1};
    explicit Fd(int f) : fd(f) {}
    ~Fd() { if (fd >= 0) ::close(fd); }
};

// True when the filesystem produced a copy-on-write clone.
static bool try_reflink(const fs::path& src, const fs::path& dst) {
#if defined(__linux__) && defined(FICLONE)
    Fd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.fd < 0) {
        throw FetchError(ErrorKind::io, "cannot open " + src.string() + ": " + std::strerror(errno));
    }
    Fd out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (out.fd < 0) {
        throw FetchError(ErrorKind::io, "cannot create " + dst.string() + ": " + std::strerror(errno));
    }
    if (::ioctl(out.fd, FICLONE, in.fd) == 0) return true;
    ::unlink(dst.c_str());
    return false;
#elif defined(__APPLE__)
    return ::clonefile(src.c_str(), dst.c_str(), 0) == 0;
#else
    (void)src; (void)dst;
    return false;
#endif
}
}

CloneMethod clone_file(const fs::path& src, const fs::path& dst, bool allow_copy) {
    if (!fs::is_regular_file(src)) {
        throw FetchError(ErrorKind::not_found, "clone source not found: " + src.string());
    }
    std::error_code ec;
    fs::remove(dst, ec);
    if (ec) throw FetchError(ErrorKind::io, "cannot replace " + dst.string() + ": " + ec.message());

    if (try_reflink(src, dst)) return CloneMethod::reflink;

    if (!allow_copy) {
        throw FetchError(ErrorKind::unsupported_filesystem,
                         "Fast clone unsupported on this filesystem. Re-run with ALLOW_COPY=1 "
                         "(or --allow-copy) to permit a real copy.");
    }
    log_info("Fast clone unsupported; doing real copy (this may be slow and use disk space).");
    if (!fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec) || ec) {
        throw FetchError(ErrorKind::io, "copy " + src.string() + " -> " + dst.string() + " failed: " + ec.message());
    }
    return CloneMethod::copy;
}

void truncate_file(const fs::path& path, std::uint64_t size) {
    std::error_code ec;
    auto current = fs::file_size(path, ec);
    if (ec) throw FetchError(ErrorKind::io, "cannot stat " + path.string() + ": " + ec.message());
    if (size > current) {
        throw FetchError(ErrorKind::io, "refusing to grow " + path.string() + " from " +
                                            std::to_string(current) + " to " + std::to_string(size) + " bytes");
    }
    fs::resize_file(path, size, ec);
    if (ec) throw FetchError(ErrorKind::io, "truncate " + path.string() + " failed: " + ec.message());
}

fs::path repaired_path_for(const fs::path& car) {
    return fs::path(car.string() + ".fixed.car");
}

RepairResult repair_container(const fs::path& car, bool allow_copy) {
    RepairResult r;
    r.offset = find_zero_length_offset(car);
    r.fixed = repaired_path_for(car);
    r.method = clone_file(car, r.fixed, allow_copy);
    truncate_file(r.fixed, r.offset);
    log_info("Wrote " + r.fixed.string() + " truncated at byte " + std::to_string(r.offset) +
             (r.method == CloneMethod::reflink ? " (reflink)" : " (copy)"));
    return r;
}
