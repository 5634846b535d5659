#include "linkgate/backend/LocalStoreClient.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/common/Logger.h"

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <map>

namespace linkgate {
namespace backend {

using linkgate::common::Error;
using linkgate::common::ErrorKind;
using linkgate::common::Result;
using linkgate::common::Status;

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Closes the descriptor on scope exit.
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) ::close(fd_);
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

LocalStoreClient::LocalStoreClient(linkgate::network::EventLoop* loop, int id, const std::string& root)
    : loop_(loop), id_(id), root_(root) {
}

std::string LocalStoreClient::MetaPath(int64_t objectId) const {
    return root_ + "/" + std::to_string(objectId) + ".meta";
}

std::string LocalStoreClient::DataPath(int64_t objectId) const {
    return root_ + "/" + std::to_string(objectId) + ".data";
}

void LocalStoreClient::Start(StartCallback cb) {
    struct stat st;
    Status status;
    if (::stat(root_.c_str(), &st) != 0) {
        status = Status(Error(ErrorKind::kBackendUnreachable,
                              "store " + root_ + ": " + std::strerror(errno)));
    } else if (!S_ISDIR(st.st_mode)) {
        status = Status(Error(ErrorKind::kBackendUnreachable, "store " + root_ + " is not a directory"));
    } else {
        connected_ = true;
        LOG_INFO << "Session " << id_ << " attached to " << root_;
    }
    loop_->QueueInLoop([cb, status]() { cb(status); });
}

void LocalStoreClient::GetFileInfo(int64_t objectId, FileInfoCallback cb) {
    using FileInfoResult = Result<std::optional<FileInfo>>;

    std::ifstream meta(MetaPath(objectId));
    if (!meta.is_open()) {
        loop_->QueueInLoop([cb]() { cb(FileInfoResult(std::optional<FileInfo>())); });
        return;
    }

    std::map<std::string, std::string> fields;
    std::string line;
    while (std::getline(meta, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        fields[Trim(line.substr(0, eq))] = Trim(line.substr(eq + 1));
    }

    FileInfo info;
    info.uniqueId = fields["unique_id"];
    info.mimeType = fields["mime_type"];
    info.fileName = fields["file_name"];
    info.fileUrl = fields["file_url"];

    struct stat st;
    if (::stat(DataPath(objectId).c_str(), &st) == 0) {
        info.fileSize = static_cast<int64_t>(st.st_size);
    } else if (errno != ENOENT) {
        std::string detail = DataPath(objectId) + ": " + std::strerror(errno);
        loop_->QueueInLoop([cb, detail]() {
            cb(FileInfoResult(Error(ErrorKind::kBackendError, detail)));
        });
        return;
    }

    loop_->QueueInLoop([cb, info]() { cb(FileInfoResult(std::optional<FileInfo>(info))); });
}

void LocalStoreClient::ReadBlock(int64_t objectId, int64_t offset, int64_t limit, BlockCallback cb) {
    using BlockResult = Result<std::string>;

    const std::string path = DataPath(objectId);
    ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        std::string detail = path + ": " + std::strerror(errno);
        loop_->QueueInLoop([cb, detail]() { cb(BlockResult(Error(ErrorKind::kBackendError, detail))); });
        return;
    }

    std::string block(static_cast<size_t>(limit > 0 ? limit : 0), '\0');
    size_t got = 0;
    while (got < block.size()) {
        ssize_t n = ::pread(fd.get(), &block[got], block.size() - got, static_cast<off_t>(offset + got));
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string detail = path + ": " + std::strerror(errno);
            loop_->QueueInLoop([cb, detail]() { cb(BlockResult(Error(ErrorKind::kBackendError, detail))); });
            return;
        }
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    block.resize(got);
    loop_->QueueInLoop([cb, block = std::move(block)]() { cb(BlockResult(block)); });
}

} // namespace backend
} // namespace linkgate
