#pragma once

#include "linkgate/common/noncopyable.h"
#include "linkgate/common/Result.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace linkgate {
namespace backend {

// Object metadata as the storage backend reports it.
struct FileInfo {
    std::string uniqueId;
    int64_t fileSize{0};
    std::string mimeType;
    std::string fileName;
    std::string fileUrl; // empty when the backend cannot hand out a direct URL
};

// One authenticated session to the storage backend. All callbacks run on
// the owning event loop, never inline from the call that started them.
class BackendClient : linkgate::common::noncopyable {
public:
    using StartCallback = std::function<void(const linkgate::common::Status&)>;
    using FileInfoCallback = std::function<void(const linkgate::common::Result<std::optional<FileInfo>>&)>;
    using BlockCallback = std::function<void(const linkgate::common::Result<std::string>&)>;

    virtual ~BackendClient() = default;

    virtual int id() const = 0;
    virtual bool IsConnected() const = 0;

    virtual void Start(StartCallback cb) = 0;
    // Empty optional when the object does not exist.
    virtual void GetFileInfo(int64_t objectId, FileInfoCallback cb) = 0;
    // Up to limit bytes at offset. A short or empty block means end of object.
    virtual void ReadBlock(int64_t objectId, int64_t offset, int64_t limit, BlockCallback cb) = 0;
};

using BackendClientPtr = std::shared_ptr<BackendClient>;

} // namespace backend
} // namespace linkgate
