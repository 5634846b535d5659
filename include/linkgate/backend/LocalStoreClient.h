#pragma once

#include "linkgate/backend/BackendClient.h"

#include <string>

namespace linkgate {
namespace network {
class EventLoop;
}

namespace backend {

// Backend session over a local directory. Object <id> is described by
// <root>/<id>.meta ("key = value" lines: unique_id, mime_type, file_name,
// file_url) and its bytes live in <root>/<id>.data.
class LocalStoreClient : public BackendClient {
public:
    LocalStoreClient(linkgate::network::EventLoop* loop, int id, const std::string& root);

    int id() const override { return id_; }
    bool IsConnected() const override { return connected_; }

    void Start(StartCallback cb) override;
    void GetFileInfo(int64_t objectId, FileInfoCallback cb) override;
    void ReadBlock(int64_t objectId, int64_t offset, int64_t limit, BlockCallback cb) override;

    const std::string& root() const { return root_; }

private:
    std::string MetaPath(int64_t objectId) const;
    std::string DataPath(int64_t objectId) const;

    linkgate::network::EventLoop* loop_;
    const int id_;
    const std::string root_;
    bool connected_{false};
};

} // namespace backend
} // namespace linkgate
