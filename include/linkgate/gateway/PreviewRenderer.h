#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace linkgate {
namespace gateway {

class PreviewRenderer {
public:
    virtual ~PreviewRenderer() = default;

    virtual std::string Render(int64_t objectId, const std::string& secretHash, const std::string& action) = 0;
};

// Fills {{title}}, {{stream_url}} and {{action}} in an HTML template. Values
// are HTML-escaped. Without a template file a built-in player page is used.
class TemplatePreviewRenderer : public PreviewRenderer {
public:
    explicit TemplatePreviewRenderer(const std::string& templatePath = std::string());

    std::string Render(int64_t objectId, const std::string& secretHash, const std::string& action) override;

    bool usingBuiltin() const { return builtin_; }

    static std::string HtmlEscape(const std::string& s);

private:
    std::string template_;
    bool builtin_{true};
};

using PreviewRendererPtr = std::unique_ptr<PreviewRenderer>;

} // namespace gateway
} // namespace linkgate
