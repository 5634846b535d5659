#include "linkgate/gateway/PreviewRenderer.h"
#include "linkgate/gateway/LinkCodec.h"
#include "linkgate/common/Logger.h"

#include <fstream>
#include <sstream>

namespace linkgate {
namespace gateway {

namespace {

const char kBuiltinPage[] =
    "<!DOCTYPE html>\n"
    "<html>\n"
    "<head>\n"
    "<meta charset=\"utf-8\">\n"
    "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
    "<title>{{title}}</title>\n"
    "<style>body{margin:0;background:#111;color:#eee;font-family:sans-serif}"
    "main{max-width:960px;margin:0 auto;padding:16px}video{width:100%}</style>\n"
    "</head>\n"
    "<body data-action=\"{{action}}\">\n"
    "<main>\n"
    "<h1>{{title}}</h1>\n"
    "<video controls preload=\"metadata\" src=\"{{stream_url}}\"></video>\n"
    "<p><a href=\"{{stream_url}}\" download>Download</a></p>\n"
    "</main>\n"
    "</body>\n"
    "</html>\n";

void ReplaceAll(std::string* text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text->find(from, pos)) != std::string::npos) {
        text->replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

TemplatePreviewRenderer::TemplatePreviewRenderer(const std::string& templatePath)
    : template_(kBuiltinPage) {
    if (templatePath.empty()) {
        return;
    }
    std::ifstream in(templatePath);
    if (!in.is_open()) {
        LOG_WARN << "Preview template " << templatePath << " not readable, using built-in page";
        return;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    template_ = ss.str();
    builtin_ = false;
    LOG_INFO << "Loaded preview template " << templatePath;
}

std::string TemplatePreviewRenderer::HtmlEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string TemplatePreviewRenderer::Render(int64_t objectId, const std::string& secretHash, const std::string& action) {
    const std::string token = EncodeLink(objectId, secretHash);
    std::string page = template_;
    ReplaceAll(&page, "{{title}}", HtmlEscape("File " + std::to_string(objectId)));
    ReplaceAll(&page, "{{stream_url}}", HtmlEscape("/" + token));
    ReplaceAll(&page, "{{action}}", HtmlEscape(action));
    return page;
}

} // namespace gateway
} // namespace linkgate
