#include "render/StyleInjector.hpp"

namespace folio::render {

std::string StyleInjector::inject(const std::string& html, const std::optional<std::string>& css) {
    if (!css || css->empty()) return html;

    const auto tag = styleTag(*css);

    if (const auto pos = html.find("</head>"); pos != std::string::npos) {
        std::string out(html);
        out.insert(pos, tag);
        return out;
    }

    if (const auto pos = html.find("<body>"); pos != std::string::npos) {
        std::string out(html);
        out.insert(pos, "<head>" + tag + "</head>");
        return out;
    }

    return "<html><head>" + tag + "</head><body>" + html + "</body></html>";
}

}
