#include "protocols/http/model/PdfRequest.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace folio::protocols::http::model {

namespace {

json fieldError(const std::string& type, json loc, const std::string& msg) {
    return json{{"type", type}, {"loc", std::move(loc)}, {"msg", msg}};
}

std::string firstMessage(const json& errors) {
    if (errors.is_array() && !errors.empty() && errors.front().contains("msg"))
        return errors.front()["msg"].get<std::string>();
    return "Request validation failed";
}

json notAnObject() {
    return json::array({fieldError("model_attributes_type", json::array({"body"}),
                                   "Input should be a valid dictionary or object to extract fields from")});
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}

bool PdfRequest::isJsonContentType(const std::string_view contentType) {
    const auto mediaType = lower(trim(contentType.substr(0, contentType.find(';'))));
    if (!mediaType.starts_with("application/")) return false;
    const std::string_view subtype = std::string_view(mediaType).substr(std::string_view("application/").size());
    return subtype == "json" || subtype.ends_with("+json");
}

ValidationError::ValidationError(json errors)
    : std::invalid_argument(firstMessage(errors)), errors_(std::move(errors)) {}

PdfRequest PdfRequest::parse(const std::string_view body, const std::optional<std::string_view> contentType) {
    if (body.empty())
        throw ValidationError(json::array({fieldError("missing", json::array({"body"}), "Field required")}));

    if (contentType && !contentType->empty() && !isJsonContentType(*contentType)) throw ValidationError(notAnObject());

    json j;
    try {
        j = json::parse(body.begin(), body.end());
    } catch (const json::parse_error& e) {
        const auto offset = e.byte > 0 ? e.byte - 1 : 0;
        auto err = fieldError("json_invalid", json::array({"body", offset}), "JSON decode error");
        err["ctx"] = {{"error", e.what()}};
        throw ValidationError(json::array({std::move(err)}));
    }

    if (!j.is_object()) throw ValidationError(notAnObject());

    PdfRequest req;
    json errors = json::array();

    if (const auto it = j.find("htmlContent"); it == j.end())
        errors.push_back(fieldError("missing", json::array({"body", "htmlContent"}), "Field required"));
    else if (!it->is_string())
        errors.push_back(fieldError("string_type", json::array({"body", "htmlContent"}), "Input should be a valid string"));
    else
        req.htmlContent = it->get<std::string>();

    if (const auto it = j.find("customCss"); it != j.end() && !it->is_null()) {
        if (!it->is_string())
            errors.push_back(fieldError("string_type", json::array({"body", "customCss"}), "Input should be a valid string"));
        else
            req.customCss = it->get<std::string>();
    }

    if (!errors.empty()) throw ValidationError(std::move(errors));
    return req;
}

}
