#include "mcplink/client/tool_catalog.hpp"

namespace mcplink {

namespace {

std::string render(const TextContent& text) {
    return text.text;
}

std::string render(const ImageContent& image) {
    return "[Image: " + image.mime_type + "]";
}

std::string render(const EmbeddedResource& embedded) {
    const auto& resource = embedded.resource;
    if (resource.text) {
        return *resource.text;
    }
    if (resource.blob) {
        return "[Resource blob: " + std::to_string(resource.blob->size()) + " bytes]";
    }
    return "[Resource: " + resource.uri + "]";
}

}  // namespace

std::string namespaced_tool_name(std::string_view server, std::string_view tool) {
    std::string name;
    name.reserve(kToolNamePrefix.size() + server.size() + kToolNameSeparator.size() + tool.size());
    name.append(kToolNamePrefix);
    name.append(server);
    name.append(kToolNameSeparator);
    name.append(tool);
    return name;
}

std::optional<std::pair<std::string, std::string>> split_namespaced_tool_name(std::string_view name) {
    if (!name.starts_with(kToolNamePrefix)) {
        return std::nullopt;
    }
    const auto rest = name.substr(kToolNamePrefix.size());
    const auto sep = rest.find(kToolNameSeparator);
    if (sep == std::string_view::npos || sep == 0) {
        return std::nullopt;
    }
    const auto tool = rest.substr(sep + kToolNameSeparator.size());
    if (tool.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::string(rest.substr(0, sep)), std::string(tool));
}

std::string format_tool_result(const std::vector<Content>& content) {
    std::string out;
    bool first = true;
    for (const auto& item : content) {
        if (!first) {
            out.push_back('\n');
        }
        first = false;
        out += std::visit([](const auto& c) { return render(c); }, item);
    }
    return out;
}

}  // namespace mcplink
