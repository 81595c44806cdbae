#include <mcpbridge/capability_registry.hpp>

#include <exception>
#include <utility>

namespace mcpbridge {

const char* to_string(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::Tools:     return "tools";
        case CapabilityKind::Resources: return "resources";
        case CapabilityKind::Prompts:   return "prompts";
    }
    return "unknown";
}

void CapabilityRegistry::set_change_listener(ChangeListener listener) {
    listener_ = std::move(listener);
}

void CapabilityRegistry::notify(CapabilityKind kind) {
    if (listener_) {
        listener_(kind);
    }
}

void CapabilityRegistry::register_tool(const ToolDescriptor& descriptor, ToolFunction handler) {
    register_async_tool(descriptor, [handler](const json& arguments, ToolCompletion done) {
        CallToolResult result;
        try {
            result = handler(arguments);
        } catch (...) {
            done(std::current_exception(), CallToolResult());
            return;
        }
        done(nullptr, std::move(result));
    });
}

void CapabilityRegistry::register_async_tool(const ToolDescriptor& descriptor, AsyncToolFunction handler) {
    tools_.upsert(descriptor.name, ToolEntry{descriptor, std::move(handler)});
    notify(CapabilityKind::Tools);
}

void CapabilityRegistry::register_resource(const ResourceDescriptor& descriptor, ResourceFunction handler) {
    register_async_resource(descriptor, [handler](ResourceCompletion done) {
        std::vector<ResourceContent> contents;
        try {
            contents = handler();
        } catch (...) {
            done(std::current_exception(), {});
            return;
        }
        done(nullptr, std::move(contents));
    });
}

void CapabilityRegistry::register_async_resource(const ResourceDescriptor& descriptor,
                                                 AsyncResourceFunction handler) {
    resources_.upsert(descriptor.uri, ResourceEntry{descriptor, std::move(handler)});
    notify(CapabilityKind::Resources);
}

void CapabilityRegistry::register_prompt(const PromptDescriptor& descriptor, PromptFunction handler) {
    register_async_prompt(descriptor,
        [handler](const std::optional<PromptArguments>& arguments, PromptCompletion done) {
            PromptResult result;
            try {
                result = handler(arguments);
            } catch (...) {
                done(std::current_exception(), PromptResult());
                return;
            }
            done(nullptr, std::move(result));
        });
}

void CapabilityRegistry::register_async_prompt(const PromptDescriptor& descriptor,
                                               AsyncPromptFunction handler) {
    prompts_.upsert(descriptor.name, PromptEntry{descriptor, std::move(handler)});
    notify(CapabilityKind::Prompts);
}

const ToolEntry* CapabilityRegistry::find_tool(const std::string& name) const {
    return tools_.find(name);
}

const ResourceEntry* CapabilityRegistry::find_resource(const std::string& uri) const {
    return resources_.find(uri);
}

const PromptEntry* CapabilityRegistry::find_prompt(const std::string& name) const {
    return prompts_.find(name);
}

std::vector<ToolDescriptor> CapabilityRegistry::tools() const {
    std::vector<ToolDescriptor> descriptors;
    descriptors.reserve(tools_.size());
    for (const auto& entry : tools_.entries) {
        descriptors.push_back(entry.descriptor);
    }
    return descriptors;
}

std::vector<ResourceDescriptor> CapabilityRegistry::resources() const {
    std::vector<ResourceDescriptor> descriptors;
    descriptors.reserve(resources_.size());
    for (const auto& entry : resources_.entries) {
        descriptors.push_back(entry.descriptor);
    }
    return descriptors;
}

std::vector<PromptDescriptor> CapabilityRegistry::prompts() const {
    std::vector<PromptDescriptor> descriptors;
    descriptors.reserve(prompts_.size());
    for (const auto& entry : prompts_.entries) {
        descriptors.push_back(entry.descriptor);
    }
    return descriptors;
}

} // namespace mcpbridge
