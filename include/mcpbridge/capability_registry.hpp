#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <mcpbridge/types.hpp>

namespace mcpbridge {

enum class CapabilityKind {
    Tools,
    Resources,
    Prompts
};

const char* to_string(CapabilityKind kind);

struct ToolEntry {
    ToolDescriptor descriptor;
    AsyncToolFunction handler;
};

struct ResourceEntry {
    ResourceDescriptor descriptor;
    AsyncResourceFunction handler;
};

struct PromptEntry {
    PromptDescriptor descriptor;
    AsyncPromptFunction handler;
};

/**
 * Tools keyed by name, resources keyed by URI, prompts keyed by name.
 *
 * Each kind keeps registration order. Registering an existing key replaces
 * the entry in place. Every register call reports exactly one change to the
 * change listener.
 */
class CapabilityRegistry {
public:
    using ChangeListener = std::function<void(CapabilityKind)>;

    void set_change_listener(ChangeListener listener);

    void register_tool(const ToolDescriptor& descriptor, ToolFunction handler);
    void register_async_tool(const ToolDescriptor& descriptor, AsyncToolFunction handler);

    void register_resource(const ResourceDescriptor& descriptor, ResourceFunction handler);
    void register_async_resource(const ResourceDescriptor& descriptor, AsyncResourceFunction handler);

    void register_prompt(const PromptDescriptor& descriptor, PromptFunction handler);
    void register_async_prompt(const PromptDescriptor& descriptor, AsyncPromptFunction handler);

    // Lookups return nullptr for unknown keys
    const ToolEntry* find_tool(const std::string& name) const;
    const ResourceEntry* find_resource(const std::string& uri) const;
    const PromptEntry* find_prompt(const std::string& name) const;

    std::vector<ToolDescriptor> tools() const;
    std::vector<ResourceDescriptor> resources() const;
    std::vector<PromptDescriptor> prompts() const;

    std::size_t tool_count() const { return tools_.size(); }
    std::size_t resource_count() const { return resources_.size(); }
    std::size_t prompt_count() const { return prompts_.size(); }

private:
    template <typename Entry>
    struct Table {
        std::vector<Entry> entries;
        std::unordered_map<std::string, std::size_t> index;

        void upsert(const std::string& key, Entry entry) {
            auto it = index.find(key);
            if (it != index.end()) {
                entries[it->second] = std::move(entry);
                return;
            }
            index.emplace(key, entries.size());
            entries.push_back(std::move(entry));
        }

        const Entry* find(const std::string& key) const {
            auto it = index.find(key);
            return it == index.end() ? nullptr : &entries[it->second];
        }

        std::size_t size() const { return entries.size(); }
    };

    void notify(CapabilityKind kind);

    Table<ToolEntry> tools_;
    Table<ResourceEntry> resources_;
    Table<PromptEntry> prompts_;
    ChangeListener listener_;
};

} // namespace mcpbridge
